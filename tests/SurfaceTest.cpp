#include "models/Surface.h"
#include "TestSurfaces.h"

#include <gtest/gtest.h>
#include <algorithm>
#include <limits>

// ─── BoundingBox ─────────────────────────────────────────────────────────────

TEST(BoundingBox, DefaultIsInvalid) {
    BoundingBox box;
    EXPECT_FALSE(box.isValid());
}

TEST(BoundingBox, ExpandMakesValid) {
    BoundingBox box;
    box.expand(3.0, -1.0);
    EXPECT_TRUE(box.isValid());
    EXPECT_DOUBLE_EQ(box.width(), 0.0);
    EXPECT_DOUBLE_EQ(box.height(), 0.0);

    box.expand(-2.0, 4.0);
    EXPECT_DOUBLE_EQ(box.minX, -2.0);
    EXPECT_DOUBLE_EQ(box.maxX, 3.0);
    EXPECT_DOUBLE_EQ(box.minY, -1.0);
    EXPECT_DOUBLE_EQ(box.maxY, 4.0);
}

TEST(BoundingBox, ExpandByInvalidBoxIsNoop) {
    BoundingBox box(0.0, 0.0, 1.0, 1.0);
    box.expand(BoundingBox());
    EXPECT_DOUBLE_EQ(box.minX, 0.0);
    EXPECT_DOUBLE_EQ(box.maxY, 1.0);
}

// ─── Surface ─────────────────────────────────────────────────────────────────

TEST(Surface, AddPointGeneratesId) {
    Surface surface("S");
    const QString id = surface.addPoint(Point3D(1.0, 2.0, 3.0));
    EXPECT_FALSE(id.isEmpty());
    ASSERT_TRUE(surface.points().contains(id));
    EXPECT_EQ(surface.points().value(id), Point3D(1.0, 2.0, 3.0));
}

TEST(Surface, AddPointKeepsGivenId) {
    Surface surface("S");
    EXPECT_EQ(surface.addPoint(Point3D(1.0, 2.0, 3.0), "p1"), QString("p1"));
    EXPECT_EQ(surface.pointCount(), 1);
}

TEST(Surface, AddTriangleRejectsUnknownIds) {
    Surface surface("S");
    surface.addPoint(Point3D(0, 0, 0), "a");
    surface.addPoint(Point3D(1, 0, 0), "b");
    surface.addPoint(Point3D(0, 1, 0), "c");

    QString error;
    EXPECT_TRUE(surface.addTriangle({"a", "b", "c"}, error));
    EXPECT_FALSE(surface.addTriangle({"a", "b", "missing"}, error));
    EXPECT_TRUE(error.contains("missing"));
    EXPECT_EQ(surface.triangles().size(), 1);
}

TEST(Surface, BoundsAndElevationRange) {
    Surface surface("S");
    surface.addPoint(Point3D(-1.0, 2.0, 5.0));
    surface.addPoint(Point3D(4.0, -3.0, -2.0));
    surface.addPoint(Point3D(0.0, 0.0, 1.0));

    BoundingBox box = surface.bounds();
    EXPECT_DOUBLE_EQ(box.minX, -1.0);
    EXPECT_DOUBLE_EQ(box.maxX, 4.0);
    EXPECT_DOUBLE_EQ(box.minY, -3.0);
    EXPECT_DOUBLE_EQ(box.maxY, 2.0);

    double lo = 0.0, hi = 0.0;
    EXPECT_TRUE(surface.elevationRange(lo, hi));
    EXPECT_DOUBLE_EQ(lo, -2.0);
    EXPECT_DOUBLE_EQ(hi, 5.0);
    EXPECT_DOUBLE_EQ(surface.minZ(), -2.0);
    EXPECT_DOUBLE_EQ(surface.maxZ(), 5.0);
}

TEST(Surface, EmptySurfaceHasNoRange) {
    Surface surface("Empty");
    double lo = 0.0, hi = 0.0;
    EXPECT_TRUE(surface.isEmpty());
    EXPECT_FALSE(surface.elevationRange(lo, hi));
    EXPECT_FALSE(surface.bounds().isValid());
}

TEST(Surface, FromVariantList) {
    QVariantList points;
    points << TestSurfaces::pointMap(0, 0, 1) << TestSurfaces::pointMap(1, 0, 2);
    QVariantMap withId = TestSurfaces::pointMap(0, 1, 3);
    withId["id"] = "corner";
    points << withId;

    QString error;
    bool ok = false;
    Surface surface = Surface::fromVariantList("Imported", points, error, &ok);
    EXPECT_TRUE(ok);
    EXPECT_TRUE(error.isEmpty());
    EXPECT_EQ(surface.name(), QString("Imported"));
    EXPECT_EQ(surface.pointCount(), 3);
    ASSERT_TRUE(surface.points().contains("corner"));
    EXPECT_DOUBLE_EQ(surface.points().value("corner").z(), 3.0);
}

TEST(Surface, FromVariantListMissingCoordinate) {
    QVariantMap bad;
    bad["x"] = 1.0;
    bad["y"] = 2.0;
    QVariantList points;
    points << TestSurfaces::pointMap(0, 0, 0) << bad;

    QString error;
    bool ok = true;
    Surface surface = Surface::fromVariantList("Broken", points, error, &ok);
    EXPECT_FALSE(ok);
    EXPECT_TRUE(error.contains("missing x, y, or z"));
    EXPECT_TRUE(surface.isEmpty());
}

TEST(Surface, FlatLattice) {
    Surface flat = Surface::flat(2.5);
    EXPECT_EQ(flat.pointCount(), 121);
    EXPECT_DOUBLE_EQ(flat.gridSpacing(), 1.0);
    EXPECT_DOUBLE_EQ(flat.minZ(), 2.5);
    EXPECT_DOUBLE_EQ(flat.maxZ(), 2.5);

    BoundingBox box = flat.bounds();
    EXPECT_DOUBLE_EQ(box.minX, 0.0);
    EXPECT_DOUBLE_EQ(box.maxX, 10.0);
    EXPECT_DOUBLE_EQ(box.maxY, 10.0);
}

TEST(Surface, LowestTakesMinimumPerLocation) {
    Surface design = TestSurfaces::plane("Design", 5.0, 0.0, 0.0, 4);
    Surface existing = TestSurfaces::plane("Existing", 0.0, 2.0, 0.0, 4);   // z = 2x

    QString error;
    Surface lowest = Surface::lowest(design, existing, error);
    EXPECT_TRUE(error.isEmpty());
    EXPECT_EQ(lowest.name(), QString("Lowest"));
    ASSERT_EQ(lowest.pointCount(), 25);

    for (const Point3D &p : lowest.points()) {
        EXPECT_DOUBLE_EQ(p.z(), std::min(5.0, 2.0 * p.x()));
    }
}

TEST(Surface, LowestRejectsMismatchedSurfaces) {
    QString error;
    Surface a = TestSurfaces::plane("A", 0.0, 0.0, 0.0, 4, 1.0);
    Surface b = TestSurfaces::plane("B", 0.0, 0.0, 0.0, 4, 2.0);
    EXPECT_TRUE(Surface::lowest(a, b, error).isEmpty());
    EXPECT_TRUE(error.contains("spacing"));

    error.clear();
    Surface c = TestSurfaces::plane("C", 0.0, 0.0, 0.0, 3, 1.0);
    EXPECT_TRUE(Surface::lowest(a, c, error).isEmpty());
    EXPECT_TRUE(error.contains("count"));

    error.clear();
    Surface shifted = TestSurfaces::plane("Shifted", 0.0, 0.0, 0.0, 4, 1.0, 0.5, 0.0);
    EXPECT_TRUE(Surface::lowest(a, shifted, error).isEmpty());
    EXPECT_FALSE(error.isEmpty());
}

TEST(Surface, FromVariantListRejectsNonNumericCoordinate) {
    QVariantMap text = TestSurfaces::pointMap(1.0, 2.0, 3.0);
    text["x"] = "abc";
    QVariantMap infinite = TestSurfaces::pointMap(1.0, 2.0, 3.0);
    infinite["z"] = std::numeric_limits<double>::infinity();

    for (const QVariantMap &bad : {text, infinite}) {
        QVariantList points;
        points << TestSurfaces::pointMap(0, 0, 0) << bad;

        QString error;
        bool ok = true;
        Surface surface = Surface::fromVariantList("Broken", points, error, &ok);
        EXPECT_FALSE(ok);
        EXPECT_TRUE(error.contains("non-numeric or non-finite"));
        EXPECT_TRUE(surface.isEmpty());
    }
}

TEST(Surface, FromVariantListRejectsDuplicateId) {
    QVariantMap first = TestSurfaces::pointMap(0, 0, 0);
    first["id"] = "p1";
    QVariantMap second = TestSurfaces::pointMap(5, 5, 5);
    second["id"] = "p1";
    QVariantList points;
    points << first << second;

    QString error;
    bool ok = true;
    Surface surface = Surface::fromVariantList("Duplicated", points, error, &ok);
    EXPECT_FALSE(ok);
    EXPECT_TRUE(error.contains("repeats id 'p1'"));
    EXPECT_TRUE(surface.isEmpty());
}
