#include "Surface.h"
#include <QDebug>
#include <QUuid>
#include <QVariantMap>
#include <algorithm>
#include <cmath>
#include <limits>

BoundingBox::BoundingBox()
    : minX(std::numeric_limits<double>::max())
    , minY(std::numeric_limits<double>::max())
    , maxX(std::numeric_limits<double>::lowest())
    , maxY(std::numeric_limits<double>::lowest())
{
}

BoundingBox::BoundingBox(double minX, double minY, double maxX, double maxY)
    : minX(minX), minY(minY), maxX(maxX), maxY(maxY)
{
}

bool BoundingBox::isValid() const
{
    return minX <= maxX && minY <= maxY;
}

void BoundingBox::expand(double x, double y)
{
    if (x < minX) minX = x;
    if (x > maxX) maxX = x;
    if (y < minY) minY = y;
    if (y > maxY) maxY = y;
}

void BoundingBox::expand(const BoundingBox &other)
{
    if (!other.isValid()) return;
    expand(other.minX, other.minY);
    expand(other.maxX, other.maxY);
}

Surface::Surface(const QString &name)
    : m_name(name)
{
}

QString Surface::addPoint(const Point3D &point, const QString &id)
{
    QString key = id.isEmpty() ? QUuid::createUuid().toString(QUuid::WithoutBraces) : id;
    m_points.insert(key, point);
    return key;
}

bool Surface::addTriangle(const Triangle &triangle, QString &errorOut)
{
    for (const QString &id : {triangle.p1, triangle.p2, triangle.p3}) {
        if (!m_points.contains(id)) {
            errorOut = QString("Triangle references unknown point id '%1' in surface '%2'")
                           .arg(id, m_name);
            return false;
        }
    }

    m_triangles.append(triangle);
    return true;
}

BoundingBox Surface::bounds() const
{
    BoundingBox box;
    for (auto it = m_points.constBegin(); it != m_points.constEnd(); ++it) {
        box.expand(it->x(), it->y());
    }
    return box;
}

bool Surface::elevationRange(double &minZ, double &maxZ) const
{
    if (m_points.isEmpty()) {
        return false;
    }

    minZ = std::numeric_limits<double>::max();
    maxZ = std::numeric_limits<double>::lowest();
    for (auto it = m_points.constBegin(); it != m_points.constEnd(); ++it) {
        if (it->z() < minZ) minZ = it->z();
        if (it->z() > maxZ) maxZ = it->z();
    }
    return true;
}

double Surface::minZ() const
{
    double lo, hi;
    return elevationRange(lo, hi) ? lo : 0.0;
}

double Surface::maxZ() const
{
    double lo, hi;
    return elevationRange(lo, hi) ? hi : 0.0;
}

Surface Surface::fromPointList(const QString &name, const QVector<Point3D> &points, double spacing)
{
    Surface surface(name);
    for (const Point3D &p : points) {
        surface.addPoint(p);
    }
    if (spacing > 0.0) {
        surface.setGridSpacing(spacing);
    }
    return surface;
}

Surface Surface::fromVariantList(const QString &name, const QVariantList &points,
                                 QString &errorOut, bool *ok)
{
    if (ok) *ok = true;

    Surface surface(name);
    for (int i = 0; i < points.size(); ++i) {
        QVariantMap m = points[i].toMap();

        if (!m.contains("x") || !m.contains("y") || !m.contains("z")) {
            errorOut = QString("Point %1 of surface '%2' missing x, y, or z coordinate")
                           .arg(i).arg(name);
            if (ok) *ok = false;
            return Surface(name);
        }

        bool okX = false, okY = false, okZ = false;
        const double x = m["x"].toDouble(&okX);
        const double y = m["y"].toDouble(&okY);
        const double z = m["z"].toDouble(&okZ);
        if (!okX || !okY || !okZ || !std::isfinite(x) || !std::isfinite(y) || !std::isfinite(z)) {
            errorOut = QString("Point %1 of surface '%2' has a non-numeric or non-finite coordinate")
                           .arg(i).arg(name);
            if (ok) *ok = false;
            return Surface(name);
        }

        // Keep caller supplied ids so triangles can refer to them
        const QString id = m.value("id").toString();
        if (!id.isEmpty() && surface.m_points.contains(id)) {
            errorOut = QString("Point %1 of surface '%2' repeats id '%3'")
                           .arg(i).arg(name, id);
            if (ok) *ok = false;
            return Surface(name);
        }
        surface.addPoint(Point3D(x, y, z), id);
    }

    return surface;
}

Surface Surface::flat(double z, int size, const QString &name, double spacing)
{
    QVector<Point3D> pts;
    pts.reserve((size + 1) * (size + 1));
    for (int i = 0; i <= size; ++i) {
        for (int j = 0; j <= size; ++j) {
            pts.append(Point3D(i * spacing, j * spacing, z));
        }
    }
    return fromPointList(name, pts, spacing);
}

Surface Surface::lowest(const Surface &design, const Surface &existing, QString &errorOut)
{
    if (design.gridSpacing() != existing.gridSpacing()) {
        errorOut = QString("Grid spacing mismatch: %1 vs %2")
                       .arg(design.gridSpacing()).arg(existing.gridSpacing());
        return Surface();
    }

    if (design.pointCount() != existing.pointCount()) {
        errorOut = QString("Point count mismatch: %1 vs %2")
                       .arg(design.pointCount()).arg(existing.pointCount());
        return Surface();
    }

    auto sorted = [](const Surface &surface) {
        QVector<Point3D> pts;
        pts.reserve(surface.pointCount());
        for (auto it = surface.points().constBegin(); it != surface.points().constEnd(); ++it) {
            pts.append(*it);
        }
        std::sort(pts.begin(), pts.end(), [](const Point3D &a, const Point3D &b) {
            if (a.x() != b.x()) return a.x() < b.x();
            return a.y() < b.y();
        });
        return pts;
    };

    const QVector<Point3D> designPts = sorted(design);
    const QVector<Point3D> existingPts = sorted(existing);

    QVector<Point3D> lowestPts;
    lowestPts.reserve(designPts.size());
    for (int i = 0; i < designPts.size(); ++i) {
        const Point3D &d = designPts[i];
        const Point3D &e = existingPts[i];
        if (d.x() != e.x() || d.y() != e.y()) {
            errorOut = QString("Surfaces are not sampled at the same locations (%1, %2) vs (%3, %4)")
                           .arg(d.x()).arg(d.y()).arg(e.x()).arg(e.y());
            return Surface();
        }
        lowestPts.append(Point3D(d.x(), d.y(), std::min(d.z(), e.z())));
    }

    qDebug() << "Lowest surface built from" << design.name() << "and" << existing.name()
             << "with" << lowestPts.size() << "points";

    return fromPointList(QStringLiteral("Lowest"), lowestPts, design.gridSpacing());
}
