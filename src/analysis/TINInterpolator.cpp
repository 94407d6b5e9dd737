#include "TINInterpolator.h"
#include "CalculationDiagnostics.h"
#include "GDALHelpers.h"
#include <QDebug>
#include <QHash>
#include <QPair>
#include <cmath>
#include <limits>

using namespace GDALHelpers;

namespace {

// +0.0 folds -0.0 so both hash to the same key
QPair<double, double> xyKey(double x, double y)
{
    return qMakePair(x + 0.0, y + 0.0);
}

double cross2(double ax, double ay, double bx, double by, double cx, double cy)
{
    return (bx - ax) * (cy - ay) - (cx - ax) * (by - ay);
}

struct QueryState {
    double x;
    double y;
    int bestIndex;
    double value;
};

void collectFacet(void *item, void *userdata)
{
    const auto *facet = static_cast<const TINInterpolator::Facet*>(item);
    auto *state = static_cast<QueryState*>(userdata);

    if (state->bestIndex >= 0 && facet->index > state->bestIndex) {
        return;
    }

    double z;
    if (facet->sample(state->x, state->y, z)) {
        state->bestIndex = facet->index;
        state->value = z;
    }
}

} // namespace

bool TINInterpolator::Facet::sample(double px, double py, double &zOut) const
{
    const double wA = cross2(px, py, x[1], y[1], x[2], y[2]) / area2;
    const double wB = cross2(px, py, x[2], y[2], x[0], y[0]) / area2;
    const double wC = 1.0 - wA - wB;

    if (wA < -BarycentricTolerance || wB < -BarycentricTolerance || wC < -BarycentricTolerance) {
        return false;
    }

    zOut = wA * z[0] + wB * z[1] + wC * z[2];
    return true;
}

QVector<double> TINInterpolator::interpolate(const Surface &surface,
                                             const SamplingGrid &grid,
                                             CalculationDiagnostics &diagnostics) const
{
    if (surface.pointCount() < MinimumPoints) {
        return failed(surface, grid,
                      QString("TIN requires at least %1 points (provided: %2)")
                          .arg(MinimumPoints).arg(surface.pointCount()),
                      diagnostics);
    }

    // Distinct XY locations; the first point in id order wins
    QHash<QPair<double, double>, double> elevationAt;
    QVector<Point3D> vertices;
    vertices.reserve(surface.pointCount());
    for (auto it = surface.points().constBegin(); it != surface.points().constEnd(); ++it) {
        const QPair<double, double> key = xyKey(it->x(), it->y());
        if (elevationAt.contains(key)) continue;
        elevationAt.insert(key, it->z());
        vertices.append(*it);
    }

    if (vertices.size() < surface.pointCount()) {
        qDebug() << "Ignored" << surface.pointCount() - vertices.size()
                 << "coincident points in surface" << surface.name();
    }

    if (vertices.size() < MinimumPoints) {
        return failed(surface, grid,
                      QString("TIN requires at least %1 distinct XY locations (found: %2)")
                          .arg(MinimumPoints).arg(vertices.size()),
                      diagnostics);
    }

    GeosContextGuard geos;
    if (!geos) {
        return failed(surface, grid, "Failed to initialise GEOS context", diagnostics);
    }
    GEOSContextHandle_t ctx = geos.get();

    std::vector<GEOSGeometry*> rawPointGeoms;
    rawPointGeoms.reserve(vertices.size());
    for (const Point3D &v : vertices) {
        GEOSGeometry* pointGeom = createPoint(ctx, v.x(), v.y());
        if (!pointGeom) {
            for (GEOSGeometry* g : rawPointGeoms) {
                GEOSGeom_destroy_r(ctx, g);
            }
            return failed(surface, grid, "Failed to create GEOS point geometry", diagnostics);
        }
        rawPointGeoms.push_back(pointGeom);
    }

    // Ownership of the points moves to the collection
    GeometryGuard collection(ctx, GEOSGeom_createCollection_r(ctx, GEOS_MULTIPOINT,
                                                              rawPointGeoms.data(),
                                                              static_cast<unsigned int>(rawPointGeoms.size())));
    if (!collection) {
        return failed(surface, grid, "Failed to create point collection for TIN", diagnostics);
    }

    GeometryGuard triangles(ctx, GEOSDelaunayTriangulation_r(ctx, collection.get(), 0.0, 0));
    if (!triangles) {
        return failed(surface, grid,
                      QString("Delaunay triangulation failed: %1").arg(geos.lastError()),
                      diagnostics);
    }

    const int numTriangles = GEOSGetNumGeometries_r(ctx, triangles.get());
    if (numTriangles <= 0) {
        return failed(surface, grid,
                      "Delaunay triangulation produced no triangles (collinear points?)",
                      diagnostics);
    }

    QVector<Facet> facets;
    QVector<const GEOSGeometry*> facetGeoms;
    facets.reserve(numTriangles);
    facetGeoms.reserve(numTriangles);
    for (int t = 0; t < numTriangles; ++t) {
        const GEOSGeometry* tri = GEOSGetGeometryN_r(ctx, triangles.get(), t);
        if (!tri) continue;

        const GEOSGeometry* ring = GEOSGetExteriorRing_r(ctx, tri);
        if (!ring) continue;

        const GEOSCoordSequence* seq = GEOSGeom_getCoordSeq_r(ctx, ring);
        if (!seq) continue;

        unsigned int numCoords = 0;
        GEOSCoordSeq_getSize_r(ctx, seq, &numCoords);
        if (numCoords < 3) continue;

        Facet facet;
        bool complete = true;
        // Triangle has 4 coords (closed ring), we need first 3
        for (unsigned int c = 0; c < 3; ++c) {
            double x, y;
            GEOSCoordSeq_getX_r(ctx, seq, c, &x);
            GEOSCoordSeq_getY_r(ctx, seq, c, &y);

            auto found = elevationAt.constFind(xyKey(x, y));
            if (found == elevationAt.constEnd()) {
                qWarning() << "Could not find matching vertex for triangle" << t << "coord" << c;
                complete = false;
                break;
            }
            facet.x[c] = x;
            facet.y[c] = y;
            facet.z[c] = found.value();
        }
        if (!complete) continue;

        facet.area2 = cross2(facet.x[0], facet.y[0], facet.x[1], facet.y[1], facet.x[2], facet.y[2]);
        if (facet.area2 == 0.0) continue;

        facet.index = facets.size();
        facets.append(facet);
        facetGeoms.append(tri);
    }

    if (facets.isEmpty()) {
        return failed(surface, grid, "TIN has no non-degenerate triangles", diagnostics);
    }

    STRtreeGuard tree(ctx, GEOSSTRtree_create_r(ctx, 10));
    if (!tree) {
        return failed(surface, grid, "Failed to create triangle index", diagnostics);
    }

    // The tree references facets and triangle geometries, both outlive it
    Facet *facetData = facets.data();
    for (int f = 0; f < facets.size(); ++f) {
        GEOSSTRtree_insert_r(ctx, tree.get(), facetGeoms[f], facetData + f);
    }

    QVector<double> elevations = nanVector(grid.pointCount());
    int sampled = 0;
    for (int i = 0; i < grid.pointCount(); ++i) {
        const QPointF &p = grid.points[i];

        GeometryGuard query(ctx, createPoint(ctx, p.x(), p.y()));
        if (!query) {
            return failed(surface, grid, "Failed to create GEOS query point", diagnostics);
        }

        QueryState state{p.x(), p.y(), -1, std::numeric_limits<double>::quiet_NaN()};
        GEOSSTRtree_query_r(ctx, tree.get(), query.get(), &collectFacet, &state);

        if (state.bestIndex >= 0) {
            elevations[i] = state.value;
            ++sampled;
        }
    }

    qDebug() << "TIN interpolation of" << surface.name() << ":" << vertices.size() << "vertices,"
             << facets.size() << "triangles," << sampled << "of" << grid.pointCount()
             << "grid points inside hull";

    return elevations;
}
