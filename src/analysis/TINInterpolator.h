#ifndef TININTERPOLATOR_H
#define TININTERPOLATOR_H

#include "SurfaceInterpolator.h"

/**
 * @brief Piecewise-linear interpolation over a Delaunay TIN
 *
 * Triangulates the surface's distinct XY locations with GEOS, then blends
 * the enclosing triangle's vertex elevations with barycentric weights.
 * Grid points outside the convex hull are NaN; points on hull edges and
 * vertices are inside.
 */
class TINInterpolator : public SurfaceInterpolator
{
public:
    static constexpr double BarycentricTolerance = 1e-9;

    QVector<double> interpolate(const Surface &surface,
                                const SamplingGrid &grid,
                                CalculationDiagnostics &diagnostics) const override;

    QString method() const override { return QStringLiteral("linear"); }

    struct Facet {
        int index;
        double x[3];
        double y[3];
        double z[3];
        double area2;   // twice the signed area

        /**
         * @brief Elevation at (px, py) if inside within tolerance
         */
        bool sample(double px, double py, double &zOut) const;
    };
};

#endif // TININTERPOLATOR_H
