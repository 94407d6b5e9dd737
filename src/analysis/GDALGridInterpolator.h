#ifndef GDALGRIDINTERPOLATOR_H
#define GDALGRIDINTERPOLATOR_H

#include "SurfaceInterpolator.h"
#include <gdal.h>

/**
 * @brief Grid interpolation through GDAL's gridding algorithms
 *
 * Provides functionality for:
 * - Inverse distance to a power ("invdist")
 * - Nearest neighbour ("nearest")
 *
 * The surface points are loaded into an in-memory OGR layer and gridded
 * onto a MEM raster whose cell centres coincide with the sampling grid
 * nodes. Results are clipped to the convex hull of the surface so no value
 * is extrapolated beyond the surveyed footprint.
 */
class GDALGridInterpolator : public SurfaceInterpolator
{
public:
    enum class Algorithm {
        InverseDistance,
        NearestNeighbor
    };

    static constexpr double NoDataValue = -9999.0;

    explicit GDALGridInterpolator(Algorithm algorithm,
                                  double power = 2.0,
                                  double smoothing = 1.0);

    QVector<double> interpolate(const Surface &surface,
                                const SamplingGrid &grid,
                                CalculationDiagnostics &diagnostics) const override;

    QString method() const override;

    /**
     * @brief gdal_grid "-a" argument for the configured algorithm
     */
    QString algorithmOption() const;

private:
    bool loadPoints(GDALDatasetH hDS, const Surface &surface, QString &errorOut) const;
    bool clipToHull(const Surface &surface,
                    const SamplingGrid &grid,
                    QVector<double> &elevations,
                    QString &errorOut) const;

    Algorithm m_algorithm;
    double m_power;
    double m_smoothing;
};

#endif // GDALGRIDINTERPOLATOR_H
