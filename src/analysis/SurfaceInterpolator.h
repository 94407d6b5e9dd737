#ifndef SURFACEINTERPOLATOR_H
#define SURFACEINTERPOLATOR_H

#include "GridBuilder.h"
#include "models/Surface.h"
#include <QString>
#include <QVector>
#include <memory>

class CalculationDiagnostics;
struct VolumeSettings;

/**
 * @brief Samples a surface's elevation at the nodes of a sampling grid
 *
 * The result holds one value per grid point, in grid point order, with NaN
 * wherever the surface is undefined. Interpolation is best effort: a
 * surface that cannot be sampled yields an all-NaN vector and an
 * InterpolationFailure warning, never an error.
 */
class SurfaceInterpolator
{
public:
    static constexpr int MinimumPoints = 3;

    virtual ~SurfaceInterpolator() = default;

    virtual QVector<double> interpolate(const Surface &surface,
                                        const SamplingGrid &grid,
                                        CalculationDiagnostics &diagnostics) const = 0;

    /**
     * @brief Short method name ("linear", "invdist", "nearest")
     */
    virtual QString method() const = 0;

    /**
     * @brief Create the strategy named by settings.interpolation
     *
     * Unknown names fall back to linear interpolation with a warning.
     */
    static std::unique_ptr<SurfaceInterpolator> create(const VolumeSettings &settings);

    static QVector<double> nanVector(int size);

protected:
    /**
     * @brief Record an InterpolationFailure and return the all-NaN result
     */
    QVector<double> failed(const Surface &surface,
                           const SamplingGrid &grid,
                           const QString &reason,
                           CalculationDiagnostics &diagnostics) const;
};

#endif // SURFACEINTERPOLATOR_H
