#include "SurfaceInterpolator.h"
#include "CalculationDiagnostics.h"
#include "GDALGridInterpolator.h"
#include "TINInterpolator.h"
#include "utilities/VolumeSettings.h"
#include <QDebug>
#include <limits>

std::unique_ptr<SurfaceInterpolator> SurfaceInterpolator::create(const VolumeSettings &settings)
{
    const QString method = settings.interpolation.trimmed().toLower();

    if (method == QLatin1String("invdist")) {
        return std::unique_ptr<SurfaceInterpolator>(
            new GDALGridInterpolator(GDALGridInterpolator::Algorithm::InverseDistance,
                                     settings.idwPower, settings.idwSmoothing));
    }

    if (method == QLatin1String("nearest")) {
        return std::unique_ptr<SurfaceInterpolator>(
            new GDALGridInterpolator(GDALGridInterpolator::Algorithm::NearestNeighbor));
    }

    if (method != QLatin1String("linear")) {
        qWarning() << "Unknown interpolation method" << settings.interpolation
                   << "- using linear";
    }

    return std::unique_ptr<SurfaceInterpolator>(new TINInterpolator());
}

QVector<double> SurfaceInterpolator::nanVector(int size)
{
    return QVector<double>(size, std::numeric_limits<double>::quiet_NaN());
}

QVector<double> SurfaceInterpolator::failed(const Surface &surface,
                                            const SamplingGrid &grid,
                                            const QString &reason,
                                            CalculationDiagnostics &diagnostics) const
{
    diagnostics.addWarning(CalculationDiagnostics::Warning::InterpolationFailure,
                           QString("Surface '%1' (%2): %3").arg(surface.name(), method(), reason));
    return nanVector(grid.pointCount());
}
