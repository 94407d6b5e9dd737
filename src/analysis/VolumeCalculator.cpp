#include "VolumeCalculator.h"
#include "BoundingBoxResolver.h"
#include "CalculationDiagnostics.h"
#include "GridBuilder.h"
#include "SurfaceInterpolator.h"
#include "models/Surface.h"
#include <QDebug>
#include <cmath>
#include <exception>

namespace {

QVector<double> sampleSurface(const SurfaceInterpolator &interpolator,
                              const Surface &surface,
                              const SamplingGrid &grid,
                              CalculationDiagnostics &diagnostics)
{
    try {
        return interpolator.interpolate(surface, grid, diagnostics);
    } catch (const std::exception &e) {
        diagnostics.addWarning(CalculationDiagnostics::Warning::InterpolationFailure,
                               QString("Surface '%1' (%2): %3")
                                   .arg(surface.name(), interpolator.method(), QString::fromUtf8(e.what())));
        return SurfaceInterpolator::nanVector(grid.pointCount());
    }
}

} // namespace

VolumeCalculator::VolumeCalculator(QObject *parent)
    : QObject(parent)
{
}

VolumeCalculator::~VolumeCalculator() = default;

void VolumeCalculator::reportProgress(int value)
{
    if (m_progressCallback) m_progressCallback(value);
}

bool VolumeCalculator::prepareGrid(const Surface *surfaceA,
                                   const Surface *surfaceB,
                                   double resolution,
                                   SamplingGrid &gridOut,
                                   CalculationDiagnostics &diagnostics)
{
    BoundingBox box;
    if (!BoundingBoxResolver::resolve(surfaceA, surfaceB, box, diagnostics)) {
        return false;
    }
    reportProgress(10);

    if (!GridBuilder::build(box, resolution, gridOut, diagnostics,
                            m_settings.gridTolerance, m_settings.maxGridCells)) {
        return false;
    }
    reportProgress(20);

    return true;
}

VolumeResult VolumeCalculator::calculateSurfaceToSurface(const Surface *existing,
                                                         const Surface *proposed,
                                                         double resolution,
                                                         CalculationDiagnostics &diagnostics)
{
    reportProgress(0);

    SamplingGrid grid;
    if (!prepareGrid(existing, proposed, resolution, grid, diagnostics)) {
        return VolumeResult();
    }

    qDebug() << "Calculating volume" << existing->name() << "->" << proposed->name()
             << "at resolution" << resolution;

    std::unique_ptr<SurfaceInterpolator> interpolator = SurfaceInterpolator::create(m_settings);

    const QVector<double> zExisting = sampleSurface(*interpolator, *existing, grid, diagnostics);
    reportProgress(50);
    const QVector<double> zProposed = sampleSurface(*interpolator, *proposed, grid, diagnostics);
    reportProgress(80);

    bool ok = false;
    VolumeResult result = DifferenceEngine::difference(zExisting, zProposed, grid, diagnostics, &ok);
    if (!ok) {
        return VolumeResult();
    }

    result.warnings = diagnostics.warningMessages();
    reportProgress(100);
    return result;
}

VolumeResult VolumeCalculator::calculateSurfaceToElevation(const Surface *surface,
                                                           double elevation,
                                                           double resolution,
                                                           CalculationDiagnostics &diagnostics)
{
    reportProgress(0);

    if (!std::isfinite(elevation)) {
        diagnostics.setError(CalculationDiagnostics::Error::InvalidInput,
                             QString("Invalid reference elevation: %1").arg(elevation));
        return VolumeResult();
    }

    SamplingGrid grid;
    if (!prepareGrid(surface, surface, resolution, grid, diagnostics)) {
        return VolumeResult();
    }

    qDebug() << "Calculating volume of" << surface->name() << "against elevation" << elevation
             << "at resolution" << resolution;

    std::unique_ptr<SurfaceInterpolator> interpolator = SurfaceInterpolator::create(m_settings);
    const QVector<double> zSurface = sampleSurface(*interpolator, *surface, grid, diagnostics);
    reportProgress(60);

    const QVector<double> zPlane(grid.pointCount(), elevation);

    bool ok = false;
    VolumeResult result = DifferenceEngine::difference(zSurface, zPlane, grid, diagnostics, &ok);
    if (!ok) {
        return VolumeResult();
    }

    result.warnings = diagnostics.warningMessages();
    reportProgress(100);
    return result;
}

QVector<SliceResult> VolumeCalculator::computeSliceVolumes(const Surface *reference,
                                                           const Surface *comparison,
                                                           double sliceThickness,
                                                           double resolution,
                                                           CalculationDiagnostics &diagnostics)
{
    if (!std::isfinite(sliceThickness) || sliceThickness <= 0) {
        diagnostics.setError(CalculationDiagnostics::Error::InvalidResolution,
                             QString("Invalid slice thickness: %1 (must be > 0)").arg(sliceThickness));
        return QVector<SliceResult>();
    }

    const VolumeResult result = calculateSurfaceToSurface(reference, comparison, resolution, diagnostics);
    if (diagnostics.hasError()) {
        return QVector<SliceResult>();
    }

    return DifferenceEngine::sliceVolumes(result, resolution, sliceThickness, diagnostics,
                                          nullptr, m_settings.maxSliceBands);
}

MassHaulResult VolumeCalculator::computeMassHaul(const Surface *reference,
                                                 const Surface *comparison,
                                                 const QVector<QPointF> &alignment,
                                                 double stationInterval,
                                                 double freeHaul,
                                                 double resolution,
                                                 CalculationDiagnostics &diagnostics)
{
    if (!MassHaulCalculator::validateParameters(stationInterval, freeHaul, diagnostics)) {
        return MassHaulResult();
    }

    const VolumeResult result = calculateSurfaceToSurface(reference, comparison, resolution, diagnostics);
    if (diagnostics.hasError()) {
        return MassHaulResult();
    }

    return MassHaulCalculator::build(result, alignment, resolution, stationInterval, freeHaul,
                                     diagnostics);
}
