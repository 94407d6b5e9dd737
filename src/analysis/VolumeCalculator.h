#ifndef VOLUMECALCULATOR_H
#define VOLUMECALCULATOR_H

#include "DifferenceEngine.h"
#include "MassHaulCalculator.h"
#include "utilities/VolumeSettings.h"
#include <QObject>
#include <QVector>
#include <functional>

class Surface;
class CalculationDiagnostics;

/**
 * @brief Handles earthwork volume calculations
 *
 * Provides functionality for:
 * - Surface to surface cut/fill on a regular grid
 * - Surface to horizontal plane cut/fill
 * - Depth band (slice) volumes of a surface difference
 * - Mass-haul curve of a surface difference along an alignment
 *
 * Each calculation resolves the common footprint, builds the sampling grid,
 * interpolates both surfaces with the configured method and differences
 * them. Fatal errors land in the diagnostics and return a default result.
 */
class VolumeCalculator : public QObject
{
    Q_OBJECT

public:
    using ProgressCallback = std::function<void(int)>;

    explicit VolumeCalculator(QObject *parent = nullptr);
    ~VolumeCalculator();

    VolumeSettings settings() const { return m_settings; }
    void setSettings(const VolumeSettings &settings) { m_settings = settings; }

    void setProgressCallback(ProgressCallback callback) { m_progressCallback = callback; }

    /**
     * @brief Cut/fill of proposed against existing (dz = proposed - existing)
     * @param existing Reference surface
     * @param proposed Comparison surface
     * @param resolution Grid cell size (> 0)
     * @param diagnostics Receives errors and warnings
     */
    VolumeResult calculateSurfaceToSurface(const Surface *existing,
                                           const Surface *proposed,
                                           double resolution,
                                           CalculationDiagnostics &diagnostics);

    /**
     * @brief Cut/fill of a surface against a horizontal plane
     *
     * dz = elevation - surface, so terrain above the plane counts as cut.
     */
    VolumeResult calculateSurfaceToElevation(const Surface *surface,
                                             double elevation,
                                             double resolution,
                                             CalculationDiagnostics &diagnostics);

    /**
     * @brief Cut/fill split into depth bands of the given thickness
     */
    QVector<SliceResult> computeSliceVolumes(const Surface *reference,
                                             const Surface *comparison,
                                             double sliceThickness,
                                             double resolution,
                                             CalculationDiagnostics &diagnostics);

    /**
     * @brief Mass-haul curve of comparison against reference along alignment
     */
    MassHaulResult computeMassHaul(const Surface *reference,
                                   const Surface *comparison,
                                   const QVector<QPointF> &alignment,
                                   double stationInterval,
                                   double freeHaul,
                                   double resolution,
                                   CalculationDiagnostics &diagnostics);

private:
    bool prepareGrid(const Surface *surfaceA,
                     const Surface *surfaceB,
                     double resolution,
                     SamplingGrid &gridOut,
                     CalculationDiagnostics &diagnostics);
    void reportProgress(int value);

    VolumeSettings m_settings;
    ProgressCallback m_progressCallback;
};

#endif // VOLUMECALCULATOR_H
