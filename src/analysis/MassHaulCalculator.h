#ifndef MASSHAULCALCULATOR_H
#define MASSHAULCALCULATOR_H

#include "DifferenceEngine.h"
#include <QPointF>
#include <QVariantMap>
#include <QVector>

class CalculationDiagnostics;

/**
 * @brief Cut/fill binned at one station of the haul alignment
 */
struct HaulStation
{
    double station = 0.0;       // distance along the alignment
    double cut = 0.0;
    double fill = 0.0;
    double cumulative = 0.0;    // running fill - cut up to this station
};

struct MassHaulResult
{
    QVector<HaulStation> stations;
    double alignmentLength = 0.0;
    double overhaul = 0.0;      // volume x distance hauled beyond free haul

    /**
     * @brief Map with stations (list of station/cut/fill/cumulative maps),
     * alignmentLength and overhaul
     */
    QVariantMap toVariantMap() const;
};

/**
 * @brief Mass-haul curve of a difference field along a haul alignment
 *
 * Every valid node of the dzGrid is projected onto the alignment polyline
 * and its volume (|dz| x cell area) is added to the station interval it
 * falls in. Stations run from 0 to the alignment length, the last one
 * catching the remainder.
 */
class MassHaulCalculator
{
public:
    static constexpr double DefaultMaxStations = 10000.0;

    /**
     * @brief Station interval must be > 0 and free haul >= 0
     * @param diagnostics Receives InvalidResolution or InvalidInput
     */
    static bool validateParameters(double stationInterval,
                                   double freeHaul,
                                   CalculationDiagnostics &diagnostics);

    /**
     * @brief Build the mass-haul curve and the overhaul
     * @param result Difference field to distribute
     * @param alignment Haul alignment vertices (at least two, non-zero length)
     * @param cellSize Grid resolution the result was computed at
     * @param stationInterval Spacing of the stations
     * @param freeHaul Haul distance that carries no overhaul
     * @param diagnostics Receives errors
     * @param ok Set to false on a fatal error
     * @param maxStations Largest accepted number of stations
     */
    static MassHaulResult build(const VolumeResult &result,
                                const QVector<QPointF> &alignment,
                                double cellSize,
                                double stationInterval,
                                double freeHaul,
                                CalculationDiagnostics &diagnostics,
                                bool *ok = nullptr,
                                double maxStations = DefaultMaxStations);
};

#endif // MASSHAULCALCULATOR_H
