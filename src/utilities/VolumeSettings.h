#ifndef VOLUMESETTINGS_H
#define VOLUMESETTINGS_H

#include <QString>

class QSettings;

/**
 * @brief Volume calculation preferences stored under the "volume/" group
 *
 * Keys: gridResolution, interpolation, idwPower, idwSmoothing,
 * sliceThickness, gridTolerance, maxGridCells, maxSliceBands,
 * stationInterval, freeHaul. Missing or invalid values
 * fall back to the defaults below.
 */
struct VolumeSettings
{
    double gridResolution = 1.0;
    QString interpolation = QStringLiteral("linear");    // linear | invdist | nearest
    double idwPower = 2.0;
    double idwSmoothing = 1.0;
    double sliceThickness = 1.0;
    double gridTolerance = 1e-9;
    double maxGridCells = 25000000.0;
    double maxSliceBands = 10000.0;
    double stationInterval = 100.0;
    double freeHaul = 500.0;

    static VolumeSettings load(QSettings &settings);
    void save(QSettings &settings) const;

    static bool isKnownInterpolation(const QString &method);
};

#endif // VOLUMESETTINGS_H
