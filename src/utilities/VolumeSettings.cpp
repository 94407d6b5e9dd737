#include "VolumeSettings.h"
#include <QDebug>
#include <QSettings>
#include <cmath>

namespace {

double positiveValue(QSettings &settings, const QString &key, double fallback)
{
    bool ok = false;
    const double value = settings.value(key, fallback).toDouble(&ok);
    if (!ok || !std::isfinite(value) || value <= 0) {
        qWarning() << "Invalid setting" << key << "=" << settings.value(key)
                   << "- using" << fallback;
        return fallback;
    }
    return value;
}

double nonNegativeValue(QSettings &settings, const QString &key, double fallback)
{
    bool ok = false;
    const double value = settings.value(key, fallback).toDouble(&ok);
    if (!ok || !std::isfinite(value) || value < 0) {
        qWarning() << "Invalid setting" << key << "=" << settings.value(key)
                   << "- using" << fallback;
        return fallback;
    }
    return value;
}

} // namespace

bool VolumeSettings::isKnownInterpolation(const QString &method)
{
    const QString m = method.trimmed().toLower();
    return m == QLatin1String("linear") || m == QLatin1String("invdist") || m == QLatin1String("nearest");
}

VolumeSettings VolumeSettings::load(QSettings &settings)
{
    VolumeSettings defaults;
    VolumeSettings loaded;

    settings.beginGroup("volume");

    loaded.gridResolution = positiveValue(settings, "gridResolution", defaults.gridResolution);
    loaded.idwPower = positiveValue(settings, "idwPower", defaults.idwPower);
    loaded.idwSmoothing = nonNegativeValue(settings, "idwSmoothing", defaults.idwSmoothing);
    loaded.sliceThickness = positiveValue(settings, "sliceThickness", defaults.sliceThickness);
    loaded.gridTolerance = nonNegativeValue(settings, "gridTolerance", defaults.gridTolerance);
    loaded.maxGridCells = positiveValue(settings, "maxGridCells", defaults.maxGridCells);
    loaded.maxSliceBands = positiveValue(settings, "maxSliceBands", defaults.maxSliceBands);
    loaded.stationInterval = positiveValue(settings, "stationInterval", defaults.stationInterval);
    loaded.freeHaul = nonNegativeValue(settings, "freeHaul", defaults.freeHaul);

    QString method = settings.value("interpolation", defaults.interpolation).toString();
    if (!isKnownInterpolation(method)) {
        qWarning() << "Unknown interpolation setting" << method << "- using" << defaults.interpolation;
        method = defaults.interpolation;
    }
    loaded.interpolation = method.trimmed().toLower();

    settings.endGroup();

    return loaded;
}

void VolumeSettings::save(QSettings &settings) const
{
    settings.beginGroup("volume");
    settings.setValue("gridResolution", gridResolution);
    settings.setValue("interpolation", interpolation);
    settings.setValue("idwPower", idwPower);
    settings.setValue("idwSmoothing", idwSmoothing);
    settings.setValue("sliceThickness", sliceThickness);
    settings.setValue("gridTolerance", gridTolerance);
    settings.setValue("maxGridCells", maxGridCells);
    settings.setValue("maxSliceBands", maxSliceBands);
    settings.setValue("stationInterval", stationInterval);
    settings.setValue("freeHaul", freeHaul);
    settings.endGroup();
}
