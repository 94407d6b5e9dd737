#include "EarthworkEngine.h"
#include "CalculationDiagnostics.h"
#include "GDALHelpers.h"
#include "VolumeCalculator.h"
#include "models/Surface.h"
#include "utilities/VolumeSettings.h"
#include <gdal.h>
#include <geos_c.h>
#include <QPointF>
#include <QSettings>
#include <QDebug>
#include <cmath>

namespace {

QVariantMap failureMap(const CalculationDiagnostics &diagnostics)
{
    QVariantMap result;
    result["success"] = false;
    result["error"] = diagnostics.errorMessage();
    result["errorCode"] = CalculationDiagnostics::errorName(diagnostics.error());
    return result;
}

bool toSurfaces(const QVariantList &existingPoints,
                const QVariantList &proposedPoints,
                Surface &existing,
                Surface &proposed,
                CalculationDiagnostics &diagnostics)
{
    QString error;
    bool ok = false;

    existing = Surface::fromVariantList("Existing", existingPoints, error, &ok);
    if (!ok) {
        diagnostics.setError(CalculationDiagnostics::Error::InvalidInput, error);
        return false;
    }

    proposed = Surface::fromVariantList("Proposed", proposedPoints, error, &ok);
    if (!ok) {
        diagnostics.setError(CalculationDiagnostics::Error::InvalidInput, error);
        return false;
    }

    return true;
}

bool toAlignment(const QVariantList &vertices,
                 QVector<QPointF> &alignment,
                 CalculationDiagnostics &diagnostics)
{
    alignment.clear();
    alignment.reserve(vertices.size());
    for (int i = 0; i < vertices.size(); ++i) {
        const QVariantMap m = vertices[i].toMap();
        bool okX = false;
        bool okY = false;
        const double x = m.value("x").toDouble(&okX);
        const double y = m.value("y").toDouble(&okY);
        if (!okX || !okY || !std::isfinite(x) || !std::isfinite(y)) {
            diagnostics.setError(CalculationDiagnostics::Error::InvalidInput,
                                 QString("Alignment vertex %1 missing or invalid x, y coordinate").arg(i));
            return false;
        }
        alignment.append(QPointF(x, y));
    }
    return true;
}

} // namespace

EarthworkEngine::EarthworkEngine(QObject *parent)
    : QObject(parent)
    , m_isProcessing(false)
    , m_progress(0)
    , m_volumeCalculator(new VolumeCalculator(this))
{
    GDALHelpers::registerDrivers();

    QSettings settings;
    m_volumeCalculator->setSettings(VolumeSettings::load(settings));
    m_volumeCalculator->setProgressCallback([this](int value) {
        setProgress(value);
    });

    qDebug() << "EarthworkEngine initialized. GDAL:" << GDALVersionInfo("RELEASE_NAME")
             << "| GEOS:" << GEOSversion();
}

EarthworkEngine::~EarthworkEngine() = default;

void EarthworkEngine::setError(const QString &error)
{
    m_lastError = error;
    emit errorChanged();
    emit errorOccurred(error);
}

void EarthworkEngine::setWarnings(const QStringList &warnings)
{
    m_lastWarnings = warnings;
    emit warningsChanged();
    for (const QString &warning : warnings) {
        emit warningOccurred(warning);
    }
}

void EarthworkEngine::setProcessing(bool processing)
{
    if (m_isProcessing != processing) {
        m_isProcessing = processing;
        emit processingChanged();
    }
}

void EarthworkEngine::setProgress(int value)
{
    if (m_progress != value) {
        m_progress = value;
        emit progressChanged(value);
    }
}

void EarthworkEngine::beginCalculation()
{
    setProcessing(true);
    setProgress(0);
    if (!m_lastWarnings.isEmpty()) {
        m_lastWarnings.clear();
        emit warningsChanged();
    }
}

QVariantMap EarthworkEngine::finishCalculation(QVariantMap result,
                                               const CalculationDiagnostics &diagnostics)
{
    setProcessing(false);

    if (diagnostics.hasError()) {
        qWarning() << "Volume calculation failed:" << diagnostics.errorMessage();
        setError(diagnostics.errorMessage());
        return failureMap(diagnostics);
    }

    result["success"] = true;
    result["error"] = QString();
    result["errorCode"] = QString();

    const QStringList warnings = diagnostics.warningMessages();
    if (!warnings.isEmpty()) {
        setWarnings(warnings);
    }

    setProgress(100);
    return result;
}

QVariantMap EarthworkEngine::calculateVolume(const QVariantList &existingPoints,
                                             const QVariantList &proposedPoints,
                                             double resolution)
{
    beginCalculation();
    CalculationDiagnostics diagnostics;

    Surface existing;
    Surface proposed;
    if (!toSurfaces(existingPoints, proposedPoints, existing, proposed, diagnostics)) {
        return finishCalculation(QVariantMap(), diagnostics);
    }

    const VolumeResult volume = m_volumeCalculator->calculateSurfaceToSurface(
        &existing, &proposed, resolution, diagnostics);

    QVariantMap result = volume.toVariantMap();
    result["method"] = m_volumeCalculator->settings().interpolation;
    return finishCalculation(result, diagnostics);
}

QVariantMap EarthworkEngine::calculateVolumeToElevation(const QVariantList &points,
                                                        double elevation,
                                                        double resolution)
{
    beginCalculation();
    CalculationDiagnostics diagnostics;

    QString error;
    bool ok = false;
    const Surface surface = Surface::fromVariantList("Surface", points, error, &ok);
    if (!ok) {
        diagnostics.setError(CalculationDiagnostics::Error::InvalidInput, error);
        return finishCalculation(QVariantMap(), diagnostics);
    }

    const VolumeResult volume = m_volumeCalculator->calculateSurfaceToElevation(
        &surface, elevation, resolution, diagnostics);

    QVariantMap result = volume.toVariantMap();
    result["method"] = m_volumeCalculator->settings().interpolation;
    result["elevation"] = elevation;
    return finishCalculation(result, diagnostics);
}

QVariantMap EarthworkEngine::computeSliceVolumes(const QVariantList &existingPoints,
                                                 const QVariantList &proposedPoints,
                                                 double sliceThickness,
                                                 double resolution)
{
    beginCalculation();
    CalculationDiagnostics diagnostics;

    Surface existing;
    Surface proposed;
    if (!toSurfaces(existingPoints, proposedPoints, existing, proposed, diagnostics)) {
        return finishCalculation(QVariantMap(), diagnostics);
    }

    const QVector<SliceResult> slices = m_volumeCalculator->computeSliceVolumes(
        &existing, &proposed, sliceThickness, resolution, diagnostics);

    QVariantList sliceList;
    double totalCut = 0.0;
    double totalFill = 0.0;
    for (const SliceResult &slice : slices) {
        QVariantMap entry;
        entry["zBottom"] = slice.zBottom;
        entry["zTop"] = slice.zTop;
        entry["cut"] = slice.cut;
        entry["fill"] = slice.fill;
        sliceList.append(entry);
        totalCut += slice.cut;
        totalFill += slice.fill;
    }

    QVariantMap result;
    result["slices"] = sliceList;
    result["sliceThickness"] = sliceThickness;
    result["cut"] = totalCut;
    result["fill"] = totalFill;
    result["net"] = totalFill - totalCut;
    return finishCalculation(result, diagnostics);
}

QVariantMap EarthworkEngine::computeMassHaul(const QVariantList &existingPoints,
                                             const QVariantList &proposedPoints,
                                             const QVariantList &alignment,
                                             double stationInterval,
                                             double freeHaul,
                                             double resolution)
{
    beginCalculation();
    CalculationDiagnostics diagnostics;

    QVector<QPointF> vertices;
    if (!toAlignment(alignment, vertices, diagnostics)) {
        return finishCalculation(QVariantMap(), diagnostics);
    }

    Surface existing;
    Surface proposed;
    if (!toSurfaces(existingPoints, proposedPoints, existing, proposed, diagnostics)) {
        return finishCalculation(QVariantMap(), diagnostics);
    }

    const MassHaulResult haul = m_volumeCalculator->computeMassHaul(
        &existing, &proposed, vertices, stationInterval, freeHaul, resolution, diagnostics);

    QVariantMap result = haul.toVariantMap();
    result["stationInterval"] = stationInterval;
    result["freeHaul"] = freeHaul;
    return finishCalculation(result, diagnostics);
}

double EarthworkEngine::defaultResolution() const
{
    return m_volumeCalculator->settings().gridResolution;
}

double EarthworkEngine::defaultSliceThickness() const
{
    return m_volumeCalculator->settings().sliceThickness;
}

double EarthworkEngine::defaultStationInterval() const
{
    return m_volumeCalculator->settings().stationInterval;
}

double EarthworkEngine::defaultFreeHaul() const
{
    return m_volumeCalculator->settings().freeHaul;
}

VolumeSettings EarthworkEngine::volumeSettings() const
{
    return m_volumeCalculator->settings();
}

void EarthworkEngine::setVolumeSettings(const VolumeSettings &settings)
{
    m_volumeCalculator->setSettings(settings);
}

QVariantMap EarthworkEngine::settings() const
{
    const VolumeSettings s = m_volumeCalculator->settings();

    QVariantMap map;
    map["gridResolution"] = s.gridResolution;
    map["interpolation"] = s.interpolation;
    map["idwPower"] = s.idwPower;
    map["idwSmoothing"] = s.idwSmoothing;
    map["sliceThickness"] = s.sliceThickness;
    map["gridTolerance"] = s.gridTolerance;
    map["maxGridCells"] = s.maxGridCells;
    map["maxSliceBands"] = s.maxSliceBands;
    map["stationInterval"] = s.stationInterval;
    map["freeHaul"] = s.freeHaul;
    return map;
}

void EarthworkEngine::setSettings(const QVariantMap &settings)
{
    VolumeSettings s = m_volumeCalculator->settings();

    auto apply = [&settings](const QString &key, double &target, bool allowZero) {
        if (!settings.contains(key)) return;
        bool ok = false;
        const double value = settings.value(key).toDouble(&ok);
        if (ok && std::isfinite(value) && (value > 0 || (allowZero && value == 0))) {
            target = value;
        } else {
            qWarning() << "Ignoring invalid setting" << key << "=" << settings.value(key);
        }
    };

    apply("gridResolution", s.gridResolution, false);
    apply("idwPower", s.idwPower, false);
    apply("idwSmoothing", s.idwSmoothing, true);
    apply("sliceThickness", s.sliceThickness, false);
    apply("gridTolerance", s.gridTolerance, true);
    apply("maxGridCells", s.maxGridCells, false);
    apply("maxSliceBands", s.maxSliceBands, false);
    apply("stationInterval", s.stationInterval, false);
    apply("freeHaul", s.freeHaul, true);

    if (settings.contains("interpolation")) {
        const QString method = settings.value("interpolation").toString();
        if (VolumeSettings::isKnownInterpolation(method)) {
            s.interpolation = method.trimmed().toLower();
        } else {
            qWarning() << "Ignoring unknown interpolation method" << method;
        }
    }

    m_volumeCalculator->setSettings(s);
}
