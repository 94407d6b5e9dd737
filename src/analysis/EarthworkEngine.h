#ifndef EARTHWORKENGINE_H
#define EARTHWORKENGINE_H

#include <QObject>
#include <QVariantList>
#include <QVariantMap>
#include <QStringList>
#include <QScopedPointer>

class VolumeCalculator;
class CalculationDiagnostics;
struct VolumeSettings;

/**
 * @brief Facade for earthwork volume operations
 *
 * Converts QML point lists into surfaces, runs the volume calculator and
 * reports errors, warnings and progress through properties and signals.
 * Every invokable returns a map with "success", "error" and "errorCode"
 * alongside its results.
 */
class EarthworkEngine : public QObject
{
    Q_OBJECT
    Q_PROPERTY(QString lastError READ lastError NOTIFY errorChanged)
    Q_PROPERTY(QStringList lastWarnings READ lastWarnings NOTIFY warningsChanged)
    Q_PROPERTY(bool isProcessing READ isProcessing NOTIFY processingChanged)
    Q_PROPERTY(int progress READ progress NOTIFY progressChanged)

public:
    explicit EarthworkEngine(QObject *parent = nullptr);
    ~EarthworkEngine();

    Q_INVOKABLE QVariantMap calculateVolume(const QVariantList &existingPoints,
                                            const QVariantList &proposedPoints,
                                            double resolution);
    Q_INVOKABLE QVariantMap calculateVolumeToElevation(const QVariantList &points,
                                                       double elevation,
                                                       double resolution);
    Q_INVOKABLE QVariantMap computeSliceVolumes(const QVariantList &existingPoints,
                                                const QVariantList &proposedPoints,
                                                double sliceThickness,
                                                double resolution);
    /**
     * @brief Mass-haul curve along an alignment given as {x, y} maps
     */
    Q_INVOKABLE QVariantMap computeMassHaul(const QVariantList &existingPoints,
                                            const QVariantList &proposedPoints,
                                            const QVariantList &alignment,
                                            double stationInterval,
                                            double freeHaul,
                                            double resolution);

    Q_INVOKABLE double defaultResolution() const;
    Q_INVOKABLE double defaultSliceThickness() const;
    Q_INVOKABLE double defaultStationInterval() const;
    Q_INVOKABLE double defaultFreeHaul() const;

    /**
     * @brief Current settings as a map keyed like the "volume/" group
     */
    Q_INVOKABLE QVariantMap settings() const;
    /**
     * @brief Apply known keys from the map; invalid values are ignored
     */
    Q_INVOKABLE void setSettings(const QVariantMap &settings);

    VolumeSettings volumeSettings() const;
    void setVolumeSettings(const VolumeSettings &settings);

    // Property getters
    QString lastError() const { return m_lastError; }
    QStringList lastWarnings() const { return m_lastWarnings; }
    bool isProcessing() const { return m_isProcessing; }
    int progress() const { return m_progress; }

signals:
    void errorOccurred(const QString &error);
    void errorChanged();
    void warningOccurred(const QString &warning);
    void warningsChanged();
    void processingChanged();
    void progressChanged(int value);

private:
    void setError(const QString &error);
    void setWarnings(const QStringList &warnings);
    void setProcessing(bool processing);
    void setProgress(int value);

    void beginCalculation();
    QVariantMap finishCalculation(QVariantMap result, const CalculationDiagnostics &diagnostics);

    QString m_lastError;
    QStringList m_lastWarnings;
    bool m_isProcessing;
    int m_progress;

    QScopedPointer<VolumeCalculator> m_volumeCalculator;
};

#endif // EARTHWORKENGINE_H
