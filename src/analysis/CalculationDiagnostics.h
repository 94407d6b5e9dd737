#ifndef CALCULATIONDIAGNOSTICS_H
#define CALCULATIONDIAGNOSTICS_H

#include <QList>
#include <QString>
#include <QStringList>

/**
 * @brief Error and warning channel for one volume calculation
 *
 * Constructed once per calculation and handed to every pipeline stage.
 * Fatal errors abort the calculation; warnings describe recoverable
 * degradations (a surface that could not be interpolated, surfaces that do
 * not overlap) and travel with the result.
 */
class CalculationDiagnostics
{
public:
    enum class Error {
        None,
        InvalidInput,       // null surface, malformed point map, size mismatch
        EmptyData,          // both surfaces without points
        InvalidResolution   // resolution/thickness <= 0 or grid too large
    };

    enum class Warning {
        InterpolationFailure,
        EmptyOverlap,
        EmptyGrid
    };

    struct Entry {
        Warning kind;
        QString message;
    };

    void setError(Error error, const QString &message);
    void addWarning(Warning kind, const QString &message);

    bool hasError() const { return m_error != Error::None; }
    Error error() const { return m_error; }
    QString errorMessage() const { return m_errorMessage; }

    bool hasWarning(Warning kind) const;
    const QList<Entry> &warnings() const { return m_warnings; }
    QStringList warningMessages() const;

    void clear();

    static QString errorName(Error error);
    static QString warningName(Warning kind);

private:
    Error m_error = Error::None;
    QString m_errorMessage;
    QList<Entry> m_warnings;
};

#endif // CALCULATIONDIAGNOSTICS_H
