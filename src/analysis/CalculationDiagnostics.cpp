#include "CalculationDiagnostics.h"
#include <QDebug>

void CalculationDiagnostics::setError(Error error, const QString &message)
{
    // The first fatal error is the one reported to the caller
    if (m_error != Error::None) {
        qWarning() << "Additional calculation error ignored:" << message;
        return;
    }

    m_error = error;
    m_errorMessage = message;
    qWarning().noquote() << errorName(error) + ":" << message;
}

void CalculationDiagnostics::addWarning(Warning kind, const QString &message)
{
    m_warnings.append({kind, message});
    qWarning().noquote() << warningName(kind) + ":" << message;
}

bool CalculationDiagnostics::hasWarning(Warning kind) const
{
    for (const Entry &entry : m_warnings) {
        if (entry.kind == kind) return true;
    }
    return false;
}

QStringList CalculationDiagnostics::warningMessages() const
{
    QStringList messages;
    for (const Entry &entry : m_warnings) {
        messages.append(QString("%1: %2").arg(warningName(entry.kind), entry.message));
    }
    return messages;
}

void CalculationDiagnostics::clear()
{
    m_error = Error::None;
    m_errorMessage.clear();
    m_warnings.clear();
}

QString CalculationDiagnostics::errorName(Error error)
{
    switch (error) {
    case Error::None:
        return QStringLiteral("None");
    case Error::InvalidInput:
        return QStringLiteral("InvalidInputError");
    case Error::EmptyData:
        return QStringLiteral("EmptyDataError");
    case Error::InvalidResolution:
        return QStringLiteral("InvalidResolutionError");
    }
    return QStringLiteral("UnknownError");
}

QString CalculationDiagnostics::warningName(Warning kind)
{
    switch (kind) {
    case Warning::InterpolationFailure:
        return QStringLiteral("InterpolationFailure");
    case Warning::EmptyOverlap:
        return QStringLiteral("EmptyOverlap");
    case Warning::EmptyGrid:
        return QStringLiteral("EmptyGrid");
    }
    return QStringLiteral("UnknownWarning");
}
