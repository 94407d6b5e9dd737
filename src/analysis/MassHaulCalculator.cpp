#include "MassHaulCalculator.h"
#include "CalculationDiagnostics.h"
#include "GDALHelpers.h"
#include <QDebug>
#include <QVariantList>
#include <algorithm>
#include <cmath>

using namespace GDALHelpers;

QVariantMap MassHaulResult::toVariantMap() const
{
    QVariantList list;
    list.reserve(stations.size());
    for (const HaulStation &s : stations) {
        QVariantMap entry;
        entry["station"] = s.station;
        entry["cut"] = s.cut;
        entry["fill"] = s.fill;
        entry["cumulative"] = s.cumulative;
        list.append(entry);
    }

    QVariantMap result;
    result["stations"] = list;
    result["alignmentLength"] = alignmentLength;
    result["overhaul"] = overhaul;
    return result;
}

bool MassHaulCalculator::validateParameters(double stationInterval,
                                            double freeHaul,
                                            CalculationDiagnostics &diagnostics)
{
    if (!std::isfinite(stationInterval) || stationInterval <= 0) {
        diagnostics.setError(CalculationDiagnostics::Error::InvalidResolution,
                             QString("Invalid station interval: %1 (must be > 0)").arg(stationInterval));
        return false;
    }
    if (!std::isfinite(freeHaul) || freeHaul < 0) {
        diagnostics.setError(CalculationDiagnostics::Error::InvalidInput,
                             QString("Invalid free haul distance: %1 (must be >= 0)").arg(freeHaul));
        return false;
    }
    return true;
}

MassHaulResult MassHaulCalculator::build(const VolumeResult &result,
                                         const QVector<QPointF> &alignment,
                                         double cellSize,
                                         double stationInterval,
                                         double freeHaul,
                                         CalculationDiagnostics &diagnostics,
                                         bool *ok,
                                         double maxStations)
{
    if (ok) *ok = false;

    MassHaulResult haul;
    if (!validateParameters(stationInterval, freeHaul, diagnostics)) {
        return haul;
    }

    if (alignment.size() < 2) {
        diagnostics.setError(CalculationDiagnostics::Error::InvalidInput,
                             QString("Haul alignment needs at least 2 vertices, got %1").arg(alignment.size()));
        return haul;
    }
    for (const QPointF &v : alignment) {
        if (!std::isfinite(v.x()) || !std::isfinite(v.y())) {
            diagnostics.setError(CalculationDiagnostics::Error::InvalidInput,
                                 "Haul alignment has a non-finite vertex");
            return haul;
        }
    }

    GeosContextGuard geos;
    if (!geos) {
        diagnostics.setError(CalculationDiagnostics::Error::InvalidInput,
                             "Failed to initialise GEOS context");
        return haul;
    }
    GEOSContextHandle_t ctx = geos.get();

    GEOSCoordSequence* seq = GEOSCoordSeq_create_r(ctx, static_cast<unsigned int>(alignment.size()), 2);
    if (!seq) {
        diagnostics.setError(CalculationDiagnostics::Error::InvalidInput,
                             QString("Failed to create haul alignment: %1").arg(geos.lastError()));
        return haul;
    }
    for (int i = 0; i < alignment.size(); ++i) {
        GEOSCoordSeq_setX_r(ctx, seq, i, alignment[i].x());
        GEOSCoordSeq_setY_r(ctx, seq, i, alignment[i].y());
    }

    // The line owns the sequence from here on
    GeometryGuard line(ctx, GEOSGeom_createLineString_r(ctx, seq));
    if (!line) {
        diagnostics.setError(CalculationDiagnostics::Error::InvalidInput,
                             QString("Failed to create haul alignment: %1").arg(geos.lastError()));
        return haul;
    }

    double length = 0.0;
    if (!GEOSLength_r(ctx, line.get(), &length) || !(length > 0.0)) {
        diagnostics.setError(CalculationDiagnostics::Error::InvalidInput,
                             QString("Haul alignment has zero length"));
        return haul;
    }

    const double stationCount = std::ceil(length / stationInterval) + 1.0;
    if (!(stationCount <= maxStations)) {
        diagnostics.setError(CalculationDiagnostics::Error::InvalidResolution,
                             QString("Station interval %1 too fine for alignment length %2: "
                                     "%3 stations exceeds limit of %4")
                                 .arg(stationInterval).arg(length).arg(stationCount).arg(maxStations));
        return haul;
    }

    const int n = static_cast<int>(stationCount);
    QVector<double> cuts(n, 0.0);
    QVector<double> fills(n, 0.0);
    const double cellArea = cellSize * cellSize;

    const DzGrid &dz = result.dzGrid;
    for (int row = 0; row < dz.rows(); ++row) {
        for (int col = 0; col < dz.cols(); ++col) {
            const double d = dz.at(row, col);
            if (std::isnan(d) || d == 0.0) continue;

            GeometryGuard node(ctx, createPoint(ctx, result.gridX[col], result.gridY[row]));
            if (!node) {
                diagnostics.setError(CalculationDiagnostics::Error::InvalidInput,
                                     QString("Failed to create GEOS point: %1").arg(geos.lastError()));
                return haul;
            }

            const double distance = GEOSProject_r(ctx, line.get(), node.get());
            if (distance < 0.0) {
                diagnostics.setError(CalculationDiagnostics::Error::InvalidInput,
                                     QString("Failed to project node onto haul alignment: %1")
                                         .arg(geos.lastError()));
                return haul;
            }

            const int idx = static_cast<int>(std::min(std::floor(distance / stationInterval),
                                                      stationCount - 1.0));
            if (d > 0) {
                fills[idx] += d * cellArea;
            } else {
                cuts[idx] += -d * cellArea;
            }
        }
    }

    haul.alignmentLength = length;
    haul.stations.reserve(n);
    double cumulative = 0.0;
    for (int i = 0; i < n; ++i) {
        cumulative += fills[i] - cuts[i];
        HaulStation station;
        station.station = i * stationInterval;
        station.cut = cuts[i];
        station.fill = fills[i];
        station.cumulative = cumulative;
        haul.stations.append(station);
    }

    // Pairs of stations further apart than the free haul contribute
    // |mass difference| x (distance - free haul)
    const double freeStations = std::floor(freeHaul / stationInterval);
    if (freeStations < n - 1) {
        const int gap = static_cast<int>(freeStations) + 1;
        for (int i = 0; i + gap < n; ++i) {
            for (int j = i + gap; j < n; ++j) {
                const double volume = std::abs(haul.stations[j].cumulative - haul.stations[i].cumulative);
                const double distance = (j - i) * stationInterval;
                haul.overhaul += (distance - freeHaul) * volume;
            }
        }
    }

    qDebug() << "Mass haul:" << n << "stations over" << length << "| overhaul" << haul.overhaul;

    if (ok) *ok = true;
    return haul;
}
