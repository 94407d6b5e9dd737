#include "DifferenceEngine.h"
#include "CalculationDiagnostics.h"
#include <QDebug>
#include <QVariantList>
#include <algorithm>
#include <cmath>
#include <limits>

DzGrid::DzGrid(int rows, int cols, double fill)
    : m_rows(rows)
    , m_cols(cols)
    , m_values(rows * cols, fill)
{
}

int DzGrid::validCount() const
{
    int count = 0;
    for (double v : m_values) {
        if (!std::isnan(v)) ++count;
    }
    return count;
}

QVariantMap VolumeResult::toVariantMap() const
{
    QVariantMap result;
    result["cut"] = cut;
    result["fill"] = fill;
    result["net"] = net;
    result["area"] = area;
    result["validCells"] = validCells;
    result["emptyOverlap"] = emptyOverlap;
    result["warnings"] = warnings;

    QVariantList xs;
    xs.reserve(gridX.size());
    for (double x : gridX) xs.append(x);

    QVariantList ys;
    ys.reserve(gridY.size());
    for (double y : gridY) ys.append(y);

    QVariantList rows;
    rows.reserve(dzGrid.rows());
    for (int r = 0; r < dzGrid.rows(); ++r) {
        QVariantList row;
        row.reserve(dzGrid.cols());
        for (int c = 0; c < dzGrid.cols(); ++c) {
            const double dz = dzGrid.at(r, c);
            row.append(std::isnan(dz) ? QVariant() : QVariant(dz));
        }
        rows.append(QVariant(row));
    }

    result["gridX"] = xs;
    result["gridY"] = ys;
    result["dzGrid"] = rows;
    return result;
}

VolumeResult DifferenceEngine::difference(const QVector<double> &elevationsA,
                                          const QVector<double> &elevationsB,
                                          const SamplingGrid &grid,
                                          CalculationDiagnostics &diagnostics,
                                          bool *ok)
{
    if (ok) *ok = true;

    VolumeResult result;
    result.gridX = grid.gridX;
    result.gridY = grid.gridY;
    result.dzGrid = DzGrid(grid.rows(), grid.cols(), std::numeric_limits<double>::quiet_NaN());

    const int cellCount = grid.rows() * grid.cols();
    if (elevationsA.size() != cellCount || elevationsB.size() != cellCount) {
        diagnostics.setError(CalculationDiagnostics::Error::InvalidInput,
                             QString("Elevation vectors (%1, %2) do not match grid of %3 x %4 cells")
                                 .arg(elevationsA.size()).arg(elevationsB.size())
                                 .arg(grid.cols()).arg(grid.rows()));
        if (ok) *ok = false;
        return result;
    }

    const double cellArea = grid.cellArea();
    double cut = 0.0;
    double fill = 0.0;
    int valid = 0;

    QVector<double> &dzValues = result.dzGrid.values();
    for (int i = 0; i < cellCount; ++i) {
        const double a = elevationsA[i];
        const double b = elevationsB[i];
        if (std::isnan(a) || std::isnan(b)) continue;

        const double dz = b - a;
        dzValues[i] = dz;
        ++valid;

        const double volume = std::abs(dz) * cellArea;
        if (dz < 0) {
            cut += volume;
        } else if (dz > 0) {
            fill += volume;
        }
    }

    result.validCells = valid;
    result.area = valid * cellArea;

    if (valid == 0) {
        result.emptyOverlap = true;
        diagnostics.addWarning(CalculationDiagnostics::Warning::EmptyOverlap,
                               QString("No grid cell is covered by both surfaces (%1 cells examined)")
                                   .arg(cellCount));
        return result;
    }

    result.cut = cut;
    result.fill = fill;
    result.net = fill - cut;

    qDebug() << "Volume (grid-based): Cut=" << cut << "Fill=" << fill
             << "Net=" << result.net << "Area=" << result.area;

    return result;
}

QVector<SliceResult> DifferenceEngine::sliceVolumes(const VolumeResult &result,
                                                    double cellSize,
                                                    double sliceThickness,
                                                    CalculationDiagnostics &diagnostics,
                                                    bool *ok,
                                                    double maxBands)
{
    if (ok) *ok = true;

    QVector<SliceResult> slices;
    if (!std::isfinite(sliceThickness) || sliceThickness <= 0) {
        diagnostics.setError(CalculationDiagnostics::Error::InvalidResolution,
                             QString("Invalid slice thickness: %1 (must be > 0)").arg(sliceThickness));
        if (ok) *ok = false;
        return slices;
    }

    double maxFill = 0.0;
    double maxCut = 0.0;
    for (double dz : result.dzGrid.values()) {
        if (std::isnan(dz)) continue;
        if (dz > maxFill) maxFill = dz;
        if (-dz > maxCut) maxCut = -dz;
    }

    auto bandCount = [sliceThickness](double depth) {
        if (depth <= 0.0) return 0.0;
        return std::max(1.0, std::ceil(depth / sliceThickness - SliceTolerance));
    };

    const double cutBandCount = bandCount(maxCut);
    const double fillBandCount = bandCount(maxFill);
    const double bandLimit = std::min(maxBands, static_cast<double>(std::numeric_limits<int>::max()));
    if (!(cutBandCount + fillBandCount <= bandLimit)) {
        diagnostics.setError(CalculationDiagnostics::Error::InvalidResolution,
                             QString("Slice thickness %1 too fine for depth range %2 to %3: "
                                     "%4 bands exceeds limit of %5")
                                 .arg(sliceThickness).arg(-maxCut).arg(maxFill)
                                 .arg(cutBandCount + fillBandCount).arg(bandLimit));
        if (ok) *ok = false;
        return slices;
    }

    const int cutBands = static_cast<int>(cutBandCount);
    const int fillBands = static_cast<int>(fillBandCount);

    QVector<double> cutVolumes(cutBands, 0.0);
    QVector<double> fillVolumes(fillBands, 0.0);
    const double cellArea = cellSize * cellSize;

    // The outermost band also takes whatever the tolerance left above it
    auto distribute = [sliceThickness, cellArea](double depth, QVector<double> &bands) {
        for (int k = 0; k < bands.size(); ++k) {
            const double bottom = k * sliceThickness;
            if (depth <= bottom) break;
            const double top = (k == bands.size() - 1) ? depth : std::min(depth, bottom + sliceThickness);
            bands[k] += (top - bottom) * cellArea;
        }
    };

    for (double dz : result.dzGrid.values()) {
        if (std::isnan(dz)) continue;
        if (dz > 0) {
            distribute(dz, fillVolumes);
        } else if (dz < 0) {
            distribute(-dz, cutVolumes);
        }
    }

    slices.reserve(cutBands + fillBands);
    for (int k = cutBands - 1; k >= 0; --k) {
        SliceResult slice;
        slice.zBottom = -(k + 1) * sliceThickness;
        slice.zTop = -k * sliceThickness;
        slice.cut = cutVolumes[k];
        slices.append(slice);
    }
    for (int k = 0; k < fillBands; ++k) {
        SliceResult slice;
        slice.zBottom = k * sliceThickness;
        slice.zTop = (k + 1) * sliceThickness;
        slice.fill = fillVolumes[k];
        slices.append(slice);
    }

    qDebug() << "Sliced difference into" << cutBands << "cut and" << fillBands
             << "fill bands of" << sliceThickness;

    return slices;
}
