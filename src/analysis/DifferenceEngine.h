#ifndef DIFFERENCEENGINE_H
#define DIFFERENCEENGINE_H

#include "GridBuilder.h"
#include <QStringList>
#include <QVariantMap>
#include <QVector>

class CalculationDiagnostics;

/**
 * @brief Elevation difference field, rows (gridY) x cols (gridX), NaN = no data
 */
class DzGrid
{
public:
    DzGrid() = default;
    DzGrid(int rows, int cols, double fill);

    int rows() const { return m_rows; }
    int cols() const { return m_cols; }
    bool isEmpty() const { return m_values.isEmpty(); }

    double at(int row, int col) const { return m_values[row * m_cols + col]; }

    const QVector<double> &values() const { return m_values; }
    QVector<double> &values() { return m_values; }

    /**
     * @brief Number of cells holding data (not NaN)
     */
    int validCount() const;

private:
    int m_rows = 0;
    int m_cols = 0;
    QVector<double> m_values;
};

/**
 * @brief Outcome of a grid volume calculation
 *
 * Downstream consumers must read NaN cells in dzGrid as "no data", not as a
 * zero elevation difference.
 */
struct VolumeResult
{
    double cut = 0.0;       // B below A: material removed
    double fill = 0.0;      // B above A: material added
    double net = 0.0;       // fill - cut
    double area = 0.0;      // area of valid cells
    int validCells = 0;
    bool emptyOverlap = false;
    DzGrid dzGrid;
    QVector<double> gridX;
    QVector<double> gridY;
    QStringList warnings;

    /**
     * @brief Map with cut, fill, net, area, validCells, emptyOverlap,
     * warnings, gridX, gridY and dzGrid (list of rows, NaN as null)
     */
    QVariantMap toVariantMap() const;
};

/**
 * @brief Cut/fill inside one depth band of the difference field
 *
 * zBottom/zTop are measured from the reference surface: fill bands lie
 * above zero, cut bands below.
 */
struct SliceResult
{
    double zBottom = 0.0;
    double zTop = 0.0;
    double cut = 0.0;
    double fill = 0.0;
};

/**
 * @brief Differences two elevation fields and aggregates volumes
 */
class DifferenceEngine
{
public:
    static constexpr double SliceTolerance = 1e-9;
    static constexpr double DefaultMaxSliceBands = 10000.0;

    /**
     * @brief dz = elevationsB - elevationsA over cells valid in both
     *
     * Cut sums |dz| * cellArea where dz < 0, fill where dz > 0. When no cell
     * is valid the result is all-zero with an all-NaN dzGrid and an
     * EmptyOverlap warning.
     * @param elevationsA Reference elevations, one per grid point
     * @param elevationsB Comparison elevations, one per grid point
     * @param grid Grid both vectors were sampled on
     * @param diagnostics Receives InvalidInput on size mismatch
     * @param ok Set to false on a fatal error
     */
    static VolumeResult difference(const QVector<double> &elevationsA,
                                   const QVector<double> &elevationsB,
                                   const SamplingGrid &grid,
                                   CalculationDiagnostics &diagnostics,
                                   bool *ok = nullptr);

    /**
     * @brief Split the difference field into depth bands of sliceThickness
     *
     * Bands are sorted by zBottom. Each cell contributes the part of its
     * dz column that lies inside a band.
     * @param cellSize Grid resolution the result was computed at
     * @param ok Set to false when sliceThickness is not positive or too
     * fine for the depth range
     * @param maxBands Largest accepted number of cut plus fill bands
     */
    static QVector<SliceResult> sliceVolumes(const VolumeResult &result,
                                             double cellSize,
                                             double sliceThickness,
                                             CalculationDiagnostics &diagnostics,
                                             bool *ok = nullptr,
                                             double maxBands = DefaultMaxSliceBands);
};

#endif // DIFFERENCEENGINE_H
