#ifndef GRIDBUILDER_H
#define GRIDBUILDER_H

#include "models/Surface.h"
#include <QPointF>
#include <QVector>

class CalculationDiagnostics;

/**
 * @brief Regular sampling grid shared by both surfaces
 *
 * points holds the Cartesian product gridY x gridX flattened row-major with
 * y varying slowest: points[row * cols() + col] == (gridX[col], gridY[row]).
 */
struct SamplingGrid
{
    QVector<double> gridX;
    QVector<double> gridY;
    QVector<QPointF> points;
    double resolution = 0.0;

    int cols() const { return gridX.size(); }
    int rows() const { return gridY.size(); }
    int pointCount() const { return points.size(); }
    bool isEmpty() const { return points.isEmpty(); }
    double cellArea() const { return resolution * resolution; }
};

/**
 * @brief Lays a uniform square grid over a bounding box
 */
class GridBuilder
{
public:
    static constexpr double DefaultToleranceFactor = 1e-9;
    static constexpr double DefaultMaxCells = 25000000.0;

    /**
     * @brief Build the sampling grid for a footprint
     *
     * Each axis runs from the box minimum in steps of resolution up to and
     * including the maximum, within resolution * toleranceFactor. An axis
     * with no samples yields an empty grid, reported as an EmptyGrid warning.
     * @param box Footprint to cover
     * @param resolution Cell size in ground units (> 0)
     * @param gridOut Output parameter for the grid
     * @param diagnostics Receives InvalidResolution errors
     * @param toleranceFactor Upper bound tolerance relative to resolution
     * @param maxCells Largest accepted number of grid cells
     * @return true on success (including the empty grid case)
     */
    static bool build(const BoundingBox &box,
                      double resolution,
                      SamplingGrid &gridOut,
                      CalculationDiagnostics &diagnostics,
                      double toleranceFactor = DefaultToleranceFactor,
                      double maxCells = DefaultMaxCells);

    /**
     * @brief Samples lo, lo + step, ... not exceeding hi + tolerance
     */
    static QVector<double> axis(double lo, double hi, double step, double tolerance);

private:
    static double sampleCount(double lo, double hi, double step, double tolerance);
};

#endif // GRIDBUILDER_H
