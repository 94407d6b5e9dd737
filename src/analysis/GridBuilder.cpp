#include "GridBuilder.h"
#include "CalculationDiagnostics.h"
#include <QDebug>
#include <cmath>
#include <limits>

double GridBuilder::sampleCount(double lo, double hi, double step, double tolerance)
{
    if (!std::isfinite(lo) || !std::isfinite(hi) || hi + tolerance < lo) {
        return 0.0;
    }
    return std::floor((hi - lo + tolerance) / step) + 1.0;
}

QVector<double> GridBuilder::axis(double lo, double hi, double step, double tolerance)
{
    QVector<double> values;
    const double count = sampleCount(lo, hi, step, tolerance);
    if (count <= 0.0 || count >= std::numeric_limits<int>::max()) {
        return values;
    }

    const int n = static_cast<int>(count);
    values.reserve(n + 1);
    for (int i = 0; i < n; ++i) {
        const double v = lo + i * step;
        if (v > hi + tolerance) break;
        values.append(v);
    }

    // floor() may have rounded the last sample away
    const double next = lo + values.size() * step;
    if (next <= hi + tolerance) {
        values.append(next);
    }

    return values;
}

bool GridBuilder::build(const BoundingBox &box,
                        double resolution,
                        SamplingGrid &gridOut,
                        CalculationDiagnostics &diagnostics,
                        double toleranceFactor,
                        double maxCells)
{
    if (!std::isfinite(resolution) || resolution <= 0) {
        diagnostics.setError(CalculationDiagnostics::Error::InvalidResolution,
                             QString("Invalid grid resolution: %1 (must be > 0)").arg(resolution));
        return false;
    }

    const double tolerance = resolution * toleranceFactor;

    const double nx = sampleCount(box.minX, box.maxX, resolution, tolerance);
    const double ny = sampleCount(box.minY, box.maxY, resolution, tolerance);
    if (nx > maxCells || ny > maxCells || nx * ny > maxCells) {
        diagnostics.setError(CalculationDiagnostics::Error::InvalidResolution,
                             QString("Grid resolution %1 too fine: %2 x %3 cells exceeds limit of %4")
                                 .arg(resolution).arg(nx).arg(ny).arg(maxCells));
        return false;
    }

    SamplingGrid grid;
    grid.resolution = resolution;
    grid.gridX = axis(box.minX, box.maxX, resolution, tolerance);
    grid.gridY = axis(box.minY, box.maxY, resolution, tolerance);

    if (grid.gridX.isEmpty() || grid.gridY.isEmpty()) {
        grid.gridX.clear();
        grid.gridY.clear();
        diagnostics.addWarning(CalculationDiagnostics::Warning::EmptyGrid,
                               QString("Bounding box [%1, %2] - [%3, %4] yields no grid samples at resolution %5")
                                   .arg(box.minX).arg(box.minY).arg(box.maxX).arg(box.maxY).arg(resolution));
        gridOut = grid;
        return true;
    }

    grid.points.reserve(grid.gridX.size() * grid.gridY.size());
    for (double y : grid.gridY) {
        for (double x : grid.gridX) {
            grid.points.append(QPointF(x, y));
        }
    }

    qDebug() << "Grid built:" << grid.cols() << "x" << grid.rows()
             << "cells at resolution" << resolution;

    gridOut = grid;
    return true;
}
