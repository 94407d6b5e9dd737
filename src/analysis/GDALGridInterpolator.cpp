#include "GDALGridInterpolator.h"
#include "CalculationDiagnostics.h"
#include "GDALHelpers.h"
#include <gdal.h>
#include <gdal_utils.h>
#include <ogr_api.h>
#include <QDebug>
#include <cmath>
#include <limits>

using namespace GDALHelpers;

GDALGridInterpolator::GDALGridInterpolator(Algorithm algorithm, double power, double smoothing)
    : m_algorithm(algorithm)
    , m_power(power)
    , m_smoothing(smoothing)
{
    registerDrivers();
}

QString GDALGridInterpolator::method() const
{
    return m_algorithm == Algorithm::InverseDistance ? QStringLiteral("invdist")
                                                     : QStringLiteral("nearest");
}

QString GDALGridInterpolator::algorithmOption() const
{
    if (m_algorithm == Algorithm::InverseDistance) {
        return QString("invdist:power=%1:smoothing=%2:nodata=%3")
            .arg(m_power, 0, 'f', 6)
            .arg(m_smoothing, 0, 'f', 6)
            .arg(NoDataValue, 0, 'f', 1);
    }
    return QString("nearest:radius1=0.0:radius2=0.0:angle=0.0:nodata=%1")
        .arg(NoDataValue, 0, 'f', 1);
}

bool GDALGridInterpolator::loadPoints(GDALDatasetH hDS, const Surface &surface, QString &errorOut) const
{
    OGRLayerH hLayer = GDALDatasetCreateLayer(hDS, "points", nullptr, wkbPoint25D, nullptr);
    if (!hLayer) {
        errorOut = "Failed to create point layer";
        return false;
    }

    for (auto it = surface.points().constBegin(); it != surface.points().constEnd(); ++it) {
        OGRFeatureH hFeat = OGR_F_Create(OGR_L_GetLayerDefn(hLayer));
        OGRGeometryH hGeom = OGR_G_CreateGeometry(wkbPoint25D);
        OGR_G_SetPoint(hGeom, 0, it->x(), it->y(), it->z());
        OGR_F_SetGeometryDirectly(hFeat, hGeom);

        OGRErr err = OGR_L_CreateFeature(hLayer, hFeat);
        OGR_F_Destroy(hFeat);

        if (err != OGRERR_NONE) {
            errorOut = QString("Failed to store point '%1' (code: %2)").arg(it.key()).arg(err);
            return false;
        }
    }

    return true;
}

bool GDALGridInterpolator::clipToHull(const Surface &surface,
                                      const SamplingGrid &grid,
                                      QVector<double> &elevations,
                                      QString &errorOut) const
{
    GeosContextGuard geos;
    if (!geos) {
        errorOut = "Failed to initialise GEOS context";
        return false;
    }
    GEOSContextHandle_t ctx = geos.get();

    std::vector<GEOSGeometry*> pointGeoms;
    pointGeoms.reserve(surface.pointCount());
    for (auto it = surface.points().constBegin(); it != surface.points().constEnd(); ++it) {
        GEOSGeometry* g = createPoint(ctx, it->x(), it->y());
        if (!g) {
            for (GEOSGeometry* created : pointGeoms) {
                GEOSGeom_destroy_r(ctx, created);
            }
            errorOut = "Failed to create GEOS point geometry";
            return false;
        }
        pointGeoms.push_back(g);
    }

    GeometryGuard collection(ctx, GEOSGeom_createCollection_r(ctx, GEOS_MULTIPOINT,
                                                              pointGeoms.data(),
                                                              static_cast<unsigned int>(pointGeoms.size())));
    if (!collection) {
        errorOut = "Failed to create point collection for hull";
        return false;
    }

    GeometryGuard hull(ctx, GEOSConvexHull_r(ctx, collection.get()));
    if (!hull) {
        errorOut = QString("Convex hull failed: %1").arg(geos.lastError());
        return false;
    }

    if (GEOSGeomTypeId_r(ctx, hull.get()) != GEOS_POLYGON) {
        errorOut = "Convex hull has no area (collinear points?)";
        return false;
    }

    PreparedGeometryGuard prepHull(ctx, GEOSPrepare_r(ctx, hull.get()));
    if (!prepHull) {
        errorOut = "Failed to prepare convex hull";
        return false;
    }

    for (int i = 0; i < grid.pointCount(); ++i) {
        if (std::isnan(elevations[i])) continue;

        const QPointF &p = grid.points[i];
        GeometryGuard pGeom(ctx, createPoint(ctx, p.x(), p.y()));
        if (!pGeom) {
            errorOut = "Failed to create GEOS query point";
            return false;
        }

        char inside = GEOSPreparedIntersects_r(ctx, prepHull.get(), pGeom.get());
        if (inside == 2) {
            errorOut = QString("Hull test failed: %1").arg(geos.lastError());
            return false;
        }
        if (!inside) {
            elevations[i] = std::numeric_limits<double>::quiet_NaN();
        }
    }

    return true;
}

QVector<double> GDALGridInterpolator::interpolate(const Surface &surface,
                                                  const SamplingGrid &grid,
                                                  CalculationDiagnostics &diagnostics) const
{
    if (surface.pointCount() < MinimumPoints) {
        return failed(surface, grid,
                      QString("Insufficient points: %1 (minimum %2 required)")
                          .arg(surface.pointCount()).arg(MinimumPoints),
                      diagnostics);
    }

    if (grid.isEmpty()) {
        return QVector<double>();
    }

    CPLErrorHandlerGuard gdalErrors;

    GDALDriverH hMemDriver = GDALGetDriverByName("Memory");
    if (!hMemDriver) {
        return failed(surface, grid, "GDAL Memory driver not available", diagnostics);
    }

    DatasetGuard srcDataset(GDALCreate(hMemDriver, "grid_points", 0, 0, 0, GDT_Unknown, nullptr));
    if (!srcDataset) {
        return failed(surface, grid, "Failed to create memory datasource for points", diagnostics);
    }

    QString error;
    if (!loadPoints(srcDataset.get(), surface, error)) {
        return failed(surface, grid, error, diagnostics);
    }

    // Cell centres of the output raster coincide with the grid nodes
    const double half = grid.resolution / 2.0;
    const double minX = grid.gridX.first() - half;
    const double maxX = grid.gridX.last() + half;
    const double minY = grid.gridY.first() - half;
    const double maxY = grid.gridY.last() + half;

    CStringArrayGuard args;
    args.add("-of");
    args.add("MEM");
    args.add("-ot");
    args.add("Float64");
    args.add("-l");
    args.add("points");
    args.add("-outsize");
    args.add(QString::number(grid.cols()));
    args.add(QString::number(grid.rows()));
    args.add("-txe");
    args.add(QString::number(minX, 'g', 17));
    args.add(QString::number(maxX, 'g', 17));
    args.add("-tye");
    args.add(QString::number(minY, 'g', 17));
    args.add(QString::number(maxY, 'g', 17));
    args.add("-a");
    args.add(algorithmOption());

    GridOptionsGuard gridOptions(GDALGridOptionsNew(args.data(), nullptr));
    if (!gridOptions) {
        return failed(surface, grid, "Failed to create GDAL grid options", diagnostics);
    }

    int usageError = FALSE;
    DatasetGuard dstDataset(GDALGrid("", srcDataset.get(), gridOptions.get(), &usageError));
    if (!dstDataset || usageError) {
        return failed(surface, grid,
                      QString("GDAL Grid failed: %1").arg(gdalErrors.lastError()),
                      diagnostics);
    }

    GDALRasterBandH hBand = GDALGetRasterBand(dstDataset.get(), 1);
    if (!hBand) {
        return failed(surface, grid, "Failed to get interpolated raster band", diagnostics);
    }

    double adfGeoTransform[6];
    if (GDALGetGeoTransform(dstDataset.get(), adfGeoTransform) != CE_None) {
        return failed(surface, grid, "Failed to get interpolated raster geotransform", diagnostics);
    }

    const int width = GDALGetRasterBandXSize(hBand);
    const int height = GDALGetRasterBandYSize(hBand);

    QVector<double> raster(width * height);
    if (GDALRasterIO(hBand, GF_Read, 0, 0, width, height,
                     raster.data(), width, height, GDT_Float64, 0, 0) != CE_None) {
        return failed(surface, grid, "Failed to read interpolated raster data", diagnostics);
    }

    // Raster rows may run north-up or south-up; place them by cell centre
    QVector<double> elevations = nanVector(grid.pointCount());
    for (int row = 0; row < height; ++row) {
        const double worldY = adfGeoTransform[3] + (row + 0.5) * adfGeoTransform[5];
        const int gridRow = qRound((worldY - grid.gridY.first()) / grid.resolution);
        if (gridRow < 0 || gridRow >= grid.rows()) continue;

        for (int col = 0; col < width; ++col) {
            const double worldX = adfGeoTransform[0] + (col + 0.5) * adfGeoTransform[1];
            const int gridCol = qRound((worldX - grid.gridX.first()) / grid.resolution);
            if (gridCol < 0 || gridCol >= grid.cols()) continue;

            const double value = raster[row * width + col];
            if (value == NoDataValue || std::isnan(value)) continue;

            elevations[gridRow * grid.cols() + gridCol] = value;
        }
    }

    if (!clipToHull(surface, grid, elevations, error)) {
        return failed(surface, grid, error, diagnostics);
    }

    qDebug() << "GDAL grid interpolation of" << surface.name() << "with" << algorithmOption();
    qDebug() << "  Grid size:" << width << "x" << height;

    return elevations;
}
