#ifndef GDALHELPERS_H
#define GDALHELPERS_H

#include <gdal.h>
#include <gdal_utils.h>
#include <cpl_error.h>
#include <geos_c.h>
#include <QByteArray>
#include <QDebug>
#include <QString>
#include <vector>
#include <cstdlib>
#include <cstring>

namespace GDALHelpers {

/**
 * @brief Register all GDAL/OGR drivers, once per process
 */
inline void registerDrivers() {
    static const bool registered = [] {
        GDALAllRegister();
        return true;
    }();
    Q_UNUSED(registered);
}

/**
 * @brief RAII owner of a re-entrant GEOS context
 *
 * Routes GEOS notices to qDebug and errors to qCritical, and keeps the last
 * error message so callers can report why an operation returned null.
 */
class GeosContextGuard {
public:
    GeosContextGuard() : m_handle(GEOS_init_r()) {
        if (m_handle) {
            GEOSContext_setNoticeMessageHandler_r(m_handle, &GeosContextGuard::notice, this);
            GEOSContext_setErrorMessageHandler_r(m_handle, &GeosContextGuard::error, this);
        }
    }

    ~GeosContextGuard() {
        if (m_handle) {
            GEOS_finish_r(m_handle);
        }
    }

    GeosContextGuard(const GeosContextGuard&) = delete;
    GeosContextGuard& operator=(const GeosContextGuard&) = delete;

    GEOSContextHandle_t get() const { return m_handle; }
    operator bool() const { return m_handle != nullptr; }

    QString lastError() const { return m_lastError; }

private:
    static void notice(const char *message, void *userdata) {
        Q_UNUSED(userdata);
        qDebug() << "GEOS Notice:" << message;
    }

    static void error(const char *message, void *userdata) {
        static_cast<GeosContextGuard*>(userdata)->m_lastError = QString::fromUtf8(message);
        qCritical() << "GEOS Error:" << message;
    }

    GEOSContextHandle_t m_handle;
    QString m_lastError;
};

/**
 * @brief RAII wrapper for GEOS geometry handles
 * Automatically destroys geometry on destruction
 */
class GeometryGuard {
public:
    explicit GeometryGuard(GEOSContextHandle_t ctx = nullptr, GEOSGeometry* geom = nullptr)
        : m_ctx(ctx), m_geom(geom) {}

    ~GeometryGuard() {
        if (m_geom) {
            GEOSGeom_destroy_r(m_ctx, m_geom);
        }
    }

    GeometryGuard(const GeometryGuard&) = delete;
    GeometryGuard& operator=(const GeometryGuard&) = delete;

    GEOSGeometry* get() const { return m_geom; }
    operator bool() const { return m_geom != nullptr; }

private:
    GEOSContextHandle_t m_ctx;
    GEOSGeometry* m_geom;
};

/**
 * @brief RAII wrapper for GEOS prepared geometry
 */
class PreparedGeometryGuard {
public:
    explicit PreparedGeometryGuard(GEOSContextHandle_t ctx = nullptr,
                                   const GEOSPreparedGeometry* geom = nullptr)
        : m_ctx(ctx), m_geom(geom) {}

    ~PreparedGeometryGuard() {
        if (m_geom) {
            GEOSPreparedGeom_destroy_r(m_ctx, m_geom);
        }
    }

    PreparedGeometryGuard(const PreparedGeometryGuard&) = delete;
    PreparedGeometryGuard& operator=(const PreparedGeometryGuard&) = delete;

    const GEOSPreparedGeometry* get() const { return m_geom; }
    operator bool() const { return m_geom != nullptr; }

private:
    GEOSContextHandle_t m_ctx;
    const GEOSPreparedGeometry* m_geom;
};

/**
 * @brief RAII wrapper for a GEOS STRtree
 * Indexed geometries are not owned and must outlive the tree
 */
class STRtreeGuard {
public:
    explicit STRtreeGuard(GEOSContextHandle_t ctx = nullptr, GEOSSTRtree* tree = nullptr)
        : m_ctx(ctx), m_tree(tree) {}

    ~STRtreeGuard() {
        if (m_tree) {
            GEOSSTRtree_destroy_r(m_ctx, m_tree);
        }
    }

    STRtreeGuard(const STRtreeGuard&) = delete;
    STRtreeGuard& operator=(const STRtreeGuard&) = delete;

    GEOSSTRtree* get() const { return m_tree; }
    operator bool() const { return m_tree != nullptr; }

private:
    GEOSContextHandle_t m_ctx;
    GEOSSTRtree* m_tree;
};

/**
 * @brief Build a GEOS point, nullptr on failure
 * The point takes ownership of its coordinate sequence even when it fails
 */
inline GEOSGeometry* createPoint(GEOSContextHandle_t ctx, double x, double y) {
    GEOSCoordSequence* s = GEOSCoordSeq_create_r(ctx, 1, 2);
    if (!s) return nullptr;
    GEOSCoordSeq_setX_r(ctx, s, 0, x);
    GEOSCoordSeq_setY_r(ctx, s, 0, y);
    return GEOSGeom_createPoint_r(ctx, s);
}

/**
 * @brief RAII wrapper for GDALDataset handles
 * Automatically closes dataset on destruction
 */
class DatasetGuard {
public:
    explicit DatasetGuard(GDALDatasetH dataset = nullptr) : m_dataset(dataset) {}

    ~DatasetGuard() {
        if (m_dataset) {
            GDALClose(m_dataset);
        }
    }

    DatasetGuard(const DatasetGuard&) = delete;
    DatasetGuard& operator=(const DatasetGuard&) = delete;

    GDALDatasetH get() const { return m_dataset; }
    operator bool() const { return m_dataset != nullptr; }

private:
    GDALDatasetH m_dataset;
};

/**
 * @brief RAII wrapper for GDALGridOptions
 * Automatically frees options on destruction
 */
class GridOptionsGuard {
public:
    explicit GridOptionsGuard(GDALGridOptions* options = nullptr) : m_options(options) {}

    ~GridOptionsGuard() {
        if (m_options) {
            GDALGridOptionsFree(m_options);
        }
    }

    GridOptionsGuard(const GridOptionsGuard&) = delete;
    GridOptionsGuard& operator=(const GridOptionsGuard&) = delete;

    GDALGridOptions* get() const { return m_options; }
    operator bool() const { return m_options != nullptr; }

private:
    GDALGridOptions* m_options;
};

/**
 * @brief RAII wrapper for char** arrays used in GDAL
 * Automatically frees all allocated strings
 */
class CStringArrayGuard {
public:
    CStringArrayGuard() = default;

    ~CStringArrayGuard() {
        for (char* str : m_strings) {
            free(str);
        }
    }

    CStringArrayGuard(const CStringArrayGuard&) = delete;
    CStringArrayGuard& operator=(const CStringArrayGuard&) = delete;

    void add(const char* str) {
        dropTerminator();
        m_strings.push_back(strdup(str));
    }

    void add(const QString& str) {
        add(str.toUtf8().constData());
    }

    char** data() {
        if (m_strings.empty() || m_strings.back() != nullptr) {
            m_strings.push_back(nullptr);
        }
        return m_strings.data();
    }

private:
    void dropTerminator() {
        if (!m_strings.empty() && m_strings.back() == nullptr) {
            m_strings.pop_back();
        }
    }

    std::vector<char*> m_strings;
};

/**
 * @brief Scoped CPL error handler forwarding GDAL messages to the Qt log
 *
 * Remembers the last failure message for the duration of the scope.
 */
class CPLErrorHandlerGuard {
public:
    CPLErrorHandlerGuard() {
        CPLPushErrorHandlerEx(&CPLErrorHandlerGuard::handler, this);
    }

    ~CPLErrorHandlerGuard() {
        CPLPopErrorHandler();
    }

    CPLErrorHandlerGuard(const CPLErrorHandlerGuard&) = delete;
    CPLErrorHandlerGuard& operator=(const CPLErrorHandlerGuard&) = delete;

    QString lastError() const { return m_lastError; }

private:
    static void CPL_STDCALL handler(CPLErr eErrClass, CPLErrorNum nError, const char *pszMsg) {
        auto *self = static_cast<CPLErrorHandlerGuard*>(CPLGetErrorHandlerUserData());
        if (eErrClass >= CE_Failure) {
            if (self) self->m_lastError = QString::fromUtf8(pszMsg);
            qCritical() << "GDAL Error" << nError << ":" << pszMsg;
        } else if (eErrClass == CE_Warning) {
            qWarning() << "GDAL Warning:" << pszMsg;
        } else {
            qDebug() << "GDAL:" << pszMsg;
        }
    }

    QString m_lastError;
};

} // namespace GDALHelpers

#endif // GDALHELPERS_H
