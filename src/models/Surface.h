#ifndef SURFACE_H
#define SURFACE_H

#include <QMap>
#include <QString>
#include <QVariantList>
#include <QVector>

/**
 * @brief Immutable 3D survey point
 */
class Point3D
{
public:
    Point3D() : m_x(0.0), m_y(0.0), m_z(0.0) {}
    Point3D(double x, double y, double z) : m_x(x), m_y(y), m_z(z) {}

    double x() const { return m_x; }
    double y() const { return m_y; }
    double z() const { return m_z; }

    bool operator==(const Point3D &other) const
    {
        return m_x == other.m_x && m_y == other.m_y && m_z == other.m_z;
    }
    bool operator!=(const Point3D &other) const { return !(*this == other); }

private:
    double m_x;
    double m_y;
    double m_z;
};

/**
 * @brief Triangle referencing three point ids of the owning Surface
 */
struct Triangle
{
    QString p1;
    QString p2;
    QString p3;
};

/**
 * @brief Axis-aligned 2D footprint (min/max X,Y)
 *
 * A default constructed box is invalid; expand() makes it valid.
 */
struct BoundingBox
{
    double minX;
    double minY;
    double maxX;
    double maxY;

    BoundingBox();
    BoundingBox(double minX, double minY, double maxX, double maxY);

    bool isValid() const;
    double width() const { return maxX - minX; }
    double height() const { return maxY - minY; }

    void expand(double x, double y);
    void expand(const BoundingBox &other);
};

/**
 * @brief Named terrain surface: id -> point mapping plus optional triangles
 *
 * Points are kept in an ordered map so iteration order only depends on the
 * point ids. Every triangle references ids present in the point mapping.
 */
class Surface
{
public:
    Surface() = default;
    explicit Surface(const QString &name);

    QString name() const { return m_name; }

    const QMap<QString, Point3D> &points() const { return m_points; }
    const QVector<Triangle> &triangles() const { return m_triangles; }

    int pointCount() const { return m_points.size(); }
    bool isEmpty() const { return m_points.isEmpty(); }

    /**
     * @brief Add a point under the given id (a new UUID when empty)
     * @return The id the point was stored under
     */
    QString addPoint(const Point3D &point, const QString &id = QString());

    /**
     * @brief Add a triangle whose three ids must already exist
     * @param errorOut Output parameter for error message
     * @return true if the triangle was added
     */
    bool addTriangle(const Triangle &triangle, QString &errorOut);

    /**
     * @brief Grid spacing recorded by grid-like constructors, 0 when unknown
     */
    double gridSpacing() const { return m_gridSpacing; }
    void setGridSpacing(double spacing) { m_gridSpacing = spacing; }

    /**
     * @brief 2D extent of all points, invalid box when the surface is empty
     */
    BoundingBox bounds() const;

    /**
     * @brief Elevation range of the surface
     * @return false when the surface has no points
     */
    bool elevationRange(double &minZ, double &maxZ) const;
    double minZ() const;
    double maxZ() const;

    /**
     * @brief Build a surface from plain points, each under a fresh UUID
     * @param spacing Optional grid spacing to record (0 = none)
     */
    static Surface fromPointList(const QString &name,
                                 const QVector<Point3D> &points,
                                 double spacing = 0.0);

    /**
     * @brief Build a surface from QML point maps with x, y, z keys
     * @param errorOut Output parameter for error message
     * @param ok Set to false when a point map lacks a coordinate, holds a
     * non-numeric or non-finite one, or repeats an earlier id
     */
    static Surface fromVariantList(const QString &name,
                                   const QVariantList &points,
                                   QString &errorOut,
                                   bool *ok = nullptr);

    /**
     * @brief Square (size+1) x (size+1) lattice at constant elevation
     */
    static Surface flat(double z, int size = 10,
                        const QString &name = QStringLiteral("Flat"),
                        double spacing = 1.0);

    /**
     * @brief Per-location minimum of two surfaces sampled at the same XY set
     *
     * Both surfaces must share grid spacing and point count; points are
     * paired after sorting by (x, y).
     * @param errorOut Output parameter for error message
     * @return "Lowest" surface, empty on mismatch
     */
    static Surface lowest(const Surface &design, const Surface &existing,
                          QString &errorOut);

private:
    QString m_name;
    QMap<QString, Point3D> m_points;
    QVector<Triangle> m_triangles;
    double m_gridSpacing = 0.0;
};

#endif // SURFACE_H
