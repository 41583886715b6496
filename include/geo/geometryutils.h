#ifndef GEOMETRYUTILS_H
#define GEOMETRYUTILS_H

#include <QPointF>
#include <QRectF>
#include <QVector>

/**
 * @brief BoundsAccumulator - Running min/max of points and rectangles
 *
 * World rectangles keep left = minX, top = minY, right = maxX, bottom = maxY.
 * Unlike QRectF::united this never drops zero-width or zero-height input.
 */
class BoundsAccumulator
{
public:
    void addPoint(const QPointF& p);
    void addPoints(const QVector<QPointF>& points);
    void addRect(const QRectF& r);

    bool isEmpty() const { return !m_hasData; }
    // Canonical unit rectangle when nothing was added
    QRectF rect() const;

private:
    bool m_hasData{false};
    double m_minX{0.0};
    double m_minY{0.0};
    double m_maxX{0.0};
    double m_maxY{0.0};
};

class GeometryUtils
{
public:
    // (0, 0, 1, 1), used wherever bounds would otherwise be degenerate
    static QRectF canonicalRect();

    static QRectF boundsOf(const QVector<QPointF>& points);
    static QRectF boundsOf(const QVector<QVector<QPointF>>& lines);
    static QRectF unite(const QRectF& a, const QRectF& b);
    static QRectF inflate(const QRectF& r, double delta);

    // True unless b lies wholly to one side of a on either axis
    static bool overlaps(const QRectF& a, const QRectF& b);

    static double distanceToRect(const QPointF& p, const QRectF& r);
    static double distance(const QPointF& p1, const QPointF& p2);
    static double squaredDistance(const QPointF& p1, const QPointF& p2);

    // Projection factor of p on segment ab clamped to [0, 1]; 0 for a zero-length segment
    static double segmentFactor(const QPointF& p, const QPointF& a, const QPointF& b);
    static QPointF lerp(const QPointF& a, const QPointF& b, double t);

    static bool isFinite(const QPointF& p);
    static bool isFinite(const QRectF& r);
};

#endif // GEOMETRYUTILS_H
