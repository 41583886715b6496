#include "geo/geometryutils.h"

#include <QtMath>
#include <algorithm>
#include <cmath>

void BoundsAccumulator::addPoint(const QPointF& p)
{
    if (!m_hasData) {
        m_minX = m_maxX = p.x();
        m_minY = m_maxY = p.y();
        m_hasData = true;
        return;
    }
    m_minX = qMin(m_minX, p.x());
    m_maxX = qMax(m_maxX, p.x());
    m_minY = qMin(m_minY, p.y());
    m_maxY = qMax(m_maxY, p.y());
}

void BoundsAccumulator::addPoints(const QVector<QPointF>& points)
{
    for (const QPointF& p : points) addPoint(p);
}

void BoundsAccumulator::addRect(const QRectF& r)
{
    addPoint(QPointF(r.left(), r.top()));
    addPoint(QPointF(r.right(), r.bottom()));
}

QRectF BoundsAccumulator::rect() const
{
    if (!m_hasData) return GeometryUtils::canonicalRect();
    return QRectF(QPointF(m_minX, m_minY), QPointF(m_maxX, m_maxY));
}

QRectF GeometryUtils::canonicalRect()
{
    return QRectF(0.0, 0.0, 1.0, 1.0);
}

QRectF GeometryUtils::boundsOf(const QVector<QPointF>& points)
{
    BoundsAccumulator acc;
    acc.addPoints(points);
    return acc.rect();
}

QRectF GeometryUtils::boundsOf(const QVector<QVector<QPointF>>& lines)
{
    BoundsAccumulator acc;
    for (const auto& line : lines) acc.addPoints(line);
    return acc.rect();
}

QRectF GeometryUtils::unite(const QRectF& a, const QRectF& b)
{
    BoundsAccumulator acc;
    acc.addRect(a);
    acc.addRect(b);
    return acc.rect();
}

QRectF GeometryUtils::inflate(const QRectF& r, double delta)
{
    return QRectF(QPointF(r.left() - delta, r.top() - delta),
                  QPointF(r.right() + delta, r.bottom() + delta));
}

bool GeometryUtils::overlaps(const QRectF& a, const QRectF& b)
{
    if (b.right() < a.left() || b.left() > a.right()) return false;
    if (b.bottom() < a.top() || b.top() > a.bottom()) return false;
    return true;
}

double GeometryUtils::distanceToRect(const QPointF& p, const QRectF& r)
{
    const double dx = std::max({r.left() - p.x(), 0.0, p.x() - r.right()});
    const double dy = std::max({r.top() - p.y(), 0.0, p.y() - r.bottom()});
    return qSqrt(dx * dx + dy * dy);
}

double GeometryUtils::distance(const QPointF& p1, const QPointF& p2)
{
    return qSqrt(squaredDistance(p1, p2));
}

double GeometryUtils::squaredDistance(const QPointF& p1, const QPointF& p2)
{
    const double dx = p2.x() - p1.x();
    const double dy = p2.y() - p1.y();
    return dx * dx + dy * dy;
}

double GeometryUtils::segmentFactor(const QPointF& p, const QPointF& a, const QPointF& b)
{
    const double dx = b.x() - a.x();
    const double dy = b.y() - a.y();
    const double lengthSq = dx * dx + dy * dy;
    if (lengthSq <= 0.0) return 0.0;

    const double t = ((p.x() - a.x()) * dx + (p.y() - a.y()) * dy) / lengthSq;
    return qBound(0.0, t, 1.0);
}

QPointF GeometryUtils::lerp(const QPointF& a, const QPointF& b, double t)
{
    return QPointF(a.x() + (b.x() - a.x()) * t, a.y() + (b.y() - a.y()) * t);
}

bool GeometryUtils::isFinite(const QPointF& p)
{
    return std::isfinite(p.x()) && std::isfinite(p.y());
}

bool GeometryUtils::isFinite(const QRectF& r)
{
    return std::isfinite(r.left()) && std::isfinite(r.top()) &&
           std::isfinite(r.right()) && std::isfinite(r.bottom());
}
