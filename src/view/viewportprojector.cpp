#include "view/viewportprojector.h"
#include "core/mapconstants.h"

#include <QtMath>
#include <cmath>

ViewportProjector::ViewportProjector(const QRectF& world, const QSizeF& canvasSize,
                                     const QTransform& viewTransform)
    : m_world(world)
    , m_canvasSize(canvasSize)
    , m_viewTransform(viewTransform)
{
    const double worldW = world.width() > 0.0 ? world.width() : 1.0;
    const double worldH = world.height() > 0.0 ? world.height() : 1.0;

    const double sx = canvasSize.width() / worldW;
    const double sy = canvasSize.height() / worldH;
    m_scale = qMin(sx, sy) * MapConstants::kBaselineZoom;
    if (!(m_scale > 0.0) || !std::isfinite(m_scale)) {
        m_scale = 1.0;
    }

    m_leftPad = (canvasSize.width() - worldW * m_scale) / 2.0;
    m_topPad = (canvasSize.height() - worldH * m_scale) / 2.0;

    bool invertible = false;
    m_viewInverse = m_viewTransform.inverted(&invertible);
    if (!invertible) {
        m_viewTransform = QTransform();
        m_viewInverse = QTransform();
    }
}

QPointF ViewportProjector::toCanvas(const QPointF& world) const
{
    const double x = m_leftPad + (world.x() - m_world.left()) * m_scale;
    const double y = m_topPad + (m_world.bottom() - world.y()) * m_scale;
    return QPointF(x, y);
}

QPointF ViewportProjector::toWorld(const QPointF& canvas) const
{
    const double x = m_world.left() + (canvas.x() - m_leftPad) / m_scale;
    const double y = m_world.bottom() - (canvas.y() - m_topPad) / m_scale;
    return QPointF(x, y);
}

QPointF ViewportProjector::canvasToViewport(const QPointF& canvas) const
{
    return m_viewTransform.map(canvas);
}

QPointF ViewportProjector::viewportToCanvas(const QPointF& viewport) const
{
    return m_viewInverse.map(viewport);
}

QPointF ViewportProjector::worldToViewport(const QPointF& world) const
{
    return canvasToViewport(toCanvas(world));
}

QPointF ViewportProjector::viewportToWorld(const QPointF& viewport) const
{
    return toWorld(viewportToCanvas(viewport));
}

double ViewportProjector::transformScale(const QTransform& transform)
{
    const double s = qSqrt(transform.m11() * transform.m11() + transform.m12() * transform.m12());
    return s > 0.0 ? s : 1.0;
}

QTransform ViewportProjector::fitTransform(const ViewportProjector& base, const QRectF& target,
                                           const QSizeF& viewportSize)
{
    if (viewportSize.isEmpty()) return QTransform();

    const QPointF a = base.toCanvas(QPointF(target.left(), target.top()));
    const QPointF b = base.toCanvas(QPointF(target.right(), target.bottom()));
    const QRectF targetRect(QPointF(qMin(a.x(), b.x()), qMin(a.y(), b.y())),
                            QPointF(qMax(a.x(), b.x()), qMax(a.y(), b.y())));

    const double fitScaleX = (viewportSize.width() * MapConstants::kFitRatio) / qMax(targetRect.width(), 1.0);
    const double fitScaleY = (viewportSize.height() * MapConstants::kFitRatio) / qMax(targetRect.height(), 1.0);
    const double s = qBound(MapConstants::kMinViewScale, qMin(fitScaleX, fitScaleY), MapConstants::kMaxViewScale);

    const QPointF center = targetRect.center();
    const double tx = viewportSize.width() / 2.0 - center.x() * s;
    const double ty = viewportSize.height() / 2.0 - center.y() * s;

    return QTransform(s, 0.0, 0.0, s, tx, ty);
}

QTransform ViewportProjector::zoomAt(const QTransform& transform, const QPointF& anchor, double factor)
{
    const double current = transformScale(transform);
    const double target = qBound(MapConstants::kMinViewScale, current * factor, MapConstants::kMaxViewScale);
    const double applied = target / current;

    // Keep the scene point under the anchor fixed
    const double tx = anchor.x() - (anchor.x() - transform.dx()) * applied;
    const double ty = anchor.y() - (anchor.y() - transform.dy()) * applied;
    return QTransform(target, 0.0, 0.0, target, tx, ty);
}

QTransform ViewportProjector::panBy(const QTransform& transform, const QPointF& delta)
{
    const double s = transformScale(transform);
    return QTransform(s, 0.0, 0.0, s, transform.dx() + delta.x(), transform.dy() + delta.y());
}
