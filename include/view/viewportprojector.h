#ifndef VIEWPORTPROJECTOR_H
#define VIEWPORTPROJECTOR_H

#include <QPointF>
#include <QRectF>
#include <QSizeF>
#include <QTransform>

/**
 * @brief ViewportProjector - Maps world coordinates onto the scene canvas
 *
 * The base fit scales the world rectangle into the canvas with a fixed
 * baseline zoom, centers it and flips Y so north is up. The view transform
 * (uniform scale plus translation) then maps canvas pixels to viewport pixels.
 */
class ViewportProjector
{
public:
    ViewportProjector(const QRectF& world, const QSizeF& canvasSize,
                      const QTransform& viewTransform = QTransform());

    QPointF toCanvas(const QPointF& world) const;
    QPointF toWorld(const QPointF& canvas) const;

    QPointF canvasToViewport(const QPointF& canvas) const;
    QPointF viewportToCanvas(const QPointF& viewport) const;
    QPointF worldToViewport(const QPointF& world) const;
    QPointF viewportToWorld(const QPointF& viewport) const;

    // Canvas pixels per world unit
    double scale() const { return m_scale; }
    // Viewport pixels per canvas pixel
    double viewScale() const { return transformScale(m_viewTransform); }

    const QRectF& world() const { return m_world; }
    const QSizeF& canvasSize() const { return m_canvasSize; }
    const QTransform& viewTransform() const { return m_viewTransform; }

    // Transform that centers target (world units) in the viewport; identity for an empty viewport
    static QTransform fitTransform(const ViewportProjector& base, const QRectF& target,
                                   const QSizeF& viewportSize);
    // Scale about a viewport anchor, clamped to the allowed view scale range
    static QTransform zoomAt(const QTransform& transform, const QPointF& anchor, double factor);
    static QTransform panBy(const QTransform& transform, const QPointF& delta);
    static double transformScale(const QTransform& transform);

private:
    QRectF m_world;
    QSizeF m_canvasSize;
    QTransform m_viewTransform;
    QTransform m_viewInverse;
    double m_scale{1.0};
    double m_leftPad{0.0};
    double m_topPad{0.0};
};

#endif // VIEWPORTPROJECTOR_H
