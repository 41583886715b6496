#ifndef SCENERENDERER_H
#define SCENERENDERER_H

#include <QBrush>
#include <QFont>
#include <QPen>
#include <QPolygonF>
#include <QRectF>
#include <QSizeF>
#include <QString>
#include <QTransform>
#include <QVector>

class LayerStore;
class NoteTextMeasurer;
class QPainter;
class ViewportProjector;

enum class DrawRole {
    MinorContour,
    MajorContour,
    Track,
    StartMarker,
    EndMarker,
    NoteMarker,
    LeaderLine,
    NoteLabel
};

/**
 * @brief DrawOp - One primitive of a frame, in canvas coordinates
 *
 * Strokes use points, markers use center/radius, labels use rect and text.
 */
struct DrawOp {
    DrawRole role{DrawRole::Track};
    QString layerId;
    QPolygonF points;
    QPointF center;
    double radius{0.0};
    QPen pen{Qt::NoPen};
    QBrush brush{Qt::NoBrush};
    QRectF rect;
    QString text;
    QPointF textOrigin;
    QFont font;
};

/**
 * @brief SceneRenderer - Turns the layer store into draw operations and paints them
 *
 * Stroke widths are divided by the view scale so lines keep a steady on-screen
 * weight once the view transform is applied. Building a frame never mutates
 * the store.
 */
class SceneRenderer
{
public:
    static QVector<DrawOp> buildFrame(const LayerStore& store, const ViewportProjector& projector,
                                      const NoteTextMeasurer& measurer);

    static void paint(QPainter& painter, const QVector<DrawOp>& frame, const QTransform& viewTransform);
    // Title, north arrow and legend, in viewport pixels
    static void paintDecorations(QPainter& painter, const QSizeF& viewportSize, const LayerStore& store);

    static double contourStrokeWidth(double layerWidth, bool major, double viewScale);
    static double trackStrokeWidth(double width, double viewScale);
    static double markerRadius(double base, double viewScale);
};

#endif // SCENERENDERER_H
