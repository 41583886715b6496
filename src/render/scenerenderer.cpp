#include "render/scenerenderer.h"
#include "core/mapconstants.h"
#include "layers/layerstore.h"
#include "render/notelabellayout.h"
#include "view/levelofdetail.h"
#include "view/viewportprojector.h"

#include <QFontMetricsF>
#include <QPainter>
#include <QPainterPath>
#include <QtMath>

namespace {

const QColor kStartMarkerColor(0x1E, 0x7E, 0x55);
const QColor kEndMarkerColor(0xC7, 0x29, 0x2D);
const QColor kLabelTextColor(0x22, 0x30, 0x2A);

double safeViewScale(double viewScale)
{
    return viewScale > 0.0 ? viewScale : 1.0;
}

QColor withAlpha(const QColor& color, double alpha)
{
    QColor c(color);
    c.setAlpha(qBound(0, qRound(alpha), 255));
    return c;
}

QPolygonF projectLine(const QVector<QPointF>& line, const ViewportProjector& projector)
{
    QPolygonF polygon;
    polygon.reserve(line.size());
    for (const QPointF& p : line) {
        polygon.append(projector.toCanvas(p));
    }
    return polygon;
}

void appendContourOps(QVector<DrawOp>& frame, const ContourLayer& layer, bool major, int interval,
                      const ViewportProjector& projector)
{
    const double opacity = qBound(0.0, layer.opacity, 1.0);
    const double alpha = major ? 255.0 * opacity : 255.0 * opacity * MapConstants::kMinorContourOpacity;

    QPen pen(withAlpha(layer.color, alpha));
    pen.setWidthF(SceneRenderer::contourStrokeWidth(layer.strokeWidth, major, projector.viewScale()));
    pen.setCapStyle(Qt::FlatCap);
    pen.setJoinStyle(Qt::BevelJoin);

    for (const auto& line : layer.lines) {
        if (line.isMajor != major) continue;
        if (!LevelOfDetail::shouldDraw(line, interval)) continue;
        if (LevelOfDetail::isFragmentSuppressed(line, interval)) continue;

        DrawOp op;
        op.role = major ? DrawRole::MajorContour : DrawRole::MinorContour;
        op.layerId = layer.id;
        op.points = projectLine(line.points, projector);
        op.pen = pen;
        frame.append(op);
    }
}

} // namespace

double SceneRenderer::contourStrokeWidth(double layerWidth, bool major, double viewScale)
{
    const double width = qBound(MapConstants::kMinContourLayerWidth, layerWidth, MapConstants::kMaxContourLayerWidth);
    const double base = width * (major ? MapConstants::kMajorContourWidthFactor
                                       : MapConstants::kMinorContourWidthFactor);
    const double renderScale = LevelOfDetail::contourRenderScale(viewScale);
    return qBound(MapConstants::kMinContourStroke, base / renderScale, MapConstants::kMaxContourStroke);
}

double SceneRenderer::trackStrokeWidth(double width, double viewScale)
{
    return qBound(MapConstants::kMinTrackStroke, width / safeViewScale(viewScale), MapConstants::kMaxTrackStroke);
}

double SceneRenderer::markerRadius(double base, double viewScale)
{
    return qBound(MapConstants::kMinMarkerRadius, base / safeViewScale(viewScale), MapConstants::kMaxMarkerRadius);
}

QVector<DrawOp> SceneRenderer::buildFrame(const LayerStore& store, const ViewportProjector& projector,
                                          const NoteTextMeasurer& measurer)
{
    QVector<DrawOp> frame;
    const double viewScale = projector.viewScale();
    const int interval = LevelOfDetail::intervalForScale(LevelOfDetail::contourRenderScale(viewScale));

    for (const auto& layer : store.contourLayers()) {
        if (!layer.visible) continue;
        appendContourOps(frame, layer, false, interval, projector);
        appendContourOps(frame, layer, true, interval, projector);
    }

    const QFont labelFont = FontTextMeasurer::noteFont(store.resolvedNoteFontFamily());

    for (const auto& track : store.trackLayers()) {
        if (!track.visible) continue;

        QPen trackPen(withAlpha(track.color, qBound(0.0, track.opacity, 1.0) * 255.0));
        trackPen.setWidthF(trackStrokeWidth(track.strokeWidth, viewScale));
        trackPen.setCapStyle(Qt::RoundCap);
        trackPen.setJoinStyle(Qt::RoundJoin);

        for (const auto& line : track.polylines) {
            DrawOp op;
            op.role = DrawRole::Track;
            op.layerId = track.id;
            op.points = projectLine(line, projector);
            op.pen = trackPen;
            frame.append(op);
        }

        if (!track.polylines.isEmpty() && !track.polylines.first().isEmpty()
            && !track.polylines.last().isEmpty()) {
            const double radius = markerRadius(MapConstants::kEndpointMarkerRadius, viewScale);

            DrawOp start;
            start.role = DrawRole::StartMarker;
            start.layerId = track.id;
            start.center = projector.toCanvas(track.polylines.first().first());
            start.radius = radius;
            start.brush = QBrush(kStartMarkerColor);
            frame.append(start);

            DrawOp end;
            end.role = DrawRole::EndMarker;
            end.layerId = track.id;
            end.center = projector.toCanvas(track.polylines.last().last());
            end.radius = radius;
            end.brush = QBrush(kEndMarkerColor);
            frame.append(end);
        }

        for (const auto& note : track.notes) {
            if (!note.visible) continue;

            const QPointF markerCenter = projector.toCanvas(note.anchorPoint);
            DrawOp marker;
            marker.role = DrawRole::NoteMarker;
            marker.layerId = track.id;
            marker.center = markerCenter;
            marker.radius = markerRadius(MapConstants::kNoteMarkerRadius, viewScale) + MapConstants::kNoteMarkerRing;
            marker.brush = QBrush(QColor(255, 255, 255, 235));
            marker.pen = QPen(withAlpha(track.color, 220), 1.0);
            frame.append(marker);

            const NoteLabel label = NoteLabelLayout::layout(note, projector, measurer);

            DrawOp leader;
            leader.role = DrawRole::LeaderLine;
            leader.layerId = track.id;
            leader.points << markerCenter << label.rect.center();
            QPen leaderPen(withAlpha(track.color, 145));
            leaderPen.setWidthF(qBound(0.3, trackStrokeWidth(MapConstants::kLeaderWidth, viewScale), 1.0));
            leaderPen.setCapStyle(Qt::RoundCap);
            leader.pen = leaderPen;
            frame.append(leader);

            DrawOp text;
            text.role = DrawRole::NoteLabel;
            text.layerId = track.id;
            text.rect = label.rect;
            text.text = label.displayText;
            text.textOrigin = label.textOrigin;
            text.font = labelFont;
            text.pen = QPen(kLabelTextColor);
            frame.append(text);
        }
    }

    return frame;
}

void SceneRenderer::paint(QPainter& painter, const QVector<DrawOp>& frame, const QTransform& viewTransform)
{
    painter.save();
    painter.setRenderHint(QPainter::Antialiasing, true);
    painter.setRenderHint(QPainter::TextAntialiasing, true);
    painter.setTransform(viewTransform, true);

    for (const auto& op : frame) {
        switch (op.role) {
            case DrawRole::MinorContour:
            case DrawRole::MajorContour:
            case DrawRole::Track:
            case DrawRole::LeaderLine:
                if (op.points.size() < 2) break;
                painter.setPen(op.pen);
                painter.setBrush(Qt::NoBrush);
                painter.drawPolyline(op.points);
                break;
            case DrawRole::StartMarker:
            case DrawRole::EndMarker:
            case DrawRole::NoteMarker:
                painter.setPen(op.pen);
                painter.setBrush(op.brush);
                painter.drawEllipse(op.center, op.radius, op.radius);
                break;
            case DrawRole::NoteLabel: {
                painter.setPen(op.pen);
                painter.setFont(op.font);
                const QRectF textRect(op.textOrigin, op.rect.bottomRight());
                painter.drawText(textRect, Qt::AlignLeft | Qt::AlignTop | Qt::TextSingleLine, op.text);
                break;
            }
        }
    }

    painter.restore();
}

void SceneRenderer::paintDecorations(QPainter& painter, const QSizeF& viewportSize, const LayerStore& store)
{
    painter.save();
    painter.setRenderHint(QPainter::Antialiasing, true);

    const double margin = 16.0;

    if (store.isDecorationVisible(MapDecoration::Title)) {
        const TitleStyle& style = store.titleStyle();
        QFont font(style.fontFamily);
        font.setPixelSize(style.fontSize);
        font.setBold(true);
        QFontMetricsF metrics(font);
        const double w = metrics.horizontalAdvance(style.text) + 28.0;
        const double h = metrics.height() + 12.0;
        const QRectF badge((viewportSize.width() - w) / 2.0, margin, w, h);

        painter.setPen(QPen(QColor(0xC9, 0xD4, 0xCD), 1.0));
        painter.setBrush(QColor(255, 255, 255, 230));
        painter.drawRoundedRect(badge, 10.0, 10.0);
        painter.setFont(font);
        painter.setPen(style.color);
        painter.drawText(badge, Qt::AlignCenter, style.text);
    }

    if (store.isDecorationVisible(MapDecoration::NorthArrow)) {
        const double size = 44.0;
        const QRectF box(viewportSize.width() - size - margin, margin, size, size + 14.0);
        const QPointF tip(box.center().x(), box.top() + 14.0);

        QPainterPath arrow;
        arrow.moveTo(tip);
        arrow.lineTo(box.center().x() + 11.0, box.bottom() - 4.0);
        arrow.lineTo(box.center().x(), box.bottom() - 12.0);
        arrow.lineTo(box.center().x() - 11.0, box.bottom() - 4.0);
        arrow.closeSubpath();

        painter.setPen(QPen(QColor(0x1F, 0x2A, 0x24), 1.2));
        painter.setBrush(QColor(0x1F, 0x2A, 0x24));
        painter.drawPath(arrow);

        QFont font = painter.font();
        font.setPixelSize(12);
        font.setBold(true);
        painter.setFont(font);
        painter.drawText(QRectF(box.left(), box.top(), box.width(), 14.0), Qt::AlignCenter, QStringLiteral("N"));
    }

    if (store.isDecorationVisible(MapDecoration::Legend)) {
        const LegendIntervals intervals = store.legendIntervals();
        const QRectF box(margin, viewportSize.height() - 86.0 - margin, 160.0, 86.0);

        painter.setPen(QPen(QColor(0xC9, 0xD4, 0xCD), 1.0));
        painter.setBrush(QColor(255, 255, 255, 240));
        painter.drawRoundedRect(box, 8.0, 8.0);

        QFont titleFont = painter.font();
        titleFont.setPixelSize(12);
        titleFont.setBold(true);
        painter.setFont(titleFont);
        painter.setPen(QColor(0x1F, 0x2A, 0x24));
        painter.drawText(QPointF(box.left() + 10.0, box.top() + 20.0), LayerStore::tr("Legend"));

        struct Row { QString label; QColor color; double thickness; };
        const Row rows[] = {
            {LayerStore::tr("Major contour (%1 m interval)").arg(intervals.major), QColor(0x4B, 0x62, 0x56, 190), 2.0},
            {LayerStore::tr("Minor contour (%1 m interval)").arg(intervals.minor), QColor(0x60, 0x76, 0x6A, 130), 1.2},
            {LayerStore::tr("Track"), store.legendTrackColor(), 2.4},
        };

        QFont rowFont = painter.font();
        rowFont.setPixelSize(11);
        rowFont.setBold(false);
        painter.setFont(rowFont);

        double y = box.top() + 38.0;
        for (const auto& row : rows) {
            painter.setPen(QPen(row.color, row.thickness, Qt::SolidLine, Qt::RoundCap));
            painter.drawLine(QPointF(box.left() + 10.0, y), QPointF(box.left() + 40.0, y));
            painter.setPen(QColor(0x1F, 0x2A, 0x24));
            painter.drawText(QPointF(box.left() + 47.0, y + 4.0), row.label);
            y += 18.0;
        }
    }

    painter.restore();
}
