#include "render/notelabellayout.h"
#include "core/mapconstants.h"
#include "view/viewportprojector.h"

#include <QFontMetricsF>
#include <QStringList>

FontTextMeasurer::FontTextMeasurer(const QString& fontFamily)
    : m_font(noteFont(fontFamily))
{
}

QFont FontTextMeasurer::noteFont(const QString& fontFamily)
{
    QFont font(fontFamily);
    font.setFamilies(QStringList{fontFamily, QStringLiteral("Noto Sans KR")});
    font.setPixelSize(MapConstants::kLabelFontPixelSize);
    font.setWeight(QFont::DemiBold);
    return font;
}

QSizeF FontTextMeasurer::measure(const QString& text, QString& displayText) const
{
    QFontMetricsF metrics(m_font);
    displayText = metrics.elidedText(text, Qt::ElideRight, MapConstants::kLabelMaxTextWidth);
    return QSizeF(metrics.horizontalAdvance(displayText), metrics.height());
}

NoteLabel NoteLabelLayout::layout(const TrackNote& note, const ViewportProjector& projector,
                                  const NoteTextMeasurer& measurer)
{
    NoteLabel label;
    const QSizeF textSize = measurer.measure(note.text, label.displayText);
    const QSizeF rectSize(textSize.width() + 2.0 * MapConstants::kLabelPadX,
                          textSize.height() + 2.0 * MapConstants::kLabelPadY);

    const QPointF center = projector.toCanvas(note.labelCenter());
    label.rect = QRectF(center.x() - rectSize.width() / 2.0, center.y() - rectSize.height() / 2.0,
                        rectSize.width(), rectSize.height());
    label.textOrigin = QPointF(label.rect.left() + MapConstants::kLabelPadX,
                               label.rect.top() + MapConstants::kLabelPadY);
    return label;
}

QPointF NoteLabelLayout::defaultLabelOffset(const ViewportProjector& projector)
{
    const double scale = qMax(projector.scale(), MapConstants::kMinProjectorScale);
    return QPointF(MapConstants::kLabelOffsetX / scale, MapConstants::kLabelOffsetY / scale);
}
