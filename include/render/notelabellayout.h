#ifndef NOTELABELLAYOUT_H
#define NOTELABELLAYOUT_H

#include <QFont>
#include <QPointF>
#include <QRectF>
#include <QSizeF>
#include <QString>

#include "layers/maplayers.h"

class ViewportProjector;

// Measures single-line note text, eliding it to the label's maximum width
class NoteTextMeasurer
{
public:
    virtual ~NoteTextMeasurer() = default;
    virtual QSizeF measure(const QString& text, QString& displayText) const = 0;
};

class FontTextMeasurer : public NoteTextMeasurer
{
public:
    explicit FontTextMeasurer(const QString& fontFamily);

    QSizeF measure(const QString& text, QString& displayText) const override;
    const QFont& font() const { return m_font; }

    static QFont noteFont(const QString& fontFamily);

private:
    QFont m_font;
};

struct NoteLabel {
    QRectF rect;            // Canvas units, centered on the projected label center
    QString displayText;
    QPointF textOrigin;     // Top-left of the text inside rect
};

class NoteLabelLayout
{
public:
    static NoteLabel layout(const TrackNote& note, const ViewportProjector& projector,
                            const NoteTextMeasurer& measurer);
    // Default label offset in world units for a note created at the projector's scale
    static QPointF defaultLabelOffset(const ViewportProjector& projector);
};

#endif // NOTELABELLAYOUT_H
