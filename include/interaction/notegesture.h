#ifndef NOTEGESTURE_H
#define NOTEGESTURE_H

#include <QPointF>

#include "interaction/trackannotator.h"

class ViewportProjector;

/**
 * @brief NoteGesture - Turns note-mode pointer events into taps or label drags
 *
 * A press only becomes a drag once the pointer travels past the tap slop, and
 * only when the press landed on the move-ready label. A release within the
 * slop is delivered to the annotator as a tap.
 */
class NoteGesture
{
public:
    explicit NoteGesture(TrackAnnotator* annotator);

    void press(const QPointF& viewportPos);
    bool move(const QPointF& viewportPos, const ViewportProjector& projector);
    // Returns the tap outcome, or Ignored when the gesture was a drag or moved too far
    TapOutcome release(const QPointF& viewportPos, const ViewportProjector& projector);
    void cancel();

    bool isPressed() const { return m_pressed; }
    bool isDragging() const { return m_dragging; }

private:
    bool beyondTapSlop(const QPointF& viewportPos) const;

    TrackAnnotator* m_annotator{nullptr};
    bool m_pressed{false};
    bool m_dragging{false};
    bool m_moved{false};
    QPointF m_pressPos;
};

#endif // NOTEGESTURE_H
