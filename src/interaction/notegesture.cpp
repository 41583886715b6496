#include "interaction/notegesture.h"
#include "core/mapconstants.h"

#include <QtMath>

NoteGesture::NoteGesture(TrackAnnotator* annotator)
    : m_annotator(annotator)
{
}

void NoteGesture::press(const QPointF& viewportPos)
{
    m_pressed = true;
    m_dragging = false;
    m_moved = false;
    m_pressPos = viewportPos;
}

bool NoteGesture::move(const QPointF& viewportPos, const ViewportProjector& projector)
{
    if (!m_pressed) return false;

    if (!m_moved) {
        if (!beyondTapSlop(viewportPos)) return false;
        m_moved = true;
        m_dragging = m_annotator->beginDrag(m_pressPos, projector);
    }
    if (!m_dragging) return false;
    return m_annotator->updateDrag(viewportPos, projector);
}

TapOutcome NoteGesture::release(const QPointF& viewportPos, const ViewportProjector& projector)
{
    if (!m_pressed) return TapOutcome::Ignored;

    const bool wasDragging = m_dragging;
    const bool tap = !m_moved && !beyondTapSlop(viewportPos);
    cancel();

    if (wasDragging) {
        m_annotator->endDrag();
        return TapOutcome::Ignored;
    }
    return tap ? m_annotator->handleTap(viewportPos, projector) : TapOutcome::Ignored;
}

void NoteGesture::cancel()
{
    m_pressed = false;
    m_dragging = false;
    m_moved = false;
}

bool NoteGesture::beyondTapSlop(const QPointF& viewportPos) const
{
    const QPointF travel = viewportPos - m_pressPos;
    return qAbs(travel.x()) > MapConstants::kTapSlop || qAbs(travel.y()) > MapConstants::kTapSlop;
}
