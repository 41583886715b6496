#include "interaction/trackannotator.h"
#include "interaction/noteprompter.h"
#include "core/mapconstants.h"
#include "geo/geometryutils.h"
#include "layers/layerstore.h"
#include "render/notelabellayout.h"
#include "view/viewportprojector.h"

#include <QDebug>
#include <QPointer>
#include <QtMath>
#include <limits>

TrackAnnotator::TrackAnnotator(LayerStore* store, NotePrompter* prompter, QObject* parent)
    : QObject(parent)
    , m_store(store)
    , m_prompter(prompter)
{
    connect(m_store, &LayerStore::selectionChanged, this, &TrackAnnotator::onSelectionChanged);
    connect(m_store, &LayerStore::trackRemoved, this, &TrackAnnotator::onTrackRemoved);
    connect(m_store, &LayerStore::trackVisibilityChanged, this, &TrackAnnotator::onTrackVisibilityChanged);
    connect(m_store, &LayerStore::noteRemoved, this, &TrackAnnotator::onNoteRemoved);
    connect(m_store, &LayerStore::noteVisibilityChanged, this, &TrackAnnotator::onNoteVisibilityChanged);
}

// --- Mode and transient state ---

void TrackAnnotator::setNoteMode(bool enabled)
{
    if (!enabled) {
        clearDragState();
        clearMoveReady();
    }
    if (m_noteMode == enabled) return;
    m_noteMode = enabled;
    emit noteModeChanged(m_noteMode);
}

bool TrackAnnotator::toggleNoteMode()
{
    if (!m_store->selectedTrack()) {
        emit statusMessage(tr("Select a GPX track in the layer list first."));
        return false;
    }
    setNoteMode(!m_noteMode);
    emit statusMessage(m_noteMode
        ? tr("Track edit mode ON: add, edit or delete points; move text from the note menu")
        : tr("Track edit mode OFF"));
    return true;
}

void TrackAnnotator::exitNoteMode()
{
    setNoteMode(false);
}

void TrackAnnotator::clearDragState()
{
    m_dragTrackId.clear();
    m_dragNoteId.clear();
    m_dragGrabDelta = QPointF();
}

void TrackAnnotator::clearMoveReady()
{
    m_moveReadyTrackId.clear();
    m_moveReadyNoteId.clear();
}

// --- Store notifications ---

void TrackAnnotator::onSelectionChanged(const Selection& selection)
{
    if (selection.kind != Selection::Kind::Track) {
        setNoteMode(false);
    }
}

void TrackAnnotator::onTrackRemoved(const QString& trackId)
{
    if (m_moveReadyTrackId == trackId) clearMoveReady();
    if (m_dragTrackId == trackId) clearDragState();
}

void TrackAnnotator::onTrackVisibilityChanged(const QString& trackId, bool visible)
{
    if (visible) return;
    if (m_store->selection().isTrack(trackId)) {
        setNoteMode(false);
    } else if (m_moveReadyTrackId == trackId) {
        clearMoveReady();
    }
}

void TrackAnnotator::onNoteRemoved(const QString& trackId, const QString& noteId)
{
    if (m_dragTrackId == trackId && m_dragNoteId == noteId) clearDragState();
    if (m_moveReadyTrackId == trackId && m_moveReadyNoteId == noteId) clearMoveReady();
}

void TrackAnnotator::onNoteVisibilityChanged(const QString& trackId, const QString& noteId, bool visible)
{
    if (visible) return;
    onNoteRemoved(trackId, noteId);
}

// --- Hit testing ---

NearestTrackPoint TrackAnnotator::nearestTrackPoint(const TrackLayer& track, const QPointF& canvasTap,
                                                    const ViewportProjector& projector)
{
    NearestTrackPoint nearest;
    double bestDistSq = std::numeric_limits<double>::infinity();

    for (const auto& line : track.polylines) {
        for (int i = 1; i < line.size(); ++i) {
            const QPointF& aWorld = line[i - 1];
            const QPointF& bWorld = line[i];
            const QPointF aCanvas = projector.toCanvas(aWorld);
            const QPointF bCanvas = projector.toCanvas(bWorld);

            const double t = GeometryUtils::segmentFactor(canvasTap, aCanvas, bCanvas);
            const QPointF closest = GeometryUtils::lerp(aCanvas, bCanvas, t);
            const double distSq = GeometryUtils::squaredDistance(closest, canvasTap);
            if (distSq < bestDistSq) {
                bestDistSq = distSq;
                nearest.found = true;
                nearest.worldPoint = GeometryUtils::lerp(aWorld, bWorld, t);
                nearest.distance = qSqrt(distSq);
            }
        }
    }
    return nearest;
}

double TrackAnnotator::labelDistance(const TrackNote& note, const QPointF& canvasPoint,
                                     const ViewportProjector& projector, double inflate) const
{
    const FontTextMeasurer fallback(m_store->resolvedNoteFontFamily());
    const NoteTextMeasurer& measurer = m_measurer ? *m_measurer : fallback;
    const NoteLabel label = NoteLabelLayout::layout(note, projector, measurer);
    const QRectF hitRect = label.rect.adjusted(-inflate, -inflate, inflate, inflate);
    return GeometryUtils::distanceToRect(canvasPoint, hitRect);
}

NearestNote TrackAnnotator::nearestNote(const TrackLayer& track, const QPointF& canvasTap,
                                        const ViewportProjector& projector) const
{
    NearestNote nearest;
    double bestDistance = std::numeric_limits<double>::infinity();

    for (const auto& note : track.notes) {
        if (!note.visible) continue;

        const double markerDistance = GeometryUtils::distance(projector.toCanvas(note.anchorPoint), canvasTap);
        if (markerDistance < bestDistance) {
            bestDistance = markerDistance;
            nearest = NearestNote{NoteHitTarget::Marker, note.id, markerDistance};
        }

        const double toLabel = labelDistance(note, canvasTap, projector, MapConstants::kLabelTapInflate);
        if (toLabel < bestDistance) {
            bestDistance = toLabel;
            nearest = NearestNote{NoteHitTarget::Label, note.id, toLabel};
        }
    }
    return nearest;
}

// --- Tap flow ---

TapOutcome TrackAnnotator::handleTap(const QPointF& viewportPos, const ViewportProjector& projector)
{
    if (!m_noteMode || m_promptOpen) return TapOutcome::Ignored;

    const TrackLayer* track = m_store->selectedTrack();
    if (!track || !track->visible) {
        setNoteMode(false);
        emit statusMessage(tr("Select a visible GPX track and try again."));
        return TapOutcome::NoVisibleTrack;
    }

    const QString trackId = track->id;
    const QPointF canvasTap = projector.viewportToCanvas(viewportPos);

    const NearestNote hitNote = nearestNote(*track, canvasTap, projector);
    const double noteThreshold = hitNote.target == NoteHitTarget::Label
        ? MapConstants::kNoteLabelHitThreshold
        : MapConstants::kNoteMarkerHitThreshold;
    if (hitNote.isValid() && hitNote.distance <= noteThreshold) {
        const TrackNote* note = track->findNote(hitNote.noteId);
        const QString noteId = hitNote.noteId;
        QPointer<TrackAnnotator> guard(this);
        m_promptOpen = true;
        m_prompter->requestAction(note ? note->text : QString(),
            [guard, trackId, noteId](bool accepted, NoteAction action) {
                if (!guard) return;
                guard->m_promptOpen = false;
                if (accepted) guard->runNoteAction(trackId, noteId, action);
            });
        return TapOutcome::NoteActionRequested;
    }

    if (m_moveReadyTrackId == trackId && !m_moveReadyNoteId.isEmpty()) {
        emit statusMessage(tr("Waiting to move text: drag the selected label."));
        return TapOutcome::MoveReadyPending;
    }

    const NearestTrackPoint onTrack = nearestTrackPoint(*track, canvasTap, projector);
    if (!onTrack.found || onTrack.distance > MapConstants::kTrackHitThreshold) {
        emit statusMessage(tr("Tap the track line or an existing point."));
        return TapOutcome::OffTrack;
    }

    promptNewNote(trackId, onTrack.worldPoint, NoteLabelLayout::defaultLabelOffset(projector));
    return TapOutcome::NewNoteRequested;
}

void TrackAnnotator::runNoteAction(const QString& trackId, const QString& noteId, NoteAction action)
{
    const TrackNote* note = m_store->findNote(trackId, noteId);
    if (!note) {
        qDebug() << "[TrackAnnotator] Note" << noteId << "vanished before its action ran";
        return;
    }

    if (action == NoteAction::MoveText) {
        m_moveReadyTrackId = trackId;
        m_moveReadyNoteId = noteId;
        emit statusMessage(tr("Ready to move text: drag the label."));
        return;
    }

    clearMoveReady();
    if (action == NoteAction::Delete) {
        const QString text = note->text;
        m_store->removeNote(trackId, noteId);
        emit statusMessage(tr("Point deleted: %1").arg(text));
        return;
    }

    promptEditNote(trackId, noteId);
}

void TrackAnnotator::promptEditNote(const QString& trackId, const QString& noteId)
{
    const TrackNote* note = m_store->findNote(trackId, noteId);
    if (!note || m_promptOpen) return;

    QPointer<TrackAnnotator> guard(this);
    m_promptOpen = true;
    m_prompter->requestText(tr("Edit point note"), note->text,
        [guard, trackId, noteId](bool accepted, const QString& text) {
            if (!guard) return;
            guard->m_promptOpen = false;
            const QString trimmed = text.trimmed();
            if (!accepted || trimmed.isEmpty()) return;
            if (!guard->m_store->updateNoteText(trackId, noteId, trimmed)) {
                qDebug() << "[TrackAnnotator] Dropped edit for missing note" << noteId;
                return;
            }
            emit guard->statusMessage(tr("Point note updated: %1").arg(trimmed));
        });
}

void TrackAnnotator::promptNewNote(const QString& trackId, const QPointF& anchor, const QPointF& labelOffset)
{
    QPointer<TrackAnnotator> guard(this);
    m_promptOpen = true;
    m_prompter->requestText(tr("Add point note"), QString(),
        [guard, trackId, anchor, labelOffset](bool accepted, const QString& text) {
            if (!guard) return;
            guard->m_promptOpen = false;
            const QString trimmed = text.trimmed();
            if (!accepted || trimmed.isEmpty()) return;
            const QString noteId = guard->m_store->addNote(trackId, anchor, trimmed, labelOffset);
            if (noteId.isEmpty()) {
                qDebug() << "[TrackAnnotator] Dropped note for missing track" << trackId;
                return;
            }
            emit guard->statusMessage(tr("Point added: %1").arg(trimmed));
        });
}

// --- Label drag ---

bool TrackAnnotator::beginDrag(const QPointF& viewportPos, const ViewportProjector& projector)
{
    if (!m_noteMode || m_promptOpen) return false;

    const TrackLayer* track = m_store->selectedTrack();
    if (!track || !track->visible) return false;
    if (m_moveReadyTrackId != track->id || m_moveReadyNoteId.isEmpty()) return false;

    const TrackNote* note = track->findNote(m_moveReadyNoteId);
    if (!note || !note->visible) return false;

    const QPointF canvasPoint = projector.viewportToCanvas(viewportPos);
    if (labelDistance(*note, canvasPoint, projector, MapConstants::kLabelDragInflate) > 0.0) {
        return false;
    }

    m_dragTrackId = track->id;
    m_dragNoteId = note->id;
    m_dragGrabDelta = note->labelCenter() - projector.toWorld(canvasPoint);
    emit statusMessage(tr("Moving text..."));
    return true;
}

bool TrackAnnotator::updateDrag(const QPointF& viewportPos, const ViewportProjector& projector)
{
    if (!m_noteMode || m_promptOpen || !isDragging()) return false;

    const TrackNote* note = m_store->findNote(m_dragTrackId, m_dragNoteId);
    if (!note) return false;

    const QPointF pointerWorld = projector.viewportToWorld(viewportPos);
    const QPointF labelCenter = pointerWorld + m_dragGrabDelta;
    return m_store->updateNoteOffset(m_dragTrackId, m_dragNoteId, labelCenter - note->anchorPoint);
}

bool TrackAnnotator::endDrag()
{
    if (!isDragging()) return false;
    clearDragState();
    clearMoveReady();
    emit statusMessage(tr("Text moved"));
    return true;
}
