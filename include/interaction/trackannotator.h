#ifndef TRACKANNOTATOR_H
#define TRACKANNOTATOR_H

#include <QObject>
#include <QPointF>
#include <QString>

#include "layers/maplayers.h"

class LayerStore;
class NotePrompter;
class NoteTextMeasurer;
class ViewportProjector;

struct NearestTrackPoint {
    bool found{false};
    QPointF worldPoint;
    double distance{0.0};       // Canvas pixels
};

enum class NoteHitTarget {
    None,
    Marker,
    Label
};

struct NearestNote {
    NoteHitTarget target{NoteHitTarget::None};
    QString noteId;
    double distance{0.0};       // Canvas pixels

    bool isValid() const { return target != NoteHitTarget::None; }
};

enum class TapOutcome {
    Ignored,            // Not in note mode or a prompt is open
    NoVisibleTrack,     // Note mode left because the selected track is gone or hidden
    NoteActionRequested,
    MoveReadyPending,
    NewNoteRequested,
    OffTrack
};

/**
 * @brief TrackAnnotator - Note editing state machine for the selected track
 *
 * Taps either open the action menu for a nearby note or prompt for a new
 * note on the nearest track point. A note armed with MoveText can then be
 * dragged by its label. Only one prompt is in flight at a time; results that
 * arrive after their track or note disappeared are dropped.
 * All positions passed in are viewport pixels; hit thresholds are in canvas pixels.
 */
class TrackAnnotator : public QObject {
    Q_OBJECT
public:
    TrackAnnotator(LayerStore* store, NotePrompter* prompter, QObject* parent = nullptr);

    // Overrides the font-based measurer; the caller keeps ownership
    void setTextMeasurer(const NoteTextMeasurer* measurer) { m_measurer = measurer; }

    bool isNoteMode() const { return m_noteMode; }
    bool toggleNoteMode();
    void exitNoteMode();

    bool isPromptOpen() const { return m_promptOpen; }
    bool isDragging() const { return !m_dragNoteId.isEmpty(); }
    QString moveReadyTrackId() const { return m_moveReadyTrackId; }
    QString moveReadyNoteId() const { return m_moveReadyNoteId; }

    static NearestTrackPoint nearestTrackPoint(const TrackLayer& track, const QPointF& canvasTap,
                                               const ViewportProjector& projector);
    NearestNote nearestNote(const TrackLayer& track, const QPointF& canvasTap,
                            const ViewportProjector& projector) const;

    TapOutcome handleTap(const QPointF& viewportPos, const ViewportProjector& projector);
    bool beginDrag(const QPointF& viewportPos, const ViewportProjector& projector);
    bool updateDrag(const QPointF& viewportPos, const ViewportProjector& projector);
    bool endDrag();

signals:
    void statusMessage(const QString& message);
    void noteModeChanged(bool enabled);

private slots:
    void onSelectionChanged(const Selection& selection);
    void onTrackRemoved(const QString& trackId);
    void onTrackVisibilityChanged(const QString& trackId, bool visible);
    void onNoteRemoved(const QString& trackId, const QString& noteId);
    void onNoteVisibilityChanged(const QString& trackId, const QString& noteId, bool visible);

private:
    void setNoteMode(bool enabled);
    void clearDragState();
    void clearMoveReady();
    void runNoteAction(const QString& trackId, const QString& noteId, NoteAction action);
    void promptEditNote(const QString& trackId, const QString& noteId);
    void promptNewNote(const QString& trackId, const QPointF& anchor, const QPointF& labelOffset);
    double labelDistance(const TrackNote& note, const QPointF& canvasPoint,
                         const ViewportProjector& projector, double inflate) const;

    LayerStore* m_store{nullptr};
    NotePrompter* m_prompter{nullptr};
    const NoteTextMeasurer* m_measurer{nullptr};

    bool m_noteMode{false};
    QString m_noteModeTrackId;
    bool m_promptOpen{false};

    QString m_moveReadyTrackId;
    QString m_moveReadyNoteId;

    QString m_dragTrackId;
    QString m_dragNoteId;
    QPointF m_dragGrabDelta;
};

#endif // TRACKANNOTATOR_H
