#include <gtest/gtest.h>

#include "core/mapconstants.h"
#include "interaction/trackannotator.h"
#include "layers/layerstore.h"
#include "tests/test_support.h"
#include "view/viewportprojector.h"

#include <QSignalSpy>

using namespace trail_test;

namespace {

// Canvas scale of 1 with the track running from canvas (0, 0) to (100, 0)
const QRectF kWorld(0.0, 0.0, 100.0, 100.0);
const QSizeF kCanvas(62.5, 62.5);
const QPointF kTrackStart(18.75, 81.25);
const QPointF kTrackEnd(118.75, 81.25);

class TrackAnnotatorTest : public ::testing::Test {
protected:
    TrackAnnotatorTest()
        : m_projector(kWorld, kCanvas)
        , m_annotator(&m_store, &m_prompter)
    {
        m_annotator.setTextMeasurer(&m_measurer);
        m_trackId = m_store.addTrackLayer("ridge", {straightLine(kTrackStart, kTrackEnd, 2)});
    }

    QPointF viewportOf(const QPointF& world) const { return m_projector.worldToViewport(world); }

    // Adds a note at the track midpoint through the tap flow
    QString addNoteByTap(const QString& text)
    {
        m_prompter.nextText = text;
        EXPECT_EQ(m_annotator.handleTap(QPointF(50.0, 0.0), m_projector), TapOutcome::NewNoteRequested);
        const TrackLayer* track = m_store.findTrack(m_trackId);
        return track && !track->notes.isEmpty() ? track->notes.last().id : QString();
    }

    LayerStore m_store;
    ScriptedPrompter m_prompter;
    FixedTextMeasurer m_measurer;
    ViewportProjector m_projector;
    TrackAnnotator m_annotator;
    QString m_trackId;
};

} // namespace

TEST_F(TrackAnnotatorTest, TrackEndpointsLandOnExpectedCanvasPoints) {
    EXPECT_NEAR(m_projector.toCanvas(kTrackStart).x(), 0.0, 1e-9);
    EXPECT_NEAR(m_projector.toCanvas(kTrackStart).y(), 0.0, 1e-9);
    EXPECT_NEAR(m_projector.toCanvas(kTrackEnd).x(), 100.0, 1e-9);
    EXPECT_NEAR(m_projector.scale(), 1.0, 1e-12);
}

TEST_F(TrackAnnotatorTest, TapOnSegmentMidpointHitsTrueMidpoint) {
    const NearestTrackPoint hit = TrackAnnotator::nearestTrackPoint(*m_store.findTrack(m_trackId),
                                                                    QPointF(50.0, 0.0), m_projector);
    ASSERT_TRUE(hit.found);
    EXPECT_NEAR(hit.distance, 0.0, 1e-9);
    EXPECT_NEAR(hit.worldPoint.x(), 68.75, 1e-9);
    EXPECT_NEAR(hit.worldPoint.y(), 81.25, 1e-9);
}

TEST_F(TrackAnnotatorTest, NearestPointClampsToSegmentEnds) {
    const NearestTrackPoint hit = TrackAnnotator::nearestTrackPoint(*m_store.findTrack(m_trackId),
                                                                    QPointF(-30.0, 40.0), m_projector);
    ASSERT_TRUE(hit.found);
    EXPECT_NEAR(hit.distance, 50.0, 1e-9);
    EXPECT_NEAR(hit.worldPoint.x(), kTrackStart.x(), 1e-9);
}

TEST_F(TrackAnnotatorTest, NoteModeNeedsSelectedTrack) {
    m_store.select(Selection::none());
    QSignalSpy status(&m_annotator, &TrackAnnotator::statusMessage);
    EXPECT_FALSE(m_annotator.toggleNoteMode());
    EXPECT_FALSE(m_annotator.isNoteMode());
    EXPECT_EQ(status.count(), 1);

    m_store.select(Selection::track(m_trackId));
    QSignalSpy mode(&m_annotator, &TrackAnnotator::noteModeChanged);
    EXPECT_TRUE(m_annotator.toggleNoteMode());
    EXPECT_TRUE(m_annotator.isNoteMode());
    ASSERT_EQ(mode.count(), 1);
    EXPECT_TRUE(mode.at(0).at(0).toBool());
}

TEST_F(TrackAnnotatorTest, TapsOutsideNoteModeAreIgnored) {
    EXPECT_EQ(m_annotator.handleTap(QPointF(50.0, 0.0), m_projector), TapOutcome::Ignored);
    EXPECT_TRUE(m_prompter.textRequests.isEmpty());
}

TEST_F(TrackAnnotatorTest, TapOnTrackCreatesNoteAtNearestPoint) {
    ASSERT_TRUE(m_annotator.toggleNoteMode());
    const QString noteId = addNoteByTap("  Summit  ");
    ASSERT_FALSE(noteId.isEmpty());

    const TrackNote* note = m_store.findNote(m_trackId, noteId);
    ASSERT_NE(note, nullptr);
    EXPECT_EQ(note->text, "Summit");
    EXPECT_NEAR(note->anchorPoint.x(), 68.75, 1e-9);
    EXPECT_NEAR(note->anchorPoint.y(), 81.25, 1e-9);
    EXPECT_NEAR(note->labelOffset.x(), MapConstants::kLabelOffsetX, 1e-9);
    EXPECT_NEAR(note->labelOffset.y(), MapConstants::kLabelOffsetY, 1e-9);
    EXPECT_FALSE(m_annotator.isPromptOpen());
}

TEST_F(TrackAnnotatorTest, BlankOrCancelledTextAddsNothing) {
    ASSERT_TRUE(m_annotator.toggleNoteMode());
    m_prompter.nextText = "   ";
    EXPECT_EQ(m_annotator.handleTap(QPointF(50.0, 0.0), m_projector), TapOutcome::NewNoteRequested);
    m_prompter.nextText = "Pass";
    m_prompter.textAccepted = false;
    EXPECT_EQ(m_annotator.handleTap(QPointF(50.0, 0.0), m_projector), TapOutcome::NewNoteRequested);
    EXPECT_TRUE(m_store.findTrack(m_trackId)->notes.isEmpty());
}

TEST_F(TrackAnnotatorTest, TapAwayFromTrackIsReported) {
    ASSERT_TRUE(m_annotator.toggleNoteMode());
    QSignalSpy status(&m_annotator, &TrackAnnotator::statusMessage);
    EXPECT_EQ(m_annotator.handleTap(QPointF(50.0, 30.0), m_projector), TapOutcome::OffTrack);
    EXPECT_EQ(status.count(), 1);
    EXPECT_TRUE(m_prompter.textRequests.isEmpty());
}

TEST_F(TrackAnnotatorTest, TapNearMarkerOpensActionsAndDeletes) {
    ASSERT_TRUE(m_annotator.toggleNoteMode());
    const QString noteId = addNoteByTap("Spring");

    m_prompter.nextAction = NoteAction::Delete;
    EXPECT_EQ(m_annotator.handleTap(QPointF(52.0, 3.0), m_projector), TapOutcome::NoteActionRequested);
    ASSERT_EQ(m_prompter.actionRequests.size(), 1);
    EXPECT_EQ(m_prompter.actionRequests.first(), "Spring");
    EXPECT_EQ(m_store.findNote(m_trackId, noteId), nullptr);
}

TEST_F(TrackAnnotatorTest, EditActionPromptsWithCurrentText) {
    ASSERT_TRUE(m_annotator.toggleNoteMode());
    const QString noteId = addNoteByTap("Spring");

    m_prompter.nextAction = NoteAction::Edit;
    m_prompter.nextText = "Dry spring";
    EXPECT_EQ(m_annotator.handleTap(QPointF(50.0, 0.0), m_projector), TapOutcome::NoteActionRequested);
    EXPECT_EQ(m_prompter.initialTexts.last(), "Spring");
    EXPECT_EQ(m_store.findNote(m_trackId, noteId)->text, "Dry spring");
}

TEST_F(TrackAnnotatorTest, TapOnLabelHitsNote) {
    ASSERT_TRUE(m_annotator.toggleNoteMode());
    const QString noteId = addNoteByTap("Spring");
    const TrackNote* note = m_store.findNote(m_trackId, noteId);

    const NearestNote hit = m_annotator.nearestNote(*m_store.findTrack(m_trackId),
                                                    m_projector.toCanvas(note->labelCenter()), m_projector);
    EXPECT_EQ(hit.target, NoteHitTarget::Label);
    EXPECT_EQ(hit.noteId, noteId);
    EXPECT_DOUBLE_EQ(hit.distance, 0.0);
}

TEST_F(TrackAnnotatorTest, HiddenNotesAreNotHit) {
    ASSERT_TRUE(m_annotator.toggleNoteMode());
    const QString noteId = addNoteByTap("Spring");
    m_store.setNoteVisible(m_trackId, noteId, false);

    const NearestNote hit = m_annotator.nearestNote(*m_store.findTrack(m_trackId), QPointF(50.0, 0.0),
                                                    m_projector);
    EXPECT_FALSE(hit.isValid());
}

TEST_F(TrackAnnotatorTest, DragMovesLabelByPointerDelta) {
    ASSERT_TRUE(m_annotator.toggleNoteMode());
    const QString noteId = addNoteByTap("Spring");
    const TrackNote before = *m_store.findNote(m_trackId, noteId);

    m_prompter.nextAction = NoteAction::MoveText;
    const QPointF labelViewport = viewportOf(before.labelCenter());
    EXPECT_EQ(m_annotator.handleTap(labelViewport, m_projector), TapOutcome::NoteActionRequested);
    EXPECT_EQ(m_annotator.moveReadyNoteId(), noteId);

    ASSERT_TRUE(m_annotator.beginDrag(labelViewport, m_projector));
    EXPECT_TRUE(m_annotator.isDragging());
    ASSERT_TRUE(m_annotator.updateDrag(viewportOf(before.labelCenter() + QPointF(4.0, 2.0)), m_projector));
    ASSERT_TRUE(m_annotator.updateDrag(viewportOf(before.labelCenter() + QPointF(10.0, 5.0)), m_projector));
    EXPECT_TRUE(m_annotator.endDrag());

    const TrackNote* after = m_store.findNote(m_trackId, noteId);
    EXPECT_NEAR(after->labelOffset.x(), before.labelOffset.x() + 10.0, 1e-6);
    EXPECT_NEAR(after->labelOffset.y(), before.labelOffset.y() + 5.0, 1e-6);
    EXPECT_EQ(after->anchorPoint, before.anchorPoint);
    EXPECT_FALSE(m_annotator.isDragging());
    EXPECT_TRUE(m_annotator.moveReadyNoteId().isEmpty());
}

TEST_F(TrackAnnotatorTest, DragNeedsMoveReadyNoteAndLabelHit) {
    ASSERT_TRUE(m_annotator.toggleNoteMode());
    const QString noteId = addNoteByTap("Spring");
    const QPointF labelViewport = viewportOf(m_store.findNote(m_trackId, noteId)->labelCenter());

    EXPECT_FALSE(m_annotator.beginDrag(labelViewport, m_projector));

    m_prompter.nextAction = NoteAction::MoveText;
    m_annotator.handleTap(labelViewport, m_projector);
    EXPECT_FALSE(m_annotator.beginDrag(labelViewport + QPointF(200.0, 200.0), m_projector));
    EXPECT_FALSE(m_annotator.updateDrag(labelViewport, m_projector));
    EXPECT_FALSE(m_annotator.endDrag());
}

TEST_F(TrackAnnotatorTest, MoveReadyBlocksNewNotes) {
    ASSERT_TRUE(m_annotator.toggleNoteMode());
    const QString noteId = addNoteByTap("Spring");
    m_prompter.nextAction = NoteAction::MoveText;
    m_annotator.handleTap(QPointF(50.0, 0.0), m_projector);
    ASSERT_EQ(m_annotator.moveReadyNoteId(), noteId);

    const int textRequests = m_prompter.textRequests.size();
    EXPECT_EQ(m_annotator.handleTap(QPointF(5.0, 0.0), m_projector), TapOutcome::MoveReadyPending);
    EXPECT_EQ(m_prompter.textRequests.size(), textRequests);
}

TEST_F(TrackAnnotatorTest, OnlyOnePromptAtATime) {
    ASSERT_TRUE(m_annotator.toggleNoteMode());
    m_prompter.deferAnswers = true;
    EXPECT_EQ(m_annotator.handleTap(QPointF(50.0, 0.0), m_projector), TapOutcome::NewNoteRequested);
    EXPECT_TRUE(m_annotator.isPromptOpen());
    EXPECT_EQ(m_annotator.handleTap(QPointF(20.0, 0.0), m_projector), TapOutcome::Ignored);
    EXPECT_EQ(m_prompter.textRequests.size(), 1);

    m_prompter.pendingText(true, "Late");
    EXPECT_FALSE(m_annotator.isPromptOpen());
    ASSERT_EQ(m_store.findTrack(m_trackId)->notes.size(), 1);
    EXPECT_EQ(m_store.findTrack(m_trackId)->notes.first().text, "Late");
}

TEST_F(TrackAnnotatorTest, AnswerForRemovedTrackIsDropped) {
    ASSERT_TRUE(m_annotator.toggleNoteMode());
    m_prompter.deferAnswers = true;
    m_annotator.handleTap(QPointF(50.0, 0.0), m_projector);
    m_store.removeTrackLayer(m_trackId);

    m_prompter.pendingText(true, "Orphan");
    EXPECT_FALSE(m_annotator.isPromptOpen());
    EXPECT_EQ(m_store.findTrack(m_trackId), nullptr);
}

TEST_F(TrackAnnotatorTest, ActionForDeletedNoteIsDropped) {
    ASSERT_TRUE(m_annotator.toggleNoteMode());
    const QString noteId = addNoteByTap("Spring");
    m_prompter.deferAnswers = true;
    m_annotator.handleTap(QPointF(50.0, 0.0), m_projector);
    m_store.removeNote(m_trackId, noteId);

    const int textRequests = m_prompter.textRequests.size();
    m_prompter.pendingAction(true, NoteAction::Edit);
    EXPECT_EQ(m_prompter.textRequests.size(), textRequests);
    EXPECT_TRUE(m_annotator.moveReadyNoteId().isEmpty());
}

TEST_F(TrackAnnotatorTest, SelectingNonTrackExitsNoteMode) {
    ASSERT_TRUE(m_annotator.toggleNoteMode());
    const QString other = m_store.addTrackLayer("valley", {straightLine(QPointF(0, 0), QPointF(10, 10), 2)});
    EXPECT_TRUE(m_store.selection().isTrack(other));
    EXPECT_TRUE(m_annotator.isNoteMode());

    m_store.select(Selection::ofDecoration(MapDecoration::Legend));
    EXPECT_FALSE(m_annotator.isNoteMode());
}

TEST_F(TrackAnnotatorTest, HidingSelectedTrackExitsNoteMode) {
    ASSERT_TRUE(m_annotator.toggleNoteMode());
    m_store.setTrackVisible(m_trackId, false);
    EXPECT_FALSE(m_annotator.isNoteMode());
}

TEST_F(TrackAnnotatorTest, RemovingMoveReadyNoteClearsIt) {
    ASSERT_TRUE(m_annotator.toggleNoteMode());
    const QString noteId = addNoteByTap("Spring");
    m_prompter.nextAction = NoteAction::MoveText;
    m_annotator.handleTap(QPointF(50.0, 0.0), m_projector);
    ASSERT_EQ(m_annotator.moveReadyNoteId(), noteId);

    m_store.removeNote(m_trackId, noteId);
    EXPECT_TRUE(m_annotator.moveReadyNoteId().isEmpty());
    EXPECT_TRUE(m_annotator.moveReadyTrackId().isEmpty());
}

TEST_F(TrackAnnotatorTest, ThresholdsAreMeasuredInCanvasPixels) {
    ASSERT_TRUE(m_annotator.toggleNoteMode());
    // Zoomed 4x: a 40 px viewport offset is only 10 canvas px
    const ViewportProjector zoomed(kWorld, kCanvas, QTransform(4.0, 0.0, 0.0, 4.0, 0.0, 0.0));
    EXPECT_EQ(m_annotator.handleTap(QPointF(200.0, 40.0), zoomed), TapOutcome::NewNoteRequested);
}
