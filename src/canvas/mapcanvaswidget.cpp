#include "canvas/mapcanvaswidget.h"
#include "core/mapconstants.h"
#include "interaction/notegesture.h"
#include "interaction/trackannotator.h"
#include "session/mapsession.h"

#include <QKeyEvent>
#include <QMouseEvent>
#include <QPainter>
#include <QResizeEvent>
#include <QWheelEvent>

MapCanvasWidget::MapCanvasWidget(QWidget* parent)
    : QWidget(parent)
{
    setMouseTracking(true);
    setFocusPolicy(Qt::StrongFocus);
    setMinimumSize(320, 240);
}

MapCanvasWidget::~MapCanvasWidget() = default;

void MapCanvasWidget::setSession(MapSession* session)
{
    m_session = session;
    m_noteGesture.reset();
    if (!m_session) return;
    m_noteGesture.reset(new NoteGesture(m_session->annotator()));
    m_session->setViewportSize(size());
    connect(m_session, &MapSession::sceneChanged, this, QOverload<>::of(&QWidget::update));
    connect(m_session, &MapSession::viewChanged, this, QOverload<>::of(&QWidget::update));
    connect(m_session->annotator(), &TrackAnnotator::noteModeChanged, this, [this]() {
        m_gesture = GestureState::Idle;
        m_noteGesture->cancel();
        updateCursor();
    });
    update();
}

void MapCanvasWidget::updateCursor()
{
    const bool noteMode = m_session && m_session->annotator()->isNoteMode();
    const bool dragging = m_noteGesture && m_noteGesture->isDragging();
    if (m_gesture == GestureState::Panning || dragging) {
        setCursor(Qt::ClosedHandCursor);
    } else {
        setCursor(noteMode ? Qt::CrossCursor : Qt::OpenHandCursor);
    }
}

void MapCanvasWidget::paintEvent(QPaintEvent* event)
{
    Q_UNUSED(event);
    QPainter painter(this);
    painter.fillRect(rect(), m_backgroundColor);
    if (m_session) {
        m_session->renderScene(painter);
    }
}

void MapCanvasWidget::resizeEvent(QResizeEvent* event)
{
    QWidget::resizeEvent(event);
    if (m_session) m_session->setViewportSize(event->size());
}

void MapCanvasWidget::wheelEvent(QWheelEvent* event)
{
    if (!m_session) return;
    const double factor = event->angleDelta().y() > 0
        ? MapConstants::kWheelZoomFactor
        : 1.0 / MapConstants::kWheelZoomFactor;
    if (m_session->zoomAt(event->position(), factor)) {
        event->accept();
    }
}

void MapCanvasWidget::mousePressEvent(QMouseEvent* event)
{
    if (!m_session) return;
    const QPointF pos = event->position();
    m_lastMousePos = pos;

    TrackAnnotator* annotator = m_session->annotator();
    if (annotator->isNoteMode()) {
        if (event->button() != Qt::LeftButton) return;
        m_noteGesture->press(pos);
        m_gesture = GestureState::NotePointer;
    } else if (event->button() == Qt::LeftButton || event->button() == Qt::MiddleButton) {
        m_gesture = GestureState::Panning;
    }
    updateCursor();
}

void MapCanvasWidget::mouseMoveEvent(QMouseEvent* event)
{
    if (!m_session) return;
    const QPointF pos = event->position();

    switch (m_gesture) {
        case GestureState::Panning:
            m_session->panBy(pos - m_lastMousePos);
            break;
        case GestureState::NotePointer:
            if (m_noteGesture->move(pos, m_session->projector())) updateCursor();
            break;
        default:
            break;
    }
    m_lastMousePos = pos;
}

void MapCanvasWidget::mouseReleaseEvent(QMouseEvent* event)
{
    if (!m_session) return;
    const QPointF pos = event->position();
    if (m_gesture == GestureState::NotePointer) {
        m_noteGesture->release(pos, m_session->projector());
    }
    m_gesture = GestureState::Idle;
    updateCursor();
}

void MapCanvasWidget::keyPressEvent(QKeyEvent* event)
{
    if (event->key() == Qt::Key_Escape && m_session && m_session->annotator()->isNoteMode()) {
        m_session->annotator()->exitNoteMode();
        return;
    }
    QWidget::keyPressEvent(event);
}
