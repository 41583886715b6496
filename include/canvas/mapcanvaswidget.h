#ifndef MAPCANVASWIDGET_H
#define MAPCANVASWIDGET_H

#include <QWidget>
#include <QPoint>
#include <QPointF>
#include <QColor>

#include <memory>

class MapSession;
class NoteGesture;

// Pointer gesture state
enum class GestureState {
    Idle,           // Nothing pressed
    Panning,        // Dragging the view
    NotePointer     // Pressed in note mode; tap or label drag
};

class MapCanvasWidget : public QWidget
{
    Q_OBJECT
public:
    explicit MapCanvasWidget(QWidget* parent = nullptr);
    ~MapCanvasWidget() override;

    void setSession(MapSession* session);
    MapSession* session() const { return m_session; }

protected:
    void paintEvent(QPaintEvent* event) override;
    void resizeEvent(QResizeEvent* event) override;
    void wheelEvent(QWheelEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void keyPressEvent(QKeyEvent* event) override;

private:
    void updateCursor();

    MapSession* m_session{nullptr};
    GestureState m_gesture{GestureState::Idle};
    std::unique_ptr<NoteGesture> m_noteGesture;
    QPointF m_lastMousePos;
    QColor m_backgroundColor{0xF4, 0xF1, 0xEA};
};

#endif // MAPCANVASWIDGET_H
