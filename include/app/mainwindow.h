#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QMainWindow>
#include <memory>

#include "layers/maplayers.h"
#include "render/mapexporter.h"

class ContourSourceCache;
class DialogNotePrompter;
class LayerPanel;
class MapCanvasWidget;
class MapSession;
class QAction;
class QDockWidget;
class QMenu;

class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    explicit MainWindow(ContourSourceCache* cache, QWidget *parent = nullptr);
    ~MainWindow();

    MapSession* session() const { return m_session; }
    MapCanvasWidget* canvas() const { return m_canvas; }

private slots:
    void importGpx();
    void openRecentTrack();
    void updateRecentTracksMenu();
    void updateContourSourcesMenu();
    void addContourSource();
    void toggleNoteMode();
    void exportImage();
    void editTitle();
    void chooseTitleFont();
    void chooseTitleSize();
    void chooseTitleColor();
    void syncActions();

private:
    void setupMenus();
    void setupToolbar();
    void setupStatusBar();
    void setupLayerPanel();
    QAction* decorationAction(MapDecoration decoration);

    std::unique_ptr<DialogNotePrompter> m_prompter;
    MapSession* m_session{nullptr};
    MapCanvasWidget* m_canvas{nullptr};
    LayerPanel* m_layerPanel{nullptr};
    QDockWidget* m_layerDock{nullptr};
    MapExporter m_exporter;

    QMenu* m_contourMenu{nullptr};
    QMenu* m_recentMenu{nullptr};
    QAction* m_importAction{nullptr};
    QAction* m_noteModeAction{nullptr};
    QAction* m_resetViewAction{nullptr};
    QAction* m_exportAction{nullptr};
    QAction* m_titleAction{nullptr};
    QAction* m_northArrowAction{nullptr};
    QAction* m_legendAction{nullptr};
};

#endif // MAINWINDOW_H
