#include "app/mainwindow.h"
#include "app/dialognoteprompter.h"
#include "appsettings.h"
#include "canvas/mapcanvaswidget.h"
#include "core/mapconstants.h"
#include "interaction/trackannotator.h"
#include "io/contoursourcecache.h"
#include "layerpanel.h"
#include "layers/layerstore.h"
#include "session/mapsession.h"

#include <QAction>
#include <QColorDialog>
#include <QDateTime>
#include <QDockWidget>
#include <QFileDialog>
#include <QFileInfo>
#include <QInputDialog>
#include <QMenu>
#include <QMenuBar>
#include <QStatusBar>
#include <QToolBar>

MainWindow::MainWindow(ContourSourceCache* cache, QWidget *parent)
    : QMainWindow(parent)
{
    setWindowTitle("Trail Contour");
    resize(1280, 860);

    m_prompter = std::make_unique<DialogNotePrompter>(this);
    m_session = new MapSession(cache, m_prompter.get(), this);

    TitleStyle title = m_session->store()->titleStyle();
    title.text = AppSettings::mapTitle();
    title.fontFamily = AppSettings::titleFontFamily();
    title.color = AppSettings::titleColor();
    title.fontSize = AppSettings::titleFontSize();
    m_session->store()->setTitleStyle(title);

    m_canvas = new MapCanvasWidget(this);
    m_canvas->setSession(m_session);
    setCentralWidget(m_canvas);

    setupMenus();
    setupToolbar();
    setupStatusBar();
    setupLayerPanel();

    connect(m_session->annotator(), &TrackAnnotator::noteModeChanged, this, &MainWindow::syncActions);
    connect(m_session->store(), &LayerStore::decorationsChanged, this, &MainWindow::syncActions);
    connect(m_session->store(), &LayerStore::selectionChanged, this, &MainWindow::syncActions);
    syncActions();

    m_session->refreshContourSources();
    updateContourSourcesMenu();
}

MainWindow::~MainWindow()
{
    // The session's annotator holds a raw pointer to the prompter
    delete m_session;
    m_session = nullptr;
}

void MainWindow::setupMenus()
{
    QMenu* fileMenu = menuBar()->addMenu("&File");
    m_importAction = fileMenu->addAction("&Import GPX Track...");
    m_importAction->setShortcut(QKeySequence::Open);
    connect(m_importAction, &QAction::triggered, this, &MainWindow::importGpx);

    m_recentMenu = fileMenu->addMenu("Recent &Tracks");
    connect(m_recentMenu, &QMenu::aboutToShow, this, &MainWindow::updateRecentTracksMenu);

    m_exportAction = fileMenu->addAction("&Export Map Image...");
    m_exportAction->setShortcut(QKeySequence("Ctrl+E"));
    connect(m_exportAction, &QAction::triggered, this, &MainWindow::exportImage);

    fileMenu->addSeparator();
    QAction* quitAction = fileMenu->addAction("&Quit");
    quitAction->setShortcut(QKeySequence::Quit);
    connect(quitAction, &QAction::triggered, this, &QWidget::close);

    QMenu* mapMenu = menuBar()->addMenu("&Map");
    m_contourMenu = mapMenu->addMenu("Add &Contour Layer");
    connect(m_contourMenu, &QMenu::aboutToShow, this, &MainWindow::updateContourSourcesMenu);

    m_resetViewAction = mapMenu->addAction("&Reset View");
    m_resetViewAction->setShortcut(QKeySequence("Ctrl+0"));
    connect(m_resetViewAction, &QAction::triggered, m_session, &MapSession::resetView);

    m_noteModeAction = mapMenu->addAction("Track &Edit Mode");
    m_noteModeAction->setCheckable(true);
    m_noteModeAction->setShortcut(QKeySequence("Ctrl+N"));
    connect(m_noteModeAction, &QAction::triggered, this, &MainWindow::toggleNoteMode);

    QMenu* decoMenu = menuBar()->addMenu("&Decorations");
    m_titleAction = decorationAction(MapDecoration::Title);
    m_northArrowAction = decorationAction(MapDecoration::NorthArrow);
    m_legendAction = decorationAction(MapDecoration::Legend);
    decoMenu->addAction(m_titleAction);
    decoMenu->addAction(m_northArrowAction);
    decoMenu->addAction(m_legendAction);
    decoMenu->addSeparator();
    QAction* titleTextAction = decoMenu->addAction("Edit Title &Text...");
    connect(titleTextAction, &QAction::triggered, this, &MainWindow::editTitle);
    QAction* titleFontAction = decoMenu->addAction("Title &Font...");
    connect(titleFontAction, &QAction::triggered, this, &MainWindow::chooseTitleFont);
    QAction* titleSizeAction = decoMenu->addAction("Title &Size...");
    connect(titleSizeAction, &QAction::triggered, this, &MainWindow::chooseTitleSize);
    QAction* titleColorAction = decoMenu->addAction("Title &Color...");
    connect(titleColorAction, &QAction::triggered, this, &MainWindow::chooseTitleColor);
}

QAction* MainWindow::decorationAction(MapDecoration decoration)
{
    QAction* action = new QAction(LayerStore::decorationLabel(decoration), this);
    action->setCheckable(true);
    connect(action, &QAction::triggered, this, [this, decoration](bool checked) {
        m_session->setDecorationVisible(decoration, checked);
    });
    return action;
}

void MainWindow::setupToolbar()
{
    QToolBar* toolbar = addToolBar("Map");
    toolbar->setMovable(false);
    toolbar->addAction(m_importAction);
    toolbar->addAction(m_contourMenu->menuAction());
    toolbar->addSeparator();
    toolbar->addAction(m_resetViewAction);
    toolbar->addAction(m_noteModeAction);
    toolbar->addSeparator();
    toolbar->addAction(m_exportAction);
}

void MainWindow::setupStatusBar()
{
    statusBar()->showMessage("Import a GPX track to begin", 5000);
    connect(m_session, &MapSession::statusMessage, this, [this](const QString& msg) {
        statusBar()->showMessage(msg, 5000);
    });
}

void MainWindow::setupLayerPanel()
{
    m_layerPanel = new LayerPanel(this);
    m_layerPanel->setSession(m_session);
    m_layerDock = new QDockWidget("Layers", this);
    m_layerDock->setWidget(m_layerPanel);
    m_layerDock->setFeatures(QDockWidget::DockWidgetMovable | QDockWidget::DockWidgetClosable);
    addDockWidget(Qt::RightDockWidgetArea, m_layerDock);
    menuBar()->addMenu("&View")->addAction(m_layerDock->toggleViewAction());
}

void MainWindow::importGpx()
{
    QString path = QFileDialog::getOpenFileName(this, "Import GPX Track", AppSettings::lastGpxDirectory(),
                                                "GPX files (*.gpx);;All files (*)");
    if (path.isEmpty()) return;
    AppSettings::setLastGpxDirectory(QFileInfo(path).absolutePath());
    if (m_session->importGpxFile(path)) {
        AppSettings::addRecentTrack(path);
        m_session->resetView();
    }
}

void MainWindow::updateRecentTracksMenu()
{
    m_recentMenu->clear();
    const QStringList tracks = AppSettings::recentTracks();
    if (tracks.isEmpty()) {
        m_recentMenu->addAction("(none)")->setEnabled(false);
        return;
    }
    for (const QString& path : tracks) {
        QAction* action = m_recentMenu->addAction(QFileInfo(path).fileName());
        action->setData(path);
        action->setToolTip(path);
        connect(action, &QAction::triggered, this, &MainWindow::openRecentTrack);
    }
    m_recentMenu->addSeparator();
    QAction* clearAction = m_recentMenu->addAction("Clear List");
    connect(clearAction, &QAction::triggered, this, []() { AppSettings::clearRecentTracks(); });
}

void MainWindow::openRecentTrack()
{
    QAction* action = qobject_cast<QAction*>(sender());
    if (!action) return;
    const QString path = action->data().toString();
    if (m_session->importGpxFile(path)) {
        AppSettings::addRecentTrack(path);
        m_session->resetView();
    }
}

void MainWindow::updateContourSourcesMenu()
{
    m_contourMenu->clear();
    const auto& sources = m_session->contourSources();
    if (sources.isEmpty()) {
        m_contourMenu->addAction("(no contour sources)")->setEnabled(false);
        return;
    }
    for (const auto& source : sources) {
        QAction* action = m_contourMenu->addAction(source.name.isEmpty() ? source.id : source.name);
        action->setData(source.id);
        action->setEnabled(!m_session->store()->hasContourSource(source.id));
        connect(action, &QAction::triggered, this, &MainWindow::addContourSource);
    }
}

void MainWindow::addContourSource()
{
    QAction* action = qobject_cast<QAction*>(sender());
    if (!action) return;
    const QString id = action->data().toString();
    for (const auto& source : m_session->contourSources()) {
        if (source.id != id) continue;
        if (m_session->addContourLayer(source)) {
            m_session->resetView();
        }
        return;
    }
}

void MainWindow::toggleNoteMode()
{
    m_session->annotator()->toggleNoteMode();
    syncActions();
}

void MainWindow::exportImage()
{
    ExportResult result = m_exporter.exportImage(*m_session, devicePixelRatioF(),
                                                 AppSettings::exportDirectory(),
                                                 QDateTime::currentDateTime());
    if (result.success) {
        statusBar()->showMessage(QString("Map image saved: %1").arg(result.filePath), 5000);
    } else {
        statusBar()->showMessage(QString("Export failed: %1").arg(result.errorMessage), 5000);
    }
}

void MainWindow::editTitle()
{
    TitleStyle style = m_session->store()->titleStyle();
    bool ok = false;
    QString text = QInputDialog::getText(this, "Map Title", "Title:", QLineEdit::Normal, style.text, &ok);
    if (!ok) return;
    text = text.trimmed().left(32);
    if (text.isEmpty()) return;
    style.text = text;
    m_session->store()->setTitleStyle(style);
    AppSettings::setMapTitle(text);
}

void MainWindow::chooseTitleFont()
{
    TitleStyle style = m_session->store()->titleStyle();
    const QStringList families = LayerStore::noteFontFamilies();
    bool ok = false;
    QString family = QInputDialog::getItem(this, "Title Font", "Font family:", families,
                                           qMax(0, families.indexOf(style.fontFamily)), false, &ok);
    if (!ok || family.isEmpty()) return;
    style.fontFamily = family;
    m_session->store()->setTitleStyle(style);
    AppSettings::setTitleFontFamily(family);
    statusBar()->showMessage(QString("Title font: %1").arg(family), 3000);
}

void MainWindow::chooseTitleSize()
{
    TitleStyle style = m_session->store()->titleStyle();
    bool ok = false;
    const int size = QInputDialog::getInt(this, "Title Size", "Font size (px):", style.fontSize,
                                          MapConstants::kMinTitleFontSize, MapConstants::kMaxTitleFontSize,
                                          1, &ok);
    if (!ok) return;
    style.fontSize = size;
    m_session->store()->setTitleStyle(style);
    AppSettings::setTitleFontSize(m_session->store()->titleStyle().fontSize);
}

void MainWindow::chooseTitleColor()
{
    TitleStyle style = m_session->store()->titleStyle();
    const QColor color = QColorDialog::getColor(style.color, this, "Title Color");
    if (!color.isValid()) return;
    style.color = color;
    m_session->store()->setTitleStyle(style);
    AppSettings::setTitleColor(color);
}

void MainWindow::syncActions()
{
    if (!m_session) return;
    LayerStore* store = m_session->store();
    m_noteModeAction->setChecked(m_session->annotator()->isNoteMode());
    m_noteModeAction->setEnabled(store->selectedTrack() != nullptr);
    m_titleAction->setChecked(store->isDecorationVisible(MapDecoration::Title));
    m_northArrowAction->setChecked(store->isDecorationVisible(MapDecoration::NorthArrow));
    m_legendAction->setChecked(store->isDecorationVisible(MapDecoration::Legend));
}
