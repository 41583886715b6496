#include "session/mapsession.h"
#include "core/mapconstants.h"
#include "geo/geometryutils.h"
#include "interaction/trackannotator.h"
#include "io/gpxreader.h"
#include "layers/layerstore.h"
#include "render/notelabellayout.h"
#include "render/scenerenderer.h"

#include <QDebug>
#include <QFileInfo>
#include <QPainter>

namespace {

// Holds the import lock until the enclosing scope exits
class ImportingFlag
{
public:
    explicit ImportingFlag(bool& flag) : m_flag(flag) { m_flag = true; }
    ~ImportingFlag() { m_flag = false; }

private:
    bool& m_flag;
};

} // namespace

MapSession::MapSession(ContourSourceCache* cache, NotePrompter* prompter, QObject* parent)
    : QObject(parent)
    , m_cache(cache)
    , m_store(new LayerStore(this))
    , m_annotator(new TrackAnnotator(m_store, prompter, this))
{
    connect(m_annotator, &TrackAnnotator::statusMessage, this, &MapSession::reportStatus);
    connect(m_store, &LayerStore::layersChanged, this, &MapSession::sceneChanged);
    connect(m_store, &LayerStore::decorationsChanged, this, &MapSession::sceneChanged);
    connect(m_store, &LayerStore::selectionChanged, this, &MapSession::sceneChanged);
}

MapSession::~MapSession() = default;

void MapSession::reportStatus(const QString& message)
{
    m_lastStatus = message;
    qDebug() << "[MapSession]" << message;
    emit statusMessage(message);
}

void MapSession::setTextMeasurer(const NoteTextMeasurer* measurer)
{
    m_measurer = measurer;
    m_annotator->setTextMeasurer(measurer);
}

// --- Viewport ---

void MapSession::setViewportSize(const QSizeF& size)
{
    if (m_viewportSize == size) return;
    m_viewportSize = size;
    emit viewChanged();
}

void MapSession::setViewTransform(const QTransform& transform)
{
    m_viewTransform = transform;
    emit viewChanged();
}

QRectF MapSession::worldBounds() const
{
    return m_store->combinedBounds();
}

ViewportProjector MapSession::projector() const
{
    return ViewportProjector(worldBounds(), m_viewportSize, m_viewTransform);
}

bool MapSession::zoomAt(const QPointF& viewportAnchor, double factor)
{
    if (m_annotator->isNoteMode() || !(factor > 0.0)) return false;
    setViewTransform(ViewportProjector::zoomAt(m_viewTransform, viewportAnchor, factor));
    return true;
}

bool MapSession::panBy(const QPointF& viewportDelta)
{
    if (m_annotator->isNoteMode()) return false;
    setViewTransform(ViewportProjector::panBy(m_viewTransform, viewportDelta));
    return true;
}

bool MapSession::resetView()
{
    QRectF target;
    const bool hasSelected = m_store->selectedVisibleBounds(target);
    const bool hasTarget = hasSelected || m_store->visibleLayersBounds(target);

    if (m_viewportSize.isEmpty() || !hasTarget) {
        setViewTransform(QTransform());
        reportStatus(tr("No visible layers; showing the default view"));
        return false;
    }

    const ViewportProjector base(worldBounds(), m_viewportSize);
    setViewTransform(ViewportProjector::fitTransform(base, target, m_viewportSize));
    reportStatus(hasSelected ? tr("Centered on the selected layer")
                             : tr("Centered on the visible layers"));
    return true;
}

// --- Contour sources ---

QVector<ContourSource> MapSession::refreshContourSources()
{
    m_contourSources = m_cache->listSources();
    if (m_contourSources.isEmpty()) {
        reportStatus(tr("No contour sources available"));
    }
    return m_contourSources;
}

bool MapSession::addContourLayer(const ContourSource& source)
{
    if (m_loadingContour) return false;

    if (const ContourLayer* existing = m_store->findContourBySource(source.id)) {
        m_annotator->exitNoteMode();
        m_store->select(Selection::contour(existing->id));
        reportStatus(tr("Contour layer already added: %1").arg(existing->name));
        return false;
    }

    m_loadingContour = true;
    reportStatus(tr("Loading contours: %1").arg(source.name));

    ContourLoadResult loaded;
    QRectF tracks;
    if (m_store->tracksBounds(tracks)) {
        loaded = m_cache->loadSource(source, GeometryUtils::inflate(tracks, MapConstants::kContourClipMargin));
        if (loaded.success && loaded.lines.isEmpty()) {
            qDebug() << "[MapSession] No contour of" << source.id << "near the tracks, loading the full extent";
            loaded = m_cache->loadSource(source);
        }
    } else {
        loaded = m_cache->loadSource(source);
    }
    m_loadingContour = false;

    if (!loaded.success) {
        reportStatus(tr("Contour load failed: %1").arg(loaded.errorMessage));
        return false;
    }

    ContourLayer layer;
    layer.id = QStringLiteral("contour_%1").arg(source.id);
    layer.sourceId = source.id;
    layer.name = source.name;
    layer.bounds = loaded.bounds;
    layer.lines = loaded.lines;

    m_annotator->exitNoteMode();
    if (!m_store->addContourLayer(layer)) {
        reportStatus(tr("Contour load failed: %1").arg(source.name));
        return false;
    }
    reportStatus(tr("Contour layer added: %1 (%2 lines)").arg(source.name).arg(layer.lines.size()));
    return true;
}

bool MapSession::removeContourLayer(const QString& layerId)
{
    const ContourLayer* layer = m_store->findContour(layerId);
    if (!layer) return false;
    const QString name = layer->name;
    m_store->removeContourLayer(layerId);
    reportStatus(tr("Contour layer removed: %1").arg(name));
    return true;
}

// --- Tracks ---

bool MapSession::importGpx(const QByteArray& content, const QString& name)
{
    if (m_importingTrack) return false;
    ImportingFlag importing(m_importingTrack);

    QVector<QVector<QPointF>> lines;
    try {
        lines = GpxReader::parseTrack(content);
    } catch (const MalformedTrackError& e) {
        reportStatus(tr("Route load failed: %1").arg(QString::fromUtf8(e.what())));
        return false;
    }

    addImportedTrack(name, lines);
    return true;
}

bool MapSession::importGpxFile(const QString& filePath)
{
    if (m_importingTrack) return false;
    ImportingFlag importing(m_importingTrack);

    QVector<QVector<QPointF>> lines;
    try {
        lines = GpxReader::readFile(filePath);
    } catch (const MalformedTrackError& e) {
        reportStatus(tr("Route load failed: %1").arg(QString::fromUtf8(e.what())));
        return false;
    }

    addImportedTrack(QFileInfo(filePath).fileName(), lines);
    return true;
}

void MapSession::addImportedTrack(const QString& name, const QVector<QVector<QPointF>>& lines)
{
    m_annotator->exitNoteMode();
    m_store->addTrackLayer(name, lines);
    reportStatus(tr("Route loaded: %1").arg(name));
}

bool MapSession::removeTrack(const QString& trackId)
{
    const TrackLayer* track = m_store->findTrack(trackId);
    if (!track) return false;
    const QString name = track->name;
    m_store->removeTrackLayer(trackId);
    reportStatus(tr("Track removed: %1").arg(name));
    return true;
}

// --- Decorations ---

void MapSession::setDecorationVisible(MapDecoration decoration, bool visible)
{
    m_store->setDecorationVisible(decoration, visible);
    const QString label = LayerStore::decorationLabel(decoration);
    reportStatus(visible ? tr("%1 shown").arg(label) : tr("%1 hidden").arg(label));
}

void MapSession::toggleDecoration(MapDecoration decoration)
{
    setDecorationVisible(decoration, !m_store->isDecorationVisible(decoration));
}

// --- Rendering ---

void MapSession::renderScene(QPainter& painter) const
{
    if (m_viewportSize.isEmpty()) return;

    const ViewportProjector proj = projector();
    const FontTextMeasurer fallback(m_store->resolvedNoteFontFamily());
    const NoteTextMeasurer& measurer = m_measurer ? *m_measurer : fallback;

    const QVector<DrawOp> frame = SceneRenderer::buildFrame(*m_store, proj, measurer);
    SceneRenderer::paint(painter, frame, m_viewTransform);
    SceneRenderer::paintDecorations(painter, m_viewportSize, *m_store);
}
