#include "layers/layerstore.h"
#include "core/mapconstants.h"
#include "geo/geometryutils.h"

#include <QDebug>
#include <QtMath>
#include <algorithm>

namespace {

const QColor kTrackPalette[] = {
    QColor(0xE7, 0x4B, 0x3C),
    QColor(0x1E, 0x7E, 0x55),
    QColor(0x0F, 0x6C, 0xBD),
    QColor(0xD2, 0x69, 0x1E),
    QColor(0x7B, 0x5E, 0xA7),
    QColor(0x2C, 0x3E, 0x50),
};
constexpr int kTrackPaletteSize = sizeof(kTrackPalette) / sizeof(kTrackPalette[0]);

QRectF trackBounds(const TrackLayer& track)
{
    return GeometryUtils::boundsOf(track.polylines);
}

// Smallest positive difference between neighbours of a sorted unique list; 0 if none
int minPositiveStep(const QVector<int>& sortedValues)
{
    int best = 0;
    for (int i = 1; i < sortedValues.size(); ++i) {
        const int diff = sortedValues[i] - sortedValues[i - 1];
        if (diff > 0 && (best == 0 || diff < best)) best = diff;
    }
    return best;
}

QVector<int> sortedUniqueElevations(const QVector<ContourLine>& lines, int majorFilter)
{
    QVector<int> values;
    for (const auto& line : lines) {
        if (majorFilter == 1 && !line.isMajor) continue;
        if (majorFilter == 0 && line.isMajor) continue;
        values.append(qAbs(line.elevation));
    }
    std::sort(values.begin(), values.end());
    values.erase(std::unique(values.begin(), values.end()), values.end());
    return values;
}

} // namespace

LayerStore::LayerStore(QObject* parent)
    : QObject(parent)
    , m_baseBounds(GeometryUtils::canonicalRect())
{
}

void LayerStore::setBaseDataset(const QRectF& bounds, bool hasContours)
{
    m_baseBounds = bounds;
    m_baseHasContours = hasContours;
    emit layersChanged();
}

int LayerStore::contourIndex(const QString& id) const
{
    for (int i = 0; i < m_contourLayers.size(); ++i) {
        if (m_contourLayers[i].id == id) return i;
    }
    return -1;
}

int LayerStore::trackIndex(const QString& id) const
{
    for (int i = 0; i < m_trackLayers.size(); ++i) {
        if (m_trackLayers[i].id == id) return i;
    }
    return -1;
}

bool LayerStore::replaceTrack(int index, const TrackLayer& updated)
{
    if (index < 0 || index >= m_trackLayers.size()) return false;
    m_trackLayers[index] = updated;
    emit layersChanged();
    return true;
}

QString LayerStore::selectedLayerId() const
{
    if (m_selection.kind == Selection::Kind::Contour || m_selection.kind == Selection::Kind::Track) {
        return m_selection.layerId;
    }
    return QString();
}

// --- Contour layers ---

bool LayerStore::addContourLayer(const ContourLayer& layer)
{
    if (layer.id.isEmpty() || hasContourSource(layer.sourceId) || contourIndex(layer.id) >= 0) {
        return false;
    }
    m_contourLayers.push_back(layer);
    emit layersChanged();
    select(Selection::contour(layer.id));
    return true;
}

bool LayerStore::removeContourLayer(const QString& id)
{
    int idx = contourIndex(id);
    if (idx < 0) return false;
    m_contourLayers.remove(idx);
    if (m_selection.isContour(id)) {
        select(Selection::none());
    }
    emit layersChanged();
    return true;
}

bool LayerStore::setContourVisible(const QString& id, bool visible)
{
    int idx = contourIndex(id);
    if (idx < 0) return false;
    ContourLayer updated = m_contourLayers[idx];
    updated.visible = visible;
    m_contourLayers[idx] = updated;
    emit layersChanged();
    return true;
}

bool LayerStore::hasContourSource(const QString& sourceId) const
{
    return findContourBySource(sourceId) != nullptr;
}

const ContourLayer* LayerStore::findContour(const QString& id) const
{
    int idx = contourIndex(id);
    return idx < 0 ? nullptr : &m_contourLayers[idx];
}

const ContourLayer* LayerStore::findContourBySource(const QString& sourceId) const
{
    for (const auto& layer : m_contourLayers) {
        if (layer.sourceId == sourceId) return &layer;
    }
    return nullptr;
}

// --- Track layers ---

QColor LayerStore::trackPaletteColor(int serial)
{
    const int idx = ((serial - 1) % kTrackPaletteSize + kTrackPaletteSize) % kTrackPaletteSize;
    return kTrackPalette[idx];
}

QString LayerStore::addTrackLayer(const QString& name, const QVector<QVector<QPointF>>& polylines)
{
    ++m_trackSerial;
    TrackLayer layer;
    layer.id = QStringLiteral("track_%1").arg(m_trackSerial);
    layer.name = name;
    layer.polylines = polylines;
    layer.color = trackPaletteColor(m_trackSerial);
    m_trackLayers.push_back(layer);
    emit layersChanged();
    select(Selection::track(layer.id));
    return layer.id;
}

bool LayerStore::removeTrackLayer(const QString& id)
{
    int idx = trackIndex(id);
    if (idx < 0) return false;
    m_trackLayers.remove(idx);
    if (m_selection.isTrack(id)) {
        select(Selection::none());
    }
    emit trackRemoved(id);
    emit layersChanged();
    return true;
}

bool LayerStore::setTrackVisible(const QString& id, bool visible)
{
    int idx = trackIndex(id);
    if (idx < 0) return false;
    TrackLayer updated = m_trackLayers[idx];
    updated.visible = visible;
    replaceTrack(idx, updated);
    emit trackVisibilityChanged(id, visible);
    return true;
}

const TrackLayer* LayerStore::findTrack(const QString& id) const
{
    int idx = trackIndex(id);
    return idx < 0 ? nullptr : &m_trackLayers[idx];
}

// --- Style ---

bool LayerStore::setLayerColor(const QString& id, const QColor& color)
{
    if (!color.isValid()) return false;
    int idx = contourIndex(id);
    if (idx >= 0) {
        ContourLayer updated = m_contourLayers[idx];
        updated.color = color;
        m_contourLayers[idx] = updated;
        emit layersChanged();
        return true;
    }
    idx = trackIndex(id);
    if (idx < 0) return false;
    TrackLayer updated = m_trackLayers[idx];
    updated.color = color;
    return replaceTrack(idx, updated);
}

bool LayerStore::setLayerStrokeWidth(const QString& id, double width)
{
    if (!(width > 0.0)) return false;
    int idx = contourIndex(id);
    if (idx >= 0) {
        ContourLayer updated = m_contourLayers[idx];
        updated.strokeWidth = width;
        m_contourLayers[idx] = updated;
        emit layersChanged();
        return true;
    }
    idx = trackIndex(id);
    if (idx < 0) return false;
    TrackLayer updated = m_trackLayers[idx];
    updated.strokeWidth = width;
    return replaceTrack(idx, updated);
}

bool LayerStore::setLayerOpacity(const QString& id, double opacity)
{
    opacity = qBound(0.0, opacity, 1.0);
    int idx = contourIndex(id);
    if (idx >= 0) {
        ContourLayer updated = m_contourLayers[idx];
        updated.opacity = opacity;
        m_contourLayers[idx] = updated;
        emit layersChanged();
        return true;
    }
    idx = trackIndex(id);
    if (idx < 0) return false;
    TrackLayer updated = m_trackLayers[idx];
    updated.opacity = opacity;
    return replaceTrack(idx, updated);
}

bool LayerStore::setSelectedColor(const QColor& color)
{
    return setLayerColor(selectedLayerId(), color);
}

bool LayerStore::setSelectedStrokeWidth(double width)
{
    return setLayerStrokeWidth(selectedLayerId(), width);
}

bool LayerStore::setSelectedOpacity(double opacity)
{
    return setLayerOpacity(selectedLayerId(), opacity);
}

// --- Track notes ---

QString LayerStore::addNote(const QString& trackId, const QPointF& anchor, const QString& text,
                            const QPointF& labelOffset)
{
    int idx = trackIndex(trackId);
    if (idx < 0) return QString();

    TrackNote note;
    note.id = QStringLiteral("note_%1").arg(++m_noteSerial);
    note.anchorPoint = anchor;
    note.text = text;
    note.labelOffset = labelOffset;

    TrackLayer updated = m_trackLayers[idx];
    updated.notes.append(note);
    replaceTrack(idx, updated);
    return note.id;
}

bool LayerStore::updateNoteText(const QString& trackId, const QString& noteId, const QString& text)
{
    int idx = trackIndex(trackId);
    if (idx < 0) return false;
    TrackLayer updated = m_trackLayers[idx];
    for (auto& note : updated.notes) {
        if (note.id == noteId) {
            note.text = text;
            return replaceTrack(idx, updated);
        }
    }
    return false;
}

bool LayerStore::updateNoteOffset(const QString& trackId, const QString& noteId, const QPointF& labelOffset)
{
    int idx = trackIndex(trackId);
    if (idx < 0) return false;
    TrackLayer updated = m_trackLayers[idx];
    for (auto& note : updated.notes) {
        if (note.id == noteId) {
            note.labelOffset = labelOffset;
            return replaceTrack(idx, updated);
        }
    }
    return false;
}

bool LayerStore::removeNote(const QString& trackId, const QString& noteId)
{
    int idx = trackIndex(trackId);
    if (idx < 0) return false;
    TrackLayer updated = m_trackLayers[idx];
    for (int i = 0; i < updated.notes.size(); ++i) {
        if (updated.notes[i].id == noteId) {
            updated.notes.remove(i);
            replaceTrack(idx, updated);
            emit noteRemoved(trackId, noteId);
            return true;
        }
    }
    return false;
}

bool LayerStore::setNoteVisible(const QString& trackId, const QString& noteId, bool visible)
{
    int idx = trackIndex(trackId);
    if (idx < 0) return false;
    TrackLayer updated = m_trackLayers[idx];
    for (auto& note : updated.notes) {
        if (note.id == noteId) {
            note.visible = visible;
            replaceTrack(idx, updated);
            emit noteVisibilityChanged(trackId, noteId, visible);
            return true;
        }
    }
    return false;
}

const TrackNote* LayerStore::findNote(const QString& trackId, const QString& noteId) const
{
    const TrackLayer* track = findTrack(trackId);
    return track ? track->findNote(noteId) : nullptr;
}

// --- Decorations ---

bool LayerStore::isDecorationVisible(MapDecoration decoration) const
{
    switch (decoration) {
        case MapDecoration::Title: return m_showTitle;
        case MapDecoration::NorthArrow: return m_showNorthArrow;
        case MapDecoration::Legend: return m_showLegend;
    }
    return false;
}

void LayerStore::setDecorationVisible(MapDecoration decoration, bool visible)
{
    switch (decoration) {
        case MapDecoration::Title: m_showTitle = visible; break;
        case MapDecoration::NorthArrow: m_showNorthArrow = visible; break;
        case MapDecoration::Legend: m_showLegend = visible; break;
    }
    if (!visible && m_selection.isDecoration(decoration)) {
        select(Selection::none());
    }
    emit decorationsChanged();
}

void LayerStore::setTitleStyle(const TitleStyle& style)
{
    m_titleStyle = style;
    m_titleStyle.fontSize = qBound(MapConstants::kMinTitleFontSize, style.fontSize,
                                   MapConstants::kMaxTitleFontSize);
    if (!m_titleStyle.color.isValid()) {
        m_titleStyle.color = TitleStyle().color;
    }
    emit decorationsChanged();
}

QStringList LayerStore::noteFontFamilies()
{
    return {
        QStringLiteral("Noto Sans KR"),
        QStringLiteral("Gothic A1"),
        QStringLiteral("Nanum Pen Script"),
        QStringLiteral("Nanum Myeongjo"),
    };
}

QString LayerStore::resolvedNoteFontFamily() const
{
    if (noteFontFamilies().contains(m_titleStyle.fontFamily)) {
        return m_titleStyle.fontFamily;
    }
    return noteFontFamilies().first();
}

QString LayerStore::decorationLabel(MapDecoration decoration)
{
    switch (decoration) {
        case MapDecoration::Title: return tr("Title");
        case MapDecoration::NorthArrow: return tr("North Arrow");
        case MapDecoration::Legend: return tr("Legend");
    }
    return QString();
}

// --- Selection ---

void LayerStore::select(const Selection& selection)
{
    if (m_selection == selection) return;
    m_selection = selection;
    emit selectionChanged(m_selection);
}

const TrackLayer* LayerStore::selectedTrack() const
{
    if (m_selection.kind != Selection::Kind::Track) return nullptr;
    return findTrack(m_selection.layerId);
}

const ContourLayer* LayerStore::selectedContour() const
{
    if (m_selection.kind != Selection::Kind::Contour) return nullptr;
    return findContour(m_selection.layerId);
}

// --- Bounds ---

QRectF LayerStore::combinedBounds(bool includeHidden) const
{
    BoundsAccumulator acc;
    if (m_baseHasContours) {
        acc.addRect(m_baseBounds);
    }
    for (const auto& layer : m_contourLayers) {
        if (!layer.visible && !includeHidden) continue;
        acc.addRect(layer.bounds);
    }
    for (const auto& track : m_trackLayers) {
        if (!track.visible && !includeHidden) continue;
        acc.addRect(GeometryUtils::inflate(trackBounds(track), MapConstants::kTrackBoundsMargin));
    }
    return acc.rect();
}

bool LayerStore::selectedVisibleBounds(QRectF& bounds) const
{
    const ContourLayer* contour = selectedContour();
    if (contour && contour->visible) {
        bounds = contour->bounds;
        return true;
    }
    const TrackLayer* track = selectedTrack();
    if (track && track->visible) {
        bounds = GeometryUtils::inflate(trackBounds(*track), MapConstants::kTrackBoundsMargin);
        return true;
    }
    return false;
}

bool LayerStore::visibleLayersBounds(QRectF& bounds) const
{
    BoundsAccumulator acc;
    for (const auto& layer : m_contourLayers) {
        if (layer.visible) acc.addRect(layer.bounds);
    }
    for (const auto& track : m_trackLayers) {
        if (track.visible) {
            acc.addRect(GeometryUtils::inflate(trackBounds(track), MapConstants::kTrackBoundsMargin));
        }
    }
    if (acc.isEmpty()) return false;
    bounds = acc.rect();
    return true;
}

bool LayerStore::tracksBounds(QRectF& bounds) const
{
    if (m_trackLayers.isEmpty()) return false;
    BoundsAccumulator acc;
    for (const auto& track : m_trackLayers) {
        acc.addRect(trackBounds(track));
    }
    bounds = acc.rect();
    return true;
}

LegendIntervals LayerStore::legendIntervals() const
{
    const ContourLayer* layer = selectedContour();
    if (!layer || !layer->visible) {
        layer = nullptr;
        for (const auto& candidate : m_contourLayers) {
            if (candidate.visible) {
                layer = &candidate;
                break;
            }
        }
    }

    LegendIntervals intervals;
    if (!layer || layer->lines.isEmpty()) return intervals;

    const int majorStep = minPositiveStep(sortedUniqueElevations(layer->lines, 1));
    const int minorStep = minPositiveStep(sortedUniqueElevations(layer->lines, 0));
    const int allStep = minPositiveStep(sortedUniqueElevations(layer->lines, -1));

    intervals.major = majorStep > 0 ? majorStep : 100;
    if (minorStep > 0) {
        intervals.minor = minorStep;
    } else if (allStep > 0 && allStep < intervals.major) {
        intervals.minor = allStep;
    } else {
        intervals.minor = intervals.major >= 100 ? 20 : 10;
    }
    return intervals;
}

QColor LayerStore::legendTrackColor() const
{
    if (const TrackLayer* track = selectedTrack()) return track->color;
    for (const auto& track : m_trackLayers) {
        if (track.visible) return track.color;
    }
    return trackPaletteColor(1);
}
