#ifndef LAYERSTORE_H
#define LAYERSTORE_H

#include <QObject>
#include <QColor>
#include <QRectF>
#include <QString>
#include <QStringList>
#include <QVector>

#include "layers/maplayers.h"

/**
 * @brief LayerStore - Single owner of contour layers, track layers, notes and decorations
 *
 * Mutations replace whole records (copy the current record, modify, assign
 * back) so a reader holding a copy never observes a partially updated layer.
 * Mutators return false when the target does not exist.
 */
class LayerStore : public QObject {
    Q_OBJECT
public:
    explicit LayerStore(QObject* parent = nullptr);

    // Base dataset shown under the layers; only contributes bounds when it has contours
    void setBaseDataset(const QRectF& bounds, bool hasContours);
    bool hasBaseContours() const { return m_baseHasContours; }

    // Contour layers
    bool addContourLayer(const ContourLayer& layer);
    bool removeContourLayer(const QString& id);
    bool setContourVisible(const QString& id, bool visible);
    bool hasContourSource(const QString& sourceId) const;
    const ContourLayer* findContour(const QString& id) const;
    const ContourLayer* findContourBySource(const QString& sourceId) const;
    const QVector<ContourLayer>& contourLayers() const { return m_contourLayers; }

    // Track layers
    QString addTrackLayer(const QString& name, const QVector<QVector<QPointF>>& polylines);
    bool removeTrackLayer(const QString& id);
    bool setTrackVisible(const QString& id, bool visible);
    const TrackLayer* findTrack(const QString& id) const;
    const QVector<TrackLayer>& trackLayers() const { return m_trackLayers; }
    static QColor trackPaletteColor(int serial);

    // Style, by id or on the current selection
    bool setLayerColor(const QString& id, const QColor& color);
    bool setLayerStrokeWidth(const QString& id, double width);
    bool setLayerOpacity(const QString& id, double opacity);
    bool setSelectedColor(const QColor& color);
    bool setSelectedStrokeWidth(double width);
    bool setSelectedOpacity(double opacity);

    // Track notes
    QString addNote(const QString& trackId, const QPointF& anchor, const QString& text,
                    const QPointF& labelOffset);
    bool updateNoteText(const QString& trackId, const QString& noteId, const QString& text);
    bool updateNoteOffset(const QString& trackId, const QString& noteId, const QPointF& labelOffset);
    bool removeNote(const QString& trackId, const QString& noteId);
    bool setNoteVisible(const QString& trackId, const QString& noteId, bool visible);
    const TrackNote* findNote(const QString& trackId, const QString& noteId) const;

    // Decorations
    bool isDecorationVisible(MapDecoration decoration) const;
    void setDecorationVisible(MapDecoration decoration, bool visible);
    const TitleStyle& titleStyle() const { return m_titleStyle; }
    void setTitleStyle(const TitleStyle& style);
    static QStringList noteFontFamilies();
    QString resolvedNoteFontFamily() const;
    static QString decorationLabel(MapDecoration decoration);

    // Selection
    const Selection& selection() const { return m_selection; }
    void select(const Selection& selection);
    const TrackLayer* selectedTrack() const;
    const ContourLayer* selectedContour() const;

    // Bounds (world units, top = minY)
    QRectF combinedBounds(bool includeHidden = false) const;
    bool selectedVisibleBounds(QRectF& bounds) const;
    bool visibleLayersBounds(QRectF& bounds) const;
    bool tracksBounds(QRectF& bounds) const;

    LegendIntervals legendIntervals() const;
    QColor legendTrackColor() const;

signals:
    void layersChanged();
    void selectionChanged(const Selection& selection);
    void trackRemoved(const QString& trackId);
    void trackVisibilityChanged(const QString& trackId, bool visible);
    void noteRemoved(const QString& trackId, const QString& noteId);
    void noteVisibilityChanged(const QString& trackId, const QString& noteId, bool visible);
    void decorationsChanged();

private:
    int contourIndex(const QString& id) const;
    int trackIndex(const QString& id) const;
    bool replaceTrack(int index, const TrackLayer& updated);
    QString selectedLayerId() const;

    QVector<ContourLayer> m_contourLayers;
    QVector<TrackLayer> m_trackLayers;
    QRectF m_baseBounds;
    bool m_baseHasContours{false};

    Selection m_selection;
    TitleStyle m_titleStyle;
    bool m_showTitle{false};
    bool m_showNorthArrow{false};
    bool m_showLegend{false};

    int m_trackSerial{0};
    int m_noteSerial{0};
};

#endif // LAYERSTORE_H
