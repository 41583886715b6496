#ifndef MAPSESSION_H
#define MAPSESSION_H

#include <QObject>
#include <QByteArray>
#include <QRectF>
#include <QSizeF>
#include <QString>
#include <QTransform>
#include <QVector>

#include "io/contoursourcecache.h"
#include "layers/maplayers.h"
#include "view/viewportprojector.h"

class LayerStore;
class NotePrompter;
class NoteTextMeasurer;
class QPainter;
class TrackAnnotator;

/**
 * @brief MapSession - Ties the layer store, contour cache, annotator and view state together
 *
 * Owns the store and the annotator. Every user-facing outcome is reported
 * through statusMessage; ingestion errors never escape as exceptions.
 */
class MapSession : public QObject {
    Q_OBJECT
public:
    MapSession(ContourSourceCache* cache, NotePrompter* prompter, QObject* parent = nullptr);
    ~MapSession() override;

    LayerStore* store() const { return m_store; }
    TrackAnnotator* annotator() const { return m_annotator; }
    ContourSourceCache* cache() const { return m_cache; }

    // Viewport
    void setViewportSize(const QSizeF& size);
    QSizeF viewportSize() const { return m_viewportSize; }
    const QTransform& viewTransform() const { return m_viewTransform; }
    void setViewTransform(const QTransform& transform);
    QRectF worldBounds() const;
    ViewportProjector projector() const;
    bool zoomAt(const QPointF& viewportAnchor, double factor);
    bool panBy(const QPointF& viewportDelta);
    bool resetView();

    // Contour sources
    QVector<ContourSource> refreshContourSources();
    const QVector<ContourSource>& contourSources() const { return m_contourSources; }
    bool addContourLayer(const ContourSource& source);
    bool isLoadingContour() const { return m_loadingContour; }

    // Tracks
    bool importGpx(const QByteArray& content, const QString& name);
    bool importGpxFile(const QString& filePath);
    bool removeTrack(const QString& trackId);
    bool removeContourLayer(const QString& layerId);

    // Decorations
    void setDecorationVisible(MapDecoration decoration, bool visible);
    void toggleDecoration(MapDecoration decoration);

    // Note text measurement; the font-based measurer is used when unset
    void setTextMeasurer(const NoteTextMeasurer* measurer);

    // Paints layers in the view transform and decorations in viewport pixels
    void renderScene(QPainter& painter) const;

    QString lastStatus() const { return m_lastStatus; }

signals:
    void statusMessage(const QString& message);
    void sceneChanged();
    void viewChanged();

private slots:
    void reportStatus(const QString& message);

private:
    void addImportedTrack(const QString& name, const QVector<QVector<QPointF>>& lines);

    ContourSourceCache* m_cache{nullptr};
    LayerStore* m_store{nullptr};
    TrackAnnotator* m_annotator{nullptr};
    const NoteTextMeasurer* m_measurer{nullptr};

    QVector<ContourSource> m_contourSources;
    QSizeF m_viewportSize;
    QTransform m_viewTransform;
    bool m_loadingContour{false};
    bool m_importingTrack{false};
    QString m_lastStatus;
};

#endif // MAPSESSION_H
