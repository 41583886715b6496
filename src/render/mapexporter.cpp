#include "render/mapexporter.h"
#include "core/mapconstants.h"
#include "layers/layerstore.h"
#include "session/mapsession.h"

#include <QDebug>
#include <QDir>
#include <QImageWriter>
#include <QPainter>
#include <QSaveFile>
#include <QtMath>

namespace {

// Shows every decoration for its lifetime, then restores the previous flags and selection
class DecorationOverride
{
public:
    explicit DecorationOverride(LayerStore* store)
        : m_store(store)
        , m_title(store->isDecorationVisible(MapDecoration::Title))
        , m_northArrow(store->isDecorationVisible(MapDecoration::NorthArrow))
        , m_legend(store->isDecorationVisible(MapDecoration::Legend))
        , m_selection(store->selection())
    {
        m_store->setDecorationVisible(MapDecoration::Title, true);
        m_store->setDecorationVisible(MapDecoration::NorthArrow, true);
        m_store->setDecorationVisible(MapDecoration::Legend, true);
    }

    ~DecorationOverride()
    {
        m_store->setDecorationVisible(MapDecoration::Title, m_title);
        m_store->setDecorationVisible(MapDecoration::NorthArrow, m_northArrow);
        m_store->setDecorationVisible(MapDecoration::Legend, m_legend);
        m_store->select(m_selection);
    }

    DecorationOverride(const DecorationOverride&) = delete;
    DecorationOverride& operator=(const DecorationOverride&) = delete;

private:
    LayerStore* m_store;
    bool m_title;
    bool m_northArrow;
    bool m_legend;
    Selection m_selection;
};

// Resets the in-progress flag on every return path
class ExportingFlag
{
public:
    explicit ExportingFlag(bool& flag) : m_flag(flag) { m_flag = true; }
    ~ExportingFlag() { m_flag = false; }

private:
    bool& m_flag;
};

} // namespace

double MapExporter::exportPixelRatio(double devicePixelRatio)
{
    return qBound(MapConstants::kMinExportPixelRatio, devicePixelRatio * 2.0, MapConstants::kMaxExportPixelRatio);
}

QString MapExporter::exportFileName(const QDateTime& timestamp)
{
    return QStringLiteral("contour_%1.png").arg(timestamp.toString(QStringLiteral("yyyyMMdd_HHmmss")));
}

QImage MapExporter::renderImage(MapSession& session, double pixelRatio) const
{
    const QSizeF viewport = session.viewportSize();
    const QSize pixelSize(qCeil(viewport.width() * pixelRatio), qCeil(viewport.height() * pixelRatio));

    QImage image(pixelSize, QImage::Format_ARGB32_Premultiplied);
    image.setDevicePixelRatio(pixelRatio);
    image.fill(Qt::white);

    QPainter painter(&image);
    session.renderScene(painter);
    painter.end();
    return image;
}

ExportResult MapExporter::exportImage(MapSession& session, double devicePixelRatio,
                                      const QString& directory, const QDateTime& timestamp)
{
    ExportResult result;
    if (m_exporting) {
        result.errorMessage = QStringLiteral("An export is already in progress");
        return result;
    }
    if (session.viewportSize().isEmpty()) {
        result.errorMessage = QStringLiteral("Map view is not ready for export");
        return result;
    }

    ExportingFlag busy(m_exporting);
    DecorationOverride decorations(session.store());

    const double ratio = exportPixelRatio(devicePixelRatio);
    const QImage image = renderImage(session, ratio);
    if (image.isNull()) {
        result.errorMessage = QStringLiteral("Could not allocate the export image");
        return result;
    }

    QDir dir(directory);
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        result.errorMessage = QStringLiteral("Cannot create directory %1").arg(directory);
        return result;
    }

    const QString filePath = dir.filePath(exportFileName(timestamp));
    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        result.errorMessage = QStringLiteral("Cannot write %1: %2").arg(filePath, file.errorString());
        return result;
    }

    QImageWriter writer(&file, "png");
    if (!writer.write(image)) {
        file.cancelWriting();
        result.errorMessage = QStringLiteral("PNG encoding failed: %1").arg(writer.errorString());
        return result;
    }
    if (!file.commit()) {
        result.errorMessage = QStringLiteral("Cannot save %1: %2").arg(filePath, file.errorString());
        return result;
    }

    qInfo() << "[Export] Wrote" << filePath << "at pixel ratio" << ratio;
    result.success = true;
    result.filePath = filePath;
    return result;
}
