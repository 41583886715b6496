#include "io/contoursourcecache.h"
#include "geo/geometryutils.h"

#include <QDebug>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QMutexLocker>
#include <cmath>

namespace {

QVector<QPointF> parseLine(const QJsonArray& rawLine)
{
    QVector<QPointF> points;
    points.reserve(rawLine.size());
    for (const auto& value : rawLine) {
        QJsonArray pair = value.toArray();
        if (pair.size() < 2 || !pair[0].isDouble() || !pair[1].isDouble()) continue;
        QPointF p(pair[0].toDouble(), pair[1].toDouble());
        if (GeometryUtils::isFinite(p)) points.append(p);
    }
    return points;
}

bool readDeclaredBounds(const QJsonObject& root, QRectF& bounds)
{
    QJsonArray raw = root["bounds"].toArray();
    if (raw.size() < 4) return false;
    for (int i = 0; i < 4; ++i) {
        if (!raw[i].isDouble()) return false;
    }
    const double minX = raw[0].toDouble();
    const double minY = raw[1].toDouble();
    const double maxX = raw[2].toDouble();
    const double maxY = raw[3].toDouble();
    if (!std::isfinite(minX) || !std::isfinite(minY) || !std::isfinite(maxX) || !std::isfinite(maxY)) {
        return false;
    }
    if (maxX < minX || maxY < minY) return false;
    bounds = QRectF(QPointF(minX, minY), QPointF(maxX, maxY));
    return true;
}

} // namespace

ContourSourceCache::ContourSourceCache(const QString& assetRoot, const QString& manifestPath)
    : m_assetRoot(assetRoot)
    , m_manifestPath(manifestPath)
{
}

QString ContourSourceCache::defaultManifestPath()
{
    return QStringLiteral("assets/data/contour_sources_manifest.json");
}

QVector<ContourSource> ContourSourceCache::listSources()
{
    QMutexLocker locker(&m_mutex);
    if (m_manifestLoaded) return m_sources;

    QFile file(m_assetRoot.filePath(m_manifestPath));
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "[ContourCache] Cannot open manifest" << file.fileName() << ":" << file.errorString();
        return {};
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (doc.isNull() || !doc.isArray()) {
        qWarning() << "[ContourCache] Invalid manifest" << file.fileName() << ":" << parseError.errorString();
        return {};
    }

    QVector<ContourSource> sources;
    for (const auto& value : doc.array()) {
        QJsonObject obj = value.toObject();
        ContourSource source;
        source.id = obj["id"].toString();
        source.name = obj["name"].toString();
        source.assetPath = obj["asset"].toString();
        if (source.id.isEmpty() || source.assetPath.isEmpty()) continue;
        sources.append(source);
    }

    m_sources = sources;
    m_manifestLoaded = true;
    qDebug() << "[ContourCache] Manifest lists" << sources.size() << "contour sources";
    return m_sources;
}

bool ContourSourceCache::findSource(const QString& sourceId, ContourSource& source)
{
    for (const auto& candidate : listSources()) {
        if (candidate.id == sourceId) {
            source = candidate;
            return true;
        }
    }
    return false;
}

bool ContourSourceCache::ensureDataset(const ContourSource& source, QString& errorMessage)
{
    if (m_datasets.contains(source.id)) return true;

    QFile file(m_assetRoot.filePath(source.assetPath));
    if (!file.open(QIODevice::ReadOnly)) {
        errorMessage = QStringLiteral("Cannot open %1: %2").arg(source.assetPath, file.errorString());
        return false;
    }
    ++m_readCount;

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (doc.isNull() || !doc.isObject()) {
        errorMessage = QStringLiteral("Invalid contour data in %1: %2")
                           .arg(source.assetPath, parseError.errorString());
        return false;
    }

    QJsonObject root = doc.object();
    if (!root["contours"].isArray()) {
        errorMessage = QStringLiteral("Missing contours array in %1").arg(source.assetPath);
        return false;
    }

    Dataset dataset;
    BoundsAccumulator pointBounds;
    for (const auto& value : root["contours"].toArray()) {
        QJsonObject item = value.toObject();
        ContourLine line;
        line.elevation = static_cast<int>(item["elev"].toDouble());
        line.isMajor = item["major"].toBool(false);
        line.points = parseLine(item["line"].toArray());
        if (line.points.isEmpty()) continue;

        pointBounds.addPoints(line.points);
        dataset.lineBounds.append(GeometryUtils::boundsOf(line.points));
        dataset.lines.append(line);
    }

    if (!readDeclaredBounds(root, dataset.bounds)) {
        qDebug() << "[ContourCache] Bounds missing or invalid in" << source.assetPath << "- recomputed from lines";
        dataset.bounds = pointBounds.rect();
    }

    m_datasets.insert(source.id, dataset);
    qDebug() << "[ContourCache] Loaded" << source.id << "with" << dataset.lines.size() << "lines";
    return true;
}

ContourLoadResult ContourSourceCache::clipDataset(const Dataset& dataset, const QRectF& clipBounds)
{
    ContourLoadResult result;
    result.success = true;

    BoundsAccumulator kept;
    for (int i = 0; i < dataset.lines.size(); ++i) {
        const QRectF& lineBounds = dataset.lineBounds[i];
        if (!GeometryUtils::overlaps(clipBounds, lineBounds)) continue;
        result.lines.append(dataset.lines[i]);
        kept.addRect(lineBounds);
    }

    // Canonical empty result when nothing overlaps
    result.bounds = kept.rect();
    return result;
}

ContourLoadResult ContourSourceCache::loadSource(const ContourSource& source)
{
    QMutexLocker locker(&m_mutex);
    ContourLoadResult result;
    if (!ensureDataset(source, result.errorMessage)) {
        qWarning() << "[ContourCache]" << result.errorMessage;
        return result;
    }
    const Dataset& dataset = m_datasets[source.id];
    result.success = true;
    result.bounds = dataset.bounds;
    result.lines = dataset.lines;
    return result;
}

ContourLoadResult ContourSourceCache::loadSource(const ContourSource& source, const QRectF& clipBounds)
{
    QMutexLocker locker(&m_mutex);
    ContourLoadResult result;
    if (!ensureDataset(source, result.errorMessage)) {
        qWarning() << "[ContourCache]" << result.errorMessage;
        return result;
    }
    return clipDataset(m_datasets[source.id], clipBounds);
}

ContourLoadResult ContourSourceCache::loadSourceById(const QString& sourceId)
{
    ContourSource source;
    if (!findSource(sourceId, source)) {
        ContourLoadResult result;
        result.errorMessage = QStringLiteral("Unknown contour source: %1").arg(sourceId);
        return result;
    }
    return loadSource(source);
}

ContourLoadResult ContourSourceCache::loadSourceById(const QString& sourceId, const QRectF& clipBounds)
{
    ContourSource source;
    if (!findSource(sourceId, source)) {
        ContourLoadResult result;
        result.errorMessage = QStringLiteral("Unknown contour source: %1").arg(sourceId);
        return result;
    }
    return loadSource(source, clipBounds);
}

bool ContourSourceCache::isCached(const QString& sourceId) const
{
    QMutexLocker locker(&m_mutex);
    return m_datasets.contains(sourceId);
}

int ContourSourceCache::datasetReadCount() const
{
    QMutexLocker locker(&m_mutex);
    return m_readCount;
}

void ContourSourceCache::clear()
{
    QMutexLocker locker(&m_mutex);
    m_datasets.clear();
    m_sources.clear();
    m_manifestLoaded = false;
    m_readCount = 0;
}
