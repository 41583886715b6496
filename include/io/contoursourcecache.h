#ifndef CONTOURSOURCECACHE_H
#define CONTOURSOURCECACHE_H

#include <QDir>
#include <QHash>
#include <QMutex>
#include <QRectF>
#include <QString>
#include <QVector>

#include "layers/maplayers.h"

struct ContourSource {
    QString id;
    QString name;
    QString assetPath;      // Relative to the cache's asset root
};

struct ContourLoadResult {
    bool success{false};
    QString errorMessage;
    QRectF bounds;
    QVector<ContourLine> lines;
};

/**
 * @brief ContourSourceCache - Discovers contour datasets and memoizes their geometry
 *
 * The manifest is a JSON array of {id, name, asset} records. Each dataset is
 * parsed at most once per id; clipped loads filter the memoized lines.
 * All public calls are serialized, so concurrent loads of the same id read
 * the file once.
 */
class ContourSourceCache
{
public:
    explicit ContourSourceCache(const QString& assetRoot,
                                const QString& manifestPath = defaultManifestPath());

    static QString defaultManifestPath();

    // Empty on any read or parse error
    QVector<ContourSource> listSources();

    ContourLoadResult loadSource(const ContourSource& source);
    ContourLoadResult loadSource(const ContourSource& source, const QRectF& clipBounds);
    ContourLoadResult loadSourceById(const QString& sourceId);
    ContourLoadResult loadSourceById(const QString& sourceId, const QRectF& clipBounds);

    bool isCached(const QString& sourceId) const;
    int datasetReadCount() const;
    void clear();

    QString assetRoot() const { return m_assetRoot.absolutePath(); }

private:
    struct Dataset {
        QRectF bounds;
        QVector<ContourLine> lines;
        QVector<QRectF> lineBounds;
    };

    bool ensureDataset(const ContourSource& source, QString& errorMessage);
    bool findSource(const QString& sourceId, ContourSource& source);
    static ContourLoadResult clipDataset(const Dataset& dataset, const QRectF& clipBounds);

    QDir m_assetRoot;
    QString m_manifestPath;

    mutable QMutex m_mutex;
    bool m_manifestLoaded{false};
    QVector<ContourSource> m_sources;
    QHash<QString, Dataset> m_datasets;
    int m_readCount{0};
};

#endif // CONTOURSOURCECACHE_H
