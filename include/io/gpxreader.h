#ifndef GPXREADER_H
#define GPXREADER_H

#include <QByteArray>
#include <QPointF>
#include <QString>
#include <QVector>
#include <stdexcept>

/**
 * @brief MalformedTrackError - GPX input held no usable coordinate sequence
 */
class MalformedTrackError : public std::runtime_error
{
public:
    explicit MalformedTrackError(const QString& message)
        : std::runtime_error(message.toStdString()) {}
};

/**
 * @brief GpxReader - Extracts projected polylines from GPX documents
 *
 * Track segments (trkseg/trkpt) are preferred; when none holds two valid
 * points the route points (rtept) form a single fallback line. Element names
 * are matched by local name so GPX 1.0, 1.1 and un-namespaced files all work.
 * Every point is run through GeodeticProjector.
 */
class GpxReader
{
public:
    static QVector<QVector<QPointF>> parseTrack(const QByteArray& xmlContent);
    static QVector<QVector<QPointF>> readFile(const QString& filePath);
};

#endif // GPXREADER_H
