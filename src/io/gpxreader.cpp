#include "io/gpxreader.h"
#include "geo/geodeticprojector.h"

#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QXmlStreamReader>
#include <cmath>

namespace {

// Reads lat/lon attributes; false if either is missing or not a finite number
bool readCoordinate(const QXmlStreamAttributes& attrs, QPointF& projected)
{
    if (!attrs.hasAttribute(QLatin1String("lat")) || !attrs.hasAttribute(QLatin1String("lon"))) {
        return false;
    }

    bool latOk = false;
    bool lonOk = false;
    const double lat = attrs.value(QLatin1String("lat")).trimmed().toDouble(&latOk);
    const double lon = attrs.value(QLatin1String("lon")).trimmed().toDouble(&lonOk);
    if (!latOk || !lonOk || !std::isfinite(lat) || !std::isfinite(lon)) {
        return false;
    }

    projected = GeodeticProjector::project(lon, lat);
    return true;
}

} // namespace

QVector<QVector<QPointF>> GpxReader::parseTrack(const QByteArray& xmlContent)
{
    QVector<QVector<QPointF>> segments;
    QVector<QPointF> routePoints;
    QVector<QPointF> currentSegment;
    bool inSegment = false;
    int skippedPoints = 0;

    QXmlStreamReader xml(xmlContent);

    while (!xml.atEnd() && !xml.hasError()) {
        QXmlStreamReader::TokenType token = xml.readNext();

        if (token == QXmlStreamReader::StartElement) {
            if (xml.name() == QLatin1String("trkseg")) {
                inSegment = true;
                currentSegment.clear();
            } else if (xml.name() == QLatin1String("trkpt") && inSegment) {
                QPointF p;
                if (readCoordinate(xml.attributes(), p)) {
                    currentSegment.append(p);
                } else {
                    ++skippedPoints;
                }
            } else if (xml.name() == QLatin1String("rtept")) {
                QPointF p;
                if (readCoordinate(xml.attributes(), p)) {
                    routePoints.append(p);
                } else {
                    ++skippedPoints;
                }
            }
        } else if (token == QXmlStreamReader::EndElement) {
            if (xml.name() == QLatin1String("trkseg")) {
                if (currentSegment.size() >= 2) {
                    segments.append(currentSegment);
                }
                currentSegment.clear();
                inSegment = false;
            }
        }
    }

    if (xml.hasError()) {
        qWarning() << "[GpxReader] XML error at line" << xml.lineNumber() << ":" << xml.errorString();
        throw MalformedTrackError(QStringLiteral("Invalid GPX document: %1").arg(xml.errorString()));
    }

    if (skippedPoints > 0) {
        qDebug() << "[GpxReader] Skipped" << skippedPoints << "points without valid lat/lon";
    }

    if (segments.isEmpty() && routePoints.size() >= 2) {
        segments.append(routePoints);
    }

    if (segments.isEmpty()) {
        throw MalformedTrackError(QStringLiteral("No track or route with at least two points"));
    }

    qDebug() << "[GpxReader] Parsed" << segments.size() << "polylines";
    return segments;
}

QVector<QVector<QPointF>> GpxReader::readFile(const QString& filePath)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        throw MalformedTrackError(QStringLiteral("Cannot open %1: %2")
                                  .arg(QFileInfo(filePath).fileName(), file.errorString()));
    }
    return parseTrack(file.readAll());
}
