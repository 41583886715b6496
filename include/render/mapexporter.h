#ifndef MAPEXPORTER_H
#define MAPEXPORTER_H

#include <QDateTime>
#include <QImage>
#include <QString>

class MapSession;

struct ExportResult {
    bool success{false};
    QString filePath;
    QString errorMessage;
};

/**
 * @brief MapExporter - Writes the current map view as a PNG
 *
 * All decorations are shown for the capture and restored afterwards,
 * whether or not the write succeeds.
 */
class MapExporter
{
public:
    ExportResult exportImage(MapSession& session, double devicePixelRatio,
                             const QString& directory, const QDateTime& timestamp);

    QImage renderImage(MapSession& session, double pixelRatio) const;

    bool isExporting() const { return m_exporting; }

    static double exportPixelRatio(double devicePixelRatio);
    static QString exportFileName(const QDateTime& timestamp);

private:
    bool m_exporting{false};
};

#endif // MAPEXPORTER_H
