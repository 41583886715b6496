#ifndef APPSETTINGS_H
#define APPSETTINGS_H

#include <QColor>
#include <QString>
#include <QStringList>

class AppSettings {
public:
    // Contour data
    static QString assetRoot();             // Directory holding assets/data/...
    static void setAssetRoot(const QString& path);
    static QString manifestPath();          // Relative to assetRoot()
    static void setManifestPath(const QString& path);

    // File dialogs
    static QString lastGpxDirectory();
    static void setLastGpxDirectory(const QString& path);
    static QString exportDirectory();
    static void setExportDirectory(const QString& path);

    // Recent GPX imports (most recent first)
    static QStringList recentTracks();
    static void addRecentTrack(const QString& path, int maxCount = 10);
    static void clearRecentTracks();

    // Map title / note font
    static QString titleFontFamily();
    static void setTitleFontFamily(const QString& family);
    static QString mapTitle();
    static void setMapTitle(const QString& title);
    static QColor titleColor();
    static void setTitleColor(const QColor& color);
    static int titleFontSize();
    static void setTitleFontSize(int size);
};

#endif // APPSETTINGS_H
