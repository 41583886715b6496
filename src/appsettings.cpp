#include "appsettings.h"
#include "io/contoursourcecache.h"

#include <QCoreApplication>
#include <QDir>
#include <QSettings>
#include <QStandardPaths>

namespace {
QString recentKey() { return QStringLiteral("files/recentTracks"); }
}

QString AppSettings::assetRoot()
{
    QSettings s; // uses QCoreApplication org/app name
    return s.value("data/assetRoot", QCoreApplication::applicationDirPath()).toString();
}

void AppSettings::setAssetRoot(const QString& path)
{
    QSettings s;
    s.setValue("data/assetRoot", path);
}

QString AppSettings::manifestPath()
{
    QSettings s;
    return s.value("data/manifestPath", ContourSourceCache::defaultManifestPath()).toString();
}

void AppSettings::setManifestPath(const QString& path)
{
    QSettings s;
    s.setValue("data/manifestPath", path);
}

QString AppSettings::lastGpxDirectory()
{
    QSettings s;
    return s.value("files/lastGpxDirectory", QDir::homePath()).toString();
}

void AppSettings::setLastGpxDirectory(const QString& path)
{
    QSettings s;
    s.setValue("files/lastGpxDirectory", path);
}

QString AppSettings::exportDirectory()
{
    QSettings s;
    QString fallback = QStandardPaths::writableLocation(QStandardPaths::PicturesLocation);
    if (fallback.isEmpty()) fallback = QDir::homePath();
    return s.value("files/exportDirectory", fallback).toString();
}

void AppSettings::setExportDirectory(const QString& path)
{
    QSettings s;
    s.setValue("files/exportDirectory", path);
}

QStringList AppSettings::recentTracks()
{
    QSettings s;
    QStringList out;
    for (const QString& path : s.value(recentKey()).toStringList()) {
        if (path.isEmpty() || out.contains(path)) continue;
        out << path;
    }
    return out;
}

void AppSettings::addRecentTrack(const QString& path, int maxCount)
{
    if (path.isEmpty()) return;
    QSettings s;
    QStringList list = s.value(recentKey()).toStringList();
    list.removeAll(path);
    list.prepend(path);
    while (list.size() > maxCount) list.removeLast();
    s.setValue(recentKey(), list);
}

void AppSettings::clearRecentTracks()
{
    QSettings s;
    s.remove(recentKey());
}

QString AppSettings::titleFontFamily()
{
    QSettings s;
    return s.value("map/titleFontFamily", QStringLiteral("Noto Sans KR")).toString();
}

void AppSettings::setTitleFontFamily(const QString& family)
{
    QSettings s;
    s.setValue("map/titleFontFamily", family);
}

QString AppSettings::mapTitle()
{
    QSettings s;
    return s.value("map/title", QStringLiteral("My Track")).toString();
}

void AppSettings::setMapTitle(const QString& title)
{
    QSettings s;
    s.setValue("map/title", title);
}

QColor AppSettings::titleColor()
{
    QSettings s;
    const QColor color(s.value("map/titleColor", QStringLiteral("#1f2a24")).toString());
    return color.isValid() ? color : QColor(0x1F, 0x2A, 0x24);
}

void AppSettings::setTitleColor(const QColor& color)
{
    QSettings s;
    s.setValue("map/titleColor", color.name());
}

int AppSettings::titleFontSize()
{
    QSettings s;
    return s.value("map/titleFontSize", 28).toInt();
}

void AppSettings::setTitleFontSize(int size)
{
    QSettings s;
    s.setValue("map/titleFontSize", size);
}
