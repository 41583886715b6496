#include <QApplication>
#include <QGuiApplication>
#include <QDebug>
#include <QDir>
#include <QMessageBox>
#include "app/mainwindow.h"
#include "appsettings.h"
#include "io/contoursourcecache.h"

int main(int argc, char *argv[])
{
    // Avoid platform theme plugins overriding the map palette
    QGuiApplication::setDesktopSettingsAware(false);
    qputenv("QT_QPA_PLATFORMTHEME", "");

    QApplication app(argc, argv);

    app.setApplicationName("Trail Contour");
    app.setOrganizationName("TrailContour");

    try {
        // Optional first argument overrides the asset root for this run
        QString assetRoot = AppSettings::assetRoot();
        const QStringList args = app.arguments();
        if (args.size() > 1) {
            assetRoot = QDir(args.at(1)).absolutePath();
            qDebug() << "[Main] Using asset root" << assetRoot;
        }

        ContourSourceCache cache(assetRoot, AppSettings::manifestPath());

        MainWindow window(&cache);
        window.show();

        return app.exec();
    } catch (const std::exception& e) {
        qCritical() << "[Main] Fatal error:" << e.what();
        QMessageBox::critical(nullptr, "Fatal Error",
            QString("Application crashed: %1").arg(e.what()));
        return 1;
    }
}
