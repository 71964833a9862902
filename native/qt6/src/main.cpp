#include <QApplication>
#include <QCoreApplication>
#include <QTimer>
#include "log_manager.h"
#include "mainwindow.h"

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);

    // Identify app for QSettings
    QCoreApplication::setOrganizationName("DropFiles");
    QCoreApplication::setApplicationName("DropFiles");

    qInstallMessageHandler(customMessageHandler);
    LogManager::instance().addLog("[MAIN] Application started; log file=" + LogManager::instance().logFilePath());

    MainWindow mainWindow;
    mainWindow.show();
    QTimer::singleShot(0, []{ LogManager::instance().addLog("[MAIN] Event loop entered"); });

    int rc = app.exec();
    LogManager::instance().addLog(QString("[MAIN] Event loop exited with code %1").arg(rc));
    return rc;
}
