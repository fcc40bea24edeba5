#include <QCoreApplication>
#include <QGuiApplication>

#include "CommandLine.h"

int main(int argc, char *argv[])
{
    if (qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM")) {
        qputenv("QT_QPA_PLATFORM", "offscreen");
    }
    QGuiApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("qrpaint"));
    QCoreApplication::setApplicationVersion(QStringLiteral("1.0.0"));

    qrpaint::CommandLine commandLine;
    return commandLine.run(QCoreApplication::arguments());
}
