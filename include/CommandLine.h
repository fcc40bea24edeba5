#pragma once

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QString>
#include <QStringList>

#include "RenderJob.h"

namespace qrpaint {

class CommandLine {
public:
    enum ExitCode {
        ExitOk = 0,
        ExitUsage = 1,
        ExitEncode = 2,
        ExitWrite = 3
    };

    CommandLine();

    // arguments includes the program name, as QCoreApplication::arguments() does.
    bool parse(const QStringList &arguments, QString *errorMessage = nullptr);

    [[nodiscard]] bool helpRequested() const;
    [[nodiscard]] bool versionRequested() const;
    [[nodiscard]] QString helpText() const;
    [[nodiscard]] QString outputPath() const;

    // Loads --config first, then applies the remaining options on top.
    bool buildJob(RenderJob &job, QString *errorMessage = nullptr) const;

    // Parse, encode and write; messages go to stdout/stderr.
    int run(const QStringList &arguments);

private:
    QCommandLineParser m_parser;
    QCommandLineOption m_helpOption;
    QCommandLineOption m_versionOption;
    QCommandLineOption m_configOption;
    QCommandLineOption m_dataOption;
    QCommandLineOption m_qrVersionOption;
    QCommandLineOption m_levelOption;
    QCommandLineOption m_sizeOption;
    QCommandLineOption m_colorOption;
    QCommandLineOption m_backgroundOption;
    QCommandLineOption m_gaplessOption;
    QCommandLineOption m_outputOption;
};

} // namespace qrpaint
