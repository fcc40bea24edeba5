#include "CommandLine.h"

#include <QCoreApplication>
#include <QTextStream>

#include "Logger.h"
#include "QrExporter.h"
#include "QrPainter.h"

namespace qrpaint {

namespace {

bool fail(QString *errorMessage, const QString &message)
{
    if (errorMessage) {
        *errorMessage = message;
    }
    return false;
}

} // namespace

CommandLine::CommandLine()
    : m_helpOption(m_parser.addHelpOption())
    , m_versionOption(m_parser.addVersionOption())
    , m_configOption({QStringLiteral("c"), QStringLiteral("config")},
                     QStringLiteral("JSON render job; command line options override its values."),
                     QStringLiteral("file"))
    , m_dataOption({QStringLiteral("d"), QStringLiteral("data")},
                   QStringLiteral("Text to encode."),
                   QStringLiteral("text"))
    , m_qrVersionOption({QStringLiteral("V"), QStringLiteral("qr-version")},
                        QStringLiteral("Symbol version 1..40, or -1 to pick the smallest that fits."),
                        QStringLiteral("n"))
    , m_levelOption({QStringLiteral("l"), QStringLiteral("level")},
                    QStringLiteral("Error correction level: L, M, Q or H."),
                    QStringLiteral("level"))
    , m_sizeOption({QStringLiteral("s"), QStringLiteral("size")},
                   QStringLiteral("Output side length in pixels (1..%1).").arg(QrExporter::kMaxImageSide),
                   QStringLiteral("px"))
    , m_colorOption(QStringLiteral("color"),
                    QStringLiteral("Module colour, e.g. #000000."),
                    QStringLiteral("color"))
    , m_backgroundOption(QStringLiteral("background"),
                         QStringLiteral("Background colour; transparent when omitted."),
                         QStringLiteral("color"))
    , m_gaplessOption(QStringLiteral("gapless"),
                      QStringLiteral("Grow modules by one unit to hide seams."))
    , m_outputOption({QStringLiteral("o"), QStringLiteral("output")},
                     QStringLiteral("Output file (.png, .svg or .rgba)."),
                     QStringLiteral("file"))
{
    m_parser.setApplicationDescription(
        QStringLiteral("Render data as a QR code with round modules and ring finder eyes"));
    m_parser.addOption(m_configOption);
    m_parser.addOption(m_dataOption);
    m_parser.addOption(m_qrVersionOption);
    m_parser.addOption(m_levelOption);
    m_parser.addOption(m_sizeOption);
    m_parser.addOption(m_colorOption);
    m_parser.addOption(m_backgroundOption);
    m_parser.addOption(m_gaplessOption);
    m_parser.addOption(m_outputOption);
}

bool CommandLine::parse(const QStringList &arguments, QString *errorMessage)
{
    if (!m_parser.parse(arguments)) {
        return fail(errorMessage, m_parser.errorText());
    }
    return true;
}

bool CommandLine::helpRequested() const
{
    return m_parser.isSet(m_helpOption);
}

bool CommandLine::versionRequested() const
{
    return m_parser.isSet(m_versionOption);
}

QString CommandLine::helpText() const
{
    return m_parser.helpText();
}

QString CommandLine::outputPath() const
{
    return m_parser.value(m_outputOption);
}

bool CommandLine::buildJob(RenderJob &job, QString *errorMessage) const
{
    if (m_parser.isSet(m_configOption) && !job.loadFile(m_parser.value(m_configOption), errorMessage)) {
        return false;
    }

    if (m_parser.isSet(m_dataOption)) {
        job.data = m_parser.value(m_dataOption);
    }

    if (m_parser.isSet(m_qrVersionOption)) {
        bool ok = false;
        const int value = m_parser.value(m_qrVersionOption).toInt(&ok);
        if (!ok) {
            return fail(errorMessage,
                        QStringLiteral("Invalid value for --qr-version: %1").arg(m_parser.value(m_qrVersionOption)));
        }
        job.version = value;
    }

    if (m_parser.isSet(m_levelOption)) {
        const auto level = errorCorrectionLevelFromString(m_parser.value(m_levelOption));
        if (!level) {
            return fail(errorMessage, QStringLiteral("Invalid value for --level: %1").arg(m_parser.value(m_levelOption)));
        }
        job.level = *level;
    }

    if (m_parser.isSet(m_sizeOption)) {
        bool ok = false;
        const double value = m_parser.value(m_sizeOption).toDouble(&ok);
        if (!ok) {
            return fail(errorMessage, QStringLiteral("Invalid value for --size: %1").arg(m_parser.value(m_sizeOption)));
        }
        if (!parseImageSize(value, job.size, errorMessage)) {
            return false;
        }
    }

    if (m_parser.isSet(m_colorOption) && !parseColor(m_parser.value(m_colorOption), job.style.darkColor, errorMessage)) {
        return false;
    }

    if (m_parser.isSet(m_backgroundOption)) {
        QColor background;
        if (!parseColor(m_parser.value(m_backgroundOption), background, errorMessage)) {
            return false;
        }
        job.style.backgroundColor = background;
    }

    if (m_parser.isSet(m_gaplessOption)) {
        job.style.gapless = true;
    }

    if (job.data.isEmpty()) {
        return fail(errorMessage, QStringLiteral("--data (or a config with \"data\") must be provided"));
    }
    if (!m_parser.isSet(m_outputOption)) {
        return fail(errorMessage, QStringLiteral("--output must be provided"));
    }
    return true;
}

int CommandLine::run(const QStringList &arguments)
{
    QString error;
    if (!parse(arguments, &error)) {
        QTextStream(stderr) << "Error: " << error << Qt::endl;
        return ExitUsage;
    }
    if (helpRequested()) {
        QTextStream(stdout) << helpText();
        return ExitOk;
    }
    if (versionRequested()) {
        QTextStream(stdout) << QCoreApplication::applicationName() << ' '
                            << QCoreApplication::applicationVersion() << Qt::endl;
        return ExitOk;
    }

    RenderJob job;
    if (!buildJob(job, &error)) {
        QTextStream(stderr) << "Error: " << error << Qt::endl;
        return ExitUsage;
    }

    const QrPainterResult created = QrPainter::create(job.data, job.version, job.level, job.style);
    if (!created.ok()) {
        QTextStream(stderr) << "Encoding failed (" << EncodeFailure::toString(created.failure->kind)
                            << "): " << created.failure->reason << Qt::endl;
        return ExitEncode;
    }

    const QrPainter &painter = *created.painter;
    Logger::info(QStringLiteral("Encoded %1 modules per side at level %2")
                     .arg(painter.grid().size())
                     .arg(toString(painter.errorCorrectionLevel())));

    const QString path = outputPath();
    if (!QrExporter::writeImageFile(painter, job.size, path, &error)) {
        QTextStream(stderr) << "Error: " << error << Qt::endl;
        return ExitWrite;
    }

    QTextStream(stdout) << "QR code written to " << path << Qt::endl;
    return ExitOk;
}

} // namespace qrpaint
