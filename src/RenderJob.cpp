#include "RenderJob.h"

#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonValue>

#include <cmath>
#include <limits>

#include "QrExporter.h"

namespace qrpaint {

namespace {

bool fail(QString *errorMessage, const QString &message)
{
    if (errorMessage) {
        *errorMessage = message;
    }
    return false;
}

QString colorToString(const QColor &color)
{
    return color.name(color.alpha() == 255 ? QColor::HexRgb : QColor::HexArgb);
}

} // namespace

bool parseColor(const QString &text, QColor &color, QString *errorMessage)
{
    const QString trimmed = text.trimmed();
    const QColor parsed(trimmed);
    if (trimmed.isEmpty() || !parsed.isValid()) {
        return fail(errorMessage, QStringLiteral("Invalid colour: '%1'").arg(text));
    }
    color = parsed;
    return true;
}

bool parseImageSize(double value, double &size, QString *errorMessage)
{
    if (!std::isfinite(value) || value < 1.0 || value > QrExporter::kMaxImageSide) {
        return fail(errorMessage,
                    QStringLiteral("Size %1 is outside 1..%2 px").arg(value).arg(QrExporter::kMaxImageSide));
    }
    size = value;
    return true;
}

bool RenderJob::applyJson(const QJsonObject &obj, QString *errorMessage)
{
    if (obj.contains(QStringLiteral("data"))) {
        const QJsonValue value = obj.value(QStringLiteral("data"));
        if (!value.isString()) {
            return fail(errorMessage, QStringLiteral("'data' must be a string"));
        }
        data = value.toString();
    }

    if (obj.contains(QStringLiteral("version"))) {
        const QJsonValue value = obj.value(QStringLiteral("version"));
        const double raw = value.toDouble();
        if (!value.isDouble() || std::floor(raw) != raw || raw < std::numeric_limits<int>::min() ||
            raw > std::numeric_limits<int>::max()) {
            return fail(errorMessage, QStringLiteral("'version' must be an integer (-1 for automatic)"));
        }
        version = static_cast<int>(value.toDouble());
    }

    if (obj.contains(QStringLiteral("error_correction"))) {
        const auto parsed = errorCorrectionLevelFromString(obj.value(QStringLiteral("error_correction")).toString());
        if (!parsed) {
            return fail(errorMessage, QStringLiteral("'error_correction' must be one of L, M, Q, H"));
        }
        level = *parsed;
    }

    if (obj.contains(QStringLiteral("color"))) {
        QColor color;
        if (!parseColor(obj.value(QStringLiteral("color")).toString(), color, errorMessage)) {
            return false;
        }
        style.darkColor = color;
    }

    if (obj.contains(QStringLiteral("background"))) {
        const QJsonValue value = obj.value(QStringLiteral("background"));
        if (value.isNull()) {
            style.backgroundColor.reset();
        } else {
            QColor color;
            if (!parseColor(value.toString(), color, errorMessage)) {
                return false;
            }
            style.backgroundColor = color;
        }
    }

    if (obj.contains(QStringLiteral("gapless"))) {
        const QJsonValue value = obj.value(QStringLiteral("gapless"));
        if (!value.isBool()) {
            return fail(errorMessage, QStringLiteral("'gapless' must be true or false"));
        }
        style.gapless = value.toBool();
    }

    if (obj.contains(QStringLiteral("size"))) {
        const QJsonValue value = obj.value(QStringLiteral("size"));
        if (!value.isDouble()) {
            return fail(errorMessage, QStringLiteral("'size' must be a positive number"));
        }
        if (!parseImageSize(value.toDouble(), size, errorMessage)) {
            return false;
        }
    }

    return true;
}

QJsonObject RenderJob::toJson() const
{
    QJsonObject obj;
    obj.insert(QStringLiteral("data"), data);
    obj.insert(QStringLiteral("version"), version);
    obj.insert(QStringLiteral("error_correction"), toString(level));
    obj.insert(QStringLiteral("color"), colorToString(style.darkColor));
    if (style.backgroundColor) {
        obj.insert(QStringLiteral("background"), colorToString(*style.backgroundColor));
    } else {
        obj.insert(QStringLiteral("background"), QJsonValue::Null);
    }
    obj.insert(QStringLiteral("gapless"), style.gapless);
    obj.insert(QStringLiteral("size"), size);
    return obj;
}

bool RenderJob::loadFile(const QString &path, QString *errorMessage)
{
    const QFileInfo info(path);
    if (!info.exists() || !info.isFile()) {
        return fail(errorMessage, QStringLiteral("Render job file not found: %1").arg(path));
    }

    QFile file(info.absoluteFilePath());
    if (!file.open(QIODevice::ReadOnly)) {
        return fail(errorMessage, QStringLiteral("Failed to open render job: %1").arg(file.errorString()));
    }

    QJsonParseError parseError {};
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        return fail(errorMessage, QStringLiteral("Invalid render job JSON: %1").arg(parseError.errorString()));
    }
    if (!doc.isObject()) {
        return fail(errorMessage, QStringLiteral("Render job file is not a JSON object"));
    }

    return applyJson(doc.object(), errorMessage);
}

bool RenderJob::saveFile(const QString &path, QString *errorMessage) const
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return fail(errorMessage, QStringLiteral("Failed to write render job: %1").arg(file.errorString()));
    }
    const QJsonDocument doc(toJson());
    const QByteArray payload = doc.toJson(QJsonDocument::Indented);
    if (file.write(payload) != payload.size()) {
        return fail(errorMessage, QStringLiteral("Failed to write render job: %1").arg(file.errorString()));
    }
    return true;
}

} // namespace qrpaint
