#pragma once

#include <QJsonObject>
#include <QString>

#include "QrEncoder.h"
#include "QrPainter.h"

namespace qrpaint {

struct RenderJob {
    QString data;
    int version {QrEncoder::kAutoVersion};
    ErrorCorrectionLevel level {ErrorCorrectionLevel::L};
    RenderConfig style;
    double size {512.0};

    // Keys: data, version, error_correction, color, background, gapless, size.
    // Keys that are absent keep their current value.
    bool applyJson(const QJsonObject &obj, QString *errorMessage = nullptr);
    [[nodiscard]] QJsonObject toJson() const;

    bool loadFile(const QString &path, QString *errorMessage = nullptr);
    bool saveFile(const QString &path, QString *errorMessage = nullptr) const;
};

// Accepts sides from 1 to QrExporter::kMaxImageSide pixels.
bool parseImageSize(double value, double &size, QString *errorMessage = nullptr);

// Accepts #RGB, #RRGGBB, #AARRGGBB and SVG colour names.
bool parseColor(const QString &text, QColor &color, QString *errorMessage = nullptr);

} // namespace qrpaint
