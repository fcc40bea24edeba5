#pragma once

#include <QByteArray>
#include <QFuture>
#include <QImage>
#include <QPicture>
#include <QString>

#include "QrPainter.h"

namespace qrpaint {

enum class ImageFormat {
    RawRgba,         // premultiplied alpha, tightly packed rows
    RawStraightRgba, // straight alpha, tightly packed rows
    Png
};

class QrExporter {
public:
    // Largest raster side accepted for export and by render jobs.
    static constexpr int kMaxImageSide = 16384;

    // Whole pixels for size (truncating); 0 when size is not finite, not
    // positive or larger than kMaxImageSide.
    [[nodiscard]] static int pixelSizeFor(double size);

    // Records the render sequence for a size x size square.
    [[nodiscard]] static QPicture toPicture(const QrPainter &painter, double size);

    // Plays the picture onto a transparent pixelSize x pixelSize image.
    [[nodiscard]] static QImage rasterize(const QPicture &picture, int pixelSize);

    [[nodiscard]] static QByteArray encodeImage(const QImage &image, ImageFormat format);

    // Drawing happens on the calling thread; only the encode step is deferred.
    [[nodiscard]] static QFuture<QByteArray> toImageData(const QrPainter &painter,
                                                        double size,
                                                        ImageFormat format = ImageFormat::Png);

    static bool writeSvg(const QrPainter &painter, double size, const QString &path, QString *errorMessage = nullptr);

    // .svg, .png or .rgba (raw straight RGBA) chosen from the suffix.
    static bool writeImageFile(const QrPainter &painter,
                               double size,
                               const QString &path,
                               QString *errorMessage = nullptr);
};

} // namespace qrpaint
