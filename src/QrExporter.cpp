#include "QrExporter.h"

#include <QFile>
#include <QFileInfo>
#include <QPainter>
#include <QSvgGenerator>
#include <QtConcurrent>

#include <cmath>
#include <cstring>
#include <vector>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include "Logger.h"
#include "PainterSurface.h"

namespace qrpaint {

namespace {

QByteArray packRows(const QImage &image)
{
    const qsizetype rowBytes = static_cast<qsizetype>(image.width()) * 4;
    QByteArray bytes(rowBytes * image.height(), Qt::Uninitialized);
    for (int y = 0; y < image.height(); ++y) {
        std::memcpy(bytes.data() + y * rowBytes, image.constScanLine(y), static_cast<size_t>(rowBytes));
    }
    return bytes;
}

QByteArray encodePng(const QImage &image)
{
    const QImage rgba = image.convertToFormat(QImage::Format_RGBA8888);
    const cv::Mat wrapped(rgba.height(),
                          rgba.width(),
                          CV_8UC4,
                          const_cast<uchar *>(rgba.constBits()),
                          static_cast<size_t>(rgba.bytesPerLine()));
    cv::Mat bgra;
    cv::cvtColor(wrapped, bgra, cv::COLOR_RGBA2BGRA);

    std::vector<uchar> buffer;
    try {
        if (!cv::imencode(".png", bgra, buffer)) {
            Logger::error(QStringLiteral("PNG encoder refused a %1x%2 image").arg(image.width()).arg(image.height()));
            return {};
        }
    } catch (const cv::Exception &ex) {
        Logger::error(QStringLiteral("PNG encoding failed: %1").arg(QString::fromStdString(ex.what())));
        return {};
    }
    return QByteArray(reinterpret_cast<const char *>(buffer.data()), static_cast<qsizetype>(buffer.size()));
}

} // namespace

int QrExporter::pixelSizeFor(double size)
{
    if (!std::isfinite(size) || size <= 0.0) {
        return 0;
    }
    if (size >= kMaxImageSide + 1.0) {
        Logger::error(QStringLiteral("Image size %1 exceeds the %2 px limit").arg(size).arg(kMaxImageSide));
        return 0;
    }
    return static_cast<int>(size);
}

QPicture QrExporter::toPicture(const QrPainter &painter, double size)
{
    QPicture picture;
    {
        QPainter recorder(&picture);
        painter.paint(recorder, QSizeF(size, size));
    }
    return picture;
}

QImage QrExporter::rasterize(const QPicture &picture, int pixelSize)
{
    if (pixelSize <= 0) {
        return {};
    }
    QImage image(pixelSize, pixelSize, QImage::Format_ARGB32_Premultiplied);
    image.fill(Qt::transparent);
    {
        QPainter p(&image);
        p.setRenderHint(QPainter::Antialiasing, true);
        p.drawPicture(0, 0, picture);
    }
    return image;
}

QByteArray QrExporter::encodeImage(const QImage &image, ImageFormat format)
{
    if (image.isNull()) {
        return {};
    }
    switch (format) {
    case ImageFormat::RawRgba:
        return packRows(image.convertToFormat(QImage::Format_RGBA8888_Premultiplied));
    case ImageFormat::RawStraightRgba:
        return packRows(image.convertToFormat(QImage::Format_RGBA8888));
    case ImageFormat::Png:
    default:
        return encodePng(image);
    }
}

QFuture<QByteArray> QrExporter::toImageData(const QrPainter &painter, double size, ImageFormat format)
{
    const int pixelSize = pixelSizeFor(size);
    const QImage image = rasterize(toPicture(painter, size), pixelSize);
    return QtConcurrent::run([image, format]() { return encodeImage(image, format); });
}

bool QrExporter::writeSvg(const QrPainter &painter, double size, const QString &path, QString *errorMessage)
{
    const int pixelSize = pixelSizeFor(size);
    if (pixelSize <= 0) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Invalid SVG size %1 (1..%2 px)").arg(size).arg(kMaxImageSide);
        }
        return false;
    }
    QSvgGenerator gen;
    gen.setFileName(path);
    gen.setSize(QSize(pixelSize, pixelSize));
    gen.setViewBox(QRectF(0.0, 0.0, size, size));
    gen.setTitle(QStringLiteral("QR code"));
    {
        QPainter p;
        if (!p.begin(&gen)) {
            if (errorMessage) {
                *errorMessage = QStringLiteral("Failed to open SVG output: %1").arg(path);
            }
            return false;
        }
        painter.paint(p, QSizeF(size, size));
    }
    return true;
}

bool QrExporter::writeImageFile(const QrPainter &painter,
                                double size,
                                const QString &path,
                                QString *errorMessage)
{
    const QString suffix = QFileInfo(path).suffix().toLower();
    if (suffix == QLatin1String("svg")) {
        return writeSvg(painter, size, path, errorMessage);
    }

    ImageFormat format;
    if (suffix == QLatin1String("png")) {
        format = ImageFormat::Png;
    } else if (suffix == QLatin1String("rgba")) {
        format = ImageFormat::RawStraightRgba;
    } else {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Unsupported output type '.%1' (use .png, .svg or .rgba)").arg(suffix);
        }
        return false;
    }

    const QByteArray bytes = toImageData(painter, size, format).result();
    if (bytes.isEmpty()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Nothing to write: image for %1 is empty").arg(path);
        }
        return false;
    }

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Failed to open %1: %2").arg(path, file.errorString());
        }
        return false;
    }
    if (file.write(bytes) != bytes.size()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Failed to write %1: %2").arg(path, file.errorString());
        }
        return false;
    }
    Logger::info(QStringLiteral("Wrote %1 (%2 bytes)").arg(path).arg(bytes.size()));
    return true;
}

} // namespace qrpaint
