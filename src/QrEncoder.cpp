#include "QrEncoder.h"

#include <cerrno>
#include <cstring>
#include <memory>

#include <qrencode.h>

namespace qrpaint {

namespace {

struct QRcodeDeleter {
    void operator()(QRcode *code) const { QRcode_free(code); }
};

using QRcodePtr = std::unique_ptr<QRcode, QRcodeDeleter>;

QRecLevel toQrencodeLevel(ErrorCorrectionLevel level)
{
    switch (level) {
    case ErrorCorrectionLevel::M:
        return QR_ECLEVEL_M;
    case ErrorCorrectionLevel::Q:
        return QR_ECLEVEL_Q;
    case ErrorCorrectionLevel::H:
        return QR_ECLEVEL_H;
    case ErrorCorrectionLevel::L:
    default:
        return QR_ECLEVEL_L;
    }
}

EncodeResult failed(EncodeFailure::Kind kind, const QString &reason)
{
    EncodeResult result;
    result.failure = EncodeFailure {kind, reason};
    return result;
}

} // namespace

QString toString(ErrorCorrectionLevel level)
{
    switch (level) {
    case ErrorCorrectionLevel::M:
        return QStringLiteral("M");
    case ErrorCorrectionLevel::Q:
        return QStringLiteral("Q");
    case ErrorCorrectionLevel::H:
        return QStringLiteral("H");
    case ErrorCorrectionLevel::L:
    default:
        return QStringLiteral("L");
    }
}

std::optional<ErrorCorrectionLevel> errorCorrectionLevelFromString(const QString &text)
{
    const QString token = text.trimmed().toUpper();
    if (token == QLatin1String("L")) {
        return ErrorCorrectionLevel::L;
    }
    if (token == QLatin1String("M")) {
        return ErrorCorrectionLevel::M;
    }
    if (token == QLatin1String("Q")) {
        return ErrorCorrectionLevel::Q;
    }
    if (token == QLatin1String("H")) {
        return ErrorCorrectionLevel::H;
    }
    return std::nullopt;
}

QString EncodeFailure::toString(Kind kind)
{
    switch (kind) {
    case Kind::DataTooLong:
        return QStringLiteral("data too long");
    case Kind::InvalidVersion:
        return QStringLiteral("invalid version");
    case Kind::InvalidConfiguration:
        return QStringLiteral("invalid configuration");
    case Kind::EncoderFault:
    default:
        return QStringLiteral("encoder fault");
    }
}

int QrEncoder::versionForModuleCount(int moduleCount)
{
    if (moduleCount < moduleCountForVersion(kMinVersion) || (moduleCount - 17) % 4 != 0) {
        return kAutoVersion;
    }
    const int version = (moduleCount - 17) / 4;
    return version <= kMaxVersion ? version : kAutoVersion;
}

EncodeResult QrEncoder::encode(const QString &data, int version, ErrorCorrectionLevel level)
{
    if (version != kAutoVersion && (version < kMinVersion || version > kMaxVersion)) {
        return failed(EncodeFailure::Kind::InvalidVersion,
                      QStringLiteral("Version %1 is outside 1..40").arg(version));
    }
    if (data.isEmpty()) {
        return failed(EncodeFailure::Kind::InvalidConfiguration,
                      QStringLiteral("Nothing to encode: data is empty"));
    }

    const QByteArray bytes = data.toUtf8();
    const int requestedVersion = version == kAutoVersion ? 0 : version;

    errno = 0;
    // explicit length: the bytes may contain NULs
    QRcodePtr code(QRcode_encodeData(static_cast<int>(bytes.size()),
                                     reinterpret_cast<const unsigned char *>(bytes.constData()),
                                     requestedVersion,
                                     toQrencodeLevel(level)));
    if (!code) {
        const int err = errno;
        if (err == ERANGE) {
            return failed(EncodeFailure::Kind::DataTooLong,
                          QStringLiteral("%1 bytes exceed the capacity of any symbol at level %2")
                              .arg(bytes.size())
                              .arg(toString(level)));
        }
        if (err == EINVAL) {
            return failed(EncodeFailure::Kind::InvalidConfiguration,
                          QStringLiteral("Encoder rejected the input: %1").arg(QString::fromLocal8Bit(std::strerror(err))));
        }
        return failed(EncodeFailure::Kind::EncoderFault,
                      QStringLiteral("Encoder failed: %1").arg(QString::fromLocal8Bit(std::strerror(err))));
    }

    // libqrencode treats the version as a lower bound and grows the symbol when needed
    if (requestedVersion > 0 && code->version != requestedVersion) {
        return failed(EncodeFailure::Kind::DataTooLong,
                      QStringLiteral("%1 bytes do not fit a version %2 symbol at level %3 (needs version %4)")
                          .arg(bytes.size())
                          .arg(requestedVersion)
                          .arg(toString(level))
                          .arg(code->version));
    }

    const int width = code->width;
    cv::Mat modules(width, width, CV_8UC1);
    const unsigned char *cell = code->data;
    for (int y = 0; y < width; ++y) {
        auto *row = modules.ptr<uchar>(y);
        for (int x = 0; x < width; ++x) {
            row[x] = static_cast<uchar>(*cell & 0x01);
            ++cell;
        }
    }

    EncodeResult result;
    result.grid = ModuleGrid(modules);
    return result;
}

} // namespace qrpaint
