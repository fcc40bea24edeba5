#pragma once

#include <optional>

#include <QString>

#include "ModuleGrid.h"

namespace qrpaint {

enum class ErrorCorrectionLevel {
    L,
    M,
    Q,
    H
};

QString toString(ErrorCorrectionLevel level);
std::optional<ErrorCorrectionLevel> errorCorrectionLevelFromString(const QString &text);

struct EncodeFailure {
    enum class Kind {
        DataTooLong,
        InvalidVersion,
        InvalidConfiguration,
        EncoderFault
    };

    Kind kind {Kind::EncoderFault};
    QString reason;

    static QString toString(Kind kind);
};

struct EncodeResult {
    std::optional<ModuleGrid> grid;
    std::optional<EncodeFailure> failure;

    [[nodiscard]] bool ok() const { return grid.has_value(); }
};

class QrEncoder {
public:
    static constexpr int kAutoVersion = -1;
    static constexpr int kMinVersion = 1;
    static constexpr int kMaxVersion = 40;

    // Module count of a symbol of the given version (1..40).
    static constexpr int moduleCountForVersion(int version) { return 17 + 4 * version; }
    // Inverse of moduleCountForVersion, or kAutoVersion when moduleCount is not a QR size.
    static int versionForModuleCount(int moduleCount);

    // Encodes data as UTF-8 bytes in 8-bit mode. version == kAutoVersion picks the
    // smallest symbol that fits; a fixed version fails if the data does not fit it.
    [[nodiscard]] static EncodeResult encode(const QString &data,
                                             int version,
                                             ErrorCorrectionLevel level);
};

} // namespace qrpaint
