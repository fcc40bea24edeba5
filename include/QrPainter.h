#pragma once

#include <functional>
#include <optional>

#include <QColor>
#include <QSizeF>
#include <QString>

#include "ModuleGrid.h"
#include "QrEncoder.h"
#include "RenderSurface.h"

class QPainter;

namespace qrpaint {

struct RenderConfig {
    QColor darkColor {QColor::fromRgba(0xff000000)};
    std::optional<QColor> backgroundColor;
    bool gapless {false};
};

struct QrPainterResult;

class QrPainter {
public:
    enum class State {
        Uninitialized,
        Ready,
        Failed
    };

    using ErrorCallback = std::function<void(const EncodeFailure &)>;

    // Encodes data right away. On failure the painter stays Failed for good and
    // onError, if given, runs once before the constructor returns.
    QrPainter(const QString &data,
              int version,
              ErrorCorrectionLevel level = ErrorCorrectionLevel::L,
              RenderConfig config = {},
              ErrorCallback onError = {});

    // Wraps a grid produced elsewhere.
    QrPainter(ModuleGrid grid, ErrorCorrectionLevel level, RenderConfig config = {});

    [[nodiscard]] static QrPainterResult create(const QString &data,
                                                int version,
                                                ErrorCorrectionLevel level = ErrorCorrectionLevel::L,
                                                RenderConfig config = {});

    // Background, module dots, then the three eyes. Draws nothing once failed.
    void render(RenderSurface &surface, const QSizeF &size) const;
    void paint(QPainter &painter, const QSizeF &size) const;

    // False only when colour, error correction level, version and grid all match.
    [[nodiscard]] bool shouldRepaint(const QrPainter &previous) const;

    [[nodiscard]] double moduleSizeFor(const QSizeF &size) const;
    [[nodiscard]] static double moduleSizeFor(double shortestSide, int moduleCount, bool gapless);

    [[nodiscard]] State state() const { return m_state; }
    [[nodiscard]] bool hasFailed() const { return m_state == State::Failed; }
    [[nodiscard]] const std::optional<EncodeFailure> &failure() const { return m_failure; }
    [[nodiscard]] const ModuleGrid &grid() const { return m_grid; }
    [[nodiscard]] int version() const { return m_version; }
    [[nodiscard]] ErrorCorrectionLevel errorCorrectionLevel() const { return m_level; }
    [[nodiscard]] const RenderConfig &config() const { return m_config; }

private:
    void initialize(const QString &data, const ErrorCallback &onError);

    int m_version {QrEncoder::kAutoVersion};
    ErrorCorrectionLevel m_level {ErrorCorrectionLevel::L};
    RenderConfig m_config;
    ModuleGrid m_grid;
    State m_state {State::Uninitialized};
    std::optional<EncodeFailure> m_failure;
};

struct QrPainterResult {
    std::optional<QrPainter> painter;
    std::optional<EncodeFailure> failure;

    [[nodiscard]] bool ok() const { return painter.has_value(); }
};

} // namespace qrpaint
