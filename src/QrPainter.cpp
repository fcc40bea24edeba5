#include "QrPainter.h"

#include <algorithm>
#include <utility>

#include <QPainter>

#include "FinderEyeRenderer.h"
#include "Logger.h"
#include "ModuleRenderer.h"
#include "PainterSurface.h"

namespace qrpaint {

QrPainter::QrPainter(const QString &data,
                     int version,
                     ErrorCorrectionLevel level,
                     RenderConfig config,
                     ErrorCallback onError)
    : m_version(version)
    , m_level(level)
    , m_config(std::move(config))
{
    initialize(data, onError);
}

QrPainter::QrPainter(ModuleGrid grid, ErrorCorrectionLevel level, RenderConfig config)
    : m_version(QrEncoder::versionForModuleCount(grid.size()))
    , m_level(level)
    , m_config(std::move(config))
    , m_grid(std::move(grid))
    , m_state(m_grid.isEmpty() ? State::Failed : State::Ready)
{
    if (m_state == State::Failed) {
        m_failure = EncodeFailure {EncodeFailure::Kind::InvalidConfiguration,
                                   QStringLiteral("Module grid is empty")};
    }
}

QrPainterResult QrPainter::create(const QString &data,
                                  int version,
                                  ErrorCorrectionLevel level,
                                  RenderConfig config)
{
    QrPainterResult result;
    QrPainter painter(data, version, level, std::move(config));
    if (painter.hasFailed()) {
        result.failure = painter.failure();
    } else {
        result.painter = std::move(painter);
    }
    return result;
}

void QrPainter::initialize(const QString &data, const ErrorCallback &onError)
{
    EncodeResult encoded = QrEncoder::encode(data, m_version, m_level);
    if (encoded.ok()) {
        m_grid = std::move(*encoded.grid);
        m_state = State::Ready;
        Logger::debug(QStringLiteral("[QR] Encoded %1 modules per side at level %2")
                          .arg(m_grid.size())
                          .arg(toString(m_level)));
        return;
    }

    m_state = State::Failed;
    m_failure = encoded.failure;
    if (onError) {
        onError(*m_failure);
    } else {
        Logger::warning(QStringLiteral("[QR] Encoding failed (%1): %2")
                            .arg(EncodeFailure::toString(m_failure->kind), m_failure->reason));
    }
}

double QrPainter::moduleSizeFor(double shortestSide, int moduleCount, bool gapless)
{
    if (moduleCount <= 0) {
        return 0.0;
    }
    return shortestSide / static_cast<double>(moduleCount) + (gapless ? 1.0 : 0.0);
}

double QrPainter::moduleSizeFor(const QSizeF &size) const
{
    const double shortestSide = std::min(size.width(), size.height());
    return moduleSizeFor(shortestSide, m_grid.size(), m_config.gapless);
}

void QrPainter::render(RenderSurface &surface, const QSizeF &size) const
{
    if (m_state != State::Ready) {
        return;
    }

    if (std::min(size.width(), size.height()) <= 0.0) {
        Logger::warning(QStringLiteral(
            "[QR] width or height is zero. Give the painter a size or render it into a surface with a non-zero size"));
    }

    if (m_config.backgroundColor) {
        surface.fillBackground(*m_config.backgroundColor);
    }

    const double moduleSize = moduleSizeFor(size);
    ModuleRenderer::paint(surface, m_grid, moduleSize, m_config.darkColor);
    FinderEyeRenderer::paint(surface,
                             FinderEyeRenderer::computeEyes(moduleSize, m_grid.size()),
                             moduleSize,
                             m_config.darkColor);
}

void QrPainter::paint(QPainter &painter, const QSizeF &size) const
{
    PainterSurface surface(painter, QRectF(QPointF(0.0, 0.0), size));
    render(surface, size);
}

bool QrPainter::shouldRepaint(const QrPainter &previous) const
{
    return m_config.darkColor != previous.m_config.darkColor ||
           m_level != previous.m_level ||
           m_version != previous.m_version ||
           m_grid != previous.m_grid;
}

} // namespace qrpaint
