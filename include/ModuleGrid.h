#pragma once

#include <opencv2/core.hpp>

namespace qrpaint {

// Square matrix of QR modules. Row index is y, column index is x.
class ModuleGrid {
public:
    ModuleGrid() = default;

    // Takes a CV_8UC1 matrix where any non-zero value marks a dark module.
    // Throws std::invalid_argument for empty, non-square or non 8-bit input.
    explicit ModuleGrid(const cv::Mat &modules);

    [[nodiscard]] int size() const { return m_modules.rows; }
    [[nodiscard]] bool isEmpty() const { return m_modules.empty(); }
    [[nodiscard]] bool isDark(int row, int col) const;
    [[nodiscard]] int darkCount() const;

    [[nodiscard]] const cv::Mat &modules() const { return m_modules; }

    bool operator==(const ModuleGrid &other) const;
    bool operator!=(const ModuleGrid &other) const { return !(*this == other); }

private:
    cv::Mat m_modules;
};

} // namespace qrpaint
