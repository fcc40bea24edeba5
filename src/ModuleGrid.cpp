#include "ModuleGrid.h"

#include <stdexcept>
#include <string>

namespace qrpaint {

ModuleGrid::ModuleGrid(const cv::Mat &modules)
{
    if (modules.empty()) {
        throw std::invalid_argument("Module grid is empty");
    }
    if (modules.rows != modules.cols) {
        throw std::invalid_argument("Module grid is not square: " + std::to_string(modules.rows) + "x" +
                                    std::to_string(modules.cols));
    }
    if (modules.type() != CV_8UC1) {
        throw std::invalid_argument("Module grid must be a single channel 8-bit matrix");
    }
    // normalise to 0/1 and detach from the caller's buffer
    const cv::Mat binary = modules != 0;
    binary.convertTo(m_modules, CV_8UC1, 1.0 / 255.0);
}

bool ModuleGrid::isDark(int row, int col) const
{
    if (row < 0 || col < 0 || row >= m_modules.rows || col >= m_modules.cols) {
        return false;
    }
    return m_modules.at<uchar>(row, col) != 0;
}

int ModuleGrid::darkCount() const
{
    return m_modules.empty() ? 0 : cv::countNonZero(m_modules);
}

bool ModuleGrid::operator==(const ModuleGrid &other) const
{
    if (m_modules.empty() || other.m_modules.empty()) {
        return m_modules.empty() && other.m_modules.empty();
    }
    if (m_modules.size() != other.m_modules.size()) {
        return false;
    }
    return cv::norm(m_modules, other.m_modules, cv::NORM_INF) == 0.0;
}

} // namespace qrpaint
