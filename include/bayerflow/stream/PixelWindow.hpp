/**
 * @file PixelWindow.hpp
 * @brief 3x3 neighborhood shift register
 */

#ifndef BAYERFLOW_STREAM_PIXEL_WINDOW_HPP
#define BAYERFLOW_STREAM_PIXEL_WINDOW_HPP

#include "bayerflow/core/types.hpp"
#include "bayerflow/stream/FrameConfig.hpp"
#include "bayerflow/stream/ReadController.hpp"

#include <array>
#include <cstdint>

namespace bayerflow {
namespace stream {

/**
 * @brief One vertical slice of three source lines at a single column
 */
struct WindowColumn {
    ColumnKind kind = ColumnKind::BUBBLE;
    uint32_t line = 0;
    uint32_t column = 0;
    std::array<core::Sample, 3> samples{};     ///< top, middle, bottom
};

/**
 * @brief Frame-boundary flags for a neighborhood centre
 */
struct EdgeMask {
    bool isLeftEdge = false;
    bool isRightEdge = false;
    bool isTopEdge = false;
    bool isBottomEdge = false;

    uint32_t sidesMasked() const {
        return static_cast<uint32_t>(isLeftEdge) + static_cast<uint32_t>(isRightEdge) +
               static_cast<uint32_t>(isTopEdge) + static_cast<uint32_t>(isBottomEdge);
    }

    static EdgeMask forCoordinate(const core::PixelCoordinate& coordinate,
                                  const FrameConfig& frame) {
        EdgeMask mask;
        mask.isLeftEdge = coordinate.column == 0;
        mask.isRightEdge = coordinate.column == frame.lastColumn();
        mask.isTopEdge = coordinate.line == 0;
        mask.isBottomEdge = coordinate.line == frame.lastLine();
        return mask;
    }
};

/**
 * @brief Masked 3x3 samples around one output coordinate
 *
 * samples[row][col]: row 0 is the line above, col 0 the column to the left.
 * Out-of-bounds positions hold 0.
 */
struct Neighborhood {
    bool valid = false;
    core::PixelCoordinate coordinate;
    EdgeMask mask;
    std::array<std::array<core::Sample, 3>, 3> samples{};

    core::Sample at(int row, int col) const { return samples[row][col]; }
    core::Sample center() const { return samples[1][1]; }
};

/**
 * @brief Three-column delay line
 *
 * Column 0 is the newest push, column 1 the centre, column 2 the oldest. The
 * centre lags the newest request by one column, so the neighborhood always
 * describes the coordinate carried by column 1, never the newest request.
 */
class PixelWindow {
public:
    static constexpr int kDepth = 3;

    void reset();

    /**
     * @brief Shift every column one place and insert the newest
     */
    void shift(const WindowColumn& newest);

    /**
     * @brief Masked neighborhood for the current centre column
     *
     * Invalid unless the centre column is a PIXEL.
     */
    Neighborhood neighborhood(const FrameConfig& frame) const;

    const WindowColumn& column(int index) const { return columns_[index]; }

private:
    std::array<WindowColumn, kDepth> columns_{};
};

} // namespace stream
} // namespace bayerflow

#endif // BAYERFLOW_STREAM_PIXEL_WINDOW_HPP
