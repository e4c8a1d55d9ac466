#include "bayerflow/stream/PixelWindow.hpp"

namespace bayerflow {
namespace stream {

constexpr int PixelWindow::kDepth;

void PixelWindow::reset() {
    columns_.fill(WindowColumn());
}

void PixelWindow::shift(const WindowColumn& newest) {
    columns_[2] = columns_[1];
    columns_[1] = columns_[0];
    columns_[0] = newest;
}

Neighborhood PixelWindow::neighborhood(const FrameConfig& frame) const {
    Neighborhood result;
    const WindowColumn& centre = columns_[1];
    if (centre.kind != ColumnKind::PIXEL) {
        return result;
    }

    result.valid = true;
    result.coordinate.line = centre.line;
    result.coordinate.column = centre.column;
    result.mask = EdgeMask::forCoordinate(result.coordinate, frame);

    // Grid column 0 (left) is the oldest window column
    const WindowColumn* sources[3] = {&columns_[2], &columns_[1], &columns_[0]};
    for (int col = 0; col < 3; ++col) {
        for (int row = 0; row < 3; ++row) {
            result.samples[row][col] = sources[col]->samples[row];
        }
    }

    if (result.mask.isTopEdge) {
        result.samples[0].fill(0);
    }
    if (result.mask.isBottomEdge) {
        result.samples[2].fill(0);
    }
    for (int row = 0; row < 3; ++row) {
        if (result.mask.isLeftEdge) {
            result.samples[row][0] = 0;
        }
        if (result.mask.isRightEdge) {
            result.samples[row][2] = 0;
        }
    }

    return result;
}

} // namespace stream
} // namespace bayerflow
