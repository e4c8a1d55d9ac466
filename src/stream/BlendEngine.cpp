#include "bayerflow/stream/BlendEngine.hpp"

namespace bayerflow {
namespace stream {

BlendEngine::BlendEngine(const core::CoreConfig& config)
    : divisionMode_(config.divideByThree)
    , rowOffset_(0)
    , columnOffset_(0)
{
    // Shift each layout so that phase 0 lands on its red site
    switch (config.pattern) {
        case core::CfaPattern::RGGB: rowOffset_ = 0; columnOffset_ = 0; break;
        case core::CfaPattern::GRBG: rowOffset_ = 0; columnOffset_ = 1; break;
        case core::CfaPattern::GBRG: rowOffset_ = 1; columnOffset_ = 0; break;
        case core::CfaPattern::BGGR: rowOffset_ = 1; columnOffset_ = 1; break;
    }
}

uint32_t BlendEngine::phaseAt(const core::PixelCoordinate& coordinate) const {
    return (((coordinate.line + rowOffset_) & 1u) << 1) |
           ((coordinate.column + columnOffset_) & 1u);
}

BlendCandidates BlendEngine::computeCandidates(const Neighborhood& n) const {
    BlendCandidates out;
    if (!n.valid) {
        return out;
    }

    const EdgeMask& mask = n.mask;
    // At most two sides: frames are at least 2x2
    const uint32_t sidesMasked = mask.sidesMasked();

    out.valid = true;
    out.coordinate = n.coordinate;
    out.phase = phaseAt(n.coordinate);
    out.center = n.center();

    // Masked positions are already zero; the divisors count what is left.
    // Diagonals: 4, 2 or 1 in bounds for 0, 1 or 2 masked sides.
    const uint32_t diagonalSum = uint32_t(n.at(0, 0)) + n.at(0, 2) + n.at(2, 0) + n.at(2, 2);
    out.corner = static_cast<core::Sample>(diagonalSum >> (2u - sidesMasked));

    const uint32_t top = n.at(0, 1);
    const uint32_t bottom = n.at(2, 1);
    const uint32_t left = n.at(1, 0);
    const uint32_t right = n.at(1, 2);

    const bool verticalPair = !mask.isTopEdge && !mask.isBottomEdge;
    const bool horizontalPair = !mask.isLeftEdge && !mask.isRightEdge;
    out.vertical = static_cast<core::Sample>(verticalPair ? (top + bottom) >> 1 : top + bottom);
    out.horizontal = static_cast<core::Sample>(horizontalPair ? (left + right) >> 1 : left + right);

    // Orthogonals: 4 - sidesMasked in bounds
    const uint32_t crossSum = top + bottom + left + right;
    switch (sidesMasked) {
        case 0:
            out.cross = static_cast<core::Sample>(crossSum >> 2);
            break;
        case 1:
            out.cross = static_cast<core::Sample>(divideBy3(crossSum));
            break;
        default:
            out.cross = static_cast<core::Sample>(crossSum >> 1);
            break;
    }

    return out;
}

OutputPixel BlendEngine::selectChannels(const BlendCandidates& c) const {
    OutputPixel out;
    if (!c.valid) {
        return out;
    }

    out.valid = true;
    out.coordinate = c.coordinate;

    switch (c.phase) {
        case PHASE_RED:
            out.rgb.r = c.center;
            out.rgb.g = c.corner;
            out.rgb.b = c.cross;
            break;
        case PHASE_GREEN_EVEN_ROW:
            out.rgb.r = c.vertical;
            out.rgb.g = c.center;
            out.rgb.b = c.horizontal;
            break;
        case PHASE_GREEN_ODD_ROW:
            out.rgb.r = c.horizontal;
            out.rgb.g = c.center;
            out.rgb.b = c.vertical;
            break;
        case PHASE_BLUE:
        default:
            out.rgb.r = c.cross;
            out.rgb.g = c.corner;
            out.rgb.b = c.center;
            break;
    }

    return out;
}

} // namespace stream
} // namespace bayerflow
