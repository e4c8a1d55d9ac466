/**
 * @file BlendEngine.hpp
 * @brief Edge-masked bilinear blends and CFA channel assignment
 */

#ifndef BAYERFLOW_STREAM_BLEND_ENGINE_HPP
#define BAYERFLOW_STREAM_BLEND_ENGINE_HPP

#include "bayerflow/core/types.hpp"
#include "bayerflow/stream/PixelWindow.hpp"

#include <cstdint>

namespace bayerflow {
namespace stream {

/**
 * @brief Stage 1 result: every candidate value for one coordinate
 */
struct BlendCandidates {
    bool valid = false;
    core::PixelCoordinate coordinate;
    uint32_t phase = 0;
    core::Sample center = 0;
    core::Sample corner = 0;        ///< In-bounds diagonals averaged
    core::Sample vertical = 0;      ///< Top and bottom
    core::Sample horizontal = 0;    ///< Left and right
    core::Sample cross = 0;         ///< In-bounds orthogonal neighbors averaged
};

/**
 * @brief Registered output of the core
 */
struct OutputPixel {
    bool valid = false;
    core::PixelCoordinate coordinate;
    core::RgbPixel rgb;
};

/**
 * @brief Two-stage blend pipeline
 *
 * Stage 1 (computeCandidates) forms the centre, corner, vertical, horizontal
 * and cross values from a masked neighborhood; stage 2 (selectChannels)
 * routes them to R, G and B by filter phase:
 *
 * | Phase | R          | G      | B          |
 * |-------|------------|--------|------------|
 * | 0     | center     | corner | cross      |
 * | 1     | vertical   | center | horizontal |
 * | 2     | horizontal | center | vertical   |
 * | 3     | cross      | corner | center     |
 */
class BlendEngine {
public:
    enum Phase : uint32_t {
        PHASE_RED = 0,
        PHASE_GREEN_EVEN_ROW = 1,
        PHASE_GREEN_ODD_ROW = 2,
        PHASE_BLUE = 3
    };

    explicit BlendEngine(const core::CoreConfig& config);

    BlendCandidates computeCandidates(const Neighborhood& neighborhood) const;

    OutputPixel selectChannels(const BlendCandidates& candidates) const;

    /**
     * @brief Both stages in one call
     */
    OutputPixel blend(const Neighborhood& neighborhood) const {
        return selectChannels(computeCandidates(neighborhood));
    }

    /**
     * @brief Filter phase of a coordinate under the configured layout
     */
    uint32_t phaseAt(const core::PixelCoordinate& coordinate) const;

    /**
     * @brief sum * (1/4 + 1/16 + 1/64 + 1/1024) as one shift-and-add product
     *
     * Equals (sum * 337) >> 10. Never exceeds floor(sum / 3); the shortfall
     * is below 0.00424 * sum + 1, i.e. at most 2 for sums up to 472 and at
     * most 4 for any sum of three 8-bit samples.
     */
    static uint32_t approxDivideBy3(uint32_t sum) {
        return ((sum << 8) + (sum << 6) + (sum << 4) + sum) >> 10;
    }

    uint32_t divideBy3(uint32_t sum) const {
        return divisionMode_ == core::DivisionMode::EXACT ? sum / 3 : approxDivideBy3(sum);
    }

private:
    core::DivisionMode divisionMode_;
    uint32_t rowOffset_;
    uint32_t columnOffset_;
};

} // namespace stream
} // namespace bayerflow

#endif // BAYERFLOW_STREAM_BLEND_ENGINE_HPP
