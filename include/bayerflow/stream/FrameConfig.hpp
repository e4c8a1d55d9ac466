/**
 * @file FrameConfig.hpp
 * @brief Immutable per-frame bounds captured at frame start
 */

#ifndef BAYERFLOW_STREAM_FRAME_CONFIG_HPP
#define BAYERFLOW_STREAM_FRAME_CONFIG_HPP

#include "bayerflow/core/types.hpp"

#include <cstdint>

namespace bayerflow {
namespace stream {

/**
 * @brief Validated frame bounds, threaded by const reference into both
 *        controllers and the blend path for the duration of one frame
 */
class FrameConfig {
public:
    /**
     * @brief Validate geometry against the core limits
     *
     * @throws core::ConfigurationException for frames narrower or shorter than
     *         2 samples, or wider than CoreConfig::maxLineWidth
     */
    static FrameConfig capture(const core::FrameGeometry& geometry,
                               const core::CoreConfig& coreConfig);

    uint32_t width() const { return lastColumn_ + 1; }
    uint32_t height() const { return lastLine_ + 1; }
    uint32_t lastColumn() const { return lastColumn_; }
    uint32_t lastLine() const { return lastLine_; }
    uint64_t pixelCount() const { return static_cast<uint64_t>(width()) * height(); }

private:
    FrameConfig(uint32_t lastColumn, uint32_t lastLine)
        : lastColumn_(lastColumn), lastLine_(lastLine) {}

    uint32_t lastColumn_;
    uint32_t lastLine_;
};

} // namespace stream
} // namespace bayerflow

#endif // BAYERFLOW_STREAM_FRAME_CONFIG_HPP
