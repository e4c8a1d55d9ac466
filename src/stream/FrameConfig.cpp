#include "bayerflow/stream/FrameConfig.hpp"
#include "bayerflow/core/exception.h"

#include <limits>
#include <string>

namespace bayerflow {
namespace stream {

FrameConfig FrameConfig::capture(const core::FrameGeometry& geometry,
                                 const core::CoreConfig& coreConfig) {
    const uint64_t width = static_cast<uint64_t>(geometry.frameWidthMinusOne) + 1;
    const uint64_t height = static_cast<uint64_t>(geometry.frameHeightMinusOne) + 1;

    // A 1-sample line or column has no complete filter-array period
    if (width < 2 || height < 2) {
        BAYERFLOW_THROW(core::ConfigurationException,
                        "Frame must be at least 2x2, got " + std::to_string(width) +
                        "x" + std::to_string(height));
    }
    if (width > coreConfig.maxLineWidth) {
        BAYERFLOW_THROW(core::ConfigurationException,
                        "Frame width " + std::to_string(width) +
                        " exceeds line buffer length " + std::to_string(coreConfig.maxLineWidth));
    }
    if (geometry.frameHeightMinusOne == std::numeric_limits<uint32_t>::max()) {
        BAYERFLOW_THROW(core::ConfigurationException, "Frame height overflows line counter");
    }

    return FrameConfig(geometry.frameWidthMinusOne, geometry.frameHeightMinusOne);
}

} // namespace stream
} // namespace bayerflow
