#include "bayerflow/stream/LineBufferPool.hpp"
#include "bayerflow/core/exception.h"

#include <algorithm>
#include <string>

namespace bayerflow {
namespace stream {

constexpr uint32_t LineBufferPool::kReadPorts;
constexpr uint32_t LineBufferPool::kMinimumCapacity;

LineBufferPool::LineBufferPool(uint32_t capacity, uint32_t maxLineWidth) {
    if (capacity < kMinimumCapacity) {
        BAYERFLOW_THROW(core::ConfigurationException,
                        "Line buffer pool needs at least " + std::to_string(kMinimumCapacity) +
                        " buffers, got " + std::to_string(capacity));
    }
    if (maxLineWidth == 0) {
        BAYERFLOW_THROW(core::ConfigurationException, "Line buffer length must be non-zero");
    }

    buffers_.assign(capacity, std::vector<core::Sample>(maxLineWidth, 0));
    lineWidth_ = maxLineWidth;
}

void LineBufferPool::configure(uint32_t lineWidth) {
    if (lineWidth == 0 || lineWidth > buffers_.front().size()) {
        BAYERFLOW_THROW(core::ConfigurationException,
                        "Line width " + std::to_string(lineWidth) + " does not fit the pool");
    }

    lineWidth_ = lineWidth;
    writeCursor_ = 0;
    oldest_ = 0;
    fillCount_ = 0;

    // New frames start from zeroed storage
    for (auto& buffer : buffers_) {
        std::fill(buffer.begin(), buffer.begin() + lineWidth_, core::Sample(0));
    }
}

void LineBufferPool::advance(bool completeLine, uint32_t retireCount) {
    const uint32_t added = completeLine ? 1u : 0u;

    if (retireCount > fillCount_) {
        BAYERFLOW_THROW_CODE(core::StreamException, core::ResultCode::ERROR_INVARIANT_VIOLATION,
                             "Retiring " + std::to_string(retireCount) + " buffers with only " +
                             std::to_string(fillCount_) + " filled");
    }
    if (completeLine && fillCount_ >= capacity()) {
        BAYERFLOW_THROW_CODE(core::StreamException, core::ResultCode::ERROR_INVARIANT_VIOLATION,
                             "Line completed into a full pool");
    }

    if (completeLine) {
        writeCursor_ = (writeCursor_ + 1) % capacity();
    }
    oldest_ = (oldest_ + retireCount) % capacity();
    fillCount_ = fillCount_ + added - retireCount;
}

} // namespace stream
} // namespace bayerflow
