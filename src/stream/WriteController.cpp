#include "bayerflow/stream/WriteController.hpp"

namespace bayerflow {
namespace stream {

constexpr uint32_t WriteController::kPrimingLines;

void WriteController::reset() {
    state_ = State::IDLE;
    column_ = 0;
    rows_ = 0;
    bufferedEnough_ = false;
    allWritten_ = false;
}

void WriteController::start() {
    reset();
    state_ = State::STREAMING;
}

bool WriteController::step(const FrameConfig& frame, LineBufferPool& pool,
                           bool valid, core::Sample sample) {
    if (!valid || !ready(pool)) {
        return false;
    }

    pool.write(column_, sample);

    if (column_ < frame.lastColumn()) {
        ++column_;
        return false;
    }

    column_ = 0;
    ++rows_;
    if (rows_ == kPrimingLines) {
        bufferedEnough_ = true;
    }
    if (rows_ == frame.height()) {
        state_ = State::DRAINED;
        allWritten_ = true;
    }
    return true;
}

std::string WriteController::stateToString(State state) {
    switch (state) {
        case State::IDLE:      return "IDLE";
        case State::STREAMING: return "STREAMING";
        case State::DRAINED:   return "DRAINED";
        default:               return "UNKNOWN";
    }
}

} // namespace stream
} // namespace bayerflow
