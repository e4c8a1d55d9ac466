#include "bayerflow/stream/ReadController.hpp"

namespace bayerflow {
namespace stream {

constexpr uint32_t ReadController::kWindowLines;

void ReadController::reset() {
    state_ = State::WAITING;
    line_ = 0;
    column_ = 0;
}

ReadRequest ReadController::step(const FrameConfig& frame, uint32_t fillCount,
                                 bool bufferedEnough, bool allWritten) {
    ReadRequest request;

    switch (state_) {
        case State::WAITING:
            if (canEmit(fillCount, bufferedEnough, allWritten)) {
                state_ = State::EMITTING;
            }
            break;

        case State::EMITTING:
            request.kind = ColumnKind::PIXEL;
            request.line = line_;
            request.column = column_;

            if (column_ < frame.lastColumn()) {
                ++column_;
                break;
            }

            // Line boundary
            if (line_ == frame.lastLine()) {
                request.retireCount = 2;
            } else if (line_ > 0) {
                request.retireCount = 1;
            }
            column_ = 0;
            ++line_;
            state_ = State::LINE_PAUSE;
            break;

        case State::LINE_PAUSE:
            request.kind = ColumnKind::FLUSH;
            request.line = line_ - 1;
            request.column = frame.lastColumn() + 1;

            if (line_ > frame.lastLine()) {
                state_ = State::COMPLETE;
            } else if (canEmit(fillCount, bufferedEnough, allWritten)) {
                state_ = State::EMITTING;
            } else {
                state_ = State::WAITING;
            }
            break;

        case State::COMPLETE:
            break;
    }

    return request;
}

std::string ReadController::stateToString(State state) {
    switch (state) {
        case State::WAITING:    return "WAITING";
        case State::EMITTING:   return "EMITTING";
        case State::LINE_PAUSE: return "LINE_PAUSE";
        case State::COMPLETE:   return "COMPLETE";
        default:                return "UNKNOWN";
    }
}

} // namespace stream
} // namespace bayerflow
