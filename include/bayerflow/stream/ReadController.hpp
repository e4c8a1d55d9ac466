/**
 * @file ReadController.hpp
 * @brief Output side state machine: line buffer pool -> pixel window
 */

#ifndef BAYERFLOW_STREAM_READ_CONTROLLER_HPP
#define BAYERFLOW_STREAM_READ_CONTROLLER_HPP

#include "bayerflow/stream/FrameConfig.hpp"

#include <cstdint>
#include <string>

namespace bayerflow {
namespace stream {

/**
 * @brief What enters the pixel window on a tick
 */
enum class ColumnKind {
    BUBBLE,     ///< Nothing requested (waiting, complete, or after reset)
    PIXEL,      ///< A pool read at (line, column)
    FLUSH       ///< Line-pause column pushed past the right edge
};

/**
 * @brief One tick's request from the read side
 */
struct ReadRequest {
    ColumnKind kind = ColumnKind::BUBBLE;
    uint32_t line = 0;
    uint32_t column = 0;
    uint32_t retireCount = 0;   ///< Buffers to retire at the end of this tick
};

/**
 * @brief Paces pool reads and retires buffers at line boundaries
 *
 * WAITING until enough lines are buffered, EMITTING one read per enabled
 * tick, LINE_PAUSE for exactly one tick after each line, COMPLETE after the
 * last line of the frame.
 *
 * Retirement: the first output line takes its centre row from the oldest
 * buffer, so its line end retires nothing. Later lines retire one buffer
 * each, and the final line retires the last two.
 */
class ReadController {
public:
    enum class State {
        WAITING,
        EMITTING,
        LINE_PAUSE,
        COMPLETE
    };

    static constexpr uint32_t kWindowLines = 3;

    ReadController() = default;

    void reset();

    /**
     * @brief One enabled tick
     *
     * Only called when the output pipeline can move. The returned request is
     * issued against the pool state registered at the start of the tick.
     *
     * @param fillCount Pool fill level at the start of the tick
     * @param bufferedEnough Write side has buffered the first three lines
     * @param allWritten Write side has finished the frame
     */
    ReadRequest step(const FrameConfig& frame, uint32_t fillCount,
                     bool bufferedEnough, bool allWritten);

    State state() const { return state_; }
    uint32_t outputLine() const { return line_; }
    uint32_t outputColumn() const { return column_; }

    static std::string stateToString(State state);

private:
    static bool canEmit(uint32_t fillCount, bool bufferedEnough, bool allWritten) {
        return allWritten || (bufferedEnough && fillCount >= kWindowLines);
    }

    State state_ = State::WAITING;
    uint32_t line_ = 0;
    uint32_t column_ = 0;
};

} // namespace stream
} // namespace bayerflow

#endif // BAYERFLOW_STREAM_READ_CONTROLLER_HPP
