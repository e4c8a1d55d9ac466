/**
 * @file WriteController.hpp
 * @brief Input side state machine: stream -> line buffer pool
 */

#ifndef BAYERFLOW_STREAM_WRITE_CONTROLLER_HPP
#define BAYERFLOW_STREAM_WRITE_CONTROLLER_HPP

#include "bayerflow/core/types.hpp"
#include "bayerflow/stream/FrameConfig.hpp"
#include "bayerflow/stream/LineBufferPool.hpp"

#include <cstdint>
#include <string>

namespace bayerflow {
namespace stream {

/**
 * @brief Accepts input samples under backpressure and fills the pool
 *
 * IDLE until a frame is armed, STREAMING while rows remain, DRAINED once the
 * last row of the frame is complete. Ready is a pure function of the
 * registered state and the pool fill level.
 */
class WriteController {
public:
    enum class State {
        IDLE,
        STREAMING,
        DRAINED
    };

    /**
     * Lines that must be buffered before the read side may start
     */
    static constexpr uint32_t kPrimingLines = 3;

    WriteController() = default;

    /**
     * @brief Return to IDLE, discarding any partial row
     */
    void reset();

    /**
     * @brief Arm for a new frame (IDLE -> STREAMING)
     */
    void start();

    /**
     * @brief Backpressure towards the producer
     */
    bool ready(const LineBufferPool& pool) const {
        return state_ == State::STREAMING && !pool.isFull();
    }

    /**
     * @brief One tick of the input handshake
     *
     * Writes the sample when valid and ready both hold. Returns true when the
     * sample completed a line; the caller folds that into the pool's cursor
     * update for the tick.
     */
    bool step(const FrameConfig& frame, LineBufferPool& pool,
              bool valid, core::Sample sample);

    State state() const { return state_; }
    uint32_t column() const { return column_; }
    uint32_t rowsWritten() const { return rows_; }

    /**
     * Three complete lines are buffered; the read side may begin
     */
    bool bufferedEnough() const { return bufferedEnough_; }

    /**
     * Every line of the frame has been written
     */
    bool allWritten() const { return allWritten_; }

    static std::string stateToString(State state);

private:
    State state_ = State::IDLE;
    uint32_t column_ = 0;
    uint32_t rows_ = 0;
    bool bufferedEnough_ = false;
    bool allWritten_ = false;
};

} // namespace stream
} // namespace bayerflow

#endif // BAYERFLOW_STREAM_WRITE_CONTROLLER_HPP
