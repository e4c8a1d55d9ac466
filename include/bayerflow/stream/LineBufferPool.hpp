/**
 * @file LineBufferPool.hpp
 * @brief Circular pool of line buffers ("ring of lines")
 *
 * Each buffer models a dual-port store: one write port driven by the write
 * cursor and one read port driven by one of the three read cursors. The
 * cursors are plain modular indices into the buffer array.
 */

#ifndef BAYERFLOW_STREAM_LINE_BUFFER_POOL_HPP
#define BAYERFLOW_STREAM_LINE_BUFFER_POOL_HPP

#include "bayerflow/core/types.hpp"

#include <cstdint>
#include <vector>

namespace bayerflow {
namespace stream {

/**
 * @brief Fixed-capacity ring of fixed-width line buffers
 *
 * Buffers between the oldest unretired one and the write cursor hold
 * complete lines. The three read cursors always sit at offsets 0, 1 and 2
 * from the oldest buffer; the write cursor sits at offset fillCount(), so it
 * is disjoint from the read buffers whenever three or more lines are
 * buffered.
 */
class LineBufferPool {
public:
    static constexpr uint32_t kReadPorts = 3;
    static constexpr uint32_t kMinimumCapacity = kReadPorts + 1;

    /**
     * @param capacity Number of line buffers (BUFFER_SIZE, at least 4)
     * @param maxLineWidth Storage allocated per buffer
     */
    LineBufferPool(uint32_t capacity, uint32_t maxLineWidth);

    /**
     * @brief Empty the pool and set the line length for a new frame
     */
    void configure(uint32_t lineWidth);

    /**
     * @brief Store a sample in the buffer under the write cursor
     *
     * Precondition: fillCount() < capacity() and column < lineWidth().
     */
    void write(uint32_t column, core::Sample value) {
        buffers_[writeCursor_][column] = value;
    }

    /**
     * @brief Apply the cursor updates of one tick
     *
     * @param completeLine The write cursor moves to the next buffer
     * @param retireCount Oldest buffers released this tick (0, 1 or 2)
     *
     * A completed line and a single retirement in the same tick leave the
     * fill count unchanged.
     *
     * @throws core::StreamException when the write side overflows or more
     *         buffers are retired than are held
     */
    void advance(bool completeLine, uint32_t retireCount);

    void advanceWrite() { advance(true, 0); }
    void advanceRead1() { advance(false, 1); }
    void advanceRead2() { advance(false, 2); }

    core::Sample read0(uint32_t column) const { return buffers_[readCursor(0)][column]; }
    core::Sample read1(uint32_t column) const { return buffers_[readCursor(1)][column]; }
    core::Sample read2(uint32_t column) const { return buffers_[readCursor(2)][column]; }

    uint32_t fillCount() const { return fillCount_; }
    uint32_t capacity() const { return static_cast<uint32_t>(buffers_.size()); }
    uint32_t lineWidth() const { return lineWidth_; }
    uint32_t writeCursor() const { return writeCursor_; }

    /**
     * @brief Buffer index behind read cursor 0, 1 or 2
     */
    uint32_t readCursor(uint32_t port) const {
        return (oldest_ + port) % capacity();
    }

    bool isFull() const { return fillCount_ >= capacity(); }

private:
    std::vector<std::vector<core::Sample>> buffers_;
    uint32_t lineWidth_ = 0;
    uint32_t writeCursor_ = 0;
    uint32_t oldest_ = 0;
    uint32_t fillCount_ = 0;
};

} // namespace stream
} // namespace bayerflow

#endif // BAYERFLOW_STREAM_LINE_BUFFER_POOL_HPP
