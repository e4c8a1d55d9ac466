/**
 * @file DemosaicCore.hpp
 * @brief Tick-driven streaming demosaic core
 *
 * Owns the line buffer pool, both controllers, the pixel window and the blend
 * engine, and implements the producer and consumer handshakes. Every call to
 * tick() is one clock edge: the handshakes are sampled against the state
 * registered before the call, then every register advances at once.
 */

#ifndef BAYERFLOW_STREAM_DEMOSAIC_CORE_HPP
#define BAYERFLOW_STREAM_DEMOSAIC_CORE_HPP

#include "bayerflow/core/types.hpp"
#include "bayerflow/stream/BlendEngine.hpp"
#include "bayerflow/stream/FrameConfig.hpp"
#include "bayerflow/stream/LineBufferPool.hpp"
#include "bayerflow/stream/PixelWindow.hpp"
#include "bayerflow/stream/ReadController.hpp"
#include "bayerflow/stream/WriteController.hpp"

#include <cstdint>
#include <memory>

namespace bayerflow {
namespace stream {

/**
 * @brief Signals driven into the core for one tick
 */
struct TickInputs {
    core::Sample sample = 0;
    bool inputValid = false;    ///< Producer presents a sample
    bool outputReady = true;    ///< Consumer accepts the output register
};

/**
 * @brief What moved across the two handshakes during a tick
 */
struct TickResult {
    bool inputAccepted = false;
    bool outputTransferred = false;
    OutputPixel pixel;          ///< Valid only when outputTransferred
};

class DemosaicCore {
public:
    /**
     * Ticks from an accepted read request to its pixel in the output
     * register: store 1, window 3, blend 2
     */
    static constexpr uint32_t kPipelineLatency = 6;

    /**
     * @throws core::ConfigurationException for an unusable CoreConfig
     */
    explicit DemosaicCore(const core::CoreConfig& config);

    // ========== Control ==========

    /**
     * @brief Clear every register, cursor and counter; no frame is armed
     */
    void reset();

    /**
     * @brief Reset and arm the core for a frame of the given bounds
     *
     * @throws core::ConfigurationException if the geometry is rejected; the
     *         core is left reset and idle
     */
    void startFrame(const core::FrameGeometry& geometry);

    // ========== Handshakes ==========

    bool inputReady() const;
    bool outputValid() const { return output_.valid; }
    const OutputPixel& outputPixel() const { return output_; }

    /**
     * @brief Advance one clock
     */
    TickResult tick(const TickInputs& inputs);

    // ========== Status ==========

    bool frameActive() const { return frame_ != nullptr; }

    /**
     * Every pixel of the armed frame has left through the output handshake
     */
    bool frameComplete() const;

    uint32_t fillCount() const { return pool_.fillCount(); }
    WriteController::State writeState() const { return writer_.state(); }
    ReadController::State readState() const { return reader_.state(); }
    uint64_t tickCount() const { return ticks_; }
    uint64_t pixelsAccepted() const { return accepted_; }
    uint64_t pixelsEmitted() const { return emitted_; }

    const core::CoreConfig& config() const { return config_; }
    const LineBufferPool& pool() const { return pool_; }

private:
    static const core::CoreConfig& validated(const core::CoreConfig& config);

    WindowColumn fetchColumn(const ReadRequest& request) const;

    core::CoreConfig config_;
    std::unique_ptr<FrameConfig> frame_;

    LineBufferPool pool_;
    WriteController writer_;
    ReadController reader_;
    PixelWindow window_;
    BlendEngine blender_;

    // Pipeline registers, oldest stage last
    WindowColumn readStage_;
    Neighborhood neighborhood_;
    BlendCandidates blendStage_;
    OutputPixel output_;

    uint64_t ticks_ = 0;
    uint64_t accepted_ = 0;
    uint64_t emitted_ = 0;
    bool primed_ = false;
};

} // namespace stream
} // namespace bayerflow

#endif // BAYERFLOW_STREAM_DEMOSAIC_CORE_HPP
