#include "bayerflow/stream/DemosaicCore.hpp"
#include "bayerflow/core/Logger.hpp"
#include "bayerflow/core/exception.h"

#include <memory>
#include <string>

namespace bayerflow {
namespace stream {

constexpr uint32_t DemosaicCore::kPipelineLatency;

const core::CoreConfig& DemosaicCore::validated(const core::CoreConfig& config) {
    if (config.bufferCount < LineBufferPool::kMinimumCapacity) {
        BAYERFLOW_THROW(core::ConfigurationException,
                        "buffer_count must be at least " +
                        std::to_string(LineBufferPool::kMinimumCapacity) +
                        ", got " + std::to_string(config.bufferCount));
    }
    if (config.sampleBits < 1 || config.sampleBits > 16) {
        BAYERFLOW_THROW(core::ConfigurationException,
                        "sample_bits must be in [1, 16], got " + std::to_string(config.sampleBits));
    }
    if (config.maxLineWidth < 2) {
        BAYERFLOW_THROW(core::ConfigurationException,
                        "max_line_width must be at least 2, got " +
                        std::to_string(config.maxLineWidth));
    }
    return config;
}

DemosaicCore::DemosaicCore(const core::CoreConfig& config)
    : config_(validated(config))
    , pool_(config_.bufferCount, config_.maxLineWidth)
    , blender_(config_)
{
    BAYERFLOW_LOG_DEBUG("DemosaicCore") << "Created: " << config_.bufferCount << " buffers x "
                                        << config_.maxLineWidth << " samples, "
                                        << config_.sampleBits << "-bit "
                                        << core::cfaPatternToString(config_.pattern) << ", "
                                        << core::divisionModeToString(config_.divideByThree)
                                        << " divide-by-three";
}

void DemosaicCore::reset() {
    frame_.reset();
    pool_.configure(config_.maxLineWidth);
    writer_.reset();
    reader_.reset();
    window_.reset();

    readStage_ = WindowColumn();
    neighborhood_ = Neighborhood();
    blendStage_ = BlendCandidates();
    output_ = OutputPixel();

    ticks_ = 0;
    accepted_ = 0;
    emitted_ = 0;
    primed_ = false;

    LOG_DEBUG("DemosaicCore reset");
}

void DemosaicCore::startFrame(const core::FrameGeometry& geometry) {
    reset();

    try {
        frame_ = std::make_unique<FrameConfig>(FrameConfig::capture(geometry, config_));
    } catch (const core::ConfigurationException& e) {
        BAYERFLOW_LOG_WARNING("DemosaicCore") << "Frame rejected: " << e.getMessage();
        throw;
    }

    pool_.configure(frame_->width());
    writer_.start();

    BAYERFLOW_LOG_INFO("DemosaicCore") << "Frame started: " << frame_->width() << "x"
                                       << frame_->height();
}

bool DemosaicCore::inputReady() const {
    return frame_ != nullptr && writer_.ready(pool_);
}

bool DemosaicCore::frameComplete() const {
    return frame_ != nullptr && emitted_ == frame_->pixelCount();
}

WindowColumn DemosaicCore::fetchColumn(const ReadRequest& request) const {
    WindowColumn column;
    column.kind = request.kind;
    column.line = request.line;
    column.column = request.column;

    if (request.kind != ColumnKind::PIXEL) {
        return column;
    }

    // The first line has no line above; its centre row is the oldest buffer
    if (request.line == 0) {
        column.samples[0] = 0;
        column.samples[1] = pool_.read0(request.column);
        column.samples[2] = pool_.read1(request.column);
    } else {
        column.samples[0] = pool_.read0(request.column);
        column.samples[1] = pool_.read1(request.column);
        column.samples[2] = pool_.read2(request.column);
    }
    return column;
}

TickResult DemosaicCore::tick(const TickInputs& inputs) {
    TickResult result;
    ++ticks_;

    if (!frame_) {
        return result;
    }

    // Handshakes sample the registered state
    const bool inReady = writer_.ready(pool_);
    const bool outValid = output_.valid;

    result.inputAccepted = inputs.inputValid && inReady;
    if (outValid && inputs.outputReady) {
        result.outputTransferred = true;
        result.pixel = output_;
        ++emitted_;
    }

    // The whole read pipeline holds while an unconsumed pixel sits in the output register
    const bool pipeEnable = !outValid || inputs.outputReady;

    ReadRequest request;
    WindowColumn fetched;
    if (pipeEnable) {
        const ReadController::State before = reader_.state();
        request = reader_.step(*frame_, pool_.fillCount(),
                               writer_.bufferedEnough(), writer_.allWritten());
        fetched = fetchColumn(request);

        if (!primed_ && before == ReadController::State::WAITING &&
            reader_.state() == ReadController::State::EMITTING) {
            primed_ = true;
            BAYERFLOW_LOG_DEBUG("DemosaicCore") << "Frame primed after " << ticks_ << " ticks, "
                                                << pool_.fillCount() << " lines buffered";
        }
    }

    const core::Sample sample = static_cast<core::Sample>(inputs.sample & config_.maxSample());
    const bool lineComplete = writer_.step(*frame_, pool_, inputs.inputValid, sample);
    if (result.inputAccepted) {
        ++accepted_;
    }

    pool_.advance(lineComplete, request.retireCount);

    if (pipeEnable) {
        output_ = blender_.selectChannels(blendStage_);
        blendStage_ = blender_.computeCandidates(neighborhood_);
        neighborhood_ = window_.neighborhood(*frame_);
        window_.shift(readStage_);
        readStage_ = fetched;
    }

    if (result.outputTransferred && frameComplete()) {
        BAYERFLOW_LOG_INFO("DemosaicCore") << "Frame complete: " << emitted_ << " pixels in "
                                           << ticks_ << " ticks";
    }

    return result;
}

} // namespace stream
} // namespace bayerflow
