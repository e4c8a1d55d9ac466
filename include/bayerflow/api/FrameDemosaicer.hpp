/**
 * @file FrameDemosaicer.hpp
 * @brief Whole-frame adapter around the streaming demosaic core
 *
 * Streams a single-channel OpenCV mosaic through DemosaicCore, one sample per
 * accepted handshake, and assembles the reconstructed three-channel image.
 */

#ifndef BAYERFLOW_API_FRAME_DEMOSAICER_HPP
#define BAYERFLOW_API_FRAME_DEMOSAICER_HPP

#include "bayerflow/core/types.hpp"
#include "bayerflow/stream/DemosaicCore.hpp"

#include <opencv2/core.hpp>
#include <chrono>
#include <cstdint>
#include <string>

namespace bayerflow {

namespace core {
    class Logger;
}

namespace api {

/**
 * @brief Drives a DemosaicCore with cv::Mat frames
 *
 * Accepts CV_8UC1 or CV_16UC1 mosaics and returns CV_8UC3 or CV_16UC3
 * images of the same size.
 */
class FrameDemosaicer {
public:
    /**
     * @brief Channel order of the returned image
     */
    enum class ChannelOrder {
        BGR,    ///< OpenCV native order
        RGB
    };

    /**
     * @brief Deterministic flow-control pattern on both stream ends
     *
     * A value of N > 0 stalls every Nth tick; 0 disables the stall.
     */
    struct StallPattern {
        uint32_t producerIdleEvery = 0;     ///< Producer withholds valid
        uint32_t consumerBlockEvery = 0;    ///< Consumer withholds ready
    };

    struct Options {
        ChannelOrder channelOrder = ChannelOrder::BGR;
        StallPattern stalls;
        uint64_t tickBudget = 0;            ///< 0 picks a budget from the frame size
    };

    /**
     * @brief Frame result
     */
    struct Result {
        cv::Mat image;                      ///< Reconstructed frame

        bool success = false;
        std::string errorMessage;

        // Statistics
        uint64_t ticks = 0;                 ///< Clock ticks to drain the frame
        uint64_t inputStalls = 0;           ///< Offered samples refused by backpressure
        uint64_t outputStalls = 0;          ///< Ticks a valid pixel waited for the consumer
        uint64_t firstOutputLatency = 0;    ///< Tick of the first output transfer
        std::chrono::microseconds processingTime{0};
    };

    /**
     * @throws core::ConfigurationException for an unusable CoreConfig
     */
    explicit FrameDemosaicer(const core::CoreConfig& coreConfig,
                             core::Logger* logger = nullptr);

    void setOptions(const Options& options) { options_ = options; }
    const Options& getOptions() const { return options_; }

    const core::CoreConfig& getCoreConfig() const { return core_.config(); }

    /**
     * @brief Demosaic one frame
     *
     * Never throws; failures are reported through Result::success.
     */
    Result process(const cv::Mat& mosaic);

private:
    uint64_t tickBudgetFor(const cv::Mat& mosaic) const;

    void storePixel(cv::Mat& image, const stream::OutputPixel& pixel) const;

    core::Logger* logger_;
    Options options_;
    stream::DemosaicCore core_;
};

} // namespace api
} // namespace bayerflow

#endif // BAYERFLOW_API_FRAME_DEMOSAICER_HPP
