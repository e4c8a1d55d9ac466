/**
 * @file FrameDemosaicer.cpp
 * @brief cv::Mat adapter for the streaming demosaic core
 */

#include "bayerflow/api/FrameDemosaicer.hpp"
#include "bayerflow/core/Logger.hpp"
#include "bayerflow/core/exception.h"

#include <string>

namespace bayerflow {
namespace api {

using namespace std::chrono;

FrameDemosaicer::FrameDemosaicer(const core::CoreConfig& coreConfig, core::Logger* logger)
    : logger_(logger ? logger : &core::Logger::getInstance())
    , core_(coreConfig)
{
}

uint64_t FrameDemosaicer::tickBudgetFor(const cv::Mat& mosaic) const {
    if (options_.tickBudget > 0) {
        return options_.tickBudget;
    }

    // One tick per pixel plus a pause per line, scaled for worst-case stall patterns
    const uint64_t pixels = static_cast<uint64_t>(mosaic.rows) * mosaic.cols;
    const uint64_t perFrame = pixels + 2 * static_cast<uint64_t>(mosaic.rows) +
                              stream::DemosaicCore::kPipelineLatency;
    return 4 * perFrame + 1024;
}

void FrameDemosaicer::storePixel(cv::Mat& image, const stream::OutputPixel& pixel) const {
    const int y = static_cast<int>(pixel.coordinate.line);
    const int x = static_cast<int>(pixel.coordinate.column);
    const core::RgbPixel& rgb = pixel.rgb;
    const bool bgr = options_.channelOrder == ChannelOrder::BGR;

    if (image.depth() == CV_8U) {
        cv::Vec3b& dst = image.at<cv::Vec3b>(y, x);
        dst[0] = static_cast<uchar>(bgr ? rgb.b : rgb.r);
        dst[1] = static_cast<uchar>(rgb.g);
        dst[2] = static_cast<uchar>(bgr ? rgb.r : rgb.b);
    } else {
        cv::Vec3w& dst = image.at<cv::Vec3w>(y, x);
        dst[0] = bgr ? rgb.b : rgb.r;
        dst[1] = rgb.g;
        dst[2] = bgr ? rgb.r : rgb.b;
    }
}

FrameDemosaicer::Result FrameDemosaicer::process(const cv::Mat& mosaic) {
    Result result;
    auto startTime = high_resolution_clock::now();

    if (mosaic.empty()) {
        result.errorMessage = "Empty mosaic";
        return result;
    }

    if (mosaic.type() != CV_8UC1 && mosaic.type() != CV_16UC1) {
        result.errorMessage = "Mosaic must be CV_8UC1 or CV_16UC1";
        return result;
    }

    try {
        const uint32_t width = static_cast<uint32_t>(mosaic.cols);
        const uint32_t height = static_cast<uint32_t>(mosaic.rows);
        const uint64_t pixels = static_cast<uint64_t>(width) * height;
        const uint64_t budget = tickBudgetFor(mosaic);
        const StallPattern& stalls = options_.stalls;

        double maxValue = 0.0;
        cv::minMaxLoc(mosaic, nullptr, &maxValue);
        const core::Sample maxSample = core_.config().maxSample();
        if (maxValue > maxSample) {
            BAYERFLOW_THROW(core::ConfigurationException,
                            "Mosaic value " + std::to_string(static_cast<long>(maxValue)) +
                            " exceeds " + std::to_string(core_.config().sampleBits) +
                            "-bit sample range (max " + std::to_string(maxSample) + ")");
        }

        core_.startFrame(core::FrameGeometry::fromSize(width, height));

        result.image.create(mosaic.rows, mosaic.cols, mosaic.depth() == CV_8U ? CV_8UC3 : CV_16UC3);

        uint64_t nextInput = 0;
        uint64_t nextOutput = 0;

        while (!core_.frameComplete()) {
            if (result.ticks >= budget) {
                BAYERFLOW_THROW_CODE(core::StreamException, core::ResultCode::ERROR_TIMEOUT,
                                     "Frame not drained after " + std::to_string(budget) +
                                     " ticks (" + std::to_string(nextOutput) + "/" +
                                     std::to_string(pixels) + " pixels)");
            }

            stream::TickInputs inputs;
            const bool producerIdle = stalls.producerIdleEvery > 0 &&
                result.ticks % stalls.producerIdleEvery == stalls.producerIdleEvery - 1;
            const bool consumerBlocked = stalls.consumerBlockEvery > 0 &&
                result.ticks % stalls.consumerBlockEvery == stalls.consumerBlockEvery - 1;

            if (nextInput < pixels && !producerIdle) {
                const int y = static_cast<int>(nextInput / width);
                const int x = static_cast<int>(nextInput % width);
                inputs.inputValid = true;
                inputs.sample = mosaic.depth() == CV_8U
                    ? static_cast<core::Sample>(mosaic.at<uchar>(y, x))
                    : mosaic.at<ushort>(y, x);
            }
            inputs.outputReady = !consumerBlocked;

            const bool holding = core_.outputValid() && !inputs.outputReady;
            const stream::TickResult tick = core_.tick(inputs);
            ++result.ticks;

            if (inputs.inputValid && !tick.inputAccepted) {
                ++result.inputStalls;
            }
            if (holding) {
                ++result.outputStalls;
            }
            if (tick.inputAccepted) {
                ++nextInput;
            }

            if (tick.outputTransferred) {
                const core::PixelCoordinate expected{
                    static_cast<uint32_t>(nextOutput / width),
                    static_cast<uint32_t>(nextOutput % width)};
                if (!(tick.pixel.coordinate == expected)) {
                    BAYERFLOW_THROW_CODE(core::StreamException,
                                         core::ResultCode::ERROR_PROTOCOL_VIOLATION,
                                         "Output out of raster order at pixel " +
                                         std::to_string(nextOutput));
                }
                if (nextOutput == 0) {
                    result.firstOutputLatency = result.ticks;
                }
                storePixel(result.image, tick.pixel);
                ++nextOutput;
            }
        }

        result.success = true;

    } catch (const core::Exception& e) {
        result.success = false;
        result.errorMessage = e.what();
        logger_->error("Demosaic failed: " + std::string(e.what()));
    } catch (const cv::Exception& e) {
        result.success = false;
        result.errorMessage = std::string("OpenCV error: ") + e.what();
        logger_->error("Demosaic failed: " + result.errorMessage);
    }

    auto endTime = high_resolution_clock::now();
    result.processingTime = duration_cast<microseconds>(endTime - startTime);

    if (result.success) {
        logger_->info("Demosaiced " + std::to_string(mosaic.cols) + "x" +
                      std::to_string(mosaic.rows) + " in " + std::to_string(result.ticks) +
                      " ticks (input stalls " + std::to_string(result.inputStalls) +
                      ", output stalls " + std::to_string(result.outputStalls) +
                      ", first output at tick " + std::to_string(result.firstOutputLatency) +
                      ", " + std::to_string(result.processingTime.count()) + " us)");
    }

    return result;
}

} // namespace api
} // namespace bayerflow
