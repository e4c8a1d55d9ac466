#include <iostream>
#include <memory>
#include <opencv2/opencv.hpp>
#include "bayerflow/bayerflow.h"

using namespace bayerflow;
using namespace std;

namespace {

// Sample a BGR image through the filter array to get a test mosaic
cv::Mat mosaicFromColor(const cv::Mat& bgr, core::CfaPattern pattern) {
    int rowOffset = 0;
    int colOffset = 0;
    switch (pattern) {
        case core::CfaPattern::RGGB: rowOffset = 0; colOffset = 0; break;
        case core::CfaPattern::GRBG: rowOffset = 0; colOffset = 1; break;
        case core::CfaPattern::GBRG: rowOffset = 1; colOffset = 0; break;
        case core::CfaPattern::BGGR: rowOffset = 1; colOffset = 1; break;
    }

    vector<cv::Mat> planes;
    cv::split(bgr, planes);
    cv::Mat mosaic(bgr.rows, bgr.cols, planes[0].type());

    for (int y = 0; y < bgr.rows; ++y) {
        for (int x = 0; x < bgr.cols; ++x) {
            const int phase = (((y + rowOffset) & 1) << 1) | ((x + colOffset) & 1);
            // Phase 0 red, 3 blue, otherwise green
            const int plane = phase == 0 ? 2 : (phase == 3 ? 0 : 1);
            if (mosaic.depth() == CV_8U) {
                mosaic.at<uchar>(y, x) = planes[plane].at<uchar>(y, x);
            } else {
                mosaic.at<ushort>(y, x) = planes[plane].at<ushort>(y, x);
            }
        }
    }
    return mosaic;
}

} // namespace

int main(int argc, char** argv) {
    cout << "=== BAYERFLOW STREAMING DEMOSAIC ===" << endl;

    if (argc < 3) {
        cerr << "Usage: " << argv[0] << " <input image> <output image> [config.yaml]" << endl;
        cerr << "  A single-channel input is treated as a mosaic; a color input is" << endl;
        cerr << "  first sampled through the configured filter array." << endl;
        return -1;
    }

    const string inputPath = argv[1];
    const string outputPath = argv[2];
    const string configPath = argc > 3 ? argv[3] : "";

    if (initialize(configPath) != core::ResultCode::SUCCESS) {
        cerr << "ERROR: Failed to load configuration " << configPath << endl;
        return -1;
    }

    core::CoreConfig coreConfig;
    try {
        coreConfig = core::Configuration::getInstance().getCoreConfig();
    } catch (const core::Exception& e) {
        cerr << "ERROR: " << e.what() << endl;
        return -1;
    }

    cv::Mat input = cv::imread(inputPath, cv::IMREAD_UNCHANGED);
    if (input.empty()) {
        cerr << "ERROR: Cannot read " << inputPath << endl;
        return -1;
    }

    cv::Mat mosaic;
    if (input.channels() == 1) {
        mosaic = input;
    } else if (input.channels() == 3) {
        cout << "Sampling color input through " << core::cfaPatternToString(coreConfig.pattern)
             << " filter array" << endl;
        mosaic = mosaicFromColor(input, coreConfig.pattern);
    } else {
        cerr << "ERROR: Unsupported channel count " << input.channels() << endl;
        return -1;
    }

    if (mosaic.depth() != CV_8U && mosaic.depth() != CV_16U) {
        cerr << "ERROR: Only 8-bit and 16-bit images are supported" << endl;
        return -1;
    }

    cout << "Input: " << mosaic.cols << " x " << mosaic.rows
         << (mosaic.depth() == CV_8U ? " (8-bit)" : " (16-bit)") << endl;
    cout << "Core: " << coreConfig.bufferCount << " line buffers, "
         << coreConfig.sampleBits << "-bit samples, "
         << core::divisionModeToString(coreConfig.divideByThree) << " divide-by-three" << endl;

    unique_ptr<api::FrameDemosaicer> demosaicer;
    try {
        demosaicer = make_unique<api::FrameDemosaicer>(coreConfig);
    } catch (const core::Exception& e) {
        cerr << "ERROR: " << e.what() << endl;
        return -1;
    }

    auto result = demosaicer->process(mosaic);
    if (!result.success) {
        cerr << "ERROR: Demosaic failed: " << result.errorMessage << endl;
        return -1;
    }

    cout << "\nRESULTS:" << endl;
    cout << "  Ticks: " << result.ticks << endl;
    cout << "  Input stalls: " << result.inputStalls << endl;
    cout << "  Output stalls: " << result.outputStalls << endl;
    cout << "  First output at tick: " << result.firstOutputLatency << endl;
    cout << "  Processing time: " << result.processingTime.count() / 1000.0 << " ms" << endl;

    if (!cv::imwrite(outputPath, result.image)) {
        cerr << "ERROR: Cannot write " << outputPath << endl;
        return -1;
    }
    cout << "Saved: " << outputPath << endl;

    shutdown();
    return 0;
}
