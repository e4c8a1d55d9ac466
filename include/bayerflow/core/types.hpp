/**
 * @file types.hpp
 * @brief Common type definitions for the bayerflow demosaic core
 *
 * This file contains the fundamental value types, enums and configuration
 * structures shared by the streaming core, the frame adapter and the tests.
 */

#ifndef BAYERFLOW_CORE_TYPES_HPP
#define BAYERFLOW_CORE_TYPES_HPP

#include <cstdint>
#include <string>

namespace bayerflow {
namespace core {

/**
 * @brief One mosaic sample or reconstructed channel value (up to 16 bits)
 */
using Sample = uint16_t;

/**
 * @brief Result codes carried by exceptions and API results
 */
enum class ResultCode {
    SUCCESS = 0,
    ERROR_GENERIC,
    ERROR_INVALID_PARAMETER,
    ERROR_NOT_INITIALIZED,
    ERROR_INVARIANT_VIOLATION,
    ERROR_PROTOCOL_VIOLATION,
    ERROR_FILE_NOT_FOUND,
    ERROR_FILE_IO,
    ERROR_TIMEOUT
};

/**
 * @brief Color filter array layouts, named by the 2x2 tile read in raster order
 */
enum class CfaPattern {
    RGGB,   ///< Red at (0,0)
    GRBG,   ///< Green on a red row at (0,0)
    GBRG,   ///< Green on a blue row at (0,0)
    BGGR    ///< Blue at (0,0)
};

/**
 * @brief Divisor implementation for three-term averages
 */
enum class DivisionMode {
    APPROXIMATE,    ///< sum * (1/4 + 1/16 + 1/64 + 1/1024), shift-and-add
    EXACT           ///< integer sum / 3
};

/**
 * @brief Static configuration of a demosaic core instance
 *
 * Fixed for the lifetime of a DemosaicCore. Per-frame bounds travel
 * separately in FrameGeometry.
 */
struct CoreConfig {
    uint32_t bufferCount = 5;           ///< Line buffers in the pool (>= 4)
    uint32_t maxLineWidth = 4096;       ///< Longest line a buffer can hold
    uint32_t sampleBits = 8;            ///< Sample bit width W (1..16)
    CfaPattern pattern = CfaPattern::RGGB;
    DivisionMode divideByThree = DivisionMode::APPROXIMATE;

    /**
     * @brief Largest representable sample value for sampleBits
     */
    Sample maxSample() const {
        return static_cast<Sample>((1u << sampleBits) - 1u);
    }
};

/**
 * @brief Frame bounds as presented on the configuration inputs
 */
struct FrameGeometry {
    uint32_t frameWidthMinusOne = 0;
    uint32_t frameHeightMinusOne = 0;

    static FrameGeometry fromSize(uint32_t width, uint32_t height) {
        FrameGeometry g;
        g.frameWidthMinusOne = width - 1;
        g.frameHeightMinusOne = height - 1;
        return g;
    }
};

/**
 * @brief Reconstructed output pixel
 */
struct RgbPixel {
    Sample r = 0;
    Sample g = 0;
    Sample b = 0;

    bool operator==(const RgbPixel& other) const {
        return r == other.r && g == other.g && b == other.b;
    }
    bool operator!=(const RgbPixel& other) const { return !(*this == other); }
};

/**
 * @brief Raster position of an output pixel
 */
struct PixelCoordinate {
    uint32_t line = 0;
    uint32_t column = 0;

    bool operator==(const PixelCoordinate& other) const {
        return line == other.line && column == other.column;
    }
};

std::string cfaPatternToString(CfaPattern pattern);
std::string divisionModeToString(DivisionMode mode);

} // namespace core
} // namespace bayerflow

#endif // BAYERFLOW_CORE_TYPES_HPP
