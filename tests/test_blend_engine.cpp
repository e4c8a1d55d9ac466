/**
 * @file test_blend_engine.cpp
 * @brief Unit tests for BlendEngine
 *
 * Validates:
 * - Diagonal blend divisors 4 / 2 / 1
 * - Orthogonal blend divisors 4 / 3 / 2, approximate and exact thirds
 * - Vertical and horizontal pass-through at edges
 * - Channel table per phase and per layout
 */

#include <gtest/gtest.h>
#include <bayerflow/stream/BlendEngine.hpp>
#include <bayerflow/core/Logger.hpp>

#include <array>

using namespace bayerflow;
using namespace bayerflow::stream;

using Grid = std::array<std::array<core::Sample, 3>, 3>;

class BlendEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        core::Logger::getInstance().setLevel(core::LogLevel::WARNING);
    }

    FrameConfig frame(uint32_t width, uint32_t height) const {
        return FrameConfig::capture(core::FrameGeometry::fromSize(width, height), config_);
    }

    // Build a masked neighborhood the way the window presents it
    static Neighborhood make(uint32_t line, uint32_t column, const FrameConfig& f, Grid grid) {
        Neighborhood n;
        n.valid = true;
        n.coordinate.line = line;
        n.coordinate.column = column;
        n.mask = EdgeMask::forCoordinate(n.coordinate, f);
        for (int r = 0; r < 3; ++r) {
            for (int c = 0; c < 3; ++c) {
                const bool masked = (r == 0 && n.mask.isTopEdge) || (r == 2 && n.mask.isBottomEdge) ||
                                    (c == 0 && n.mask.isLeftEdge) || (c == 2 && n.mask.isRightEdge);
                n.samples[r][c] = masked ? 0 : grid[r][c];
            }
        }
        return n;
    }

    core::CoreConfig config_;
};

/**
 * Test 1: Interior diagonals average over four
 */
TEST_F(BlendEngineTest, InteriorCornerBlend) {
    BlendEngine engine(config_);
    const Grid g = {{{10, 1, 20}, {1, 50, 1}, {30, 1, 40}}};
    const BlendCandidates c = engine.computeCandidates(make(2, 2, frame(8, 8), g));

    ASSERT_TRUE(c.valid);
    EXPECT_EQ(c.corner, 25);
    EXPECT_EQ(c.center, 50);
}

/**
 * Test 2: Frame corner keeps the single in-bounds diagonal
 */
TEST_F(BlendEngineTest, FrameCornerDiagonalDivisorIsOne) {
    BlendEngine engine(config_);
    const Grid g = {{{9, 9, 9}, {9, 50, 60}, {9, 70, 77}}};
    const BlendCandidates c = engine.computeCandidates(make(0, 0, frame(8, 8), g));

    EXPECT_EQ(c.corner, 77);
    // Two orthogonals in bounds
    EXPECT_EQ(c.cross, (60 + 70) / 2);
    EXPECT_EQ(c.vertical, 70);
    EXPECT_EQ(c.horizontal, 60);
}

/**
 * Test 3: Non-corner edge keeps two diagonals
 */
TEST_F(BlendEngineTest, EdgeDiagonalDivisorIsTwo) {
    BlendEngine engine(config_);
    const Grid g = {{{10, 20, 30}, {40, 50, 60}, {70, 80, 90}}};

    // Bottom edge: top-left and top-right remain
    const BlendCandidates bottom = engine.computeCandidates(make(7, 3, frame(8, 8), g));
    EXPECT_EQ(bottom.corner, (10 + 30) / 2);
    EXPECT_EQ(bottom.vertical, 20);
    EXPECT_EQ(bottom.horizontal, (40 + 60) / 2);

    // Right edge: top-left and bottom-left remain
    const BlendCandidates right = engine.computeCandidates(make(3, 7, frame(8, 8), g));
    EXPECT_EQ(right.corner, (10 + 70) / 2);
    EXPECT_EQ(right.horizontal, 40);
    EXPECT_EQ(right.vertical, (20 + 80) / 2);
}

/**
 * Test 4: Interior orthogonals divide by four exactly
 */
TEST_F(BlendEngineTest, InteriorCrossIsExactQuarter) {
    BlendEngine engine(config_);
    const Grid g = {{{0, 101, 0}, {102, 7, 103}, {0, 104, 0}}};
    const BlendCandidates c = engine.computeCandidates(make(3, 3, frame(8, 8), g));
    EXPECT_EQ(c.cross, (101 + 102 + 103 + 104) / 4);
}

/**
 * Test 5: Three orthogonals use the shift-and-add third
 */
TEST_F(BlendEngineTest, EdgeCrossUsesApproximateThird) {
    BlendEngine engine(config_);
    const Grid g = {{{0, 90, 0}, {120, 7, 150}, {0, 200, 0}}};

    // Top edge drops the 90
    const BlendCandidates c = engine.computeCandidates(make(0, 3, frame(8, 8), g));
    const uint32_t sum = 120 + 150 + 200;
    EXPECT_EQ(c.cross, BlendEngine::approxDivideBy3(sum));
    EXPECT_EQ(c.cross, (sum * 337) >> 10);
    EXPECT_LE(c.cross, sum / 3);
    EXPECT_GE(c.cross + 2u, sum / 3);

    config_.divideByThree = core::DivisionMode::EXACT;
    BlendEngine exact(config_);
    EXPECT_EQ(exact.computeCandidates(make(0, 3, frame(8, 8), g)).cross, sum / 3);
}

/**
 * Test 6: Approximate third error bound
 */
TEST_F(BlendEngineTest, ApproximateThirdErrorBound) {
    for (uint32_t sum = 0; sum <= 3 * 255; ++sum) {
        const uint32_t approx = BlendEngine::approxDivideBy3(sum);
        ASSERT_LE(approx, sum / 3) << "sum " << sum;
        if (sum <= 472) {
            ASSERT_LE(sum / 3 - approx, 2u) << "sum " << sum;
        }
        ASSERT_LE(sum / 3 - approx, 4u) << "sum " << sum;
    }
    EXPECT_EQ(BlendEngine::approxDivideBy3(3), 0u);
    EXPECT_EQ(BlendEngine::approxDivideBy3(6), 1u);
}

/**
 * Test 7: Channel table for every phase
 */
TEST_F(BlendEngineTest, ChannelSelectionByPhase) {
    BlendEngine engine(config_);

    BlendCandidates c;
    c.valid = true;
    c.center = 1;
    c.corner = 2;
    c.vertical = 3;
    c.horizontal = 4;
    c.cross = 5;

    c.phase = BlendEngine::PHASE_RED;
    EXPECT_EQ(engine.selectChannels(c).rgb, (core::RgbPixel{1, 2, 5}));
    c.phase = BlendEngine::PHASE_GREEN_EVEN_ROW;
    EXPECT_EQ(engine.selectChannels(c).rgb, (core::RgbPixel{3, 1, 4}));
    c.phase = BlendEngine::PHASE_GREEN_ODD_ROW;
    EXPECT_EQ(engine.selectChannels(c).rgb, (core::RgbPixel{4, 1, 3}));
    c.phase = BlendEngine::PHASE_BLUE;
    EXPECT_EQ(engine.selectChannels(c).rgb, (core::RgbPixel{5, 2, 1}));

    c.valid = false;
    EXPECT_FALSE(engine.selectChannels(c).valid);
}

/**
 * Test 8: Layout offsets move the red site
 */
TEST_F(BlendEngineTest, PhaseFollowsLayout) {
    const core::PixelCoordinate origin;
    core::PixelCoordinate oddOdd;
    oddOdd.line = 5;
    oddOdd.column = 3;

    config_.pattern = core::CfaPattern::RGGB;
    EXPECT_EQ(BlendEngine(config_).phaseAt(origin), 0u);
    EXPECT_EQ(BlendEngine(config_).phaseAt(oddOdd), 3u);

    config_.pattern = core::CfaPattern::GRBG;
    EXPECT_EQ(BlendEngine(config_).phaseAt(origin), 1u);

    config_.pattern = core::CfaPattern::GBRG;
    EXPECT_EQ(BlendEngine(config_).phaseAt(origin), 2u);

    config_.pattern = core::CfaPattern::BGGR;
    EXPECT_EQ(BlendEngine(config_).phaseAt(origin), 3u);
    EXPECT_EQ(BlendEngine(config_).phaseAt(oddOdd), 0u);
}

/**
 * Test 9: Uniform neighborhoods
 */
TEST_F(BlendEngineTest, UniformInputEverywhere) {
    const FrameConfig f = frame(4, 4);
    const core::Sample v = 200;
    const Grid g = {{{v, v, v}, {v, v, v}, {v, v, v}}};

    config_.divideByThree = core::DivisionMode::EXACT;
    BlendEngine exact(config_);
    BlendEngine approximate(core::CoreConfig{});

    for (uint32_t y = 0; y < 4; ++y) {
        for (uint32_t x = 0; x < 4; ++x) {
            const Neighborhood n = make(y, x, f, g);
            EXPECT_EQ(exact.blend(n).rgb, (core::RgbPixel{v, v, v})) << y << "," << x;

            const BlendCandidates c = approximate.computeCandidates(n);
            EXPECT_EQ(c.corner, v);
            EXPECT_EQ(c.vertical, v);
            EXPECT_EQ(c.horizontal, v);
            if (n.mask.sidesMasked() == 1) {
                EXPECT_LE(c.cross, v);
                EXPECT_GE(c.cross + 4, v);
            } else {
                EXPECT_EQ(c.cross, v);
            }
        }
    }
}
