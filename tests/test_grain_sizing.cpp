#include <gtest/gtest.h>
#include <cmath>
#include "../src/design/grain_sizing.hpp"
#include "../src/design/nozzle.hpp"
#include "../src/design/design_config.hpp"
#include "../src/physics/types.hpp"
#include "../src/utils/errors.hpp"

using namespace srm_design;
using namespace srm_design::design;

class GrainSizingTest : public ::testing::Test {
protected:
    void SetUp() override {
        // 54 mm case, 50 mm grain, 0.4 kg KNSB in three segments, 1.5 s target
        config_.rocket.propellant_mass = 0.4;
        config_.grain.segments = 3;

        NozzleDesign nozzle = nozzle::solveNozzle(nozzle::makeNozzleRequest(config_.motor, 279.7, kAmbient));
        request_ = makeGrainSizingRequest(config_, nozzle, makeBallisticsOptions(config_, kAmbient));
    }

    static constexpr double kAmbient = 101325.0;

    DesignConfig config_;
    GrainSizingRequest request_;
};

TEST_F(GrainSizingTest, RequestFromConfig) {
    EXPECT_EQ(request_.propellant_mass, 0.4);
    EXPECT_EQ(request_.segments, 3);
    EXPECT_FALSE(request_.inhibit_ends);
    EXPECT_EQ(request_.max_iter, config_.limits.grain_solver_max_iter);
    EXPECT_EQ(request_.burn_time_rel_tol, config_.tolerance.burn_time_rel_tol);
    EXPECT_NEAR(request_.motor.grainOuterDiameter(), 0.05, 1e-15);
}

TEST_F(GrainSizingTest, GeometryConservesMass) {
    GrainGeometry grain = grainForCoreDiameter(0.02, 0.05, 0.4, 1641.0, 3, false);
    EXPECT_NEAR(grain.segment_length, 0.04926301, 1e-7);
    EXPECT_NEAR(1641.0 * grain.volumeAt(0.0), 0.4, 1e-12);
    EXPECT_EQ(grain.segments, 3);

    EXPECT_THROW(grainForCoreDiameter(0.05, 0.05, 0.4, 1641.0, 3, false), InvalidGeometry);
}

TEST_F(GrainSizingTest, MinimumCoreFromPortRatio) {
    double d = minimumCoreDiameter(request_.nozzle.throat_area, 2.0);
    EXPECT_NEAR(utils::circleArea(d), 2.0 * request_.nozzle.throat_area, 1e-15);
    EXPECT_NEAR(d, 0.018084, 1e-5);
}

TEST_F(GrainSizingTest, InitialGuessWithoutErosiveRisk) {
    GrainSizingResult guess = initialGrainGuess(request_);
    EXPECT_FALSE(guess.erosive_risk);
    EXPECT_NEAR(guess.port_to_throat_ratio, 2.0, 1e-9);
    EXPECT_NEAR(guess.length_to_diameter, 2.857, 0.01);
    EXPECT_EQ(guess.grain.core_diameter, guess.min_core_diameter);
}

TEST_F(GrainSizingTest, InitialGuessRaisesPortRatioForLongGrains) {
    // 26 mm grain holding 0.4 kg is over 30 diameters long
    request_.motor.chamber_diameter = 0.03;
    GrainSizingResult guess = initialGrainGuess(request_);

    EXPECT_TRUE(guess.erosive_risk);
    EXPECT_NEAR(guess.port_to_throat_ratio, 3.0, 1e-9);
    EXPECT_NEAR(guess.min_core_diameter, 0.022147, 1e-5);
    EXPECT_GT(guess.length_to_diameter, 60.0);
}

TEST_F(GrainSizingTest, SizesCoreForTargetBurnTime) {
    GrainSizingResult result = sizeGrain(request_);

    EXPECT_NEAR(result.burn_time, 1.5, 1.5e-3);
    EXPECT_EQ(result.burn_time, result.ballistics.burn_time);
    EXPECT_NEAR(result.grain.core_diameter, 0.020094, 5e-5);
    EXPECT_NEAR(result.grain.segment_length, 0.049351, 5e-5);
    EXPECT_EQ(result.iterations, 9);
    EXPECT_FALSE(result.erosive_risk);
    EXPECT_GE(result.port_to_throat_ratio, 2.0);
    EXPECT_GT(result.grain.core_diameter, result.min_core_diameter);

    EXPECT_NEAR(result.ballistics.total_impulse, 423.74, 0.3);
    EXPECT_NEAR(result.ballistics.peak_pressure, 2.4262e6, 2.0e3);
    EXPECT_LE(result.ballistics.peak_pressure, config_.motor.max_chamber_pressure);
    EXPECT_NEAR(result.ballistics.propellant_consumed, 0.4, 1e-3);
}

TEST_F(GrainSizingTest, ShorterBurnNeedsLargerCore) {
    GrainSizingResult nominal = sizeGrain(request_);
    request_.motor.burn_time = 1.2;
    GrainSizingResult fast = sizeGrain(request_);

    EXPECT_NEAR(fast.burn_time, 1.2, 1.2e-3);
    EXPECT_GT(fast.grain.core_diameter, nominal.grain.core_diameter);
    EXPECT_GT(fast.ballistics.peak_pressure, nominal.ballistics.peak_pressure);
}

TEST_F(GrainSizingTest, TargetLongerThanThickestWeb) {
    request_.motor.burn_time = 5.0;
    EXPECT_THROW(sizeGrain(request_), InfeasibleDesign);
}

TEST_F(GrainSizingTest, IterationBudget) {
    request_.max_iter = 3;
    try {
        sizeGrain(request_);
        FAIL() << "expected NonConvergence";
    } catch (const NonConvergence& e) {
        EXPECT_EQ(e.iterations(), 3);
        EXPECT_GT(e.bestCandidate(), 0.018);
        EXPECT_LT(e.bestCandidate(), 0.0475);
    }
}

TEST_F(GrainSizingTest, GrainMustFitChamber) {
    request_.motor.chamber_volume = 2.0e-4;
    EXPECT_THROW(sizeGrain(request_), InvalidGeometry);
}

TEST_F(GrainSizingTest, AnalyseFixedGrain) {
    GrainGeometry grain(0.02, 0.05, 0.04926301, 3);
    GrainSizingResult result = analyseGrain(grain, request_);

    EXPECT_EQ(result.iterations, 0);
    EXPECT_NEAR(result.burn_time, 1.50732, 2e-4);
    EXPECT_NEAR(result.port_to_throat_ratio, utils::circleArea(0.02) / request_.nozzle.throat_area, 1e-12);
    EXPECT_NEAR(result.length_to_diameter, 3.0 * 0.04926301 / 0.05, 1e-12);
    EXPECT_FALSE(result.erosive_risk);

    request_.motor.chamber_volume = 1.0e-4;
    EXPECT_THROW(analyseGrain(grain, request_), InvalidGeometry);
}
