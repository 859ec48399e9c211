#include <gtest/gtest.h>
#include <cmath>
#include "../src/physics/types.hpp"
#include "../src/physics/aerodynamics/aerodynamics.hpp"
#include "../src/utils/errors.hpp"

using namespace srm_design;

class TypesTest : public ::testing::Test {
protected:
    void SetUp() override {
        grain_ = GrainGeometry(0.02, 0.05, 0.05, 3, false);
    }

    GrainGeometry grain_;
    MotorSpec motor_;
};

TEST_F(TypesTest, WebThicknessRadialLimited) {
    // Radial web 15 mm, half length 25 mm
    EXPECT_NEAR(grain_.webThickness(), 0.015, 1e-15);
}

TEST_F(TypesTest, WebThicknessLengthLimited) {
    GrainGeometry short_grain(0.01, 0.05, 0.03, 2, false);
    EXPECT_NEAR(short_grain.webThickness(), 0.015, 1e-15);

    GrainGeometry inhibited(0.01, 0.05, 0.03, 2, true);
    EXPECT_NEAR(inhibited.webThickness(), 0.02, 1e-15);
}

TEST_F(TypesTest, BurnAreaAtIgnition) {
    double core = kPi * 0.02 * 0.05;
    double ends = 2.0 * 0.25 * kPi * (0.05 * 0.05 - 0.02 * 0.02);
    EXPECT_NEAR(grain_.burnAreaAt(0.0), 3.0 * (core + ends), 1e-12);
}

TEST_F(TypesTest, BurnAreaInhibitedEnds) {
    grain_.inhibit_ends = true;
    EXPECT_NEAR(grain_.burnAreaAt(0.001), 3.0 * kPi * 0.022 * 0.05, 1e-12);
}

TEST_F(TypesTest, RegressionErodesGrain) {
    double x = 0.004;
    EXPECT_NEAR(grain_.coreDiameterAt(x), 0.028, 1e-15);
    EXPECT_NEAR(grain_.segmentLengthAt(x), 0.042, 1e-15);
    EXPECT_LT(grain_.volumeAt(x), grain_.volumeAt(0.0));
    EXPECT_NEAR(grain_.volumeAt(grain_.webThickness()), 0.0, 1e-15);
    // Core never exceeds the outer diameter
    EXPECT_DOUBLE_EQ(grain_.coreDiameterAt(1.0), grain_.outer_diameter);
}

TEST_F(TypesTest, GrainValidity) {
    EXPECT_TRUE(grain_.isValid());
    EXPECT_FALSE(GrainGeometry(0.05, 0.05, 0.05, 3).isValid());
    EXPECT_FALSE(GrainGeometry(0.0, 0.05, 0.05, 3).isValid());
    EXPECT_FALSE(GrainGeometry(0.02, 0.05, 0.05, 0).isValid());
    EXPECT_FALSE(GrainGeometry(0.02, 0.05, -0.01, 3).isValid());
}

TEST_F(TypesTest, BurnRateLaw) {
    // r = a * Pc^n with Pc in MPa
    EXPECT_NEAR(motor_.burnRate(1.0e6), motor_.burn_rate_coefficient, 1e-15);
    EXPECT_NEAR(motor_.burnRate(2.0e6), 8.26e-3 * std::pow(2.0, 0.319), 1e-12);
    EXPECT_NEAR(motor_.designChamberPressure(), 0.615 * 3.0e6, 1e-6);
    EXPECT_NEAR(motor_.grainOuterDiameter(), 0.05, 1e-15);
}

TEST_F(TypesTest, FlightStateVector) {
    FlightState state(1.5, 100.0, 20.0, 1.2);
    StateVector y = state.toVector();
    EXPECT_EQ(y(idx(StateIndex::H)), 100.0);
    EXPECT_EQ(y(idx(StateIndex::V)), 20.0);
    EXPECT_EQ(y(idx(StateIndex::M)), 1.2);

    FlightState other;
    other.fromVector(2.0, y);
    EXPECT_EQ(other.t, 2.0);
    EXPECT_EQ(other.h, 100.0);
    EXPECT_EQ(other.m, 1.2);
}

TEST_F(TypesTest, TrajectoryResultDefaults) {
    TrajectoryResult result;
    EXPECT_TRUE(result.samples.empty());
    EXPECT_TRUE(std::isnan(result.ground_impact_time));
    EXPECT_FALSE(result.lifted_off);
}

TEST_F(TypesTest, CircleHelpers) {
    EXPECT_NEAR(utils::circleArea(0.02), kPi * 1e-4, 1e-18);
    EXPECT_NEAR(utils::circleDiameter(utils::circleArea(0.0123)), 0.0123, 1e-15);
}

TEST(AerodynamicsTest, ConstantDragModel) {
    aerodynamics::DragModel model;
    model.Cd_subsonic = 0.45;
    EXPECT_EQ(aerodynamics::drag_coefficient(0.3, model), 0.45);
    EXPECT_EQ(aerodynamics::drag_coefficient(2.5, model), 0.45);
}

TEST(AerodynamicsTest, MachDependentDragModel) {
    aerodynamics::DragModel model;
    model.type = aerodynamics::DragModelType::MACH_DEPENDENT;
    EXPECT_EQ(aerodynamics::drag_coefficient(0.5, model), model.Cd_subsonic);
    EXPECT_NEAR(aerodynamics::drag_coefficient(1.0, model),
                0.5 * (model.Cd_subsonic + model.Cd_transonic_peak), 1e-12);
    EXPECT_NEAR(aerodynamics::drag_coefficient(1.2, model), model.Cd_transonic_peak, 1e-12);
    double far = aerodynamics::drag_coefficient(5.0, model);
    EXPECT_GT(far, model.Cd_supersonic);
    EXPECT_LT(far, model.Cd_transonic_peak);
}

TEST(AerodynamicsTest, SupersonicDecayReachesSupersonicValue) {
    aerodynamics::DragModel model;
    model.type = aerodynamics::DragModelType::MACH_DEPENDENT;
    // One Mach past the ramp: peak + (supersonic - peak) * (1 - e^-2)
    EXPECT_NEAR(aerodynamics::drag_coefficient(2.2, model),
                model.Cd_supersonic + 0.4 * std::exp(-2.0), 1e-12);
    EXPECT_LT(aerodynamics::drag_coefficient(3.0, model), aerodynamics::drag_coefficient(2.2, model));
    EXPECT_NEAR(aerodynamics::drag_coefficient(10.0, model), model.Cd_supersonic, 1e-6);
}

TEST(AerodynamicsTest, DragOpposesVelocity) {
    double up = aerodynamics::drag_force(1.225, 50.0, 0.5, 0.005);
    double down = aerodynamics::drag_force(1.225, -50.0, 0.5, 0.005);
    EXPECT_NEAR(up, 0.5 * 1.225 * 2500.0 * 0.5 * 0.005, 1e-12);
    EXPECT_NEAR(down, -up, 1e-12);
}

TEST(AerodynamicsTest, Validity) {
    aerodynamics::DragModel model;
    EXPECT_TRUE(aerodynamics::is_valid(model));
    model.Cd_subsonic = -0.1;
    EXPECT_FALSE(aerodynamics::is_valid(model));
}

TEST(ErrorsTest, KindsAndNames) {
    InfeasibleDesign infeasible("x");
    EXPECT_EQ(infeasible.kind(), ErrorKind::INFEASIBLE_DESIGN);
    EXPECT_STREQ(toString(ErrorKind::OVER_PRESSURE), "OverPressure");

    NonConvergence nc("budget", 250.0, 499.0, 7);
    EXPECT_EQ(nc.kind(), ErrorKind::NON_CONVERGENCE);
    EXPECT_EQ(nc.bestCandidate(), 250.0);
    EXPECT_EQ(nc.bestValue(), 499.0);
    EXPECT_EQ(nc.iterations(), 7);

    const DesignError& base = nc;
    EXPECT_STREQ(base.what(), "budget");
}
