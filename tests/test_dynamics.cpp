#include <gtest/gtest.h>
#include <Eigen/Dense>
#include <cmath>
#include "../src/physics/types.hpp"
#include "../src/physics/dynamics.hpp"
#include "../src/physics/atmosphere.hpp"
#include "../src/physics/propulsion/thrust_profile.hpp"
#include "../src/utils/errors.hpp"

using namespace srm_design;
using namespace srm_design::physics;

class DynamicsTest : public ::testing::Test {
protected:
    void SetUp() override {
        rocket_.dry_mass = 1.0;
        rocket_.propellant_mass = 0.3;
        rocket_.reference_area = 0.005;
        rocket_.drag.Cd_subsonic = 0.5;

        atmosphere_ = createISAAtmosphere();
        profile_ = propulsion::createConstantThrustProfile(100.0, 1.0, 0.3, 2.0e6);
        dynamics_ = createAscentDynamics(rocket_, atmosphere_, profile_);
    }

    RocketSpec rocket_;
    std::shared_ptr<ISAAtmosphere> atmosphere_;
    std::shared_ptr<propulsion::ConstantThrustProfile> profile_;
    std::shared_ptr<AscentDynamics> dynamics_;
};

TEST_F(DynamicsTest, DerivativeDuringBoost) {
    StateVector y(0.0, 0.0, 1.3);
    StateVector y_dot = dynamics_->computeDerivative(0.1, y, FlightPhase::BOOST);

    EXPECT_EQ(y_dot(idx(StateIndex::H)), 0.0);
    EXPECT_NEAR(y_dot(idx(StateIndex::V)), (100.0 - 1.3 * kStandardGravity) / 1.3, 1e-12);
    EXPECT_NEAR(y_dot(idx(StateIndex::M)), -0.3, 1e-12);
}

TEST_F(DynamicsTest, PositionDerivativeIsVelocity) {
    StateVector y(120.0, 45.0, 1.2);
    StateVector y_dot = dynamics_->computeDerivative(0.5, y, FlightPhase::BOOST);
    EXPECT_EQ(y_dot(idx(StateIndex::H)), 45.0);
}

TEST_F(DynamicsTest, DragReducesAcceleration) {
    StateVector y(100.0, 80.0, 1.0);
    ForceBreakdown f = dynamics_->computeForces(2.0, y, FlightPhase::COAST);

    double rho = atmosphere_->computeDensity(100.0);
    EXPECT_NEAR(f.drag, 0.5 * rho * 80.0 * 80.0 * 0.5 * 0.005, 1e-12);
    EXPECT_EQ(f.thrust, 0.0);
    EXPECT_NEAR(f.acceleration, -kStandardGravity - f.drag / 1.0, 1e-12);
    EXPECT_NEAR(f.dynamic_pressure, 0.5 * rho * 6400.0, 1e-9);
    EXPECT_GT(f.mach, 0.2);
}

TEST_F(DynamicsTest, DragDuringDescentPointsUp) {
    StateVector y(100.0, -30.0, 1.0);
    ForceBreakdown f = dynamics_->computeForces(5.0, y, FlightPhase::DESCENT);
    EXPECT_LT(f.drag, 0.0);
    EXPECT_GT(f.acceleration, -kStandardGravity);
}

TEST_F(DynamicsTest, HeldOnPadWhenThrustBelowWeight) {
    auto weak = propulsion::createConstantThrustProfile(5.0, 1.0, 0.3);
    auto dynamics = createAscentDynamics(rocket_, atmosphere_, weak);

    StateVector y(0.0, 0.0, 1.3);
    ForceBreakdown f = dynamics->computeForces(0.2, y, FlightPhase::BOOST);
    EXPECT_TRUE(f.held_on_pad);
    EXPECT_EQ(f.acceleration, 0.0);
    EXPECT_LT(f.net, 0.0);

    // Propellant still burns on the pad
    StateVector y_dot = dynamics->computeDerivative(0.2, y, FlightPhase::BOOST);
    EXPECT_NEAR(y_dot(idx(StateIndex::M)), -0.3, 1e-12);
}

TEST_F(DynamicsTest, NoPadHoldAfterApogee) {
    StateVector y(0.0, -10.0, 1.0);
    ForceBreakdown f = dynamics_->computeForces(20.0, y, FlightPhase::DESCENT);
    EXPECT_FALSE(f.held_on_pad);
    EXPECT_LT(f.acceleration, 0.0);
}

TEST_F(DynamicsTest, NoThrustOrMassFlowAfterBurnout) {
    StateVector y(300.0, 50.0, 1.0);
    StateVector y_dot = dynamics_->computeDerivative(1.5, y, FlightPhase::COAST);
    EXPECT_EQ(y_dot(idx(StateIndex::M)), 0.0);
    EXPECT_EQ(dynamics_->computeForces(1.5, y, FlightPhase::COAST).thrust, 0.0);
}

TEST_F(DynamicsTest, BoostThrustHeldAtBurnoutTime) {
    // A stage evaluated marginally past burnout inside the final boost step still burns
    StateVector y(50.0, 60.0, 1.05);
    ForceBreakdown f = dynamics_->computeForces(1.0 + 1e-12, y, FlightPhase::BOOST);
    EXPECT_EQ(f.thrust, 100.0);
    EXPECT_EQ(f.chamber_pressure, 2.0e6);
}

TEST_F(DynamicsTest, MassFlowStopsAtDryMass) {
    StateVector y(50.0, 60.0, 1.0);
    StateVector y_dot = dynamics_->computeDerivative(0.9, y, FlightPhase::BOOST);
    EXPECT_EQ(y_dot(idx(StateIndex::M)), 0.0);

    // Propellant gone before the profile ends: the motor no longer pushes
    ForceBreakdown f = dynamics_->computeForces(0.9, y, FlightPhase::BOOST);
    EXPECT_TRUE(f.propellant_exhausted);
    EXPECT_EQ(f.thrust, 0.0);
    EXPECT_EQ(f.chamber_pressure, 0.0);
    EXPECT_EQ(f.mass_flow, 0.0);
    EXPECT_NEAR(f.acceleration, (-f.drag - f.weight) / 1.0, 1e-12);
}

TEST_F(DynamicsTest, OverloadedProfileCutsThrustAtDryMass) {
    // Profile carries 0.6 kg over 2 s, the airframe only holds 0.3 kg
    auto long_burn = propulsion::createConstantThrustProfile(100.0, 2.0, 0.6, 2.0e6);
    auto dynamics = createAscentDynamics(rocket_, atmosphere_, long_burn);

    StateVector burning(20.0, 30.0, 1.1);
    ForceBreakdown f = dynamics->computeForces(0.5, burning, FlightPhase::BOOST);
    EXPECT_FALSE(f.propellant_exhausted);
    EXPECT_EQ(f.thrust, 100.0);
    EXPECT_NEAR(f.mass_flow, 0.3, 1e-15);

    StateVector dry(50.0, 30.0, rocket_.dry_mass);
    f = dynamics->computeForces(1.5, dry, FlightPhase::BOOST);
    EXPECT_TRUE(f.propellant_exhausted);
    EXPECT_EQ(f.thrust, 0.0);
    EXPECT_EQ(f.mass_flow, 0.0);
}

TEST_F(DynamicsTest, DryMassAtBurnoutStillBurning) {
    // Consistent motor: mass reaches dry exactly at burnout, the last stage keeps its thrust
    StateVector y(50.0, 60.0, rocket_.dry_mass);
    ForceBreakdown f = dynamics_->computeForces(1.0, y, FlightPhase::BOOST);
    EXPECT_FALSE(f.propellant_exhausted);
    EXPECT_EQ(f.thrust, 100.0);
}

TEST_F(DynamicsTest, LaunchAltitudeOffsetsAtmosphere) {
    RocketSpec high = rocket_;
    high.launch_altitude = 1500.0;
    auto dynamics = createAscentDynamics(high, atmosphere_, profile_);

    StateVector y(0.0, 10.0, 1.3);
    ForceBreakdown f = dynamics->computeForces(0.1, y, FlightPhase::BOOST);
    EXPECT_NEAR(f.density, atmosphere_->computeDensity(1500.0), 1e-15);
    EXPECT_NEAR(f.pressure, atmosphere_->computePressure(1500.0), 1e-9);
}

TEST_F(DynamicsTest, InvalidConstruction) {
    EXPECT_THROW(createAscentDynamics(rocket_, nullptr, profile_), InvalidInput);
    RocketSpec bad = rocket_;
    bad.dry_mass = 0.0;
    EXPECT_THROW(createAscentDynamics(bad, atmosphere_, profile_), InvalidInput);
}

TEST(ThrustProfileTest, ConstantProfile) {
    propulsion::ConstantThrustProfile profile(200.0, 1.5, 0.4, 1.8e6);
    EXPECT_EQ(profile.thrust(0.0), 200.0);
    EXPECT_EQ(profile.thrust(1.5), 200.0);
    EXPECT_EQ(profile.thrust(1.6), 0.0);
    EXPECT_NEAR(profile.massFlowRate(0.7), 0.4 / 1.5, 1e-15);
    EXPECT_EQ(profile.massFlowRate(-0.1), 0.0);
    EXPECT_NEAR(profile.totalImpulse(), 300.0, 1e-12);
    EXPECT_THROW(propulsion::ConstantThrustProfile(-1.0, 1.0, 0.1), InvalidInput);
    EXPECT_THROW(propulsion::ConstantThrustProfile(10.0, 0.0, 0.1), InvalidInput);
}

TEST(ThrustProfileTest, TabulatedInterpolation) {
    std::vector<propulsion::ThrustPoint> points = {
        {0.0, 100.0, 0.2, 2.0e6},
        {1.0, 200.0, 0.4, 3.0e6},
        {2.0, 0.0, 0.0, 101325.0},
    };
    propulsion::TabulatedThrustProfile profile(points);

    EXPECT_DOUBLE_EQ(profile.burnTime(), 2.0);
    EXPECT_NEAR(profile.thrust(0.5), 150.0, 1e-12);
    EXPECT_NEAR(profile.thrust(1.5), 100.0, 1e-12);
    EXPECT_NEAR(profile.chamberPressure(0.25), 2.25e6, 1e-6);
    EXPECT_NEAR(profile.massFlowRate(1.0), 0.4, 1e-15);
    EXPECT_EQ(profile.thrust(2.5), 0.0);
    EXPECT_EQ(profile.thrust(-0.5), 0.0);

    // Trapezoidal integrals
    EXPECT_NEAR(profile.totalImpulse(), 250.0, 1e-12);
    EXPECT_NEAR(profile.propellantMass(), 0.5, 1e-12);
}

TEST(ThrustProfileTest, TabulatedValidation) {
    using propulsion::ThrustPoint;
    using propulsion::TabulatedThrustProfile;

    std::vector<ThrustPoint> single = {{0.0, 1.0, 0.1, 0.0}};
    std::vector<ThrustPoint> late_start = {{0.1, 1.0, 0.1, 0.0}, {0.2, 1.0, 0.1, 0.0}};
    std::vector<ThrustPoint> repeated = {{0.0, 1.0, 0.1, 0.0}, {0.0, 1.0, 0.1, 0.0}};
    std::vector<ThrustPoint> negative = {{0.0, -1.0, 0.1, 0.0}, {1.0, 1.0, 0.1, 0.0}};

    EXPECT_THROW(TabulatedThrustProfile profile(single), InvalidInput);
    EXPECT_THROW(TabulatedThrustProfile profile(late_start), InvalidInput);
    EXPECT_THROW(TabulatedThrustProfile profile(repeated), InvalidInput);
    EXPECT_THROW(TabulatedThrustProfile profile(negative), InvalidInput);
}
