#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>
#include <cmath>
#include <string>
#include "../src/utils/config_loader.hpp"
#include "../src/design/design_config.hpp"
#include "../src/utils/errors.hpp"

using namespace srm_design;
using namespace srm_design::design;

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_dir_ = SRM_DESIGN_CONFIG_DIR;
    }

    DesignConfig parse(const std::string& text) const {
        return config::parseDesignConfig(YAML::Load(text));
    }

    std::string config_dir_;
};

TEST_F(ConfigLoaderTest, LoadsReferenceScenario) {
    DesignConfig config = config::loadDesignConfig(config_dir_ + "/knsb_500m.yaml");

    EXPECT_EQ(config.target_altitude, 500.0);
    EXPECT_EQ(config.rocket.dry_mass, 3.35);
    EXPECT_EQ(config.rocket.propellant_mass, 0.4);
    EXPECT_EQ(config.rocket.reference_area, 0.00528);
    EXPECT_EQ(config.rocket.drag.type, aerodynamics::DragModelType::CONSTANT);
    EXPECT_EQ(config.rocket.drag.Cd_subsonic, 0.5);

    EXPECT_EQ(config.motor.propellant_density, 1641.0);
    EXPECT_EQ(config.motor.burn_rate_exponent, 0.319);
    EXPECT_EQ(config.motor.expansion_ratio, 7.414);
    EXPECT_EQ(config.motor.burn_time, 1.5);

    EXPECT_EQ(config.grain_mode, GrainMode::SIZED);
    EXPECT_EQ(config.grain.segments, 3);
    EXPECT_NEAR(config.grain.outer_diameter, 0.05, 1e-15);

    EXPECT_EQ(config.integrator.method, physics::IntegratorMethod::RK45);
    EXPECT_EQ(config.limits.bracket_expansions, 20);
    EXPECT_EQ(config.ballistics.time_step, 1.0e-3);
    EXPECT_TRUE(config.verify_with_ballistics);
}

TEST_F(ConfigLoaderTest, MissingKeysKeepDefaults) {
    DesignConfig config = parse("target_altitude: 750\n");
    DesignConfig defaults;

    EXPECT_EQ(config.target_altitude, 750.0);
    EXPECT_EQ(config.rocket.dry_mass, defaults.rocket.dry_mass);
    EXPECT_EQ(config.motor.characteristic_velocity, defaults.motor.characteristic_velocity);
    EXPECT_EQ(config.tolerance.altitude_eps, defaults.tolerance.altitude_eps);
    EXPECT_EQ(config.search.thrust_max, defaults.search.thrust_max);
}

TEST_F(ConfigLoaderTest, GrainDiameterFollowsLiner) {
    DesignConfig config = parse(
        "motor:\n"
        "  chamber_diameter: 0.044\n"
        "  liner_thickness: 0.003\n");
    EXPECT_NEAR(config.grain.outer_diameter, 0.038, 1e-15);
}

TEST_F(ConfigLoaderTest, FixedGrainAndOptions) {
    DesignConfig config = parse(
        "grain:\n"
        "  mode: fixed\n"
        "  core_diameter: 0.02\n"
        "  segment_length: 0.05\n"
        "  segments: 2\n"
        "  inhibit_ends: true\n"
        "integrator:\n"
        "  method: rk4\n"
        "  fixed_step: 0.002\n"
        "  simulate_descent: true\n"
        "rocket:\n"
        "  reference_diameter: 0.08\n"
        "  drag:\n"
        "    model: mach\n"
        "    cd: 0.45\n"
        "    cd_supersonic: 0.6\n");

    EXPECT_EQ(config.grain_mode, GrainMode::FIXED);
    EXPECT_EQ(config.grain.segments, 2);
    EXPECT_TRUE(config.grain.inhibit_ends);
    EXPECT_EQ(config.grain.core_diameter, 0.02);
    EXPECT_EQ(config.integrator.method, physics::IntegratorMethod::RK4);
    EXPECT_EQ(config.integrator.fixed_step, 0.002);
    EXPECT_TRUE(config.integrator.simulate_descent);
    EXPECT_NEAR(config.rocket.reference_area, 0.25 * kPi * 0.08 * 0.08, 1e-15);
    EXPECT_EQ(config.rocket.drag.type, aerodynamics::DragModelType::MACH_DEPENDENT);
    EXPECT_EQ(config.rocket.drag.Cd_subsonic, 0.45);
    EXPECT_EQ(config.rocket.drag.Cd_supersonic, 0.6);
}

TEST_F(ConfigLoaderTest, UnknownKeysAreIgnored) {
    DesignConfig config = parse(
        "target_altitude: 600\n"
        "payload: camera\n"
        "rocket:\n"
        "  fins: 4\n");
    EXPECT_EQ(config.target_altitude, 600.0);
}

TEST_F(ConfigLoaderTest, RejectsMalformedValues) {
    EXPECT_THROW(parse("target_altitude: high\n"), InvalidInput);
    EXPECT_THROW(parse("rocket: 3\n"), InvalidInput);
    EXPECT_THROW(parse("grain:\n  mode: star\n"), InvalidInput);
    EXPECT_THROW(parse("integrator:\n  method: euler\n"), InvalidInput);
    EXPECT_THROW(parse("rocket:\n  drag:\n    model: table\n"), InvalidInput);
    EXPECT_THROW(parse("rocket:\n  reference_area: 0.005\n  reference_diameter: 0.08\n"), InvalidInput);
    EXPECT_THROW(parse("- 1\n- 2\n"), InvalidInput);
}

TEST_F(ConfigLoaderTest, RejectsNonPhysicalValues) {
    EXPECT_THROW(parse("target_altitude: -10\n"), InvalidInput);
    EXPECT_THROW(parse("rocket:\n  propellant_mass: 0\n"), InvalidInput);
    EXPECT_THROW(parse("motor:\n  burn_rate_exponent: 1.2\n"), InvalidInput);
    EXPECT_THROW(parse("motor:\n  expansion_ratio: 0.5\n"), InvalidInput);
    EXPECT_THROW(parse("search:\n  thrust_min: 2000\n"), InvalidInput);
    EXPECT_THROW(parse("integrator:\n  min_step: 0.1\n  max_step: 0.01\n"), InvalidInput);
}

TEST_F(ConfigLoaderTest, MissingFile) {
    EXPECT_THROW(config::loadDesignConfig(config_dir_ + "/does_not_exist.yaml"), InvalidInput);
}

TEST(DesignConfigTest, GrainModeNames) {
    EXPECT_EQ(grainModeFromString("fixed"), GrainMode::FIXED);
    EXPECT_EQ(grainModeFromString("sized"), GrainMode::SIZED);
    EXPECT_STREQ(toString(GrainMode::FIXED), "fixed");
    EXPECT_THROW(grainModeFromString("auto"), InvalidInput);
}

TEST(DesignConfigTest, IntegratorOptionsFromConfig) {
    DesignConfig config;
    config.tolerance.integrator_abs_tol = 1e-8;
    config.integrator.max_step = 0.02;
    config.limits.max_step_rejections = 7;
    physics::IntegratorOptions options = makeIntegratorOptions(config);
    EXPECT_EQ(options.abs_tol, 1e-8);
    EXPECT_EQ(options.max_step, 0.02);
    EXPECT_EQ(options.max_step_rejections, 7);
    EXPECT_TRUE(options.record_samples);
}
