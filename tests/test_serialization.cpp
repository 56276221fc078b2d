#include <gtest/gtest.h>
#include <serialization/json_serialization.hpp>
#include <serialization/config_json.hpp>
#include <serialization/design_json.hpp>
#include <serialization/layout_json.hpp>
#include <geometry/spiral_builder.hpp>
#include "test_helpers.hpp"
#include <cmath>
#include <cstdio>
#include <limits>
#include <string>

using namespace magtorq;

class SerializationTest : public ::testing::Test {
protected:
    ConstraintSet constraints;

    void SetUp() override {
        constraints = test::sample_constraints();
    }

    // Through text, the way records reach the next command
    static nlohmann::json reparse(const nlohmann::json& j) {
        return nlohmann::json::parse(j.dump());
    }
};

TEST_F(SerializationTest, ConstraintSetSections) {
    nlohmann::json j = constraints;
    ASSERT_TRUE(j.contains("physical_constants"));
    ASSERT_TRUE(j.contains("thermal_properties"));
    ASSERT_TRUE(j.contains("design_constraints"));
    ASSERT_TRUE(j.contains("manufacturing_constraints"));
    EXPECT_EQ(j["design_constraints"]["num_layers"], 6);

    ConstraintSet loaded = reparse(j).get<ConstraintSet>();
    EXPECT_EQ(loaded.design.num_layers, constraints.design.num_layers);
    EXPECT_EQ(loaded.design.outer_length, constraints.design.outer_length);
    EXPECT_EQ(loaded.manufacturing.via_pad_diameter, constraints.manufacturing.via_pad_diameter);
    EXPECT_EQ(loaded.physical.copper_resistivity, constraints.physical.copper_resistivity);
    EXPECT_EQ(loaded.thermal.emissivity, constraints.thermal.emissivity);
}

TEST_F(SerializationTest, PartialConstraintFileKeepsDefaults) {
    nlohmann::json j = nlohmann::json::parse(R"({
        "design_constraints": { "max_power": 2.5, "num_layers": 4 },
        "manufacturing_constraints": { "inner_clearance": 0.0005 }
    })");

    ConstraintSet loaded = j.get<ConstraintSet>();
    EXPECT_DOUBLE_EQ(loaded.design.max_power, 2.5);
    EXPECT_EQ(loaded.design.num_layers, 4);
    EXPECT_DOUBLE_EQ(loaded.design.voltage, 8.2);
    EXPECT_DOUBLE_EQ(loaded.manufacturing.inner_clearance, 0.0005);
    EXPECT_DOUBLE_EQ(loaded.manufacturing.min_trace_width, 0.15e-3);
    EXPECT_DOUBLE_EQ(loaded.thermal.emissivity, 0.9);
}

TEST_F(SerializationTest, OptimizeConfigFromJson) {
    nlohmann::json j = nlohmann::json::parse(R"({
        "max_iterations": 50,
        "num_threads": 0,
        "model": { "thermal_policy": "worst_case", "self_consistent_resistance": true }
    })");

    OptimizeConfig config = j.get<OptimizeConfig>();
    EXPECT_EQ(config.max_iterations, 50);
    EXPECT_EQ(config.num_threads, 0);
    EXPECT_DOUBLE_EQ(config.constraint_tolerance, 1e-6);
    EXPECT_EQ(config.model.thermal_policy, ThermalPolicy::WorstCase);
    EXPECT_TRUE(config.model.self_consistent_resistance);
    EXPECT_EQ(config.model.thermal.max_iterations, 60);

    nlohmann::json out = config;
    EXPECT_EQ(out["model"]["thermal_policy"], "worst_case");
    EXPECT_FALSE(out.contains("step_callback"));
}

TEST_F(SerializationTest, EnumsUseSnakeCaseNames) {
    EXPECT_EQ(nlohmann::json(OptimizationStatus::BudgetExhausted), "budget_exhausted");
    EXPECT_EQ(nlohmann::json(CurrentLimit::CurrentDensity), "current_density");
    EXPECT_EQ(nlohmann::json(ThermalStatus::AboveCeiling), "above_ceiling");
    EXPECT_EQ(nlohmann::json(TransitionKind::Feed), "feed");
    EXPECT_EQ(nlohmann::json(WindingDirection::CounterClockwise), "counter_clockwise");
    EXPECT_EQ(nlohmann::json("ground_only").get<ThermalPolicy>(), ThermalPolicy::GroundOnly);
}

TEST_F(SerializationTest, OptimizationResultRoundTripIsExact) {
    OptimizationResult result = CoilOptimizer::optimize(constraints, test::default_optimize_config());
    ASSERT_TRUE(result.converged());

    OptimizationResult loaded = reparse(nlohmann::json(result)).get<OptimizationResult>();

    EXPECT_EQ(loaded.status, result.status);
    EXPECT_EQ(loaded.design.turns, result.design.turns);
    EXPECT_EQ(loaded.design.trace_width, result.design.trace_width);
    EXPECT_EQ(loaded.design.copper_thickness, result.design.copper_thickness);
    EXPECT_EQ(loaded.magnetic_moment, result.magnetic_moment);
    EXPECT_EQ(loaded.state.resistance, result.state.resistance);
    EXPECT_EQ(loaded.state.current, result.state.current);
    EXPECT_EQ(loaded.state.current_limit, result.state.current_limit);
    EXPECT_EQ(loaded.state.ground.temperature, result.state.ground.temperature);
    EXPECT_EQ(loaded.state.space.status, result.state.space.status);
    EXPECT_EQ(loaded.dynamics.inductance, result.dynamics.inductance);
    EXPECT_EQ(loaded.seed.trace_width, result.seed.trace_width);
    EXPECT_EQ(loaded.iterations, result.iterations);
    EXPECT_EQ(loaded.evaluations, result.evaluations);

    ASSERT_EQ(loaded.residuals.size(), result.residuals.size());
    for (size_t i = 0; i < result.residuals.size(); ++i) {
        EXPECT_EQ(loaded.residuals.residuals[i].name, result.residuals.residuals[i].name);
        EXPECT_EQ(loaded.residuals.residuals[i].kind, result.residuals.residuals[i].kind);
        EXPECT_EQ(loaded.residuals.residuals[i].value, result.residuals.residuals[i].value);
    }

    ASSERT_EQ(loaded.candidates.size(), result.candidates.size());
    EXPECT_EQ(loaded.candidates.back().status, result.candidates.back().status);
    EXPECT_EQ(loaded.candidates.back().width_max, result.candidates.back().width_max);

    // The reloaded design builds the same geometry
    CoilLayout a = build_layout(constraints, result);
    CoilLayout b = build_layout(constraints, loaded);
    EXPECT_EQ(a.to_polyline(0), b.to_polyline(0));
}

TEST_F(SerializationTest, InfiniteResistanceSurvivesAsNull) {
    ElectroThermalState state;
    state.resistance = std::numeric_limits<double>::infinity();

    nlohmann::json j = reparse(nlohmann::json(state));
    EXPECT_TRUE(j["resistance"].is_null());

    ElectroThermalState loaded = j.get<ElectroThermalState>();
    EXPECT_TRUE(std::isinf(loaded.resistance));
}

TEST_F(SerializationTest, LayoutRoundTripIsExact) {
    DesignPoint point = CoilModel(constraints).design_point(0.4e-3);
    CoilLayout layout = build_layout(constraints, point);

    CoilLayout loaded = coil_layout_from_json(reparse(coil_layout_to_json(layout)));

    EXPECT_EQ(loaded.trace_width(), layout.trace_width());
    EXPECT_EQ(loaded.terminal_layer(), layout.terminal_layer());
    ASSERT_EQ(loaded.layer_count(), layout.layer_count());
    for (size_t i = 0; i < layout.layer_count(); ++i) {
        EXPECT_EQ(loaded.layer(i).direction, layout.layer(i).direction);
        EXPECT_EQ(loaded.to_polyline(i), layout.to_polyline(i));
        EXPECT_EQ(loaded.layer(i).entry, layout.layer(i).entry);
        EXPECT_EQ(loaded.layer(i).exit, layout.layer(i).exit);
    }
    ASSERT_EQ(loaded.transitions().size(), layout.transitions().size());
    for (size_t i = 0; i < layout.transitions().size(); ++i) {
        EXPECT_EQ(loaded.transitions()[i].kind, layout.transitions()[i].kind);
        EXPECT_EQ(loaded.transitions()[i].position, layout.transitions()[i].position);
    }
    EXPECT_TRUE(loaded.validate(constraints).valid);
}

TEST_F(SerializationTest, DesignSummaryInDisplayUnits) {
    OptimizationResult result = CoilOptimizer::optimize(constraints, test::default_optimize_config());
    nlohmann::json summary = design_summary(constraints, result);

    EXPECT_DOUBLE_EQ(summary["dimensions"]["outer"]["length"].get<double>(), 132.0);
    EXPECT_DOUBLE_EQ(summary["dimensions"]["inner"]["width"].get<double>(), 25.0);
    EXPECT_EQ(summary["traces"]["turns_per_layer"], result.design.turns);
    EXPECT_EQ(summary["traces"]["total_layers"], 6);
    EXPECT_DOUBLE_EQ(summary["traces"]["spacing"].get<double>(), 0.15);
    EXPECT_EQ(summary["electrical"]["current_limit"], "voltage");
    EXPECT_EQ(summary["performance"]["status"], "converged");
    EXPECT_TRUE(summary["thermal"].contains("ground"));
    EXPECT_TRUE(summary["thermal"].contains("space"));
    EXPECT_DOUBLE_EQ(summary["thermal"]["ground"]["ambient"].get<double>(), 20.0);
    EXPECT_NEAR(summary["dynamics"]["inductance"].get<double>(),
                result.dynamics.inductance * 1e6, 1e-3);
}

TEST_F(SerializationTest, EnvelopeCarriesStep) {
    json::SerializedData data;
    data.step = "optimize";
    data.config = {{"constraints", constraints}};
    data.data = {{"value", 42}};

    json::SerializedData loaded = json::SerializedData::from_json(reparse(data.to_json()));
    EXPECT_EQ(loaded.version, json::SERIALIZATION_VERSION);
    EXPECT_EQ(loaded.step, "optimize");
    EXPECT_EQ(loaded.data["value"], 42);
    EXPECT_TRUE(loaded.stats.is_null());

    EXPECT_THROW(json::SerializedData::from_json(nlohmann::json::object()), std::runtime_error);
}

TEST_F(SerializationTest, ReadSerializedChecksStep) {
    std::string path = ::testing::TempDir() + "magtorq_envelope_test.json";

    json::SerializedData data;
    data.step = "geometry";
    data.data = nlohmann::json::object();
    json::write_serialized(path, data);

    EXPECT_NO_THROW(json::read_serialized(path));
    EXPECT_NO_THROW(json::read_serialized(path, "geometry"));
    EXPECT_THROW(json::read_serialized(path, "optimize"), std::runtime_error);
    EXPECT_THROW(json::read_serialized(path + ".missing"), std::runtime_error);

    std::remove(path.c_str());
}
