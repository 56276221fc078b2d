#include <gtest/gtest.h>
#include <geometry/spiral_builder.hpp>
#include "test_helpers.hpp"
#include <cmath>
#include <string>

using namespace magtorq;

class SpiralBuilderTest : public ::testing::Test {
protected:
    ConstraintSet constraints;
    DesignPoint point;

    void SetUp() override {
        constraints = test::sample_constraints();
        point = CoilModel(constraints).design_point(0.4e-3);
    }
};

TEST_F(SpiralBuilderTest, LayoutMatchesDesignPoint) {
    CoilLayout layout = build_layout(constraints, point);

    EXPECT_EQ(layout.layer_count(), 5u);
    EXPECT_EQ(layout.terminal_layer(), 5);
    EXPECT_DOUBLE_EQ(layout.trace_width(), point.trace_width);
    EXPECT_EQ(layout.turns_per_layer(), point.turns);

    for (const auto& layer : layout.layers()) {
        EXPECT_EQ(static_cast<int>(layer.turn_count()), point.turns);
    }

    ValidationResult result = layout.validate(constraints);
    EXPECT_TRUE(result.valid) << result.error_summary();
}

TEST_F(SpiralBuilderTest, DirectionsAlternate) {
    CoilLayout layout = build_layout(constraints, point);
    for (size_t i = 0; i < layout.layer_count(); ++i) {
        EXPECT_EQ(layout.layer(i).index, static_cast<int>(i));
        EXPECT_EQ(layout.layer(i).direction,
                  i % 2 == 0 ? WindingDirection::Clockwise : WindingDirection::CounterClockwise);
    }
}

TEST_F(SpiralBuilderTest, OddLayersMirrorEvenLayers) {
    CoilLayout layout = build_layout(constraints, point);
    const auto& even = layout.layer(0);
    const auto& odd = layout.layer(1);

    ASSERT_EQ(even.turns.size(), odd.turns.size());
    for (size_t k = 0; k < even.turns.size(); ++k) {
        ASSERT_EQ(even.turns[k].size(), odd.turns[k].size());
        for (size_t j = 0; j < even.turns[k].size(); ++j) {
            EXPECT_EQ(odd.turns[k][j], even.turns[k][j].mirrored_x());
        }
    }
}

TEST_F(SpiralBuilderTest, TurnsAreConcentricRectangles) {
    CoilLayout layout = build_layout(constraints, point);
    CoilModel model(constraints);

    const auto& layer = layout.layer(0);
    for (int k = 0; k < point.turns; ++k) {
        TurnRect rect = model.turn_rect(k, point.trace_width);
        const auto& turn = layer.turns[k];
        ASSERT_EQ(turn.size(), 5u);
        EXPECT_EQ(turn[0], Vec2(-rect.half_width, rect.half_length));
        EXPECT_EQ(turn[1], Vec2(rect.half_width, rect.half_length));
        EXPECT_EQ(turn[2], Vec2(rect.half_width, -rect.half_length));
        EXPECT_EQ(turn[3], Vec2(-rect.half_width, -rect.half_length));
    }

    // Every segment runs along a board axis
    auto path = layout.to_polyline(0);
    for (size_t i = 1; i < path.size(); ++i) {
        bool horizontal = path[i].y == path[i - 1].y;
        bool vertical = path[i].x == path[i - 1].x;
        EXPECT_TRUE(horizontal || vertical) << "segment " << i;
    }
}

TEST_F(SpiralBuilderTest, TransitionsChainLayersInSeries) {
    SpiralBuilder builder(constraints, point);
    CoilLayout layout = builder.build();
    const auto& transitions = layout.transitions();

    ASSERT_EQ(transitions.size(), 6u);

    EXPECT_EQ(transitions[0].kind, TransitionKind::Feed);
    EXPECT_EQ(transitions[0].from_layer, 5);
    EXPECT_EQ(transitions[0].to_layer, 0);
    EXPECT_EQ(transitions[0].position, layout.layer(0).entry);

    for (int i = 0; i < 5; ++i) {
        const auto& t = transitions[i + 1];
        EXPECT_EQ(t.from_layer, i);
        EXPECT_EQ(t.to_layer, i + 1);
        EXPECT_EQ(t.kind, i % 2 == 0 ? TransitionKind::Inner : TransitionKind::Outer);
        EXPECT_EQ(t.position, layout.layer(i).exit);
        EXPECT_DOUBLE_EQ(t.drill, constraints.manufacturing.via_drill);
        EXPECT_DOUBLE_EQ(t.pad_diameter, constraints.manufacturing.via_pad_diameter);
    }

    // Vias of one kind stack at a single position
    for (const auto& t : transitions) {
        if (t.kind == TransitionKind::Inner) {
            EXPECT_EQ(t.position, builder.inner_transition());
        } else if (t.kind == TransitionKind::Outer) {
            EXPECT_EQ(t.position, builder.outer_transition());
        }
        EXPECT_DOUBLE_EQ(t.position.x, 0.0);
    }
}

TEST_F(SpiralBuilderTest, TransitionsClearTheTurns) {
    SpiralBuilder builder(constraints, point);
    CoilModel model(constraints);
    const double w = point.trace_width;
    const double s = constraints.manufacturing.min_trace_spacing;
    const double pad = constraints.manufacturing.via_pad_diameter;

    TurnRect outer = model.turn_rect(0, w);
    TurnRect inner = model.turn_rect(point.turns - 1, w);

    // Pad edge to trace edge is at least the minimum spacing
    EXPECT_GE(builder.outer_transition().y - pad / 2.0 - (outer.half_length + w / 2.0), s - 1e-12);
    EXPECT_GE((inner.half_length - w / 2.0) - (builder.inner_transition().y + pad / 2.0), s - 1e-12);
    EXPECT_GE(builder.feed_transition().y - builder.outer_transition().y, pad + s - 1e-12);

    // The inner via stays outside the cutout
    EXPECT_GT(builder.inner_transition().y - pad / 2.0, constraints.design.inner_length / 2.0);
}

TEST_F(SpiralBuilderTest, TraceLengthTracksModel) {
    CoilLayout layout = build_layout(constraints, point);
    CoilModel model(constraints);
    double expected = model.total_trace_length(point.trace_width, point.turns);
    EXPECT_NEAR(layout.total_trace_length(), expected, 0.01 * expected);
}

TEST_F(SpiralBuilderTest, BoundingBoxStaysWithinOutlineWidth) {
    CoilLayout layout = build_layout(constraints, point);
    auto box = layout.bounding_box();

    EXPECT_LE(box.second.x + point.trace_width / 2.0, constraints.design.outer_width / 2.0 + 1e-12);
    EXPECT_GE(box.first.x - point.trace_width / 2.0, -constraints.design.outer_width / 2.0 - 1e-12);
    EXPECT_GE(box.first.y - point.trace_width / 2.0, -constraints.design.outer_length / 2.0 - 1e-12);
}

TEST_F(SpiralBuilderTest, BuildIsDeterministic) {
    CoilLayout a = build_layout(constraints, point);
    CoilLayout b = build_layout(constraints, point);
    ASSERT_EQ(a.layer_count(), b.layer_count());
    for (size_t i = 0; i < a.layer_count(); ++i) {
        EXPECT_EQ(a.to_polyline(i), b.to_polyline(i));
    }
}

TEST_F(SpiralBuilderTest, OptimizedDesignValidates) {
    OptimizationResult result = CoilOptimizer::optimize(constraints, test::default_optimize_config());
    ASSERT_TRUE(result.converged());

    CoilLayout layout = build_layout(constraints, result);
    EXPECT_EQ(layout.turns_per_layer(), result.design.turns);
    ValidationResult validation = layout.validate(constraints);
    EXPECT_TRUE(validation.valid) << validation.error_summary();
}

TEST_F(SpiralBuilderTest, OptimizedDesignsAcrossPowerBudgetsBuild) {
    OptimizeConfig config = test::default_optimize_config();
    int built = 0;

    // 2.28 W lands on the upper width of the 21-turn interval
    for (double max_power : {0.3, 0.5, 0.75, 1.0, 1.5, 2.0, 2.27, 2.28, 2.29, 2.5, 3.0, 4.0, 5.0}) {
        constraints.design.max_power = max_power;
        OptimizationResult result = CoilOptimizer::optimize(constraints, config);
        if (!result.converged()) {
            continue;
        }

        CoilLayout layout;
        ASSERT_NO_THROW(layout = build_layout(constraints, result))
            << "max_power = " << max_power << ", n = " << result.design.turns
            << ", w = " << result.design.trace_width;
        EXPECT_EQ(layout.turns_per_layer(), result.design.turns);
        ValidationResult validation = layout.validate(constraints);
        EXPECT_TRUE(validation.valid) << "max_power = " << max_power << ": "
                                      << validation.error_summary();
        ++built;
    }
    EXPECT_GE(built, 10);
}

TEST_F(SpiralBuilderTest, IntervalEndpointWidthsBuild) {
    CoilModel model(constraints);
    const auto& m = constraints.manufacturing;
    const int fewest = model.turn_count(m.max_trace_width);
    const int most = model.turn_count(m.min_trace_width);
    ASSERT_LT(fewest, most);

    for (int n = fewest; n <= most; ++n) {
        double lo = 0.0;
        double hi = 0.0;
        ASSERT_TRUE(CoilOptimizer::width_interval(model, n, lo, hi)) << "n = " << n;

        for (double w : {lo, hi}) {
            DesignPoint p = model.design_point(w);
            ASSERT_EQ(p.turns, n) << "w = " << w;

            CoilLayout layout;
            ASSERT_NO_THROW(layout = build_layout(constraints, p)) << "n = " << n << ", w = " << w;
            ValidationResult result = layout.validate(constraints);
            EXPECT_TRUE(result.valid) << "n = " << n << ", w = " << w << ": "
                                      << result.error_summary();
        }
    }
}

TEST_F(SpiralBuilderTest, SmallBoardAcrossWidths) {
    constraints = test::small_board();
    CoilModel model(constraints);

    for (double w : {0.15e-3, 0.33e-3, 0.6e-3, 0.85e-3, 1.0e-3}) {
        DesignPoint p = model.design_point(w);
        ASSERT_GE(p.turns, 1);
        CoilLayout layout = build_layout(constraints, p);
        EXPECT_EQ(layout.layer_count(), 3u);
        ValidationResult result = layout.validate(constraints);
        EXPECT_TRUE(result.valid) << "w = " << w << ": " << result.error_summary();
    }
}

TEST_F(SpiralBuilderTest, WrongTurnCountThrows) {
    DesignPoint bad = point;
    bad.turns += 1;
    EXPECT_THROW(build_layout(constraints, bad), GeometryInconsistency);

    bad.turns = point.turns - 1;
    EXPECT_THROW(build_layout(constraints, bad), GeometryInconsistency);
}

TEST_F(SpiralBuilderTest, NoTurnsThrows) {
    DesignPoint empty = point;
    empty.turns = 0;
    EXPECT_THROW(build_layout(constraints, empty), GeometryInconsistency);
}

TEST_F(SpiralBuilderTest, ValidationCatchesTamperedLayout) {
    CoilLayout layout = build_layout(constraints, point);

    auto layers = layout.layers();
    auto transitions = layout.transitions();
    transitions[2].position = transitions[2].position + Vec2(0.001, 0.0);
    CoilLayout moved(layers, transitions, layout.terminal_layer(), layout.trace_width());
    EXPECT_FALSE(moved.validate(constraints).valid);

    layers = layout.layers();
    layers[1].turns.pop_back();
    CoilLayout short_layer(layers, layout.transitions(), layout.terminal_layer(),
                           layout.trace_width());
    EXPECT_FALSE(short_layer.validate(constraints).valid);
}

TEST_F(SpiralBuilderTest, TransitionPadsClearTheTurns) {
    CoilLayout layout = build_layout(constraints, point);
    ASSERT_TRUE(layout.validate(constraints).valid);

    // Pads wide enough to reach the outer turn
    auto transitions = layout.transitions();
    for (auto& t : transitions) {
        if (t.kind == TransitionKind::Outer) {
            t.pad_diameter *= 4.0;
        }
    }
    CoilLayout crowded(layout.layers(), transitions, layout.terminal_layer(),
                       layout.trace_width());
    ValidationResult result = crowded.validate(constraints);
    EXPECT_FALSE(result.valid);
    EXPECT_NE(result.error_summary().find("outer transition pad"), std::string::npos);

    // Inner pads grown into the innermost turn
    transitions = layout.transitions();
    for (auto& t : transitions) {
        if (t.kind == TransitionKind::Inner) {
            t.pad_diameter *= 4.0;
        }
    }
    CoilLayout inner_crowded(layout.layers(), transitions, layout.terminal_layer(),
                             layout.trace_width());
    EXPECT_FALSE(inner_crowded.validate(constraints).valid);
}
