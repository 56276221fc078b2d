#include "spiral_builder.hpp"
#include <common/logging.hpp>
#include <algorithm>
#include <string>

namespace magtorq {

SpiralBuilder::SpiralBuilder(const ConstraintSet& constraints, const DesignPoint& point)
    : constraints_(constraints)
    , model_(constraints)
    , point_(point) {
    for (int k = 0; k < point_.turns; ++k) {
        rects_.push_back(model_.turn_rect(k, point_.trace_width));
    }
}

void SpiralBuilder::check_consistency(const CoilModel& model, const DesignPoint& point) {
    auto log = magtorq::logging::get_logger();

    auto fail = [&](const std::string& msg) {
        log->error("SpiralBuilder: {}", msg);
        throw GeometryInconsistency(msg);
    };

    if (point.turns < 1) {
        fail("design point has " + std::to_string(point.turns) + " turns per layer");
    }

    int expected = model.turn_count(point.trace_width);
    if (point.turns != expected) {
        fail("design point commits to " + std::to_string(point.turns) +
             " turns but trace width " + std::to_string(point.trace_width * 1e3) +
             " mm fits " + std::to_string(expected));
    }

    // The keep-out is checked through the same floor as the turn count, so a
    // width on a turn-count boundary is not rejected by rounding
    double span_length = model.half_span_length();
    double span_width = model.half_span_width();
    if (model.turns_for_span(span_length, point.trace_width) < point.turns ||
        model.turns_for_span(span_width, point.trace_width) < point.turns) {
        double keepout = model.inner_keepout(point.trace_width);
        double gap_length = model.innermost_gap(span_length, point.turns, point.trace_width);
        double gap_width = model.innermost_gap(span_width, point.turns, point.trace_width);
        fail("innermost turn leaves " + std::to_string(std::min(gap_length, gap_width) * 1e3) +
             " mm to the cutout, keep-out needs " + std::to_string(keepout * 1e3) + " mm");
    }
}

double SpiralBuilder::lead_offset() const {
    return point_.trace_width / 2.0 +
           constraints_.manufacturing.min_trace_spacing +
           model_.lane_width(point_.trace_width) / 2.0;
}

Vec2 SpiralBuilder::inner_transition() const {
    return Vec2(0.0, rects_.back().half_length - lead_offset());
}

Vec2 SpiralBuilder::outer_transition() const {
    return Vec2(0.0, rects_.front().half_length + lead_offset());
}

Vec2 SpiralBuilder::feed_transition() const {
    // One pad pitch beyond the outer transitions, clear of their pads
    double offset = model_.lane_width(point_.trace_width) +
                    constraints_.manufacturing.min_trace_spacing;
    return outer_transition() + Vec2(0.0, offset);
}

LayerGeometry SpiralBuilder::build_clockwise_layer(int index, const Vec2& outer_entry) const {
    LayerGeometry layer;
    layer.index = index;
    layer.direction = WindingDirection::Clockwise;

    const TurnRect& first = rects_.front();
    layer.outer_lead = {
        outer_entry,
        Vec2(-first.half_width, outer_entry.y),
        Vec2(-first.half_width, first.half_length),
    };

    const Vec2 lane_end = inner_transition();
    const int n = static_cast<int>(rects_.size());
    for (int k = 0; k < n; ++k) {
        const double a = rects_[k].half_length;
        const double b = rects_[k].half_width;

        // The left side climbs to the next turn's top edge, or to the lane
        double climb_to = (k + 1 < n) ? rects_[k + 1].half_length : lane_end.y;

        layer.turns.push_back({
            Vec2(-b, a),
            Vec2(b, a),
            Vec2(b, -a),
            Vec2(-b, -a),
            Vec2(-b, climb_to),
        });
    }

    layer.inner_lead = {
        Vec2(-rects_.back().half_width, lane_end.y),
        lane_end,
    };

    layer.entry = outer_entry;
    layer.exit = lane_end;
    return layer;
}

std::vector<Transition> SpiralBuilder::build_transitions() const {
    const auto& m = constraints_.manufacturing;
    const int winding_layers = constraints_.winding_layers();
    const int terminal = constraints_.design.num_layers - 1;

    std::vector<Transition> transitions;

    Transition feed;
    feed.from_layer = terminal;
    feed.to_layer = 0;
    feed.kind = TransitionKind::Feed;
    feed.position = feed_transition();
    feed.drill = m.via_drill;
    feed.pad_diameter = m.via_pad_diameter;
    transitions.push_back(feed);

    for (int i = 0; i < winding_layers; ++i) {
        Transition t;
        t.from_layer = i;
        t.to_layer = (i + 1 < winding_layers) ? i + 1 : terminal;
        t.kind = (i % 2 == 0) ? TransitionKind::Inner : TransitionKind::Outer;
        t.position = (i % 2 == 0) ? inner_transition() : outer_transition();
        t.drill = m.via_drill;
        t.pad_diameter = m.via_pad_diameter;
        transitions.push_back(t);
    }
    return transitions;
}

CoilLayout SpiralBuilder::build() const {
    auto log = magtorq::logging::get_logger();

    check_consistency(model_, point_);

    const int winding_layers = constraints_.winding_layers();
    log->debug("SpiralBuilder: {} winding layers, {} turns, w = {:.4f} mm",
               winding_layers, point_.turns, point_.trace_width * 1e3);

    std::vector<LayerGeometry> layers;
    layers.reserve(winding_layers);

    for (int i = 0; i < winding_layers; ++i) {
        if (i % 2 == 0) {
            Vec2 entry = (i == 0) ? feed_transition() : outer_transition();
            layers.push_back(build_clockwise_layer(i, entry));
            continue;
        }

        // Odd layers mirror the clockwise spiral and carry current outward
        LayerGeometry layer = build_clockwise_layer(i, outer_transition());
        for (auto& turn : layer.turns) {
            for (auto& p : turn) {
                p = p.mirrored_x();
            }
        }
        for (auto& p : layer.outer_lead) {
            p = p.mirrored_x();
        }
        for (auto& p : layer.inner_lead) {
            p = p.mirrored_x();
        }
        layer.direction = WindingDirection::CounterClockwise;
        layer.entry = inner_transition();
        layer.exit = outer_transition();
        layers.push_back(std::move(layer));
    }

    CoilLayout layout(std::move(layers), build_transitions(),
                      constraints_.design.num_layers - 1, point_.trace_width);

    log->debug("SpiralBuilder: {} transitions, {:.4f} m of trace",
               layout.transitions().size(), layout.total_trace_length());
    return layout;
}

CoilLayout build_layout(const ConstraintSet& constraints, const DesignPoint& point) {
    SpiralBuilder builder(constraints, point);
    return builder.build();
}

CoilLayout build_layout(const ConstraintSet& constraints, const OptimizationResult& result) {
    return build_layout(constraints, result.design);
}

}  // namespace magtorq
