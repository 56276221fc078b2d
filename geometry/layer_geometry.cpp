#include "layer_geometry.hpp"
#include <coil/coil_model.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

namespace magtorq {

namespace {

// Geometric comparisons tolerate 1 nm of rounding
constexpr double GEOMETRY_EPS = 1e-9;

void append_path(std::vector<Vec2>& out, const std::vector<Vec2>& points) {
    for (const auto& p : points) {
        if (out.empty() || out.back() != p) {
            out.push_back(p);
        }
    }
}

double path_length(const std::vector<Vec2>& points) {
    double length = 0.0;
    for (size_t i = 1; i < points.size(); ++i) {
        length += points[i - 1].distance_to(points[i]);
    }
    return length;
}

// Half extents of the rectangle traced by the four corners of a turn
std::pair<double, double> turn_half_extents(const std::vector<Vec2>& turn) {
    double hx = 0.0;
    double hy = 0.0;
    for (size_t i = 0; i < turn.size() && i < 4; ++i) {
        hx = std::max(hx, std::abs(turn[i].x));
        hy = std::max(hy, std::abs(turn[i].y));
    }
    return {hx, hy};
}

std::string layer_label(const LayerGeometry& layer) {
    return "layer " + std::to_string(layer.index);
}

}  // namespace

const char* to_string(WindingDirection direction) {
    switch (direction) {
        case WindingDirection::Clockwise: return "clockwise";
        case WindingDirection::CounterClockwise: return "counter_clockwise";
    }
    return "unknown";
}

const char* to_string(TransitionKind kind) {
    switch (kind) {
        case TransitionKind::Inner: return "inner";
        case TransitionKind::Outer: return "outer";
        case TransitionKind::Feed: return "feed";
    }
    return "unknown";
}

std::vector<Vec2> LayerGeometry::to_polyline() const {
    std::vector<Vec2> out;
    append_path(out, outer_lead);
    for (const auto& turn : turns) {
        append_path(out, turn);
    }
    append_path(out, inner_lead);
    return out;
}

double LayerGeometry::trace_length() const {
    return path_length(to_polyline());
}

CoilLayout::CoilLayout(std::vector<LayerGeometry> layers,
                       std::vector<Transition> transitions,
                       int terminal_layer,
                       double trace_width)
    : layers_(std::move(layers))
    , transitions_(std::move(transitions))
    , terminal_layer_(terminal_layer)
    , trace_width_(trace_width) {}

int CoilLayout::turns_per_layer() const {
    return layers_.empty() ? 0 : static_cast<int>(layers_.front().turn_count());
}

std::vector<Vec2> CoilLayout::to_polyline(size_t layer_index) const {
    return layers_.at(layer_index).to_polyline();
}

double CoilLayout::total_trace_length() const {
    double total = 0.0;
    for (const auto& layer : layers_) {
        total += layer.trace_length();
    }
    return total;
}

std::pair<Vec2, Vec2> CoilLayout::bounding_box() const {
    constexpr double inf = std::numeric_limits<double>::infinity();
    Vec2 min_pt(inf, inf);
    Vec2 max_pt(-inf, -inf);

    auto extend = [&](const Vec2& p) {
        min_pt.x = std::min(min_pt.x, p.x);
        min_pt.y = std::min(min_pt.y, p.y);
        max_pt.x = std::max(max_pt.x, p.x);
        max_pt.y = std::max(max_pt.y, p.y);
    };

    for (const auto& layer : layers_) {
        for (const auto& p : layer.to_polyline()) {
            extend(p);
        }
    }
    for (const auto& t : transitions_) {
        extend(t.position);
    }

    if (layers_.empty() && transitions_.empty()) {
        return {Vec2(), Vec2()};
    }
    return {min_pt, max_pt};
}

ValidationResult CoilLayout::validate(const ConstraintSet& constraints) const {
    ValidationResult result;

    CoilModel model(constraints);
    const auto& d = constraints.design;
    const auto& m = constraints.manufacturing;
    const double w = trace_width_;
    const double pitch = model.turn_pitch(w);
    const double keepout = model.inner_keepout(w);
    const double lane = model.lane_width(w);

    if (w < m.min_trace_width - GEOMETRY_EPS || w > m.max_trace_width + GEOMETRY_EPS) {
        result.add_error("trace width " + std::to_string(w) + " m outside manufacturing bounds");
    }
    if (static_cast<int>(layers_.size()) != constraints.winding_layers()) {
        result.add_error("expected " + std::to_string(constraints.winding_layers()) +
                         " winding layers, got " + std::to_string(layers_.size()));
    }
    if (terminal_layer_ != d.num_layers - 1) {
        result.add_error("terminal layer must be the last physical layer");
    }

    const int turns = turns_per_layer();
    for (size_t i = 0; i < layers_.size(); ++i) {
        const auto& layer = layers_[i];
        const std::string label = layer_label(layer);

        if (layer.index != static_cast<int>(i)) {
            result.add_error(label + " stored at position " + std::to_string(i));
        }
        WindingDirection expected = (i % 2 == 0) ? WindingDirection::Clockwise
                                                 : WindingDirection::CounterClockwise;
        if (layer.direction != expected) {
            result.add_error(label + " winds " + to_string(layer.direction) +
                             ", expected " + to_string(expected));
        }
        if (static_cast<int>(layer.turn_count()) != turns) {
            result.add_error(label + " has " + std::to_string(layer.turn_count()) +
                             " turns, expected " + std::to_string(turns));
        }
        if (layer.turns.empty()) {
            continue;
        }

        // Traces run along the board axes only
        auto path = layer.to_polyline();
        for (size_t k = 1; k < path.size(); ++k) {
            if (std::abs(path[k].x - path[k - 1].x) > GEOMETRY_EPS &&
                std::abs(path[k].y - path[k - 1].y) > GEOMETRY_EPS) {
                result.add_error(label + " has a diagonal segment at point " + std::to_string(k));
                break;
            }
        }

        auto outer = turn_half_extents(layer.turns.front());
        if (outer.first + w / 2.0 > d.outer_width / 2.0 + GEOMETRY_EPS ||
            outer.second + w / 2.0 > d.outer_length / 2.0 + GEOMETRY_EPS) {
            result.add_error(label + " outer turn exceeds the board envelope");
        }

        for (size_t k = 1; k < layer.turns.size(); ++k) {
            auto prev = turn_half_extents(layer.turns[k - 1]);
            auto cur = turn_half_extents(layer.turns[k]);
            if (prev.first - cur.first < pitch - GEOMETRY_EPS ||
                prev.second - cur.second < pitch - GEOMETRY_EPS) {
                result.add_error(label + " turns " + std::to_string(k - 1) + " and " +
                                 std::to_string(k) + " closer than the minimum spacing");
            }
        }

        auto inner = turn_half_extents(layer.turns.back());
        if (inner.first - w / 2.0 - d.inner_width / 2.0 < keepout - GEOMETRY_EPS ||
            inner.second - w / 2.0 - d.inner_length / 2.0 < keepout - GEOMETRY_EPS) {
            result.add_error(label + " innermost turn violates the cutout keep-out");
        }

        for (const auto& p : layer.inner_lead) {
            if (std::abs(p.y) - lane / 2.0 - d.inner_length / 2.0 <
                m.min_trace_spacing + m.inner_clearance - GEOMETRY_EPS) {
                result.add_error(label + " inner lead too close to the cutout");
                break;
            }
        }
    }

    // Transition pads keep the minimum spacing to the turns they pass. Outer
    // and feed pads sit beyond the outer turn, inner pads inside the innermost
    if (!layers_.empty() && !layers_.front().turns.empty()) {
        auto outer = turn_half_extents(layers_.front().turns.front());
        auto inner = turn_half_extents(layers_.front().turns.back());
        const Transition* outer_pad = nullptr;

        for (const auto& t : transitions_) {
            double half_pad = t.pad_diameter / 2.0;
            double clearance = (t.kind == TransitionKind::Inner)
                ? (inner.second - w / 2.0) - (std::abs(t.position.y) + half_pad)
                : (std::abs(t.position.y) - half_pad) - (outer.second + w / 2.0);
            if (clearance < m.min_trace_spacing - GEOMETRY_EPS) {
                result.add_error(std::string(to_string(t.kind)) + " transition pad at y = " +
                                 std::to_string(t.position.y * 1e3) +
                                 " mm is closer than the minimum spacing to the turns");
            }
            if (t.kind == TransitionKind::Outer) {
                outer_pad = &t;
            }
        }

        for (const auto& t : transitions_) {
            if (t.kind != TransitionKind::Feed || !outer_pad) {
                continue;
            }
            double gap = t.position.distance_to(outer_pad->position) -
                         (t.pad_diameter + outer_pad->pad_diameter) / 2.0;
            if (gap < m.min_trace_spacing - GEOMETRY_EPS) {
                result.add_error("feed transition pad overlaps the outer transition pad");
            }
        }
    }

    // Series chain: feed -> layer 0 -> ... -> last winding layer -> terminal
    auto find_transition = [&](int from, int to) -> const Transition* {
        for (const auto& t : transitions_) {
            if (t.from_layer == from && t.to_layer == to) {
                return &t;
            }
        }
        return nullptr;
    };

    if (!layers_.empty()) {
        const Transition* feed = find_transition(terminal_layer_, 0);
        if (!feed) {
            result.add_error("missing feed transition into layer 0");
        } else if (feed->position != layers_.front().entry) {
            result.add_error("feed transition does not meet the layer 0 entry");
        }

        for (size_t i = 0; i < layers_.size(); ++i) {
            int to = (i + 1 < layers_.size()) ? static_cast<int>(i + 1) : terminal_layer_;
            const Transition* t = find_transition(static_cast<int>(i), to);
            if (!t) {
                result.add_error("missing transition from layer " + std::to_string(i) +
                                 " to layer " + std::to_string(to));
                continue;
            }
            if (t->position != layers_[i].exit) {
                result.add_error("transition from layer " + std::to_string(i) +
                                 " does not meet its exit");
            }
            if (i + 1 < layers_.size() && t->position != layers_[i + 1].entry) {
                result.add_error("transition into layer " + std::to_string(i + 1) +
                                 " does not meet its entry");
            }
            if (!(t->drill < t->pad_diameter)) {
                result.add_error("transition drill must be smaller than its pad");
            }
        }
    }

    // Transitions of one kind share one position
    for (const auto& a : transitions_) {
        for (const auto& b : transitions_) {
            if (a.kind == b.kind && a.position != b.position) {
                result.add_error(std::string(to_string(a.kind)) +
                                 " transitions are not aligned");
                return result;
            }
        }
    }

    return result;
}

}  // namespace magtorq
