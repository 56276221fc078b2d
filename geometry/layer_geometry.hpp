#ifndef MAGTORQ_LAYER_GEOMETRY_HPP
#define MAGTORQ_LAYER_GEOMETRY_HPP

#include <math/vec2.hpp>
#include <coil/constraint_set.hpp>
#include <utility>
#include <vector>

namespace magtorq {

// Sense of the spiral drawn from the outer turn inward, viewed from the top
enum class WindingDirection {
    Clockwise,
    CounterClockwise
};

enum class TransitionKind {
    Inner,   // inside the innermost turn
    Outer,   // outside the outermost turn
    Feed     // terminal layer into the first winding layer
};

const char* to_string(WindingDirection direction);
const char* to_string(TransitionKind kind);

// Via joining two copper layers
struct Transition {
    int from_layer = 0;
    int to_layer = 0;
    TransitionKind kind = TransitionKind::Inner;
    Vec2 position;
    double drill = 0.0;          // m
    double pad_diameter = 0.0;   // m
};

// Spiral trace on one winding layer. Polylines are centerlines in meters,
// drawn from the outer edge inward regardless of current direction.
struct LayerGeometry {
    int index = 0;
    WindingDirection direction = WindingDirection::Clockwise;

    // One polyline per turn, outermost first. Turn k ends where the step onto
    // turn k+1 begins.
    std::vector<std::vector<Vec2>> turns;

    std::vector<Vec2> outer_lead;   // outer transition to the first turn
    std::vector<Vec2> inner_lead;   // innermost turn to the inner transition

    Vec2 entry;   // current enters here
    Vec2 exit;    // and leaves here

    size_t turn_count() const { return turns.size(); }

    // Outer lead, every turn and the inner lead as one continuous path
    std::vector<Vec2> to_polyline() const;

    double trace_length() const;
};

// All winding layers of a coil plus the vias that chain them in series
class CoilLayout {
public:
    CoilLayout() = default;
    CoilLayout(std::vector<LayerGeometry> layers,
               std::vector<Transition> transitions,
               int terminal_layer,
               double trace_width);

    const std::vector<LayerGeometry>& layers() const { return layers_; }
    const LayerGeometry& layer(size_t index) const { return layers_.at(index); }
    size_t layer_count() const { return layers_.size(); }

    const std::vector<Transition>& transitions() const { return transitions_; }

    // Last physical layer, reserved for the terminal connections
    int terminal_layer() const { return terminal_layer_; }

    double trace_width() const { return trace_width_; }

    // Turns per layer; zero for an empty layout
    int turns_per_layer() const;

    // Check spacing, envelope, keep-out and layer chaining
    ValidationResult validate(const ConstraintSet& constraints) const;

    // Path of one layer
    std::vector<Vec2> to_polyline(size_t layer_index) const;

    // Trace length summed over every winding layer
    double total_trace_length() const;

    // Min and max corners over every path point and transition
    std::pair<Vec2, Vec2> bounding_box() const;

private:
    std::vector<LayerGeometry> layers_;
    std::vector<Transition> transitions_;
    int terminal_layer_ = 0;
    double trace_width_ = 0.0;
};

}  // namespace magtorq

#endif // MAGTORQ_LAYER_GEOMETRY_HPP
