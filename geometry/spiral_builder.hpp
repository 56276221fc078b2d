#ifndef MAGTORQ_SPIRAL_BUILDER_HPP
#define MAGTORQ_SPIRAL_BUILDER_HPP

#include "layer_geometry.hpp"
#include <coil/coil_model.hpp>
#include <optimizer/coil_optimizer.hpp>
#include <vector>

namespace magtorq {

// Turns a committed design point into the multi-layer spiral layout.
// Deterministic and non-iterative: the same point always yields the same
// coordinates.
//
// Even layers wind clockwise from the outer lead inward and leave through
// the inner transition; odd layers are their mirror image (x -> -x), entered
// at the inner transition and left at the outer one, so current circulates
// the same way on every layer.
class SpiralBuilder {
public:
    SpiralBuilder(const ConstraintSet& constraints, const DesignPoint& point);

    // Throws GeometryInconsistency when the point does not fit the board
    CoilLayout build() const;

    // Transition points, all on the y axis
    Vec2 inner_transition() const;
    Vec2 outer_transition() const;
    Vec2 feed_transition() const;

    // Distance from a turn's centerline to the centerline of a lead running
    // alongside it with a transition pad at its end
    double lead_offset() const;

    // Throws GeometryInconsistency unless the turn count is what the shared
    // formula gives for the trace width and the innermost turn clears the
    // cutout on both axes
    static void check_consistency(const CoilModel& model, const DesignPoint& point);

private:
    // Clockwise layer entered at outer_entry
    LayerGeometry build_clockwise_layer(int index, const Vec2& outer_entry) const;

    std::vector<Transition> build_transitions() const;

    const ConstraintSet& constraints_;
    CoilModel model_;
    DesignPoint point_;
    std::vector<TurnRect> rects_;
};

// Layout for a design point
CoilLayout build_layout(const ConstraintSet& constraints, const DesignPoint& point);

// Layout for the design an optimization committed to
CoilLayout build_layout(const ConstraintSet& constraints, const OptimizationResult& result);

}  // namespace magtorq

#endif // MAGTORQ_SPIRAL_BUILDER_HPP
