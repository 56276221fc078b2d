#include "constraint_set.hpp"
#include <common/logging.hpp>
#include <cmath>
#include <string>

namespace magtorq {

namespace {

void check_positive(ValidationResult& result, const char* name, double value) {
    if (!std::isfinite(value) || value <= 0.0) {
        result.add_error(std::string(name) + " must be positive (got " +
                         std::to_string(value) + ")");
    }
}

void check_finite(ValidationResult& result, const char* name, double value) {
    if (!std::isfinite(value)) {
        result.add_error(std::string(name) + " must be finite");
    }
}

}  // namespace

ValidationResult validate(const ConstraintSet& c) {
    ValidationResult result;

    const auto& phys = c.physical;
    check_positive(result, "vacuum_permeability", phys.vacuum_permeability);
    check_positive(result, "copper_resistivity", phys.copper_resistivity);
    check_positive(result, "temperature_coefficient", phys.temperature_coefficient);
    check_positive(result, "oz_to_m", phys.oz_to_m);
    check_positive(result, "current_density_limit", phys.current_density_limit);
    check_finite(result, "reference_temp", phys.reference_temp);

    const auto& th = c.thermal;
    check_positive(result, "thermal_conductivity_copper", th.thermal_conductivity_copper);
    check_positive(result, "thermal_conductivity_fr4", th.thermal_conductivity_fr4);
    check_positive(result, "fr4_thickness", th.fr4_thickness);
    check_positive(result, "surface_area_multiplier", th.surface_area_multiplier);
    check_positive(result, "emissivity", th.emissivity);
    if (th.emissivity > 1.0) {
        result.add_error("emissivity must not exceed 1");
    }
    if (!std::isfinite(th.ground_convection_coefficient) || th.ground_convection_coefficient < 0.0) {
        result.add_error("ground_convection_coefficient must be zero or positive");
    }
    check_finite(result, "space_ambient_temp", th.space_ambient_temp);
    check_finite(result, "max_equilibrium_temp", th.max_equilibrium_temp);

    const auto& d = c.design;
    if (d.num_layers < 2) {
        result.add_error("num_layers must be at least 2 (one winding layer plus the terminal layer)");
    }
    check_positive(result, "copper_weight", d.copper_weight);
    check_positive(result, "max_power", d.max_power);
    check_positive(result, "voltage", d.voltage);
    check_positive(result, "inner_length", d.inner_length);
    check_positive(result, "inner_width", d.inner_width);
    check_positive(result, "outer_length", d.outer_length);
    check_positive(result, "outer_width", d.outer_width);
    check_finite(result, "operating_temp", d.operating_temp);
    check_finite(result, "ambient_temp", d.ambient_temp);

    if (d.inner_length >= d.outer_length) {
        result.add_error("inner_length must be less than outer_length");
    }
    if (d.inner_width >= d.outer_width) {
        result.add_error("inner_width must be less than outer_width");
    }

    // Temperatures are in Celsius; they only need a consistent ordering
    if (d.operating_temp <= d.ambient_temp) {
        result.add_error("operating_temp must be above ambient_temp");
    }
    if (d.operating_temp <= th.space_ambient_temp) {
        result.add_error("operating_temp must be above space_ambient_temp");
    }
    if (th.max_equilibrium_temp <= d.operating_temp) {
        result.add_error("max_equilibrium_temp must be above operating_temp");
    }
    if (to_kelvin(d.ambient_temp) <= 0.0 || to_kelvin(th.space_ambient_temp) <= 0.0) {
        result.add_error("ambient temperatures must be above absolute zero");
    }

    const auto& m = c.manufacturing;
    check_positive(result, "min_trace_width", m.min_trace_width);
    check_positive(result, "max_trace_width", m.max_trace_width);
    check_positive(result, "min_trace_spacing", m.min_trace_spacing);
    check_positive(result, "via_drill", m.via_drill);
    check_positive(result, "via_pad_diameter", m.via_pad_diameter);
    if (!std::isfinite(m.inner_clearance) || m.inner_clearance < 0.0) {
        result.add_error("inner_clearance must be zero or positive");
    }
    if (m.min_trace_width > m.max_trace_width) {
        result.add_error("min_trace_width must not exceed max_trace_width");
    }
    if (m.via_drill >= m.via_pad_diameter) {
        result.add_error("via_drill must be smaller than via_pad_diameter");
    }

    if (result.valid && d.num_layers > 16) {
        result.add_warning("num_layers = " + std::to_string(d.num_layers) +
                           " is unusual for a PCB stack-up");
    }

    return result;
}

void require_valid(const ConstraintSet& constraints) {
    auto log = magtorq::logging::get_logger();
    ValidationResult result = validate(constraints);

    for (const auto& warning : result.warnings) {
        log->warn("Constraint set: {}", warning);
    }

    if (!result.valid) {
        log->error("Invalid constraint set: {}", result.error_summary());
        throw ConfigurationError("invalid constraint set: " + result.error_summary());
    }
}

}  // namespace magtorq
