#ifndef MAGTORQ_COIL_CONSTRAINT_SET_HPP
#define MAGTORQ_COIL_CONSTRAINT_SET_HPP

#include <common/errors.hpp>

namespace magtorq {

constexpr double KELVIN_OFFSET = 273.15;
constexpr double STEFAN_BOLTZMANN = 5.670374419e-8;  // W/(m^2 K^4)

inline constexpr double to_kelvin(double celsius) {
    return celsius + KELVIN_OFFSET;
}

inline constexpr double to_celsius(double kelvin) {
    return kelvin - KELVIN_OFFSET;
}

struct PhysicalConstants {
    double vacuum_permeability = 1.25663706212e-6;  // H/m
    double copper_resistivity = 1.68e-8;            // Ohm*m at reference_temp
    double temperature_coefficient = 0.00393;       // 1/K
    double reference_temp = 20.0;                   // C, resistivity reference
    double oz_to_m = 3.48e-5;                       // copper thickness per oz
    double current_density_limit = 35.0e6;          // A/m^2
};

struct ThermalProperties {
    double thermal_conductivity_copper = 385.0;     // W/(m K)
    double thermal_conductivity_fr4 = 0.3;          // W/(m K)
    double fr4_thickness = 1.6e-3;                  // m
    double surface_area_multiplier = 2.0;           // both faces of the board
    double emissivity = 0.9;
    double ground_convection_coefficient = 0.0;     // W/(m^2 K), bench tests in air
    double space_ambient_temp = 0.0;                // C, on-orbit baseplate
    double max_equilibrium_temp = 400.0;            // C, root-find ceiling
};

struct DesignConstraints {
    int num_layers = 6;               // winding layers + one terminal layer
    double copper_weight = 1.0;       // oz
    double max_power = 1.0;           // W
    double voltage = 8.2;             // V
    double inner_length = 0.097;      // m, cutout along y
    double inner_width = 0.025;       // m, cutout along x
    double outer_length = 0.132;      // m
    double outer_width = 0.061;       // m
    double operating_temp = 65.0;     // C
    double ambient_temp = 20.0;       // C, ground test ambient
};

struct ManufacturingConstraints {
    double min_trace_width = 0.15e-3;    // m
    double max_trace_width = 1.0e-3;     // m
    double min_trace_spacing = 0.15e-3;  // m
    double via_drill = 0.3e-3;           // m
    double via_pad_diameter = 0.6e-3;    // m
    double inner_clearance = 0.0;        // m, extra keep-out around the cutout
};

// Immutable input of one optimization run
struct ConstraintSet {
    PhysicalConstants physical;
    ThermalProperties thermal;
    DesignConstraints design;
    ManufacturingConstraints manufacturing;

    // Derived properties
    double copper_thickness() const {
        return design.copper_weight * physical.oz_to_m;
    }

    // The last physical layer carries the terminal connections
    int winding_layers() const {
        return design.num_layers - 1;
    }

    // Radiating area of the board
    double radiating_area() const {
        return thermal.surface_area_multiplier *
               design.outer_length * design.outer_width;
    }

    // 6-layer board, 1 W at 8.2 V, 132 x 61 mm outline around a 97 x 25 mm cutout
    static ConstraintSet sample() {
        return ConstraintSet{};
    }
};

// Check every invariant, collecting all violations
ValidationResult validate(const ConstraintSet& constraints);

// Throws ConfigurationError listing every violation
void require_valid(const ConstraintSet& constraints);

}  // namespace magtorq

#endif // MAGTORQ_COIL_CONSTRAINT_SET_HPP
