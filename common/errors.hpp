#ifndef MAGTORQ_COMMON_ERRORS_HPP
#define MAGTORQ_COMMON_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <vector>

namespace magtorq {

// Constraint set violates a basic invariant (non-positive dimension,
// inner >= outer, min > max trace width, ...). Raised before any search.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& msg)
        : std::runtime_error(msg) {}
};

// The generated geometry does not match the committed design point.
// Signals a broken optimizer/geometry coupling, not a user error.
class GeometryInconsistency : public std::logic_error {
public:
    explicit GeometryInconsistency(const std::string& msg)
        : std::logic_error(msg) {}
};

// Validation result collecting every problem found, not just the first
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> warnings;
    std::vector<std::string> errors;

    void add_warning(const std::string& msg) {
        warnings.push_back(msg);
    }

    void add_error(const std::string& msg) {
        errors.push_back(msg);
        valid = false;
    }

    // All errors joined into one diagnostic line
    std::string error_summary() const {
        std::string out;
        for (size_t i = 0; i < errors.size(); ++i) {
            if (i > 0) out += "; ";
            out += errors[i];
        }
        return out;
    }
};

}  // namespace magtorq

#endif // MAGTORQ_COMMON_ERRORS_HPP
