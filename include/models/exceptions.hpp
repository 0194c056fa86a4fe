/**
 * @file exceptions.hpp
 * @brief Exception types raised by the solve pipeline
 */

#ifndef HEATFEM_MODELS_EXCEPTIONS_HPP
#define HEATFEM_MODELS_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>

/**
 * @brief Missing or invalid problem settings (mesh, boundary conditions, solver)
 */
class ConfigurationError : public std::invalid_argument {
    public:
        explicit ConfigurationError(const std::string& what)
            : std::invalid_argument(what) {}
};

/**
 * @brief Dimension/order combination without an implemented basis, numbering
 * or boundary path
 */
class UnsupportedConfigurationError : public std::logic_error {
    public:
        explicit UnsupportedConfigurationError(const std::string& what)
            : std::logic_error(what) {}
};

/**
 * @brief Non-positive determinant of the isoparametric mapping
 */
class DegenerateElementError : public std::runtime_error {
    public:
        DegenerateElementError(int element_index, double det_jacobian)
            : std::runtime_error(
                "Degenerate element " + std::to_string(element_index) +
                ": Jacobian determinant " + std::to_string(det_jacobian) + " <= 0"),
              element_index_(element_index),
              det_jacobian_(det_jacobian) {}

        int element() const { return element_index_; }
        double det_jacobian() const { return det_jacobian_; }

    private:
        int element_index_;
        double det_jacobian_;
};

/**
 * @brief Unknown boundary key or condition kind
 */
class BoundaryConditionError : public std::invalid_argument {
    public:
        explicit BoundaryConditionError(const std::string& what)
            : std::invalid_argument(what) {}
};

/**
 * @brief The direct solver met a zero pivot
 */
class SingularSystemError : public std::runtime_error {
    public:
        explicit SingularSystemError(const std::string& what)
            : std::runtime_error(what) {}
};

#endif // HEATFEM_MODELS_EXCEPTIONS_HPP
