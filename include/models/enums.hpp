/**
 * @file enums.hpp
 * @brief Defines enumerations used throughout the library
 * @author Paulo Akira
 * @date YYYY-MM-DD
 */

#ifndef HEATFEM_MODELS_ENUMS_HPP
#define HEATFEM_MODELS_ENUMS_HPP

#include <string>

/**
 * @enum SolverType
 * @brief Physics selected by the problem configuration
 */
enum class SolverType {
    /**
     * @brief Steady-state heat conduction in a solid
     */
    SolidHeatTransfer
};

/**
 * @enum MeshDimension
 * @brief Spatial dimension of the computational mesh
 */
enum class MeshDimension {
    /**
     * @brief Segment [0, maxX]
     */
    OneD,

    /**
     * @brief Rectangle [0, maxX] x [0, maxY]
     */
    TwoD
};

/**
 * @enum ElementOrder
 * @brief Polynomial order of the Lagrange elements
 */
enum class ElementOrder {
    /**
     * @brief 2-node segments / 4-node quadrilaterals
     */
    Linear,

    /**
     * @brief 3-node segments / 9-node quadrilaterals
     */
    Quadratic
};

/**
 * @enum BoundarySide
 * @brief Sides of the rectangular domain (and of the reference element)
 */
enum class BoundarySide {
    Bottom = 0,
    Left = 1,
    Top = 2,
    Right = 3
};

/**
 * @enum BoundaryConditionType
 * @brief Thermal boundary condition kinds
 */
enum class BoundaryConditionType {
    /**
     * @brief Robin condition: heat exchange with an external medium
     */
    Convection,

    /**
     * @brief Dirichlet condition: prescribed temperature
     */
    ConstantTemp
};

// string conversions used by the JSON readers and by the debug output
std::string to_string(MeshDimension dimension);
std::string to_string(ElementOrder order);
std::string to_string(BoundarySide side);
std::string to_string(BoundaryConditionType type);

MeshDimension parse_mesh_dimension(const std::string& value);
ElementOrder parse_element_order(const std::string& value);
SolverType parse_solver_type(const std::string& value);
BoundaryConditionType parse_boundary_condition_type(const std::string& value);

/**
 * @brief Map a boundary key to a side of the domain
 *
 * Accepts "bottom", "left", "top", "right", the same names with a "Boundary"
 * suffix ("leftBoundary") and the side indices "0" to "3".
 */
BoundarySide parse_boundary_side(const std::string& key);

#endif // HEATFEM_MODELS_ENUMS_HPP
