/**
 * @file templates.hpp
 * @brief Defines data structures passed between the pipeline stages
 * @author Paulo Akira
 * @date YYYY-MM-DD
 */

#ifndef HEATFEM_MODELS_TEMPLATES_HPP
#define HEATFEM_MODELS_TEMPLATES_HPP

#include <Eigen/Dense>
#include <array>
#include <vector>

#include "models/enums.hpp"

// Element touching a side of the domain
struct BoundaryElement {
    int element;        // 0-based element index
    BoundarySide side;  // side of the element lying on the boundary
};

// Mesh produced by the generator (or read from a mesh file)
struct MeshData {
    Eigen::VectorXd nodes_x; // x coordinate of every global node
    Eigen::VectorXd nodes_y; // y coordinate of every global node (zeros in 1D)
    int total_nodes_x = 0; // nodes along the x axis
    int total_nodes_y = 1; // nodes along the y axis

    // Nodal numbering (NOP): one row per element, 1-based global node ids
    // in the local order of models/reference_element.hpp
    Eigen::MatrixXi nop;

    // Boundary elements of each side, indexed by BoundarySide
    std::array<std::vector<BoundaryElement>, 4> boundary_elements;

    int total_nodes() const { return static_cast<int>(nodes_x.size()); }
    int total_elements() const { return static_cast<int>(nop.rows()); }
    int nodes_per_element() const { return static_cast<int>(nop.cols()); }

    // 0-based global node of a local node; the only place where the 1-based NOP is converted
    int global_node(int element, int local_node) const { return nop(element, local_node) - 1; }

    const std::vector<BoundaryElement>& boundary(BoundarySide side) const {
        return boundary_elements[static_cast<int>(side)];
    }
};

// Basis functions and natural derivatives at one point of the reference element
struct BasisFunctionSet {
    Eigen::VectorXd values;
    Eigen::VectorXd deriv_ksi;
    Eigen::VectorXd deriv_eta; // empty for 1D elements
};

// Gauss rule on [0,1]
struct GaussRule {
    Eigen::VectorXd points;
    Eigen::VectorXd weights;

    int size() const { return static_cast<int>(points.size()); }
};

// Physical quantities of the isoparametric mapping at one point
struct IsoparametricMap {
    double x = 0.0;
    double y = 0.0;
    double x_ksi = 0.0; // dx/dksi
    double x_eta = 0.0; // dx/deta
    double y_ksi = 0.0; // dy/dksi
    double y_eta = 0.0; // dy/deta
    double det_jacobian = 0.0;
};

// Dense Galerkin system
struct LinearSystem {
    Eigen::MatrixXd jacobian;
    Eigen::VectorXd residual;
};

// Node coordinates returned with every result
struct NodesCoordinates {
    Eigen::VectorXd x;
    Eigen::VectorXd y;
};

struct AssemblyResult {
    LinearSystem system;
    NodesCoordinates coordinates;
};

struct SolveResult {
    Eigen::VectorXd solution;
    NodesCoordinates coordinates;
};

#endif
