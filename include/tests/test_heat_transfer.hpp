/**
 * @file test_heat_transfer.hpp
 * @brief Tests for the structured mesh, the Q9 basis, the quadrature rules,
 * the element assembly, the boundary conditions and the full solve
 * @author Paulo Akira
 * @date 2025
 */

#ifndef TEST_HEAT_TRANSFER_HPP
#define TEST_HEAT_TRANSFER_HPP

#include <iostream>
#include <iomanip>
#include <cassert>
#include <cmath>
#include <string>

#include <Eigen/Dense>

#include "mesh/uniform.hpp"
#include "models/config.hpp"
#include "models/exceptions.hpp"
#include "models/reference_element.hpp"
#include "solver/model.hpp"
#include "solver/solidHeatTransfer.hpp"
#include "utils/basis.hpp"
#include "utils/boundary.hpp"
#include "utils/integration.hpp"
#include "utils/matrix_helper.hpp"

namespace TestHeatTransfer {
    // Mesh generator
    void test_single_element_mesh();
    void test_two_by_two_nodal_numbering();
    void test_boundary_element_lists();
    void test_one_dimensional_mesh();

    // Basis and quadrature
    void test_quadrature_rules();
    void test_basis_partition_of_unity();
    void test_basis_kronecker_property();
    void test_basis_dimension_mismatch();

    // Assembly
    void test_rectangular_element_mapping();
    void test_assembled_system_properties();
    void test_degenerate_element();

    // Boundary conditions
    void test_convection_edge_integral();
    void test_constant_temp_rows();
    void test_constant_temp_precedence();

    // Full solve
    void test_constant_temp_solution();
    void test_convection_solution();
    void test_convective_plate();
    void test_dense_size_limit();

    void run_all();
}

#endif
