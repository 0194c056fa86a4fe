/**
 * @file test_linear_algebra.hpp
 * @brief Tests for the dense LU solver against Eigen's partial-pivoting LU
 * @author Paulo Akira
 * @date 2025
 */

#ifndef TEST_LINEAR_ALGEBRA_HPP
#define TEST_LINEAR_ALGEBRA_HPP

#include <iostream>
#include <Eigen/Dense>
#include <cassert>
#include <cmath>
#include <random>
#include <iomanip>
#include <vector>

#include "utils/scope_timer.hpp"
#include "linear_algebra/gauss_elimination.hpp"

namespace TestLinearAlgebra {
    void test_basic_solve();
    void test_blocked_factorization();
    void test_row_exchanges();
    void test_singular_matrix();
    void test_multiple_solves();
    void test_solution_accuracy();

    void run_all();
}

#endif
