#ifndef HEATFEM_MATRIX_HELPER_HPP
#define HEATFEM_MATRIX_HELPER_HPP

#include <cmath>
#include <string>
#include <iostream>
#include <iomanip>
#include <algorithm>

#include <Eigen/Dense>

#include "models/templates.hpp"

struct MatrixInfo {
    int num_rows;
    int num_cols;
    bool is_symmetric;
    double symmetry_error;     // largest |A(i,j) - A(j,i)|
    double max_row_sum;        // largest |sum_j A(i,j)|
    int identity_rows;         // rows equal to a unit row (imposed nodes)
    double trace_value;
};

namespace utils {
    class MatrixHelper {
        public:

            // ============================================================================
            // BASIC CHECKS
            // ============================================================================

            /**
             * @brief Check the properties of a dense system matrix
             * @param matrix The matrix to check
             * @param tolerance The tolerance for the symmetry check
             * @return A MatrixInfo struct containing the properties of the matrix
             */
            static MatrixInfo check_matrix_properties(const Eigen::MatrixXd& matrix, double tolerance = 1e-12);

            /**
             * @brief Check if a matrix is symmetric considering all entries.
             *
             * Use that only for smaller matrices (n < 500).
             *
             * @param matrix The matrix to check
             * @param tolerance The tolerance for the symmetry check
             * @return True if the matrix is symmetric, false otherwise
             */
            static bool check_symmetry_full(const Eigen::MatrixXd& matrix, double tolerance);

            // Row i is zero except for a unit diagonal
            static bool is_identity_row(const Eigen::MatrixXd& matrix, int row);

            // ============================================================================
            // HELPERS
            // ============================================================================

            /**
             * @brief Display matrix in formatted terminal output
             * @param matrix The matrix to display
             * @param name Optional name/label for the matrix
             * @param precision Number of decimal places to show
             * @param max_rows Maximum number of rows to display (0 = all)
             * @param max_cols Maximum number of columns to display (0 = all)
             */
            static void display_matrix(
                const Eigen::MatrixXd& matrix,
                const std::string& name = "",
                int precision = 6,
                int max_rows = 0,
                int max_cols = 0
            );

            // Short summary of an assembled system on stdout; systems with at most
            // kDisplayLimit rows are also printed in full
            static void print_system_summary(const LinearSystem& system, const std::string& name);

            static constexpr int kDisplayLimit = 25;
    };
}

#endif
