#ifndef HEATFEM_GAUSS_ELIMINATION_HPP
#define HEATFEM_GAUSS_ELIMINATION_HPP

#include <vector>
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <iostream>

#include <cblas.h>

namespace LinearAlgebra {
    /**
     * @class GaussElimination
     * @brief Dense direct solver: blocked LU factorization with partial
     * pivoting (GEPP) on top of CBLAS kernels
     *
     * Matrices are column-major (Eigen's default storage). The factors
     * overwrite the input matrix: U on and above the diagonal, L (unit
     * diagonal implied) below it.
     */
    class GaussElimination {
        public:
            // ============================================================================
            // CONSTRUCTORS AND DESTRUCTOR
            // ============================================================================

            /**
             * @brief Construct GEPP solver for given matrix size
             * @param n Matrix dimension
             * @param block_size Panel width (0 = derived from the matrix size)
             */
            explicit GaussElimination(size_t n, size_t block_size = 0);

            ~GaussElimination() = default;

            GaussElimination(const GaussElimination&) = delete;
            GaussElimination& operator=(const GaussElimination&) = delete;

            GaussElimination(GaussElimination&&) = default;
            GaussElimination& operator=(GaussElimination&&) = default;

            // ============================================================================
            // MAIN SOLVER INTERFACE
            // ============================================================================

            /**
             * @brief Solve system Ax = b using GEPP (combined factorization + solve)
             * @param A Coefficient matrix (overwritten by its LU factors)
             * @param x Solution vector (resized to n)
             * @param b Right-hand side vector
             * @return true if successful, false if singular matrix
             */
            bool solve(Eigen::MatrixXd& A, Eigen::VectorXd& x, const Eigen::VectorXd& b);

            /**
             * @brief In-place factorization
             * @param A Matrix to factorize (n x n, column-major)
             * @param lda Leading dimension of A
             * @return 0 if successful, k>0 if singular at position k
             *
             * Throws std::invalid_argument for a null matrix or lda < n.
             */
            int factorize(double* A, size_t lda);

            /**
             * @brief Solve using pre-computed factorization
             * @param A Factorized matrix from factorize()
             * @param lda Leading dimension of A
             * @param x Solution vector(s)
             * @param b Right-hand side vector(s)
             * @param nrhs Number of right-hand sides
             * @return false if the solution has non-finite entries
             */
            bool solve_factorized(const double* A, size_t lda, double* x, const double* b, size_t nrhs = 1) const;

            size_t size() const { return matrix_size_; }
            size_t getBlockSize() const { return block_size_; }

            /**
             * @brief Get pivot indices from last factorization (1-based)
             */
            const std::vector<int>& getPivots() const { return pivot_indices_; }

        private:
            // matrices up to this size are factorized as a single panel
            static constexpr size_t kUnblockedLimit = 256;

            size_t matrix_size_;           ///< Matrix dimension
            size_t block_size_;            ///< Panel width
            std::vector<int> pivot_indices_;    ///< Pivot permutation (1-based)

            /**
             * @brief Whole matrix up to kUnblockedLimit, otherwise about n/8
             * rounded to a multiple of 8 and clamped to [64, 256]
             */
            size_t determine_optimal_block_size() const;

            /**
             * @brief Blocked GEPP: panel factorization, pivot propagation to the
             * right blocks, trailing update (TRSM + GEMM)
             * @return 0 if successful, k>0 if singular at position k
             */
            int blocked_gepp(double* A, size_t lda);

            /**
             * @brief Unblocked factorization of columns k:k+jb-1 with partial pivoting
             * @return 0 if successful, j>0 if singular at relative position j
             */
            int panel_factorization(double* A, size_t lda, size_t k, size_t jb);

            /**
             * @brief Apply the row interchanges of panel k:k+jb-1 to the columns
             * col_start:col_start+ncols-1
             */
            void apply_pivots(double* A, size_t lda, size_t col_start, size_t ncols, size_t k, size_t jb) const;

            /**
             * @brief Update trailing matrix A₂₂ after panel factorization.
             * 1. L₁₁ U₁₂ = A₁₂ (TRSM)
             * 2. A₂₂ ← A₂₂ - L₂₁ U₁₂ (GEMM)
             */
            void update_trailing_matrix(double* A, size_t lda, size_t k, size_t jb) const;

            void apply_permutation(double* x, size_t nrhs) const;

            /**
             * @brief Forward substitution L y = P b, then backward substitution U x = y
             */
            void triangular_solves(const double* A, size_t lda, double* x, size_t nrhs) const;

            void validate_dimensions(size_t rows, size_t cols) const;
            bool is_matrix_valid(const double* A, size_t lda) const;
    };
}

#endif
