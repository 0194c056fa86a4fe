#include "linear_algebra/gauss_elimination.hpp"

namespace LinearAlgebra {
    // ============================================================================
    // CONSTRUCTORS AND INITIALIZATION
    // ============================================================================

    GaussElimination::GaussElimination(size_t n, size_t block_size)
            : matrix_size_(n)
            , block_size_(block_size == 0 ? determine_optimal_block_size() : block_size)
            , pivot_indices_(n) {

            if (n == 0) {
                throw std::invalid_argument("Matrix size must be positive");
            }
        }

    size_t GaussElimination::determine_optimal_block_size() const {
        // heat systems of a few hundred nodes factorize in one unblocked panel
        if (matrix_size_ <= kUnblockedLimit) {
            return matrix_size_;
        }

        // about eight panels, in multiples of 8 columns
        size_t candidate = (matrix_size_ / 8 + 7) / 8 * 8;
        return std::clamp(candidate, size_t(64), size_t(256));
    }

    // ============================================================================
    // MAIN SOLVER INTERFACE
    // ============================================================================

    bool GaussElimination::solve(Eigen::MatrixXd& A, Eigen::VectorXd& x, const Eigen::VectorXd& b) {
        validate_dimensions(A.rows(), A.cols());

        if (static_cast<size_t>(b.size()) != matrix_size_) {
            throw std::invalid_argument("Matrix and vector dimensions must match");
        }

        x.resize(b.size());

        int info = factorize(A.data(), static_cast<size_t>(A.outerStride()));
        if (info != 0) {
            return false; // zero pivot
        }

        return solve_factorized(A.data(), static_cast<size_t>(A.outerStride()), x.data(), b.data(), 1);
    }

    int GaussElimination::factorize(double* A, size_t lda) {
        if (!is_matrix_valid(A, lda)) {
            throw std::invalid_argument("Factorization needs a non-null matrix with lda >= n");
        }

        return blocked_gepp(A, lda);
    }

    bool GaussElimination::solve_factorized(const double* A, size_t lda, double* x,
        const double* b, size_t nrhs) const {

        const size_t n = matrix_size_;

        cblas_dcopy(static_cast<int>(n * nrhs), b, 1, x, 1);

        apply_permutation(x, nrhs);
        triangular_solves(A, lda, x, nrhs);

        for (size_t i = 0; i < n * nrhs; ++i) {
            if (!std::isfinite(x[i])) {
                return false;
            }
        }
        return true;
    }

    // ============================================================================
    // CORE FACTORIZATION ALGORITHM
    // ============================================================================

    int GaussElimination::blocked_gepp(double* A, size_t lda) {
        const size_t n = matrix_size_;

        for (size_t k = 0; k < n; k += block_size_) {
            size_t jb = std::min(block_size_, n - k);

            int panel_info = panel_factorization(A, lda, k, jb);
            if (panel_info != 0) {
                return static_cast<int>(k + panel_info);
            }

            if (k + jb < n) {
                apply_pivots(A, lda, k + jb, n - k - jb, k, jb);
                update_trailing_matrix(A, lda, k, jb);
            }
        }

        return 0;
    }

    int GaussElimination::panel_factorization(double* A, size_t lda, size_t k, size_t jb) {
        const size_t n = matrix_size_;

        for (size_t j = k; j < k + jb; j++) {
            // partial pivoting on column j
            size_t pivot_row = j;
            double max_val = std::abs(A[j * lda + j]);

            for (size_t i = j + 1; i < n; i++) {
                double val = std::abs(A[j * lda + i]);
                if (val > max_val) {
                    max_val = val;
                    pivot_row = i;
                }
            }

            pivot_indices_[j] = static_cast<int>(pivot_row + 1);

            if (max_val == 0.0) {
                return static_cast<int>(j - k + 1);
            }

            // columns 0..k+jb-1 only, apply_pivots handles the trailing block
            if (pivot_row != j) {
                cblas_dswap(static_cast<int>(k + jb), A + j, static_cast<int>(lda),
                           A + pivot_row, static_cast<int>(lda));
            }

            if (j < n - 1) {
                double alpha = 1.0 / A[j * lda + j];
                cblas_dscal(static_cast<int>(n - j - 1), alpha, A + j * lda + j + 1, 1);
            }

            // eliminate below the pivot inside the panel
            if (j < k + jb - 1 && j < n - 1) {
                cblas_dger(CblasColMajor,
                          static_cast<int>(n - j - 1),
                          static_cast<int>(k + jb - j - 1),
                          -1.0,
                          A + j * lda + j + 1, 1,
                          A + (j + 1) * lda + j, static_cast<int>(lda),
                          A + (j + 1) * lda + j + 1, static_cast<int>(lda));
            }
        }

        return 0;
    }

    void GaussElimination::apply_pivots(double* A, size_t lda, size_t col_start, size_t ncols, size_t k, size_t jb) const {
        for (size_t i = k; i < k + jb; i++) {
            int pivot_row = pivot_indices_[i] - 1;
            if (pivot_row != static_cast<int>(i)) {
                cblas_dswap(static_cast<int>(ncols),
                           A + col_start * lda + i, static_cast<int>(lda),
                           A + col_start * lda + pivot_row, static_cast<int>(lda));
            }
        }
    }

    void GaussElimination::update_trailing_matrix(double* A, size_t lda, size_t k, size_t jb) const {
        const size_t n = matrix_size_;
        size_t remaining = n - k - jb;

        cblas_dtrsm(CblasColMajor, CblasLeft, CblasLower, CblasNoTrans, CblasUnit,
                   static_cast<int>(jb), static_cast<int>(remaining), 1.0,
                   A + k * lda + k, static_cast<int>(lda),
                   A + (k + jb) * lda + k, static_cast<int>(lda));

        cblas_dgemm(CblasColMajor, CblasNoTrans, CblasNoTrans,
                   static_cast<int>(remaining), static_cast<int>(remaining),
                   static_cast<int>(jb), -1.0,
                   A + k * lda + k + jb, static_cast<int>(lda),
                   A + (k + jb) * lda + k, static_cast<int>(lda),
                   1.0,
                   A + (k + jb) * lda + k + jb, static_cast<int>(lda));
    }

    void GaussElimination::apply_permutation(double* x, size_t nrhs) const {
        const size_t n = matrix_size_;

        for (size_t k = 0; k < n; k++) {
            int pivot = pivot_indices_[k] - 1;
            if (pivot != static_cast<int>(k)) {
                for (size_t j = 0; j < nrhs; j++) {
                    std::swap(x[j * n + k], x[j * n + pivot]);
                }
            }
        }
    }

    void GaussElimination::triangular_solves(const double* A, size_t lda, double* x, size_t nrhs) const {
        const size_t n = matrix_size_;

        cblas_dtrsm(CblasColMajor, CblasLeft, CblasLower, CblasNoTrans, CblasUnit,
                   static_cast<int>(n), static_cast<int>(nrhs), 1.0,
                   A, static_cast<int>(lda), x, static_cast<int>(n));

        cblas_dtrsm(CblasColMajor, CblasLeft, CblasUpper, CblasNoTrans, CblasNonUnit,
                   static_cast<int>(n), static_cast<int>(nrhs), 1.0,
                   A, static_cast<int>(lda), x, static_cast<int>(n));
    }

    // ============================================================================
    // UTILITY METHODS
    // ============================================================================

    void GaussElimination::validate_dimensions(size_t rows, size_t cols) const {
        if (rows != matrix_size_ || cols != matrix_size_) {
            throw std::invalid_argument("Matrix dimensions must match solver size");
        }
    }

    bool GaussElimination::is_matrix_valid(const double* A, size_t lda) const {
        return A != nullptr && lda >= matrix_size_;
    }
}
