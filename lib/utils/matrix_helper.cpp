#include "utils/matrix_helper.hpp"

namespace utils {

    MatrixInfo MatrixHelper::check_matrix_properties(const Eigen::MatrixXd& matrix, double tolerance) {
        MatrixInfo info;

        info.num_rows = static_cast<int>(matrix.rows());
        info.num_cols = static_cast<int>(matrix.cols());

        // Check symmetry
        if (info.num_rows == info.num_cols) {
            info.symmetry_error = (matrix - matrix.transpose()).cwiseAbs().maxCoeff();
            info.is_symmetric = check_symmetry_full(matrix, tolerance);
        } else {
            info.symmetry_error = INFINITY;
            info.is_symmetric = false;
        }

        info.max_row_sum = matrix.rowwise().sum().cwiseAbs().maxCoeff();

        info.identity_rows = 0;
        for (int i = 0; i < info.num_rows; ++i) {
            if (is_identity_row(matrix, i)) {
                info.identity_rows++;
            }
        }

        info.trace_value = matrix.trace();
        return info;
    }

    bool MatrixHelper::check_symmetry_full(const Eigen::MatrixXd& matrix, double tolerance) {
        int n = static_cast<int>(matrix.rows());
        if (matrix.cols() != n) {
            return false;
        }

        for (int i = 0; i < n; ++i) {
            for (int j = i + 1; j < n; ++j) {  // Only check upper triangle
                double error = std::abs(matrix(i, j) - matrix(j, i));
                if (error > tolerance) {
                    return false;
                }
            }
        }

        return true;
    }

    bool MatrixHelper::is_identity_row(const Eigen::MatrixXd& matrix, int row) {
        if (row < 0 || row >= matrix.rows() || row >= matrix.cols()) {
            return false;
        }
        for (int j = 0; j < matrix.cols(); ++j) {
            double expected = (j == row) ? 1.0 : 0.0;
            if (matrix(row, j) != expected) {
                return false;
            }
        }
        return true;
    }

    // ============================================================================
    // HELPERS
    // ============================================================================
    void MatrixHelper::display_matrix(
        const Eigen::MatrixXd& matrix,
        const std::string& name,
        int precision,
        int max_rows,
        int max_cols
    ) {
        if (!name.empty()) {
            std::cout << "\n=== " << name << " ===" << std::endl;
        }

        int rows = static_cast<int>(matrix.rows());
        int cols = static_cast<int>(matrix.cols());

        // Set display limits
        int display_rows = (max_rows > 0) ? std::min(max_rows, rows) : rows;
        int display_cols = (max_cols > 0) ? std::min(max_cols, cols) : cols;

        std::cout << std::fixed << std::setprecision(precision);

        std::cout << "Dimensions: " << rows << " x " << cols;
        if (max_rows > 0 && rows > max_rows) std::cout << " (showing " << max_rows << " rows)";
        if (max_cols > 0 && cols > max_cols) std::cout << " (showing " << max_cols << " cols)";
        std::cout << std::endl;

        for (int i = 0; i < display_rows; ++i) {
            for (int j = 0; j < display_cols; ++j) {
                std::cout << std::setw(precision + 8) << matrix(i, j);
            }
            if (cols > display_cols) std::cout << " ...";
            std::cout << std::endl;
        }
        if (rows > display_rows) {
            std::cout << "..." << std::endl;
        }

        std::cout << std::defaultfloat << std::endl;
    }

    void MatrixHelper::print_system_summary(const LinearSystem& system, const std::string& name) {
        MatrixInfo info = check_matrix_properties(system.jacobian);

        std::cout << name << ": " << info.num_rows << " x " << info.num_cols << std::endl;
        std::cout << "  Symmetric: " << (info.is_symmetric ? "yes" : "no")
                  << " (max error " << info.symmetry_error << ")" << std::endl;
        std::cout << "  Imposed rows: " << info.identity_rows << std::endl;
        std::cout << "  Trace: " << info.trace_value << std::endl;
        std::cout << "  Residual norm: " << system.residual.norm() << std::endl;

        // a single element or a strip is small enough to print in full
        if (info.num_rows <= kDisplayLimit) {
            display_matrix(system.jacobian, name + " jacobian", 4);
        }
    }
}
