/**
 * @file model.hpp
 * @brief Solve-call boundary of the heat transfer pipeline
 * @author Paulo Akira
 * @date YYYY-MM-DD
 */

#if __INTELLISENSE__
#undef __ARM_NEON
#undef __ARM_NEON__
#endif

#ifndef HEATFEM_MODEL_HPP
#define HEATFEM_MODEL_HPP

#include <cstddef>
#include <iostream>
#include <string>

#include <Eigen/Dense>

#include "models/config.hpp"
#include "models/templates.hpp"

namespace solver {
    /**
     * @class model
     * @brief Runs mesh generation, assembly, boundary imposition and the dense
     * solve, in this order, for one immutable problem configuration
     *
     * The configuration is validated on construction so that missing or
     * inconsistent settings fail before any assembly work starts.
     */
    class model {
        public:
            explicit model(const ProblemConfig& config, bool debug = false);

            /**
             * @brief Check a configuration without building a model
             *
             * Throws ConfigurationError for missing mesh settings or boundary
             * conditions and UnsupportedConfigurationError for solvers or
             * element types without an implementation, or for structured
             * meshes too large for the dense solver.
             */
            static void validate(const ProblemConfig& config);

            /**
             * @brief Refuse meshes whose dense system exceeds kMaxDenseSystemBytes
             *
             * Throws UnsupportedConfigurationError before anything is allocated.
             */
            static void check_dense_size(long long total_nodes);

            static constexpr size_t kMaxDenseSystemBytes = size_t(200) * 1024 * 1024;

            /**
             * @brief Structured mesh, or the mesh read from meshConfig.meshFile
             */
            MeshData build_mesh() const;

            /**
             * @brief Assembled system with every boundary condition imposed
             */
            AssemblyResult assemble() const;

            /**
             * @brief Assemble and solve the system with the dense LU solver
             *
             * Throws SingularSystemError when the factorization meets a zero pivot.
             */
            SolveResult solve() const;

            const ProblemConfig& get_config() const { return config_; }

        private:
            const ProblemConfig config_;
            bool debug_ = false;
    };
}

#endif
