#if __INTELLISENSE__
#undef __ARM_NEON
#undef __ARM_NEON__
#endif

#ifndef HEATFEM_BOUNDARY_HPP
#define HEATFEM_BOUNDARY_HPP

#include <map>
#include <string>
#include <iostream>
#include <Eigen/Dense>

#include "models/config.hpp"
#include "models/templates.hpp"
#include "utils/basis.hpp"

namespace utils {
    /**
     * @class boundary
     * @brief Thermal boundary conditions on the sides of a rectangular mesh
     *
     * Convection (Robin) terms are edge integrals accumulated into the
     * system; constant temperature (Dirichlet) conditions overwrite whole
     * rows. apply() runs the convection pass first so that the Dirichlet rows
     * are final.
     */
    class boundary {
    public:
        // ============================================================================
        // CONSTRUCTORS AND DESTRUCTOR
        // ============================================================================

        /**
         * @param conditions Boundary conditions keyed by side
         * @param mesh Mesh providing the NOP, coordinates and boundary elements
         * @param order Element order of the mesh
         * @param debug Print the number of touched elements and nodes
         */
        boundary(
            const BoundaryConditionMap& conditions,
            const MeshData& mesh,
            ElementOrder order,
            bool debug = false
        );

        ~boundary() = default;

        // ============================================================================
        // BOUNDARY CONDITION IMPOSITION
        // ============================================================================

        /**
         * @brief Impose convection then constant temperature conditions
         *
         * @param system Assembled system, modified in place
         * @param gauss 1D Gauss rule swept along the element edges
         */
        void apply(LinearSystem& system, const GaussRule& gauss) const;

        /**
         * @brief Add the convection (Robin) edge integrals
         *
         * For every boundary element side tagged "convection", with the edge
         * Jacobian J_e = dx/dksi on bottom/top and dy/deta on left/right:
         *   residual[m]    += -w J_e N_m h T_ext
         *   jacobian[m][n] += -w J_e N_m N_n h
         * for the three edge nodes m, n of that side only.
         */
        void impose_convection(LinearSystem& system, const GaussRule& gauss) const;

        /**
         * @brief Overwrite the rows of constant temperature nodes
         *
         * residual[i] = T, row i of the Jacobian is zeroed and its diagonal
         * set to one. Must run after every accumulation into the system.
         */
        void impose_constant_temp(LinearSystem& system) const;

        /**
         * @brief Global nodes (0-based) fixed by constant temperature conditions
         *
         * @return node -> prescribed temperature; a node on two constantTemp
         * sides keeps the value of the side processed last
         * (bottom, left, top, right)
         */
        std::map<int, double> constant_temp_nodes() const;

        void set_debug_mode(bool debug) { debug_ = debug; }

    private:
        BoundaryConditionMap conditions_;
        MeshData mesh_;
        basis basis_;
        ElementOrder order_;
        bool debug_ = false;

        void require_quadratic(const std::string& what) const;
    };
}

#endif
