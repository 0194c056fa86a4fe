/**
 * @file solidHeatTransfer.hpp
 * @brief Defines the Galerkin assembler for steady heat conduction
 * @author Paulo Akira
 * @date YYYY-MM-DD
 */

#if __INTELLISENSE__
#undef __ARM_NEON
#undef __ARM_NEON__
#endif

#ifndef HEATFEM_SOLIDHEATTRANSFER_HPP
#define HEATFEM_SOLIDHEATTRANSFER_HPP

#include <iostream>
#include <cmath>

#include <Eigen/Dense>

#include "models/templates.hpp"
#include "utils/basis.hpp"
#include "utils/integration.hpp"

namespace solver {
    /**
     * @class solidHeatTransfer
     * @brief Assembles the dense Jacobian matrix and residual vector of steady
     * heat conduction with a unit source on isoparametric quadrilaterals
     *
     * For every element and every pair of Gauss points:
     *   residual[m]    += w_a w_b detJ N_m
     *   jacobian[m][n] += -w_a w_b detJ (dN_m/dx dN_n/dx + dN_m/dy dN_n/dy)
     * Boundary conditions are not part of this stage (see utils::boundary).
     */
    class solidHeatTransfer{
        public:
            /**
             * @brief Constructor
             *
             * @param mesh Mesh (coordinates and nodal numbering)
             * @param order Element order; must match the number of nodes per element
             * @param debug Print assembly diagnostics
             */
            solidHeatTransfer(const MeshData& mesh, ElementOrder order, bool debug = false);

            // zero-initialized system sized to the mesh
            LinearSystem create_system() const;

            /**
             * @brief Assemble every element into a fresh system
             * @return Jacobian matrix and residual vector before boundary conditions
             */
            LinearSystem assemble() const;

            /**
             * @brief Accumulate every element into an existing system
             */
            void assemble_system(LinearSystem& system) const;

            /**
             * @brief Accumulate the contribution of one element
             *
             * Throws DegenerateElementError when the mapping determinant is not
             * strictly positive at a Gauss point.
             */
            void assemble_element(int element, LinearSystem& system) const;

            /**
             * @brief Isoparametric mapping of an element at one point
             *
             * @param element Element index
             * @param phi Basis functions evaluated at the point
             * @return Physical coordinates, their natural derivatives and detJ
             */
            IsoparametricMap map_point(int element, const BasisFunctionSet& phi) const;

            /**
             * @brief Physical gradients of the basis functions through the inverse Jacobian
             *
             * @param map Mapping at the point (detJ must be non-zero)
             * @param phi Basis functions evaluated at the point
             * @param dN_dx Output x-derivatives
             * @param dN_dy Output y-derivatives
             */
            static void physical_derivatives(
                const IsoparametricMap& map,
                const BasisFunctionSet& phi,
                Eigen::VectorXd& dN_dx,
                Eigen::VectorXd& dN_dy
            );

            const MeshData& get_mesh() const { return mesh_; }
            const GaussRule& get_gauss_rule() const { return gauss_; }
            const utils::basis& get_basis() const { return basis_; }

        private:
            MeshData mesh_;
            utils::basis basis_;
            GaussRule gauss_;
            bool debug_ = false;
    };
}

#endif
