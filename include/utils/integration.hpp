#if __INTELLISENSE__
#undef __ARM_NEON
#undef __ARM_NEON__
#endif

#ifndef HEATFEM_INTEGRATION_HPP
#define HEATFEM_INTEGRATION_HPP

#include <cmath>
#include <vector>

#include <Eigen/Dense>

#include "models/enums.hpp"
#include "models/templates.hpp"

namespace utils {
    class integration{
        public:

        // ============================================================================
        // GAUSS-LEGENDRE RULES
        // ============================================================================

        /**
         * @brief Gauss rule used by the elements of a given order (1D, on [0,1])
         *
         * Linear elements use the 1-point rule (0.5, weight 1), quadratic
         * elements the 3-point rule, exact up to degree 5. 2D integrals use the
         * tensor product of this rule in both natural directions.
         *
         * @param order Element order
         * @return Points and weights on [0,1]; the weights sum to 1
         */
        static GaussRule gauss_rule(ElementOrder order);

        /**
         * @brief Get Gauss-Legendre quadrature points and weights on [-1,1]
         *
         * @param n_points Number of points (1 to 5)
         * @param points Vector of quadrature points
         * @param weights Vector of quadrature weights
         */
        static void get_gauss_quadrature_rule(
            int n_points,
            std::vector<double>& points,
            std::vector<double>& weights
        );

        /**
         * @brief Generate Gauss-Legendre quadrature points and weights on [0,1]
         * This transforms the standard rule from [-1,1] to [0,1]:
         * - Point transformation: t = (ξ + 1)/2
         * - Weight scaling: w → w/2
         *
         * @param n_points Number of points (1 to 5)
         */
        static GaussRule gauss_legendre_01(int n_points);
    };
}

#endif
