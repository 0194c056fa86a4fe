#if __INTELLISENSE__
#undef __ARM_NEON
#undef __ARM_NEON__
#endif

#ifndef HEATFEM_BASIS_HPP
#define HEATFEM_BASIS_HPP

#include <cmath>
#include <iostream>

#include <Eigen/Dense>

#include "models/enums.hpp"
#include "models/templates.hpp"

namespace utils {
    /**
     * @class basis
     * @brief Lagrange shape functions on the reference element [0,1] / [0,1]^2
     *
     * 2D functions are tensor products of the 1D Lagrange polynomials, one
     * per natural coordinate, in the local order of reference_element.hpp.
     */
    class basis {
        public:
            basis(MeshDimension dimension, ElementOrder order)
                : dimension_(dimension), order_(order) {}
            ~basis() = default;

            /**
             * @brief Evaluate the 1D basis functions at ksi
             *
             * Throws ConfigurationError when the basis is two-dimensional,
             * since a 2D evaluation needs both natural coordinates.
             */
            BasisFunctionSet evaluate(double ksi) const;

            /**
             * @brief Evaluate the 2D basis functions at (ksi, eta)
             */
            BasisFunctionSet evaluate(double ksi, double eta) const;

            // number of basis functions (local nodes) of the element
            int size() const;

            MeshDimension dimension() const { return dimension_; }
            ElementOrder order() const { return order_; }

            // ============================================================================
            // 1D LAGRANGE POLYNOMIALS
            // ============================================================================

            /**
             * @brief Values of the univariate Lagrange polynomials at c
             *
             * Linear: {1-c, c}. Quadratic (nodes 0, 0.5, 1):
             * {2c²-3c+1, -4c²+4c, 2c²-c}.
             */
            static Eigen::VectorXd lagrange(ElementOrder order, double c);

            // derivatives of lagrange()
            static Eigen::VectorXd lagrange_derivative(ElementOrder order, double c);

        private:
            MeshDimension dimension_;
            ElementOrder order_;
    };
}

#endif
