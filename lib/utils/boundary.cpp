#include "utils/boundary.hpp"
#include "models/exceptions.hpp"
#include "models/reference_element.hpp"

namespace utils {

    // ============================================================================
    // CONSTRUCTORS AND DESTRUCTOR
    // ============================================================================
    boundary::boundary(
        const BoundaryConditionMap& conditions,
        const MeshData& mesh,
        ElementOrder order,
        bool debug)
        : conditions_(conditions),
          mesh_(mesh),
          basis_(MeshDimension::TwoD, order),
          order_(order),
          debug_(debug) {}

    void boundary::require_quadratic(const std::string& what) const {
        if (order_ != ElementOrder::Quadratic) {
            throw UnsupportedConfigurationError(
                what + " is not available for " + to_string(order_) + " elements");
        }
    }

    // ============================================================================
    // BOUNDARY CONDITION IMPOSITION
    // ============================================================================

    void boundary::apply(LinearSystem& system, const GaussRule& gauss) const {
        impose_convection(system, gauss);
        impose_constant_temp(system);
    }

    void boundary::impose_convection(LinearSystem& system, const GaussRule& gauss) const {
        int touched_elements = 0;

        for (const auto& [side_key, bc] : conditions_) {
            if (bc.type != BoundaryConditionType::Convection) {
                continue;
            }
            require_quadratic("Convection boundary condition");

            for (const BoundaryElement& be : mesh_.boundary(side_key)) {
                const auto& edge_nodes = reference::side_nodes(be.side);
                const bool horizontal = reference::is_horizontal(be.side);

                for (int l = 0; l < gauss.size(); ++l) {
                    const auto natural = reference::side_point(be.side, gauss.points(l));
                    BasisFunctionSet phi = basis_.evaluate(natural[0], natural[1]);

                    // tangential derivative of the mapping along the edge
                    double x_ksi = 0.0;
                    double y_eta = 0.0;
                    for (int k = 0; k < mesh_.nodes_per_element(); ++k) {
                        const int node = mesh_.global_node(be.element, k);
                        x_ksi += mesh_.nodes_x(node) * phi.deriv_ksi(k);
                        y_eta += mesh_.nodes_y(node) * phi.deriv_eta(k);
                    }
                    const double edge_jacobian = horizontal ? x_ksi : y_eta;
                    const double w = gauss.weights(l) * edge_jacobian;

                    for (int m : edge_nodes) {
                        const int gm = mesh_.global_node(be.element, m);
                        system.residual(gm) += -w * phi.values(m) * bc.coeff * bc.external_temp;

                        for (int n : edge_nodes) {
                            const int gn = mesh_.global_node(be.element, n);
                            system.jacobian(gm, gn) += -w * phi.values(m) * phi.values(n) * bc.coeff;
                        }
                    }
                }
                touched_elements++;
            }
        }

        if (debug_) {
            std::cout << "Convection boundary conditions imposed on "
                      << touched_elements << " element sides" << std::endl;
        }
    }

    std::map<int, double> boundary::constant_temp_nodes() const {
        std::map<int, double> fixed;

        for (const auto& [side_key, bc] : conditions_) {
            if (bc.type != BoundaryConditionType::ConstantTemp) {
                continue;
            }
            require_quadratic("Constant temperature boundary condition");

            for (const BoundaryElement& be : mesh_.boundary(side_key)) {
                for (int local : reference::side_nodes(be.side)) {
                    fixed[mesh_.global_node(be.element, local)] = bc.value;
                }
            }
        }

        return fixed;
    }

    void boundary::impose_constant_temp(LinearSystem& system) const {
        const std::map<int, double> fixed = constant_temp_nodes();

        for (const auto& [node, value] : fixed) {
            system.residual(node) = value;
            system.jacobian.row(node).setZero();
            system.jacobian(node, node) = 1.0;
        }

        if (debug_) {
            std::cout << "Constant temperature imposed on " << fixed.size() << " nodes" << std::endl;
        }
    }
}
