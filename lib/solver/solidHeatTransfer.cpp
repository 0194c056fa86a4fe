#include "solver/solidHeatTransfer.hpp"
#include "models/exceptions.hpp"

namespace solver {

    solidHeatTransfer::solidHeatTransfer(const MeshData& mesh, ElementOrder order, bool debug)
        : mesh_(mesh),
          basis_(MeshDimension::TwoD, order),
          gauss_(utils::integration::gauss_rule(order)),
          debug_(debug) {

        if (mesh_.total_elements() == 0) {
            throw UnsupportedConfigurationError("Assembly needs a mesh with a nodal numbering");
        }
        if (mesh_.nodes_per_element() != basis_.size()) {
            throw UnsupportedConfigurationError(
                "Elements with " + std::to_string(mesh_.nodes_per_element()) +
                " nodes do not match the " + to_string(order) + " 2D basis");
        }
    }

    LinearSystem solidHeatTransfer::create_system() const {
        const int n = mesh_.total_nodes();
        LinearSystem system;
        system.jacobian = Eigen::MatrixXd::Zero(n, n);
        system.residual = Eigen::VectorXd::Zero(n);
        return system;
    }

    LinearSystem solidHeatTransfer::assemble() const {
        LinearSystem system = create_system();
        assemble_system(system);
        return system;
    }

    void solidHeatTransfer::assemble_system(LinearSystem& system) const {
        const int n = mesh_.total_nodes();
        if (system.jacobian.rows() != n || system.jacobian.cols() != n || system.residual.size() != n) {
            throw std::invalid_argument("System size does not match the number of mesh nodes");
        }

        for (int element = 0; element < mesh_.total_elements(); ++element) {
            assemble_element(element, system);
        }

        if (debug_) {
            std::cout << "Assembly completed:" << std::endl;
            std::cout << "  Elements: " << mesh_.total_elements() << std::endl;
            std::cout << "  Nodes: " << n << std::endl;
            std::cout << "  Gauss points per element: " << gauss_.size() * gauss_.size() << std::endl;
            std::cout << "  Residual sum: " << system.residual.sum() << std::endl;
        }
    }

    IsoparametricMap solidHeatTransfer::map_point(int element, const BasisFunctionSet& phi) const {
        IsoparametricMap map;

        for (int k = 0; k < mesh_.nodes_per_element(); ++k) {
            const int node = mesh_.global_node(element, k);
            const double xn = mesh_.nodes_x(node);
            const double yn = mesh_.nodes_y(node);

            map.x += xn * phi.values(k);
            map.y += yn * phi.values(k);
            map.x_ksi += xn * phi.deriv_ksi(k);
            map.x_eta += xn * phi.deriv_eta(k);
            map.y_ksi += yn * phi.deriv_ksi(k);
            map.y_eta += yn * phi.deriv_eta(k);
        }

        map.det_jacobian = map.x_ksi * map.y_eta - map.x_eta * map.y_ksi;
        return map;
    }

    void solidHeatTransfer::physical_derivatives(
        const IsoparametricMap& map,
        const BasisFunctionSet& phi,
        Eigen::VectorXd& dN_dx,
        Eigen::VectorXd& dN_dy
    ){
        dN_dx = (map.y_eta * phi.deriv_ksi - map.y_ksi * phi.deriv_eta) / map.det_jacobian;
        dN_dy = (map.x_ksi * phi.deriv_eta - map.x_eta * phi.deriv_ksi) / map.det_jacobian;
    }

    void solidHeatTransfer::assemble_element(int element, LinearSystem& system) const {
        if (element < 0 || element >= mesh_.total_elements()) {
            throw std::out_of_range("Element index out of range for assembly");
        }

        const int n_local = mesh_.nodes_per_element();

        // local-to-global map, 0-based
        Eigen::VectorXi global(n_local);
        for (int k = 0; k < n_local; ++k) {
            global(k) = mesh_.global_node(element, k);
        }

        Eigen::VectorXd dN_dx, dN_dy;

        for (int a = 0; a < gauss_.size(); ++a) {
            for (int b = 0; b < gauss_.size(); ++b) {
                BasisFunctionSet phi = basis_.evaluate(gauss_.points(a), gauss_.points(b));
                IsoparametricMap map = map_point(element, phi);

                if (!(map.det_jacobian > 0.0)) {
                    throw DegenerateElementError(element, map.det_jacobian);
                }

                physical_derivatives(map, phi, dN_dx, dN_dy);

                const double w = gauss_.weights(a) * gauss_.weights(b) * map.det_jacobian;

                for (int m = 0; m < n_local; ++m) {
                    const int gm = global(m);
                    system.residual(gm) += w * phi.values(m);

                    for (int n = 0; n < n_local; ++n) {
                        const int gn = global(n);
                        system.jacobian(gm, gn) += -w * (dN_dx(m) * dN_dx(n) + dN_dy(m) * dN_dy(n));
                    }
                }
            }
        }
    }
}
