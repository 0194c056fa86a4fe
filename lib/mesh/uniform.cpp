#include "mesh/uniform.hpp"
#include "models/exceptions.hpp"
#include "models/reference_element.hpp"

namespace mesh {
    uniform::uniform(const MeshConfig& config, bool debug)
        : config_(config), debug_(debug) {

        if (config_.num_elements_x <= 0) {
            throw ConfigurationError("numElementsX must be positive");
        }
        if (config_.max_x <= 0.0) {
            throw ConfigurationError("maxX must be positive");
        }
        if (config_.dimension == MeshDimension::TwoD) {
            if (config_.num_elements_y <= 0) {
                throw ConfigurationError("numElementsY must be positive");
            }
            if (config_.max_y <= 0.0) {
                throw ConfigurationError("maxY must be positive");
            }
        }

        delta_x_ = config_.max_x / static_cast<double>(config_.num_elements_x);
        if (config_.dimension == MeshDimension::TwoD) {
            delta_y_ = config_.max_y / static_cast<double>(config_.num_elements_y);
        }
    }

    void uniform::require_quadratic_2d(const std::string& what) const {
        if (config_.dimension != MeshDimension::TwoD || config_.order != ElementOrder::Quadratic) {
            throw UnsupportedConfigurationError(
                what + " is not available for " + to_string(config_.dimension) +
                " " + to_string(config_.order) + " elements");
        }
    }

    void uniform::compute_node_coordinates(MeshData& mesh) const {
        if (config_.dimension == MeshDimension::OneD) {
            int total_nodes_x = 2 * config_.num_elements_x + 1;

            mesh.total_nodes_x = total_nodes_x;
            mesh.total_nodes_y = 1;
            mesh.nodes_x.resize(total_nodes_x);
            mesh.nodes_y = Eigen::VectorXd::Zero(total_nodes_x);

            // nodes are evenly spaced by the element length
            for (int i = 0; i < total_nodes_x; ++i) {
                mesh.nodes_x(i) = i * delta_x_;
            }
            return;
        }

        int total_nodes_x = 2 * config_.num_elements_x + 1;
        int total_nodes_y = 2 * config_.num_elements_y + 1;

        mesh.total_nodes_x = total_nodes_x;
        mesh.total_nodes_y = total_nodes_y;
        mesh.nodes_x.resize(total_nodes_x * total_nodes_y);
        mesh.nodes_y.resize(total_nodes_x * total_nodes_y);

        // column-major: node i*total_nodes_y + j sits at (i*dx/2, j*dy/2)
        for (int i = 0; i < total_nodes_x; ++i) {
            for (int j = 0; j < total_nodes_y; ++j) {
                int node = i * total_nodes_y + j;
                mesh.nodes_x(node) = i * delta_x_ / 2.0;
                mesh.nodes_y(node) = j * delta_y_ / 2.0;
            }
        }
    }

    Eigen::MatrixXi uniform::generate_nodal_numbering(int total_nodes_y) const {
        require_quadratic_2d("Nodal numbering");

        const int nex = config_.num_elements_x;
        const int ney = config_.num_elements_y;

        Eigen::MatrixXi nop = Eigen::MatrixXi::Zero(nex * ney, reference::kQuadraticNodes);

        int element = 0;
        for (int i = 1; i <= nex; ++i) {          // element columns (x)
            for (int j = 1; j <= ney; ++j) {      // element rows (y)
                // column k of the 3x3 lattice starts at local node 3*(k-1)
                for (int k = 1; k <= 3; ++k) {
                    int first = 3 * (k - 1);
                    int base = total_nodes_y * (2 * i + k - 3) + 2 * j - 1;
                    nop(element, first) = base;
                    nop(element, first + 1) = base + 1;
                    nop(element, first + 2) = base + 2;
                }
                element++;
            }
        }

        return nop;
    }

    std::array<std::vector<BoundaryElement>, 4> uniform::find_boundary_elements() const {
        require_quadratic_2d("Boundary element search");

        std::array<std::vector<BoundaryElement>, 4> boundary_elements;

        for (int ex = 0; ex < config_.num_elements_x; ++ex) {
            for (int ey = 0; ey < config_.num_elements_y; ++ey) {
                int element = ex * config_.num_elements_y + ey;

                if (ey == 0) {
                    boundary_elements[0].push_back({element, BoundarySide::Bottom});
                }
                if (ey == config_.num_elements_y - 1) {
                    boundary_elements[2].push_back({element, BoundarySide::Top});
                }
                if (ex == 0) {
                    boundary_elements[1].push_back({element, BoundarySide::Left});
                }
                if (ex == config_.num_elements_x - 1) {
                    boundary_elements[3].push_back({element, BoundarySide::Right});
                }
            }
        }

        return boundary_elements;
    }

    MeshData uniform::generate() const {
        MeshData mesh;
        compute_node_coordinates(mesh);
        mesh.nop = generate_nodal_numbering(mesh.total_nodes_y);
        mesh.boundary_elements = find_boundary_elements();

        if (debug_) {
            std::cout << config_.num_elements_x << "x" << config_.num_elements_y
                      << " structured mesh created:" << std::endl;
            std::cout << "  Nodes: " << mesh.total_nodes() << " (" << mesh.total_nodes_x
                      << "x" << mesh.total_nodes_y << " grid)" << std::endl;
            std::cout << "  Elements: " << mesh.total_elements() << std::endl;
            std::cout << "  Element size = " << std::fixed << std::setprecision(6)
                      << delta_x_ << " x " << delta_y_ << std::endl;
            std::cout << std::defaultfloat;
        }

        return mesh;
    }
}
