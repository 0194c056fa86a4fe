#if __INTELLISENSE__
#undef __ARM_NEON
#undef __ARM_NEON__
#endif

#ifndef HEATFEM_UNIFORM_HPP
#define HEATFEM_UNIFORM_HPP

#include <cmath>
#include <iomanip>
#include <iostream>

#include <Eigen/Dense>

#include "models/config.hpp"
#include "models/templates.hpp"

namespace mesh {

/**
 * @class uniform
 * @brief Structured mesh generator for the segment [0,maxX] and the
 * rectangle [0,maxX] x [0,maxY]
 *
 * Nodes are numbered column-major: all nodes of an x-column are contiguous.
 * Quadratic elements place nodes at element corners, edge midpoints and
 * centers, so every axis carries 2*numElements + 1 nodes.
 */
class uniform{
    public:

        uniform(const MeshConfig& config, bool debug = false);
        ~uniform() = default;

        /**
         * @brief Build coordinates, nodal numbering and boundary elements
         * @return Complete mesh
        */
        MeshData generate() const;

        /**
         * @brief Fill nodes_x, nodes_y, total_nodes_x and total_nodes_y
         * @param mesh Output mesh
        */
        void compute_node_coordinates(MeshData& mesh) const;

        /**
         * @brief Build the nodal numbering (NOP) array, 1-based node ids
         *
         * Only 2D quadratic elements are supported; any other combination
         * throws UnsupportedConfigurationError.
         *
         * @param total_nodes_y Number of nodes along the y axis
         * @return One row of 9 global ids per element
        */
        Eigen::MatrixXi generate_nodal_numbering(int total_nodes_y) const;

        /**
         * @brief Classify the elements touching each side of the rectangle
         *
         * Corner elements appear in two lists. Only 2D quadratic elements are
         * supported.
         */
        std::array<std::vector<BoundaryElement>, 4> find_boundary_elements() const;

        double get_element_width() const { return delta_x_; }
        double get_element_height() const { return delta_y_; }

    private:
        MeshConfig config_;
        bool debug_ = false;
        double delta_x_ = 0.0;
        double delta_y_ = 0.0;

        void require_quadratic_2d(const std::string& what) const;
};

}

#endif
