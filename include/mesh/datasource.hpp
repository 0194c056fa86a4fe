/**
 * @file datasource.hpp
 * @brief Defines the datasource class for problem/mesh file I/O operations
 * @author Paulo Akira
 * @date YYYY-MM-DD
 */

#if __INTELLISENSE__
#undef __ARM_NEON
#undef __ARM_NEON__
#endif

#ifndef HEATFEM_DATASOURCE_HPP
#define HEATFEM_DATASOURCE_HPP

#include <iostream>
#include <fstream>
#include <iomanip>
#include <string>

#include <Eigen/Core>
#include <Eigen/Dense>
#include <nlohmann/json.hpp>

#include "models/config.hpp"
#include "models/templates.hpp"

namespace mesh {
    /**
     * @class datasource
     * @brief Class for reading problem and mesh files and writing results
     *
     * Every file is JSON. Problem files hold the solver name, the mesh
     * configuration and the boundary conditions; mesh files hold node
     * coordinates and element connectivity; result files hold the solution
     * together with the node coordinates.
     */
    class datasource{
        public:
            datasource(bool debug = false) : debug_(debug) {}

            /**
             * @brief Read a problem description from a JSON file
             *
             * @param filepath Path to the JSON file
             * @return Validated problem configuration
             */
            ProblemConfig readProblemJson(const std::string& filepath) const;

            /**
             * @brief Build a problem description from a parsed JSON document
             *
             * Missing "meshConfig" or "boundaryConditions" sections, and missing
             * fields inside them, throw ConfigurationError.
             */
            static ProblemConfig parseProblem(const nlohmann::json& j);

            /**
             * @brief Parse the "meshConfig" section
             */
            static MeshConfig parseMeshConfig(const nlohmann::json& j);

            /**
             * @brief Parse the "boundaryConditions" section
             *
             * Every entry maps a boundary key to ["convection", h, T_ext] or
             * ["constantTemp", T].
             */
            static BoundaryConditionMap parseBoundaryConditions(const nlohmann::json& j);

            /**
             * @brief Read a custom quadratic mesh from a JSON file
             *
             * The document holds "nodes": [{"x":..,"y":..}, ...] and
             * "elements": [[9 1-based node ids], ...].
             *
             * @param filepath Path to the JSON file
             * @return Mesh with coordinates, NOP and boundary elements
             */
            MeshData readJson(const std::string& filepath) const;

            /**
             * @brief Build a mesh from a parsed mesh document
             */
            static MeshData parseMesh(const nlohmann::json& j);

            /**
             * @brief Classify element sides lying on the bounding box of the nodes
             *
             * A side belongs to the boundary when its three edge nodes share the
             * minimum/maximum x (left/right) or y (bottom/top) coordinate.
             *
             * @param mesh Mesh with coordinates and NOP; boundary_elements is overwritten
             */
            static void classifyBoundaryElements(MeshData& mesh);

            /**
             * @brief Write the solution vector and the node coordinates to a JSON file
             *
             * @param result Solve result
             * @param filename Output filename
             */
            void writeOutput(const SolveResult& result, const std::string& filename) const;

            /**
             * @brief JSON representation of a solve result
             */
            static nlohmann::json toJson(const SolveResult& result);

            // assembled system before the solve: jacobianMatrix (row by row), residualVector, nodesCoordinates
            static nlohmann::json toJson(const AssemblyResult& assembled);

        private:
            bool debug_ = false;
    };
}

#endif
