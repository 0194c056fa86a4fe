#include "mesh/datasource.hpp"
#include "models/exceptions.hpp"
#include "models/reference_element.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace {
    using json = nlohmann::json;

    double require_number(const json& j, const std::string& key, const std::string& section){
        if (!j.contains(key)) {
            throw ConfigurationError("Missing '" + key + "' in " + section);
        }
        if (!j[key].is_number()) {
            throw ConfigurationError("'" + key + "' in " + section + " must be a number");
        }
        return j[key].get<double>();
    }

    int require_integer(const json& j, const std::string& key, const std::string& section){
        if (!j.contains(key)) {
            throw ConfigurationError("Missing '" + key + "' in " + section);
        }
        if (!j[key].is_number_integer()) {
            throw ConfigurationError("'" + key + "' in " + section + " must be an integer");
        }
        return j[key].get<int>();
    }

    std::string optional_string(const json& j, const std::string& key, const std::string& fallback){
        if (!j.contains(key)) {
            return fallback;
        }
        if (!j[key].is_string()) {
            throw ConfigurationError("'" + key + "' must be a string");
        }
        return j[key].get<std::string>();
    }

    std::vector<double> to_std_vector(const Eigen::VectorXd& v){
        return std::vector<double>(v.data(), v.data() + v.size());
    }
}

namespace mesh {

    // ============================================================================
    // PROBLEM FILES
    // ============================================================================

    ProblemConfig datasource::readProblemJson(const std::string& filepath) const {
        std::ifstream input_file(filepath);
        if (!input_file.is_open()) {
            throw ConfigurationError("Failed to open problem file: " + filepath);
        }

        json j;
        try {
            input_file >> j;
        } catch (const json::parse_error& e) {
            throw ConfigurationError("Invalid JSON in " + filepath + ": " + e.what());
        }

        ProblemConfig config = parseProblem(j);

        if (debug_) {
            std::cout << "------------------------------------" << std::endl;
            std::cout << "Problem file: " << filepath << std::endl;
            std::cout << "Mesh: " << to_string(config.mesh.dimension) << " "
                      << to_string(config.mesh.order) << std::endl;
            std::cout << "Boundary conditions: " << config.boundary_conditions.size() << std::endl;
            std::cout << "------------------------------------" << std::endl;
        }

        return config;
    }

    ProblemConfig datasource::parseProblem(const json& j){
        if (!j.is_object()) {
            throw ConfigurationError("Problem description must be a JSON object");
        }

        ProblemConfig config;

        if (j.contains("solverConfig")) {
            config.solver = parse_solver_type(optional_string(j, "solverConfig", ""));
        }

        if (!j.contains("meshConfig")) {
            throw ConfigurationError("Missing 'meshConfig' section");
        }
        config.mesh = parseMeshConfig(j["meshConfig"]);

        if (!j.contains("boundaryConditions")) {
            throw ConfigurationError("Missing 'boundaryConditions' section");
        }
        config.boundary_conditions = parseBoundaryConditions(j["boundaryConditions"]);

        return config;
    }

    MeshConfig datasource::parseMeshConfig(const json& j){
        const std::string section = "meshConfig";
        if (!j.is_object()) {
            throw ConfigurationError("'meshConfig' must be a JSON object");
        }

        MeshConfig mesh;
        mesh.dimension = parse_mesh_dimension(optional_string(j, "meshDimension", "2D"));
        mesh.order = parse_element_order(optional_string(j, "elementOrder", "linear"));
        mesh.mesh_file = optional_string(j, "meshFile", "");

        // a mesh file carries its own geometry
        if (mesh.has_mesh_file()) {
            return mesh;
        }

        mesh.num_elements_x = require_integer(j, "numElementsX", section);
        mesh.max_x = require_number(j, "maxX", section);

        if (mesh.dimension == MeshDimension::TwoD) {
            mesh.num_elements_y = require_integer(j, "numElementsY", section);
            mesh.max_y = require_number(j, "maxY", section);
        } else {
            mesh.num_elements_y = j.contains("numElementsY") ? require_integer(j, "numElementsY", section) : 1;
            mesh.max_y = j.contains("maxY") ? require_number(j, "maxY", section) : 0.0;
        }

        return mesh;
    }

    BoundaryConditionMap datasource::parseBoundaryConditions(const json& j){
        if (!j.is_object()) {
            throw ConfigurationError("'boundaryConditions' must be a JSON object");
        }

        BoundaryConditionMap conditions;

        for (auto it = j.begin(); it != j.end(); ++it) {
            const std::string& key = it.key();
            const json& value = it.value();

            BoundarySide side = parse_boundary_side(key);

            if (!value.is_array() || value.empty() || !value[0].is_string()) {
                throw BoundaryConditionError(
                    "Boundary '" + key + "' must be [\"convection\", h, T_ext] or [\"constantTemp\", T]");
            }

            BoundaryConditionType type = parse_boundary_condition_type(value[0].get<std::string>());

            BoundaryCondition bc;
            if (type == BoundaryConditionType::ConstantTemp) {
                if (value.size() != 2 || !value[1].is_number()) {
                    throw BoundaryConditionError("Boundary '" + key + "': expected [\"constantTemp\", T]");
                }
                bc = BoundaryCondition::constant_temp(value[1].get<double>());
            } else {
                if (value.size() != 3 || !value[1].is_number() || !value[2].is_number()) {
                    throw BoundaryConditionError("Boundary '" + key + "': expected [\"convection\", h, T_ext]");
                }
                bc = BoundaryCondition::convection(value[1].get<double>(), value[2].get<double>());
            }

            if (!conditions.emplace(side, bc).second) {
                throw BoundaryConditionError(
                    "More than one condition given for the " + to_string(side) + " boundary");
            }
        }

        return conditions;
    }

    // ============================================================================
    // MESH FILES
    // ============================================================================

    MeshData datasource::readJson(const std::string& filepath) const {
        std::ifstream input_file(filepath);
        if (!input_file.is_open()) {
            throw ConfigurationError("Failed to open mesh file: " + filepath);
        }

        json j;
        try {
            input_file >> j;
        } catch (const json::parse_error& e) {
            throw ConfigurationError("Invalid JSON in " + filepath + ": " + e.what());
        }

        MeshData mesh = parseMesh(j);

        if (debug_) {
            std::cout << "------------------------------------" << std::endl;
            std::cout << "Load mesh information: " << std::endl;
            std::cout << "Nodes: " << mesh.total_nodes() << std::endl;
            std::cout << "Elements: " << mesh.total_elements() << std::endl;
            for (int s = 0; s < reference::kSides; ++s) {
                std::cout << "Boundary " << to_string(static_cast<BoundarySide>(s)) << ": "
                          << mesh.boundary_elements[s].size() << " elements" << std::endl;
            }
            std::cout << "------------------------------------" << std::endl;
        }

        return mesh;
    }

    MeshData datasource::parseMesh(const json& j){
        if (!j.contains("nodes") || !j["nodes"].is_array() || j["nodes"].empty()) {
            throw ConfigurationError("Mesh file needs a non-empty 'nodes' array");
        }
        if (!j.contains("elements") || !j["elements"].is_array() || j["elements"].empty()) {
            throw ConfigurationError("Mesh file needs a non-empty 'elements' array");
        }

        const json& nodes_values = j["nodes"];
        const json& elements_values = j["elements"];

        MeshData mesh;
        const int n_nodes = static_cast<int>(nodes_values.size());
        mesh.nodes_x.resize(n_nodes);
        mesh.nodes_y.resize(n_nodes);
        mesh.total_nodes_x = n_nodes;
        mesh.total_nodes_y = 1;

        // fill coordinates
        for (int i = 0; i < n_nodes; i++) {
            const std::string where = "node " + std::to_string(i);
            mesh.nodes_x(i) = require_number(nodes_values[i], "x", where);
            mesh.nodes_y(i) = require_number(nodes_values[i], "y", where);
        }

        const int n_elements = static_cast<int>(elements_values.size());
        const int nodes_per_element = static_cast<int>(elements_values[0].size());
        if (nodes_per_element != reference::kQuadraticNodes) {
            throw UnsupportedConfigurationError(
                "Mesh file elements with " + std::to_string(nodes_per_element) +
                " nodes are not supported (quadratic 9-node elements only)");
        }

        // fill connectivity, keeping the 1-based numbering of the file
        mesh.nop.resize(n_elements, nodes_per_element);
        for (int e = 0; e < n_elements; e++) {
            if (!elements_values[e].is_array() ||
                static_cast<int>(elements_values[e].size()) != nodes_per_element) {
                throw ConfigurationError("Element " + std::to_string(e) + " must list " +
                                         std::to_string(nodes_per_element) + " node ids");
            }
            for (int k = 0; k < nodes_per_element; k++) {
                const json& id = elements_values[e][k];
                if (!id.is_number_integer() || id.get<int>() < 1 || id.get<int>() > n_nodes) {
                    throw ConfigurationError("Element " + std::to_string(e) +
                                             " references an invalid node id");
                }
                mesh.nop(e, k) = id.get<int>();
            }
        }

        classifyBoundaryElements(mesh);

        return mesh;
    }

    void datasource::classifyBoundaryElements(MeshData& mesh){
        const double min_x = mesh.nodes_x.minCoeff();
        const double max_x = mesh.nodes_x.maxCoeff();
        const double min_y = mesh.nodes_y.minCoeff();
        const double max_y = mesh.nodes_y.maxCoeff();
        const double tol = 1e-10 * std::max({1.0, max_x - min_x, max_y - min_y});

        for (auto& list : mesh.boundary_elements) {
            list.clear();
        }

        for (int e = 0; e < mesh.total_elements(); ++e) {
            for (int s = 0; s < reference::kSides; ++s) {
                BoundarySide side = static_cast<BoundarySide>(s);

                bool on_side = true;
                for (int local : reference::side_nodes(side)) {
                    int node = mesh.global_node(e, local);
                    double coord = reference::is_horizontal(side) ? mesh.nodes_y(node) : mesh.nodes_x(node);
                    double target = 0.0;
                    switch (side) {
                        case BoundarySide::Bottom: target = min_y; break;
                        case BoundarySide::Left:   target = min_x; break;
                        case BoundarySide::Top:    target = max_y; break;
                        case BoundarySide::Right:  target = max_x; break;
                    }
                    if (std::abs(coord - target) > tol) {
                        on_side = false;
                        break;
                    }
                }

                if (on_side) {
                    mesh.boundary_elements[s].push_back({e, side});
                }
            }
        }
    }

    // ============================================================================
    // RESULTS
    // ============================================================================

    json datasource::toJson(const SolveResult& result){
        json j;
        j["solutionVector"] = to_std_vector(result.solution);
        j["nodesCoordinates"]["nodesXCoordinates"] = to_std_vector(result.coordinates.x);
        j["nodesCoordinates"]["nodesYCoordinates"] = to_std_vector(result.coordinates.y);
        return j;
    }

    json datasource::toJson(const AssemblyResult& assembled){
        const Eigen::MatrixXd& jacobian = assembled.system.jacobian;

        json rows = json::array();
        for (int i = 0; i < jacobian.rows(); ++i) {
            Eigen::VectorXd row = jacobian.row(i).transpose();
            rows.push_back(to_std_vector(row));
        }

        json j;
        j["jacobianMatrix"] = rows;
        j["residualVector"] = to_std_vector(assembled.system.residual);
        j["nodesCoordinates"]["nodesXCoordinates"] = to_std_vector(assembled.coordinates.x);
        j["nodesCoordinates"]["nodesYCoordinates"] = to_std_vector(assembled.coordinates.y);
        return j;
    }

    void datasource::writeOutput(const SolveResult& result, const std::string& filename) const {
        std::ofstream file(filename);
        if (!file.is_open()) {
            throw std::runtime_error("Failed to open file: " + filename);
        }

        file << std::setw(4) << toJson(result) << std::endl;

        if (debug_) {
            std::cout << "Data written to: " << filename << std::endl;
        }
    }
}
