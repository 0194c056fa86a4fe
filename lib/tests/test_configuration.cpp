#include "tests/test_configuration.hpp"

namespace TestConfiguration {

    using json = nlohmann::json;

    template<typename Exception, typename Function>
    bool throws(Function&& f) {
        try {
            f();
        } catch (const Exception&) {
            return true;
        }
        return false;
    }

    std::filesystem::path scratch_directory() {
        std::filesystem::path dir = std::filesystem::temp_directory_path() / "heatfem_tests";
        std::filesystem::create_directories(dir);
        return dir;
    }

    json unit_square_problem() {
        return json::parse(R"({
            "solverConfig": "solidHeatTransferScript",
            "meshConfig": {
                "meshDimension": "2D",
                "elementOrder": "quadratic",
                "numElementsX": 2,
                "numElementsY": 2,
                "maxX": 1.0,
                "maxY": 1.0
            },
            "boundaryConditions": {
                "leftBoundary": ["constantTemp", 100.0],
                "rightBoundary": ["convection", 10.0, 20.0]
            }
        })");
    }

    // Mesh file layout written by a mesher: nodes as {x, y}, elements as 1-based ids
    json mesh_to_json(const MeshData& mesh) {
        json j;
        j["nodes"] = json::array();
        for (int i = 0; i < mesh.total_nodes(); ++i) {
            j["nodes"].push_back({{"x", mesh.nodes_x(i)}, {"y", mesh.nodes_y(i)}});
        }
        j["elements"] = json::array();
        for (int e = 0; e < mesh.total_elements(); ++e) {
            json element = json::array();
            for (int k = 0; k < mesh.nodes_per_element(); ++k) {
                element.push_back(mesh.nop(e, k));
            }
            j["elements"].push_back(element);
        }
        return j;
    }

    MeshData uniform_mesh(int nx, int ny, double max_x, double max_y) {
        MeshConfig config;
        config.dimension = MeshDimension::TwoD;
        config.order = ElementOrder::Quadratic;
        config.num_elements_x = nx;
        config.num_elements_y = ny;
        config.max_x = max_x;
        config.max_y = max_y;
        return mesh::uniform(config).generate();
    }

    // ============================================================================
    // PROBLEM FILES
    // ============================================================================

    void test_enum_parsing() {
        std::cout << "Testing configuration keywords..." << std::endl;

        assert(parse_mesh_dimension("1D") == MeshDimension::OneD);
        assert(parse_mesh_dimension("2D") == MeshDimension::TwoD);
        assert(parse_element_order("quadratic") == ElementOrder::Quadratic);
        assert(parse_solver_type("solidHeatTransferScript") == SolverType::SolidHeatTransfer);
        assert(parse_boundary_condition_type("convection") == BoundaryConditionType::Convection);

        assert(parse_boundary_side("bottomBoundary") == BoundarySide::Bottom);
        assert(parse_boundary_side("left") == BoundarySide::Left);
        assert(parse_boundary_side("2") == BoundarySide::Top);
        assert(parse_boundary_side("rightBoundary") == BoundarySide::Right);

        assert(throws<ConfigurationError>([]() { parse_mesh_dimension("3D"); }));
        assert(throws<ConfigurationError>([]() { parse_element_order("cubic"); }));
        assert(throws<UnsupportedConfigurationError>([]() { parse_solver_type("fluidFlow"); }));
        assert(throws<BoundaryConditionError>([]() { parse_boundary_condition_type("radiation"); }));
        assert(throws<BoundaryConditionError>([]() { parse_boundary_side("front"); }));
        assert(throws<BoundaryConditionError>([]() { parse_boundary_side("Boundary"); }));

        assert(to_string(BoundarySide::Top) == "top");

        std::cout << "  ✓ Keywords and side names" << std::endl;
    }

    void test_parse_problem() {
        std::cout << "Testing problem parsing..." << std::endl;

        ProblemConfig config = mesh::datasource::parseProblem(unit_square_problem());

        assert(config.solver == SolverType::SolidHeatTransfer);
        assert(config.mesh.dimension == MeshDimension::TwoD);
        assert(config.mesh.order == ElementOrder::Quadratic);
        assert(config.mesh.num_elements_x == 2 && config.mesh.num_elements_y == 2);
        assert(config.mesh.max_x == 1.0 && config.mesh.max_y == 1.0);
        assert(!config.mesh.has_mesh_file());

        assert(config.boundary_conditions.size() == 2);
        const BoundaryCondition& left = config.boundary_conditions.at(BoundarySide::Left);
        assert(left.type == BoundaryConditionType::ConstantTemp && left.value == 100.0);
        const BoundaryCondition& right = config.boundary_conditions.at(BoundarySide::Right);
        assert(right.type == BoundaryConditionType::Convection);
        assert(right.coeff == 10.0 && right.external_temp == 20.0);

        // element order defaults to linear, solver to heat transfer
        json j = unit_square_problem();
        j.erase("solverConfig");
        j["meshConfig"].erase("elementOrder");
        ProblemConfig defaults = mesh::datasource::parseProblem(j);
        assert(defaults.solver == SolverType::SolidHeatTransfer);
        assert(defaults.mesh.order == ElementOrder::Linear);

        // a mesh file replaces the structured sizes
        json with_file = unit_square_problem();
        with_file["meshConfig"] = {{"elementOrder", "quadratic"}, {"meshFile", "mesh.json"}};
        ProblemConfig from_file = mesh::datasource::parseProblem(with_file);
        assert(from_file.mesh.has_mesh_file() && from_file.mesh.mesh_file == "mesh.json");

        // reading from disk
        std::filesystem::path path = scratch_directory() / "problem.json";
        {
            std::ofstream out(path);
            out << unit_square_problem().dump(4);
        }
        mesh::datasource source;
        ProblemConfig read = source.readProblemJson(path.string());
        assert(read.boundary_conditions.size() == 2);

        std::cout << "  ✓ Mesh settings and boundary conditions" << std::endl;
    }

    void test_problem_errors() {
        std::cout << "Testing malformed problems..." << std::endl;

        json missing_mesh = unit_square_problem();
        missing_mesh.erase("meshConfig");
        assert(throws<ConfigurationError>([&]() { mesh::datasource::parseProblem(missing_mesh); }));

        json missing_bcs = unit_square_problem();
        missing_bcs.erase("boundaryConditions");
        assert(throws<ConfigurationError>([&]() { mesh::datasource::parseProblem(missing_bcs); }));

        json missing_size = unit_square_problem();
        missing_size["meshConfig"].erase("numElementsX");
        assert(throws<ConfigurationError>([&]() { mesh::datasource::parseProblem(missing_size); }));

        json missing_height = unit_square_problem();
        missing_height["meshConfig"].erase("maxY");
        assert(throws<ConfigurationError>([&]() { mesh::datasource::parseProblem(missing_height); }));

        json fractional = unit_square_problem();
        fractional["meshConfig"]["numElementsX"] = 2.5;
        assert(throws<ConfigurationError>([&]() { mesh::datasource::parseProblem(fractional); }));

        json bad_side = unit_square_problem();
        bad_side["boundaryConditions"]["frontBoundary"] = json::array({"constantTemp", 1.0});
        assert(throws<BoundaryConditionError>([&]() { mesh::datasource::parseProblem(bad_side); }));

        json short_entry = unit_square_problem();
        short_entry["boundaryConditions"]["topBoundary"] = json::array({"constantTemp"});
        assert(throws<BoundaryConditionError>([&]() { mesh::datasource::parseProblem(short_entry); }));

        json short_convection = unit_square_problem();
        short_convection["boundaryConditions"]["topBoundary"] = json::array({"convection", 10.0});
        assert(throws<BoundaryConditionError>([&]() { mesh::datasource::parseProblem(short_convection); }));

        json duplicate = unit_square_problem();
        duplicate["boundaryConditions"]["3"] = json::array({"constantTemp", 0.0});
        assert(throws<BoundaryConditionError>([&]() { mesh::datasource::parseProblem(duplicate); }));

        json other_solver = unit_square_problem();
        other_solver["solverConfig"] = "fluidFlow";
        assert(throws<UnsupportedConfigurationError>([&]() { mesh::datasource::parseProblem(other_solver); }));

        mesh::datasource source;
        assert(throws<ConfigurationError>([&]() { source.readProblemJson("does/not/exist.json"); }));

        std::filesystem::path broken = scratch_directory() / "broken.json";
        {
            std::ofstream out(broken);
            out << "{ \"meshConfig\": ";
        }
        assert(throws<ConfigurationError>([&]() { source.readProblemJson(broken.string()); }));

        std::cout << "  ✓ Missing keys and bad entries rejected" << std::endl;
    }

    void test_model_validation() {
        std::cout << "Testing model validation..." << std::endl;

        const ProblemConfig valid = mesh::datasource::parseProblem(unit_square_problem());
        solver::model accepted(valid);
        assert(accepted.get_config().mesh.num_elements_x == 2);

        ProblemConfig one_d = valid;
        one_d.mesh.dimension = MeshDimension::OneD;
        assert(throws<UnsupportedConfigurationError>([&]() { solver::model m(one_d); }));

        ProblemConfig linear = valid;
        linear.mesh.order = ElementOrder::Linear;
        assert(throws<UnsupportedConfigurationError>([&]() { solver::model m(linear); }));

        ProblemConfig no_bcs = valid;
        no_bcs.boundary_conditions.clear();
        assert(throws<ConfigurationError>([&]() { solver::model m(no_bcs); }));

        ProblemConfig empty_mesh = valid;
        empty_mesh.mesh.num_elements_y = 0;
        assert(throws<ConfigurationError>([&]() { solver::model m(empty_mesh); }));

        // only convection: no fixed temperature, the system is still regular
        ProblemConfig convection_only = valid;
        convection_only.boundary_conditions.clear();
        convection_only.boundary_conditions[BoundarySide::Top] = BoundaryCondition::convection(5.0, 10.0);
        SolveResult result = solver::model(convection_only).solve();
        assert(result.solution.allFinite());

        std::cout << "  ✓ Unsupported elements fail before assembly" << std::endl;
    }

    // ============================================================================
    // MESH FILES
    // ============================================================================

    void test_mesh_file() {
        std::cout << "Testing mesh file parsing..." << std::endl;

        MeshData reference_mesh = uniform_mesh(3, 2, 3.0, 1.0);
        MeshData parsed = mesh::datasource::parseMesh(mesh_to_json(reference_mesh));

        assert(parsed.total_nodes() == reference_mesh.total_nodes());
        assert(parsed.total_elements() == reference_mesh.total_elements());
        assert(parsed.nop == reference_mesh.nop);
        assert(parsed.nodes_x.isApprox(reference_mesh.nodes_x));

        // bounding-box classification matches the structured lists
        for (int s = 0; s < 4; ++s) {
            assert(parsed.boundary_elements[s].size() == reference_mesh.boundary_elements[s].size());
            for (size_t i = 0; i < parsed.boundary_elements[s].size(); ++i) {
                assert(parsed.boundary_elements[s][i].element == reference_mesh.boundary_elements[s][i].element);
                assert(parsed.boundary_elements[s][i].side == reference_mesh.boundary_elements[s][i].side);
            }
        }

        json quads = mesh_to_json(reference_mesh);
        quads["elements"] = json::array({json::array({1, 2, 3, 4})});
        assert(throws<UnsupportedConfigurationError>([&]() { mesh::datasource::parseMesh(quads); }));

        json bad_id = mesh_to_json(reference_mesh);
        bad_id["elements"][0][0] = 0;
        assert(throws<ConfigurationError>([&]() { mesh::datasource::parseMesh(bad_id); }));

        json no_nodes = mesh_to_json(reference_mesh);
        no_nodes.erase("nodes");
        assert(throws<ConfigurationError>([&]() { mesh::datasource::parseMesh(no_nodes); }));

        std::cout << "  ✓ Connectivity kept 1-based, boundary sides found" << std::endl;
    }

    void test_mesh_file_solve() {
        std::cout << "Testing solve on a mesh file..." << std::endl;

        std::filesystem::path mesh_path = scratch_directory() / "unit_square_mesh.json";
        {
            std::ofstream out(mesh_path);
            out << mesh_to_json(uniform_mesh(2, 2, 1.0, 1.0)).dump(4);
        }

        ProblemConfig structured = mesh::datasource::parseProblem(unit_square_problem());
        ProblemConfig from_file = structured;
        from_file.mesh.mesh_file = mesh_path.string();

        SolveResult a = solver::model(structured).solve();
        SolveResult b = solver::model(from_file).solve();

        assert(a.solution.size() == b.solution.size());
        assert((a.solution - b.solution).cwiseAbs().maxCoeff() < 1e-10);

        std::cout << "  ✓ Same solution as the structured mesh" << std::endl;
    }

    // ============================================================================
    // OUTPUT
    // ============================================================================

    void test_result_output() {
        std::cout << "Testing result output..." << std::endl;

        SolveResult result = solver::model(mesh::datasource::parseProblem(unit_square_problem())).solve();

        json j = mesh::datasource::toJson(result);
        assert(j["solutionVector"].size() == 25);
        assert(j["nodesCoordinates"]["nodesXCoordinates"].size() == 25);
        assert(j["nodesCoordinates"]["nodesYCoordinates"].size() == 25);
        assert(j["solutionVector"][0].get<double>() == result.solution(0));

        std::filesystem::path path = scratch_directory() / "result.json";
        mesh::datasource source;
        source.writeOutput(result, path.string());

        std::ifstream in(path);
        json read = json::parse(in);
        assert(read == j);

        // assembled system before the solve
        AssemblyResult assembled = solver::model(mesh::datasource::parseProblem(unit_square_problem())).assemble();
        json system = mesh::datasource::toJson(assembled);
        assert(system["jacobianMatrix"].size() == 25);
        assert(system["jacobianMatrix"][3].size() == 25);
        assert(system["jacobianMatrix"][0][0].get<double>() == 1.0);   // left node, fixed
        assert(system["residualVector"][0].get<double>() == 100.0);
        assert(system["nodesCoordinates"]["nodesXCoordinates"].size() == 25);

        std::cout << "  ✓ solutionVector and nodesCoordinates written" << std::endl;
    }

    void test_run_log() {
        std::cout << "Testing run log..." << std::endl;

        ProblemConfig config = mesh::datasource::parseProblem(unit_square_problem());
        std::map<std::string, std::string> entries = utils::logging::describeProblem(config);

        assert(entries.at("meshDimension") == "2D");
        assert(entries.at("elementOrder") == "quadratic");
        assert(entries.at("numElementsX") == "2");
        assert(entries.count("leftBoundary") == 1);
        assert(entries.count("rightBoundary") == 1);

        entries["status"] = "solved";

        utils::logging logger((scratch_directory() / "log").string());
        std::string filename = logger.buildLogFile(entries);

        std::ifstream in(filename);
        assert(in.is_open());
        json read = json::parse(in);
        assert(read["status"] == "solved");
        assert(read.contains("date"));
        assert(read.contains("timestamp"));

        std::cout << "  ✓ Log file with date and problem entries" << std::endl;
    }

    void run_all() {
        std::cout << "\n" << std::string(60, '=') << std::endl;
        std::cout << "CONFIGURATION TESTS" << std::endl;
        std::cout << std::string(60, '=') << std::endl;

        test_enum_parsing();
        test_parse_problem();
        test_problem_errors();
        test_model_validation();
        test_mesh_file();
        test_mesh_file_solve();
        test_result_output();
        test_run_log();

        std::cout << "\nAll configuration tests passed!" << std::endl;
    }
}
