#include "solver/model.hpp"

#include "linear_algebra/gauss_elimination.hpp"
#include "mesh/datasource.hpp"
#include "mesh/uniform.hpp"
#include "models/exceptions.hpp"
#include "solver/solidHeatTransfer.hpp"
#include "utils/boundary.hpp"
#include "utils/matrix_helper.hpp"
#include "utils/scope_timer.hpp"

namespace solver {

    model::model(const ProblemConfig& config, bool debug)
        : config_(config), debug_(debug) {
        validate(config_);
    }

    void model::validate(const ProblemConfig& config){
        if (config.solver != SolverType::SolidHeatTransfer) {
            throw UnsupportedConfigurationError("Only the solid heat transfer solver is available");
        }

        const MeshConfig& mesh = config.mesh;
        if (!mesh.has_mesh_file()) {
            if (mesh.num_elements_x <= 0 || mesh.max_x <= 0.0) {
                throw ConfigurationError("Mesh configuration needs numElementsX > 0 and maxX > 0");
            }
            if (mesh.dimension == MeshDimension::TwoD &&
                (mesh.num_elements_y <= 0 || mesh.max_y <= 0.0)) {
                throw ConfigurationError("2D mesh configuration needs numElementsY > 0 and maxY > 0");
            }
        }

        if (config.boundary_conditions.empty()) {
            throw ConfigurationError("No boundary conditions were given");
        }

        if (mesh.dimension != MeshDimension::TwoD || mesh.order != ElementOrder::Quadratic) {
            throw UnsupportedConfigurationError(
                "Heat transfer assembly is available for 2D quadratic elements only (requested " +
                to_string(mesh.dimension) + " " + to_string(mesh.order) + ")");
        }

        if (!mesh.has_mesh_file()) {
            const long long nodes_x = 2LL * mesh.num_elements_x + 1;
            const long long nodes_y = 2LL * mesh.num_elements_y + 1;
            check_dense_size(nodes_x * nodes_y);
        }
    }

    void model::check_dense_size(long long total_nodes){
        const double bytes = static_cast<double>(total_nodes) * static_cast<double>(total_nodes) * sizeof(double);
        if (bytes > static_cast<double>(kMaxDenseSystemBytes)) {
            throw UnsupportedConfigurationError(
                "Mesh with " + std::to_string(total_nodes) + " nodes needs " +
                std::to_string(static_cast<long long>(bytes / (1024.0 * 1024.0))) +
                " MB of dense storage (limit " +
                std::to_string(kMaxDenseSystemBytes / (1024 * 1024)) + " MB)");
        }
    }

    MeshData model::build_mesh() const {
        if (config_.mesh.has_mesh_file()) {
            mesh::datasource source(debug_);
            MeshData mesh = source.readJson(config_.mesh.mesh_file);
            check_dense_size(mesh.total_nodes());
            return mesh;
        }

        mesh::uniform generator(config_.mesh, debug_);
        return generator.generate();
    }

    AssemblyResult model::assemble() const {
        AssemblyResult result;

        MeshData mesh = build_mesh();

        {
            utils::ScopeTimer timer("assemblyMatrices", debug_);

            solidHeatTransfer assembler(mesh, config_.mesh.order, debug_);
            result.system = assembler.assemble();

            utils::boundary thermal_boundary(config_.boundary_conditions, mesh, config_.mesh.order, debug_);
            thermal_boundary.apply(result.system, assembler.get_gauss_rule());
        }

        if (debug_) {
            utils::MatrixHelper::print_system_summary(result.system, "Heat transfer system");
        }

        result.coordinates.x = mesh.nodes_x;
        result.coordinates.y = mesh.nodes_y;
        return result;
    }

    SolveResult model::solve() const {
        AssemblyResult assembled = assemble();

        SolveResult result;
        result.coordinates = assembled.coordinates;

        {
            utils::ScopeTimer timer("systemSolving", debug_);

            const size_t n = static_cast<size_t>(assembled.system.residual.size());
            LinearAlgebra::GaussElimination lu(n);
            if (!lu.solve(assembled.system.jacobian, result.solution, assembled.system.residual)) {
                throw SingularSystemError(
                    "LU factorization failed: the assembled system is singular");
            }
        }

        if (debug_) {
            std::cout << "Solution range: [" << result.solution.minCoeff() << ", "
                      << result.solution.maxCoeff() << "]" << std::endl;
        }

        return result;
    }
}
