#include <iostream>
#include <iomanip>
#include <Eigen/Dense>

#include "mesh/datasource.hpp"
#include "mesh/uniform.hpp"
#include "models/config.hpp"
#include "solver/model.hpp"

// Plate heated on the left, cooled on the right, convective top edge
int main() {
    std::cout << "=== 2D Steady Heat Conduction Example ===" << std::endl;

    ProblemConfig config;
    config.solver = SolverType::SolidHeatTransfer;
    config.mesh.dimension = MeshDimension::TwoD;
    config.mesh.order = ElementOrder::Quadratic;
    config.mesh.num_elements_x = 4;
    config.mesh.num_elements_y = 2;
    config.mesh.max_x = 1.0;
    config.mesh.max_y = 0.5;

    config.boundary_conditions[BoundarySide::Left] = BoundaryCondition::constant_temp(100.0);
    config.boundary_conditions[BoundarySide::Right] = BoundaryCondition::constant_temp(20.0);
    config.boundary_conditions[BoundarySide::Top] = BoundaryCondition::convection(5.0, 25.0);

    try {
        solver::model heat(config, true);
        SolveResult result = heat.solve();

        mesh::uniform generator(config.mesh);
        const int total_nodes_y = 2 * config.mesh.num_elements_y + 1;

        // temperature along the bottom edge (j = 0) and the top edge
        std::cout << std::fixed << std::setprecision(4);
        std::cout << std::setw(10) << "x" << std::setw(14) << "T(y=0)" << std::setw(14) << "T(y=max)" << std::endl;
        for (int i = 0; i < 2 * config.mesh.num_elements_x + 1; ++i) {
            const int bottom = i * total_nodes_y;
            const int top = bottom + total_nodes_y - 1;
            std::cout << std::setw(10) << i * generator.get_element_width() / 2.0
                      << std::setw(14) << result.solution(bottom)
                      << std::setw(14) << result.solution(top) << std::endl;
        }
        std::cout << std::defaultfloat;

        mesh::datasource source(true);
        source.writeOutput(result, "heat_2d_results.json");

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
