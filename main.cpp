#include <iostream>
#include <iomanip>
#include <map>
#include <string>

#include <Eigen/Dense>

#include "mesh/datasource.hpp"
#include "models/exceptions.hpp"
#include "solver/model.hpp"
#include "utils/logging.hpp"
#include "utils/scope_timer.hpp"

void print_separator(const std::string& title) {
    std::cout << "\n" << std::string(50, '=') << std::endl;
    std::cout << title << std::endl;
    std::cout << std::string(50, '=') << std::endl;
}

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <problem.json> [output.json] [--debug]" << std::endl;
}

int main(int argc, char* argv[]) {
    std::string problem_file;
    std::string output_file = "heat_results.json";
    bool debug = false;

    int positional = 0;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--debug") {
            debug = true;
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (positional == 0) {
            problem_file = arg;
            positional++;
        } else if (positional == 1) {
            output_file = arg;
            positional++;
        } else {
            print_usage(argv[0]);
            return 2;
        }
    }

    if (problem_file.empty()) {
        print_usage(argv[0]);
        return 2;
    }

    try {
        mesh::datasource source(debug);
        ProblemConfig config = source.readProblemJson(problem_file);

        print_separator("Steady heat conduction");
        std::cout << "Problem: " << problem_file << std::endl;

        SolveResult result;
        double total_ms = 0.0;
        {
            utils::ScopeTimer timer("total", debug);
            solver::model heat(config, debug);
            result = heat.solve();
            total_ms = timer.elapsed_ms();
        }

        std::cout << "Nodes: " << result.solution.size() << std::endl;
        std::cout << std::fixed << std::setprecision(6);
        std::cout << "Temperature range: [" << result.solution.minCoeff() << ", "
                  << result.solution.maxCoeff() << "]" << std::endl;
        std::cout << std::defaultfloat;

        source.writeOutput(result, output_file);
        std::cout << "Results written to: " << output_file << std::endl;

        std::map<std::string, std::string> entries = utils::logging::describeProblem(config);
        entries["problemFile"] = problem_file;
        entries["outputFile"] = output_file;
        entries["totalNodes"] = std::to_string(result.solution.size());
        entries["minTemperature"] = std::to_string(result.solution.minCoeff());
        entries["maxTemperature"] = std::to_string(result.solution.maxCoeff());
        entries["elapsedMs"] = std::to_string(total_ms);

        utils::logging logger;
        logger.buildLogFile(entries);

    } catch (const ConfigurationError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    } catch (const BoundaryConditionError& e) {
        std::cerr << "Boundary condition error: " << e.what() << std::endl;
        return 1;
    } catch (const UnsupportedConfigurationError& e) {
        std::cerr << "Unsupported configuration: " << e.what() << std::endl;
        return 1;
    } catch (const DegenerateElementError& e) {
        std::cerr << "Mesh error: " << e.what() << std::endl;
        return 1;
    } catch (const SingularSystemError& e) {
        std::cerr << "Solver error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
