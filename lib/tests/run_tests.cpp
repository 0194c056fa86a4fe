#include <iostream>
#include <string>
#include <exception>

#include "tests/test_configuration.hpp"
#include "tests/test_heat_transfer.hpp"
#include "tests/test_linear_algebra.hpp"

// Usage: run_tests [heat|configuration|linear_algebra]
int main(int argc, char* argv[]) {
    const std::string group = argc > 1 ? argv[1] : "all";

    if (group != "all" && group != "heat" && group != "configuration" && group != "linear_algebra") {
        std::cerr << "Unknown test group: " << group << std::endl;
        return 2;
    }

    try {
        if (group == "all" || group == "linear_algebra") {
            TestLinearAlgebra::run_all();
        }
        if (group == "all" || group == "heat") {
            TestHeatTransfer::run_all();
        }
        if (group == "all" || group == "configuration") {
            TestConfiguration::run_all();
        }
    } catch (const std::exception& e) {
        std::cerr << "Test failed: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
