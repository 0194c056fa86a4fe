/**
 * @file test_configuration.hpp
 * @brief Tests for problem files, mesh files, result output and run logs
 * @author Paulo Akira
 * @date 2025
 */

#ifndef TEST_CONFIGURATION_HPP
#define TEST_CONFIGURATION_HPP

#include <iostream>
#include <cassert>
#include <cmath>
#include <fstream>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "mesh/datasource.hpp"
#include "mesh/uniform.hpp"
#include "models/config.hpp"
#include "models/enums.hpp"
#include "models/exceptions.hpp"
#include "solver/model.hpp"
#include "utils/logging.hpp"

namespace TestConfiguration {
    void test_enum_parsing();
    void test_parse_problem();
    void test_problem_errors();
    void test_model_validation();
    void test_mesh_file();
    void test_mesh_file_solve();
    void test_result_output();
    void test_run_log();

    void run_all();
}

#endif
