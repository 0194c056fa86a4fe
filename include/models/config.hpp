/**
 * @file config.hpp
 * @brief Problem configuration (mesh, boundary conditions, solver)
 */

#ifndef HEATFEM_MODELS_CONFIG_HPP
#define HEATFEM_MODELS_CONFIG_HPP

#include <map>
#include <string>

#include "models/enums.hpp"

// Structured mesh settings
struct MeshConfig {
    MeshDimension dimension = MeshDimension::TwoD;
    ElementOrder order = ElementOrder::Quadratic;
    int num_elements_x = 0;
    int num_elements_y = 1;
    double max_x = 0.0;
    double max_y = 0.0;

    // optional JSON mesh file replacing the structured generator
    std::string mesh_file;

    bool has_mesh_file() const { return !mesh_file.empty(); }
};

// One thermal boundary condition
struct BoundaryCondition {
    BoundaryConditionType type = BoundaryConditionType::ConstantTemp;
    double value = 0.0;         // prescribed temperature (constantTemp)
    double coeff = 0.0;         // heat transfer coefficient (convection)
    double external_temp = 0.0; // external temperature (convection)

    static BoundaryCondition constant_temp(double temperature){
        BoundaryCondition bc;
        bc.type = BoundaryConditionType::ConstantTemp;
        bc.value = temperature;
        return bc;
    }

    static BoundaryCondition convection(double heat_transfer_coeff, double ext_temp){
        BoundaryCondition bc;
        bc.type = BoundaryConditionType::Convection;
        bc.coeff = heat_transfer_coeff;
        bc.external_temp = ext_temp;
        return bc;
    }
};

using BoundaryConditionMap = std::map<BoundarySide, BoundaryCondition>;

// Everything a solve needs; built once and passed by const reference
struct ProblemConfig {
    SolverType solver = SolverType::SolidHeatTransfer;
    MeshConfig mesh;
    BoundaryConditionMap boundary_conditions;
};

#endif // HEATFEM_MODELS_CONFIG_HPP
