#include "models/enums.hpp"
#include "models/exceptions.hpp"

std::string to_string(MeshDimension dimension){
    return dimension == MeshDimension::OneD ? "1D" : "2D";
}

std::string to_string(ElementOrder order){
    return order == ElementOrder::Linear ? "linear" : "quadratic";
}

std::string to_string(BoundarySide side){
    switch (side) {
        case BoundarySide::Bottom: return "bottom";
        case BoundarySide::Left:   return "left";
        case BoundarySide::Top:    return "top";
        case BoundarySide::Right:  return "right";
    }
    return "unknown";
}

std::string to_string(BoundaryConditionType type){
    return type == BoundaryConditionType::Convection ? "convection" : "constantTemp";
}

MeshDimension parse_mesh_dimension(const std::string& value){
    if (value == "1D") return MeshDimension::OneD;
    if (value == "2D") return MeshDimension::TwoD;
    throw ConfigurationError("Unknown mesh dimension '" + value + "' (expected 1D or 2D)");
}

ElementOrder parse_element_order(const std::string& value){
    if (value == "linear") return ElementOrder::Linear;
    if (value == "quadratic") return ElementOrder::Quadratic;
    throw ConfigurationError("Unknown element order '" + value + "' (expected linear or quadratic)");
}

SolverType parse_solver_type(const std::string& value){
    if (value == "solidHeatTransferScript" || value == "solidHeatTransfer") {
        return SolverType::SolidHeatTransfer;
    }
    throw UnsupportedConfigurationError("Unsupported solver '" + value + "'");
}

BoundaryConditionType parse_boundary_condition_type(const std::string& value){
    if (value == "convection") return BoundaryConditionType::Convection;
    if (value == "constantTemp") return BoundaryConditionType::ConstantTemp;
    throw BoundaryConditionError("Unknown boundary condition kind '" + value + "'");
}

BoundarySide parse_boundary_side(const std::string& key){
    std::string name = key;

    const std::string suffix = "Boundary";
    if (name.size() > suffix.size() &&
        name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
        name = name.substr(0, name.size() - suffix.size());
    }

    if (name == "bottom" || name == "0") return BoundarySide::Bottom;
    if (name == "left"   || name == "1") return BoundarySide::Left;
    if (name == "top"    || name == "2") return BoundarySide::Top;
    if (name == "right"  || name == "3") return BoundarySide::Right;

    throw BoundaryConditionError("Unknown boundary '" + key + "'");
}
