#include "utils/logging.hpp"

#include <filesystem>
#include <stdexcept>

std::string utils::logging::generateDateString(){
    auto now = std::chrono::system_clock::now();

    std::time_t currentTime = std::chrono::system_clock::to_time_t(now);
    std::tm* localTime = std::localtime(&currentTime);

    std::ostringstream dateStream;
    dateStream << std::put_time(localTime, "%Y-%m-%d %H:%M:%S");
    return dateStream.str();
}

std::string utils::logging::generateTimestamp(){
    auto now = std::chrono::system_clock::now();
    return std::to_string(std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count());
}

std::map<std::string, std::string> utils::logging::describeProblem(const ProblemConfig& config){
    std::map<std::string, std::string> dataMap;

    dataMap["meshDimension"] = to_string(config.mesh.dimension);
    dataMap["elementOrder"] = to_string(config.mesh.order);
    if (config.mesh.has_mesh_file()) {
        dataMap["meshFile"] = config.mesh.mesh_file;
    } else {
        dataMap["numElementsX"] = std::to_string(config.mesh.num_elements_x);
        dataMap["numElementsY"] = std::to_string(config.mesh.num_elements_y);
        dataMap["maxX"] = std::to_string(config.mesh.max_x);
        dataMap["maxY"] = std::to_string(config.mesh.max_y);
    }

    for (const auto& [side, bc] : config.boundary_conditions) {
        std::ostringstream entry;
        if (bc.type == BoundaryConditionType::ConstantTemp) {
            entry << "constantTemp " << bc.value;
        } else {
            entry << "convection " << bc.coeff << " " << bc.external_temp;
        }
        dataMap[to_string(side) + "Boundary"] = entry.str();
    }

    return dataMap;
}

std::string utils::logging::buildLogFile(std::map<std::string, std::string>& dataMap) const {
    std::string dateString = generateDateString();
    std::string timestamp = generateTimestamp();

    dataMap["date"] = dateString;
    dataMap["timestamp"] = timestamp;

    nlohmann::json j = dataMap;

    std::filesystem::create_directories(directory_);
    std::string filename = (std::filesystem::path(directory_) / ("log_" + timestamp + ".json")).string();

    std::ofstream o(filename);
    if (!o.is_open()) {
        throw std::runtime_error("Failed to open log file: " + filename);
    }
    o << std::setw(4) << j << std::endl;

    std::cout << "Log written to: " << filename << std::endl;
    return filename;
}
