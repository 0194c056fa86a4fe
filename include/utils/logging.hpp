#if __INTELLISENSE__
#undef __ARM_NEON
#undef __ARM_NEON__
#endif

#ifndef HEATFEM_LOGGING_HPP
#define HEATFEM_LOGGING_HPP

#include <iostream>
#include <sstream>
#include <fstream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <map>
#include <string>

#include <nlohmann/json.hpp>

#include "models/config.hpp"

namespace utils {
    class logging{
    public:
        explicit logging(const std::string& directory = "log") : directory_(directory) {}

        // generate a date string with the current date
        static std::string generateDateString();

        // generate timestamp (seconds since epoch)
        static std::string generateTimestamp();

        // flatten a problem configuration into log entries
        static std::map<std::string, std::string> describeProblem(const ProblemConfig& config);

        /**
         * @brief Write the entries, the date and the timestamp to
         * <directory>/log_<timestamp>.json
         * @return Path of the written file
         */
        std::string buildLogFile(std::map<std::string, std::string>& dataMap) const;

    private:
        std::string directory_;
    };
}

#endif
