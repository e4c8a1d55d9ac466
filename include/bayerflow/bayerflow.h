#pragma once

/**
 * @file bayerflow.h
 * @brief Main header for the bayerflow streaming demosaic library
 *
 * Include this single header to access the streaming core, the frame adapter
 * and the logging / configuration infrastructure.
 *
 * @version 1.0.0
 */

// Core types and utilities
#include "bayerflow/core/types.hpp"
#include "bayerflow/core/Logger.hpp"
#include "bayerflow/core/Configuration.hpp"
#include "bayerflow/core/exception.h"

// Streaming core
#include "bayerflow/stream/DemosaicCore.hpp"

// Frame API
#include "bayerflow/api/FrameDemosaicer.hpp"

#include <string>

#define BAYERFLOW_VERSION_MAJOR 1
#define BAYERFLOW_VERSION_MINOR 0
#define BAYERFLOW_VERSION_PATCH 0

namespace bayerflow {

/**
 * @brief Get version string
 * @return Version string (e.g., "1.0.0")
 */
inline std::string getVersionString() {
    return std::to_string(BAYERFLOW_VERSION_MAJOR) + "." +
           std::to_string(BAYERFLOW_VERSION_MINOR) + "." +
           std::to_string(BAYERFLOW_VERSION_PATCH);
}

/**
 * @brief Initialize logging from a configuration file
 *
 * Optional. Loads the YAML file (if given) into the Configuration singleton
 * and applies its logging section to the Logger singleton.
 *
 * @param configFile YAML configuration file, or empty for defaults
 * @return ResultCode indicating success or failure
 */
inline core::ResultCode initialize(const std::string& configFile = "") {
    auto& config = core::Configuration::getInstance();
    if (!configFile.empty() && !config.load(configFile)) {
        return core::ResultCode::ERROR_FILE_IO;
    }

    try {
        const auto logging = config.getLoggingConfig();
        if (!core::Logger::getInstance().initialize(logging.level, logging.console, logging.file)) {
            return core::ResultCode::ERROR_FILE_IO;
        }
    } catch (const core::Exception& e) {
        LOG_ERROR(std::string("Invalid logging configuration: ") + e.what());
        return e.getResultCode();
    }

    BAYERFLOW_LOG_INFO("API") << "bayerflow initialized - Version " << getVersionString();
    return core::ResultCode::SUCCESS;
}

/**
 * @brief Flush logs
 */
inline void shutdown() {
    BAYERFLOW_LOG_INFO("API") << "bayerflow shutdown";
    core::Logger::getInstance().flush();
}

} // namespace bayerflow
