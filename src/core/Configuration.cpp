#include "bayerflow/core/Configuration.hpp"
#include "bayerflow/core/exception.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace bayerflow {
namespace core {

namespace {

std::string toUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

template<typename T>
T readScalar(const YAML::Node& section, const char* key, const T& defaultValue) {
    const YAML::Node node = section[key];
    if (!node) {
        return defaultValue;
    }
    try {
        return node.as<T>();
    } catch (const YAML::Exception& e) {
        BAYERFLOW_THROW(ConfigurationException,
                        std::string("Invalid value for '") + key + "': " + e.what());
    }
}

} // namespace

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

bool Configuration::load(const std::string& filename) {
    try {
        YAML::Node document = YAML::LoadFile(filename);
        std::lock_guard<std::mutex> lock(mutex_);
        root_ = document;
        currentFile_ = filename;
    } catch (const YAML::Exception& e) {
        LOG_ERROR("Failed to load configuration " + filename + ": " + e.what());
        return false;
    }

    LOG_INFO("Configuration loaded from " + filename);
    return true;
}

bool Configuration::loadFromString(const std::string& yaml) {
    try {
        YAML::Node document = YAML::Load(yaml);
        std::lock_guard<std::mutex> lock(mutex_);
        root_ = document;
        currentFile_.clear();
    } catch (const YAML::Exception& e) {
        LOG_ERROR(std::string("Failed to parse configuration: ") + e.what());
        return false;
    }
    return true;
}

bool Configuration::reload() {
    std::string filename;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        filename = currentFile_;
    }
    if (filename.empty()) {
        return false;
    }
    return load(filename);
}

void Configuration::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    root_ = YAML::Node();
    currentFile_.clear();
}

bool Configuration::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<bool>(lookup(key));
}

YAML::Node Configuration::lookup(const std::string& key) const {
    YAML::Node current;
    current.reset(root_);

    std::stringstream parts(key);
    std::string part;
    while (std::getline(parts, part, '.')) {
        if (!current || !current.IsMap()) {
            return YAML::Node(YAML::NodeType::Undefined);
        }
        const YAML::Node& parent = current;
        YAML::Node child = parent[part];
        if (!child) {
            return YAML::Node(YAML::NodeType::Undefined);
        }
        current.reset(child);
    }
    return current;
}

CoreConfig Configuration::getCoreConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);

    CoreConfig config;
    const YAML::Node section = lookup("core");
    if (!section) {
        return config;
    }
    if (!section.IsMap()) {
        BAYERFLOW_THROW(ConfigurationException, "'core' must be a mapping");
    }

    config.bufferCount = readScalar<uint32_t>(section, "buffer_count", config.bufferCount);
    config.maxLineWidth = readScalar<uint32_t>(section, "max_line_width", config.maxLineWidth);
    config.sampleBits = readScalar<uint32_t>(section, "sample_bits", config.sampleBits);

    if (section["cfa_pattern"]) {
        config.pattern = parseCfaPattern(readScalar<std::string>(section, "cfa_pattern", "RGGB"));
    }
    if (section["divide_by_three"]) {
        config.divideByThree =
            parseDivisionMode(readScalar<std::string>(section, "divide_by_three", "approximate"));
    }

    return config;
}

Configuration::LoggingConfig Configuration::getLoggingConfig() const {
    std::lock_guard<std::mutex> lock(mutex_);

    LoggingConfig config;
    const YAML::Node section = lookup("logging");
    if (!section) {
        return config;
    }

    if (section["level"]) {
        const std::string name = readScalar<std::string>(section, "level", "INFO");
        if (!Logger::levelFromString(name, config.level)) {
            BAYERFLOW_THROW(ConfigurationException, "Unknown log level: " + name);
        }
    }
    config.console = readScalar<bool>(section, "console", config.console);
    config.file = readScalar<std::string>(section, "file", config.file);
    return config;
}

CfaPattern Configuration::parseCfaPattern(const std::string& name) {
    const std::string upper = toUpper(name);
    if (upper == "RGGB") return CfaPattern::RGGB;
    if (upper == "GRBG") return CfaPattern::GRBG;
    if (upper == "GBRG") return CfaPattern::GBRG;
    if (upper == "BGGR") return CfaPattern::BGGR;
    BAYERFLOW_THROW(ConfigurationException, "Unknown CFA pattern: " + name);
}

DivisionMode Configuration::parseDivisionMode(const std::string& name) {
    const std::string upper = toUpper(name);
    if (upper == "APPROXIMATE") return DivisionMode::APPROXIMATE;
    if (upper == "EXACT") return DivisionMode::EXACT;
    BAYERFLOW_THROW(ConfigurationException, "Unknown divide_by_three mode: " + name);
}

} // namespace core
} // namespace bayerflow
