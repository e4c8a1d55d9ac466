#pragma once

#include "bayerflow/core/Logger.hpp"
#include "bayerflow/core/types.hpp"

#include <yaml-cpp/yaml.h>

#include <mutex>
#include <string>

namespace bayerflow {
namespace core {

/**
 * Configuration management class
 *
 * Holds one YAML document (file or inline string) and converts its sections
 * into typed configuration structs. Missing keys fall back to defaults;
 * malformed values raise ConfigurationException.
 */
class Configuration {
public:
    /**
     * Logging section
     */
    struct LoggingConfig {
        LogLevel level = LogLevel::INFO;
        bool console = true;
        std::string file;
    };

    /**
     * Get singleton instance
     */
    static Configuration& getInstance();

    /**
     * Load configuration from a YAML file. Returns false if the file cannot be
     * read or parsed; the previous document is kept in that case.
     */
    bool load(const std::string& filename);

    /**
     * Load configuration from an in-memory YAML document
     */
    bool loadFromString(const std::string& yaml);

    /**
     * Reload the last file passed to load()
     */
    bool reload();

    /**
     * Drop the current document (everything reverts to defaults)
     */
    void clear();

    /**
     * Check if a dotted key ("core.sample_bits") exists
     */
    bool has(const std::string& key) const;

    /**
     * Scalar access by dotted key
     */
    template<typename T>
    T get(const std::string& key, const T& defaultValue) const {
        std::lock_guard<std::mutex> lock(mutex_);
        YAML::Node node = lookup(key);
        if (!node || !node.IsScalar()) {
            return defaultValue;
        }
        try {
            return node.as<T>();
        } catch (const YAML::Exception&) {
            return defaultValue;
        }
    }

    /**
     * Typed "core" section
     */
    CoreConfig getCoreConfig() const;

    /**
     * Typed "logging" section
     */
    LoggingConfig getLoggingConfig() const;

    std::string getFilename() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return currentFile_;
    }

    static CfaPattern parseCfaPattern(const std::string& name);
    static DivisionMode parseDivisionMode(const std::string& name);

private:
    Configuration() = default;
    ~Configuration() = default;

    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    YAML::Node lookup(const std::string& key) const;

    mutable std::mutex mutex_;
    YAML::Node root_;
    std::string currentFile_;
};

} // namespace core
} // namespace bayerflow
