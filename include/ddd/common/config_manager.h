/**
 * @file config_manager.h
 * @brief Centralized Configuration Management
 *
 * Provides unified access to environment variables and explicit overrides.
 * Features:
 * - Environment variable access with defaults
 * - Type-safe configuration retrieval
 * - Thread-safe singleton pattern
 */

#pragma once

#include <string>
#include <map>
#include <mutex>
#include <memory>

namespace ddd::common {

/**
 * @brief Configuration Manager (Singleton)
 *
 * Lookup order: value set through set(), then environment variable,
 * then the caller's default.
 */
class ConfigManager {
private:
    std::map<std::string, std::string> config_;
    mutable std::mutex mutex_;

    static std::unique_ptr<ConfigManager> instance_;
    static std::once_flag initFlag_;

    ConfigManager();

public:
    /**
     * @brief Get singleton instance
     */
    static ConfigManager& getInstance();

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    ConfigManager(ConfigManager&&) = delete;
    ConfigManager& operator=(ConfigManager&&) = delete;

    /**
     * @brief Get string configuration value
     * @param key Configuration key
     * @param defaultValue Default value if key not found
     * @return Configuration value
     */
    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    /**
     * @brief Get boolean configuration value
     *
     * Accepts true/false, 1/0, yes/no, on/off (case-insensitive).
     */
    bool getBool(const std::string& key, bool defaultValue = false) const;

    /**
     * @brief Set configuration value
     */
    void set(const std::string& key, const std::string& value);

    /**
     * @brief Load known keys from environment
     */
    void loadFromEnvironment();

    /// @name Predefined Configuration Keys

    // Logging
    static constexpr const char* LOG_LEVEL = "DDD_LOG_LEVEL";
    static constexpr const char* LOG_TO_FILE = "DDD_LOG_TO_FILE";
    static constexpr const char* LOG_FILE = "DDD_LOG_FILE";
};

} // namespace ddd::common
