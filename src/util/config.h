// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

/**
 * Configuration file and environment variable support.
 * Reads artdna.conf and allows ARTDNA_* environment overrides.
 */

#ifndef ARTDNA_UTIL_CONFIG_H
#define ARTDNA_UTIL_CONFIG_H

#include <cstdint>
#include <string>
#include <map>
#include <vector>
#include <optional>

/**
 * Configuration file parser
 *
 * Supports:
 * - Key=value pairs
 * - Comments (# and ;)
 * - Section headers [section] (ignored, keys are flat)
 * - Environment variable overrides (ARTDNA_*)
 */
class CConfigParser {
private:
    std::map<std::string, std::string> m_settings;
    std::string m_config_file_path;
    bool m_loaded;

    static std::string Trim(const std::string& str);

    bool ParseLine(const std::string& line, std::string& key, std::string& value);

    static std::optional<std::string> GetEnv(const std::string& name);

public:
    CConfigParser();
    ~CConfigParser();

    /**
     * Load configuration from file
     * @param file_path Path to artdna.conf
     * @return true if loaded successfully (or file doesn't exist), false on read error
     */
    bool LoadConfigFile(const std::string& file_path);

    /**
     * Set a value directly, as if it had been read from the file.
     * Environment overrides still take precedence.
     */
    void SetValue(const std::string& key, const std::string& value);

    /**
     * Get string value
     * Priority: Environment variable > Config file > Default
     * @param key Configuration key (e.g., "hot_path_budget_ms")
     * @param default_value Default value if not found
     * @return Configuration value or default
     */
    std::string GetString(const std::string& key, const std::string& default_value = "") const;

    /**
     * Get integer value
     * @param key Configuration key
     * @param default_value Default value if not found or unparsable
     * @return Configuration value or default
     */
    int64_t GetInt64(const std::string& key, int64_t default_value = 0) const;

    /**
     * Get floating point value
     * @param key Configuration key
     * @param default_value Default value if not found or unparsable
     */
    double GetDouble(const std::string& key, double default_value = 0.0) const;

    /**
     * Get boolean value
     * Supports: 1, 0, true, false, yes, no, on, off
     */
    bool GetBool(const std::string& key, bool default_value = false) const;

    /**
     * Get a comma-separated list (e.g. log categories)
     * @param key Configuration key
     * @return Trimmed, non-empty items
     */
    std::vector<std::string> GetList(const std::string& key) const;

    /** True if the key is set in the file or the environment */
    bool HasKey(const std::string& key) const;

    bool IsLoaded() const { return m_loaded; }

    std::string GetConfigFilePath() const { return m_config_file_path; }

    std::map<std::string, std::string> GetAllSettings() const { return m_settings; }
};

#endif // ARTDNA_UTIL_CONFIG_H
