// Copyright (c) 2026 The ArtDNA Core developers
// Distributed under the MIT software license

#include <util/config.h>
#include <util/logging.h>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace {

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string EnvKey(const std::string& key) {
    std::string env_key = "ARTDNA_" + key;
    std::transform(env_key.begin(), env_key.end(), env_key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return env_key;
}

} // namespace

CConfigParser::CConfigParser() : m_loaded(false) {
}

CConfigParser::~CConfigParser() {
}

std::string CConfigParser::Trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, (last - first + 1));
}

bool CConfigParser::ParseLine(const std::string& line, std::string& key, std::string& value) {
    std::string clean_line = line;
    size_t comment_pos = clean_line.find_first_of("#;");
    if (comment_pos != std::string::npos) {
        clean_line = clean_line.substr(0, comment_pos);
    }

    clean_line = Trim(clean_line);
    if (clean_line.empty()) {
        return false;
    }

    if (clean_line[0] == '[' && clean_line.back() == ']') {
        return false;
    }

    size_t eq_pos = clean_line.find('=');
    if (eq_pos == std::string::npos) {
        return false;
    }

    key = Trim(clean_line.substr(0, eq_pos));
    value = Trim(clean_line.substr(eq_pos + 1));

    if (value.length() >= 2 && value[0] == '"' && value.back() == '"') {
        value = value.substr(1, value.length() - 2);
    }

    return !key.empty();
}

std::optional<std::string> CConfigParser::GetEnv(const std::string& name) {
#ifdef _WIN32
    size_t size = 0;
    getenv_s(&size, nullptr, 0, name.c_str());
    if (size == 0) {
        return std::nullopt;
    }
    std::string value(size, '\0');
    getenv_s(&size, value.data(), size, name.c_str());
    if (size > 0) {
        value.resize(size - 1);
        return value;
    }
    return std::nullopt;
#else
    const char* env_value = std::getenv(name.c_str());
    if (env_value == nullptr) {
        return std::nullopt;
    }
    return std::string(env_value);
#endif
}

bool CConfigParser::LoadConfigFile(const std::string& file_path) {
    m_config_file_path = file_path;
    m_settings.clear();
    m_loaded = false;

    std::ifstream file(file_path);
    if (!file.is_open()) {
        // Missing file is fine, defaults apply
        LogPrintConfig(DEBUG, "Config file not found: %s (using defaults)", file_path.c_str());
        m_loaded = true;
        return true;
    }

    std::string line;
    while (std::getline(file, line)) {
        std::string key, value;
        if (ParseLine(line, key, value)) {
            key = ToLower(key);
            m_settings[key] = value;
            LogPrintConfig(DEBUG, "Config: %s = %s", key.c_str(), value.c_str());
        }
    }

    if (file.bad()) {
        LogPrintConfig(ERROR, "Failed reading config file %s", file_path.c_str());
        return false;
    }

    m_loaded = true;
    if (!m_settings.empty()) {
        LogPrintConfig(INFO, "Loaded configuration from %s (%zu settings)",
                       file_path.c_str(), m_settings.size());
    }
    return true;
}

void CConfigParser::SetValue(const std::string& key, const std::string& value) {
    m_settings[ToLower(key)] = value;
}

std::string CConfigParser::GetString(const std::string& key, const std::string& default_value) const {
    // Priority 1: Environment variable (ARTDNA_*)
    auto env_value = GetEnv(EnvKey(key));
    if (env_value.has_value()) {
        LogPrintConfig(DEBUG, "Config: %s = %s (from environment)",
                       key.c_str(), env_value->c_str());
        return *env_value;
    }

    // Priority 2: Config file
    auto it = m_settings.find(ToLower(key));
    if (it != m_settings.end()) {
        return it->second;
    }

    return default_value;
}

bool CConfigParser::HasKey(const std::string& key) const {
    return GetEnv(EnvKey(key)).has_value() || m_settings.count(ToLower(key)) > 0;
}

int64_t CConfigParser::GetInt64(const std::string& key, int64_t default_value) const {
    std::string value = GetString(key, "");
    if (value.empty()) {
        return default_value;
    }

    try {
        size_t consumed = 0;
        int64_t parsed = std::stoll(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return parsed;
    } catch (const std::exception&) {
        LogPrintConfig(WARN, "Config: Invalid integer value for %s: %s (using default: %lld)",
                       key.c_str(), value.c_str(), static_cast<long long>(default_value));
        return default_value;
    }
}

double CConfigParser::GetDouble(const std::string& key, double default_value) const {
    std::string value = GetString(key, "");
    if (value.empty()) {
        return default_value;
    }

    try {
        size_t consumed = 0;
        double parsed = std::stod(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return parsed;
    } catch (const std::exception&) {
        LogPrintConfig(WARN, "Config: Invalid numeric value for %s: %s (using default: %g)",
                       key.c_str(), value.c_str(), default_value);
        return default_value;
    }
}

bool CConfigParser::GetBool(const std::string& key, bool default_value) const {
    std::string value = ToLower(GetString(key, ""));
    if (value.empty()) {
        return default_value;
    }

    if (value == "1" || value == "true" || value == "yes" || value == "on") {
        return true;
    }

    if (value == "0" || value == "false" || value == "no" || value == "off") {
        return false;
    }

    LogPrintConfig(WARN, "Config: Invalid boolean value for %s: %s (using default: %s)",
                   key.c_str(), value.c_str(), default_value ? "true" : "false");
    return default_value;
}

std::vector<std::string> CConfigParser::GetList(const std::string& key) const {
    std::vector<std::string> result;

    std::stringstream ss(GetString(key, ""));
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = Trim(item);
        if (!item.empty()) {
            result.push_back(item);
        }
    }

    return result;
}
