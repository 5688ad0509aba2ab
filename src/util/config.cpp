// Copyright (c) 2025 The Tally Core developers
// Distributed under the MIT software license

#include <util/config.h>
#include <util/logging.h>
#include <util/strencodings.h>
#include <fstream>
#include <sstream>
#include <cstdlib>

#include <unistd.h>
#include <pwd.h>
#include <sys/stat.h>

CConfigParser::CConfigParser() : m_loaded(false) {
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

    // Section headers are accepted but carry no meaning
    if (clean_line[0] == '[' && clean_line.back() == ']') {
        return false;
    }

    size_t eq_pos = clean_line.find('=');
    if (eq_pos == std::string::npos) {
        return false;
    }

    key = ToLower(Trim(clean_line.substr(0, eq_pos)));
    value = Trim(clean_line.substr(eq_pos + 1));

    if (value.length() >= 2 && value[0] == '"' && value.back() == '"') {
        value = value.substr(1, value.length() - 2);
    }

    return !key.empty();
}

std::optional<std::string> CConfigParser::GetEnv(const std::string& name) {
    const char* env_value = std::getenv(name.c_str());
    if (env_value == nullptr) {
        return std::nullopt;
    }
    return std::string(env_value);
}

std::string CConfigParser::EnvName(const std::string& key) {
    std::string env_key = "TALLY_" + key;
    for (char& c : env_key) {
        c = static_cast<char>(toupper(static_cast<unsigned char>(c)));
    }
    return env_key;
}

bool CConfigParser::LoadConfigFile(const std::string& file_path) {
    m_config_file_path = file_path;
    m_settings.clear();
    m_loaded = false;

    struct stat file_stat;
    if (stat(file_path.c_str(), &file_stat) == 0) {
        mode_t mode = file_stat.st_mode;
        if (mode & (S_IWGRP | S_IWOTH)) {
            LogPrintConfig(WARN, "Config file %s is writable by other users (mode %o)",
                           file_path.c_str(), mode & 0777);
        }
    }

    std::ifstream file(file_path);
    if (!file.is_open()) {
        // Missing file is fine, defaults apply
        LogPrintConfig(DEBUG, "Config file not found: %s (using defaults)", file_path.c_str());
        m_loaded = true;
        return true;
    }

    std::string line;
    size_t count = 0;
    while (std::getline(file, line)) {
        std::string key, value;
        if (ParseLine(line, key, value)) {
            m_settings[key].push_back(value);
            count++;
            LogPrintConfig(DEBUG, "Config: %s = %s", key.c_str(), value.c_str());
        }
    }

    if (file.bad()) {
        LogPrintConfig(ERROR, "Failed reading config file %s", file_path.c_str());
        return false;
    }

    m_loaded = true;
    if (count > 0) {
        LogPrintConfig(INFO, "Loaded configuration from %s (%zu settings)", file_path.c_str(), count);
    }
    return true;
}

void CConfigParser::Set(const std::string& key, const std::string& value) {
    m_settings[ToLower(key)] = std::vector<std::string>{value};
}

std::string CConfigParser::GetString(const std::string& key, const std::string& default_value) const {
    auto env_value = GetEnv(EnvName(key));
    if (env_value.has_value()) {
        LogPrintConfig(DEBUG, "Config: %s = %s (from environment)", key.c_str(), env_value->c_str());
        return *env_value;
    }

    auto it = m_settings.find(ToLower(key));
    if (it != m_settings.end() && !it->second.empty()) {
        return it->second.back();
    }

    return default_value;
}

int64_t CConfigParser::GetInt64(const std::string& key, int64_t default_value) const {
    std::string value = GetString(key, "");
    if (value.empty()) {
        return default_value;
    }

    try {
        size_t pos = 0;
        int64_t result = std::stoll(value, &pos);
        if (pos == value.size()) {
            return result;
        }
    } catch (const std::exception&) {
    }

    LogPrintConfig(WARN, "Config: Invalid integer value for %s: %s (using default: %lld)",
                   key.c_str(), value.c_str(), static_cast<long long>(default_value));
    return default_value;
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
    auto env_value = GetEnv(EnvName(key));
    if (env_value.has_value()) {
        return SplitString(*env_value, ',');
    }

    auto it = m_settings.find(ToLower(key));
    if (it == m_settings.end()) {
        return std::vector<std::string>();
    }
    return it->second;
}

std::string GetDefaultDataDir() {
    const char* home = std::getenv("HOME");
    if (home == nullptr) {
        struct passwd* pwd = getpwuid(getuid());
        if (pwd != nullptr) {
            home = pwd->pw_dir;
        }
    }

    if (home != nullptr) {
        return std::string(home) + "/.tally";
    }
    return ".tally";
}

std::string GetConfigFilePath(const std::string& datadir) {
    std::string dir = datadir.empty() ? GetDefaultDataDir() : datadir;
    return dir + "/tally.conf";
}

bool ApplyLoggingConfig(const CConfigParser& config) {
    CLoggingConfig& logging = CLoggingConfig::GetInstance();
    bool ok = true;

    std::string level_name = config.GetString("debuglevel", "");
    if (!level_name.empty()) {
        LogLevel level;
        if (ParseLogLevel(level_name, level)) {
            logging.SetLogLevel(level);
        } else {
            LogPrintConfig(WARN, "Config: unknown debuglevel '%s'", level_name.c_str());
            ok = false;
        }
    }

    std::vector<std::string> categories = config.GetList("debug");
    if (!categories.empty()) {
        uint32_t mask = 0;
        bool valid = true;
        for (const std::string& item : categories) {
            uint32_t item_mask = 0;
            if (!ParseLogCategories(item, item_mask)) {
                LogPrintConfig(WARN, "Config: unknown debug category in '%s'", item.c_str());
                valid = false;
                break;
            }
            mask |= item_mask;
        }
        if (valid) {
            logging.SetCategories(mask);
        } else {
            ok = false;
        }
    }

    std::string logfile = config.GetString("logfile", "");
    if (!logfile.empty()) {
        logging.SetLogFile(logfile);
    }

    logging.SetConsoleLogging(config.GetBool("printtoconsole", logging.IsConsoleLoggingEnabled()));

    int64_t max_size_mib = config.GetInt64("maxlogsize", 10);
    if (max_size_mib > 0) {
        logging.SetMaxLogSize(static_cast<size_t>(max_size_mib) * 1024 * 1024);
    }

    int64_t max_files = config.GetInt64("maxlogfiles", 10);
    if (max_files > 0) {
        logging.SetMaxLogFiles(static_cast<size_t>(max_files));
    }

    return ok;
}
