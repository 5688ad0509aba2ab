// Copyright (c) 2025 The Tally Core developers
// Distributed under the MIT software license

#ifndef TALLY_UTIL_CONFIG_H
#define TALLY_UTIL_CONFIG_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

/**
 * tally.conf reader
 *
 * One key=value per line. Text after # or ; is a comment, [section] lines
 * are accepted and ignored, keys are case insensitive and a value wrapped
 * in double quotes is unquoted. A key may repeat: GetList returns every
 * value in file order, the scalar getters use the last one.
 *
 * TALLY_<KEY> in the environment overrides the file (for GetList the
 * variable is split on commas).
 *
 * Keys read by the wallet core: datadir, walletdb, dbcache, debuglevel,
 * debug, logfile, printtoconsole, maxlogsize, maxlogfiles.
 */
class CConfigParser {
public:
    CConfigParser();

    /**
     * Replace the current settings with the contents of file_path.
     * A missing file leaves the parser empty and counts as success.
     * @return false if the file exists but could not be read
     */
    bool LoadConfigFile(const std::string& file_path);

    /** Override one key, dropping any values read from the file */
    void Set(const std::string& key, const std::string& value);

    std::string GetString(const std::string& key, const std::string& default_value = "") const;

    /** Whole-string decimal parse; anything else logs a warning and returns default_value */
    int64_t GetInt64(const std::string& key, int64_t default_value = 0) const;

    /** 1/0, true/false, yes/no, on/off */
    bool GetBool(const std::string& key, bool default_value = false) const;

    std::vector<std::string> GetList(const std::string& key) const;

    bool IsLoaded() const { return m_loaded; }
    std::string GetConfigFilePath() const { return m_config_file_path; }

private:
    static std::string Trim(const std::string& str);
    static bool ParseLine(const std::string& line, std::string& key, std::string& value);
    static std::optional<std::string> GetEnv(const std::string& name);
    static std::string EnvName(const std::string& key);

    std::map<std::string, std::vector<std::string>> m_settings;
    std::string m_config_file_path;
    bool m_loaded;
};

/** $HOME/.tally, or the passwd home directory when HOME is unset */
std::string GetDefaultDataDir();

/** <datadir>/tally.conf, using GetDefaultDataDir() when datadir is empty */
std::string GetConfigFilePath(const std::string& datadir = "");

/**
 * Push the logging keys into CLoggingConfig:
 *   debuglevel=error|warn|info|debug
 *   debug=<category list>, may repeat
 *   logfile=<path>, printtoconsole=<bool>
 *   maxlogsize=<MiB>, maxlogfiles=<n>
 * @return false if a value was invalid; that option is left unchanged
 */
bool ApplyLoggingConfig(const CConfigParser& config);

#endif // TALLY_UTIL_CONFIG_H
