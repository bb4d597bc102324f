// STAKELEDGER - Configuration File Parser
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License
//
// INI-style configuration for the stakeledger tools.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs, values may be quoted
// - Section headers: [section]
// - A bare key is a boolean flag; "nokey" negates it
// - Boolean values: true/false, yes/no, on/off, 1/0

#ifndef STAKELEDGER_UTIL_CONFIG_H
#define STAKELEDGER_UTIL_CONFIG_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace stakeledger {
namespace util {

// ============================================================================
// Configuration Constants
// ============================================================================

/// Data directory name under $HOME
constexpr const char* DEFAULT_DATADIR_NAME = ".stakeledger";

/// Config file name inside the data directory
constexpr const char* DEFAULT_CONFIG_FILENAME = "stakeledger.conf";

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

/// Maximum line length
constexpr size_t MAX_LINE_LENGTH = 4096;

// ============================================================================
// Configuration Entry
// ============================================================================

struct ConfigEntry {
    std::string key;
    std::string value;
    std::string section;   // Empty for global section
    std::string source;    // File path or "<command-line>"
    int lineNumber{0};
    bool isDefault{false};
};

/// Source name used for command-line entries
constexpr const char* COMMAND_LINE_SOURCE = "<command-line>";

// ============================================================================
// Configuration Parse Result
// ============================================================================

struct ConfigParseResult {
    bool success{false};
    std::string errorMessage;
    std::string errorFile;
    int errorLine{0};
    
    static ConfigParseResult Success() {
        return {true, "", "", 0};
    }
    
    static ConfigParseResult Error(const std::string& msg,
                                   const std::string& file = "",
                                   int line = 0) {
        return {false, msg, file, line};
    }
    
    /// "file:line: message" (file and line omitted when unknown)
    std::string ToString() const;
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Holds configuration from files and command-line arguments.
 *
 * Priority (highest first): command-line options, the config file,
 * defaults registered with SetDefault.
 */
class ConfigManager {
public:
    ConfigManager() = default;
    
    // ========================================================================
    // Parsing
    // ========================================================================
    
    /// Parse a configuration file. Command-line values are never replaced.
    ConfigParseResult ParseFile(const std::string& filePath);
    
    /// Parse configuration from a string
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");
    
    /**
     * Parse command-line arguments.
     *
     * Options take the form --key=value (or -key=value); a bare --flag is
     * "true" and --noflag is "false". Every other argument is positional
     * and kept in order.
     */
    ConfigParseResult ParseCommandLine(int argc, const char* const argv[]);
    
    /// Load <datadir>/stakeledger.conf (or the file named by -conf) if present
    ConfigParseResult LoadConfigFile();
    
    /// Positional arguments in command-line order
    const std::vector<std::string>& GetPositionalArgs() const { return positional_; }
    
    // ========================================================================
    // Value Retrieval
    // ========================================================================
    
    bool HasKey(const std::string& key, const std::string& section = "") const;
    
    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;
    std::string GetString(const std::string& key,
                          const std::string& defaultValue,
                          const std::string& section = "") const;
    
    /// Integer value; nullopt if missing or not a whole decimal number
    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;
    int64_t GetInt(const std::string& key, int64_t defaultValue,
                   const std::string& section = "") const;
    
    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;
    bool GetBool(const std::string& key, bool defaultValue,
                 const std::string& section = "") const;
    
    /// Path value with ~ expansion
    std::string GetPath(const std::string& key,
                        const std::string& defaultValue = "",
                        const std::string& section = "") const;
    
    /// Full entry for diagnostics
    std::optional<ConfigEntry> GetEntry(const std::string& key,
                                        const std::string& section = "") const;
    
    // ========================================================================
    // Value Setting
    // ========================================================================
    
    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");
    
    /// Set a value only used when nothing else defines the key
    void SetDefault(const std::string& key, const std::string& value,
                    const std::string& section = "");
    
    // ========================================================================
    // Utilities
    // ========================================================================
    
    void Clear();
    size_t Size() const { return entries_.size(); }
    
    /// Data directory: -datadir if given, else the platform default
    std::string GetDataDir() const;
    
    static std::string GetDefaultDataDir();
    
    /// Expand a leading ~ to $HOME
    static std::string ExpandTilde(const std::string& path);
    
    /// Expand ${VAR} and $VAR references (undefined variables expand to "")
    static std::string ExpandEnvVars(const std::string& value);
    
    /// Dump all entries as "[section] key=value (source)" lines
    std::string Dump() const;

private:
    std::string MakeKey(const std::string& key, const std::string& section) const;
    
    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);
    
    ConfigParseResult ParseStream(std::istream& in, const std::string& sourceName);
    
    /// Store entry unless a command-line value already holds the key
    void Store(ConfigEntry entry);
    
    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static std::optional<bool> ParseBool(const std::string& str);
    static bool IsValidKey(const std::string& key);
    
    std::map<std::string, ConfigEntry> entries_;
    std::vector<std::string> positional_;
};

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    constexpr const char* DATADIR = "datadir";
    constexpr const char* CONF = "conf";
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* PRINTTOCONSOLE = "printtoconsole";
    constexpr const char* LOGFILE = "logfile";
    constexpr const char* CONTRACT = "contract";
    constexpr const char* MOCKTIME = "mocktime";
}

} // namespace util
} // namespace stakeledger

#endif // STAKELEDGER_UTIL_CONFIG_H
