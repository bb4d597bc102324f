// STAKELEDGER - Configuration File Parser Implementation
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#include "stakeledger/util/config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <pwd.h>
#include <unistd.h>

namespace stakeledger {
namespace util {

std::string ConfigParseResult::ToString() const {
    std::ostringstream oss;
    if (!errorFile.empty()) {
        oss << errorFile;
        if (errorLine > 0) {
            oss << ":" << errorLine;
        }
        oss << ": ";
    }
    oss << errorMessage;
    return oss.str();
}

// ============================================================================
// Static Helpers
// ============================================================================

std::string ConfigManager::Trim(const std::string& str) {
    const char* whitespace = " \t\r\n";
    size_t start = str.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(whitespace);
    return str.substr(start, end - start + 1);
}

std::string ConfigManager::Unquote(const std::string& str) {
    if (str.length() < 2) {
        return str;
    }
    char first = str.front();
    if ((first != '"' && first != '\'') || str.back() != first) {
        return str;
    }
    
    std::string inner = str.substr(1, str.length() - 2);
    if (first == '\'') {
        return inner;
    }
    
    // Double quotes honour \" \\ \n \t
    std::string out;
    out.reserve(inner.length());
    for (size_t i = 0; i < inner.length(); ++i) {
        if (inner[i] == '\\' && i + 1 < inner.length()) {
            char next = inner[++i];
            switch (next) {
                case 'n': out += '\n'; break;
                case 't': out += '\t'; break;
                case '"': out += '"'; break;
                case '\\': out += '\\'; break;
                default: out += '\\'; out += next; break;
            }
        } else {
            out += inner[i];
        }
    }
    return out;
}

std::optional<bool> ConfigManager::ParseBool(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    
    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
        return false;
    }
    return std::nullopt;
}

bool ConfigManager::IsValidKey(const std::string& key) {
    if (key.empty()) {
        return false;
    }
    return std::all_of(key.begin(), key.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-' || c == '.';
    });
}

std::string ConfigManager::ExpandEnvVars(const std::string& value) {
    std::string result;
    result.reserve(value.length());
    
    size_t i = 0;
    while (i < value.length()) {
        if (value[i] == '$' && i + 1 < value.length()) {
            size_t nameStart;
            size_t nameEnd;
            size_t resume;
            if (value[i + 1] == '{') {
                nameStart = i + 2;
                nameEnd = value.find('}', nameStart);
                if (nameEnd == std::string::npos) {
                    result += value.substr(i);
                    break;
                }
                resume = nameEnd + 1;
            } else {
                nameStart = i + 1;
                nameEnd = nameStart;
                while (nameEnd < value.length() &&
                       (std::isalnum(static_cast<unsigned char>(value[nameEnd])) ||
                        value[nameEnd] == '_')) {
                    ++nameEnd;
                }
                resume = nameEnd;
            }
            
            if (nameEnd > nameStart) {
                std::string name = value.substr(nameStart, nameEnd - nameStart);
                if (const char* env = std::getenv(name.c_str())) {
                    result += env;
                }
                i = resume;
                continue;
            }
        }
        result += value[i++];
    }
    return result;
}

std::string ConfigManager::ExpandTilde(const std::string& path) {
    if (path.empty() || path[0] != '~' || (path.length() > 1 && path[1] != '/')) {
        return path;
    }
    
    std::string home;
    if (const char* env = std::getenv("HOME")) {
        home = env;
    } else if (struct passwd* pw = getpwuid(getuid())) {
        home = pw->pw_dir;
    }
    
    return home.empty() ? path : home + path.substr(1);
}

std::string ConfigManager::GetDefaultDataDir() {
    const char* home = std::getenv("HOME");
    if (!home) {
        return DEFAULT_DATADIR_NAME;
    }
    return std::string(home) + "/" + DEFAULT_DATADIR_NAME;
}

std::string ConfigManager::MakeKey(const std::string& key, const std::string& section) const {
    return section.empty() ? key : section + ":" + key;
}

// ============================================================================
// Parsing
// ============================================================================

void ConfigManager::Store(ConfigEntry entry) {
    std::string fullKey = MakeKey(entry.key, entry.section);
    auto it = entries_.find(fullKey);
    if (it != entries_.end() && it->second.source == COMMAND_LINE_SOURCE &&
        entry.source != COMMAND_LINE_SOURCE) {
        return;
    }
    entries_[fullKey] = std::move(entry);
}

bool ConfigManager::ParseLine(const std::string& line, const std::string& source,
                              int lineNum, std::string& currentSection,
                              ConfigParseResult& result) {
    std::string trimmed = Trim(line);
    
    if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';') {
        return true;
    }
    
    if (trimmed[0] == '[') {
        size_t end = trimmed.find(']');
        if (end == std::string::npos) {
            result = ConfigParseResult::Error(
                "Missing closing bracket in section header", source, lineNum);
            return false;
        }
        currentSection = Trim(trimmed.substr(1, end - 1));
        return true;
    }
    
    ConfigEntry entry;
    entry.section = currentSection;
    entry.source = source;
    entry.lineNumber = lineNum;
    
    size_t eqPos = trimmed.find('=');
    if (eqPos == std::string::npos) {
        // Bare flag, "noflag" negates
        entry.key = trimmed;
        entry.value = "true";
        if (entry.key.length() > 2 && entry.key.compare(0, 2, "no") == 0 &&
            std::islower(static_cast<unsigned char>(entry.key[2]))) {
            entry.key = entry.key.substr(2);
            entry.value = "false";
        }
    } else {
        entry.key = Trim(trimmed.substr(0, eqPos));
        entry.value = ExpandEnvVars(Unquote(Trim(trimmed.substr(eqPos + 1))));
    }
    
    if (entry.key.empty()) {
        result = ConfigParseResult::Error("Empty key", source, lineNum);
        return false;
    }
    if (!IsValidKey(entry.key)) {
        result = ConfigParseResult::Error("Invalid key: " + entry.key, source, lineNum);
        return false;
    }
    
    Store(std::move(entry));
    return true;
}

ConfigParseResult ConfigManager::ParseStream(std::istream& in, const std::string& sourceName) {
    std::string currentSection;
    std::string line;
    int lineNum = 0;
    ConfigParseResult result = ConfigParseResult::Success();
    
    while (std::getline(in, line)) {
        ++lineNum;
        if (line.length() > MAX_LINE_LENGTH) {
            return ConfigParseResult::Error(
                "Line too long (max " + std::to_string(MAX_LINE_LENGTH) + " characters)",
                sourceName, lineNum);
        }
        if (!ParseLine(line, sourceName, lineNum, currentSection, result)) {
            return result;
        }
    }
    return result;
}

ConfigParseResult ConfigManager::ParseFile(const std::string& filePath) {
    std::string path = ExpandEnvVars(ExpandTilde(filePath));
    
    std::ifstream file(path);
    if (!file.is_open()) {
        return ConfigParseResult::Error("Cannot open file: " + path);
    }
    
    file.seekg(0, std::ios::end);
    std::streamoff size = file.tellg();
    file.seekg(0, std::ios::beg);
    if (size > static_cast<std::streamoff>(MAX_CONFIG_SIZE)) {
        return ConfigParseResult::Error(
            "Config file too large (max " + std::to_string(MAX_CONFIG_SIZE) + " bytes)", path);
    }
    
    return ParseStream(file, path);
}

ConfigParseResult ConfigManager::ParseString(const std::string& content,
                                             const std::string& sourceName) {
    std::istringstream stream(content);
    return ParseStream(stream, sourceName);
}

ConfigParseResult ConfigManager::ParseCommandLine(int argc, const char* const argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        
        // A lone "-" or a negative number is positional
        if (arg.size() < 2 || arg[0] != '-' ||
            std::isdigit(static_cast<unsigned char>(arg[1]))) {
            positional_.push_back(arg);
            continue;
        }
        
        size_t start = arg.find_first_not_of('-');
        if (start == std::string::npos) {
            positional_.push_back(arg);
            continue;
        }
        arg = arg.substr(start);
        
        ConfigEntry entry;
        entry.source = COMMAND_LINE_SOURCE;
        
        size_t eqPos = arg.find('=');
        if (eqPos != std::string::npos) {
            entry.key = arg.substr(0, eqPos);
            entry.value = arg.substr(eqPos + 1);
        } else {
            entry.key = arg;
            entry.value = "true";
            if (arg.length() > 2 && arg.compare(0, 2, "no") == 0 &&
                std::islower(static_cast<unsigned char>(arg[2]))) {
                entry.key = arg.substr(2);
                entry.value = "false";
            }
        }
        
        if (!IsValidKey(entry.key)) {
            return ConfigParseResult::Error("Invalid option: " + std::string(argv[i]),
                                            COMMAND_LINE_SOURCE);
        }
        Store(std::move(entry));
    }
    return ConfigParseResult::Success();
}

ConfigParseResult ConfigManager::LoadConfigFile() {
    auto explicitConf = TryGetString(ConfigKeys::CONF);
    std::string path = explicitConf ? ExpandTilde(*explicitConf)
                                    : GetDataDir() + "/" + DEFAULT_CONFIG_FILENAME;
    
    // The default file is optional; an explicit one must exist
    if (!explicitConf) {
        std::ifstream probe(path);
        if (!probe.is_open()) {
            return ConfigParseResult::Success();
        }
    }
    return ParseFile(path);
}

// ============================================================================
// Value Retrieval
// ============================================================================

bool ConfigManager::HasKey(const std::string& key, const std::string& section) const {
    return entries_.find(MakeKey(key, section)) != entries_.end();
}

std::optional<std::string> ConfigManager::TryGetString(const std::string& key,
                                                       const std::string& section) const {
    auto it = entries_.find(MakeKey(key, section));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.value;
}

std::string ConfigManager::GetString(const std::string& key,
                                     const std::string& defaultValue,
                                     const std::string& section) const {
    return TryGetString(key, section).value_or(defaultValue);
}

std::optional<int64_t> ConfigManager::TryGetInt(const std::string& key,
                                                const std::string& section) const {
    auto str = TryGetString(key, section);
    if (!str || str->empty()) {
        return std::nullopt;
    }
    
    try {
        size_t pos = 0;
        long long value = std::stoll(*str, &pos, 10);
        if (pos != str->length()) {
            return std::nullopt;
        }
        return static_cast<int64_t>(value);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

int64_t ConfigManager::GetInt(const std::string& key, int64_t defaultValue,
                              const std::string& section) const {
    return TryGetInt(key, section).value_or(defaultValue);
}

std::optional<bool> ConfigManager::TryGetBool(const std::string& key,
                                              const std::string& section) const {
    auto str = TryGetString(key, section);
    if (!str) {
        return std::nullopt;
    }
    return ParseBool(*str);
}

bool ConfigManager::GetBool(const std::string& key, bool defaultValue,
                            const std::string& section) const {
    return TryGetBool(key, section).value_or(defaultValue);
}

std::string ConfigManager::GetPath(const std::string& key,
                                   const std::string& defaultValue,
                                   const std::string& section) const {
    return ExpandTilde(GetString(key, defaultValue, section));
}

std::optional<ConfigEntry> ConfigManager::GetEntry(const std::string& key,
                                                   const std::string& section) const {
    auto it = entries_.find(MakeKey(key, section));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

// ============================================================================
// Value Setting
// ============================================================================

void ConfigManager::Set(const std::string& key, const std::string& value,
                        const std::string& section) {
    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = section;
    entry.source = "<set>";
    entries_[MakeKey(key, section)] = std::move(entry);
}

void ConfigManager::SetDefault(const std::string& key, const std::string& value,
                               const std::string& section) {
    std::string fullKey = MakeKey(key, section);
    if (entries_.find(fullKey) != entries_.end()) {
        return;
    }
    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = section;
    entry.source = "<default>";
    entry.isDefault = true;
    entries_[fullKey] = std::move(entry);
}

// ============================================================================
// Utilities
// ============================================================================

void ConfigManager::Clear() {
    entries_.clear();
    positional_.clear();
}

std::string ConfigManager::GetDataDir() const {
    return GetPath(ConfigKeys::DATADIR, GetDefaultDataDir());
}

std::string ConfigManager::Dump() const {
    std::ostringstream oss;
    for (const auto& [fullKey, entry] : entries_) {
        if (!entry.section.empty()) {
            oss << "[" << entry.section << "] ";
        }
        oss << entry.key << "=" << entry.value << " (" << entry.source;
        if (entry.lineNumber > 0) {
            oss << ":" << entry.lineNumber;
        }
        oss << ")\n";
    }
    return oss.str();
}

} // namespace util
} // namespace stakeledger
