// ZKCOMPLY - Configuration File Parser Implementation
// Copyright (c) 2024 ZKCOMPLY Developers
// MIT License

#include "zkcomply/util/config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <pwd.h>
#include <unistd.h>

namespace zkcomply {
namespace util {

namespace {

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool IsValidKey(const std::string& key, char& bad) {
    for (char c : key) {
        if (!std::isalnum(static_cast<unsigned char>(c)) &&
            c != '_' && c != '-' && c != '.') {
            bad = c;
            return false;
        }
    }
    return true;
}

} // namespace

// ============================================================================
// ConfigManager Implementation
// ============================================================================

ConfigManager::ConfigManager() = default;

ConfigManager::~ConfigManager() = default;

// ============================================================================
// Static Helper Functions
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
    char last = str.back();
    
    if ((first == '"' && last == '"') || (first == '\'' && last == '\'')) {
        std::string result = str.substr(1, str.length() - 2);
        
        // Escape sequences only in double-quoted strings
        if (first == '"') {
            std::string unescaped;
            unescaped.reserve(result.length());
            
            for (size_t i = 0; i < result.length(); ++i) {
                if (result[i] == '\\' && i + 1 < result.length()) {
                    char next = result[i + 1];
                    switch (next) {
                        case 'n': unescaped += '\n'; ++i; break;
                        case 't': unescaped += '\t'; ++i; break;
                        case '\\': unescaped += '\\'; ++i; break;
                        case '"': unescaped += '"'; ++i; break;
                        default: unescaped += result[i]; break;
                    }
                } else {
                    unescaped += result[i];
                }
            }
            return unescaped;
        }
        
        return result;
    }
    
    return str;
}

std::optional<bool> ConfigManager::ParseBool(const std::string& str) {
    std::string lower = ToLower(Trim(str));
    
    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
        return false;
    }
    
    return std::nullopt;
}

std::string ConfigManager::ExpandEnvVars(const std::string& value) {
    std::string result;
    result.reserve(value.length());
    
    size_t i = 0;
    while (i < value.length()) {
        if (value[i] == '$' && i + 1 < value.length()) {
            if (value[i + 1] == '{') {
                size_t end = value.find('}', i + 2);
                if (end != std::string::npos) {
                    std::string varName = value.substr(i + 2, end - i - 2);
                    const char* envValue = std::getenv(varName.c_str());
                    if (envValue) {
                        result += envValue;
                    }
                    i = end + 1;
                    continue;
                }
            } else {
                size_t start = i + 1;
                size_t end = start;
                while (end < value.length() &&
                       (std::isalnum(static_cast<unsigned char>(value[end])) ||
                        value[end] == '_')) {
                    ++end;
                }
                if (end > start) {
                    std::string varName = value.substr(start, end - start);
                    const char* envValue = std::getenv(varName.c_str());
                    if (envValue) {
                        result += envValue;
                    }
                    i = end;
                    continue;
                }
            }
        }
        
        result += value[i];
        ++i;
    }
    
    return result;
}

std::string ConfigManager::ExpandTilde(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    if (path.length() > 1 && path[1] != '/') {
        return path;
    }
    
    std::string home;
    const char* homeEnv = std::getenv("HOME");
    if (homeEnv) {
        home = homeEnv;
    } else {
        struct passwd* pw = getpwuid(getuid());
        if (pw) {
            home = pw->pw_dir;
        }
    }
    
    if (home.empty()) {
        return path;
    }
    return home + path.substr(1);
}

// ============================================================================
// Internal Key Management
// ============================================================================

std::string ConfigManager::MakeKey(const std::string& key, const std::string& section) const {
    if (section.empty()) {
        return key;
    }
    return section + ":" + key;
}

// ============================================================================
// Parsing
// ============================================================================

bool ConfigManager::ParseLine(const std::string& line, const std::string& source, 
                               int lineNum, std::string& currentSection, 
                               ConfigParseResult& result) {
    std::string trimmed = Trim(line);
    
    if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';') {
        return true;
    }
    
    // Section header [section]
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
    
    size_t eqPos = trimmed.find('=');
    std::string key;
    std::string value;
    if (eqPos == std::string::npos) {
        // Bare flag
        key = trimmed;
        value = "true";
    } else {
        key = Trim(trimmed.substr(0, eqPos));
        value = ExpandEnvVars(Unquote(Trim(trimmed.substr(eqPos + 1))));
    }
    
    if (key.empty()) {
        result = ConfigParseResult::Error("Empty key", source, lineNum);
        return false;
    }
    char bad = 0;
    if (!IsValidKey(key, bad)) {
        result = ConfigParseResult::Error(
            "Invalid character in key: " + std::string(1, bad), source, lineNum);
        return false;
    }
    
    std::string fullKey = MakeKey(key, currentSection);
    
    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = currentSection;
    entry.source = source;
    entry.lineNumber = lineNum;
    entry.isDefault = false;
    
    entries_[fullKey] = entry;
    lists_[fullKey].push_back(value);
    return true;
}

ConfigParseResult ConfigManager::ParseStream(std::istream& stream,
                                             const std::string& source) {
    std::string currentSection;
    std::string line;
    std::string continuationLine;
    int lineNum = 0;
    
    ConfigParseResult result = ConfigParseResult::Success();
    
    while (std::getline(stream, line)) {
        ++lineNum;
        
        if (line.length() > MAX_LINE_LENGTH) {
            return ConfigParseResult::Error(
                "Line too long (max " + std::to_string(MAX_LINE_LENGTH) + " characters)",
                source, lineNum);
        }
        
        if (!line.empty() && line.back() == '\\') {
            continuationLine += line.substr(0, line.length() - 1);
            continue;
        }
        
        if (!continuationLine.empty()) {
            line = continuationLine + line;
            continuationLine.clear();
        }
        
        if (!ParseLine(line, source, lineNum, currentSection, result)) {
            return result;
        }
    }
    
    if (!continuationLine.empty()) {
        if (!ParseLine(continuationLine, source, lineNum, currentSection, result)) {
            return result;
        }
    }
    
    return ConfigParseResult::Success();
}

ConfigParseResult ConfigManager::ParseFile(const std::string& filePath) {
    std::string expandedPath = ExpandEnvVars(ExpandTilde(filePath));
    
    std::ifstream file(expandedPath);
    if (!file.is_open()) {
        return ConfigParseResult::Error("Cannot open file: " + expandedPath);
    }
    
    file.seekg(0, std::ios::end);
    auto fileSize = file.tellg();
    file.seekg(0, std::ios::beg);
    
    if (fileSize > static_cast<std::streampos>(MAX_CONFIG_SIZE)) {
        return ConfigParseResult::Error(
            "Config file too large (max " + std::to_string(MAX_CONFIG_SIZE) + " bytes)",
            expandedPath);
    }
    
    return ParseStream(file, expandedPath);
}

ConfigParseResult ConfigManager::ParseString(const std::string& content,
                                              const std::string& sourceName) {
    std::istringstream stream(content);
    return ParseStream(stream, sourceName);
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
    if (it != entries_.end()) {
        return it->second.value;
    }
    return std::nullopt;
}

std::string ConfigManager::GetString(const std::string& key,
                                      const std::string& defaultValue,
                                      const std::string& section) const {
    return TryGetString(key, section).value_or(defaultValue);
}

std::optional<int64_t> ConfigManager::TryGetInt(const std::string& key,
                                                 const std::string& section) const {
    auto str = TryGetString(key, section);
    if (!str) {
        return std::nullopt;
    }
    
    std::string value = Trim(*str);
    if (value.empty()) {
        return std::nullopt;
    }
    
    try {
        size_t pos = 0;
        int64_t parsed = std::stoll(value, &pos);
        if (pos != value.size()) {
            return std::nullopt;
        }
        return parsed;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

int64_t ConfigManager::GetInt(const std::string& key,
                               int64_t defaultValue,
                               const std::string& section) const {
    return TryGetInt(key, section).value_or(defaultValue);
}

std::optional<uint64_t> ConfigManager::TryGetUInt(const std::string& key,
                                                   const std::string& section) const {
    auto intValue = TryGetInt(key, section);
    if (!intValue || *intValue < 0) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(*intValue);
}

uint64_t ConfigManager::GetUInt(const std::string& key,
                                 uint64_t defaultValue,
                                 const std::string& section) const {
    return TryGetUInt(key, section).value_or(defaultValue);
}

std::optional<bool> ConfigManager::TryGetBool(const std::string& key,
                                               const std::string& section) const {
    auto str = TryGetString(key, section);
    if (!str) {
        return std::nullopt;
    }
    return ParseBool(*str);
}

bool ConfigManager::GetBool(const std::string& key,
                             bool defaultValue,
                             const std::string& section) const {
    return TryGetBool(key, section).value_or(defaultValue);
}

std::vector<std::string> ConfigManager::GetList(const std::string& key,
                                                 const std::string& section) const {
    std::string fullKey = MakeKey(key, section);
    std::vector<std::string> raw;
    
    auto listIt = lists_.find(fullKey);
    if (listIt != lists_.end()) {
        raw = listIt->second;
    } else {
        auto entryIt = entries_.find(fullKey);
        if (entryIt != entries_.end()) {
            raw.push_back(entryIt->second.value);
        }
    }
    
    std::vector<std::string> result;
    for (const auto& value : raw) {
        std::istringstream ss(value);
        std::string item;
        while (std::getline(ss, item, ',')) {
            item = Trim(item);
            if (!item.empty()) {
                result.push_back(item);
            }
        }
    }
    return result;
}

std::string ConfigManager::GetPath(const std::string& key,
                                    const std::string& defaultValue,
                                    const std::string& section) const {
    return ExpandEnvVars(ExpandTilde(GetString(key, defaultValue, section)));
}

// ============================================================================
// Value Setting
// ============================================================================

void ConfigManager::Set(const std::string& key, const std::string& value,
                         const std::string& section) {
    std::string fullKey = MakeKey(key, section);
    
    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.section = section;
    entry.source = "<programmatic>";
    entry.isDefault = false;
    
    entries_[fullKey] = entry;
    lists_.erase(fullKey);
}

void ConfigManager::SetDefault(const std::string& key, const std::string& value,
                                const std::string& section) {
    std::string fullKey = MakeKey(key, section);
    
    if (entries_.find(fullKey) == entries_.end()) {
        ConfigEntry entry;
        entry.key = key;
        entry.value = value;
        entry.section = section;
        entry.source = "<default>";
        entry.isDefault = true;
        
        entries_[fullKey] = entry;
    }
}

// ============================================================================
// Validation
// ============================================================================

void ConfigManager::RequireKey(const std::string& key, const std::string& section) {
    requiredKeys_.insert(MakeKey(key, section));
}

void ConfigManager::AllowKey(const std::string& key, const std::string& section) {
    allowedKeys_.insert(MakeKey(key, section));
}

std::vector<std::string> ConfigManager::Validate() const {
    std::vector<std::string> errors;
    
    for (const auto& requiredKey : requiredKeys_) {
        if (entries_.find(requiredKey) == entries_.end()) {
            errors.push_back("Required key missing: " + requiredKey);
        }
    }
    
    if (!allowedKeys_.empty()) {
        for (const auto& [fullKey, entry] : entries_) {
            if (allowedKeys_.find(fullKey) == allowedKeys_.end() &&
                requiredKeys_.find(fullKey) == requiredKeys_.end()) {
                errors.push_back("Unknown key: " + fullKey + 
                                 " (defined in " + entry.source + ")");
            }
        }
    }
    
    return errors;
}

// ============================================================================
// Utilities
// ============================================================================

void ConfigManager::Clear() {
    entries_.clear();
    lists_.clear();
    requiredKeys_.clear();
    allowedKeys_.clear();
}

size_t ConfigManager::Size() const {
    return entries_.size();
}

} // namespace util
} // namespace zkcomply
