// ZKCOMPLY - Configuration File Parser
// Copyright (c) 2024 ZKCOMPLY Developers
// MIT License
//
// Parses INI-style configuration files.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs
// - Section headers: [section]
// - Values can be quoted: key="value with spaces"
// - Backslash continuation for multi-line values
// - Boolean values: true/false, yes/no, 1/0
// - Environment variable expansion: ${VAR_NAME}

#ifndef ZKCOMPLY_UTIL_CONFIG_H
#define ZKCOMPLY_UTIL_CONFIG_H

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace zkcomply {
namespace util {

// ============================================================================
// Configuration Constants
// ============================================================================

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

/// Maximum line length
constexpr size_t MAX_LINE_LENGTH = 4096;

// ============================================================================
// Configuration Entry
// ============================================================================

/**
 * A single configuration entry.
 */
struct ConfigEntry {
    std::string key;
    std::string value;
    std::string section;   // Empty for global section
    std::string source;    // File path where this was defined
    int lineNumber{0};
    bool isDefault{false};
};

// ============================================================================
// Configuration Parse Result
// ============================================================================

/**
 * Result of parsing a configuration file.
 */
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
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Holds key/value settings loaded from files, strings or code.
 *
 * Keys inside a section are addressed as (key, section). Later values for
 * the same key replace earlier ones, except defaults which never replace
 * an explicit value.
 */
class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();
    
    // ========================================================================
    // Parsing
    // ========================================================================
    
    /// Parse a configuration file
    ConfigParseResult ParseFile(const std::string& filePath);
    
    /// Parse configuration from a string
    ConfigParseResult ParseString(const std::string& content, 
                                  const std::string& sourceName = "<string>");
    
    // ========================================================================
    // Value Retrieval
    // ========================================================================
    
    bool HasKey(const std::string& key, const std::string& section = "") const;
    
    std::optional<std::string> TryGetString(const std::string& key, 
                                             const std::string& section = "") const;
    
    std::string GetString(const std::string& key, 
                         const std::string& defaultValue,
                         const std::string& section = "") const;
    
    /// Integer value; nullopt when missing or not a number
    std::optional<int64_t> TryGetInt(const std::string& key, 
                                      const std::string& section = "") const;
    
    int64_t GetInt(const std::string& key, 
                   int64_t defaultValue,
                   const std::string& section = "") const;
    
    std::optional<uint64_t> TryGetUInt(const std::string& key, 
                                        const std::string& section = "") const;
    
    uint64_t GetUInt(const std::string& key, 
                     uint64_t defaultValue,
                     const std::string& section = "") const;
    
    std::optional<bool> TryGetBool(const std::string& key, 
                                    const std::string& section = "") const;
    
    bool GetBool(const std::string& key, 
                 bool defaultValue,
                 const std::string& section = "") const;
    
    /// Comma-separated or repeated values
    std::vector<std::string> GetList(const std::string& key, 
                                     const std::string& section = "") const;
    
    /// String value with ~ and environment variables expanded
    std::string GetPath(const std::string& key, 
                        const std::string& defaultValue = "",
                        const std::string& section = "") const;
    
    // ========================================================================
    // Value Setting
    // ========================================================================
    
    void Set(const std::string& key, const std::string& value, 
             const std::string& section = "");
    
    void SetDefault(const std::string& key, const std::string& value, 
                   const std::string& section = "");
    
    // ========================================================================
    // Validation
    // ========================================================================
    
    void RequireKey(const std::string& key, const std::string& section = "");
    
    void AllowKey(const std::string& key, const std::string& section = "");
    
    /// Missing required keys and unknown keys (when an allow-list exists)
    std::vector<std::string> Validate() const;
    
    // ========================================================================
    // Utilities
    // ========================================================================
    
    void Clear();
    
    size_t Size() const;
    
    static std::string ExpandEnvVars(const std::string& value);
    
    static std::string ExpandTilde(const std::string& path);
    
    static std::string Trim(const std::string& str);
    
    static std::optional<bool> ParseBool(const std::string& str);

private:
    std::string MakeKey(const std::string& key, const std::string& section) const;
    
    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);
    
    ConfigParseResult ParseStream(std::istream& stream, const std::string& source);
    
    static std::string Unquote(const std::string& str);
    
    std::map<std::string, ConfigEntry> entries_;
    std::map<std::string, std::vector<std::string>> lists_;
    
    std::set<std::string> requiredKeys_;
    std::set<std::string> allowedKeys_;
};

} // namespace util
} // namespace zkcomply

#endif // ZKCOMPLY_UTIL_CONFIG_H
