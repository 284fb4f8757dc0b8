// CURATOR - Configuration File Parser
// Copyright (c) 2024 CURATOR Developers
// MIT License
//
// Parses INI-style configuration for registry parameters and logging.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs
// - Section headers: [section]
// - Values can be quoted: key="value with spaces"
// - Boolean values: true/false, yes/no, on/off, 1/0
// - A repeated key replaces the earlier value (a warning is recorded)

#ifndef CURATOR_UTIL_CONFIG_H
#define CURATOR_UTIL_CONFIG_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace curator {
namespace util {

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
    std::string source;    // File path or source name
    int lineNumber{0};
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
    std::vector<std::string> warnings;

    static ConfigParseResult Success() {
        return {true, "", "", 0, {}};
    }

    static ConfigParseResult Error(const std::string& msg,
                                   const std::string& file = "",
                                   int line = 0) {
        return {false, msg, file, line, {}};
    }
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Holds key/value configuration grouped by section.
 *
 * Values are looked up by (key, section); the global section is the
 * empty string. Parsing stops at the first malformed line and leaves the
 * entries parsed before it in place.
 */
class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    // ========================================================================
    // Parsing
    // ========================================================================

    /**
     * Parse a configuration file.
     *
     * @param filePath Path to the config file
     * @return Parse result
     */
    ConfigParseResult ParseFile(const std::string& filePath);

    /**
     * Parse configuration from a string.
     *
     * @param content Config file content
     * @param sourceName Name for error messages
     * @return Parse result
     */
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    // ========================================================================
    // Value Retrieval
    // ========================================================================

    bool HasKey(const std::string& key, const std::string& section = "") const;

    /// Get raw string value (nullopt if the key doesn't exist)
    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;

    std::string GetString(const std::string& key,
                          const std::string& defaultValue,
                          const std::string& section = "") const;

    /// Get integer value (nullopt if missing or not a whole number)
    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;

    int64_t GetInt(const std::string& key,
                   int64_t defaultValue,
                   const std::string& section = "") const;

    /// Get boolean value (nullopt if missing or not a boolean word)
    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;

    bool GetBool(const std::string& key,
                 bool defaultValue,
                 const std::string& section = "") const;

    /// Comma-separated list value, empty items dropped
    std::vector<std::string> GetList(const std::string& key,
                                     const std::string& section = "") const;

    // ========================================================================
    // Value Setting
    // ========================================================================

    /// Set a value programmatically
    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    // ========================================================================
    // Sections
    // ========================================================================

    /// All non-global section names, sorted
    std::vector<std::string> GetSections() const;

    /// All keys in a section (empty for global)
    std::vector<std::string> GetKeys(const std::string& section = "") const;

    /// Entry with its source location, if present
    std::optional<ConfigEntry> GetEntry(const std::string& key,
                                        const std::string& section = "") const;

    // ========================================================================
    // Utilities
    // ========================================================================

    void Clear();
    size_t Size() const;

    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static std::optional<bool> ParseBool(const std::string& str);

private:
    std::string MakeKey(const std::string& key, const std::string& section) const;

    ConfigParseResult ParseStream(std::istream& in, const std::string& source);

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);

    std::map<std::string, ConfigEntry> entries_;
};

} // namespace util
} // namespace curator

#endif // CURATOR_UTIL_CONFIG_H
