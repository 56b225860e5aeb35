// STAKEVAULT - Configuration File Parser
// Copyright (c) 2024 STAKEVAULT Developers
// MIT License
//
// INI-style configuration for the vault service and its tools.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs, optionally grouped under [section] headers
// - Values can be quoted: key="value with spaces"
// - Backslash continuation for multi-line values
// - A bare key is a boolean flag; "nokey" negates it
// - Boolean values: true/false, yes/no, on/off, 1/0

#ifndef STAKEVAULT_UTIL_CONFIG_H
#define STAKEVAULT_UTIL_CONFIG_H

#include <stakevault/core/arith.h>

#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace stakevault {
namespace util {

// ============================================================================
// Configuration Constants
// ============================================================================

constexpr const char* DEFAULT_DATADIR_NAME = ".stakevault";
constexpr const char* DEFAULT_CONFIG_FILENAME = "stakevault.conf";

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

constexpr size_t MAX_LINE_LENGTH = 4096;

// ============================================================================
// Configuration Entry
// ============================================================================

struct ConfigEntry {
    std::string key;
    std::string value;
    std::string section;   // Empty for global section
    std::string source;    // File path, "<command-line>", "<default>", ...
    int lineNumber{0};
    bool isDefault{false};
};

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

    /// "file:line: message" for diagnostics
    std::string ToString() const;
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Holds configuration from files, strings and the command line.
 *
 * Later sources overwrite earlier ones, except that SetDefault never
 * replaces an existing value. The CLI parses the command line, then the
 * data directory config file, then the command line again.
 */
class ConfigManager {
public:
    ConfigManager() = default;

    // ========================================================================
    // Parsing
    // ========================================================================

    ConfigParseResult ParseFile(const std::string& filePath);

    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    /// Accepts -key, --key, -key=value, --key value and -nokey
    ConfigParseResult ParseCommandLine(int argc, char* argv[]);

    // ========================================================================
    // Value Retrieval
    // ========================================================================

    bool HasKey(const std::string& key, const std::string& section = "") const;

    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;
    std::string GetString(const std::string& key,
                          const std::string& defaultValue,
                          const std::string& section = "") const;

    /// Decimal integer; nullopt if missing or malformed
    std::optional<int64_t> TryGetInt(const std::string& key,
                                     const std::string& section = "") const;
    int64_t GetInt(const std::string& key, int64_t defaultValue,
                   const std::string& section = "") const;

    std::optional<uint64_t> TryGetUInt(const std::string& key,
                                       const std::string& section = "") const;
    uint64_t GetUInt(const std::string& key, uint64_t defaultValue,
                     const std::string& section = "") const;

    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;
    bool GetBool(const std::string& key, bool defaultValue,
                 const std::string& section = "") const;

    /// 256-bit amount (deposits, rate ceilings)
    std::optional<uint256> TryGetUint256(const std::string& key,
                                         const std::string& section = "") const;
    uint256 GetUint256(const std::string& key, const uint256& defaultValue,
                       const std::string& section = "") const;

    /// Path value with ~ expanded
    std::string GetPath(const std::string& key,
                        const std::string& defaultValue = "",
                        const std::string& section = "") const;

    // ========================================================================
    // Value Setting
    // ========================================================================

    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    /// Only takes effect when the key is not already set
    void SetDefault(const std::string& key, const std::string& value,
                    const std::string& section = "");

    // ========================================================================
    // Sections
    // ========================================================================

    std::vector<std::string> GetSections() const;
    std::vector<std::string> GetKeys(const std::string& section = "") const;

    // ========================================================================
    // Validation
    // ========================================================================

    void RequireKey(const std::string& key, const std::string& section = "");
    void AllowKey(const std::string& key, const std::string& section = "");

    /// Missing required keys, and unknown keys once any key is allowed
    std::vector<std::string> Validate() const;

    // ========================================================================
    // Utilities
    // ========================================================================

    void Clear();
    size_t Size() const { return entries_.size(); }

    std::string GetDataDir() const;
    void SetDataDir(const std::string& dir);

    /// $HOME/.stakevault
    static std::string GetDefaultDataDir();

    static std::string ExpandTilde(const std::string& path);

    /// Commented template listing every known key
    static std::string GenerateSampleConfig();

    /// All entries with their source, grouped by section
    std::string Dump() const;

private:
    std::string MakeKey(const std::string& key, const std::string& section) const;

    ConfigParseResult ParseStream(std::istream& stream, const std::string& source);

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);

    void Store(const std::string& key, const std::string& value,
               const std::string& section, const std::string& source,
               int lineNum, bool isDefault);

    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static bool IsValidKey(const std::string& key);
    static std::optional<bool> ParseBool(const std::string& str);

    std::map<std::string, ConfigEntry> entries_;
    std::set<std::string> requiredKeys_;
    std::set<std::string> allowedKeys_;
    std::string dataDir_;
};

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    // General
    constexpr const char* DATADIR = "datadir";
    constexpr const char* CONF = "conf";
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* PRINTTOCONSOLE = "printtoconsole";
    constexpr const char* DEBUG = "debug";

    // Reward consensus
    constexpr const char* REWARDSDELAY = "rewardsdelay";
    constexpr const char* REWARDSMINORACLES = "rewardsminoracles";
    constexpr const char* MAXAVGREWARDPERSECOND = "maxavgrewardpersecond";
    constexpr const char* KEEPEROWNER = "keeperowner";

    // Vaults
    constexpr const char* CLAIMDELAY = "claimdelay";
    constexpr const char* SECURITYDEPOSIT = "securitydeposit";
}

} // namespace util
} // namespace stakevault

#endif // STAKEVAULT_UTIL_CONFIG_H
