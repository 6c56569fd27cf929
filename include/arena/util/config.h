// ARENA - Configuration File Parser
// Copyright (c) 2024 ARENA Developers
// MIT License
//
// Parses INI-style configuration for the arena and its simulator.
//
// Configuration file format:
// - Lines starting with # or ; are comments
// - key=value pairs, grouped under [section] headers
// - Values can be quoted: key="value with spaces"
// - Backslash continuation for multi-line values
// - Boolean values: true/false, yes/no, on/off, 1/0
// - Environment variable expansion: ${VAR_NAME}
// - include <path> pulls in another file

#ifndef ARENA_UTIL_CONFIG_H
#define ARENA_UTIL_CONFIG_H

#include <cstdint>
#include <iosfwd>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace arena {
namespace util {

/// Default config file name
constexpr const char* DEFAULT_CONFIG_FILENAME = "arena.conf";

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

/// Maximum line length
constexpr size_t MAX_LINE_LENGTH = 4096;

/// Maximum include depth
constexpr int MAX_INCLUDE_DEPTH = 10;

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
 * Holds configuration from files, the command line and defaults.
 *
 * Command-line values and later files overwrite earlier ones; SetDefault
 * never overwrites an existing value.
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

    /// Parse configuration from a string; sourceName appears in errors
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");

    /**
     * Parse -key=value / --key value / -nokey arguments into the global
     * section. "section.key" targets a section. Non-option arguments are
     * returned in positional order through GetPositional().
     */
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

    /// Integer value; nullopt if missing or not a whole number
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

    /// Comma-separated values, or repeated entries of the same key
    std::vector<std::string> GetList(const std::string& key,
                                     const std::string& section = "") const;

    /// Arguments that were not options
    const std::vector<std::string>& GetPositional() const { return positional_; }

    // ========================================================================
    // Value Setting
    // ========================================================================

    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

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

    /// Missing required keys and, when allowed keys are registered, unknown keys
    std::vector<std::string> Validate() const;

    // ========================================================================
    // Utilities
    // ========================================================================

    void Clear();

    size_t Size() const;

    static std::string ExpandEnvVars(const std::string& value);

    static std::string ExpandTilde(const std::string& path);

    /// Sample arena.conf with every key commented out at its default
    static std::string GenerateSampleConfig();

    /// All entries grouped by section
    std::string Dump() const;

private:
    std::string MakeKey(const std::string& key, const std::string& section) const;

    ConfigParseResult ParseStream(std::istream& stream, const std::string& source);

    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);

    static bool IsValidKey(const std::string& key, char& badChar);
    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static std::optional<bool> ParseBool(const std::string& str);

    std::map<std::string, ConfigEntry> entries_;
    std::map<std::string, std::vector<std::string>> lists_;
    std::vector<std::string> positional_;

    std::set<std::string> requiredKeys_;
    std::set<std::string> allowedKeys_;

    int includeDepth_{0};
};

// ============================================================================
// Arena Configuration Keys
// ============================================================================

namespace ConfigSections {
    constexpr const char* STAGES = "stages";
    constexpr const char* INCENTIVES = "incentives";
    constexpr const char* POLICY = "policy";
    constexpr const char* SIM = "sim";
}

namespace ConfigKeys {
    // General
    constexpr const char* CONF = "conf";
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* LOGFILE = "logfile";
    constexpr const char* PRINTTOCONSOLE = "printtoconsole";
    constexpr const char* DEBUG = "debug";

    // [stages], seconds
    constexpr const char* STAGE_STAKE = "stake";
    constexpr const char* STAGE_DAIVOTE = "daivote";
    constexpr const char* STAGE_PAIR = "pair";
    constexpr const char* STAGE_ZOOVOTE = "zoovote";
    constexpr const char* STAGE_WINNER = "winner";

    // [incentives], whole tokens and an epoch number
    constexpr const char* BASE_STAKER_REWARD = "basestakerreward";
    constexpr const char* BASE_VOTER_REWARD = "basevoterreward";
    constexpr const char* END_EPOCH = "endepoch";

    // [policy]
    constexpr const char* DAI_VOTE_MULTIPLIER = "daivotemultiplier";
    constexpr const char* ZOO_VOTE_MULTIPLIER = "zoovotemultiplier";
    constexpr const char* LEAGUE_THRESHOLDS = "leaguethresholds";
    constexpr const char* LEAGUE_ZOO_REWARDS = "leaguezoorewards";
    constexpr const char* AUTO_FULFILL = "autofulfill";

    // [sim]
    constexpr const char* SIM_EPOCHS = "epochs";
    constexpr const char* SIM_STAKERS = "stakers";
    constexpr const char* SIM_VOTERS = "voters";
    constexpr const char* SIM_YIELD_BPS = "yieldbps";
    constexpr const char* SIM_DEPOSIT = "deposit";
    constexpr const char* SIM_SEED = "seed";
}

} // namespace util
} // namespace arena

#endif // ARENA_UTIL_CONFIG_H
