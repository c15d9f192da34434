#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace finenoise {

// ============================================================================
// ConfigValue - A parsed configuration value
// ============================================================================

/**
 * @brief The text after a key's colon, with typed accessors
 *
 * Accessors return the supplied default when the text is empty or does not
 * start with a number.
 */
class ConfigValue {
public:
    ConfigValue() = default;
    explicit ConfigValue(std::string_view text) : text_(text) {}

    // String access
    [[nodiscard]] std::string_view asString() const { return text_; }

    // Numeric access
    [[nodiscard]] double asDouble(double defaultVal = 0.0) const;
    [[nodiscard]] int asInt(int defaultVal = 0) const;

    // Wraps modulo 2^32, so "-1" reads as 0xFFFFFFFF
    [[nodiscard]] uint32_t asUInt32(uint32_t defaultVal = 0) const;

    // Whitespace-separated numbers ("6 2.0 0.5"); non-numeric tokens are skipped
    [[nodiscard]] std::vector<double> asNumbers() const;

    [[nodiscard]] bool empty() const { return text_.empty(); }

private:
    std::string text_;
};

// ============================================================================
// ConfigEntry - A key-value pair
// ============================================================================

struct ConfigEntry {
    std::string key;    // Text before the colon (e.g., "type", "fbm")
    ConfigValue value;  // Trimmed text after the colon
};

// ============================================================================
// ConfigDocument - A parsed configuration file
// ============================================================================

/**
 * @brief A parsed configuration document
 *
 * Contains all entries in file order. Lookup by key returns the last match,
 * so later entries (and included files) override earlier ones. Repeated keys
 * stay available in order through entries().
 */
class ConfigDocument {
public:
    ConfigDocument() = default;

    void addEntry(ConfigEntry entry);

    // Lookup by key (returns last entry with this key, or nullptr)
    [[nodiscard]] const ConfigEntry* get(std::string_view key) const;

    // Get value directly (convenience)
    [[nodiscard]] std::string_view getString(std::string_view key, std::string_view defaultVal = "") const;
    [[nodiscard]] double getDouble(std::string_view key, double defaultVal = 0.0) const;
    [[nodiscard]] int getInt(std::string_view key, int defaultVal = 0) const;
    [[nodiscard]] uint32_t getUInt32(std::string_view key, uint32_t defaultVal = 0) const;

    // Iteration
    [[nodiscard]] const std::vector<ConfigEntry>& entries() const { return entries_; }
    [[nodiscard]] auto begin() const { return entries_.begin(); }
    [[nodiscard]] auto end() const { return entries_.end(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }
    [[nodiscard]] size_t size() const { return entries_.size(); }

private:
    std::vector<ConfigEntry> entries_;
};

// ============================================================================
// ConfigParser - Parses configuration files
// ============================================================================

/**
 * @brief Parser for simple line-based configuration files
 *
 * Format:
 * ```
 * # Comments start with #
 * type: perlin
 * seed: 42
 * fbm: 6 2.0 0.5
 * include: shared_layers.conf
 * ```
 *
 * - One `key: value` per line
 * - `#` starts a comment at line start, or after whitespace in a value
 *   (`seed: 42   # fixed`); a `#` inside a word is kept
 * - A line without a colon is a key with an empty value
 * - `include:` pulls in another file at that point, relative to the
 *   including file's directory; a missing include is skipped, and so is
 *   a file that is already being included (cycles)
 */
class ConfigParser {
public:
    ConfigParser() = default;

    /**
     * @brief Parse a configuration file
     * @param path Filesystem path to the file
     * @return Parsed document, or nullopt if the file cannot be read
     */
    [[nodiscard]] std::optional<ConfigDocument> parseFile(const std::string& path) const;

    /**
     * @brief Parse configuration from a string
     * @param content The configuration content
     * @param basePath Directory prefix for resolving includes (optional)
     */
    [[nodiscard]] ConfigDocument parseString(std::string_view content,
                                             const std::string& basePath = "") const;

private:
    // Canonical paths of the files currently being parsed, outermost first
    using IncludeStack = std::vector<std::string>;

    std::optional<ConfigDocument> parseNested(const std::string& path, IncludeStack& stack) const;
    void parseContent(std::string_view content, ConfigDocument& doc,
                      const std::string& basePath, IncludeStack& stack) const;
    void parseLine(std::string_view line, ConfigDocument& doc,
                   const std::string& basePath, IncludeStack& stack) const;
};

}  // namespace finenoise
