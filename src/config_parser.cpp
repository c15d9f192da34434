#include "finenoise/config_parser.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace finenoise {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

// Drops a trailing comment: '#' at the start of the value or after whitespace
std::string_view stripComment(std::string_view value) {
    for (size_t i = 0; i < value.size(); ++i) {
        if (value[i] != '#') continue;
        if (i == 0 || std::isspace(static_cast<unsigned char>(value[i - 1]))) {
            return trim(value.substr(0, i));
        }
    }
    return value;
}

std::string canonicalPath(const std::string& path) {
    std::error_code ec;
    auto canonical = std::filesystem::weakly_canonical(path, ec);
    if (ec) {
        return std::filesystem::absolute(path, ec).lexically_normal().string();
    }
    return canonical.string();
}

}  // namespace

// ============================================================================
// ConfigValue
// ============================================================================

double ConfigValue::asDouble(double defaultVal) const {
    if (text_.empty()) return defaultVal;

    char* end;
    double val = std::strtod(text_.c_str(), &end);
    if (end == text_.c_str()) return defaultVal;
    return val;
}

int ConfigValue::asInt(int defaultVal) const {
    if (text_.empty()) return defaultVal;

    char* end;
    long val = std::strtol(text_.c_str(), &end, 10);
    if (end == text_.c_str()) return defaultVal;
    return static_cast<int>(val);
}

uint32_t ConfigValue::asUInt32(uint32_t defaultVal) const {
    if (text_.empty()) return defaultVal;

    char* end;
    long long val = std::strtoll(text_.c_str(), &end, 10);
    if (end == text_.c_str()) return defaultVal;
    return static_cast<uint32_t>(val);
}

std::vector<double> ConfigValue::asNumbers() const {
    std::vector<double> numbers;

    const char* pos = text_.c_str();
    const char* const last = pos + text_.size();
    while (pos < last) {
        // Skip whitespace
        while (pos < last && std::isspace(static_cast<unsigned char>(*pos))) {
            ++pos;
        }
        if (pos >= last) break;

        char* end;
        double val = std::strtod(pos, &end);
        if (end == pos) {
            // Not a number - skip this token
            while (pos < last && !std::isspace(static_cast<unsigned char>(*pos))) {
                ++pos;
            }
        } else {
            numbers.push_back(val);
            pos = end;
        }
    }

    return numbers;
}

// ============================================================================
// ConfigDocument
// ============================================================================

void ConfigDocument::addEntry(ConfigEntry entry) {
    entries_.push_back(std::move(entry));
}

const ConfigEntry* ConfigDocument::get(std::string_view key) const {
    // Return last entry with this key (later overrides earlier)
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        if (it->key == key) {
            return &(*it);
        }
    }
    return nullptr;
}

std::string_view ConfigDocument::getString(std::string_view key, std::string_view defaultVal) const {
    if (auto* entry = get(key)) {
        auto sv = entry->value.asString();
        if (!sv.empty()) return sv;
    }
    return defaultVal;
}

double ConfigDocument::getDouble(std::string_view key, double defaultVal) const {
    if (auto* entry = get(key)) {
        return entry->value.asDouble(defaultVal);
    }
    return defaultVal;
}

int ConfigDocument::getInt(std::string_view key, int defaultVal) const {
    if (auto* entry = get(key)) {
        return entry->value.asInt(defaultVal);
    }
    return defaultVal;
}

uint32_t ConfigDocument::getUInt32(std::string_view key, uint32_t defaultVal) const {
    if (auto* entry = get(key)) {
        return entry->value.asUInt32(defaultVal);
    }
    return defaultVal;
}

// ============================================================================
// ConfigParser
// ============================================================================

std::optional<ConfigDocument> ConfigParser::parseFile(const std::string& path) const {
    IncludeStack stack;
    return parseNested(path, stack);
}

ConfigDocument ConfigParser::parseString(std::string_view content, const std::string& basePath) const {
    ConfigDocument doc;
    IncludeStack stack;
    parseContent(content, doc, basePath, stack);
    return doc;
}

std::optional<ConfigDocument> ConfigParser::parseNested(const std::string& path,
                                                        IncludeStack& stack) const {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    // Extract base path for relative includes
    std::string basePath;
    auto lastSlash = path.find_last_of("/\\");
    if (lastSlash != std::string::npos) {
        basePath = path.substr(0, lastSlash + 1);
    }

    ConfigDocument doc;
    stack.push_back(canonicalPath(path));
    parseContent(buffer.str(), doc, basePath, stack);
    stack.pop_back();
    return doc;
}

void ConfigParser::parseContent(std::string_view content, ConfigDocument& doc,
                                const std::string& basePath, IncludeStack& stack) const {
    std::string_view remaining = content;

    while (!remaining.empty()) {
        // Find end of line
        auto lineEnd = remaining.find('\n');
        std::string_view line;
        if (lineEnd == std::string_view::npos) {
            line = remaining;
            remaining = {};
        } else {
            line = remaining.substr(0, lineEnd);
            remaining = remaining.substr(lineEnd + 1);
        }

        // Remove trailing \r if present (Windows line endings)
        if (!line.empty() && line.back() == '\r') {
            line = line.substr(0, line.size() - 1);
        }

        parseLine(line, doc, basePath, stack);
    }
}

void ConfigParser::parseLine(std::string_view line, ConfigDocument& doc,
                             const std::string& basePath, IncludeStack& stack) const {
    line = trim(line);

    // Empty line or comment
    if (line.empty() || line[0] == '#') {
        return;
    }

    ConfigEntry entry;

    auto colonPos = line.find(':');
    if (colonPos == std::string_view::npos) {
        // No colon - treat as simple key with no value
        entry.key = std::string(stripComment(line));
        doc.addEntry(std::move(entry));
        return;
    }

    entry.key = std::string(trim(line.substr(0, colonPos)));
    auto rest = stripComment(trim(line.substr(colonPos + 1)));

    // Handle special directives
    if (entry.key == "include") {
        std::string includePath = basePath + std::string(rest);
        if (std::find(stack.begin(), stack.end(), canonicalPath(includePath)) != stack.end()) {
            std::cerr << "[ConfigParser] WARNING: include cycle through '" << includePath
                      << "', skipping\n";
            return;
        }
        if (auto includedDoc = parseNested(includePath, stack)) {
            for (const auto& included : *includedDoc) {
                doc.addEntry(included);
            }
        }
        return;
    }

    entry.value = ConfigValue(rest);
    doc.addEntry(std::move(entry));
}

}  // namespace finenoise
