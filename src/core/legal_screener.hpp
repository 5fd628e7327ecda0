/**
 * @file    legal_screener.hpp
 * @brief   Severity-tiered prohibited term screening for campaign messages
 * @license MIT
 *
 * @details
 * The term table is loaded once at startup and injected; screening is a
 * pure function of (text, table, config). Matching is ASCII
 * case-insensitive, either as substring or as whole word.
 */

#pragma once

#include "core/gate_config.hpp"
#include "core/types.hpp"

#include <nlohmann/json_fwd.hpp>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ccg {

// =============================================================================
// Term table
// =============================================================================

struct TermEntry {
    std::string term;        // Lowercased
    Severity severity;
    std::string category;    // Empty for flat tables
};

/**
 * Prohibited terms with their severities, in file order
 */
class TermTable {
public:
    TermTable() = default;

    /**
     * Accepts either shape:
     *   flat:        {"cures": "ERROR", "best": "WARNING"}
     *   categorized: {"medical": {"severity": "ERROR", "words": ["cure", ...]}}
     * Categories without "severity" default to WARNING.
     *
     * @throws ConfigurationError on any other shape or an unknown severity
     */
    static TermTable from_json(const nlohmann::ordered_json& table);

    /**
     * Load from a JSON file, preserving key order
     *
     * @throws ConfigurationError if unreadable or malformed
     */
    static TermTable load(const std::filesystem::path& path);

    /**
     * Add a term. A term already present keeps the higher severity.
     *
     * @throws ConfigurationError on an empty term
     */
    void add(std::string_view term, Severity severity, std::string_view category = {});

    [[nodiscard]] const std::vector<TermEntry>& entries() const noexcept { return entries_; }
    [[nodiscard]] size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

private:
    std::vector<TermEntry> entries_;
};

// =============================================================================
// Verdicts
// =============================================================================

enum class TextSource {
    Original,
    Translated,
};

[[nodiscard]] constexpr const char* to_string(TextSource source) noexcept {
    switch (source) {
        case TextSource::Original:   return "original";
        case TextSource::Translated: return "translated";
        default:                     return "unknown";
    }
}

struct LegalFinding {
    std::string term;
    Severity severity = Severity::Warning;
    std::string location;        // Message excerpt around the hit
    std::string category;
    size_t offset = 0;           // Byte offset of the hit in the screened text
    TextSource source = TextSource::Original;
};

struct LegalVerdict {
    std::vector<LegalFinding> findings;
    bool blocked = false;        // Some finding has severity >= kBlockingSeverity

    /**
     * Highest severity among the findings, nullopt when clean
     */
    [[nodiscard]] std::optional<Severity> highest_severity() const;

    /**
     * "Found N legal issue(s)" or "No legal issues detected"
     */
    [[nodiscard]] std::string details() const;

    /**
     * Union of both verdicts' findings (this first); blocked is OR-ed
     */
    [[nodiscard]] LegalVerdict merged_with(const LegalVerdict& other) const;
};

// =============================================================================
// Screener
// =============================================================================

class LegalScreener {
public:
    explicit LegalScreener(LegalConfig config = {});

    /**
     * Scan text for every occurrence of every term.
     *
     * Findings are ordered by position in the text; hits at the same
     * position list the longer term first, then table order.
     */
    [[nodiscard]] LegalVerdict screen(
        std::string_view text,
        const TermTable& table,
        TextSource source = TextSource::Original
    ) const;

private:
    LegalConfig config_;
};

}  // namespace ccg
