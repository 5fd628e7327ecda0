/**
 * @file    legal_screener.cpp
 * @brief   Severity-tiered prohibited term screening for campaign messages
 * @license MIT
 */

#include "core/legal_screener.hpp"
#include "utils/path_formatter.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <fstream>

namespace ccg {

namespace {

using ordered_json = nlohmann::ordered_json;

std::string to_lower_ascii(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

// Non-ASCII bytes count as word characters so UTF-8 words are not split
bool is_word_byte(char c) {
    const auto u = static_cast<unsigned char>(c);
    return u >= 0x80 || std::isalnum(u) || c == '_';
}

bool is_utf8_continuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

std::string make_excerpt(std::string_view text, size_t offset, size_t length, int radius) {
    size_t begin = offset > static_cast<size_t>(radius) ? offset - radius : 0;
    size_t end = std::min(text.size(), offset + length + static_cast<size_t>(radius));

    while (begin > 0 && is_utf8_continuation(text[begin])) --begin;
    while (end < text.size() && is_utf8_continuation(text[end])) ++end;

    std::string excerpt;
    if (begin > 0) excerpt += "...";
    excerpt += text.substr(begin, end - begin);
    if (end < text.size()) excerpt += "...";
    return excerpt;
}

}  // anonymous namespace

Severity parse_severity(std::string_view text) {
    const std::string lowered = to_lower_ascii(trim(text));
    if (lowered == "error") return Severity::Error;
    if (lowered == "warning") return Severity::Warning;
    throw ConfigurationError(fmt::format("Unknown severity '{}' (expected ERROR or WARNING)", text));
}

// =============================================================================
// TermTable
// =============================================================================

void TermTable::add(std::string_view term, Severity severity, std::string_view category) {
    const std::string lowered = to_lower_ascii(trim(term));
    if (lowered.empty()) {
        throw ConfigurationError("Term table: empty term");
    }

    for (auto& entry : entries_) {
        if (entry.term == lowered) {
            if (severity > entry.severity) {
                entry.severity = severity;
                entry.category = std::string(category);
            }
            return;
        }
    }
    entries_.push_back(TermEntry{lowered, severity, std::string(category)});
}

TermTable TermTable::from_json(const ordered_json& table) {
    if (!table.is_object()) {
        throw ConfigurationError("Term table must be a JSON object");
    }

    TermTable result;
    for (const auto& item : table.items()) {
        const std::string& key = item.key();
        const ordered_json& value = item.value();

        if (value.is_string()) {
            // Flat: term -> severity
            result.add(key, parse_severity(value.get<std::string>()));
            continue;
        }

        if (!value.is_object()) {
            throw ConfigurationError(fmt::format(
                "Term table: value for '{}' must be a severity string or a category object", key));
        }

        // Categorized: category -> {severity, words}
        Severity severity = Severity::Warning;
        if (auto it = value.find("severity"); it != value.end()) {
            if (!it->is_string()) {
                throw ConfigurationError(fmt::format("Term table: '{}.severity' must be a string", key));
            }
            severity = parse_severity(it->get<std::string>());
        }

        auto words = value.find("words");
        if (words == value.end() || !words->is_array()) {
            throw ConfigurationError(fmt::format("Term table: '{}.words' must be an array", key));
        }
        for (const auto& word : *words) {
            if (!word.is_string()) {
                throw ConfigurationError(fmt::format("Term table: '{}.words' must contain strings", key));
            }
            result.add(word.get<std::string>(), severity, key);
        }
    }
    return result;
}

TermTable TermTable::load(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigurationError(fmt::format("Cannot open term table: {}", path));
    }

    // ordered_json keeps the file's term order
    ordered_json root;
    try {
        root = ordered_json::parse(in);
    } catch (const ordered_json::parse_error& e) {
        throw ConfigurationError(fmt::format("Malformed term table {}: {}", path, e.what()));
    }

    TermTable table = from_json(root);
    spdlog::info("Loaded {} prohibited terms from {}", table.size(), path.filename());
    return table;
}

// =============================================================================
// LegalVerdict
// =============================================================================

std::optional<Severity> LegalVerdict::highest_severity() const {
    std::optional<Severity> highest;
    for (const auto& f : findings) {
        if (!highest || f.severity > *highest) {
            highest = f.severity;
        }
    }
    return highest;
}

std::string LegalVerdict::details() const {
    if (findings.empty()) {
        return "No legal issues detected";
    }
    return fmt::format("Found {} legal issue(s)", findings.size());
}

LegalVerdict LegalVerdict::merged_with(const LegalVerdict& other) const {
    LegalVerdict merged = *this;
    merged.findings.insert(merged.findings.end(), other.findings.begin(), other.findings.end());
    merged.blocked = blocked || other.blocked;
    return merged;
}

// =============================================================================
// LegalScreener
// =============================================================================

LegalScreener::LegalScreener(LegalConfig config)
    : config_(config) {}

LegalVerdict LegalScreener::screen(
    std::string_view text,
    const TermTable& table,
    TextSource source) const
{
    struct Hit {
        size_t offset;
        size_t index;    // Into table.entries()
    };

    const std::string lowered = to_lower_ascii(text);
    const auto& entries = table.entries();

    std::vector<Hit> hits;
    for (size_t i = 0; i < entries.size(); ++i) {
        const std::string& term = entries[i].term;

        size_t pos = lowered.find(term);
        while (pos != std::string::npos) {
            bool accept = true;
            if (config_.match_mode == MatchMode::WholeWord) {
                const size_t end = pos + term.size();
                const bool left_ok = pos == 0 || !is_word_byte(lowered[pos - 1]);
                const bool right_ok = end >= lowered.size() || !is_word_byte(lowered[end]);
                accept = left_ok && right_ok;
            }
            if (accept) {
                hits.push_back(Hit{pos, i});
                pos = lowered.find(term, pos + term.size());
            } else {
                // A rejected hit may overlap a valid one
                pos = lowered.find(term, pos + 1);
            }
        }
    }

    std::sort(hits.begin(), hits.end(), [&](const Hit& a, const Hit& b) {
        if (a.offset != b.offset) return a.offset < b.offset;
        const size_t la = entries[a.index].term.size();
        const size_t lb = entries[b.index].term.size();
        if (la != lb) return la > lb;
        return a.index < b.index;
    });

    LegalVerdict verdict;
    verdict.findings.reserve(hits.size());
    for (const auto& hit : hits) {
        const TermEntry& entry = entries[hit.index];
        verdict.findings.push_back(LegalFinding{
            entry.term,
            entry.severity,
            make_excerpt(text, hit.offset, entry.term.size(), config_.excerpt_radius),
            entry.category,
            hit.offset,
            source
        });

        spdlog::debug("[{}] '{}' at {} in {} message",
                      to_string(entry.severity), entry.term, hit.offset, to_string(source));
    }

    const auto highest = verdict.highest_severity();
    verdict.blocked = highest.has_value() && *highest >= kBlockingSeverity;

    return verdict;
}

}  // namespace ccg
