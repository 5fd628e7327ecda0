/**
 * @file    campaign_report.cpp
 * @brief   JSON report and console summary for a campaign run
 * @license MIT
 */

#include "report/campaign_report.hpp"
#include "core/color_utils.hpp"
#include "utils/path_formatter.hpp"

#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <fmt/color.h>

#include <cmath>
#include <fstream>
#include <stdexcept>

namespace ccg::report {

namespace {

using json = nlohmann::json;

json colors_to_json(const std::set<ColorSample>& colors) {
    json arr = json::array();
    for (const auto& c : colors) {
        arr.push_back(to_hex(c));
    }
    return arr;
}

json brand_color_to_json(const BrandColorMatch& match) {
    return json{
        {"color", to_hex(match.color)},
        {"present", match.present},
        {"closest_distance", std::isfinite(match.closest_distance)
                                 ? json(match.closest_distance) : json(nullptr)},
        {"coverage", match.coverage},
        {"matched_shades", colors_to_json(match.matched_shades)},
    };
}

}  // anonymous namespace

json to_json(const LogoMatch& logo) {
    json j{
        {"found", logo.found},
        {"confidence", logo.confidence},
        {"scale", logo.scale},
    };
    if (logo.location) {
        j["location"] = json{
            {"x", logo.location->x},
            {"y", logo.location->y},
            {"width", logo.location->width},
            {"height", logo.location->height},
        };
    } else {
        j["location"] = nullptr;
    }
    return j;
}

json to_json(const ComplianceVerdict& verdict) {
    json palette = json::array();
    for (const auto& entry : verdict.palette) {
        palette.push_back(json{{"color", to_hex(entry.color)}, {"weight", entry.weight}});
    }

    return json{
        {"overall_pass", verdict.overall_pass},
        {"logo", to_json(verdict.logo)},
        {"color_pass", verdict.color_pass},
        {"matched_colors", colors_to_json(verdict.matched_colors)},
        {"primary_color", brand_color_to_json(verdict.primary)},
        {"secondary_color", brand_color_to_json(verdict.secondary)},
        {"palette", palette},
        {"violations", verdict.violations},
    };
}

json to_json(const LegalFinding& finding) {
    return json{
        {"term", finding.term},
        {"severity", to_string(finding.severity)},
        {"category", finding.category},
        {"location", finding.location},
        {"offset", finding.offset},
        {"source", to_string(finding.source)},
    };
}

json to_json(const LegalVerdict& verdict) {
    json findings = json::array();
    for (const auto& f : verdict.findings) {
        findings.push_back(to_json(f));
    }

    const auto highest = verdict.highest_severity();
    return json{
        {"blocked", verdict.blocked},
        {"highest_severity", highest ? to_string(*highest) : "NONE"},
        {"details", verdict.details()},
        {"findings", findings},
    };
}

json to_json(const ProductResult& product) {
    json flags = json::array();
    for (const auto& f : product.legal_flags) {
        flags.push_back(fmt::format("[{}] {}: '{}' in {} message",
                                    to_string(f.severity),
                                    f.category.empty() ? "term" : f.category,
                                    f.term, to_string(f.source)));
    }

    return json{
        {"product_name", product.product_name},
        {"generated", product.generated},
        {"uploaded", product.uploaded},
        {"compliance_passed", product.compliant()},
        {"compliance", product.compliance ? to_json(*product.compliance) : json(nullptr)},
        {"legal_flags", flags},
        {"error", product.failed() ? json(product.error) : json(nullptr)},
        {"elapsed_seconds", product.elapsed_seconds},
    };
}

json to_json(const CampaignResult& result) {
    json products = json::array();
    for (const auto& p : result.products) {
        products.push_back(to_json(p));
    }

    return json{
        {"campaign_id", result.campaign_id},
        {"blocked", result.blocked},
        {"translated_message", result.translated_message},
        {"legal", to_json(result.legal)},
        {"products", products},
        {"summary", json{
            {"total", result.products.size()},
            {"compliant", result.compliant_count()},
            {"non_compliant", result.non_compliant_count()},
            {"failed", result.failed_count()},
        }},
        {"elapsed_seconds", result.elapsed_seconds},
    };
}

void write_report(const CampaignResult& result, const std::filesystem::path& path) {
    auto dir = path.parent_path();
    if (!dir.empty() && !std::filesystem::exists(dir)) {
        std::filesystem::create_directories(dir);
    }

    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error(fmt::format("Cannot write report: {}", path));
    }
    out << to_json(result).dump(2) << '\n';
    if (!out) {
        throw std::runtime_error(fmt::format("Failed writing report: {}", path));
    }
    spdlog::info("Report saved: {}", path);
}

void print_summary(const CampaignResult& result) {
    fmt::print("\n");
    fmt::print(fmt::emphasis::bold, "Campaign {}\n", result.campaign_id);

    const auto highest = result.legal.highest_severity();
    if (result.blocked) {
        fmt::print(fmt::fg(fmt::color::red), "  [BLOCKED] {}\n", result.legal.details());
    } else if (highest) {
        fmt::print(fmt::fg(fmt::color::yellow), "  [WARN] {}\n", result.legal.details());
    } else {
        fmt::print(fmt::fg(fmt::color::green), "  [OK] {}\n", result.legal.details());
    }
    for (const auto& f : result.legal.findings) {
        fmt::print(fmt::fg(f.severity >= kBlockingSeverity ? fmt::color::red : fmt::color::yellow),
                   "    {:<7} '{}' ({} message): {}\n",
                   to_string(f.severity), f.term, to_string(f.source), f.location);
    }

    if (result.blocked) {
        fmt::print(fmt::fg(fmt::color::gray), "  No creatives were generated or uploaded.\n\n");
        return;
    }

    for (const auto& p : result.products) {
        if (p.failed()) {
            fmt::print(fmt::fg(fmt::color::red), "  [ERROR] {}: {}\n", p.product_name, p.error);
            continue;
        }
        if (p.compliant()) {
            fmt::print(fmt::fg(fmt::color::green), "  [OK]    {} (logo {:.2f})\n",
                       p.product_name, p.compliance->logo.confidence);
            continue;
        }
        fmt::print(fmt::fg(fmt::color::orange), "  [FAIL]  {}\n", p.product_name);
        if (p.compliance) {
            for (const auto& v : p.compliance->violations) {
                fmt::print(fmt::fg(fmt::color::gray), "          - {}\n", v);
            }
        }
    }

    fmt::print(fmt::fg(fmt::color::green), "\n[OK] Completed: {} compliant", result.compliant_count());
    if (result.non_compliant_count() > 0) {
        fmt::print(fmt::fg(fmt::color::orange), ", {} non-compliant", result.non_compliant_count());
    }
    if (result.failed_count() > 0) {
        fmt::print(fmt::fg(fmt::color::red), ", {} failed", result.failed_count());
    }
    fmt::print(" ({:.2f}s)\n\n", result.elapsed_seconds);
}

}  // namespace ccg::report
