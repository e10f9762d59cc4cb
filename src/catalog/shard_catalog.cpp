// src/catalog/shard_catalog.cpp

#include "histshard/catalog/shard_catalog.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <set>
#include "histshard/core/logger.hpp"
#include "histshard/core/time_utils.hpp"

namespace histshard {

namespace {

const std::vector<ShardCategory> ALL_CATEGORIES = {ShardCategory::INDICES, ShardCategory::OPTIONS,
                                                   ShardCategory::ETFS, ShardCategory::STOCKS};

const std::vector<ShardCategory> BAR_CATEGORIES = {ShardCategory::INDICES, ShardCategory::ETFS,
                                                   ShardCategory::STOCKS};

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool all_digits(const std::string& s, size_t length) {
    return s.size() == length && std::all_of(s.begin(), s.end(), [](unsigned char c) {
               return std::isdigit(c) != 0;
           });
}

std::vector<std::string> split(const std::string& s, char delimiter) {
    std::vector<std::string> parts;
    size_t begin = 0;
    while (true) {
        size_t pos = s.find(delimiter, begin);
        parts.push_back(s.substr(begin, pos - begin));
        if (pos == std::string::npos) {
            break;
        }
        begin = pos + 1;
    }
    return parts;
}

// Last millisecond before the given UTC instant
Timestamp just_before(const Timestamp& ts) {
    return ts - std::chrono::milliseconds(1);
}

}  // anonymous namespace

nlohmann::json ShardDescriptor::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["category"] = category_to_string(category);
    j["symbol"] = symbol;
    j["coverage_start"] = core::format_timestamp(coverage.start);
    j["coverage_end"] = core::format_timestamp(coverage.end);
    j["granularity"] = granularity.to_string();
    j["size_hint"] = size_hint;
    return j;
}

nlohmann::json CatalogStatistics::to_json() const {
    nlohmann::json j;
    j["shard_count"] = shard_count;
    j["total_size_bytes"] = total_size_bytes;
    j["built_at"] = core::format_timestamp(built_at);
    j["shards_per_category"] = shards_per_category;

    nlohmann::json coverage = nlohmann::json::object();
    for (const auto& [key, range] : coverage_per_symbol) {
        coverage[key] = {{"start", core::format_timestamp(range.start)},
                         {"end", core::format_timestamp(range.end)}};
    }
    j["coverage"] = coverage;
    return j;
}

ShardCatalog::ShardCatalog(std::filesystem::path root)
    : root_(std::move(root)), snapshot_(std::make_shared<const Snapshot>()) {}

std::shared_ptr<const ShardCatalog::Snapshot> ShardCatalog::snapshot() const {
    return std::atomic_load(&snapshot_);
}

std::optional<ShardDescriptor> ShardCatalog::parse_shard_file(ShardCategory category,
                                                              const std::filesystem::path& file,
                                                              const std::string& relative_id) {
    if (to_lower(file.extension().string()) != ".db") {
        return std::nullopt;
    }

    auto parts = split(to_lower(file.stem().string()), '_');
    if (parts.size() < 3) {
        return std::nullopt;
    }

    TimeRange coverage;
    size_t period_tokens = 0;
    const std::string& last = parts.back();
    const std::string& before_last = parts[parts.size() - 2];

    if (parts.size() >= 4 && all_digits(before_last, 4) && all_digits(last, 2)) {
        int year = std::stoi(before_last);
        unsigned month = static_cast<unsigned>(std::stoi(last));
        if (month < 1 || month > 12) {
            return std::nullopt;
        }
        Timestamp start = core::make_date(year, month, 1);
        Timestamp next = month == 12 ? core::make_date(year + 1, 1, 1)
                                     : core::make_date(year, month + 1, 1);
        coverage = TimeRange(start, just_before(next));
        period_tokens = 2;
    } else if (parts.size() >= 4 && all_digits(before_last, 4) && all_digits(last, 4)) {
        int first_year = std::stoi(before_last);
        int last_year = std::stoi(last);
        if (last_year < first_year) {
            return std::nullopt;
        }
        coverage = TimeRange(core::make_date(first_year, 1, 1),
                             just_before(core::make_date(last_year + 1, 1, 1)));
        period_tokens = 2;
    } else if (all_digits(last, 4)) {
        int year = std::stoi(last);
        coverage =
            TimeRange(core::make_date(year, 1, 1), just_before(core::make_date(year + 1, 1, 1)));
        period_tokens = 1;
    } else {
        return std::nullopt;
    }

    size_t granularity_index = parts.size() - period_tokens - 1;
    if (granularity_index == 0) {
        return std::nullopt;
    }
    auto granularity = Granularity::parse(parts[granularity_index]);
    if (granularity.is_error()) {
        return std::nullopt;
    }

    std::string symbol = parts[0];
    for (size_t i = 1; i < granularity_index; ++i) {
        symbol += "_" + parts[i];
    }

    ShardDescriptor descriptor;
    descriptor.id = relative_id;
    descriptor.category = category;
    descriptor.symbol = to_upper(symbol);
    descriptor.coverage = coverage;
    descriptor.granularity = granularity.value();
    descriptor.path = file;

    std::error_code ec;
    auto size = std::filesystem::file_size(file, ec);
    descriptor.size_hint = ec ? 0 : static_cast<uint64_t>(size);

    return descriptor;
}

Result<void> ShardCatalog::refresh() {
    Logger::register_component("ShardCatalog");

    std::error_code ec;
    if (!std::filesystem::is_directory(root_, ec)) {
        ERROR("Data root " << root_.string() << " is not a directory");
        return make_error<void>(ErrorCode::FILE_NOT_FOUND,
                                "Data root not found: " + root_.string(), "ShardCatalog");
    }

    auto next = std::make_shared<Snapshot>();
    size_t skipped = 0;

    try {
        for (ShardCategory category : ALL_CATEGORIES) {
            std::string dir_name = category_to_string(category);
            std::filesystem::path dir = root_ / dir_name;
            if (!std::filesystem::is_directory(dir, ec)) {
                continue;
            }

            for (const auto& entry : std::filesystem::directory_iterator(dir)) {
                if (!entry.is_regular_file()) {
                    continue;
                }
                std::string relative_id = dir_name + "/" + entry.path().filename().string();
                auto descriptor = parse_shard_file(category, entry.path(), relative_id);
                if (!descriptor) {
                    WARN("Skipping unrecognised file " << relative_id);
                    ++skipped;
                    continue;
                }
                next->shards.push_back(std::move(*descriptor));
            }
        }
    } catch (const std::filesystem::filesystem_error& e) {
        ERROR("Catalog scan failed: " << e.what());
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                std::string("Catalog scan failed: ") + e.what(), "ShardCatalog");
    }

    std::sort(next->shards.begin(), next->shards.end(),
              [](const ShardDescriptor& a, const ShardDescriptor& b) {
                  if (a.category != b.category)
                      return a.category < b.category;
                  if (a.symbol != b.symbol)
                      return a.symbol < b.symbol;
                  return coverage_order(a, b);
              });
    next->built_at = std::chrono::system_clock::now();

    size_t count = next->shards.size();
    std::shared_ptr<const Snapshot> published = std::move(next);
    std::atomic_store(&snapshot_, published);

    INFO("Catalog refreshed from " << root_.string() << ": " << count << " shards, " << skipped
                                   << " skipped");
    return Result<void>();
}

Result<std::vector<ShardDescriptor>> ShardCatalog::resolve(ShardCategory category,
                                                           const std::string& symbol,
                                                           const Granularity& granularity,
                                                           const TimeRange& range) const {
    if (!range.is_valid()) {
        return make_error<std::vector<ShardDescriptor>>(
            ErrorCode::INVALID_RANGE, "Range end precedes start", "ShardCatalog");
    }

    auto snap = snapshot();
    std::string wanted = to_upper(symbol);

    bool symbol_known = false;
    std::vector<ShardDescriptor> result;
    for (const auto& shard : snap->shards) {
        if (shard.category != category || shard.symbol != wanted ||
            shard.granularity != granularity) {
            continue;
        }
        symbol_known = true;
        if (shard.coverage.overlaps(range)) {
            result.push_back(shard);
        }
    }

    if (!symbol_known) {
        return make_error<std::vector<ShardDescriptor>>(
            ErrorCode::NOT_FOUND,
            "No " + granularity.to_string() + " shards for " + category_to_string(category) +
                "/" + wanted,
            "ShardCatalog");
    }
    if (result.empty()) {
        return make_error<std::vector<ShardDescriptor>>(
            ErrorCode::INVALID_RANGE,
            "No shard coverage for " + wanted + " between " + core::format_timestamp(range.start) +
                " and " + core::format_timestamp(range.end),
            "ShardCatalog");
    }

    std::sort(result.begin(), result.end(), coverage_order);
    return Result<std::vector<ShardDescriptor>>(std::move(result));
}

Result<std::vector<ShardDescriptor>> ShardCatalog::resolve_options(const std::string& underlying,
                                                                   const TimeRange& range) const {
    if (!range.is_valid()) {
        return make_error<std::vector<ShardDescriptor>>(
            ErrorCode::INVALID_RANGE, "Range end precedes start", "ShardCatalog");
    }

    auto snap = snapshot();
    std::string wanted = to_upper(underlying);

    bool underlying_known = false;
    std::vector<ShardDescriptor> result;
    for (const auto& shard : snap->shards) {
        if (shard.category != ShardCategory::OPTIONS || shard.symbol != wanted) {
            continue;
        }
        underlying_known = true;
        if (shard.coverage.overlaps(range)) {
            result.push_back(shard);
        }
    }

    if (!underlying_known) {
        return make_error<std::vector<ShardDescriptor>>(
            ErrorCode::NOT_FOUND, "No option shards for " + wanted, "ShardCatalog");
    }
    if (result.empty()) {
        return make_error<std::vector<ShardDescriptor>>(
            ErrorCode::INVALID_RANGE,
            "No option shard for " + wanted + " covers " + core::format_date(range.start) +
                " to " + core::format_date(range.end),
            "ShardCatalog");
    }

    std::sort(result.begin(), result.end(), coverage_order);
    return Result<std::vector<ShardDescriptor>>(std::move(result));
}

std::vector<Granularity> ShardCatalog::granularities(ShardCategory category,
                                                     const std::string& symbol) const {
    auto snap = snapshot();
    std::string wanted = to_upper(symbol);

    std::set<int64_t> widths;
    for (const auto& shard : snap->shards) {
        if (shard.category == category && shard.symbol == wanted) {
            widths.insert(shard.granularity.millis());
        }
    }

    std::vector<Granularity> result;
    for (int64_t width : widths) {
        result.emplace_back(width);
    }
    return result;
}

std::vector<Granularity> ShardCatalog::granularities(ShardCategory category,
                                                     const std::string& symbol,
                                                     const TimeRange& range) const {
    auto snap = snapshot();
    std::string wanted = to_upper(symbol);

    std::set<int64_t> widths;
    for (const auto& shard : snap->shards) {
        if (shard.category == category && shard.symbol == wanted &&
            shard.coverage.overlaps(range)) {
            widths.insert(shard.granularity.millis());
        }
    }

    std::vector<Granularity> result;
    for (int64_t width : widths) {
        result.emplace_back(width);
    }
    return result;
}

std::vector<ShardCategory> ShardCatalog::categories_for(const std::string& symbol) const {
    auto snap = snapshot();
    std::string wanted = to_upper(symbol);

    std::vector<ShardCategory> result;
    for (ShardCategory category : BAR_CATEGORIES) {
        bool present = std::any_of(snap->shards.begin(), snap->shards.end(),
                                   [&](const ShardDescriptor& shard) {
                                       return shard.category == category && shard.symbol == wanted;
                                   });
        if (present) {
            result.push_back(category);
        }
    }
    return result;
}

std::vector<ShardDescriptor> ShardCatalog::shards() const {
    return snapshot()->shards;
}

size_t ShardCatalog::size() const {
    return snapshot()->shards.size();
}

CatalogStatistics ShardCatalog::statistics() const {
    auto snap = snapshot();

    CatalogStatistics stats;
    stats.shard_count = snap->shards.size();
    stats.built_at = snap->built_at;
    for (const auto& shard : snap->shards) {
        stats.total_size_bytes += shard.size_hint;
        stats.shards_per_category[category_to_string(shard.category)]++;

        std::string key = category_to_string(shard.category) + "/" + shard.symbol;
        auto it = stats.coverage_per_symbol.find(key);
        if (it == stats.coverage_per_symbol.end()) {
            stats.coverage_per_symbol.emplace(key, shard.coverage);
        } else {
            it->second.start = std::min(it->second.start, shard.coverage.start);
            it->second.end = std::max(it->second.end, shard.coverage.end);
        }
    }
    return stats;
}

}  // namespace histshard
