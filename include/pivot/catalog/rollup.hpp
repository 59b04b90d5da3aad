#pragma once

#include <pivot/core/time.hpp>

#include <chrono>
#include <cstdint>
#include <expected>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pivot {

enum class RollupStatus : std::uint8_t {
    Pending,
    Creating,
    Ready,
    Refreshing,
    Error,
    Stale,
};

[[nodiscard]] auto to_string(RollupStatus status) -> std::string_view;
[[nodiscard]] auto parse_rollup_status(std::string_view text) -> std::optional<RollupStatus>;

/// Statistics recorded by the last successful build or refresh.
struct RollupStats {
    std::int64_t row_count = 0;
    std::int64_t size_bytes = 0;
    std::optional<Date> min_date;
    std::optional<Date> max_date;
    std::int64_t refresh_duration_seconds = 0;
    std::optional<std::chrono::sys_seconds> refreshed_at;
};

/// Pre-aggregated table grouped by a fixed dimension set.
///
/// Status changes only through the transition methods; an illegal transition
/// leaves the rollup untouched and returns an error.
class Rollup {
   public:
    Rollup(std::string id, std::string table_path, std::vector<std::string> dimensions,
           RollupStatus status = RollupStatus::Pending);

    [[nodiscard]] auto id() const noexcept -> const std::string& { return id_; }
    [[nodiscard]] auto table_path() const noexcept -> const std::string& { return table_path_; }
    [[nodiscard]] auto dimensions() const noexcept -> const std::vector<std::string>& {
        return dimensions_;
    }
    [[nodiscard]] auto status() const noexcept -> RollupStatus { return status_; }
    [[nodiscard]] auto is_ready() const noexcept -> bool { return status_ == RollupStatus::Ready; }
    [[nodiscard]] auto stats() const noexcept -> const RollupStats& { return stats_; }
    [[nodiscard]] auto error_message() const noexcept -> const std::string& {
        return error_message_;
    }

    [[nodiscard]] auto has_dimension(std::string_view dimension) const -> bool;

    /// Restrict the stored volume metrics. Without a list the rollup stores
    /// every volume metric of its table.
    void set_metrics(std::vector<std::string> metrics) { metrics_ = std::move(metrics); }
    [[nodiscard]] auto metrics() const noexcept -> const std::optional<std::vector<std::string>>& {
        return metrics_;
    }
    [[nodiscard]] auto stores_metric(std::string_view metric) const -> bool;

    /// pending | error -> creating
    auto begin_build() -> std::expected<void, std::string>;
    /// pending | ready | error | stale -> refreshing
    auto begin_refresh() -> std::expected<void, std::string>;
    /// creating | refreshing -> ready
    auto mark_ready(RollupStats stats) -> std::expected<void, std::string>;
    /// creating | refreshing -> error; the last good stats are kept.
    auto mark_error(std::string message) -> std::expected<void, std::string>;
    /// ready -> stale
    auto mark_stale() -> std::expected<void, std::string>;

   private:
    auto transition(std::initializer_list<RollupStatus> from, RollupStatus to)
        -> std::expected<void, std::string>;

    std::string id_;
    std::string table_path_;
    std::vector<std::string> dimensions_;
    std::optional<std::vector<std::string>> metrics_;
    RollupStatus status_ = RollupStatus::Pending;
    RollupStats stats_;
    std::string error_message_;
};

struct RollupRecommendation {
    std::vector<std::string> dimensions;
    std::string suggested_id;
    std::string reason;
};

/// Rollups of one source table, in registration order.
class RollupCatalog {
   public:
    RollupCatalog() = default;
    explicit RollupCatalog(std::string source_table) : source_table_(std::move(source_table)) {}

    [[nodiscard]] auto source_table() const noexcept -> const std::string& {
        return source_table_;
    }

    /// Register a rollup; ids are unique.
    auto add(Rollup rollup) -> std::expected<void, std::string>;

    [[nodiscard]] auto rollups() const noexcept -> const std::vector<Rollup>& { return rollups_; }
    [[nodiscard]] auto find(std::string_view id) const -> const Rollup*;
    [[nodiscard]] auto find(std::string_view id) -> Rollup*;
    [[nodiscard]] auto ready() const -> std::vector<const Rollup*>;

    /// First ready rollup whose dimensions are exactly {date}.
    [[nodiscard]] auto baseline() const -> const Rollup*;

    /// Dimension combinations with no rollup of the same dimension set.
    [[nodiscard]] auto recommend(const std::vector<std::vector<std::string>>& combinations) const
        -> std::vector<RollupRecommendation>;

   private:
    std::string source_table_;
    std::vector<Rollup> rollups_;
};

}  // namespace pivot
