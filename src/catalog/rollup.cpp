#include <pivot/catalog/rollup.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>

namespace pivot {

auto to_string(RollupStatus status) -> std::string_view {
    switch (status) {
        case RollupStatus::Pending:
            return "pending";
        case RollupStatus::Creating:
            return "creating";
        case RollupStatus::Ready:
            return "ready";
        case RollupStatus::Refreshing:
            return "refreshing";
        case RollupStatus::Error:
            return "error";
        case RollupStatus::Stale:
            return "stale";
    }
    return "unknown";
}

auto parse_rollup_status(std::string_view text) -> std::optional<RollupStatus> {
    for (auto status : {RollupStatus::Pending, RollupStatus::Creating, RollupStatus::Ready,
                        RollupStatus::Refreshing, RollupStatus::Error, RollupStatus::Stale}) {
        if (to_string(status) == text) {
            return status;
        }
    }
    return std::nullopt;
}

Rollup::Rollup(std::string id, std::string table_path, std::vector<std::string> dimensions,
               RollupStatus status)
    : id_(std::move(id)),
      table_path_(std::move(table_path)),
      dimensions_(std::move(dimensions)),
      status_(status) {}

auto Rollup::has_dimension(std::string_view dimension) const -> bool {
    return std::ranges::find(dimensions_, dimension) != dimensions_.end();
}

auto Rollup::stores_metric(std::string_view metric) const -> bool {
    if (!metrics_.has_value()) {
        return true;
    }
    return std::ranges::find(*metrics_, metric) != metrics_->end();
}

auto Rollup::transition(std::initializer_list<RollupStatus> from, RollupStatus to)
    -> std::expected<void, std::string> {
    if (std::ranges::find(from, status_) == from.end()) {
        return std::unexpected(fmt::format("rollup '{}': cannot move from {} to {}", id_,
                                           to_string(status_), to_string(to)));
    }
    spdlog::debug("rollup '{}': {} -> {}", id_, to_string(status_), to_string(to));
    status_ = to;
    return {};
}

auto Rollup::begin_build() -> std::expected<void, std::string> {
    return transition({RollupStatus::Pending, RollupStatus::Error}, RollupStatus::Creating);
}

auto Rollup::begin_refresh() -> std::expected<void, std::string> {
    return transition({RollupStatus::Pending, RollupStatus::Ready, RollupStatus::Error,
                       RollupStatus::Stale},
                      RollupStatus::Refreshing);
}

auto Rollup::mark_ready(RollupStats stats) -> std::expected<void, std::string> {
    auto moved = transition({RollupStatus::Creating, RollupStatus::Refreshing}, RollupStatus::Ready);
    if (!moved.has_value()) {
        return moved;
    }
    stats_ = std::move(stats);
    error_message_.clear();
    return {};
}

auto Rollup::mark_error(std::string message) -> std::expected<void, std::string> {
    auto moved = transition({RollupStatus::Creating, RollupStatus::Refreshing}, RollupStatus::Error);
    if (!moved.has_value()) {
        return moved;
    }
    error_message_ = std::move(message);
    return {};
}

auto Rollup::mark_stale() -> std::expected<void, std::string> {
    return transition({RollupStatus::Ready}, RollupStatus::Stale);
}

auto RollupCatalog::add(Rollup rollup) -> std::expected<void, std::string> {
    if (find(rollup.id()) != nullptr) {
        return std::unexpected(fmt::format("duplicate rollup '{}'", rollup.id()));
    }
    rollups_.push_back(std::move(rollup));
    return {};
}

auto RollupCatalog::find(std::string_view id) const -> const Rollup* {
    auto it = std::ranges::find_if(rollups_, [&](const Rollup& r) { return r.id() == id; });
    return it == rollups_.end() ? nullptr : &*it;
}

auto RollupCatalog::find(std::string_view id) -> Rollup* {
    auto it = std::ranges::find_if(rollups_, [&](const Rollup& r) { return r.id() == id; });
    return it == rollups_.end() ? nullptr : &*it;
}

auto RollupCatalog::ready() const -> std::vector<const Rollup*> {
    std::vector<const Rollup*> out;
    for (const auto& rollup : rollups_) {
        if (rollup.is_ready()) {
            out.push_back(&rollup);
        }
    }
    return out;
}

auto RollupCatalog::baseline() const -> const Rollup* {
    for (const auto& rollup : rollups_) {
        if (rollup.is_ready() && rollup.dimensions().size() == 1 &&
            rollup.dimensions().front() == "date") {
            return &rollup;
        }
    }
    return nullptr;
}

auto RollupCatalog::recommend(const std::vector<std::vector<std::string>>& combinations) const
    -> std::vector<RollupRecommendation> {
    std::set<std::vector<std::string>> existing;
    for (const auto& rollup : rollups_) {
        auto dims = rollup.dimensions();
        std::ranges::sort(dims);
        existing.insert(std::move(dims));
    }

    std::vector<RollupRecommendation> out;
    for (const auto& combination : combinations) {
        auto sorted = combination;
        std::ranges::sort(sorted);
        if (existing.contains(sorted)) {
            continue;
        }
        out.push_back(RollupRecommendation{
            .dimensions = combination,
            .suggested_id = fmt::format("rollup_{}", fmt::join(sorted, "_")),
            .reason = "Frequently queried dimension combination",
        });
    }
    return out;
}

}  // namespace pivot
