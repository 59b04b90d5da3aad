#pragma once

#include <pivot/catalog/rollup.hpp>
#include <pivot/catalog/schema.hpp>

#include <string>
#include <vector>

namespace pivot {

inline constexpr int kExactMatchScore = 150;
inline constexpr int kDateReaggregationScore = 100;
inline constexpr int kDistinctReaggregationScore = 80;
inline constexpr int kRejectedScore = -1;

struct RouterOptions {
    /// Treat every volume metric as distinct-like, not only COUNT DISTINCT ones.
    bool conservative_distinct = false;
};

/// Dimensions grouped on, metrics requested, dimensions only filtered on.
struct RouteQuery {
    std::vector<std::string> dimensions;
    std::vector<std::string> metrics;
    std::vector<std::string> filter_dimensions;
};

/// Eligibility of one rollup for one query.
struct RollupScore {
    std::string rollup_id;
    std::vector<std::string> dimensions;
    RollupStatus status = RollupStatus::Pending;
    int score = kRejectedScore;
    bool can_use = false;
    bool needs_reaggregation = false;
    std::string reason;
    std::vector<std::string> missing_dimensions;
    std::vector<std::string> missing_metrics;
};

/// Outcome of routing one query. Immutable once built.
class RouteDecision {
   public:
    struct Fields {
        bool use_rollup = false;
        std::string rollup_id;
        std::string table_path;
        bool needs_reaggregation = false;
        int score = kRejectedScore;
        std::string reason;
        std::vector<std::string> metrics_available;
        std::vector<std::string> metrics_unavailable;
        std::vector<std::string> required_dimensions;
        std::vector<RollupScore> candidates;
    };

    explicit RouteDecision(Fields fields) : fields_(std::move(fields)) {}

    [[nodiscard]] auto use_rollup() const noexcept -> bool { return fields_.use_rollup; }
    [[nodiscard]] auto rollup_id() const noexcept -> const std::string& { return fields_.rollup_id; }
    /// Store table of the chosen rollup; empty when routing fell through.
    [[nodiscard]] auto table_path() const noexcept -> const std::string& {
        return fields_.table_path;
    }
    [[nodiscard]] auto needs_reaggregation() const noexcept -> bool {
        return fields_.needs_reaggregation;
    }
    [[nodiscard]] auto score() const noexcept -> int { return fields_.score; }
    [[nodiscard]] auto reason() const noexcept -> const std::string& { return fields_.reason; }
    [[nodiscard]] auto metrics_available() const noexcept -> const std::vector<std::string>& {
        return fields_.metrics_available;
    }
    [[nodiscard]] auto metrics_unavailable() const noexcept -> const std::vector<std::string>& {
        return fields_.metrics_unavailable;
    }
    /// Sorted union of grouped and filtered dimensions; set only on a required-rollup miss.
    [[nodiscard]] auto required_dimensions() const noexcept -> const std::vector<std::string>& {
        return fields_.required_dimensions;
    }
    /// Every rollup scored, best first; set only on a required-rollup miss.
    [[nodiscard]] auto candidates() const noexcept -> const std::vector<RollupScore>& {
        return fields_.candidates;
    }

   private:
    Fields fields_;
};

/// Picks the cheapest rollup able to answer a query.
///
/// A rollup qualifies when it carries every grouped and filtered dimension
/// and stores every volume metric the query needs. Extra rollup dimensions
/// are only tolerated when they are exactly {date}, in which case the store
/// re-sums the per-date rows. Decisions read the catalogs at call time and
/// are never cached.
class QueryRouter {
   public:
    QueryRouter(const SchemaCatalog& schema, const RollupCatalog& rollups,
                RouterOptions options = {});

    [[nodiscard]] auto route(const RouteQuery& query, bool require_rollup) const -> RouteDecision;

    [[nodiscard]] auto score(const Rollup& rollup, const RouteQuery& query) const -> RollupScore;

    /// Scores for every registered rollup, best first, ties in registration order.
    [[nodiscard]] auto diagnose(const RouteQuery& query) const -> std::vector<RollupScore>;

    /// Requested metrics that are distinct-like.
    [[nodiscard]] auto distinct_metrics(const std::vector<std::string>& metrics) const
        -> std::vector<std::string>;

    /// Requested volume metrics plus the volume leaves of requested derived
    /// metrics, in catalog order.
    [[nodiscard]] auto required_volume_metrics(const std::vector<std::string>& metrics) const
        -> std::vector<std::string>;

    /// Date-only rollup used as the inflation baseline.
    [[nodiscard]] auto baseline() const -> const Rollup* { return rollups_->baseline(); }

   private:
    const SchemaCatalog* schema_;
    const RollupCatalog* rollups_;
    RouterOptions options_;
};

}  // namespace pivot
