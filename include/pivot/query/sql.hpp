#pragma once

#include <pivot/query/fetch_spec.hpp>

#include <cstdint>
#include <string>

namespace pivot {

/// Render a fetch as a BigQuery-dialect statement.
[[nodiscard]] auto render_sql(const GroupedFetchSpec& spec) -> std::string;

/// Stable 64-bit FNV-1a hash of the rendered statement. Identical fetches
/// share a fingerprint, so it can key an external result cache.
[[nodiscard]] auto fingerprint(const GroupedFetchSpec& spec) -> std::uint64_t;

}  // namespace pivot
