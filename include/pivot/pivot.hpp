#pragma once

/// Convenience umbrella header for the pivot library.

#include <pivot/catalog/rollup.hpp>
#include <pivot/catalog/schema.hpp>
#include <pivot/core/table.hpp>
#include <pivot/engine/pivot_service.hpp>
#include <pivot/formula/parser.hpp>
#include <pivot/query/sql.hpp>
#include <pivot/router/router.hpp>
#include <pivot/store/csv.hpp>
#include <pivot/store/memory_store.hpp>
