#include <pivot/store/csv.hpp>

#include "test_support.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

using pivot::testing::string_at;

namespace {

auto write_csv(const std::filesystem::path& path, const char* content) {
    std::ofstream out(path);
    out << content;
}

auto tmp(const char* name) -> std::filesystem::path {
    return std::filesystem::temp_directory_path() / name;
}

auto is_null_at(const pivot::Table& table, const char* name, std::size_t row) -> bool {
    const auto* entry = table.find_entry(name);
    REQUIRE(entry != nullptr);
    return pivot::is_null(*entry, row);
}

}  // namespace

TEST_CASE("Read simple CSV - int and string columns", "[store][csv]") {
    auto path = tmp("pivot_test_simple.csv");
    write_csv(path, "queries,country\n10,DE\n20,FR\n30,DE\n");

    auto table = pivot::read_csv(path.string());
    REQUIRE(table.has_value());
    const auto* queries = std::get_if<pivot::Column<std::int64_t>>(table->find("queries"));
    REQUIRE(queries != nullptr);
    REQUIRE(queries->size() == 3);
    REQUIRE((*queries)[2] == 30);
    REQUIRE(string_at(*table, "country", 1) == "FR");
}

TEST_CASE("Read CSV - float and date column detection", "[store][csv]") {
    auto path = tmp("pivot_test_types.csv");
    write_csv(path, "date,ctr,mixed\n2024-03-01,1,1\n2024-03-02,0.25,x\n");

    auto table = pivot::read_csv(path.string());
    REQUIRE(table.has_value());
    const auto* dates = std::get_if<pivot::Column<pivot::Date>>(table->find("date"));
    REQUIRE(dates != nullptr);
    REQUIRE((*dates)[1] == pivot::date_from_ymd(2024, 3, 2));

    const auto* ctr = std::get_if<pivot::Column<double>>(table->find("ctr"));
    REQUIRE(ctr != nullptr);
    REQUIRE((*ctr)[0] == Catch::Approx(1.0));
    REQUIRE((*ctr)[1] == Catch::Approx(0.25));

    REQUIRE(std::holds_alternative<pivot::Column<std::string>>(*table->find("mixed")));
    REQUIRE(string_at(*table, "mixed", 0) == "1");
}

TEST_CASE("Read CSV - empty cells are null", "[store][csv]") {
    auto path = tmp("pivot_test_nulls.csv");
    write_csv(path, "country,queries,note\r\nDE,10,\r\n,20,\r\n\r\n");

    auto table = pivot::read_csv(path.string());
    REQUIRE(table.has_value());
    REQUIRE(table->rows() == 2);
    REQUIRE_FALSE(is_null_at(*table, "country", 0));
    REQUIRE(is_null_at(*table, "country", 1));
    REQUIRE_FALSE(is_null_at(*table, "queries", 1));
    REQUIRE(is_null_at(*table, "note", 0));
    REQUIRE(std::holds_alternative<pivot::Column<std::string>>(*table->find("note")));
}

TEST_CASE("Read CSV - errors", "[store][csv]") {
    SECTION("missing file") {
        auto table = pivot::read_csv("/nonexistent/pivot.csv");
        REQUIRE_FALSE(table.has_value());
        REQUIRE(table.error() == "failed to open csv: /nonexistent/pivot.csv");
    }

    SECTION("ragged row") {
        auto path = tmp("pivot_test_ragged.csv");
        write_csv(path, "a,b\n1,2\n3\n");
        auto table = pivot::read_csv(path.string());
        REQUIRE_FALSE(table.has_value());
        REQUIRE(table.error() == path.string() + ":3: expected 2 columns, found 1");
    }

    SECTION("empty file") {
        auto path = tmp("pivot_test_empty.csv");
        write_csv(path, "");
        auto table = pivot::read_csv(path.string());
        REQUIRE_FALSE(table.has_value());
        REQUIRE(table.error().starts_with("csv is empty"));
    }
}

TEST_CASE("Read CSV - bundled search events", "[store][csv]") {
    auto table = pivot::read_csv(std::string(PIVOT_TEST_DATA_DIR) + "/search_events.csv");
    REQUIRE(table.has_value());
    REQUIRE(table->rows() == 5);
    REQUIRE(table->columns.size() == 7);
    REQUIRE(std::holds_alternative<pivot::Column<pivot::Date>>(*table->find("date")));
    REQUIRE(std::holds_alternative<pivot::Column<std::int64_t>>(*table->find("queries")));
    REQUIRE(is_null_at(*table, "country", 3));
}
