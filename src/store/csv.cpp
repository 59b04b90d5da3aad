#include <pivot/store/csv.hpp>

#include <fmt/format.h>

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace pivot {

namespace {

auto split_line(const std::string& line) -> std::vector<std::string> {
    std::vector<std::string> fields;
    std::string field;
    std::stringstream ss(line);
    while (std::getline(ss, field, ',')) {
        if (!field.empty() && field.back() == '\r') {
            field.pop_back();
        }
        fields.push_back(field);
    }
    if (!line.empty() && line.back() == ',') {
        fields.emplace_back();
    }
    return fields;
}

auto try_parse_int(const std::string& text, std::int64_t& out) -> bool {
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto result = std::from_chars(begin, end, out);
    return result.ec == std::errc() && result.ptr == end;
}

auto try_parse_double(const std::string& text, double& out) -> bool {
    char* end = nullptr;
    out = std::strtod(text.c_str(), &end);
    return end != text.c_str() && *end == '\0';
}

}  // namespace

auto read_csv(std::string_view path) -> std::expected<Table, std::string> {
    std::ifstream input{std::string(path)};
    if (!input) {
        return std::unexpected(fmt::format("failed to open csv: {}", path));
    }

    std::string header_line;
    if (!std::getline(input, header_line)) {
        return std::unexpected(fmt::format("csv is empty: {}", path));
    }

    auto headers = split_line(header_line);
    if (headers.empty()) {
        return std::unexpected(fmt::format("csv has no headers: {}", path));
    }

    std::vector<std::vector<std::string>> columns(headers.size());
    std::string line;
    std::size_t line_no = 1;
    while (std::getline(input, line)) {
        ++line_no;
        if (line.empty() || line == "\r") {
            continue;
        }
        auto fields = split_line(line);
        if (fields.size() != headers.size()) {
            return std::unexpected(fmt::format("{}:{}: expected {} columns, found {}", path,
                                               line_no, headers.size(), fields.size()));
        }
        for (std::size_t i = 0; i < fields.size(); ++i) {
            columns[i].push_back(std::move(fields[i]));
        }
    }

    Table table;
    for (std::size_t i = 0; i < headers.size(); ++i) {
        const auto& cells = columns[i];
        std::vector<bool> validity;
        validity.reserve(cells.size());
        bool has_null = false;
        bool has_value = false;
        bool all_int = true;
        bool all_double = true;
        bool all_date = true;
        std::vector<std::int64_t> ints;
        std::vector<double> doubles;
        std::vector<Date> dates;
        ints.reserve(cells.size());
        doubles.reserve(cells.size());
        dates.reserve(cells.size());
        for (const auto& value : cells) {
            if (value.empty()) {
                validity.push_back(false);
                has_null = true;
                ints.push_back(0);
                doubles.push_back(0.0);
                dates.push_back(Date{});
                continue;
            }
            validity.push_back(true);
            has_value = true;
            std::int64_t int_value = 0;
            double double_value = 0.0;
            if (all_int && try_parse_int(value, int_value)) {
                ints.push_back(int_value);
                doubles.push_back(static_cast<double>(int_value));
                all_date = false;
                continue;
            }
            all_int = false;
            if (all_double && try_parse_double(value, double_value)) {
                doubles.push_back(double_value);
                all_date = false;
                continue;
            }
            all_double = false;
            if (auto date = parse_date(value); all_date && date.has_value()) {
                dates.push_back(*date);
                continue;
            }
            all_date = false;
        }

        ColumnValue column;
        if (has_value && all_int) {
            column = Column<std::int64_t>{std::move(ints)};
        } else if (has_value && all_double) {
            column = Column<double>{std::move(doubles)};
        } else if (has_value && all_date) {
            column = Column<Date>{std::move(dates)};
        } else {
            Column<std::string> strings;
            strings.reserve(cells.size());
            for (const auto& value : cells) {
                strings.push_back(value);
            }
            column = std::move(strings);
        }
        if (has_null) {
            table.add_column(headers[i], std::move(column), std::move(validity));
        } else {
            table.add_column(headers[i], std::move(column));
        }
    }

    return table;
}

}  // namespace pivot
