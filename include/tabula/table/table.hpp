#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tabula::table {

enum class ColumnType : std::uint8_t {
    Int64 = 1,
    Float64 = 2,
    Bool = 3,
    Utf8 = 4,
    Binary = 5
};

[[nodiscard]] std::string_view column_type_name(ColumnType type) noexcept;
[[nodiscard]] bool is_valid_column_type(std::uint8_t raw) noexcept;

struct Field final {
    std::string name{};
    ColumnType type = ColumnType::Int64;
    bool nullable = false;

    bool operator==(const Field&) const = default;
};

using Schema = std::vector<Field>;

// Utf8 and Binary share string storage; Bool is stored one byte per row.
using ColumnValues = std::variant<std::vector<std::int64_t>,
                                  std::vector<double>,
                                  std::vector<std::uint8_t>,
                                  std::vector<std::string>>;

class Column final {
public:
    Column() = default;

    static Column int64(std::vector<std::int64_t> values, std::vector<std::uint8_t> validity = {});
    static Column float64(std::vector<double> values, std::vector<std::uint8_t> validity = {});
    static Column boolean(std::vector<std::uint8_t> values, std::vector<std::uint8_t> validity = {});
    static Column utf8(std::vector<std::string> values, std::vector<std::uint8_t> validity = {});
    static Column binary(std::vector<std::string> values, std::vector<std::uint8_t> validity = {});
    static Column empty(ColumnType type);

    [[nodiscard]] ColumnType type() const noexcept;
    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] bool is_null(std::size_t row) const noexcept;
    [[nodiscard]] std::size_t null_count() const noexcept;

    [[nodiscard]] const std::vector<std::int64_t>& int64_values() const;
    [[nodiscard]] const std::vector<double>& float64_values() const;
    [[nodiscard]] const std::vector<std::uint8_t>& bool_values() const;
    [[nodiscard]] const std::vector<std::string>& string_values() const;

    [[nodiscard]] Column slice(std::size_t offset, std::size_t length) const;
    void append(const Column& other);

    bool operator==(const Column& other) const;

private:
    Column(ColumnType type, ColumnValues values, std::vector<std::uint8_t> validity);

    ColumnType type_ = ColumnType::Int64;
    ColumnValues values_{std::vector<std::int64_t>{}};
    // Empty when every row is valid; otherwise one entry per row, non-zero meaning valid.
    std::vector<std::uint8_t> validity_{};
};

class Table final {
public:
    Table() = default;
    Table(Schema schema, std::vector<Column> columns);

    [[nodiscard]] const Schema& schema() const noexcept;
    [[nodiscard]] std::size_t num_rows() const noexcept;
    [[nodiscard]] std::size_t num_columns() const noexcept;
    [[nodiscard]] const Column& column(std::size_t index) const;

    [[nodiscard]] Table slice(std::size_t offset, std::size_t length) const;

    static Table concatenate(const std::vector<Table>& tables);

    bool operator==(const Table& other) const;

private:
    Schema schema_{};
    std::vector<Column> columns_{};
    std::size_t num_rows_ = 0U;
};

}  // namespace tabula::table
