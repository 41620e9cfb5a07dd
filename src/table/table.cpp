#include "tabula/table/table.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace tabula::table {
namespace {

template <typename T>
std::vector<T> slice_vector(const std::vector<T>& values, std::size_t offset, std::size_t length)
{
    const auto begin = values.begin() + static_cast<std::ptrdiff_t>(offset);
    return std::vector<T>(begin, begin + static_cast<std::ptrdiff_t>(length));
}

std::size_t values_size(const ColumnValues& values) noexcept
{
    return std::visit([](const auto& typed) { return typed.size(); }, values);
}

bool storage_matches(ColumnType type, const ColumnValues& values) noexcept
{
    switch (type) {
    case ColumnType::Int64:
        return std::holds_alternative<std::vector<std::int64_t>>(values);
    case ColumnType::Float64:
        return std::holds_alternative<std::vector<double>>(values);
    case ColumnType::Bool:
        return std::holds_alternative<std::vector<std::uint8_t>>(values);
    case ColumnType::Utf8:
    case ColumnType::Binary:
        return std::holds_alternative<std::vector<std::string>>(values);
    }
    return false;
}

}  // namespace

std::string_view column_type_name(ColumnType type) noexcept
{
    switch (type) {
    case ColumnType::Int64:
        return "int64";
    case ColumnType::Float64:
        return "float64";
    case ColumnType::Bool:
        return "bool";
    case ColumnType::Utf8:
        return "utf8";
    case ColumnType::Binary:
        return "binary";
    }
    return "unknown";
}

bool is_valid_column_type(std::uint8_t raw) noexcept
{
    return raw >= static_cast<std::uint8_t>(ColumnType::Int64) && raw <= static_cast<std::uint8_t>(ColumnType::Binary);
}

Column::Column(ColumnType type, ColumnValues values, std::vector<std::uint8_t> validity)
    : type_{type}
    , values_{std::move(values)}
    , validity_{std::move(validity)}
{
    if (!storage_matches(type_, values_)) {
        throw std::invalid_argument{"Column storage does not match column type"};
    }
    if (!validity_.empty() && validity_.size() != values_size(values_)) {
        throw std::invalid_argument{"Column validity length must match value count"};
    }
    if (std::all_of(validity_.begin(), validity_.end(), [](std::uint8_t flag) { return flag != 0U; })) {
        validity_.clear();
    }
}

Column Column::int64(std::vector<std::int64_t> values, std::vector<std::uint8_t> validity)
{
    return Column{ColumnType::Int64, std::move(values), std::move(validity)};
}

Column Column::float64(std::vector<double> values, std::vector<std::uint8_t> validity)
{
    return Column{ColumnType::Float64, std::move(values), std::move(validity)};
}

Column Column::boolean(std::vector<std::uint8_t> values, std::vector<std::uint8_t> validity)
{
    return Column{ColumnType::Bool, std::move(values), std::move(validity)};
}

Column Column::utf8(std::vector<std::string> values, std::vector<std::uint8_t> validity)
{
    return Column{ColumnType::Utf8, std::move(values), std::move(validity)};
}

Column Column::binary(std::vector<std::string> values, std::vector<std::uint8_t> validity)
{
    return Column{ColumnType::Binary, std::move(values), std::move(validity)};
}

Column Column::empty(ColumnType type)
{
    switch (type) {
    case ColumnType::Int64:
        return int64({});
    case ColumnType::Float64:
        return float64({});
    case ColumnType::Bool:
        return boolean({});
    case ColumnType::Utf8:
        return utf8({});
    case ColumnType::Binary:
        return binary({});
    }
    throw std::invalid_argument{"Unknown column type"};
}

ColumnType Column::type() const noexcept
{
    return type_;
}

std::size_t Column::size() const noexcept
{
    return values_size(values_);
}

bool Column::is_null(std::size_t row) const noexcept
{
    return !validity_.empty() && row < validity_.size() && validity_[row] == 0U;
}

std::size_t Column::null_count() const noexcept
{
    return static_cast<std::size_t>(std::count(validity_.begin(), validity_.end(), std::uint8_t{0U}));
}

const std::vector<std::int64_t>& Column::int64_values() const
{
    if (type_ != ColumnType::Int64) {
        throw std::logic_error{"Column::int64_values requires an int64 column"};
    }
    return std::get<std::vector<std::int64_t>>(values_);
}

const std::vector<double>& Column::float64_values() const
{
    if (type_ != ColumnType::Float64) {
        throw std::logic_error{"Column::float64_values requires a float64 column"};
    }
    return std::get<std::vector<double>>(values_);
}

const std::vector<std::uint8_t>& Column::bool_values() const
{
    if (type_ != ColumnType::Bool) {
        throw std::logic_error{"Column::bool_values requires a bool column"};
    }
    return std::get<std::vector<std::uint8_t>>(values_);
}

const std::vector<std::string>& Column::string_values() const
{
    if (type_ != ColumnType::Utf8 && type_ != ColumnType::Binary) {
        throw std::logic_error{"Column::string_values requires a utf8 or binary column"};
    }
    return std::get<std::vector<std::string>>(values_);
}

Column Column::slice(std::size_t offset, std::size_t length) const
{
    if (offset > size() || length > size() - offset) {
        throw std::out_of_range{"Column::slice range exceeds column length"};
    }

    auto values = std::visit(
        [&](const auto& typed) -> ColumnValues { return slice_vector(typed, offset, length); }, values_);
    std::vector<std::uint8_t> validity{};
    if (!validity_.empty()) {
        validity = slice_vector(validity_, offset, length);
    }
    return Column{type_, std::move(values), std::move(validity)};
}

void Column::append(const Column& other)
{
    if (other.type_ != type_) {
        throw std::invalid_argument{"Column::append requires matching column types"};
    }

    const auto existing_rows = size();
    if (!validity_.empty() || !other.validity_.empty()) {
        if (validity_.empty()) {
            validity_.assign(existing_rows, 1U);
        }
        if (other.validity_.empty()) {
            validity_.insert(validity_.end(), other.size(), 1U);
        } else {
            validity_.insert(validity_.end(), other.validity_.begin(), other.validity_.end());
        }
    }

    std::visit(
        [&](auto& typed) {
            using Vector = std::decay_t<decltype(typed)>;
            const auto& source = std::get<Vector>(other.values_);
            typed.insert(typed.end(), source.begin(), source.end());
        },
        values_);
}

bool Column::operator==(const Column& other) const
{
    if (type_ != other.type_ || size() != other.size() || values_ != other.values_) {
        return false;
    }
    for (std::size_t row = 0U; row < size(); ++row) {
        if (is_null(row) != other.is_null(row)) {
            return false;
        }
    }
    return true;
}

Table::Table(Schema schema, std::vector<Column> columns)
    : schema_{std::move(schema)}
    , columns_{std::move(columns)}
{
    if (schema_.size() != columns_.size()) {
        throw std::invalid_argument{"Table schema has " + std::to_string(schema_.size()) + " fields but "
                                    + std::to_string(columns_.size()) + " columns were supplied"};
    }

    num_rows_ = columns_.empty() ? 0U : columns_.front().size();
    for (std::size_t index = 0U; index < columns_.size(); ++index) {
        const auto& field = schema_[index];
        const auto& column = columns_[index];
        if (column.type() != field.type) {
            throw std::invalid_argument{"Column '" + field.name + "' expected type "
                                        + std::string{column_type_name(field.type)} + " but holds "
                                        + std::string{column_type_name(column.type())}};
        }
        if (column.size() != num_rows_) {
            throw std::invalid_argument{"Column '" + field.name + "' has " + std::to_string(column.size())
                                        + " values, expected " + std::to_string(num_rows_)};
        }
        if (!field.nullable && column.null_count() != 0U) {
            throw std::invalid_argument{"Column '" + field.name + "' is not nullable but contains nulls"};
        }
    }
}

const Schema& Table::schema() const noexcept
{
    return schema_;
}

std::size_t Table::num_rows() const noexcept
{
    return num_rows_;
}

std::size_t Table::num_columns() const noexcept
{
    return columns_.size();
}

const Column& Table::column(std::size_t index) const
{
    if (index >= columns_.size()) {
        throw std::out_of_range{"Table::column index out of range"};
    }
    return columns_[index];
}

Table Table::slice(std::size_t offset, std::size_t length) const
{
    if (offset > num_rows_ || length > num_rows_ - offset) {
        throw std::out_of_range{"Table::slice range exceeds table length"};
    }

    std::vector<Column> columns;
    columns.reserve(columns_.size());
    for (const auto& column : columns_) {
        columns.push_back(column.slice(offset, length));
    }
    return Table{schema_, std::move(columns)};
}

Table Table::concatenate(const std::vector<Table>& tables)
{
    if (tables.empty()) {
        return Table{};
    }

    const auto& schema = tables.front().schema();
    std::vector<Column> columns;
    columns.reserve(schema.size());
    for (const auto& field : schema) {
        columns.push_back(Column::empty(field.type));
    }

    for (const auto& table : tables) {
        if (table.schema() != schema) {
            throw std::invalid_argument{"Table::concatenate requires identical schemas"};
        }
        for (std::size_t index = 0U; index < columns.size(); ++index) {
            columns[index].append(table.columns_[index]);
        }
    }

    return Table{schema, std::move(columns)};
}

bool Table::operator==(const Table& other) const
{
    return num_rows_ == other.num_rows_ && schema_ == other.schema_ && columns_ == other.columns_;
}

}  // namespace tabula::table
