#include "tabula/table/chunk_format.hpp"

#include "tabula/common/client_errors.hpp"

#include <algorithm>
#include <bit>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace tabula::table {
namespace {

static_assert(std::endian::native == std::endian::little, "chunk encoding assumes a little-endian host");

constexpr std::size_t kMaxSectionLength = std::numeric_limits<std::uint32_t>::max();

[[nodiscard]] std::uint32_t safe_cast_length(std::size_t length)
{
    if (length > kMaxSectionLength) {
        throw std::length_error{"Chunk section length exceeds 32-bit storage"};
    }
    return static_cast<std::uint32_t>(length);
}

[[nodiscard]] std::size_t align_section(std::size_t offset) noexcept
{
    constexpr std::size_t mask = kChunkSectionAlignment - 1U;
    return (offset + mask) & ~mask;
}

[[nodiscard]] std::size_t bitmap_bytes(std::size_t rows) noexcept
{
    return (rows + 7U) / 8U;
}

template <typename T>
std::span<const std::byte> as_bytes_of(const std::vector<T>& values, std::size_t offset, std::size_t count)
{
    return std::as_bytes(std::span<const T>(values.data() + offset, count));
}

// Fills a chunk presized by encoded_chunk_size. The chunk starts zeroed, so skipped padding stays zero.
class ChunkWriter final {
public:
    explicit ChunkWriter(std::size_t size)
        : chunk_(size)
    {
    }

    std::span<std::byte> allocate(std::size_t size)
    {
        if (size > chunk_.size() - offset_) {
            throw std::logic_error{"encode_chunk overran the size computed by encoded_chunk_size"};
        }
        auto destination = std::span<std::byte>(chunk_).subspan(offset_, size);
        offset_ += size;
        return destination;
    }

    void write(std::span<const std::byte> data)
    {
        auto destination = allocate(data.size());
        std::copy(data.begin(), data.end(), destination.begin());
    }

    void align()
    {
        static_cast<void>(allocate(align_section(offset_) - offset_));
    }

    Chunk finish()
    {
        if (offset_ != chunk_.size()) {
            throw std::logic_error{"encode_chunk wrote fewer bytes than encoded_chunk_size computed"};
        }
        return std::move(chunk_);
    }

private:
    Chunk chunk_;
    std::size_t offset_ = 0U;
};

void write_pod(ChunkWriter& buffer, const void* value, std::size_t size)
{
    auto destination = buffer.allocate(size);
    std::memcpy(destination.data(), value, size);
}

void write_validity(ChunkWriter& buffer, const Column& column, std::size_t row_offset, std::size_t row_count)
{
    auto bitmap = buffer.allocate(bitmap_bytes(row_count));
    std::fill(bitmap.begin(), bitmap.end(), std::byte{0});
    for (std::size_t row = 0U; row < row_count; ++row) {
        if (!column.is_null(row_offset + row)) {
            bitmap[row / 8U] |= std::byte{static_cast<unsigned char>(1U << (row % 8U))};
        }
    }
    buffer.align();
}

void write_strings(ChunkWriter& buffer,
                   const std::vector<std::string>& values,
                   std::size_t row_offset,
                   std::size_t row_count)
{
    std::vector<std::uint32_t> offsets;
    offsets.reserve(row_count + 1U);
    std::size_t total = 0U;
    offsets.push_back(0U);
    for (std::size_t row = 0U; row < row_count; ++row) {
        total += values[row_offset + row].size();
        offsets.push_back(safe_cast_length(total));
    }
    buffer.write(std::as_bytes(std::span<const std::uint32_t>(offsets)));

    for (std::size_t row = 0U; row < row_count; ++row) {
        const auto& value = values[row_offset + row];
        buffer.write(std::as_bytes(std::span<const char>(value.data(), value.size())));
    }
}

void write_column(ChunkWriter& buffer,
                  const Field& field,
                  const Column& column,
                  std::size_t row_offset,
                  std::size_t row_count)
{
    if (field.nullable) {
        write_validity(buffer, column, row_offset, row_count);
    }

    switch (column.type()) {
    case ColumnType::Int64:
        buffer.write(as_bytes_of(column.int64_values(), row_offset, row_count));
        break;
    case ColumnType::Float64:
        buffer.write(as_bytes_of(column.float64_values(), row_offset, row_count));
        break;
    case ColumnType::Bool:
        buffer.write(as_bytes_of(column.bool_values(), row_offset, row_count));
        break;
    case ColumnType::Utf8:
    case ColumnType::Binary:
        write_strings(buffer, column.string_values(), row_offset, row_count);
        break;
    }
    buffer.align();
}

[[noreturn]] void fail_decode(const std::string& detail)
{
    throw_client_error(ClientErrc::InvalidChunk, "Malformed chunk: " + detail);
}

class ChunkReader final {
public:
    explicit ChunkReader(std::span<const std::byte> bytes) noexcept
        : bytes_{bytes}
    {
    }

    std::span<const std::byte> take(std::size_t size, const char* what)
    {
        if (size > remaining()) {
            fail_decode(std::string{what} + " needs " + std::to_string(size) + " bytes, "
                        + std::to_string(remaining()) + " remain");
        }
        auto view = bytes_.subspan(offset_, size);
        offset_ += size;
        return view;
    }

    template <typename T>
    T read(const char* what)
    {
        T value{};
        const auto view = take(sizeof(T), what);
        std::memcpy(&value, view.data(), sizeof(T));
        return value;
    }

    template <typename T>
    std::vector<T> read_array(std::size_t count, const char* what)
    {
        if (count > remaining() / sizeof(T)) {
            fail_decode(std::string{what} + " array of " + std::to_string(count) + " entries exceeds chunk");
        }
        std::vector<T> values(count);
        const auto view = take(count * sizeof(T), what);
        if (!view.empty()) {
            std::memcpy(values.data(), view.data(), view.size());
        }
        return values;
    }

    void align()
    {
        const auto aligned = align_section(offset_);
        if (aligned > bytes_.size()) {
            fail_decode("section padding runs past end of chunk");
        }
        offset_ = aligned;
    }

    [[nodiscard]] std::size_t remaining() const noexcept
    {
        return bytes_.size() - offset_;
    }

private:
    std::span<const std::byte> bytes_{};
    std::size_t offset_ = 0U;
};

std::vector<std::uint8_t> read_validity(ChunkReader& reader, std::size_t row_count)
{
    if (row_count / 8U > reader.remaining()) {
        fail_decode("validity bitmap exceeds chunk");
    }
    const auto bitmap = reader.take(bitmap_bytes(row_count), "validity bitmap");
    std::vector<std::uint8_t> validity(row_count, 1U);
    for (std::size_t row = 0U; row < row_count; ++row) {
        const auto bit = std::to_integer<unsigned>(bitmap[row / 8U]) >> (row % 8U);
        validity[row] = static_cast<std::uint8_t>(bit & 1U);
    }
    reader.align();
    return validity;
}

std::vector<std::string> read_strings(ChunkReader& reader, std::size_t row_count)
{
    if (row_count == std::numeric_limits<std::size_t>::max()) {
        fail_decode("string row count overflows");
    }
    const auto offsets = reader.read_array<std::uint32_t>(row_count + 1U, "string offsets");
    if (offsets.front() != 0U) {
        fail_decode("string offsets must start at zero");
    }
    for (std::size_t index = 1U; index < offsets.size(); ++index) {
        if (offsets[index] < offsets[index - 1U]) {
            fail_decode("string offsets are not monotonic");
        }
    }

    const auto data = reader.take(offsets.back(), "string data");
    std::vector<std::string> values;
    values.reserve(row_count);
    for (std::size_t row = 0U; row < row_count; ++row) {
        const auto begin = static_cast<std::size_t>(offsets[row]);
        const auto length = static_cast<std::size_t>(offsets[row + 1U]) - begin;
        values.emplace_back(reinterpret_cast<const char*>(data.data()) + begin, length);
    }
    return values;
}

Column read_column(ChunkReader& reader, const Field& field, std::size_t row_count)
{
    std::vector<std::uint8_t> validity{};
    if (field.nullable) {
        validity = read_validity(reader, row_count);
    }

    Column column{};
    switch (field.type) {
    case ColumnType::Int64:
        column = Column::int64(reader.read_array<std::int64_t>(row_count, "int64 values"), std::move(validity));
        break;
    case ColumnType::Float64:
        column = Column::float64(reader.read_array<double>(row_count, "float64 values"), std::move(validity));
        break;
    case ColumnType::Bool:
        column = Column::boolean(reader.read_array<std::uint8_t>(row_count, "bool values"), std::move(validity));
        break;
    case ColumnType::Utf8:
        column = Column::utf8(read_strings(reader, row_count), std::move(validity));
        break;
    case ColumnType::Binary:
        column = Column::binary(read_strings(reader, row_count), std::move(validity));
        break;
    }
    reader.align();
    return column;
}

}  // namespace

std::size_t encoded_chunk_size(const Table& table, std::size_t row_offset, std::size_t row_count)
{
    if (row_offset > table.num_rows() || row_count > table.num_rows() - row_offset) {
        throw std::out_of_range{"encoded_chunk_size row range exceeds table length"};
    }

    std::size_t size = sizeof(ChunkHeader);
    for (const auto& field : table.schema()) {
        size += sizeof(ChunkFieldEntry) + field.name.size();
    }
    size = align_section(size);

    for (std::size_t index = 0U; index < table.num_columns(); ++index) {
        const auto& field = table.schema()[index];
        const auto& column = table.column(index);
        if (field.nullable) {
            size = align_section(size + bitmap_bytes(row_count));
        }

        switch (field.type) {
        case ColumnType::Int64:
        case ColumnType::Float64:
            size += row_count * 8U;
            break;
        case ColumnType::Bool:
            size += row_count;
            break;
        case ColumnType::Utf8:
        case ColumnType::Binary: {
            const auto& values = column.string_values();
            size += (row_count + 1U) * sizeof(std::uint32_t);
            for (std::size_t row = 0U; row < row_count; ++row) {
                size += values[row_offset + row].size();
            }
            break;
        }
        }
        size = align_section(size);
    }

    return size;
}

Chunk encode_chunk(const Table& table, std::size_t row_offset, std::size_t row_count)
{
    if (row_offset > table.num_rows() || row_count > table.num_rows() - row_offset) {
        throw std::out_of_range{"encode_chunk row range exceeds table length"};
    }

    ChunkWriter buffer{encoded_chunk_size(table, row_offset, row_count)};

    ChunkHeader header{};
    header.column_count = safe_cast_length(table.num_columns());
    header.row_count = static_cast<std::uint64_t>(row_count);
    write_pod(buffer, &header, sizeof(header));

    for (const auto& field : table.schema()) {
        ChunkFieldEntry entry{};
        entry.type = static_cast<std::uint8_t>(field.type);
        entry.nullable = field.nullable ? 1U : 0U;
        entry.name_length = safe_cast_length(field.name.size());
        write_pod(buffer, &entry, sizeof(entry));
        buffer.write(std::as_bytes(std::span<const char>(field.name.data(), field.name.size())));
    }
    buffer.align();

    for (std::size_t index = 0U; index < table.num_columns(); ++index) {
        write_column(buffer, table.schema()[index], table.column(index), row_offset, row_count);
    }

    return buffer.finish();
}

Chunk encode_chunk(const Table& table)
{
    return encode_chunk(table, 0U, table.num_rows());
}

Table decode_chunk(std::span<const std::byte> chunk)
{
    ChunkReader reader{chunk};
    const auto header = reader.read<ChunkHeader>("chunk header");
    if (header.magic != kChunkMagic) {
        fail_decode("bad magic");
    }
    if (header.version != kChunkFormatVersion) {
        fail_decode("unsupported format version " + std::to_string(header.version));
    }

    const auto column_count = static_cast<std::size_t>(header.column_count);
    const auto row_count = static_cast<std::size_t>(header.row_count);
    if (column_count > reader.remaining() / sizeof(ChunkFieldEntry)) {
        fail_decode("column count " + std::to_string(column_count) + " exceeds chunk");
    }

    Schema schema;
    schema.reserve(column_count);
    for (std::size_t index = 0U; index < column_count; ++index) {
        const auto entry = reader.read<ChunkFieldEntry>("field entry");
        if (!is_valid_column_type(entry.type)) {
            fail_decode("unknown column type " + std::to_string(entry.type));
        }
        const auto name = reader.take(entry.name_length, "field name");
        Field field{};
        field.name.assign(reinterpret_cast<const char*>(name.data()), name.size());
        field.type = static_cast<ColumnType>(entry.type);
        field.nullable = entry.nullable != 0U;
        schema.push_back(std::move(field));
    }
    reader.align();

    std::vector<Column> columns;
    columns.reserve(column_count);
    for (const auto& field : schema) {
        columns.push_back(read_column(reader, field, row_count));
    }

    if (reader.remaining() != 0U) {
        fail_decode(std::to_string(reader.remaining()) + " trailing bytes");
    }

    try {
        return Table{std::move(schema), std::move(columns)};
    } catch (const std::invalid_argument& error) {
        fail_decode(error.what());
    }
}

Table decode_chunks(const std::vector<Chunk>& chunks)
{
    std::vector<Table> tables;
    tables.reserve(chunks.size());
    for (const auto& chunk : chunks) {
        tables.push_back(decode_chunk(chunk));
    }
    return Table::concatenate(tables);
}

}  // namespace tabula::table
