#pragma once

#include "tabula/table/table.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace tabula::table {

using Chunk = std::vector<std::byte>;

constexpr std::array<char, 4> kChunkMagic{'T', 'B', 'C', 'K'};
constexpr std::uint16_t kChunkFormatVersion = 1U;
constexpr std::size_t kChunkSectionAlignment = 8U;

// Layout: header, one field entry plus name bytes per column, then one section per column
// (validity bitmap for nullable columns, then values). Sections start on 8-byte boundaries.
struct alignas(8) ChunkHeader final {
    std::array<char, 4> magic = kChunkMagic;
    std::uint16_t version = kChunkFormatVersion;
    std::uint16_t flags = 0U;
    std::uint32_t column_count = 0U;
    std::uint32_t reserved = 0U;
    std::uint64_t row_count = 0U;
};

struct ChunkFieldEntry final {
    std::uint8_t type = 0U;
    std::uint8_t nullable = 0U;
    std::uint16_t reserved = 0U;
    std::uint32_t name_length = 0U;
};

static_assert(sizeof(ChunkHeader) == 24U, "ChunkHeader must remain 24 bytes");
static_assert(sizeof(ChunkFieldEntry) == 8U, "ChunkFieldEntry must remain 8 bytes");

[[nodiscard]] std::size_t encoded_chunk_size(const Table& table, std::size_t row_offset, std::size_t row_count);
[[nodiscard]] Chunk encode_chunk(const Table& table, std::size_t row_offset, std::size_t row_count);
[[nodiscard]] Chunk encode_chunk(const Table& table);

// Throws std::system_error(ClientErrc::InvalidChunk) on any malformed input.
[[nodiscard]] Table decode_chunk(std::span<const std::byte> chunk);
[[nodiscard]] Table decode_chunks(const std::vector<Chunk>& chunks);

}  // namespace tabula::table
