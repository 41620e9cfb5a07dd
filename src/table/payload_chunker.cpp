#include "tabula/table/payload_chunker.hpp"

#include "tabula/common/client_errors.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <string>
#include <utility>

namespace tabula::table {

ChunkSequence::iterator::iterator(const Table& table, const ChunkerConfig& config)
    : table_{&table}
    , config_{config}
{
    pending_.push_back(RowRange{0U, table.num_rows()});
    advance();
}

ChunkSequence::iterator::reference ChunkSequence::iterator::operator*() const noexcept
{
    return current_;
}

ChunkSequence::iterator::pointer ChunkSequence::iterator::operator->() const noexcept
{
    return &current_;
}

ChunkSequence::iterator& ChunkSequence::iterator::operator++()
{
    advance();
    return *this;
}

void ChunkSequence::iterator::operator++(int)
{
    advance();
}

const RowRange& ChunkSequence::iterator::rows() const noexcept
{
    return rows_;
}

bool ChunkSequence::iterator::operator==(const iterator& other) const noexcept
{
    if (table_ == nullptr || other.table_ == nullptr) {
        return table_ == other.table_;
    }
    return table_ == other.table_ && rows_ == other.rows_ && pending_ == other.pending_;
}

void ChunkSequence::iterator::advance()
{
    if (table_ == nullptr) {
        return;
    }

    const auto& table = *table_;
    const auto max_chunk_size = config_.max_chunk_size;

    // Ranges are pushed right half first so the left half is always emitted first.
    while (!pending_.empty()) {
        const auto range = pending_.back();
        pending_.pop_back();

        const auto size = encoded_chunk_size(table, range.offset, range.count);
        if (size < max_chunk_size) {
            SPDLOG_DEBUG("chunk rows=[{}, {}) bytes={}", range.offset, range.offset + range.count, size);
            rows_ = range;
            current_ = encode_chunk(table, range.offset, range.count);
            return;
        }

        if (range.count <= 1U) {
            const auto what = range.count == 0U
                                  ? "Table schema encodes to " + std::to_string(size) + " bytes"
                                  : "Row " + std::to_string(range.offset) + " encodes to " + std::to_string(size)
                                        + " bytes";
            table_ = nullptr;
            pending_.clear();
            throw_client_error(ClientErrc::TooWideRow,
                               what + ", which does not fit the maximum chunk size of "
                                   + std::to_string(max_chunk_size) + " bytes");
        }

        const auto half = range.count / 2U;
        SPDLOG_DEBUG("bisecting rows=[{}, {}) bytes={} limit={}",
                     range.offset,
                     range.offset + range.count,
                     size,
                     max_chunk_size);
        pending_.push_back(RowRange{range.offset + half, range.count - half});
        pending_.push_back(RowRange{range.offset, half});
    }

    table_ = nullptr;
    rows_ = {};
    current_.clear();
}

ChunkSequence::ChunkSequence(const Table& table, const ChunkerConfig& config)
    : table_{&table}
    , config_{config}
{
    if (config_.max_chunk_size == 0U) {
        throw std::invalid_argument{"ChunkerConfig::max_chunk_size must be positive"};
    }
}

ChunkSequence::iterator ChunkSequence::begin() const
{
    return iterator{*table_, config_};
}

ChunkSequence::iterator ChunkSequence::end() const noexcept
{
    return iterator{};
}

const Table& ChunkSequence::table() const noexcept
{
    return *table_;
}

const ChunkerConfig& ChunkSequence::config() const noexcept
{
    return config_;
}

PayloadChunker::PayloadChunker(const ChunkerConfig& config)
    : config_{config}
{
    if (config_.max_chunk_size == 0U) {
        throw std::invalid_argument{"ChunkerConfig::max_chunk_size must be positive"};
    }
}

ChunkSequence PayloadChunker::split(const Table& table) const
{
    return ChunkSequence{table, config_};
}

std::vector<Chunk> PayloadChunker::split_all(const Table& table) const
{
    std::vector<Chunk> chunks;
    for (const auto& chunk : split(table)) {
        chunks.push_back(chunk);
    }
    return chunks;
}

const ChunkerConfig& PayloadChunker::config() const noexcept
{
    return config_;
}

}  // namespace tabula::table
