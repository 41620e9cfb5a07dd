#pragma once

#include "tabula/client_config.hpp"
#include "tabula/table/chunk_format.hpp"
#include "tabula/table/table.hpp"

#include <cstddef>
#include <iterator>
#include <vector>

namespace tabula::table {

struct RowRange final {
    std::size_t offset = 0U;
    std::size_t count = 0U;

    bool operator==(const RowRange&) const = default;
};

// Lazily bisects a table into chunks that each encode below the configured size bound.
// The table must outlive the sequence and every iterator obtained from it. Iterators carry their own
// copy of the chunker settings and stay usable after the sequence itself is gone.
class ChunkSequence final {
public:
    class iterator final {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Chunk;
        using difference_type = std::ptrdiff_t;
        using pointer = const Chunk*;
        using reference = const Chunk&;

        iterator() = default;

        reference operator*() const noexcept;
        pointer operator->() const noexcept;
        iterator& operator++();
        void operator++(int);

        [[nodiscard]] const RowRange& rows() const noexcept;

        bool operator==(const iterator& other) const noexcept;

    private:
        friend class ChunkSequence;

        iterator(const Table& table, const ChunkerConfig& config);
        void advance();

        // Null once the sequence is exhausted or has failed.
        const Table* table_ = nullptr;
        ChunkerConfig config_{};
        std::vector<RowRange> pending_{};
        RowRange rows_{};
        Chunk current_{};
    };

    ChunkSequence(const Table& table, const ChunkerConfig& config);

    [[nodiscard]] iterator begin() const;
    [[nodiscard]] iterator end() const noexcept;

    [[nodiscard]] const Table& table() const noexcept;
    [[nodiscard]] const ChunkerConfig& config() const noexcept;

private:
    const Table* table_ = nullptr;
    ChunkerConfig config_{};
};

class PayloadChunker final {
public:
    explicit PayloadChunker(const ChunkerConfig& config = {});

    [[nodiscard]] ChunkSequence split(const Table& table) const;
    [[nodiscard]] std::vector<Chunk> split_all(const Table& table) const;

    [[nodiscard]] const ChunkerConfig& config() const noexcept;

private:
    ChunkerConfig config_{};
};

}  // namespace tabula::table
