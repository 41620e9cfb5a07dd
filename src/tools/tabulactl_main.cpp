#include "tabula/client_config.hpp"
#include "tabula/net/endpoint_expander.hpp"
#include "tabula/scan/range_codec.hpp"
#include "tabula/table/chunk_format.hpp"
#include "tabula/table/payload_chunker.hpp"
#include "tabula/table/table.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace {

void print_expanded(const std::vector<std::string>& specs)
{
    for (const auto& endpoint : tabula::net::expand_endpoints(specs)) {
        std::cout << endpoint << '\n';
    }
}

void print_range(const std::string& prefix, const std::string& format)
{
    const auto range = tabula::scan::prefix_to_range(prefix);
    if (format == "json") {
        std::cout << tabula::scan::to_json(range) << '\n';
        return;
    }
    std::cout << "lower: " << tabula::scan::escape_bytes(range.lower) << '\n';
    std::cout << "upper: " << tabula::scan::escape_bytes(range.upper) << '\n';
}

tabula::table::Table make_sample_table(std::size_t rows, std::size_t text_width)
{
    using tabula::table::Column;
    using tabula::table::ColumnType;
    using tabula::table::Field;

    std::vector<std::int64_t> ids;
    std::vector<double> scores;
    std::vector<std::string> payloads;
    ids.reserve(rows);
    scores.reserve(rows);
    payloads.reserve(rows);
    for (std::size_t row = 0U; row < rows; ++row) {
        ids.push_back(static_cast<std::int64_t>(row));
        scores.push_back(static_cast<double>(row) / 1000.0);
        payloads.emplace_back(text_width, static_cast<char>('a' + static_cast<int>(row % 26U)));
    }

    tabula::table::Schema schema{Field{"id", ColumnType::Int64, false},
                                 Field{"score", ColumnType::Float64, false},
                                 Field{"payload", ColumnType::Utf8, false}};
    std::vector<Column> columns;
    columns.push_back(Column::int64(std::move(ids)));
    columns.push_back(Column::float64(std::move(scores)));
    columns.push_back(Column::utf8(std::move(payloads)));
    return tabula::table::Table{std::move(schema), std::move(columns)};
}

int run_chunk_report(std::size_t rows, std::size_t text_width, const tabula::ChunkerConfig& config)
{
    const auto table = make_sample_table(rows, text_width);
    const tabula::table::PayloadChunker chunker{config};

    std::vector<tabula::table::Chunk> chunks;
    std::size_t largest = 0U;
    std::size_t total = 0U;
    const auto sequence = chunker.split(table);
    for (auto it = sequence.begin(); it != sequence.end(); ++it) {
        std::cout << "chunk " << chunks.size() << ": rows [" << it.rows().offset << ", "
                  << it.rows().offset + it.rows().count << ") " << it->size() << " bytes" << '\n';
        largest = std::max(largest, it->size());
        total += it->size();
        chunks.push_back(*it);
    }

    const bool round_trip = tabula::table::decode_chunks(chunks) == table;
    std::cout << chunks.size() << " chunk(s), " << total << " bytes total, largest " << largest << " bytes, limit "
              << config.max_chunk_size << " bytes" << '\n';
    std::cout << "round trip: " << (round_trip ? "ok" : "MISMATCH") << '\n';
    return round_trip ? EXIT_SUCCESS : EXIT_FAILURE;
}

}  // namespace

int main(int argc, char** argv)
{
    CLI::App app{"Operational tooling for the tabula client core"};
    app.require_subcommand(1);

    bool verbose = false;
    app.add_flag("-v,--verbose", verbose, "Enable debug logging");
    app.parse_complete_callback([&]() {
        spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::warn);
    });

    std::vector<std::string> expand_specs;
    auto* expand = app.add_subcommand("expand", "Expand endpoint specifications such as http://10.0.0.1-3");
    expand->add_option("specs", expand_specs, "Endpoint specifications")->required();
    expand->callback([&]() { print_expanded(expand_specs); });

    std::string range_prefix;
    std::string range_format = "text";
    auto* range = app.add_subcommand("range", "Compute the byte range scanned for a key prefix");
    range->add_option("prefix", range_prefix, "UTF-8 key prefix")->required();
    range->add_option("-f,--format", range_format, "Output format (json or text)")
        ->transform(CLI::CheckedTransformer({{"json", "json"}, {"text", "text"}}));
    range->callback([&]() { print_range(range_prefix, range_format); });

    std::size_t chunk_rows = 100'000U;
    std::size_t chunk_text_width = 32U;
    tabula::ChunkerConfig chunk_config{};
    int chunk_exit_code = EXIT_SUCCESS;
    auto* chunk = app.add_subcommand("chunk", "Split a synthetic table and report the chunk layout");
    chunk->add_option("-r,--rows", chunk_rows, "Rows in the synthetic table")->check(CLI::NonNegativeNumber);
    chunk->add_option("-w,--text-width", chunk_text_width, "Bytes per text value")->check(CLI::NonNegativeNumber);
    chunk->add_option("-m,--max-chunk-size", chunk_config.max_chunk_size, "Maximum encoded chunk size in bytes")
        ->check(CLI::PositiveNumber);
    chunk->callback([&]() { chunk_exit_code = run_chunk_report(chunk_rows, chunk_text_width, chunk_config); });

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& error) {
        return app.exit(error);
    } catch (const std::system_error& error) {
        std::cerr << "error: " << error.what() << " [" << error.code().category().name() << ':'
                  << error.code().value() << "]" << '\n';
        return EXIT_FAILURE;
    } catch (const std::exception& error) {
        std::cerr << "error: " << error.what() << '\n';
        return EXIT_FAILURE;
    }

    return chunk_exit_code;
}
