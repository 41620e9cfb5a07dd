#include "tabula/txn/session.hpp"

#include <stdexcept>
#include <utility>

namespace tabula::txn {

Session::Session(TransactionTransport& transport, ObjectStore& object_store, ClientConfig config)
    : transport_{&transport}
    , resolver_{object_store}
    , config_{std::move(config)}
{
    if (config_.chunker.max_chunk_size == 0U) {
        throw std::invalid_argument{"ClientConfig::chunker.max_chunk_size must be positive"};
    }
}

Transaction Session::transaction()
{
    return Transaction{*this};
}

TransactionTransport& Session::transport() const noexcept
{
    return *transport_;
}

const ResourceResolver& Session::resolver() const noexcept
{
    return resolver_;
}

const ClientConfig& Session::config() const noexcept
{
    return config_;
}

table::PayloadChunker Session::chunker() const
{
    return table::PayloadChunker{config_.chunker};
}

std::string Session::describe() const
{
    const std::string endpoint = config_.endpoints.empty() ? std::string{"<unset>"} : config_.endpoints.front();
    return "Session(endpoint=" + endpoint + ")";
}

TransactionTelemetrySnapshot Session::telemetry_snapshot() const
{
    TransactionTelemetrySnapshot snapshot{};
    snapshot.opened_transactions = telemetry_.opened_transactions.load(std::memory_order_relaxed);
    snapshot.committed_transactions = telemetry_.committed_transactions.load(std::memory_order_relaxed);
    snapshot.rolled_back_transactions = telemetry_.rolled_back_transactions.load(std::memory_order_relaxed);
    snapshot.begin_failures = telemetry_.begin_failures.load(std::memory_order_relaxed);
    snapshot.commit_failures = telemetry_.commit_failures.load(std::memory_order_relaxed);
    snapshot.rollback_failures = telemetry_.rollback_failures.load(std::memory_order_relaxed);
    return snapshot;
}

}  // namespace tabula::txn
