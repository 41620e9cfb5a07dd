#pragma once

#include "tabula/client_config.hpp"
#include "tabula/table/payload_chunker.hpp"
#include "tabula/txn/resource_resolver.hpp"
#include "tabula/txn/transaction.hpp"
#include "tabula/txn/transaction_telemetry.hpp"
#include "tabula/txn/transaction_types.hpp"

#include <atomic>
#include <cstdint>
#include <string>

namespace tabula::txn {

// Entry point for one cluster. Hands out transactions against the transport and resolves
// containers through the object store. Both collaborators must outlive the session, and the session
// must outlive every transaction it hands out.
class Session final {
public:
    Session(TransactionTransport& transport, ObjectStore& object_store, ClientConfig config = {});
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    [[nodiscard]] Transaction transaction();

    [[nodiscard]] TransactionTransport& transport() const noexcept;
    [[nodiscard]] const ResourceResolver& resolver() const noexcept;
    [[nodiscard]] const ClientConfig& config() const noexcept;
    [[nodiscard]] table::PayloadChunker chunker() const;

    [[nodiscard]] std::string describe() const;
    [[nodiscard]] TransactionTelemetrySnapshot telemetry_snapshot() const;

private:
    struct Telemetry final {
        std::atomic<std::uint64_t> opened_transactions{0U};
        std::atomic<std::uint64_t> committed_transactions{0U};
        std::atomic<std::uint64_t> rolled_back_transactions{0U};
        std::atomic<std::uint64_t> begin_failures{0U};
        std::atomic<std::uint64_t> commit_failures{0U};
        std::atomic<std::uint64_t> rollback_failures{0U};
    };

    TransactionTransport* transport_ = nullptr;
    ResourceResolver resolver_;
    ClientConfig config_{};
    mutable Telemetry telemetry_{};

    friend class Transaction;
};

}  // namespace tabula::txn
