#pragma once

#include <string>
#include <system_error>

namespace tabula {

enum class ClientErrc {
    Success = 0,
    TooWideRow,
    InvalidRange,
    AccessDenied,
    NotFound,
    BeginFailed,
    CommitFailed,
    RollbackFailed,
    InvalidEndpoint,
    ConnectionFailed,
    UnsupportedServer,
    InvalidChunk
};

enum class ClientErrcCondition {
    TransactionFailure = 1
};

const std::error_category& client_error_category() noexcept;
const std::error_category& client_condition_category() noexcept;
std::error_code make_error_code(ClientErrc value) noexcept;
std::error_condition make_error_condition(ClientErrcCondition value) noexcept;

[[noreturn]] void throw_client_error(ClientErrc value, const std::string& what);

}  // namespace tabula

namespace std {

template <>
struct is_error_code_enum<tabula::ClientErrc> : true_type {
};

template <>
struct is_error_condition_enum<tabula::ClientErrcCondition> : true_type {
};

}  // namespace std
