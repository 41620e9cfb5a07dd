#include "tabula/common/client_errors.hpp"

#include <string>

namespace tabula {

namespace {

class ClientErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "tabula.client";
    }

    std::string message(int condition) const override
    {
        switch (static_cast<ClientErrc>(condition)) {
        case ClientErrc::Success:
            return "success";
        case ClientErrc::TooWideRow:
            return "row too wide to fit in a chunk";
        case ClientErrc::InvalidRange:
            return "invalid range prefix";
        case ClientErrc::AccessDenied:
            return "access denied";
        case ClientErrc::NotFound:
            return "not found";
        case ClientErrc::BeginFailed:
            return "begin transaction failed";
        case ClientErrc::CommitFailed:
            return "commit transaction failed";
        case ClientErrc::RollbackFailed:
            return "rollback transaction failed";
        case ClientErrc::InvalidEndpoint:
            return "invalid endpoint specification";
        case ClientErrc::ConnectionFailed:
            return "connection failed";
        case ClientErrc::UnsupportedServer:
            return "unsupported server version";
        case ClientErrc::InvalidChunk:
            return "invalid chunk encoding";
        default:
            return "unknown client error";
        }
    }

    bool equivalent(int code, const std::error_condition& condition) const noexcept override
    {
        if (condition.category() != client_condition_category()) {
            return default_error_condition(code) == condition;
        }

        switch (static_cast<ClientErrcCondition>(condition.value())) {
        case ClientErrcCondition::TransactionFailure: {
            const auto value = static_cast<ClientErrc>(code);
            return value == ClientErrc::BeginFailed || value == ClientErrc::CommitFailed
                   || value == ClientErrc::RollbackFailed;
        }
        default:
            return false;
        }
    }
};

class ClientConditionCategory final : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "tabula.client.condition";
    }

    std::string message(int condition) const override
    {
        switch (static_cast<ClientErrcCondition>(condition)) {
        case ClientErrcCondition::TransactionFailure:
            return "transaction failure";
        default:
            return "unknown client condition";
        }
    }
};

const ClientErrorCategory kCategory{};
const ClientConditionCategory kConditionCategory{};

}  // namespace

const std::error_category& client_error_category() noexcept
{
    return kCategory;
}

const std::error_category& client_condition_category() noexcept
{
    return kConditionCategory;
}

std::error_code make_error_code(ClientErrc value) noexcept
{
    return {static_cast<int>(value), client_error_category()};
}

std::error_condition make_error_condition(ClientErrcCondition value) noexcept
{
    return {static_cast<int>(value), client_condition_category()};
}

void throw_client_error(ClientErrc value, const std::string& what)
{
    throw std::system_error(make_error_code(value), what);
}

}  // namespace tabula
