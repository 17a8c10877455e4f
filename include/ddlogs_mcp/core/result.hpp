#pragma once

#include <cassert>
#include <optional>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace ddlogs_mcp {

// ---------------------------------------------------------------------------
// Result<T, E> - a discriminated union that holds either a value or an error.
// ---------------------------------------------------------------------------
template <typename T, typename E>
class Result {
public:
    static Result Ok(const T& value) { return Result(OkTag{}, value); }
    static Result Ok(T&& value) { return Result(OkTag{}, std::move(value)); }

    static Result Err(const E& error) { return Result(ErrTag{}, error); }
    static Result Err(E&& error) { return Result(ErrTag{}, std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return storage_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return storage_.index() == 1; }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const T& Value() const& {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(storage_);
    }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(storage_);
    }

    [[nodiscard]] T Value() && {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(std::move(storage_));
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(std::move(storage_));
    }

    // fn: T -> U
    template <typename Fn>
    auto Map(Fn&& fn) const& -> Result<std::invoke_result_t<Fn, const T&>, E> {
        using U = std::invoke_result_t<Fn, const T&>;
        if (IsOk()) {
            return Result<U, E>::Ok(std::forward<Fn>(fn)(std::get<0>(storage_)));
        }
        return Result<U, E>::Err(std::get<1>(storage_));
    }

private:
    struct OkTag {};
    struct ErrTag {};

    Result(OkTag, const T& value) : storage_(std::in_place_index<0>, value) {}
    Result(OkTag, T&& value) : storage_(std::in_place_index<0>, std::move(value)) {}
    Result(ErrTag, const E& error) : storage_(std::in_place_index<1>, error) {}
    Result(ErrTag, E&& error) : storage_(std::in_place_index<1>, std::move(error)) {}

    std::variant<T, E> storage_;
};

// ---------------------------------------------------------------------------
// Result<void, E> - specialization for operations that succeed with no value.
// ---------------------------------------------------------------------------
template <typename E>
class Result<void, E> {
public:
    static Result Ok() { return Result(OkTag{}); }

    static Result Err(const E& error) { return Result(ErrTag{}, error); }
    static Result Err(E&& error) { return Result(ErrTag{}, std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return !error_.has_value(); }
    [[nodiscard]] bool IsErr() const noexcept { return error_.has_value(); }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return *error_;
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::move(*error_);
    }

private:
    struct OkTag {};
    struct ErrTag {};

    explicit Result(OkTag) : error_(std::nullopt) {}
    Result(ErrTag, const E& error) : error_(error) {}
    Result(ErrTag, E&& error) : error_(std::move(error)) {}

    std::optional<E> error_;
};

// ---------------------------------------------------------------------------
// JSON-RPC 2.0 error codes used on the wire.
// ---------------------------------------------------------------------------
namespace rpc_code {
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams  = -32602;
constexpr int kInternalError  = -32603;
constexpr int kBackendError   = -32000;
} // namespace rpc_code

// ---------------------------------------------------------------------------
// ErrorCategory - classifies errors for JSON-RPC codes and log output.
// ---------------------------------------------------------------------------
enum class ErrorCategory {
    InvalidRequest,
    InvalidParams,
    MethodNotFound,
    Config,
    Connection,
    Authentication,
    RateLimited,
    Timeout,
    Upstream,
    BadResponse,
    Internal,
};

// ---------------------------------------------------------------------------
// Error - structured error type shared by every layer.
// ---------------------------------------------------------------------------
struct Error {
    std::string operation;
    std::string endpoint;
    std::optional<int> http_status;
    std::string message;
    ErrorCategory category = ErrorCategory::Internal;

    /// Create an Error from a non-2xx Datadog API status. The first entry of
    /// the body's "errors" array, if any, is appended to the message.
    static Error FromHttpStatus(const std::string& operation,
                                const std::string& endpoint,
                                int status_code,
                                const std::string& response_body = "");

    static Error InvalidParams(const std::string& operation,
                               const std::string& message) {
        return Error{operation, "", std::nullopt, message,
                     ErrorCategory::InvalidParams};
    }

    /// True for failures raised by the log-search backend.
    [[nodiscard]] bool IsBackendFailure() const noexcept {
        switch (category) {
            case ErrorCategory::Connection:
            case ErrorCategory::Authentication:
            case ErrorCategory::RateLimited:
            case ErrorCategory::Timeout:
            case ErrorCategory::Upstream:
            case ErrorCategory::BadResponse:
                return true;
            default:
                return false;
        }
    }

    [[nodiscard]] int RpcCode() const noexcept {
        switch (category) {
            case ErrorCategory::InvalidRequest: return rpc_code::kInvalidRequest;
            case ErrorCategory::InvalidParams:  return rpc_code::kInvalidParams;
            case ErrorCategory::MethodNotFound: return rpc_code::kMethodNotFound;
            case ErrorCategory::Config:         return rpc_code::kInternalError;
            case ErrorCategory::Internal:       return rpc_code::kInternalError;
            case ErrorCategory::Connection:
            case ErrorCategory::Authentication:
            case ErrorCategory::RateLimited:
            case ErrorCategory::Timeout:
            case ErrorCategory::Upstream:
            case ErrorCategory::BadResponse:
                return rpc_code::kBackendError;
        }
        return rpc_code::kInternalError;
    }

    [[nodiscard]] std::string CategoryName() const {
        switch (category) {
            case ErrorCategory::InvalidRequest: return "invalid_request";
            case ErrorCategory::InvalidParams:  return "invalid_params";
            case ErrorCategory::MethodNotFound: return "method_not_found";
            case ErrorCategory::Config:         return "config";
            case ErrorCategory::Connection:     return "connection";
            case ErrorCategory::Authentication: return "authentication";
            case ErrorCategory::RateLimited:    return "rate_limited";
            case ErrorCategory::Timeout:        return "timeout";
            case ErrorCategory::Upstream:       return "upstream";
            case ErrorCategory::BadResponse:    return "bad_response";
            case ErrorCategory::Internal:       return "internal";
        }
        return "internal";
    }

    // Detailed form for logs: "op [endpoint] (HTTP n): message".
    [[nodiscard]] std::string ToString() const {
        std::ostringstream oss;
        oss << operation;
        if (!endpoint.empty()) {
            oss << " [" << endpoint << "]";
        }
        if (http_status.has_value()) {
            oss << " (HTTP " << *http_status << ")";
        }
        oss << ": " << message;
        return oss.str();
    }

    friend std::ostream& operator<<(std::ostream& os, const Error& e) {
        return os << e.ToString();
    }

    bool operator==(const Error& other) const {
        return operation == other.operation &&
               endpoint == other.endpoint &&
               http_status == other.http_status &&
               message == other.message &&
               category == other.category;
    }

    bool operator!=(const Error& other) const {
        return !(*this == other);
    }
};

} // namespace ddlogs_mcp
