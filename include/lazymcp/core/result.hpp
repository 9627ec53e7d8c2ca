#pragma once

#include <cassert>
#include <optional>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace lazymcp {

// ---------------------------------------------------------------------------
// Result<T, E>: holds either a value or an error. Used by every fallible
// operation in the gateway; exceptions never cross module boundaries.
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

    [[nodiscard]] T ValueOr(T default_value) const& {
        if (IsOk()) {
            return std::get<0>(storage_);
        }
        return default_value;
    }

    // fn: T -> Result<U, E>
    template <typename Fn>
    auto AndThen(Fn&& fn) && -> std::invoke_result_t<Fn, T&&> {
        using ReturnType = std::invoke_result_t<Fn, T&&>;
        if (IsOk()) {
            return std::forward<Fn>(fn)(std::get<0>(std::move(storage_)));
        }
        return ReturnType::Err(std::get<1>(std::move(storage_)));
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

// Result<void, E>: operations that succeed with no value.
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
// ErrorCategory: the gateway's error taxonomy.
// ---------------------------------------------------------------------------
enum class ErrorCategory {
    PathNotFound,       // unknown hierarchy path segment
    NotACategory,       // browse on a tool node
    NotATool,           // execute on a category node
    ServerSpawnFailed,  // backend transport could not be established
    ServerUnavailable,  // backend failed recently, still cooling down
    BackendError,       // backend reported a failure or the transport broke
    Timeout,            // bounded call exceeded its deadline
    Config,
    InvalidArgument,
    PolicyDenied,
    Internal,
};

// ---------------------------------------------------------------------------
// Error: structured error carried through every layer.
//
// `target` names what the operation acted on: a hierarchy path, a backend
// name, or a config file. `backend_detail` holds the backend's own payload
// (raw JSON text) when the failure originated there, so it can be passed
// through to the agent unchanged.
// ---------------------------------------------------------------------------
struct Error {
    std::string operation;
    std::string target;
    std::optional<int> http_status;
    std::string message;
    std::optional<std::string> backend_detail;
    ErrorCategory category = ErrorCategory::Internal;

    static Error Make(ErrorCategory category,
                      const std::string& operation,
                      const std::string& target,
                      const std::string& message);

    /// Classify an HTTP status from a backend's MCP endpoint.
    static Error FromHttpStatus(const std::string& operation,
                                const std::string& target,
                                int status_code,
                                const std::string& response_body = "");

    [[nodiscard]] int ExitCode() const {
        switch (category) {
            case ErrorCategory::Config:          return 1;
            case ErrorCategory::InvalidArgument: return 1;
            case ErrorCategory::PathNotFound:
            case ErrorCategory::NotACategory:
            case ErrorCategory::NotATool:        return 2;
            case ErrorCategory::ServerSpawnFailed:
            case ErrorCategory::ServerUnavailable: return 3;
            case ErrorCategory::BackendError:    return 4;
            case ErrorCategory::PolicyDenied:    return 5;
            case ErrorCategory::Timeout:         return 10;
            case ErrorCategory::Internal:        return 99;
        }
        return 99;
    }

    [[nodiscard]] std::string CategoryName() const {
        switch (category) {
            case ErrorCategory::PathNotFound:      return "path_not_found";
            case ErrorCategory::NotACategory:      return "not_a_category";
            case ErrorCategory::NotATool:          return "not_a_tool";
            case ErrorCategory::ServerSpawnFailed: return "server_spawn_failed";
            case ErrorCategory::ServerUnavailable: return "server_unavailable";
            case ErrorCategory::BackendError:      return "backend_error";
            case ErrorCategory::Timeout:           return "timeout";
            case ErrorCategory::Config:            return "config";
            case ErrorCategory::InvalidArgument:   return "invalid_argument";
            case ErrorCategory::PolicyDenied:      return "policy_denied";
            case ErrorCategory::Internal:          return "internal";
        }
        return "internal";
    }

    [[nodiscard]] std::string ToString() const {
        std::ostringstream oss;
        oss << operation;
        if (!target.empty()) {
            oss << " [" << target << "]";
        }
        if (http_status.has_value()) {
            oss << " (HTTP " << *http_status << ")";
        }
        oss << ": " << message;
        return oss.str();
    }

    /// Single-line JSON object; strings are escaped.
    [[nodiscard]] std::string ToJson() const;

    friend std::ostream& operator<<(std::ostream& os, const Error& e) {
        return os << e.ToString();
    }

    bool operator==(const Error& other) const {
        return operation == other.operation &&
               target == other.target &&
               http_status == other.http_status &&
               message == other.message &&
               backend_detail == other.backend_detail &&
               category == other.category;
    }

    bool operator!=(const Error& other) const {
        return !(*this == other);
    }
};

} // namespace lazymcp
