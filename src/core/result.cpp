#include <lazymcp/core/result.hpp>

#include <nlohmann/json.hpp>

namespace lazymcp {

namespace {

// MCP endpoints report JSON-RPC errors in the body even on non-2xx replies.
std::optional<std::string> ExtractRpcErrorMessage(const std::string& body) {
    if (body.empty()) return std::nullopt;
    auto parsed = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded() || !parsed.is_object()) return std::nullopt;
    if (!parsed.contains("error") || !parsed["error"].is_object()) return std::nullopt;
    const auto& err = parsed["error"];
    if (!err.contains("message") || !err["message"].is_string()) return std::nullopt;
    return err["message"].get<std::string>();
}

} // anonymous namespace

Error Error::Make(ErrorCategory category,
                  const std::string& operation,
                  const std::string& target,
                  const std::string& message) {
    return Error{operation, target, std::nullopt, message, std::nullopt, category};
}

Error Error::FromHttpStatus(const std::string& operation,
                            const std::string& target,
                            int status_code,
                            const std::string& response_body) {
    auto rpc_error = ExtractRpcErrorMessage(response_body);

    ErrorCategory category = ErrorCategory::BackendError;
    std::string message;

    switch (status_code) {
        case 400:
            message = rpc_error.has_value()
                ? "Bad request: " + *rpc_error
                : "Bad request";
            break;
        case 401:
        case 403:
            message = "Backend rejected credentials; check the configured headers";
            break;
        case 404:
            message = "MCP endpoint not found (or session expired)";
            break;
        case 408:
        case 504:
            category = ErrorCategory::Timeout;
            message = "Backend timed out";
            break;
        case 429:
            message = "Too many requests; retry later";
            break;
        case 500:
            message = rpc_error.has_value()
                ? "Backend server error: " + *rpc_error
                : "Backend internal error";
            break;
        case 502:
        case 503:
            message = "Backend unavailable";
            break;
        default:
            message = "Unexpected HTTP " + std::to_string(status_code);
            break;
    }

    std::optional<std::string> detail;
    if (!response_body.empty()) {
        detail = response_body;
    }
    return Error{operation, target, status_code, message, detail, category};
}

std::string Error::ToJson() const {
    nlohmann::json j;
    j["category"] = CategoryName();
    j["operation"] = operation;
    if (!target.empty()) {
        j["target"] = target;
    }
    if (http_status.has_value()) {
        j["http_status"] = *http_status;
    }
    j["message"] = message;
    if (backend_detail.has_value()) {
        auto detail = nlohmann::json::parse(*backend_detail, nullptr, /*allow_exceptions=*/false);
        if (detail.is_discarded()) {
            j["backend_detail"] = *backend_detail;
        } else {
            j["backend_detail"] = std::move(detail);
        }
    }
    return nlohmann::json{{"error", j}}.dump(-1, ' ', false,
                                             nlohmann::json::error_handler_t::replace);
}

} // namespace lazymcp
