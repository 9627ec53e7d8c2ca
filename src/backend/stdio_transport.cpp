#include <lazymcp/backend/stdio_transport.hpp>

#include <lazymcp/core/log.hpp>

namespace lazymcp {

namespace {

constexpr const char* kComponent = "stdio";

// Keep log lines readable when a backend dumps large payloads.
std::string Truncate(const std::string& text, std::size_t max_len = 200) {
    if (text.size() <= max_len) return text;
    return text.substr(0, max_len) + "...";
}

} // anonymous namespace

StdioTransport::StdioTransport(std::string server_name, std::unique_ptr<Subprocess> process)
    : server_name_(std::move(server_name)), process_(std::move(process)) {}

StdioTransport::~StdioTransport() {
    Close();
}

Result<nlohmann::json, Error> StdioTransport::Request(const nlohmann::json& request,
                                                      Deadline deadline) {
    using R = Result<nlohmann::json, Error>;
    if (!process_) {
        return R::Err(Error::Make(ErrorCategory::BackendError, "Request", server_name_,
                                  "Transport is closed"));
    }

    auto sent = WriteMessage(request, deadline);
    if (sent.IsErr()) {
        return R::Err(std::move(sent).Error());
    }

    const auto& expected_id = request["id"];
    for (;;) {
        auto line = process_->ReadLine(deadline);
        if (line.IsErr()) {
            auto err = std::move(line).Error();
            err.target = server_name_;
            return R::Err(std::move(err));
        }
        if (line.Value().empty()) {
            continue;
        }

        auto message = nlohmann::json::parse(line.Value(), nullptr, /*allow_exceptions=*/false);
        if (message.is_discarded() || !message.is_object()) {
            LogDebug(kComponent, "[" + server_name_ + "] ignoring non-JSON output: " +
                                     Truncate(line.Value()));
            continue;
        }

        if (message.contains("method")) {
            if (message.contains("id")) {
                RejectServerRequest(message, deadline);
            }
            continue;  // notification
        }

        if (!message.contains("id") || message["id"] != expected_id) {
            LogDebug(kComponent, "[" + server_name_ + "] discarding stale response id=" +
                                     (message.contains("id") ? message["id"].dump() : "null"));
            continue;
        }
        return R::Ok(std::move(message));
    }
}

Result<void, Error> StdioTransport::Notify(const nlohmann::json& notification,
                                           Deadline deadline) {
    if (!process_) {
        return Result<void, Error>::Err(Error::Make(
            ErrorCategory::BackendError, "Notify", server_name_, "Transport is closed"));
    }
    return WriteMessage(notification, deadline);
}

bool StdioTransport::IsAlive() {
    return process_ && process_->IsRunning();
}

void StdioTransport::Close() {
    if (process_) {
        LogDebug(kComponent, "[" + server_name_ + "] terminating pid=" +
                                 std::to_string(process_->Pid()));
        process_->Terminate();
        process_.reset();
    }
}

Result<void, Error> StdioTransport::WriteMessage(const nlohmann::json& message,
                                                 Deadline deadline) {
    auto line = message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    line.push_back('\n');
    auto written = process_->Write(line, deadline);
    if (written.IsErr()) {
        auto err = std::move(written).Error();
        err.target = server_name_;
        return Result<void, Error>::Err(std::move(err));
    }
    return Result<void, Error>::Ok();
}

void StdioTransport::RejectServerRequest(const nlohmann::json& message, Deadline deadline) {
    auto method = message.value("method", "");
    LogDebug(kComponent, "[" + server_name_ + "] rejecting server request '" + method + "'");
    nlohmann::json reply = {
        {"jsonrpc", "2.0"},
        {"id", message["id"]},
        {"error", {{"code", -32601}, {"message", "Method not supported by client: " + method}}},
    };
    auto written = WriteMessage(reply, deadline);
    if (written.IsErr()) {
        LogWarn(kComponent, "[" + server_name_ + "] could not reject server request: " +
                                written.Error().ToString());
    }
}

} // namespace lazymcp
