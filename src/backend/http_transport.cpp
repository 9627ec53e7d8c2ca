#include <lazymcp/backend/http_transport.hpp>

#include <lazymcp/core/log.hpp>

#include <httplib.h>

#include <algorithm>
#include <cctype>
#include <optional>
#include <sstream>

namespace lazymcp {

namespace {

constexpr const char* kComponent = "http";
constexpr const char* kSessionHeader = "Mcp-Session-Id";

ErrorCategory CategoryFromHttpTransportError(httplib::Error error) {
    switch (error) {
        case httplib::Error::Timeout:
        case httplib::Error::ConnectionTimeout:
        case httplib::Error::Read:
            return ErrorCategory::Timeout;
        default:
            return ErrorCategory::BackendError;
    }
}

std::chrono::milliseconds Remaining(Deadline deadline) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - SteadyClock::now());
    return std::max(remaining, std::chrono::milliseconds(1));
}

bool IsEventStream(const httplib::Response& res) {
    auto content_type = res.get_header_value("Content-Type");
    std::transform(content_type.begin(), content_type.end(), content_type.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return content_type.find("text/event-stream") != std::string::npos;
}

// A JSON body may be a single message or a batch.
std::optional<nlohmann::json> FindResponse(const nlohmann::json& payload,
                                           const nlohmann::json& expected_id) {
    if (payload.is_object()) {
        if (payload.contains("id") && payload["id"] == expected_id &&
            !payload.contains("method")) {
            return payload;
        }
        return std::nullopt;
    }
    if (payload.is_array()) {
        for (const auto& item : payload) {
            auto found = FindResponse(item, expected_id);
            if (found) return found;
        }
    }
    return std::nullopt;
}

} // anonymous namespace

bool SplitUrl(const std::string& url, std::string& scheme_host_port, std::string& path) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) return false;
    auto scheme = url.substr(0, scheme_end);
    if (scheme != "http" && scheme != "https") return false;

    auto host_start = scheme_end + 3;
    auto path_start = url.find('/', host_start);
    if (path_start == host_start) return false;  // no host
    if (path_start == std::string::npos) {
        if (host_start >= url.size()) return false;
        scheme_host_port = url;
        path = "/";
        return true;
    }
    scheme_host_port = url.substr(0, path_start);
    path = url.substr(path_start);
    return true;
}

std::vector<std::string> ParseSseData(const std::string& body) {
    std::vector<std::string> events;
    std::istringstream in(body);
    std::string line;
    std::string data;
    bool has_data = false;
    auto flush = [&] {
        if (has_data) {
            events.push_back(data);
        }
        data.clear();
        has_data = false;
    };
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            flush();
            continue;
        }
        if (line.rfind("data:", 0) == 0) {
            auto value = line.substr(5);
            if (!value.empty() && value.front() == ' ') {
                value.erase(0, 1);
            }
            if (has_data) {
                data.push_back('\n');
            }
            data += value;
            has_data = true;
        }
        // "event:", "id:", "retry:" and comments carry nothing we need.
    }
    flush();
    return events;
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct HttpTransport::Impl {
    std::string server_name;
    std::string path;
    httplib::Headers base_headers;
    std::unique_ptr<httplib::Client> client;
    std::optional<std::string> session_id;
    bool closed = false;

    httplib::Headers RequestHeaders() const {
        auto hdrs = base_headers;
        if (session_id.has_value()) {
            hdrs.emplace(kSessionHeader, *session_id);
        }
        return hdrs;
    }

    Result<httplib::Response, Error> Post(const nlohmann::json& message,
                                          Deadline deadline,
                                          const std::string& operation) {
        using R = Result<httplib::Response, Error>;
        if (closed) {
            return R::Err(Error::Make(ErrorCategory::BackendError, operation, server_name,
                                      "Transport is closed"));
        }
        auto remaining = Remaining(deadline);
        client->set_connection_timeout(remaining);
        client->set_read_timeout(remaining);
        client->set_write_timeout(remaining);

        auto body = message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        auto res = client->Post(path, RequestHeaders(), body, "application/json");
        if (!res) {
            auto err = res.error();
            return R::Err(Error::Make(CategoryFromHttpTransportError(err), operation,
                                      server_name,
                                      "HTTP request failed: " + httplib::to_string(err)));
        }
        if (res->status == 404 && session_id.has_value()) {
            // The server forgot our session (expired or restarted). This
            // transport is dead; the registry starts a new session next time.
            LogWarn(kComponent, "[" + server_name + "] session " + *session_id + " expired");
            session_id.reset();
            closed = true;
        }
        if (res->status < 200 || res->status >= 300) {
            return R::Err(Error::FromHttpStatus(operation, server_name, res->status, res->body));
        }
        if (res->has_header(kSessionHeader)) {
            session_id = res->get_header_value(kSessionHeader);
        }
        return R::Ok(*res);
    }
};

HttpTransport::HttpTransport(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}

HttpTransport::~HttpTransport() {
    Close();
}

Result<std::unique_ptr<HttpTransport>, Error> HttpTransport::Create(const BackendConfig& config) {
    using R = Result<std::unique_ptr<HttpTransport>, Error>;
    std::string scheme_host_port;
    std::string path;
    if (!SplitUrl(config.url, scheme_host_port, path)) {
        return R::Err(Error::Make(ErrorCategory::ServerSpawnFailed, "HttpConnect", config.name,
                                  "Invalid backend URL '" + config.url + "'"));
    }

    auto impl = std::make_unique<Impl>();
    impl->server_name = config.name;
    impl->path = path;
    impl->client = std::make_unique<httplib::Client>(scheme_host_port);
    if (!impl->client->is_valid()) {
        return R::Err(Error::Make(ErrorCategory::ServerSpawnFailed, "HttpConnect", config.name,
                                  "Unsupported URL (HTTPS needs an OpenSSL-enabled build): " +
                                      config.url));
    }
    impl->client->set_keep_alive(true);
    impl->base_headers.emplace("Accept", "application/json, text/event-stream");
    for (const auto& [key, value] : config.headers) {
        impl->base_headers.emplace(key, value);
    }

    return R::Ok(std::make_unique<HttpTransport>(std::move(impl)));
}

Result<nlohmann::json, Error> HttpTransport::Request(const nlohmann::json& request,
                                                     Deadline deadline) {
    using R = Result<nlohmann::json, Error>;
    auto res = impl_->Post(request, deadline, "Request");
    if (res.IsErr()) {
        return R::Err(std::move(res).Error());
    }

    const auto& response = res.Value();
    const auto& expected_id = request["id"];

    std::vector<std::string> payloads;
    if (IsEventStream(response)) {
        payloads = ParseSseData(response.body);
    } else {
        payloads.push_back(response.body);
    }

    for (const auto& text : payloads) {
        auto payload = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
        if (payload.is_discarded()) {
            LogDebug(kComponent, "[" + impl_->server_name + "] ignoring non-JSON payload");
            continue;
        }
        auto found = FindResponse(payload, expected_id);
        if (found) {
            return R::Ok(std::move(*found));
        }
    }
    return R::Err(Error::Make(ErrorCategory::BackendError, "Request", impl_->server_name,
                              "HTTP reply contained no response for request id " +
                                  expected_id.dump()));
}

Result<void, Error> HttpTransport::Notify(const nlohmann::json& notification,
                                          Deadline deadline) {
    auto res = impl_->Post(notification, deadline, "Notify");
    if (res.IsErr()) {
        return Result<void, Error>::Err(std::move(res).Error());
    }
    return Result<void, Error>::Ok();
}

bool HttpTransport::IsAlive() {
    return !impl_->closed;
}

void HttpTransport::Close() {
    if (!impl_ || impl_->closed) {
        return;
    }
    impl_->closed = true;
    if (!impl_->session_id.has_value()) {
        return;
    }
    // Tell the server the session is over; it expires on its own otherwise.
    impl_->client->set_connection_timeout(std::chrono::seconds(2));
    impl_->client->set_read_timeout(std::chrono::seconds(2));
    auto res = impl_->client->Delete(impl_->path, impl_->RequestHeaders());
    if (!res) {
        LogDebug(kComponent, "[" + impl_->server_name + "] session DELETE failed: " +
                                 httplib::to_string(res.error()));
    }
}

} // namespace lazymcp
