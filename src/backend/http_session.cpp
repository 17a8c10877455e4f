#include <ddlogs_mcp/backend/http_session.hpp>

#include <ddlogs_mcp/core/log.hpp>

#include <httplib.h>

#include <algorithm>
#include <cctype>

namespace ddlogs_mcp {

namespace {

std::string ToLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool IsSensitiveHeader(std::string_view key) {
    const auto lower = ToLower(key);
    return lower == "dd-api-key" ||
           lower == "dd-application-key" ||
           lower == "authorization" ||
           lower == "cookie";
}

ErrorCategory CategoryFromTransportError(httplib::Error error) {
    switch (error) {
        case httplib::Error::Read:
        case httplib::Error::ConnectionTimeout:
            return ErrorCategory::Timeout;
        default:
            return ErrorCategory::Connection;
    }
}

HttpHeaders ToHttpHeaders(const httplib::Headers& hdrs) {
    HttpHeaders result;
    for (const auto& [key, value] : hdrs) {
        result[key] = value;
    }
    return result;
}

void LogRequestHeaders(const httplib::Headers& hdrs) {
    for (const auto& [k, v] : hdrs) {
        LogDebug("http", "  > " + k + ": " + (IsSensitiveHeader(k) ? "<redacted>" : v));
    }
}

void LogResponse(int status, const std::string& body) {
    LogInfo("http", "  < " + std::to_string(status));
    if (status >= 400 && !body.empty()) {
        constexpr size_t kMaxBodyLog = 2000;
        if (body.size() <= kMaxBodyLog) {
            LogDebug("http", "  < body: " + body);
        } else {
            LogDebug("http", "  < body: " + body.substr(0, kMaxBodyLog) + "... (truncated)");
        }
    }
}

} // anonymous namespace

struct HttpSession::Impl {
    std::string base_url;
    std::unique_ptr<httplib::Client> client;
    HttpHeaders default_headers;

    Impl(const std::string& url, const HttpSessionOptions& opts)
        : base_url(url), default_headers(opts.default_headers) {
        client = std::make_unique<httplib::Client>(base_url);
        client->set_connection_timeout(opts.connect_timeout);
        client->set_read_timeout(opts.read_timeout);
        client->set_write_timeout(opts.read_timeout);
        client->set_follow_location(false);
    }

    httplib::Headers BuildHeaders(const HttpHeaders& extra) const {
        httplib::Headers hdrs;
        for (const auto& [key, value] : default_headers) {
            hdrs.emplace(key, value);
        }
        for (const auto& [key, value] : extra) {
            hdrs.emplace(key, value);
        }
        return hdrs;
    }
};

HttpSession::HttpSession(const std::string& base_url,
                         const HttpSessionOptions& options)
    : impl_(std::make_unique<Impl>(base_url, options)) {}

HttpSession::~HttpSession() = default;

Result<HttpResponse, Error> HttpSession::Post(std::string_view path,
                                              std::string_view body,
                                              std::string_view content_type,
                                              const HttpHeaders& headers) {
    auto hdrs = impl_->BuildHeaders(headers);
    LogInfo("http", "POST " + impl_->base_url + std::string(path));
    LogRequestHeaders(hdrs);

    auto res = impl_->client->Post(std::string(path), hdrs, std::string(body),
                                   std::string(content_type));
    if (!res) {
        const auto http_error = res.error();
        return Result<HttpResponse, Error>::Err(Error{
            "Post", std::string(path), std::nullopt,
            "HTTP request failed: " + httplib::to_string(http_error),
            CategoryFromTransportError(http_error)});
    }

    LogResponse(res->status, res->body);
    return Result<HttpResponse, Error>::Ok(
        HttpResponse{res->status, ToHttpHeaders(res->headers), res->body});
}

} // namespace ddlogs_mcp
