#pragma once

#include <ddlogs_mcp/backend/i_http_session.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace ddlogs_mcp {

struct HttpSessionOptions {
    std::chrono::seconds connect_timeout{10};
    std::chrono::seconds read_timeout{30};
    HttpHeaders default_headers;  // sent with every request
};

// ---------------------------------------------------------------------------
// HttpSession - IHttpSession over cpp-httplib.
//
// httplib stays out of the public header (pimpl). Both timeouts are always
// set, so a stalled backend surfaces as a Timeout error instead of hanging
// the server. Header values named DD-API-KEY / DD-APPLICATION-KEY are never
// logged.
// ---------------------------------------------------------------------------
class HttpSession : public IHttpSession {
public:
    HttpSession(const std::string& base_url, const HttpSessionOptions& options);
    ~HttpSession() override;

    HttpSession(const HttpSession&) = delete;
    HttpSession& operator=(const HttpSession&) = delete;
    HttpSession(HttpSession&&) = delete;
    HttpSession& operator=(HttpSession&&) = delete;

    [[nodiscard]] Result<HttpResponse, Error> Post(
        std::string_view path,
        std::string_view body,
        std::string_view content_type,
        const HttpHeaders& headers = {}) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ddlogs_mcp
