#pragma once

#include <ddlogs_mcp/core/result.hpp>

#include <map>
#include <string>
#include <string_view>

namespace ddlogs_mcp {

using HttpHeaders = std::map<std::string, std::string>;

struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::string body;
};

// ---------------------------------------------------------------------------
// IHttpSession - abstract HTTP session bound to one API base URL.
//
// The Datadog client depends on this interface rather than on cpp-httplib so
// it can be tested offline via MockHttpSession. Transport failures come back
// as Err; any HTTP status (including 4xx/5xx) comes back as Ok.
// ---------------------------------------------------------------------------
class IHttpSession {
public:
    virtual ~IHttpSession() = default;

    IHttpSession(const IHttpSession&) = delete;
    IHttpSession& operator=(const IHttpSession&) = delete;
    IHttpSession(IHttpSession&&) = delete;
    IHttpSession& operator=(IHttpSession&&) = delete;

    [[nodiscard]] virtual Result<HttpResponse, Error> Post(
        std::string_view path,
        std::string_view body,
        std::string_view content_type,
        const HttpHeaders& headers = {}) = 0;

protected:
    IHttpSession() = default;
};

} // namespace ddlogs_mcp
