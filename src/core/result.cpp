#include <ddlogs_mcp/core/result.hpp>

#include <nlohmann/json.hpp>

namespace ddlogs_mcp {

namespace {

// Datadog error bodies come in two shapes:
//   {"errors": ["Forbidden"]}
//   {"errors": [{"status": "400", "title": "Bad Request", "detail": "..."}]}
// Returns the first usable message, if any.
std::optional<std::string> ExtractApiError(const std::string& body) {
    if (body.empty()) return std::nullopt;

    auto doc = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded() || !doc.is_object()) return std::nullopt;

    auto it = doc.find("errors");
    if (it == doc.end() || !it->is_array() || it->empty()) return std::nullopt;

    const auto& first = it->front();
    if (first.is_string()) {
        auto msg = first.get<std::string>();
        if (msg.empty()) return std::nullopt;
        return msg;
    }
    if (first.is_object()) {
        for (const char* key : {"detail", "title"}) {
            auto field = first.find(key);
            if (field != first.end() && field->is_string() &&
                !field->get<std::string>().empty()) {
                return field->get<std::string>();
            }
        }
    }
    return std::nullopt;
}

} // anonymous namespace

Error Error::FromHttpStatus(const std::string& operation,
                            const std::string& endpoint,
                            int status_code,
                            const std::string& response_body) {
    auto api_error = ExtractApiError(response_body);

    ErrorCategory category;
    std::string message;

    switch (status_code) {
        case 400:
            category = ErrorCategory::Upstream;
            message = "Bad request";
            break;
        case 401:
            category = ErrorCategory::Authentication;
            message = "Unauthorized (check DD_API_KEY)";
            break;
        case 403:
            category = ErrorCategory::Authentication;
            message = "Forbidden (check DD_APP_KEY and its logs_read_data scope)";
            break;
        case 404:
            category = ErrorCategory::Upstream;
            message = "Not found (check the configured site)";
            break;
        case 408:
            category = ErrorCategory::Timeout;
            message = "Request timed out";
            break;
        case 429:
            category = ErrorCategory::RateLimited;
            message = "Rate limit exceeded";
            break;
        case 500:
            category = ErrorCategory::Upstream;
            message = "Datadog internal error";
            break;
        case 502:
        case 503:
        case 504:
            category = ErrorCategory::Connection;
            message = "Datadog API unavailable";
            break;
        default:
            category = ErrorCategory::Upstream;
            message = "Unexpected HTTP " + std::to_string(status_code);
            break;
    }

    if (api_error.has_value()) {
        message += ": " + *api_error;
    }

    return Error{operation, endpoint, status_code, message, category};
}

} // namespace ddlogs_mcp
