#pragma once

#include <ddlogs_mcp/backend/i_http_session.hpp>

#include <deque>
#include <string>
#include <vector>

namespace ddlogs_mcp {
namespace testing {

// ---------------------------------------------------------------------------
// MockHttpSession - hand-written mock for offline unit testing.
//
// Usage:
//   MockHttpSession mock;
//   mock.EnqueuePost(Result<HttpResponse, Error>::Ok({200, {}, R"({"data":[]})"}));
//   DatadogLogsClient client(mock);
//   auto result = client.Search(request);
//   CHECK(mock.PostCallCount() == 1);
//
// Responses are consumed FIFO. If the queue is empty when Post is called,
// the mock returns a descriptive error rather than crashing.
// ---------------------------------------------------------------------------

struct PostCall {
    std::string path;
    std::string body;
    std::string content_type;
    HttpHeaders headers;
};

class MockHttpSession : public IHttpSession {
public:
    MockHttpSession() = default;

    void EnqueuePost(Result<HttpResponse, Error> response) {
        post_responses_.push_back(std::move(response));
    }

    [[nodiscard]] const std::vector<PostCall>& PostCalls() const noexcept {
        return post_calls_;
    }
    [[nodiscard]] size_t PostCallCount() const noexcept {
        return post_calls_.size();
    }

    Result<HttpResponse, Error> Post(
        std::string_view path,
        std::string_view body,
        std::string_view content_type,
        const HttpHeaders& headers) override {
        post_calls_.push_back({
            std::string(path),
            std::string(body),
            std::string(content_type),
            headers,
        });
        if (post_responses_.empty()) {
            return Result<HttpResponse, Error>::Err(Error{
                "Post", std::string(path), std::nullopt,
                "MockHttpSession: no Post responses enqueued",
                ErrorCategory::Internal});
        }
        auto response = std::move(post_responses_.front());
        post_responses_.pop_front();
        return response;
    }

private:
    std::deque<Result<HttpResponse, Error>> post_responses_;
    std::vector<PostCall> post_calls_;
};

} // namespace testing
} // namespace ddlogs_mcp
