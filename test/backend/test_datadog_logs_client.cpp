#include <catch2/catch_test_macros.hpp>

#include <ddlogs_mcp/backend/datadog_logs_client.hpp>

#include "../mocks/mock_http_session.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <string>

using namespace ddlogs_mcp;
using namespace ddlogs_mcp::testing;

namespace {

std::string LoadFixture(const std::string& filename) {
    std::string this_file = __FILE__;
    auto test_dir = this_file.substr(0, this_file.rfind('/'));     // .../test/backend
    auto test_root = test_dir.substr(0, test_dir.rfind('/'));      // .../test
    std::ifstream in(test_root + "/testdata/" + filename);
    REQUIRE(in.good());
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

LogSearchRequest SampleRequest() {
    LogSearchRequest req;
    req.query = "service:web status:error";
    req.from = "2026-01-20T09:00:00Z";
    req.to = "2026-01-20T10:00:00Z";
    req.limit = 25;
    return req;
}

} // anonymous namespace

// ===========================================================================
// Request body and headers
// ===========================================================================

TEST_CASE("BuildLogSearchBody: filter, page and sort", "[datadog]") {
    auto body = nlohmann::json::parse(BuildLogSearchBody(SampleRequest()));

    CHECK(body["filter"]["query"] == "service:web status:error");
    CHECK(body["filter"]["from"] == "2026-01-20T09:00:00Z");
    CHECK(body["filter"]["to"] == "2026-01-20T10:00:00Z");
    CHECK(body["page"]["limit"] == 25);
    CHECK(body["sort"] == "-timestamp");
}

TEST_CASE("BuildLogSearchBody: oldest-first sort", "[datadog]") {
    auto req = SampleRequest();
    req.sort = LogSortOrder::OldestFirst;
    auto body = nlohmann::json::parse(BuildLogSearchBody(req));
    CHECK(body["sort"] == "timestamp");
}

TEST_CASE("MakeDatadogHeaders: both keys and Accept", "[datadog]") {
    auto headers = MakeDatadogHeaders("api", "app");
    CHECK(headers.at("DD-API-KEY") == "api");
    CHECK(headers.at("DD-APPLICATION-KEY") == "app");
    CHECK(headers.at("Accept") == "application/json");
}

// ===========================================================================
// ParseLogSearchResponse
// ===========================================================================

TEST_CASE("ParseLogSearchResponse: two events", "[datadog]") {
    auto result = ParseLogSearchResponse(LoadFixture("search_two_logs.json"));
    REQUIRE(result.IsOk());
    const auto& records = result.Value();
    REQUIRE(records.size() == 2);

    CHECK(records[0].id == "AAAAAYx1");
    REQUIRE(records[0].timestamp.has_value());
    CHECK(*records[0].timestamp == "2026-01-20T10:15:00.123Z");
    CHECK(records[0].message == "upstream timed out");
    CHECK(records[0].status == "error");
    CHECK(records[0].service == "web");
    CHECK(records[0].tags == std::vector<std::string>{"env:prod", "team:core"});
    REQUIRE(records[0].attributes.has_value());
    CHECK((*records[0].attributes)["http"]["status_code"] == 504);

    CHECK(records[1].id == "AAAAAYx0");
    CHECK(records[1].tags.empty());
    CHECK_FALSE(records[1].attributes.has_value());
}

TEST_CASE("ParseLogSearchResponse: empty and missing data", "[datadog]") {
    auto empty = ParseLogSearchResponse(LoadFixture("search_empty.json"));
    REQUIRE(empty.IsOk());
    CHECK(empty.Value().empty());

    auto missing = ParseLogSearchResponse(R"({"meta":{}})");
    REQUIRE(missing.IsOk());
    CHECK(missing.Value().empty());

    auto null_data = ParseLogSearchResponse(R"({"data":null})");
    REQUIRE(null_data.IsOk());
    CHECK(null_data.Value().empty());
}

TEST_CASE("ParseLogSearchResponse: missing fields become empty", "[datadog]") {
    auto result = ParseLogSearchResponse(
        R"({"data":[{"id":"x","attributes":{"message":"m","tags":["a",1,"b"]}}]})");
    REQUIRE(result.IsOk());
    const auto& rec = result.Value().at(0);
    CHECK_FALSE(rec.timestamp.has_value());
    CHECK(rec.status.empty());
    CHECK(rec.service.empty());
    CHECK(rec.tags == std::vector<std::string>{"a", "b"});
}

TEST_CASE("ParseLogSearchResponse: malformed bodies are BadResponse", "[datadog]") {
    for (const char* body : {"not json", "[]", R"({"data":{}})",
                             R"({"data":["string"]})",
                             R"({"data":[{"id":"x","attributes":[]}]})"}) {
        auto result = ParseLogSearchResponse(body);
        REQUIRE(result.IsErr());
        CHECK(result.Error().category == ErrorCategory::BadResponse);
    }
}

// ===========================================================================
// DatadogLogsClient::Search
// ===========================================================================

TEST_CASE("DatadogLogsClient: posts to the search endpoint", "[datadog]") {
    MockHttpSession mock;
    mock.EnqueuePost(Result<HttpResponse, Error>::Ok(
        {200, {}, LoadFixture("search_two_logs.json")}));
    DatadogLogsClient client(mock);

    auto result = client.Search(SampleRequest());
    REQUIRE(result.IsOk());
    CHECK(result.Value().size() == 2);

    REQUIRE(mock.PostCallCount() == 1);
    const auto& call = mock.PostCalls()[0];
    CHECK(call.path == "/api/v2/logs/events/search");
    CHECK(call.content_type == "application/json");
    CHECK(nlohmann::json::parse(call.body)["filter"]["query"] ==
          "service:web status:error");
}

TEST_CASE("DatadogLogsClient: 403 becomes Authentication error", "[datadog]") {
    MockHttpSession mock;
    mock.EnqueuePost(Result<HttpResponse, Error>::Ok(
        {403, {}, LoadFixture("error_forbidden.json")}));
    DatadogLogsClient client(mock);

    auto result = client.Search(SampleRequest());
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Authentication);
    CHECK(result.Error().http_status == 403);
    CHECK(result.Error().message.find("Forbidden") != std::string::npos);
}

TEST_CASE("DatadogLogsClient: 400 carries the API detail", "[datadog]") {
    MockHttpSession mock;
    mock.EnqueuePost(Result<HttpResponse, Error>::Ok(
        {400, {}, LoadFixture("error_bad_query.json")}));
    DatadogLogsClient client(mock);

    auto result = client.Search(SampleRequest());
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("unbalanced parentheses") != std::string::npos);
}

TEST_CASE("DatadogLogsClient: transport errors pass through", "[datadog]") {
    MockHttpSession mock;
    mock.EnqueuePost(Result<HttpResponse, Error>::Err(Error{
        "Post", "/api/v2/logs/events/search", std::nullopt,
        "Read timed out", ErrorCategory::Timeout}));
    DatadogLogsClient client(mock);

    auto result = client.Search(SampleRequest());
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Timeout);
    CHECK(result.Error().message == "Read timed out");
}
