#pragma once

#include <ddlogs_mcp/core/result.hpp>

#include <istream>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace ddlogs_mcp {

// ---------------------------------------------------------------------------
// JsonMessageReader - pulls JSON values off a line-oriented stream.
//
// Values are separated by whitespace, so one line may hold several of them
// and one value may span several lines: while the parser stops at end of
// input the next line is appended. Blank lines are skipped. A parse error
// discards the buffered text and is reported to the caller; when it occurs
// on an appended line, that line is decoded again on its own.
// ---------------------------------------------------------------------------
class JsonMessageReader {
public:
    explicit JsonMessageReader(std::istream& in);

    // The next value, an error describing undecodable input, or nullopt
    // once the stream is exhausted.
    [[nodiscard]] std::optional<Result<nlohmann::json, std::string>> Next();

    // Lines consumed so far.
    [[nodiscard]] size_t LineNumber() const noexcept { return line_number_; }

private:
    // Unparsed text left on the current line, else the next line.
    bool NextChunk(std::string& chunk);

    std::istream& in_;
    std::string carry_;
    size_t line_number_ = 0;
};

} // namespace ddlogs_mcp
