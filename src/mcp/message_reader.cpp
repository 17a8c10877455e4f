#include <ddlogs_mcp/mcp/message_reader.hpp>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <sstream>

namespace ddlogs_mcp {

namespace {

bool IsBlank(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
}

// First character of any JSON value.
bool StartsValue(const std::string& text) {
    auto pos = text.find_first_not_of(" \t\r\n");
    if (pos == std::string::npos) return false;
    char c = text[pos];
    return std::strchr("{[\"-tfn", c) != nullptr ||
           std::isdigit(static_cast<unsigned char>(c)) != 0;
}

} // anonymous namespace

JsonMessageReader::JsonMessageReader(std::istream& in) : in_(in) {}

bool JsonMessageReader::NextChunk(std::string& chunk) {
    if (!carry_.empty()) {
        chunk = std::move(carry_);
        carry_.clear();
        return true;
    }
    if (!std::getline(in_, chunk)) return false;
    ++line_number_;
    if (!chunk.empty() && chunk.back() == '\r') {
        chunk.pop_back();
    }
    return true;
}

std::optional<Result<nlohmann::json, std::string>> JsonMessageReader::Next() {
    using R = Result<nlohmann::json, std::string>;

    std::string pending;
    size_t first_line = 0;
    std::string chunk;
    while (NextChunk(chunk)) {
        if (pending.empty() && IsBlank(chunk)) continue;

        const bool continued = !pending.empty();
        if (continued) {
            pending += '\n';
        } else {
            first_line = line_number_;
        }
        pending += chunk;

        // operator>> parses a single value and leaves the stream after it.
        std::istringstream value_in(pending);
        nlohmann::json value;
        try {
            value_in >> value;
        } catch (const nlohmann::json::parse_error& e) {
            // The lexer read past the buffer: the value continues on a later line.
            if (e.byte > pending.size()) continue;
            if (continued) {
                // Give the newest line its own chance; only the fragment before
                // it is dropped.
                carry_ = chunk;
                return R::Err("line " + std::to_string(first_line) +
                              ": incomplete JSON value followed by line " +
                              std::to_string(line_number_) + ": " + e.what());
            }
            return R::Err("line " + std::to_string(line_number_) + ": " + e.what());
        }

        std::streamoff consumed = value_in.tellg();
        std::string rest = consumed < 0
            ? std::string()
            : pending.substr(static_cast<size_t>(consumed));
        if (IsBlank(rest)) return R::Ok(std::move(value));
        if (StartsValue(rest)) {
            carry_ = std::move(rest);
            return R::Ok(std::move(value));
        }
        return R::Err("line " + std::to_string(line_number_) +
                      ": unexpected text after JSON value: " + rest);
    }

    if (!pending.empty()) {
        return R::Err("incomplete JSON at end of input (line " +
                      std::to_string(line_number_) + ")");
    }
    return std::nullopt;
}

} // namespace ddlogs_mcp
