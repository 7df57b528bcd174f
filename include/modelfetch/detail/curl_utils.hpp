#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace modelfetch::detail {

void ensureCurlInitialized();

struct ContentRange {
    std::uint64_t first{0};
    std::uint64_t last{0};
    std::optional<std::uint64_t> total; // "*" when the server does not know
};

// Parses a "Content-Range: bytes <first>-<last>/<total>" header value.
[[nodiscard]] std::optional<ContentRange> parseContentRange(std::string_view value);

// Splits a raw "Name: value\r\n" header line; names are lower-cased.
[[nodiscard]] std::optional<std::pair<std::string, std::string>> parseHeaderLine(std::string_view line);

// curl reports unknown lengths as -1.
[[nodiscard]] std::uint64_t toByteCount(long long value) noexcept;

} // namespace modelfetch::detail
