#include "modelfetch/detail/curl_utils.hpp"

#include <curl/curl.h>
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <mutex>

namespace modelfetch::detail {

namespace {

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

std::optional<std::uint64_t> parseNumber(std::string_view text) {
    text = trim(text);
    if (text.empty() || text.size() > 19) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    for (const char c : text) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        value = value * 10 + static_cast<std::uint64_t>(c - '0');
    }
    return value;
}

} // namespace

void ensureCurlInitialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

std::optional<ContentRange> parseContentRange(std::string_view value) {
    value = trim(value);
    constexpr std::string_view unit = "bytes";
    if (value.size() <= unit.size() || value.compare(0, unit.size(), unit) != 0) {
        return std::nullopt;
    }
    value = trim(value.substr(unit.size()));

    const auto dash = value.find('-');
    const auto slash = value.find('/');
    if (dash == std::string_view::npos || slash == std::string_view::npos || dash > slash) {
        return std::nullopt;
    }

    const auto first = parseNumber(value.substr(0, dash));
    const auto last = parseNumber(value.substr(dash + 1, slash - dash - 1));
    if (!first || !last || *last < *first) {
        return std::nullopt;
    }

    ContentRange range;
    range.first = *first;
    range.last = *last;

    const auto total_text = trim(value.substr(slash + 1));
    if (total_text != "*") {
        const auto total = parseNumber(total_text);
        if (!total || *total <= *last) {
            return std::nullopt;
        }
        range.total = *total;
    }
    return range;
}

std::optional<std::pair<std::string, std::string>> parseHeaderLine(std::string_view line) {
    const auto colon = line.find(':');
    if (colon == std::string_view::npos || colon == 0) {
        return std::nullopt;
    }
    const auto name_view = trim(line.substr(0, colon));
    std::string name;
    name.reserve(name_view.size());
    for (const char c : name_view) {
        name.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return std::make_pair(std::move(name), std::string(trim(line.substr(colon + 1))));
}

std::uint64_t toByteCount(long long value) noexcept {
    //保证不为负数, 如果没有返回length字段的值, 将返回-1
    return value > 0 ? static_cast<std::uint64_t>(value) : 0;
}

} // namespace modelfetch::detail
