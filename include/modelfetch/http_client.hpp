#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>

namespace modelfetch {

// Cooperative stop flag, checked by the client at every chunk boundary.
class AbortSignal {
public:
    void abort() noexcept { aborted_.store(true); }
    [[nodiscard]] bool aborted() const noexcept { return aborted_.load(); }

private:
    std::atomic<bool> aborted_{false};
};

struct HttpRequest {
    std::string url;
    std::string method{"GET"};
    std::map<std::string, std::string> headers;
    std::uint64_t range_start{0}; // > 0 sends "Range: bytes=<start>-"
};

struct HttpResponseHead {
    long status_code{0};
    std::uint64_t content_length{0}; // body bytes of this response, 0 = unknown
    std::optional<std::uint64_t> range_start; // first byte reported by Content-Range
    std::uint64_t total_size{0}; // whole resource, 0 = unknown
};

enum class TransferOutcome {
    Finished,
    Aborted
};

class HttpClient {
public:
    using HeadHandler = std::function<void(const HttpResponseHead&)>;
    using DataHandler = std::function<void(const char* data, std::size_t size)>;

    virtual ~HttpClient() = default;

    // Streams one GET. The head handler runs once before the first body byte.
    // Exceptions thrown by a handler end the transfer and are rethrown here;
    // network failures and HTTP statuses >= 400 throw TransferError.
    virtual TransferOutcome fetch(const HttpRequest& request,
                                  const HeadHandler& on_head,
                                  const DataHandler& on_data,
                                  const AbortSignal& abort) = 0;
};

} // namespace modelfetch
