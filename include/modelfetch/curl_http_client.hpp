#pragma once

#include "http_client.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace modelfetch {

class CurlHttpClient final : public HttpClient {
public:
    struct Options {
        std::string user_agent{"modelfetch"};
        std::chrono::seconds connect_timeout{30};
        std::chrono::seconds low_speed_time{60};
    };

    CurlHttpClient();
    explicit CurlHttpClient(Options options);
    ~CurlHttpClient() override;

    TransferOutcome fetch(const HttpRequest& request,
                          const HeadHandler& on_head,
                          const DataHandler& on_data,
                          const AbortSignal& abort) override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace modelfetch
