#include "modelfetch/curl_http_client.hpp"

#include "modelfetch/detail/curl_utils.hpp"
#include "modelfetch/errors.hpp"
#include "modelfetch/log.hpp"

#include <exception>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <curl/curl.h>
#include <fmt/format.h>

namespace modelfetch {

class CurlHttpClient::Impl {
public:
    explicit Impl(Options options) : options_(std::move(options)) { detail::ensureCurlInitialized(); }

    TransferOutcome fetch(const HttpRequest& request,
                          const HeadHandler& on_head,
                          const DataHandler& on_data,
                          const AbortSignal& abort) {
        using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
        using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

        CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
        if (!curl) {
            throw TransferError("Failed to allocate curl handle");
        }

        HeaderList header_list{nullptr, &curl_slist_free_all};
        for (const auto& [name, value] : request.headers) {
            const auto line = fmt::format("{}: {}", name, value);
            curl_slist* appended = curl_slist_append(header_list.get(), line.c_str());
            if (!appended) {
                throw TransferError("Failed to build request headers");
            }
            header_list.release();
            header_list.reset(appended);
        }

        TransferContext ctx{&on_head, &on_data, &abort, curl.get()};
        const std::string range = fmt::format("{}-", request.range_start);

        curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
        if (request.method != "GET") {
            curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, request.method.c_str());
        }
        if (request.range_start > 0) {
            curl_easy_setopt(curl.get(), CURLOPT_RANGE, range.c_str());
        }
        if (header_list) {
            curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
        }
        curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, options_.user_agent.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, static_cast<long>(options_.connect_timeout.count()));
        curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, static_cast<long>(options_.low_speed_time.count()));
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, &Impl::headerCallback);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &ctx);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &Impl::writeCallback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, &Impl::xferInfoCallback);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &ctx);

        const CURLcode res = curl_easy_perform(curl.get());

        if (ctx.failure) {
            std::rethrow_exception(ctx.failure);
        }
        if (abort.aborted()) {
            return TransferOutcome::Aborted;
        }
        if (res == CURLE_HTTP_RETURNED_ERROR) {
            long code = 0;
            curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);
            throw TransferError(fmt::format("HTTP error {}", code), code);
        }
        if (res != CURLE_OK) {
            throw TransferError(std::string{"curl error: "} + curl_easy_strerror(res));
        }
        if (!ctx.head_delivered) {
            // 空响应体时写回调不会触发
            on_head(ctx.buildHead());
        }
        return TransferOutcome::Finished;
    }

private:
    struct TransferContext {
        const HeadHandler* on_head{nullptr};
        const DataHandler* on_data{nullptr};
        const AbortSignal* abort{nullptr};
        CURL* curl{nullptr};
        std::map<std::string, std::string> headers{};
        bool head_delivered{false};
        std::exception_ptr failure{};

        [[nodiscard]] HttpResponseHead buildHead() const {
            HttpResponseHead head;
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &head.status_code);

            curl_off_t length = -1;
            curl_easy_getinfo(curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
            head.content_length = detail::toByteCount(length);

            auto it = headers.find("content-range");
            if (it != headers.end()) {
                if (const auto range = detail::parseContentRange(it->second)) {
                    head.range_start = range->first;
                    head.total_size = range->total.value_or(0);
                }
            }
            if (head.status_code == 200) {
                head.total_size = head.content_length;
            }
            return head;
        }
    };

    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
        auto* ctx = static_cast<TransferContext*>(userdata);
        const size_t total = size * nitems;
        const std::string_view line(buffer, total);

        // 重定向时每个响应都会带一组新的头
        if (line.compare(0, 5, "HTTP/") == 0) {
            ctx->headers.clear();
            return total;
        }
        if (auto header = detail::parseHeaderLine(line)) {
            ctx->headers[header->first] = std::move(header->second);
        }
        return total;
    }

    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* ctx = static_cast<TransferContext*>(userdata);
        const size_t total = size * nmemb;
        if (ctx->abort->aborted()) {
            return 0;
        }

        try {
            if (!ctx->head_delivered) {
                ctx->head_delivered = true;
                (*ctx->on_head)(ctx->buildHead());
            }
            (*ctx->on_data)(ptr, total);
        } catch (...) {
            ctx->failure = std::current_exception();
            return 0;
        }
        return total;
    }

    static int xferInfoCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
        const auto* ctx = static_cast<const TransferContext*>(clientp);
        return ctx->abort->aborted() ? 1 : 0;
    }

    Options options_;
};

CurlHttpClient::CurlHttpClient() : CurlHttpClient(Options{}) {}

CurlHttpClient::CurlHttpClient(Options options) : impl_(std::make_unique<Impl>(std::move(options))) {}

CurlHttpClient::~CurlHttpClient() = default;

TransferOutcome CurlHttpClient::fetch(const HttpRequest& request,
                                      const HeadHandler& on_head,
                                      const DataHandler& on_data,
                                      const AbortSignal& abort) {
    MODELFETCH_DEBUG("GET {} from byte {}", request.url, request.range_start);
    return impl_->fetch(request, on_head, on_data, abort);
}

} // namespace modelfetch
