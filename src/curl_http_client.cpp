#include "updatechecker/curl_http_client.hpp"
#include "updatechecker/detail/curl_utils.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

namespace updatechecker {

namespace {

constexpr const char* kUserAgent = "updatechecker/1.0";
constexpr long kMaxRedirects = 10;
constexpr std::chrono::milliseconds kConnectTimeout{30000};

bool isSuccess(long status) {
    return status >= 200 && status < 300;
}

} // namespace

class CurlHttpClient::Impl {
public:
    explicit Impl(std::vector<Header> default_headers)
        : default_headers_(std::move(default_headers)) {
        detail::ensureCurlInitialized();
    }

    std::optional<HeadResponse> head(const std::string& url, std::chrono::milliseconds timeout) {
        auto curl = detail::makeCurlHandle();
        if (!curl) {
            spdlog::warn("Failed to allocate curl handle for HEAD '{}'", url);
            return std::nullopt;
        }

        detail::ResponseHeaders headers;
        auto header_list = buildHeaderList({});

        configureCommon(curl.get(), url, timeout, header_list.get());
        curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, &Impl::headerCallback);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &headers);

        const CURLcode res = curl_easy_perform(curl.get());
        if (res != CURLE_OK) {
            spdlog::debug("HEAD '{}' failed: {}", url, curl_easy_strerror(res));
            return std::nullopt;
        }

        long status = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
        if (!isSuccess(status)) {
            spdlog::debug("HEAD '{}' returned HTTP {}", url, status);
            return std::nullopt;
        }

        HeadResponse response;
        response.status = status;
        response.descriptor.etag = headers.etag;
        response.descriptor.last_modified = headers.last_modified;
        response.descriptor.content_length = headers.content_length;
        response.accepts_ranges = headers.accepts_ranges;

        spdlog::debug("HEAD '{}': etag={}, last_modified={}, content_length={}", url,
                      headers.etag.value_or("<none>"), headers.last_modified.value_or("<none>"),
                      headers.content_length ? std::to_string(*headers.content_length) : "<none>");
        return response;
    }

    std::optional<GetResponse> get(const GetRequest& request, const BodyHandler& handler) {
        auto curl = detail::makeCurlHandle();
        if (!curl) {
            spdlog::warn("Failed to allocate curl handle for GET '{}'", request.url);
            return std::nullopt;
        }

        auto header_list = buildHeaderList(request.headers);
        configureCommon(curl.get(), request.url, request.timeout, header_list.get());

        std::string range;
        if (request.range) {
            range = std::to_string(request.range->first) + "-" + std::to_string(request.range->last);
            curl_easy_setopt(curl.get(), CURLOPT_RANGE, range.c_str());
        }

        TransferContext ctx;
        ctx.curl = curl.get();
        ctx.handler = &handler;

        curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, &Impl::headerCallback);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &ctx.headers);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &Impl::writeCallback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);

        const CURLcode res = curl_easy_perform(curl.get());
        if (res != CURLE_OK) {
            if (ctx.aborted) {
                spdlog::debug("GET '{}' aborted by receiver", request.url);
            } else {
                spdlog::debug("GET '{}' failed: {}", request.url, curl_easy_strerror(res));
            }
            return std::nullopt;
        }

        long status = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
        if (!isSuccess(status)) {
            spdlog::debug("GET '{}' returned HTTP {}", request.url, status);
            return std::nullopt;
        }

        if (!ctx.response_sent) {
            ctx.response = makeResponse(ctx);
            ctx.response_sent = true;
            if (handler.on_response) {
                handler.on_response(ctx.response);
            }
        }
        return ctx.response;
    }

private:
    struct TransferContext {
        CURL* curl{nullptr};
        const BodyHandler* handler{nullptr};
        detail::ResponseHeaders headers;
        GetResponse response;
        bool response_sent{false};
        bool aborted{false};
    };

    static GetResponse makeResponse(const TransferContext& ctx) {
        GetResponse response;
        curl_easy_getinfo(ctx.curl, CURLINFO_RESPONSE_CODE, &response.status);
        response.content_length = ctx.headers.content_length;
        response.content_range = ctx.headers.content_range;
        return response;
    }

    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
        const size_t total = size * nitems;
        auto* headers = static_cast<detail::ResponseHeaders*>(userdata);
        if (headers) {
            headers->consumeLine(std::string_view(buffer, total));
        }
        return total;
    }

    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* ctx = static_cast<TransferContext*>(userdata);
        const size_t total = size * nmemb;
        if (!ctx || !ctx->handler) {
            return 0;
        }

        if (!ctx->response_sent) {
            ctx->response = makeResponse(*ctx);
            ctx->response_sent = true;
            if (ctx->handler->on_response) {
                ctx->handler->on_response(ctx->response);
            }
        }

        if (total == 0) {
            return 0;
        }
        if (ctx->handler->on_data && !ctx->handler->on_data(ptr, total)) {
            ctx->aborted = true;
            return 0;
        }
        return total;
    }

    detail::CurlHeaderList buildHeaderList(const std::vector<Header>& extra) const {
        curl_slist* list = nullptr;
        const auto append = [&list](const Header& header) {
            const std::string line = header.name + ": " + header.value;
            curl_slist* next = curl_slist_append(list, line.c_str());
            if (next) {
                list = next;
            }
        };
        std::for_each(default_headers_.begin(), default_headers_.end(), append);
        std::for_each(extra.begin(), extra.end(), append);
        return detail::CurlHeaderList{list, &curl_slist_free_all};
    }

    static void configureCommon(CURL* curl, const std::string& url,
                                std::chrono::milliseconds timeout, curl_slist* headers) {
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_USERAGENT, kUserAgent);
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, kMaxRedirects);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 1L);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(std::min(timeout, kConnectTimeout).count()));
        if (headers) {
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        }
    }

    std::vector<Header> default_headers_;
};

CurlHttpClient::CurlHttpClient(std::vector<Header> default_headers)
    : impl_(std::make_unique<Impl>(std::move(default_headers))) {}

CurlHttpClient::~CurlHttpClient() = default;

std::optional<HeadResponse> CurlHttpClient::head(const std::string& url,
                                                 std::chrono::milliseconds timeout) {
    return impl_->head(url, timeout);
}

std::optional<GetResponse> CurlHttpClient::get(const GetRequest& request,
                                               const BodyHandler& handler) {
    return impl_->get(request, handler);
}

} // namespace updatechecker
