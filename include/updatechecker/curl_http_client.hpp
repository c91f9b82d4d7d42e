#pragma once

#include "http_client.hpp"

#include <memory>
#include <string>
#include <vector>

namespace updatechecker {

class CurlHttpClient final : public HttpClient {
public:
    explicit CurlHttpClient(std::vector<Header> default_headers = {});
    ~CurlHttpClient() override;

    [[nodiscard]] std::optional<HeadResponse> head(const std::string& url,
                                                   std::chrono::milliseconds timeout) override;

    [[nodiscard]] std::optional<GetResponse> get(const GetRequest& request,
                                                 const BodyHandler& handler) override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace updatechecker
