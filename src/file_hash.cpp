#include "updatechecker/file_hash.hpp"

#include <array>
#include <cstddef>
#include <fstream>
#include <memory>

#include <openssl/evp.h>
#include <spdlog/spdlog.h>

namespace updatechecker {

namespace {

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

std::string toHexLower(const unsigned char* bytes, std::size_t len) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        const unsigned v = bytes[i];
        out[2 * i + 0] = kHex[(v >> 4) & 0xF];
        out[2 * i + 1] = kHex[v & 0xF];
    }
    return out;
}

class Md5Digest {
public:
    Md5Digest() : ctx_(EVP_MD_CTX_new(), &EVP_MD_CTX_free) {
        ok_ = ctx_ && EVP_DigestInit_ex(ctx_.get(), EVP_md5(), nullptr) == 1;
    }

    [[nodiscard]] bool ok() const { return ok_; }

    void update(const void* data, std::size_t size) {
        if (ok_ && size > 0) {
            ok_ = EVP_DigestUpdate(ctx_.get(), data, size) == 1;
        }
    }

    std::optional<std::string> finalize() {
        if (!ok_) {
            return std::nullopt;
        }
        std::array<unsigned char, EVP_MAX_MD_SIZE> md{};
        unsigned int md_len = 0;
        if (EVP_DigestFinal_ex(ctx_.get(), md.data(), &md_len) != 1) {
            ok_ = false;
            return std::nullopt;
        }
        return toHexLower(md.data(), md_len);
    }

private:
    DigestContext ctx_;
    bool ok_{false};
};

} // namespace

std::optional<std::string> md5File(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        spdlog::warn("Cannot get md5sum: '{}' can't be opened", path.string());
        return std::nullopt;
    }

    spdlog::debug("Getting md5 of '{}'", path.string());
    Md5Digest digest;
    std::array<char, 64 * 1024> buffer{};
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto got = in.gcount();
        if (got > 0) {
            digest.update(buffer.data(), static_cast<std::size_t>(got));
        }
    }
    if (in.bad()) {
        spdlog::warn("Cannot get md5sum: read error on '{}'", path.string());
        return std::nullopt;
    }
    return digest.finalize();
}

std::string md5Hex(const std::string& data) {
    Md5Digest digest;
    digest.update(data.data(), data.size());
    return digest.finalize().value_or("");
}

} // namespace updatechecker
