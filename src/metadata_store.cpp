#include "updatechecker/metadata_store.hpp"
#include "updatechecker/detail/string_utils.hpp"

#include <cctype>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <system_error>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace updatechecker {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::optional<std::string> optionalString(const json& object, const char* key) {
    const auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

std::optional<std::uint64_t> optionalLength(const json& object, const char* key) {
    const auto it = object.find(key);
    if (it == object.end()) {
        return std::nullopt;
    }
    if (it->is_number_unsigned()) {
        return it->get<std::uint64_t>();
    }
    if (it->is_number_integer()) {
        const auto value = it->get<std::int64_t>();
        if (value >= 0) {
            return static_cast<std::uint64_t>(value);
        }
        return std::nullopt;
    }
    if (it->is_string()) {
        return detail::parseUnsigned(it->get<std::string>());
    }
    return std::nullopt;
}

template <typename T> json toJson(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

} // namespace

fs::path MetadataStore::sidecarPath(const fs::path& target) {
    fs::path sidecar = target;
    sidecar += kSidecarSuffix;
    return sidecar;
}

std::optional<CachedMetadata> MetadataStore::load(const fs::path& target) const {
    const fs::path path = sidecarPath(target);
    std::error_code ec;

    if (!fs::exists(target, ec)) {
        spdlog::debug("Ignoring metadata for missing target '{}'", target.string());
        return std::nullopt;
    }
    if (!fs::exists(path, ec)) {
        spdlog::debug("No metadata file found at '{}'", path.string());
        return std::nullopt;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        spdlog::warn("Failed to open metadata '{}'", path.string());
        return std::nullopt;
    }
    const std::string text{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};

    const json document = json::parse(text, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        spdlog::warn("Corrupted metadata file '{}'", path.string());
        return std::nullopt;
    }

    CachedMetadata metadata;
    metadata.source_url = optionalString(document, "url").value_or("");
    metadata.descriptor.etag = optionalString(document, "etag");
    metadata.descriptor.last_modified = optionalString(document, "last_modified");
    metadata.descriptor.content_length = optionalLength(document, "content_length");
    if (const auto cached_at = optionalString(document, "cached_at")) {
        metadata.cached_at = parseTimestamp(*cached_at).value_or(std::chrono::system_clock::time_point{});
    }
    return metadata;
}

bool MetadataStore::save(const fs::path& target, const RemoteDescriptor& descriptor,
                         const std::string& url) const {
    const fs::path path = sidecarPath(target);
    fs::path staging = path;
    staging += ".tmp";

    json document = {
        {"url", url},
        {"etag", toJson(descriptor.etag)},
        {"last_modified", toJson(descriptor.last_modified)},
        {"content_length", toJson(descriptor.content_length)},
        {"cached_at", formatTimestamp(std::chrono::system_clock::now())},
    };

    {
        std::ofstream out(staging, std::ios::binary | std::ios::trunc);
        if (!out) {
            spdlog::warn("Failed to save metadata to '{}': cannot open file", path.string());
            return false;
        }
        out << document.dump(2);
        if (!out.flush()) {
            spdlog::warn("Failed to save metadata to '{}': write error", path.string());
            out.close();
            std::error_code ignored;
            fs::remove(staging, ignored);
            return false;
        }
    }

    std::error_code ec;
    fs::rename(staging, path, ec);
    if (ec) {
        spdlog::warn("Failed to save metadata to '{}': {}", path.string(), ec.message());
        std::error_code ignored;
        fs::remove(staging, ignored);
        return false;
    }

    spdlog::debug("Saved metadata to '{}'", path.string());
    return true;
}

bool MetadataStore::remove(const fs::path& target) const {
    const fs::path path = sidecarPath(target);
    std::error_code ec;
    const bool removed = fs::remove(path, ec);
    if (ec) {
        spdlog::warn("Failed to delete metadata '{}': {}", path.string(), ec.message());
        return false;
    }
    if (removed) {
        spdlog::debug("Deleted metadata file '{}'", path.string());
    }
    return true;
}

std::string formatTimestamp(std::chrono::system_clock::time_point time) {
    const auto since_epoch = time.time_since_epoch();
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(since_epoch - seconds).count();
    std::time_t raw = static_cast<std::time_t>(seconds.count());
    if (micros < 0) {
        micros += 1000000;
        --raw;
    }

    std::tm utc{};
    gmtime_r(&raw, &utc);
    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:06}+00:00", utc.tm_year + 1900,
                       utc.tm_mon + 1, utc.tm_mday, utc.tm_hour, utc.tm_min, utc.tm_sec, micros);
}

std::optional<std::chrono::system_clock::time_point> parseTimestamp(const std::string& text) {
    std::tm utc{};
    std::istringstream in(text);
    in >> std::get_time(&utc, "%Y-%m-%dT%H:%M:%S");
    if (in.fail()) {
        return std::nullopt;
    }

    std::string rest;
    std::getline(in, rest);

    long long micros = 0;
    std::size_t pos = 0;
    if (pos < rest.size() && rest[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < rest.size() && std::isdigit(static_cast<unsigned char>(rest[pos]))) {
            if (digits < 6) {
                micros = micros * 10 + (rest[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        for (; digits < 6; ++digits) {
            micros *= 10;
        }
    }

    long offset_seconds = 0;
    if (pos < rest.size() && (rest[pos] == '+' || rest[pos] == '-')) {
        const int sign = rest[pos] == '-' ? -1 : 1;
        const std::string zone = rest.substr(pos + 1);
        int hours = 0;
        int minutes = 0;
        if (std::sscanf(zone.c_str(), "%2d:%2d", &hours, &minutes) < 1) {
            return std::nullopt;
        }
        offset_seconds = sign * (hours * 3600L + minutes * 60L);
    } else if (pos < rest.size() && rest[pos] != 'Z' && rest[pos] != 'z') {
        return std::nullopt;
    }

    const std::time_t raw = timegm(&utc) - offset_seconds;
    return std::chrono::system_clock::from_time_t(raw) + std::chrono::microseconds(micros);
}

} // namespace updatechecker
