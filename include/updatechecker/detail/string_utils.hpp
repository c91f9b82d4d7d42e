#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace updatechecker::detail {

[[nodiscard]] std::string trim(std::string_view value);
[[nodiscard]] std::string toLower(std::string_view value);
[[nodiscard]] std::optional<std::uint64_t> parseUnsigned(std::string_view value);

// First whitespace-delimited token, empty when the text holds none.
[[nodiscard]] std::string firstToken(std::string_view text);

} // namespace updatechecker::detail
