#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace MS {

/**
 * Decodes text that may or may not have been escaped with JavaScript's
 * encodeURIComponent. The decoded form is returned only when escaping it
 * again reproduces the input exactly and it is valid UTF-8; any other text
 * comes back unchanged.
 */
[[nodiscard]] auto decodeComponent(std::string_view text) -> std::string;

// encodeURIComponent: every byte outside A-Z a-z 0-9 and "-_.~!*'()" as %XX.
[[nodiscard]] auto encodeComponent(std::string_view text) -> std::string;

// Applies decodeComponent to every string value, recursing through arrays and
// objects. Object keys are left alone.
auto decodePayloadStrings(nlohmann::json& value) -> void;

} // namespace MS
