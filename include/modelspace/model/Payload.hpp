#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>
#include <optional>
#include <string>

namespace MS {

using EntityId  = std::int64_t;
using SessionId = std::int64_t;

// A decoded update message: a JSON object of flat properties and nested
// property groups (object-valued fields).
using Payload = nlohmann::json;

[[nodiscard]] inline auto readInteger(nlohmann::json const& value) -> std::optional<std::int64_t> {
    if (value.is_number_unsigned()) {
        auto const raw = value.get<std::uint64_t>();
        if (raw > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(raw);
    }
    if (value.is_number_integer()) {
        return value.get<std::int64_t>();
    }
    return std::nullopt;
}

[[nodiscard]] inline auto readInteger(nlohmann::json const& object, std::string const& key)
    -> std::optional<std::int64_t> {
    if (!object.is_object()) {
        return std::nullopt;
    }
    if (auto it = object.find(key); it != object.end()) {
        return readInteger(*it);
    }
    return std::nullopt;
}

} // namespace MS
