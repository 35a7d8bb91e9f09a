#include <modelspace/core/Options.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <iostream>
#include <iterator>
#include <string>

namespace MS {

namespace {

template <typename T>
bool parse_integer(std::string_view text, T& out) {
    T value{};
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        return false;
    }
    out = value;
    return true;
}

std::string normalize(std::string_view text) {
    std::string normalized;
    normalized.reserve(text.size());
    for (unsigned char ch : text) {
        if (std::isspace(ch) != 0) {
            continue;
        }
        normalized.push_back(static_cast<char>(std::tolower(ch)));
    }
    return normalized;
}

template <typename Setter>
bool apply_env(char const* key, Setter&& setter) {
    if (const char* raw = std::getenv(key)) {
        return setter(std::string_view{raw});
    }
    return true;
}

bool has_blank_key(SessionKeys const& keys) {
    for (auto const* key : {&keys.sessionId, &keys.entityId, &keys.videoState, &keys.rank,
                            &keys.name, &keys.level, &keys.flags}) {
        if (key->empty()) {
            return true;
        }
    }
    return false;
}

} // namespace

auto SessionKeys::descriptive() -> SessionKeys {
    return SessionKeys{};
}

auto SessionKeys::wire() -> SessionKeys {
    SessionKeys keys;
    keys.sessionId  = "sid";
    keys.entityId   = "uid";
    keys.videoState = "vs";
    keys.rank       = "rc";
    keys.name       = "nm";
    keys.level      = "lv";
    keys.flags      = "flags";
    return keys;
}

auto ParseSessionKeysPreset(std::string_view name) -> std::optional<SessionKeys> {
    auto const normalized = normalize(name);
    if (normalized == "wire") {
        return SessionKeys::wire();
    }
    if (normalized == "descriptive" || normalized == "default") {
        return SessionKeys::descriptive();
    }
    return std::nullopt;
}

auto ValidateRegistryOptions(RegistryOptions const& options) -> std::optional<std::string> {
    if (has_blank_key(options.keys)) {
        return std::string{"payload key names must not be empty"};
    }
    if (options.keys.sessionId == options.keys.entityId) {
        return std::string{"session id and entity id keys must differ"};
    }
    if (options.expectedLevel < 0) {
        return std::string{"expected level must be >= 0"};
    }
    return std::nullopt;
}

bool ApplyRegistryEnvOverrides(RegistryOptions& options) {
    if (!apply_env("MODELSPACE_PAYLOAD_KEYS", [&](std::string_view value) {
            auto keys = ParseSessionKeysPreset(value);
            if (!keys) {
                std::cerr << "MODELSPACE_PAYLOAD_KEYS must be 'wire' or 'descriptive'\n";
                return false;
            }
            options.keys = std::move(*keys);
            return true;
        })) {
        return false;
    }

    if (!apply_env("MODELSPACE_EXPECTED_LEVEL", [&](std::string_view value) {
            std::int64_t parsed = options.expectedLevel;
            if (!parse_integer(value, parsed) || parsed < 0) {
                std::cerr << "MODELSPACE_EXPECTED_LEVEL must be a non-negative integer\n";
                return false;
            }
            options.expectedLevel = parsed;
            return true;
        })) {
        return false;
    }

    if (!apply_env("MODELSPACE_AGGREGATE_ID", [&](std::string_view value) {
            std::int64_t parsed = options.aggregateId;
            if (!parse_integer(value, parsed)) {
                std::cerr << "MODELSPACE_AGGREGATE_ID must be an integer\n";
                return false;
            }
            options.aggregateId = parsed;
            return true;
        })) {
        return false;
    }
    return true;
}

auto RegistryOptions::fromEnvironment() -> RegistryOptions {
    RegistryOptions options;
    if (!ApplyRegistryEnvOverrides(options)) {
        return RegistryOptions{};
    }
    if (auto problem = ValidateRegistryOptions(options)) {
        std::cerr << "[modelspace] " << *problem << ", using defaults\n";
        return RegistryOptions{};
    }
    return options;
}

} // namespace MS
