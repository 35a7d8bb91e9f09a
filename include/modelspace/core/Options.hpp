#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace MS {

// Names of the payload keys the merge engine reads and maintains.
struct SessionKeys {
    std::string sessionId{"sessionId"};
    std::string entityId{"entityId"};
    std::string videoState{"videoState"};
    std::string rank{"rank"};
    std::string name{"name"};
    std::string level{"level"};
    std::string flags{"flags"};

    // Long-form names, used by decoded payloads built in-process.
    static auto descriptive() -> SessionKeys;
    // Short names as they appear in the chat server's JSON messages.
    static auto wire() -> SessionKeys;
};

struct RegistryOptions {
    SessionKeys  keys{};
    std::int64_t expectedLevel{4};
    std::int64_t aggregateId{-500};

    /**
     * Defaults overridden by MODELSPACE_PAYLOAD_KEYS (wire|descriptive),
     * MODELSPACE_EXPECTED_LEVEL and MODELSPACE_AGGREGATE_ID. An invalid
     * environment is reported on stderr and the defaults are kept.
     */
    static auto fromEnvironment() -> RegistryOptions;
};

bool ApplyRegistryEnvOverrides(RegistryOptions& options);

auto ValidateRegistryOptions(RegistryOptions const& options) -> std::optional<std::string>;

auto ParseSessionKeysPreset(std::string_view name) -> std::optional<SessionKeys>;

} // namespace MS
