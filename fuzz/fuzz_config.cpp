// Fuzz target for load_config(): arbitrary JSON must either load into a
// valid Config or raise ConfigError.

#include <mergeguard/config.hpp>
#include <mergeguard/error.hpp>
#include <mergeguard/json.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    auto j = nlohmann::json::parse(data, data + size, nullptr, false);
    if (j.is_discarded()) return 0;

    try {
        auto config = mergeguard::load_config(j);
        // Round-trip: a loaded config must reload to itself
        auto again = mergeguard::load_config(nlohmann::json(config));
        (void)again;
    } catch (const mergeguard::ConfigError&) {
        return 0;
    }
    return 0;
}
