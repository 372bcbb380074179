// Fuzz target for load_input() + Engine::analyze(): exercises the whole
// pipeline on arbitrary snapshots. Malformed input must be rejected with
// an exception, never crash; a loaded snapshot must analyse.

#include <mergeguard/mergeguard.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <stdexcept>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    auto j = nlohmann::json::parse(data, data + size, nullptr, false);
    if (j.is_discarded()) return 0;

    auto input = mergeguard::AnalysisInput{};
    try {
        input = mergeguard::load_input(j);
    } catch (const nlohmann::json::exception&) {
        return 0;
    } catch (const std::runtime_error&) {
        return 0;
    }

    auto config = mergeguard::Config{};
    config.worker_count = 1;
    auto result = mergeguard::Engine{config}.analyze(input);
    (void)result;
    return 0;
}
