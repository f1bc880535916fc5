#include "failsafe/resilience/circuit_state.hpp"

#include <array>
#include <cctype>
#include <string>

namespace failsafe {

namespace {

constexpr std::array<CircuitState, 3> ALL_STATES = {
    CircuitState::Open,
    CircuitState::Tripped,
    CircuitState::HalfOpen
};

std::string_view trim(std::string_view text) noexcept {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

}  // namespace

CircuitState circuit_state_from_string(std::string_view name) {
    const std::string_view trimmed = trim(name);

    std::string upper;
    upper.reserve(trimmed.size());
    for (const char c : trimmed) {
        upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }

    for (const CircuitState state : ALL_STATES) {
        if (to_string(state) == upper) {
            return state;
        }
    }
    return CircuitState::Open;
}

}  // namespace failsafe
