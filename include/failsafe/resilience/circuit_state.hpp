#pragma once

#include <cstdint>
#include <string_view>

namespace failsafe {

// ─────────────────────────────────────────────────────────────────────────────
// Circuit State
// ─────────────────────────────────────────────────────────────────────────────
// The enumerator value is the gauge code exported to dashboards; the name is
// the token used in transition log lines. Both come from this one enum.
//
//   ┌────────┐  err_rate > max_err_rate   ┌─────────┐
//   │  OPEN  │ ─────────────────────────▶ │ TRIPPED │ ◀──────────┐
//   └────────┘                            └────┬────┘            │
//       ▲                                      │ min_closed_sec  │ probe
//       │ half_open_probe                      ▼ elapsed         │ error
//       │ successes                      ┌───────────┐           │
//       └────────────────────────────────│ HALF_OPEN │───────────┘
//                                        └───────────┘

enum class CircuitState : std::uint8_t {
    Open     = 0,  ///< Normal operation, traffic allowed
    Tripped  = 1,  ///< Blocking traffic
    HalfOpen = 2   ///< Probing for recovery
};

[[nodiscard]] constexpr std::string_view to_string(CircuitState state) noexcept {
    switch (state) {
        case CircuitState::Open:     return "OPEN";
        case CircuitState::Tripped:  return "TRIPPED";
        case CircuitState::HalfOpen: return "HALF_OPEN";
    }
    return "OPEN";
}

/// Stable gauge code (0 = OPEN, 1 = TRIPPED, 2 = HALF_OPEN)
[[nodiscard]] constexpr int state_code(CircuitState state) noexcept {
    return static_cast<int>(state);
}

/// Parse a state name, case-insensitive and ignoring surrounding whitespace.
/// Unknown names map to OPEN.
[[nodiscard]] CircuitState circuit_state_from_string(std::string_view name);

/// True when the breaker lets traffic through (OPEN or HALF_OPEN)
[[nodiscard]] constexpr bool allows_traffic(CircuitState state) noexcept {
    return state != CircuitState::Tripped;
}

}  // namespace failsafe
