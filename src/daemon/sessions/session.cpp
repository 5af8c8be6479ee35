#include "sessions/session.hpp"

#include <chrono>
#include <format>
#include <random>

std::string_view to_string(SessionStatus status) {
    switch (status) {
        case SessionStatus::Active: return "active";
        case SessionStatus::Cancelled: return "cancelled";
        case SessionStatus::Spec: return "spec";
    }
    return "active";
}

std::string_view to_string(SessionState state) {
    switch (state) {
        case SessionState::Spec: return "spec";
        case SessionState::Running: return "running";
        case SessionState::Reviewed: return "reviewed";
    }
    return "running";
}

std::optional<SessionStatus> parse_session_status(std::string_view s) {
    if (s == "active") return SessionStatus::Active;
    if (s == "cancelled") return SessionStatus::Cancelled;
    if (s == "spec") return SessionStatus::Spec;
    return std::nullopt;
}

std::optional<SessionState> parse_session_state(std::string_view s) {
    if (s == "spec") return SessionState::Spec;
    if (s == "running") return SessionState::Running;
    if (s == "reviewed") return SessionState::Reviewed;
    return std::nullopt;
}

bool can_transition(SessionState from, SessionState to) {
    if (from == to) return true;
    switch (from) {
        case SessionState::Spec: return to == SessionState::Running;
        case SessionState::Running: return to == SessionState::Reviewed || to == SessionState::Spec;
        case SessionState::Reviewed: return to == SessionState::Running;
    }
    return false;
}

int64_t unix_now() {
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

// Random version 4 UUID.
std::string generate_id() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    uint64_t hi = rng();
    uint64_t lo = rng();
    hi = (hi & 0xffffffffffff0fffULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3fffffffffffffffULL) | 0x8000000000000000ULL;
    return std::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
                       hi >> 32, (hi >> 16) & 0xffff, hi & 0xffff,
                       lo >> 48, lo & 0xffffffffffffULL);
}
