#pragma once

#include <mutex>
#include <set>
#include <string>
#include <utility>

// Names held by in-flight session creations, scoped per repository. A name
// is reserved before any git work starts and released once the session row
// exists or the creation is abandoned.
class NameReservation {
public:
    bool reserve(const std::string& repo, const std::string& name);
    void unreserve(const std::string& repo, const std::string& name);
    bool is_reserved(const std::string& repo, const std::string& name) const;
    size_t size() const;

private:
    mutable std::mutex mu_;
    std::set<std::pair<std::string, std::string>> held_;
};

// Releases a reservation when it goes out of scope.
class ReservationGuard {
public:
    ReservationGuard(NameReservation& registry, std::string repo, std::string name)
        : registry_(&registry), repo_(std::move(repo)), name_(std::move(name)) {}
    ~ReservationGuard() { release(); }

    ReservationGuard(const ReservationGuard&) = delete;
    ReservationGuard& operator=(const ReservationGuard&) = delete;

    void release() {
        if (registry_) registry_->unreserve(repo_, name_);
        registry_ = nullptr;
    }

private:
    NameReservation* registry_;
    std::string repo_;
    std::string name_;
};
