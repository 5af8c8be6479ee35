#include "sessions/name_reservation.hpp"

bool NameReservation::reserve(const std::string& repo, const std::string& name) {
    std::lock_guard lock(mu_);
    return held_.emplace(repo, name).second;
}

void NameReservation::unreserve(const std::string& repo, const std::string& name) {
    std::lock_guard lock(mu_);
    held_.erase({repo, name});
}

bool NameReservation::is_reserved(const std::string& repo, const std::string& name) const {
    std::lock_guard lock(mu_);
    return held_.contains({repo, name});
}

size_t NameReservation::size() const {
    std::lock_guard lock(mu_);
    return held_.size();
}
