#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>

// One mutex per terminal id, created on first use and kept for the life of
// the registry. The registry lock only guards lookup and insert.
class TerminalLockRegistry {
public:
    std::shared_ptr<std::mutex> lock_for(const std::string& terminal_id) {
        std::lock_guard lock(mu_);
        auto& slot = locks_[terminal_id];
        if (!slot) slot = std::make_shared<std::mutex>();
        return slot;
    }

    size_t size() const {
        std::lock_guard lock(mu_);
        return locks_.size();
    }

private:
    mutable std::mutex mu_;
    std::map<std::string, std::shared_ptr<std::mutex>> locks_;
};
