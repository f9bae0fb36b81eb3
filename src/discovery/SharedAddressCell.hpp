#pragma once
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>

namespace onionsite {

// Holds the onion address once discovery has found it. Written by the
// discovery task, read by request handlers on any worker thread.
//
// Transitions at most once from unknown to known; later writes are ignored,
// so every read after the first publish returns the same value.
class SharedAddressCell {
public:
    std::optional<std::string> get() const {
        std::shared_lock<std::shared_mutex> lock(mtx_);
        return value_;
    }

    bool known() const {
        std::shared_lock<std::shared_mutex> lock(mtx_);
        return value_.has_value();
    }

    // Returns true if this call published the address.
    bool set(const std::string& address) {
        std::unique_lock<std::shared_mutex> lock(mtx_);
        if (value_) return false;
        value_ = address;
        return true;
    }

private:
    mutable std::shared_mutex mtx_;
    std::optional<std::string> value_;
};

} // namespace onionsite
