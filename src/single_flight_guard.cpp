#include "single_flight_guard.hpp"
#include "fleet_log.hpp"

namespace fleet {

SingleFlightGuard::Lease SingleFlightGuard::tryAcquire(const std::string& operation) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (current_) {
        FLOG_INFO("guard", "Rejecting '%s': '%s' still in progress", operation.c_str(), current_->c_str());
        return Lease();
    }
    current_ = operation;
    FLOG_DEBUG("guard", "Acquired for '%s'", operation.c_str());
    return Lease(this);
}

void SingleFlightGuard::release() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (current_) {
        FLOG_DEBUG("guard", "Released '%s'", current_->c_str());
    }
    current_.reset();
}

bool SingleFlightGuard::busy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_.has_value();
}

std::optional<std::string> SingleFlightGuard::currentOperation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

} // namespace fleet
