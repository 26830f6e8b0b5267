// =============================================================================
// AdbFleet - Single-Flight Guard
// =============================================================================
// At most one guarded operation runs per process. A second request while the
// slot is taken is rejected (not queued); the caller retries later.
// Usage:
//   auto lease = guard.tryAcquire("refresh");
//   if (!lease) { /* busy: guard.currentOperation() says who holds it */ }
//   ... work ...            // slot released when `lease` is destroyed
// =============================================================================
#pragma once
#include <mutex>
#include <optional>
#include <string>

namespace fleet {

class SingleFlightGuard {
public:
    // RAII ownership of the slot; move-only
    class Lease {
    public:
        Lease() = default;
        ~Lease() { release(); }

        Lease(Lease&& o) noexcept : guard_(o.guard_) { o.guard_ = nullptr; }
        Lease& operator=(Lease&& o) noexcept {
            if (this != &o) {
                release();
                guard_ = o.guard_;
                o.guard_ = nullptr;
            }
            return *this;
        }
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        explicit operator bool() const { return guard_ != nullptr; }

        // Frees the slot early; no-op on an empty lease
        void release() {
            if (guard_) {
                guard_->release();
                guard_ = nullptr;
            }
        }

    private:
        friend class SingleFlightGuard;
        explicit Lease(SingleFlightGuard* guard) : guard_(guard) {}
        SingleFlightGuard* guard_ = nullptr;
    };

    SingleFlightGuard() = default;
    SingleFlightGuard(const SingleFlightGuard&) = delete;
    SingleFlightGuard& operator=(const SingleFlightGuard&) = delete;

    // Empty lease if another operation holds the slot
    Lease tryAcquire(const std::string& operation);

    // Clears the slot (normally called through Lease)
    void release();

    bool busy() const;
    std::optional<std::string> currentOperation() const;

private:
    mutable std::mutex mutex_;
    std::optional<std::string> current_;
};

} // namespace fleet
