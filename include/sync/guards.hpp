#pragma once

#include "cloud/errors.hpp"
#include "log/Registry.hpp"

#include <type_traits>
#include <utility>

namespace sdbx::sync {

inline constexpr auto CONNECTION_ERROR_MSG =
    "Cannot connect to Dropbox servers. Please check your internet connection and try again later.";

// Pauses syncing for the guard's lifetime and lifts the pause on every exit
// path. Syncing stopped by a lost connection is held down too, so a reconnect
// cannot restart it mid-operation. A guard that finds syncing paused by the
// user leaves it paused.
//
// Target needs isSyncing(), isPausedByUser(), pauseSync(), resumeSync() and
// releaseSync().
template <typename Target>
class SyncPauseGuard {
public:
    explicit SyncPauseGuard(Target& target)
        : target_(target), resume_(target.isSyncing()), hold_(!target.isPausedByUser()) {
        if (resume_ || hold_) target_.pauseSync();
    }

    ~SyncPauseGuard() {
        if (resume_) target_.resumeSync();
        else if (hold_) target_.releaseSync();
    }

    SyncPauseGuard(const SyncPauseGuard&) = delete;
    SyncPauseGuard& operator=(const SyncPauseGuard&) = delete;

    [[nodiscard]] bool willResume() const { return resume_; }

private:
    Target& target_;
    const bool resume_;
    const bool hold_;
};

template <typename Target, typename Fn>
decltype(auto) withSyncPaused(Target& target, Fn&& fn) {
    SyncPauseGuard guard(target);
    return std::forward<Fn>(fn)();
}

// Runs fn only if target is connected. A cloud::ConnectionError raised by fn is
// reported like a missing connection. Returns false on connectivity failure,
// otherwise fn's result (or true for void fn).
//
// Target needs isConnected() and reportConnectionError().
template <typename Target, typename Fn>
bool ifConnected(Target& target, Fn&& fn) {
    if (!target.isConnected()) {
        log::Registry::cloud()->warn("[ifConnected] Not connected, skipping operation");
        target.reportConnectionError();
        return false;
    }

    try {
        if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
            std::forward<Fn>(fn)();
            return true;
        } else {
            return static_cast<bool>(std::forward<Fn>(fn)());
        }
    } catch (const cloud::ConnectionError& e) {
        log::Registry::cloud()->warn("[ifConnected] Connection failed during operation: {}", e.what());
        target.reportConnectionError();
        return false;
    }
}

}
