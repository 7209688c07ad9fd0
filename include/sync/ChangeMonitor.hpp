#pragma once

namespace sdbx::sync {

// Background sync activity as seen by the controller. start()/stop() toggle
// the running signal; the connected signal is owned by the monitor.
class ChangeMonitor {
public:
    virtual ~ChangeMonitor() = default;

    virtual void start() = 0;
    virtual void stop() = 0;

    [[nodiscard]] virtual bool isRunning() const = 0;
    [[nodiscard]] virtual bool isConnected() const = 0;

    // While set, a monitor must not restart syncing on its own, e.g. after
    // the connection comes back.
    virtual void setStoppedByUser(bool stopped) = 0;
};

}
