#pragma once

#include "sync/ChangeMonitor.hpp"
#include "config/Config.hpp"

#include <atomic>
#include <memory>
#include <mutex>

namespace sdbx::cloud { class RemoteClient; }
namespace sdbx::config { class ConfigStore; }

namespace sdbx::sync {

// Keeps the local folder up to date with remote changes.
//
// Two workers: a connection watcher that runs for the lifetime of the monitor
// and owns the connected signal, and a remote watcher that long-polls for
// changes while the monitor is started. Losing the connection stops the remote
// watcher; regaining it restarts the watcher unless it was stopped by the user.
class Monitor final : public ChangeMonitor {
public:
    Monitor(std::shared_ptr<cloud::RemoteClient> client,
            std::shared_ptr<config::ConfigStore> store,
            config::MonitorConfig cfg);

    ~Monitor() override;

    void start() override;
    void stop() override;

    [[nodiscard]] bool isRunning() const override;
    [[nodiscard]] bool isConnected() const override { return connected_.load(); }

    void setStoppedByUser(bool stopped) override { stoppedByUser_.store(stopped); }
    [[nodiscard]] bool isStoppedByUser() const { return stoppedByUser_.load(); }

private:
    class ConnectionWatcher;
    class RemoteWatcher;

    std::shared_ptr<cloud::RemoteClient> client_;
    std::shared_ptr<config::ConfigStore> store_;
    config::MonitorConfig cfg_;

    std::atomic<bool> connected_{false};
    std::atomic<bool> stoppedByUser_{true};
    std::mutex lifecycleMutex_;

    std::unique_ptr<RemoteWatcher> remote_;
    std::unique_ptr<ConnectionWatcher> connection_;

    void onConnectionChanged(bool connected);
};

}
