#include "sync/Monitor.hpp"
#include "cloud/RemoteClient.hpp"
#include "cloud/errors.hpp"
#include "concurrency/AsyncService.hpp"
#include "config/ConfigStore.hpp"
#include "log/Registry.hpp"

#include <chrono>
#include <stdexcept>

using namespace sdbx::sync;
using namespace sdbx::concurrency;

// -------------------------------------------------------------------------
// RemoteWatcher
// -------------------------------------------------------------------------

class Monitor::RemoteWatcher final : public AsyncService {
public:
    RemoteWatcher(std::shared_ptr<cloud::RemoteClient> client,
                  std::shared_ptr<config::ConfigStore> store,
                  const config::MonitorConfig& cfg)
        : AsyncService("RemoteWatcher"), client_(std::move(client)), store_(std::move(store)), cfg_(cfg) {}

    ~RemoteWatcher() override { stop(); }

protected:
    void runLoop() override {
        while (!shouldStop()) {
            const auto cursor = store_->getString("internal", "cursor");
            if (cursor.empty()) {
                log::Registry::sync()->debug("[RemoteWatcher] No cursor yet, waiting for first sync");
                lazySleep(cfg_.retry_backoff);
                continue;
            }

            try {
                const auto poll = client_->waitForChanges(cursor, cfg_.longpoll_timeout, interruptFlag_);
                if (shouldStop()) continue;

                if (poll.changes) {
                    log::Registry::sync()->info("[RemoteWatcher] Remote changes detected");
                    const auto excluded = store_->getStringList("main", "excluded_folders");
                    const auto next = client_->applyChanges(cursor, excluded);

                    store_->set("internal", "cursor", next);
                    store_->set("internal", "lastsync", nowSeconds());
                }

                // server-requested quiet period before the next longpoll
                if (poll.backoff.count() > 0) {
                    log::Registry::sync()->debug("[RemoteWatcher] Backing off {}s", poll.backoff.count());
                    lazySleep(poll.backoff);
                }
            } catch (const cloud::ConnectionError& e) {
                log::Registry::sync()->warn("[RemoteWatcher] Connection problem, retrying in {}s: {}",
                                            cfg_.retry_backoff.count(), e.what());
                lazySleep(cfg_.retry_backoff);
            } catch (const cloud::ApiError& e) {
                log::Registry::sync()->error("[RemoteWatcher] Dropbox refused request, retrying in {}s: {}",
                                             cfg_.retry_backoff.count(), e.what());
                lazySleep(cfg_.retry_backoff);
            }
        }
    }

private:
    std::shared_ptr<cloud::RemoteClient> client_;
    std::shared_ptr<config::ConfigStore> store_;
    config::MonitorConfig cfg_;

    static double nowSeconds() {
        using namespace std::chrono;
        return duration<double>(system_clock::now().time_since_epoch()).count();
    }
};

// -------------------------------------------------------------------------
// ConnectionWatcher
// -------------------------------------------------------------------------

class Monitor::ConnectionWatcher final : public AsyncService {
public:
    explicit ConnectionWatcher(Monitor& monitor)
        : AsyncService("ConnectionWatcher"), monitor_(monitor) {}

    ~ConnectionWatcher() override { stop(); }

protected:
    void runLoop() override {
        while (!shouldStop()) {
            const bool connected = monitor_.client_->checkConnection();
            if (connected != monitor_.connected_.load()) monitor_.onConnectionChanged(connected);
            lazySleep(monitor_.cfg_.connection_check_interval);
        }
    }

private:
    Monitor& monitor_;
};

// -------------------------------------------------------------------------
// Monitor
// -------------------------------------------------------------------------

Monitor::Monitor(std::shared_ptr<cloud::RemoteClient> client,
                 std::shared_ptr<config::ConfigStore> store,
                 config::MonitorConfig cfg)
    : client_(std::move(client)), store_(std::move(store)), cfg_(cfg) {
    if (!client_ || !store_) throw std::invalid_argument("Monitor requires a remote client and a config store");

    // First probe is synchronous so callers see a meaningful connected signal
    connected_ = client_->checkConnection();
    if (!connected_) log::Registry::sync()->warn("[Monitor] Cannot reach Dropbox servers, will keep trying");

    remote_ = std::make_unique<RemoteWatcher>(client_, store_, cfg_);
    connection_ = std::make_unique<ConnectionWatcher>(*this);
    connection_->start();
}

Monitor::~Monitor() {
    connection_.reset();
    remote_.reset();
}

void Monitor::start() {
    std::scoped_lock lock(lifecycleMutex_);
    if (remote_->isRunning()) return;
    remote_->start();
    log::Registry::sync()->info("[Monitor] Syncing started");
}

void Monitor::stop() {
    std::scoped_lock lock(lifecycleMutex_);
    if (!remote_->isRunning()) return;
    remote_->stop();
    log::Registry::sync()->info("[Monitor] Syncing stopped");
}

bool Monitor::isRunning() const {
    return remote_->isRunning();
}

void Monitor::onConnectionChanged(const bool connected) {
    std::scoped_lock lock(lifecycleMutex_);

    // The watcher is down before anyone observes the lost connection
    if (!connected) {
        log::Registry::sync()->warn("[Monitor] Connection lost");
        remote_->stop();
        connected_ = false;
        return;
    }

    connected_ = true;
    log::Registry::sync()->info("[Monitor] Connected");
    if (!stoppedByUser_ && !remote_->isRunning()) remote_->start();
}
