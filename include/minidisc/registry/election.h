#ifndef MINIDISC_REGISTRY_ELECTION_H
#define MINIDISC_REGISTRY_ELECTION_H

#include "minidisc/base/config.h"
#include "minidisc/base/logger.h"
#include "minidisc/registry/directory.h"
#include "minidisc/registry/protocol_handler.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>

namespace minidisc {

class RegistryServer;

enum class RegistryState {
    Unbound,          // trying to bind the discovery port
    Leader,           // serving on the discovery port
    DelegateAttempt,  // serving on a free port, registering with the leader
    DelegateServing,  // registered, watching the leader
    Stopped
};

const char* to_string(RegistryState state);

// Decides whether this registry leads its host or serves as a delegate of
// the process holding the discovery port, and keeps it that way:
//
//   Unbound -> Leader
//   Unbound -> DelegateAttempt -> DelegateServing -> Unbound
//   DelegateAttempt -> (backoff) -> Unbound
//
// run() blocks the calling thread until stop().
class ElectionController {
public:
    // Waits for the given duration. Returns false if the controller was
    // asked to stop while waiting.
    using SleepFunction = std::function<bool(std::chrono::milliseconds)>;
    using StateCallback = std::function<void(RegistryState)>;

    ElectionController(const RegistryConfig& config,
                       ServiceDirectory& directory,
                       RegistryProtocolHandler& handler,
                       std::shared_ptr<LogSink> log = null_log_sink());
    ~ElectionController();

    // Throws MinidiscError(BindFailed) if neither the discovery port nor
    // any free port can be bound on the local address.
    void run();

    // Safe to call from any thread, and from a state-change callback.
    void stop();

    RegistryState state() const { return state_.load(); }

    // Port currently being served, 0 when not serving.
    uint16_t serving_port() const { return serving_port_.load(); }

    void set_on_state_change(StateCallback callback);
    void set_sleep_function(SleepFunction sleep);

private:
    void set_state(RegistryState state);
    bool sleep(std::chrono::milliseconds duration);
    bool stop_requested() const { return stop_requested_.load(); }

    void serve_as_leader(RegistryServer& server);
    void serve_as_delegate(RegistryServer& server);

    RegistryConfig config_;
    ServiceDirectory& directory_;
    RegistryProtocolHandler& handler_;
    std::shared_ptr<LogSink> log_;

    std::atomic<RegistryState> state_{RegistryState::Unbound};
    std::atomic<uint16_t> serving_port_{0};
    std::atomic<bool> stop_requested_{false};

    std::mutex mutex_;
    std::condition_variable stop_cv_;
    StateCallback on_state_change_;
    SleepFunction sleep_;
};

} // namespace minidisc

#endif // MINIDISC_REGISTRY_ELECTION_H
