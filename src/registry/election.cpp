#include "minidisc/registry/election.h"
#include "minidisc/base/error_code.h"
#include "minidisc/net/registry_client.h"
#include "minidisc/registry/registry_server.h"

namespace minidisc {

namespace {
constexpr auto kServerPollInterval = std::chrono::milliseconds(100);
}

const char* to_string(RegistryState state) {
    switch (state) {
        case RegistryState::Unbound:         return "unbound";
        case RegistryState::Leader:          return "leader";
        case RegistryState::DelegateAttempt: return "delegate-attempt";
        case RegistryState::DelegateServing: return "delegate";
        case RegistryState::Stopped:         return "stopped";
    }
    return "unknown";
}

ElectionController::ElectionController(const RegistryConfig& config,
                                       ServiceDirectory& directory,
                                       RegistryProtocolHandler& handler,
                                       std::shared_ptr<LogSink> log)
    : config_(config),
      directory_(directory),
      handler_(handler),
      log_(log ? std::move(log) : null_log_sink()) {}

ElectionController::~ElectionController() {
    stop();
}

void ElectionController::set_on_state_change(StateCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_state_change_ = std::move(callback);
}

void ElectionController::set_sleep_function(SleepFunction sleep) {
    std::lock_guard<std::mutex> lock(mutex_);
    sleep_ = std::move(sleep);
}

void ElectionController::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    stop_cv_.notify_all();
}

void ElectionController::set_state(RegistryState state) {
    RegistryState previous = state_.exchange(state);
    if (previous == state) {
        return;
    }
    log_->debug("Registry state: {} -> {}", to_string(previous), to_string(state));

    StateCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = on_state_change_;
    }
    if (callback) {
        callback(state);
    }
}

bool ElectionController::sleep(std::chrono::milliseconds duration) {
    SleepFunction sleep_fn;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sleep_fn = sleep_;
    }
    if (sleep_fn) {
        return sleep_fn(duration) && !stop_requested();
    }

    std::unique_lock<std::mutex> lock(mutex_);
    return !stop_cv_.wait_for(lock, duration, [this] { return stop_requested_.load(); });
}

void ElectionController::run() {
    const std::string& address = directory_.local_address();
    const AddrPort leader{address, config_.discovery_port};
    const auto backoff = std::chrono::milliseconds(config_.retry_backoff_ms);

    while (!stop_requested()) {
        set_state(RegistryState::Unbound);

        auto server = RegistryServer::bind(address, config_.discovery_port, config_.worker_threads, log_);
        if (server) {
            server->start(handler_.routes());
            serve_as_leader(*server);
            serving_port_ = 0;
            server->shutdown(std::chrono::milliseconds(config_.drain_timeout_ms));
            if (!stop_requested() && !sleep(backoff)) {
                break;
            }
            continue;
        }

        server = RegistryServer::bind(address, 0, config_.worker_threads, log_);
        if (!server) {
            set_state(RegistryState::Stopped);
            throw MinidiscError(ErrorCode::BindFailed,
                                "Cannot bind any port on " + address + ", discovery is unavailable");
        }

        server->start(handler_.routes());
        serving_port_ = server->port();
        set_state(RegistryState::DelegateAttempt);

        const AddrPort self{address, server->port()};
        log_->info("Discovery port {} is taken, registering {} as a delegate", config_.discovery_port,
                   self.to_string());
        RegistryCallResult registration = RegistryClient::add_delegate(
            leader, self, std::chrono::milliseconds(config_.registration_timeout_ms));

        if (!registration.ok()) {
            if (registration.error == ErrorCode::RegistrationFailed) {
                log_->warning("Leader {} refused delegate {}: {}. Retrying in {} ms", leader.to_string(),
                              self.to_string(), registration.message, config_.retry_backoff_ms);
            } else {
                log_->warning("Delegate registration with {} failed: {}. Retrying in {} ms",
                              leader.to_string(), registration.message, config_.retry_backoff_ms);
            }
            server->shutdown(std::chrono::milliseconds(config_.drain_timeout_ms));
            serving_port_ = 0;
            if (!sleep(backoff)) {
                break;
            }
            continue;
        }

        set_state(RegistryState::DelegateServing);
        serve_as_delegate(*server);
        serving_port_ = 0;
    }

    set_state(RegistryState::Stopped);
}

void ElectionController::serve_as_leader(RegistryServer& server) {
    serving_port_ = server.port();
    set_state(RegistryState::Leader);
    log_->info("Serving as leader on {}:{}", server.address(), server.port());

    while (!stop_requested()) {
        if (server.wait_for_exit(kServerPollInterval)) {
            log_->error("Leader server on port {} stopped unexpectedly", server.port());
            return;
        }
    }
}

void ElectionController::serve_as_delegate(RegistryServer& server) {
    const AddrPort leader{directory_.local_address(), config_.discovery_port};
    const auto drain = std::chrono::milliseconds(config_.drain_timeout_ms);
    log_->info("Serving as delegate on {}:{}", server.address(), server.port());

    while (sleep(std::chrono::milliseconds(config_.leader_probe_interval_ms))) {
        if (server.wait_for_exit(std::chrono::milliseconds(0))) {
            log_->error("Delegate server on port {} stopped unexpectedly", server.port());
            server.shutdown(drain);
            sleep(std::chrono::milliseconds(config_.retry_backoff_ms));
            return;
        }

        RegistryCallResult probe = RegistryClient::ping(
            leader, std::chrono::milliseconds(config_.leader_probe_timeout_ms));
        if (!probe.ok()) {
            log_->info("Leader {} is gone ({}), re-running election", leader.to_string(), probe.message);
            server.shutdown(drain);
            return;
        }
    }

    server.shutdown(drain);
}

} // namespace minidisc
