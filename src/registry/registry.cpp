#include "minidisc/registry/registry.h"
#include "minidisc/base/error_code.h"
#include "minidisc/discovery/address_source.h"
#include "minidisc/registry/directory.h"
#include "minidisc/registry/protocol_handler.h"
#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace minidisc {

struct Registry::Impl {
    RegistryConfig config;
    std::shared_ptr<LogSink> log;

    std::unique_ptr<ServiceDirectory> directory;
    std::unique_ptr<RegistryProtocolHandler> handler;
    std::unique_ptr<ElectionController> election;
    std::thread election_thread;

    mutable std::mutex mutex;
    mutable std::condition_variable state_cv;
    std::mutex join_mutex;
    std::exception_ptr error;
    FatalCallback on_fatal;
    ElectionController::StateCallback on_state_change;

    void state_changed(RegistryState state) {
        ElectionController::StateCallback callback;
        {
            std::lock_guard<std::mutex> lock(mutex);
            callback = on_state_change;
        }
        state_cv.notify_all();
        if (callback) {
            callback(state);
        }
    }

    void run_election() {
        try {
            election->run();
        } catch (const std::exception& e) {
            log->error("Registry stopped: {}", e.what());
            FatalCallback callback;
            {
                std::lock_guard<std::mutex> lock(mutex);
                error = std::current_exception();
                callback = on_fatal;
            }
            state_cv.notify_all();
            if (callback) {
                callback(error);
            }
        }
    }

    void join() {
        std::lock_guard<std::mutex> lock(join_mutex);
        if (election_thread.joinable()) {
            election_thread.join();
        }
    }
};

Registry::Registry(std::unique_ptr<Impl> impl)
    : impl_(std::move(impl)) {}

Registry::~Registry() {
    stop();
}

std::unique_ptr<Registry> Registry::start(const RegistryConfig& config,
                                          std::shared_ptr<AddressSource> address_source,
                                          std::shared_ptr<LogSink> log) {
    if (!address_source) {
        throw MinidiscError(ErrorCode::InvalidArgument, "Registry needs an address source");
    }
    if (!log) {
        log = null_log_sink();
    }

    // The local address is fixed for the registry's lifetime, even if the
    // network is reconfigured later.
    NetworkStatus status = address_source->status();
    if (!is_valid_ipv4(status.local_address)) {
        throw MinidiscError(ErrorCode::AddressSourceError,
                            "Invalid local address '" + status.local_address + "'");
    }

    auto impl = std::make_unique<Impl>();
    impl->config = config;
    impl->log = log;
    impl->directory = std::make_unique<ServiceDirectory>(status.local_address, log);
    impl->handler = std::make_unique<RegistryProtocolHandler>(
        *impl->directory, std::chrono::milliseconds(config.delegate_fetch_timeout_ms), log);
    impl->election = std::make_unique<ElectionController>(config, *impl->directory, *impl->handler, log);

    Impl* raw = impl.get();
    impl->election->set_on_state_change([raw](RegistryState state) { raw->state_changed(state); });

    log->info("Starting registry on {}", status.local_address);
    impl->election_thread = std::thread([raw]() { raw->run_election(); });

    return std::unique_ptr<Registry>(new Registry(std::move(impl)));
}

void Registry::advertise_service(uint16_t port, const std::string& name, const Labels& labels) {
    impl_->directory->advertise(AddrPort{impl_->directory->local_address(), port}, name, labels);
}

void Registry::advertise_remote_service(const AddrPort& addr_port, const std::string& name,
                                        const Labels& labels) {
    impl_->directory->advertise_remote(addr_port, name, labels);
}

void Registry::unlist_service(uint16_t port) {
    impl_->directory->unlist(port);
}

void Registry::unlist_remote_service(const AddrPort& addr_port) {
    impl_->directory->unlist_remote(addr_port);
}

std::vector<Service> Registry::services() const {
    return impl_->directory->services();
}

const std::string& Registry::local_address() const {
    return impl_->directory->local_address();
}

RegistryState Registry::state() const {
    return impl_->election->state();
}

uint16_t Registry::serving_port() const {
    return impl_->election->serving_port();
}

RegistryState Registry::wait_for_state(std::initializer_list<RegistryState> states,
                                       std::chrono::milliseconds timeout) const {
    auto reached = [&] {
        RegistryState current = impl_->election->state();
        return std::find(states.begin(), states.end(), current) != states.end() ||
               current == RegistryState::Stopped;
    };
    std::unique_lock<std::mutex> lock(impl_->mutex);
    impl_->state_cv.wait_for(lock, timeout, reached);
    return impl_->election->state();
}

void Registry::set_on_fatal(FatalCallback callback) {
    std::exception_ptr error;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->on_fatal = callback;
        error = impl_->error;
    }
    // The election may already have failed.
    if (error && callback) {
        callback(error);
    }
}

void Registry::set_on_state_change(ElectionController::StateCallback callback) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->on_state_change = std::move(callback);
}

void Registry::stop() {
    if (!impl_) {
        return;
    }
    impl_->election->stop();
    impl_->join();
}

void Registry::wait() {
    impl_->join();
    std::exception_ptr error;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        error = impl_->error;
    }
    if (error) {
        std::rethrow_exception(error);
    }
}

} // namespace minidisc
