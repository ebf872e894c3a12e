#include "services/transfer/transfer_worker.hpp"

#include "core/logging.hpp"

#include <stop_token>

namespace dicom_transfer::services {

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("TransferJob");
    return logger;
}

} // anonymous namespace

void ProgressChannel::push(ProgressEvent event) {
    {
        std::lock_guard lock(mutex_);
        if (closed_) {
            return;
        }
        events_.push_back(std::move(event));
    }
    cv_.notify_one();
}

void ProgressChannel::close() {
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

std::optional<ProgressEvent> ProgressChannel::tryPop() {
    std::lock_guard lock(mutex_);
    if (events_.empty()) {
        return std::nullopt;
    }
    ProgressEvent event = std::move(events_.front());
    events_.pop_front();
    return event;
}

std::optional<ProgressEvent> ProgressChannel::waitPop() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return closed_ || !events_.empty(); });
    if (events_.empty()) {
        return std::nullopt;
    }
    ProgressEvent event = std::move(events_.front());
    events_.pop_front();
    return event;
}

std::optional<ProgressEvent> ProgressChannel::waitPopFor(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return closed_ || !events_.empty(); });
    if (events_.empty()) {
        return std::nullopt;
    }
    ProgressEvent event = std::move(events_.front());
    events_.pop_front();
    return event;
}

bool ProgressChannel::isClosed() const {
    std::lock_guard lock(mutex_);
    return closed_;
}

TransferWorker::TransferWorker(std::unique_ptr<TransferJob> job)
    : job_(std::move(job)) {
}

TransferWorker::~TransferWorker() {
    if (thread_.joinable()) {
        thread_.request_stop();
        thread_.join();
    }
}

std::future<JobResult> TransferWorker::start(ProgressSink sink) {
    if (thread_.joinable() || !job_) {
        getLogger()->warn("Transfer worker already started");
        return {};
    }

    std::promise<JobResult> promise;
    auto future = promise.get_future();

    thread_ = std::jthread(
        [this, sink = std::move(sink), promise = std::move(promise)]
        (std::stop_token stopToken) mutable {
            std::stop_callback onStop(stopToken, [this] { job_->cancel(); });

            JobResult result = job_->run([this, &sink](const ProgressEvent& event) {
                if (sink) {
                    sink(event);
                }
                channel_.push(event);
            });

            channel_.close();
            promise.set_value(std::move(result));
        });

    return future;
}

void TransferWorker::cancel() noexcept {
    if (job_) {
        job_->cancel();
    }
}

} // namespace dicom_transfer::services
