#include "offline_sync/sync_worker.hpp"

namespace offline_sync {

SyncWorker::SyncWorker(SyncCoordinator& coordinator)
    : coordinator_(coordinator),
      logger_(get_logger()) {}

SyncWorker::~SyncWorker() {
    stop();
}

void SyncWorker::start() {
    std::scoped_lock lock(mutex_);
    if (flag_running_.exchange(true)) {
        return;
    }
    worker_thread_ = std::thread([this]() { worker_loop(); });
    logger_->debug("Sync worker started");
}

void SyncWorker::stop() {
    {
        std::scoped_lock lock(mutex_);
        if (!flag_running_.exchange(false)) {
            return;
        }
    }
    cv_trigger_.notify_all();
    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }
    logger_->debug("Sync worker stopped after {} passes", completed_passes_.load());
}

void SyncWorker::trigger() {
    {
        std::scoped_lock lock(mutex_);
        flag_pending_ = true;
    }
    cv_trigger_.notify_one();
}

std::size_t SyncWorker::completed_passes() const noexcept {
    return completed_passes_.load();
}

bool SyncWorker::running() const noexcept {
    return flag_running_.load();
}

void SyncWorker::worker_loop() {
    while (true) {
        {
            std::unique_lock lock(mutex_);
            cv_trigger_.wait(lock, [this]() { return flag_pending_ || !flag_running_.load(); });
            if (!flag_running_.load()) {
                return;
            }
            flag_pending_ = false;
        }

        const SyncResult result = coordinator_.sync_queue();
        if (!result.success) {
            logger_->debug("Triggered sync did not run: {}", to_string(result.reason));
        }
        ++completed_passes_;
    }
}

}  // namespace offline_sync
