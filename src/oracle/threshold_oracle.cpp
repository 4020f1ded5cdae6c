#include "threshold_oracle.h"

namespace oracle {

bool RequestQueue::push(Job job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            return false;
        }
        queue_.push(std::move(job));
    }
    cv_.notify_one();
    return true;
}

bool RequestQueue::pop(Job& job) {
    std::unique_lock<std::mutex> lock(mutex_);

    cv_.wait(lock, [this] {
        return !queue_.empty() || stopped_;
    });

    if (queue_.empty()) {
        return false;
    }

    job = std::move(queue_.front());
    queue_.pop();
    return true;
}

void RequestQueue::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
    }
    cv_.notify_all();
}

void RequestQueue::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    stopped_ = false;
}

size_t RequestQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

ThresholdOracle::ThresholdOracle(const OracleConfig& config)
    : config_(config)
    , keys_(crypto::deal_threshold_keys(config.threshold, config.trustees))
    , decryptor_(config.threshold, config.max_count)
    , signing_key_(crypto::Keypair::generate()) {
    // Nothing is accepted until start()
    queue_.stop();
}

ThresholdOracle::~ThresholdOracle() {
    stop();
}

bool ThresholdOracle::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (running_.load()) {
        return true;
    }

    queue_.reset();
    running_.store(true);
    worker_ = std::thread(&ThresholdOracle::worker_loop, this);
    return true;
}

void ThresholdOracle::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!running_.load()) {
        return;
    }

    running_.store(false);
    queue_.stop();

    if (worker_.joinable()) {
        worker_.join();
    }
}

bool ThresholdOracle::submit(const DecryptionRequest& request, ResultCallback callback) {
    if (!queue_.push({request, std::move(callback)})) {
        return false;
    }
    requests_received_++;
    return true;
}

std::optional<DecryptionResult> ThresholdOracle::decrypt(const DecryptionRequest& request) const {
    const auto& shares = keys_.shares;

    // Rotate which trustees answer; any `threshold` of them suffice
    size_t offset = request.request_id[0] % shares.size();

    DecryptionResult result;
    result.request_id = request.request_id;
    result.poll_id = request.poll_id;
    result.counts.reserve(request.ciphertexts.size());

    for (const auto& ct : request.ciphertexts) {
        std::vector<crypto::PartialDecryption> partials;
        partials.reserve(config_.threshold);

        for (uint32_t k = 0; k < config_.threshold; ++k) {
            auto partial = shares[(offset + k) % shares.size()].partial_decrypt(ct);
            if (!partial) {
                return std::nullopt;
            }
            partials.push_back(*partial);
        }

        auto count = decryptor_.decrypt(ct, partials);
        if (!count) {
            return std::nullopt;
        }
        result.counts.push_back(*count);
    }

    result.sign(signing_key_);
    return result;
}

void ThresholdOracle::worker_loop() {
    RequestQueue::Job job;

    while (queue_.pop(job)) {
        auto result = decrypt(job.request);
        if (!result) {
            decrypt_failures_++;
            continue;
        }

        results_delivered_++;
        if (job.callback) {
            job.callback(*result);
        }
    }
}

} // namespace oracle
