#pragma once

#include "decryption_oracle.h"
#include "../crypto/keypair.h"
#include "../crypto/threshold.h"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <thread>

namespace oracle {

/**
 * Tunables for the reference oracle
 */
struct OracleConfig {
    uint32_t threshold = 2;       // trustees needed to decrypt
    uint32_t trustees = 3;        // key shares dealt
    uint64_t max_count = 1000000; // largest decodable per-option count
};

/**
 * Pending work for the oracle worker
 * Thread-safe producer-consumer queue
 */
class RequestQueue {
public:
    struct Job {
        DecryptionRequest request;
        ResultCallback callback;
    };

    /**
     * Push job to queue
     * Returns false if the queue is stopped
     */
    bool push(Job job);

    /**
     * Pop job from queue (blocking)
     * Returns false once the queue is stopped and drained
     */
    bool pop(Job& job);

    /**
     * Stop the queue (unblocks waiting consumers)
     */
    void stop();

    /**
     * Re-arm a stopped queue
     */
    void reset();

    size_t size() const;

private:
    std::queue<Job> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stopped_ = false;
};

/**
 * In-process threshold-decryption oracle
 *
 * Deals a tally key among `trustees` key shares, and answers each request on
 * a background thread: `threshold` trustees produce partial decryptions, the
 * partials are combined, and the counts are signed with the oracle key.
 * Requests whose counts cannot be decoded are dropped and counted in
 * decrypt_failures().
 */
class ThresholdOracle : public DecryptionOracle {
public:
    explicit ThresholdOracle(const OracleConfig& config = {});
    ~ThresholdOracle() override;

    // Non-copyable
    ThresholdOracle(const ThresholdOracle&) = delete;
    ThresholdOracle& operator=(const ThresholdOracle&) = delete;

    /**
     * Start the worker thread
     */
    bool start();

    /**
     * Stop the worker thread; queued requests are still answered first
     */
    void stop();

    bool is_running() const { return running_.load(); }

    bool submit(const DecryptionRequest& request, ResultCallback callback) override;

    [[nodiscard]] const crypto::PublicKey& signer() const override { return signing_key_.public_key(); }

    /**
     * Key that ballots for polls served by this oracle must be encrypted to
     */
    [[nodiscard]] const crypto::TallyKey& tally_key() const { return keys_.public_key; }

    /**
     * Decrypt a request synchronously on the calling thread
     * Returns nullopt if any ciphertext cannot be decoded
     */
    [[nodiscard]] std::optional<DecryptionResult> decrypt(const DecryptionRequest& request) const;

    size_t requests_received() const { return requests_received_.load(); }
    size_t results_delivered() const { return results_delivered_.load(); }
    size_t decrypt_failures() const { return decrypt_failures_.load(); }
    size_t pending_requests() const { return queue_.size(); }

private:
    OracleConfig config_;
    crypto::ThresholdKeys keys_;
    crypto::ThresholdDecryptor decryptor_;
    crypto::Keypair signing_key_;

    RequestQueue queue_;
    std::thread worker_;
    std::atomic<bool> running_{false};
    std::mutex lifecycle_mutex_;

    std::atomic<size_t> requests_received_{0};
    std::atomic<size_t> results_delivered_{0};
    std::atomic<size_t> decrypt_failures_{0};

    void worker_loop();
};

} // namespace oracle
