#include <chrono>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>

#include "src/crypto/hash.h"
#include "src/crypto/keypair.h"
#include "src/oracle/threshold_oracle.h"
#include "src/polls/clock.h"
#include "src/polls/poll_engine.h"

namespace {

void print_status(const std::string& label, polls::Status status) {
    std::cout << "   " << label << ": " << polls::status_to_string(status) << std::endl;
}

std::string short_id(const polls::Identity& identity) {
    return crypto::short_hex(identity);
}

}

void demo_confidential_poll() {
    std::cout << "\n=== Part 1: Confidential poll ===" << std::endl;
    std::cout << std::endl;

    // Oracle: 2-of-3 trustees
    std::cout << "1. Starting threshold decryption oracle..." << std::endl;
    oracle::ThresholdOracle decryption_oracle(oracle::OracleConfig{
        .threshold = 2, .trustees = 3, .max_count = 10000});
    if (!decryption_oracle.start()) {
        std::cerr << "Failed to start oracle" << std::endl;
        return;
    }
    std::cout << "   Oracle signer: " << short_id(decryption_oracle.signer()) << std::endl;
    std::cout << std::endl;

    std::mutex finalized_mutex;
    std::condition_variable finalized_cv;
    bool finalized = false;

    auto clock = std::make_shared<polls::ManualClock>(1700000000);
    polls::PollEngine engine(decryption_oracle.tally_key(), decryption_oracle, clock);

    engine.set_event_callback([&](const polls::PollEvent& event) {
        std::cout << "   [event] " << polls::event_type_to_string(event.type)
                  << " poll=" << event.poll_id << std::endl;
        if (event.type == polls::EventType::PollFinalized) {
            std::lock_guard<std::mutex> lock(finalized_mutex);
            finalized = true;
            finalized_cv.notify_all();
        }
    });

    // Participants
    std::cout << "2. Creating participants..." << std::endl;
    auto creator = crypto::Keypair::generate();
    auto alice = crypto::Keypair::generate();
    auto bob = crypto::Keypair::generate();
    auto carol = crypto::Keypair::generate();
    std::cout << "   Creator: " << short_id(creator.public_key()) << std::endl;
    std::cout << "   Alice:   " << short_id(alice.public_key()) << std::endl;
    std::cout << "   Bob:     " << short_id(bob.public_key()) << std::endl;
    std::cout << "   Carol:   " << short_id(carol.public_key()) << std::endl;
    std::cout << std::endl;

    std::cout << "3. Creating poll..." << std::endl;
    auto params = polls::PollParamsBuilder()
        .set_title("Favorite Color")
        .add_option("Red")
        .add_option("Blue")
        .add_option("Green")
        .set_window(clock->now() - 60, clock->now() + 3600)
        .build();

    auto poll_id = engine.create_poll(params, creator.public_key());
    if (!poll_id.ok()) {
        std::cerr << "Failed to create poll: " << polls::status_to_string(poll_id.status()) << std::endl;
        return;
    }

    auto stats = engine.get_voting_stats(*poll_id);
    std::cout << "   Voters: " << stats->total_voters
              << ", active: " << (stats->is_active ? "yes" : "no")
              << ", remaining: " << stats->time_remaining << "s" << std::endl;
    std::cout << std::endl;

    std::cout << "4. Voting (ballots encrypted client-side)..." << std::endl;
    const auto& key = decryption_oracle.tally_key();
    print_status("Alice -> Red", engine.vote(*poll_id, 0, crypto::Ciphertext::encrypt_unit(key), alice.public_key()));
    print_status("Bob -> Red", engine.vote(*poll_id, 0, crypto::Ciphertext::encrypt_unit(key), bob.public_key()));
    print_status("Carol -> Blue", engine.vote(*poll_id, 1, crypto::Ciphertext::encrypt_unit(key), carol.public_key()));
    print_status("Alice again -> Green", engine.vote(*poll_id, 2, crypto::Ciphertext::encrypt_unit(key), alice.public_key()));
    std::cout << "   Total voters: " << *engine.get_total_voters(*poll_id) << std::endl;
    std::cout << std::endl;

    std::cout << "5. Finalizing..." << std::endl;
    print_status("Before end", engine.request_finalization(*poll_id, alice.public_key()));
    clock->advance(3600);
    print_status("After end", engine.request_finalization(*poll_id, alice.public_key()));
    print_status("Results while pending", engine.get_results(*poll_id).status());

    {
        std::unique_lock<std::mutex> lock(finalized_mutex);
        if (!finalized_cv.wait_for(lock, std::chrono::seconds(30), [&] { return finalized; })) {
            std::cerr << "   Oracle did not answer in time" << std::endl;
            return;
        }
    }

    auto results = engine.get_results(*poll_id);
    if (!results.ok()) {
        std::cerr << "   " << polls::status_to_string(results.status()) << std::endl;
        return;
    }
    for (size_t i = 0; i < params.options.size(); ++i) {
        std::cout << "   " << params.options[i] << ": " << results.value()[i] << " vote(s)" << std::endl;
    }

    decryption_oracle.stop();
}

void demo_emergency_pause() {
    std::cout << "\n=== Part 2: Emergency pause ===" << std::endl;
    std::cout << std::endl;

    oracle::ThresholdOracle decryption_oracle;
    if (!decryption_oracle.start()) {
        std::cerr << "Failed to start oracle" << std::endl;
        return;
    }

    auto clock = std::make_shared<polls::SystemClock>();
    polls::PollEngine engine(decryption_oracle.tally_key(), decryption_oracle, clock);

    auto creator = crypto::Keypair::generate();
    auto mallory = crypto::Keypair::generate();

    auto poll_id = engine.create_poll("Emergency Test", {"Option A", "Option B"},
                                      clock->now() + 60, clock->now() + 3660,
                                      creator.public_key());
    if (!poll_id.ok()) {
        std::cerr << "Failed to create poll" << std::endl;
        return;
    }

    print_status("Pause by non-creator", engine.emergency_pause(*poll_id, mallory.public_key()));
    print_status("Pause by creator", engine.emergency_pause(*poll_id, creator.public_key()));
    print_status("Results", engine.get_results(*poll_id).status());

    auto phase = engine.get_phase(*poll_id);
    std::cout << "   Phase: " << polls::phase_to_string(*phase) << std::endl;

    decryption_oracle.stop();
}

int main() {
    if (!crypto::init()) {
        std::cerr << "Failed to initialize libsodium" << std::endl;
        return 1;
    }

    std::cout << "=========================================" << std::endl;
    std::cout << "   sealpoll - confidential poll engine" << std::endl;
    std::cout << "=========================================" << std::endl;

    demo_confidential_poll();
    demo_emergency_pause();

    std::cout << "\nDone." << std::endl;
    return 0;
}
