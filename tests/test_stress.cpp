#include <gtest/gtest.h>
#include "challenge_service.hpp"
#include "verification_service.hpp"
#include <thread>
#include <vector>
#include <atomic>
#include <chrono>

using namespace captcha;

TEST(StressTest, ConcurrentDebugChallenges) {
    RasterRenderer renderer;
    CommitmentCodec codec("stress_secret");
    ChallengeService service(renderer, codec);
    VerificationService verifier(codec);
    ChallengeConfig config = ChallengeConfig::parse(
        R"({"image": {"width": 120, "height": 40}, "particleOptions": [50], "debug": true})");

    const int num_threads = 4;
    const int rounds_per_thread = 25;
    std::atomic<int> success_count{0};
    std::atomic<int> failure_count{0};

    auto worker = [&]() {
        for (int i = 0; i < rounds_per_thread; ++i) {
            try {
                ChallengeResult r = service.create_challenge(config, "internal");
                if (verifier.verify_answer(r.token, "ABC123", "internal")) {
                    success_count++;
                } else {
                    failure_count++;
                }
            } catch (const std::exception& e) {
                ADD_FAILURE() << "create_challenge threw: " << e.what();
                failure_count++;
            }
        }
    };

    std::vector<std::thread> threads;
    auto start = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back(worker);
    }

    for (auto& t : threads) {
        t.join();
    }
    auto end = std::chrono::high_resolution_clock::now();

    std::chrono::duration<double> diff = end - start;
    std::cout << "[*] Issued and verified " << success_count << " challenges in " << diff.count() << "s" << std::endl;

    EXPECT_EQ(success_count, num_threads * rounds_per_thread);
    EXPECT_EQ(failure_count, 0);
}

TEST(StressTest, ConcurrentCommitments) {
    CommitmentCodec codec;
    const int num_threads = 8;
    const int commits_per_thread = 500;
    std::atomic<int> success_count{0};

    auto worker = [&](int thread_id) {
        for (int i = 0; i < commits_per_thread; ++i) {
            std::string challenge = "c" + std::to_string(thread_id) + "x" + std::to_string(i);
            Commitment c = codec.commit(challenge);
            if (codec.verify(c.token, challenge)) {
                success_count++;
            }
        }
    };

    std::vector<std::thread> threads;
    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back(worker, i);
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(success_count, num_threads * commits_per_thread);
}
