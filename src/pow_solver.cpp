#include <iostream>
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <string>
#include <variant>
#include "challenge.hpp"
#include "crypto_utils.hpp"
#include "hash_engine.hpp"
#include "search_worker.hpp"

using namespace powgate;

namespace {

void usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <payload-b64> <difficulty-bits>\n"
              << "       " << prog << " --simulate <hashes-per-sec> [seconds]\n";
}

void print_progress(const SearchProgress& p) {
    std::cout << "[*] " << p.attempts << " hashes, " << p.elapsed_ms << "ms, "
              << std::fixed << std::setprecision(0) << p.hash_rate << " H/s" << std::endl;
}

int simulate(double rate, int seconds) {
    SimulatedSearch sim(rate);
    sim.start();

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(seconds);
    while (std::chrono::steady_clock::now() < deadline) {
        auto event = sim.next_event_for(std::chrono::milliseconds(500));
        if (event && std::holds_alternative<SearchProgress>(*event)) {
            print_progress(std::get<SearchProgress>(*event));
        }
    }
    sim.cancel();
    std::cout << "[*] Simulation finished (no solution is produced in this mode)" << std::endl;
    return 0;
}

}

int main(int argc, char* argv[]) {
    if (argc < 3) {
        usage(argv[0]);
        return 1;
    }

    std::string first = argv[1];
    try {
        if (first == "--simulate") {
            double rate = std::stod(argv[2]);
            int seconds = argc > 3 ? std::stoi(argv[3]) : 5;
            return simulate(rate, seconds);
        }

        int difficulty = std::stoi(argv[2]);
        if (!is_valid_difficulty(difficulty)) {
            std::cerr << "[-] Difficulty must be within [1, 32]" << std::endl;
            return 1;
        }

        auto decoded = crypto::base64_decode(first);
        if (!decoded || decoded->size() != CHALLENGE_PAYLOAD_SIZE) {
            std::cerr << "[-] Payload must be base64 of exactly 32 bytes" << std::endl;
            return 1;
        }
        Payload payload{};
        std::copy(decoded->begin(), decoded->end(), payload.begin());

        std::cout << "[*] Starting PoW Solver..." << std::endl;
        std::cout << "[*] Difficulty: " << difficulty << " (leading zero bits)" << std::endl;

        SearchWorker worker(payload, difficulty);
        std::cout << "[*] Start nonce: " << worker.start_nonce() << std::endl;
        worker.start();

        while (auto event = worker.next_event()) {
            if (std::holds_alternative<SearchProgress>(*event)) {
                print_progress(std::get<SearchProgress>(*event));
                continue;
            }

            const auto& found = std::get<SearchFound>(*event);
            std::cout << "[+] SUCCESS! Found nonce: " << found.nonce << std::endl;
            std::cout << "[+] Digest: " << crypto::to_hex(found.digest.data(), found.digest.size()) << std::endl;
            std::cout << "[+] Verification of found nonce: "
                      << (HashEngine::verify(payload, found.nonce, difficulty) ? "PASSED" : "FAILED") << std::endl;
            std::cout << "[*] Total attempts: " << found.attempts << std::endl;
            std::cout << "[*] Time taken: " << found.elapsed_ms << "ms" << std::endl;
            return 0;
        }

        std::cout << "[-] FAILED: nonce space exhausted without a solution." << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "[-] " << e.what() << std::endl;
        usage(argv[0]);
        return 1;
    }
}
