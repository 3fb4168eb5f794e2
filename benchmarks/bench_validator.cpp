// Sluice Validator Benchmark
// Measures per-frame cost of line framing and Stratum classification

#include "../src/stratum/framer.hpp"
#include "../src/stratum/validator.hpp"

#include <chrono>
#include <iostream>
#include <iomanip>
#include <string>
#include <vector>

using namespace sluice::stratum;

// Benchmark helper
template<typename Func>
double benchmark(Func&& func, size_t iterations) {
    auto start = std::chrono::high_resolution_clock::now();

    for (size_t i = 0; i < iterations; i++) {
        func();
    }

    auto end = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start);
    return static_cast<double>(duration.count()) / iterations;
}

struct Sample {
    const char* name;
    std::string frame;
};

void benchmark_classify() {
    std::cout << "\n=== classify Benchmark ===\n";

    const size_t iterations = 200000;
    std::vector<Sample> samples = {
        {"subscribe", R"({"id":1,"method":"mining.subscribe","params":["cgminer/4.10.0",null]})"},
        {"authorize", R"({"id":2,"method":"mining.authorize","params":["rig1.worker","x"]})"},
        {"submit", R"({"id":4,"method":"mining.submit","params":["rig1.worker","bf","00000001","504e86ed","b2957c02"]})"},
        {"response", R"({"id":1,"result":[[["mining.notify","ae6812eb4cd7735a302a8a9dd95cf71f"]],"08000002",4],"error":null})"},
        {"bad_submit", R"({"id":4,"method":"mining.submit","params":["rig1.worker","bf","zz","504e86ed","b2957c02"]})"},
        {"not_json", "GET / HTTP/1.1"},
    };

    std::cout << std::setw(14) << "Frame"
              << std::setw(10) << "Bytes"
              << std::setw(16) << "Verdict"
              << std::setw(14) << "ns/frame" << "\n";
    std::cout << std::string(54, '-') << "\n";

    for (const auto& sample : samples) {
        Verdict verdict = classify(std::string_view{sample.frame});
        double ns = benchmark([&]() {
            volatile auto result = classify(std::string_view{sample.frame});
            (void)result;
        }, iterations);

        std::cout << std::setw(14) << sample.name
                  << std::setw(10) << sample.frame.size()
                  << std::setw(16) << verdict_name(verdict)
                  << std::setw(14) << std::fixed << std::setprecision(2) << ns << "\n";
    }
}

void benchmark_framer() {
    std::cout << "\n=== LineFramer Benchmark ===\n";

    const std::string frame =
        R"({"id":4,"method":"mining.submit","params":["rig1.worker","bf","00000001","504e86ed","b2957c02"]})";
    const size_t iterations = 20000;
    std::vector<size_t> frames_per_chunk = {1, 8, 64};

    std::cout << std::setw(10) << "Frames"
              << std::setw(15) << "Chunk bytes"
              << std::setw(15) << "ns/frame" << "\n";
    std::cout << std::string(40, '-') << "\n";

    for (size_t count : frames_per_chunk) {
        std::string chunk;
        for (size_t i = 0; i < count; i++) {
            chunk += frame;
            chunk += FRAME_DELIMITER;
        }

        LineFramer framer;
        double ns = benchmark([&]() {
            auto frames = framer.feed(chunk);
            volatile auto n = frames.size();
            (void)n;
        }, iterations);

        std::cout << std::setw(10) << count
                  << std::setw(15) << chunk.size()
                  << std::setw(15) << std::fixed << std::setprecision(2) << (ns / count) << "\n";
    }
}

int main() {
    std::cout << "Sluice Validator Benchmarks\n";
    std::cout << "===========================\n";

    benchmark_classify();
    benchmark_framer();

    std::cout << "\nDone.\n";
    return 0;
}
