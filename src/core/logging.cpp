#include "logging.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <random>

#include "../control/config.hpp"

namespace sluice::logging {

static std::atomic<quill::Logger*> g_logger{nullptr};

void init_logging_system() {
    quill::Backend::start();
}

quill::Logger* init_logger(const control::LogConfig& log_config) {
    if (auto* existing = g_logger.load(std::memory_order_acquire)) {
        return existing;
    }

    std::filesystem::create_directories(log_config.output);

    quill::RotatingFileSinkConfig config;
    config.set_rotation_max_file_size(static_cast<uint64_t>(log_config.rotation.max_size_mb) * 1'000'000);
    config.set_max_backup_files(log_config.rotation.max_files);
    config.set_open_mode('a');

    std::string log_path = fmt::format("{}/{}", log_config.output, log_config.file);

    quill::Logger* logger = nullptr;

    if (log_config.format == "json") {
        auto json_sink =
            quill::Frontend::create_or_get_sink<quill::RotatingJsonFileSink>(log_path, config);
        logger = quill::Frontend::create_or_get_logger("sluice", std::move(json_sink));
    } else {
        auto file_sink =
            quill::Frontend::create_or_get_sink<quill::RotatingFileSink>(log_path, config);
        logger = quill::Frontend::create_or_get_logger("sluice", std::move(file_sink));
    }

    std::string level_lower = log_config.level;
    std::transform(level_lower.begin(), level_lower.end(), level_lower.begin(), ::tolower);

    if (level_lower == "debug") {
        logger->set_log_level(quill::LogLevel::Debug);
    } else if (level_lower == "warning" || level_lower == "warn") {
        logger->set_log_level(quill::LogLevel::Warning);
    } else if (level_lower == "error") {
        logger->set_log_level(quill::LogLevel::Error);
    } else {
        logger->set_log_level(quill::LogLevel::Info);
    }

    g_logger.store(logger, std::memory_order_release);
    return logger;
}

void shutdown_logging() {
    if (auto* logger = g_logger.load(std::memory_order_acquire)) {
        logger->flush_log();
    }
    quill::Backend::stop();
}

quill::Logger* get_logger() noexcept {
    return g_logger.load(std::memory_order_acquire);
}

// Random UUID v4, generated once per thread as the correlation ID base
static std::string generate_base_uuid() {
    std::mt19937 rng(std::random_device{}() ^
                     std::chrono::steady_clock::now().time_since_epoch().count());
    std::uniform_int_distribution<uint32_t> dist;

    std::array<uint8_t, 16> bytes{};
    for (size_t i = 0; i < bytes.size(); i += 4) {
        uint32_t value = dist(rng);
        bytes[i] = static_cast<uint8_t>(value & 0xFF);
        bytes[i + 1] = static_cast<uint8_t>((value >> 8) & 0xFF);
        bytes[i + 2] = static_cast<uint8_t>((value >> 16) & 0xFF);
        bytes[i + 3] = static_cast<uint8_t>((value >> 24) & 0xFF);
    }

    // Version 4, RFC4122 variant
    bytes[6] = (bytes[6] & 0x0F) | 0x40;
    bytes[8] = (bytes[8] & 0x3F) | 0x80;

    return fmt::format("{:02x}{:02x}{:02x}{:02x}-{:02x}{:02x}-{:02x}{:02x}-{:02x}{:02x}-"
                       "{:02x}{:02x}{:02x}{:02x}{:02x}{:02x}",
                       bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5], bytes[6],
                       bytes[7], bytes[8], bytes[9], bytes[10], bytes[11], bytes[12], bytes[13],
                       bytes[14], bytes[15]);
}

std::string generate_correlation_id() {
    static thread_local std::string base_uuid = generate_base_uuid();
    static thread_local uint64_t counter = 0;

    return fmt::format("{}#{}", base_uuid, counter++);
}

bool is_valid_correlation_id(std::string_view id) {
    size_t hash_pos = id.rfind('#');
    if (hash_pos == std::string_view::npos) {
        return false;
    }

    std::string_view uuid = id.substr(0, hash_pos);
    std::string_view counter = id.substr(hash_pos + 1);

    // 8-4-4-4-12
    if (uuid.size() != 36 || uuid[8] != '-' || uuid[13] != '-' || uuid[18] != '-' ||
        uuid[23] != '-') {
        return false;
    }

    if (uuid[14] != '4') {
        return false;
    }

    char variant = uuid[19];
    if (variant != '8' && variant != '9' && variant != 'a' && variant != 'b') {
        return false;
    }

    for (size_t i = 0; i < uuid.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) continue;
        char c = uuid[i];
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
    }

    if (counter.empty()) {
        return false;
    }
    return std::all_of(counter.begin(), counter.end(), [](char c) { return c >= '0' && c <= '9'; });
}

}  // namespace sluice::logging
