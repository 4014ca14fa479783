#pragma once
#include <cstdint>
#include <spdlog/fmt/fmt.h>
#include <random>
#include <string>

namespace pushhub::utils {

    // 128 random bits as 32 hex characters; used to tag sessions in logs.
    inline std::string generate_session_id() {
        thread_local std::mt19937_64 gen{std::random_device{}()};
        std::uniform_int_distribution<std::uint64_t> dist;
        return fmt::format("{:016x}{:016x}", dist(gen), dist(gen));
    }
}// namespace pushhub::utils
