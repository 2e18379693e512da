#pragma once
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace draftline::core::config {

    // Generates a random RFC 4122 version 4 UUID, e.g. "3b241101-e2bb-4255-8caf-4136c566a962"
    inline std::string generate_draft_id() {
        thread_local std::mt19937_64 gen(std::random_device{}());
        std::uniform_int_distribution<std::uint64_t> dis;

        std::uint64_t hi = dis(gen);
        std::uint64_t lo = dis(gen);
        hi = (hi & 0xffffffffffff0fffULL) | 0x0000000000004000ULL; // version 4
        lo = (lo & 0x3fffffffffffffffULL) | 0x8000000000000000ULL; // variant 10xx

        std::ostringstream ss;
        ss << std::hex << std::setfill('0')
           << std::setw(8) << (hi >> 32) << "-"
           << std::setw(4) << ((hi >> 16) & 0xffffULL) << "-"
           << std::setw(4) << (hi & 0xffffULL) << "-"
           << std::setw(4) << (lo >> 48) << "-"
           << std::setw(12) << (lo & 0xffffffffffffULL);
        return ss.str();
    }

    // Generates a 32-character hex token identifying one SSE channel
    inline std::string generate_channel_id() {
        thread_local std::mt19937 gen(std::random_device{}());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        for (int i = 0; i < 32; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

} // namespace draftline::core::config
