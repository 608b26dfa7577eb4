#pragma once
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace uploader::core::config {

    // Correlation id for runs started without --task-id: "task-" + 8 hex digits.
    inline std::string generate_task_token() {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<std::uint32_t> dis;

        std::ostringstream ss;
        ss << "task-" << std::hex << std::setw(8) << std::setfill('0') << dis(gen);
        return ss.str();
    }

} // namespace uploader::core::config
