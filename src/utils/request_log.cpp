#include <utils/request_log.hpp>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iostream>
#include <utility>

namespace static_server::request_log {
    std::string format_timestamp(std::chrono::system_clock::time_point time) {
        auto since_epoch = time.time_since_epoch();
        auto secs = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
        auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch - secs);

        char buffer[48];
        std::snprintf(buffer, sizeof(buffer), "%lld.%09lld",
                      static_cast<long long>(secs.count()), static_cast<long long>(nanos.count()));
        return buffer;
    }

    RequestLog::RequestLog(std::string file_path) : file_path(std::move(file_path)) {
    }

    void RequestLog::log_request(const std::string& client, const std::string& summary) {
        try {
            std::string entry = "[" + format_timestamp() + "] " + client + " - " + summary + "\n";

            std::lock_guard<std::mutex> lock(mutex);
            std::ofstream file(file_path, std::ios::app | std::ios::binary);
            if (!file) {
                std::cerr << "Failed to open log file " << file_path << ": " << std::strerror(errno) << std::endl;
                return;
            }
            file << entry;
            if (!file) {
                std::cerr << "Failed to write to log file " << file_path << std::endl;
            }
        } catch (const std::exception& e) {
            std::cerr << "Error writing request log: " << e.what() << std::endl;
        }
    }
}
