#ifndef REQUEST_LOG_HPP
#define REQUEST_LOG_HPP

#include <chrono>
#include <mutex>
#include <string>

namespace static_server::request_log {
    // "secs.nanos" since the epoch
    std::string format_timestamp(std::chrono::system_clock::time_point time = std::chrono::system_clock::now());

    // Append-only request log. Writes are best effort: failures go to stderr
    // and never reach the caller.
    class RequestLog {
    public:
        explicit RequestLog(std::string file_path);

        void log_request(const std::string& client, const std::string& summary);

        const std::string& path() const { return file_path; }

    private:
        std::string file_path;
        std::mutex mutex;
    };
}

#endif
