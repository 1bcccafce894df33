#ifndef CONFIG_HPP
#define CONFIG_HPP
#include <cstdint>
#include <cstddef>
#include <chrono>
#include <string>

namespace static_server::config {
    inline constexpr int BUF_LEN                        = 4096;
    inline constexpr uint16_t DEFAULT_PORT              = 8000;
    inline constexpr char DEFAULT_BIND_ADDRESS[]        = "0.0.0.0";
    inline constexpr int CONNECTION_TIMEOUT             = 30; // seconds
    inline constexpr int BACKLOG_SIZE                   = 10;
    inline constexpr std::size_t MAX_CONCURRENT_CONNECTIONS = 4;
    inline constexpr std::size_t MAX_REQUESTS_PER_WINDOW    = 100;
    inline constexpr int RATE_LIMIT_WINDOW              = 60; // seconds
    inline constexpr char DEFAULT_ROOT_PATH[]           = "public_html";
    inline constexpr char DEFAULT_ASSETS_PATH[]         = "server_assets";
    inline constexpr char INDEX_DOCUMENT[]              = "index.html";
    inline constexpr char NOT_FOUND_DOCUMENT[]          = "404.html";
    inline constexpr char DEFAULT_LOG_FILE[]            = "server.log";
    inline constexpr char VISITOR_COUNT_PATH[]          = "/visitor-count";

    struct Settings {
        uint16_t port                       = DEFAULT_PORT;
        std::string bind_address            = DEFAULT_BIND_ADDRESS;
        std::string root_path               = DEFAULT_ROOT_PATH;
        std::string assets_path             = DEFAULT_ASSETS_PATH;
        std::string log_file                = DEFAULT_LOG_FILE;
        std::size_t max_connections         = MAX_CONCURRENT_CONNECTIONS;
        std::size_t rate_limit              = MAX_REQUESTS_PER_WINDOW;
        std::chrono::milliseconds rate_window   = std::chrono::seconds(RATE_LIMIT_WINDOW);
        std::chrono::seconds read_timeout       = std::chrono::seconds(CONNECTION_TIMEOUT);
        bool gzip                           = false;
    };

    // Build settings from the command line; throws std::invalid_argument on bad input
    Settings parse_arguments(int argc, const char *const *argv);
}

#endif
