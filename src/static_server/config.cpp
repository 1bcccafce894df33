#include <static_server/config.hpp>
#include <stdexcept>
#include <string>

namespace {
    // Parse the value following "--name=" as a positive integer no larger than max_value
    unsigned long parse_number(const std::string &arg, std::size_t prefix_len, unsigned long max_value) {
        std::string value = arg.substr(prefix_len);
        try {
            std::size_t consumed = 0;
            unsigned long number = std::stoul(value, &consumed);
            if (consumed != value.size() || value[0] == '-') {
                throw std::invalid_argument("trailing characters");
            }
            if (number == 0 || number > max_value) {
                throw std::out_of_range("must be between 1-" + std::to_string(max_value));
            }
            return number;
        } catch (const std::exception& e) {
            throw std::invalid_argument("Invalid value for " + arg.substr(0, prefix_len - 1) + ": " + e.what());
        }
    }

    bool starts_with(const std::string &arg, const char *prefix) {
        return arg.rfind(prefix, 0) == 0;
    }
}

static_server::config::Settings static_server::config::parse_arguments(int argc, const char *const *argv) {
    Settings settings;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--directory" || arg == "-d") {
            if (i + 1 < argc) {
                settings.root_path = argv[++i];
            } else {
                throw std::invalid_argument("--directory option requires a path argument");
            }
        } else if (arg == "--assets") {
            if (i + 1 < argc) {
                settings.assets_path = argv[++i];
            } else {
                throw std::invalid_argument("--assets option requires a path argument");
            }
        } else if (starts_with(arg, "--port=")) {
            settings.port = static_cast<uint16_t>(parse_number(arg, 7, 65535));
        } else if (starts_with(arg, "--host=")) {
            settings.bind_address = arg.substr(7);
            if (settings.bind_address.empty()) {
                throw std::invalid_argument("--host requires an address");
            }
        } else if (starts_with(arg, "--max-connections=")) {
            settings.max_connections = parse_number(arg, 18, 4096);
        } else if (starts_with(arg, "--rate-limit=")) {
            settings.rate_limit = parse_number(arg, 13, 1000000);
        } else if (starts_with(arg, "--rate-window=")) {
            settings.rate_window = std::chrono::seconds(parse_number(arg, 14, 86400));
        } else if (starts_with(arg, "--read-timeout=")) {
            settings.read_timeout = std::chrono::seconds(parse_number(arg, 15, 3600));
        } else if (starts_with(arg, "--log-file=")) {
            settings.log_file = arg.substr(11);
            if (settings.log_file.empty()) {
                throw std::invalid_argument("--log-file requires a path");
            }
        } else if (arg == "--gzip") {
            settings.gzip = true;
        } else {
            throw std::invalid_argument("Unknown option: " + arg);
        }
    }

    return settings;
}
