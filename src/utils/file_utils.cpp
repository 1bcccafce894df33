#include <utils/file_utils.hpp>
#include <fstream>
#include <iostream>
#include <filesystem>
#include <iterator>

namespace {
    bool ends_with(const std::string &value, const char *suffix) {
        std::string tail = suffix;
        return value.size() >= tail.size()
            && value.compare(value.size() - tail.size(), tail.size(), tail) == 0;
    }
}

namespace static_server::file_utils {
    std::optional<std::string> read_file(const std::string& file_path) {
        try {
            // Only regular files are served
            if (!std::filesystem::is_regular_file(file_path)) {
                return std::nullopt;
            }

            std::ifstream file{file_path, std::ios::binary};
            if(!file) {
                throw std::runtime_error("Failed to open file for reading: " + file_path);
            }

            std::string content {
                std::istreambuf_iterator<char>(file),
                std::istreambuf_iterator<char>()
            };
            if (file.bad()) {
                throw std::runtime_error("Failed to read file: " + file_path);
            }
            return content;
        } catch (const std::exception& e) {
            std::cerr << "Error reading file: " << e.what() << std::endl;
            return std::nullopt;
        }
    }

    const char *content_type_for(const std::string& file_path) {
        if (ends_with(file_path, ".html")) {
            return "text/html";
        } else if (ends_with(file_path, ".css")) {
            return "text/css";
        } else if (ends_with(file_path, ".js")) {
            return "application/javascript";
        } else if (ends_with(file_path, ".png")) {
            return "image/png";
        } else if (ends_with(file_path, ".jpg") || ends_with(file_path, ".jpeg")) {
            return "image/jpeg";
        } else if (ends_with(file_path, ".gif")) {
            return "image/gif";
        } else if (ends_with(file_path, ".svg")) {
            return "image/svg+xml";
        } else if (ends_with(file_path, ".ico")) {
            return "image/x-icon";
        }
        return "application/octet-stream";
    }
}
