#ifndef FILE_UTILS_HPP
#define FILE_UTILS_HPP

#include <string>
#include <optional>
namespace static_server::file_utils {
    // Read an entire file into a string; nullopt when absent, a directory, or unreadable
    std::optional<std::string> read_file(const std::string& file_path);

    // MIME type from the file extension, application/octet-stream when unknown
    const char *content_type_for(const std::string& file_path);
}


#endif
