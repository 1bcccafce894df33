#include <utils/path_validation.hpp>
#include <static_server/config.hpp>

#include <filesystem>

namespace static_server::path_validation {
    bool has_parent_reference(const std::filesystem::path& path) {
        for (const auto& component : path) {
            if (component == "..") {
                return true;
            }
        }
        return false;
    }

    std::string resolve_request_path(const std::string& directory_root, const std::string& request_path) {
        if (request_path == "/") {
            return directory_root + "/" + config::INDEX_DOCUMENT;
        }
        return directory_root + request_path;
    }
}
