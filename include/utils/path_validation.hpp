#ifndef PATH_VALIDATION_HPP
#define PATH_VALIDATION_HPP

#include <filesystem>
#include <string>
namespace static_server::path_validation {
    // True when any component of the path is ".."
    bool has_parent_reference(const std::filesystem::path& path);

    // Map a request path onto the static root: "/" becomes the index document,
    // anything else is appended to the root verbatim
    std::string resolve_request_path(const std::string& directory_root, const std::string& request_path);
}

#endif
