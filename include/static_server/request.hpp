#ifndef REQUEST_HPP
#define REQUEST_HPP

#include <string>
#include <map>

namespace static_server {
    struct HTTP_Request {
        std::string method, path, version;
        // Header names are stored lower-cased
        std::map<std::string, std::string> headers;

        // Empty string when the header is absent
        std::string header(const std::string &name) const;
    };

    // Throws std::invalid_argument when the request line lacks a method or path
    HTTP_Request parse_request(const std::string &raw);
}

#endif
