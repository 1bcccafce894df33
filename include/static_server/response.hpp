#ifndef RESPONSE_HPP
#define RESPONSE_HPP

#include <static_server/status.hpp>
#include <string>
#include <map>

namespace static_server {
    struct HTTP_Response {
        int status_code;
        std::string status_message;
        std::map<std::string, std::string> headers;
        std::string body;

        // Serialize the status line, headers and body. Content-Length always
        // reflects body.size(), except on 204 where it is omitted.
        std::string to_string() const;
    };

    // Status line plus Content-Type; Content-Length is filled in on serialization
    HTTP_Response make_response(HTTP_STATUS_CODE code, const std::string &content_type, std::string body);

    // HTML error page carrying only the Allow-Origin CORS header
    HTTP_Response make_error_response(HTTP_STATUS_CODE code);

    // Allow-Origin only
    void add_origin_header(HTTP_Response &response);
    // Allow-Origin, Allow-Methods and Allow-Headers
    void add_cors_headers(HTTP_Response &response);
}
#endif
