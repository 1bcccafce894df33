#include <static_server/response.hpp>
#include <sstream>
#include <iostream>
#include <stdexcept>
#include <utility>

std::string static_server::HTTP_Response::to_string() const {
    try {
        std::stringstream ss;

        // Status line
        ss << "HTTP/1.1 " << status_code << " " << status_message << "\r\n";

        // Content-Length is derived from the body, never trusted from the map
        std::map<std::string, std::string> all_headers = headers;
        if (status_code == static_cast<int>(HTTP_STATUS_CODE::NO_CONTENT)) {
            all_headers.erase("Content-Length");
        } else {
            all_headers["Content-Length"] = std::to_string(body.size());
        }

        // Headers
        for (const auto &[name, value] : all_headers) {
            ss << name << ": " << value << "\r\n";
        }

        // Empty line separator
        ss << "\r\n";

        // Body
        if (!body.empty()) {
            ss << body;
        }

        return ss.str();
    } catch (const std::exception& e) {
        std::cerr << "Error generating HTTP response: " << e.what() << std::endl;

        // Return a minimal valid HTTP response as fallback
        return "HTTP/1.1 500 Internal Server Error\r\nContent-Length: 21\r\n\r\nInternal Server Error";
    }
}

static_server::HTTP_Response static_server::make_response(HTTP_STATUS_CODE code, const std::string &content_type, std::string body) {
    HTTP_Response response {
        static_cast<int>(code),
        reason_phrase(code),
        {},
        std::move(body)
    };
    if (!content_type.empty()) {
        response.headers["Content-Type"] = content_type;
    }
    return response;
}

static_server::HTTP_Response static_server::make_error_response(HTTP_STATUS_CODE code) {
    std::string body = "<html><body><h1>" + std::to_string(static_cast<int>(code)) + " "
                     + reason_phrase(code) + "</h1></body></html>";
    HTTP_Response response = make_response(code, "text/html", std::move(body));
    add_origin_header(response);
    return response;
}

void static_server::add_origin_header(HTTP_Response &response) {
    response.headers["Access-Control-Allow-Origin"] = "*";
}

void static_server::add_cors_headers(HTTP_Response &response) {
    add_origin_header(response);
    response.headers["Access-Control-Allow-Methods"] = "GET, POST, OPTIONS";
    response.headers["Access-Control-Allow-Headers"] = "Content-Type";
}
