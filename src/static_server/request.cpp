#include <static_server/request.hpp>
#include <vector>
#include <stdexcept>
#include <sstream>
#include <iostream>
#include <algorithm>       // std::transform
#include <cctype>          // std::tolower

namespace {
    std::string to_lower(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return value;
    }

    std::string trim(const std::string &value) {
        const char *whitespace = " \t";
        size_t first = value.find_first_not_of(whitespace);
        if (first == std::string::npos) {
            return "";
        }
        size_t last = value.find_last_not_of(whitespace);
        return value.substr(first, last - first + 1);
    }
}

std::string static_server::HTTP_Request::header(const std::string &name) const {
    auto it = headers.find(to_lower(name));
    return it == headers.end() ? std::string{} : it->second;
}

static_server::HTTP_Request static_server::parse_request(const std::string &raw) {
    HTTP_Request request;

    // Only the head is read; anything after the blank line is ignored. A head
    // without its terminating blank line was truncated by the read buffer.
    std::string head = raw.substr(0, raw.find("\r\n\r\n"));

    // Split header block into lines, tolerating bare LF line endings
    std::vector<std::string> lines;
    std::istringstream head_stream(head);
    std::string line;
    while (std::getline(head_stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }

    if (lines.empty()) {
        throw std::invalid_argument("Invalid request: empty request line");
    }

    {
        // Parse request line; the version token is optional
        std::istringstream request_line(lines[0]);
        if (!(request_line >> request.method >> request.path)) {
            throw std::invalid_argument("Invalid request line format");
        }
        request_line >> request.version;

        if (request.path.front() != '/') {
            throw std::invalid_argument("Request path must start with '/'");
        }
    }

    // Headers are kept for lookup but never required
    for (size_t i = 1; i < lines.size(); ++i) {
        if (lines[i].empty()) {
            break;
        }
        size_t colon = lines[i].find(':');
        if (colon == std::string::npos || colon == 0) {
            std::cerr << "Skipping malformed header: " << lines[i] << std::endl;
            continue;
        }

        std::string name = to_lower(trim(lines[i].substr(0, colon)));
        std::string value = trim(lines[i].substr(colon + 1));
        request.headers[name] = value;
    }

    return request;
}
