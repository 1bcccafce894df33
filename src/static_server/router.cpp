#include <static_server/router.hpp>
#include <static_server/compression/gzip.hpp>
#include <utils/file_utils.hpp>
#include <utils/path_validation.hpp>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace {
    constexpr char RATE_LIMIT_BODY[] = "Rate limit exceeded";
    constexpr char NOT_FOUND_BODY[] = "404 Not Found";
}

static_server::Router::Router(const config::Settings &settings, RateLimiter &rate_limiter,
                              VisitorCounter &visitor_counter, request_log::RequestLog &access_log)
    : root_path(settings.root_path),
      not_found_path(settings.assets_path + "/" + config::NOT_FOUND_DOCUMENT),
      rate_limiter(rate_limiter),
      visitor_counter(visitor_counter),
      access_log(access_log) {
    if (settings.gzip) {
        compressors.register_compressor(std::make_unique<compression::GzipCompressor>());
    }
}

static_server::HTTP_Response static_server::Router::handle(const std::string &raw, const std::string &client) {
    HTTP_Request request;
    try {
        request = parse_request(raw);
    } catch (const std::invalid_argument& e) {
        std::cout << "[" << request_log::format_timestamp() << "] Malformed request from "
                  << client << ": " << e.what() << std::endl;
        return make_error_response(HTTP_STATUS_CODE::BAD_REQUEST);
    }

    std::cout << "[" << request_log::format_timestamp() << "] " << request.method << " "
              << request.path << " from " << client << std::endl;

    try {
        return dispatch(request, client);
    } catch (const std::exception& e) {
        std::cerr << "Error dispatching request to " << request.path << ": " << e.what() << std::endl;
        return make_error_response(HTTP_STATUS_CODE::INTERNAL_SERVER_ERROR);
    }
}

static_server::HTTP_Response static_server::Router::dispatch(const HTTP_Request &request, const std::string &client) {
    if (!rate_limiter.allow(client)) {
        std::cout << "Rate limit exceeded for " << client << std::endl;
        HTTP_Response response = make_response(HTTP_STATUS_CODE::TOO_MANY_REQUESTS, "text/plain", RATE_LIMIT_BODY);
        add_origin_header(response);
        return response;
    }

    // The counter answers every method, ahead of the OPTIONS and GET checks
    if (request.path == config::VISITOR_COUNT_PATH) {
        return visitor_count();
    }

    if (request.method == "OPTIONS") {
        HTTP_Response response = make_response(HTTP_STATUS_CODE::NO_CONTENT, "", "");
        add_cors_headers(response);
        return response;
    }

    if (request.method != "GET") {
        return make_error_response(HTTP_STATUS_CODE::METHOD_NOT_ALLOWED);
    }

    return serve_static(request, client);
}

static_server::HTTP_Response static_server::Router::visitor_count() {
    std::uint64_t count;
    try {
        count = visitor_counter.increment_and_get();
    } catch (const std::system_error& e) {
        std::cerr << "Visitor count lock failed: " << e.what() << std::endl;
        return make_error_response(HTTP_STATUS_CODE::INTERNAL_SERVER_ERROR);
    }
    std::cout << "Incrementing visitor count to: " << count << std::endl;

    HTTP_Response response = make_response(HTTP_STATUS_CODE::OK, "text/plain", std::to_string(count));
    add_cors_headers(response);
    return response;
}

static_server::HTTP_Response static_server::Router::serve_static(const HTTP_Request &request, const std::string &client) {
    // Traversal is answered exactly like a missing file. Only the request
    // path is checked, never the configured root
    if (path_validation::has_parent_reference(request.path)) {
        std::cout << "Security: Blocked path with .. component: " << request.path << std::endl;
        return not_found();
    }

    std::string resolved = path_validation::resolve_request_path(root_path, request.path);

    auto content = file_utils::read_file(resolved);
    if (!content) {
        std::cout << "[" << request_log::format_timestamp() << "] 404 Not Found: " << resolved << std::endl;
        return not_found();
    }

    HTTP_Response response = make_response(HTTP_STATUS_CODE::OK, file_utils::content_type_for(resolved), std::move(*content));
    add_cors_headers(response);
    compress(request, response);

    std::cout << "[" << request_log::format_timestamp() << "] 200 OK: " << resolved << std::endl;
    access_log.log_request(client, request.method + " " + request.path + " 200");
    return response;
}

static_server::HTTP_Response static_server::Router::not_found() const {
    HTTP_Response response = make_response(HTTP_STATUS_CODE::NOT_FOUND, "text/plain", NOT_FOUND_BODY);
    if (auto page = file_utils::read_file(not_found_path)) {
        response.headers["Content-Type"] = "text/html";
        response.body = std::move(*page);
    }
    add_cors_headers(response);
    return response;
}

void static_server::Router::compress(const HTTP_Request &request, HTTP_Response &response) const {
    if (compressors.empty()) {
        return;
    }
    std::string accept_encoding = request.header("Accept-Encoding");
    if (accept_encoding.empty()) {
        return;
    }

    const auto *compressor = compressors.select_compressor(accept_encoding);
    if (!compressor) {
        return;
    }
    if (auto encoded = compressor->compress(response.body)) {
        response.body = std::move(*encoded);
        response.headers["Content-Encoding"] = compressor->encoding_name();
        response.headers["Vary"] = "Accept-Encoding";
    }
}
