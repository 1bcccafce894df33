#ifndef ROUTER_HPP
#define ROUTER_HPP

#include <static_server/request.hpp>  // HTTP_Request
#include <static_server/response.hpp> // HTTP_Response
#include <static_server/status.hpp>   // HTTP_STATUS_CODE
#include <static_server/config.hpp>   // Settings
#include <static_server/rate_limiter.hpp>
#include <static_server/visitor_counter.hpp>
#include <static_server/compression/registry.hpp>
#include <utils/request_log.hpp>
#include <string>

namespace static_server {
    /*
        Turns one raw request into exactly one response. Routing order:
        malformed -> 400, rate limited -> 429, /visitor-count (any method),
        OPTIONS -> 204, non-GET -> 405, then static files from the root.
    */
    class Router {
        public:
            Router(const config::Settings &settings, RateLimiter &rate_limiter,
                   VisitorCounter &visitor_counter, request_log::RequestLog &access_log);

            HTTP_Response handle(const std::string &raw, const std::string &client);
            HTTP_Response dispatch(const HTTP_Request &request, const std::string &client);

        private:
            HTTP_Response visitor_count();
            HTTP_Response serve_static(const HTTP_Request &request, const std::string &client);
            HTTP_Response not_found() const;
            void compress(const HTTP_Request &request, HTTP_Response &response) const;

            std::string root_path;
            std::string not_found_path;
            RateLimiter &rate_limiter;
            VisitorCounter &visitor_counter;
            request_log::RequestLog &access_log;
            compression::CompressionRegistry compressors;
    };
}

#endif
