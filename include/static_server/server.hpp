#ifndef SERVER_HPP
#define SERVER_HPP

#include <static_server/config.hpp>  // Settings
#include <static_server/router.hpp>  // Router
#include <static_server/rate_limiter.hpp>
#include <static_server/visitor_counter.hpp>
#include <static_server/connection_slots.hpp>
#include <utils/request_log.hpp>
#include <atomic>           // std::atomic
#include <string>           // std::string
#include <arpa/inet.h>      // sockaddr_in, htons(), INADDR_ANY
#include <stdexcept>        // std::runtime_error

namespace static_server {
    class HTTP_Server {
    public:
        // Binds and listens; throws std::runtime_error when the socket cannot be set up
        explicit HTTP_Server(const config::Settings &settings);
        // Accepts until stop() is called; one detached thread per connection.
        // Client sockets get read and write timeouts of settings.read_timeout
        void run();
        // Ends the accept loop and waits for in-flight handlers to finish; safe to call twice
        void stop();
        uint16_t port() const;
        VisitorCounter &visitors() { return visitor_counter; }
        ~HTTP_Server();
    private:
        int server_fd = -1;
        config::Settings settings;
        struct sockaddr_in server_address;
        RateLimiter rate_limiter;
        VisitorCounter visitor_counter;
        request_log::RequestLog access_log;
        Router router;
        ConnectionSlots slots;
        std::atomic<bool> running{true};

        void handle_client_connection(int client_fd, const sockaddr_in& client_address);
    };
}
#endif
