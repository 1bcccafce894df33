#include <static_server/server.hpp>
#include <static_server/request.hpp>
#include <static_server/response.hpp>
#include <sys/socket.h>
#include <sys/time.h>       // timeval
#include <netinet/in.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <iostream>
#include <system_error>
#include <thread>           // std::thread
#include <utility>
#include <unistd.h>         // close()
#include <arpa/inet.h>      // inet_pton(), inet_ntop()

namespace {
    // send() until the whole buffer is out or the peer goes away
    bool send_all(int fd, const std::string &data) {
        size_t sent = 0;
        while (sent < data.size()) {
            ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return false;
            }
            sent += static_cast<size_t>(n);
        }
        return true;
    }
}

static_server::HTTP_Server::HTTP_Server(const config::Settings &settings)
    : settings(settings),
      rate_limiter(settings.rate_limit, settings.rate_window),
      access_log(settings.log_file),
      router(this->settings, rate_limiter, visitor_counter, access_log),
      slots(settings.max_connections) {
    try {
        // Create socket
        server_fd = socket(AF_INET, SOCK_STREAM, 0);
        if(server_fd < 0) {
            throw std::runtime_error("Failed to create socket: " + std::string(strerror(errno)));
        }

        // Set socket options to reuse address and port
        int opt = 1;
        if(setsockopt(server_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
            throw std::runtime_error("Failed to set socket options");
        }

        // Setup server address
        std::memset(&this->server_address, 0, sizeof(this->server_address));
        server_address.sin_family = AF_INET;
        server_address.sin_port = htons(settings.port);
        if(inet_pton(AF_INET, settings.bind_address.c_str(), &server_address.sin_addr) != 1) {
            throw std::runtime_error("Invalid bind address: " + settings.bind_address);
        }

        // Bind socket
        if(bind(server_fd, (struct sockaddr *)&server_address, sizeof(server_address)) < 0) {
            throw std::runtime_error("Failed to bind to " + settings.bind_address + ":" + std::to_string(settings.port)
                                     + ": " + std::string(strerror(errno)));
        }

        // Listen for connections
        if(listen(server_fd, config::BACKLOG_SIZE) < 0) {
            throw std::runtime_error("Failed to listen on port " + std::to_string(settings.port));
        }

        std::cout << "Server initialized on " << settings.bind_address << ":" << port()
                  << " (max " << slots.capacity() << " concurrent connections)" << std::endl;
    } catch (const std::exception& e) {
        // Close socket if it was opened
        if(server_fd >= 0) {
            close(server_fd);
            server_fd = -1;
        }
        std::cerr << "Server initialization error: " << e.what() << std::endl;
        throw;  // Re-throw to be handled by main()
    }
}

uint16_t static_server::HTTP_Server::port() const {
    struct sockaddr_in bound;
    socklen_t bound_len = sizeof(bound);
    if(getsockname(server_fd, (struct sockaddr *)&bound, &bound_len) < 0) {
        return settings.port;
    }
    return ntohs(bound.sin_port);
}

void static_server::HTTP_Server::run() {
    std::cout << "Server starting to listen for connections..." << std::endl;

    while(running) {
        struct sockaddr_in client_address;
        socklen_t client_address_len = sizeof(client_address);

        int client_fd = accept(this->server_fd, (struct sockaddr *)&client_address, &client_address_len);
        if(client_fd < 0) {
            if(!running) {
                break;
            }
            int error = errno;
            if(error == EINTR) {
                continue;
            }
            std::cerr << "Error accepting connection: " << strerror(error) << std::endl;
            if(error == EMFILE || error == ENFILE) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
            // Continue to accept other connections even if one fails
            continue;
        }

        // Blocks while every handler slot is busy; the kernel backlog holds later clients
        ConnectionSlots::Slot slot = slots.acquire();
        if(!running) {
            close(client_fd);
            break;
        }

        try {
            std::thread([this, client_fd, client_address, slot = std::move(slot)]() {
                try {
                    handle_client_connection(client_fd, client_address);
                } catch (const std::exception& e) {
                    std::cerr << "Error handling client: " << e.what() << std::endl;
                }
                // Ensure the client socket is closed even if an exception occurs
                shutdown(client_fd, SHUT_RDWR);
                close(client_fd);
            }).detach();
        } catch (const std::system_error& e) {
            std::cerr << "Failed to start handler thread: " << e.what() << std::endl;
            close(client_fd);
        }
    }

    std::cout << "Server stopped accepting connections" << std::endl;
}

void static_server::HTTP_Server::stop() {
    running = false;
    // Wakes a thread blocked in accept()
    if(server_fd >= 0) {
        shutdown(server_fd, SHUT_RDWR);
    }
    slots.wait_idle();
}

void static_server::HTTP_Server::handle_client_connection(int client_fd, const sockaddr_in& client_address) {
    char buffer[config::BUF_LEN];

    char client_ip[INET_ADDRSTRLEN];
    std::string client = "unknown";
    if(inet_ntop(AF_INET, &client_address.sin_addr, client_ip, INET_ADDRSTRLEN) != nullptr) {
        client = client_ip;
    }

    struct timeval timeout;
    timeout.tv_sec = static_cast<time_t>(settings.read_timeout.count());
    timeout.tv_usec = 0;
    if(setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout)) < 0) {
        std::cerr << "Failed to set read timeout for " << client << ": " << strerror(errno) << std::endl;
    }
    // A peer that stops reading must not hold its slot forever
    if(setsockopt(client_fd, SOL_SOCKET, SO_SNDTIMEO, &timeout, sizeof(timeout)) < 0) {
        std::cerr << "Failed to set write timeout for " << client << ": " << strerror(errno) << std::endl;
    }

    // One bounded read: a head larger than the buffer is truncated
    ssize_t bytes_read;
    do {
        bytes_read = recv(client_fd, buffer, sizeof(buffer), 0);
    } while(bytes_read < 0 && errno == EINTR);

    if(bytes_read <= 0) {
        // Client disconnected or error; nothing is sent back
        if (bytes_read < 0) {
            std::cerr << "Error reading from " << client << ": " << strerror(errno) << std::endl;
        }
        return;
    }

    HTTP_Response response = router.handle(std::string(buffer, static_cast<size_t>(bytes_read)), client);
    response.headers["Connection"] = "close";

    if(!send_all(client_fd, response.to_string())) {
        std::cerr << "Error sending response to " << client << ": " << strerror(errno) << std::endl;
    }
}

static_server::HTTP_Server::~HTTP_Server() {
    // Handler threads refer to this object until they give back their slot
    stop();
    if(server_fd >= 0) {
        close(server_fd);
        server_fd = -1;
    }
}
