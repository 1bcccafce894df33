#include <static_server/server.hpp>
#include <static_server/config.hpp>
#include <stdexcept>
#include <filesystem>
#include <iostream>

int main(int argc, char **argv) {
    try {
        static_server::config::Settings settings = static_server::config::parse_arguments(argc, argv);

        // Validate that the root directory exists
        if (!std::filesystem::exists(settings.root_path)) {
            throw std::runtime_error("Root directory does not exist: " + settings.root_path);
        }

        if (!std::filesystem::is_directory(settings.root_path)) {
            throw std::runtime_error("Specified path is not a directory: " + settings.root_path);
        }

        if (!std::filesystem::is_directory(settings.assets_path)) {
            std::cerr << "Assets directory " << settings.assets_path
                      << " not found; 404 responses will use the plain-text body" << std::endl;
        }

        static_server::HTTP_Server server(settings);
        std::cout << "Server running on port " << server.port() << " with root directory: "
                  << settings.root_path << std::endl;

        server.run();
    } catch(const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
