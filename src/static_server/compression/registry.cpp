#include <static_server/compression/registry.hpp>
#include <sstream>
#include <vector>

namespace {
    std::string trim(const std::string &value) {
        size_t first = value.find_first_not_of(" \t");
        if (first == std::string::npos) {
            return "";
        }
        size_t last = value.find_last_not_of(" \t");
        return value.substr(first, last - first + 1);
    }

    // "gzip;q=0" and "gzip; q=0.0" explicitly refuse the coding
    bool refused(const std::string &params) {
        size_t q = params.find("q=");
        if (q == std::string::npos) {
            return false;
        }
        std::string weight = trim(params.substr(q + 2));
        return weight.find_first_not_of("0.") == std::string::npos;
    }
}

namespace static_server::compression {
    void CompressionRegistry::register_compressor(std::unique_ptr<Compressor> compressor) {
        /*
        * Register a compressor. The registry takes ownership; the order of
        * registration is the order of preference.
        */
        compressors.push_back(std::move(compressor));
    }

    const Compressor* CompressionRegistry::select_compressor(const std::string &accept_encoding) const {
        /*
        * Choose a compressor based on the Accept-Encoding header. Every
        * comma-separated coding the client lists (and does not weight to
        * zero) is matched against the registered compressors in order.
        */
        std::vector<std::string> accepted;
        std::istringstream encodings(accept_encoding);
        std::string item;
        while (std::getline(encodings, item, ',')) {
            size_t semicolon = item.find(';');
            std::string name = trim(item.substr(0, semicolon));
            if (semicolon != std::string::npos && refused(item.substr(semicolon + 1))) {
                continue;
            }
            if (!name.empty()) {
                accepted.push_back(name);
            }
        }

        for (const auto &compressor : compressors) {
            for (const auto &name : accepted) {
                if (name == compressor->encoding_name()) {
                    return compressor.get();
                }
            }
        }
        return nullptr;
    }
}
