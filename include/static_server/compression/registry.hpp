#ifndef REGISTRY_HPP
#define REGISTRY_HPP
#include "compressor.hpp"
#include <memory>
#include <vector>

namespace static_server::compression {
    // Registration happens before the server starts; lookups are read-only afterwards
    class CompressionRegistry {
    public:
        void register_compressor(std::unique_ptr<Compressor> compressor);
        // First registered compressor the client accepts, or nullptr
        const Compressor* select_compressor(const std::string &accept_encoding) const;
        bool empty() const { return compressors.empty(); }
    private:
        std::vector<std::unique_ptr<Compressor>> compressors;
    };
}

#endif
