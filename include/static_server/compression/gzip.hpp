#ifndef GZIP_HPP
#define GZIP_HPP
#include "compressor.hpp"
#include <cstddef>
#include <zlib.h>
#include <limits>

namespace static_server::compression {
    class GzipCompressor: public Compressor {
    public:
        // Inputs larger than max_input are refused; one deflate pass takes at most uInt bytes
        explicit GzipCompressor(std::size_t max_input = std::numeric_limits<uInt>::max())
            : max_input(max_input) {}

        std::optional<std::string> compress(const std::string &data) const override;
        std::string encoding_name() const override {
            return "gzip";
        }

    private:
        std::size_t max_input;
    };
}

#endif
