#ifndef COMPRESSOR_HPP
#define COMPRESSOR_HPP

#include <string>
#include <optional>

namespace static_server::compression {
    inline constexpr int GZIP_BUF_LEN = 32768; // Buffer length for GZIP compression
    class Compressor {
    public:
        virtual ~Compressor() = default;
        // nullopt when the data could not be encoded; callers then send it as-is
        virtual std::optional<std::string> compress(const std::string &data) const = 0;
        virtual std::string encoding_name() const = 0;
    };
}

#endif
