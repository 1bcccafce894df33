#ifndef STATUS_HPP
#define STATUS_HPP

namespace static_server {
    enum class HTTP_STATUS_CODE{
        OK                      = 200,
        NO_CONTENT              = 204,
        BAD_REQUEST             = 400,
        NOT_FOUND               = 404,
        METHOD_NOT_ALLOWED      = 405,
        TOO_MANY_REQUESTS       = 429,
        INTERNAL_SERVER_ERROR   = 500,
    };

    inline const char *reason_phrase(HTTP_STATUS_CODE code) {
        switch (code) {
            case HTTP_STATUS_CODE::OK:                      return "OK";
            case HTTP_STATUS_CODE::NO_CONTENT:              return "No Content";
            case HTTP_STATUS_CODE::BAD_REQUEST:             return "Bad Request";
            case HTTP_STATUS_CODE::NOT_FOUND:               return "Not Found";
            case HTTP_STATUS_CODE::METHOD_NOT_ALLOWED:      return "Method Not Allowed";
            case HTTP_STATUS_CODE::TOO_MANY_REQUESTS:       return "Too Many Requests";
            case HTTP_STATUS_CODE::INTERNAL_SERVER_ERROR:   return "Internal Server Error";
        }
        return "Unknown";
    }
}

#endif
