#pragma once

#include "json.hpp"

#include <istream>
#include <optional>
#include <ostream>
#include <string>

namespace guardian {

// Line-delimited JSON framing: one request object per input line, one
// response object per output line.
class Bridge {
public:
    struct Request {
        std::string id;
        std::string method;
        Json params;
    };

    // Skips blank lines; nullopt at end of input. Throws std::runtime_error
    // for a line that is not a JSON object.
    std::optional<Request> read_request(std::istream& in) const;

    void send_response(std::ostream& out, const std::string& id, const Json& result) const;
    void send_error(std::ostream& out, const std::string& id, const std::string& type, const std::string& message) const;
};

} // namespace guardian
