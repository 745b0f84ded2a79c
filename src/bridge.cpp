#include "../include/guardian/bridge.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace guardian {

std::optional<Bridge::Request> Bridge::read_request(std::istream& in) const {
    std::string line;
    while (std::getline(in, line)) {
        if (std::all_of(line.begin(), line.end(), [](unsigned char c) { return std::isspace(c) != 0; })) {
            continue;
        }
        const Json parsed = Json::parse(line);
        if (!parsed.is_object()) {
            throw std::runtime_error("request must be a JSON object");
        }
        Request request;
        if (auto id = parsed.find("id")) {
            request.id = id->is_string() ? id->as_string() : id->dump();
        }
        if (const auto method = parsed.get_string("method")) {
            request.method = *method;
        }
        if (auto params = parsed.find("params")) {
            request.params = *params;
        }
        return request;
    }
    return std::nullopt;
}

void Bridge::send_response(std::ostream& out, const std::string& id, const Json& result) const {
    JsonObject obj;
    obj["id"] = Json(id);
    obj["result"] = result;
    out << Json(obj).dump() << '\n';
    out.flush();
}

void Bridge::send_error(std::ostream& out, const std::string& id, const std::string& type,
                        const std::string& message) const {
    JsonObject err;
    err["type"] = Json(type);
    err["message"] = Json(message);
    JsonObject obj;
    obj["id"] = Json(id);
    obj["error"] = Json(err);
    out << Json(obj).dump() << '\n';
    out.flush();
}

} // namespace guardian
