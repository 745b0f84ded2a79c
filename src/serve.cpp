#include "../include/guardian/serve.hpp"
#include "../include/guardian/errors.hpp"
#include "../include/guardian/log.hpp"

#include <filesystem>

namespace guardian {

namespace {

std::string require_string(const Json& params, const std::string& key) {
    const Json* value = params.find(key);
    if (!value || !value->is_string()) {
        throw ValidationError("'" + key + "' must be a string");
    }
    return value->as_string();
}

JsonObject optional_object(const Json& params, const std::string& key) {
    const Json* value = params.find(key);
    if (!value || value->is_null()) {
        return {};
    }
    if (!value->is_object()) {
        throw ValidationError("'" + key + "' must be an object");
    }
    return value->as_object();
}

std::string optional_string(const Json& params, const std::string& key) {
    const Json* value = params.find(key);
    if (!value || value->is_null()) {
        return {};
    }
    if (!value->is_string()) {
        throw ValidationError("'" + key + "' must be a string");
    }
    return value->as_string();
}

void require_object(const Json& params) {
    if (!params.is_object() && !params.is_null()) {
        throw ValidationError("params must be an object");
    }
}

} // namespace

Service::Service(Gateway& gateway, Bridge bridge)
    : m_gateway(&gateway), m_bridge(std::move(bridge)) {}

void Service::run(std::istream& in, std::ostream& out) {
    while (true) {
        std::optional<Bridge::Request> request;
        try {
            request = m_bridge.read_request(in);
        } catch (const std::runtime_error& ex) {
            m_bridge.send_error(out, "", "parse", ex.what());
            continue;
        }
        if (!request) {
            break;
        }
        try {
            m_bridge.send_response(out, request->id, handle_request(*request));
        } catch (const IntegrityError& ex) {
            m_bridge.send_error(out, request->id, "integrity", ex.what());
            throw;
        } catch (const ValidationError& ex) {
            m_bridge.send_error(out, request->id, "validation", ex.what());
        } catch (const GenerationError& ex) {
            log("Service", std::string("Generation failed: ") + ex.what());
            m_bridge.send_error(out, request->id, "generation", ex.what());
        } catch (const std::exception& ex) {
            log("Service", std::string("Request failed: ") + ex.what());
            m_bridge.send_error(out, request->id, "internal", ex.what());
        }
    }
    out.flush();
}

Json Service::handle_request(const Bridge::Request& request) {
    std::string method = request.method;
    if (!method.empty() && method.front() != '/') {
        method.insert(method.begin(), '/');
    }
    if (method == "/check") {
        return handle_check(request.params);
    }
    if (method == "/answer") {
        return handle_answer(request.params);
    }
    if (method == "/verify") {
        return handle_verify(request.params);
    }
    if (method == "/ping") {
        return handle_ping();
    }
    if (method == "/bundle") {
        return handle_bundle();
    }
    throw ValidationError("unknown method '" + request.method + "'");
}

Json Service::handle_check(const Json& params) {
    require_object(params);
    const CheckResult result = m_gateway->check(require_string(params, "prompt"), optional_object(params, "context"),
                                                optional_string(params, "jurisdiction"));
    return result.to_json();
}

Json Service::handle_answer(const Json& params) {
    require_object(params);
    const AnswerResult result = m_gateway->answer(require_string(params, "prompt"), optional_object(params, "context"),
                                                  optional_string(params, "jurisdiction"));
    return result.to_json();
}

Json Service::handle_verify(const Json& params) {
    require_object(params);
    JsonObject meta = optional_object(params, "meta");
    if (meta.empty()) {
        meta = optional_object(params, "context");
    }
    const VerifyResult result = m_gateway->verify_output(require_string(params, "output"), meta,
                                                         optional_string(params, "jurisdiction"));
    return result.to_json();
}

Json Service::handle_ping() const {
    const Ledger& ledger = m_gateway->ledger();
    JsonObject out;
    out["ok"] = Json(!ledger.halted());
    out["records"] = Json(static_cast<std::uint64_t>(ledger.size()));
    out["head"] = Json(ledger.head_hash());
    return Json(out);
}

Json Service::handle_bundle() {
    const std::filesystem::path path = m_gateway->export_bundle();
    JsonObject out;
    out["path"] = Json(path.string());
    out["records"] = Json(static_cast<std::uint64_t>(m_gateway->ledger().size()));
    return Json(out);
}

} // namespace guardian
