#pragma once

#include "bridge.hpp"
#include "gateway.hpp"

#include <istream>
#include <ostream>

namespace guardian {

/**
 * Service
 *
 * Request loop over a Bridge. Methods: /check, /answer, /verify, /ping,
 * /bundle. Per-request failures become error responses; an IntegrityError
 * is reported and then rethrown so the process stops writing.
 */
class Service {
public:
    Service(Gateway& gateway, Bridge bridge = {});

    void run(std::istream& in, std::ostream& out);

    // Dispatches one request. Throws on failure.
    Json handle_request(const Bridge::Request& request);

private:
    Gateway* m_gateway;
    Bridge m_bridge;

    Json handle_check(const Json& params);
    Json handle_answer(const Json& params);
    Json handle_verify(const Json& params);
    Json handle_ping() const;
    Json handle_bundle();
};

} // namespace guardian
