#pragma once

#include <string>
#include <utility>
#include <vector>

namespace guardian::net {

// POSTs a JSON body and returns the response body.
// Throws GenerationTimeoutError when the transfer exceeds timeout_ms and
// GenerationError for any other transport failure or non-2xx status.
std::string post_json(const std::string& url,
                      const std::string& body,
                      const std::vector<std::pair<std::string, std::string>>& headers,
                      long timeout_ms = -1);

} // namespace guardian::net
