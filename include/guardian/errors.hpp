#pragma once

#include <stdexcept>
#include <string>

namespace guardian {

struct Error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Malformed input; rejected before anything reaches the ledger.
struct ValidationError : Error {
    using Error::Error;
};

// Malformed policy or service configuration. Fatal at startup.
struct ConfigError : Error {
    using Error::Error;
};

// Hash chain mismatch. The ledger stops accepting writes once this is raised.
struct IntegrityError : Error {
    using Error::Error;
};

// Generation backend did not answer within the configured timeout.
struct GenerationTimeoutError : Error {
    using Error::Error;
};

// Generation backend failed for any other reason after all attempts.
struct GenerationError : Error {
    using Error::Error;
};

} // namespace guardian
