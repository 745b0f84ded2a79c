#pragma once

#include "../config.hpp"

#include <memory>
#include <string>

namespace guardian::backend {

// Text generation endpoint the Gateway calls between the pre and post checks.
struct Generator {
    virtual ~Generator() = default;

    // One attempt. Throws GenerationTimeoutError past timeout_ms and
    // GenerationError for every other failure.
    virtual std::string generate(const std::string& prompt, long timeout_ms) = 0;

    virtual std::string describe() const = 0;
};

using GeneratorPtr = std::unique_ptr<Generator>;

enum class Kind {
    Ollama,
    OpenAICompat
};

// Throws ConfigError for an unknown kind or a missing endpoint.
GeneratorPtr make_generator(const BackendSettings& settings);

Kind parse_kind(const std::string& name);
std::string kind_to_string(Kind kind);

} // namespace guardian::backend
