#include "../../include/guardian/backend/generator.hpp"
#include "../../include/guardian/errors.hpp"
#include "../../include/guardian/json.hpp"
#include "../../include/guardian/net/http.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace {

using guardian::Json;
using guardian::JsonArray;
using guardian::JsonObject;

std::string strip(const std::string& text) {
    auto begin = std::find_if_not(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c) != 0; });
    auto end = std::find_if_not(text.rbegin(), text.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
    if (begin >= end) {
        return std::string();
    }
    return std::string(begin, end);
}

std::string lowered(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return text;
}

Json parse_response(const std::string& body, const std::string& backend) {
    try {
        return Json::parse(body);
    } catch (const std::runtime_error& ex) {
        throw guardian::GenerationError(backend + " returned malformed JSON: " + ex.what());
    }
}

} // namespace

namespace guardian::backend {

namespace {

// Ollama /api/generate with stream disabled. Some builds still answer with
// newline-delimited chunks; those are stitched together.
class OllamaGenerator final : public Generator {
public:
    OllamaGenerator(std::string endpoint, std::string model, int max_tokens)
        : m_endpoint(std::move(endpoint)), m_model(std::move(model)), m_max_tokens(max_tokens) {}

    std::string generate(const std::string& prompt, long timeout_ms) override {
        JsonObject options;
        options["num_predict"] = Json(m_max_tokens);
        JsonObject payload;
        payload["model"] = Json(m_model);
        payload["prompt"] = Json(prompt);
        payload["stream"] = Json(false);
        payload["options"] = Json(options);

        const std::string response = net::post_json(m_endpoint, Json(payload).dump(), {}, timeout_ms);
        Json parsed;
        try {
            parsed = Json::parse(response);
        } catch (const std::runtime_error&) {
            return stitch_chunks(response);
        }
        if (const auto text = parsed.get_string("response")) {
            return strip(*text);
        }
        if (const auto error = parsed.get_string("error")) {
            throw GenerationError("ollama error: " + *error);
        }
        return {};
    }

    std::string describe() const override { return kind_to_string(Kind::Ollama) + ":" + m_model; }

private:
    std::string m_endpoint;
    std::string m_model;
    int m_max_tokens;

    static std::string stitch_chunks(const std::string& response) {
        std::istringstream lines(response);
        std::string line;
        std::string text;
        while (std::getline(lines, line)) {
            if (strip(line).empty()) {
                continue;
            }
            const Json chunk = parse_response(line, "ollama");
            if (const auto piece = chunk.get_string("response")) {
                text += *piece;
            }
        }
        return strip(text);
    }
};

class OpenAICompatGenerator final : public Generator {
public:
    OpenAICompatGenerator(std::string endpoint, std::string model, std::string api_key, int max_tokens)
        : m_endpoint(std::move(endpoint)),
          m_model(std::move(model)),
          m_api_key(std::move(api_key)),
          m_max_tokens(max_tokens) {}

    std::string generate(const std::string& prompt, long timeout_ms) override {
        JsonObject message;
        message["role"] = Json("user");
        message["content"] = Json(prompt);
        JsonArray messages;
        messages.emplace_back(Json(message));

        JsonObject payload;
        payload["model"] = Json(m_model);
        payload["messages"] = Json(messages);
        payload["max_tokens"] = Json(m_max_tokens);

        std::vector<std::pair<std::string, std::string>> headers;
        if (!m_api_key.empty()) {
            headers.emplace_back("Authorization", "Bearer " + m_api_key);
        }

        const std::string response = net::post_json(m_endpoint, Json(payload).dump(), headers, timeout_ms);
        const Json parsed = parse_response(response, "openai");
        if (parsed.is_object()) {
            const auto& obj = parsed.as_object();
            if (auto choices_it = obj.find("choices"); choices_it != obj.end() && choices_it->second.is_array()) {
                const auto& choices = choices_it->second.as_array();
                if (!choices.empty() && choices.front().is_object()) {
                    const auto& choice = choices.front().as_object();
                    if (auto msg_it = choice.find("message"); msg_it != choice.end() && msg_it->second.is_object()) {
                        if (const auto content = msg_it->second.get_string("content")) {
                            return strip(*content);
                        }
                    }
                    if (auto text_it = choice.find("text"); text_it != choice.end() && text_it->second.is_string()) {
                        return strip(text_it->second.as_string());
                    }
                }
            }
        }
        return {};
    }

    std::string describe() const override { return kind_to_string(Kind::OpenAICompat) + ":" + m_model; }

private:
    std::string m_endpoint;
    std::string m_model;
    std::string m_api_key;
    int m_max_tokens;
};

} // namespace

GeneratorPtr make_generator(const BackendSettings& settings) {
    if (settings.endpoint.empty()) {
        throw ConfigError("backend endpoint must be set");
    }
    switch (parse_kind(settings.kind)) {
    case Kind::Ollama:
        return std::make_unique<OllamaGenerator>(settings.endpoint, settings.model, settings.max_tokens);
    case Kind::OpenAICompat:
        return std::make_unique<OpenAICompatGenerator>(settings.endpoint, settings.model, settings.api_key,
                                                       settings.max_tokens);
    }
    throw ConfigError("unsupported backend kind");
}

Kind parse_kind(const std::string& name) {
    const std::string lower = lowered(name);
    if (lower == "ollama") {
        return Kind::Ollama;
    }
    if (lower == "openai" || lower == "openai-compatible" || lower == "openai_compat") {
        return Kind::OpenAICompat;
    }
    throw ConfigError("unknown backend kind: " + name);
}

std::string kind_to_string(Kind kind) {
    switch (kind) {
    case Kind::Ollama:
        return "ollama";
    case Kind::OpenAICompat:
        return "openai";
    }
    return "unknown";
}

} // namespace guardian::backend
