/**
 * @file backend.cpp
 * @brief Backend implementation for geministream
 */

#include "geministream/backend.hpp"
#include "geministream/errors.hpp"
#include <curl/curl.h>
#include <exception>

namespace geministream {

namespace {

constexpr const char* DEFAULT_USER_AGENT = "geministream";

struct StreamContext {
    CURL* curl = nullptr;
    SseDecoder decoder;
    const ChunkCallback* on_chunk = nullptr;
    const std::atomic<bool>* stop_requested = nullptr;
    std::string endpoint;
    std::string error_body;
    std::exception_ptr failure;
    bool stopped = false;
};

size_t stream_write(char* contents, size_t size, size_t nmemb, void* userp) {
    auto* ctx = static_cast<StreamContext*>(userp);
    size_t total = size * nmemb;

    if (ctx->stop_requested->load()) {
        ctx->stopped = true;
        return 0;
    }

    long http_code = 0;
    curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code != 200) {
        // Error bodies are plain JSON, not SSE
        ctx->error_body.append(contents, total);
        return total;
    }

    // Exceptions must not unwind through libcurl; park them for the caller.
    try {
        bool keep_going = ctx->decoder.feed(contents, total, [ctx](const std::string& data) {
            if (data == "[DONE]") {
                return true;
            }

            json parsed = json::parse(data);
            if (parsed.contains("error") && parsed["error"].is_object()) {
                Backend::handle_http_error(parsed["error"].value("code", 500), data, ctx->endpoint);
            }

            if (!(*ctx->on_chunk)(parsed)) {
                ctx->stopped = true;
                return false;
            }
            return true;
        });
        if (!keep_going) {
            return 0;
        }
    } catch (...) {
        ctx->failure = std::current_exception();
        return 0;
    }

    return total;
}

int stream_progress(void* userp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<StreamContext*>(userp);
    if (ctx->stop_requested->load()) {
        ctx->stopped = true;
        return 1;
    }
    return 0;
}

} // namespace

bool SseDecoder::feed(const char* data, std::size_t size,
                      const std::function<bool(const std::string&)>& on_data) {
    buffer_.append(data, size);

    // Process complete lines
    size_t pos;
    while ((pos = buffer_.find('\n')) != std::string::npos) {
        std::string line = buffer_.substr(0, pos);
        buffer_.erase(0, pos + 1);

        while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
            line.pop_back();
        }

        if (line.empty() || line[0] == ':') continue;

        if (line.compare(0, 5, "data:") == 0) {
            std::string payload = line.substr(5);
            size_t start = payload.find_first_not_of(" \t");
            payload = start == std::string::npos ? std::string() : payload.substr(start);

            if (payload.empty()) continue;

            if (!on_data(payload)) {
                return false;
            }
        }
    }

    return true;
}

Backend::Backend(const BackendOptions& options) : options_(options) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

Backend::~Backend() {
    curl_global_cleanup();
}

json Backend::prepare_contents(const std::vector<Message>& contents) {
    json result = json::array();

    for (const auto& msg : contents) {
        if (msg.role == Role::System || msg.content.empty()) {
            continue;
        }
        result.push_back({
            {"role", role_to_string(msg.role)},
            {"parts", json::array({{{"text", msg.content}}})}
        });
    }

    return result;
}

json Backend::prepare_tools(const std::vector<Tool>& tools) {
    if (tools.empty()) {
        return json();
    }

    json func_decls = json::array();
    for (const auto& tool : tools) {
        json func_def = {
            {"name", tool.name},
            {"description", tool.description}
        };

        if (tool.parameters.has_value()) {
            func_def["parameters"] = {
                {"type", "object"},
                {"properties", tool.parameters->value("properties", json::object())},
                {"required", tool.parameters->value("required", json::array())}
            };
        }

        func_decls.push_back(func_def);
    }

    return json::array({{{"functionDeclarations", func_decls}}});
}

json Backend::prepare_generation_config(const GenerationConfig& config) {
    json gen_config = json::object();

    if (config.temperature.has_value()) {
        gen_config["temperature"] = *config.temperature;
    }
    if (config.max_output_tokens.has_value()) {
        gen_config["maxOutputTokens"] = *config.max_output_tokens;
    }
    if (config.top_p.has_value()) {
        gen_config["topP"] = *config.top_p;
    }
    if (config.top_k.has_value()) {
        gen_config["topK"] = *config.top_k;
    }
    if (config.stop_sequences.has_value()) {
        gen_config["stopSequences"] = *config.stop_sequences;
    }

    return gen_config;
}

json Backend::build_request_payload(const GenerateRequest& request) const {
    json body = {{"contents", prepare_contents(request.contents)}};

    json system_parts = json::array();
    if (request.system_instruction.has_value() && !request.system_instruction->empty()) {
        system_parts.push_back({{"text", *request.system_instruction}});
    }
    for (const auto& msg : request.contents) {
        if (msg.role == Role::System && !msg.content.empty()) {
            system_parts.push_back({{"text", msg.content}});
        }
    }
    if (!system_parts.empty()) {
        body["systemInstruction"] = {{"parts", system_parts}};
    }

    if (request.generation_config.has_value()) {
        json gen_config = prepare_generation_config(*request.generation_config);
        if (!gen_config.empty()) {
            body["generationConfig"] = gen_config;
        }
    }

    json prepared_tools = prepare_tools(request.tools);
    if (!prepared_tools.is_null() && !prepared_tools.empty()) {
        body["tools"] = prepared_tools;
    }

    if (request.tool_config.has_value()) {
        body["toolConfig"] = *request.tool_config;
    }

    if (!request.safety_settings.empty()) {
        json safety = json::array();
        for (const auto& setting : request.safety_settings) {
            safety.push_back({
                {"category", setting.category},
                {"threshold", setting.threshold}
            });
        }
        body["safetySettings"] = safety;
    }

    return body;
}

std::string Backend::stream_url(const StreamConfig& config) const {
    std::string base = config.endpoint;
    if (base.find("://") == std::string::npos) {
        base = "https://" + base;
    }
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }

    std::string model = config.model;
    if (model.rfind("models/", 0) != 0 && model.rfind("tunedModels/", 0) != 0) {
        model = "models/" + model;
    }

    return base + "/" + options_.api_version + "/" + model + ":streamGenerateContent?alt=sse";
}

void Backend::handle_http_error(int status_code, const std::string& body, const std::string& endpoint) {
    std::string error_msg = body;

    if (json::accept(body)) {
        json data = json::parse(body);
        if (data.contains("error") && data["error"].is_object() &&
            data["error"].contains("message") && data["error"]["message"].is_string()) {
            error_msg = data["error"]["message"].get<std::string>();
        }
    }

    switch (status_code) {
        case 401:
            throw AuthenticationError("Authentication failed: " + error_msg, endpoint);
        case 403:
            throw PermissionDeniedError("Permission denied: " + error_msg);
        case 404:
            throw NotFoundError("Not found: " + error_msg, endpoint);
        case 429:
            throw RateLimitError("Rate limit exceeded: " + error_msg);
        default:
            throw APIError("API error: " + error_msg, status_code, body, endpoint);
    }
}

void Backend::stream_generate(
    const StreamConfig& config,
    const GenerateRequest& request,
    const ChunkCallback& on_chunk,
    const std::atomic<bool>& stop_requested
) const {
    if (config.api_key.empty()) {
        throw ConfigurationError("API key is required", "api_key");
    }

    std::string url = stream_url(config);
    std::string request_body = build_request_payload(request).dump();
    double timeout = request.timeout.value_or(config.request_timeout);

    CURL* curl = curl_easy_init();
    if (!curl) {
        throw ConnectionError("Failed to initialize CURL", config.endpoint);
    }

    StreamContext ctx;
    ctx.curl = curl;
    ctx.on_chunk = &on_chunk;
    ctx.stop_requested = &stop_requested;
    ctx.endpoint = config.endpoint;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request_body.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, stream_write);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, stream_progress);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, options_.user_agent.value_or(DEFAULT_USER_AGENT).c_str());
    if (timeout > 0) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout * 1000.0));
    }

    struct curl_slist* header_list = nullptr;
    header_list = curl_slist_append(header_list, "Content-Type: application/json");
    header_list = curl_slist_append(header_list, "Accept: text/event-stream");
    header_list = curl_slist_append(header_list,
        (std::string(GEMINI_API_KEY_HEADER) + ": " + config.api_key).c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);

    CURLcode res = curl_easy_perform(curl);

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

    curl_slist_free_all(header_list);
    curl_easy_cleanup(curl);

    if (ctx.failure) {
        std::rethrow_exception(ctx.failure);
    }

    if (ctx.stopped) {
        return;
    }

    if (res == CURLE_OPERATION_TIMEDOUT) {
        throw TimeoutError(timeout);
    }

    if (res != CURLE_OK) {
        throw ConnectionError("CURL error: " + std::string(curl_easy_strerror(res)), config.endpoint);
    }

    if (http_code != 200) {
        handle_http_error(static_cast<int>(http_code), ctx.error_body, config.endpoint);
    }
}

} // namespace geministream
