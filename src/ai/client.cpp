#include "ai/client.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <nlohmann/json.hpp>
#include <thread>
#include "ai/prompts.hpp"
#include "ai/response_parser.hpp"
#include "common/io_utils.hpp"

namespace kata {
using namespace std;
using namespace nlohmann;

// 错误信息中最多保留的响应内容字节数
static const size_t ERROR_BODY_LIMIT = 500;

static ai_service_error cancelled_error(int attempts) {
    ai_service_error error;
    error.type = ai_error_type::UNKNOWN;
    error.message = "AI request was cancelled";
    error.cancelled = true;
    error.attempts = attempts;
    return error;
}

// choices[0].message.content
static string extract_content(const string &body) {
    json j;
    try {
        j = json::parse(body);
    } catch (json::parse_error &ex) {
        throw response_format_error(fmt::format("AI API returned invalid JSON: {}", ex.what()));
    }

    if (!j.is_object() || !j.count("choices") || !j.at("choices").is_array() || j.at("choices").empty())
        throw response_format_error("Invalid response format from AI API: missing choices");
    const json &choice = j.at("choices").at(0);
    if (!choice.count("message") || !choice.at("message").count("content") || !choice.at("message").at("content").is_string())
        throw response_format_error("Invalid response format from AI API: missing message content");
    return choice.at("message").at("content").get<string>();
}

ai_client::ai_client(const ai_config &config, completion_transport &transport)
    : config(config), transport(transport), policy(config.retry) {}

void ai_client::on_retry(retry_callback callback) {
    retry_listener = move(callback);
}

http_request ai_client::make_request(const string &prompt) const {
    string base_url = config.base_url;
    while (!base_url.empty() && base_url.back() == '/') base_url.pop_back();

    json body = {{"model", config.model},
                 {"messages", json::array({{{"role", "user"}, {"content", prompt}}})},
                 {"temperature", config.temperature},
                 {"max_tokens", config.max_tokens}};

    http_request request;
    request.url = base_url + "/chat/completions";
    request.headers = {"Content-Type: application/json", "Authorization: Bearer " + config.api_key};
    request.body = body.dump();
    request.timeout = config.timeout;
    return request;
}

template <typename T, typename Parser>
ai_result<T> ai_client::call(const char *operation, const string &prompt, Parser parse, const cancellation_token *cancel) {
    if (config.api_key.empty()) {
        ai_service_error error;
        error.type = ai_error_type::AUTH;
        error.message = "AI API key is not configured";
        error.retryable = false;
        return error;
    }

    for (int attempt = 0;; ++attempt) {
        if (is_cancelled(cancel)) return cancelled_error(attempt);

        raw_error raw;
        try {
            http_response response = transport.post(make_request(prompt), cancel);
            if (response.status_code >= 200 && response.status_code < 300)
                return parse(extract_content(response.body));

            raw.status_code = static_cast<int>(response.status_code);
            raw.message = fmt::format("AI API request failed: {} - {}", response.status_code,
                                      tail(sanitize_utf8(response.body), ERROR_BODY_LIMIT));
        } catch (network_error &ex) {
            raw.transport = ex.failure();
            raw.message = ex.what();
        } catch (response_format_error &ex) {
            raw.malformed_body = true;
            raw.message = fmt::format("Failed to parse AI response: {}", ex.what());
        }

        ai_service_error error = classify_error(raw);
        error.attempts = attempt + 1;
        if (error.cancelled) return error;

        if (!policy.should_retry(error, attempt)) {
            LOG(WARNING) << operation << " failed after " << error.attempts << " attempt(s): "
                         << to_string(error.type) << ": " << error.message;
            return error;
        }

        retry_state state;
        state.attempt = attempt;
        state.max_attempts = policy.config().max_attempts;
        state.next_delay = policy.next_delay(attempt);
        LOG(WARNING) << operation << " attempt " << attempt + 1 << "/" << state.max_attempts << " failed ("
                     << to_string(error.type) << ": " << error.message << "), retrying in " << state.next_delay.count() << "ms";
        if (retry_listener) retry_listener(state, error);

        if (cancel) {
            if (cancel->wait_for(state.next_delay)) return cancelled_error(attempt + 1);
        } else {
            this_thread::sleep_for(state.next_delay);
        }
    }
}

ai_result<judge_result> ai_client::judge_explanation(const explanation_request &request, const cancellation_token *cancel) {
    return call<judge_result>("judge_explanation", make_explanation_prompt(request), [&](const string &content) {
        return process_judgment(parse_judgment(content), request.rubric);
    }, cancel);
}

ai_result<judge_result> ai_client::judge_template(const template_request &request, const cancellation_token *cancel) {
    return call<judge_result>("judge_template", make_template_prompt(request), [&](const string &content) {
        return process_judgment(parse_judgment(content), request.rubric);
    }, cancel);
}

ai_result<judge_result> ai_client::judge_codebase(const codebase_request &request, const cancellation_token *cancel) {
    return call<judge_result>("judge_codebase", make_codebase_prompt(request), [&](const string &content) {
        return process_judgment(parse_judgment(content), request.rubric);
    }, cancel);
}

ai_result<generated_artifact> ai_client::generate(const string &prompt, const artifact_schema &schema, const cancellation_token *cancel) {
    return call<generated_artifact>("generate", prompt, [&](const string &content) {
        return parse_artifact(content, schema);
    }, cancel);
}

}  // namespace kata
