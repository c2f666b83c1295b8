#include "ai/error.hpp"
#include <fmt/core.h>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/assign.hpp>
#include <map>

namespace kata {
using namespace std;

// clang-format off
static const map<ai_error_type, string> ERROR_TYPE_NAMES = boost::assign::map_list_of
    (ai_error_type::AUTH, "auth")
    (ai_error_type::RATE_LIMIT, "rate_limit")
    (ai_error_type::NETWORK, "network")
    (ai_error_type::SERVER, "server")
    (ai_error_type::VALIDATION, "validation")
    (ai_error_type::TIMEOUT, "timeout")
    (ai_error_type::UNKNOWN, "unknown");
// clang-format on

string to_string(ai_error_type type) {
    return ERROR_TYPE_NAMES.at(type);
}

bool is_retryable(ai_error_type type) {
    switch (type) {
        case ai_error_type::RATE_LIMIT:
        case ai_error_type::NETWORK:
        case ai_error_type::SERVER:
        case ai_error_type::TIMEOUT:
            return true;
        default:
            return false;
    }
}

static ai_error_type classify_status(int status_code) {
    if (status_code == 401 || status_code == 403) return ai_error_type::AUTH;
    if (status_code == 429) return ai_error_type::RATE_LIMIT;
    if (status_code == 408) return ai_error_type::TIMEOUT;
    if (status_code >= 500 && status_code < 600) return ai_error_type::SERVER;
    if (status_code == 400 || status_code == 422) return ai_error_type::VALIDATION;
    return ai_error_type::UNKNOWN;
}

static ai_error_type classify_transport(network_failure failure) {
    switch (failure) {
        case network_failure::CONNECTION:
        case network_failure::DNS:
            return ai_error_type::NETWORK;
        case network_failure::TIMEOUT:
            return ai_error_type::TIMEOUT;
        default:
            return ai_error_type::UNKNOWN;
    }
}

// 没有状态码时根据错误信息中的关键字判断
static ai_error_type classify_message(const string &message) {
    string text = boost::algorithm::to_lower_copy(message);
    auto contains = [&](const char *keyword) { return boost::algorithm::contains(text, keyword); };

    if (contains("invalid api key") || contains("unauthorized") || contains("invalid credential") || contains("incorrect api key"))
        return ai_error_type::AUTH;
    if (contains("rate limit") || contains("quota") || contains("too many requests"))
        return ai_error_type::RATE_LIMIT;
    if (contains("timed out") || contains("timeout") || contains("deadline"))
        return ai_error_type::TIMEOUT;
    if (contains("econnrefused") || contains("econnreset") || contains("enotfound") || contains("connection refused") ||
        contains("connection reset") || contains("could not resolve"))
        return ai_error_type::NETWORK;
    return ai_error_type::UNKNOWN;
}

ai_service_error classify_error(const raw_error &error) {
    ai_service_error result;
    result.message = error.message;
    result.status_code = error.status_code;

    if (error.status_code)
        result.type = classify_status(*error.status_code);
    else if (error.transport)
        result.type = classify_transport(*error.transport);
    else if (error.malformed_body)
        result.type = ai_error_type::VALIDATION;
    else
        result.type = classify_message(error.message);

    result.cancelled = error.transport == network_failure::CANCELLED;
    result.retryable = is_retryable(result.type);
    return result;
}

string ai_service_error::user_message() const {
    if (cancelled) return "AI request was cancelled";
    if (status_code) {
        switch (*status_code) {
            case 401:
                return "AI service authentication failed - check API key";
            case 403:
                return "AI service access forbidden";
            case 429:
                return "AI service rate limit exceeded - please try again later";
            case 500:
                return "AI service internal error";
            case 503:
                return "AI service temporarily unavailable";
            default:
                return fmt::format("AI service error ({}): {}", *status_code, message);
        }
    }
    return fmt::format("AI service error: {}", message);
}

vector<string> ai_service_error::recovery_suggestions() const {
    switch (type) {
        case ai_error_type::AUTH:
            return {"Check that the API key is set in OPENAI_API_KEY or the configuration file",
                    "Make sure the API key is valid and the account has sufficient credits"};
        case ai_error_type::RATE_LIMIT:
            return {"Wait a minute before trying again", "Reduce the number of concurrent AI requests"};
        case ai_error_type::NETWORK:
            return {"Check the internet connection", "Check that the AI service base URL is reachable"};
        case ai_error_type::SERVER:
            return {"The AI service is having problems, try again later"};
        case ai_error_type::VALIDATION:
            return {"Try the request again, the model may answer in the expected format next time",
                    "Simplify the submission or the rubric"};
        case ai_error_type::TIMEOUT:
            return {"Try again with a shorter submission", "Increase the AI request timeout in the configuration"};
        case ai_error_type::UNKNOWN:
            break;
    }
    return {"Try again later"};
}

}  // namespace kata
