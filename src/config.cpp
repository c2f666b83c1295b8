#include "config.hpp"
#include <boost/algorithm/string/predicate.hpp>
#include <boost/lexical_cast.hpp>
#include <algorithm>
#include <fmt/core.h>
#include <stdexcept>
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace kata {
using namespace std;
using namespace nlohmann;

const vector<string> SUPPORTED_MODELS = {"gpt-4o-mini", "gpt-4-turbo", "gpt-4", "gpt-3.5-turbo"};

static chrono::milliseconds get_millis(const json &j, const char *key, chrono::milliseconds def) {
    return j.count(key) ? chrono::milliseconds(j.at(key).get<int64_t>()) : def;
}

void from_json(const json &j, ai_config &config) {
    config.api_key = j.value("api_key", config.api_key);
    config.base_url = j.value("base_url", config.base_url);
    config.model = j.value("model", config.model);
    config.temperature = j.value("temperature", config.temperature);
    config.max_tokens = j.value("max_tokens", config.max_tokens);
    config.timeout = get_millis(j, "timeout_ms", config.timeout);

    if (j.count("retry")) {
        const json &retry = j.at("retry");
        config.retry.max_attempts = retry.value("max_attempts", config.retry.max_attempts);
        config.retry.base_delay = get_millis(retry, "base_delay_ms", config.retry.base_delay);
        config.retry.max_delay = get_millis(retry, "max_delay_ms", config.retry.max_delay);
        config.retry.jitter_ratio = retry.value("jitter_ratio", config.retry.jitter_ratio);
    }
}

void from_json(const json &j, engine_config &config) {
    if (j.count("run_dir")) config.run_dir = j.at("run_dir").get<string>();
    config.workers = j.value("workers", config.workers);
    config.debug = j.value("debug", config.debug);
    config.default_timeout = get_millis(j, "default_timeout_ms", config.default_timeout);
    config.compile_timeout = get_millis(j, "compile_timeout_ms", config.compile_timeout);
    config.probe_timeout = get_millis(j, "probe_timeout_ms", config.probe_timeout);
    config.kill_grace = get_millis(j, "kill_grace_ms", config.kill_grace);
    config.output_limit = j.value("output_limit", config.output_limit);
    if (j.count("ai")) j.at("ai").get_to(config.ai);
}

engine_config load_engine_config(const filesystem::path &config_file) {
    engine_config config;
    try {
        json::parse(read_file_content(config_file)).get_to(config);
    } catch (json::exception &ex) {
        throw invalid_argument("malformed configuration " + config_file.string() + ": " + ex.what());
    }
    return config;
}

void apply_environment(engine_config &config) {
    string api_key = get_env("OPENAI_API_KEY", get_env("OPENAI_API_TOKEN", ""));
    if (!api_key.empty()) config.ai.api_key = api_key;
    config.ai.base_url = get_env("OPENAI_BASE_URL", config.ai.base_url);
    config.ai.model = get_env("KATA_MODEL", config.ai.model);

    if (getenv("KATA_RUN_DIR")) config.run_dir = getenv("KATA_RUN_DIR");
    if (getenv("KATA_WORKERS")) config.workers = boost::lexical_cast<size_t>(getenv("KATA_WORKERS"));
    if (getenv("KATA_DEBUG")) config.debug = true;
}

vector<string> validate_ai_config(const ai_config &config) {
    vector<string> errors;
    if (config.api_key.empty()) {
        errors.push_back("API key is required");
    } else if (!boost::algorithm::starts_with(config.api_key, "sk-") || config.api_key.size() < 20) {
        errors.push_back("API key format is invalid");
    }

    if (find(SUPPORTED_MODELS.begin(), SUPPORTED_MODELS.end(), config.model) == SUPPORTED_MODELS.end())
        errors.push_back(fmt::format("model {} is not supported", config.model));
    if (config.max_tokens < 100 || config.max_tokens > 8000)
        errors.push_back("max tokens must be between 100 and 8000");
    if (config.temperature < 0 || config.temperature > 2)
        errors.push_back("temperature must be between 0 and 2");
    if (config.retry.max_attempts < 1 || config.retry.max_attempts > 10)
        errors.push_back("retry attempts must be between 1 and 10");
    if (config.timeout < chrono::seconds(5) || config.timeout > chrono::seconds(120))
        errors.push_back("timeout must be between 5 and 120 seconds");
    if (config.retry.jitter_ratio < 0 || config.retry.jitter_ratio >= 1)
        errors.push_back("jitter ratio must be in [0, 1)");
    return errors;
}

}  // namespace kata
