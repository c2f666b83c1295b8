#include "engine.hpp"
#include <glog/logging.h>

namespace kata {
using namespace std;

engine::engine(engine_config config)
    : engine(move(config), make_unique<process_sandbox>(), nullptr) {}

engine::engine(engine_config config, unique_ptr<kata::sandbox> sandbox, unique_ptr<completion_transport> transport)
    : cfg(move(config)),
      sandbox(move(sandbox)),
      prober(*this->sandbox, cfg.probe_timeout),
      dispatcher(cfg, *this->sandbox, prober),
      curl(transport ? nullptr : make_unique<curl_global>()),
      transport(transport ? move(transport) : make_unique<curl_transport>()),
      ai(cfg.ai, *this->transport),
      pool(cfg.workers) {
    filesystem::create_directories(cfg.run_dir);
    LOG(INFO) << "Engine started with " << cfg.workers << " workers, run directory " << cfg.run_dir;
}

execution_result engine::execute(const execution_request &request, const cancellation_token *cancel) {
    return dispatcher.execute(request, cancel);
}

shared_ptr<const system_dependencies> engine::check_dependencies(bool refresh) {
    return refresh ? prober.refresh() : prober.probe();
}

execution_result engine::evaluate_answer(const answer_request &request) {
    return kata::evaluate_answer(request);
}

ai_result<judge_result> engine::judge_explanation(const explanation_request &request, const cancellation_token *cancel) {
    return ai.judge_explanation(request, cancel);
}

ai_result<judge_result> engine::judge_template(const template_request &request, const cancellation_token *cancel) {
    return ai.judge_template(request, cancel);
}

ai_result<judge_result> engine::judge_codebase(const codebase_request &request, const cancellation_token *cancel) {
    return ai.judge_codebase(request, cancel);
}

ai_result<generated_artifact> engine::generate(const string &prompt, const artifact_schema &schema, const cancellation_token *cancel) {
    return ai.generate(prompt, schema, cancel);
}

const engine_config &engine::config() const noexcept {
    return cfg;
}

worker_pool &engine::workers() noexcept {
    return pool;
}

}  // namespace kata
