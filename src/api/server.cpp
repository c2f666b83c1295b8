#include "api/server.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <boost/exception/diagnostic_information.hpp>
#include "api/messages.hpp"
#include "common/defer.hpp"
#include "common/json_utils.hpp"

namespace kata {
using namespace std;
using namespace nlohmann;

rpc_method parse_rpc_method(const string &name) {
    if (name == "execute") return rpc_method::EXECUTE;
    if (name == "checkDependencies") return rpc_method::CHECK_DEPENDENCIES;
    if (name == "judgeExplanation") return rpc_method::JUDGE_EXPLANATION;
    if (name == "judgeTemplate") return rpc_method::JUDGE_TEMPLATE;
    if (name == "judgeCodebase") return rpc_method::JUDGE_CODEBASE;
    if (name == "generate") return rpc_method::GENERATE;
    if (name == "evaluateAnswer") return rpc_method::EVALUATE_ANSWER;
    if (name == "cancel") return rpc_method::CANCEL;
    throw invalid_argument("unknown method " + name);
}

// AI 调用失败时错误作为 error 返回，附带错误分类和恢复建议
template <typename T>
static json ai_response(const ai_result<T> &result) {
    if (auto *error = get_if<ai_service_error>(&result)) {
        json body = *error;
        body["code"] = "ai_service_error";
        return {{"error", body}};
    }
    return {{"result", get<T>(result)}};
}

line_server::line_server(engine &eng, istream &in, ostream &out) : eng(eng), in(in), out(out) {}

void line_server::serve() {
    LOG(INFO) << "Serving requests from stdin";
    string line;
    while (getline(in, line))
        handle_line(line);
    LOG(INFO) << "Input closed, waiting for in-flight requests";
    wait();
}

void line_server::wait() {
    vector<future<void>> futures;
    {
        lock_guard<mutex> guard(inflight_mutex);
        futures.swap(pending);
    }
    for (auto &f : futures) f.wait();
}

void line_server::write(const json &response) {
    string line = response.dump();
    lock_guard<mutex> guard(output_mutex);
    out << line << '\n';
    out.flush();
}

void line_server::write_error(const json &id, const string &code, const string &message) {
    write({{"id", id}, {"error", {{"code", code}, {"message", message}}}});
}

bool line_server::cancel(const json &id) {
    lock_guard<mutex> guard(inflight_mutex);
    auto it = inflight.find(id.dump());
    if (it == inflight.end()) return false;
    it->second->cancel();
    return true;
}

json line_server::invoke(rpc_method method, const json &params, const cancellation_token *cancel) {
    switch (method) {
        case rpc_method::EXECUTE:
            return {{"result", eng.execute(params.get<execution_request>(), cancel)}};
        case rpc_method::CHECK_DEPENDENCIES:
            return {{"result", *eng.check_dependencies(get_value_def<bool>(params, false, "refresh"))}};
        case rpc_method::JUDGE_EXPLANATION:
            return ai_response(eng.judge_explanation(params.get<explanation_request>(), cancel));
        case rpc_method::JUDGE_TEMPLATE:
            return ai_response(eng.judge_template(params.get<template_request>(), cancel));
        case rpc_method::JUDGE_CODEBASE:
            return ai_response(eng.judge_codebase(params.get<codebase_request>(), cancel));
        case rpc_method::GENERATE:
            return ai_response(eng.generate(get_value<string>(params, "prompt"),
                                            get_value_def<artifact_schema>(params, artifact_schema(), "schema"), cancel));
        case rpc_method::EVALUATE_ANSWER:
            return {{"result", eng.evaluate_answer(params.get<answer_request>())}};
        case rpc_method::CANCEL:
            break;
    }
    throw invalid_argument("method cannot be invoked asynchronously");
}

void line_server::handle_line(const string &line) {
    if (line.find_first_not_of(" \t\r") == string::npos) return;

    json request;
    try {
        request = json::parse(line);
    } catch (json::parse_error &ex) {
        write_error(nullptr, "parse_error", ex.what());
        return;
    }

    json id = request.is_object() && request.count("id") ? request.at("id") : json(nullptr);
    rpc_method method;
    try {
        method = parse_rpc_method(get_value<string>(request, "method"));
    } catch (invalid_argument &ex) {
        write_error(id, "invalid_request", ex.what());
        return;
    }
    json params = exists(request, "params") ? request.at("params") : json::object();

    if (method == rpc_method::CANCEL) {
        json target = exists(params, "id") ? params.at("id") : json(nullptr);
        write({{"id", id}, {"result", {{"cancelled", cancel(target)}}}});
        return;
    }

    auto token = make_shared<cancellation_token>();
    string key = id.dump();
    {
        lock_guard<mutex> guard(inflight_mutex);
        inflight[key] = token;
        // 清理已经完成的请求
        pending.erase(remove_if(pending.begin(), pending.end(),
                                [](const future<void> &f) { return f.wait_for(chrono::seconds(0)) == future_status::ready; }),
                      pending.end());
    }

    auto task = [this, id, key, method, params = move(params), token] {
        defer {
            lock_guard<mutex> guard(inflight_mutex);
            auto it = inflight.find(key);
            if (it != inflight.end() && it->second == token) inflight.erase(it);
        };

        try {
            json response = invoke(method, params, token.get());
            response["id"] = id;
            write(response);
        } catch (invalid_argument &ex) {
            write_error(id, "invalid_argument", ex.what());
        } catch (json::exception &ex) {
            write_error(id, "invalid_argument", ex.what());
        } catch (std::exception &ex) {
            LOG(ERROR) << "request " << key << " failed: " << boost::diagnostic_information(ex);
            write_error(id, "internal_error", ex.what());
        }
    };

    try {
        future<void> done = eng.workers().submit(move(task));
        lock_guard<mutex> guard(inflight_mutex);
        pending.push_back(move(done));
    } catch (runtime_error &ex) {
        write_error(id, "internal_error", ex.what());
    }
}

}  // namespace kata
