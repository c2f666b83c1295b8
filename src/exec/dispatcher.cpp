#include "exec/dispatcher.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <algorithm>
#include <cmath>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "exec/adapters.hpp"
#include "exec/kata.hpp"
#include "exec/result_parser.hpp"

namespace kata {
using namespace std;

// 诊断信息中最多展示的 stderr 字节数
static const size_t DIAGNOSTIC_STDERR = 2048;

execution_dispatcher::execution_dispatcher(const engine_config &config, kata::sandbox &sandbox, dependency_prober &prober)
    : config(config), sandbox(sandbox), prober(prober) {}

int compute_score(const vector<test_result> &results) {
    if (results.empty()) return 0;
    size_t passed = count_if(results.begin(), results.end(), [](const test_result &r) { return r.passed; });
    return static_cast<int>(lround(100.0 * passed / results.size()));
}

static bool any_failed(const vector<test_result> &results) {
    return any_of(results.begin(), results.end(), [](const test_result &r) { return !r.passed; });
}

// 测试驱动没能给出失败的测试点时（比如超时、崩溃），补充一个失败项，保证结果中能看到失败原因
static void ensure_failure(vector<test_result> &results, const string &name, const string &message) {
    if (!any_failed(results))
        results.push_back({name, false, message});
}

static string describe_exit(const runguard_result &run) {
    if (run.exitcode) return fmt::format("exited with code {}", *run.exitcode);
    return fmt::format("was killed by signal {}", run.signal);
}

void assemble_result(execution_result &result, const harness_output &output, chrono::milliseconds timeout) {
    const runguard_result &run = output.run;
    test_report report = parse_test_report(output.report, output.token);

    result.test_results = move(report.results);
    for (auto &test : result.test_results) {
        test.name = sanitize_utf8(test.name);
        test.message = sanitize_utf8(test.message);
    }
    result.stdout_data = sanitize_utf8(run.stdout_data);
    result.stderr_data = sanitize_utf8(run.stderr_data);
    result.exit_code = run.exitcode;
    result.timed_out = run.timed_out;
    result.output_truncated = run.stdout_truncated || run.stderr_truncated;

    if (run.timed_out) {
        result.status = status::TIME_LIMIT_EXCEEDED;
        result.diagnostic = fmt::format("execution exceeded the time limit of {}ms", timeout.count());
        ensure_failure(result.test_results, "timeout", fmt::format("Execution timed out after {}ms", timeout.count()));
    } else if (run.cancelled) {
        result.status = status::CANCELLED;
        result.diagnostic = "execution was cancelled";
        ensure_failure(result.test_results, "cancelled", "Execution was cancelled");
    } else if (report.malformed_lines > 0) {
        result.status = status::HARNESS_PARSE_ERROR;
        result.diagnostic = report.first_error;
    } else if (output.crashed) {
        result.status = status::RUNTIME_ERROR;
        result.diagnostic = fmt::format("test harness {}", describe_exit(run));
        if (!result.stderr_data.empty())
            result.diagnostic += ":\n" + tail(result.stderr_data, DIAGNOSTIC_STDERR);
        ensure_failure(result.test_results, "runtime", fmt::format("Runtime error: process {}", describe_exit(run)));
    } else if (!report.complete) {
        // 选手代码提前结束了进程，之后的测试（包括隐藏测试）都没有运行
        result.status = status::RUNTIME_ERROR;
        result.diagnostic = fmt::format("test harness {} before all tests finished", describe_exit(run));
        result.test_results.push_back({"harness", false, "Test run ended before all tests finished"});
    } else if (result.test_results.empty()) {
        result.status = status::TESTS_FAILED;
        result.diagnostic = "test harness reported no tests";
        result.test_results.push_back({"tests", false, "No tests were reported"});
    } else if (any_failed(result.test_results)) {
        result.status = status::TESTS_FAILED;
    } else if (run.exitcode && *run.exitcode != 0) {
        // 所有测试都通过，但测试驱动返回了失败
        result.status = status::TESTS_FAILED;
        result.diagnostic = fmt::format("test harness {} although every test passed", describe_exit(run));
        result.test_results.push_back({"harness", false, result.diagnostic});
    } else {
        result.status = status::ACCEPTED;
    }

    // tail 可能从多字节字符中间截断
    result.diagnostic = sanitize_utf8(result.diagnostic);
    result.score = compute_score(result.test_results);
    result.success = result.status == status::ACCEPTED;
}

static void validate(const execution_request &request) {
    if (request.kata_path.empty())
        throw invalid_argument("kata path is required");
    if (!filesystem::is_directory(request.kata_path))
        throw invalid_argument(fmt::format("kata path {} is not a directory", request.kata_path.string()));
    if (request.timeout_ms && *request.timeout_ms <= 0)
        throw invalid_argument(fmt::format("timeout must be positive, got {}ms", *request.timeout_ms));
}

execution_result execution_dispatcher::execute(const execution_request &request, const cancellation_token *cancel) {
    elapsed_time elapsed;
    validate(request);
    kata_metadata meta = load_kata_metadata(request.kata_path);

    execution_result result;
    auto finish = [&]() -> execution_result & {
        result.duration_ms = elapsed.duration<chrono::milliseconds>().count();
        return result;
    };

    auto deps = prober.probe();
    if (const dependency_status *missing = deps->missing_toolchain(request.language)) {
        LOG(WARNING) << "refusing to run " << to_string(request.language) << " code: " << missing->name << " is unavailable";
        result.status = status::TOOLCHAIN_MISSING;
        result.diagnostic = fmt::format("{} is required to run {} code but is not available: {}", missing->name,
                                        to_string(request.language), missing->error.value_or("not found"));
        if (missing->installation_guide)
            result.diagnostic += "\n" + *missing->installation_guide;
        return finish();
    }

    chrono::milliseconds timeout = config.default_timeout;
    if (request.timeout_ms)
        timeout = chrono::milliseconds(*request.timeout_ms);
    else if (meta.timeout_ms && *meta.timeout_ms > 0)
        timeout = chrono::milliseconds(*meta.timeout_ms);
    else if (meta.timeout_ms)
        LOG(WARNING) << "ignoring non-positive timeout_ms " << *meta.timeout_ms << " of kata " << request.kata_path;

    if (is_cancelled(cancel)) {
        result.status = status::CANCELLED;
        result.diagnostic = "execution was cancelled before it started";
        return finish();
    }

    filesystem::path workdir = config.run_dir / boost::lexical_cast<string>(boost::uuids::random_generator()());
    defer {
        if (config.debug) {
            LOG(INFO) << "keeping workspace " << workdir;
            return;
        }
        error_code ec;
        filesystem::remove_all(workdir, ec);
        if (ec) LOG(WARNING) << "unable to remove workspace " << workdir << ": " << ec.message();
    };

    try {
        filesystem::create_directories(workdir);

        auto adapter = make_adapter(make_adapter_config(request.language, *deps));
        string token = boost::lexical_cast<string>(boost::uuids::random_generator()());
        adapter_context ctx{request, workdir, timeout, config.compile_timeout, config.kill_grace,
                            config.output_limit, token, sandbox, cancel};
        DLOG(INFO) << "executing " << to_string(request.language) << " submission for " << request.kata_path
                   << " in " << workdir << " with timeout " << timeout.count() << "ms";

        harness_output output = adapter->execute(ctx);
        assemble_result(result, output, timeout);
    } catch (compilation_error &ex) {
        result.status = status::COMPILATION_ERROR;
        result.diagnostic = ex.what();
        result.stderr_data = ex.error_log;
    } catch (internal_error &ex) {
        LOG(ERROR) << "execution of " << request.kata_path << " failed: " << ex;
        result.status = status::INTERNAL_ERROR;
        result.diagnostic = ex.what();
    } catch (system_error &ex) {
        LOG(ERROR) << "execution of " << request.kata_path << " failed: " << boost::diagnostic_information(ex);
        result.status = status::INTERNAL_ERROR;
        result.diagnostic = ex.what();
    }

    LOG(INFO) << "executed " << to_string(request.language) << " submission for " << request.kata_path << ": "
              << to_string(result.status) << ", score " << result.score;
    return finish();
}

}  // namespace kata
