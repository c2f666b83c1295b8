#include "exec/adapter.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace kata {
using namespace std;

const char *REPORT_FILE = ".kata_report.jsonl";
const char *TOKEN_FILE = ".kata_token";

// 选手程序写入文件的大小上限，避免占满磁盘
const int64_t FILE_LIMIT = 64 << 20;

compilation_error::compilation_error(const string &message, const string &error_log)
    : runtime_error(message), error_log(error_log) {}

language_adapter::~language_adapter() {}

vector<string> language_adapter::prepare_workspace(const adapter_context &ctx) const {
    const auto &request = ctx.request;
    write_file_content(ctx.workdir / entry_file(), request.source_code);

    vector<string> tests;
    filesystem::path public_tests = request.kata_path / public_tests_file();
    if (!filesystem::is_regular_file(public_tests))
        throw invalid_argument(fmt::format("kata {} has no {}", request.kata_path.string(), public_tests_file()));
    filesystem::copy_file(public_tests, ctx.workdir / public_tests_file(), filesystem::copy_options::overwrite_existing);
    tests.push_back(public_tests_file());

    if (request.include_hidden) {
        filesystem::path hidden_tests = request.kata_path / hidden_tests_file();
        if (filesystem::is_regular_file(hidden_tests)) {
            filesystem::copy_file(hidden_tests, ctx.workdir / hidden_tests_file(), filesystem::copy_options::overwrite_existing);
            tests.push_back(hidden_tests_file());
        } else {
            LOG(INFO) << "kata " << request.kata_path << " has no hidden tests";
        }
    }
    return tests;
}

runguard_options language_adapter::make_options(const adapter_context &ctx, chrono::milliseconds limit) const {
    runguard_options opt;
    opt.work_dir = ctx.workdir.string();
    opt.wall_limit = limit;
    opt.kill_delay = ctx.kill_grace;
    opt.stream_size = ctx.output_limit;
    opt.file_limit = FILE_LIMIT;
    opt.no_core_dumps = true;
    opt.env.push_back("KATA_REPORT_FILE=" + (ctx.workdir / REPORT_FILE).string());
    return opt;
}

harness_output language_adapter::run_harness(const adapter_context &ctx, const vector<string> &command, const vector<string> &env) const {
    runguard_options opt = make_options(ctx, ctx.timeout);
    opt.command = command;
    opt.env.insert(opt.env.end(), env.begin(), env.end());
    write_file_content(ctx.workdir / TOKEN_FILE, ctx.report_token);

    harness_output output;
    output.token = ctx.report_token;
    output.run = ctx.sandbox.run(opt, ctx.cancel);
    if (!output.run.exec_error.empty())
        throw internal_error(output.run.exec_error);

    output.report = read_file_content(ctx.workdir / REPORT_FILE, "");
    if (!output.run.timed_out && !output.run.cancelled) {
        output.crashed = !output.run.exitcode || (*output.run.exitcode != 0 && *output.run.exitcode != 1);
    }
    return output;
}

bool language_adapter::compile(const adapter_context &ctx, const vector<string> &command) const {
    runguard_options opt = make_options(ctx, ctx.compile_timeout);
    opt.command = command;

    runguard_result result = ctx.sandbox.run(opt, ctx.cancel);
    if (!result.exec_error.empty())
        throw internal_error(result.exec_error);
    if (result.cancelled)
        return false;

    string log = sanitize_utf8(result.stdout_data + result.stderr_data);
    if (result.timed_out)
        throw compilation_error(fmt::format("compilation timed out after {}ms", ctx.compile_timeout.count()), log);
    if (!result.exitcode || *result.exitcode != 0)
        throw compilation_error(result.exitcode ? fmt::format("compiler exited with code {}", *result.exitcode)
                                                : fmt::format("compiler killed by signal {}", result.signal),
                                log);
    return true;
}

}  // namespace kata
