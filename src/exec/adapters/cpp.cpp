#include <fmt/core.h>
#include <glog/logging.h>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/stl_utils.hpp"
#include "common/utils.hpp"
#include "exec/adapters.hpp"
#include "exec/result_parser.hpp"

namespace kata {
using namespace std;

static const char *EXECUTABLE = "solution";

// stderr 在诊断信息中最多保留的字节数
static const size_t STDERR_TAIL = 512;

vector<io_case> parse_io_cases(const string &content) {
    vector<io_case> cases;
    for (const string &raw : split_by(content, "===")) {
        string block = trim_copy(raw);
        if (block.empty()) continue;

        vector<string> parts = split_by(block, "---");
        io_case c;
        if (parts.size() == 2) {
            c.input = trim_copy(parts[0]);
            c.expected = trim_copy(parts[1]);
        } else {
            c.input = block;
            c.well_formed = false;
        }
        cases.push_back(move(c));
    }
    return cases;
}

cpp_adapter::cpp_adapter(cpp_config config) : config(move(config)) {}

language cpp_adapter::language() const { return kata::language::CPP; }
string cpp_adapter::entry_file() const { return "entry.cpp"; }
string cpp_adapter::public_tests_file() const { return "tests.txt"; }
string cpp_adapter::hidden_tests_file() const { return "hidden_tests.txt"; }

harness_output cpp_adapter::execute(const adapter_context &ctx) {
    vector<string> tests = prepare_workspace(ctx);

    harness_output output;
    vector<string> compile_command;
    to_string_list(compile_command, config.compiler, config.compiler_flags, "-o", EXECUTABLE, entry_file());
    if (!compile(ctx, compile_command)) {
        output.run.cancelled = true;
        return output;
    }

    // 测试点由引擎直接运行，报告也由引擎写入
    output.token = ctx.report_token;
    size_t reported = 0;
    auto report = [&](const test_result &result) {
        output.report += format_test_line(result) + "\n";
        ++reported;
    };

    // 所有测试点共享同一个时间限制
    elapsed_time elapsed;
    int index = 0;
    for (const string &test_file : tests) {
        string prefix = test_file == hidden_tests_file() ? "hidden_test_" : "test_";
        vector<io_case> cases = parse_io_cases(read_file_content(ctx.workdir / test_file));
        DLOG(INFO) << "running " << cases.size() << " cases from " << test_file;

        for (size_t i = 0; i < cases.size(); ++i) {
            const io_case &c = cases[i];
            test_result result;
            result.name = prefix + std::to_string(i + 1);

            if (!c.well_formed) {
                result.message = "malformed test case: expected input and output separated by ---";
                report(result);
                continue;
            }

            auto remaining = ctx.timeout - elapsed.duration<chrono::milliseconds>();
            if (remaining <= chrono::milliseconds(0)) {
                output.run.timed_out = true;
                break;
            }

            filesystem::path input_file = ctx.workdir / fmt::format("case_{}.in", ++index);
            write_file_content(input_file, c.input + "\n");

            runguard_options opt = make_options(ctx, remaining);
            opt.command = {"./" + string(EXECUTABLE)};
            opt.stdin_filename = input_file.string();
            runguard_result run = ctx.sandbox.run(opt, ctx.cancel);
            if (!run.exec_error.empty())
                throw internal_error(run.exec_error);

            output.run.stdout_data += fmt::format("Test {}:\n{}\n", result.name, run.stdout_data);
            if (!run.stderr_data.empty())
                output.run.stderr_data += fmt::format("Test {} stderr:\n{}\n", result.name, run.stderr_data);
            output.run.stdout_truncated |= run.stdout_truncated;
            output.run.stderr_truncated |= run.stderr_truncated;
            output.run.stdout_bytes += run.stdout_bytes;
            output.run.stderr_bytes += run.stderr_bytes;
            output.run.exitcode = run.exitcode;
            output.run.signal = run.signal;

            if (run.cancelled) {
                output.run.cancelled = true;
                break;
            }
            if (run.timed_out) {
                output.run.timed_out = true;
                result.message = "Execution timed out";
                report(result);
                break;
            }
            if (!run.exitcode) {
                // 被信号杀死，比如段错误
                output.crashed = true;
                result.message = fmt::format("Test execution failed: killed by signal {}. stderr: {}", run.signal,
                                             tail(run.stderr_data, STDERR_TAIL));
            } else if (*run.exitcode != 0) {
                result.message = fmt::format("Test execution failed: process exited with code {}. stderr: {}",
                                             *run.exitcode, tail(run.stderr_data, STDERR_TAIL));
            } else {
                string actual = trim_copy(run.stdout_data);
                result.passed = actual == c.expected;
                if (!result.passed)
                    result.message = fmt::format("Expected: \"{}\", Got: \"{}\"", c.expected, actual);
            }
            report(result);
        }
        if (output.run.timed_out || output.run.cancelled) break;
    }
    if (!output.run.timed_out && !output.run.cancelled)
        output.report += format_completion_line(reported, ctx.report_token) + "\n";
    output.run.wall_time = elapsed.duration<chrono::duration<double>>().count();
    return output;
}

}  // namespace kata
