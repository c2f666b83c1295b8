#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "exec/adapters.hpp"

namespace kata {
using namespace std;

// 工作目录下没有 node_modules，测试代码用到的全局名字需要自行声明
static const char *TYPESCRIPT_GLOBALS = R"TS(declare function test(name: string, fn: () => unknown): void;
declare function it(name: string, fn: () => unknown): void;
declare function describe(name: string, fn: () => void): void;
declare function require(id: string): any;
declare var process: any;
declare var module: any;
declare module 'assert';
)TS";

typescript_adapter::typescript_adapter(typescript_config config) : config(move(config)) {}

language typescript_adapter::language() const { return kata::language::TYPESCRIPT; }
string typescript_adapter::entry_file() const { return "entry.ts"; }
string typescript_adapter::public_tests_file() const { return "tests.ts"; }
string typescript_adapter::hidden_tests_file() const { return "hidden_tests.ts"; }

harness_output typescript_adapter::execute(const adapter_context &ctx) {
    vector<string> tests = prepare_workspace(ctx);
    write_file_content(ctx.workdir / "kata_globals.d.ts", TYPESCRIPT_GLOBALS);
    write_file_content(ctx.workdir / "kata_runner.js", JAVASCRIPT_RUNNER);

    vector<string> compile_command;
    to_string_list(compile_command, config.compiler, config.compiler_flags, entry_file(), tests, "kata_globals.d.ts");
    if (!compile(ctx, compile_command)) {
        harness_output output;
        output.run.cancelled = true;
        return output;
    }

    vector<string> compiled;
    for (const string &test : tests)
        compiled.push_back(filesystem::path(test).replace_extension(".js").string());

    vector<string> command;
    to_string_list(command, config.node, "kata_runner.js", compiled);
    return run_harness(ctx, command);
}

}  // namespace kata
