#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "exec/adapters.hpp"

namespace kata {
using namespace std;

// clang-format off
static const char *PYTHON_RUNNER = R"PY(import importlib
import inspect
import json
import os
import sys

REPORT = os.environ.get("KATA_REPORT_FILE", ".kata_report.jsonl")
TOKEN_FILE = ".kata_token"


def emit(name, passed, message):
    with open(REPORT, "a", encoding="utf-8") as report:
        report.write(json.dumps({"name": name, "passed": passed, "message": message}) + "\n")


def run_module(module_name):
    """Returns the number of failed tests and the number of reported tests."""
    try:
        module = importlib.import_module(module_name)
    except BaseException as e:
        emit(module_name, False, "failed to load %s: %s: %s" % (module_name, type(e).__name__, e))
        return 1, 1

    failed = 0
    reported = 0
    for name, fn in list(vars(module).items()):
        if not name.startswith("test") or not inspect.isfunction(fn) or fn.__module__ != module.__name__:
            continue
        try:
            fn()
            emit(name, True, "")
        except AssertionError as e:
            failed += 1
            emit(name, False, str(e) or "assertion failed")
        except BaseException as e:
            failed += 1
            emit(name, False, "%s: %s" % (type(e).__name__, e))
        reported += 1
    return failed, reported


def main():
    with open(TOKEN_FILE, encoding="utf-8") as f:
        token = f.read().strip()
    os.unlink(TOKEN_FILE)

    sys.path.insert(0, os.getcwd())
    failed = 0
    reported = 0
    for module_name in sys.argv[1:]:
        module_failed, module_reported = run_module(module_name)
        failed += module_failed
        reported += module_reported
    with open(REPORT, "a", encoding="utf-8") as report:
        report.write(json.dumps({"done": True, "count": reported, "token": token}) + "\n")
    sys.stdout.flush()
    sys.exit(1 if failed else 0)


if __name__ == "__main__":
    main()
)PY";
// clang-format on

python_adapter::python_adapter(python_config config) : config(move(config)) {}

language python_adapter::language() const { return kata::language::PYTHON; }
string python_adapter::entry_file() const { return "entry.py"; }
string python_adapter::public_tests_file() const { return "tests.py"; }
string python_adapter::hidden_tests_file() const { return "hidden_tests.py"; }

harness_output python_adapter::execute(const adapter_context &ctx) {
    vector<string> tests = prepare_workspace(ctx);
    write_file_content(ctx.workdir / "kata_runner.py", PYTHON_RUNNER);

    vector<string> modules;
    for (const string &test : tests)
        modules.push_back(filesystem::path(test).stem().string());

    vector<string> command;
    to_string_list(command, config.interpreter, "-B", "kata_runner.py", modules);
    return run_harness(ctx, command,
                       {"PYTHONPATH=" + ctx.workdir.string(), "PYTHONDONTWRITEBYTECODE=1", "PYTHONIOENCODING=utf-8"});
}

}  // namespace kata
