#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "exec/adapters.hpp"

namespace kata {
using namespace std;

// clang-format off
const char *JAVASCRIPT_RUNNER = R"JS('use strict';
// Any exit before the run completes is reported as a crash.
process.exitCode = 2;

const fs = require('fs');
const path = require('path');

const REPORT = process.env.KATA_REPORT_FILE || '.kata_report.jsonl';
const appendFileSync = fs.appendFileSync;
let emitted = 0;

function emit(name, passed, message) {
  appendFileSync(REPORT, JSON.stringify({ name, passed, message }) + '\n');
  emitted++;
}

function describeError(e) {
  if (e && e.name === 'AssertionError' && e.message) return e.message;
  if (e instanceof Error) return `${e.name}: ${e.message}`;
  return String(e);
}

let registered = [];
global.test = global.it = (name, fn) => { registered.push([String(name), fn]); };
global.describe = (name, fn) => { fn(); };

async function runFile(file) {
  registered = [];
  let exported;
  try {
    exported = require(path.resolve(file));
  } catch (e) {
    emit(path.basename(file, '.js'), false, `failed to load ${file}: ${describeError(e)}`);
    return 1;
  }

  const tests = registered.slice();
  if (exported && (typeof exported === 'object' || typeof exported === 'function')) {
    for (const [name, fn] of Object.entries(exported)) {
      if (name.startsWith('test') && typeof fn === 'function') tests.push([name, fn]);
    }
  }

  let failed = 0;
  for (const [name, fn] of tests) {
    try {
      await fn();
      emit(name, true, '');
    } catch (e) {
      failed++;
      emit(name, false, describeError(e));
    }
  }
  return failed;
}

(async () => {
  const token = fs.readFileSync('.kata_token', 'utf8').trim();
  fs.unlinkSync('.kata_token');

  let failed = 0;
  for (const file of process.argv.slice(2)) failed += await runFile(file);
  appendFileSync(REPORT, JSON.stringify({ done: true, count: emitted, token }) + '\n');
  process.exitCode = failed ? 1 : 0;
})().catch((e) => {
  console.error(e);
  process.exitCode = 2;
});
)JS";
// clang-format on

javascript_adapter::javascript_adapter(javascript_config config) : config(move(config)) {}

language javascript_adapter::language() const { return kata::language::JAVASCRIPT; }
string javascript_adapter::entry_file() const { return "entry.js"; }
string javascript_adapter::public_tests_file() const { return "tests.js"; }
string javascript_adapter::hidden_tests_file() const { return "hidden_tests.js"; }

harness_output javascript_adapter::execute(const adapter_context &ctx) {
    vector<string> tests = prepare_workspace(ctx);
    write_file_content(ctx.workdir / "kata_runner.js", JAVASCRIPT_RUNNER);

    vector<string> command;
    to_string_list(command, config.node, "kata_runner.js", tests);
    return run_harness(ctx, command);
}

}  // namespace kata
