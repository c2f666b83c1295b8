#include "exec/dependency_prober.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <regex>
#include "common/stl_utils.hpp"

namespace kata {
using namespace std;

const int MIN_PYTHON_MAJOR = 3, MIN_PYTHON_MINOR = 8;
const int MIN_NODE_MAJOR = 18;

// clang-format off
const char *PYTHON_GUIDE = "Install Python using your package manager: \"sudo apt install python3\" (Ubuntu/Debian) or \"sudo yum install python3\" (RHEL/CentOS)";
const char *NODEJS_GUIDE = "Install Node.js using NodeSource repository or your package manager. See https://nodejs.org/en/download/package-manager/";
const char *TYPESCRIPT_GUIDE = "Install the TypeScript compiler with npm: \"npm install -g typescript\"";
const char *CPP_GUIDE = "Install build-essential: \"sudo apt install build-essential\" (Ubuntu/Debian) or \"sudo yum groupinstall 'Development Tools'\" (RHEL/CentOS)";
// clang-format on

const dependency_status *system_dependencies::missing_toolchain(language lang) const {
    switch (lang) {
        case language::PYTHON:
            return python.available ? nullptr : &python;
        case language::JAVASCRIPT:
            return nodejs.available ? nullptr : &nodejs;
        case language::TYPESCRIPT:
            if (!nodejs.available) return &nodejs;
            return typescript.available ? nullptr : &typescript;
        case language::CPP:
            return cpp.available ? nullptr : &cpp;
    }
    return nullptr;
}

dependency_prober::dependency_prober(sandbox &sb, chrono::milliseconds probe_timeout)
    : sb(sb), probe_timeout(probe_timeout) {}

shared_ptr<const system_dependencies> dependency_prober::probe() {
    if (auto snapshot = atomic_load(&cache)) return snapshot;

    lock_guard<mutex> guard(refresh_mutex);
    // 另一个线程可能已经完成了首次探测
    if (auto snapshot = atomic_load(&cache)) return snapshot;
    auto fresh = make_shared<const system_dependencies>(probe_all());
    atomic_store(&cache, fresh);
    return fresh;
}

shared_ptr<const system_dependencies> dependency_prober::refresh() {
    lock_guard<mutex> guard(refresh_mutex);
    auto fresh = make_shared<const system_dependencies>(probe_all());
    atomic_store(&cache, fresh);
    return fresh;
}

shared_ptr<const system_dependencies> dependency_prober::cached() const {
    return atomic_load(&cache);
}

system_dependencies dependency_prober::probe_all() {
    system_dependencies deps;
    deps.python = probe_python();
    deps.nodejs = probe_nodejs();
    deps.typescript = probe_typescript();
    deps.cpp = probe_cpp();
    deps.all_available = deps.python.available && deps.nodejs.available &&
                         deps.typescript.available && deps.cpp.available;

    for (auto *status : {&deps.python, &deps.nodejs, &deps.typescript, &deps.cpp}) {
        if (status->available)
            LOG(INFO) << status->name << " available: " << status->command << " " << status->version.value_or("");
        else
            LOG(WARNING) << status->name << " unavailable: " << status->error.value_or("unknown error");
    }
    return deps;
}

bool dependency_prober::query(const vector<string> &command, string &output, string &error) {
    runguard_options opt;
    opt.command = command;
    opt.wall_limit = probe_timeout;
    opt.stream_size = 64 * 1024;

    runguard_result result;
    try {
        result = sb.run(opt, nullptr);
    } catch (system_error &ex) {
        error = fmt::format("{}: {}", command[0], ex.what());
        return false;
    }

    output = result.stdout_data + result.stderr_data;
    if (!result.exec_error.empty()) {
        error = fmt::format("{} not found ({})", command[0], result.exec_error);
        return false;
    }
    if (result.timed_out) {
        error = fmt::format("{} did not answer the version query within {}ms", command[0], probe_timeout.count());
        return false;
    }
    if (!result.exitcode || *result.exitcode != 0) {
        error = fmt::format("{} exited with {}", command[0],
                            result.exitcode ? "code " + std::to_string(*result.exitcode) : "signal " + std::to_string(result.signal));
        return false;
    }
    return true;
}

dependency_status dependency_prober::probe_python() {
    static const regex version_regex(R"(Python (\d+)\.(\d+)(\.\d+)?)");

    dependency_status status;
    status.name = "Python";
    string last_error;
    for (const string &command : {"python3", "python"}) {
        string output, error;
        if (!query({command, "--version"}, output, error)) {
            last_error = error;
            continue;
        }

        smatch match;
        if (!regex_search(output, match, version_regex)) {
            last_error = fmt::format("unable to parse Python version from '{}'", trim_copy(output));
            continue;
        }

        int major = boost::lexical_cast<int>(match[1].str());
        int minor = boost::lexical_cast<int>(match[2].str());
        status.version = match[0].str().substr(7);
        status.command = command;
        if (major > MIN_PYTHON_MAJOR || (major == MIN_PYTHON_MAJOR && minor >= MIN_PYTHON_MINOR)) {
            status.available = true;
            return status;
        }
        last_error = fmt::format("Python {}.{}+ is required, found {}", MIN_PYTHON_MAJOR, MIN_PYTHON_MINOR, *status.version);
    }

    status.error = last_error;
    status.installation_guide = PYTHON_GUIDE;
    return status;
}

dependency_status dependency_prober::probe_nodejs() {
    static const regex version_regex(R"(v(\d+)\.(\d+)\.(\d+))");

    dependency_status status;
    status.name = "Node.js";
    string output, error;
    if (query({"node", "--version"}, output, error)) {
        smatch match;
        if (regex_search(output, match, version_regex)) {
            status.version = match[0].str();
            status.command = "node";
            if (boost::lexical_cast<int>(match[1].str()) >= MIN_NODE_MAJOR) {
                status.available = true;
                return status;
            }
            error = fmt::format("Node.js {}+ is required, found {}", MIN_NODE_MAJOR, *status.version);
        } else {
            error = fmt::format("unable to parse Node.js version from '{}'", trim_copy(output));
        }
    }

    status.error = error;
    status.installation_guide = NODEJS_GUIDE;
    return status;
}

dependency_status dependency_prober::probe_typescript() {
    static const regex version_regex(R"(Version (\d+\.\d+(\.\d+)?))");

    dependency_status status;
    status.name = "TypeScript";
    string output, error;
    if (query({"tsc", "--version"}, output, error)) {
        smatch match;
        if (regex_search(output, match, version_regex)) {
            status.version = match[1].str();
            status.command = "tsc";
            status.available = true;
            return status;
        }
        error = fmt::format("unable to parse TypeScript version from '{}'", trim_copy(output));
    }

    status.error = error;
    status.installation_guide = TYPESCRIPT_GUIDE;
    return status;
}

dependency_status dependency_prober::probe_cpp() {
    dependency_status status;
    status.name = "C++ Compiler";
    string last_error;
    for (const string &command : {"g++", "clang++"}) {
        string output, error;
        if (!query({command, "--version"}, output, error)) {
            last_error = error;
            continue;
        }

        // 只保留版本输出的第一行，比如 "g++ (Ubuntu 11.4.0-1ubuntu1~22.04) 11.4.0"
        status.version = trim_copy(output.substr(0, output.find('\n')));
        status.command = command;
        status.available = true;
        return status;
    }

    status.error = last_error;
    status.installation_guide = CPP_GUIDE;
    return status;
}

}  // namespace kata
