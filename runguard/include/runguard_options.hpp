#pragma once

#include <chrono>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace kata {

struct runguard_options {
    std::string work_dir;
    size_t nproc = 0;  // 0 means unlimited

    /* Wall clock limit, measured from the moment the command is started. */
    std::chrono::milliseconds wall_limit{5000};
    /* Time between SIGTERM and SIGKILL when the command is aborted. */
    std::chrono::milliseconds kill_delay{200};
    int cpu_limit = -1;  // CPU seconds, -1 means unlimited

    int64_t file_limit = -1;  // Maximum size of files written by the command, in bytes
    int64_t stream_size = -1;  // Maximum number of captured bytes per stream, -1 means unlimited
    bool no_core_dumps = true;

    std::string stdin_filename;

    bool preserve_sys_env = true;
    std::vector<std::string> env;  // KEY=VALUE pairs

    std::vector<std::string> command;
};

struct runguard_result {
    std::string stdout_data;
    std::string stderr_data;

    /* Set when the command exited normally. */
    std::optional<int> exitcode;
    /* Signal that terminated the command, -1 if none. */
    int signal = -1;

    bool timed_out = false;
    bool cancelled = false;

    bool stdout_truncated = false;
    bool stderr_truncated = false;
    size_t stdout_bytes = 0;
    size_t stderr_bytes = 0;

    /* Non-empty when the command could not be started (e.g. not found). */
    std::string exec_error;

    /* Process id and process group id of the command. */
    int pid = -1;

    double wall_time = 0;  // seconds
};

}  // namespace kata
