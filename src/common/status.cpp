#include "common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace kata {
using namespace std;

struct status_names {
    const char *display;
    const char *key;
};

// clang-format off
static const unordered_map<status, status_names> status_string = boost::assign::map_list_of
    (status::ACCEPTED, status_names{"Accepted", "none"})
    (status::TESTS_FAILED, status_names{"Tests Failed", "tests_failed"})
    (status::TOOLCHAIN_MISSING, status_names{"Toolchain Missing", "toolchain_missing"})
    (status::COMPILATION_ERROR, status_names{"Compilation Error", "compile_error"})
    (status::RUNTIME_ERROR, status_names{"Runtime Error", "runtime_error"})
    (status::TIME_LIMIT_EXCEEDED, status_names{"Time Limit Exceeded", "timeout"})
    (status::HARNESS_PARSE_ERROR, status_names{"Test Harness Parse Error", "harness_parse_error"})
    (status::CANCELLED, status_names{"Cancelled", "cancelled"})
    (status::INTERNAL_ERROR, status_names{"Internal Error", "internal_error"});
// clang-format on

const char *get_display_message(status stat) {
    return status_string.at(stat).display;
}

string to_string(status stat) {
    return status_string.at(stat).key;
}

}  // namespace kata
