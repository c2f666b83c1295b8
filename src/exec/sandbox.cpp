#include "exec/sandbox.hpp"
#include <boost/algorithm/string/join.hpp>
#include <glog/logging.h>
#include "run.hpp"

namespace kata {

sandbox::~sandbox() {}

runguard_result process_sandbox::run(const runguard_options &opt, const cancellation_token *cancel) {
    DLOG(INFO) << "run [" << boost::algorithm::join(opt.command, " ") << "] in " << opt.work_dir
               << ", wall limit " << opt.wall_limit.count() << "ms";
    return runit(opt, cancel);
}

}  // namespace kata
