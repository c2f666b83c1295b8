#include "limits.hpp"
#include <sys/resource.h>
#include <cerrno>

namespace kata {

static int set_rlimit(int resource, rlim_t cur, rlim_t max) {
    struct rlimit lim;
    lim.rlim_cur = cur;
    lim.rlim_max = max;
    if (setrlimit(resource, &lim) != 0) return errno;
    return 0;
}

int set_restrictions(const runguard_options &opt) {
    int err = 0;

    if (opt.cpu_limit > 0) {
        /* Setting the real hard limit one second
           higher: at the soft limit the kernel will send SIGXCPU at
           the hard limit a SIGKILL. The SIGXCPU can be caught, but is
           not by default and gives us a reliable way to detect if the
           CPU-time limit was reached. */
        rlim_t cputime_limit = (rlim_t)opt.cpu_limit;
        if ((err = set_rlimit(RLIMIT_CPU, cputime_limit, cputime_limit + 1))) return err;
    }

    if (opt.file_limit > 0) {
        if ((err = set_rlimit(RLIMIT_FSIZE, opt.file_limit, opt.file_limit))) return err;
    }
    if (opt.nproc > 0) {
        if ((err = set_rlimit(RLIMIT_NPROC, opt.nproc, opt.nproc))) return err;
    }
    if (opt.no_core_dumps) {
        if ((err = set_rlimit(RLIMIT_CORE, 0, 0))) return err;
    }

    return 0;
}

}  // namespace kata
