#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace kata {
using namespace std;

kata_exception::kata_exception()
    : kata_exception("") {}

kata_exception::kata_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *kata_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const kata_exception &ex) {
    os << boost::diagnostic_information(ex) << endl
       << *ex.stacktrace;
    return os;
}

internal_error::internal_error()
    : kata_exception() {}

internal_error::internal_error(const string &message)
    : kata_exception(message) {}

network_error::network_error(network_failure failure, const string &message)
    : kata_exception(message), kind(failure) {}

network_failure network_error::failure() const noexcept {
    return kind;
}

}  // namespace kata
