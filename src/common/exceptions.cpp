#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace submitter {
using namespace std;

submitter_exception::submitter_exception()
    : submitter_exception("") {}

submitter_exception::submitter_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *submitter_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const submitter_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

fatal_error::fatal_error()
    : submitter_exception() {}

fatal_error::fatal_error(const string &message)
    : submitter_exception(message) {}

cancelled_error::cancelled_error()
    : fatal_error("cancelled") {}

cancelled_error::cancelled_error(const string &message)
    : fatal_error(message) {}

non_retriable_error::non_retriable_error()
    : submitter_exception() {}

non_retriable_error::non_retriable_error(const string &message)
    : submitter_exception(message) {}

retry_exhausted_error::retry_exhausted_error()
    : submitter_exception() {}

retry_exhausted_error::retry_exhausted_error(const string &message)
    : submitter_exception(message) {}

store_error::store_error()
    : submitter_exception() {}

store_error::store_error(const string &message)
    : submitter_exception(message) {}

}  // namespace submitter
