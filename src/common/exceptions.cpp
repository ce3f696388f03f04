#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace tci {
using namespace std;

tci_exception::tci_exception()
    : tci_exception("") {}

tci_exception::tci_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *tci_exception::what() const noexcept {
    return message.c_str();
}

const char *tci_exception::kind() const noexcept {
    return "error";
}

std::ostream &operator<<(std::ostream &os, const tci_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

const char *internal_error::kind() const noexcept { return "internal_error"; }
const char *provisioning_error::kind() const noexcept { return "provisioning_error"; }
const char *pool_exhausted::kind() const noexcept { return "pool_exhausted"; }
const char *session_busy::kind() const noexcept { return "session_busy"; }
const char *not_found_error::kind() const noexcept { return "not_found"; }
const char *session_closed::kind() const noexcept { return "session_closed"; }
const char *invalid_transition::kind() const noexcept { return "invalid_transition"; }
const char *invalid_argument_error::kind() const noexcept { return "invalid_argument"; }

state_store_error::state_store_error(const string &message, bool transient)
    : tci_exception(message), transient(transient) {}

const char *state_store_error::kind() const noexcept { return "state_store_error"; }

}  // namespace tci
