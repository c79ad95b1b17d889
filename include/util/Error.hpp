#pragma once
#include <stdexcept>

namespace procstat::util {

// Conditions under which no sampling is meaningful (missing /proc, unreadable
// uptime). Everything else degrades or skips instead of throwing.
struct FatalError : public std::runtime_error { using std::runtime_error::runtime_error; };

} // namespace procstat::util
