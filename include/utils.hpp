#ifndef SSDPD_UTILS_HPP
#define SSDPD_UTILS_HPP

#include <string>

namespace utils
{

/// IPv4 address of the first interface that is up and not a loopback interface.
/// Throws std::runtime_error if there is none.
std::string get_local_ipaddr();

} // utils

#endif
