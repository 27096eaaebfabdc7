#include "ssdp/device.hpp"

#include "http/request.hpp"

#include <algorithm>

namespace ssdp
{

std::string make_usn(std::string_view unique_id, std::string_view search_target)
{
    std::string usn {unique_id};
    if(!search_target.empty())
        (usn += "::") += search_target;
    return usn;
}

device::device(std::string id, std::string st, std::string loc)
    : unique_id {std::move(id)},
      search_target {std::move(st)},
      usn {make_usn(unique_id, search_target)},
      location {std::move(loc)}
{}

const device* device_registry::find_by_target(std::string_view st) const
{
    // Registries hold a handful of entries so a linear scan is all we need
    auto it = std::find_if(m_devices.begin(), m_devices.end(), [st](const device& d) {
        return http::iequals(d.search_target, st);
    });

    return (it != m_devices.end()) ? &(*it) : nullptr;
}

} // namespace ssdp
