#ifndef SSDP_DEVICE_HPP
#define SSDP_DEVICE_HPP

#include <string>
#include <string_view>
#include <vector>
#include <utility>

namespace ssdp
{

// A logical entity advertised on the network
struct device
{
    device(std::string unique_id, std::string search_target, std::string location);

    std::string unique_id;
    std::string search_target;   // ST in searches, NT in notifications
    std::string usn;             // unique_id::search_target or unique_id alone
    std::string location;        // URL of the device description
};

std::string make_usn(std::string_view unique_id, std::string_view search_target);

class device_registry
{
public:

    using const_iterator = std::vector<device>::const_iterator;

    device_registry() = default;

    explicit device_registry(std::vector<device> devices)
        : m_devices {std::move(devices)}
    {}

    /// First device in registration order whose search target equals st, ignoring ASCII case.
    /// Returns nullptr if no device matches.
    const device* find_by_target(std::string_view st) const;

    const_iterator begin() const { return m_devices.begin(); }

    const_iterator end() const { return m_devices.end(); }

    size_t size() const { return m_devices.size(); }

    bool empty() const { return m_devices.empty(); }

private:

    std::vector<device> m_devices;

};

} // namespace ssdp

#endif
