#include "ssdp/config.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

using nlohmann::json;

namespace ssdp
{

template<typename T>
static T get_or(const json& obj, const char* key, T fallback)
{
    auto it = obj.find(key);
    if(it == obj.end() || it->is_null())
        return fallback;

    try {
        return it->get<T>();
    } catch(json::type_error& e) {
        throw config_error {std::string {"Invalid type for '"} + key + "': " + e.what()};
    }
}

// Non-negative integer in [min, max]. nlohmann converts negative numbers to unsigned types
// without complaint, so the sign is checked on the JSON value itself.
static uint64_t get_unsigned_or(const json& obj, const char* key, uint64_t fallback, uint64_t min, uint64_t max)
{
    auto it = obj.find(key);
    if(it == obj.end() || it->is_null())
        return fallback;

    if(!it->is_number_unsigned())
        throw config_error {std::string {"'"} + key + "' must be a non-negative integer"};

    uint64_t value = it->get<uint64_t>();
    if(value < min || value > max)
        throw config_error {std::string {"'"} + key + "' must be between " + std::to_string(min) + " and " + std::to_string(max)};
    return value;
}

static http::header_list parse_extra_headers(const json& node)
{
    http::header_list headers;

    // Either {"NAME": "value", ...} or [["NAME", "value"], ...] when order matters
    if(node.is_object())
    {
        for(const auto& [name, value] : node.items())
        {
            if(!value.is_string())
                throw config_error {"Extra header '" + name + "' must be a string"};
            headers.emplace_back(name, value.get<std::string>());
        }
    }
    else if(node.is_array())
    {
        for(const auto& entry : node)
        {
            if(!entry.is_array() || entry.size() != 2 || !entry[0].is_string() || !entry[1].is_string())
                throw config_error {"Extra header entries must be [name, value] string pairs"};
            headers.emplace_back(entry[0].get<std::string>(), entry[1].get<std::string>());
        }
    }
    else
    {
        throw config_error {"'extra_headers' must be an object or an array"};
    }

    for(const auto& h : headers)
    {
        if(h.first.empty() || h.first.find_first_of(":\r\n ") != std::string::npos || h.second.find_first_of("\r\n") != std::string::npos)
            throw config_error {"Invalid extra header '" + h.first + "'"};
    }

    return headers;
}

static device parse_device(const json& node)
{
    if(!node.is_object())
        throw config_error {"Device entries must be objects"};

    auto unique_id = get_or<std::string>(node, "unique_id", "");
    if(unique_id.empty())
        throw config_error {"Device entry without 'unique_id'"};

    auto location = get_or<std::string>(node, "location", "");
    if(location.empty())
        throw config_error {"Device '" + unique_id + "' has no 'location'"};

    return device {std::move(unique_id), get_or<std::string>(node, "search_target", ""), std::move(location)};
}

daemon_config parse_config(const std::string& json_text)
{
    json root;
    try {
        root = json::parse(json_text);
    } catch(json::parse_error& e) {
        throw config_error {std::string {"Malformed configuration: "} + e.what()};
    }

    if(!root.is_object())
        throw config_error {"Configuration root must be an object"};

    daemon_config conf;
    conf.interface = get_or<std::string>(root, "interface", conf.interface);
    conf.log_level = get_or<std::string>(root, "log_level", conf.log_level);

    server_config& srv = conf.server;
    srv.server_name = get_or<std::string>(root, "server_name", srv.server_name);
    srv.max_age = get_unsigned_or(root, "max_age", srv.max_age, 1, max_age_limit);
    srv.partial_request_workaround = get_or<bool>(root, "partial_request_workaround", srv.partial_request_workaround);

    uint64_t interval = get_unsigned_or(root, "announce_interval_ms", srv.announce_interval.count(), 0, 60000);
    srv.announce_interval = std::chrono::milliseconds {static_cast<std::chrono::milliseconds::rep>(interval)};

    if(auto it = root.find("extra_headers"); it != root.end())
        srv.extra_headers = parse_extra_headers(*it);

    auto devices = root.find("devices");
    if(devices == root.end() || !devices->is_array())
        throw config_error {"'devices' must be an array"};

    for(const auto& node : *devices)
        conf.devices.push_back(parse_device(node));

    return conf;
}

daemon_config load_config(const std::string& path)
{
    std::ifstream ifs(path);
    if(!ifs.good())
        throw config_error {"Unable to open configuration file " + path};

    std::stringstream sstr;
    sstr << ifs.rdbuf();
    return parse_config(sstr.str());
}

} // namespace ssdp
