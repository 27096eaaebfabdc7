#include "ssdp/server.hpp"

#include "ssdp/broadcaster.hpp"
#include "ssdp/message.hpp"
#include "ssdp/responder.hpp"
#include "ssdp/search_request.hpp"
#include "ssdp/udp_channel.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <future>
#include <optional>
#include <stdexcept>
#include <system_error>

using namespace std::chrono_literals;

namespace ssdp
{

// How long a receive may block before the dispatch loop checks for shutdown again
static constexpr std::chrono::milliseconds poll_interval = 200ms;

static void dispatch(const interpreted_request& ir, const endpoint& peer, const search_responder& responder)
{
    switch(ir.kind)
    {
    case request_kind::search:
        try {
            responder.respond(parse_search_request(ir.req), peer);
        } catch(const invalid_search_request& e) {
            spdlog::error("Handle search from {}:{} failed: {}", peer.addr, peer.port, e.what());
        }
        break;

    case request_kind::notify:
        spdlog::trace("NOTIFY * from {}:{}", peer.addr, peer.port);
        break;

    case request_kind::unknown:
        spdlog::debug("Unknown SSDP request {} {} from {}:{}", ir.req.get_method(), ir.req.get_path(), peer.addr, peer.port);
        break;

    case request_kind::dropped:
        break;
    }
}

server::server(std::vector<device> devices, server_config conf)
    : m_conf {std::move(conf)},
      m_devices {std::move(devices)}
{}

server& server::server_name(std::string name)
{
    m_conf.server_name = std::move(name);
    return *this;
}

server& server::max_age(uint64_t seconds)
{
    if(seconds == 0 || seconds > max_age_limit)
        throw std::invalid_argument {"max_age must be between 1 and " + std::to_string(max_age_limit) + " seconds"};
    m_conf.max_age = seconds;
    return *this;
}

server& server::extra_header(std::string name, std::string value)
{
    m_conf.extra_headers.emplace_back(std::move(name), std::move(value));
    return *this;
}

server& server::partial_request_workaround(bool enabled)
{
    m_conf.partial_request_workaround = enabled;
    return *this;
}

server& server::announce_interval(std::chrono::milliseconds interval)
{
    m_conf.announce_interval = interval;
    return *this;
}

server& server::max_search_delay(std::chrono::seconds delay)
{
    m_conf.max_search_delay = delay;
    return *this;
}

void server::serve(const std::string& interface_ip)
{
    serve(std::make_shared<udp_channel>(interface_ip));
}

void server::serve(std::shared_ptr<datagram_channel> channel)
{
    if(m_served.exchange(true))
        throw std::logic_error {"SSDP server can only serve once"};

    // Everything below is shared read-only by the broadcast threads and pending search replies
    auto conf = std::make_shared<const server_config>(m_conf);
    auto devices = std::make_shared<const device_registry>(m_devices);
    auto extra_headers = std::make_shared<const std::string>(render_headers(conf->extra_headers));

    broadcaster announcer {conf, devices, extra_headers, channel};
    search_responder responder {conf, devices, extra_headers, channel};

    std::future<void> alive = std::async(std::launch::async, [&announcer, this]() {
        announcer.run_alive_loop(m_shutdown);
    });

    std::future<void> byebye;
    try {
        byebye = std::async(std::launch::async, [&announcer, this]() {
            announcer.run_byebye_on_shutdown(m_shutdown);
        });
    } catch(const std::system_error&) {
        m_shutdown.fire();
        throw;
    }

    spdlog::info("Serving {} device(s)", devices->size());

    std::exception_ptr fatal;
    try {
        while(!m_shutdown.fired())
        {
            std::optional<datagram> dg = channel->receive(max_datagram_size, poll_interval);
            if(!dg)
                continue;

            if(conf->partial_request_workaround && apply_partial_request_workaround(dg->payload, max_datagram_size))
                spdlog::trace("Completed partial request from {}:{}", dg->peer.addr, dg->peer.port);

            dispatch(interpret_datagram(dg->payload), dg->peer, responder);
        }
    } catch(const std::runtime_error& e) {
        spdlog::error("SSDP channel failed: {}", e.what());
        fatal = std::current_exception();
    } catch(...) {
        fatal = std::current_exception();
    }

    // Lets the byebye round finish before handing control back
    m_shutdown.fire();
    alive.get();
    byebye.get();

    spdlog::info("SSDP server stopped");

    if(fatal)
        std::rethrow_exception(fatal);
}

void server::shutdown()
{
    m_shutdown.fire();
}

} // namespace ssdp
