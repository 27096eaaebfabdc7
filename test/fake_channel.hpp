#ifndef SSDP_TEST_FAKE_CHANNEL_HPP
#define SSDP_TEST_FAKE_CHANNEL_HPP

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "ssdp/channel.hpp"

// In-memory datagram channel: tests push incoming datagrams and inspect what was sent
class fake_channel : public ssdp::datagram_channel
{
public:

    struct sent_datagram
    {
        ssdp::endpoint peer;
        std::string payload;
        std::chrono::steady_clock::time_point at;
    };

    void push(std::string payload, ssdp::endpoint peer)
    {
        {
            std::lock_guard<std::mutex> lock {m_mutex};
            m_incoming.push_back(ssdp::datagram {std::move(payload), std::move(peer)});
        }
        m_cond.notify_all();
    }

    // The next receive throws as if the socket had been closed
    void break_channel()
    {
        {
            std::lock_guard<std::mutex> lock {m_mutex};
            m_broken = true;
        }
        m_cond.notify_all();
    }

    void fail_sends(size_t count)
    {
        std::lock_guard<std::mutex> lock {m_mutex};
        m_failing_sends = count;
    }

    std::optional<ssdp::datagram> receive(size_t max_size, std::chrono::milliseconds timeout) override
    {
        std::unique_lock<std::mutex> lock {m_mutex};
        m_cond.wait_for(lock, timeout, [this]() { return m_broken || !m_incoming.empty(); });

        if(m_broken)
            throw std::runtime_error {"fake channel closed"};
        if(m_incoming.empty())
            return std::nullopt;

        ssdp::datagram dg = std::move(m_incoming.front());
        m_incoming.pop_front();
        if(dg.payload.size() > max_size)
            dg.payload.resize(max_size);
        return dg;
    }

    void send_to(const ssdp::endpoint& peer, std::string_view payload) override
    {
        {
            std::lock_guard<std::mutex> lock {m_mutex};
            if(m_failing_sends > 0)
            {
                --m_failing_sends;
                throw std::runtime_error {"fake send failure"};
            }
            m_sent.push_back(sent_datagram {peer, std::string {payload}, std::chrono::steady_clock::now()});
        }
        m_cond.notify_all();
    }

    std::vector<sent_datagram> sent() const
    {
        std::lock_guard<std::mutex> lock {m_mutex};
        return m_sent;
    }

    std::vector<sent_datagram> sent_to(const std::string& addr) const
    {
        std::vector<sent_datagram> result;
        for(auto& s : sent())
        {
            if(s.peer.addr == addr)
                result.push_back(s);
        }
        return result;
    }

    // Waits until at least count datagrams have been sent to addr
    bool wait_for_sent(const std::string& addr, size_t count, std::chrono::milliseconds timeout)
    {
        std::unique_lock<std::mutex> lock {m_mutex};
        return m_cond.wait_for(lock, timeout, [this, &addr, count]() {
            return static_cast<size_t>(std::count_if(m_sent.begin(), m_sent.end(), [&addr](const sent_datagram& s) {
                return s.peer.addr == addr;
            })) >= count;
        });
    }

private:

    mutable std::mutex m_mutex;

    std::condition_variable m_cond;

    std::deque<ssdp::datagram> m_incoming;

    std::vector<sent_datagram> m_sent;

    size_t m_failing_sends = 0;

    bool m_broken = false;

};

#endif
