#include <atomic>
#include <future>
#include <csignal>
#include <cstdlib>
#include <stdexcept>
#include <unistd.h>

#include "fmt/format.h"

#include <spdlog/spdlog.h>

#include "ssdp/config.hpp"
#include "ssdp/server.hpp"
#include "utils.hpp"

static void block_signals(sigset_t* sigset)
{
    sigemptyset(sigset);
    sigaddset(sigset, SIGINT);
    sigaddset(sigset, SIGTERM);
    pthread_sigmask(SIG_BLOCK, sigset, nullptr);
}

static void setup_logging(const std::string& level)
{
    spdlog::level::level_enum lvl = spdlog::level::from_str(level);
    if(lvl == spdlog::level::off && level != "off")
        throw ssdp::config_error {"Unknown log level " + level};

    spdlog::set_level(lvl);
    spdlog::set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] %v");
}

int main(int argc, char** argv)
{
    if(argc != 2)
    {
        fmt::print(stderr, "Usage: {} <config.json>\n", argv[0]);
        return EXIT_FAILURE;
    }

    ssdp::daemon_config conf;
    try {
        conf = ssdp::load_config(argv[1]);
        setup_logging(conf.log_level);
        if(conf.interface == "auto")
            conf.interface = utils::get_local_ipaddr();
    } catch(const std::runtime_error& e) {
        fmt::print(stderr, "{}\n", e.what());
        return EXIT_FAILURE;
    }

    if(conf.devices.empty())
        spdlog::warn("No devices configured, nothing will be announced");

    // Signals are handled by a dedicated thread, every other thread inherits the blocked mask
    sigset_t sigset;
    block_signals(&sigset);

    ssdp::server srv {std::move(conf.devices), std::move(conf.server)};

    std::atomic<bool> serve_done {false};
    std::future<int> signal_handler = std::async(std::launch::async, [&srv, &sigset, &serve_done]()
    {
        int signum = 0;
        sigwait(&sigset, &signum);
        if(!serve_done.load())
            spdlog::info("Shutting down...");
        srv.shutdown();
        return signum;
    });

    int status = EXIT_SUCCESS;
    try {
        srv.serve(conf.interface);
    } catch(const std::runtime_error& e) {
        spdlog::error("Serving failed: {}", e.what());
        status = EXIT_FAILURE;
    }

    // Release the signal thread if serving ended on its own
    serve_done.store(true);
    if(status != EXIT_SUCCESS)
        kill(getpid(), SIGTERM);

    signal_handler.get();
    return status;
}
