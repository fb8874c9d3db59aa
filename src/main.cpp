#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <stdexcept>
#include <string>
#include <vector>
#include <getopt.h>

#include "fmt/format.h"

#include "config.hpp"
#include "ssdp_discovery.hpp"
#include "upnp_device.hpp"

enum class action
{
    list,
    play,
    pause,
    stop
};

static void usage(std::FILE* out)
{
    fmt::print(out, "dlna_remote [--list] [-d[evice] <name>] [-t[imeout] <seconds>] [--play <url>] [--pause] [--stop]\n");
}

int main(int argc, char** argv)
{
    enum long_only { opt_list = 256, opt_play, opt_pause, opt_stop };

    static const option long_options[] = {
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 'v'},
        {"device", required_argument, nullptr, 'd'},
        {"timeout", required_argument, nullptr, 't'},
        {"list", no_argument, nullptr, opt_list},
        {"play", required_argument, nullptr, opt_play},
        {"pause", no_argument, nullptr, opt_pause},
        {"stop", no_argument, nullptr, opt_stop},
        {nullptr, 0, nullptr, 0}
    };

    discovery::discover_options options;
    options.timeout = std::chrono::milliseconds {500};
    action act = action::list;
    std::string url;

    int opt;
    while((opt = getopt_long(argc, argv, "hvd:t:", long_options, nullptr)) != -1)
    {
        switch(opt)
        {
            case 'h':
                usage(stdout);
                return EXIT_SUCCESS;
            case 'v':
                fmt::print("{}\n", DLNA_REMOTE_VERSION);
                return EXIT_SUCCESS;
            case 'd':
                options.name = optarg;
                break;
            case 't':
                try {
                    options.timeout = discovery::parse_timeout(optarg);
                } catch(std::invalid_argument& e) {
                    fmt::print(stderr, "{}\n", e.what());
                    usage(stderr);
                    return EXIT_FAILURE;
                }
                break;
            case opt_list:
                act = action::list;
                break;
            case opt_play:
                act = action::play;
                url = optarg;
                break;
            case opt_pause:
                act = action::pause;
                break;
            case opt_stop:
                act = action::stop;
                break;
            default:
                usage(stderr);
                return EXIT_FAILURE;
        }
    }

    std::vector<upnp::upnp_device> devices;
    try {
        devices = discovery::discover(options);
    } catch(std::exception& e) {
        fmt::print(stderr, "Discovery failed: {}\n", e.what());
        return EXIT_FAILURE;
    }

    if(devices.empty())
    {
        fmt::print("No devices found.\n");
        return EXIT_FAILURE;
    }

    if(act == action::list)
    {
        fmt::print("Discovered devices:\n");
        for(const auto& device : devices)
            fmt::print(" {} {}\n", device.has_av_transport() ? '+' : '-', device.to_string());
        return EXIT_SUCCESS;
    }

    const upnp::upnp_device& device = devices.front();
    fmt::print("{}\n", device.to_string());
    try {
        switch(act)
        {
            case action::play:
                device.play(url);
                break;
            case action::pause:
                device.pause();
                break;
            case action::stop:
                device.stop();
                break;
            case action::list:
                break;
        }
    } catch(std::exception& e) {
        fmt::print(stderr, "Command failed: {}\n", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
