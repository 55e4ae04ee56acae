// main.cpp

#include "cmdargs.hpp"
#include "config.hpp"
#include "reader_container.hpp"

#include <pwr/error.hpp>
#include <pwr/forced_exit.hpp>
#include <pwr/log.hpp>
#include <pwr/tracker_array.hpp>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>

static void handle_exception()
{
    try
    {
        throw;
    }
    catch (const pwr::exception& e)
    {
        std::cerr << "PWR exception: " << e.what() << "\n";
    }
    catch (const pwrtrack::cfg::exception& e)
    {
        std::cerr << "Config exception: " << e.what() << "\n";
    }
    catch (const std::exception& e)
    {
        std::cerr << "Other exception: " << e.what() << "\n";
    }
    catch (...)
    {
        std::cerr << "Unknown exception\n";
    }
}

int main(int argc, char* argv[])
{
    try
    {
        using namespace pwrtrack;
        using pwr::log;

        std::optional<arguments> args = parse_arguments(argc, argv);
        if (!args)
            return 1;

        cfg::config_t config;
        if (!args->config.empty())
        {
            std::ifstream is(args->config);
            if (!is)
            {
                std::cerr << "error opening config file '" << args->config
                    << "': " << strerror(errno) << "\n";
                return 1;
            }
            config = cfg::config_t(is);
        }

        log::init(args->logargs.quiet, args->logargs.path,
            args->logargs.level.value_or(config.log_level().value_or(log::debug)));

    #ifndef NDEBUG
        {
            std::ostringstream oss;
            oss << *args << "\n" << config;
            log::logline(log::debug, "%s", oss.str().c_str());
        }
    #endif

        pwr::forced_exit::install();

        auto dt_read = args->dt_read ? *args->dt_read
            : config.dt_read().value_or(pwr::base_tracker::default_dt_read);
        auto dt_write = args->dt_write ? *args->dt_write
            : config.dt_write().value_or(pwr::base_tracker::default_dt_write);

        reader_container readers(config, *args);
        std::vector<std::string> outputs = readers.outputs();
        pwr::tracker_array trackers(readers.release_readers(), dt_read, dt_write, outputs);

        log::logline(log::info, "tracking %zu readers every %.3f s; "
            "interrupt to stop", trackers.size(),
            std::chrono::duration<double>(dt_read).count());
        trackers.track_until_forced_exit(dt_write);
        return 0;
    }
    catch (...)
    {
        handle_exception();
        return 1;
    }
}
