// cmdargs.hpp

#pragma once

#include "config.hpp"

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace pwrtrack
{
    struct log_args
    {
        bool quiet;
        std::string path;
        std::optional<pwr::log::level> level;
    };

    struct arguments
    {
        using duration = pwr::base_tracker::duration;

        std::string config;
        std::optional<duration> dt_read;
        std::optional<duration> dt_write;
        std::string id;
        std::vector<cfg::source> readers;
        log_args logargs;
    };

    std::ostream& operator<<(std::ostream& os, const arguments& a);

    std::optional<arguments> parse_arguments(int argc, char* const argv[]);
}
