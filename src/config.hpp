// config.hpp

#pragma once

#include <pwr/log.hpp>
#include <pwr/tracker.hpp>
#include <pwr/units.hpp>

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace pwrtrack
{
    namespace cfg
    {
        enum class errc : uint32_t;
    }
}

namespace std
{
    template<> struct is_error_code_enum<pwrtrack::cfg::errc> : std::true_type {};
}

namespace pwrtrack
{
    namespace cfg
    {
        enum class errc : uint32_t
        {
            config_io_error = 1,
            config_not_found,
            config_out_of_mem,
            config_bad_format,
            config_no_config,
            invalid_interval,
            invalid_freq,
            invalid_write_interval,
            invalid_log_level,
            invalid_reader,
            invalid_quantity,
            empty_output,
            empty_path,
        };

        struct exception : std::system_error
        {
            using system_error::system_error;
        };

        std::error_code make_error_code(errc) noexcept;
        const std::error_category& config_category() noexcept;

        enum class source
        {
            rapl,
            nvml,
        };

        const char* to_string(source) noexcept;
        std::optional<source> source_from_string(std::string_view);

        struct reader_entry
        {
            source src;
            // empty means the reader's default quantities
            std::vector<pwr::quantity> quantities;
            // powercap directory, RAPL only
            std::optional<std::string> path;
            std::optional<std::string> output;

            explicit reader_entry(source);
        };

        struct config_t
        {
            using duration = pwr::base_tracker::duration;

            const std::optional<duration>& dt_read() const noexcept;
            const std::optional<duration>& dt_write() const noexcept;
            const std::optional<pwr::log::level>& log_level() const noexcept;
            const std::vector<reader_entry>& readers() const noexcept;

            // no configuration file: every value is left to the defaults
            config_t();
            explicit config_t(std::istream&);

        private:
            struct impl;
            std::shared_ptr<const impl> _impl;
        };

        // nullopt unless finite, positive and representable in nanoseconds
        std::optional<config_t::duration> seconds_to_duration(double seconds) noexcept;

        std::ostream& operator<<(std::ostream&, const reader_entry&);
        std::ostream& operator<<(std::ostream&, const config_t&);
    }
}
