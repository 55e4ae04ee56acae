// forced_exit.hpp

#pragma once

namespace pwr::forced_exit {
// SIGINT, SIGTERM and SIGUSR1 request an exit instead of terminating
void install();

bool requested() noexcept;
void request() noexcept;
void reset() noexcept;
} // namespace pwr::forced_exit
