#pragma once

#if defined(PWR_GPU_NV)
#include <nvml.h>
#endif // defined(PWR_GPU_NV)

namespace pwr {
#if defined(PWR_GPU_NV)
using gpu_handle = nvmlDevice_t;
#else
using gpu_handle = void *;
#endif // defined(PWR_GPU_NV)
} // namespace pwr
