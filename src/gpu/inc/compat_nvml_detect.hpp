#ifndef ARBITER_GPU_COMPAT_NVML_DETECT_HPP
#define ARBITER_GPU_COMPAT_NVML_DETECT_HPP
/**
 * @file compat_nvml_detect.hpp
 * @brief Compile-time NVML availability detection.
 *
 * Macros:
 *  - COMPAT_NVML_AVAILABLE         : 1 if NVML is available for this build, else 0
 *  - COMPAT_NVML_HEADER_AVAILABLE  : 1 if <nvml.h> is includable, else 0
 *
 * Notes:
 *  - CMake forces the value when it resolves CUDA::nvml:
 *      -DCOMPAT_NVML_AVAILABLE=1   or   -DCOMPAT_NVML_AVAILABLE=0
 *  - With NVML compiled out the NVML probe reports itself unavailable and the
 *    nvidia-smi probe is the only hardware telemetry source.
 */

#ifndef COMPAT_NVML_AVAILABLE
#if defined(__has_include)
#if __has_include(<nvml.h>)
#define COMPAT_NVML_HEADER_AVAILABLE 1
#else
#define COMPAT_NVML_HEADER_AVAILABLE 0
#endif
#else
#define COMPAT_NVML_HEADER_AVAILABLE 0
#endif

#if COMPAT_NVML_HEADER_AVAILABLE
#define COMPAT_NVML_AVAILABLE 1
#else
#define COMPAT_NVML_AVAILABLE 0
#endif
#else
#ifndef COMPAT_NVML_HEADER_AVAILABLE
#define COMPAT_NVML_HEADER_AVAILABLE COMPAT_NVML_AVAILABLE
#endif
#endif

#if COMPAT_NVML_AVAILABLE
#include <nvml.h>
#endif

#endif // ARBITER_GPU_COMPAT_NVML_DETECT_HPP
