//
// Created by usatiynyan.
// Injection points for synchronization primitives.
// Override SL_RX_ATOMIC / SL_RX_MUTEX to run the library under a model checker or a fiber runtime.
//

#pragma once

#ifndef SL_RX_ATOMIC
#include <atomic>
#define SL_RX_ATOMIC std::atomic
#endif // SL_RX_ATOMIC

#ifndef SL_RX_MUTEX
#include <mutex>
#define SL_RX_MUTEX std::mutex
#endif // SL_RX_MUTEX

#if !SL_RX_INTERFERENCE_SIZE && defined(__cpp_lib_hardware_interference_size)
#include <new>
#endif

#include <cstddef>

namespace sl::rx::detail {

template <typename T>
using atomic = SL_RX_ATOMIC<T>;

using mutex = SL_RX_MUTEX;

#if SL_RX_INTERFERENCE_SIZE
constexpr std::size_t cache_line_size = SL_RX_INTERFERENCE_SIZE;
#elif defined(__cpp_lib_hardware_interference_size)
constexpr std::size_t cache_line_size = std::hardware_destructive_interference_size;
#else
constexpr std::size_t cache_line_size = 64;
#endif

} // namespace sl::rx::detail
