#pragma once

#include <cstdint>

namespace warden {
namespace process {

// Platform process identifier widened to a common type.
// Valid identifiers are strictly positive.
using ProcessId = std::int64_t;

// Writable OS handle the child's stdout/stderr are redirected to.
#ifdef _WIN32
using NativeHandle = void *;  // HANDLE
constexpr NativeHandle kInvalidHandle = nullptr;
#else
using NativeHandle = int;  // file descriptor
constexpr NativeHandle kInvalidHandle = -1;
#endif

}  // namespace process
}  // namespace warden
