#include "itemcrypt/security/MemoryWiper.hpp"

#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <Windows.h>
#elif defined(__linux__) || defined(__FreeBSD__) || defined(__OpenBSD__)
#include <string.h>
#else
#include <cstring>
#endif

namespace itemcrypt::security
{
namespace
{

#if !defined(_WIN32) && !defined(__linux__) && !defined(__FreeBSD__) && !defined(__OpenBSD__)
// The compiler cannot prove what a volatile function pointer targets, so the call survives dead-store elimination.
void* (*const volatile g_wipeMemset)(void*, int, std::size_t){ &std::memset };
#endif

void wipeRange(void* dst, std::size_t count) noexcept
{
#if defined(_WIN32)
    ::SecureZeroMemory(dst, count);
#elif defined(__linux__) || defined(__FreeBSD__) || defined(__OpenBSD__)
    ::explicit_bzero(dst, count);
#else
    (void)g_wipeMemset(dst, 0, count);
#endif
}

} // namespace

void secureWipe(std::span<std::byte> bytes) noexcept
{
    if (!bytes.empty())
    {
        wipeRange(bytes.data(), bytes.size());
    }
}

} // namespace itemcrypt::security
