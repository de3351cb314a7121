#include "itemcrypt/security/SecureRandom.hpp"
#include <cerrno>
#include <cstddef>
#include <limits>

#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <Windows.h>
#include <bcrypt.h>
#elif defined(__linux__)
#include <sys/random.h>
#else
#error Unsupported platform
#endif

namespace itemcrypt::security
{
namespace
{

#if defined(_WIN32)

[[nodiscard]] bool fillChunk(std::uint8_t* dst, std::size_t count) noexcept
{
    const NTSTATUS status{ ::BCryptGenRandom(nullptr, reinterpret_cast<PUCHAR>(dst), static_cast<ULONG>(count),
                                             BCRYPT_USE_SYSTEM_PREFERRED_RNG) };
    return BCRYPT_SUCCESS(status);
}

constexpr std::size_t g_kMaxChunkBytes{ static_cast<std::size_t>(std::numeric_limits<ULONG>::max()) };

#else

// Returns the number of bytes written, 0 on a retryable interruption, or -1 on failure.
[[nodiscard]] ssize_t fillChunk(std::uint8_t* dst, std::size_t count) noexcept
{
    const ssize_t got{ ::getrandom(dst, count, 0) };
    if (got > 0)
    {
        return got;
    }
    if (got < 0 && errno == EINTR)
    {
        return 0;
    }
    return -1;
}

// getrandom() may return short reads above this size.
constexpr std::size_t g_kMaxChunkBytes{ 32U * 1024U * 1024U };

#endif

} // namespace

bool secureRandomFill(std::span<std::uint8_t> out) noexcept
{
    std::size_t done{};
    while (done < out.size())
    {
        const std::size_t remaining{ out.size() - done };
        const std::size_t chunk{ remaining > g_kMaxChunkBytes ? g_kMaxChunkBytes : remaining };

#if defined(_WIN32)
        if (!fillChunk(out.data() + done, chunk))
        {
            return false;
        }
        done += chunk;
#else
        const ssize_t got{ fillChunk(out.data() + done, chunk) };
        if (got < 0)
        {
            return false;
        }
        if (static_cast<std::size_t>(got) > chunk)
        {
            return false;
        }
        done += static_cast<std::size_t>(got);
#endif
    }
    return true;
}

} // namespace itemcrypt::security
