#ifndef INCLUDE_ITEMCRYPT_SECURITY_ZEROALLOCATOR_HPP
#define INCLUDE_ITEMCRYPT_SECURITY_ZEROALLOCATOR_HPP

#include "itemcrypt/security/MemoryWiper.hpp"
#include <cstddef>
#include <limits>
#include <new>
#include <span>
#include <type_traits>

namespace itemcrypt::security
{

// Allocator that wipes each block before handing it back to the heap.
// Containers using it leave no copy of key material behind on reallocation or destruction.
template <class T> struct ZeroAllocator
{
    using value_type = T;
    using is_always_equal = std::true_type;
    using propagate_on_container_move_assignment = std::true_type;
    using propagate_on_container_swap = std::true_type;

    ZeroAllocator() noexcept = default;

    template <class U> constexpr explicit ZeroAllocator([[maybe_unused]] const ZeroAllocator<U>& other) noexcept
    {
    }

    [[nodiscard]] T* allocate(std::size_t count)
    {
        if (count == 0U)
        {
            return nullptr;
        }
        if (count > (std::numeric_limits<std::size_t>::max() / sizeof(T)))
        {
            throw std::bad_array_new_length{};
        }
        return static_cast<T*>(::operator new(count * sizeof(T), std::align_val_t{ alignof(T) }));
    }

    void deallocate(T* block, std::size_t count) noexcept
    {
        if (block == nullptr)
        {
            return;
        }
        if (count != 0U)
        {
            secureWipe(std::span<std::byte>{ reinterpret_cast<std::byte*>(block), count * sizeof(T) });
        }
        ::operator delete(block, std::align_val_t{ alignof(T) });
    }
};

template <class T, class U>
constexpr bool operator==([[maybe_unused]] const ZeroAllocator<T>& lhs,
                          [[maybe_unused]] const ZeroAllocator<U>& rhs) noexcept
{
    return true;
}

} // namespace itemcrypt::security

#endif // INCLUDE_ITEMCRYPT_SECURITY_ZEROALLOCATOR_HPP
