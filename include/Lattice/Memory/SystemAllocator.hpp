/// @file SystemAllocator.hpp
/// @brief Stateless aligned allocation wrapper used as the upstream of arenas.
#pragma once

#include <cstddef>
#include <cstdlib>

#include <Lattice/Primitives.hpp>

namespace Lattice::Memory
{
    struct SystemAllocator
    {
        [[nodiscard]] static bool IsPowerOfTwo(UIntSize v) noexcept
        {
            return v && ((v & (v - 1)) == 0);
        }

        /// @brief Returns `size` bytes aligned to `alignment`, or nullptr on failure.
        [[nodiscard]] void* Allocate(UIntSize size, UIntSize alignment) noexcept
        {
            if (size == 0)
                return nullptr;
            if (!IsPowerOfTwo(alignment))
                alignment = alignof(std::max_align_t);

#if defined(_WIN32) || defined(_WIN64)
            return _aligned_malloc(size, alignment);
#else
            void* p = nullptr;
            if (alignment < sizeof(void*))
                alignment = sizeof(void*);
            if (posix_memalign(&p, alignment, size) != 0)
                return nullptr;
            return p;
#endif
        }

        void Deallocate(void* ptr) noexcept
        {
            if (!ptr)
                return;
#if defined(_WIN32) || defined(_WIN64)
            _aligned_free(ptr);
#else
            std::free(ptr);
#endif
        }
    };
}// namespace Lattice::Memory
