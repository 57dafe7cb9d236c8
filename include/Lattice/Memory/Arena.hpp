/// @file Arena.hpp
/// @brief Growable bump-pointer arena made of linked chunks.
///
/// The arena serves sub-allocations by advancing a bump pointer inside the newest chunk and
/// requests a new chunk from the system allocator when the current one is exhausted.
/// Individual allocations are never freed; all memory is released together by `Reset()` or
/// the destructor. Pointers handed out stay valid when the arena itself is moved.
///
/// ### Typical usage
/// @code
/// Lattice::Memory::Arena arena(4096);
/// char* text = arena.AllocateChars(32);
/// auto  copy = arena.CopyString("hello");
/// @endcode
///
/// The arena is not thread-safe and is meant to be owned by one tree or one pass.
#pragma once

#include <Lattice/Defines.hpp>
#include <Lattice/Memory/SystemAllocator.hpp>
#include <Lattice/Primitives.hpp>

#include <cstddef>
#include <optional>
#include <string_view>

namespace Lattice::Memory
{
    class LATTICE_API Arena
    {
    public:
        static constexpr UIntSize DefaultChunkBytes = 4096;

        /// @brief Position inside the arena that can be restored with `Rollback`.
        struct Marker
        {
            void*    chunk {nullptr};
            UIntSize offset {0};
            UIntSize used {0};
        };

        /// @brief Creates an empty arena; no memory is reserved until the first allocation.
        ///
        /// @param chunkBytes Minimum size of each chunk requested from the system allocator.
        /// @param limitBytes Upper bound on the total chunk bytes reserved (0 means unlimited).
        explicit Arena(UIntSize chunkBytes = DefaultChunkBytes, UIntSize limitBytes = 0) noexcept;

        Arena(const Arena&)            = delete;
        Arena& operator=(const Arena&) = delete;

        Arena(Arena&& other) noexcept;
        Arena& operator=(Arena&& other) noexcept;

        ~Arena();

        /// @brief Allocates `size` bytes aligned to `alignment`.
        ///
        /// @return nullptr when the system allocator fails or the byte limit would be exceeded.
        [[nodiscard]] void* Allocate(UIntSize size, UIntSize alignment = alignof(std::max_align_t)) noexcept;

        [[nodiscard]] char* AllocateChars(UIntSize count) noexcept
        {
            return static_cast<char*>(Allocate(count == 0 ? 1 : count, alignof(char)));
        }

        /// @brief Copies `text` into the arena. Returns nullopt on exhaustion.
        [[nodiscard]] std::optional<std::string_view> CopyString(std::string_view text) noexcept;

        /// @brief Captures the current bump position.
        [[nodiscard]] Marker Mark() const noexcept;

        /// @brief Releases everything allocated after `marker` was taken.
        void Rollback(const Marker& marker) noexcept;

        /// @brief Releases every chunk except the first and rewinds it.
        void Reset() noexcept;

        /// @brief Bytes handed out, including alignment padding.
        [[nodiscard]] UIntSize Used() const noexcept { return m_used; }

        /// @brief Bytes reserved from the system allocator, excluding chunk headers.
        [[nodiscard]] UIntSize Reserved() const noexcept { return m_reserved; }

        [[nodiscard]] UIntSize ChunkCount() const noexcept;

        /// @brief Returns true if `pointer` lies inside one of this arena's chunks.
        [[nodiscard]] bool Owns(const void* pointer) const noexcept;

    private:
        struct Chunk;

        [[nodiscard]] Chunk* AddChunk(UIntSize minimumBytes) noexcept;
        void ReleaseAll() noexcept;

        Chunk*          m_head {nullptr};
        UIntSize        m_chunkBytes {DefaultChunkBytes};
        UIntSize        m_limitBytes {0};
        UIntSize        m_reserved {0};
        UIntSize        m_used {0};
        SystemAllocator m_upstream {};
    };
}// namespace Lattice::Memory
