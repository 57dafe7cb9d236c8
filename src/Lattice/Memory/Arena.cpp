#include <Lattice/Memory/Arena.hpp>

#include <algorithm>
#include <cstring>
#include <limits>
#include <new>
#include <utility>

namespace Lattice::Memory
{
    struct Arena::Chunk
    {
        Chunk*   previous {nullptr};
        UIntSize capacity {0};
        UIntSize offset {0};
    };

    namespace
    {
        constexpr UIntSize kHeaderBytes =
                (sizeof(void*) + 2 * sizeof(UIntSize) + alignof(std::max_align_t) - 1) & ~(alignof(std::max_align_t) - 1);

        [[nodiscard]] std::byte* DataOf(void* chunk) noexcept
        {
            return static_cast<std::byte*>(chunk) + kHeaderBytes;
        }
    }// namespace

    Arena::Arena(UIntSize chunkBytes, UIntSize limitBytes) noexcept
        : m_chunkBytes(chunkBytes == 0 ? DefaultChunkBytes : chunkBytes)
        , m_limitBytes(limitBytes)
    {
    }

    Arena::Arena(Arena&& other) noexcept
        : m_head(std::exchange(other.m_head, nullptr))
        , m_chunkBytes(other.m_chunkBytes)
        , m_limitBytes(other.m_limitBytes)
        , m_reserved(std::exchange(other.m_reserved, 0))
        , m_used(std::exchange(other.m_used, 0))
    {
    }

    Arena& Arena::operator=(Arena&& other) noexcept
    {
        if (this != &other)
        {
            ReleaseAll();
            m_head       = std::exchange(other.m_head, nullptr);
            m_chunkBytes = other.m_chunkBytes;
            m_limitBytes = other.m_limitBytes;
            m_reserved   = std::exchange(other.m_reserved, 0);
            m_used       = std::exchange(other.m_used, 0);
        }
        return *this;
    }

    Arena::~Arena()
    {
        ReleaseAll();
    }

    void* Arena::Allocate(UIntSize size, UIntSize alignment) noexcept
    {
        if (size == 0)
            return nullptr;
        if (!SystemAllocator::IsPowerOfTwo(alignment))
            alignment = alignof(std::max_align_t);
        if (size > std::numeric_limits<UIntSize>::max() - alignment - kHeaderBytes)
            return nullptr;

        const auto bump = [&](Chunk* chunk) -> void* {
            std::byte*      base    = DataOf(chunk);
            const UIntPtr   current = reinterpret_cast<UIntPtr>(base + chunk->offset);
            const UIntPtr   aligned = (current + (alignment - 1)) & ~static_cast<UIntPtr>(alignment - 1);
            const UIntSize  padding = static_cast<UIntSize>(aligned - current);
            if (chunk->offset + padding + size > chunk->capacity)
                return nullptr;
            chunk->offset += padding + size;
            m_used += padding + size;
            return reinterpret_cast<void*>(aligned);
        };

        if (m_head)
        {
            if (void* p = bump(m_head))
                return p;
        }

        Chunk* chunk = AddChunk(size + alignment);
        if (!chunk)
            return nullptr;
        return bump(chunk);
    }

    std::optional<std::string_view> Arena::CopyString(std::string_view text) noexcept
    {
        char* destination = AllocateChars(text.size());
        if (!destination)
            return std::nullopt;
        if (!text.empty())
            std::memcpy(destination, text.data(), text.size());
        return std::string_view {destination, text.size()};
    }

    Arena::Marker Arena::Mark() const noexcept
    {
        if (!m_head)
            return Marker {nullptr, 0, m_used};
        return Marker {m_head, m_head->offset, m_used};
    }

    void Arena::Rollback(const Marker& marker) noexcept
    {
        while (m_head && m_head != marker.chunk)
        {
            Chunk* previous = m_head->previous;
            m_reserved -= m_head->capacity;
            m_upstream.Deallocate(m_head);
            m_head = previous;
        }
        if (m_head)
            m_head->offset = marker.offset;
        m_used = marker.used;
    }

    void Arena::Reset() noexcept
    {
        if (!m_head)
            return;
        while (m_head->previous)
        {
            Chunk* previous = m_head->previous;
            m_reserved -= m_head->capacity;
            m_upstream.Deallocate(m_head);
            m_head = previous;
        }
        m_head->offset = 0;
        m_used         = 0;
    }

    UIntSize Arena::ChunkCount() const noexcept
    {
        UIntSize count = 0;
        for (const Chunk* chunk = m_head; chunk; chunk = chunk->previous)
            ++count;
        return count;
    }

    bool Arena::Owns(const void* pointer) const noexcept
    {
        const auto* p = static_cast<const std::byte*>(pointer);
        for (Chunk* chunk = m_head; chunk; chunk = chunk->previous)
        {
            const std::byte* base = DataOf(chunk);
            if (p >= base && p < base + chunk->capacity)
                return true;
        }
        return false;
    }

    Arena::Chunk* Arena::AddChunk(UIntSize minimumBytes) noexcept
    {
        UIntSize capacity = std::max(m_chunkBytes, minimumBytes);
        if (m_limitBytes != 0)
        {
            if (m_reserved >= m_limitBytes)
                return nullptr;
            capacity = std::min(capacity, m_limitBytes - m_reserved);
            if (capacity < minimumBytes)
                return nullptr;
        }

        void* memory = m_upstream.Allocate(kHeaderBytes + capacity, alignof(std::max_align_t));
        if (!memory)
            return nullptr;

        static_assert(sizeof(Chunk) <= kHeaderBytes);
        auto* chunk = ::new (memory) Chunk {m_head, capacity, 0};
        m_head      = chunk;
        m_reserved += capacity;
        return chunk;
    }

    void Arena::ReleaseAll() noexcept
    {
        while (m_head)
        {
            Chunk* previous = m_head->previous;
            m_upstream.Deallocate(m_head);
            m_head = previous;
        }
        m_reserved = 0;
        m_used     = 0;
    }
}// namespace Lattice::Memory
