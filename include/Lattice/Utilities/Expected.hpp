/// @file Expected.hpp
/// @brief `Lattice::Utilities::Expected<T, E>`: an inline "value or error" return type.
#pragma once

#include <Lattice/Defines.hpp>
#include <Lattice/Primitives.hpp>

#include <memory>
#include <type_traits>
#include <utility>

namespace Lattice::Utilities
{
    /// @brief Tag used to select in-place construction of a specific alternative.
    template <class T>
    struct InPlaceType
    {
        explicit constexpr InPlaceType() noexcept { }
    };

    /// @brief Wrapper used to explicitly construct an error value for `Expected<T, E>`.
    ///
    /// @tparam E Error type.
    template <class E>
    class Unexpected
    {
    public:
        using ErrorType = E;

        constexpr explicit Unexpected(const E& error) noexcept(std::is_nothrow_copy_constructible_v<E>)
            requires(std::is_copy_constructible_v<E>)
            : m_error {error}
        {
        }

        constexpr explicit Unexpected(E&& error) noexcept(std::is_nothrow_move_constructible_v<E>)
            requires(std::is_move_constructible_v<E>)
            : m_error {std::move(error)}
        {
        }

        [[nodiscard]] constexpr E& Error() & noexcept { return m_error; }
        [[nodiscard]] constexpr const E& Error() const& noexcept { return m_error; }
        [[nodiscard]] constexpr E&& Error() && noexcept { return std::move(m_error); }

    private:
        E m_error;
    };

    /// @brief Holds either a `T` or an `E`, never both and never neither.
    ///
    /// Checked accessors (`Value`, `Error`) abort on misuse; `ValueUnsafe`/`ErrorUnsafe`
    /// skip the check.
    ///
    /// @tparam T Value type.
    /// @tparam E Error type.
    template <class T, class E>
    class [[nodiscard]] Expected
    {
        static_assert(!std::is_reference_v<T>, "Expected<T&,...> is not supported.");
        static_assert(!std::is_reference_v<E>, "Expected<...,E&> is not supported.");

    public:
        using ValueType = T;
        using ErrorType = E;

        template <class... Args>
        constexpr explicit Expected(InPlaceType<T>, Args&&... args)
            noexcept(std::is_nothrow_constructible_v<T, Args...>)
            requires(std::is_constructible_v<T, Args...>)
            : m_hasValue {true}
        {
            std::construct_at(std::addressof(m_value), std::forward<Args>(args)...);
        }

        constexpr explicit Expected(const T& value) noexcept(std::is_nothrow_copy_constructible_v<T>)
            requires(std::is_copy_constructible_v<T>)
            : m_hasValue {true}
        {
            std::construct_at(std::addressof(m_value), value);
        }

        constexpr explicit Expected(T&& value) noexcept(std::is_nothrow_move_constructible_v<T>)
            requires(std::is_move_constructible_v<T>)
            : m_hasValue {true}
        {
            std::construct_at(std::addressof(m_value), std::move(value));
        }

        constexpr explicit Expected(Unexpected<E>&& unexpected) noexcept(std::is_nothrow_move_constructible_v<E>)
            : m_hasValue {false}
        {
            std::construct_at(std::addressof(m_error), std::move(unexpected).Error());
        }

        template <class... Args>
        constexpr explicit Expected(InPlaceType<E>, Args&&... args)
            noexcept(std::is_nothrow_constructible_v<E, Args...>)
            requires(!std::is_same_v<T, E> && std::is_constructible_v<E, Args...>)
            : m_hasValue {false}
        {
            std::construct_at(std::addressof(m_error), std::forward<Args>(args)...);
        }

        constexpr Expected(const Expected& other)
            requires(std::is_copy_constructible_v<T> && std::is_copy_constructible_v<E>)
            : m_hasValue {other.m_hasValue}
        {
            if (m_hasValue)
                std::construct_at(std::addressof(m_value), other.m_value);
            else
                std::construct_at(std::addressof(m_error), other.m_error);
        }

        constexpr Expected(Expected&& other) noexcept(std::is_nothrow_move_constructible_v<T> && std::is_nothrow_move_constructible_v<E>)
            : m_hasValue {other.m_hasValue}
        {
            if (m_hasValue)
                std::construct_at(std::addressof(m_value), std::move(other.m_value));
            else
                std::construct_at(std::addressof(m_error), std::move(other.m_error));
        }

        constexpr Expected& operator=(const Expected& other)
            requires(std::is_copy_constructible_v<T> && std::is_copy_constructible_v<E>)
        {
            if (this != &other)
            {
                DestroyActive();
                m_hasValue = other.m_hasValue;
                if (m_hasValue)
                    std::construct_at(std::addressof(m_value), other.m_value);
                else
                    std::construct_at(std::addressof(m_error), other.m_error);
            }
            return *this;
        }

        constexpr Expected& operator=(Expected&& other) noexcept(std::is_nothrow_move_constructible_v<T> && std::is_nothrow_move_constructible_v<E>)
        {
            if (this != &other)
            {
                DestroyActive();
                m_hasValue = other.m_hasValue;
                if (m_hasValue)
                    std::construct_at(std::addressof(m_value), std::move(other.m_value));
                else
                    std::construct_at(std::addressof(m_error), std::move(other.m_error));
            }
            return *this;
        }

        constexpr ~Expected() { DestroyActive(); }

        /// @brief Returns true if this object currently holds a value.
        [[nodiscard]] constexpr bool HasValue() const noexcept { return m_hasValue; }

        /// @brief Returns true if this object currently holds a value.
        constexpr explicit operator bool() const noexcept { return HasValue(); }

        /// @brief Returns the contained value; aborts when holding an error.
        [[nodiscard]] constexpr T& Value() & noexcept
        {
            if (LATTICE_UNLIKELY(!m_hasValue))
                LATTICE_ABORT("Expected::Value called when holding error");
            return m_value;
        }

        [[nodiscard]] constexpr const T& Value() const& noexcept
        {
            if (LATTICE_UNLIKELY(!m_hasValue))
                LATTICE_ABORT("Expected::Value called when holding error");
            return m_value;
        }

        [[nodiscard]] constexpr T&& Value() && noexcept
        {
            if (LATTICE_UNLIKELY(!m_hasValue))
                LATTICE_ABORT("Expected::Value called when holding error");
            return std::move(m_value);
        }

        /// @brief Returns the contained error; aborts when holding a value.
        [[nodiscard]] constexpr E& Error() & noexcept
        {
            if (LATTICE_UNLIKELY(m_hasValue))
                LATTICE_ABORT("Expected::Error called when holding value");
            return m_error;
        }

        [[nodiscard]] constexpr const E& Error() const& noexcept
        {
            if (LATTICE_UNLIKELY(m_hasValue))
                LATTICE_ABORT("Expected::Error called when holding value");
            return m_error;
        }

        [[nodiscard]] constexpr E&& Error() && noexcept
        {
            if (LATTICE_UNLIKELY(m_hasValue))
                LATTICE_ABORT("Expected::Error called when holding value");
            return std::move(m_error);
        }

        /// @warning Undefined behavior if holding an error.
        [[nodiscard]] constexpr T& ValueUnsafe() & noexcept { return m_value; }
        [[nodiscard]] constexpr const T& ValueUnsafe() const& noexcept { return m_value; }
        [[nodiscard]] constexpr T&& ValueUnsafe() && noexcept { return std::move(m_value); }

        /// @warning Undefined behavior if holding a value.
        [[nodiscard]] constexpr E& ErrorUnsafe() & noexcept { return m_error; }
        [[nodiscard]] constexpr const E& ErrorUnsafe() const& noexcept { return m_error; }
        [[nodiscard]] constexpr E&& ErrorUnsafe() && noexcept { return std::move(m_error); }

        /// @brief Returns the contained value if present, otherwise returns `fallback`.
        [[nodiscard]] constexpr const T& ValueOr(const T& fallback) const& noexcept
        {
            return m_hasValue ? m_value : fallback;
        }

        [[nodiscard]] constexpr T ValueOr(T fallback) && noexcept(std::is_nothrow_move_constructible_v<T>)
        {
            return m_hasValue ? std::move(m_value) : std::move(fallback);
        }

    private:
        constexpr void DestroyActive() noexcept
        {
            if (m_hasValue)
            {
                if constexpr (!std::is_trivially_destructible_v<T>)
                    std::destroy_at(std::addressof(m_value));
            }
            else
            {
                if constexpr (!std::is_trivially_destructible_v<E>)
                    std::destroy_at(std::addressof(m_error));
            }
        }

        union
        {
            T m_value;
            E m_error;
        };
        bool m_hasValue {false};
    };

    /// @brief Specialization for "success or error" without a value payload.
    template <class E>
    class [[nodiscard]] Expected<void, E>
    {
        static_assert(!std::is_reference_v<E>, "Expected<void,E&> is not supported.");

    public:
        using ValueType = void;
        using ErrorType = E;

        /// @brief Constructs a success state.
        constexpr Expected() noexcept
            : m_empty {}
            , m_hasValue {true}
        {
        }

        constexpr explicit Expected(Unexpected<E>&& unexpected) noexcept(std::is_nothrow_move_constructible_v<E>)
            : m_hasValue {false}
        {
            std::construct_at(std::addressof(m_error), std::move(unexpected).Error());
        }

        constexpr Expected(const Expected& other)
            requires(std::is_copy_constructible_v<E>)
            : m_empty {}
            , m_hasValue {other.m_hasValue}
        {
            if (!m_hasValue)
                std::construct_at(std::addressof(m_error), other.m_error);
        }

        constexpr Expected(Expected&& other) noexcept(std::is_nothrow_move_constructible_v<E>)
            : m_empty {}
            , m_hasValue {other.m_hasValue}
        {
            if (!m_hasValue)
                std::construct_at(std::addressof(m_error), std::move(other.m_error));
        }

        constexpr Expected& operator=(Expected&& other) noexcept(std::is_nothrow_move_constructible_v<E>)
        {
            if (this != &other)
            {
                DestroyActive();
                m_hasValue = other.m_hasValue;
                if (!m_hasValue)
                    std::construct_at(std::addressof(m_error), std::move(other.m_error));
            }
            return *this;
        }

        constexpr ~Expected() { DestroyActive(); }

        [[nodiscard]] constexpr bool HasValue() const noexcept { return m_hasValue; }
        constexpr explicit operator bool() const noexcept { return HasValue(); }

        [[nodiscard]] constexpr const E& Error() const& noexcept
        {
            if (LATTICE_UNLIKELY(m_hasValue))
                LATTICE_ABORT("Expected::Error called when holding value");
            return m_error;
        }

        [[nodiscard]] constexpr E&& Error() && noexcept
        {
            if (LATTICE_UNLIKELY(m_hasValue))
                LATTICE_ABORT("Expected::Error called when holding value");
            return std::move(m_error);
        }

        /// @warning Undefined behavior if holding a value.
        [[nodiscard]] constexpr const E& ErrorUnsafe() const& noexcept { return m_error; }
        [[nodiscard]] constexpr E&& ErrorUnsafe() && noexcept { return std::move(m_error); }

    private:
        constexpr void DestroyActive() noexcept
        {
            if (!m_hasValue)
            {
                if constexpr (!std::is_trivially_destructible_v<E>)
                    std::destroy_at(std::addressof(m_error));
            }
        }

        union
        {
            char m_empty;
            E    m_error;
        };
        bool m_hasValue {true};
    };
}// namespace Lattice::Utilities
