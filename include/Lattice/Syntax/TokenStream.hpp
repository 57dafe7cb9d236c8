/// @file TokenStream.hpp
/// @brief Pull-based token producers behind one `Next()` operation.
///
/// Two dispatch strategies share the same observable behavior:
/// - direct: the built-in lexers and `BufferedTokenSource` live inside a closed `std::variant`
///   and are called without indirection;
/// - dynamic: `TokenSource` erases any producer behind a handle and a static operation table.
///
/// ### Typical usage
/// @code
/// auto stream = Lattice::Syntax::Tokenize(text, Lattice::Syntax::Grammar::Json);
/// while (auto token = stream.Next())
///     Consume(*token);
/// @endcode
#pragma once

#include <Lattice/Defines.hpp>
#include <Lattice/Primitives.hpp>
#include <Lattice/Syntax/Grammar.hpp>
#include <Lattice/Syntax/JsonLexer.hpp>
#include <Lattice/Syntax/Token.hpp>
#include <Lattice/Syntax/ZonLexer.hpp>

#include <concepts>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace Lattice::Syntax
{
    /// @brief Anything with `std::optional<Token> Next()`.
    template<typename T>
    concept TokenProducer = requires(T& producer) {
        { producer.Next() } -> std::same_as<std::optional<Token>>;
    };

    /// @brief Type-erased token producer: an opaque handle plus a static operation table.
    ///
    /// Created with `From` (borrows a producer that must outlive the source) or `Own`
    /// (takes ownership and destroys the producer on release).
    class LATTICE_API TokenSource final
    {
    public:
        using NextFn    = std::optional<Token> (*)(void*);
        using DestroyFn = void (*)(void*) noexcept;

        struct Operations
        {
            NextFn    next {nullptr};
            DestroyFn destroy {nullptr};
        };

        TokenSource() noexcept = default;

        TokenSource(void* handle, const Operations* operations) noexcept
            : m_handle(handle)
            , m_operations(operations)
        {
        }

        TokenSource(const TokenSource&)            = delete;
        TokenSource& operator=(const TokenSource&) = delete;

        TokenSource(TokenSource&& other) noexcept
            : m_handle(std::exchange(other.m_handle, nullptr))
            , m_operations(std::exchange(other.m_operations, nullptr))
        {
        }

        TokenSource& operator=(TokenSource&& other) noexcept
        {
            if (this != &other)
            {
                Release();
                m_handle     = std::exchange(other.m_handle, nullptr);
                m_operations = std::exchange(other.m_operations, nullptr);
            }
            return *this;
        }

        ~TokenSource() { Release(); }

        template<TokenProducer TProducer>
        [[nodiscard]] static TokenSource From(TProducer& producer) noexcept
        {
            static constexpr Operations operations {
                    +[](void* self) -> std::optional<Token> { return static_cast<TProducer*>(self)->Next(); },
                    nullptr,
            };
            return TokenSource(&producer, &operations);
        }

        template<TokenProducer TProducer>
        [[nodiscard]] static TokenSource Own(std::unique_ptr<TProducer> producer) noexcept
        {
            static constexpr Operations operations {
                    +[](void* self) -> std::optional<Token> { return static_cast<TProducer*>(self)->Next(); },
                    +[](void* self) noexcept { delete static_cast<TProducer*>(self); },
            };
            return TokenSource(producer.release(), &operations);
        }

        [[nodiscard]] bool IsValid() const noexcept { return m_handle != nullptr && m_operations != nullptr; }

        [[nodiscard]] std::optional<Token> Next()
        {
            if (!IsValid())
                return std::nullopt;
            return m_operations->next(m_handle);
        }

    private:
        void Release() noexcept
        {
            if (m_operations && m_operations->destroy && m_handle)
                m_operations->destroy(m_handle);
            m_handle     = nullptr;
            m_operations = nullptr;
        }

        void*             m_handle {nullptr};
        const Operations* m_operations {nullptr};
    };

    /// @brief Replays a caller-owned run of tokens.
    ///
    /// An `Eof` positioned at the end of the last token is synthesized when the run does not
    /// end with one.
    class LATTICE_API BufferedTokenSource
    {
    public:
        explicit BufferedTokenSource(std::span<const Token> tokens) noexcept
            : m_tokens(tokens)
        {
        }

        [[nodiscard]] std::optional<Token> Next() noexcept;

        [[nodiscard]] UIntSize Position() const noexcept { return m_index; }

    private:
        std::span<const Token> m_tokens;
        UIntSize               m_index {0};
        bool                   m_finished {false};
    };

    /// @brief Single-pass token stream; yields `Eof` once, then nullopt forever.
    class LATTICE_API TokenStream
    {
    public:
        using Storage = std::variant<JsonLexer, ZonLexer, BufferedTokenSource, TokenSource>;

        explicit TokenStream(JsonLexer lexer) noexcept
            : m_producer(std::in_place_index<0>, lexer)
        {
        }

        explicit TokenStream(ZonLexer lexer) noexcept
            : m_producer(std::in_place_index<1>, lexer)
        {
        }

        explicit TokenStream(BufferedTokenSource buffered) noexcept
            : m_producer(std::in_place_index<2>, buffered)
        {
        }

        explicit TokenStream(TokenSource source) noexcept
            : m_producer(std::in_place_index<3>, std::move(source))
        {
        }

        [[nodiscard]] std::optional<Token> Next();

        /// @brief True when tokens come through the type-erased `TokenSource`.
        [[nodiscard]] bool IsDynamic() const noexcept { return m_producer.index() == 3; }

    private:
        Storage m_producer;
        bool    m_finished {false};
    };

    /// @brief Creates the direct stream for `grammar`. Never fails; problems surface as `Error` tokens.
    [[nodiscard]] LATTICE_API TokenStream Tokenize(std::string_view source, Grammar grammar, const LexerOptions& options = {}) noexcept;

    /// @brief Drains `stream`, including the final `Eof`.
    [[nodiscard]] LATTICE_API std::vector<Token> CollectTokens(TokenStream& stream);
}// namespace Lattice::Syntax
