#include <Lattice/Syntax/TokenStream.hpp>

namespace Lattice::Syntax
{
    std::optional<Token> BufferedTokenSource::Next() noexcept
    {
        if (m_finished)
            return std::nullopt;

        if (m_index < m_tokens.size())
        {
            const Token token = m_tokens[m_index++];
            if (token.kind == TokenKind::Eof)
                m_finished = true;
            return token;
        }

        m_finished       = true;
        const UInt32 end = m_tokens.empty() ? 0 : m_tokens.back().span.end;
        return Token {TokenKind::Eof, Span {end, end}};
    }

    std::optional<Token> TokenStream::Next()
    {
        if (m_finished)
            return std::nullopt;

        std::optional<Token> token;
        switch (m_producer.index())
        {
            case 0:
                token = std::get_if<0>(&m_producer)->Next();
                break;
            case 1:
                token = std::get_if<1>(&m_producer)->Next();
                break;
            case 2:
                token = std::get_if<2>(&m_producer)->Next();
                break;
            case 3:
                token = std::get_if<3>(&m_producer)->Next();
                break;
            default:
                Unreachable();
        }

        if (!token || token->kind == TokenKind::Eof)
            m_finished = true;
        return token;
    }

    TokenStream Tokenize(std::string_view source, Grammar grammar, const LexerOptions& options) noexcept
    {
        if (grammar == Grammar::Zon)
            return TokenStream(ZonLexer(source));
        return TokenStream(JsonLexer(source, options));
    }

    std::vector<Token> CollectTokens(TokenStream& stream)
    {
        std::vector<Token> tokens;
        while (auto token = stream.Next())
            tokens.push_back(*token);
        return tokens;
    }
}// namespace Lattice::Syntax
