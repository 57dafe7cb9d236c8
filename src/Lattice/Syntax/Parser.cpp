#include <Lattice/Syntax/Parser.hpp>

#include <Lattice/Syntax/Escapes.hpp>
#include <Lattice/Syntax/NumberText.hpp>
#include <Lattice/Text/Utf8.hpp>

#include <algorithm>
#include <format>
#include <memory>
#include <new>
#include <string>
#include <vector>

namespace Lattice::Syntax
{
    namespace
    {
        using NodeResult = Utilities::Expected<NodeId, ParseError>;
        using VoidResult = Utilities::Expected<void, ParseError>;
        using TreeResult = Utilities::Expected<SyntaxTree, ParseError>;

        struct ParseContext
        {
            std::string_view    source;
            TokenStream&        tokens;
            Grammar             grammar;
            const ParseOptions& options;
            SyntaxTree&         tree;
            Token               current {};
            std::vector<NodeId> scratch {};
            UInt32              depth {0};
            UInt32              maxDepth {ContextStack::Capacity};
        };

        [[nodiscard]] ParseError MakeError(const ParseContext& ctx, ParseErrorCode code, Span span, std::string message)
        {
            ParseError err;
            err.code     = code;
            err.span     = span;
            err.location = Text::LocateOffset(ctx.source, span.start);
            err.message  = std::move(message);
            return err;
        }

        [[nodiscard]] NodeResult NodeError(const ParseContext& ctx, ParseErrorCode code, Span span, std::string message)
        {
            return NodeResult(Utilities::Unexpected<ParseError>(MakeError(ctx, code, span, std::move(message))));
        }

        [[nodiscard]] ParseErrorCode MapLexError(LexErrorCode code) noexcept
        {
            switch (code)
            {
                case LexErrorCode::LeadingZero:
                case LexErrorCode::MalformedNumber:
                    return ParseErrorCode::InvalidNumber;
                case LexErrorCode::InvalidEscape:
                    return ParseErrorCode::InvalidStringEscape;
                case LexErrorCode::InvalidUnicodeEscape:
                    return ParseErrorCode::InvalidUnicodeEscape;
                case LexErrorCode::UnterminatedString:
                case LexErrorCode::UnterminatedComment:
                    return ParseErrorCode::UnexpectedEnd;
                case LexErrorCode::CommentNotAllowed:
                    return ParseErrorCode::CommentNotAllowed;
                case LexErrorCode::NestingTooDeep:
                    return ParseErrorCode::DepthExceeded;
                default:
                    return ParseErrorCode::InvalidToken;
            }
        }

        [[nodiscard]] std::string_view SeparatorText(Grammar grammar) noexcept
        {
            return grammar == Grammar::Zon ? "=" : ":";
        }

        [[nodiscard]] std::string_view CloseText(const ParseContext& ctx, bool object) noexcept
        {
            if (ctx.grammar == Grammar::Zon)
                return "}";
            return object ? "}" : "]";
        }

        [[nodiscard]] bool AllowsComments(const ParseContext& ctx) noexcept
        {
            return ctx.grammar == Grammar::Zon || ctx.options.allowComments;
        }

        [[nodiscard]] bool AllowsTrailingCommas(const ParseContext& ctx) noexcept
        {
            return ctx.grammar == Grammar::Zon || ctx.options.allowTrailingCommas;
        }

        /// @brief Moves to the next significant token; lexical errors fail here.
        VoidResult Advance(ParseContext& ctx)
        {
            while (true)
            {
                auto next = ctx.tokens.Next();
                if (!next)
                {
                    const auto end = static_cast<UInt32>(ctx.source.size());
                    ctx.current    = Token {TokenKind::Eof, Span {end, end}};
                    return {};
                }

                const Token& token = *next;
                if (token.kind == TokenKind::Comment && !AllowsComments(ctx))
                {
                    return VoidResult(Utilities::Unexpected<ParseError>(
                            MakeError(ctx, ParseErrorCode::CommentNotAllowed, token.span, "Comments are not allowed")));
                }
                if (token.IsSkippable())
                    continue;

                if (token.kind == TokenKind::Error)
                {
                    std::string message = token.error == LexErrorCode::NestingTooDeep
                                                  ? std::format("Nesting exceeds maximum depth of {}", ctx.maxDepth)
                                                  : std::string(ToString(token.error));
                    return VoidResult(Utilities::Unexpected<ParseError>(
                            MakeError(ctx, MapLexError(token.error), token.span, std::move(message))));
                }

                ctx.current = token;
                return {};
            }
        }

        [[nodiscard]] NodeResult AddLeaf(ParseContext& ctx, const Node& node)
        {
            const NodeId id = ctx.tree.AddNode(node);
            auto         advanced = Advance(ctx);
            if (!advanced.HasValue())
                return NodeResult(Utilities::Unexpected<ParseError>(std::move(advanced).ErrorUnsafe()));
            return NodeResult(id);
        }

        /// @brief Decoded text for a string-like token, viewing the source when possible.
        [[nodiscard]] Utilities::Expected<std::string_view, ParseError> StringText(ParseContext& ctx, const Token& token)
        {
            using TextResult = Utilities::Expected<std::string_view, ParseError>;

            const std::string_view body     = LiteralBody(token.Text(ctx.source), token);
            const bool             verbatim = !token.Has(TokenFlags::HasEscapes) && !token.Has(TokenFlags::Multiline);
            if (verbatim && !ctx.options.copyStrings)
                return TextResult(body);

            char* out = ctx.tree.GetArena().AllocateChars(DecodedCapacity(body));
            if (!out)
            {
                return TextResult(Utilities::Unexpected<ParseError>(
                        MakeError(ctx, ParseErrorCode::OutOfMemory, token.span, "Arena exhausted while decoding string")));
            }

            UIntSize   written = 0;
            const auto status  = DecodeLiteral(ctx.grammar, body, token, out, written);
            if (status == DecodeStatus::InvalidEscape)
            {
                return TextResult(Utilities::Unexpected<ParseError>(
                        MakeError(ctx, ParseErrorCode::InvalidStringEscape, token.span, "Invalid escape sequence")));
            }
            if (status == DecodeStatus::InvalidUnicodeEscape)
            {
                return TextResult(Utilities::Unexpected<ParseError>(
                        MakeError(ctx, ParseErrorCode::InvalidUnicodeEscape, token.span, "Invalid Unicode escape sequence")));
            }
            return TextResult(std::string_view(out, written));
        }

        NodeResult ParseValue(ParseContext& ctx);

        [[nodiscard]] NodeResult ParseString(ParseContext& ctx)
        {
            const Token token = ctx.current;
            auto        text  = StringText(ctx, token);
            if (!text.HasValue())
                return NodeResult(Utilities::Unexpected<ParseError>(std::move(text).ErrorUnsafe()));

            Node node;
            node.kind = NodeKind::String;
            node.span = token.span;
            node.text = text.ValueUnsafe();
            return AddLeaf(ctx, node);
        }

        [[nodiscard]] NodeResult ParseNumber(ParseContext& ctx)
        {
            const Token            token   = ctx.current;
            const std::string_view literal = token.Text(ctx.source);
            const auto             value   = ParseNumberText(ctx.grammar, literal, token.flags);
            if (!value)
                return NodeError(ctx, ParseErrorCode::InvalidNumber, token.span, std::format("Invalid number '{}'", literal));

            Node node;
            node.kind   = NodeKind::Number;
            node.span   = token.span;
            node.number = *value;
            node.text   = literal;
            if (ctx.options.copyStrings)
            {
                const auto copy = ctx.tree.GetArena().CopyString(literal);
                if (!copy)
                    return NodeError(ctx, ParseErrorCode::OutOfMemory, token.span, "Arena exhausted while copying number");
                node.text = *copy;
            }
            return AddLeaf(ctx, node);
        }

        [[nodiscard]] NodeResult EnterContainer(ParseContext& ctx)
        {
            if (++ctx.depth > ctx.maxDepth)
            {
                return NodeError(ctx, ParseErrorCode::DepthExceeded, ctx.current.span,
                                 std::format("Nesting exceeds maximum depth of {}", ctx.maxDepth));
            }
            return NodeResult(InvalidNodeId);
        }

        [[nodiscard]] NodeResult CloseContainer(ParseContext& ctx, NodeKind kind, UInt32 start, UIntSize mark)
        {
            const std::span<const NodeId> children(ctx.scratch.data() + mark, ctx.scratch.size() - mark);

            Node node;
            node.kind       = kind;
            node.span       = Span {start, ctx.current.span.end};
            node.firstChild = ctx.tree.AddChildren(children);
            node.childCount = static_cast<UInt32>(children.size());
            ctx.scratch.resize(mark);
            --ctx.depth;
            return AddLeaf(ctx, node);
        }

        /// @brief Value in `key = value` / `"key": value` position.
        [[nodiscard]] NodeResult ParseMemberValue(ParseContext& ctx, Span separator)
        {
            const Token& token = ctx.current;
            switch (token.kind)
            {
                case TokenKind::Eof:
                    return NodeError(ctx, ParseErrorCode::UnexpectedEnd, token.span,
                                     std::format("Unexpected end of input after '{}'", SeparatorText(ctx.grammar)));
                case TokenKind::ObjectEnd:
                case TokenKind::ArrayEnd:
                case TokenKind::Comma:
                    return NodeError(ctx, ParseErrorCode::MissingValue, separator,
                                     std::format("Missing value after '{}'", SeparatorText(ctx.grammar)));
                case TokenKind::Colon:
                    return NodeError(ctx, ParseErrorCode::UnexpectedToken, token.span,
                                     std::format("Unexpected '{}' after '{}'", SeparatorText(ctx.grammar), SeparatorText(ctx.grammar)));
                default:
                    return ParseValue(ctx);
            }
        }

        [[nodiscard]] NodeResult ParseObject(ParseContext& ctx)
        {
            const UInt32 start = ctx.current.span.start;
            if (auto entered = EnterContainer(ctx); !entered.HasValue())
                return entered;
            if (auto advanced = Advance(ctx); !advanced.HasValue())
                return NodeResult(Utilities::Unexpected<ParseError>(std::move(advanced).ErrorUnsafe()));

            const UIntSize mark = ctx.scratch.size();
            while (ctx.current.kind != TokenKind::ObjectEnd)
            {
                if (ctx.current.kind == TokenKind::Eof)
                    return NodeError(ctx, ParseErrorCode::UnexpectedEnd, ctx.current.span, "Unterminated object");
                if (ctx.current.kind != TokenKind::PropertyName)
                {
                    return NodeError(ctx, ParseErrorCode::UnexpectedToken, ctx.current.span,
                                     std::format("Expected property name, found {}", ToString(ctx.current.kind)));
                }

                auto key = ParseString(ctx);
                if (!key.HasValue())
                    return key;

                if (ctx.current.kind != TokenKind::Colon)
                {
                    if (ctx.current.kind == TokenKind::Eof)
                        return NodeError(ctx, ParseErrorCode::UnexpectedEnd, ctx.current.span, "Unterminated object");
                    return NodeError(ctx, ParseErrorCode::MissingSeparator, ctx.current.span,
                                     std::format("Expected '{}' after property name", SeparatorText(ctx.grammar)));
                }
                const Span separator = ctx.current.span;
                if (auto advanced = Advance(ctx); !advanced.HasValue())
                    return NodeResult(Utilities::Unexpected<ParseError>(std::move(advanced).ErrorUnsafe()));

                auto value = ParseMemberValue(ctx, separator);
                if (!value.HasValue())
                    return value;

                const NodeId keyId   = key.ValueUnsafe();
                const NodeId valueId = value.ValueUnsafe();
                const NodeId pair[]  = {keyId, valueId};

                Node property;
                property.kind       = NodeKind::Property;
                property.span       = ctx.tree.GetNode(keyId).span.Merge(ctx.tree.GetNode(valueId).span);
                property.firstChild = ctx.tree.AddChildren(pair);
                property.childCount = 2;
                ctx.scratch.push_back(ctx.tree.AddNode(property));

                if (ctx.current.kind == TokenKind::Comma)
                {
                    const Span comma = ctx.current.span;
                    if (auto advanced = Advance(ctx); !advanced.HasValue())
                        return NodeResult(Utilities::Unexpected<ParseError>(std::move(advanced).ErrorUnsafe()));
                    if (ctx.current.kind == TokenKind::ObjectEnd && !AllowsTrailingCommas(ctx))
                        return NodeError(ctx, ParseErrorCode::TrailingComma, comma, "Trailing comma in object");
                    continue;
                }
                if (ctx.current.kind == TokenKind::ObjectEnd)
                    break;
                if (ctx.current.kind == TokenKind::Eof)
                    return NodeError(ctx, ParseErrorCode::UnexpectedEnd, ctx.current.span, "Unterminated object");
                return NodeError(ctx, ParseErrorCode::MissingSeparator, ctx.current.span,
                                 std::format("Expected ',' or '{}' after object member", CloseText(ctx, true)));
            }

            return CloseContainer(ctx, NodeKind::Object, start, mark);
        }

        [[nodiscard]] NodeResult ParseArray(ParseContext& ctx)
        {
            const UInt32 start = ctx.current.span.start;
            if (auto entered = EnterContainer(ctx); !entered.HasValue())
                return entered;
            if (auto advanced = Advance(ctx); !advanced.HasValue())
                return NodeResult(Utilities::Unexpected<ParseError>(std::move(advanced).ErrorUnsafe()));

            const UIntSize mark = ctx.scratch.size();
            while (ctx.current.kind != TokenKind::ArrayEnd)
            {
                if (ctx.current.kind == TokenKind::Eof)
                    return NodeError(ctx, ParseErrorCode::UnexpectedEnd, ctx.current.span, "Unterminated array");

                auto element = ParseValue(ctx);
                if (!element.HasValue())
                    return element;
                ctx.scratch.push_back(element.ValueUnsafe());

                if (ctx.current.kind == TokenKind::Comma)
                {
                    const Span comma = ctx.current.span;
                    if (auto advanced = Advance(ctx); !advanced.HasValue())
                        return NodeResult(Utilities::Unexpected<ParseError>(std::move(advanced).ErrorUnsafe()));
                    if (ctx.current.kind == TokenKind::ArrayEnd && !AllowsTrailingCommas(ctx))
                        return NodeError(ctx, ParseErrorCode::TrailingComma, comma, "Trailing comma in array");
                    continue;
                }
                if (ctx.current.kind == TokenKind::ArrayEnd)
                    break;
                if (ctx.current.kind == TokenKind::Eof)
                    return NodeError(ctx, ParseErrorCode::UnexpectedEnd, ctx.current.span, "Unterminated array");
                return NodeError(ctx, ParseErrorCode::MissingSeparator, ctx.current.span,
                                 std::format("Expected ',' or '{}' after array element", CloseText(ctx, false)));
            }

            return CloseContainer(ctx, NodeKind::Array, start, mark);
        }

        NodeResult ParseValue(ParseContext& ctx)
        {
            const Token& token = ctx.current;
            switch (token.kind)
            {
                case TokenKind::String:
                    return ParseString(ctx);
                case TokenKind::Number:
                    return ParseNumber(ctx);
                case TokenKind::True:
                case TokenKind::False: {
                    Node node;
                    node.kind    = NodeKind::Boolean;
                    node.span    = token.span;
                    node.boolean = token.kind == TokenKind::True;
                    return AddLeaf(ctx, node);
                }
                case TokenKind::Null: {
                    Node node;
                    node.kind = NodeKind::Null;
                    node.span = token.span;
                    return AddLeaf(ctx, node);
                }
                case TokenKind::ObjectStart:
                    return ParseObject(ctx);
                case TokenKind::ArrayStart:
                    return ParseArray(ctx);
                case TokenKind::Eof:
                    return NodeError(ctx, ParseErrorCode::UnexpectedEnd, token.span, "Unexpected end of input");
                default:
                    return NodeError(ctx, ParseErrorCode::UnexpectedToken, token.span,
                                     std::format("Unexpected {} '{}'", ToString(token.kind), token.Text(ctx.source)));
            }
        }

        [[nodiscard]] NodeResult ParseDocument(ParseContext& ctx)
        {
            if (ctx.options.validateUtf8)
            {
                const UIntSize invalid = Text::FindInvalidUtf8(ctx.source);
                if (invalid != ctx.source.size())
                {
                    const auto offset = static_cast<UInt32>(invalid);
                    return NodeError(ctx, ParseErrorCode::InvalidEncoding, Span {offset, offset + 1}, "Invalid UTF-8 sequence");
                }
            }

            if (auto advanced = Advance(ctx); !advanced.HasValue())
                return NodeResult(Utilities::Unexpected<ParseError>(std::move(advanced).ErrorUnsafe()));
            if (ctx.current.kind == TokenKind::Eof)
                return NodeError(ctx, ParseErrorCode::UnexpectedEnd, ctx.current.span, "Empty input");

            auto root = ParseValue(ctx);
            if (!root.HasValue())
                return root;

            if (ctx.current.kind != TokenKind::Eof)
            {
                return NodeError(ctx, ParseErrorCode::TrailingCharacters, ctx.current.span,
                                 "Trailing characters after value");
            }
            return root;
        }

        [[nodiscard]] TreeResult Fail(const ParseOptions& options, ParseError error)
        {
            Logging::Log(options.logger, Logging::LogLevel::Debug, "parse failed: {} at {}:{}: {}", ToString(error.code),
                         error.location.line, error.location.column, error.message);
            return TreeResult(Utilities::Unexpected<ParseError>(std::move(error)));
        }
    }// namespace

    Utilities::Expected<SyntaxTree, ParseError>
    Parser::Parse(std::string_view source, Grammar grammar, const ParseOptions& options)
    {
        LexerOptions lexerOptions;
        lexerOptions.allowComments = options.allowComments;
        TokenStream tokens         = Tokenize(source, grammar, lexerOptions);
        return Parse(source, tokens, grammar, options);
    }

    Utilities::Expected<SyntaxTree, ParseError>
    Parser::Parse(std::string_view source, TokenStream& tokens, Grammar grammar, const ParseOptions& options)
    {
        SyntaxTree   tree(options.arenaChunkBytes, options.arenaLimitBytes);
        ParseContext ctx {source, tokens, grammar, options, tree};
        ctx.maxDepth = std::min(options.maxDepth, ContextStack::Capacity);

        try
        {
            auto root = ParseDocument(ctx);
            if (!root.HasValue())
                return Fail(options, std::move(root).ErrorUnsafe());
            tree.SetRoot(root.ValueUnsafe());
        } catch (const std::bad_alloc&)
        {
            return Fail(options, MakeError(ctx, ParseErrorCode::OutOfMemory, ctx.current.span, "Allocation failed"));
        }

        return TreeResult(std::move(tree));
    }

    Utilities::Expected<SyntaxTree, ParseError>
    Parser::Parse(IO::IByteReader& reader, Grammar grammar, const ParseOptions& options)
    {
        std::unique_ptr<std::string> owned;
        try
        {
            auto contents = IO::ReadAll(reader);
            if (!contents.HasValue())
            {
                ParseError err;
                err.code    = ParseErrorCode::ReadFailed;
                err.message = std::format("Failed to read from reader: {}", contents.ErrorUnsafe().message);
                return Fail(options, std::move(err));
            }
            owned = std::make_unique<std::string>(std::move(contents.ValueUnsafe()));
        } catch (const std::bad_alloc&)
        {
            ParseError err;
            err.code    = ParseErrorCode::OutOfMemory;
            err.message = "Allocation failed while reading input";
            return Fail(options, std::move(err));
        }

        const std::string_view text   = *owned;
        auto                   result = Parse(text, grammar, options);
        if (result.HasValue())
            result.ValueUnsafe().AdoptSource(std::move(owned));
        return result;
    }
}// namespace Lattice::Syntax
