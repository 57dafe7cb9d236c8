#include <Lattice/Lint/Linter.hpp>

#include <Lattice/Analysis/ZonManifest.hpp>
#include <Lattice/Syntax/Escapes.hpp>
#include <Lattice/Syntax/Identifier.hpp>
#include <Lattice/Syntax/NumberText.hpp>
#include <Lattice/Text/Utf8.hpp>

#include <algorithm>
#include <cmath>
#include <format>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace Lattice::Lint
{
    namespace
    {
        using Syntax::Grammar;
        using Syntax::LexErrorCode;
        using Syntax::Token;
        using Syntax::TokenKind;
        namespace TokenFlags = Syntax::TokenFlags;
        using Text::Span;

        /// @brief A root-object member, kept for the build manifest checks.
        struct RootField
        {
            std::string                     name;
            Span                            key;
            Span                            value;
            std::optional<Syntax::NodeKind> kind;
            UIntSize                        childCount {0};
        };

        [[nodiscard]] std::optional<Syntax::NodeKind> ValueKind(TokenKind kind) noexcept
        {
            switch (kind)
            {
                case TokenKind::String:
                    return Syntax::NodeKind::String;
                case TokenKind::Number:
                    return Syntax::NodeKind::Number;
                case TokenKind::True:
                case TokenKind::False:
                    return Syntax::NodeKind::Boolean;
                case TokenKind::Null:
                    return Syntax::NodeKind::Null;
                case TokenKind::ObjectStart:
                    return Syntax::NodeKind::Object;
                case TokenKind::ArrayStart:
                    return Syntax::NodeKind::Array;
                default:
                    return std::nullopt;
            }
        }

        class LintPass
        {
        public:
            LintPass(std::string_view          source,
                     Syntax::TokenStream&      tokens,
                     Grammar                   grammar,
                     const EnabledRules&       rules,
                     const LinterOptions&      options,
                     std::vector<Diagnostic>&  diagnostics) noexcept
                : m_source(source)
                , m_tokens(tokens)
                , m_grammar(grammar)
                , m_rules(rules)
                , m_options(options)
                , m_diagnostics(diagnostics)
                , m_maxDepth(std::min(options.maxDepth, Syntax::ContextStack::Capacity))
            {
            }

            void Run()
            {
                Advance();
                if (m_current.kind == TokenKind::Eof)
                {
                    Report(RuleType::SyntaxError, "Empty input", m_current.span);
                    return;
                }

                LintValue();
                if (m_stopped)
                    return;

                if (m_current.kind != TokenKind::Eof)
                    Report(RuleType::SyntaxError, "Unexpected content after root value", m_current.span);
            }

        private:
            [[nodiscard]] bool Enabled(RuleType rule) const noexcept { return m_rules.Contains(rule); }

            void Report(RuleType rule, std::string message, Span range)
            {
                if (!Enabled(rule))
                    return;
                m_diagnostics.push_back(Diagnostic {rule, std::move(message), GetRuleInfo(rule).severity, range});
            }

            [[nodiscard]] bool AllowsComments() const noexcept
            {
                return m_grammar == Grammar::Zon || m_options.allowComments;
            }

            [[nodiscard]] std::string_view CloseText(bool object) const noexcept
            {
                return (m_grammar == Grammar::Zon || object) ? "}" : "]";
            }

            /// @brief Moves to the next significant token.
            void Advance()
            {
                while (true)
                {
                    auto next = m_tokens.Next();
                    if (!next)
                    {
                        const auto end = static_cast<UInt32>(m_source.size());
                        m_current      = Token {TokenKind::Eof, Span {end, end}};
                        return;
                    }
                    if (next->kind == TokenKind::Comment && !AllowsComments())
                    {
                        Report(RuleType::SyntaxError, "Comments are not allowed", next->span);
                        continue;
                    }
                    if (next->IsSkippable())
                        continue;
                    m_current = *next;
                    return;
                }
            }

            /// @brief Reports an `Error` token through the first enabled rule of its chain.
            void ReportLexError(const Token& token)
            {
                switch (token.error)
                {
                    case LexErrorCode::LeadingZero:
                        if (m_options.allowLeadingZeros)
                            return;
                        if (Enabled(RuleType::NoLeadingZeros))
                            return Report(RuleType::NoLeadingZeros, "Number has leading zero", token.span);
                        if (Enabled(RuleType::InvalidNumber))
                            return Report(RuleType::InvalidNumber, "Number format is invalid", token.span);
                        break;
                    case LexErrorCode::MalformedNumber:
                        if (Enabled(RuleType::InvalidNumber))
                            return Report(RuleType::InvalidNumber, "Number format is invalid", token.span);
                        break;
                    case LexErrorCode::InvalidEscape:
                        if (Enabled(RuleType::InvalidEscapeSequence))
                            return Report(RuleType::InvalidEscapeSequence, "Invalid escape sequence", token.span);
                        break;
                    case LexErrorCode::InvalidUnicodeEscape:
                        if (Enabled(RuleType::InvalidEscapeSequence))
                            return Report(RuleType::InvalidEscapeSequence, "Invalid Unicode escape sequence", token.span);
                        break;
                    case LexErrorCode::NestingTooDeep:
                        return StopAtDepth(token.span);
                    case LexErrorCode::UnexpectedCharacter:
                        if (m_grammar == Grammar::Zon && Enabled(RuleType::InvalidIdentifier) && IsDotBeforeDigit(token.span))
                        {
                            return Report(RuleType::InvalidIdentifier, "Identifier must start with letter or underscore",
                                          Span {token.span.start, token.span.end + 1});
                        }
                        break;
                    default:
                        break;
                }
                Report(RuleType::SyntaxError, std::string(Syntax::ToString(token.error)), token.span);
            }

            void LintValue()
            {
                const Token token = m_current;
                switch (token.kind)
                {
                    case TokenKind::String:
                        if (token.Has(TokenFlags::EnumLiteral))
                            LintIdentifier(token);
                        LintString(token);
                        Advance();
                        return;
                    case TokenKind::Number:
                        LintNumber(token);
                        Advance();
                        return;
                    case TokenKind::True:
                    case TokenKind::False:
                    case TokenKind::Null:
                        Advance();
                        return;
                    case TokenKind::ObjectStart:
                        LintObject();
                        return;
                    case TokenKind::ArrayStart:
                        LintArray();
                        return;
                    case TokenKind::Error:
                        ReportLexError(token);
                        Advance();
                        return;
                    default:
                        Report(RuleType::SyntaxError, std::format("Unexpected {}", Syntax::ToString(token.kind)), token.span);
                        Advance();
                        return;
                }
            }

            void LintString(const Token& token)
            {
                const std::string_view body = Syntax::LiteralBody(token.Text(m_source), token);

                if (Enabled(RuleType::LargeStructure) && body.size() > m_options.maxStringLength)
                    Report(RuleType::LargeStructure, "String exceeds maximum length", token.span);

                if (Enabled(RuleType::ValidStringEncoding) && !Text::IsValidUtf8(body))
                    Report(RuleType::ValidStringEncoding, "String contains invalid UTF-8 sequences", token.span);

                if (Enabled(RuleType::InvalidEscapeSequence) && token.Has(TokenFlags::HasEscapes) && !token.Has(TokenFlags::Multiline))
                {
                    const auto status = Syntax::ValidateEscapes(m_grammar, body);
                    if (status == Syntax::DecodeStatus::InvalidEscape)
                        Report(RuleType::InvalidEscapeSequence, "Invalid escape sequence", token.span);
                    else if (status == Syntax::DecodeStatus::InvalidUnicodeEscape)
                        Report(RuleType::InvalidEscapeSequence, "Invalid Unicode escape sequence", token.span);
                }
            }

            void LintNumber(const Token& token)
            {
                const std::string_view text = token.Text(m_source);

                if (Enabled(RuleType::NoLeadingZeros) && !m_options.allowLeadingZeros && !token.Has(TokenFlags::RadixPrefix))
                {
                    const std::string_view digits = (!text.empty() && text.front() == '-') ? text.substr(1) : text;
                    if (digits.size() > 1 && digits[0] == '0' && Text::IsDigit(digits[1]))
                        Report(RuleType::NoLeadingZeros, "Number has leading zero", token.span);
                }

                const bool wantsPrecision = Enabled(RuleType::LargeNumberPrecision);
                const bool wantsValidity  = Enabled(RuleType::InvalidNumber);
                if (!wantsPrecision && !wantsValidity)
                    return;

                const auto value = Syntax::ParseNumberText(m_grammar, text, token.flags);
                if (!value)
                {
                    Report(RuleType::InvalidNumber, "Number format is invalid", token.span);
                    return;
                }

                if (!wantsPrecision)
                    return;
                if (Syntax::FractionDigits(text) > m_options.maxNumberPrecision)
                {
                    Report(RuleType::LargeNumberPrecision, "Number has high precision that may cause floating-point issues", token.span);
                }
                else if (!token.Has(TokenFlags::Float) && !token.Has(TokenFlags::CharLiteral) && std::isfinite(*value) &&
                         std::fabs(*value) > static_cast<F64>(Syntax::MaxExactInteger))
                {
                    Report(RuleType::LargeNumberPrecision, "Integer exceeds the exactly representable range", token.span);
                }
            }

            [[nodiscard]] bool IsDotBeforeDigit(Span span) const noexcept
            {
                return span.Length() == 1 && m_source[span.start] == '.' && span.end < m_source.size() && Text::IsDigit(m_source[span.end]);
            }

            /// @brief Field names and enum literals must be usable Zig identifiers.
            void LintIdentifier(const Token& token)
            {
                if (!Enabled(RuleType::InvalidIdentifier))
                    return;
                const std::string_view text = token.Text(m_source);
                if (token.Has(TokenFlags::QuotedField))
                {
                    if (Syntax::LiteralBody(text, token).empty())
                        Report(RuleType::InvalidIdentifier, "Identifier cannot be empty", token.span);
                    return;
                }
                const std::string_view name = text.substr(1);
                if (Syntax::IsReservedWord(name))
                    Report(RuleType::InvalidIdentifier, std::format("'{}' is a reserved word; write it as .@\"{}\"", name, name), token.span);
            }

            [[nodiscard]] bool WantsManifestChecks() const noexcept
            {
                return m_grammar == Grammar::Zon &&
                       (Enabled(RuleType::InvalidFieldType) || Enabled(RuleType::UnknownField) || Enabled(RuleType::MissingRequiredField));
            }

            /// @brief Checks the root object against the build manifest schema when its keys mark it as one.
            void CheckManifestRoot(Span open, const std::vector<RootField>& fields)
            {
                const bool isManifest = std::any_of(fields.begin(), fields.end(),
                                                    [](const RootField& field) { return Analysis::IsBuildManifestKey(field.name); });
                if (!isManifest)
                    return;

                const Analysis::ManifestSchema& schema = Analysis::BuildManifestSchema();
                for (const Analysis::FieldSpec& spec : schema.fields)
                {
                    if (!spec.required)
                        continue;
                    const bool present = std::any_of(fields.begin(), fields.end(), [&spec](const RootField& field) { return field.name == spec.name; });
                    if (!present)
                        Report(RuleType::MissingRequiredField, std::format("Missing required field '{}' in build.zig.zon", spec.name),
                               Span {open.start, open.start});
                }

                for (const RootField& field : fields)
                {
                    const Analysis::FieldSpec* spec = schema.Find(field.name);
                    if (!spec)
                    {
                        if (!schema.allowUnknownFields)
                            Report(RuleType::UnknownField, std::format("Unknown field '{}' in build.zig.zon", field.name), field.key);
                        continue;
                    }
                    if (field.kind && !Analysis::MatchesFieldType(spec->type, *field.kind, field.childCount))
                    {
                        Report(RuleType::InvalidFieldType,
                               std::format("Field '{}' expects {}, got {}", field.name, Analysis::ToString(spec->type), Syntax::ToString(*field.kind)),
                               field.value);
                    }
                }
            }

            void StopAtDepth(Span open)
            {
                Report(RuleType::MaxDepthExceeded, std::format("Nesting depth exceeds maximum of {}", m_maxDepth), open);
                Logging::Log(m_options.logger, Logging::LogLevel::Warning, "lint stopped at offset {}: nesting deeper than {}",
                             open.start, m_maxDepth);
                m_stopped = true;
            }

            /// @brief Opens a container; false when linting must stop.
            [[nodiscard]] bool Enter(Span open)
            {
                ++m_depth;
                if (m_depth > m_maxDepth)
                {
                    StopAtDepth(open);
                    return false;
                }
                if (m_depth == m_options.warnOnDeepNesting + 1)
                    Report(RuleType::DeepNesting, "Structure has deep nesting", open);
                return true;
            }

            [[nodiscard]] bool IsMissingValue() const noexcept
            {
                switch (m_current.kind)
                {
                    case TokenKind::ObjectEnd:
                    case TokenKind::ArrayEnd:
                    case TokenKind::Comma:
                    case TokenKind::Eof:
                        return true;
                    default:
                        return false;
                }
            }

            void LintObject()
            {
                const Span open = m_current.span;
                if (!Enter(open))
                    return;
                Advance();

                std::unordered_map<std::string, Span> keys;
                UIntSize                              count = 0;
                std::string                           decoded;
                const bool                            trackRoot = m_depth == 1 && WantsManifestChecks();
                std::vector<RootField>                rootFields;

                while (!m_stopped && m_current.kind != TokenKind::ObjectEnd)
                {
                    const Token token = m_current;
                    if (token.kind == TokenKind::Eof)
                    {
                        Report(RuleType::SyntaxError, "Unterminated object", open);
                        --m_depth;
                        return;
                    }
                    if (token.kind == TokenKind::Error)
                    {
                        ReportLexError(token);
                        Advance();
                        continue;
                    }
                    if (token.kind != TokenKind::PropertyName)
                    {
                        Report(RuleType::SyntaxError, "Expected property name", token.span);
                        Advance();
                        continue;
                    }

                    if (m_grammar == Grammar::Zon)
                        LintIdentifier(token);
                    LintString(token);
                    ++count;
                    const bool checkDuplicates = Enabled(RuleType::NoDuplicateKeys) && !m_options.allowDuplicateKeys;
                    if (checkDuplicates || trackRoot)
                    {
                        const std::string_view body = Syntax::LiteralBody(token.Text(m_source), token);
                        if (Syntax::DecodeLiteral(m_grammar, body, token, decoded) != Syntax::DecodeStatus::Ok)
                            decoded.assign(body);
                    }
                    if (checkDuplicates && !keys.try_emplace(decoded, token.span).second)
                        Report(RuleType::NoDuplicateKeys, "Duplicate object key", token.span);
                    if (trackRoot)
                        rootFields.push_back(RootField {decoded, token.span, Span {}, std::nullopt, 0});
                    Advance();

                    if (m_current.kind == TokenKind::Colon)
                    {
                        Advance();
                    }
                    else
                    {
                        Report(RuleType::SyntaxError,
                               std::format("Expected '{}' after property name", m_grammar == Grammar::Zon ? "=" : ":"),
                               m_current.span);
                    }

                    if (IsMissingValue())
                    {
                        Report(RuleType::SyntaxError, "Missing value", m_current.span);
                    }
                    else
                    {
                        const Token value = m_current;
                        LintValue();
                        if (trackRoot)
                        {
                            RootField& field = rootFields.back();
                            field.value      = value.span;
                            field.kind       = ValueKind(value.kind);
                            field.childCount = value.kind == TokenKind::ObjectStart ? m_lastObjectKeys : 1;
                        }
                    }
                    if (m_stopped)
                        return;

                    if (m_current.kind == TokenKind::Comma)
                    {
                        const Span comma = m_current.span;
                        Advance();
                        if (m_current.kind == TokenKind::ObjectEnd && m_grammar == Grammar::Json)
                            Report(RuleType::SyntaxError, "Trailing comma in object", comma);
                        continue;
                    }
                    if (m_current.kind == TokenKind::ObjectEnd || m_current.kind == TokenKind::Eof)
                        continue;

                    Report(RuleType::SyntaxError, std::format("Expected ',' or '{}'", CloseText(true)), m_current.span);
                    if (m_current.kind != TokenKind::PropertyName)
                        Advance();
                }
                if (m_stopped)
                    return;

                if (Enabled(RuleType::LargeStructure) && count > m_options.maxObjectKeys)
                    Report(RuleType::LargeStructure, "Object has too many keys", open.Merge(m_current.span));
                if (trackRoot)
                    CheckManifestRoot(open, rootFields);
                m_lastObjectKeys = count;
                --m_depth;
                Advance();
            }

            void LintArray()
            {
                const Span open = m_current.span;
                if (!Enter(open))
                    return;
                Advance();

                UIntSize count = 0;
                while (!m_stopped && m_current.kind != TokenKind::ArrayEnd)
                {
                    if (m_current.kind == TokenKind::Eof)
                    {
                        Report(RuleType::SyntaxError, "Unterminated array", open);
                        --m_depth;
                        return;
                    }

                    ++count;
                    LintValue();
                    if (m_stopped)
                        return;

                    if (m_current.kind == TokenKind::Comma)
                    {
                        const Span comma = m_current.span;
                        Advance();
                        if (m_current.kind == TokenKind::ArrayEnd && m_grammar == Grammar::Json)
                            Report(RuleType::SyntaxError, "Trailing comma in array", comma);
                        continue;
                    }
                    if (m_current.kind == TokenKind::ArrayEnd || m_current.kind == TokenKind::Eof)
                        continue;

                    Report(RuleType::SyntaxError, std::format("Expected ',' or '{}'", CloseText(false)), m_current.span);
                    if (!m_current.IsValueStart() && m_current.kind != TokenKind::Error)
                        Advance();
                }
                if (m_stopped)
                    return;

                if (Enabled(RuleType::LargeStructure) && count > m_options.maxArrayElements)
                    Report(RuleType::LargeStructure, "Array has too many elements", open.Merge(m_current.span));
                --m_depth;
                Advance();
            }

            std::string_view         m_source;
            Syntax::TokenStream&     m_tokens;
            Grammar                  m_grammar;
            const EnabledRules&      m_rules;
            const LinterOptions&     m_options;
            std::vector<Diagnostic>& m_diagnostics;
            Token                    m_current {};
            UInt32                   m_maxDepth {0};
            UIntSize                 m_lastObjectKeys {0};
            UInt32                   m_depth {0};
            bool                     m_stopped {false};
        };
    }// namespace

    std::vector<Diagnostic> Linter::Lint(std::string_view source, Syntax::Grammar grammar, const EnabledRules& rules) const
    {
        // Comments are always lexed so that a disallowed one is reported once and skipped.
        Syntax::LexerOptions lexerOptions;
        lexerOptions.allowComments = true;
        Syntax::TokenStream tokens = Syntax::Tokenize(source, grammar, lexerOptions);
        return Lint(source, tokens, grammar, rules);
    }

    std::vector<Diagnostic>
    Linter::Lint(std::string_view source, Syntax::TokenStream& tokens, Syntax::Grammar grammar, const EnabledRules& rules) const
    {
        std::vector<Diagnostic> diagnostics;
        if (rules.IsEmpty())
            return diagnostics;

        LintPass(source, tokens, grammar, rules, m_options, diagnostics).Run();

        std::stable_sort(diagnostics.begin(), diagnostics.end(),
                         [](const Diagnostic& a, const Diagnostic& b) { return a.range.start < b.range.start; });

        Logging::Log(m_options.logger, Logging::LogLevel::Debug, "lint finished ({}): {} diagnostics", Syntax::ToString(grammar),
                     diagnostics.size());
        return diagnostics;
    }
}// namespace Lattice::Lint
