/// @file Rule.hpp
/// @brief Lint rule identifiers, their static metadata, and the enabled-rule set.
#pragma once

#include <Lattice/Defines.hpp>
#include <Lattice/Primitives.hpp>

#include <bitset>
#include <initializer_list>
#include <optional>
#include <string_view>

namespace Lattice::Lint
{
    enum class RuleType : UInt8
    {
        NoDuplicateKeys,
        NoLeadingZeros,
        ValidStringEncoding,
        MaxDepthExceeded,
        LargeNumberPrecision,
        LargeStructure,
        DeepNesting,
        InvalidNumber,
        InvalidEscapeSequence,
        SyntaxError,
        InvalidFieldType,
        UnknownField,
        MissingRequiredField,
        InvalidIdentifier,
    };

    inline constexpr UIntSize RuleCount = 14;

    enum class Severity : UInt8
    {
        Error,
        Warning,
        Info,
    };

    struct RuleInfo
    {
        std::string_view name;
        std::string_view description;
        Severity         severity;
        bool             enabledByDefault;
    };

    [[nodiscard]] LATTICE_API const RuleInfo& GetRuleInfo(RuleType rule) noexcept;

    /// @brief Looks a rule up by its snake_case name, e.g. `no_duplicate_keys`.
    [[nodiscard]] LATTICE_API std::optional<RuleType> RuleFromName(std::string_view name) noexcept;

    [[nodiscard]] inline std::string_view ToString(RuleType rule) noexcept { return GetRuleInfo(rule).name; }

    [[nodiscard]] LATTICE_API std::string_view ToString(Severity severity) noexcept;

    /// @brief Fixed-size set of rules, one bit per `RuleType`.
    class LATTICE_API EnabledRules
    {
    public:
        constexpr EnabledRules() noexcept = default;

        EnabledRules(std::initializer_list<RuleType> rules) noexcept
        {
            for (const RuleType rule : rules)
                Insert(rule);
        }

        /// @brief Rules whose metadata marks them enabled by default.
        [[nodiscard]] static EnabledRules Defaults() noexcept;
        [[nodiscard]] static EnabledRules All() noexcept;
        [[nodiscard]] static EnabledRules None() noexcept { return EnabledRules {}; }

        [[nodiscard]] bool Contains(RuleType rule) const noexcept { return m_bits.test(static_cast<UIntSize>(rule)); }

        void Insert(RuleType rule) noexcept { m_bits.set(static_cast<UIntSize>(rule)); }
        void Remove(RuleType rule) noexcept { m_bits.reset(static_cast<UIntSize>(rule)); }

        void Set(RuleType rule, bool enabled) noexcept { m_bits.set(static_cast<UIntSize>(rule), enabled); }

        [[nodiscard]] UIntSize Count() const noexcept { return m_bits.count(); }
        [[nodiscard]] bool     IsEmpty() const noexcept { return m_bits.none(); }

        friend bool operator==(const EnabledRules&, const EnabledRules&) noexcept = default;

    private:
        std::bitset<RuleCount> m_bits {};
    };
}// namespace Lattice::Lint
