#include <Lattice/Lint/Rule.hpp>

#include <array>

namespace Lattice::Lint
{
    namespace
    {
        constexpr std::array<RuleInfo, RuleCount> kRuleInfo {{
                {"no_duplicate_keys", "Object keys must be unique", Severity::Error, true},
                {"no_leading_zeros", "Numbers should not have leading zeros", Severity::Warning, true},
                {"valid_string_encoding", "Strings must be valid UTF-8", Severity::Error, true},
                {"max_depth_exceeded", "Structure exceeds maximum nesting depth", Severity::Error, true},
                {"large_number_precision", "Number has high precision that may cause issues", Severity::Warning, false},
                {"large_structure", "Structure is very large", Severity::Warning, false},
                {"deep_nesting", "Structure has deep nesting that may be hard to read", Severity::Warning, true},
                {"invalid_number", "Numbers must be well formed", Severity::Error, true},
                {"invalid_escape_sequence", "String escapes must be valid", Severity::Error, true},
                {"syntax_error", "Input must be structurally valid", Severity::Error, true},
                {"invalid_field_type", "Field has invalid type for known schema", Severity::Error, false},
                {"unknown_field", "Field is not recognized in known schema", Severity::Warning, false},
                {"missing_required_field", "Required field is missing from object", Severity::Error, false},
                {"invalid_identifier", "Identifier uses invalid ZON syntax", Severity::Error, true},
        }};
    }// namespace

    const RuleInfo& GetRuleInfo(RuleType rule) noexcept
    {
        return kRuleInfo[static_cast<UIntSize>(rule)];
    }

    std::optional<RuleType> RuleFromName(std::string_view name) noexcept
    {
        for (UIntSize i = 0; i < RuleCount; ++i)
        {
            if (kRuleInfo[i].name == name)
                return static_cast<RuleType>(i);
        }
        return std::nullopt;
    }

    std::string_view ToString(Severity severity) noexcept
    {
        switch (severity)
        {
            case Severity::Error:
                return "error";
            case Severity::Warning:
                return "warning";
            case Severity::Info:
                return "info";
        }
        return "unknown";
    }

    EnabledRules EnabledRules::Defaults() noexcept
    {
        EnabledRules rules;
        for (UIntSize i = 0; i < RuleCount; ++i)
            rules.Set(static_cast<RuleType>(i), kRuleInfo[i].enabledByDefault);
        return rules;
    }

    EnabledRules EnabledRules::All() noexcept
    {
        EnabledRules rules;
        for (UIntSize i = 0; i < RuleCount; ++i)
            rules.Insert(static_cast<RuleType>(i));
        return rules;
    }
}// namespace Lattice::Lint
