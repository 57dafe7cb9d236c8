/// @file JsonSchema.hpp
/// @brief Structural schema inferred from JSON and ZON values.
///
/// A schema exclusively owns its nested schemas: object properties live in an ordered
/// `SchemaProperties` list behind a `std::unique_ptr`, array items in a `std::unique_ptr<JsonSchema>`. A null pointer
/// means "absent", which is distinct from an empty property list. Schemas are move-only;
/// use `Clone()` for an explicit deep copy.
#pragma once

#include <Lattice/Defines.hpp>
#include <Lattice/Primitives.hpp>

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace Lattice::Analysis
{
    enum class SchemaType : UInt8
    {
        String,
        Number,
        Boolean,
        Null,
        Object,
        Array,
        Any,
    };

    [[nodiscard]] LATTICE_API std::string_view ToString(SchemaType type) noexcept;

    struct SchemaProperty;
    class SchemaProperties;

    struct LATTICE_API JsonSchema
    {
        SchemaType                        type {SchemaType::Any};
        std::unique_ptr<SchemaProperties> properties {};
        std::unique_ptr<JsonSchema>       items {};
        bool                              nullable {false};
        std::vector<std::string>          examples {};

        JsonSchema() noexcept;
        explicit JsonSchema(SchemaType schemaType) noexcept;
        ~JsonSchema();

        JsonSchema(JsonSchema&&) noexcept;
        JsonSchema& operator=(JsonSchema&&) noexcept;

        JsonSchema(const JsonSchema&)            = delete;
        JsonSchema& operator=(const JsonSchema&) = delete;

        /// @brief Object schema with an empty, present property list.
        [[nodiscard]] static JsonSchema Object();

        /// @brief Array schema whose items are `itemSchema`.
        [[nodiscard]] static JsonSchema Array(JsonSchema itemSchema);

        [[nodiscard]] JsonSchema Clone() const;

        [[nodiscard]] bool HasProperties() const noexcept { return properties != nullptr; }
        [[nodiscard]] bool HasItems() const noexcept { return items != nullptr; }

        [[nodiscard]] UIntSize PropertyCount() const noexcept;

        [[nodiscard]] JsonSchema*       FindProperty(std::string_view name) noexcept;
        [[nodiscard]] const JsonSchema* FindProperty(std::string_view name) const noexcept;

        /// @brief Inserts or replaces `name`; a replaced property keeps its position.
        JsonSchema& SetProperty(std::string_view name, JsonSchema schema);
    };

    struct SchemaProperty
    {
        std::string name;
        JsonSchema  schema;
    };

    /// @brief Properties in field order with a name index for constant-time lookup.
    class LATTICE_API SchemaProperties
    {
    public:
        using Storage = std::vector<SchemaProperty>;

        [[nodiscard]] UIntSize size() const noexcept { return m_entries.size(); }
        [[nodiscard]] bool     empty() const noexcept { return m_entries.empty(); }

        [[nodiscard]] SchemaProperty&       operator[](UIntSize index) noexcept { return m_entries[index]; }
        [[nodiscard]] const SchemaProperty& operator[](UIntSize index) const noexcept { return m_entries[index]; }

        [[nodiscard]] Storage::iterator               begin() noexcept { return m_entries.begin(); }
        [[nodiscard]] Storage::iterator               end() noexcept { return m_entries.end(); }
        [[nodiscard]] Storage::const_iterator         begin() const noexcept { return m_entries.begin(); }
        [[nodiscard]] Storage::const_iterator         end() const noexcept { return m_entries.end(); }
        [[nodiscard]] Storage::const_reverse_iterator rbegin() const noexcept { return m_entries.rbegin(); }
        [[nodiscard]] Storage::const_reverse_iterator rend() const noexcept { return m_entries.rend(); }

        [[nodiscard]] JsonSchema*       Find(std::string_view name) noexcept;
        [[nodiscard]] const JsonSchema* Find(std::string_view name) const noexcept;

        /// @brief Inserts or replaces `name`; a replaced property keeps its position.
        JsonSchema& Set(std::string_view name, JsonSchema schema);

        void Reserve(UIntSize count);

    private:
        struct NameHash
        {
            using is_transparent = void;

            [[nodiscard]] UIntSize operator()(std::string_view name) const noexcept { return std::hash<std::string_view> {}(name); }
        };

        Storage                                                               m_entries {};
        std::unordered_map<std::string, UIntSize, NameHash, std::equal_to<>> m_index {};
    };
}// namespace Lattice::Analysis
