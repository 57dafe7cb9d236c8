#include <Lattice/Analysis/JsonSchema.hpp>

#include <utility>

namespace Lattice::Analysis
{
    std::string_view ToString(SchemaType type) noexcept
    {
        switch (type)
        {
            case SchemaType::String:
                return "string";
            case SchemaType::Number:
                return "number";
            case SchemaType::Boolean:
                return "boolean";
            case SchemaType::Null:
                return "null";
            case SchemaType::Object:
                return "object";
            case SchemaType::Array:
                return "array";
            case SchemaType::Any:
                return "any";
        }
        return "unknown";
    }

    JsonSchema::JsonSchema() noexcept = default;

    JsonSchema::JsonSchema(SchemaType schemaType) noexcept
        : type(schemaType)
    {
    }

    JsonSchema::~JsonSchema() = default;

    JsonSchema::JsonSchema(JsonSchema&&) noexcept            = default;
    JsonSchema& JsonSchema::operator=(JsonSchema&&) noexcept = default;

    JsonSchema JsonSchema::Object()
    {
        JsonSchema schema(SchemaType::Object);
        schema.properties = std::make_unique<SchemaProperties>();
        return schema;
    }

    JsonSchema JsonSchema::Array(JsonSchema itemSchema)
    {
        JsonSchema schema(SchemaType::Array);
        schema.items = std::make_unique<JsonSchema>(std::move(itemSchema));
        return schema;
    }

    JsonSchema JsonSchema::Clone() const
    {
        JsonSchema copy(type);
        copy.nullable = nullable;
        copy.examples = examples;
        if (properties)
        {
            copy.properties = std::make_unique<SchemaProperties>();
            copy.properties->Reserve(properties->size());
            for (const SchemaProperty& property : *properties)
                copy.properties->Set(property.name, property.schema.Clone());
        }
        if (items)
            copy.items = std::make_unique<JsonSchema>(items->Clone());
        return copy;
    }

    UIntSize JsonSchema::PropertyCount() const noexcept
    {
        return properties ? properties->size() : 0;
    }

    JsonSchema* JsonSchema::FindProperty(std::string_view name) noexcept
    {
        return properties ? properties->Find(name) : nullptr;
    }

    const JsonSchema* JsonSchema::FindProperty(std::string_view name) const noexcept
    {
        return properties ? std::as_const(*properties).Find(name) : nullptr;
    }

    JsonSchema& JsonSchema::SetProperty(std::string_view name, JsonSchema schema)
    {
        if (!properties)
            properties = std::make_unique<SchemaProperties>();
        return properties->Set(name, std::move(schema));
    }

    JsonSchema* SchemaProperties::Find(std::string_view name) noexcept
    {
        const auto found = m_index.find(name);
        return found == m_index.end() ? nullptr : &m_entries[found->second].schema;
    }

    const JsonSchema* SchemaProperties::Find(std::string_view name) const noexcept
    {
        const auto found = m_index.find(name);
        return found == m_index.end() ? nullptr : &m_entries[found->second].schema;
    }

    JsonSchema& SchemaProperties::Set(std::string_view name, JsonSchema schema)
    {
        if (const auto found = m_index.find(name); found != m_index.end())
        {
            JsonSchema& existing = m_entries[found->second].schema;
            existing             = std::move(schema);
            return existing;
        }
        m_index.emplace(std::string(name), m_entries.size());
        m_entries.push_back(SchemaProperty {std::string(name), std::move(schema)});
        return m_entries.back().schema;
    }

    void SchemaProperties::Reserve(UIntSize count)
    {
        m_entries.reserve(count);
        m_index.reserve(count);
    }
}// namespace Lattice::Analysis
