#include <Lattice/Analysis/SchemaAnalyzer.hpp>

#include <format>
#include <utility>

namespace Lattice::Analysis
{
    namespace
    {
        using Syntax::NodeId;
        using Syntax::NodeKind;
        using Syntax::SyntaxTree;

        [[nodiscard]] bool LooksLikeArrayElement(std::string_view name) noexcept
        {
            return name.starts_with("item") || name.ends_with("_0") || name.ends_with("_1");
        }

        [[nodiscard]] bool LooksLikeUrl(std::string_view text) noexcept
        {
            return text.starts_with("http://") || text.starts_with("https://");
        }

        [[nodiscard]] bool LooksLikeEmail(std::string_view text) noexcept
        {
            return text.find('@') != std::string_view::npos && text.find('.') != std::string_view::npos;
        }

        [[nodiscard]] std::string JoinPath(std::string_view parent, std::string_view child)
        {
            if (parent.empty())
                return std::string(child);
            return std::format("{}.{}", parent, child);
        }

        [[nodiscard]] std::string Located(std::string_view path, std::string_view message)
        {
            if (path.empty())
                return std::string(message);
            return std::format("{}: {}", path, message);
        }
    }// namespace

    JsonSchema SchemaAnalyzer::InferSchema(const SyntaxTree& tree) const
    {
        if (tree.Root() == Syntax::InvalidNodeId)
            return JsonSchema(SchemaType::Any);
        return InferNode(tree, tree.Root(), 0);
    }

    JsonSchema SchemaAnalyzer::InferSchema(const SyntaxTree& tree, NodeId node) const
    {
        if (node >= tree.NodeCount())
            return JsonSchema(SchemaType::Any);
        return InferNode(tree, node, 0);
    }

    JsonSchema SchemaAnalyzer::InferNode(const SyntaxTree& tree, NodeId id, UInt32 depth) const
    {
        if (depth > m_options.maxSchemaDepth)
            return JsonSchema(SchemaType::Any);

        const Syntax::Node& node = tree.GetNode(id);
        switch (node.kind)
        {
            case NodeKind::String: {
                JsonSchema schema(SchemaType::String);
                schema.examples.emplace_back(node.text);
                return schema;
            }
            case NodeKind::Number: {
                JsonSchema schema(SchemaType::Number);
                schema.examples.emplace_back(node.text);
                return schema;
            }
            case NodeKind::Boolean: {
                JsonSchema schema(SchemaType::Boolean);
                schema.examples.emplace_back(node.boolean ? "true" : "false");
                return schema;
            }
            case NodeKind::Null:
                return JsonSchema(SchemaType::Null);
            case NodeKind::Object:
                return InferObject(tree, id, depth);
            case NodeKind::Array:
                return InferArray(tree, id, depth);
            case NodeKind::Property:
                return InferNode(tree, tree.PropertyValue(id), depth);
        }
        return JsonSchema(SchemaType::Any);
    }

    JsonSchema SchemaAnalyzer::InferObject(const SyntaxTree& tree, NodeId id, UInt32 depth) const
    {
        JsonSchema schema = JsonSchema::Object();
        for (const NodeId property : tree.Children(id))
        {
            const std::string_view name = tree.GetNode(tree.PropertyKey(property)).text;
            schema.SetProperty(name, InferNode(tree, tree.PropertyValue(property), depth + 1));
        }
        return schema;
    }

    JsonSchema SchemaAnalyzer::InferArray(const SyntaxTree& tree, NodeId id, UInt32 depth) const
    {
        const auto elements = tree.Children(id);
        if (elements.empty() || !m_options.inferArrayItemTypes)
            return JsonSchema::Array(JsonSchema(SchemaType::Any));

        JsonSchema first = InferNode(tree, elements.front(), depth + 1);
        for (const NodeId element : elements.subspan(1))
        {
            const JsonSchema next = InferNode(tree, element, depth + 1);
            if (next.type != first.type)
                return JsonSchema::Array(JsonSchema(SchemaType::Any));
            MergeExamples(first, next);
        }
        return JsonSchema::Array(std::move(first));
    }

    void SchemaAnalyzer::MergeExamples(JsonSchema& target, const JsonSchema& source) const
    {
        for (const std::string& example : source.examples)
        {
            if (target.examples.size() >= m_options.maxExamples)
                return;
            target.examples.push_back(example);
        }
    }

    bool SchemaAnalyzer::Unify(JsonSchema& base, const JsonSchema& other) const
    {
        struct Pending
        {
            JsonSchema*       base;
            const JsonSchema* other;
        };

        std::vector<Pending> work;
        work.push_back(Pending {&base, &other});
        while (!work.empty())
        {
            const Pending item = work.back();
            work.pop_back();

            JsonSchema&       target = *item.base;
            const JsonSchema& source = *item.other;
            if (target.type != source.type)
                return false;

            target.nullable = target.nullable || source.nullable;
            MergeExamples(target, source);

            if (source.properties)
            {
                // Append first: growing the property vector would invalidate queued pointers.
                const auto&       incoming = *source.properties;
                std::vector<bool> added(incoming.size(), false);
                for (UIntSize i = 0; i < incoming.size(); ++i)
                {
                    if (!target.FindProperty(incoming[i].name))
                    {
                        target.SetProperty(incoming[i].name, incoming[i].schema.Clone());
                        added[i] = true;
                    }
                }
                for (UIntSize i = 0; i < incoming.size(); ++i)
                {
                    if (!added[i])
                        work.push_back(Pending {target.FindProperty(incoming[i].name), &incoming[i].schema});
                }
            }

            if (source.items)
            {
                if (target.items)
                    work.push_back(Pending {target.items.get(), source.items.get()});
                else
                    target.items = std::make_unique<JsonSchema>(source.items->Clone());
            }
        }
        return true;
    }

    JsonSchema SchemaAnalyzer::InferSchemaFromValues(const SyntaxTree& tree, std::span<const NodeId> nodes) const
    {
        if (nodes.empty())
            return JsonSchema(SchemaType::Any);

        JsonSchema result = InferSchema(tree, nodes.front());
        for (const NodeId node : nodes.subspan(1))
        {
            if (!Unify(result, InferSchema(tree, node)))
                return JsonSchema(SchemaType::Any);
        }
        return result;
    }

    JsonSchema SchemaAnalyzer::InferSchemaFromDocuments(std::span<const SyntaxTree> trees) const
    {
        if (trees.empty())
            return JsonSchema(SchemaType::Any);

        JsonSchema result = InferSchema(trees.front());
        for (const SyntaxTree& tree : trees.subspan(1))
        {
            if (!Unify(result, InferSchema(tree)))
                return JsonSchema(SchemaType::Any);
        }
        return result;
    }

    bool SchemaAnalyzer::IsCompatible(const JsonSchema& a, const JsonSchema& b)
    {
        struct Pair
        {
            const JsonSchema* a;
            const JsonSchema* b;
        };

        std::vector<Pair> work;
        work.push_back(Pair {&a, &b});
        while (!work.empty())
        {
            const Pair pair = work.back();
            work.pop_back();

            if (pair.a->type != pair.b->type)
                return false;

            if (pair.a->type == SchemaType::Object)
            {
                if (pair.a->HasProperties() != pair.b->HasProperties())
                    return false;
                if (pair.a->HasProperties())
                {
                    for (const SchemaProperty& property : *pair.a->properties)
                    {
                        const JsonSchema* counterpart = pair.b->FindProperty(property.name);
                        if (!counterpart)
                            return false;
                        work.push_back(Pair {&property.schema, counterpart});
                    }
                }
            }
            else if (pair.a->type == SchemaType::Array)
            {
                if (pair.a->HasItems() != pair.b->HasItems())
                    return false;
                if (pair.a->HasItems())
                    work.push_back(Pair {pair.a->items.get(), pair.b->items.get()});
            }
        }
        return true;
    }

    std::vector<std::string> SchemaAnalyzer::SuggestOptimizations(const JsonSchema& schema) const
    {
        struct Visit
        {
            const JsonSchema* schema;
            std::string       path;
        };

        std::vector<std::string> suggestions;
        std::vector<Visit>       work;
        work.push_back(Visit {&schema, std::string {}});

        while (!work.empty())
        {
            Visit visit = std::move(work.back());
            work.pop_back();
            const JsonSchema& current = *visit.schema;

            switch (current.type)
            {
                case SchemaType::Object: {
                    if (!current.properties)
                        break;
                    if (current.properties->size() > 50)
                        suggestions.push_back(Located(visit.path, "Consider splitting large objects with >50 properties"));
                    for (const SchemaProperty& property : *current.properties)
                    {
                        if (LooksLikeArrayElement(property.name))
                        {
                            suggestions.push_back(
                                Located(visit.path, std::format("Property '{}' suggests array-like structure", property.name)));
                        }
                    }
                    for (auto it = current.properties->rbegin(); it != current.properties->rend(); ++it)
                        work.push_back(Visit {&it->schema, JoinPath(visit.path, it->name)});
                    break;
                }
                case SchemaType::Array:
                    if (!current.items)
                        break;
                    if (current.items->type == SchemaType::Any)
                        suggestions.push_back(Located(visit.path, "Array has mixed types - consider using consistent types"));
                    work.push_back(Visit {current.items.get(), visit.path + "[]"});
                    break;
                case SchemaType::String:
                    if (current.examples.empty())
                        break;
                    if (LooksLikeUrl(current.examples.front()))
                        suggestions.push_back(Located(visit.path, "String appears to be URL - consider URL validation"));
                    if (LooksLikeEmail(current.examples.front()))
                        suggestions.push_back(Located(visit.path, "String appears to be email - consider email validation"));
                    break;
                default:
                    break;
            }
        }
        return suggestions;
    }
}// namespace Lattice::Analysis
