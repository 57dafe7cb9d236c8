/// @file SchemaAnalyzer.hpp
/// @brief Bottom-up schema inference over syntax trees.
///
/// Inference is bounded by `maxSchemaDepth`: any structure nested deeper collapses to
/// `SchemaType::Any`. Arrays compare the top-level type of each element against the first one
/// and stop at the first mismatch. Results are plain values; allocation failure propagates as
/// `std::bad_alloc`.
///
/// ### Typical usage
/// @code
/// auto tree = Lattice::Syntax::Parser::Parse(text, Lattice::Syntax::Grammar::Json);
/// Lattice::Analysis::SchemaAnalyzer analyzer;
/// Lattice::Analysis::JsonSchema schema = analyzer.InferSchema(tree.Value());
/// for (const std::string& hint : analyzer.SuggestOptimizations(schema))
///     std::cout << hint << '\n';
/// @endcode
#pragma once

#include <Lattice/Analysis/JsonSchema.hpp>
#include <Lattice/Defines.hpp>
#include <Lattice/Syntax/SyntaxTree.hpp>

#include <span>
#include <string>
#include <vector>

namespace Lattice::Analysis
{
    struct AnalyzerOptions
    {
        UInt32 maxSchemaDepth {20};
        bool   inferArrayItemTypes {true};
        UInt32 maxExamples {10};
    };

    class LATTICE_API SchemaAnalyzer
    {
    public:
        explicit SchemaAnalyzer(const AnalyzerOptions& options = {}) noexcept
            : m_options(options)
        {
        }

        /// @brief Schema of the tree's root value.
        [[nodiscard]] JsonSchema InferSchema(const Syntax::SyntaxTree& tree) const;

        /// @brief Schema of `node`, which is treated as depth zero.
        [[nodiscard]] JsonSchema InferSchema(const Syntax::SyntaxTree& tree, Syntax::NodeId node) const;

        /// @brief Unifies the schemas of `nodes`; any type mismatch yields `Any`.
        [[nodiscard]] JsonSchema InferSchemaFromValues(const Syntax::SyntaxTree& tree, std::span<const Syntax::NodeId> nodes) const;

        /// @brief Unifies the root schemas of independent documents.
        [[nodiscard]] JsonSchema InferSchemaFromDocuments(std::span<const Syntax::SyntaxTree> trees) const;

        /// @brief True when values described by `a` are also described by `b`.
        ///
        /// Types must match. Every property of `a` must exist in `b` with a compatible schema;
        /// extra properties of `b` are allowed. Array items are compared recursively.
        [[nodiscard]] static bool IsCompatible(const JsonSchema& a, const JsonSchema& b);

        /// @brief Advisory hints about `schema`; nested findings are prefixed with their path.
        [[nodiscard]] std::vector<std::string> SuggestOptimizations(const JsonSchema& schema) const;

        [[nodiscard]] const AnalyzerOptions& Options() const noexcept { return m_options; }

    private:
        [[nodiscard]] JsonSchema InferNode(const Syntax::SyntaxTree& tree, Syntax::NodeId node, UInt32 depth) const;
        [[nodiscard]] JsonSchema InferObject(const Syntax::SyntaxTree& tree, Syntax::NodeId node, UInt32 depth) const;
        [[nodiscard]] JsonSchema InferArray(const Syntax::SyntaxTree& tree, Syntax::NodeId node, UInt32 depth) const;

        void MergeExamples(JsonSchema& target, const JsonSchema& source) const;

        /// @brief Folds `other` into `base`; false on the first type mismatch.
        [[nodiscard]] bool Unify(JsonSchema& base, const JsonSchema& other) const;

        AnalyzerOptions m_options;
    };
}// namespace Lattice::Analysis
