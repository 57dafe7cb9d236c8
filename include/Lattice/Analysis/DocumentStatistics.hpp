/// @file DocumentStatistics.hpp
/// @brief Size and shape metrics of a parsed document.
#pragma once

#include <Lattice/Defines.hpp>
#include <Lattice/Primitives.hpp>
#include <Lattice/Syntax/SyntaxTree.hpp>

namespace Lattice::Analysis
{
    struct TypeCounts
    {
        UInt32 strings {0};
        UInt32 numbers {0};
        UInt32 booleans {0};
        UInt32 nulls {0};
        UInt32 objects {0};
        UInt32 arrays {0};
    };

    /// @brief Metrics produced by `GenerateStatistics`.
    ///
    /// - `maxDepth`: containers on the deepest path; a scalar document has depth 0.
    /// - `totalKeys`: properties across all objects.
    /// - `totalValues`: value nodes, property keys excluded.
    /// - `sizeBytes`: length of the root value's span.
    /// - `complexityScore`: `2 * maxDepth + 1.5 * objects + 1.2 * arrays + 0.5 * totalKeys + ln(sizeBytes)`.
    struct DocumentStatistics
    {
        UInt32     maxDepth {0};
        UInt32     totalKeys {0};
        UInt32     totalValues {0};
        TypeCounts typeCounts {};
        UInt32     sizeBytes {0};
        F64        complexityScore {0.0};
    };

    [[nodiscard]] LATTICE_API DocumentStatistics GenerateStatistics(const Syntax::SyntaxTree& tree);
}// namespace Lattice::Analysis
