#include <Lattice/Analysis/DocumentStatistics.hpp>

#include <algorithm>
#include <cmath>
#include <vector>

namespace Lattice::Analysis
{
    namespace
    {
        [[nodiscard]] F64 ComplexityOf(const DocumentStatistics& stats) noexcept
        {
            F64 score = 0.0;
            score += static_cast<F64>(stats.maxDepth) * 2.0;
            score += static_cast<F64>(stats.typeCounts.objects) * 1.5;
            score += static_cast<F64>(stats.typeCounts.arrays) * 1.2;
            score += static_cast<F64>(stats.totalKeys) * 0.5;
            if (stats.sizeBytes > 0)
                score += std::log(static_cast<F64>(stats.sizeBytes));
            return score;
        }
    }// namespace

    DocumentStatistics GenerateStatistics(const Syntax::SyntaxTree& tree)
    {
        using Syntax::NodeId;
        using Syntax::NodeKind;

        DocumentStatistics stats;
        if (tree.Root() == Syntax::InvalidNodeId)
            return stats;

        struct Visit
        {
            NodeId id;
            UInt32 depth;
        };

        std::vector<Visit> work;
        work.push_back(Visit {tree.Root(), 0});
        while (!work.empty())
        {
            const Visit visit = work.back();
            work.pop_back();

            const Syntax::Node& node = tree.GetNode(visit.id);
            ++stats.totalValues;
            switch (node.kind)
            {
                case NodeKind::String:
                    ++stats.typeCounts.strings;
                    break;
                case NodeKind::Number:
                    ++stats.typeCounts.numbers;
                    break;
                case NodeKind::Boolean:
                    ++stats.typeCounts.booleans;
                    break;
                case NodeKind::Null:
                    ++stats.typeCounts.nulls;
                    break;
                case NodeKind::Object:
                    ++stats.typeCounts.objects;
                    stats.maxDepth = std::max(stats.maxDepth, visit.depth + 1);
                    for (const NodeId property : tree.Children(visit.id))
                    {
                        ++stats.totalKeys;
                        work.push_back(Visit {tree.PropertyValue(property), visit.depth + 1});
                    }
                    break;
                case NodeKind::Array:
                    ++stats.typeCounts.arrays;
                    stats.maxDepth = std::max(stats.maxDepth, visit.depth + 1);
                    for (const NodeId element : tree.Children(visit.id))
                        work.push_back(Visit {element, visit.depth + 1});
                    break;
                case NodeKind::Property:
                    --stats.totalValues;
                    work.push_back(Visit {tree.PropertyValue(visit.id), visit.depth});
                    break;
            }
        }

        stats.sizeBytes       = tree.GetNode(tree.Root()).span.Length();
        stats.complexityScore = ComplexityOf(stats);
        return stats;
    }
}// namespace Lattice::Analysis
