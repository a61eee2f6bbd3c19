/**
 * @file import_edge.cpp
 */
#include "modgraph/graph/import_edge.hpp"

namespace modgraph
{

ImportEdge ImportEdge::from_record(const ImportRecord& record)
{
    ImportEdge edge;
    edge.imported_names = record.names;
    edge.has_star_import = record.has_star_import;
    edge.is_optional = record.is_optional();
    return edge;
}

ImportEdge ImportEdge::merged_with(const ImportEdge& other) const
{
    ImportEdge result = *this;
    result.imported_names.insert(other.imported_names.begin(), other.imported_names.end());
    result.has_star_import = has_star_import || other.has_star_import;
    result.is_optional = is_optional && other.is_optional;
    return result;
}

ImportEdge merge_import_edges(const ImportEdge& existing, const ImportEdge& incoming)
{
    return existing.merged_with(incoming);
}

std::ostream& operator<<(std::ostream& os, const ImportEdge& edge)
{
    os << "ImportEdge(names={";
    bool first = true;
    for (const auto& name : edge.imported_names)
    {
        os << (first ? "" : ", ") << name;
        first = false;
    }
    os << "}, star=" << (edge.has_star_import ? "true" : "false")
       << ", optional=" << (edge.is_optional ? "true" : "false") << ")";
    return os;
}

} // namespace modgraph
