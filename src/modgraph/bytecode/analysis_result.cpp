/**
 * @file analysis_result.cpp
 */
#include "modgraph/bytecode/analysis_result.hpp"

namespace modgraph
{

std::ostream& operator<<(std::ostream& os, const ImportRecord& record)
{
    os << "ImportRecord(module='" << record.module << "', level=" << record.level
       << ", names={";
    bool first = true;
    for (const auto& name : record.names)
    {
        os << (first ? "" : ", ") << name;
        first = false;
    }
    os << "}, star=" << (record.has_star_import ? "true" : "false")
       << ", conditional=" << (record.is_conditional ? "true" : "false") << ")";
    return os;
}

void AnalysisResult::merge(AnalysisResult&& other)
{
    imports.reserve(imports.size() + other.imports.size());
    for (auto& record : other.imports)
    {
        imports.push_back(std::move(record));
    }
    globals_written.merge(other.globals_written);
    globals_read.merge(other.globals_read);
    other.imports.clear();
}

} // namespace modgraph
