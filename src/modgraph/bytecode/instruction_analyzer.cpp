/**
 * @file instruction_analyzer.cpp
 */
#include "modgraph/bytecode/instruction_analyzer.hpp"
#include "modgraph/common/opaque_ptr_key.hpp"

#include <redlog.hpp>

#include <unordered_set>

namespace modgraph
{

namespace
{

redlog::logger log_ = redlog::get_logger("modgraph.analyzer");

using UnitKey = OpaquePtrKey<CompiledUnit>;

/// A unit waiting in the work queue.
struct PendingUnit
{
    CompiledUnitPtr unit;
    /// True if some ancestor is a function body.
    bool inside_function;
};

/// Scope classification of nested units, filled in by MAKE_FUNCTION.
struct ScopeTable
{
    std::unordered_set<UnitKey> function_units;
    std::unordered_set<UnitKey> class_units;
};

[[noreturn]] void throw_structural(const CompiledUnit& unit, std::size_t offset,
                                   const std::string& detail)
{
    log_.err("analysis failed",
             redlog::field("code", analysis_error_code_name(AnalysisErrorCode::StructuralViolation)),
             redlog::field("unit", unit.name()), redlog::field("offset", offset),
             redlog::field("detail", detail));
    throw AnalysisError(AnalysisErrorCode::StructuralViolation,
                        "Unit '" + unit.name() + "', instruction " + std::to_string(offset) +
                            ": " + detail);
}

std::uint32_t require_arg(const CompiledUnit& unit, std::size_t offset)
{
    const Instruction& inst = unit.instructions()[offset];
    if (!inst.arg)
    {
        throw_structural(unit, offset, std::string(opcode_name(inst.opcode)) + " has no operand");
    }
    return *inst.arg;
}

/// The constant loaded by the LOAD_CONST `distance` instructions before `offset`.
const Constant& preceding_constant(const CompiledUnit& unit, std::size_t offset,
                                   std::size_t distance)
{
    const auto& instructions = unit.instructions();
    Opcode opcode = instructions[offset].opcode;
    if (offset < distance)
    {
        throw_structural(unit, offset,
                         std::string(opcode_name(opcode)) + " is missing its LOAD_CONST operand " +
                             std::to_string(distance) + " position(s) earlier");
    }
    std::size_t load_offset = offset - distance;
    if (instructions[load_offset].opcode != Opcode::LoadConst)
    {
        throw_structural(unit, offset,
                         std::string(opcode_name(opcode)) + " expects LOAD_CONST at offset " +
                             std::to_string(load_offset) + ", found " +
                             opcode_name(instructions[load_offset].opcode));
    }
    return unit.constant_at(require_arg(unit, load_offset));
}

/**
 * @brief Single pass over one unit's instruction stream.
 */
class UnitScanner
{
public:
    UnitScanner(const CompiledUnit& unit, ScopeKind scope, bool conditional,
                bool track_globals, ScopeTable& scopes, AnalysisResult& result)
        : m_unit(unit)
        , m_scope(scope)
        , m_conditional(conditional)
        , m_track_globals(track_globals)
        , m_scopes(scopes)
        , m_result(result)
    {
    }

    void run()
    {
        const auto& instructions = m_unit.instructions();
        for (std::size_t offset = 0; offset < instructions.size(); ++offset)
        {
            const Instruction& inst = instructions[offset];
            switch (inst.opcode)
            {
            case Opcode::ImportName:
                on_import(offset);
                break;
            case Opcode::StoreName:
            case Opcode::StoreGlobal:
                on_store(offset);
                break;
            case Opcode::LoadName:
            case Opcode::LoadGlobal:
                on_load(offset, inst.opcode);
                break;
            case Opcode::MakeFunction:
                on_make_function(offset);
                break;
            case Opcode::LoadConst:
            case Opcode::LoadBuildClass:
            case Opcode::Other:
                break;
            }
        }
    }

private:
    void on_import(std::size_t offset)
    {
        const Constant& level_const = preceding_constant(m_unit, offset, 2);
        const Constant& fromlist = preceding_constant(m_unit, offset, 1);

        const std::int64_t* level = level_const.as_integer();
        if (!level || *level < 0)
        {
            throw_structural(m_unit, offset,
                             std::string("IMPORT_NAME level must be a non-negative int, found ") +
                                 level_const.kind_name());
        }

        ImportRecord record;
        record.module = m_unit.name_at(require_arg(m_unit, offset));
        record.level = *level;
        record.is_conditional = m_conditional;

        if (const Constant::Tuple* names = fromlist.as_tuple())
        {
            for (const Constant& item : *names)
            {
                const std::string* name = item.as_string();
                if (!name)
                {
                    throw_structural(m_unit, offset,
                                     std::string("IMPORT_NAME fromlist entries must be str, found ") +
                                         item.kind_name());
                }
                if (*name == "*")
                {
                    record.has_star_import = true;
                }
                else
                {
                    record.names.insert(*name);
                }
            }
        }
        else if (!fromlist.is_none())
        {
            throw_structural(m_unit, offset,
                             std::string("IMPORT_NAME fromlist must be none or a tuple, found ") +
                                 fromlist.kind_name());
        }

        log_.trc("import", redlog::field("unit", m_unit.name()),
                 redlog::field("module", record.module), redlog::field("level", record.level),
                 redlog::field("names", record.names.size()),
                 redlog::field("star", record.has_star_import),
                 redlog::field("conditional", record.is_conditional));

        if (m_track_globals && m_scope == ScopeKind::Module)
        {
            m_result.globals_written.insert(record.names.begin(), record.names.end());
        }
        m_result.imports.push_back(std::move(record));
    }

    void on_store(std::size_t offset)
    {
        const std::string& name = m_unit.name_at(require_arg(m_unit, offset));
        if (m_scope == ScopeKind::Class || !m_track_globals)
        {
            return;
        }
        m_result.globals_written.insert(name);
    }

    void on_load(std::size_t offset, Opcode opcode)
    {
        const std::string& name = m_unit.name_at(require_arg(m_unit, offset));
        if (m_scope == ScopeKind::Class && opcode == Opcode::LoadName)
        {
            return;
        }
        if (m_track_globals)
        {
            m_result.globals_read.insert(name);
        }
    }

    void on_make_function(std::size_t offset)
    {
        const Constant& code = preceding_constant(m_unit, offset, 2);
        CompiledUnitPtr nested = code.as_unit();
        if (!nested)
        {
            throw_structural(m_unit, offset,
                             std::string("MAKE_FUNCTION expects a code constant, found ") +
                                 code.kind_name());
        }

        const auto& instructions = m_unit.instructions();
        bool is_class = offset >= 3 && instructions[offset - 3].opcode == Opcode::LoadBuildClass;
        if (is_class)
        {
            m_scopes.class_units.insert(UnitKey(nested));
        }
        else
        {
            m_scopes.function_units.insert(UnitKey(nested));
        }
    }

private:
    const CompiledUnit& m_unit;
    ScopeKind m_scope;
    bool m_conditional;
    bool m_track_globals;
    ScopeTable& m_scopes;
    AnalysisResult& m_result;
};

} // namespace

// ============================================================================
// InstructionAnalyzer
// ============================================================================

InstructionAnalyzer::InstructionAnalyzer(AnalyzerConfig config)
    : m_config(config)
{
}

AnalysisResult InstructionAnalyzer::analyze(const CompiledUnitPtr& root) const
{
    if (!root)
    {
        throw AnalysisError(AnalysisErrorCode::InvalidArgument,
                            "InstructionAnalyzer::analyze: null compiled unit");
    }

    log_.vrb("analyzing unit tree", redlog::field("root", root->name()));

    AnalysisResult result;
    ScopeTable scopes;
    std::deque<PendingUnit> work_q;
    work_q.push_back(PendingUnit{root, false});
    std::size_t unit_count = 0;

    while (!work_q.empty())
    {
        PendingUnit current = std::move(work_q.front());
        work_q.pop_front();

        if (m_config.max_units != 0 && unit_count >= m_config.max_units)
        {
            log_.err("analysis failed",
                     redlog::field("code",
                                   analysis_error_code_name(AnalysisErrorCode::UnitLimitExceeded)),
                     redlog::field("root", root->name()),
                     redlog::field("max_units", m_config.max_units));
            throw AnalysisError(AnalysisErrorCode::UnitLimitExceeded,
                                "Unit tree rooted at '" + root->name() + "' has more than " +
                                    std::to_string(m_config.max_units) + " units");
        }
        ++unit_count;

        UnitKey key(current.unit);
        bool is_function =
            current.inside_function || scopes.function_units.count(key) != 0;
        bool is_class = scopes.class_units.count(key) != 0;

        ScopeKind scope = ScopeKind::Module;
        if (is_class)
        {
            scope = ScopeKind::Class;
        }
        else if (is_function)
        {
            scope = ScopeKind::Function;
        }

        std::size_t imports_before = result.imports.size();
        UnitScanner scanner(*current.unit, scope, is_function, m_config.track_globals, scopes,
                            result);
        scanner.run();

        log_.dbg("scanned unit", redlog::field("unit", current.unit->name()),
                 redlog::field("scope", scope_kind_name(scope)),
                 redlog::field("conditional", is_function),
                 redlog::field("imports", result.imports.size() - imports_before));

        for (auto& nested : current.unit->nested_units())
        {
            work_q.push_back(PendingUnit{std::move(nested), is_function});
        }
    }

    log_.vrb("analysis complete", redlog::field("root", root->name()),
             redlog::field("units", unit_count), redlog::field("imports", result.imports.size()),
             redlog::field("globals_written", result.globals_written.size()),
             redlog::field("globals_read", result.globals_read.size()));

    return result;
}

AnalysisResult analyze_unit(const CompiledUnitPtr& root)
{
    return InstructionAnalyzer{}.analyze(root);
}

} // namespace modgraph
