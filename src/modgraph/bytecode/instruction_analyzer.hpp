/**
 * @file instruction_analyzer.hpp
 */
#pragma once
#include "modgraph/common/common.hpp"
#include "modgraph/bytecode/analysis_exceptions.hpp"
#include "modgraph/bytecode/analysis_result.hpp"
#include "modgraph/bytecode/compiled_unit.hpp"

namespace modgraph
{

/**
 * @brief Configuration for analyzer behavior.
 */
struct AnalyzerConfig
{
    /**
     * @brief Maximum number of compiled units to analyze in one call.
     * @details 0 means unlimited. When the unit tree has more units than this,
     *          `analyze()` throws `AnalysisError` with `UnitLimitExceeded`.
     */
    std::size_t max_units{0};

    /**
     * @brief Whether to collect `globals_written` and `globals_read`.
     * @details If false, only imports are reported and both name sets stay empty.
     */
    bool track_globals{true};
};

/**
 * @brief Extracts imports and module-level name usage from a compiled unit tree.
 *
 * @details
 * `analyze()` walks the root unit and every unit reachable through constant pools,
 * breadth-first with an explicit queue, so arbitrarily deep nesting does not grow the
 * call stack. Each unit's instruction stream is scanned once, left to right; operands
 * of an instruction are recovered from the instructions at fixed offsets before it:
 *
 * - `IMPORT_NAME` is preceded by `LOAD_CONST level` and `LOAD_CONST fromlist`.
 * - `MAKE_FUNCTION` is preceded by `LOAD_CONST code` and `LOAD_CONST qualname`, and
 *   for a class body by `LOAD_BUILD_CLASS` one instruction earlier still.
 *
 * The scope kind of a nested unit is decided when its parent's `MAKE_FUNCTION` is
 * seen, and recorded in a side table keyed by unit identity. A unit inside a function
 * (at any depth) is treated as function code for conditionality, even when it is a
 * class body.
 *
 * @par Name tracking
 * - Stores (`STORE_NAME`, `STORE_GLOBAL`) count as module writes except in class
 *   bodies.
 * - Loads (`LOAD_NAME`, `LOAD_GLOBAL`) count as module reads, except `LOAD_NAME` in a
 *   class body, which resolves through the class namespace first.
 * - `from X import a, b` at module scope also writes `a` and `b`.
 *
 * @par Thread safety
 * - `analyze()` is const and keeps all working state on its own stack; concurrent
 *   calls on the same analyzer are safe.
 */
class InstructionAnalyzer
{
public:
    explicit InstructionAnalyzer(AnalyzerConfig config = AnalyzerConfig{});

    const AnalyzerConfig& config() const noexcept
    {
        return m_config;
    }

    /**
     * @brief Analyze a module-level compiled unit and everything nested in it.
     * @param root The module (or script) unit.
     * @return Imports in discovery order and module-level name sets.
     * @throw AnalysisError with `InvalidArgument` if `root` is null,
     *        `StructuralViolation` if an instruction stream breaks the operand layout
     *        described above, or `UnitLimitExceeded` if `max_units` is exceeded.
     */
    AnalysisResult analyze(const CompiledUnitPtr& root) const;

private:
    AnalyzerConfig m_config;
};

/**
 * @brief Analyze `root` with a default-configured analyzer.
 */
AnalysisResult analyze_unit(const CompiledUnitPtr& root);

} // namespace modgraph
