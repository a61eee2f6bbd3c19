/**
 * @file compiled_unit.hpp
 * @brief In-memory model of a compiled unit and a builder for it.
 */
#pragma once
#include "modgraph/common/common.hpp"
#include "modgraph/bytecode/instruction.hpp"

namespace modgraph
{

class CompiledUnit;

/**
 * @brief Shared, immutable handle to a compiled unit.
 */
using CompiledUnitPtr = std::shared_ptr<const CompiledUnit>;

/**
 * @brief One entry of a compiled unit's constant pool.
 *
 * @details
 * A constant is none, a boolean, an integer, a float, a string, a tuple of constants,
 * or a nested compiled unit (the body of a function, class or comprehension defined
 * inside the owning unit). Constants are built through the named factories so that a
 * string literal never silently becomes a boolean.
 */
class Constant
{
public:
    using Tuple = std::vector<Constant>;
    using Value = std::variant<std::monostate, bool, std::int64_t, double, std::string, Tuple,
                               CompiledUnitPtr>;

    /**
     * @brief Default-constructed constant is none.
     */
    Constant() = default;

    static Constant none()
    {
        return Constant{};
    }

    static Constant boolean(bool value)
    {
        return Constant{Value{std::in_place_type<bool>, value}};
    }

    static Constant integer(std::int64_t value)
    {
        return Constant{Value{std::in_place_type<std::int64_t>, value}};
    }

    static Constant floating(double value)
    {
        return Constant{Value{std::in_place_type<double>, value}};
    }

    static Constant string(std::string value)
    {
        return Constant{Value{std::in_place_type<std::string>, std::move(value)}};
    }

    static Constant tuple(Tuple items)
    {
        return Constant{Value{std::in_place_type<Tuple>, std::move(items)}};
    }

    /**
     * @brief Tuple of strings, the shape of an import's explicit-name list.
     */
    static Constant string_tuple(const std::vector<std::string>& items);

    static Constant unit(CompiledUnitPtr unit)
    {
        return Constant{Value{std::in_place_type<CompiledUnitPtr>, std::move(unit)}};
    }

    bool is_none() const noexcept
    {
        return std::holds_alternative<std::monostate>(m_value);
    }

    bool is_integer() const noexcept
    {
        return std::holds_alternative<std::int64_t>(m_value);
    }

    bool is_tuple() const noexcept
    {
        return std::holds_alternative<Tuple>(m_value);
    }

    /**
     * @brief Returns the integer value, or nullptr if this is not an integer.
     */
    const std::int64_t* as_integer() const noexcept
    {
        return std::get_if<std::int64_t>(&m_value);
    }

    const std::string* as_string() const noexcept
    {
        return std::get_if<std::string>(&m_value);
    }

    const Tuple* as_tuple() const noexcept
    {
        return std::get_if<Tuple>(&m_value);
    }

    /**
     * @brief Returns the nested unit, or null if this is not a unit constant.
     */
    CompiledUnitPtr as_unit() const noexcept
    {
        if (auto p = std::get_if<CompiledUnitPtr>(&m_value))
        {
            return *p;
        }
        return nullptr;
    }

    /**
     * @brief Short name of the held alternative ("none", "int", "str", ...).
     */
    const char* kind_name() const noexcept;

    /**
     * @brief True if both constants are the same scalar (none, bool, int, float, str).
     * @note Tuples and units never compare equal here; the builder relies on this to
     *       keep every nested unit as its own pool entry.
     */
    bool same_scalar(const Constant& other) const noexcept;

private:
    explicit Constant(Value value)
        : m_value(std::move(value))
    {
    }

    Value m_value;
};

/**
 * @brief One function, class or module body worth of compiled instructions.
 *
 * @details
 * A compiled unit is produced by an external compiler/loader and is immutable. Its
 * constant pool may hold further compiled units; the analyzer discovers them from
 * there, so callers only supply the module-level unit.
 *
 * @par Checked access
 * `constant_at()` and `name_at()` validate the operand index and throw
 * `AnalysisError` with `StructuralViolation` when it is out of range, since an
 * out-of-range operand means the unit is corrupt.
 *
 * @par Thread safety
 * - Immutable after construction; concurrent reads are safe.
 */
class CompiledUnit
{
public:
    CompiledUnit(std::string name,
                 std::vector<Instruction> instructions,
                 std::vector<Constant> constants,
                 std::vector<std::string> names);

    const std::string& name() const noexcept
    {
        return m_name;
    }

    const std::vector<Instruction>& instructions() const noexcept
    {
        return m_instructions;
    }

    const std::vector<Constant>& constants() const noexcept
    {
        return m_constants;
    }

    const std::vector<std::string>& names() const noexcept
    {
        return m_names;
    }

    /**
     * @brief Get a constant pool entry.
     * @throw AnalysisError with `StructuralViolation` if `index` is out of range.
     */
    const Constant& constant_at(std::size_t index) const;

    /**
     * @brief Get a names table entry.
     * @throw AnalysisError with `StructuralViolation` if `index` is out of range.
     */
    const std::string& name_at(std::size_t index) const;

    /**
     * @brief The compiled units held directly in the constant pool, in pool order.
     */
    std::vector<CompiledUnitPtr> nested_units() const;

private:
    std::string m_name;
    std::vector<Instruction> m_instructions;
    std::vector<Constant> m_constants;
    std::vector<std::string> m_names;
};

/**
 * @brief Incremental construction of a `CompiledUnit`.
 *
 * @details
 * Used by loaders that decode a unit instruction by instruction. Scalar constants and
 * names are interned (adding an equal value again returns the existing index); tuple
 * and unit constants always get a fresh pool entry.
 *
 * @par Usage
 * @code
 * CompiledUnitBuilder b("<module>");
 * b.load_const(Constant::integer(0))
 *  .load_const(Constant::none())
 *  .emit_name(Opcode::ImportName, "os")
 *  .emit_name(Opcode::StoreName, "os");
 * CompiledUnitPtr unit = b.build();
 * @endcode
 */
class CompiledUnitBuilder
{
public:
    explicit CompiledUnitBuilder(std::string name);

    /**
     * @brief Add a constant to the pool.
     * @return The pool index of the constant.
     */
    std::uint32_t add_constant(Constant constant);

    /**
     * @brief Add a name to the names table.
     * @return The table index of the name.
     */
    std::uint32_t add_name(const std::string& name);

    /**
     * @brief Append an instruction without operand.
     */
    CompiledUnitBuilder& emit(Opcode opcode);

    /**
     * @brief Append an instruction with a raw operand.
     * @note The operand is not validated here; an out-of-range operand is reported
     *       when the unit is analyzed.
     */
    CompiledUnitBuilder& emit(Opcode opcode, std::uint32_t arg);

    /**
     * @brief Add `constant` to the pool and append a `LoadConst` for it.
     */
    CompiledUnitBuilder& load_const(Constant constant);

    /**
     * @brief Add `name` to the names table and append `opcode` referring to it.
     * @throw std::invalid_argument if `opcode` does not take a name operand.
     */
    CompiledUnitBuilder& emit_name(Opcode opcode, const std::string& name);

    std::size_t instruction_count() const noexcept
    {
        return m_instructions.size();
    }

    /**
     * @brief Produce the immutable unit. The builder may keep being used afterwards.
     */
    CompiledUnitPtr build() const;

private:
    std::string m_name;
    std::vector<Instruction> m_instructions;
    std::vector<Constant> m_constants;
    std::vector<std::string> m_names;
    std::unordered_map<std::string, std::uint32_t> m_name_index;
};

} // namespace modgraph
