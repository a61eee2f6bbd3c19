/**
 * @file compiled_unit.cpp
 */
#include "modgraph/bytecode/compiled_unit.hpp"
#include "modgraph/bytecode/analysis_exceptions.hpp"

namespace modgraph
{

// ============================================================================
// Constant
// ============================================================================

Constant Constant::string_tuple(const std::vector<std::string>& items)
{
    Tuple tuple;
    tuple.reserve(items.size());
    for (const auto& item : items)
    {
        tuple.push_back(Constant::string(item));
    }
    return Constant::tuple(std::move(tuple));
}

const char* Constant::kind_name() const noexcept
{
    switch (m_value.index())
    {
    case 0:
        return "none";
    case 1:
        return "bool";
    case 2:
        return "int";
    case 3:
        return "float";
    case 4:
        return "str";
    case 5:
        return "tuple";
    case 6:
        return "code";
    default:
        return "invalid";
    }
}

bool Constant::same_scalar(const Constant& other) const noexcept
{
    if (m_value.index() != other.m_value.index())
    {
        return false;
    }
    switch (m_value.index())
    {
    case 0:
        return true;
    case 1:
        return std::get<bool>(m_value) == std::get<bool>(other.m_value);
    case 2:
        return std::get<std::int64_t>(m_value) == std::get<std::int64_t>(other.m_value);
    case 3:
        return std::get<double>(m_value) == std::get<double>(other.m_value);
    case 4:
        return std::get<std::string>(m_value) == std::get<std::string>(other.m_value);
    default:
        return false;
    }
}

// ============================================================================
// CompiledUnit
// ============================================================================

CompiledUnit::CompiledUnit(std::string name,
                           std::vector<Instruction> instructions,
                           std::vector<Constant> constants,
                           std::vector<std::string> names)
    : m_name(std::move(name))
    , m_instructions(std::move(instructions))
    , m_constants(std::move(constants))
    , m_names(std::move(names))
{
}

const Constant& CompiledUnit::constant_at(std::size_t index) const
{
    if (index >= m_constants.size())
    {
        throw AnalysisError(
            AnalysisErrorCode::StructuralViolation,
            "Unit '" + m_name + "': constant index " + std::to_string(index) +
                " out of range [0, " + std::to_string(m_constants.size()) + ")");
    }
    return m_constants[index];
}

const std::string& CompiledUnit::name_at(std::size_t index) const
{
    if (index >= m_names.size())
    {
        throw AnalysisError(
            AnalysisErrorCode::StructuralViolation,
            "Unit '" + m_name + "': name index " + std::to_string(index) +
                " out of range [0, " + std::to_string(m_names.size()) + ")");
    }
    return m_names[index];
}

std::vector<CompiledUnitPtr> CompiledUnit::nested_units() const
{
    std::vector<CompiledUnitPtr> units;
    for (const auto& constant : m_constants)
    {
        if (auto unit = constant.as_unit())
        {
            units.push_back(std::move(unit));
        }
    }
    return units;
}

// ============================================================================
// CompiledUnitBuilder
// ============================================================================

CompiledUnitBuilder::CompiledUnitBuilder(std::string name)
    : m_name(std::move(name))
{
}

std::uint32_t CompiledUnitBuilder::add_constant(Constant constant)
{
    for (std::size_t idx = 0; idx < m_constants.size(); ++idx)
    {
        if (m_constants[idx].same_scalar(constant))
        {
            return static_cast<std::uint32_t>(idx);
        }
    }
    m_constants.push_back(std::move(constant));
    return static_cast<std::uint32_t>(m_constants.size() - 1);
}

std::uint32_t CompiledUnitBuilder::add_name(const std::string& name)
{
    auto it = m_name_index.find(name);
    if (it != m_name_index.end())
    {
        return it->second;
    }
    auto index = static_cast<std::uint32_t>(m_names.size());
    m_names.push_back(name);
    m_name_index.emplace(name, index);
    return index;
}

CompiledUnitBuilder& CompiledUnitBuilder::emit(Opcode opcode)
{
    m_instructions.push_back(Instruction{opcode, std::nullopt});
    return *this;
}

CompiledUnitBuilder& CompiledUnitBuilder::emit(Opcode opcode, std::uint32_t arg)
{
    m_instructions.push_back(Instruction{opcode, arg});
    return *this;
}

CompiledUnitBuilder& CompiledUnitBuilder::load_const(Constant constant)
{
    return emit(Opcode::LoadConst, add_constant(std::move(constant)));
}

CompiledUnitBuilder& CompiledUnitBuilder::emit_name(Opcode opcode, const std::string& name)
{
    if (!has_name_operand(opcode))
    {
        throw std::invalid_argument(std::string("CompiledUnitBuilder::emit_name: ") +
                                    opcode_name(opcode) + " does not take a name operand");
    }
    return emit(opcode, add_name(name));
}

CompiledUnitPtr CompiledUnitBuilder::build() const
{
    return std::make_shared<CompiledUnit>(m_name, m_instructions, m_constants, m_names);
}

} // namespace modgraph
