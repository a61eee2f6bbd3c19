/**
 * @file instruction.hpp
 */
#pragma once
#include "modgraph/common/common.hpp"

namespace modgraph
{

/**
 * @brief Closed set of instruction categories the analyzer distinguishes.
 *
 * @details
 * A loader maps the concrete instruction set of the scripting language onto these
 * categories. Anything the analyzer does not inspect, including local (fast) and cell
 * variable access, maps to `Other`.
 *
 * @par Operands
 * - `LoadConst`: index into the unit's constant pool.
 * - `ImportName`, `StoreName`, `StoreGlobal`, `LoadName`, `LoadGlobal`: index into the
 *   unit's names table.
 * - `LoadBuildClass`, `MakeFunction`, `Other`: operand is not inspected.
 */
enum class Opcode
{
    LoadConst,
    ImportName,
    StoreName,
    StoreGlobal,
    LoadName,
    LoadGlobal,
    LoadBuildClass,
    MakeFunction,
    Other
};

/**
 * @brief Returns the mnemonic of an opcode.
 */
inline const char* opcode_name(Opcode opcode) noexcept
{
    switch (opcode)
    {
    case Opcode::LoadConst:
        return "LOAD_CONST";
    case Opcode::ImportName:
        return "IMPORT_NAME";
    case Opcode::StoreName:
        return "STORE_NAME";
    case Opcode::StoreGlobal:
        return "STORE_GLOBAL";
    case Opcode::LoadName:
        return "LOAD_NAME";
    case Opcode::LoadGlobal:
        return "LOAD_GLOBAL";
    case Opcode::LoadBuildClass:
        return "LOAD_BUILD_CLASS";
    case Opcode::MakeFunction:
        return "MAKE_FUNCTION";
    case Opcode::Other:
        return "OTHER";
    }
    return "UNKNOWN";
}

/**
 * @brief True for opcodes whose operand indexes the names table.
 */
inline bool has_name_operand(Opcode opcode) noexcept
{
    switch (opcode)
    {
    case Opcode::ImportName:
    case Opcode::StoreName:
    case Opcode::StoreGlobal:
    case Opcode::LoadName:
    case Opcode::LoadGlobal:
        return true;
    case Opcode::LoadConst:
    case Opcode::LoadBuildClass:
    case Opcode::MakeFunction:
    case Opcode::Other:
        return false;
    }
    return false;
}

/**
 * @brief One decoded instruction.
 */
struct Instruction
{
    Opcode opcode{Opcode::Other};
    std::optional<std::uint32_t> arg;
};

inline bool operator==(const Instruction& lhs, const Instruction& rhs)
{
    return lhs.opcode == rhs.opcode && lhs.arg == rhs.arg;
}

inline bool operator!=(const Instruction& lhs, const Instruction& rhs)
{
    return !(lhs == rhs);
}

} // namespace modgraph
