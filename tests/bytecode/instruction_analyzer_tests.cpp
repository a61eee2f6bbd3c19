/**
 * @file instruction_analyzer_tests.cpp
 * @brief Unit tests for InstructionAnalyzer
 */
#include <gtest/gtest.h>
#include "modgraph/bytecode/instruction_analyzer.hpp"
#include "common/unit_fixtures.hpp"

#include <set>
#include <sstream>
#include <string>
#include <vector>

using namespace modgraph;
using namespace modgraph::fixtures;

namespace
{

std::vector<std::string> imported_modules(const AnalysisResult& result)
{
    std::vector<std::string> modules;
    for (const auto& record : result.imports)
    {
        modules.push_back(record.module);
    }
    return modules;
}

AnalysisErrorCode error_code_of(const CompiledUnitPtr& unit)
{
    try
    {
        analyze_unit(unit);
    }
    catch (const AnalysisError& e)
    {
        return e.code();
    }
    ADD_FAILURE() << "expected AnalysisError";
    return AnalysisErrorCode::InvalidArgument;
}

} // namespace

// ============================================================================
// Units without imports
// ============================================================================

TEST(InstructionAnalyzerTests, Empty_ModuleWithoutInstructions)
{
    CompiledUnitBuilder module("<module>");
    AnalysisResult result = analyze_unit(module.build());

    EXPECT_TRUE(result.imports.empty());
    EXPECT_TRUE(result.globals_written.empty());
    EXPECT_TRUE(result.globals_read.empty());
}

TEST(InstructionAnalyzerTests, Empty_NoImportInstructionsMeansNoImports)
{
    // x = 1; print(x); def f(): return y
    CompiledUnitBuilder f("f");
    f.emit_name(Opcode::LoadGlobal, "y");
    f.emit(Opcode::Other);

    CompiledUnitBuilder module("<module>");
    module.load_const(Constant::integer(1));
    module.emit_name(Opcode::StoreName, "x");
    module.emit_name(Opcode::LoadName, "print");
    module.emit_name(Opcode::LoadName, "x");
    module.emit(Opcode::Other);
    emit_function_def(module, f.build());
    emit_return_none(module);

    AnalysisResult result = analyze_unit(module.build());

    EXPECT_TRUE(result.imports.empty());
    EXPECT_EQ(result.globals_written, (std::set<std::string>{"x", "f"}));
    EXPECT_EQ(result.globals_read, (std::set<std::string>{"print", "x", "y"}));
}

// ============================================================================
// Module-level imports
// ============================================================================

TEST(InstructionAnalyzerTests, Module_PlainDottedImport)
{
    // import a.b.c
    CompiledUnitBuilder module("<module>");
    emit_plain_import(module, "a.b.c", "a");
    emit_return_none(module);

    AnalysisResult result = analyze_unit(module.build());

    ASSERT_EQ(result.imports.size(), 1u);
    const ImportRecord& record = result.imports[0];
    EXPECT_EQ(record.module, "a.b.c");
    EXPECT_EQ(record.level, 0);
    EXPECT_TRUE(record.names.empty());
    EXPECT_FALSE(record.has_star_import);
    EXPECT_FALSE(record.is_conditional);
    EXPECT_FALSE(record.is_optional());
    EXPECT_EQ(result.globals_written, (std::set<std::string>{"a"}));
}

TEST(InstructionAnalyzerTests, Module_FromImportBindsNamesGlobally)
{
    // from pkg.mod import alpha, beta
    CompiledUnitBuilder module("<module>");
    emit_import(module, "pkg.mod", 0, std::vector<std::string>{"alpha", "beta"});
    module.emit(Opcode::Other);  // IMPORT_FROM
    module.emit_name(Opcode::StoreName, "alpha");
    module.emit(Opcode::Other);  // IMPORT_FROM
    module.emit_name(Opcode::StoreName, "beta");
    module.emit(Opcode::Other);  // POP_TOP

    AnalysisResult result = analyze_unit(module.build());

    ASSERT_EQ(result.imports.size(), 1u);
    EXPECT_EQ(result.imports[0].names, (std::set<std::string>{"alpha", "beta"}));
    EXPECT_FALSE(result.imports[0].is_conditional);
    EXPECT_EQ(result.globals_written, (std::set<std::string>{"alpha", "beta"}));
}

TEST(InstructionAnalyzerTests, Module_FromImportNamesWrittenWithoutStores)
{
    // The explicit names count as module bindings even if no STORE follows.
    CompiledUnitBuilder module("<module>");
    emit_import(module, "pkg", 0, std::vector<std::string>{"gamma"});

    AnalysisResult result = analyze_unit(module.build());

    EXPECT_EQ(result.globals_written, (std::set<std::string>{"gamma"}));
}

TEST(InstructionAnalyzerTests, Module_StarImport)
{
    // from pkg import *
    CompiledUnitBuilder module("<module>");
    emit_import(module, "pkg", 0, std::vector<std::string>{"*"});
    module.emit(Opcode::Other);  // IMPORT_STAR

    AnalysisResult result = analyze_unit(module.build());

    ASSERT_EQ(result.imports.size(), 1u);
    EXPECT_EQ(result.imports[0].module, "pkg");
    EXPECT_TRUE(result.imports[0].has_star_import);
    EXPECT_TRUE(result.imports[0].names.empty());
    EXPECT_EQ(result.imports[0].names.count("*"), 0u);
    EXPECT_TRUE(result.globals_written.empty());
}

TEST(InstructionAnalyzerTests, Module_StarMixedWithNamesKeepsOnlyNames)
{
    CompiledUnitBuilder module("<module>");
    emit_import(module, "pkg", 0, std::vector<std::string>{"one", "*"});

    AnalysisResult result = analyze_unit(module.build());

    ASSERT_EQ(result.imports.size(), 1u);
    EXPECT_TRUE(result.imports[0].has_star_import);
    EXPECT_EQ(result.imports[0].names, (std::set<std::string>{"one"}));
    EXPECT_EQ(result.globals_written, (std::set<std::string>{"one"}));
}

TEST(InstructionAnalyzerTests, Module_RelativeImportLevel)
{
    // from ..sibling import thing
    CompiledUnitBuilder module("<module>");
    emit_import(module, "sibling", 2, std::vector<std::string>{"thing"});

    AnalysisResult result = analyze_unit(module.build());

    ASSERT_EQ(result.imports.size(), 1u);
    EXPECT_EQ(result.imports[0].module, "sibling");
    EXPECT_EQ(result.imports[0].level, 2);
}

TEST(InstructionAnalyzerTests, Module_RepeatedImportsAreNotDeduplicated)
{
    CompiledUnitBuilder module("<module>");
    emit_plain_import(module, "os", "os");
    emit_plain_import(module, "os", "os");

    AnalysisResult result = analyze_unit(module.build());

    ASSERT_EQ(result.imports.size(), 2u);
    EXPECT_EQ(result.imports[0], result.imports[1]);
}

// ============================================================================
// Function scope
// ============================================================================

TEST(InstructionAnalyzerTests, Function_RelativeFromImportIsConditional)
{
    // def f():
    //     from . import x
    CompiledUnitBuilder f("f");
    emit_import(f, "", 1, std::vector<std::string>{"x"});
    f.emit(Opcode::Other);  // IMPORT_FROM
    f.emit(Opcode::Other);  // STORE_FAST x
    emit_return_none(f);

    CompiledUnitBuilder module("<module>");
    emit_function_def(module, f.build());
    emit_return_none(module);

    AnalysisResult result = analyze_unit(module.build());

    ASSERT_EQ(result.imports.size(), 1u);
    const ImportRecord& record = result.imports[0];
    EXPECT_EQ(record.module, "");
    EXPECT_EQ(record.level, 1);
    EXPECT_EQ(record.names, (std::set<std::string>{"x"}));
    EXPECT_TRUE(record.is_conditional);
    EXPECT_TRUE(record.is_optional());
    EXPECT_EQ(result.globals_written.count("x"), 0u);
    EXPECT_EQ(result.globals_written, (std::set<std::string>{"f"}));
}

TEST(InstructionAnalyzerTests, Function_GlobalAccessIsTracked)
{
    // def f():
    //     global counter
    //     counter = limit
    CompiledUnitBuilder f("f");
    f.emit_name(Opcode::LoadGlobal, "limit");
    f.emit_name(Opcode::StoreGlobal, "counter");
    emit_return_none(f);

    CompiledUnitBuilder module("<module>");
    emit_function_def(module, f.build());

    AnalysisResult result = analyze_unit(module.build());

    EXPECT_EQ(result.globals_written, (std::set<std::string>{"f", "counter"}));
    EXPECT_EQ(result.globals_read, (std::set<std::string>{"limit"}));
}

TEST(InstructionAnalyzerTests, Function_NestedFunctionIsConditional)
{
    // def outer():
    //     def inner():
    //         import deep
    CompiledUnitBuilder inner("inner");
    emit_import(inner, "deep", 0, std::nullopt);
    inner.emit(Opcode::Other);

    CompiledUnitBuilder outer("outer");
    emit_function_def(outer, inner.build(), Opcode::Other);
    emit_return_none(outer);

    CompiledUnitBuilder module("<module>");
    emit_function_def(module, outer.build());

    AnalysisResult result = analyze_unit(module.build());

    ASSERT_EQ(result.imports.size(), 1u);
    EXPECT_EQ(result.imports[0].module, "deep");
    EXPECT_TRUE(result.imports[0].is_conditional);
}

TEST(InstructionAnalyzerTests, Function_DeepNestingDoesNotRecurse)
{
    constexpr int depth = 2000;

    CompiledUnitBuilder innermost("f" + std::to_string(depth));
    emit_import(innermost, "bottom", 0, std::nullopt);
    CompiledUnitPtr current = innermost.build();

    for (int level = depth - 1; level >= 1; --level)
    {
        CompiledUnitBuilder b("f" + std::to_string(level));
        emit_function_def(b, current, Opcode::Other);
        current = b.build();
    }

    CompiledUnitBuilder module("<module>");
    emit_function_def(module, current);

    AnalysisResult result = analyze_unit(module.build());

    ASSERT_EQ(result.imports.size(), 1u);
    EXPECT_EQ(result.imports[0].module, "bottom");
    EXPECT_TRUE(result.imports[0].is_conditional);
}

// ============================================================================
// Class scope
// ============================================================================

TEST(InstructionAnalyzerTests, Class_AssignmentsAreNotModuleGlobals)
{
    // LIMIT = 10
    // class Config:
    //     size = LIMIT
    //     name = other
    CompiledUnitBuilder body("Config");
    body.emit_name(Opcode::LoadName, "__name__");
    body.emit_name(Opcode::StoreName, "__module__");
    body.emit_name(Opcode::LoadGlobal, "LIMIT");
    body.emit_name(Opcode::StoreName, "size");
    body.emit_name(Opcode::LoadName, "other");
    body.emit_name(Opcode::StoreName, "name");
    body.emit_name(Opcode::StoreGlobal, "sneaky");
    emit_return_none(body);

    CompiledUnitBuilder module("<module>");
    module.load_const(Constant::integer(10));
    module.emit_name(Opcode::StoreName, "LIMIT");
    emit_class_def(module, body.build());
    emit_return_none(module);

    AnalysisResult result = analyze_unit(module.build());

    EXPECT_EQ(result.globals_written, (std::set<std::string>{"LIMIT", "Config"}));
    EXPECT_EQ(result.globals_written.count("size"), 0u);
    EXPECT_EQ(result.globals_written.count("__module__"), 0u);
    EXPECT_EQ(result.globals_written.count("sneaky"), 0u);

    // Global lookups from the class body count; class-namespace lookups do not.
    EXPECT_EQ(result.globals_read.count("LIMIT"), 1u);
    EXPECT_EQ(result.globals_read.count("other"), 0u);
    EXPECT_EQ(result.globals_read.count("__name__"), 0u);
}

TEST(InstructionAnalyzerTests, Class_ImportIsUnconditionalButNotGlobal)
{
    // class Holder:
    //     from pkg import helper
    CompiledUnitBuilder body("Holder");
    emit_import(body, "pkg", 0, std::vector<std::string>{"helper"});
    body.emit(Opcode::Other);
    body.emit_name(Opcode::StoreName, "helper");
    emit_return_none(body);

    CompiledUnitBuilder module("<module>");
    emit_class_def(module, body.build());

    AnalysisResult result = analyze_unit(module.build());

    ASSERT_EQ(result.imports.size(), 1u);
    EXPECT_FALSE(result.imports[0].is_conditional);
    EXPECT_EQ(result.imports[0].names, (std::set<std::string>{"helper"}));
    EXPECT_EQ(result.globals_written, (std::set<std::string>{"Holder"}));
}

TEST(InstructionAnalyzerTests, Class_MethodIsFunctionScope)
{
    // class Service:
    //     def run(self):
    //         import json
    //         return settings
    CompiledUnitBuilder run("Service.run");
    emit_import(run, "json", 0, std::nullopt);
    run.emit(Opcode::Other);
    run.emit_name(Opcode::LoadGlobal, "settings");
    run.emit(Opcode::Other);

    CompiledUnitBuilder body("Service");
    emit_function_def(body, run.build());
    emit_return_none(body);

    CompiledUnitBuilder module("<module>");
    emit_class_def(module, body.build());

    AnalysisResult result = analyze_unit(module.build());

    ASSERT_EQ(result.imports.size(), 1u);
    EXPECT_EQ(result.imports[0].module, "json");
    EXPECT_TRUE(result.imports[0].is_conditional);
    EXPECT_EQ(result.globals_read, (std::set<std::string>{"settings"}));
    EXPECT_EQ(result.globals_written, (std::set<std::string>{"Service"}));
}

TEST(InstructionAnalyzerTests, Class_InsideFunctionIsConditional)
{
    // def factory():
    //     class Local:
    //         import enum
    //         value = 1
    CompiledUnitBuilder body("factory.<locals>.Local");
    emit_import(body, "enum", 0, std::nullopt);
    body.emit_name(Opcode::StoreName, "enum");
    body.load_const(Constant::integer(1));
    body.emit_name(Opcode::StoreName, "value");
    emit_return_none(body);

    CompiledUnitBuilder factory("factory");
    emit_class_def(factory, body.build(), Opcode::Other);
    emit_return_none(factory);

    CompiledUnitBuilder module("<module>");
    emit_function_def(module, factory.build());

    AnalysisResult result = analyze_unit(module.build());

    ASSERT_EQ(result.imports.size(), 1u);
    EXPECT_TRUE(result.imports[0].is_conditional);
    EXPECT_EQ(result.globals_written, (std::set<std::string>{"factory"}));
}

TEST(InstructionAnalyzerTests, Class_NestedClassInClassIsClassScope)
{
    CompiledUnitBuilder inner("Outer.Inner");
    inner.emit_name(Opcode::StoreName, "attr");
    inner.emit_name(Opcode::LoadGlobal, "BASE");

    CompiledUnitBuilder outer("Outer");
    emit_class_def(outer, inner.build());

    CompiledUnitBuilder module("<module>");
    emit_class_def(module, outer.build());

    AnalysisResult result = analyze_unit(module.build());

    EXPECT_EQ(result.globals_written, (std::set<std::string>{"Outer"}));
    EXPECT_EQ(result.globals_read, (std::set<std::string>{"BASE"}));
}

// ============================================================================
// Discovery order and unit tree shape
// ============================================================================

TEST(InstructionAnalyzerTests, Order_ParentBeforeChildrenSiblingsInPoolOrder)
{
    CompiledUnitBuilder f("f");
    emit_import(f, "from_f", 0, std::nullopt);

    CompiledUnitBuilder g_inner("g.inner");
    emit_import(g_inner, "from_g_inner", 0, std::nullopt);

    CompiledUnitBuilder g("g");
    emit_function_def(g, g_inner.build(), Opcode::Other);
    emit_import(g, "from_g", 0, std::nullopt);

    CompiledUnitBuilder c("C");
    emit_import(c, "from_c", 0, std::nullopt);

    CompiledUnitBuilder module("<module>");
    emit_plain_import(module, "first", "first");
    emit_function_def(module, f.build());
    emit_function_def(module, g.build());
    emit_class_def(module, c.build());
    emit_plain_import(module, "last", "last");

    AnalysisResult result = analyze_unit(module.build());

    EXPECT_EQ(imported_modules(result),
              (std::vector<std::string>{"first", "last", "from_f", "from_g", "from_c",
                                        "from_g_inner"}));
}

TEST(InstructionAnalyzerTests, Tree_DuplicatedNestedUnitIsAnalyzedPerOccurrence)
{
    CompiledUnitBuilder shared("shared");
    emit_import(shared, "twice", 0, std::nullopt);
    CompiledUnitPtr shared_unit = shared.build();

    CompiledUnitBuilder module("<module>");
    emit_function_def(module, shared_unit);
    module.load_const(Constant::unit(shared_unit));
    module.load_const(Constant::string("shared_again"));
    module.emit(Opcode::MakeFunction, 0);
    module.emit_name(Opcode::StoreName, "shared_again");

    AnalysisResult result = analyze_unit(module.build());

    ASSERT_EQ(result.imports.size(), 2u);
    EXPECT_EQ(result.imports[0].module, "twice");
    EXPECT_EQ(result.imports[1].module, "twice");
    EXPECT_TRUE(result.imports[0].is_conditional);
    EXPECT_TRUE(result.imports[1].is_conditional);
}

TEST(InstructionAnalyzerTests, Tree_CodeConstantWithoutMakeFunctionUsesModuleSemantics)
{
    CompiledUnitBuilder stray("stray");
    emit_import(stray, "loose", 0, std::vector<std::string>{"bit"});

    CompiledUnitBuilder module("<module>");
    module.add_constant(Constant::unit(stray.build()));
    emit_return_none(module);

    AnalysisResult result = analyze_unit(module.build());

    ASSERT_EQ(result.imports.size(), 1u);
    EXPECT_FALSE(result.imports[0].is_conditional);
    EXPECT_EQ(result.globals_written, (std::set<std::string>{"bit"}));
}

// ============================================================================
// Configuration
// ============================================================================

TEST(InstructionAnalyzerTests, Config_TrackGlobalsOffLeavesNameSetsEmpty)
{
    CompiledUnitBuilder module("<module>");
    emit_import(module, "pkg", 0, std::vector<std::string>{"name"});
    module.emit_name(Opcode::StoreName, "name");
    module.emit_name(Opcode::LoadName, "name");

    AnalyzerConfig config;
    config.track_globals = false;
    InstructionAnalyzer analyzer(config);
    AnalysisResult result = analyzer.analyze(module.build());

    EXPECT_EQ(result.imports.size(), 1u);
    EXPECT_TRUE(result.globals_written.empty());
    EXPECT_TRUE(result.globals_read.empty());
}

TEST(InstructionAnalyzerTests, Config_UnitLimit)
{
    CompiledUnitBuilder f("f");
    CompiledUnitBuilder g("g");
    CompiledUnitBuilder module("<module>");
    emit_function_def(module, f.build());
    emit_function_def(module, g.build());
    CompiledUnitPtr root = module.build();

    AnalyzerConfig tight;
    tight.max_units = 2;
    try
    {
        InstructionAnalyzer(tight).analyze(root);
        FAIL() << "expected UnitLimitExceeded";
    }
    catch (const AnalysisError& e)
    {
        EXPECT_EQ(e.code(), AnalysisErrorCode::UnitLimitExceeded);
    }

    AnalyzerConfig exact;
    exact.max_units = 3;
    EXPECT_NO_THROW(InstructionAnalyzer(exact).analyze(root));
}

TEST(InstructionAnalyzerTests, Config_DefaultIsUnlimitedWithGlobals)
{
    InstructionAnalyzer analyzer;
    EXPECT_EQ(analyzer.config().max_units, 0u);
    EXPECT_TRUE(analyzer.config().track_globals);
}

// ============================================================================
// Malformed input
// ============================================================================

TEST(InstructionAnalyzerTests, Malformed_NullRoot)
{
    EXPECT_EQ(error_code_of(nullptr), AnalysisErrorCode::InvalidArgument);
}

TEST(InstructionAnalyzerTests, Malformed_ImportAtStartOfStream)
{
    CompiledUnitBuilder module("<module>");
    module.emit_name(Opcode::ImportName, "os");

    EXPECT_EQ(error_code_of(module.build()), AnalysisErrorCode::StructuralViolation);
}

TEST(InstructionAnalyzerTests, Malformed_ImportNotPrecededByTwoConstants)
{
    CompiledUnitBuilder module("<module>");
    module.load_const(Constant::integer(0));
    module.emit_name(Opcode::LoadName, "fromlist");
    module.emit_name(Opcode::ImportName, "os");

    EXPECT_EQ(error_code_of(module.build()), AnalysisErrorCode::StructuralViolation);
}

TEST(InstructionAnalyzerTests, Malformed_LevelIsNotAnInteger)
{
    CompiledUnitBuilder module("<module>");
    module.load_const(Constant::string("zero"));
    module.load_const(Constant::none());
    module.emit_name(Opcode::ImportName, "os");

    EXPECT_EQ(error_code_of(module.build()), AnalysisErrorCode::StructuralViolation);
}

TEST(InstructionAnalyzerTests, Malformed_NegativeLevel)
{
    CompiledUnitBuilder module("<module>");
    emit_import(module, "os", -1, std::nullopt);

    EXPECT_EQ(error_code_of(module.build()), AnalysisErrorCode::StructuralViolation);
}

TEST(InstructionAnalyzerTests, Malformed_FromlistIsAString)
{
    CompiledUnitBuilder module("<module>");
    module.load_const(Constant::integer(0));
    module.load_const(Constant::string("path"));
    module.emit_name(Opcode::ImportName, "os");

    EXPECT_EQ(error_code_of(module.build()), AnalysisErrorCode::StructuralViolation);
}

TEST(InstructionAnalyzerTests, Malformed_FromlistHoldsNonString)
{
    CompiledUnitBuilder module("<module>");
    module.load_const(Constant::integer(0));
    module.load_const(Constant::tuple({Constant::integer(3)}));
    module.emit_name(Opcode::ImportName, "os");

    EXPECT_EQ(error_code_of(module.build()), AnalysisErrorCode::StructuralViolation);
}

TEST(InstructionAnalyzerTests, Malformed_ConstantIndexOutOfRange)
{
    CompiledUnitBuilder module("<module>");
    module.emit(Opcode::LoadConst, 40);
    module.load_const(Constant::none());
    module.emit_name(Opcode::ImportName, "os");

    EXPECT_EQ(error_code_of(module.build()), AnalysisErrorCode::StructuralViolation);
}

TEST(InstructionAnalyzerTests, Malformed_NameIndexOutOfRange)
{
    CompiledUnitBuilder module("<module>");
    module.emit(Opcode::StoreName, 7);

    EXPECT_EQ(error_code_of(module.build()), AnalysisErrorCode::StructuralViolation);
}

TEST(InstructionAnalyzerTests, Malformed_NameInstructionWithoutOperand)
{
    CompiledUnitBuilder module("<module>");
    module.emit(Opcode::LoadGlobal);

    EXPECT_EQ(error_code_of(module.build()), AnalysisErrorCode::StructuralViolation);
}

TEST(InstructionAnalyzerTests, Malformed_MakeFunctionWithoutCodeConstant)
{
    CompiledUnitBuilder module("<module>");
    module.load_const(Constant::string("not code"));
    module.load_const(Constant::string("f"));
    module.emit(Opcode::MakeFunction, 0);

    EXPECT_EQ(error_code_of(module.build()), AnalysisErrorCode::StructuralViolation);
}

TEST(InstructionAnalyzerTests, Malformed_ViolationInNestedUnitNamesIt)
{
    CompiledUnitBuilder broken("broken_helper");
    broken.emit_name(Opcode::ImportName, "os");

    CompiledUnitBuilder module("<module>");
    emit_function_def(module, broken.build());

    try
    {
        analyze_unit(module.build());
        FAIL() << "expected StructuralViolation";
    }
    catch (const AnalysisError& e)
    {
        EXPECT_EQ(e.code(), AnalysisErrorCode::StructuralViolation);
        EXPECT_NE(std::string(e.what()).find("broken_helper"), std::string::npos);
    }
}

// ============================================================================
// AnalysisResult
// ============================================================================

TEST(InstructionAnalyzerTests, Result_MergeAppendsImportsAndUnitesNames)
{
    CompiledUnitBuilder first("first");
    emit_plain_import(first, "a", "a");
    CompiledUnitBuilder second("second");
    emit_plain_import(second, "b", "b");
    second.emit_name(Opcode::LoadName, "a");

    AnalysisResult merged = analyze_unit(first.build());
    merged.merge(analyze_unit(second.build()));

    EXPECT_EQ(imported_modules(merged), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(merged.globals_written, (std::set<std::string>{"a", "b"}));
    EXPECT_EQ(merged.globals_read, (std::set<std::string>{"a"}));
}

TEST(InstructionAnalyzerTests, Result_ImportRecordPrints)
{
    ImportRecord record;
    record.module = "pkg";
    record.level = 1;
    record.names = {"a", "b"};
    record.is_conditional = true;

    std::ostringstream oss;
    oss << record;
    EXPECT_EQ(oss.str(),
              "ImportRecord(module='pkg', level=1, names={a, b}, star=false, conditional=true)");
}
