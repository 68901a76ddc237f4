#include <iostream>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

#include "Context.hpp"
#include "Names.hpp"
#include "SyntaxTree.hpp"
#include "TreeMaker.hpp"
#include "TreeMutator.hpp"
#include "TreePrinter.hpp"

int main(int argc, char **argv)
{
    using namespace Annotrace;

    spdlog::set_level(spdlog::level::debug);

    Context context;
    const TreeMaker & maker = *TreeMaker::instance(context);
    Names & names = *Names::instance(context);

    // package com.example;
    // import java.util.List;
    // public class Widget { void resize(int w, int h) { a(); b(); } Widget(int x) { super(); init(); } }
    CompilationUnit unit("Widget.java");
    NodeId listImport = maker.importDecl(unit, "java.util.List");
    NodeId body = maker.block
    (
        unit,
        {
            maker.verbatim(unit, "a();", VerbatimKind::Statement),
            maker.verbatim(unit, "b();", VerbatimKind::Statement)
        }
    );
    NodeId method = maker.methodDef
    (
        unit,
        MethodDefData
        {
            .name = names.fromString("resize"),
            .header = "void resize(int w, int h)",
            .params = {{"int", names.fromString("w")}, {"int", names.fromString("h")}},
            .body = body
        }
    );
    NodeId ctorBody = maker.block
    (
        unit,
        {
            maker.verbatim(unit, "super();", VerbatimKind::ConstructorCall),
            maker.verbatim(unit, "init();", VerbatimKind::Statement)
        }
    );
    NodeId ctor = maker.methodDef
    (
        unit,
        MethodDefData
        {
            .name = names.fromString("Widget"),
            .header = "Widget(int x)",
            .params = {{"int", names.fromString("x")}},
            .body = ctorBody,
            .isConstructor = true
        }
    );
    NodeId cls = maker.classDef
    (
        unit,
        ClassDefData{.name = names.fromString("Widget"), .header = "public class Widget", .members = {method, ctor}}
    );
    unit.setRoot(maker.topLevel(unit, "com.example", {listImport, cls}));

    if (unit.at(body).parent != method || unit.at(method).parent != cls || unit.at(cls).parent != unit.root())
    {
        std::cout << "Parents were not adopted" << std::endl;
        return 1;
    }

    auto statement = [&](std::string text)
    {
        SyntaxTree fragment;
        fragment.setRoot(maker.verbatim(fragment, std::move(text), VerbatimKind::Statement));
        return fragment;
    };

    // Head insertions keep their call order ahead of the original statements
    TreeMutator::insertStatementAtHead(unit, body, method, statement("first();"));
    TreeMutator::insertStatementAtHead(unit, body, method, statement("second();"));
    // super() stays first in a constructor
    TreeMutator::insertStatementAtHead(unit, ctorBody, ctor, statement("first();"));

    // Grafted fragments are remapped and adopted
    SyntaxTree call;
    call.setRoot(maker.exec(call, maker.apply(call, maker.ident(call, names.fromString("go")), {})));
    std::size_t sizeBefore = unit.size();
    NodeId grafted = unit.graft(std::move(call));
    if (unit.size() != sizeBefore + 3 || unit.at(grafted).tag() != Tag::Exec)
    {
        std::cout << "Graft did not append the fragment" << std::endl;
        return 1;
    }
    NodeId apply = unit.get<ExecData>(grafted).expr;
    if (unit.at(apply).parent != grafted || TreePrinter::print(unit, grafted) != "go();")
    {
        std::cout << "Grafted fragment is broken: " << TreePrinter::print(unit, grafted) << std::endl;
        return 1;
    }

    // Imports: idempotent, skipped for the unit's own package, placed after the last import
    bool added = TreeMutator::addImport(maker, unit, "org.slf4j", "Logger");
    bool addedAgain = TreeMutator::addImport(maker, unit, "org.slf4j", "Logger");
    bool addedSamePackage = TreeMutator::addImport(maker, unit, "com.example", "Helper");
    TreeMutator::addImport(maker, unit, "org.slf4j", "LoggerFactory");
    if (!added || addedAgain || addedSamePackage)
    {
        std::cout << "Unexpected addImport results: " << added << addedAgain << addedSamePackage << std::endl;
        return 1;
    }

    std::string expected =
R"(package com.example;

import java.util.List;
import org.slf4j.Logger;
import org.slf4j.LoggerFactory;

public class Widget {
    void resize(int w, int h) {
        first();
        second();
        a();
        b();
    }

    Widget(int x) {
        super();
        first();
        init();
    }
}
)";
    std::string result = TreePrinter::print(unit);
    if (result != expected)
    {
        std::cout << "Test failed!" << std::endl;
        std::cout << "Expected: \n" << expected << std::endl;
        std::cout << "Got: \n" << result << std::endl;
        return 1;
    }

    // Comments ahead of this(...) do not push the insertions in front of it
    CompilationUnit gadget("Gadget.java");
    NodeId gadgetBody = maker.block
    (
        gadget,
        {
            maker.verbatim(gadget, "// delegate", VerbatimKind::Comment),
            maker.verbatim(gadget, "/* to the default */", VerbatimKind::Comment),
            maker.verbatim(gadget, "this(0);", VerbatimKind::ConstructorCall),
            maker.verbatim(gadget, "init();", VerbatimKind::Statement)
        }
    );
    NodeId gadgetCtor = maker.methodDef
    (
        gadget,
        MethodDefData{.name = names.fromString("Gadget"), .header = "Gadget()", .body = gadgetBody, .isConstructor = true}
    );
    NodeId gadgetClass = maker.classDef
    (
        gadget,
        ClassDefData{.name = names.fromString("Gadget"), .header = "class Gadget", .members = {gadgetCtor}}
    );
    NodeId loggerClass = maker.classDef
    (
        gadget,
        ClassDefData{.name = names.fromString("Logger"), .header = "class Logger"}
    );
    NodeId loggingImport = maker.importDecl(gadget, "java.util.logging.Handler");
    gadget.setRoot(maker.topLevel(gadget, "com.example", {loggingImport, gadgetClass, loggerClass}));
    TreeMutator::insertStatementAtHead(gadget, gadgetBody, gadgetCtor, statement("first();"));
    TreeMutator::insertStatementAtHead(gadget, gadgetBody, gadgetCtor, statement("second();"));
    std::string gadgetExpected = "{\n    // delegate\n    /* to the default */\n    this(0);\n    first();\n    second();\n    init();\n}";
    if (TreePrinter::print(gadget, gadgetBody) != gadgetExpected)
    {
        std::cout << "Insertions landed before this(...):\n" << TreePrinter::print(gadget, gadgetBody) << std::endl;
        return 1;
    }

    // A simple name already bound by an import or a top-level type is not imported again
    bool clashesWithImport = TreeMutator::addImport(maker, gadget, "org.slf4j", "Handler");
    bool clashesWithType = TreeMutator::addImport(maker, gadget, "org.slf4j", "Logger");
    bool distinct = TreeMutator::addImport(maker, gadget, "org.slf4j", "LoggerFactory");
    if (clashesWithImport || clashesWithType || !distinct || gadget.topLevel().defs.size() != 4)
    {
        std::cout << "Unexpected addImport results on clashing names: "
            << clashesWithImport << clashesWithType << distinct << std::endl;
        return 1;
    }

    // Misuse is reported, not tolerated
    try
    {
        TreeMutator::insertStatementAtHead(unit, ctorBody, method, statement("x();"));
        std::cout << "Inserted into a body of another method" << std::endl;
        return 1;
    }
    catch (const std::invalid_argument & e)
    {
        std::cout << "Rejected: " << e.what() << std::endl;
    }
    try
    {
        SyntaxTree ident;
        ident.setRoot(maker.ident(ident, names.fromString("x")));
        TreeMutator::insertStatementAtHead(unit, body, method, std::move(ident));
        std::cout << "Inserted an expression as a statement" << std::endl;
        return 1;
    }
    catch (const std::invalid_argument & e)
    {
        std::cout << "Rejected: " << e.what() << std::endl;
    }
    try
    {
        unit.get<BlockData>(method);
        std::cout << "Tag mismatch went unnoticed" << std::endl;
        return 1;
    }
    catch (const std::invalid_argument & e)
    {
        std::cout << "Rejected: " << e.what() << std::endl;
    }
    try
    {
        unit.at(static_cast<NodeId>(unit.size()));
        std::cout << "Out of range id went unnoticed" << std::endl;
        return 1;
    }
    catch (const std::out_of_range & e)
    {
        std::cout << "Rejected: " << e.what() << std::endl;
    }

    std::cout << "Test passed!" << std::endl;
    return 0;
}
