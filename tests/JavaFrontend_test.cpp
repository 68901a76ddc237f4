#include <iostream>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "Context.hpp"
#include "SyntaxTree.hpp"
#include "JavaFrontend.hpp"
#include "TreePrinter.hpp"

using namespace Annotrace;

const std::string WidgetSource = R"(package com.example;

import java.util.List;
import static java.util.Collections.emptyList;
import org.legacy.*;

/** Widgets. */
public class Widget extends Base implements Runnable {
    private int size = 0;

    @Deprecated
    public Widget(int size) {
        // delegate
        /* to the base */
        super(size);
        this.size = size;
    }

    @Deprecated
    public void resize(int w, int h) {
        size = w * h;
    }

    @Override
    public void run() {
    }

    public static void log(String fmt, Object... args) {
        System.out.println(fmt);
    }

    interface Listener {
        @java.lang.Deprecated
        void onEvent(String e);
    }

    enum Mode {
        ON, // on
        OFF // off
        ;

        @Deprecated
        boolean active() { return this == ON; }
    }
}
)";

int main(int argc, char **argv)
{
    spdlog::set_level(spdlog::level::debug);

    Context context;
    JavaFrontend frontend(context);
    CompilationUnit unit = frontend.parseSource(WidgetSource, "com/example/Widget.java");

    const std::vector<NodeId> & defs = unit.topLevel().defs;
    if (unit.packageName() != "com.example" || defs.size() != 5)
    {
        std::cout << "Unexpected top level: package " << unit.packageName() << ", " << defs.size() << " defs" << std::endl;
        return 1;
    }

    // Imports: plain, static, on demand
    const ImportData & listImport = unit.get<ImportData>(defs[0]);
    const ImportData & staticImport = unit.get<ImportData>(defs[1]);
    const ImportData & onDemand = unit.get<ImportData>(defs[2]);
    if (listImport.qualifiedName != "java.util.List" || listImport.isStatic
        || staticImport.qualifiedName != "java.util.Collections.emptyList" || !staticImport.isStatic
        || onDemand.qualifiedName != "org.legacy.*" || onDemand.isStatic)
    {
        std::cout << "Imports were not lowered" << std::endl;
        return 1;
    }
    if (unit.get<VerbatimData>(defs[3]).text != "/** Widgets. */")
    {
        std::cout << "Top-level comment was not kept" << std::endl;
        return 1;
    }

    const ClassDefData & widget = unit.get<ClassDefData>(defs[4]);
    if (widget.name.str() != "Widget"
        || widget.header != "public class Widget extends Base implements Runnable"
        || !widget.annotations.empty()
        || widget.members.size() != 7)
    {
        std::cout << "Unexpected class: " << widget.header << " with " << widget.members.size() << " members" << std::endl;
        return 1;
    }

    // Field stays verbatim
    if (unit.get<VerbatimData>(widget.members[0]).text != "private int size = 0;")
    {
        std::cout << "Field was not kept verbatim" << std::endl;
        return 1;
    }

    // Constructor: comments and the super(...) call are told apart
    const MethodDefData & ctor = unit.get<MethodDefData>(widget.members[1]);
    if (!ctor.isConstructor
        || ctor.name.str() != "Widget"
        || ctor.header != "@Deprecated\n    public Widget(int size)"
        || ctor.annotations != std::vector<std::string>{"Deprecated"}
        || ctor.params.size() != 1 || ctor.params[0].type != "int" || ctor.params[0].name.str() != "size")
    {
        std::cout << "Unexpected constructor: " << ctor.header << std::endl;
        return 1;
    }
    const BlockData & ctorBody = unit.get<BlockData>(ctor.body);
    std::vector<VerbatimKind> expectedKinds =
    {
        VerbatimKind::Comment,
        VerbatimKind::Comment,
        VerbatimKind::ConstructorCall,
        VerbatimKind::Statement
    };
    if (ctorBody.stats.size() != expectedKinds.size())
    {
        std::cout << "Constructor body has " << ctorBody.stats.size() << " statements" << std::endl;
        return 1;
    }
    for (std::size_t i = 0; i < expectedKinds.size(); ++i)
    {
        if (unit.get<VerbatimData>(ctorBody.stats[i]).kind != expectedKinds[i])
        {
            std::cout << "Wrong kind for " << unit.get<VerbatimData>(ctorBody.stats[i]).text << std::endl;
            return 1;
        }
    }
    if (unit.get<VerbatimData>(ctorBody.stats[0]).text != "// delegate"
        || unit.get<VerbatimData>(ctorBody.stats[2]).text != "super(size);")
    {
        std::cout << "Constructor statements were not kept verbatim" << std::endl;
        return 1;
    }

    const MethodDefData & resize = unit.get<MethodDefData>(widget.members[2]);
    if (resize.isConstructor
        || resize.params.size() != 2 || resize.params[1].name.str() != "h"
        || unit.get<BlockData>(resize.body).stats.size() != 1)
    {
        std::cout << "Unexpected method: " << resize.header << std::endl;
        return 1;
    }

    const MethodDefData & run = unit.get<MethodDefData>(widget.members[3]);
    if (run.annotations != std::vector<std::string>{"Override"} || !unit.get<BlockData>(run.body).stats.empty())
    {
        std::cout << "Unexpected method: " << run.header << std::endl;
        return 1;
    }

    // Varargs keep their ellipsis in the type
    const MethodDefData & log = unit.get<MethodDefData>(widget.members[4]);
    if (log.params.size() != 2
        || log.params[0].type != "String"
        || log.params[1].type != "Object..."
        || log.params[1].name.str() != "args")
    {
        std::cout << "Varargs were not lowered" << std::endl;
        return 1;
    }

    // Nested interface: a method without a body keeps its full text
    const ClassDefData & listener = unit.get<ClassDefData>(widget.members[5]);
    if (listener.name.str() != "Listener" || listener.members.size() != 1)
    {
        std::cout << "Nested interface was not lowered" << std::endl;
        return 1;
    }
    const MethodDefData & onEvent = unit.get<MethodDefData>(listener.members[0]);
    if (onEvent.body != NoNode
        || onEvent.annotations != std::vector<std::string>{"java.lang.Deprecated"}
        || !onEvent.header.ends_with("void onEvent(String e);"))
    {
        std::cout << "Unexpected interface method: " << onEvent.header << std::endl;
        return 1;
    }

    // Enum constants stay one member; a comment after the last one is kept on its own
    const ClassDefData & mode = unit.get<ClassDefData>(widget.members[6]);
    if (mode.header != "enum Mode" || mode.members.size() != 3)
    {
        std::cout << "Unexpected enum: " << mode.header << " with " << mode.members.size() << " members" << std::endl;
        return 1;
    }
    if (unit.get<VerbatimData>(mode.members[0]).text != "ON, // on\n        OFF;"
        || unit.get<VerbatimData>(mode.members[1]).text != "// off"
        || unit.get<MethodDefData>(mode.members[2]).name.str() != "active")
    {
        std::cout << "Enum body was not lowered: " << unit.get<VerbatimData>(mode.members[0]).text << std::endl;
        return 1;
    }

    // The printed unit is valid Java again, with the same shape
    std::string printed = TreePrinter::print(unit);
    std::cout << printed << std::endl;
    CompilationUnit reparsed = frontend.parseSource(printed, "com/example/Widget.java");
    if (reparsed.topLevel().defs.size() != defs.size()
        || reparsed.get<ClassDefData>(reparsed.topLevel().defs[4]).members.size() != widget.members.size()
        || TreePrinter::print(reparsed) != printed)
    {
        std::cout << "Printed unit does not parse back to itself:\n" << TreePrinter::print(reparsed) << std::endl;
        return 1;
    }

    // Records and their compact constructors
    CompilationUnit record = frontend.parseSource
    (
        "record Point(int x, int y) {\n    @Deprecated\n    Point {\n        check(x);\n    }\n}\n",
        "Point.java"
    );
    const ClassDefData & point = record.get<ClassDefData>(record.topLevel().defs[0]);
    const MethodDefData & compact = record.get<MethodDefData>(point.members[0]);
    if (!record.packageName().empty()
        || point.header != "record Point(int x, int y)"
        || !compact.isConstructor || compact.name.str() != "Point" || !compact.params.empty())
    {
        std::cout << "Record was not lowered: " << point.header << std::endl;
        return 1;
    }

    // Syntax errors are reported with their position
    try
    {
        frontend.parseSource("class Broken { void f( { }", "Broken.java");
        std::cout << "Accepted a broken source" << std::endl;
        return 1;
    }
    catch (const JavaSyntaxError & e)
    {
        std::cout << "Rejected: " << e.what() << std::endl;
    }

    std::cout << "Test passed!" << std::endl;
    return 0;
}
