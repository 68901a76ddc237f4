// Lowers Java sources into compilation units.
// Parsing is done by tree-sitter-java. Declarations down to method bodies are modelled; statements and
// members that are not methods or types are kept as verbatim source text.

#ifndef ANNOTRACE_JAVAFRONTEND_HPP
#define ANNOTRACE_JAVAFRONTEND_HPP

#include <filesystem>
#include <format>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

#include "Util.hpp"
#include "Context.hpp"
#include "Names.hpp"
#include "SyntaxTree.hpp"
#include "TreeMaker.hpp"
#include "TreeSitter.hpp"
#include "TreeSitterJava.hpp"

namespace Annotrace
{

class JavaSyntaxError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

class JavaFrontend
{
public:
    explicit JavaFrontend(Context & context)
        : java(), parser(java), treeMaker(*TreeMaker::instance(context)), names(*Names::instance(context))
    {
    }

    CompilationUnit parseFile(const std::filesystem::path & path)
    {
        return parseSource(loadFileToString(path), path);
    }

    CompilationUnit parseSource(std::string source, const std::filesystem::path & sourcePath)
    {
        TSTree tree = parser.parseString(std::move(source));
        TSNode program = tree.rootNode();
        if (TSNode error = program.firstErrorNode())
        {
            std::string_view text = error.textView().substr(0, 40);
            throw JavaSyntaxError
            (
                std::format("{}:{}: syntax error near \"{}\"", sourcePath.string(), error.startPoint().toString(), text)
            );
        }

        CompilationUnit unit(sourcePath);
        std::string packageName;
        std::vector<NodeId> defs;
        for (const TSNode & child : program.namedChildren())
        {
            if (child.isSymbol(java.package_declaration_s))
            {
                packageName = qualifiedNameOf(child);
            }
            else if (child.isSymbol(java.import_declaration_s))
            {
                defs.push_back(lowerImport(unit, child));
            }
            else if (java.isTypeDeclaration(child))
            {
                defs.push_back(lowerType(unit, child));
            }
            else
            {
                defs.push_back(treeMaker.verbatim(unit, child.text(), VerbatimKind::Declaration));
            }
        }
        unit.setRoot(treeMaker.topLevel(unit, std::move(packageName), std::move(defs)));

        SPDLOG_DEBUG("Lowered {} into {} nodes", sourcePath.string(), unit.size());
        return unit;
    }

private:
    Java java;
    TSParser parser;
    const TreeMaker & treeMaker;
    Names & names;

    static std::string_view trimRight(std::string_view text)
    {
        std::size_t end = text.find_last_not_of(" \t\r\n");
        return end == std::string_view::npos ? std::string_view() : text.substr(0, end + 1);
    }

    // Source text from the start of node up to (excluding) stop
    static std::string textUntil(const TSNode & node, const TSNode & stop)
    {
        std::string_view source = node.getSource();
        return std::string(trimRight(source.substr(node.startByte(), stop.startByte() - node.startByte())));
    }

    // Text of the identifier or scoped_identifier naming a package or import
    std::string qualifiedNameOf(const TSNode & declaration) const
    {
        for (const TSNode & child : declaration.namedChildren())
        {
            if (child.isSymbol(java.identifier_s) || child.isSymbol(java.scoped_identifier_s))
            {
                return child.text();
            }
        }
        throw JavaSyntaxError(std::format("No name in \"{}\"", declaration.text()));
    }

    NodeId lowerImport(CompilationUnit & unit, const TSNode & node) const
    {
        std::string qualifiedName = qualifiedNameOf(node);
        bool isStatic = false;
        for (const TSNode & child : node.children())
        {
            if (child.type() == "static") isStatic = true;
            if (child.isSymbol(java.asterisk_s)) qualifiedName += ".*";
        }
        return treeMaker.importDecl(unit, std::move(qualifiedName), isStatic);
    }

    // Annotation names as spelt on the declaration, e.g. "Deprecated" or "java.lang.Deprecated"
    std::vector<std::string> annotationsOf(const TSNode & declaration) const
    {
        std::vector<std::string> annotations;
        for (const TSNode & child : declaration.namedChildren())
        {
            if (!child.isSymbol(java.modifiers_s)) continue;
            for (const TSNode & modifier : child.namedChildren())
            {
                if (modifier.isSymbol(java.marker_annotation_s) || modifier.isSymbol(java.annotation_s))
                {
                    annotations.push_back(modifier.childByFieldId(java.annotation_s.name_f).text());
                }
            }
        }
        return annotations;
    }

    NodeId lowerType(CompilationUnit & unit, const TSNode & node)
    {
        TSNode nameNode = node.childByFieldId(java.class_declaration_s.name_f);
        TSNode body = node.childByFieldId(java.class_declaration_s.body_f);
        if (!nameNode || !body)
        {
            throw JavaSyntaxError
            (
                std::format("{}: incomplete {}", node.startPoint().toString(), node.type())
            );
        }

        std::vector<NodeId> members;
        if (body.isSymbol(java.enum_body_s))
        {
            lowerEnumBody(unit, body, members);
        }
        else
        {
            lowerMembers(unit, body, members);
        }

        return treeMaker.classDef
        (
            unit,
            ClassDefData
            {
                .name = names.fromString(nameNode.textView()),
                .header = textUntil(node, body),
                .annotations = annotationsOf(node),
                .members = std::move(members)
            }
        );
    }

    void lowerMembers(CompilationUnit & unit, const TSNode & body, std::vector<NodeId> & members)
    {
        for (const TSNode & member : body.namedChildren())
        {
            if (member.isSymbol(java.method_declaration_s))
            {
                members.push_back(lowerMethod(unit, member, false));
            }
            else if (member.isSymbol(java.constructor_declaration_s) || member.isSymbol(java.compact_constructor_declaration_s))
            {
                members.push_back(lowerMethod(unit, member, true));
            }
            else if (java.isTypeDeclaration(member))
            {
                members.push_back(lowerType(unit, member));
            }
            else
            {
                members.push_back(treeMaker.verbatim(unit, member.text(), VerbatimKind::Member));
            }
        }
    }

    // Enum constants stay one verbatim member, terminated by ';'.
    // Comments between constants are part of it; comments around the constants become members of their own.
    void lowerEnumBody(CompilationUnit & unit, const TSNode & body, std::vector<NodeId> & members)
    {
        TSNode firstConstant;
        TSNode lastConstant;
        TSNode declarations;
        std::vector<TSNode> leadingComments;
        std::vector<TSNode> trailingComments;
        for (const TSNode & child : body.namedChildren())
        {
            if (child.isSymbol(java.enum_constant_s))
            {
                if (!firstConstant) firstConstant = child;
                lastConstant = child;
                trailingComments.clear();
            }
            else if (child.isSymbol(java.enum_body_declarations_s))
            {
                declarations = child;
            }
            else if (!firstConstant)
            {
                leadingComments.push_back(child);
            }
            else
            {
                trailingComments.push_back(child);
            }
        }

        for (const TSNode & comment : leadingComments)
        {
            members.push_back(treeMaker.verbatim(unit, comment.text(), VerbatimKind::Member));
        }
        if (firstConstant)
        {
            std::string_view source = body.getSource();
            std::string constants(source.substr(firstConstant.startByte(), lastConstant.endByte() - firstConstant.startByte()));
            members.push_back(treeMaker.verbatim(unit, constants + ";", VerbatimKind::Member));
        }
        for (const TSNode & comment : trailingComments)
        {
            members.push_back(treeMaker.verbatim(unit, comment.text(), VerbatimKind::Member));
        }
        else if (declarations)
        {
            members.push_back(treeMaker.verbatim(unit, ";", VerbatimKind::Member));
        }
        if (declarations)
        {
            lowerMembers(unit, declarations, members);
        }
    }

    std::vector<Parameter> lowerParameters(const TSNode & formalParameters) const
    {
        std::vector<Parameter> params;
        if (!formalParameters) return params;
        for (const TSNode & param : formalParameters.namedChildren())
        {
            if (param.isSymbol(java.formal_parameter_s))
            {
                std::string type = param.childByFieldId(java.formal_parameter_s.type_f).text();
                if (TSNode dims = param.childByFieldId(java.formal_parameter_s.dimensions_f))
                {
                    type += dims.text();
                }
                params.push_back
                (
                    Parameter
                    {
                        .type = std::move(type),
                        .name = names.fromString(param.childByFieldId(java.formal_parameter_s.name_f).textView())
                    }
                );
            }
            else if (param.isSymbol(java.spread_parameter_s))
            {
                // [modifiers] Type ... declarator
                TSNode typeStart;
                TSNode declarator;
                for (const TSNode & child : param.namedChildren())
                {
                    if (child.isSymbol(java.modifiers_s)) continue;
                    if (child.isSymbol(java.variable_declarator_s))
                    {
                        declarator = child;
                        break;
                    }
                    if (!typeStart) typeStart = child;
                }
                if (!typeStart || !declarator)
                {
                    throw JavaSyntaxError(std::format("Malformed varargs parameter \"{}\"", param.text()));
                }
                params.push_back
                (
                    Parameter
                    {
                        .type = textUntil(typeStart, declarator),
                        .name = names.fromString(declarator.childByFieldId(java.variable_declarator_s.name_f).textView())
                    }
                );
            }
            // receiver_parameter and comments carry no parameter
        }
        return params;
    }

    NodeId lowerBody(CompilationUnit & unit, const TSNode & body) const
    {
        std::vector<NodeId> stats;
        for (const TSNode & stat : body.namedChildren())
        {
            VerbatimKind kind = VerbatimKind::Statement;
            if (stat.isSymbol(java.explicit_constructor_invocation_s)) kind = VerbatimKind::ConstructorCall;
            else if (java.isComment(stat)) kind = VerbatimKind::Comment;
            stats.push_back(treeMaker.verbatim(unit, stat.text(), kind));
        }
        return treeMaker.block(unit, std::move(stats));
    }

    NodeId lowerMethod(CompilationUnit & unit, const TSNode & node, bool isConstructor)
    {
        TSNode nameNode = node.childByFieldId(java.method_declaration_s.name_f);
        if (!nameNode)
        {
            throw JavaSyntaxError(std::format("{}: method without a name", node.startPoint().toString()));
        }
        TSNode body = node.childByFieldId(java.method_declaration_s.body_f);

        MethodDefData method
        {
            .name = names.fromString(nameNode.textView()),
            .header = body ? textUntil(node, body) : node.text(),
            .params = lowerParameters(node.childByFieldId(java.method_declaration_s.parameters_f)),
            .annotations = annotationsOf(node),
            .body = body ? lowerBody(unit, body) : NoNode,
            .isConstructor = isConstructor
        };
        return treeMaker.methodDef(unit, std::move(method));
    }
};

} // namespace Annotrace

#endif // ANNOTRACE_JAVAFRONTEND_HPP
