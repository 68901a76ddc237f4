// Specialized TSLanguage class for the tree-sitter-java language
// Also encodes the symbolized subset of the grammar the Java frontend reads

#ifndef ANNOTRACE_TREESITTERJAVA_HPP
#define ANNOTRACE_TREESITTERJAVA_HPP

#include <string>
#include <vector>

#include "TreeSitter.hpp"

namespace ts
{
    #include "tree_sitter/tree-sitter-java.h"
} // namespace ts

namespace Annotrace
{

class Java : public TSLanguage
{
public:
    // X-macro that defines the symbols and fields of the tree-sitter-java language
    // In this way we don't need to use string literals in the code
    // X: start of symbol (syntactic kind)
    // XX: end of symbol
    // Y: field
    #define JAVA_GRAMMAR \
        X(program) XX \
        X(package_declaration) XX \
        X(import_declaration) XX \
        X(asterisk) XX \
        X(identifier) XX \
        X(scoped_identifier) \
            Y(scope) \
            Y(name) \
        XX \
        X(line_comment) XX \
        X(block_comment) XX \
        X(modifiers) XX \
        X(marker_annotation) \
            Y(name) \
        XX \
        X(annotation) \
            Y(name) \
            Y(arguments) \
        XX \
        X(class_declaration) \
            Y(name) \
            Y(body) \
        XX \
        X(interface_declaration) \
            Y(name) \
            Y(body) \
        XX \
        X(enum_declaration) \
            Y(name) \
            Y(body) \
        XX \
        X(record_declaration) \
            Y(name) \
            Y(parameters) \
            Y(body) \
        XX \
        X(annotation_type_declaration) \
            Y(name) \
            Y(body) \
        XX \
        X(class_body) XX \
        X(interface_body) XX \
        X(enum_body) XX \
        X(enum_body_declarations) XX \
        X(enum_constant) XX \
        X(method_declaration) \
            Y(type) \
            Y(name) \
            Y(parameters) \
            Y(body) \
        XX \
        X(constructor_declaration) \
            Y(name) \
            Y(parameters) \
            Y(body) \
        XX \
        X(compact_constructor_declaration) \
            Y(name) \
            Y(body) \
        XX \
        X(formal_parameters) XX \
        X(formal_parameter) \
            Y(type) \
            Y(name) \
            Y(dimensions) \
        XX \
        X(spread_parameter) XX \
        X(receiver_parameter) XX \
        X(variable_declarator) \
            Y(name) \
            Y(dimensions) \
        XX \
        X(block) XX \
        X(constructor_body) XX \
        X(explicit_constructor_invocation) XX \

    #define X(sym) , sym##_s({ .str = #sym, .tsSymbol = symbolForName(#sym, true)
    #define Y(fld) , .fld##_f = { .str = #fld, .tsFieldId = fieldIdForName(#fld) }
    #define XX })
    Java()
        : TSLanguage(ts::tree_sitter_java())
        JAVA_GRAMMAR
    {
    }
    #undef XX
    #undef Y
    #undef X
    // Example:
    // , method_declaration_s({ .str = "method_declaration", .tsSymbol = symbolForName("method_declaration", true) , .type_f = { .str = "type", .tsFieldId = fieldIdForName("type") } , ... })

    #define X(sym) struct type_##sym##_s { std::string str; TSSymbol tsSymbol; operator TSSymbol() const { return tsSymbol; }
    #define Y(fld) const struct type_##fld##_f { std::string str; TSFieldId tsFieldId; operator TSFieldId() const { return tsFieldId; } } fld##_f;
    #define XX };
    JAVA_GRAMMAR
    #undef XX
    #undef Y
    #undef X

    #define X(sym) const type_##sym##_s sym##_s;
    #define Y(fld)
    #define XX
    JAVA_GRAMMAR
    #undef XX
    #undef Y
    #undef X

    #undef JAVA_GRAMMAR

    // Type declarations that open a class-like scope
    bool isTypeDeclaration(const TSNode & node) const
    {
        TSSymbol symbol = node.symbol();
        return symbol == class_declaration_s
            || symbol == interface_declaration_s
            || symbol == enum_declaration_s
            || symbol == record_declaration_s
            || symbol == annotation_type_declaration_s;
    }

    bool isComment(const TSNode & node) const
    {
        return node.isSymbol(line_comment_s) || node.isSymbol(block_comment_s);
    }
};

} // namespace Annotrace

#endif // ANNOTRACE_TREESITTERJAVA_HPP
