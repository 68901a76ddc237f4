// C++ wrapper for the parts of the Tree-sitter C API the Java frontend walks
// C API: https://github.com/tree-sitter/tree-sitter/blob/master/lib/include/tree_sitter/api.h

#ifndef ANNOTRACE_TREESITTER_HPP
#define ANNOTRACE_TREESITTER_HPP

#include <cstdint>
#include <format>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <boost/stacktrace.hpp>
#include <spdlog/spdlog.h>

#include "Util.hpp"

namespace ts
{
    #include "tree_sitter/api.h"
} // namespace ts

namespace Annotrace
{

using TSSymbol = ts::TSSymbol;
using TSFieldId = ts::TSFieldId;

struct TSPoint : public ts::TSPoint
{
    TSPoint() = default;
    TSPoint(uint32_t row, uint32_t column) : ts::TSPoint{row, column} {}
    TSPoint(const ts::TSPoint & point) : ts::TSPoint{point} {}

    // 1-based "line:column"
    std::string toString() const
    {
        return std::format("{}:{}", row + 1, column + 1);
    }
};

// Languages generated by tree-sitter are static tables, so no ownership is taken
class TSLanguage
{
public:
    TSLanguage(const ts::TSLanguage * language);

    operator const ts::TSLanguage *() const;

    TSSymbol symbolForName(const std::string & name, bool isNamed) const;
    TSFieldId fieldIdForName(const std::string & name) const;

private:
    const ts::TSLanguage * language;
};

class TSNode
{
public:
    TSNode(const ts::TSNode & node, const std::string * source);
    TSNode();

    operator ts::TSNode() const;

    std::string type() const;
    TSSymbol symbol() const;

    uint32_t startByte() const;
    uint32_t endByte() const;
    TSPoint startPoint() const;

    uint32_t childCount() const;
    uint32_t namedChildCount() const;
    TSNode child(uint32_t index) const;
    TSNode namedChild(uint32_t index) const;
    TSNode childByFieldId(TSFieldId fieldId) const;

    bool isNull() const;
    operator bool() const;
    bool hasError() const;
    bool isError() const;
    bool isMissing() const;
    bool operator==(const TSNode & other) const;

    // Helper functions
    bool isSymbol(TSSymbol symbol) const;
    const std::string & getSource() const;
    std::string_view textView() const;
    std::string text() const;
    std::size_t length() const;
    std::vector<TSNode> children() const;
    std::vector<TSNode> namedChildren() const;
    // First ERROR or MISSING node in preorder, null when the subtree is clean
    TSNode firstErrorNode() const;

private:
    ts::TSNode node;
    const std::string * source;

    void assertNonNull() const;
};

class TSTree
{
public:
    TSTree(ts::TSTree * tree, std::string && source);
    TSTree();

    TSTree(const TSTree &) = delete;
    TSTree(TSTree &&) = default;
    TSTree & operator=(const TSTree &) = delete;
    TSTree & operator=(TSTree &&) = default;
    ~TSTree() = default;

    operator const ts::TSTree *() const;

    TSNode rootNode() const;
    const std::string & getSource() const;

private:
    std::unique_ptr<ts::TSTree, decltype(&ts::ts_tree_delete)> tree;
    std::unique_ptr<const std::string> sourcePtr; // Keeps node text views valid after moving
};

class TSParser
{
public:
    TSParser(const ts::TSLanguage * language);

    TSParser(const TSParser &) = delete;
    TSParser(TSParser &&) = default;
    TSParser & operator=(const TSParser &) = delete;
    TSParser & operator=(TSParser &&) = default;
    ~TSParser() = default;

    operator ts::TSParser *();

    TSTree parseString(std::string && source);

private:
    std::unique_ptr<ts::TSParser, decltype(&ts::ts_parser_delete)> parser;
};

// TSLanguage

TSLanguage::TSLanguage(const ts::TSLanguage * language)
    : language(language)
{
    if (!language)
    {
        throw std::invalid_argument("TSLanguage: null language");
    }
}

TSLanguage::operator const ts::TSLanguage *() const
{
    return language;
}

// Get the numerical id for the given node type string.
TSSymbol TSLanguage::symbolForName(const std::string & name, bool isNamed) const
{
    return ts::ts_language_symbol_for_name(*this, name.c_str(), name.size(), isNamed);
}

// Get the numerical id for the given field name string.
TSFieldId TSLanguage::fieldIdForName(const std::string & name) const
{
    return ts::ts_language_field_id_for_name(*this, name.c_str(), static_cast<uint32_t>(name.size()));
}

// TSNode

TSNode::TSNode(const ts::TSNode & node, const std::string * source)
    : node(node), source(source)
{
}

TSNode::TSNode()
{
    node =
    {
        .context = {0, 0, 0, 0},
        .id = nullptr,
        .tree = nullptr,
    };
    source = nullptr;
}

TSNode::operator ts::TSNode() const
{
    return node;
}

std::string TSNode::type() const
{
    const char * t = ts::ts_node_type(*this);
    if (t == nullptr) return std::string();
    return t;
}

TSSymbol TSNode::symbol() const
{
    assertNonNull();
    return ts::ts_node_symbol(*this);
}

uint32_t TSNode::startByte() const
{
    assertNonNull();
    return ts::ts_node_start_byte(*this);
}

uint32_t TSNode::endByte() const
{
    assertNonNull();
    return ts::ts_node_end_byte(*this);
}

TSPoint TSNode::startPoint() const
{
    assertNonNull();
    return ts::ts_node_start_point(*this);
}

uint32_t TSNode::childCount() const
{
    assertNonNull();
    return ts::ts_node_child_count(*this);
}

uint32_t TSNode::namedChildCount() const
{
    assertNonNull();
    return ts::ts_node_named_child_count(*this);
}

TSNode TSNode::child(uint32_t index) const
{
    assertNonNull();
    return { ts::ts_node_child(*this, index), source };
}

TSNode TSNode::namedChild(uint32_t index) const
{
    assertNonNull();
    return { ts::ts_node_named_child(*this, index), source };
}

TSNode TSNode::childByFieldId(TSFieldId fieldId) const
{
    assertNonNull();
    return { ts::ts_node_child_by_field_id(*this, fieldId), source };
}

// Functions like ts_node_child return a null node to indicate that no such node was found.
bool TSNode::isNull() const
{
    return ts::ts_node_is_null(*this) || source == nullptr;
}

TSNode::operator bool() const
{
    return !isNull();
}

bool TSNode::hasError() const
{
    assertNonNull();
    return ts::ts_node_has_error(*this);
}

bool TSNode::isError() const
{
    assertNonNull();
    return ts::ts_node_is_error(*this);
}

bool TSNode::isMissing() const
{
    assertNonNull();
    return ts::ts_node_is_missing(*this);
}

bool TSNode::operator==(const TSNode & other) const
{
    return ts::ts_node_eq(*this, other) || !(*this) && !other;
}

bool TSNode::isSymbol(TSSymbol symbol) const
{
    return symbol == this->symbol();
}

const std::string & TSNode::getSource() const
{
    assertNonNull();
    return *source;
}

std::string_view TSNode::textView() const
{
    if (isNull()) return "";
    return std::string_view(getSource()).substr(startByte(), length());
}

std::string TSNode::text() const
{
    return std::string(textView());
}

std::size_t TSNode::length() const
{
    return endByte() - startByte();
}

std::vector<TSNode> TSNode::children() const
{
    std::vector<TSNode> result;
    uint32_t count = childCount();
    result.reserve(count);
    for (uint32_t i = 0; i < count; ++i)
    {
        result.push_back(child(i));
    }
    return result;
}

std::vector<TSNode> TSNode::namedChildren() const
{
    std::vector<TSNode> result;
    uint32_t count = namedChildCount();
    result.reserve(count);
    for (uint32_t i = 0; i < count; ++i)
    {
        result.push_back(namedChild(i));
    }
    return result;
}

TSNode TSNode::firstErrorNode() const
{
    if (isNull() || !hasError()) return TSNode();
    if (isError() || isMissing()) return *this;
    for (const TSNode & c : children())
    {
        if (TSNode found = c.firstErrorNode()) return found;
    }
    return *this;
}

void TSNode::assertNonNull() const
{
    #if DEBUG
        // Throw and print stack trace if the node is null.
        if (isNull())
        {
            std::cout << boost::stacktrace::stacktrace() << std::endl;
            std::cout << std::flush;
            throw std::runtime_error("TSNode is null");
        }
    #endif
}

// TSTree

TSTree::TSTree(ts::TSTree * tree, std::string && source)
    : tree(tree, ts::ts_tree_delete), sourcePtr(std::make_unique<std::string>(std::move(source))) // Move and own
{
}

TSTree::TSTree()
    : tree(nullptr, ts::ts_tree_delete), sourcePtr(nullptr)
{
}

TSTree::operator const ts::TSTree *() const
{
    return tree.get();
}

TSNode TSTree::rootNode() const
{
    return { ts::ts_tree_root_node(*this), sourcePtr.get() };
}

const std::string & TSTree::getSource() const
{
    if (!sourcePtr)
    {
        throw std::logic_error("TSTree: empty tree has no source");
    }
    return *sourcePtr;
}

// TSParser

// Create a new parser and set its language.
TSParser::TSParser(const ts::TSLanguage * language)
    : parser(ts::ts_parser_new(), ts::ts_parser_delete)
{
    if (!ts::ts_parser_set_language(*this, language))
    {
        throw std::runtime_error("TSParser: incompatible language version");
    }
}

TSParser::operator ts::TSParser *()
{
    return parser.get();
}

TSTree TSParser::parseString(std::string && source)
{
    ts::TSTree * tree = ts::ts_parser_parse_string(*this, nullptr, source.data(), source.size());
    if (!tree)
    {
        throw std::runtime_error("TSParser: parsing was cancelled");
    }
    return { tree, std::move(source) };
}

} // namespace Annotrace

#endif // ANNOTRACE_TREESITTER_HPP
