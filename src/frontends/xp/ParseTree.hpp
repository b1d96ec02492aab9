//===----------------------------------------------------------------------===//
//
// Part of the Xpresso project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file ParseTree.hpp
/// @brief Concrete parse tree built by the X-presso parser.
///
/// @details There is one node type. Non-terminal nodes carry the production
/// label (`ClassDecl`, `BinaryExpr`, ...); terminal nodes carry the token
/// lexeme and never have children. Each node owns its children and keeps a
/// non-owning pointer to the node that adopted it.
///
/// @invariant For every child c of n: c->parent() == n.
/// @invariant Terminal nodes have no children.
/// @invariant A non-terminal without an explicit location takes the location
///            of its first adopted child.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/xp/Token.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace xpresso::frontends::xp
{

class ParseTreeNode;

using NodePtr = std::unique_ptr<ParseTreeNode>;

class ParseTreeNode
{
  public:
    ParseTreeNode(std::string label, bool terminal, SourceLoc loc);

    ParseTreeNode(const ParseTreeNode &) = delete;
    ParseTreeNode &operator=(const ParseTreeNode &) = delete;

    /// @brief Leaf node for @p tok, labelled with its lexeme.
    static NodePtr makeTerminal(const Token &tok);

    static NodePtr makeNonTerminal(std::string label, SourceLoc loc = {});

    [[nodiscard]] const std::string &label() const
    {
        return label_;
    }

    [[nodiscard]] bool isTerminal() const
    {
        return terminal_;
    }

    [[nodiscard]] SourceLoc loc() const
    {
        return loc_;
    }

    [[nodiscard]] ParseTreeNode *parent() const
    {
        return parent_;
    }

    [[nodiscard]] bool isRoot() const
    {
        return parent_ == nullptr;
    }

    [[nodiscard]] const std::vector<NodePtr> &children() const
    {
        return children_;
    }

    [[nodiscard]] std::size_t childCount() const
    {
        return children_.size();
    }

    /// @brief Child @p i, or nullptr when out of range.
    [[nodiscard]] ParseTreeNode *child(std::size_t i) const;

    /// @brief Take ownership of @p child and make this node its parent.
    /// @pre !isTerminal() and child != nullptr.
    /// @return Reference to the adopted node.
    ParseTreeNode &addChild(NodePtr child);

    /// @brief Add a terminal child for @p tok.
    ParseTreeNode &addToken(const Token &tok);

    /// @brief Drop children beyond the first @p count (speculation rollback).
    void truncateChildren(std::size_t count);

    /// @brief First direct child labelled @p label, or nullptr.
    [[nodiscard]] const ParseTreeNode *findChild(std::string_view label) const;

    /// @brief First node labelled @p label in pre-order, this node included.
    [[nodiscard]] const ParseTreeNode *findDescendant(std::string_view label) const;

    /// @brief Number of nodes labelled @p label in this subtree.
    [[nodiscard]] std::size_t countLabel(std::string_view label) const;

    /// @brief Number of nodes in this subtree, this node included.
    [[nodiscard]] std::size_t subtreeSize() const;

  private:
    std::string label_;
    bool terminal_;
    SourceLoc loc_;
    std::vector<NodePtr> children_;
    ParseTreeNode *parent_{nullptr};
};

} // namespace xpresso::frontends::xp
