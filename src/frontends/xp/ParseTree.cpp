//===----------------------------------------------------------------------===//
//
// Part of the Xpresso project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file ParseTree.cpp
/// @brief Parse tree node construction and traversal helpers.
///
//===----------------------------------------------------------------------===//

#include "frontends/xp/ParseTree.hpp"

#include <cassert>
#include <utility>

namespace xpresso::frontends::xp
{

ParseTreeNode::ParseTreeNode(std::string label, bool terminal, SourceLoc loc)
    : label_(std::move(label)), terminal_(terminal), loc_(loc)
{
}

NodePtr ParseTreeNode::makeTerminal(const Token &tok)
{
    return std::make_unique<ParseTreeNode>(tok.text, true, tok.loc);
}

NodePtr ParseTreeNode::makeNonTerminal(std::string label, SourceLoc loc)
{
    return std::make_unique<ParseTreeNode>(std::move(label), false, loc);
}

ParseTreeNode *ParseTreeNode::child(std::size_t i) const
{
    return i < children_.size() ? children_[i].get() : nullptr;
}

ParseTreeNode &ParseTreeNode::addChild(NodePtr child)
{
    assert(!terminal_ && "terminal parse tree nodes cannot have children");
    assert(child && "addChild requires a node");
    child->parent_ = this;
    if (!loc_.isValid())
        loc_ = child->loc_;
    children_.push_back(std::move(child));
    return *children_.back();
}

ParseTreeNode &ParseTreeNode::addToken(const Token &tok)
{
    return addChild(makeTerminal(tok));
}

void ParseTreeNode::truncateChildren(std::size_t count)
{
    if (count < children_.size())
        children_.resize(count);
}

const ParseTreeNode *ParseTreeNode::findChild(std::string_view label) const
{
    for (const auto &c : children_)
    {
        if (c->label_ == label)
            return c.get();
    }
    return nullptr;
}

const ParseTreeNode *ParseTreeNode::findDescendant(std::string_view label) const
{
    if (label_ == label)
        return this;
    for (const auto &c : children_)
    {
        if (const ParseTreeNode *found = c->findDescendant(label))
            return found;
    }
    return nullptr;
}

std::size_t ParseTreeNode::countLabel(std::string_view label) const
{
    std::size_t n = label_ == label ? 1 : 0;
    for (const auto &c : children_)
        n += c->countLabel(label);
    return n;
}

std::size_t ParseTreeNode::subtreeSize() const
{
    std::size_t n = 1;
    for (const auto &c : children_)
        n += c->subtreeSize();
    return n;
}

} // namespace xpresso::frontends::xp
