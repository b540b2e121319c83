// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#include "syntax_tree.hpp"

#include <sstream>
#include <stdexcept>

namespace branchcov {

char const* kind_name(node_kind k)
{
    switch (k)
    {
    case node_kind::expression: return "expression";
    case node_kind::sequence: return "sequence";
    case node_kind::empty_body: return "empty body";
    case node_kind::conditional: return "conditional";
    case node_kind::dispatch: return "dispatch";
    case node_kind::dispatch_arm: return "dispatch arm";
    case node_kind::short_circuit: return "short-circuit";
    case node_kind::safe_navigation: return "safe navigation";
    case node_kind::loop: return "loop";
    case node_kind::rescue: return "rescue";
    case node_kind::handler_arm: return "handler arm";
    case node_kind::ensure: return "ensure";
    }
    return "unknown";
}

node_id syntax_tree::add_node()
{
    nodes.push_back(node());
    return nodes.size() - 1;
}

node& syntax_tree::modify(node_id id)
{
    if (id >= nodes.size())
        throw std::out_of_range("node id out of range");
    return nodes[id];
}

void syntax_tree::adopt(node_id parent, std::vector<node_id> const& children)
{
    node& p = modify(parent);
    p.children.clear();
    for (auto child : children)
    {
        if (child == no_node)
            continue;
        node& c = modify(child);
        c.parent = parent;
        c.index_in_parent = p.children.size();
        p.children.push_back(child);
    }
}

node const& syntax_tree::operator[](node_id id) const
{
    if (id >= nodes.size())
        throw std::out_of_range("node id out of range");
    return nodes[id];
}

node_id syntax_tree::previous_sibling(node_id id) const
{
    node const& n = (*this)[id];
    if (n.parent == no_node || n.index_in_parent == 0)
        return no_node;
    return (*this)[n.parent].children[n.index_in_parent - 1];
}

node_id syntax_tree::next_sibling(node_id id) const
{
    node const& n = (*this)[id];
    if (n.parent == no_node)
        return no_node;
    std::vector<node_id> const& siblings = (*this)[n.parent].children;
    if (n.index_in_parent + 1 >= siblings.size())
        return no_node;
    return siblings[n.index_in_parent + 1];
}

std::vector<node_id> syntax_tree::preorder() const
{
    std::vector<node_id> order;
    if (nodes.empty())
        return order;
    order.reserve(nodes.size());

    std::vector<node_id> pending(1, root());
    while (!pending.empty())
    {
        node_id n = pending.back();
        pending.pop_back();
        order.push_back(n);
        std::vector<node_id> const& children = (*this)[n].children;
        pending.insert(pending.end(), children.rbegin(), children.rend());
    }
    return order;
}

boost::optional<tracker_id> syntax_tree::tracker(node_id id, tracker_role role) const
{
    node const& n = (*this)[id];
    auto p = n.trackers.find(role);
    if (p == n.trackers.end())
        return boost::none;
    return p->second;
}

boost::optional<source_range> syntax_tree::keyword_range(node_id id, keyword k) const
{
    node const& n = (*this)[id];
    auto p = n.keywords.find(k);
    if (p == n.keywords.end())
        return boost::none;
    return p->second;
}

source_range const& syntax_tree::range(node_id id) const
{
    node const& n = (*this)[id];
    if (!n.range)
        throw malformed_tree(describe(id) + " has no source range");
    return *n.range;
}

node_id syntax_tree::required(node_id owner, node_id slot, char const* slot_name) const
{
    if (slot == no_node)
        throw malformed_tree(describe(owner) + " is missing its " + slot_name);
    return slot;
}

std::string syntax_tree::describe(node_id id) const
{
    std::stringstream s;
    s << kind_name((*this)[id].kind()) << " #" << id;
    if ((*this)[id].range)
        s << " at " << *(*this)[id].range;
    return s.str();
}

} // namespace branchcov
