// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef BRANCHCOV_SYNTAX_TREE_HPP
# define BRANCHCOV_SYNTAX_TREE_HPP

# include "source_range.hpp"
# include "counter_store.hpp"
# include "errors.hpp"
# include <boost/container/flat_map.hpp>
# include <boost/optional.hpp>
# include <boost/variant.hpp>
# include <string>
# include <vector>

namespace branchcov {

// Nodes live in one vector owned by the syntax_tree and refer to each
// other by index.  Ids are handed out in preorder, so a parent's id is
// always smaller than its children's.
typedef std::size_t node_id;
node_id const no_node = node_id(-1);

enum class tracker_role
{
    entry,          // control reached the root of the unit
    completion,     // an expression or call finished without raising
    truthy,         // a conditional's test came out true
    entered_body,   // a dispatch or handler arm's body was entered
    else_entered,   // no dispatch arm matched
    conditional,    // the right side of && or || was evaluated
    body,           // a loop body was entered
    non_nil,        // a safe-navigation receiver was non-nil
    nil_receiver    // a safe-navigation receiver was nil
};

// Locations of the keywords surrounding a construct's clauses
enum class keyword
{
    begin,          // `then` or `do`, or `begin` for a compound body
    else_clause,    // `else` or `elsif`
    end
};

enum class conditional_style { if_style, unless_style, elsif_style, ternary_style };
enum class logical_operator { conjunction, disjunction };
enum class loop_polarity { while_loop, until_loop };
enum class loop_test { pre_test, post_test };

//
// Kind-specific child slots.  A slot holding no_node is absent.
//
struct expression
{
    std::string type;
    std::vector<node_id> operands;
};

struct sequence
{
    bool explicit_begin;            // written as begin ... end
    std::vector<node_id> statements;
};

struct empty_body
{
};

struct conditional
{
    conditional_style style;
    node_id condition;
    node_id true_branch;
    node_id false_branch;
};

struct dispatch
{
    node_id subject;
    std::vector<node_id> arms;
    node_id else_branch;
};

struct dispatch_arm
{
    std::vector<node_id> patterns;
    node_id body;
};

struct short_circuit
{
    logical_operator op;
    node_id left;
    node_id right;
};

struct safe_navigation
{
    node_id receiver;
    std::vector<node_id> arguments;
};

struct loop
{
    loop_polarity polarity;
    loop_test test;
    node_id condition;
    node_id body;
};

struct rescue
{
    node_id watched_body;
    std::vector<node_id> handlers;
    node_id else_branch;
};

struct handler_arm
{
    node_id exceptions;
    node_id assignment;
    node_id body;
};

struct ensure
{
    node_id body;
    node_id ensure_body;
};

// The order here is the order of node_kind below
typedef boost::variant<
    expression, sequence, empty_body, conditional, dispatch, dispatch_arm,
    short_circuit, safe_navigation, loop, rescue, handler_arm, ensure
    > node_payload;

enum class node_kind
{
    expression, sequence, empty_body, conditional, dispatch, dispatch_arm,
    short_circuit, safe_navigation, loop, rescue, handler_arm, ensure
};

char const* kind_name(node_kind k);

struct node
{
    node()
        : payload(empty_body()), parent(no_node), index_in_parent(0)
    {}

    node_kind kind() const { return node_kind(payload.which()); }

    node_payload payload;

    // Absent when the node stands for a slot with no syntax at all
    boost::optional<source_range> range;

    node_id parent;
    std::size_t index_in_parent;

    // Present child slots, in evaluation order
    std::vector<node_id> children;

    boost::container::flat_map<tracker_role, tracker_id> trackers;
    boost::container::flat_map<keyword, source_range> keywords;
};

class syntax_tree
{
 public:
    syntax_tree() {}

    // Construction.  Reserve the parent first so ids come out in
    // preorder, then adopt its children once they are built.
    node_id add_node();
    node& modify(node_id id);
    void adopt(node_id parent, std::vector<node_id> const& children);

    std::size_t size() const { return nodes.size(); }
    bool empty() const { return nodes.empty(); }
    node_id root() const { return nodes.empty() ? no_node : 0; }

    node const& operator[](node_id id) const;

    node_id parent(node_id id) const { return (*this)[id].parent; }
    node_id previous_sibling(node_id id) const;
    node_id next_sibling(node_id id) const;

    // Reachable ids, parents before children, children in slot order
    std::vector<node_id> preorder() const;

    bool is_empty_body(node_id id) const
    {
        return id != no_node && (*this)[id].kind() == node_kind::empty_body;
    }

    boost::optional<tracker_id> tracker(node_id id, tracker_role role) const;
    boost::optional<source_range> keyword_range(node_id id, keyword k) const;

    // The node's own range.  Throws malformed_tree if it has none.
    source_range const& range(node_id id) const;

    // Returns slot, throwing malformed_tree if the slot is absent
    node_id required(node_id owner, node_id slot, char const* slot_name) const;

    template <class Payload>
    Payload const& payload(node_id id) const
    {
        Payload const* p = boost::get<Payload>(&(*this)[id].payload);
        if (!p)
            throw malformed_tree(describe(id) + " has an unexpected kind");
        return *p;
    }

    // Human-readable identification for diagnostics
    std::string describe(node_id id) const;

 private:
    std::vector<node> nodes;
};

} // namespace branchcov

#endif // BRANCHCOV_SYNTAX_TREE_HPP
