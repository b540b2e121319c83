// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#include "flow_counts.hpp"

#include <sstream>

namespace branchcov {

namespace
{
  // Falls through the last of the given nodes, or `otherwise` when
  // there are none.
  hit_count last_completion(
      flow_counts const& f, std::vector<node_id> const& nodes, hit_count otherwise)
  {
      return nodes.empty() ? otherwise : f.flow_completion_count(nodes.back());
  }

  struct completion_rule : boost::static_visitor<hit_count>
  {
      completion_rule(flow_counts const& f, node_id id)
          : f(f), t(f.tree()), id(id)
      {}

      hit_count operator()(expression const& e) const
      {
          if (t.tracker(id, tracker_role::completion))
              return f.hits(id, tracker_role::completion);
          return last_completion(f, e.operands, f.execution_count(id));
      }

      hit_count operator()(sequence const& s) const
      {
          return last_completion(f, s.statements, f.flow_entry_count(id));
      }

      hit_count operator()(empty_body const&) const
      {
          return f.flow_entry_count(id);
      }

      hit_count operator()(conditional const& c) const
      {
          return f.flow_completion_count(t.required(id, c.true_branch, "true branch"))
              + f.flow_completion_count(t.required(id, c.false_branch, "false branch"));
      }

      hit_count operator()(dispatch const& d) const
      {
          hit_count total = f.flow_completion_count(t.required(id, d.else_branch, "else branch"));
          for (auto arm : d.arms)
              total += f.flow_completion_count(arm);
          return total;
      }

      hit_count operator()(dispatch_arm const& a) const
      {
          return f.flow_completion_count(t.required(id, a.body, "body"));
      }

      hit_count operator()(short_circuit const& s) const
      {
          return f.flow_completion_count(t.required(id, s.right, "right operand"))
              + f.implicit_branch_count(id);
      }

      hit_count operator()(safe_navigation const& s) const
      {
          hit_count made;
          if (t.tracker(id, tracker_role::completion))
              made = f.hits(id, tracker_role::completion);
          else
              made = last_completion(f, s.arguments, f.hits(id, tracker_role::non_nil));
          return f.implicit_branch_count(id) + made;
      }

      hit_count operator()(loop const&) const
      {
          return f.implicit_branch_count(id);
      }

      hit_count operator()(rescue const& r) const
      {
          if (r.watched_body == no_node)
              return f.flow_entry_count(id);
          hit_count total = f.flow_completion_count(
              r.else_branch != no_node ? r.else_branch : r.watched_body);
          for (auto handler : r.handlers)
              total += f.flow_completion_count(handler);
          return total;
      }

      hit_count operator()(handler_arm const& h) const
      {
          if (h.body != no_node)
              return f.flow_completion_count(h.body);
          return f.execution_count(id);
      }

      hit_count operator()(ensure const& e) const
      {
          if (e.body != no_node)
              return f.flow_completion_count(e.body);
          if (e.ensure_body != no_node)
              return f.flow_completion_count(e.ensure_body);
          return f.flow_entry_count(id);
      }

      flow_counts const& f;
      syntax_tree const& t;
      node_id id;
  };

  // How often control enters `child` from within `parent`
  struct child_entry_rule : boost::static_visitor<hit_count>
  {
      child_entry_rule(flow_counts const& f, node_id parent, node_id child)
          : f(f), t(f.tree()), parent(parent), child(child)
      {}

      // Operands run one after the other
      hit_count in_sequence() const
      {
          node_id prev = t.previous_sibling(child);
          if (prev == no_node)
              return f.flow_entry_count(parent);
          return f.flow_completion_count(prev);
      }

      hit_count operator()(expression const&) const { return in_sequence(); }
      hit_count operator()(sequence const&) const { return in_sequence(); }

      hit_count operator()(empty_body const&) const
      {
          throw malformed_tree(t.describe(parent) + " cannot have children");
      }

      hit_count operator()(conditional const& c) const
      {
          if (child == c.condition)
              return f.flow_entry_count(parent);
          if (child == c.true_branch)
              return f.hits(parent, tracker_role::truthy);
          return f.flow_completion_count(t.required(parent, c.condition, "condition"))
              - f.hits(parent, tracker_role::truthy);
      }

      hit_count operator()(dispatch const& d) const
      {
          if (child == d.subject)
              return f.flow_entry_count(parent);
          if (child == d.else_branch)
              return f.hits(parent, tracker_role::else_entered);

          node_id prev = t.previous_sibling(child);
          if (prev == no_node)
              return f.flow_entry_count(parent);
          if (prev == d.subject)
              return f.flow_completion_count(prev);

          // Control moves on to the next arm when no pattern of the
          // previous one matched.
          dispatch_arm const& previous = t.payload<dispatch_arm>(prev);
          return f.flow_entry_count(prev)
              - f.flow_entry_count(t.required(prev, previous.body, "body"));
      }

      hit_count operator()(dispatch_arm const& a) const
      {
          if (child == a.body)
              return f.hits(parent, tracker_role::entered_body);
          return in_sequence();
      }

      hit_count operator()(short_circuit const& s) const
      {
          if (child == s.right)
              return f.hits(parent, tracker_role::conditional);
          return f.flow_entry_count(parent);
      }

      hit_count operator()(safe_navigation const& s) const
      {
          if (child == s.receiver)
              return f.flow_entry_count(parent);
          node_id prev = t.previous_sibling(child);
          if (prev == no_node || prev == s.receiver)
              return f.hits(parent, tracker_role::non_nil);
          return f.flow_completion_count(prev);
      }

      hit_count operator()(loop const& l) const
      {
          if (child == l.body)
              return f.hits(parent, tracker_role::body);
          node_id body = t.required(parent, l.body, "body");
          if (l.test == loop_test::post_test)
              return f.flow_completion_count(body);
          return f.flow_entry_count(parent) + f.flow_completion_count(body);
      }

      hit_count operator()(rescue const& r) const
      {
          if (child == r.watched_body)
              return f.flow_entry_count(parent);
          if (child == r.else_branch)
              return f.execution_count(parent);
          return f.handler_entry_count(child);
      }

      hit_count operator()(handler_arm const& h) const
      {
          if (child == h.exceptions)
              return f.flow_entry_count(parent);
          return f.hits(parent, tracker_role::entered_body);
      }

      hit_count operator()(ensure const& e) const
      {
          // The ensure clause runs however the body is left
          if (child == e.ensure_body && e.body != no_node)
              return f.flow_entry_count(e.body);
          return f.flow_entry_count(parent);
      }

      flow_counts const& f;
      syntax_tree const& t;
      node_id parent;
      node_id child;
  };
}

flow_counts::flow_counts(syntax_tree const& tree, counter_store const& counters)
    : tree_(tree),
      counters(counters),
      entry_cache(tree.size()),
      execution_cache(tree.size()),
      completion_cache(tree.size())
{
}

hit_count flow_counts::hits(node_id id, tracker_role role) const
{
    boost::optional<tracker_id> t = tree_.tracker(id, role);
    return t ? counters.hits(*t) : 0;
}

hit_count flow_counts::checked(hit_count n, node_id id, char const* what) const
{
    if (n < 0)
    {
        std::stringstream msg;
        msg << what << " count of " << tree_.describe(id) << " is " << n;
        throw inconsistent_counts(msg.str());
    }
    return n;
}

hit_count flow_counts::flow_entry_count(node_id id) const
{
    if (!entry_cache.at(id))
    {
        node_id parent = tree_.parent(id);
        hit_count n = parent == no_node
            ? hits(id, tracker_role::entry)
            : child_entry(parent, id);
        entry_cache[id] = checked(n, id, "flow entry");
    }
    return *entry_cache[id];
}

hit_count flow_counts::execution_count(node_id id) const
{
    if (!execution_cache.at(id))
    {
        hit_count n = 0;
        switch (tree_[id].kind())
        {
        case node_kind::rescue:
        {
            node_id watched = tree_.payload<rescue>(id).watched_body;
            n = watched != no_node ? flow_completion_count(watched) : flow_entry_count(id);
            break;
        }
        case node_kind::handler_arm:
            n = hits(id, tracker_role::entered_body);
            break;
        case node_kind::expression:
        case node_kind::sequence:
        case node_kind::empty_body:
        case node_kind::conditional:
        case node_kind::dispatch:
        case node_kind::dispatch_arm:
        case node_kind::short_circuit:
        case node_kind::safe_navigation:
        case node_kind::loop:
        case node_kind::ensure:
            n = flow_entry_count(id);
            break;
        }
        checked(n, id, "execution");

        // A handler arm is entered by exception class matching, which
        // the entry derivation only approximates.
        if (tree_[id].kind() != node_kind::handler_arm && n > flow_entry_count(id))
        {
            std::stringstream msg;
            msg << tree_.describe(id) << " executed " << n
                << " times but was entered " << flow_entry_count(id) << " times";
            throw inconsistent_counts(msg.str());
        }
        execution_cache[id] = n;
    }
    return *execution_cache[id];
}

hit_count flow_counts::flow_completion_count(node_id id) const
{
    if (!completion_cache.at(id))
    {
        hit_count n = checked(
            boost::apply_visitor(completion_rule(*this, id), tree_[id].payload),
            id, "flow completion");

        hit_count bound = tree_[id].kind() == node_kind::handler_arm
            ? execution_count(id) : flow_entry_count(id);
        if (n > bound)
        {
            std::stringstream msg;
            msg << tree_.describe(id) << " completed " << n
                << " times but was entered " << bound << " times";
            throw inconsistent_counts(msg.str());
        }
        completion_cache[id] = n;
    }
    return *completion_cache[id];
}

hit_count flow_counts::child_entry(node_id parent, node_id child) const
{
    return boost::apply_visitor(child_entry_rule(*this, parent, child), tree_[parent].payload);
}

hit_count flow_counts::handler_entry_count(node_id arm) const
{
    node_id owner = tree_.parent(arm);
    if (owner == no_node)
        throw malformed_tree(tree_.describe(arm) + " is outside any rescue");
    rescue const& r = tree_.payload<rescue>(owner);
    if (r.watched_body == no_node)
        return flow_entry_count(owner);

    node_id prev = tree_.previous_sibling(arm);
    if (prev == r.watched_body)
    {
        return checked(
            flow_entry_count(prev) - flow_completion_count(prev), arm, "handler entry");
    }

    // Exceptions the previous arm let through.  Approximate: which arm
    // an exception lands in depends on its class, which nothing here
    // tracks.
    handler_arm const& previous = tree_.payload<handler_arm>(prev);
    hit_count offered = previous.exceptions != no_node
        ? flow_completion_count(previous.exceptions)
        : flow_entry_count(prev);
    return checked(offered - execution_count(prev), arm, "handler entry");
}

hit_count flow_counts::implicit_branch_count(node_id id) const
{
    hit_count n = 0;
    switch (tree_[id].kind())
    {
    case node_kind::short_circuit:
    {
        short_circuit const& s = tree_.payload<short_circuit>(id);
        n = flow_completion_count(tree_.required(id, s.left, "left operand"))
            - execution_count(tree_.required(id, s.right, "right operand"));
        break;
    }
    case node_kind::safe_navigation:
    {
        if (tree_.tracker(id, tracker_role::nil_receiver))
            return hits(id, tracker_role::nil_receiver);
        safe_navigation const& s = tree_.payload<safe_navigation>(id);
        n = flow_completion_count(tree_.required(id, s.receiver, "receiver"))
            - hits(id, tracker_role::non_nil);
        break;
    }
    case node_kind::loop:
    {
        loop const& l = tree_.payload<loop>(id);
        hit_count tested = flow_completion_count(tree_.required(id, l.condition, "condition"));
        hit_count entered = flow_entry_count(tree_.required(id, l.body, "body"));
        // After the first pass of a post-test loop, every body entry
        // comes from the condition.
        if (l.test == loop_test::post_test)
            entered -= flow_entry_count(id);
        n = tested - entered;
        break;
    }
    default:
        throw malformed_tree(tree_.describe(id) + " has no implicit branch");
    }
    return checked(n, id, "implicit branch");
}

} // namespace branchcov
