// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef BRANCHCOV_FLOW_COUNTS_HPP
# define BRANCHCOV_FLOW_COUNTS_HPP

# include "syntax_tree.hpp"
# include "counter_store.hpp"
# include <boost/optional.hpp>
# include <vector>

namespace branchcov {

// Derives, for every node of one tree, how often control
//
//   - entered it from its predecessor (flow entry),
//   - reached its start (execution), and
//   - left it by falling through (flow completion),
//
// from the tracker hits alone.  Results are memoized for the lifetime
// of the object, which must not outlive the tree or the counters.
//
// Every accessor throws inconsistent_counts when a derived count is
// negative, when completion exceeds entry, or when execution exceeds
// entry, and malformed_tree when a required child slot is absent.
class flow_counts
{
 public:
    flow_counts(syntax_tree const& tree, counter_store const& counters);

    hit_count execution_count(node_id id) const;
    hit_count flow_entry_count(node_id id) const;
    hit_count flow_completion_count(node_id id) const;

    // How many exceptions reached the given handler arm, derived from
    // what precedes it.  Diagnostic only: the arm's own entered_body
    // tracker is what its execution count reports.
    hit_count handler_entry_count(node_id arm) const;

    // The count of the branch that has no node of its own: the
    // short-circuited path of && and ||, the skipped call of &., and
    // the exit of a loop.
    hit_count implicit_branch_count(node_id id) const;

    // Hits of the tracker bound to id in the given role; 0 if unbound
    hit_count hits(node_id id, tracker_role role) const;

    syntax_tree const& tree() const { return tree_; }

 private:
    hit_count child_entry(node_id parent, node_id child) const;
    hit_count checked(hit_count n, node_id id, char const* what) const;

    syntax_tree const& tree_;
    counter_store const& counters;

    typedef std::vector<boost::optional<hit_count> > cache;
    mutable cache entry_cache;
    mutable cache execution_cache;
    mutable cache completion_cache;
};

} // namespace branchcov

#endif // BRANCHCOV_FLOW_COUNTS_HPP
