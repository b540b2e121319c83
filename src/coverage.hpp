// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef BRANCHCOV_COVERAGE_HPP
# define BRANCHCOV_COVERAGE_HPP

# include "flow_counts.hpp"
# include <iosfwd>
# include <string>
# include <vector>

namespace branchcov {

// Per-node run counts, indexed by node id
typedef std::vector<hit_count> run_counts;

inline bool covered(hit_count runs)
{
    return runs != 0;
}

bool is_branching(node_kind k);

// What each node reports before demotion: its execution count
run_counts raw_runs(flow_counts const& counts);

// Counts of the immediate sub-branches of a branching node, taken from
// `runs` where the sub-branch is a node of its own.  Empty for any
// other node.
std::vector<hit_count> sub_branch_runs(
    flow_counts const& counts, run_counts const& runs, node_id id);

// A branching node that ran, but one of whose sub-branches never did,
// reports that sub-branch's count instead.  Nodes are revisited
// children first, so demotion propagates outward.
run_counts demote_partially_covered(flow_counts const& counts, run_counts runs);

// Writes a warning for every node the demotion changed and returns how
// many there were.
std::size_t report_partial_coverage(
    std::ostream& os, syntax_tree const& tree,
    run_counts const& raw, run_counts const& demoted, std::string const& unit);

// One line per branching node: "kind line:column raw demoted"
void print_runs(
    std::ostream& os, syntax_tree const& tree,
    run_counts const& raw, run_counts const& demoted);

} // namespace branchcov

#endif // BRANCHCOV_COVERAGE_HPP
