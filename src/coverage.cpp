// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#include "coverage.hpp"
#include "log.hpp"
#include <boost/foreach.hpp>

#include <algorithm>
#include <ostream>

namespace branchcov {

bool is_branching(node_kind k)
{
    switch (k)
    {
    case node_kind::conditional:
    case node_kind::dispatch:
    case node_kind::short_circuit:
    case node_kind::safe_navigation:
    case node_kind::loop:
        return true;
    default:
        return false;
    }
}

run_counts raw_runs(flow_counts const& counts)
{
    syntax_tree const& tree = counts.tree();
    run_counts runs(tree.size(), 0);
    BOOST_FOREACH(node_id id, tree.preorder())
        runs[id] = counts.execution_count(id);
    return runs;
}

std::vector<hit_count> sub_branch_runs(
    flow_counts const& counts, run_counts const& runs, node_id id)
{
    syntax_tree const& tree = counts.tree();
    std::vector<hit_count> result;
    switch (tree[id].kind())
    {
    case node_kind::conditional:
    {
        conditional const& c = tree.payload<conditional>(id);
        result.push_back(runs.at(tree.required(id, c.true_branch, "true branch")));
        result.push_back(runs.at(tree.required(id, c.false_branch, "false branch")));
        break;
    }
    case node_kind::dispatch:
    {
        dispatch const& d = tree.payload<dispatch>(id);
        BOOST_FOREACH(node_id arm, d.arms)
            result.push_back(runs.at(tree.required(arm, tree.payload<dispatch_arm>(arm).body, "body")));
        result.push_back(runs.at(tree.required(id, d.else_branch, "else branch")));
        break;
    }
    case node_kind::short_circuit:
        result.push_back(runs.at(tree.required(id, tree.payload<short_circuit>(id).right, "right operand")));
        result.push_back(counts.implicit_branch_count(id));
        break;
    case node_kind::safe_navigation:
        result.push_back(counts.implicit_branch_count(id));
        result.push_back(counts.hits(id, tracker_role::non_nil));
        break;
    case node_kind::loop:
        result.push_back(runs.at(tree.required(id, tree.payload<loop>(id).body, "body")));
        result.push_back(counts.implicit_branch_count(id));
        break;
    default:
        break;
    }
    return result;
}

run_counts demote_partially_covered(flow_counts const& counts, run_counts runs)
{
    std::vector<node_id> order = counts.tree().preorder();
    BOOST_REVERSE_FOREACH(node_id id, order)
    {
        if (!covered(runs.at(id)))
            continue;

        std::vector<hit_count> branches = sub_branch_runs(counts, runs, id);
        if (branches.empty())
            continue;

        hit_count worst = *std::min_element(branches.begin(), branches.end());
        if (!covered(worst))
            runs[id] = worst;
    }
    return runs;
}

std::size_t report_partial_coverage(
    std::ostream& os, syntax_tree const& tree,
    run_counts const& raw, run_counts const& demoted, std::string const& unit)
{
    std::size_t n = 0;
    BOOST_FOREACH(node_id id, tree.preorder())
    {
        if (raw.at(id) == demoted.at(id))
            continue;
        ++n;

        os << unit << ":";
        if (tree[id].range)
            os << tree[id].range->begin.line;
        os << ": warning: " << kind_name(tree[id].kind())
           << " partially covered (runs " << raw[id]
           << ", worst branch " << demoted[id] << ")" << std::endl;
    }
    Log::debug() << n << " partially covered branching constructs" << std::endl;
    return n;
}

void print_runs(
    std::ostream& os, syntax_tree const& tree,
    run_counts const& raw, run_counts const& demoted)
{
    BOOST_FOREACH(node_id id, tree.preorder())
    {
        if (!is_branching(tree[id].kind()))
            continue;
        os << kind_name(tree[id].kind());
        if (tree[id].range)
            os << " " << tree[id].range->begin;
        os << " " << raw.at(id) << " " << demoted.at(id) << "\n";
    }
}

} // namespace branchcov
