// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef BRANCHCOV_BRANCH_REPORT_HPP
# define BRANCHCOV_BRANCH_REPORT_HPP

# include "syntax_tree.hpp"
# include "flow_counts.hpp"
# include "source_buffer.hpp"
# include <boost/operators.hpp>
# include <ostream>
# include <utility>
# include <vector>

namespace branchcov {

// The tags of the reference branch coverage report
enum class branch_key
{
    if_, unless, case_, when, else_, then, while_, until, body,
    safe_navigation,    // &.
    conjunction,        // &&
    disjunction         // ||
};

char const* key_name(branch_key k);

// (kind, location id, first line, first column, last line, last column)
struct descriptor : boost::equality_comparable<descriptor>
{
    descriptor() : key(branch_key::if_), location_id(0) {}
    descriptor(branch_key key, std::size_t location_id, source_range range)
        : key(key), location_id(location_id), range(range)
    {}

    friend bool operator==(descriptor const& lhs, descriptor const& rhs)
    {
        return lhs.key == rhs.key
            && lhs.location_id == rhs.location_id
            && lhs.range == rhs.range;
    }

    // Prints the reference form, e.g. [:then, 2, 2, 2, 2, 3]
    friend std::ostream& operator<<(std::ostream& os, descriptor const& d);

    branch_key key;
    std::size_t location_id;
    source_range range;
};

typedef std::pair<descriptor, hit_count> branch_entry;

struct branch_record
{
    node_id node;               // the branching construct
    descriptor condition;
    std::vector<branch_entry> branches; // in report order
};

// Condition records in traversal order
typedef std::vector<branch_record> branch_report;

// Walks the tree in preorder and derives one record per branching
// construct.  Location ids start at 1 on every call.
branch_report build_branch_report(
    syntax_tree const& tree, flow_counts const& counts, source_buffer const& source);

// Prints the report the way the reference runtime inspects its own:
// {[:if, 1, ...]=>{[:then, 2, ...]=>1, ...}, ...}
std::ostream& operator<<(std::ostream& os, branch_report const& report);

} // namespace branchcov

#endif // BRANCHCOV_BRANCH_REPORT_HPP
