// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef BRANCHCOV_BRANCH_LOCATIONS_HPP
# define BRANCHCOV_BRANCH_LOCATIONS_HPP

# include "syntax_tree.hpp"
# include "source_buffer.hpp"
# include <boost/optional.hpp>

namespace branchcov {

// Hands out location ids in the order descriptors are created.  One
// counter belongs to one reporting pass.
class location_counter
{
 public:
    location_counter() : last(0) {}

    std::size_t next() { return ++last; }
    std::size_t issued() const { return last; }

 private:
    std::size_t last;
};

// Decides which source range to report for a branch, following the
// reference report's conventions:
//
//   1. a branch with content is reported at its own range;
//   2. a branch whose slot is written but empty is reported at the
//      caller's explicit marker;
//   3. a branch with no syntax at all is reported at the enclosing
//      construct, except that the implicit else of a dispatch with a
//      subject is reported at the subject.
class location_resolver
{
 public:
    location_resolver(syntax_tree const& tree, source_buffer const& source)
        : tree(tree), source(source)
    {}

    source_range resolve(
        node_id enclosing, node_id branch,
        boost::optional<source_range> const& explicit_empty_marker) const;

    // The range a node is reported at.  An elsif arm whose chain ends in
    // an empty else runs up to the `end` of the outermost conditional.
    source_range reported_range(node_id id) const;

    // The empty range at the first content after r
    source_range content_marker(source_range const& r) const
    {
        return source_range::at(source.skip_to_content_start(r));
    }

    // The conditional an elsif chain hangs from
    node_id outermost_conditional(node_id id) const;

    // The last elsif arm of the chain continuing at id
    node_id deepest_elsif(node_id id) const;

 private:
    bool is_elsif(node_id id) const;

    syntax_tree const& tree;
    source_buffer const& source;
};

} // namespace branchcov

#endif // BRANCHCOV_BRANCH_LOCATIONS_HPP
