// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef BRANCHCOV_TREE_DUMP_HPP
# define BRANCHCOV_TREE_DUMP_HPP

# include <boost/fusion/adapted/struct/define_struct.hpp>
# include <boost/fusion/include/adapt_struct.hpp>
# include <boost/container/vector.hpp>
# include <boost/optional.hpp>
# include <vector>
# include <string>

// The textual form of a decorated tree, as the parser reads it.
// load_tree turns it into a syntax_tree.

BOOST_FUSION_DEFINE_STRUCT((branchcov)(dump), range,
  (int, first_line)
  (int, first_column)
  (int, last_line)
  (int, last_column)
  )

BOOST_FUSION_DEFINE_STRUCT((branchcov)(dump), attribute,
  (std::string, name)
  (std::string, value)
  )

namespace branchcov { namespace dump {

struct node
{
    std::string kind;
    int line;                           // in the dump file
    boost::optional<range> location;
    std::vector<attribute> attributes;
    // boost::container::vector accepts the incomplete element type
    boost::container::vector<node> children;
};

// Marks a slot with no syntax: (_)
inline bool is_absent(node const& n)
{
    return n.kind == "_";
}

}} // namespace branchcov::dump

BOOST_FUSION_ADAPT_STRUCT(
  branchcov::dump::node,
  (std::string, kind)
  (int, line)
  (boost::optional<branchcov::dump::range>, location)
  (std::vector<branchcov::dump::attribute>, attributes)
  (boost::container::vector<branchcov::dump::node>, children)
  )

#endif // BRANCHCOV_TREE_DUMP_HPP
