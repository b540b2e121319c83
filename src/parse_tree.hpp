// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef BRANCHCOV_PARSE_TREE_HPP
# define BRANCHCOV_PARSE_TREE_HPP

#include "tree_dump.hpp"
#include <iosfwd>
#include <string>

namespace branchcov {

// Throws std::runtime_error pointing at the offending line and column
dump::node parse_tree(std::istream& in, std::string const& name);
dump::node parse_tree_file(std::string const& filename);

}

#endif // BRANCHCOV_PARSE_TREE_HPP
