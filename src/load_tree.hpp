// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef BRANCHCOV_LOAD_TREE_HPP
# define BRANCHCOV_LOAD_TREE_HPP

# include "syntax_tree.hpp"
# include "tree_dump.hpp"
# include <iosfwd>
# include <string>

namespace branchcov {

// Lays the dump out in the syntax_tree's arena, assigning each
// positional child to its kind's slot.  Slots are not checked for
// presence here; the derivation rules do that when they need them.
syntax_tree build_tree(dump::node const& root, std::string const& name);

syntax_tree load_tree(std::istream& in, std::string const& name);
syntax_tree load_tree_file(std::string const& filename);

} // namespace branchcov

#endif // BRANCHCOV_LOAD_TREE_HPP
