// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef BRANCHCOV_ERRORS_HPP
# define BRANCHCOV_ERRORS_HPP

# include <stdexcept>
# include <string>

namespace branchcov {

// A node lacks a child that its kind guarantees.  The tree builder
// upstream is at fault, not the program being measured.
class malformed_tree : public std::runtime_error
{
 public:
    explicit malformed_tree(std::string const& message)
        : std::runtime_error("malformed tree: " + message)
    {}
};

// A derived count came out negative, or control left a node more
// often than it entered.  Counters were lost or torn.
class inconsistent_counts : public std::runtime_error
{
 public:
    explicit inconsistent_counts(std::string const& message)
        : std::runtime_error("inconsistent counts: " + message)
    {}
};

} // namespace branchcov

#endif // BRANCHCOV_ERRORS_HPP
