// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef BRANCHCOV_SOURCE_RANGE_HPP
# define BRANCHCOV_SOURCE_RANGE_HPP

# include <boost/operators.hpp>
# include <ostream>

namespace branchcov {

// A point in the program text.  Lines count from 1, columns from 0,
// which is the convention of the reference coverage report.
struct position : boost::totally_ordered<position>
{
    position() : line(0), column(0) {}
    position(int line, int column) : line(line), column(column) {}

    friend bool operator==(position const& lhs, position const& rhs)
    {
        return lhs.line == rhs.line && lhs.column == rhs.column;
    }

    friend bool operator<(position const& lhs, position const& rhs)
    {
        return lhs.line < rhs.line
            || (lhs.line == rhs.line && lhs.column < rhs.column);
    }

    friend std::ostream& operator<<(std::ostream& os, position const& p)
    {
        return os << p.line << ":" << p.column;
    }

    int line;
    int column;
};

// A half-open span of program text; the end column is exclusive.
struct source_range : boost::equality_comparable<source_range>
{
    source_range() {}
    source_range(position begin, position end) : begin(begin), end(end) {}
    source_range(int first_line, int first_column, int last_line, int last_column)
        : begin(first_line, first_column), end(last_line, last_column)
    {}

    // The empty range sitting at p
    static source_range at(position p) { return source_range(p, p); }

    source_range with_end(position p) const { return source_range(begin, p); }
    source_range with_begin(position p) const { return source_range(p, end); }

    bool empty() const { return begin == end; }

    friend bool operator==(source_range const& lhs, source_range const& rhs)
    {
        return lhs.begin == rhs.begin && lhs.end == rhs.end;
    }

    friend std::ostream& operator<<(std::ostream& os, source_range const& r)
    {
        return os << r.begin << "-" << r.end;
    }

    position begin;
    position end;
};

} // namespace branchcov

#endif // BRANCHCOV_SOURCE_RANGE_HPP
