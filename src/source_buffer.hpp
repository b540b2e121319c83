// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef BRANCHCOV_SOURCE_BUFFER_HPP
# define BRANCHCOV_SOURCE_BUFFER_HPP

# include "source_range.hpp"
# include <string>
# include <vector>

namespace branchcov {

// The text of one compiled unit, split into lines.  Only used to find
// where the next piece of content starts after a keyword.
class source_buffer
{
 public:
    source_buffer() {}
    explicit source_buffer(std::string const& text);

    // Returns the position immediately following any whitespace
    // (newlines included) and '#' comments after r.end.  With no text
    // loaded, r.end is returned unchanged.
    position skip_to_content_start(source_range const& r) const;

    // The position just past the last character
    position end() const;

    std::size_t line_count() const { return lines.size(); }
    bool empty() const { return lines.empty(); }

 private:
    std::vector<std::string> lines;
};

source_buffer read_source_file(std::string const& filename);

} // namespace branchcov

#endif // BRANCHCOV_SOURCE_BUFFER_HPP
