// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#include "source_buffer.hpp"
#include "log.hpp"

#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <cctype>

namespace branchcov {

source_buffer::source_buffer(std::string const& text)
{
    if (!text.empty())
        boost::split(lines, text, boost::is_any_of("\n"));
}

position source_buffer::end() const
{
    if (lines.empty())
        return position();
    return position(int(lines.size()), int(lines.back().size()));
}

position source_buffer::skip_to_content_start(source_range const& r) const
{
    if (lines.empty() || r.end.line < 1 || std::size_t(r.end.line) > lines.size())
        return r.end;

    std::size_t line = r.end.line - 1;
    std::size_t column = r.end.column;
    while (line < lines.size())
    {
        std::string const& text = lines[line];
        while (column < text.size() && std::isspace(static_cast<unsigned char>(text[column])))
            ++column;

        if (column < text.size())
        {
            if (text[column] != '#')
                return position(int(line) + 1, int(column));
            // comments run to the end of the line
        }
        ++line;
        column = 0;
    }
    return end();
}

source_buffer read_source_file(std::string const& filename)
{
    std::ifstream file(filename.c_str());
    if (!file)
    {
        throw std::runtime_error("cannot read source: " + filename);
    }
    std::string text(
        (std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    source_buffer result(text);
    Log::info() << "read " << result.line_count() << " source lines from "
                << filename << std::endl;
    return result;
}

} // namespace branchcov
