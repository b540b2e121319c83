// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#include "counter_store.hpp"
#include "log.hpp"

#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/lexical_cast.hpp>
#include <fstream>
#include <stdexcept>
#include <vector>

namespace branchcov {

counter_store read_counters(std::istream& in, std::string const& filename)
{
    counter_store result;
    std::string line;
    int line_no = 0;
    while (std::getline(in, line))
    {
        ++line_no;
        boost::algorithm::trim(line);
        if (line.empty() || line[0] == '#')
        {
            continue;
        }
        std::vector<std::string> fields;
        boost::split(fields, line, boost::is_any_of(" \t"), boost::token_compress_on);
        if (fields.size() != 2)
        {
            throw std::runtime_error(
                filename + ":" + boost::lexical_cast<std::string>(line_no)
                + ": error: expected 'tracker count', got '" + line + "'");
        }
        try
        {
            hit_count n = boost::lexical_cast<hit_count>(fields[1]);
            // lexical_cast wraps a negative id into range
            if (n < 0 || boost::starts_with(fields[0], "-"))
            {
                throw boost::bad_lexical_cast();
            }
            result.add(boost::lexical_cast<tracker_id>(fields[0]), n);
        }
        catch (boost::bad_lexical_cast const&)
        {
            throw std::runtime_error(
                filename + ":" + boost::lexical_cast<std::string>(line_no)
                + ": error: bad counter entry '" + line + "'");
        }
    }
    return result;
}

counter_store read_counters_file(std::string const& filename)
{
    std::ifstream file(filename.c_str());
    if (!file)
    {
        throw std::runtime_error("cannot read counters: " + filename);
    }
    counter_store result = read_counters(file, filename);
    Log::info() << "read " << result.size() << " counters from " << filename << std::endl;
    return result;
}

} // namespace branchcov
