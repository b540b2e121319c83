// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#ifndef BRANCHCOV_COUNTER_STORE_HPP
# define BRANCHCOV_COUNTER_STORE_HPP

# include <iosfwd>
# include <string>
# include <unordered_map>

namespace branchcov {

typedef std::size_t tracker_id;
typedef long long hit_count;

// Read-only view of the counters the instrumented program filled in.
// Trackers that never fired have no entry and read as zero.
class counter_store
{
    typedef std::unordered_map<tracker_id, hit_count> storage;
 public:
    counter_store() {}

    hit_count hits(tracker_id id) const
    {
        storage::const_iterator p = counters.find(id);
        return p == counters.end() ? 0 : p->second;
    }

    // Accumulates, so a counter file may list a tracker more than once
    void add(tracker_id id, hit_count n) { counters[id] += n; }

    std::size_t size() const { return counters.size(); }

 private:
    storage counters;
};

counter_store read_counters(std::istream& in, std::string const& filename);
counter_store read_counters_file(std::string const& filename);

} // namespace branchcov

#endif // BRANCHCOV_COUNTER_STORE_HPP
