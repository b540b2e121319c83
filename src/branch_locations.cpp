// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#include "branch_locations.hpp"

namespace branchcov {

bool location_resolver::is_elsif(node_id id) const
{
    return id != no_node
        && tree[id].kind() == node_kind::conditional
        && tree.payload<conditional>(id).style == conditional_style::elsif_style;
}

node_id location_resolver::outermost_conditional(node_id id) const
{
    while (is_elsif(id) && tree.parent(id) != no_node)
        id = tree.parent(id);
    return id;
}

node_id location_resolver::deepest_elsif(node_id id) const
{
    for (;;)
    {
        node_id next = tree.payload<conditional>(id).false_branch;
        if (!is_elsif(next))
            return id;
        id = next;
    }
}

source_range location_resolver::reported_range(node_id id) const
{
    source_range const& r = tree.range(id);
    if (!is_elsif(id))
        return r;

    node_id deepest = deepest_elsif(id);
    if (!tree.is_empty_body(tree.payload<conditional>(deepest).false_branch))
        return r;

    boost::optional<source_range> end_keyword =
        tree.keyword_range(outermost_conditional(id), keyword::end);
    if (!end_keyword)
        return r;
    return r.with_end(end_keyword->begin);
}

source_range location_resolver::resolve(
    node_id enclosing, node_id branch,
    boost::optional<source_range> const& explicit_empty_marker) const
{
    tree.required(enclosing, branch, "branch");

    if (!tree.is_empty_body(branch))
        return reported_range(branch);

    if (tree[branch].range)
        return explicit_empty_marker ? *explicit_empty_marker : *tree[branch].range;

    // Nothing written at all.  The reference report puts a missing
    // dispatch else at the subject rather than the whole construct.
    if (tree[enclosing].kind() == node_kind::dispatch)
    {
        dispatch const& d = tree.payload<dispatch>(enclosing);
        if (branch == d.else_branch && d.subject != no_node)
            return tree.range(d.subject);
    }
    return reported_range(enclosing);
}

} // namespace branchcov
