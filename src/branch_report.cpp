// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#include "branch_report.hpp"
#include "branch_locations.hpp"
#include "log.hpp"

#include <utility>

namespace branchcov {

char const* key_name(branch_key k)
{
    switch (k)
    {
    case branch_key::if_: return "if";
    case branch_key::unless: return "unless";
    case branch_key::case_: return "case";
    case branch_key::when: return "when";
    case branch_key::else_: return "else";
    case branch_key::then: return "then";
    case branch_key::while_: return "while";
    case branch_key::until: return "until";
    case branch_key::body: return "body";
    case branch_key::safe_navigation: return "&.";
    case branch_key::conjunction: return "&&";
    case branch_key::disjunction: return "||";
    }
    return "?";
}

std::ostream& operator<<(std::ostream& os, descriptor const& d)
{
    // Operator symbols need quoting to read back as symbols
    bool quoted = d.key == branch_key::safe_navigation
        || d.key == branch_key::conjunction
        || d.key == branch_key::disjunction;
    os << "[:";
    if (quoted)
        os << '"' << key_name(d.key) << '"';
    else
        os << key_name(d.key);
    return os << ", " << d.location_id
              << ", " << d.range.begin.line << ", " << d.range.begin.column
              << ", " << d.range.end.line << ", " << d.range.end.column << "]";
}

std::ostream& operator<<(std::ostream& os, branch_report const& report)
{
    os << "{";
    for (std::size_t i = 0; i < report.size(); ++i)
    {
        if (i != 0)
            os << ",\n ";
        os << report[i].condition << "=>{";
        std::vector<branch_entry> const& branches = report[i].branches;
        for (std::size_t j = 0; j < branches.size(); ++j)
        {
            if (j != 0)
                os << ", ";
            os << branches[j].first << "=>" << branches[j].second;
        }
        os << "}";
    }
    return os << "}";
}

namespace
{
  struct report_builder : boost::static_visitor<void>
  {
      report_builder(syntax_tree const& tree, flow_counts const& counts, source_buffer const& source)
          : tree(tree), counts(counts), locations(tree, source), id(no_node)
      {}

      void visit(node_id n)
      {
          id = n;
          boost::apply_visitor(*this, tree[n].payload);
      }

      // Constructs with no branches of their own
      void operator()(expression const&) {}
      void operator()(sequence const&) {}
      void operator()(empty_body const&) {}
      void operator()(dispatch_arm const&) {}
      void operator()(rescue const&) {}
      void operator()(handler_arm const&) {}
      void operator()(ensure const&) {}

      void operator()(conditional const& c)
      {
          tree.required(id, c.condition, "condition");
          node_id branches[2] = {
              tree.required(id, c.true_branch, "true branch"),
              tree.required(id, c.false_branch, "false branch")
          };
          bool negated = c.style == conditional_style::unless_style;

          branch_record& record = open(negated ? branch_key::unless : branch_key::if_,
                                       locations.reported_range(id));

          // Where an empty clause is reported.  A ternary cannot have
          // one; a modifier has no keywords and falls back to the node.
          boost::optional<source_range> markers[2];
          if (c.style != conditional_style::ternary_style)
          {
              boost::optional<source_range> begin_keyword = tree.keyword_range(id, keyword::begin);
              boost::optional<source_range> else_keyword = tree.keyword_range(id, keyword::else_clause);
              boost::optional<source_range> end_keyword =
                  tree.keyword_range(locations.outermost_conditional(id), keyword::end);

              if (begin_keyword)
                  markers[0] = locations.content_marker(*begin_keyword);
              else if (else_keyword)
                  markers[0] = source_range::at(else_keyword->begin);
              if (else_keyword)
                  markers[1] = locations.content_marker(*else_keyword);

              for (auto& m : markers)
                  if (!m && end_keyword)
                      m = source_range::at(end_keyword->begin);
          }

          branch_key keys[2] = { branch_key::then, branch_key::else_ };
          if (negated)
          {
              std::swap(keys[0], keys[1]);
              std::swap(markers[0], markers[1]);
          }

          for (int i = 0; i < 2; ++i)
          {
              add(record, keys[i],
                  locations.resolve(id, branches[i], markers[i]),
                  counts.execution_count(branches[i]));
          }
      }

      void operator()(dispatch const& d)
      {
          node_id else_branch = tree.required(id, d.else_branch, "else branch");
          branch_record& record = open(branch_key::case_, tree.range(id));

          for (auto arm : d.arms)
          {
              node_id body = tree.required(arm, tree.payload<dispatch_arm>(arm).body, "body");
              boost::optional<source_range> begin_keyword = tree.keyword_range(arm, keyword::begin);

              source_range where;
              if (tree.is_empty_body(body))
              {
                  where = locations.resolve(
                      id, body,
                      locations.content_marker(begin_keyword ? *begin_keyword : tree.range(arm)));
              }
              else
              {
                  source_range const& content = tree.range(body);
                  where = begin_keyword
                      ? source_range(locations.content_marker(*begin_keyword).begin, content.end)
                      : content;
              }
              add(record, branch_key::when, where, counts.execution_count(body));
          }

          boost::optional<source_range> else_marker;
          boost::optional<source_range> end_keyword = tree.keyword_range(id, keyword::end);
          if (tree.keyword_range(id, keyword::else_clause) && end_keyword)
              else_marker = source_range::at(end_keyword->begin);

          add(record, branch_key::else_,
              locations.resolve(id, else_branch, else_marker),
              counts.execution_count(else_branch));
      }

      void operator()(short_circuit const& s)
      {
          node_id left = tree.required(id, s.left, "left operand");
          node_id right = tree.required(id, s.right, "right operand");
          bool conjunction = s.op == logical_operator::conjunction;

          branch_record& record = open(
              conjunction ? branch_key::conjunction : branch_key::disjunction, tree.range(id));

          // The right side runs when && finds its left side true, or
          // when || finds it false.
          add(record, conjunction ? branch_key::then : branch_key::else_,
              tree.range(right), counts.execution_count(right));
          add(record, conjunction ? branch_key::else_ : branch_key::then,
              source_range::at(tree.range(left).end), counts.implicit_branch_count(id));
      }

      void operator()(safe_navigation const& s)
      {
          tree.required(id, s.receiver, "receiver");
          source_range const& where = tree.range(id);

          branch_record& record = open(branch_key::safe_navigation, where);
          add(record, branch_key::then, where, counts.hits(id, tracker_role::non_nil));
          add(record, branch_key::else_, where, counts.implicit_branch_count(id));
      }

      void operator()(loop const& l)
      {
          tree.required(id, l.condition, "condition");
          node_id body = tree.required(id, l.body, "body");

          branch_record& record = open(
              l.polarity == loop_polarity::while_loop ? branch_key::while_ : branch_key::until,
              tree.range(id));

          // A pre-test loop reports a begin...end body whole, keywords
          // included.
          std::vector<node_id> statements;
          if (tree[body].kind() == node_kind::sequence
              && (l.test == loop_test::post_test || !tree.payload<sequence>(body).explicit_begin))
              statements = tree.payload<sequence>(body).statements;
          else if (l.test == loop_test::post_test && !tree.is_empty_body(body))
              statements.push_back(body);

          source_range where;
          if (!statements.empty())
          {
              where = tree.range(statements.front()).with_end(tree.range(statements.back()).end);
          }
          else
          {
              boost::optional<source_range> end_keyword = tree.keyword_range(body, keyword::end);
              if (l.test == loop_test::post_test && end_keyword)
                  where = source_range::at(end_keyword->begin);
              else
                  where = locations.resolve(id, body, boost::none);
          }
          add(record, branch_key::body, where, counts.execution_count(body));
      }

      branch_record& open(branch_key key, source_range const& where)
      {
          Log::trace() << "branches of " << tree.describe(id) << std::endl;
          branch_record record;
          record.node = id;
          record.condition = descriptor(key, ids.next(), where);
          report.push_back(record);
          return report.back();
      }

      void add(branch_record& record, branch_key key, source_range const& where, hit_count n)
      {
          record.branches.push_back(branch_entry(descriptor(key, ids.next(), where), n));
      }

      syntax_tree const& tree;
      flow_counts const& counts;
      location_resolver locations;
      location_counter ids;
      node_id id;
      branch_report report;
  };
}

branch_report build_branch_report(
    syntax_tree const& tree, flow_counts const& counts, source_buffer const& source)
{
    report_builder builder(tree, counts, source);
    for (auto n : tree.preorder())
        builder.visit(n);

    Log::debug() << builder.report.size() << " branching constructs, "
                 << builder.ids.issued() << " locations" << std::endl;
    return builder.report;
}

} // namespace branchcov
