// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#include "load_tree.hpp"
#include "parse_tree.hpp"
#include "log.hpp"

#include <boost/spirit/include/qi.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/lexical_cast.hpp>
#include <stdexcept>
#include <utility>

namespace branchcov {

namespace
{
  struct tracker_name
  {
      char const* name;
      tracker_role role;
  };

  tracker_name const tracker_names[] =
  {
      { "entry", tracker_role::entry },
      { "completion", tracker_role::completion },
      { "truthy", tracker_role::truthy },
      { "entered_body", tracker_role::entered_body },
      { "else_entered", tracker_role::else_entered },
      { "conditional", tracker_role::conditional },
      { "body", tracker_role::body },
      { "non_nil", tracker_role::non_nil },
      { "nil_receiver", tracker_role::nil_receiver }
  };

  struct keyword_name
  {
      char const* name;
      keyword key;
  };

  keyword_name const keyword_names[] =
  {
      { "begin", keyword::begin },
      { "else", keyword::else_clause },
      { "end", keyword::end }
  };

  source_range to_range(dump::range const& r)
  {
      return source_range(r.first_line, r.first_column, r.last_line, r.last_column);
  }

  struct tree_builder
  {
      tree_builder(syntax_tree& tree, std::string const& name)
          : tree(tree), name(name)
      {}

      node_id build(dump::node const& d)
      {
          if (dump::is_absent(d))
              return no_node;

          node_id id = tree.add_node();

          std::vector<node_id> kids;
          std::vector<std::string> kinds;
          for (auto const& c : d.children)
          {
              kids.push_back(build(c));
              kinds.push_back(c.kind);
          }

          node& n = tree.modify(id);
          if (d.location)
              n.range = to_range(*d.location);
          read_attributes(d, n);
          n.payload = make_payload(d, kids, kinds);

          tree.adopt(id, kids);
          return id;
      }

   private:
      std::runtime_error format_error(dump::node const& d, std::string const& what) const
      {
          return std::runtime_error(
              name + ":" + boost::lexical_cast<std::string>(d.line) + ": error: " + what);
      }

      source_range parse_range(dump::node const& d, std::string const& text) const
      {
          namespace qi = boost::spirit::qi;
          unsigned first_line = 0, first_column = 0, last_line = 0, last_column = 0;
          std::string::const_iterator first = text.begin();
          bool ok = qi::parse(
              first, text.end(),
              qi::uint_ >> ':' >> qi::uint_ >> '-' >> qi::uint_ >> ':' >> qi::uint_,
              first_line, first_column, last_line, last_column);
          if (!ok || first != text.end())
              throw format_error(d, "bad range '" + text + "'");
          return source_range(first_line, first_column, last_line, last_column);
      }

      void read_attributes(dump::node const& d, node& n) const
      {
          for (auto const& a : d.attributes)
          {
              if (a.name == "style")
                  continue; // read with the payload

              bool known = false;
              for (auto const& t : tracker_names)
              {
                  if (a.name != t.name)
                      continue;
                  try
                  {
                      // lexical_cast wraps a negative value into range
                      if (boost::starts_with(a.value, "-"))
                          throw boost::bad_lexical_cast();
                      n.trackers[t.role] = boost::lexical_cast<tracker_id>(a.value);
                  }
                  catch (boost::bad_lexical_cast const&)
                  {
                      throw format_error(d, "bad tracker id '" + a.value + "'");
                  }
                  known = true;
              }
              for (auto const& k : keyword_names)
              {
                  if (a.name != k.name)
                      continue;
                  n.keywords[k.key] = parse_range(d, a.value);
                  known = true;
              }
              if (!known)
              {
                  Log::warn() << name << ":" << d.line << ": ignoring unknown attribute '"
                              << a.name << "' on " << d.kind << std::endl;
              }
          }
      }

      static std::string style_of(dump::node const& d)
      {
          for (auto const& a : d.attributes)
              if (a.name == "style")
                  return a.value;
          return "if";
      }

      static node_id slot(std::vector<node_id> const& kids, std::size_t i)
      {
          return i < kids.size() ? kids[i] : no_node;
      }

      void expect_at_most(dump::node const& d, std::vector<node_id> const& kids, std::size_t n) const
      {
          if (kids.size() > n)
              throw format_error(d, "too many children for " + d.kind);
      }

      static std::vector<node_id> present(std::vector<node_id> const& kids)
      {
          std::vector<node_id> result;
          for (auto k : kids)
              if (k != no_node)
                  result.push_back(k);
          return result;
      }

      // Lays out a leading slot, a run of arms of the given kind, and a
      // trailing slot, as in case/when/else and rescue/resbody/else.
      void split_arms(
          dump::node const& d,
          std::vector<node_id> const& kids, std::vector<std::string> const& kinds,
          char const* arm_kind,
          node_id& leading, std::vector<node_id>& arms, node_id& trailing) const
      {
          std::size_t i = 0;
          leading = no_node;
          trailing = no_node;
          if (i < kids.size() && kinds[i] != arm_kind)
              leading = kids[i++];
          while (i < kids.size() && kinds[i] == arm_kind)
              arms.push_back(kids[i++]);
          if (i < kids.size())
              trailing = kids[i++];
          if (i < kids.size())
              throw format_error(d, "unexpected child " + kinds[i] + " in " + d.kind);
      }

      node_payload make_payload(
          dump::node const& d,
          std::vector<node_id> const& kids, std::vector<std::string> const& kinds) const
      {
          std::string const& k = d.kind;
          if (k == "if")
          {
              expect_at_most(d, kids, 3);
              conditional c;
              std::string style = style_of(d);
              if (style == "if")
                  c.style = conditional_style::if_style;
              else if (style == "unless")
                  c.style = conditional_style::unless_style;
              else if (style == "elsif")
                  c.style = conditional_style::elsif_style;
              else if (style == "ternary")
                  c.style = conditional_style::ternary_style;
              else
                  throw format_error(d, "unknown conditional style '" + style + "'");
              c.condition = slot(kids, 0);
              c.true_branch = slot(kids, 1);
              c.false_branch = slot(kids, 2);
              return c;
          }
          if (k == "case")
          {
              dispatch c;
              split_arms(d, kids, kinds, "when", c.subject, c.arms, c.else_branch);
              return c;
          }
          if (k == "when")
          {
              dispatch_arm w;
              w.body = kids.empty() ? no_node : kids.back();
              for (std::size_t i = 0; i + 1 < kids.size(); ++i)
                  if (kids[i] != no_node)
                      w.patterns.push_back(kids[i]);
              return w;
          }
          if (k == "and" || k == "or")
          {
              expect_at_most(d, kids, 2);
              short_circuit s;
              s.op = k == "and" ? logical_operator::conjunction : logical_operator::disjunction;
              s.left = slot(kids, 0);
              s.right = slot(kids, 1);
              return s;
          }
          if (k == "csend")
          {
              safe_navigation s;
              s.receiver = slot(kids, 0);
              if (kids.size() > 1)
                  s.arguments = present(std::vector<node_id>(kids.begin() + 1, kids.end()));
              return s;
          }
          if (k == "while" || k == "until" || k == "while_post" || k == "until_post")
          {
              expect_at_most(d, kids, 2);
              loop l;
              l.polarity = k.compare(0, 5, "while") == 0
                  ? loop_polarity::while_loop : loop_polarity::until_loop;
              l.test = k.size() > 5 && k.compare(k.size() - 5, 5, "_post") == 0
                  ? loop_test::post_test : loop_test::pre_test;
              l.condition = slot(kids, 0);
              l.body = slot(kids, 1);
              return l;
          }
          if (k == "rescue")
          {
              rescue r;
              split_arms(d, kids, kinds, "resbody", r.watched_body, r.handlers, r.else_branch);
              return r;
          }
          if (k == "resbody")
          {
              expect_at_most(d, kids, 3);
              handler_arm h;
              h.exceptions = slot(kids, 0);
              h.assignment = slot(kids, 1);
              h.body = slot(kids, 2);
              return h;
          }
          if (k == "ensure")
          {
              expect_at_most(d, kids, 2);
              ensure e;
              e.body = slot(kids, 0);
              e.ensure_body = slot(kids, 1);
              return e;
          }
          if (k == "begin" || k == "kwbegin")
          {
              sequence s;
              s.explicit_begin = k == "kwbegin";
              s.statements = present(kids);
              return s;
          }
          if (k == "empty")
          {
              expect_at_most(d, kids, 0);
              return empty_body();
          }
          expression e;
          e.type = k;
          e.operands = present(kids);
          return e;
      }

      syntax_tree& tree;
      std::string const& name;
  };
}

syntax_tree build_tree(dump::node const& root, std::string const& name)
{
    syntax_tree tree;
    tree_builder builder(tree, name);
    if (builder.build(root) == no_node)
        throw std::runtime_error(name + ": error: the root of a tree cannot be absent");
    Log::info() << "loaded " << tree.size() << " nodes from " << name << std::endl;
    return tree;
}

syntax_tree load_tree(std::istream& in, std::string const& name)
{
    return build_tree(parse_tree(in, name), name);
}

syntax_tree load_tree_file(std::string const& filename)
{
    return build_tree(parse_tree_file(filename), filename);
}

} // namespace branchcov
