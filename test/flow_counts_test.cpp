// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#define BOOST_TEST_MODULE flow_counts
#include <boost/test/unit_test.hpp>

#include "flow_counts.hpp"
#include "load_tree.hpp"
#include <initializer_list>
#include <sstream>
#include <utility>

using namespace branchcov;

static syntax_tree load(std::string const& text)
  {
  std::istringstream in(text);
  return load_tree(in, "test.tree");
  }

static counter_store hits(std::initializer_list<std::pair<tracker_id, hit_count> > entries)
  {
  counter_store c;
  for (auto const& e : entries)
    c.add(e.first, e.second);
  return c;
  }

// Every node stays within the bounds its entry count sets
static void check_bounds(flow_counts const& f)
  {
  syntax_tree const& t = f.tree();
  for (node_id id = 0; id < t.size(); ++id)
    {
    BOOST_CHECK_LE(f.flow_completion_count(id), f.flow_entry_count(id));
    if (t[id].kind() != node_kind::handler_arm)
      BOOST_CHECK_LE(f.execution_count(id), f.flow_entry_count(id));
    }
  }

BOOST_AUTO_TEST_CASE(conditional_flow)
  {
  // if x then a else b end, entered 3 times, x true twice
  syntax_tree t = load(
    "(if @1:0-1:22 entry=1 truthy=2\n"
    "  (send @1:3-1:4)\n"
    "  (send @1:10-1:11)\n"
    "  (send @1:17-1:18))\n");
  counter_store c = hits({{1, 3}, {2, 2}});
  flow_counts f(t, c);

  BOOST_CHECK_EQUAL(f.flow_entry_count(0), 3);
  BOOST_CHECK_EQUAL(f.execution_count(1), 3);
  BOOST_CHECK_EQUAL(f.execution_count(2), 2);
  BOOST_CHECK_EQUAL(f.execution_count(3), 1);
  BOOST_CHECK_EQUAL(f.flow_completion_count(0), 3);
  BOOST_CHECK_EQUAL(f.hits(0, tracker_role::truthy), 2);
  BOOST_CHECK_EQUAL(f.hits(0, tracker_role::completion), 0);
  check_bounds(f);
  }

BOOST_AUTO_TEST_CASE(early_exit_loses_completions)
  {
  // if x then raise_it; a end, where raise_it never completes
  syntax_tree t = load(
    "(if @1:0-1:28 entry=1 truthy=2\n"
    "  (send @1:3-1:4)\n"
    "  (begin @1:10-1:22\n"
    "    (send @1:10-1:18 completion=3)\n"
    "    (send @1:20-1:21))\n"
    "  (empty))\n");
  counter_store c = hits({{1, 2}, {2, 2}, {3, 0}});
  flow_counts f(t, c);

  BOOST_CHECK_EQUAL(f.execution_count(2), 2);
  BOOST_CHECK_EQUAL(f.execution_count(4), 0);
  BOOST_CHECK_EQUAL(f.flow_completion_count(2), 0);
  BOOST_CHECK_EQUAL(f.flow_completion_count(0), 0);
  check_bounds(f);
  }

BOOST_AUTO_TEST_CASE(rescued_exception)
  {
  // begin; r; rescue; h; end where r raises once and h runs once
  syntax_tree t = load(
    "(kwbegin @1:0-1:25 entry=1\n"
    "  (rescue @1:7-1:21\n"
    "    (send @1:7-1:8 completion=2)\n"
    "    (resbody @1:10-1:21 entered_body=3 (_) (_) (send @1:18-1:19))\n"
    "    (_)))\n");
  counter_store c = hits({{1, 1}, {3, 1}});
  flow_counts f(t, c);

  node_id rescue_node = 1, watched = 2, handler = 3;
  BOOST_CHECK_EQUAL(f.flow_completion_count(watched), 0);
  BOOST_CHECK_EQUAL(f.handler_entry_count(handler), 1);
  BOOST_CHECK_EQUAL(f.execution_count(handler), 1);
  BOOST_CHECK_EQUAL(f.flow_completion_count(handler), 1);
  BOOST_CHECK_EQUAL(f.flow_completion_count(rescue_node), 1);
  BOOST_CHECK_EQUAL(f.flow_completion_count(0), 1);
  check_bounds(f);
  }

BOOST_AUTO_TEST_CASE(handler_arms_share_the_exceptions)
  {
  // begin; r; rescue A; h1; rescue B; h2; else; e; end
  syntax_tree t = load(
    "(kwbegin entry=1\n"
    "  (rescue\n"
    "    (send completion=2)\n"
    "    (resbody entered_body=3 (const) (_) (send))\n"
    "    (resbody entered_body=4 (const) (_) (send))\n"
    "    (send)))\n");
  counter_store c = hits({{1, 4}, {2, 1}, {3, 1}, {4, 2}});
  flow_counts f(t, c);

  rescue const& r = t.payload<rescue>(1);
  BOOST_REQUIRE_EQUAL(r.handlers.size(), 2u);
  BOOST_CHECK_EQUAL(f.handler_entry_count(r.handlers[0]), 3);
  BOOST_CHECK_EQUAL(f.handler_entry_count(r.handlers[1]), 2);
  BOOST_CHECK_EQUAL(f.execution_count(r.handlers[0]), 1);
  BOOST_CHECK_EQUAL(f.execution_count(r.handlers[1]), 2);

  // The else clause runs when the protected body completes
  BOOST_CHECK_EQUAL(f.execution_count(1), 1);
  BOOST_CHECK_EQUAL(f.flow_entry_count(r.else_branch), 1);
  BOOST_CHECK_EQUAL(f.flow_completion_count(1), 4);
  }

BOOST_AUTO_TEST_CASE(rescue_without_protected_body)
  {
  syntax_tree t = load(
    "(rescue entry=1 (_) (resbody entered_body=2 (_) (_) (_)) (_))\n");
  counter_store c = hits({{1, 2}});
  flow_counts f(t, c);
  BOOST_CHECK_EQUAL(f.handler_entry_count(1), 2);
  BOOST_CHECK_EQUAL(f.execution_count(1), 0);
  BOOST_CHECK_EQUAL(f.flow_completion_count(1), 0);
  BOOST_CHECK_EQUAL(f.flow_completion_count(0), 2);
  }

BOOST_AUTO_TEST_CASE(ensure_runs_however_the_body_is_left)
  {
  syntax_tree t = load(
    "(ensure entry=1 (send completion=2) (send))\n");
  counter_store c = hits({{1, 3}, {2, 1}});
  flow_counts f(t, c);
  BOOST_CHECK_EQUAL(f.flow_entry_count(2), 3);
  BOOST_CHECK_EQUAL(f.flow_completion_count(0), 1);
  }

BOOST_AUTO_TEST_CASE(ensure_without_guarded_body)
  {
  syntax_tree t = load(
    "(ensure entry=1 (_) (send completion=2))\n");
  counter_store c = hits({{1, 3}, {2, 1}});
  flow_counts f(t, c);
  BOOST_CHECK_EQUAL(f.flow_entry_count(1), 3);
  BOOST_CHECK_EQUAL(f.flow_completion_count(1), 1);
  BOOST_CHECK_EQUAL(f.flow_completion_count(0), 1);
  check_bounds(f);
  }

BOOST_AUTO_TEST_CASE(ensure_with_nothing_written)
  {
  syntax_tree t = load("(ensure entry=1 (_) (_))\n");
  counter_store c = hits({{1, 3}});
  flow_counts f(t, c);
  BOOST_CHECK_EQUAL(f.flow_entry_count(0), 3);
  BOOST_CHECK_EQUAL(f.flow_completion_count(0), 3);
  }

BOOST_AUTO_TEST_CASE(rescue_with_else_clause)
  {
  // begin; r; rescue; h; else; e; end
  syntax_tree t = load(
    "(rescue entry=1\n"
    "  (send completion=2)\n"
    "  (resbody entered_body=3 (_) (_) (send))\n"
    "  (send completion=4))\n");
  counter_store c = hits({{1, 3}, {2, 2}, {3, 1}, {4, 2}});
  flow_counts f(t, c);

  rescue const& r = t.payload<rescue>(0);
  BOOST_REQUIRE_EQUAL(r.handlers.size(), 1u);
  BOOST_REQUIRE(r.else_branch != no_node);
  BOOST_CHECK_EQUAL(f.flow_entry_count(r.else_branch), 2);
  BOOST_CHECK_EQUAL(f.flow_completion_count(r.else_branch), 2);
  BOOST_CHECK_EQUAL(f.flow_completion_count(r.handlers[0]), 1);

  // Completions come from the else clause, not the protected body
  BOOST_CHECK_EQUAL(f.flow_completion_count(0), 3);
  check_bounds(f);
  }

BOOST_AUTO_TEST_CASE(handler_completes_more_than_it_ran)
  {
  syntax_tree t = load(
    "(rescue entry=1\n"
    "  (send completion=2)\n"
    "  (resbody entered_body=3 (_) (_) (send completion=4))\n"
    "  (_))\n");
  counter_store c = hits({{1, 2}, {2, 1}, {3, 1}, {4, 2}});
  flow_counts f(t, c);

  node_id handler = t.payload<rescue>(0).handlers.at(0);
  BOOST_CHECK_EQUAL(f.execution_count(handler), 1);
  BOOST_CHECK_THROW(f.flow_completion_count(handler), inconsistent_counts);
  BOOST_CHECK_THROW(f.flow_completion_count(0), inconsistent_counts);
  }

BOOST_AUTO_TEST_CASE(dispatch_flow)
  {
  // case x when 1 then a when 2 then b else c end
  syntax_tree t = load(
    "(case entry=1 else_entered=4\n"
    "  (lvar)\n"
    "  (when entered_body=2 (int) (send))\n"
    "  (when entered_body=3 (int) (send))\n"
    "  (send))\n");
  counter_store c = hits({{1, 4}, {2, 1}, {3, 2}, {4, 1}});
  flow_counts f(t, c);

  dispatch const& d = t.payload<dispatch>(0);
  BOOST_CHECK_EQUAL(f.flow_entry_count(d.arms[0]), 4);
  BOOST_CHECK_EQUAL(f.flow_entry_count(d.arms[1]), 3);
  BOOST_CHECK_EQUAL(f.execution_count(t.payload<dispatch_arm>(d.arms[1]).body), 2);
  BOOST_CHECK_EQUAL(f.execution_count(d.else_branch), 1);
  BOOST_CHECK_EQUAL(f.flow_completion_count(0), 4);
  check_bounds(f);
  }

BOOST_AUTO_TEST_CASE(short_circuit_flow)
  {
  syntax_tree t = load("(and entry=1 conditional=2 (lvar) (send))\n");
  counter_store c = hits({{1, 3}, {2, 2}});
  flow_counts f(t, c);
  BOOST_CHECK_EQUAL(f.execution_count(2), 2);
  BOOST_CHECK_EQUAL(f.implicit_branch_count(0), 1);
  BOOST_CHECK_EQUAL(f.flow_completion_count(0), 3);
  }

BOOST_AUTO_TEST_CASE(safe_navigation_flow)
  {
  syntax_tree t = load("(csend entry=1 non_nil=2 (lvar) (lvar))\n");
  counter_store c = hits({{1, 5}, {2, 3}});
  flow_counts f(t, c);
  BOOST_CHECK_EQUAL(f.implicit_branch_count(0), 2);
  BOOST_CHECK_EQUAL(f.flow_entry_count(2), 3);
  BOOST_CHECK_EQUAL(f.flow_completion_count(0), 5);

  syntax_tree u = load("(csend entry=1 non_nil=2 nil_receiver=3 (lvar))\n");
  counter_store d = hits({{1, 5}, {2, 3}, {3, 1}});
  flow_counts g(u, d);
  BOOST_CHECK_EQUAL(g.implicit_branch_count(0), 1);
  BOOST_CHECK_EQUAL(g.flow_completion_count(0), 4);
  }

BOOST_AUTO_TEST_CASE(loop_flow)
  {
  // while c; b; end, body run 3 times
  syntax_tree pre = load("(while entry=1 body=2 (lvar) (send))\n");
  counter_store c = hits({{1, 1}, {2, 3}});
  flow_counts f(pre, c);
  BOOST_CHECK_EQUAL(f.flow_entry_count(1), 4);
  BOOST_CHECK_EQUAL(f.implicit_branch_count(0), 1);
  BOOST_CHECK_EQUAL(f.flow_completion_count(0), 1);
  check_bounds(f);

  // begin; b; end while c, body run 3 times
  syntax_tree post = load("(while_post entry=1 body=2 (lvar) (kwbegin (send)))\n");
  flow_counts g(post, c);
  BOOST_CHECK_EQUAL(g.flow_entry_count(1), 3);
  BOOST_CHECK_EQUAL(g.implicit_branch_count(0), 1);
  BOOST_CHECK_EQUAL(g.flow_completion_count(0), 1);
  }

BOOST_AUTO_TEST_CASE(inconsistent_counters)
  {
  syntax_tree t = load("(if entry=1 truthy=2 (lvar) (send) (send))\n");

  // More true conditions than evaluations
  counter_store c = hits({{1, 1}, {2, 5}});
  flow_counts f(t, c);
  BOOST_CHECK_THROW(f.execution_count(3), inconsistent_counts);

  // Completed more often than entered
  syntax_tree u = load("(send entry=1 completion=2)\n");
  counter_store d = hits({{1, 1}, {2, 2}});
  flow_counts g(u, d);
  BOOST_CHECK_THROW(g.flow_completion_count(0), inconsistent_counts);
  }

BOOST_AUTO_TEST_CASE(missing_slots)
  {
  syntax_tree t = load("(if entry=1 (_) (send) (send))\n");
  counter_store c = hits({{1, 1}});
  flow_counts f(t, c);
  BOOST_CHECK_THROW(f.flow_entry_count(2), malformed_tree);
  BOOST_CHECK_THROW(f.implicit_branch_count(0), malformed_tree);

  syntax_tree u = load("(and entry=1 (lvar) (_))\n");
  flow_counts g(u, c);
  BOOST_CHECK_THROW(g.flow_completion_count(0), malformed_tree);
  }
