// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#define BOOST_TEST_MODULE branch_locations
#include <boost/test/unit_test.hpp>

#include "branch_locations.hpp"
#include "load_tree.hpp"
#include <sstream>

using namespace branchcov;

static syntax_tree load(std::string const& text)
  {
  std::istringstream in(text);
  return load_tree(in, "test.tree");
  }

BOOST_AUTO_TEST_CASE(location_ids_count_up)
  {
  location_counter ids;
  BOOST_CHECK_EQUAL(ids.issued(), 0u);
  BOOST_CHECK_EQUAL(ids.next(), 1u);
  BOOST_CHECK_EQUAL(ids.next(), 2u);
  BOOST_CHECK_EQUAL(ids.issued(), 2u);

  location_counter fresh;
  BOOST_CHECK_EQUAL(fresh.next(), 1u);
  }

BOOST_AUTO_TEST_CASE(branch_with_content)
  {
  syntax_tree t = load("(if @1:0-1:15 (lvar @1:3-1:4) (send @1:10-1:11) (empty))");
  source_buffer none;
  location_resolver r(t, none);
  BOOST_CHECK(r.resolve(0, 2, source_range::at(position(9, 9))) == source_range(1, 10, 1, 11));
  }

BOOST_AUTO_TEST_CASE(written_but_empty)
  {
  // case x; when 1 then; else; end
  syntax_tree t = load(
    "(case @1:0-1:30\n"
    "  (lvar @1:5-1:6)\n"
    "  (when @1:8-1:19 begin=1:15-1:19 (int @1:13-1:14) (empty @1:19-1:19))\n"
    "  (empty @1:21-1:25))\n");
  source_buffer source("case x; when 1 then; else; end");
  location_resolver r(t, source);

  node_id body = 4, else_branch = 5;
  BOOST_REQUIRE(t.is_empty_body(body));
  source_range marker = r.content_marker(*t.keyword_range(2, keyword::begin));
  BOOST_CHECK(marker == source_range::at(position(1, 19)));
  BOOST_CHECK(r.resolve(0, body, marker) == marker);

  // No marker: the empty slot's own range
  BOOST_CHECK(r.resolve(0, else_branch, boost::none) == source_range(1, 21, 1, 25));
  }

BOOST_AUTO_TEST_CASE(no_syntax_at_all)
  {
  syntax_tree t = load(
    "(begin\n"
    "  (if @1:0-1:15 (lvar @1:3-1:4) (send @1:10-1:11) (empty))\n"
    "  (case @2:0-2:21 (lvar @2:5-2:6) (when @2:8-2:17 (int @2:13-2:14) (send @2:16-2:17)) (empty))\n"
    "  (case @3:0-3:20 (_) (when @3:5-3:16 (lvar @3:10-3:11) (send @3:13-3:16)) (empty)))\n");
  source_buffer none;
  location_resolver r(t, none);

  // An absent else reports at the whole conditional
  BOOST_CHECK(r.resolve(1, 4, boost::none) == source_range(1, 0, 1, 15));

  // ...but a dispatch reports its absent else at the subject
  dispatch const& with_subject = t.payload<dispatch>(5);
  BOOST_CHECK(r.resolve(5, with_subject.else_branch, source_range::at(position(7, 7)))
              == source_range(2, 5, 2, 6));

  // A dispatch without a subject falls back to its whole range
  node_id bare = t[0].children.at(2);
  dispatch const& without_subject = t.payload<dispatch>(bare);
  BOOST_CHECK_EQUAL(without_subject.subject, no_node);
  BOOST_CHECK(r.resolve(bare, without_subject.else_branch, boost::none)
              == source_range(3, 0, 3, 20));
  }

BOOST_AUTO_TEST_CASE(absent_branch_slot)
  {
  syntax_tree t = load("(if @1:0-1:15 (lvar @1:3-1:4) (send @1:10-1:11) (_))");
  source_buffer none;
  location_resolver r(t, none);
  BOOST_CHECK_THROW(r.resolve(0, no_node, boost::none), malformed_tree);
  }

BOOST_AUTO_TEST_CASE(elsif_chain_reaches_the_end_keyword)
  {
  // if a
  //   x
  // elsif b
  //   y
  // end
  syntax_tree t = load(
    "(if @1:0-5:3 end=5:0-5:3\n"
    "  (lvar @1:3-1:4)\n"
    "  (send @2:2-2:3)\n"
    "  (if @3:0-4:3 style=elsif begin=3:6-3:7\n"
    "    (lvar @3:6-3:7)\n"
    "    (send @4:2-4:3)\n"
    "    (empty)))\n");
  source_buffer none;
  location_resolver r(t, none);

  node_id elsif = 3;
  BOOST_CHECK_EQUAL(r.outermost_conditional(elsif), 0u);
  BOOST_CHECK_EQUAL(r.outermost_conditional(0), 0u);
  BOOST_CHECK_EQUAL(r.deepest_elsif(0), elsif);
  BOOST_CHECK(r.reported_range(elsif) == source_range(3, 0, 5, 0));
  BOOST_CHECK(r.reported_range(0) == source_range(1, 0, 5, 3));

  // The elsif as the else branch of its parent is extended too
  BOOST_CHECK(r.resolve(0, elsif, boost::none) == source_range(3, 0, 5, 0));
  }

BOOST_AUTO_TEST_CASE(elsif_chain_with_an_else_keeps_its_range)
  {
  syntax_tree t = load(
    "(if @1:0-7:3 end=7:0-7:3\n"
    "  (lvar @1:3-1:4)\n"
    "  (send @2:2-2:3)\n"
    "  (if @3:0-6:3 style=elsif else=5:0-5:4\n"
    "    (lvar @3:6-3:7)\n"
    "    (send @4:2-4:3)\n"
    "    (send @6:2-6:3)))\n");
  source_buffer none;
  location_resolver r(t, none);
  BOOST_CHECK(r.reported_range(3) == source_range(3, 0, 6, 3));
  }
