// Copyright Dave Abrahams 2013. Distributed under the Boost
// Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
#include "parse_tree.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <boost/spirit/include/qi.hpp>
#include <boost/spirit/include/support_multi_pass.hpp>
#include <boost/spirit/include/classic_position_iterator.hpp>
#include <boost/spirit/repository/include/qi_confix.hpp>
#include <boost/spirit/repository/include/qi_iter_pos.hpp>
#include <boost/phoenix/bind/bind_function.hpp>

namespace qi = boost::spirit::qi;
namespace ascii = boost::spirit::ascii;
namespace classic = boost::spirit::classic;
namespace phoenix = boost::phoenix;

namespace branchcov
{

typedef std::istreambuf_iterator<char> BaseIterator;
typedef boost::spirit::multi_pass<BaseIterator> ForwardIterator;
typedef classic::position_iterator2<ForwardIterator> PosIterator;

static void get_line(int& line, PosIterator const& iterator)
  {
  line = iterator.get_position().line;
  }

template<typename Iterator>
struct CommentSkipper: qi::grammar<Iterator>
  {
  CommentSkipper() : CommentSkipper::base_type(skip_)
    {
    skip_
      = ascii::space
      | boost::spirit::repository::confix("/*", "*/")[*(qi::char_ - "*/")]
      | boost::spirit::repository::confix("//", qi::eol | qi::eoi)[*(qi::char_ - qi::eol)]
      ;
    }
  qi::rule<Iterator> skip_;
  };

template<typename Iterator, typename Skipper>
struct TreeGrammar: qi::grammar<Iterator, dump::node(), Skipper>
  {
  TreeGrammar() : TreeGrammar::base_type(node_)
    {
    node_
     %= '('
      > kind_
      > line_number_
      > -range_
      > *attribute_
      > *node_
      > ')'
      ;
    range_
     %= '@'
      > range_body_
      ;
    range_body_
     %= qi::uint_
      > ':'
      > qi::uint_
      > '-'
      > qi::uint_
      > ':'
      > qi::uint_
      ;
    attribute_
     %= name_
      >> '='
      > value_
      ;
    kind_
     %= qi::lexeme[qi::char_("a-zA-Z_") >> *qi::char_("a-zA-Z_0-9")]
      ;
    name_
     %= qi::lexeme[qi::char_("a-zA-Z_") >> *qi::char_("a-zA-Z_0-9")]
      ;
    value_
     %= qi::lexeme[+(qi::char_ - ascii::space - '(' - ')')]
      ;
    line_number_ = boost::spirit::repository::qi::iter_pos
      [
      phoenix::bind(get_line, qi::_val, qi::_1)
      ];
    }
  qi::rule<Iterator, dump::node(), Skipper> node_;
  qi::rule<Iterator, dump::range(), Skipper> range_, range_body_;
  qi::rule<Iterator, dump::attribute(), Skipper> attribute_;
  qi::rule<Iterator, std::string(), Skipper> kind_, name_, value_;
  qi::rule<Iterator, int(), Skipper> line_number_;
  };

dump::node parse_tree(std::istream& in, std::string const& name)
  {
  dump::node root;

  BaseIterator in_begin(in);
  ForwardIterator fwd_begin = boost::spirit::make_default_multi_pass(in_begin), fwd_end;
  PosIterator begin(fwd_begin, fwd_end, name), end;

  CommentSkipper<PosIterator> skipper;
  TreeGrammar<PosIterator, CommentSkipper<PosIterator> > grammar;
  try
    {
    if (!qi::phrase_parse(begin, end, qi::eps > grammar > qi::eoi, skipper, root))
      {
      throw std::runtime_error("parse error at file " + name);
      }
    }
  catch (const qi::expectation_failure<PosIterator>& error)
    {
    typedef classic::file_position_base<std::string> Position;
    const Position& pos = error.first.get_position();
    std::stringstream msg;
    msg << "parse error at file " << name
        << " line " << pos.line
        << " column " << pos.column << std::endl
        << "'" << error.first.get_currentline() << "'" << std::endl
        << std::setw(pos.column) << " " << "^- here"
      ;
    throw std::runtime_error(msg.str());
    }
  return root;
  }

dump::node parse_tree_file(std::string const& filename)
  {
  std::ifstream file(filename.c_str());
  if (!file)
    {
    throw std::runtime_error("cannot read tree: " + filename);
    }
  return parse_tree(file, filename);
  }

} // namespace branchcov
