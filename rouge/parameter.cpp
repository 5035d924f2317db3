//
//  Copyright(C) 2010-2011 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include <iterator>
#include <algorithm>

#define BOOST_SPIRIT_THREADSAFE
#define PHOENIX_THREADSAFE

#include "parameter.hpp"
#include "error.hpp"

#include <boost/spirit/include/qi.hpp>

#include <boost/fusion/adapted/std_pair.hpp>
#include <boost/fusion/include/std_pair.hpp>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/lexical_cast.hpp>

namespace rouge
{
  typedef std::pair<std::string, std::string> value_parsed_type;
  typedef std::vector<value_parsed_type, std::allocator<value_parsed_type> > value_parsed_set_type;

  typedef std::pair<std::string, value_parsed_set_type> parameter_parsed_type;

  template <typename Iterator>
  struct parameter_parser : boost::spirit::qi::grammar<Iterator, parameter_parsed_type(), boost::spirit::standard::space_type>
  {
    parameter_parser() : parameter_parser::base_type(parameter)
    {
      namespace qi = boost::spirit::qi;
      namespace standard = boost::spirit::standard;

      quoted %= qi::lexeme['"' >> *(standard::char_ - '"') >> '"'];

      name  %= qi::lexeme[+(standard::char_ - standard::space - ':')];
      key   %= qi::lexeme[+(standard::char_ - standard::space - '=' - ',')];
      value %= qi::lexeme[+(standard::char_ - standard::space - ',')];

      key_values %= (key >> '=' >> (qi::hold[quoted] | value)) % ',';
      parameter  %= name >> -(':' >> key_values);
    }

    typedef boost::spirit::standard::space_type space_type;

    boost::spirit::qi::rule<Iterator, std::string(), space_type>           quoted;
    boost::spirit::qi::rule<Iterator, std::string(), space_type>           name;
    boost::spirit::qi::rule<Iterator, std::string(), space_type>           key;
    boost::spirit::qi::rule<Iterator, std::string(), space_type>           value;
    boost::spirit::qi::rule<Iterator, value_parsed_set_type(), space_type> key_values;
    boost::spirit::qi::rule<Iterator, parameter_parsed_type(), space_type> parameter;
  };

  void Parameter::parse(const std::string& parameter)
  {
    typedef std::string::const_iterator iter_type;
    typedef parameter_parser<iter_type> parser_type;

    __name.clear();
    __values.clear();

    parser_type parser;
    parameter_parsed_type parsed;

    iter_type iter     = parameter.begin();
    iter_type iter_end = parameter.end();

    const bool result = boost::spirit::qi::phrase_parse(iter, iter_end, parser, boost::spirit::standard::space, parsed);

    if (! result || iter != iter_end)
      throw config_error("parameter parsing failed: " + parameter);

    __name = parsed.first;
    __values.insert(__values.end(), parsed.second.begin(), parsed.second.end());
  }

  Parameter::const_iterator Parameter::find(const key_type& key) const
  {
    for (const_iterator iter = begin(); iter != end(); ++ iter)
      if (iter->first == key)
	return iter;
    return end();
  }

  std::ostream& operator<<(std::ostream& os, const Parameter& x)
  {
    os << x.__name;
    Parameter::const_iterator iter_begin = x.begin();
    Parameter::const_iterator iter_end   = x.end();
    for (Parameter::const_iterator iter = iter_begin; iter != iter_end; ++ iter) {
      os << (iter == iter_begin ? ':' : ',') << iter->first << '=';
      if (iter->second.find_first_of(" \t,\"") != std::string::npos)
	os << '"' << iter->second << '"';
      else
	os << iter->second;
    }
    return os;
  }

  bool parameter_to_bool(const std::string& key, const std::string& value)
  {
    const std::string lowered = boost::algorithm::to_lower_copy(value);

    if (lowered == "true" || lowered == "yes" || lowered == "on" || lowered == "1")
      return true;
    else if (lowered == "false" || lowered == "no" || lowered == "off" || lowered == "0")
      return false;
    else
      throw config_error("invalid boolean for " + key + ": " + value);
  }

  int parameter_to_int(const std::string& key, const std::string& value)
  {
    try {
      return boost::lexical_cast<int>(value);
    }
    catch (const boost::bad_lexical_cast&) {
      throw config_error("invalid integer for " + key + ": " + value);
    }
  }

  double parameter_to_double(const std::string& key, const std::string& value)
  {
    try {
      return boost::lexical_cast<double>(value);
    }
    catch (const boost::bad_lexical_cast&) {
      throw config_error("invalid number for " + key + ": " + value);
    }
  }
};
