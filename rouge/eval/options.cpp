//
//  Copyright(C) 2010-2011 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include "eval/options.hpp"

#include "tokenizer/rouge155.hpp"
#include "error.hpp"

#include <iostream>

namespace rouge
{
  namespace eval
  {
    Rouge155Options::Rouge155Options()
      : b(0), l(0), m(false), s(false), n(4), f('A'), p(0.5),
	e(tokenizer::Rouge155::default_data()), v(0) {}

    Rouge155Options::Rouge155Options(const Parameter& param)
      : b(0), l(0), m(false), s(false), n(4), f('A'), p(0.5),
	e(tokenizer::Rouge155::default_data()), v(0)
    {
      for (Parameter::const_iterator piter = param.begin(); piter != param.end(); ++ piter) {
	const std::string& key = piter->first;
	const std::string& value = piter->second;

	if (key == "b")
	  b = parameter_to_int(key, value);
	else if (key == "l")
	  l = parameter_to_int(key, value);
	else if (key == "m")
	  m = parameter_to_bool(key, value);
	else if (key == "s")
	  s = parameter_to_bool(key, value);
	else if (key == "n")
	  n = parameter_to_int(key, value);
	else if (key == "f") {
	  if (value != "A" && value != "B")
	    throw config_error("invalid scoring formula: " + value + ", must be A or B");
	  f = value[0];
	} else if (key == "p")
	  p = parameter_to_double(key, value);
	else if (key == "e")
	  e = value;
	else if (key == "v")
	  v = parameter_to_int(key, value);
	else if (key == "x" || key == "c" || key == "r" || key == "d" || key == "w" || key == "z"
		 || key == "t" || key == "a" || key == "u" || key == "2" || key == "3")
	  continue;
	else
	  std::cerr << "WARNING: unsupported parameter for rouge: " << key << "=" << value << std::endl;
      }

      if (b < 0)
	throw config_error("negative byte limit");
      if (l < 0)
	throw config_error("negative word limit");
    }
  };
};
