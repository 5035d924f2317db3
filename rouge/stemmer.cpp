//
//  Copyright(C) 2010-2011 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include "stemmer.hpp"
#include "stemmer/porter.hpp"
#include "stemmer/morph.hpp"

#include "parameter.hpp"
#include "error.hpp"

#include <iostream>

namespace rouge
{
  const char* Stemmer::lists()
  {
    static const char* desc = "\
porter: Porter stemming (Martin Porter's reference variant)\n\
morph: WordNet exceptions followed by Porter stemming\n\
\tdata=[ROUGE data directory holding WordNet-2.0-Exceptions]\n\
";
    return desc;
  }

  Stemmer::stemmer_ptr_type Stemmer::create(const std::string& parameter)
  {
    typedef rouge::Parameter parameter_type;

    const parameter_type param(parameter);

    stemmer_ptr_type stemmer;

    if (param.name() == "porter") {
      for (parameter_type::const_iterator piter = param.begin(); piter != param.end(); ++ piter)
	std::cerr << "WARNING: unsupported parameter for porter stemmer: " << piter->first << "=" << piter->second << std::endl;

      stemmer.reset(new stemmer::Porter());
    } else if (param.name() == "morph") {
      std::string data;

      for (parameter_type::const_iterator piter = param.begin(); piter != param.end(); ++ piter) {
	if (piter->first == "data")
	  data = piter->second;
	else
	  std::cerr << "WARNING: unsupported parameter for morph stemmer: " << piter->first << "=" << piter->second << std::endl;
      }

      if (data.empty())
	throw config_error("no data directory for morph stemmer?");

      stemmer.reset(new stemmer::Morph(stemmer::Morph::exception_path(data)));
    } else
      throw config_error("invalid stemmer parameter: " + parameter);

    stemmer->__algorithm = parameter;

    return stemmer;
  }
};
