//
//  Copyright(C) 2010-2011 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include "tokenizer.hpp"

#include "tokenizer/rouge155.hpp"
#include "tokenizer/icu.hpp"

#include "parameter.hpp"
#include "error.hpp"

#include <iostream>

namespace rouge
{
  const char* Tokenizer::lists()
  {
    static const char* desc = "\
rouge155: ROUGE-1.5.5 compatible tokenization\n\
\tbyte-limit=[int] only the first n bytes (0 for no limit)\n\
\tword-limit=[int] only the first n words (0 for no limit)\n\
\tstem=[true|false] WordNet exceptions + Porter stemming\n\
\tstopword=[true|false] remove SMART common words\n\
\tsplit=[none|SPL|SEE|ISI|SIMPLE] sentence splitting (default SPL)\n\
\tdata=[ROUGE data directory]\n\
icu: ICU word boundary tokenization\n\
\tsentence=[true|false] split sentences by ICU sentence boundary\n\
";
    return desc;
  }

  Tokenizer::tokenizer_ptr_type Tokenizer::create(const std::string& parameter)
  {
    typedef rouge::Parameter parameter_type;

    const parameter_type param(parameter);

    tokenizer_ptr_type tokenizer;

    if (param.name() == "rouge155") {
      tokenizer::Rouge155::options_type options;

      for (parameter_type::const_iterator piter = param.begin(); piter != param.end(); ++ piter) {
	if (piter->first == "byte-limit" || piter->first == "word-limit") {
	  const int limit = parameter_to_int(piter->first, piter->second);
	  if (limit < 0)
	    throw config_error("negative " + piter->first + ": " + piter->second);

	  if (piter->first == "byte-limit")
	    options.byte_limit = limit;
	  else
	    options.word_limit = limit;
	} else if (piter->first == "stem")
	  options.stem = parameter_to_bool(piter->first, piter->second);
	else if (piter->first == "stopword")
	  options.stopword = parameter_to_bool(piter->first, piter->second);
	else if (piter->first == "split")
	  options.split = piter->second;
	else if (piter->first == "data")
	  options.data = piter->second;
	else
	  std::cerr << "WARNING: unsupported parameter for rouge155 tokenizer: " << piter->first << "=" << piter->second << std::endl;
      }

      tokenizer.reset(new tokenizer::Rouge155(options));
    } else if (param.name() == "icu") {
      bool sentence = false;

      for (parameter_type::const_iterator piter = param.begin(); piter != param.end(); ++ piter) {
	if (piter->first == "sentence")
	  sentence = parameter_to_bool(piter->first, piter->second);
	else
	  std::cerr << "WARNING: unsupported parameter for icu tokenizer: " << piter->first << "=" << piter->second << std::endl;
      }

      tokenizer.reset(new tokenizer::Icu(sentence));
    } else
      throw config_error("invalid tokenizer parameter: " + parameter);

    tokenizer->__algorithm = parameter;

    return tokenizer;
  }
};
