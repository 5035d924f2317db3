//
//  Copyright(C) 2010-2011 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include "sentence_splitter.hpp"

#include "error.hpp"

#include <boost/regex.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>

namespace rouge
{
  SentenceSplitter::SentenceSplitter(const mode_type mode) : __mode(mode) { verify(); }

  SentenceSplitter::SentenceSplitter(const std::string& name) : __mode(parse(name)) { verify(); }

  SentenceSplitter::mode_type SentenceSplitter::parse(const std::string& name)
  {
    if (name.empty() || name == "none" || name == "None")
      return NONE;
    else if (name == "SPL")
      return SPL;
    else if (name == "SEE")
      return SEE;
    else if (name == "ISI")
      return ISI;
    else if (name == "SIMPLE")
      return SIMPLE;
    else
      throw config_error("invalid sentence splitting: " + name + ", must be one of none, SPL, SEE, ISI, SIMPLE");
  }

  void SentenceSplitter::verify() const
  {
    switch (__mode) {
    case NONE:
    case SPL:
    case SEE:
      break;
    case ISI:
      throw unimplemented_error("ISI sentence splitting is not implemented");
    case SIMPLE:
      throw unimplemented_error("SIMPLE sentence splitting is not implemented");
    default:
      throw config_error("invalid sentence splitting mode");
    }
  }

  void SentenceSplitter::operator()(const text_type& text, text_set_type& sentences) const
  {
    sentences.clear();

    switch (__mode) {
    case NONE:
      sentences.push_back(text);
      break;
    case SPL:
      boost::algorithm::split(sentences, text, boost::algorithm::is_any_of("\n"));
      break;
    case SEE: {
      // <a size="12" name="1">[1]</a> <a href="#1" id=1>text
      // <a name="1">[1]</a> <a href="#1" id=1>text
      static const boost::regex pattern("<a size=\"[0-9]+\" name=\"[0-9]+\">\\[([0-9]+)\\]</a>\\s+<a href=\"#[0-9]+\" id=[0-9]+>([^<]+)"
					"|<a name=\"[0-9]+\">\\[([0-9]+)\\]</a>\\s+<a href=\"#[0-9]+\" id=[0-9]+>([^<]+)");

      boost::sregex_iterator iter_end;
      for (boost::sregex_iterator iter(text.begin(), text.end(), pattern); iter != iter_end; ++ iter)
	sentences.push_back((*iter)[2].matched ? (*iter)[2].str() : (*iter)[4].str());
    } break;
    default:
      verify();
    }
  }
};
