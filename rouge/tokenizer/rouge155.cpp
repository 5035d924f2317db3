//
//  Copyright(C) 2010-2011 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include "tokenizer/rouge155.hpp"

#include "truncate.hpp"

#include <cstdlib>
#include <cctype>

#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>

namespace rouge
{
  namespace tokenizer
  {
    Rouge155::path_type Rouge155::default_data()
    {
      const char* home = std::getenv("ROUGE_EVAL_HOME");
      return path_type(home && *home ? home : "data");
    }

    Rouge155::Rouge155(const options_type& options)
      : __byte_limit(options.byte_limit),
	__word_limit(options.word_limit),
	splitter(options.split)
    {
      if (options.stopword)
	stopwords.reset(new Stopwords(Stopwords::stopword_path(options.data)));
      if (options.stem)
	morph.reset(new stemmer::Morph(stemmer::Morph::exception_path(options.data)));
    }

    std::string Rouge155::preprocess(const std::string& sentence)
    {
      std::string normalized;
      normalized.reserve(sentence.size());

      // hyphens are isolated, everything else non-alphanumeric is a separator
      bool space = true;
      std::string::const_iterator iter_end = sentence.end();
      for (std::string::const_iterator iter = sentence.begin(); iter != iter_end; ++ iter) {
	const unsigned char c = *iter;

	if (c == '-') {
	  if (! space)
	    normalized += ' ';
	  normalized += "- ";
	  space = true;
	} else if (c < 0x80 && std::isalnum(c)) {
	  normalized += c;
	  space = false;
	} else if (! space) {
	  normalized += ' ';
	  space = true;
	}
      }

      if (! normalized.empty() && normalized[normalized.size() - 1] == ' ')
	normalized.erase(normalized.size() - 1);

      return normalized;
    }

    bool Rouge155::normalize(const word_type& word, word_type& normalized) const
    {
      normalized = word;
      for (word_type::iterator iter = normalized.begin(); iter != normalized.end(); ++ iter)
	if (*iter >= 'A' && *iter <= 'Z')
	  *iter = *iter - 'A' + 'a';

      if (stopwords && stopwords->find(normalized))
	return false;

      if (normalized.empty()) return false;

      const char first = normalized[0];
      if (! ((first >= 'a' && first <= 'z') || (first >= '0' && first <= '9') || first == '$'))
	return false;

      if (morph)
	normalized = morph->stem(normalized);

      return ! normalized.empty();
    }

    void Rouge155::tokenize(const std::string& text, document_type& tokenized) const
    {
      SentenceSplitter::text_set_type sentences;
      splitter(text, sentences);

      std::vector<std::string, std::allocator<std::string> > words;
      word_type normalized;

      tokenized.clear();
      SentenceSplitter::text_set_type::const_iterator siter_end = sentences.end();
      for (SentenceSplitter::text_set_type::const_iterator siter = sentences.begin(); siter != siter_end; ++ siter) {
	const std::string preprocessed = preprocess(*siter);

	tokenized.push_back(sentence_type());
	if (preprocessed.empty()) continue;

	boost::algorithm::split(words, preprocessed, boost::algorithm::is_any_of(" "));

	std::vector<std::string, std::allocator<std::string> >::const_iterator witer_end = words.end();
	for (std::vector<std::string, std::allocator<std::string> >::const_iterator witer = words.begin(); witer != witer_end; ++ witer)
	  if (normalize(*witer, normalized))
	    tokenized.back().push_back(normalized);
      }

      if (__byte_limit)
	tokenized = truncate_bytes(tokenized, __byte_limit);
      if (__word_limit)
	tokenized = truncate_words(tokenized, __word_limit);
    }
  };
};
