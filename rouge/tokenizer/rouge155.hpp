// -*- mode: c++ -*-
//
//  Copyright(C) 2010-2011 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __ROUGE__TOKENIZER__ROUGE155__HPP__
#define __ROUGE__TOKENIZER__ROUGE155__HPP__ 1

#include <string>

#include <rouge/tokenizer.hpp>
#include <rouge/sentence_splitter.hpp>
#include <rouge/stopwords.hpp>
#include <rouge/stemmer/morph.hpp>

#include <boost/shared_ptr.hpp>
#include <boost/filesystem/path.hpp>

// ROUGE-1.5.5 style tokenization (readText + createNGram)
/*
  $text =~ s/-/ - /g;
  $text =~ s/[^A-Za-z0-9\-]/ /g;
  $text =~ s/^\s+//;
  $text =~ s/\s+$//;
  $text =~ s/\s+/ /g;
  ...
  lower case, stopword removal, /^[a-z0-9\$]/, MorphStem
*/

namespace rouge
{
  namespace tokenizer
  {
    class Rouge155 : public rouge::Tokenizer
    {
    public:
      typedef boost::filesystem::path path_type;

      struct options_type
      {
	size_t      byte_limit;  // 0 for unlimited
	size_t      word_limit;  // 0 for unlimited
	bool        stem;
	bool        stopword;
	std::string split;
	path_type   data;

	options_type()
	  : byte_limit(0), word_limit(0), stem(true), stopword(true), split("SPL"), data(default_data()) {}
      };

    public:
      explicit Rouge155(const options_type& options);

    public:
      // word-level normalization; false when the word is dropped
      bool normalize(const word_type& word, word_type& normalized) const;

      // sentence-level normalization
      static std::string preprocess(const std::string& sentence);

      // $ROUGE_EVAL_HOME or "data"
      static path_type default_data();

      size_t byte_limit() const { return __byte_limit; }
      size_t word_limit() const { return __word_limit; }

      bool stemming() const { return static_cast<bool>(morph); }
      bool stopword_removal() const { return static_cast<bool>(stopwords); }

    protected:
      void tokenize(const std::string& text, document_type& tokenized) const;

    private:
      size_t __byte_limit;
      size_t __word_limit;

      SentenceSplitter                  splitter;
      boost::shared_ptr<Stopwords>      stopwords;
      boost::shared_ptr<stemmer::Morph> morph;
    };
  };
};

#endif
