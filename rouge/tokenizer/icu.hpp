// -*- mode: c++ -*-
//
//  Copyright(C) 2010-2011 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __ROUGE__TOKENIZER__ICU__HPP__
#define __ROUGE__TOKENIZER__ICU__HPP__ 1

#include <rouge/tokenizer.hpp>

namespace rouge
{
  namespace tokenizer
  {
    // ICU word boundary analysis, punctuation and spaces are dropped.
    // No stemming, stopword removal or truncation: scores differ from ROUGE-1.5.5.
    class Icu : public rouge::Tokenizer
    {
    public:
      explicit Icu(const bool __sentence=false);
      ~Icu();

    protected:
      void tokenize(const std::string& text, document_type& tokenized) const;

    private:
      void* pimpl_word;
      void* pimpl_sentence;
    };
  };
};

#endif
