// -*- mode: c++ -*-
//
//  Copyright(C) 2010-2011 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __ROUGE__TOKENIZER__HPP__
#define __ROUGE__TOKENIZER__HPP__ 1

#include <string>

#include <rouge/document.hpp>

#include <boost/shared_ptr.hpp>

namespace rouge
{
  // text to sentences of tokens
  class Tokenizer
  {
  public:
    typedef rouge::word_type     word_type;
    typedef rouge::sentence_type sentence_type;
    typedef rouge::document_type document_type;

    typedef boost::shared_ptr<Tokenizer> tokenizer_ptr_type;

  public:
    Tokenizer() {}
    virtual ~Tokenizer() {}

  private:
    Tokenizer(const Tokenizer& x) {}
    Tokenizer& operator=(const Tokenizer& x) { return *this; }

  public:
    void operator()(const std::string& text, document_type& tokenized) const
    {
      tokenized.clear();
      tokenize(text, tokenized);
    }

    document_type operator()(const std::string& text) const
    {
      document_type tokenized;
      tokenize(text, tokenized);
      return tokenized;
    }

    const std::string& algorithm() const { return __algorithm; }

  public:
    static tokenizer_ptr_type create(const std::string& parameter);
    static const char* lists();

  protected:
    virtual void tokenize(const std::string& text, document_type& tokenized) const = 0;

  private:
    std::string __algorithm;
  };
};

#endif
