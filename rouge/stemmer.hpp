// -*- mode: c++ -*-
//
//  Copyright(C) 2010-2011 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __ROUGE__STEMMER__HPP__
#define __ROUGE__STEMMER__HPP__ 1

#include <string>

#include <boost/shared_ptr.hpp>

namespace rouge
{
  class Stemmer
  {
  public:
    typedef std::string word_type;

    typedef size_t    size_type;
    typedef ptrdiff_t difference_type;

    typedef boost::shared_ptr<Stemmer> stemmer_ptr_type;

  public:
    Stemmer() {}
    virtual ~Stemmer() {}

  public:
    static stemmer_ptr_type create(const std::string& parameter);
    static const char* lists();

  public:
    word_type operator()(const word_type& word) const { return stem(word); }
    virtual word_type stem(const word_type& word) const = 0;

    const std::string& algorithm() const { return __algorithm; }

  private:
    std::string __algorithm;
  };
};

#endif
