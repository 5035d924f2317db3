// -*- mode: c++ -*-
//
//  Copyright(C) 2010-2011 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __ROUGE__STEMMER_PORTER__HPP__
#define __ROUGE__STEMMER_PORTER__HPP__ 1

#include <rouge/stemmer.hpp>

namespace rouge
{
  namespace stemmer
  {
    // Porter stemmer, following Martin Porter's own reference implementation
    // rather than the published paper:
    //   bli -> ble instead of abli -> able, and an additional logi -> log in step 2,
    //   words of length <= 2 are not stemmed.
    // Input is expected to be lower-cased.
    class Porter : public Stemmer
    {
    public:
      word_type stem(const word_type& word) const;
    };
  };
};

#endif
