//
//  Copyright(C) 2010-2011 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include "ngram_counts.hpp"

#include <algorithm>

namespace rouge
{
  namespace
  {
    inline
    ngram_type join(sentence_type::const_iterator first, sentence_type::const_iterator last)
    {
      ngram_type ngram;
      for (sentence_type::const_iterator iter = first; iter != last; ++ iter) {
	if (iter != first)
	  ngram += ' ';
	ngram += *iter;
      }
      return ngram;
    }
  };

  void ngrams_suffix(const sentence_type& words, const size_t size, const int order, ngram_set_type& ngrams)
  {
    ngrams.clear();

    if (order <= 0 || words.size() < static_cast<size_t>(order)) return;

    const size_t last  = words.size() - order + 1;
    const size_t first = (size >= last ? 0 : last - size);

    for (size_t i = first; i != last; ++ i)
      ngrams.push_back(join(words.begin() + i, words.begin() + i + order));
  }

  void ngrams(const document_type& document, const int order, ngram_set_type& ngrams)
  {
    sentence_type words;
    flatten(document, words);

    ngrams_suffix(words, words.size(), order, ngrams);
  }

  NGramCounts::NGramCounts(const document_type& document, const int order)
    : counts(), __total(0)
  {
    ngram_set_type ngrams;
    rouge::ngrams(document, order, ngrams);

    ngram_set_type::const_iterator niter_end = ngrams.end();
    for (ngram_set_type::const_iterator niter = ngrams.begin(); niter != niter_end; ++ niter)
      ++ counts[*niter];
    __total = ngrams.size();
  }

  NGramCounts::count_type NGramCounts::matches(const NGramCounts& x) const
  {
    count_type matched = 0;

    const_iterator iter_end = counts.end();
    for (const_iterator iter = counts.begin(); iter != iter_end; ++ iter) {
      const_iterator xiter = x.counts.find(iter->first);
      if (xiter != x.counts.end())
	matched += std::min(iter->second, xiter->second);
    }

    return matched;
  }
};
