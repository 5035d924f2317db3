// -*- mode: c++ -*-
//
//  Copyright(C) 2010-2011 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __ROUGE__NGRAM_COUNTS__HPP__
#define __ROUGE__NGRAM_COUNTS__HPP__ 1

#include <string>
#include <vector>

#include <rouge/document.hpp>

#include <boost/unordered_map.hpp>

namespace rouge
{
  // n-gram identities are the words joined by a single space
  typedef std::string ngram_type;
  typedef std::vector<ngram_type, std::allocator<ngram_type> > ngram_set_type;

  // n-grams over the flattened words of a document
  void ngrams(const document_type& document, const int order, ngram_set_type& ngrams);

  // n-grams ending within the last size words
  void ngrams_suffix(const sentence_type& words, const size_t size, const int order, ngram_set_type& ngrams);

  class NGramCounts
  {
  public:
    typedef long count_type;

  private:
    typedef boost::unordered_map<ngram_type, count_type> count_map_type;

  public:
    typedef count_map_type::const_iterator const_iterator;
    typedef count_map_type::const_iterator iterator;
    typedef count_map_type::size_type      size_type;

  public:
    NGramCounts() : counts(), __total(0) {}
    NGramCounts(const document_type& document, const int order);

  public:
    count_type count(const ngram_type& ngram) const
    {
      const_iterator iter = counts.find(ngram);
      return (iter != counts.end() ? iter->second : count_type(0));
    }

    bool find(const ngram_type& ngram) const { return counts.find(ngram) != counts.end(); }

    // sum of counts, repetitions included
    count_type total() const { return __total; }

    // distinct n-grams
    size_type size() const { return counts.size(); }
    bool empty() const { return counts.empty(); }

    const_iterator begin() const { return counts.begin(); }
    const_iterator end() const { return counts.end(); }

    // multiset intersection size, sum of min(count, x.count)
    count_type matches(const NGramCounts& x) const;

  private:
    count_map_type counts;
    count_type     __total;
  };
};

#endif
