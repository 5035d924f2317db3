// -*- mode: c++ -*-
//
//  Copyright(C) 2010-2011 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __ROUGE__STOPWORDS__HPP__
#define __ROUGE__STOPWORDS__HPP__ 1

#include <string>

#include <boost/unordered_set.hpp>
#include <boost/filesystem/path.hpp>

namespace rouge
{
  // exact, case-sensitive stopword set, one word per line
  class Stopwords
  {
  public:
    typedef std::string word_type;
    typedef boost::filesystem::path path_type;

    typedef boost::unordered_set<word_type> word_set_type;
    typedef word_set_type::size_type size_type;

  public:
    explicit Stopwords(const path_type& path);

  public:
    bool operator()(const word_type& word) const { return find(word); }
    bool find(const word_type& word) const { return words.find(word) != words.end(); }

    size_type size() const { return words.size(); }

    // ROUGE-1.5.5 SMART common words
    static path_type stopword_path(const path_type& data);

  private:
    word_set_type words;
  };
};

#endif
