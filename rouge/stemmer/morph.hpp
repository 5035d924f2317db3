// -*- mode: c++ -*-
//
//  Copyright(C) 2010-2011 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __ROUGE__STEMMER_MORPH__HPP__
#define __ROUGE__STEMMER_MORPH__HPP__ 1

#include <string>

#include <rouge/stemmer.hpp>
#include <rouge/stemmer/porter.hpp>

#include <boost/unordered_map.hpp>
#include <boost/filesystem/path.hpp>

namespace rouge
{
  namespace stemmer
  {
    // ROUGE-1.5.5 MorphStem: irregular forms listed in the WordNet-2.0
    // exception files (adj.exc, adv.exc, noun.exc, verb.exc) are mapped to
    // their base form before Porter stemming.
    class Morph : public Stemmer
    {
    public:
      typedef boost::filesystem::path path_type;

      typedef boost::unordered_map<word_type, word_type> exception_map_type;

    public:
      // directory holding exactly four *.exc files
      explicit Morph(const path_type& path);

    public:
      word_type stem(const word_type& word) const;

      size_type exception_size() const { return exceptions.size(); }

      static path_type exception_path(const path_type& data);

    private:
      exception_map_type exceptions;
      Porter             porter;
    };
  };
};

#endif
