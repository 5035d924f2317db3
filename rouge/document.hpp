// -*- mode: c++ -*-
//
//  Copyright(C) 2010-2011 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __ROUGE__DOCUMENT__HPP__
#define __ROUGE__DOCUMENT__HPP__ 1

#include <string>
#include <vector>

namespace rouge
{
  typedef std::string word_type;
  typedef std::vector<word_type, std::allocator<word_type> > sentence_type;
  typedef std::vector<sentence_type, std::allocator<sentence_type> > document_type;

  // erase sentence boundaries
  inline
  void flatten(const document_type& document, sentence_type& words)
  {
    words.clear();
    document_type::const_iterator diter_end = document.end();
    for (document_type::const_iterator diter = document.begin(); diter != diter_end; ++ diter)
      words.insert(words.end(), diter->begin(), diter->end());
  }

  inline
  size_t word_size(const document_type& document)
  {
    size_t size = 0;
    document_type::const_iterator diter_end = document.end();
    for (document_type::const_iterator diter = document.begin(); diter != diter_end; ++ diter)
      size += diter->size();
    return size;
  }
};

#endif
