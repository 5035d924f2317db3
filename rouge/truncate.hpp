// -*- mode: c++ -*-
//
//  Copyright(C) 2010-2011 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __ROUGE__TRUNCATE__HPP__
#define __ROUGE__TRUNCATE__HPP__ 1

#include <rouge/document.hpp>

namespace rouge
{
  // keep the first limit bytes (UTF-8) of the concatenated words; the word
  // crossing the limit is cut, never within a character
  document_type truncate_bytes(const document_type& document, const size_t limit);

  // keep the first limit words
  document_type truncate_words(const document_type& document, const size_t limit);

  size_t byte_size(const document_type& document);
};

#endif
