//
//  Copyright(C) 2010-2011 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include "truncate.hpp"

#include <unicode/utf8.h>

namespace rouge
{
  namespace
  {
    // longest prefix of at most size bytes ending on a code point boundary
    word_type utf8_prefix(const word_type& word, const size_t size)
    {
      if (size >= word.size()) return word;

      const uint8_t* s = reinterpret_cast<const uint8_t*>(word.c_str());
      int32_t i = static_cast<int32_t>(size);
      U8_SET_CP_START(s, 0, i);

      return word.substr(0, i);
    }
  };

  document_type truncate_bytes(const document_type& document, const size_t limit)
  {
    document_type truncated;
    size_t length = 0;

    document_type::const_iterator diter_end = document.end();
    for (document_type::const_iterator diter = document.begin(); diter != diter_end; ++ diter) {
      size_t length_sentence = length;
      sentence_type::const_iterator siter_end = diter->end();
      for (sentence_type::const_iterator siter = diter->begin(); siter != siter_end; ++ siter)
	length_sentence += siter->size();

      if (length_sentence > limit) {
	sentence_type sentence;

	for (sentence_type::const_iterator siter = diter->begin(); siter != siter_end; ++ siter) {
	  if (length + siter->size() >= limit) {
	    sentence.push_back(utf8_prefix(*siter, limit - length));
	    length = limit;
	    break;
	  }

	  sentence.push_back(*siter);
	  length += siter->size();
	}

	truncated.push_back(sentence);
      } else {
	truncated.push_back(*diter);
	length = length_sentence;
      }

      if (length == limit) break;
    }

    return truncated;
  }

  document_type truncate_words(const document_type& document, const size_t limit)
  {
    document_type truncated;
    size_t length = 0;

    document_type::const_iterator diter_end = document.end();
    for (document_type::const_iterator diter = document.begin(); diter != diter_end; ++ diter) {
      if (length + diter->size() > limit) {
	truncated.push_back(sentence_type(diter->begin(), diter->begin() + (limit - length)));
	length = limit;
      } else {
	truncated.push_back(*diter);
	length += diter->size();
      }

      if (length == limit) break;
    }

    return truncated;
  }

  size_t byte_size(const document_type& document)
  {
    size_t size = 0;
    document_type::const_iterator diter_end = document.end();
    for (document_type::const_iterator diter = document.begin(); diter != diter_end; ++ diter)
      for (sentence_type::const_iterator siter = diter->begin(); siter != diter->end(); ++ siter)
	size += siter->size();
    return size;
  }
};
