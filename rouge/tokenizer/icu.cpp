//
//  Copyright(C) 2010-2011 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include "tokenizer/icu.hpp"

#include <memory>
#include <stdexcept>

#include <unicode/brkiter.h>
#include <unicode/locid.h>
#include <unicode/unistr.h>

namespace rouge
{
  namespace tokenizer
  {
    namespace
    {
      void words(icu::BreakIterator& iter, const icu::UnicodeString& utext, sentence_type& sentence)
      {
	iter.setText(utext);

	int32_t start = iter.first();
	for (int32_t end = iter.next(); end != icu::BreakIterator::DONE; start = end, end = iter.next()) {
	  if (iter.getRuleStatus() == UBRK_WORD_NONE) continue;

	  std::string word;
	  utext.tempSubStringBetween(start, end).toUTF8String(word);
	  sentence.push_back(word);
	}
      }
    };

    Icu::Icu(const bool sentence) : pimpl_word(0), pimpl_sentence(0)
    {
      UErrorCode status = U_ZERO_ERROR;
      std::unique_ptr<icu::BreakIterator> word(icu::BreakIterator::createWordInstance(icu::Locale::getEnglish(), status));
      if (U_FAILURE(status))
	throw std::runtime_error(std::string("BreakIterator::createWordInstance(): ") + u_errorName(status));

      if (sentence) {
	std::unique_ptr<icu::BreakIterator> sent(icu::BreakIterator::createSentenceInstance(icu::Locale::getEnglish(), status));
	if (U_FAILURE(status))
	  throw std::runtime_error(std::string("BreakIterator::createSentenceInstance(): ") + u_errorName(status));

	pimpl_sentence = sent.release();
      }

      pimpl_word = word.release();
    }

    Icu::~Icu()
    {
      std::unique_ptr<icu::BreakIterator> tmp_word(static_cast<icu::BreakIterator*>(pimpl_word));
      std::unique_ptr<icu::BreakIterator> tmp_sentence(static_cast<icu::BreakIterator*>(pimpl_sentence));
    }

    void Icu::tokenize(const std::string& text, document_type& tokenized) const
    {
      // break iterators keep state, so work on clones
      std::unique_ptr<icu::BreakIterator> word(static_cast<const icu::BreakIterator*>(pimpl_word)->clone());

      const icu::UnicodeString utext = icu::UnicodeString::fromUTF8(icu::StringPiece(text.data(), text.size()));

      tokenized.clear();

      if (! pimpl_sentence) {
	tokenized.push_back(sentence_type());
	words(*word, utext, tokenized.back());
	return;
      }

      std::unique_ptr<icu::BreakIterator> sentence(static_cast<const icu::BreakIterator*>(pimpl_sentence)->clone());
      sentence->setText(utext);

      int32_t start = sentence->first();
      for (int32_t end = sentence->next(); end != icu::BreakIterator::DONE; start = end, end = sentence->next()) {
	const icu::UnicodeString usentence(utext, start, end - start);

	sentence_type tokens;
	words(*word, usentence, tokens);
	if (! tokens.empty())
	  tokenized.push_back(tokens);
      }
    }
  };
};
