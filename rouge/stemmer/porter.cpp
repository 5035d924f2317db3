//
//  Copyright(C) 2010-2011 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include "stemmer/porter.hpp"

#include <cstring>

namespace rouge
{
  namespace stemmer
  {
    namespace
    {
      typedef std::string word_type;

      bool is_consonant(const word_type& word, const size_t i)
      {
	switch (word[i]) {
	case 'a':
	case 'e':
	case 'i':
	case 'o':
	case 'u':
	  return false;
	case 'y':
	  return (i == 0 ? true : ! is_consonant(word, i - 1));
	default:
	  return true;
	}
      }

      // number of vc sequences, [C](VC)^m[V]
      int measure(const word_type& stem)
      {
	int m = 0;
	bool vowel = false;
	for (size_t i = 0; i != stem.size(); ++ i) {
	  const bool consonant = is_consonant(stem, i);
	  if (consonant && vowel)
	    ++ m;
	  vowel = ! consonant;
	}
	return m;
      }

      bool contains_vowel(const word_type& stem)
      {
	for (size_t i = 0; i != stem.size(); ++ i)
	  if (! is_consonant(stem, i))
	    return true;
	return false;
      }

      bool ends_double_consonant(const word_type& word)
      {
	const size_t size = word.size();
	return size >= 2 && word[size - 1] == word[size - 2] && is_consonant(word, size - 1);
      }

      // *o
      bool ends_cvc(const word_type& word)
      {
	const size_t size = word.size();
	if (size < 3) return false;

	const char last = word[size - 1];
	return (is_consonant(word, size - 3)
		&& ! is_consonant(word, size - 2)
		&& is_consonant(word, size - 1)
		&& last != 'w' && last != 'x' && last != 'y');
      }

      bool ends_with(const word_type& word, const char* suffix)
      {
	const size_t length = std::strlen(suffix);
	return word.size() >= length && word.compare(word.size() - length, length, suffix) == 0;
      }

      word_type strip(const word_type& word, const char* suffix)
      {
	return word.substr(0, word.size() - std::strlen(suffix));
      }

      enum condition_type {
	NONE,
	MEASURE_POSITIVE,
	MEASURE_GREATER_ONE,
	MEASURE_GREATER_ONE_ST,
      };

      struct rule_type
      {
	const char*    suffix;
	const char*    replacement;
	condition_type condition;
      };

      bool satisfied(const word_type& stem, const condition_type condition)
      {
	switch (condition) {
	case NONE:                   return true;
	case MEASURE_POSITIVE:       return measure(stem) > 0;
	case MEASURE_GREATER_ONE:    return measure(stem) > 1;
	case MEASURE_GREATER_ONE_ST: return measure(stem) > 1 && (stem[stem.size() - 1] == 's' || stem[stem.size() - 1] == 't');
	}
	return false;
      }

      // the first rule whose suffix matches decides the outcome of the step
      template <size_t N>
      word_type apply(const word_type& word, const rule_type (&rules)[N])
      {
	for (size_t i = 0; i != N; ++ i)
	  if (ends_with(word, rules[i].suffix)) {
	    const word_type stem = strip(word, rules[i].suffix);
	    return (satisfied(stem, rules[i].condition) ? stem + rules[i].replacement : word);
	  }
	return word;
      }

      word_type step1a(const word_type& word)
      {
	static const rule_type rules[] = {
	  {"sses", "ss", NONE},
	  {"ies",  "i",  NONE},
	  {"ss",   "ss", NONE},
	  {"s",    "",   NONE},
	};
	return apply(word, rules);
      }

      word_type step1b(const word_type& word)
      {
	if (ends_with(word, "eed")) {
	  const word_type stem = strip(word, "eed");
	  return (measure(stem) > 0 ? stem + "ee" : word);
	}

	word_type stem;
	if (ends_with(word, "ed") && contains_vowel(strip(word, "ed")))
	  stem = strip(word, "ed");
	else if (ends_with(word, "ing") && contains_vowel(strip(word, "ing")))
	  stem = strip(word, "ing");
	else
	  return word;

	if (ends_with(stem, "at") || ends_with(stem, "bl") || ends_with(stem, "iz"))
	  return stem + 'e';

	if (ends_double_consonant(stem)) {
	  const char last = stem[stem.size() - 1];
	  return (last != 'l' && last != 's' && last != 'z' ? stem.substr(0, stem.size() - 1) : stem);
	}

	if (measure(stem) == 1 && ends_cvc(stem))
	  return stem + 'e';

	return stem;
      }

      word_type step1c(const word_type& word)
      {
	if (ends_with(word, "y") && contains_vowel(strip(word, "y")))
	  return strip(word, "y") + 'i';
	return word;
      }

      word_type step2(const word_type& word)
      {
	static const rule_type rules[] = {
	  {"ational", "ate",  MEASURE_POSITIVE},
	  {"tional",  "tion", MEASURE_POSITIVE},
	  {"enci",    "ence", MEASURE_POSITIVE},
	  {"anci",    "ance", MEASURE_POSITIVE},
	  {"izer",    "ize",  MEASURE_POSITIVE},
	  {"bli",     "ble",  MEASURE_POSITIVE},
	  {"alli",    "al",   MEASURE_POSITIVE},
	  {"entli",   "ent",  MEASURE_POSITIVE},
	  {"eli",     "e",    MEASURE_POSITIVE},
	  {"ousli",   "ous",  MEASURE_POSITIVE},
	  {"ization", "ize",  MEASURE_POSITIVE},
	  {"ation",   "ate",  MEASURE_POSITIVE},
	  {"ator",    "ate",  MEASURE_POSITIVE},
	  {"alism",   "al",   MEASURE_POSITIVE},
	  {"iveness", "ive",  MEASURE_POSITIVE},
	  {"fulness", "ful",  MEASURE_POSITIVE},
	  {"ousness", "ous",  MEASURE_POSITIVE},
	  {"aliti",   "al",   MEASURE_POSITIVE},
	  {"iviti",   "ive",  MEASURE_POSITIVE},
	  {"biliti",  "ble",  MEASURE_POSITIVE},
	  {"logi",    "log",  MEASURE_POSITIVE},
	};
	return apply(word, rules);
      }

      word_type step3(const word_type& word)
      {
	static const rule_type rules[] = {
	  {"icate", "ic", MEASURE_POSITIVE},
	  {"ative", "",   MEASURE_POSITIVE},
	  {"alize", "al", MEASURE_POSITIVE},
	  {"iciti", "ic", MEASURE_POSITIVE},
	  {"ical",  "ic", MEASURE_POSITIVE},
	  {"ful",   "",   MEASURE_POSITIVE},
	  {"ness",  "",   MEASURE_POSITIVE},
	};
	return apply(word, rules);
      }

      word_type step4(const word_type& word)
      {
	static const rule_type rules[] = {
	  {"al",    "", MEASURE_GREATER_ONE},
	  {"ance",  "", MEASURE_GREATER_ONE},
	  {"ence",  "", MEASURE_GREATER_ONE},
	  {"er",    "", MEASURE_GREATER_ONE},
	  {"ic",    "", MEASURE_GREATER_ONE},
	  {"able",  "", MEASURE_GREATER_ONE},
	  {"ible",  "", MEASURE_GREATER_ONE},
	  {"ant",   "", MEASURE_GREATER_ONE},
	  {"ement", "", MEASURE_GREATER_ONE},
	  {"ment",  "", MEASURE_GREATER_ONE},
	  {"ent",   "", MEASURE_GREATER_ONE},
	  {"ion",   "", MEASURE_GREATER_ONE_ST},
	  {"ou",    "", MEASURE_GREATER_ONE},
	  {"ism",   "", MEASURE_GREATER_ONE},
	  {"ate",   "", MEASURE_GREATER_ONE},
	  {"iti",   "", MEASURE_GREATER_ONE},
	  {"ous",   "", MEASURE_GREATER_ONE},
	  {"ive",   "", MEASURE_GREATER_ONE},
	  {"ize",   "", MEASURE_GREATER_ONE},
	};
	return apply(word, rules);
      }

      word_type step5a(const word_type& word)
      {
	if (! ends_with(word, "e")) return word;

	const word_type stem = strip(word, "e");
	const int m = measure(stem);
	if (m > 1 || (m == 1 && ! ends_cvc(stem)))
	  return stem;
	return word;
      }

      word_type step5b(const word_type& word)
      {
	if (ends_with(word, "ll") && measure(strip(word, "l")) > 1)
	  return strip(word, "l");
	return word;
      }
    };

    Porter::word_type Porter::stem(const word_type& word) const
    {
      if (word.size() <= 2) return word;

      word_type stemmed = step1a(word);
      stemmed = step1b(stemmed);
      stemmed = step1c(stemmed);
      stemmed = step2(stemmed);
      stemmed = step3(stemmed);
      stemmed = step4(stemmed);
      stemmed = step5a(stemmed);
      stemmed = step5b(stemmed);

      return stemmed;
    }
  };
};
