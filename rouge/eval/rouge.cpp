//
//  Copyright(C) 2010-2011 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include "eval/rouge.hpp"

#include "tokenizer/rouge155.hpp"
#include "parameter.hpp"
#include "error.hpp"

#include <cstdio>
#include <cstdlib>
#include <stdexcept>

#include <boost/lexical_cast.hpp>

namespace rouge
{
  namespace eval
  {
    std::ostream& operator<<(std::ostream& os, const RougeScore& x)
    {
      char buffer[128];
      std::snprintf(buffer, sizeof(buffer), "R: %.5f P: %.5f F: %.5f", x.recall, x.precision, x.fscore);
      os << buffer;
      return os;
    }

    const char* Rouge::lists()
    {
      static const char* desc = "\
rouge: ROUGE-N with ROUGE-1.5.5 options\n\
\tb=[int] only the first n bytes (0 for no limit)\n\
\tl=[int] only the first n words (0 for no limit)\n\
\tm=[true|false] stemming\n\
\ts=[true|false] stopword removal\n\
\tn=[int] compute up to ROUGE-n (default 4)\n\
\tf=[A|B] scoring formula, A: model average, B: best model (default A)\n\
\tp=[real] relative importance of recall and precision (default 0.5)\n\
\te=[ROUGE data directory]\n\
\tv=[int] verbose\n\
";
      return desc;
    }

    Rouge::Rouge(const tokenizer_ptr_type& tokenizer, const int order, const scoring_type scoring, const double alpha, const int __debug)
      : __tokenizer(tokenizer), __order(order), __scoring(scoring), __alpha(alpha), debug(__debug)
    {
      if (! __tokenizer)
	throw config_error("no tokenizer?");
      if (__order <= 0)
	throw config_error("invalid ngram order: " + boost::lexical_cast<std::string>(__order));
      if (__scoring != AVERAGE && __scoring != BEST)
	throw config_error("invalid scoring formula, must be A or B");
      if (! (__alpha >= 0.0 && __alpha <= 1.0))
	throw config_error("invalid alpha: " + boost::lexical_cast<std::string>(__alpha));
    }

    Rouge::rouge_ptr_type Rouge::from_rouge155(const Rouge155Options& options)
    {
      if (options.b < 0 || options.l < 0)
	throw config_error("negative byte or word limit");

      tokenizer::Rouge155::options_type tokenizer_options;
      tokenizer_options.byte_limit = options.b;
      tokenizer_options.word_limit = options.l;
      tokenizer_options.stem       = options.m;
      tokenizer_options.stopword   = options.s;
      tokenizer_options.split      = "SPL";
      tokenizer_options.data       = options.e;

      const tokenizer_ptr_type tokenizer(new tokenizer::Rouge155(tokenizer_options));

      return rouge_ptr_type(new Rouge(tokenizer, options.n, scoring_type(options.f), options.p, options.v));
    }

    Rouge::rouge_ptr_type Rouge::create(const std::string& parameter)
    {
      const Parameter param(parameter);

      if (param.name() != "rouge")
	throw config_error("invalid rouge parameter: " + parameter);

      return from_rouge155(Rouge155Options(param));
    }

    std::string Rouge::label(const int n)
    {
      return "ROUGE-" + boost::lexical_cast<std::string>(n);
    }

    double Rouge::round(const double value, const int digits)
    {
      // correctly rounded decimal representation, ties to even
      char buffer[64];
      std::snprintf(buffer, sizeof(buffer), "%.*f", digits, value);
      return std::strtod(buffer, 0);
    }

    RougeCounts Rouge::aggregate(const std::vector<RougeCounts, std::allocator<RougeCounts> >& counts, const scoring_type scoring)
    {
      typedef std::vector<RougeCounts, std::allocator<RougeCounts> > counts_set_type;

      if (counts.empty())
	return RougeCounts();

      if (scoring == AVERAGE) {
	RougeCounts summed;
	for (counts_set_type::const_iterator citer = counts.begin(); citer != counts.end(); ++ citer) {
	  summed.candidate += citer->candidate;
	  summed.reference += citer->reference;
	  summed.matched   += citer->matched;
	}
	return summed;
      }

      // the first reference with the highest matched/reference
      counts_set_type::const_iterator best = counts.begin();
      double best_ratio = (best->reference ? double(best->matched) / best->reference : 0.0);
      for (counts_set_type::const_iterator citer = counts.begin() + 1; citer != counts.end(); ++ citer) {
	const double ratio = (citer->reference ? double(citer->matched) / citer->reference : 0.0);
	if (ratio > best_ratio) {
	  best = citer;
	  best_ratio = ratio;
	}
      }
      return *best;
    }

    RougeScore Rouge::score(const RougeCounts& counts, const double alpha)
    {
      const double recall    = (counts.reference ? double(counts.matched) / counts.reference : 0.0);
      const double precision = (counts.candidate ? double(counts.matched) / counts.candidate : 0.0);
      const double fscore    = (counts.matched
				? (precision * recall) / ((1.0 - alpha) * precision + alpha * recall)
				: 0.0);

      return RougeScore(round(recall), round(precision), round(fscore));
    }

    Rouge::score_map_type Rouge::n_score(const text_set_type& references, const text_type& candidate) const
    {
      typedef std::vector<document_type, std::allocator<document_type> > document_set_type;
      typedef std::vector<RougeCounts, std::allocator<RougeCounts> > counts_set_type;

      if (references.empty())
	throw std::invalid_argument("no reference texts?");

      const document_type candidate_tokenized = (*__tokenizer)(candidate);

      document_set_type references_tokenized(references.size());
      for (size_t i = 0; i != references.size(); ++ i)
	(*__tokenizer)(references[i], references_tokenized[i]);

      score_map_type results;
      counts_set_type counts;

      for (int n = 1; n <= __order; ++ n) {
	const NGramCounts candidate_counts(candidate_tokenized, n);

	counts.clear();
	for (size_t i = 0; i != references_tokenized.size(); ++ i) {
	  const NGramCounts reference_counts(references_tokenized[i], n);

	  counts.push_back(RougeCounts(candidate_counts.total(), reference_counts.total(), candidate_counts.matches(reference_counts)));

	  if (debug)
	    std::cerr << label(n) << " reference: " << i
		      << " candidate-count: " << counts.back().candidate
		      << " reference-count: " << counts.back().reference
		      << " matched: " << counts.back().matched
		      << std::endl;
	}

	results[label(n)] = score(aggregate(counts, __scoring), __alpha);
      }

      return results;
    }

    RougeSession Rouge::reset_incremental(const text_set_type& references) const
    {
      RougeSession session(__order);

      for (size_t i = 0; i != references.size(); ++ i) {
	const document_type tokenized = (*__tokenizer)(references[i]);

	for (int n = 1; n <= __order; ++ n) {
	  session.references[n - 1].push_back(NGramCounts(tokenized, n));
	  session.totals[n - 1] += session.references[n - 1].back().total();
	}
      }

      return session;
    }

    Rouge::recall_map_type Rouge::n_score_incremental(RougeSession& session, const text_type& text) const
    {
      if (session.order != __order)
	throw std::invalid_argument("incremental session of order " + boost::lexical_cast<std::string>(session.order)
				    + " used with ROUGE order " + boost::lexical_cast<std::string>(__order));

      recall_map_type results;

      sentence_type words;
      flatten((*__tokenizer)(text), words);

      if (words.empty()) {
	for (int n = 1; n <= __order; ++ n)
	  results[label(n)] = boost::none;
	return results;
      }

      sentence_type& context = session.context;
      context.insert(context.end(), words.begin(), words.end());

      ngram_set_type ngrams;
      for (int n = 1; n <= __order; ++ n) {
	ngrams_suffix(context, words.size(), n, ngrams);

	count_type matched = 0;
	const RougeSession::counts_set_type& references = session.references[n - 1];
	for (RougeSession::counts_set_type::const_iterator riter = references.begin(); riter != references.end(); ++ riter)
	  for (ngram_set_type::const_iterator niter = ngrams.begin(); niter != ngrams.end(); ++ niter)
	    matched += riter->find(*niter);

	const count_type total = session.totals[n - 1];

	if (debug)
	  std::cerr << label(n) << " incremental words: " << words.size()
		    << " ngrams: " << ngrams.size()
		    << " matched: " << matched
		    << " reference-count: " << total
		    << std::endl;

	results[label(n)] = (total ? double(matched) / total : 0.0);
      }

      // keep the last order - 1 words
      if (context.size() > static_cast<size_t>(__order - 1))
	context.erase(context.begin(), context.end() - (__order - 1));

      return results;
    }
  };
};
