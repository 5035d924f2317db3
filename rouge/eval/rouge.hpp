// -*- mode: c++ -*-
//
//  Copyright(C) 2010-2011 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#ifndef __ROUGE__EVAL__ROUGE__HPP__
#define __ROUGE__EVAL__ROUGE__HPP__ 1

#include <string>
#include <vector>
#include <map>
#include <iostream>

#include <rouge/tokenizer.hpp>
#include <rouge/ngram_counts.hpp>
#include <rouge/eval/options.hpp>

#include <boost/shared_ptr.hpp>
#include <boost/optional.hpp>

namespace rouge
{
  namespace eval
  {
    struct RougeScore
    {
      double recall;
      double precision;
      double fscore;

      RougeScore() : recall(0), precision(0), fscore(0) {}
      RougeScore(const double __recall, const double __precision, const double __fscore)
	: recall(__recall), precision(__precision), fscore(__fscore) {}

      friend
      std::ostream& operator<<(std::ostream& os, const RougeScore& x);
    };

    // n-gram statistics for one candidate/reference pair
    struct RougeCounts
    {
      typedef NGramCounts::count_type count_type;

      count_type candidate;
      count_type reference;
      count_type matched;

      RougeCounts() : candidate(0), reference(0), matched(0) {}
      RougeCounts(const count_type __candidate, const count_type __reference, const count_type __matched)
	: candidate(__candidate), reference(__reference), matched(__matched) {}
    };

    class Rouge;

    // state of an incremental evaluation against fixed references
    class RougeSession
    {
    private:
      friend class Rouge;

      typedef NGramCounts::count_type count_type;
      typedef std::vector<NGramCounts, std::allocator<NGramCounts> > counts_set_type;
      typedef std::vector<counts_set_type, std::allocator<counts_set_type> > counts_order_type;
      typedef std::vector<count_type, std::allocator<count_type> > total_set_type;

    private:
      explicit RougeSession(const int __order)
	: references(__order), totals(__order, 0), context(__order - 1, std::string()), order(__order) {}

    public:
      int max_order() const { return order; }

      // sum of the reference n-gram counts for order n
      count_type reference_total(const int n) const { return totals[n - 1]; }

      // words carried over to complete n-grams spanning increments
      const sentence_type& carry_over() const { return context; }

    private:
      counts_order_type references;
      total_set_type    totals;
      sentence_type     context;
      int               order;
    };

    class Rouge
    {
    public:
      typedef Tokenizer::tokenizer_ptr_type tokenizer_ptr_type;
      typedef boost::shared_ptr<Rouge>      rouge_ptr_type;

      typedef std::string text_type;
      typedef std::vector<text_type, std::allocator<text_type> > text_set_type;

      typedef RougeCounts::count_type count_type;

      typedef std::map<std::string, RougeScore, std::less<std::string>,
		       std::allocator<std::pair<const std::string, RougeScore> > > score_map_type;
      typedef std::map<std::string, boost::optional<double>, std::less<std::string>,
		       std::allocator<std::pair<const std::string, boost::optional<double> > > > recall_map_type;

      enum scoring_type {
	AVERAGE = 'A', // model average
	BEST    = 'B', // best model
      };

    public:
      Rouge(const tokenizer_ptr_type& tokenizer, const int order, const scoring_type scoring, const double alpha, const int debug=0);

      static rouge_ptr_type from_rouge155(const Rouge155Options& options);
      static rouge_ptr_type create(const std::string& parameter);
      static const char* lists();

    public:
      // ROUGE-1 ... ROUGE-N, rounded to 5 decimal places
      score_map_type n_score(const text_set_type& references, const text_type& candidate) const;

      // incremental recall, average scoring
      RougeSession reset_incremental(const text_set_type& references) const;
      recall_map_type n_score_incremental(RougeSession& session, const text_type& text) const;

      const Tokenizer& tokenizer() const { return *__tokenizer; }
      int order() const { return __order; }
      scoring_type scoring() const { return __scoring; }
      double alpha() const { return __alpha; }

      static std::string label(const int n);
      static double round(const double value, const int digits=5);

      // combine per-reference statistics by the scoring formula
      static RougeCounts aggregate(const std::vector<RougeCounts, std::allocator<RougeCounts> >& counts, const scoring_type scoring);
      static RougeScore score(const RougeCounts& counts, const double alpha);

    private:
      tokenizer_ptr_type __tokenizer;
      int                __order;
      scoring_type       __scoring;
      double             __alpha;
      int                debug;
    };
  };
};

#endif
