//
//  Copyright(C) 2010-2011 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include "eval/rouge.hpp"
#include "eval/options.hpp"
#include "tokenizer.hpp"
#include "parameter.hpp"
#include "error.hpp"

#include <string>
#include <vector>
#include <sstream>
#include <stdexcept>

#include <boost/filesystem.hpp>

#include <gtest/gtest.h>

namespace rouge
{
  namespace eval
  {
    namespace
    {
      const boost::filesystem::path testdata(ROUGE_TESTDATA_DIR);

      typedef Rouge::text_set_type text_set_type;

      Tokenizer::tokenizer_ptr_type plain_tokenizer()
      {
	return Tokenizer::create("rouge155:stem=false,stopword=false");
      }

      text_set_type make_references(const char* first, const char* second=0)
      {
	text_set_type references;
	references.push_back(first);
	if (second)
	  references.push_back(second);
	return references;
      }

      TEST(RougeTest, MultisetMatching)
      {
	const Rouge rouge(plain_tokenizer(), 1, Rouge::AVERAGE, 0.5);

	const Rouge::score_map_type scores = rouge.n_score(make_references("a b b"), "a a b");
	ASSERT_EQ(1u, scores.size());

	const RougeScore& score = scores.find("ROUGE-1")->second;
	EXPECT_DOUBLE_EQ(0.66667, score.recall);
	EXPECT_DOUBLE_EQ(0.66667, score.precision);
	EXPECT_DOUBLE_EQ(0.66667, score.fscore);
      }

      TEST(RougeTest, AverageAndBest)
      {
	const text_set_type references = make_references("a a a a", "a");

	const Rouge average(plain_tokenizer(), 1, Rouge::AVERAGE, 0.5);
	const RougeScore score_average = average.n_score(references, "a a")["ROUGE-1"];
	EXPECT_DOUBLE_EQ(0.6, score_average.recall);
	EXPECT_DOUBLE_EQ(0.75, score_average.precision);

	const Rouge best(plain_tokenizer(), 1, Rouge::BEST, 0.5);
	const RougeScore score_best = best.n_score(references, "a a")["ROUGE-1"];
	EXPECT_DOUBLE_EQ(1.0, score_best.recall);
	EXPECT_DOUBLE_EQ(0.5, score_best.precision);
      }

      TEST(RougeTest, BestKeepsFirstOnTie)
      {
	std::vector<RougeCounts> counts;
	counts.push_back(RougeCounts(4, 2, 1));
	counts.push_back(RougeCounts(4, 4, 2));
	counts.push_back(RougeCounts(4, 0, 0));

	const RougeCounts best = Rouge::aggregate(counts, Rouge::BEST);
	EXPECT_EQ(2, best.reference);
	EXPECT_EQ(1, best.matched);

	const RougeCounts summed = Rouge::aggregate(counts, Rouge::AVERAGE);
	EXPECT_EQ(12, summed.candidate);
	EXPECT_EQ(6, summed.reference);
	EXPECT_EQ(3, summed.matched);
      }

      TEST(RougeTest, Bigrams)
      {
	const Rouge rouge(plain_tokenizer(), 2, Rouge::AVERAGE, 0.5);

	Rouge::score_map_type scores = rouge.n_score(make_references("the cat lay on the mat"), "The cat sat on the mat.");
	ASSERT_EQ(2u, scores.size());

	EXPECT_DOUBLE_EQ(0.83333, scores["ROUGE-1"].recall);
	EXPECT_DOUBLE_EQ(0.6, scores["ROUGE-2"].recall);
	EXPECT_DOUBLE_EQ(0.6, scores["ROUGE-2"].precision);
	EXPECT_DOUBLE_EQ(0.6, scores["ROUGE-2"].fscore);
      }

      TEST(RougeTest, NGramsSpanSentences)
      {
	const Rouge rouge(plain_tokenizer(), 2, Rouge::AVERAGE, 0.5);

	Rouge::score_map_type scores = rouge.n_score(make_references("a b c"), "a b\nc");
	EXPECT_DOUBLE_EQ(1.0, scores["ROUGE-2"].recall);
      }

      TEST(RougeTest, FScoreBoundaries)
      {
	const Rouge rouge(plain_tokenizer(), 1, Rouge::AVERAGE, 0.5);

	Rouge::score_map_type none = rouge.n_score(make_references("x y z"), "a b c");
	EXPECT_DOUBLE_EQ(0.0, none["ROUGE-1"].recall);
	EXPECT_DOUBLE_EQ(0.0, none["ROUGE-1"].precision);
	EXPECT_DOUBLE_EQ(0.0, none["ROUGE-1"].fscore);

	Rouge::score_map_type all = rouge.n_score(make_references("a b c"), "a b c");
	EXPECT_DOUBLE_EQ(1.0, all["ROUGE-1"].fscore);

	EXPECT_DOUBLE_EQ(0.66667, Rouge::score(RougeCounts(2, 1, 1), 0.5).fscore);
	EXPECT_DOUBLE_EQ(0.5, Rouge::score(RougeCounts(2, 1, 1), 1.0).fscore);
	EXPECT_DOUBLE_EQ(1.0, Rouge::score(RougeCounts(2, 1, 1), 0.0).fscore);
      }

      TEST(RougeTest, EmptyTexts)
      {
	const Rouge rouge(plain_tokenizer(), 4, Rouge::AVERAGE, 0.5);

	Rouge::score_map_type scores = rouge.n_score(make_references("a b"), "");
	ASSERT_EQ(4u, scores.size());
	for (Rouge::score_map_type::const_iterator siter = scores.begin(); siter != scores.end(); ++ siter) {
	  EXPECT_DOUBLE_EQ(0.0, siter->second.recall);
	  EXPECT_DOUBLE_EQ(0.0, siter->second.precision);
	  EXPECT_DOUBLE_EQ(0.0, siter->second.fscore);
	}

	EXPECT_THROW(rouge.n_score(text_set_type(), "a b"), std::invalid_argument);
      }

      TEST(RougeTest, StemmingAndStopwords)
      {
	Rouge155Options options;
	options.m = true;
	options.s = true;
	options.n = 1;
	options.e = testdata;

	Rouge::rouge_ptr_type rouge = Rouge::from_rouge155(options);

	Rouge::score_map_type scores = rouge->n_score(make_references("A child meets."), "The children are meeting.");
	EXPECT_DOUBLE_EQ(1.0, scores["ROUGE-1"].recall);
	EXPECT_DOUBLE_EQ(1.0, scores["ROUGE-1"].precision);
      }

      TEST(RougeTest, Round)
      {
	EXPECT_DOUBLE_EQ(0.66667, Rouge::round(2.0 / 3.0));
	EXPECT_DOUBLE_EQ(0.12, Rouge::round(0.125, 2));
	EXPECT_DOUBLE_EQ(1.0, Rouge::round(0.999996));
	EXPECT_EQ("ROUGE-3", Rouge::label(3));
      }

      TEST(RougeTest, ScoreOutput)
      {
	std::ostringstream os;
	os << RougeScore(0.6, 1.0, 0.75);
	EXPECT_EQ("R: 0.60000 P: 1.00000 F: 0.75000", os.str());
      }

      TEST(RougeTest, InvalidConfiguration)
      {
	EXPECT_THROW(Rouge(plain_tokenizer(), 0, Rouge::AVERAGE, 0.5), config_error);
	EXPECT_THROW(Rouge(plain_tokenizer(), 2, Rouge::scoring_type('C'), 0.5), config_error);
	EXPECT_THROW(Rouge(plain_tokenizer(), 2, Rouge::AVERAGE, 1.5), config_error);
	EXPECT_THROW(Rouge(Rouge::tokenizer_ptr_type(), 2, Rouge::AVERAGE, 0.5), config_error);
      }

      TEST(RougeIncrementalTest, SumsToBatchRecall)
      {
	const Rouge rouge(plain_tokenizer(), 4, Rouge::AVERAGE, 0.5);

	const text_set_type references = make_references("w1 w2 w3 w4 w5 w6", "w0 w2 w3 w7 w4 w5");

	const char* lines[] = {"w1 w2", "w3", "w4 w5 zz", "w6"};

	RougeSession session = rouge.reset_incremental(references);
	EXPECT_EQ(4, session.max_order());
	EXPECT_EQ(12, session.reference_total(1));
	EXPECT_EQ(6, session.reference_total(4));
	EXPECT_EQ(3u, session.carry_over().size());

	std::vector<double> summed(4, 0.0);
	std::string text;
	for (size_t i = 0; i != sizeof(lines) / sizeof(lines[0]); ++ i) {
	  const Rouge::recall_map_type recalls = rouge.n_score_incremental(session, lines[i]);
	  ASSERT_EQ(4u, recalls.size());

	  for (int n = 1; n <= 4; ++ n) {
	    const boost::optional<double>& recall = recalls.find(Rouge::label(n))->second;
	    ASSERT_TRUE(recall);
	    summed[n - 1] += *recall;
	  }

	  text += (text.empty() ? "" : "\n");
	  text += lines[i];
	}

	Rouge::score_map_type batch = rouge.n_score(references, text);
	for (int n = 1; n <= 4; ++ n)
	  EXPECT_NEAR(batch[Rouge::label(n)].recall, summed[n - 1], 1e-5) << Rouge::label(n);

	EXPECT_NEAR(10.0 / 12.0, summed[0], 1e-12);
	EXPECT_NEAR(6.0 / 10.0, summed[1], 1e-12);
      }

      TEST(RougeIncrementalTest, NGramsAcrossIncrements)
      {
	const Rouge rouge(plain_tokenizer(), 2, Rouge::AVERAGE, 0.5);

	RougeSession session = rouge.reset_incremental(make_references("a b c d"));

	Rouge::recall_map_type first = rouge.n_score_incremental(session, "a b");
	EXPECT_DOUBLE_EQ(2.0 / 4.0, *first["ROUGE-1"]);
	EXPECT_DOUBLE_EQ(1.0 / 3.0, *first["ROUGE-2"]);

	ASSERT_EQ(1u, session.carry_over().size());
	EXPECT_EQ("b", session.carry_over().front());

	Rouge::recall_map_type second = rouge.n_score_incremental(session, "c");
	EXPECT_DOUBLE_EQ(1.0 / 4.0, *second["ROUGE-1"]);
	EXPECT_DOUBLE_EQ(1.0 / 3.0, *second["ROUGE-2"]);
      }

      TEST(RougeIncrementalTest, MembershipPerReference)
      {
	const Rouge rouge(plain_tokenizer(), 1, Rouge::AVERAGE, 0.5);

	RougeSession session = rouge.reset_incremental(make_references("a b", "a c"));

	// "a" is present in both references
	Rouge::recall_map_type recalls = rouge.n_score_incremental(session, "a a");
	EXPECT_DOUBLE_EQ(4.0 / 4.0, *recalls["ROUGE-1"]);
      }

      TEST(RougeIncrementalTest, EmptyIncrement)
      {
	const Rouge rouge(plain_tokenizer(), 3, Rouge::AVERAGE, 0.5);

	RougeSession session = rouge.reset_incremental(make_references("a b c"));
	rouge.n_score_incremental(session, "a");

	const Rouge::recall_map_type recalls = rouge.n_score_incremental(session, "... !");
	ASSERT_EQ(3u, recalls.size());
	for (Rouge::recall_map_type::const_iterator riter = recalls.begin(); riter != recalls.end(); ++ riter)
	  EXPECT_FALSE(riter->second) << riter->first;

	// the carry-over is untouched
	ASSERT_EQ(2u, session.carry_over().size());
	EXPECT_EQ("a", session.carry_over().back());

	Rouge::recall_map_type next = rouge.n_score_incremental(session, "b");
	EXPECT_DOUBLE_EQ(1.0 / 2.0, *next["ROUGE-2"]);
      }

      TEST(RougeIncrementalTest, EmptyReferences)
      {
	const Rouge rouge(plain_tokenizer(), 2, Rouge::AVERAGE, 0.5);

	RougeSession session = rouge.reset_incremental(make_references(""));
	EXPECT_EQ(0, session.reference_total(1));

	Rouge::recall_map_type recalls = rouge.n_score_incremental(session, "a b");
	EXPECT_DOUBLE_EQ(0.0, *recalls["ROUGE-1"]);
	EXPECT_DOUBLE_EQ(0.0, *recalls["ROUGE-2"]);
      }

      TEST(RougeIncrementalTest, IndependentSessions)
      {
	const Rouge rouge(plain_tokenizer(), 2, Rouge::AVERAGE, 0.5);
	const text_set_type references = make_references("a b c");

	RougeSession first = rouge.reset_incremental(references);
	rouge.n_score_incremental(first, "a");

	RougeSession second = rouge.reset_incremental(references);
	Rouge::recall_map_type recalls = rouge.n_score_incremental(second, "b");

	// "a b" would have matched had the sessions shared a carry-over
	EXPECT_DOUBLE_EQ(0.0, *recalls["ROUGE-2"]);
      }

      TEST(RougeIncrementalTest, OrderMismatch)
      {
	const Rouge bigram(plain_tokenizer(), 2, Rouge::AVERAGE, 0.5);
	const Rouge trigram(plain_tokenizer(), 3, Rouge::AVERAGE, 0.5);

	RougeSession session = bigram.reset_incremental(make_references("a b c"));
	EXPECT_THROW(trigram.n_score_incremental(session, "a b"), std::invalid_argument);
      }

      TEST(Rouge155OptionsTest, Parse)
      {
	const Rouge155Options options(Parameter("rouge:b=665,l=100,m=true,s=yes,n=2,f=B,p=0.3,e=/tmp/data,v=1,x=1,a=1,c=95,r=1000,2=4,u=1"));

	EXPECT_EQ(665, options.b);
	EXPECT_EQ(100, options.l);
	EXPECT_TRUE(options.m);
	EXPECT_TRUE(options.s);
	EXPECT_EQ(2, options.n);
	EXPECT_EQ('B', options.f);
	EXPECT_DOUBLE_EQ(0.3, options.p);
	EXPECT_EQ(boost::filesystem::path("/tmp/data"), options.e);
	EXPECT_EQ(1, options.v);
      }

      TEST(Rouge155OptionsTest, Defaults)
      {
	const Rouge155Options options;

	EXPECT_EQ(0, options.b);
	EXPECT_EQ(0, options.l);
	EXPECT_FALSE(options.m);
	EXPECT_FALSE(options.s);
	EXPECT_EQ(4, options.n);
	EXPECT_EQ('A', options.f);
	EXPECT_DOUBLE_EQ(0.5, options.p);
      }

      TEST(Rouge155OptionsTest, Invalid)
      {
	EXPECT_THROW(Rouge155Options options(Parameter("rouge:f=C")), config_error);
	EXPECT_THROW(Rouge155Options options(Parameter("rouge:b=-1")), config_error);
	EXPECT_THROW(Rouge155Options options(Parameter("rouge:n=two")), config_error);
	EXPECT_THROW(Rouge::create("bleu:n=2"), config_error);
	EXPECT_THROW(Rouge::create("rouge:n=0"), config_error);
	EXPECT_THROW(Rouge::create("rouge:p=2"), config_error);
      }

      TEST(RougeTest, Create)
      {
	Rouge::rouge_ptr_type rouge = Rouge::create("rouge:n=2,f=B,p=0.2");
	ASSERT_TRUE(rouge);

	EXPECT_EQ(2, rouge->order());
	EXPECT_EQ(Rouge::BEST, rouge->scoring());
	EXPECT_DOUBLE_EQ(0.2, rouge->alpha());
      }
    };
  };
};
