//
//  Copyright(C) 2010-2011 Taro Watanabe <taro.watanabe@nict.go.jp>
//

#include "stemmer.hpp"
#include "stemmer/porter.hpp"
#include "stemmer/morph.hpp"
#include "error.hpp"

#include <string>
#include <vector>
#include <sstream>

#include <boost/filesystem.hpp>

#include <gtest/gtest.h>

namespace rouge
{
  namespace
  {
    const boost::filesystem::path testdata(ROUGE_TESTDATA_DIR);

    TEST(PorterTest, ReferenceVariant)
    {
      const char* words[] = {
	"caresses", "flies", "dies", "mules", "denied",
	"died", "agreed", "owned", "humbled", "sized",
	"meeting", "stating", "siezing", "itemization",
	"sensational", "traditional", "reference", "colonizer",
	"plotted",
      };
      const char* stems[] = {
	"caress", "fli", "di", "mule", "deni",
	"di", "agre", "own", "humbl", "size",
	"meet", "state", "siez", "item",
	"sensat", "tradit", "refer", "colon",
	"plot",
      };

      stemmer::Porter porter;
      for (size_t i = 0; i != sizeof(words) / sizeof(words[0]); ++ i)
	EXPECT_EQ(stems[i], porter(words[i])) << words[i];
    }

    TEST(PorterTest, ShortWordsUnchanged)
    {
      stemmer::Porter porter;

      EXPECT_EQ("as", porter("as"));
      EXPECT_EQ("is", porter("is"));
      EXPECT_EQ("a", porter("a"));
      EXPECT_EQ("", porter(""));
    }

    TEST(PorterTest, StepTwoExtensions)
    {
      stemmer::Porter porter;

      // bli -> ble
      EXPECT_EQ("possibl", porter("possibly"));
      // logi -> log
      EXPECT_EQ("analog", porter("analogy"));
      // y -> i whenever the stem has a vowel
      EXPECT_EQ("happi", porter("happy"));
      EXPECT_EQ("sky", porter("sky"));
    }

    TEST(MorphTest, WordNetExceptions)
    {
      const stemmer::Morph morph(stemmer::Morph::exception_path(testdata));

      EXPECT_EQ("free", morph("freest"));
      EXPECT_EQ("hard", morph("hardest"));
      EXPECT_EQ("candelabrum", morph("candelabra"));
      EXPECT_EQ("hobnob", morph("hobnobbing"));
    }

    TEST(MorphTest, PorterAfterException)
    {
      const stemmer::Morph morph(stemmer::Morph::exception_path(testdata));

      EXPECT_EQ("child", morph("children"));
      EXPECT_EQ("write", morph("written"));
      EXPECT_EQ("meet", morph("meeting"));
    }

    TEST(MorphTest, LaterFileOverrides)
    {
      const stemmer::Morph morph(stemmer::Morph::exception_path(testdata));

      // adj.exc: best good, adv.exc: best well
      EXPECT_EQ("well", morph("best"));
      EXPECT_EQ("well", morph("better"));
    }

    TEST(MorphTest, FirstBaseForm)
    {
      const stemmer::Morph morph(stemmer::Morph::exception_path(testdata));

      EXPECT_EQ("see", morph("saw"));
    }

    TEST(MorphTest, MissingDirectory)
    {
      EXPECT_THROW(stemmer::Morph morph(testdata / "no-such-directory"), config_error);
    }

    TEST(MorphTest, WrongFileCount)
    {
      // only the stopword file, no *.exc
      EXPECT_THROW(stemmer::Morph morph(testdata), config_error);
    }

    TEST(StemmerTest, Create)
    {
      Stemmer::stemmer_ptr_type porter = Stemmer::create("porter");
      ASSERT_TRUE(porter);
      EXPECT_EQ("porter", porter->algorithm());
      EXPECT_EQ("plot", porter->stem("plotted"));

      std::ostringstream spec;
      spec << "morph:data=\"" << testdata.string() << "\"";

      Stemmer::stemmer_ptr_type morph = Stemmer::create(spec.str());
      ASSERT_TRUE(morph);
      EXPECT_EQ("hobnob", morph->stem("hobnobbing"));
    }

    TEST(StemmerTest, CreateFailure)
    {
      EXPECT_THROW(Stemmer::create("snowball"), config_error);
      EXPECT_THROW(Stemmer::create("morph"), config_error);
    }
  };
};
