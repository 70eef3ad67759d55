#include <cmath>
#include <cstdio>
#include <fstream>
#include <string>
#include <unordered_map>
#include <vector>

#include <gtest/gtest.h>
#include <userver/utest/utest.hpp>

#include "text_analyzers/lexicon_polarity_analyzer.hpp"
#include "text_analyzers/tokenizers.hpp"
#include "text_analyzers/vader_sentiment_analyzer.hpp"

namespace review_scoring {

using Tokens = std::vector<std::string>;
using VaderLexicon = std::unordered_map<std::string, double>;
using PolarityLexicon = std::unordered_map<std::string, PolarityEntry>;

TEST(TreebankTokenizer, SplitsEdgePunctuation) {
    const TreebankTokenizer tokenizer;
    EXPECT_EQ(tokenizer.Tokenize("product bagus, delivery cepat."),
              (Tokens{"product", "bagus", ",", "delivery", "cepat", "."}));
    EXPECT_EQ(tokenizer.Tokenize("(best) seller!"), (Tokens{"(", "best", ")", "seller", "!"}));
}

TEST(TreebankTokenizer, KeepsEllipsisAndInnerMarks) {
    const TreebankTokenizer tokenizer;
    EXPECT_EQ(tokenizer.Tokenize("wait... don't re-order"),
              (Tokens{"wait", "...", "don't", "re-order"}));
}

TEST(WhitespaceTokenizer, SplitsOnWhitespace) {
    const WhitespaceTokenizer tokenizer;
    EXPECT_EQ(tokenizer.Tokenize("  ok  lah, \t sampai "), (Tokens{"ok", "lah,", "sampai"}));
    EXPECT_TRUE(tokenizer.Tokenize("   ").empty());
}

TEST(VaderSentimentAnalyzer, SingleWordCompound) {
    const VaderSentimentAnalyzer analyzer(VaderLexicon{{"good", 1.9}, {"bad", -2.5}});
    const auto scores = analyzer.PolarityScores("good");
    EXPECT_NEAR(scores.compound, 1.9 / std::sqrt(1.9 * 1.9 + 15.0), 1e-4);
    EXPECT_DOUBLE_EQ(scores.positive, 1.0);
    EXPECT_DOUBLE_EQ(scores.negative, 0.0);
}

TEST(VaderSentimentAnalyzer, NegationFlipsSign) {
    const VaderSentimentAnalyzer analyzer(VaderLexicon{{"good", 1.9}});
    EXPECT_GT(analyzer.PolarityScores("the seller is good").compound, 0.0);
    EXPECT_LT(analyzer.PolarityScores("the seller is not good").compound, 0.0);
}

TEST(VaderSentimentAnalyzer, ProportionsSumToOne) {
    const VaderSentimentAnalyzer analyzer(VaderLexicon{{"good", 1.9}, {"bad", -2.5}});
    const auto scores = analyzer.PolarityScores("good packaging but bad delivery");
    EXPECT_NEAR(scores.positive + scores.negative + scores.neutral, 1.0, 1e-9);
    EXPECT_GE(scores.compound, -1.0);
    EXPECT_LE(scores.compound, 1.0);
}

UTEST(VaderSentimentAnalyzer, MissingLexiconFile) {
    VaderSentimentAnalyzer analyzer;
    EXPECT_FALSE(analyzer.LoadLexicon("/nonexistent/vader_lexicon.txt"));
    EXPECT_FALSE(analyzer.IsLoaded());
}

TEST(LexiconPolarityAnalyzer, AveragesMatchedWords) {
    const LexiconPolarityAnalyzer analyzer(PolarityLexicon{
        {"great", {0.8, 0.75, 1.0}},
        {"bad", {-0.7, 0.65, 1.0}},
    });
    const auto result = analyzer.Analyze("great box, bad tape");
    EXPECT_NEAR(result.polarity, 0.05, 1e-9);
    EXPECT_NEAR(result.subjectivity, 0.7, 1e-9);
}

TEST(LexiconPolarityAnalyzer, NegationAndIntensifier) {
    const LexiconPolarityAnalyzer analyzer(PolarityLexicon{
        {"good", {0.7, 0.6, 1.0}},
        {"very", {0.0, 0.3, 1.3}},
    });
    EXPECT_NEAR(analyzer.Analyze("not good").polarity, -0.35, 1e-9);
    EXPECT_NEAR(analyzer.Analyze("very good").polarity, 0.91, 1e-9);
}

TEST(LexiconPolarityAnalyzer, NoMatchesGiveZero) {
    const LexiconPolarityAnalyzer analyzer(PolarityLexicon{{"good", {0.7, 0.6, 1.0}}});
    const auto result = analyzer.Analyze("barang sampai");
    EXPECT_DOUBLE_EQ(result.polarity, 0.0);
    EXPECT_DOUBLE_EQ(result.subjectivity, 0.0);
}

UTEST(LexiconPolarityAnalyzer, LoadsTsv) {
    const std::string path = ::testing::TempDir() + "polarity_lexicon.tsv";
    {
        std::ofstream out(path);
        out << "# word\tpolarity\tsubjectivity\tintensity\n";
        out << "great\t0.8\t0.75\n";
        out << "broken line\n";
        out << "very\t0.0\t0.3\t1.3\n";
    }

    LexiconPolarityAnalyzer analyzer;
    ASSERT_TRUE(analyzer.LoadLexicon(path));
    EXPECT_NEAR(analyzer.Analyze("very great").polarity, 1.0, 1e-9);
    std::remove(path.c_str());
}

} // namespace review_scoring
