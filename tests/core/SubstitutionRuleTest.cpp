#include "core/SubstitutionRule.hpp"
#include <gtest/gtest.h>

using namespace podfetch::core;

TEST(SubstitutionRuleTest, StripsTrackingSuffixFromEpisodeName) {
    auto rule = SubstitutionRule::parse(R"(s@^(.*/)((.+?)(-[0-9]{16,})?-.{20}(.{12})?)[.]@\3.@)");
    const std::string url = "http://audio.example.com/repository/audio/episodes/"
                            "Giuseppe_Ottaviani_presents_GO_On_Air_Episode_229-1484302984297800712-MjM1NDgtNTk5MDY5OTk=.m4a";

    EXPECT_EQ(rule.apply(url), "Giuseppe_Ottaviani_presents_GO_On_Air_Episode_229.m4a");
}

TEST(SubstitutionRuleTest, BuildsNameFromDirectoryAndExtension) {
    auto rule = SubstitutionRule::parse(R"(s,^.+/([^/]+)/media([.]\w+)$,\1\2,)");

    EXPECT_EQ(rule.apply("https://media.example.com/warcollege/episode-slug/media.mp3"), "episode-slug.mp3");
}

TEST(SubstitutionRuleTest, NonMatchingInputIsReturnedUnchanged) {
    auto rule = SubstitutionRule::parse(R"(s,^.+/([^/]+)/media([.]\w+)$,\1\2,)");
    const std::string url = "https://cdn.example.com/feeds/other/episode.ogg";

    EXPECT_FALSE(rule.matches(url));
    EXPECT_EQ(rule.apply(url), url);
    EXPECT_EQ(rule.apply(""), "");
}

TEST(SubstitutionRuleTest, ApplyIsDeterministic) {
    auto rule = SubstitutionRule::parse(R"(s/(\w+)-(\d+)/\2_\1/)");
    const std::string input = "show-12 and talk-7";

    std::string first = rule.apply(input);
    EXPECT_EQ(first, "12_show and 7_talk");
    EXPECT_EQ(rule.apply(input), first);
}

TEST(SubstitutionRuleTest, ExposesParsedParts) {
    auto rule = SubstitutionRule::parse(R"(s@^(.*/)((.+?)(-[0-9]{16,})?-.{20}(.{12})?)[.]@\3.@)");

    EXPECT_EQ(rule.delimiter(), '@');
    EXPECT_EQ(rule.pattern(), "^(.*/)((.+?)(-[0-9]{16,})?-.{20}(.{12})?)[.]");
    ASSERT_EQ(rule.replacement().size(), 2u);
    EXPECT_EQ(rule.replacement()[0].kind, TemplateToken::Kind::Group);
    EXPECT_EQ(rule.replacement()[0].group, 3u);
    EXPECT_EQ(rule.replacement()[1].kind, TemplateToken::Kind::Literal);
    EXPECT_EQ(rule.replacement()[1].text, ".");
}

TEST(SubstitutionRuleTest, EscapedDelimiterInPatternIsLiteral) {
    auto rule = SubstitutionRule::parse(R"(s/a\/b/x/)");

    EXPECT_EQ(rule.pattern(), "a/b");
    EXPECT_EQ(rule.apply("a/b/c"), "x/c");
}

TEST(SubstitutionRuleTest, EscapedDelimiterInReplacementIsLiteral) {
    auto rule = SubstitutionRule::parse(R"(s,x,a\,b,)");

    EXPECT_EQ(rule.apply("x"), "a,b");
}

TEST(SubstitutionRuleTest, EscapedRegexMetacharDelimiterStaysLiteral) {
    auto rule = SubstitutionRule::parse(R"(s|a\|b|X|)");

    EXPECT_EQ(rule.apply("a|b"), "X");
    EXPECT_EQ(rule.apply("a"), "a");
}

TEST(SubstitutionRuleTest, EscapedBackslashInReplacement) {
    auto rule = SubstitutionRule::parse(R"(s/a/\\/)");

    EXPECT_EQ(rule.apply("a"), "\\");
}

TEST(SubstitutionRuleTest, ReplacesEveryMatchByDefault) {
    EXPECT_EQ(SubstitutionRule::parse("s/a/b/").apply("banana"), "bbnbnb");
    EXPECT_EQ(SubstitutionRule::parse("s/a/b/g").apply("banana"), "bbnbnb");
}

TEST(SubstitutionRuleTest, FirstMatchOnlyFlag) {
    auto rule = SubstitutionRule::parse("s/a/b/1");

    EXPECT_FALSE(rule.isGlobal());
    EXPECT_EQ(rule.apply("banana"), "bbnana");
}

TEST(SubstitutionRuleTest, CaseInsensitiveFlag) {
    auto rule = SubstitutionRule::parse("s/A/o/i");

    EXPECT_TRUE(rule.isCaseInsensitive());
    EXPECT_EQ(rule.apply("Banana"), "Bonono");
}

TEST(SubstitutionRuleTest, EmptyReplacementDeletesMatches) {
    EXPECT_EQ(SubstitutionRule::parse("s/a//").apply("banana"), "bnn");
}

TEST(SubstitutionRuleTest, UnmatchedOptionalGroupExpandsToNothing) {
    auto rule = SubstitutionRule::parse(R"(s/(x)?b/[\1]/)");

    EXPECT_EQ(rule.apply("b"), "[]");
    EXPECT_EQ(rule.apply("xb"), "[x]");
}

TEST(SubstitutionRuleTest, RepeatedAndWholeMatchReferences) {
    EXPECT_EQ(SubstitutionRule::parse(R"(s/(a)/\1\1/1)").apply("a"), "aa");
    EXPECT_EQ(SubstitutionRule::parse(R"(s/an/<\0>/)").apply("banana"), "b<an><an>a");
}

TEST(SubstitutionRuleTest, RejectsWrongDelimiterCount) {
    EXPECT_THROW(SubstitutionRule::parse("s/a/b"), MalformedRuleError);
    EXPECT_THROW(SubstitutionRule::parse("s/a/b/c/"), MalformedRuleError);
    EXPECT_THROW(SubstitutionRule::parse("s/a"), MalformedRuleError);
}

TEST(SubstitutionRuleTest, RejectsUnusableDelimiters) {
    EXPECT_THROW(SubstitutionRule::parse("s a b "), MalformedRuleError);
    EXPECT_THROW(SubstitutionRule::parse("ssasbs"), MalformedRuleError);
    EXPECT_THROW(SubstitutionRule::parse("sxaxbx"), MalformedRuleError);
    EXPECT_THROW(SubstitutionRule::parse(R"(s\a\b\)"), MalformedRuleError);
}

TEST(SubstitutionRuleTest, RejectsMissingCommand) {
    EXPECT_THROW(SubstitutionRule::parse(""), MalformedRuleError);
    EXPECT_THROW(SubstitutionRule::parse("s"), MalformedRuleError);
    EXPECT_THROW(SubstitutionRule::parse("y/a/b/"), MalformedRuleError);
}

TEST(SubstitutionRuleTest, RejectsEmptyPattern) {
    EXPECT_THROW(SubstitutionRule::parse("s///"), MalformedRuleError);
}

TEST(SubstitutionRuleTest, RejectsReferenceToMissingGroup) {
    EXPECT_THROW(SubstitutionRule::parse(R"(s/(a)/\2/)"), MalformedRuleError);
    EXPECT_THROW(SubstitutionRule::parse(R"(s/a/\1/)"), MalformedRuleError);
}

TEST(SubstitutionRuleTest, InvalidPatternNamesTheFragment) {
    try {
        SubstitutionRule::parse("s/(ab/x/");
        FAIL() << "expected MalformedRuleError";
    } catch (const MalformedRuleError& e) {
        EXPECT_EQ(e.rule(), "s/(ab/x/");
        EXPECT_NE(std::string(e.what()).find("'(ab'"), std::string::npos);
    }
}

TEST(SubstitutionRuleTest, RejectsUnknownFlag) {
    EXPECT_THROW(SubstitutionRule::parse("s/a/b/q"), MalformedRuleError);
}
