#include <config.h>
#include <pkgcat/strutl.h>

#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

TEST(StrUtilTest,StringStrip)
{
   EXPECT_EQ("", PkgCat::String::Strip(""));
   EXPECT_EQ("foobar", PkgCat::String::Strip("foobar"));
   EXPECT_EQ("foo bar", PkgCat::String::Strip("foo bar"));

   EXPECT_EQ("", PkgCat::String::Strip("  "));
   EXPECT_EQ("", PkgCat::String::Strip(" \r\n   \t "));

   EXPECT_EQ("foo bar", PkgCat::String::Strip("foo bar \r\n \t "));
   EXPECT_EQ("foo bar", PkgCat::String::Strip("\r\n \t foo bar"));
   EXPECT_EQ("bar \t\r\n foo", PkgCat::String::Strip("\r\n \t bar \t\r\n foo \r\n \t "));
}
TEST(StrUtilTest,StartsWithAndJoin)
{
   EXPECT_TRUE(PkgCat::String::Startswith("PkgCat::List", "PkgCat"));
   EXPECT_TRUE(PkgCat::String::Startswith("PkgCat", ""));
   EXPECT_FALSE(PkgCat::String::Startswith("Pkg", "PkgCat"));

   EXPECT_EQ("", PkgCat::String::Join({}, ", "));
   EXPECT_EQ("rst", PkgCat::String::Join({"rst"}, ", "));
   EXPECT_EQ("name_only, rst, html", PkgCat::String::Join({"name_only", "rst", "html"}, ", "));
}
TEST(StrUtilTest,VectorizeString)
{
   EXPECT_TRUE(VectorizeString("", ',').empty());

   std::vector<std::string> vec = VectorizeString("web,cli,,text", ',');
   ASSERT_EQ(4u, vec.size());
   EXPECT_EQ("web", vec[0]);
   EXPECT_EQ("cli", vec[1]);
   EXPECT_EQ("", vec[2]);
   EXPECT_EQ("text", vec[3]);

   vec = VectorizeString(",web,", ',');
   ASSERT_EQ(2u, vec.size());
   EXPECT_EQ("", vec[0]);
   EXPECT_EQ("web", vec[1]);
}
TEST(StrUtilTest,StringToBool)
{
   EXPECT_EQ(0, StringToBool("0"));
   EXPECT_EQ(1, StringToBool("1"));
   EXPECT_EQ(1, StringToBool("yes"));
   EXPECT_EQ(1, StringToBool("Enable"));
   EXPECT_EQ(0, StringToBool("off"));
   EXPECT_EQ(0, StringToBool("FALSE"));
   EXPECT_EQ(-1, StringToBool("2"));
   EXPECT_EQ(-1, StringToBool("0ad"));
   EXPECT_EQ(42, StringToBool("", 42));
   EXPECT_EQ(42, StringToBool("maybe", 42));
}
TEST(StrUtilTest,StringCaseCompare)
{
   EXPECT_EQ(0, stringcasecmp("R", "r"));
   EXPECT_EQ(0, stringcasecmp(std::string("Py-Dionysus"), std::string("py-dionysus")));
   EXPECT_GT(0, stringcasecmp("abc", "ABD"));
   EXPECT_LT(0, stringcasecmp("abd", "ABC"));
   EXPECT_GT(0, stringcasecmp("ab", "abc"));
   EXPECT_LT(0, stringcasecmp("abc", "AB"));
   EXPECT_GT(0, stringcasecmp("", "a"));
}
TEST(StrUtilTest,SubstVar)
{
   EXPECT_EQ("https://example.org/zlib/package.py",
	 SubstVar("https://example.org/$(PACKAGE)/package.py", "$(PACKAGE)", "zlib"));
   EXPECT_EQ("zlib zlib", SubstVar("$(PACKAGE) $(PACKAGE)", "$(PACKAGE)", "zlib"));
   EXPECT_EQ("no variable", SubstVar("no variable", "$(PACKAGE)", "zlib"));
   EXPECT_EQ("$(PACKAGE)", SubstVar("$(PACKAGE)", "", "zlib"));
   EXPECT_EQ("", SubstVar("$(PACKAGE)", "$(PACKAGE)", ""));
}
TEST(StrUtilTest,HtmlEscape)
{
   EXPECT_EQ("", HtmlEscape(""));
   EXPECT_EQ("plain text", HtmlEscape("plain text"));
   EXPECT_EQ("&lt;b&gt;bold&lt;/b&gt; &amp; \"quoted\"", HtmlEscape("<b>bold</b> & \"quoted\""));
   EXPECT_EQ("&lt;b&gt;bold&lt;/b&gt; &amp; &quot;quoted&quot;", HtmlEscape("<b>bold</b> & \"quoted\"", true));
   EXPECT_EQ("&amp;amp;", HtmlEscape("&amp;"));
}
TEST(StrUtilTest,QuoteURI)
{
   EXPECT_EQ("http://www.gagolewski.com/software/stringi/", QuoteURI("http://www.gagolewski.com/software/stringi/"));
   EXPECT_EQ("http://example.org/a%20b", QuoteURI("http://example.org/a b"));
   EXPECT_EQ("%22%3Cscript%3E%22", QuoteURI("\"<script>\""));
   EXPECT_EQ("http://example.org/%7Euser?q=1&r=2#top", QuoteURI("http://example.org/%7Euser?q=1&r=2#top"));
   EXPECT_EQ("r-stringi", QuoteURI("r-stringi"));
}
TEST(StrUtilTest,WrapText)
{
   EXPECT_EQ("", WrapText("", 72, 2));
   EXPECT_EQ("", WrapText(" \n\t ", 72, 2));
   EXPECT_EQ("  short text\n", WrapText("short text", 72, 2));
   EXPECT_EQ("  collapsed white space\n", WrapText("  collapsed \n\t white\n\nspace ", 72, 2));
   EXPECT_EQ("aaa bbb\nccc\n", WrapText("aaa bbb ccc", 7, 0));
   EXPECT_EQ("    aaa bbb\n    ccc\n", WrapText("aaa bbb ccc", 7, 4));
   EXPECT_EQ("abcd\nefgh\nij\n", WrapText("abcdefghij", 4, 0));
   // too long words start on the current line
   EXPECT_EQ("a ab\ncdef\ngh b\n", WrapText("a abcdefgh b", 4, 0));
   EXPECT_EQ("  A short de\n  scription.\n", WrapText("A short description.", 10, 2));
   EXPECT_EQ("A short description.\n", WrapText("A short  description.", 0, 0));
}
TEST(StrUtilTest,WrapTextHyphens)
{
   EXPECT_EQ("a well-\nknown\nlong-lived\npackage\n", WrapText("a well-known long-lived package", 10, 0));
   EXPECT_EQ("x-ray-\nmachines\n", WrapText("x-ray-machines", 8, 0));
   // no break between a letter and a digit, but inside a too long word
   EXPECT_EQ("ab-\n12345\n67\n", WrapText("ab-1234567", 5, 0));
   EXPECT_EQ("  py-dionysus\n", WrapText("py-dionysus", 72, 2));
}
TEST(StrUtilTest,ioprintf)
{
   std::ostringstream out;
   ioprintf(out, "%zu packages.\n", static_cast<size_t>(4));
   EXPECT_EQ("4 packages.\n", out.str());
   out.str("");
   std::string const longer(1000, 'x');
   ioprintf(out, "<%s>", longer.c_str());
   EXPECT_EQ("<" + longer + ">", out.str());
}
