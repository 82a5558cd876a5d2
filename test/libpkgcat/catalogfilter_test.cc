#include <config.h>

#include <pkgcat/catalog.h>
#include <pkgcat/catalogfilter.h>
#include <pkgcat/configuration.h>
#include <pkgcat/error.h>

#include <memory>
#include <set>
#include <string>
#include <vector>

#include <gtest/gtest.h>

using namespace PkgCat;
using namespace PkgCat::CatalogFilter;

static Package makePackage(std::string const &name, std::string const &description = "",
			   std::set<std::string> const &tags = {})
{
   Package pkg;
   pkg.Name = name;
   pkg.Description = description;
   pkg.Tags = tags;
   return pkg;
}
static std::vector<std::string> filter(Catalog const &cat, FilterSpec const &request)
{
   std::vector<std::string> result;
   EXPECT_TRUE(Filter(cat, request, result));
   return result;
}

TEST(PatternMatcherTest,SubstringWithoutWildcards)
{
   auto const m = PatternMatcher::Compile("ba");
   ASSERT_NE(nullptr, m);
   EXPECT_EQ("ba", m->Pattern());
   EXPECT_EQ("*ba*", m->Expanded());
   EXPECT_TRUE(m->Matches("ba"));
   EXPECT_TRUE(m->Matches("Bar"));
   EXPECT_TRUE(m->Matches("BAZ"));
   EXPECT_TRUE(m->Matches("foobar"));
   EXPECT_FALSE(m->Matches("Foo"));
   EXPECT_FALSE(m->Matches("b-a"));
   EXPECT_FALSE(m->Matches(""));

   // every candidate containing the pattern matches, whatever its case
   for (auto const &candidate : {"py-stringi", "r-stringi", "STRINGIFY", "libstringi2"})
      EXPECT_TRUE(PatternMatcher::Compile("Stringi")->Matches(candidate)) << candidate;

   EXPECT_TRUE(PatternMatcher::Compile("")->Matches(""));
   EXPECT_TRUE(PatternMatcher::Compile("")->Matches("anything"));
}
TEST(PatternMatcherTest,Wildcards)
{
   auto const star = PatternMatcher::Compile("py-*");
   ASSERT_NE(nullptr, star);
   EXPECT_EQ("py-*", star->Expanded());
   EXPECT_TRUE(star->Matches("py-dionysus"));
   EXPECT_TRUE(star->Matches("PY-numpy"));
   EXPECT_TRUE(star->Matches("py-"));
   EXPECT_FALSE(star->Matches("r-py-foo"));

   auto const question = PatternMatcher::Compile("?");
   ASSERT_NE(nullptr, question);
   EXPECT_TRUE(question->Matches("R"));
   EXPECT_FALSE(question->Matches("r-stringi"));
   EXPECT_FALSE(question->Matches(""));

   auto const bracket = PatternMatcher::Compile("[hc]*");
   ASSERT_NE(nullptr, bracket);
   EXPECT_EQ("[hc]*", bracket->Expanded());
   EXPECT_TRUE(bracket->Matches("henson"));
   EXPECT_TRUE(bracket->Matches("Compiz"));
   EXPECT_FALSE(bracket->Matches("r-stringi"));

   // bracket expressions without * or ? still match anywhere
   auto const range = PatternMatcher::Compile("[0-9]");
   ASSERT_NE(nullptr, range);
   EXPECT_EQ("*[0-9]*", range->Expanded());
   EXPECT_TRUE(range->Matches("py-dionysus2"));
   EXPECT_FALSE(range->Matches("py-dionysus"));

   auto const negated = PatternMatcher::Compile("[!p]*");
   ASSERT_NE(nullptr, negated);
   EXPECT_TRUE(negated->Matches("r-stringi"));
   EXPECT_FALSE(negated->Matches("py-dionysus"));

   auto const closing = PatternMatcher::Compile("[]x]*");
   ASSERT_NE(nullptr, closing);
   EXPECT_TRUE(closing->Matches("]abc"));
}
TEST(PatternMatcherTest,PatternErrors)
{
   EXPECT_EQ(nullptr, PatternMatcher::Compile("py-[abc"));
   std::string msg;
   EXPECT_TRUE(_error->PopMessage(msg));
   EXPECT_EQ("Unbalanced '[' in pattern 'py-[abc'", msg);

   EXPECT_EQ(nullptr, PatternMatcher::Compile("[z-a]*"));
   EXPECT_TRUE(_error->PopMessage(msg));
   EXPECT_EQ("Invalid range 'z-a' in pattern '[z-a]*'", msg);
   EXPECT_TRUE(_error->empty());

   // escaped brackets are no bracket expressions
   EXPECT_NE(nullptr, PatternMatcher::Compile("\\[abc"));
   EXPECT_NE(nullptr, PatternMatcher::Compile("[a-]*"));
   EXPECT_NE(nullptr, PatternMatcher::Compile("[-z]*"));
   EXPECT_TRUE(_error->empty());

   // a - right after the negation is a member, ranges compare bytes
   auto const negatedDash = PatternMatcher::Compile("[^-!]");
   ASSERT_NE(nullptr, negatedDash);
   EXPECT_TRUE(negatedDash->Matches("x"));
   EXPECT_FALSE(negatedDash->Matches("-"));
   EXPECT_FALSE(negatedDash->Matches("!"));
   EXPECT_NE(nullptr, PatternMatcher::Compile("[!-a]b"));
   EXPECT_NE(nullptr, PatternMatcher::Compile("[Z-a]x"));
   EXPECT_NE(nullptr, PatternMatcher::Compile("[]-a]"));
   EXPECT_TRUE(_error->empty());

   EXPECT_EQ(nullptr, PatternMatcher::Compile("h[e"));
   EXPECT_TRUE(_error->PopMessage(msg));
   EXPECT_EQ("Unbalanced '[' in pattern 'h[e'", msg);
   EXPECT_TRUE(_error->empty());
}
TEST(CatalogFilterTest,SortNames)
{
   std::vector<std::string> names = {"baz", "Bar", "R", "bar", "a", "Bar", "r-stringi", "r"};
   SortNames(names);
   std::vector<std::string> const expected = {"a", "Bar", "bar", "baz", "R", "r", "r-stringi"};
   EXPECT_EQ(expected, names);
}
TEST(CatalogFilterTest,SubstringPattern)
{
   Catalog cat;
   cat.Insert(makePackage("Foo"));
   cat.Insert(makePackage("Bar"));
   cat.Insert(makePackage("Baz"));

   FilterSpec request;
   request.Patterns = {"ba"};
   std::vector<std::string> const expected = {"Bar", "Baz"};
   EXPECT_EQ(expected, filter(cat, request));
}
TEST(CatalogFilterTest,NoPatternsSelectsEverything)
{
   Catalog cat;
   for (auto const &name : {"zlib", "Compiz", "henson", "R", "py-dionysus", "r-stringi"})
      cat.Insert(makePackage(name));

   std::vector<std::string> const expected = {"Compiz", "henson", "py-dionysus", "R", "r-stringi", "zlib"};
   EXPECT_EQ(expected, filter(cat, FilterSpec()));

   std::vector<std::string> result;
   EXPECT_TRUE(Filter(cat, {"b", "a", "B", "a"}, FilterSpec(), result));
   EXPECT_EQ((std::vector<std::string>{"a", "B", "b"}), result);
}
TEST(CatalogFilterTest,AnyPatternMatches)
{
   Catalog cat;
   for (auto const &name : {"zlib", "compiz", "henson", "py-dionysus", "r-stringi"})
      cat.Insert(makePackage(name));

   FilterSpec request;
   request.Patterns = {"py-*", "son", "ZLIB", "py"};
   std::vector<std::string> const expected = {"henson", "py-dionysus", "zlib"};
   EXPECT_EQ(expected, filter(cat, request));

   request.Patterns = {"nothing-matches"};
   EXPECT_TRUE(filter(cat, request).empty());
}
TEST(CatalogFilterTest,SearchDescription)
{
   Catalog cat;
   cat.Insert(makePackage("henson", "Cooperative multitasking\nfor in situ processing."));
   cat.Insert(makePackage("r-stringi", "Character String Processing Facilities"));
   cat.Insert(makePackage("compiz"));

   FilterSpec request;
   request.Patterns = {"processing"};
   EXPECT_TRUE(filter(cat, request).empty());

   request.SearchDescription = true;
   EXPECT_EQ((std::vector<std::string>{"henson", "r-stringi"}), filter(cat, request));

   // the description has to match as a whole for explicit wildcards
   request.Patterns = {"Character*"};
   EXPECT_EQ((std::vector<std::string>{"r-stringi"}), filter(cat, request));
   request.Patterns = {"String*"};
   EXPECT_TRUE(filter(cat, request).empty());

   // names still match with description search enabled
   request.Patterns = {"comp"};
   EXPECT_EQ((std::vector<std::string>{"compiz"}), filter(cat, request));

   // packages without a description never match by description
   request.Patterns = {"*"};
   EXPECT_EQ((std::vector<std::string>{"compiz", "henson", "r-stringi"}), filter(cat, request));
   Package const empty = makePackage("nodesc");
   auto const star = std::shared_ptr<PatternMatcher const>(PatternMatcher::Compile("*"));
   PackageDescriptionMatchesPattern description(star);
   EXPECT_FALSE(description(empty));
   PackageNameMatchesPattern name(star);
   EXPECT_TRUE(name(empty));
}
TEST(CatalogFilterTest,Tags)
{
   Catalog cat;
   cat.Insert(makePackage("X", "", {"t1"}));
   cat.Insert(makePackage("Y", "", {"t2"}));
   cat.Insert(makePackage("Z", "", {"t1", "t2"}));

   FilterSpec request;
   request.Patterns = {"X", "Y"};
   request.Tags = {"t1"};
   EXPECT_EQ((std::vector<std::string>{"X"}), filter(cat, request));

   request.Tags = {"t1", "t2"};
   EXPECT_EQ((std::vector<std::string>{"X", "Y"}), filter(cat, request));

   request.Patterns.clear();
   request.Tags = {"t2"};
   EXPECT_EQ((std::vector<std::string>{"Y", "Z"}), filter(cat, request));

   request.Tags = {"unknown"};
   EXPECT_TRUE(filter(cat, request).empty());

   // filtering the result again by the same tags changes nothing
   request.Tags = {"t1"};
   std::vector<std::string> const once = filter(cat, request);
   std::vector<std::string> twice;
   std::set<std::string> const onceSet(once.begin(), once.end());
   EXPECT_TRUE(Filter(cat, onceSet, request, twice));
   EXPECT_EQ(once, twice);
}
TEST(CatalogFilterTest,NamesMissingFromCatalog)
{
   Catalog cat;
   cat.Insert(makePackage("henson", "described"));

   FilterSpec request;
   request.Patterns = {"e"};
   request.SearchDescription = true;
   std::vector<std::string> result;
   EXPECT_TRUE(Filter(cat, {"henson", "extra", "other"}, request, result));
   EXPECT_EQ((std::vector<std::string>{"extra", "henson", "other"}), result);
   EXPECT_TRUE(_error->empty());
}
TEST(CatalogFilterTest,InvalidPattern)
{
   Catalog cat;
   cat.Insert(makePackage("henson"));

   FilterSpec request;
   request.Patterns = {"hen", "[abc"};
   std::vector<std::string> result = {"stale"};
   EXPECT_FALSE(Filter(cat, request, result));
   EXPECT_TRUE(result.empty());
   EXPECT_TRUE(_error->PendingError());
   EXPECT_EQ(nullptr, BuildMatcher(request));
   _error->Discard();

   request.Patterns = {"hen", "[a-c]"};
   auto const matcher = BuildMatcher(request);
   ASSERT_NE(nullptr, matcher);
   EXPECT_FALSE(matcher->empty());
   EXPECT_TRUE(BuildMatcher(FilterSpec())->empty());
}
TEST(CatalogFilterTest,DebugOutput)
{
   Catalog cat;
   cat.Insert(makePackage("X", "", {"t1"}));
   _config->Set("Debug::CatalogFilter", true);
   FilterSpec request;
   request.Tags = {"t1"};
   testing::internal::CaptureStderr();
   EXPECT_EQ((std::vector<std::string>{"X"}), filter(cat, request));
   std::string const output = testing::internal::GetCapturedStderr();
   _config->Clear("Debug::CatalogFilter");
   EXPECT_EQ("CatalogFilter: 1 of 1 packages match 0 patterns\n"
	 "CatalogFilter: 1 packages left after filtering for t1\n", output);
}
