#include <config.h>

#include <pkgcat/catalog.h>
#include <pkgcat/error.h>

#include <set>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "file-helpers.h"

static char const * const catalogContent =
   "Package: r-stringi\n"
   "Homepage: http://www.gagolewski.com/software/stringi/\n"
   "Version: 1.1.3, 1.1.5\n"
   "Build-Depends: r\n"
   "Link-Depends: icu4c\n"
   "Run-Depends: r, r-magrittr\n"
   "Tags: r text\n"
   "Description: Character String Processing Facilities\n"
   " Allows for fast, correct, consistent, portable, as well as\n"
   " convenient character string/text processing.\n"
   " .\n"
   " In every aspect.\n"
   "\n"
   "Package: henson\n"
   "Homepage: https://github.com/henson-insitu/henson\n"
   "Version: develop\n"
   "Build-Depends: cmake, mpi\n"
   "Tags: hpc\n"
   "Description: Cooperative multitasking for in situ processing.\n"
   "\n"
   "Package: compiz\n"
   "Homepage: http://www.compiz.org/\n";

TEST(CatalogTest,ReadCatalog)
{
   auto file = createTemporaryFile("catalog", catalogContent);
   PkgCat::Catalog cat;
   ASSERT_TRUE(PkgCat::ReadCatalog(cat, file.Name()));
   EXPECT_TRUE(_error->empty());
   EXPECT_EQ(3u, cat.size());
   EXPECT_FALSE(cat.empty());

   std::set<std::string> const names = cat.AllNames();
   EXPECT_EQ((std::set<std::string>{"compiz", "henson", "r-stringi"}), names);

   PkgCat::Package const * const stringi = cat.Find("r-stringi");
   ASSERT_NE(nullptr, stringi);
   EXPECT_EQ("r-stringi", stringi->Name);
   EXPECT_EQ("http://www.gagolewski.com/software/stringi/", stringi->Homepage);
   EXPECT_EQ("Character String Processing Facilities\n"
	 "Allows for fast, correct, consistent, portable, as well as\n"
	 "convenient character string/text processing.\n"
	 "\n"
	 "In every aspect.", stringi->Description);
   EXPECT_EQ((std::vector<std::string>{"1.1.3", "1.1.5"}), stringi->Versions);
   EXPECT_EQ((std::vector<std::string>{"1.1.5", "1.1.3"}), stringi->SortedVersions());
   EXPECT_EQ((std::set<std::string>{"r"}), stringi->DependenciesOfType(PkgCat::DepType::Build));
   EXPECT_EQ((std::set<std::string>{"icu4c"}), stringi->DependenciesOfType(PkgCat::DepType::Link));
   EXPECT_EQ((std::set<std::string>{"r", "r-magrittr"}), stringi->DependenciesOfType(PkgCat::DepType::Run));
   EXPECT_TRUE(stringi->DependenciesOfType(PkgCat::DepType::Test).empty());
   EXPECT_EQ((std::set<std::string>{"r", "text"}), stringi->Tags);

   PkgCat::Package const * const compiz = cat.Find("compiz");
   ASSERT_NE(nullptr, compiz);
   EXPECT_TRUE(compiz->Versions.empty());
   EXPECT_TRUE(compiz->Description.empty());
   EXPECT_TRUE(compiz->Tags.empty());
   for (auto const type : PkgCat::AllDepTypes)
      EXPECT_TRUE(compiz->DependenciesOfType(type).empty());
}
TEST(CatalogTest,ReadCompressedCatalog)
{
   auto file = createTemporaryFile("catalog", catalogContent, ".gz");
   PkgCat::Catalog cat;
   ASSERT_TRUE(PkgCat::ReadCatalog(cat, file.Name()));
   EXPECT_EQ(3u, cat.size());
   ASSERT_NE(nullptr, cat.Find("henson"));
   EXPECT_EQ((std::vector<std::string>{"develop"}), cat.Find("henson")->Versions);
}
TEST(CatalogTest,MissingPackageField)
{
   auto file = createTemporaryFile("catalog", "Package: foo\n\nHomepage: http://example.org/\n");
   PkgCat::Catalog cat;
   EXPECT_FALSE(PkgCat::ReadCatalog(cat, file.Name()));
   std::string msg;
   EXPECT_TRUE(_error->PopMessage(msg));
   EXPECT_EQ("Catalog " + file.Name() + " stanza 2 has no Package field", msg);
   EXPECT_TRUE(_error->PopMessage(msg));
   EXPECT_EQ("Problem reading the catalog " + file.Name(), msg);
   EXPECT_TRUE(_error->empty());
}
TEST(CatalogTest,UnreadableCatalog)
{
   PkgCat::Catalog cat;
   EXPECT_FALSE(PkgCat::ReadCatalog(cat, "/does/not/exist/catalog"));
   EXPECT_TRUE(_error->PendingError());
   _error->Discard();
}
TEST(CatalogTest,DuplicatePackages)
{
   PkgCat::Catalog cat;
   PkgCat::Package first;
   first.Name = "py-dionysus";
   first.Tags = {"python", "topology"};
   cat.Insert(first);
   EXPECT_TRUE(_error->empty());

   PkgCat::Package second;
   second.Name = "py-dionysus";
   second.Homepage = "http://mrzv.org/software/dionysus2/";
   second.Tags = {"python"};
   cat.Insert(second);
   EXPECT_FALSE(_error->PendingError());
   std::string msg;
   EXPECT_FALSE(_error->PopMessage(msg));
   EXPECT_EQ("Package py-dionysus is listed more than once, using the last entry", msg);

   EXPECT_EQ(1u, cat.size());
   EXPECT_EQ("http://mrzv.org/software/dionysus2/", cat.Find("py-dionysus")->Homepage);
   EXPECT_TRUE(cat.PackagesWithTags({"topology"}).empty());
   EXPECT_EQ((std::set<std::string>{"py-dionysus"}), cat.PackagesWithTags({"python"}));
}
TEST(CatalogTest,PackagesWithTags)
{
   PkgCat::Catalog cat;
   auto const add = [&](std::string const &name, std::set<std::string> const &tags) {
      PkgCat::Package pkg;
      pkg.Name = name;
      pkg.Tags = tags;
      cat.Insert(pkg);
   };
   add("henson", {"hpc"});
   add("r-stringi", {"r", "text"});
   add("py-dionysus", {"python", "text"});
   add("compiz", {});

   EXPECT_TRUE(cat.PackagesWithTags({}).empty());
   EXPECT_TRUE(cat.PackagesWithTags({"unknown"}).empty());
   EXPECT_EQ((std::set<std::string>{"henson"}), cat.PackagesWithTags({"hpc"}));
   EXPECT_EQ((std::set<std::string>{"py-dionysus", "r-stringi"}), cat.PackagesWithTags({"text"}));
   EXPECT_EQ((std::set<std::string>{"henson", "py-dionysus", "r-stringi"}), cat.PackagesWithTags({"hpc", "text", "unknown"}));
   // tags are case-sensitive
   EXPECT_TRUE(cat.PackagesWithTags({"HPC"}).empty());
}
TEST(CatalogTest,Lookup)
{
   PkgCat::Catalog cat;
   PkgCat::Package pkg;
   pkg.Name = "R";
   cat.Insert(pkg);

   EXPECT_NE(nullptr, cat.Lookup("R"));
   EXPECT_TRUE(_error->empty());
   EXPECT_EQ(nullptr, cat.Find("r"));
   EXPECT_TRUE(_error->empty());

   EXPECT_EQ(nullptr, cat.Lookup("r"));
   std::string msg;
   EXPECT_TRUE(_error->PopMessage(msg));
   EXPECT_EQ("Unable to locate package r", msg);
}
TEST(CatalogTest,DepTypeNames)
{
   EXPECT_STREQ("build", PkgCat::DepTypeName(PkgCat::DepType::Build));
   EXPECT_STREQ("link", PkgCat::DepTypeName(PkgCat::DepType::Link));
   EXPECT_STREQ("Run", PkgCat::DepTypeTitle(PkgCat::DepType::Run));
   EXPECT_STREQ("Test", PkgCat::DepTypeTitle(PkgCat::DepType::Test));
   ASSERT_EQ(4u, PkgCat::AllDepTypes.size());
   EXPECT_EQ(PkgCat::DepType::Build, PkgCat::AllDepTypes.front());
   EXPECT_EQ(PkgCat::DepType::Test, PkgCat::AllDepTypes.back());
}
