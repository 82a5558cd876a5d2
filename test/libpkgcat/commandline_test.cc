#include <config.h>

#include <pkgcat/cmndline.h>
#include <pkgcat/configuration.h>
#include <pkgcat/error.h>
#include <pkgcat-private/private-cmndline.h>

#include <string>
#include <vector>

#include <gtest/gtest.h>

TEST(CommandLineTest,Parsing)
{
   CommandLine::Args Args[] = {
      { 't', 0, "Test::Worked", 0 },
      { 'T', "testing", "Test::Worked", CommandLine::HasArg },
      { 'z', "zero", "Test::Zero", 0 },
      { 'o', "option", 0, CommandLine::ArbItem },
      {0,0,0,0}
   };
   ::Configuration c;
   CommandLine CmdL(Args, &c);

   char const * argv[] = { "test", "--zero", "-t" };
   EXPECT_TRUE(CmdL.Parse(3 , argv));
   EXPECT_TRUE(c.FindB("Test::Worked", false));
   EXPECT_TRUE(c.FindB("Test::Zero", false));

   c.Clear("Test");
   c.Set("Test::Zero", true);
   char const * argv2[] = { "test", "--no-zero", "-t" };
   EXPECT_TRUE(CmdL.Parse(3 , argv2));
   EXPECT_TRUE(c.FindB("Test::Worked", false));
   EXPECT_FALSE(c.FindB("Test::Zero", true));

   c.Clear("Test");
   {
   char const * argv[] = { "test", "-T", "yes" };
   EXPECT_TRUE(CmdL.Parse(3 , argv));
   EXPECT_EQ("yes", c.Find("Test::Worked", "no"));
   EXPECT_EQ(0u, CmdL.FileSize());
   }
   c.Clear("Test");
   {
   char const * argv[] = { "test", "-T=", "yes" };
   EXPECT_TRUE(CmdL.Parse(3 , argv));
   EXPECT_TRUE(c.Exists("Test::Worked"));
   EXPECT_EQ("no", c.Find("Test::Worked", "no"));
   EXPECT_EQ(1u, CmdL.FileSize());
   }
   c.Clear("Test");
   {
   char const * argv[] = { "test", "--testing=yes" };
   EXPECT_TRUE(CmdL.Parse(2 , argv));
   EXPECT_EQ("yes", c.Find("Test::Worked", "no"));
   EXPECT_EQ(0u, CmdL.FileSize());
   }
   c.Clear("Test");
   {
   char const * argv[] = { "test", "-o", "test::worked=yes" };
   EXPECT_TRUE(CmdL.Parse(3 , argv));
   EXPECT_TRUE(c.FindB("Test::Worked", false));
   }
   c.Clear("Test");
   {
   char const * argv[] = { "test", "-o", "test::worked" };
   EXPECT_FALSE(CmdL.Parse(3 , argv));
   EXPECT_TRUE(_error->PendingError());
   _error->Discard();
   }
   {
   char const * argv[] = { "test", "--unknown" };
   EXPECT_FALSE(CmdL.Parse(2 , argv));
   std::string msg;
   EXPECT_TRUE(_error->PopMessage(msg));
   EXPECT_EQ("Command line option --unknown is not understood in combination with the other options", msg);
   }
}
TEST(CommandLineTest, BoolParsing)
{
   CommandLine::Args Args[] = {
      { 't', 0, "Test::Worked", 0 },
      {0,0,0,0}
   };
   ::Configuration c;
   CommandLine CmdL(Args, &c);

   // a word is only taken as the value of a boolean option
   // if all of it is a boolean expression
   {
   char const * argv[] = { "list", "-t", "0ad" };
   EXPECT_TRUE(CmdL.Parse(sizeof(argv)/sizeof(char*), argv));
   ASSERT_EQ(std::string(CmdL.FileList[0]), "0ad");
   EXPECT_TRUE(c.FindB("Test::Worked"));
   }
   {
   char const * argv[] = { "list", "-t", "0", "ad" };
   EXPECT_TRUE(CmdL.Parse(sizeof(argv)/sizeof(char*), argv));
   ASSERT_EQ(std::string(CmdL.FileList[0]), "ad");
   EXPECT_FALSE(c.FindB("Test::Worked", true));
   }
}
TEST(CommandLineTest, ListOption)
{
   CommandLine::Args Args[] = {
      { 't', "tags", "Test::Tags", CommandLine::List },
      {0,0,0,0}
   };
   ::Configuration c;
   CommandLine CmdL(Args, &c);

   char const * argv[] = { "list", "-t", "web, cli", "--tags=text", "--tags", ",," };
   EXPECT_TRUE(CmdL.Parse(sizeof(argv)/sizeof(char*), argv));
   std::vector<std::string> const tags = c.FindVector("Test::Tags");
   ASSERT_EQ(3u, tags.size());
   EXPECT_EQ("web", tags[0]);
   EXPECT_EQ("cli", tags[1]);
   EXPECT_EQ("text", tags[2]);
}

static bool DoVoid(CommandLine &) { return false; }

TEST(CommandLineTest,GetCommand)
{
   CommandLine::Dispatch Cmds[] = { {"help",&DoVoid}, {"list", &DoVoid}, {0,0} };
   {
   char const * argv[] = { "pkgcat", "--format", "rst", "list", "-d", "foo" };
   char const * com = CommandLine::GetCommand(Cmds, sizeof(argv)/sizeof(argv[0]), argv);
   EXPECT_STREQ("list", com);
   }
   {
   char const * argv[] = { "pkgcat", "-d", "--", "list", "foo" };
   EXPECT_STREQ("list", CommandLine::GetCommand(Cmds, sizeof(argv)/sizeof(argv[0]), argv));
   }
   {
   char const * argv[] = { "pkgcat", "lsit", "foo" };
   EXPECT_EQ(nullptr, CommandLine::GetCommand(Cmds, sizeof(argv)/sizeof(argv[0]), argv));
   }
   {
   char const * argv[] = { "pkgcat", "-c", "/dev/null", "list", "he" };
   EXPECT_STREQ("list", CommandLine::GetCommand(Cmds, sizeof(argv)/sizeof(argv[0]), argv));
   }
   {
   char const * argv[] = { "pkgcat", "-o", "Debug::Foo=1", "list", "-d", "foo" };
   EXPECT_STREQ("list", CommandLine::GetCommand(Cmds, sizeof(argv)/sizeof(argv[0]), argv));
   }
}
TEST(CommandLineTest,GeneralOptionBeforeCommand)
{
   CommandLine::Dispatch Cmds[] = { {"help",&DoVoid}, {"list", &DoVoid}, {0,0} };
   char const * argv[] = { "pkgcat", "-o", "Debug::Foo=1", "list", "--catalog", "/tmp/catalog", "-d", "foo" };
   char const * const com = CommandLine::GetCommand(Cmds, sizeof(argv)/sizeof(argv[0]), argv);
   ASSERT_STREQ("list", com);

   std::vector<CommandLine::Args> Args = getCommandArgs(com);
   ::Configuration c;
   CommandLine CmdL(Args.data(), &c);
   CmdL.RemainderAfter = getCommandRemainder(com);
   ASSERT_TRUE(CmdL.Parse(sizeof(argv)/sizeof(argv[0]), argv));
   EXPECT_TRUE(c.FindB("Debug::Foo"));
   EXPECT_EQ("/tmp/catalog", c.Find("PkgCat::List::Catalog"));
   EXPECT_TRUE(c.FindB("PkgCat::List::Search-Description"));
   ASSERT_EQ(2u, CmdL.FileSize());
   EXPECT_EQ(std::string(CmdL.FileList[0]), "list");
   EXPECT_EQ(std::string(CmdL.FileList[1]), "foo");
}
TEST(CommandLineTest,ListRemainder)
{
   {
   char const * argv[] = { "pkgcat", "list", "-d", "py-*", "--format", "rst", "-x" };
   std::vector<CommandLine::Args> Args = getCommandArgs("list");
   ::Configuration c;
   CommandLine CmdL(Args.data(), &c);
   CmdL.RemainderAfter = getCommandRemainder("list");
   ASSERT_TRUE(CmdL.Parse(sizeof(argv)/sizeof(argv[0]), argv));
   EXPECT_TRUE(c.FindB("PkgCat::List::Search-Description"));
   EXPECT_FALSE(c.Exists("PkgCat::List::Format"));
   ASSERT_EQ(5u, CmdL.FileSize());
   EXPECT_EQ(std::string(CmdL.FileList[0]), "list");
   EXPECT_EQ(std::string(CmdL.FileList[1]), "py-*");
   EXPECT_EQ(std::string(CmdL.FileList[2]), "--format");
   EXPECT_EQ(std::string(CmdL.FileList[3]), "rst");
   EXPECT_EQ(std::string(CmdL.FileList[4]), "-x");
   }
   {
   char const * argv[] = { "pkgcat", "--format", "html", "list", "-t", "web,cli", "--tags", "text", "r-*" };
   std::vector<CommandLine::Args> Args = getCommandArgs("list");
   ::Configuration c;
   CommandLine CmdL(Args.data(), &c);
   CmdL.RemainderAfter = getCommandRemainder("list");
   ASSERT_TRUE(CmdL.Parse(sizeof(argv)/sizeof(argv[0]), argv));
   EXPECT_EQ("html", c.Find("PkgCat::List::Format"));
   EXPECT_FALSE(c.FindB("PkgCat::List::Search-Description"));
   std::vector<std::string> const tags = c.FindVector("PkgCat::List::Tags");
   ASSERT_EQ(3u, tags.size());
   EXPECT_EQ("web", tags[0]);
   EXPECT_EQ("cli", tags[1]);
   EXPECT_EQ("text", tags[2]);
   ASSERT_EQ(2u, CmdL.FileSize());
   EXPECT_EQ(std::string(CmdL.FileList[1]), "r-*");
   }
   {
   char const * argv[] = { "pkgcat", "list", "--", "-d" };
   std::vector<CommandLine::Args> Args = getCommandArgs("list");
   ::Configuration c;
   CommandLine CmdL(Args.data(), &c);
   CmdL.RemainderAfter = getCommandRemainder("list");
   ASSERT_TRUE(CmdL.Parse(sizeof(argv)/sizeof(argv[0]), argv));
   EXPECT_FALSE(c.FindB("PkgCat::List::Search-Description"));
   ASSERT_EQ(2u, CmdL.FileSize());
   EXPECT_EQ(std::string(CmdL.FileList[1]), "-d");
   }
   EXPECT_EQ(0u, getCommandRemainder("help"));
}
