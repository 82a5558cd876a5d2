#include <pkgcat/fileutl.h>

#include <cstdlib>
#include <cstring>
#include <string>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <gtest/gtest.h>

#include "file-helpers.h"

void helperCreateTemporaryDirectory(std::string const &id, std::string &dir)
{
   std::string const strtempdir = GetTempDir().append("/pkgcat-tests-").append(id).append(".XXXXXX");
   char * tempdir = strdup(strtempdir.c_str());
   ASSERT_STREQ(tempdir, mkdtemp(tempdir));
   dir = tempdir;
   free(tempdir);
}
void helperRemoveDirectory(std::string const &dir)
{
   // basic sanity check to avoid removing random directories based on earlier failures
   if (dir.find("/pkgcat-tests-") == std::string::npos || dir.find_first_of("*?") != std::string::npos)
      FAIL() << "Directory '" << dir << "' seems invalid. It is therefore not removed!";
   else
      ASSERT_EQ(0, system(std::string("rm -rf ").append(dir).c_str()));
}
void helperCreateFile(std::string const &dir, std::string const &name, char const * const content)
{
   std::string const file = flCombine(dir, name);
   FileFd fd;
   ASSERT_TRUE(fd.Open(file, FileFd::WriteEmpty, FileFd::Extension, 0600));
   if (content != nullptr)
      EXPECT_TRUE(fd.Write(content, strlen(content)));
   EXPECT_TRUE(fd.Close());
}

ScopedFileDeleter::ScopedFileDeleter(std::string const &filename) : _filename{filename} {}
ScopedFileDeleter::ScopedFileDeleter(ScopedFileDeleter &&sfd) = default;
ScopedFileDeleter& ScopedFileDeleter::operator=(ScopedFileDeleter &&sfd) = default;
ScopedFileDeleter::~ScopedFileDeleter() {
   if (not _filename.empty())
      unlink(_filename.c_str());
}
ScopedFileDeleter createTemporaryFile(std::string const &id, char const * const content, std::string const &suffix)
{
   std::string const pattern = GetTempDir().append("/pkgcat-").append(id).append(".XXXXXX").append(suffix);
   char * name = strdup(pattern.c_str());
   int const fd = mkstemps(name, suffix.length());
   std::string const filename = name;
   free(name);
   EXPECT_NE(-1, fd);
   if (fd == -1)
      return ScopedFileDeleter{""};
   close(fd);

   FileFd file;
   EXPECT_TRUE(file.Open(filename, FileFd::WriteEmpty, FileFd::Extension));
   if (content != nullptr)
      EXPECT_TRUE(file.Write(content, strlen(content)));
   EXPECT_TRUE(file.Close());
   return ScopedFileDeleter{filename};
}
