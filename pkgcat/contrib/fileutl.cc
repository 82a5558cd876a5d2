// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   File Utilities

   The actual reading and writing is done by a FileFdPrivate backend,
   either directly on the descriptor or through zlib.

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <pkgcat/configuration.h>
#include <pkgcat/error.h>
#include <pkgcat/fileutl.h>
#include <pkgcat/strutl.h>

#include <algorithm>
#include <string>
#include <vector>

#include <dirent.h>
#include <errno.h>
#include <fcntl.h>
#include <stdarg.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <zlib.h>

#include <pkgcati18n.h>
									/*}}}*/

class PKGCAT_HIDDEN FileFdPrivate {					/*{{{*/
protected:
   FileFd * const filefd;
public:
   explicit FileFdPrivate(FileFd * const pfilefd) : filefd(pfilefd) {}

   virtual bool InternalOpen(int const iFd, unsigned int const Mode) = 0;
   virtual ssize_t InternalRead(void * const To, unsigned long long const Size) = 0;
   virtual bool InternalReadError() { return filefd->FileFdErrno("read",_("Read error")); }
   virtual ssize_t InternalWrite(void const * const From, unsigned long long const Size) = 0;
   virtual bool InternalWriteError() { return filefd->FileFdErrno("write",_("Write error")); }
   virtual bool InternalClose(std::string const &FileName) = 0;

   virtual ~FileFdPrivate() {}
};
									/*}}}*/
class PKGCAT_HIDDEN DirectFileFdPrivate: public FileFdPrivate		/*{{{*/
{
public:
   bool InternalOpen(int const, unsigned int const) PKGCAT_OVERRIDE
   {
      return true;
   }
   ssize_t InternalRead(void * const To, unsigned long long const Size) PKGCAT_OVERRIDE
   {
      return read(filefd->iFd, To, Size);
   }
   ssize_t InternalWrite(void const * const From, unsigned long long const Size) PKGCAT_OVERRIDE
   {
      return write(filefd->iFd, From, Size);
   }
   bool InternalClose(std::string const &) PKGCAT_OVERRIDE
   {
      return true;
   }

   explicit DirectFileFdPrivate(FileFd * const filefd) : FileFdPrivate(filefd) {}
};
									/*}}}*/
class PKGCAT_HIDDEN GzipFileFdPrivate: public FileFdPrivate		/*{{{*/
{
   gzFile gz;
public:
   bool InternalOpen(int const iFd, unsigned int const Mode) PKGCAT_OVERRIDE
   {
      if ((Mode & FileFd::WriteOnly) == FileFd::WriteOnly)
	 gz = gzdopen(iFd, "w");
      else
	 gz = gzdopen(iFd, "r");
      filefd->Flags |= FileFd::Compressed;
      return gz != nullptr;
   }
   ssize_t InternalRead(void * const To, unsigned long long const Size) PKGCAT_OVERRIDE
   {
      return gzread(gz, To, Size);
   }
   bool InternalReadError() PKGCAT_OVERRIDE
   {
      int err;
      char const * const errmsg = gzerror(gz, &err);
      if (err != Z_ERRNO)
	 return filefd->FileFdError("gzread: %s (%d: %s)", _("Read error"), err, errmsg);
      return FileFdPrivate::InternalReadError();
   }
   ssize_t InternalWrite(void const * const From, unsigned long long const Size) PKGCAT_OVERRIDE
   {
      return gzwrite(gz, From, Size);
   }
   bool InternalWriteError() PKGCAT_OVERRIDE
   {
      int err;
      char const * const errmsg = gzerror(gz, &err);
      if (err != Z_ERRNO)
	 return filefd->FileFdError("gzwrite: %s (%d: %s)", _("Write error"), err, errmsg);
      return FileFdPrivate::InternalWriteError();
   }
   bool InternalClose(std::string const &FileName) PKGCAT_OVERRIDE
   {
      if (gz == nullptr)
	 return true;
      int const e = gzclose(gz);
      gz = nullptr;
      // gzclose() on empty files always fails with "buffer error", ignore that
      if (e != Z_OK && e != Z_BUF_ERROR)
	 return _error->Errno("close",_("Problem closing the gzip file %s"), FileName.c_str());
      return true;
   }

   explicit GzipFileFdPrivate(FileFd * const filefd) : FileFdPrivate(filefd), gz(nullptr) {}
   ~GzipFileFdPrivate() { InternalClose(""); }
};
									/*}}}*/

// FileFd Constructors							/*{{{*/
FileFd::FileFd(std::string const &FileName,unsigned int const Mode,CompressMode Compress) : iFd(-1), Flags(0)
{
   Open(FileName, Mode, Compress);
}
FileFd::FileFd() : iFd(-1), Flags(AutoClose) {}
FileFd::~FileFd()
{
   Close();
}
									/*}}}*/
// FileFd::Open - Open a file						/*{{{*/
// ---------------------------------------------------------------------
/* With the Extension mode a name ending in .gz selects gzip, everything
   else is read as is. */
bool FileFd::Open(std::string const &FileName,unsigned int const Mode,CompressMode Compress, unsigned long const AccessMode)
{
   Close();
   Flags = AutoClose;
   this->FileName = FileName;

   if (Compress == Extension)
      Compress = (flExtension(FileName) == "gz") ? Gzip : None;

   int fileflags = 0;
   if ((Mode & ReadWrite) == ReadWrite)
      fileflags |= O_RDWR;
   else if ((Mode & WriteOnly) == WriteOnly)
      fileflags |= O_WRONLY;
   else
      fileflags |= O_RDONLY;
   if ((Mode & Create) == Create)
      fileflags |= O_CREAT;
   if ((Mode & Empty) == Empty)
      fileflags |= O_TRUNC;

   iFd = open(FileName.c_str(), fileflags | O_CLOEXEC, AccessMode);
   if (iFd == -1)
      return FileFdErrno("open", _("Could not open file %s"), FileName.c_str());
   return OpenDescriptor(iFd, Mode, Compress, true);
}
									/*}}}*/
// FileFd::OpenDescriptor - Open a filedescriptor			/*{{{*/
bool FileFd::OpenDescriptor(int Fd, unsigned int const Mode, CompressMode Compress, bool AutoClose)
{
   iFd = Fd;
   Flags = AutoClose ? FileFd::AutoClose : 0;
   if (Compress == Gzip)
      d.reset(new GzipFileFdPrivate(this));
   else
      d.reset(new DirectFileFdPrivate(this));
   if (d->InternalOpen(iFd, Mode) == false)
   {
      d.reset();
      if (FileName.empty() == false)
	 return FileFdError(_("Could not open file descriptor %d for %s"), Fd, FileName.c_str());
      return FileFdError(_("Could not open file descriptor %d"), Fd);
   }
   // the zlib handle owns the descriptor from now on
   if (Compress == Gzip)
      Flags &= ~FileFd::AutoClose;
   return true;
}
									/*}}}*/
// FileFd::Read - Read a bit of the file				/*{{{*/
// ---------------------------------------------------------------------
/* Reading less than Size bytes is only an error if Actual is not given,
   otherwise it marks the end of the file. */
bool FileFd::Read(void *To,unsigned long long Size,unsigned long long *Actual)
{
   if (d == nullptr || Failed())
      return false;
   if (Actual != nullptr)
      *Actual = 0;
   while (Size > 0)
   {
      errno = 0;
      ssize_t const Res = d->InternalRead(To, Size);
      if (Res < 0)
      {
	 if (errno == EINTR)
	    continue;
	 return d->InternalReadError();
      }
      if (Res == 0)
	 break;
      To = static_cast<char *>(To) + Res;
      Size -= Res;
      if (Actual != nullptr)
	 *Actual += Res;
   }

   if (Size == 0)
      return true;
   if (Actual != nullptr)
   {
      Flags |= HitEof;
      return true;
   }
   return FileFdError(_("read, still have %llu to read but none left"), Size);
}
									/*}}}*/
// FileFd::ReadLine - Read a complete line from the file		/*{{{*/
bool FileFd::ReadLine(std::string &To)
{
   To.clear();
   while (true)
   {
      auto const newline = LineBuffer.find('\n');
      if (newline != std::string::npos)
      {
	 To.assign(LineBuffer, 0, newline);
	 LineBuffer.erase(0, newline + 1);
	 return true;
      }
      if (Eof() == true)
      {
	 if (LineBuffer.empty() == true)
	    return false;
	 To.swap(LineBuffer);
	 LineBuffer.clear();
	 return true;
      }
      char Buffer[4096];
      unsigned long long Actual = 0;
      if (Read(Buffer, sizeof(Buffer), &Actual) == false)
	 return false;
      LineBuffer.append(Buffer, Actual);
   }
}
									/*}}}*/
// FileFd::Write - Write to the file					/*{{{*/
bool FileFd::Write(const void *From,unsigned long long Size)
{
   if (d == nullptr || Failed())
      return false;
   while (Size > 0)
   {
      errno = 0;
      ssize_t const Res = d->InternalWrite(From, Size);
      if (Res < 0)
      {
	 if (errno == EINTR)
	    continue;
	 return d->InternalWriteError();
      }
      if (Res == 0)
	 return FileFdError(_("write, still have %llu to write but couldn't"), Size);
      From = static_cast<char const *>(From) + Res;
      Size -= Res;
   }
   return true;
}
									/*}}}*/
// FileFd::Close - Close the file if the close flag is set		/*{{{*/
bool FileFd::Close()
{
   bool Res = true;
   if (d != nullptr)
   {
      Res &= d->InternalClose(FileName);
      d.reset();
   }
   if ((Flags & AutoClose) == AutoClose && iFd > 0 && close(iFd) != 0)
      Res &= _error->Errno("close",_("Problem closing the file %s"), FileName.c_str());
   iFd = -1;
   LineBuffer.clear();
   return Res;
}
									/*}}}*/
// FileFd::FileFdErrno - set Fail and call _error->Errno		*{{{*/
bool FileFd::FileFdErrno(const char * Function, const char * Description,...)
{
   Flags |= Fail;
   int const errsv = errno;
   va_list args;
   va_start(args,Description);
   char Msg[1024];
   vsnprintf(Msg, sizeof(Msg), Description, args);
   va_end(args);
   errno = errsv;
   return _error->Errno(Function, "%s", Msg);
}
									/*}}}*/
// FileFd::FileFdError - set Fail and call _error->Error		*{{{*/
bool FileFd::FileFdError(const char * Description,...) {
   Flags |= Fail;
   va_list args;
   va_start(args,Description);
   char Msg[1024];
   vsnprintf(Msg, sizeof(Msg), Description, args);
   va_end(args);
   return _error->Error("%s", Msg);
}
									/*}}}*/

// FileExists - Check if a file exists					/*{{{*/
bool FileExists(std::string const &File)
{
   struct stat Buf;
   return stat(File.c_str(),&Buf) == 0;
}
bool RealFileExists(std::string const &File)
{
   struct stat Buf;
   if (stat(File.c_str(),&Buf) != 0)
      return false;
   return S_ISREG(Buf.st_mode);
}
bool DirectoryExists(std::string const &Path)
{
   struct stat Buf;
   if (stat(Path.c_str(),&Buf) != 0)
      return false;
   return S_ISDIR(Buf.st_mode);
}
									/*}}}*/
std::string GetTempDir()						/*{{{*/
{
   const char *tmpdir = getenv("TMPDIR");
   struct stat st;
   if (tmpdir == nullptr || *tmpdir == '\0' || stat(tmpdir, &st) != 0 || S_ISDIR(st.st_mode) == 0)
      tmpdir = "/tmp";
   return tmpdir;
}
									/*}}}*/
// GetListOfFilesInDir - returns a vector of files in the given dir	/*{{{*/
std::vector<std::string> GetListOfFilesInDir(std::string const &Dir, std::string const &Ext,
					     bool const &SortList, bool const &AllowNoExt)
{
   bool const Debug = _config->FindB("Debug::GetListOfFilesInDir", false);
   std::vector<std::string> List;

   if (DirectoryExists(Dir) == false)
   {
      _error->Error(_("List of files can't be created as '%s' is not a directory"), Dir.c_str());
      return List;
   }

   DIR *D = opendir(Dir.c_str());
   if (D == nullptr)
   {
      _error->Errno("opendir",_("Unable to read %s"),Dir.c_str());
      return List;
   }
   DEFER([&] { closedir(D); });

   for (struct dirent *Ent = readdir(D); Ent != nullptr; Ent = readdir(D))
   {
      if (Ent->d_name[0] == '.')
	 continue;
      std::string const File = flCombine(Dir,Ent->d_name);
      if (RealFileExists(File) == false)
      {
	 if (DirectoryExists(File) == false)
	    _error->Notice(_("Ignoring '%s' in directory '%s' as it is not a regular file"), Ent->d_name, Dir.c_str());
	 continue;
      }
      if (Ext.empty() == false)
      {
	 std::string const d_ext = flExtension(Ent->d_name);
	 if (d_ext == Ent->d_name) // no extension
	 {
	    if (AllowNoExt == false)
	    {
	       if (Debug == true)
		  std::clog << "Bad file: " << Ent->d_name << " has no extension" << std::endl;
	       continue;
	    }
	 }
	 else if (d_ext != Ext)
	 {
	    if (Debug == true)
	       std::clog << "Bad file extension: " << Ent->d_name << std::endl;
	    continue;
	 }
      }
      if (Debug == true)
	 std::clog << "Accept file: " << Ent->d_name << " in " << Dir << std::endl;
      List.push_back(File);
   }

   if (SortList == true)
      std::sort(List.begin(),List.end());
   return List;
}
									/*}}}*/
// flNotDir - Strip the directory from the filename			/*{{{*/
std::string flNotDir(std::string const &File)
{
   auto const Res = File.rfind('/');
   if (Res == std::string::npos)
      return File;
   return File.substr(Res + 1);
}
									/*}}}*/
// flNotFile - Strip the file from the directory name			/*{{{*/
// ---------------------------------------------------------------------
/* Result ends in a / */
std::string flNotFile(std::string const &File)
{
   auto const Res = File.rfind('/');
   if (Res == std::string::npos)
      return "./";
   return File.substr(0, Res + 1);
}
									/*}}}*/
// flExtension - Return the extension for the file			/*{{{*/
std::string flExtension(std::string const &File)
{
   std::string const Base = flNotDir(File);
   auto const Res = Base.rfind('.');
   if (Res == std::string::npos)
      return Base;
   return Base.substr(Res + 1);
}
									/*}}}*/
// flCombine - Combine a file and a directory				/*{{{*/
// ---------------------------------------------------------------------
/* If the file is an absolute path then it is just returned, otherwise
   the directory is pre-pended to it. */
std::string flCombine(std::string Dir,std::string const &File)
{
   if (File.empty() == true)
      return std::string();
   if (File[0] == '/' || Dir.empty() == true)
      return File;
   if (File.length() >= 2 && File[0] == '.' && File[1] == '/')
      return File;
   if (Dir.back() != '/')
      Dir.push_back('/');
   return Dir + File;
}
									/*}}}*/
std::string flNormalize(std::string file)				/*{{{*/
{
   // remove // and /./ from the path
   size_t found;
   while ((found = file.find("/./")) != std::string::npos)
      file.replace(found, 3, "/");
   while ((found = file.find("//")) != std::string::npos)
      file.replace(found, 2, "/");
   return file;
}
									/*}}}*/
