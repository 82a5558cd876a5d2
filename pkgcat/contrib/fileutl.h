// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   File Utilities

   FileFd is a thin wrapper around a file descriptor which reports errors
   through the global error stack and can transparently decompress gzip
   files. The rest are small helpers to deal with file names.

   ##################################################################### */
									/*}}}*/
#ifndef PKGCAT_FILEUTL_H
#define PKGCAT_FILEUTL_H

#include <pkgcat/macros.h>

#include <memory>
#include <string>
#include <vector>

class FileFdPrivate;
class PKGCAT_PUBLIC FileFd
{
   friend class FileFdPrivate;
   friend class DirectFileFdPrivate;
   friend class GzipFileFdPrivate;
   protected:
   int iFd;

   enum LocalFlags {AutoClose = (1<<0),Fail = (1<<1),HitEof = (1<<2),Compressed = (1<<3)};
   unsigned long Flags;
   std::string FileName;

   public:
   enum OpenMode {
	ReadOnly = (1 << 0),
	WriteOnly = (1 << 1),
	ReadWrite = ReadOnly | WriteOnly,

	Create = (1 << 2),
	Empty = (1 << 5),

	WriteEmpty = ReadWrite | Create | Empty,
	WriteAny = ReadWrite | Create
   };
   enum CompressMode
   {
      None = 'N',
      Extension = 'E',
      Gzip = 'G'
   };

   bool Read(void *To,unsigned long long Size,unsigned long long *Actual = nullptr);
   /** read a complete line from the file
    *
    *  Similar to std::getline() the string does \b not include
    *  the newline. Returns \b false on end of file or read errors,
    *  use Failed() to tell them apart.
    */
   bool ReadLine(std::string &To);
   bool Write(const void *From,unsigned long long Size);
   inline bool Write(std::string const &From) {return Write(From.data(), From.length());};

   bool Open(std::string const &FileName,unsigned int const Mode,CompressMode Compress,unsigned long const AccessMode = 0666);
   inline bool Open(std::string const &FileName,unsigned int const Mode, unsigned long const AccessMode = 0666) {
      return Open(FileName, Mode, Extension, AccessMode);
   };
   bool OpenDescriptor(int Fd, unsigned int const Mode, CompressMode Compress, bool AutoClose=false);
   bool Close();

   inline int Fd() {return iFd;};
   inline bool IsOpen() {return iFd >= 0;};
   inline bool Failed() {return (Flags & Fail) == Fail;};
   inline bool Eof() {return (Flags & HitEof) == HitEof;};
   inline bool IsCompressed() {return (Flags & Compressed) == Compressed;};
   inline std::string &Name() {return FileName;};

   FileFd(std::string const &FileName,unsigned int const Mode,CompressMode Compress = Extension);
   FileFd();
   virtual ~FileFd();

   FileFd(const FileFd &) = delete;
   FileFd & operator=(const FileFd &) = delete;

   private:
   std::unique_ptr<FileFdPrivate> d;
   std::string LineBuffer;

   PKGCAT_HIDDEN bool FileFdErrno(const char* Function, const char* Description,...) PKGCAT_PRINTF(3) PKGCAT_COLD;
   PKGCAT_HIDDEN bool FileFdError(const char* Description,...) PKGCAT_PRINTF(2) PKGCAT_COLD;
};

PKGCAT_PUBLIC bool FileExists(std::string const &File);
PKGCAT_PUBLIC bool RealFileExists(std::string const &File);
PKGCAT_PUBLIC bool DirectoryExists(std::string const &Path);
PKGCAT_PUBLIC std::string GetTempDir();

/** \brief regular files of \b Dir ending in .\b Ext (any file if empty)
 *
 *  Hidden files are skipped, the list is sorted if \b SortList is set.
 *  With \b AllowNoExt files without any extension are included, too.
 */
PKGCAT_PUBLIC std::vector<std::string> GetListOfFilesInDir(std::string const &Dir, std::string const &Ext,
					bool const &SortList, bool const &AllowNoExt = false);

// File string manipulators
PKGCAT_PUBLIC std::string flNotDir(std::string const &File);
PKGCAT_PUBLIC std::string flNotFile(std::string const &File);
PKGCAT_PUBLIC std::string flExtension(std::string const &File);
PKGCAT_PUBLIC std::string flCombine(std::string Dir,std::string const &File);
PKGCAT_PUBLIC std::string flNormalize(std::string file);

#endif
