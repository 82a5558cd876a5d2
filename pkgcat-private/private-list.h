#ifndef PKGCAT_PRIVATE_LIST_H
#define PKGCAT_PRIVATE_LIST_H

#include <pkgcat/macros.h>

class CommandLine;

PKGCAT_PUBLIC bool DoList(CommandLine &CmdL);

#endif
