#ifndef PKGCAT_PRIVATE_OUTPUT_H
#define PKGCAT_PRIVATE_OUTPUT_H

#include <pkgcat/configuration.h>
#include <pkgcat/macros.h>

#include <fstream>
#include <iostream>
#include <string>
#include <vector>

PKGCAT_PUBLIC extern std::ostream c0out;
PKGCAT_PUBLIC extern std::ostream c1out;
PKGCAT_PUBLIC extern std::ostream c2out;
PKGCAT_PUBLIC extern std::ofstream devnull;
/** columns of the terminal, 80 if it can't be determined */
PKGCAT_PUBLIC extern unsigned int ScreenWidth;

/** \brief set up the output streams, the screen width and colors
 *
 *  Whether the real stdout is a terminal is recorded in
 *  PkgCat::Output::Terminal unless that is already set.
 */
PKGCAT_PUBLIC bool InitOutput(std::basic_streambuf<char> * const out = std::cout.rdbuf());

/** \brief print \b List in as many columns as fit into \b ScreenWidth */
PKGCAT_PUBLIC void ShowWithColumns(std::ostream &out, const std::vector<std::string> &List, size_t Indent, size_t ScreenWidth);

#endif
