// Include files							/*{{{*/
#include <config.h>

#include <pkgcat/configuration.h>
#include <pkgcat/error.h>
#include <pkgcat/strutl.h>

#include <pkgcat-private/private-output.h>
#include <pkgcat-private/private-table.h>

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <sys/ioctl.h>
#include <unistd.h>

#include <pkgcati18n.h>
									/*}}}*/

using namespace std;

std::ostream c0out(0);
std::ostream c1out(0);
std::ostream c2out(0);
std::ofstream devnull("/dev/null");

unsigned int ScreenWidth = 80;

// SigWinch - Window size change signal handler				/*{{{*/
static void SigWinch(int)
{
#ifdef TIOCGWINSZ
   struct winsize ws;

   if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) != -1 && ws.ws_col >= 5)
      ScreenWidth = ws.ws_col;
#endif
}
									/*}}}*/
bool InitOutput(std::basic_streambuf<char> * const out)			/*{{{*/
{
   bool const Terminal = isatty(STDOUT_FILENO) != 0;
   _config->CndSet("PkgCat::Output::Terminal", Terminal);

   c0out.rdbuf(out);
   c1out.rdbuf(out);
   c2out.rdbuf(out);
   if (_config->FindI("quiet",0) > 0)
      c0out.rdbuf(devnull.rdbuf());
   if (_config->FindI("quiet",0) > 1)
      c1out.rdbuf(devnull.rdbuf());

   // deal with window size changes
   auto cols = getenv("COLUMNS");
   if (cols != nullptr)
   {
      char * colends;
      auto const sw = strtoul(cols, &colends, 10);
      if (*colends != '\0' || sw == 0)
      {
	 _error->Warning(_("Environment variable COLUMNS was ignored as it has an invalid value: \"%s\""), cols);
	 cols = nullptr;
      }
      else
	 ScreenWidth = sw;
   }
   if (cols == nullptr)
   {
      signal(SIGWINCH,SigWinch);
      SigWinch(0);
   }

   if (isatty(STDERR_FILENO) == 0 || getenv("NO_COLOR") != nullptr || getenv("PKGCAT_NO_COLOR") != nullptr)
      _config->Set("PkgCat::Color", false);
   else
      _config->CndSet("PkgCat::Color", true);

   return true;
}
									/*}}}*/
// ShowWithColumns - print a list in columns				/*{{{*/
// ---------------------------------------------------------------------
/* The names are filled in column by column like ls does:

  bzip2              py-dionysus  r-stringi
  compiz             henson
 */
void ShowWithColumns(ostream &out, vector<string> const &List, size_t Indent, size_t ScreenWidth)
{
   size_t const Width = ScreenWidth > Indent + 1 ? ScreenWidth - Indent : 1;
   PkgCat::ShowColumns(out, List, PkgCat::LayoutColumns(List, Width), Indent);
}
									/*}}}*/
