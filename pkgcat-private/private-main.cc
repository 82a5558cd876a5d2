#include <config.h>

#include <pkgcat-private/private-main.h>

#include <clocale>
#include <locale>
#include <stdexcept>

#include <signal.h>

#include <pkgcati18n.h>


void InitLocale()							/*{{{*/
{
   try {
      std::locale::global(std::locale(""));
   } catch (std::runtime_error const &) {
      setlocale(LC_ALL, "");
   }
#ifdef PKGCAT_DOMAIN
   textdomain(PKGCAT_DOMAIN);
#endif
}
									/*}}}*/
void InitSignals()							/*{{{*/
{
   signal(SIGPIPE,SIG_IGN);
}
									/*}}}*/
