#ifndef PKGCAT_PRIVATE_MAIN_H
#define PKGCAT_PRIVATE_MAIN_H

#include <pkgcat/macros.h>

PKGCAT_PUBLIC void InitLocale();
PKGCAT_PUBLIC void InitSignals();

#endif
