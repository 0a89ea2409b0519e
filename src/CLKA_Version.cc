
#include <string>
#include "CLKA_Version.h"

#ifndef CLKA_VERSION
    #define CLKA_VERSION unknown
#endif
#ifndef CLKA_xSTR
    #define CLKA_xSTR(x) CLKA_STR(x)
#endif
#ifndef CLKA_STR
    #define CLKA_STR(x) #x
#endif

extern const std::string CLKA_VERSION_STR( CLKA_xSTR(CLKA_VERSION) );

#undef CLKA_VERSION
#undef CLKA_xSTR
#undef CLKA_STR

