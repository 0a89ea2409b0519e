//CLKA_Version.h.

#pragma once

#include <string>

extern const std::string CLKA_VERSION_STR;

