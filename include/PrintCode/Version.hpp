// =================================================================
// include/PrintCode/Version.hpp
// =================================================================

#pragma once

#ifndef PRINTCODE_VERSION
#define PRINTCODE_VERSION "0.3.0"
#endif
