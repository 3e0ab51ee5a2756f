/**
 * @file Version.cpp
 * @brief Version string compiled into the library
 */

#include "popaccess.hpp"
#include "version.h"

namespace popaccess {

const char* version_string() {
    return POPACCESS_VERSION_STRING;
}

} // namespace popaccess
