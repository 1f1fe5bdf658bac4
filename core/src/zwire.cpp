/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "utils/err.hpp"

void zwire_version (int *major_, int *minor_, int *patch_)
{
    *major_ = ZWIRE_VERSION_MAJOR;
    *minor_ = ZWIRE_VERSION_MINOR;
    *patch_ = ZWIRE_VERSION_PATCH;
}

const char *zwire_strerror (int errnum_)
{
    return zwire::errno_to_string (errnum_);
}

int zwire_errno (void)
{
    return errno;
}
