/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZWIRE_PRECOMPILED_HPP_INCLUDED__
#define __ZWIRE_PRECOMPILED_HPP_INCLUDED__

//  Headers pulled in by nearly every translation unit of the library.

#include <errno.h>
#include <stddef.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <string>
#include <vector>

#include "zwire.h"

#endif
