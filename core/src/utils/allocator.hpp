/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZWIRE_ALLOCATOR_HPP_INCLUDED__
#define __ZWIRE_ALLOCATOR_HPP_INCLUDED__

#include <memory_resource>

namespace zwire
{
//  Process-wide memory resource backed by mimalloc. Streaming byte sources
//  draw their read buffers from it. Safe to use from any thread.
std::pmr::memory_resource *get_memory_resource ();
}

#endif
