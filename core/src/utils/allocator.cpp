/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "utils/allocator.hpp"
#include "utils/macros.hpp"

#include <cstddef>
#include <memory_resource>
#include <new>

#include <mimalloc.h>

namespace zwire
{
namespace
{
class mimalloc_resource_t ZWIRE_FINAL : public std::pmr::memory_resource
{
  private:
    void *do_allocate (std::size_t bytes_, std::size_t alignment_) ZWIRE_FINAL
    {
        void *ptr = mi_malloc_aligned (bytes_, alignment_);
        if (!ptr)
            throw std::bad_alloc ();
        return ptr;
    }

    void do_deallocate (void *ptr_,
                        std::size_t bytes_,
                        std::size_t alignment_) ZWIRE_FINAL
    {
        LIBZWIRE_UNUSED (bytes_);
        LIBZWIRE_UNUSED (alignment_);
        mi_free (ptr_);
    }

    bool do_is_equal (const std::pmr::memory_resource &other_) const
      ZWIRE_NOEXCEPT ZWIRE_FINAL
    {
        return this == &other_;
    }
};
}

std::pmr::memory_resource *get_memory_resource ()
{
    static mimalloc_resource_t mi_resource;
    return &mi_resource;
}
}
