/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZWIRE_MACROS_HPP_INCLUDED__
#define __ZWIRE_MACROS_HPP_INCLUDED__

//  Avoid warnings about unused parameters and variables.
#define LIBZWIRE_UNUSED(object) (void) object

#if __cplusplus >= 201103L || (defined(_MSC_VER) && _MSC_VER >= 1900)
#define ZWIRE_NOEXCEPT noexcept
#else
#define ZWIRE_NOEXCEPT
#endif

#if __cplusplus >= 201103L || (defined(_MSC_VER) && _MSC_VER >= 1900)
#define ZWIRE_OVERRIDE override
#else
#define ZWIRE_OVERRIDE
#endif

#if __cplusplus >= 201103L || (defined(_MSC_VER) && _MSC_VER >= 1900)
#define ZWIRE_FINAL final
#else
#define ZWIRE_FINAL
#endif

#if __cplusplus >= 201103L || (defined(_MSC_VER) && _MSC_VER >= 1900)
#define ZWIRE_DEFAULT = default;
#else
#define ZWIRE_DEFAULT                                                          \
    {                                                                          \
    }
#endif

#if __cplusplus >= 201103L || (defined(_MSC_VER) && _MSC_VER >= 1900)
#define ZWIRE_NON_COPYABLE_NOR_MOVABLE(classname)                              \
  public:                                                                      \
    classname (const classname &) = delete;                                    \
    classname &operator= (const classname &) = delete;                         \
    classname (classname &&) = delete;                                         \
    classname &operator= (classname &&) = delete;
#else
#define ZWIRE_NON_COPYABLE_NOR_MOVABLE(classname)                              \
  private:                                                                     \
    classname (const classname &);                                             \
    classname &operator= (const classname &);
#endif

#endif
