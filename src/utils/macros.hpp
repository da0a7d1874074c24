/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __MUXFRAME_MACROS_HPP_INCLUDED__
#define __MUXFRAME_MACROS_HPP_INCLUDED__

/******************************************************************************/
/*  muxframe internal use                                                     */
/******************************************************************************/

#define LIBMUXFRAME_UNUSED(object) (void) object
#define LIBMUXFRAME_DELETE(p_object)                                           \
    {                                                                          \
        delete p_object;                                                       \
        p_object = 0;                                                          \
    }

/******************************************************************************/

#if !defined MUXFRAME_NOEXCEPT
#if defined MUXFRAME_HAVE_NOEXCEPT
#define MUXFRAME_NOEXCEPT noexcept
#else
#define MUXFRAME_NOEXCEPT
#endif
#endif

#if !defined MUXFRAME_FINAL
#if defined MUXFRAME_HAVE_NOEXCEPT
#define MUXFRAME_FINAL final
#else
#define MUXFRAME_FINAL
#endif
#endif

#if !defined MUXFRAME_NON_COPYABLE_NOR_MOVABLE
#if defined MUXFRAME_HAVE_NOEXCEPT
#define MUXFRAME_NON_COPYABLE_NOR_MOVABLE(classname)                           \
  public:                                                                      \
    classname (const classname &) = delete;                                    \
    classname &operator= (const classname &) = delete;                         \
    classname (classname &&) = delete;                                         \
    classname &operator= (classname &&) = delete;
#else
#define MUXFRAME_NON_COPYABLE_NOR_MOVABLE(classname)                           \
  private:                                                                     \
    classname (const classname &);                                             \
    classname &operator= (const classname &);
#endif
#endif

#endif
