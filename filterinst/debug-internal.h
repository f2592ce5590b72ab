//
// Internal debugging macros for libfilterinst.
//
// Copyright © 2021 by the filterinst authors.
//
// Licensed under Apache License v2.0.  See the file "LICENSE" for more
// information.
//

#ifndef _FILTERINST_DEBUG_INTERNAL_H_
#  define _FILTERINST_DEBUG_INTERNAL_H_


//
// C++ magic...
//

#  ifdef __cplusplus
extern "C" {
#  endif // __cplusplus


//
// The debug macros are used if you compile with DEBUG defined.
//
// Usage:
//
//   DEBUG_puts("string");
//   DEBUG_printf(("format string", arg, arg, ...));
//
// Note the extra parenthesis around the DEBUG_printf macro...
//

#  ifdef DEBUG
#    define DEBUG_puts(x) _fi_debug_puts(x)
#    define DEBUG_printf(x) _fi_debug_printf x
#  else
#    define DEBUG_puts(x)
#    define DEBUG_printf(x)
#  endif // DEBUG

#  ifdef DEBUG
extern void	_fi_debug_printf(const char *format, ...);
extern void	_fi_debug_puts(const char *s);
#  endif // DEBUG

#  ifdef __cplusplus
}
#  endif // __cplusplus

#endif // !_FILTERINST_DEBUG_INTERNAL_H_
