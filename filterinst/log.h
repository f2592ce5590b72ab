//
// Log functions header file for libfilterinst.
//
// Copyright © 2021 by the filterinst authors.
//
// Licensed under Apache License v2.0.  See the file "LICENSE" for more
// information.
//

#ifndef _FILTERINST_LOG_H_
#  define _FILTERINST_LOG_H_

#  ifdef __cplusplus
extern "C" {
#  endif // __cplusplus


//
// Types...
//

typedef enum fi_loglevel_e           // Log levels, same as libcupsfilters
{
  FI_LOGLEVEL_UNSPEC = -1,           // Not specified
  FI_LOGLEVEL_DEBUG,                 // Debug message
  FI_LOGLEVEL_INFO,                  // Informational message
  FI_LOGLEVEL_WARN,                  // Warning message
  FI_LOGLEVEL_ERROR,                 // Error message
  FI_LOGLEVEL_FATAL                  // Fatal message
} fi_loglevel_t;

typedef void (*fi_logfunc_t)(void *data, fi_loglevel_t level,
			     const char *message, ...);

typedef struct fi_cli_log_s          // Data for fiCLILogFunc()
{
  const char    *progname;           // Program name for message prefixes
  fi_loglevel_t min_level;           // Messages below this are dropped
} fi_cli_log_t;


//
// Prototypes...
//

extern void fiCLILogFunc(void *data,
			 fi_loglevel_t level,
			 const char *message,
			 ...);

#  ifdef __cplusplus
}
#  endif // __cplusplus

#endif // !_FILTERINST_LOG_H_
