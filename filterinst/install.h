//
// Filter installation header file for libfilterinst.
//
// Copyright © 2021 by the filterinst authors.
//
// Licensed under Apache License v2.0.  See the file "LICENSE" for more
// information.
//

#ifndef _FILTERINST_INSTALL_H_
#  define _FILTERINST_INSTALL_H_

#  ifdef __cplusplus
extern "C" {
#  endif // __cplusplus


//
// Include necessary headers...
//

#  include "log.h"

#  include <cups/cups.h>


//
// Types and structures...
//

typedef struct fi_install_s          // What to install where
{
  char filter_name[256];             // File name of the filter binary
  char source_dir[1024];             // Directory holding the prebuilt filter
  char filter_dir[1024];             // CUPS filter directory to install into
  int  sync;                         // 1 to flush filesystem buffers after
                                     // installing, 0 otherwise
} fi_install_t;


//
// Prototypes...
//

extern int fiInstallInit(fi_install_t *params,
			 const char *argv0,
			 int num_options,
			 cups_option_t *options,
			 fi_logfunc_t log,
			 void *ld);

// Options: filter-name, source-dir, filter-dir, sync


extern int fiCopyFile(const char *src, const char *dst,
		      fi_logfunc_t log, void *ld);


extern int fiMakeExecutable(const char *path, fi_logfunc_t log, void *ld);


extern void fiSyncFilesystems(fi_logfunc_t log, void *ld);


extern int fiInstallFilter(const fi_install_t *params,
			   fi_logfunc_t log, void *ld);

#  ifdef __cplusplus
}
#  endif // __cplusplus

#endif // !_FILTERINST_INSTALL_H_
