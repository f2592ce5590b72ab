//
// Kernel detection and CUPS filter directory header file for libfilterinst.
//
// Copyright © 2021 by the filterinst authors.
//
// Licensed under Apache License v2.0.  See the file "LICENSE" for more
// information.
//

#ifndef _FILTERINST_PLATFORM_H_
#  define _FILTERINST_PLATFORM_H_

#  ifdef __cplusplus
extern "C" {
#  endif // __cplusplus


//
// Include necessary headers...
//

#  include "log.h"

#  include <stddef.h>


//
// Types...
//

typedef enum fi_kernel_e             // Kernels we know a filter directory for
{
  FI_KERNEL_LINUX,                   // "Linux"
  FI_KERNEL_DARWIN,                  // "Darwin"
  FI_KERNEL_OTHER                    // Anything else, treated like Linux
} fi_kernel_t;


//
// Prototypes...
//

extern fi_kernel_t fiKernelFromName(const char *sysname);


extern const char *fiKernelString(fi_kernel_t kernel);


extern fi_kernel_t fiGetKernel(char *sysname, size_t sysnamesize,
			       fi_logfunc_t log, void *ld);


extern const char *fiFilterDirForKernel(fi_kernel_t kernel);


// sysname: Kernel name as printed by uname, NULL to query the running
//          kernel
extern const char *fiResolveFilterDir(const char *sysname,
				      fi_logfunc_t log, void *ld);

#  ifdef __cplusplus
}
#  endif // __cplusplus

#endif // !_FILTERINST_PLATFORM_H_
