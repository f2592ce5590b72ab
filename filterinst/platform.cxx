//
// Kernel detection and CUPS filter directory functions for libfilterinst.
//
// Copyright © 2021 by the filterinst authors.
//
// Licensed under Apache License v2.0.  See the file "LICENSE" for more
// information.
//
// Contents:
//
//   fiKernelFromName()     - Map a kernel name to a kernel kind.
//   fiKernelString()       - Return a printable name for a kernel kind.
//   fiGetKernel()          - Query the running kernel.
//   fiFilterDirForKernel() - Return the CUPS filter directory for a kernel.
//   fiResolveFilterDir()   - Pick the filter directory and report the choice.
//

//
// Include necessary headers...
//

#include <config.h>
#include "filterinst/platform.h"
#include "filterinst/debug-internal.h"
#include <errno.h>
#include <stdio.h>
#include <string.h>
#include <sys/utsname.h>


//
// 'fiKernelFromName()' - Map a kernel name to a kernel kind.
//
// The comparison is exact, "linux" is not "Linux".
//

fi_kernel_t				// O - Kernel kind
fiKernelFromName(const char *sysname)	// I - Kernel name or NULL
{
  if (!sysname || !*sysname)
    return (FI_KERNEL_OTHER);

  if (!strcmp(sysname, "Linux"))
    return (FI_KERNEL_LINUX);
  else if (!strcmp(sysname, "Darwin"))
    return (FI_KERNEL_DARWIN);
  else
    return (FI_KERNEL_OTHER);
}


//
// 'fiKernelString()' - Return a printable name for a kernel kind.
//

const char *				// O - Name
fiKernelString(fi_kernel_t kernel)	// I - Kernel kind
{
  switch (kernel)
  {
    case FI_KERNEL_LINUX :
        return ("Linux");
    case FI_KERNEL_DARWIN :
        return ("Darwin");
    default :
        return ("unknown");
  }
}


//
// 'fiGetKernel()' - Query the running kernel.
//

fi_kernel_t				// O - Kernel kind
fiGetKernel(char         *sysname,	// O - Kernel name or NULL
	    size_t       sysnamesize,	// I - Size of sysname buffer
	    fi_logfunc_t log,		// I - Log function
	    void         *ld)		// I - Aux. data for log function
{
  struct utsname	uts;		// Kernel identification


  if (sysname && sysnamesize > 0)
    *sysname = '\0';

  if (uname(&uts))
  {
    if (log) log(ld, FI_LOGLEVEL_ERROR,
		 "Unable to get kernel name - %s", strerror(errno));
    return (FI_KERNEL_OTHER);
  }

  DEBUG_printf(("fiGetKernel: sysname=\"%s\", release=\"%s\"\n",
		uts.sysname, uts.release));

  if (log) log(ld, FI_LOGLEVEL_DEBUG,
	       "Kernel name \"%s\", release \"%s\"", uts.sysname, uts.release);

  if (sysname && sysnamesize > 0)
    snprintf(sysname, sysnamesize, "%s", uts.sysname);

  return (fiKernelFromName(uts.sysname));
}


//
// 'fiFilterDirForKernel()' - Return the CUPS filter directory for a kernel.
//

const char *				// O - Filter directory
fiFilterDirForKernel(fi_kernel_t kernel)// I - Kernel kind
{
  if (kernel == FI_KERNEL_DARWIN)
    return (FI_DARWIN_FILTER_DIR);

  return (FI_LINUX_FILTER_DIR);
}


//
// 'fiResolveFilterDir()' - Pick the filter directory and report the choice.
//

const char *				// O - Filter directory
fiResolveFilterDir(const char   *sysname,// I - Kernel name, NULL for running
		   fi_logfunc_t log,	// I - Log function
		   void         *ld)	// I - Aux. data for log function
{
  fi_kernel_t	kernel;			// Kernel kind


  if (sysname)
    kernel = fiKernelFromName(sysname);
  else
    kernel = fiGetKernel(NULL, 0, log, ld);

  switch (kernel)
  {
    case FI_KERNEL_LINUX :
        if (log) log(ld, FI_LOGLEVEL_INFO, "Detected Linux Kernel");
	break;
    case FI_KERNEL_DARWIN :
        if (log) log(ld, FI_LOGLEVEL_INFO, "Detected Darwin Kernel");
	break;
    default :
        if (log) log(ld, FI_LOGLEVEL_INFO, "Assuming Linux Kernel");
	break;
  }

  return (fiFilterDirForKernel(kernel));
}
