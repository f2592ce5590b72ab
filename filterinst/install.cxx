//
// Filter installation functions for libfilterinst.
//
// Copyright © 2021 by the filterinst authors.
//
// Licensed under Apache License v2.0.  See the file "LICENSE" for more
// information.
//
// Contents:
//
//   fiCopyFile()        - Copy a file like cp(1) does.
//   fiMakeExecutable()  - Add execute permission for everyone.
//   fiSyncFilesystems() - Flush buffered filesystem writes.
//   fiInstallFilter()   - Copy a filter into the filter directory.
//

//
// Include necessary headers...
//

#include <config.h>
#include "filterinst/install.h"
#include "filterinst/debug-internal.h"
#include <errno.h>
#include <fcntl.h>
#include <stdio.h>
#include <string.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/types.h>


//
// Local functions...
//

static int	write_all(int fd, const char *buffer, size_t bytes);


//
// 'fiCopyFile()' - Copy a file like cp(1) does.
//
// An existing destination is truncated and keeps its permissions, a new
// one gets the permissions of the source minus the umask.
//

int					// O - 0 on success, -1 on error
fiCopyFile(const char   *src,		// I - Source file
	   const char   *dst,		// I - Destination file
	   fi_logfunc_t log,		// I - Log function
	   void         *ld)		// I - Aux. data for log function
{
  int		infd,			// Source file descriptor
		outfd;			// Destination file descriptor
  struct stat	srcinfo,		// Source file information
		dstinfo;		// Destination file information
  char		buffer[65536];		// Copy buffer
  ssize_t	bytes;			// Bytes read
  off_t		total = 0;		// Bytes copied
  int		status = 0;		// Return value


  if ((infd = open(src, O_RDONLY)) < 0)
  {
    if (log) log(ld, FI_LOGLEVEL_ERROR,
		 "Unable to open \"%s\" - %s", src, strerror(errno));
    return (-1);
  }

  if (fstat(infd, &srcinfo))
  {
    if (log) log(ld, FI_LOGLEVEL_ERROR,
		 "Unable to stat \"%s\" - %s", src, strerror(errno));
    close(infd);
    return (-1);
  }

  if (S_ISDIR(srcinfo.st_mode))
  {
    if (log) log(ld, FI_LOGLEVEL_ERROR,
		 "\"%s\" is a directory, not copying it", src);
    close(infd);
    return (-1);
  }

  if (!stat(dst, &dstinfo) &&
      dstinfo.st_dev == srcinfo.st_dev && dstinfo.st_ino == srcinfo.st_ino)
  {
    if (log) log(ld, FI_LOGLEVEL_ERROR,
		 "\"%s\" and \"%s\" are the same file", src, dst);
    close(infd);
    return (-1);
  }

  if ((outfd = open(dst, O_WRONLY | O_CREAT | O_TRUNC,
		    srcinfo.st_mode & 0777)) < 0)
  {
    if (log) log(ld, FI_LOGLEVEL_ERROR,
		 "Unable to create \"%s\" - %s", dst, strerror(errno));
    close(infd);
    return (-1);
  }

  DEBUG_printf(("fiCopyFile: Copying \"%s\" (%ld bytes) to \"%s\"\n", src,
		(long)srcinfo.st_size, dst));

  while ((bytes = read(infd, buffer, sizeof(buffer))) != 0)
  {
    if (bytes < 0)
    {
      if (errno == EINTR)
        continue;

      if (log) log(ld, FI_LOGLEVEL_ERROR,
		   "Unable to read \"%s\" - %s", src, strerror(errno));
      status = -1;
      break;
    }

    if (write_all(outfd, buffer, (size_t)bytes))
    {
      if (log) log(ld, FI_LOGLEVEL_ERROR,
		   "Unable to write \"%s\" - %s", dst, strerror(errno));
      status = -1;
      break;
    }

    total += bytes;
  }

  close(infd);

  if (close(outfd) && !status)
  {
    if (log) log(ld, FI_LOGLEVEL_ERROR,
		 "Unable to write \"%s\" - %s", dst, strerror(errno));
    status = -1;
  }

  if (!status && log)
    log(ld, FI_LOGLEVEL_DEBUG,
	"Copied %ld bytes from \"%s\" to \"%s\"", (long)total, src, dst);

  return (status);
}


//
// 'fiMakeExecutable()' - Add execute permission for everyone.
//

int					// O - 0 on success, -1 on error
fiMakeExecutable(const char   *path,	// I - File to change
		 fi_logfunc_t log,	// I - Log function
		 void         *ld)	// I - Aux. data for log function
{
  struct stat	fileinfo;		// File information
  mode_t	mode;			// New permissions


  if (stat(path, &fileinfo))
  {
    if (log) log(ld, FI_LOGLEVEL_ERROR,
		 "Unable to stat \"%s\" - %s", path, strerror(errno));
    return (-1);
  }

  mode = (fileinfo.st_mode & 07777) | S_IXUSR | S_IXGRP | S_IXOTH;

  if (chmod(path, mode))
  {
    if (log) log(ld, FI_LOGLEVEL_ERROR,
		 "Unable to change permissions of \"%s\" - %s", path,
		 strerror(errno));
    return (-1);
  }

  if (log) log(ld, FI_LOGLEVEL_DEBUG,
	       "Permissions of \"%s\" set to %04o", path, (unsigned)mode);

  return (0);
}


//
// 'fiSyncFilesystems()' - Flush buffered filesystem writes.
//

void
fiSyncFilesystems(fi_logfunc_t log,	// I - Log function
		  void         *ld)	// I - Aux. data for log function
{
  if (log) log(ld, FI_LOGLEVEL_DEBUG, "Flushing filesystem buffers");

  sync();
}


//
// 'fiInstallFilter()' - Copy a filter into the filter directory.
//
// All steps are attempted even when an earlier one fails, there is no
// rollback.
//

int					// O - 0 on success, 1 on error
fiInstallFilter(const fi_install_t *params,
					// I - What to install where
		fi_logfunc_t       log,	// I - Log function
		void               *ld)	// I - Aux. data for log function
{
  char	srcpath[2048],			// Prebuilt filter
	dstpath[2048];			// Installed filter
  int	status = 0;			// Exit status


  DEBUG_puts("fiInstallFilter: Starting");

  if (!params || !params->filter_name[0])
  {
    if (log) log(ld, FI_LOGLEVEL_ERROR, "No filter to install");
    return (1);
  }

  if ((size_t)snprintf(srcpath, sizeof(srcpath), "%s/%s", params->source_dir,
		       params->filter_name) >= sizeof(srcpath) ||
      (size_t)snprintf(dstpath, sizeof(dstpath), "%s/%s", params->filter_dir,
		       params->filter_name) >= sizeof(dstpath))
  {
    if (log) log(ld, FI_LOGLEVEL_ERROR, "Path of \"%s\" is too long",
		 params->filter_name);
    return (1);
  }

  if (log) log(ld, FI_LOGLEVEL_INFO, "installing %s to directory %s",
	       params->filter_name, params->filter_dir);

  if (fiCopyFile(srcpath, dstpath, log, ld))
    status = 1;

  if (fiMakeExecutable(dstpath, log, ld))
    status = 1;

  if (params->sync)
    fiSyncFilesystems(log, ld);

  DEBUG_printf(("fiInstallFilter: Returning %d\n", status));

  return (status);
}


//
// 'write_all()' - Write a buffer, retrying short and interrupted writes.
//

static int				// O - 0 on success, -1 on error
write_all(int        fd,		// I - File descriptor
	  const char *buffer,		// I - Data
	  size_t     bytes)		// I - Number of bytes
{
  ssize_t	written;		// Bytes written this time


  while (bytes > 0)
  {
    if ((written = write(fd, buffer, bytes)) < 0)
    {
      if (errno == EINTR)
        continue;

      return (-1);
    }

    buffer += written;
    bytes  -= (size_t)written;
  }

  return (0);
}
