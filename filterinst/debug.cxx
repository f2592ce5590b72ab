//
// Debugging functions for libfilterinst.
//
// Copyright © 2021 by the filterinst authors.
//
// Licensed under Apache License v2.0.  See the file "LICENSE" for more
// information.
//

#include "filterinst/debug-internal.h"

#ifdef DEBUG
#  include <stdarg.h>
#  include <stdio.h>
#  include <time.h>
#  include <sys/time.h>


//
// '_fi_debug_printf()' - Write a formatted line to stderr with a timestamp.
//

void
_fi_debug_printf(const char *format,	// I - Printf-style format string
		 ...)			// I - Additional arguments as needed
{
  va_list		ap;		// Pointer to arguments
  struct timeval	curtime;	// Current time


  gettimeofday(&curtime, NULL);
  fprintf(stderr, "%02d:%02d:%02d.%03d ",
	  (int)((curtime.tv_sec / 3600) % 24),
	  (int)((curtime.tv_sec / 60) % 60),
	  (int)(curtime.tv_sec % 60), (int)(curtime.tv_usec / 1000));

  va_start(ap, format);
  vfprintf(stderr, format, ap);
  va_end(ap);

  fflush(stderr);
}


//
// '_fi_debug_puts()' - Write a single line to stderr.
//

void
_fi_debug_puts(const char *s)		// I - String to output
{
  _fi_debug_printf("%s\n", s);
}
#endif // DEBUG
