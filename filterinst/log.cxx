//
// Log functions for libfilterinst.
//
// Copyright © 2021 by the filterinst authors.
//
// Licensed under Apache License v2.0.  See the file "LICENSE" for more
// information.
//

#include "filterinst/log.h"
#include <stdarg.h>
#include <stdio.h>


//
// 'fiCLILogFunc()' - Log function for the command-line installer.
//
// Informational messages go to stdout as-is, they are the installer's
// progress lines.  Problems go to stderr, prefixed with the program name.
//

void
fiCLILogFunc(void          *data,	// I - fi_cli_log_t or NULL
	     fi_loglevel_t level,	// I - Log level
	     const char    *message,	// I - Printf-style format
	     ...)			// I - Arguments
{
  fi_cli_log_t	*cli = (fi_cli_log_t *)data;
					// Settings
  const char	*progname;		// Prefix for problem messages
  fi_loglevel_t	min_level;		// Lowest level shown
  FILE		*fp;			// Output stream
  va_list	arglist;		// Argument list


  progname  = (cli && cli->progname) ? cli->progname : "filterinst";
  min_level = (cli && cli->min_level != FI_LOGLEVEL_UNSPEC) ?
              cli->min_level : FI_LOGLEVEL_INFO;

  if (level < min_level)
    return;

  switch (level)
  {
    case FI_LOGLEVEL_UNSPEC :
    case FI_LOGLEVEL_DEBUG :
        fp = stdout;
	fputs("DEBUG: ", fp);
	break;
    case FI_LOGLEVEL_INFO :
        fp = stdout;
	break;
    case FI_LOGLEVEL_WARN :
        fp = stderr;
	fprintf(fp, "%s: WARNING: ", progname);
	break;
    default :
        fp = stderr;
	fprintf(fp, "%s: ", progname);
	break;
  }

  va_start(arglist, message);
  vfprintf(fp, message, arglist);
  va_end(arglist);

  fputc('\n', fp);
  fflush(fp);
}
