//
// Command-line front end for libfilterinst.
//
// Copyright © 2021 by the filterinst authors.
//
// Licensed under Apache License v2.0.  See the file "LICENSE" for more
// information.
//
// Contents:
//
//   fiParseCommandLine() - Scan the installer's command-line.
//   fiInstallerMain()    - Run the installer, return its exit status.
//   usage()              - Show usage.
//

//
// Include necessary headers...
//

#include <config.h>
#include "filterinst/cli.h"
#include "filterinst/install.h"
#include <stdio.h>
#include <string.h>


//
// Local functions...
//

static void	usage(FILE *fp, const char *progname);


//
// 'fiParseCommandLine()' - Scan the installer's command-line.
//

fi_cli_status_t				// O - What to do next
fiParseCommandLine(
    int           argc,			// I - Number of command-line arguments
    char          *argv[],		// I - Command-line arguments
    int           *num_options,		// O - Number of -o options
    cups_option_t **options,		// O - -o options
    fi_cli_log_t  *logdata)		// O - Settings for fiCLILogFunc()
{
  int		i;			// Looping var
  char		*opt;			// Current option
  const char	*progname;		// Program name


  *num_options = 0;
  *options     = NULL;

  if (argc < 1 || !argv[0] || !argv[0][0])
    progname = "install-cprastertocmd";
  else if ((progname = strrchr(argv[0], '/')) != NULL)
    progname ++;
  else
    progname = argv[0];

  logdata->progname  = progname;
  logdata->min_level = FI_LOGLEVEL_INFO;

  for (i = 1; i < argc; i ++)
    if (argv[i][0] == '-' && argv[i][1])
    {
      for (opt = argv[i] + 1; *opt; opt ++)
        switch (*opt)
	{
	  case 'h' :			// Help
	      usage(stdout, progname);
	      return (FI_CLI_HELP);

	  case 'o' :			// Installer option
	      i ++;
	      if (i >= argc)
	      {
		fprintf(stderr, "%s: Expected name=value after \"-o\".\n",
			progname);
	        usage(stderr, progname);
		return (FI_CLI_ERROR);
	      }

	      *num_options = cupsParseOptions(argv[i], *num_options, options);
	      break;

	  case 'v' :			// Be verbose
	      logdata->min_level = FI_LOGLEVEL_DEBUG;
	      break;

	  default :			// Unknown
	      fprintf(stderr, "%s: Unknown option \"-%c\".\n", progname, *opt);
	      usage(stderr, progname);
	      return (FI_CLI_ERROR);
	}
    }
    else
    {
      fprintf(stderr, "%s: Unexpected argument \"%s\".\n", progname, argv[i]);
      usage(stderr, progname);
      return (FI_CLI_ERROR);
    }

  return (FI_CLI_RUN);
}


//
// 'fiInstallerMain()' - Run the installer, return its exit status.
//
// 0 when the filter was copied and made executable, 1 when the arguments
// were bad or any installation step failed.
//

int					// O - Exit status
fiInstallerMain(int  argc,		// I - Number of command-line arguments
		char *argv[])		// I - Command-line arguments
{
  int			num_options;	// Number of -o options
  cups_option_t		*options;	// -o options
  fi_cli_log_t		logdata;	// Settings for fiCLILogFunc()
  fi_install_t		params;		// What to install where
  fi_cli_status_t	cli;		// Command-line scan result
  int			status;		// Exit status


  cli = fiParseCommandLine(argc, argv, &num_options, &options, &logdata);

  if (cli != FI_CLI_RUN)
  {
    cupsFreeOptions(num_options, options);
    return (cli == FI_CLI_HELP ? 0 : 1);
  }

  status = fiInstallInit(&params, argc > 0 ? argv[0] : NULL, num_options,
			 options, fiCLILogFunc, &logdata);
  cupsFreeOptions(num_options, options);

  if (status)
    return (1);

  return (fiInstallFilter(&params, fiCLILogFunc, &logdata));
}


//
// 'usage()' - Show usage.
//

static void
usage(FILE       *fp,			// I - Where to print
      const char *progname)		// I - Program name
{
  fprintf(fp, "Usage: %s [options]\n", progname);
  fputs("Options:\n", fp);
  fputs("  -h                      Show this help.\n", fp);
  fputs("  -o filter-name=NAME     Install NAME (default " FI_FILTER_NAME
	").\n", fp);
  fputs("  -o source-dir=DIR       Take the filter from DIR (default: the "
	"directory of this program).\n", fp);
  fputs("  -o filter-dir=DIR       Install into DIR instead of the CUPS "
	"filter directory.\n", fp);
  fputs("  -o sync=no              Do not flush filesystem buffers.\n", fp);
  fputs("  -v                      Be verbose.\n", fp);
  fputs("Exit status is 0 when the filter was installed, 1 when an option "
	"was bad or\nany step (copy, chmod) failed.\n", fp);
}
