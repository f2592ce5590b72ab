//
// Installer for the cprastertocmd CUPS filter.
//
// Copyright © 2021 by the filterinst authors.
//
// Licensed under Apache License v2.0.  See the file "LICENSE" for more
// information.
//
// Usage: install-cprastertocmd [-h] [-v] [-o name=value ...]
//
// Exits with 0 when the filter was installed and 1 when an option was bad
// or the copy or chmod failed.  Every step is attempted regardless.
//

//
// Include necessary headers...
//

#include <filterinst/cli.h>


//
// 'main()' - Main entry for the filter installer.
//

int					// O - Exit status
main(int  argc,				// I - Number of command-line arguments
     char *argv[])			// I - Command-line arguments
{
  return (fiInstallerMain(argc, argv));
}
