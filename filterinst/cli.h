//
// Command-line front end header file for libfilterinst.
//
// Copyright © 2021 by the filterinst authors.
//
// Licensed under Apache License v2.0.  See the file "LICENSE" for more
// information.
//

#ifndef _FILTERINST_CLI_H_
#  define _FILTERINST_CLI_H_

#  ifdef __cplusplus
extern "C" {
#  endif // __cplusplus


//
// Include necessary headers...
//

#  include "log.h"

#  include <cups/cups.h>


//
// Types...
//

typedef enum fi_cli_status_e         // Result of fiParseCommandLine()
{
  FI_CLI_RUN,                        // Arguments OK, go on installing
  FI_CLI_HELP,                       // Usage was shown on stdout, exit 0
  FI_CLI_ERROR                       // Bad arguments, usage was shown on
                                     // stderr, exit 1
} fi_cli_status_t;


//
// Prototypes...
//

// *options must be freed with cupsFreeOptions() whatever the result.
extern fi_cli_status_t fiParseCommandLine(int argc, char *argv[],
					  int *num_options,
					  cups_option_t **options,
					  fi_cli_log_t *logdata);


extern int fiInstallerMain(int argc, char *argv[]);

#  ifdef __cplusplus
}
#  endif // __cplusplus

#endif // !_FILTERINST_CLI_H_
