//
// Installer option functions for libfilterinst.
//
// Copyright © 2021 by the filterinst authors.
//
// Licensed under Apache License v2.0.  See the file "LICENSE" for more
// information.
//

#include <config.h>
#include "filterinst/install.h"
#include "filterinst/platform.h"
#include "filterinst/debug-internal.h"
#include <stdio.h>
#include <string.h>
#include <strings.h>


static bool is_false(const char *value) // {{{
{
  if (!value) {
    return false;
  }
  return (strcasecmp(value,"no")==0)||
    (strcasecmp(value,"off")==0)||
    (strcasecmp(value,"false")==0);
}
// }}}

static bool is_true(const char *value) // {{{
{
  if (!value) {
    return false;
  }
  return (strcasecmp(value,"yes")==0)||
    (strcasecmp(value,"on")==0)||
    (strcasecmp(value,"true")==0);
}
// }}}

static int copy_value(char *dst,size_t dstsize,const char *name,const char *value,fi_logfunc_t log,void *ld) // {{{
{
  if (!*value) {
    if (log) log(ld,FI_LOGLEVEL_ERROR,"Empty value for option \"%s\"",name);
    return -1;
  }
  if ((size_t)snprintf(dst,dstsize,"%s",value)>=dstsize) {
    if (log) log(ld,FI_LOGLEVEL_ERROR,"Value for option \"%s\" is too long",name);
    return -1;
  }
  return 0;
}
// }}}

// Same result as dirname "$0"
static int source_dir_from_argv0(char *dst,size_t dstsize,const char *argv0,fi_logfunc_t log,void *ld) // {{{
{
  char *ptr;

  if ((size_t)snprintf(dst,dstsize,"%s",(argv0&&*argv0)?argv0:".")>=dstsize) {
    if (log) log(ld,FI_LOGLEVEL_ERROR,"Program path is too long to find the source directory, use -o source-dir=DIR");
    return -1;
  }

  // "prog/" names the same directory entry as "prog"
  ptr=dst+strlen(dst)-1;
  while ((ptr>dst)&&(*ptr=='/')) {
    *ptr--='\0';
  }

  if ((ptr=strrchr(dst,'/'))==NULL) {
    snprintf(dst,dstsize,".");
    return 0;
  }

  while ((ptr>dst)&&(ptr[-1]=='/')) {
    ptr--;
  }
  if (ptr==dst) {
    ptr++; // Keep the root directory
  }
  *ptr='\0';
  return 0;
}
// }}}


int fiInstallInit(fi_install_t *params,const char *argv0,int num_options,cups_option_t *options,fi_logfunc_t log,void *ld) // {{{
{
  const char *val,*filter_dir;

  memset(params,0,sizeof(fi_install_t));
  params->sync=1;

  if ((val=cupsGetOption("filter-name",num_options,options))==NULL) {
    val=FI_FILTER_NAME;
  }
  if (strchr(val,'/')) {
    if (log) log(ld,FI_LOGLEVEL_ERROR,"Filter name \"%s\" must not contain '/'",val);
    return -1;
  }
  if (copy_value(params->filter_name,sizeof(params->filter_name),"filter-name",val,log,ld)) {
    return -1;
  }

  if ((val=cupsGetOption("source-dir",num_options,options))!=NULL) {
    if (copy_value(params->source_dir,sizeof(params->source_dir),"source-dir",val,log,ld)) {
      return -1;
    }
  } else {
    if (source_dir_from_argv0(params->source_dir,sizeof(params->source_dir),argv0,log,ld)) {
      return -1;
    }
  }

  // the kernel is always reported, even when the directory is given
  filter_dir=fiResolveFilterDir(NULL,log,ld);
  if ((val=cupsGetOption("filter-dir",num_options,options))!=NULL) {
    if (log) log(ld,FI_LOGLEVEL_DEBUG,"Using filter directory \"%s\" instead of \"%s\"",val,filter_dir);
    filter_dir=val;
  }
  if (copy_value(params->filter_dir,sizeof(params->filter_dir),"filter-dir",filter_dir,log,ld)) {
    return -1;
  }

  if ((val=cupsGetOption("sync",num_options,options))!=NULL) {
    if (is_true(val)) {
      params->sync=1;
    } else if (is_false(val)) {
      params->sync=0;
    } else {
      if (log) log(ld,FI_LOGLEVEL_ERROR,"Bad value \"%s\" for option \"sync\"",val);
      return -1;
    }
  }

  DEBUG_printf(("fiInstallInit: filter_name=\"%s\", source_dir=\"%s\", filter_dir=\"%s\", sync=%d\n",
		params->filter_name,params->source_dir,params->filter_dir,params->sync));

  if (log) log(ld,FI_LOGLEVEL_DEBUG,"Source directory \"%s\"",params->source_dir);

  return 0;
}
// }}}
