/*
 *
 * Copyright (c) 2001-2017, Parallels International GmbH
 *
 * Common programm undependent routines.
 *
 * This file is part of OpenVZ. OpenVZ is free software; you can redistribute
 * it and/or modify it under the terms of the GNU General Public License as
 * published by the Free Software Foundation; either version 2 of the License,
 * or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but
 * WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 * General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA
 * 02110-1301, USA.
 *
 * Our contact details: Parallels International GmbH, Vordergasse 59, 8200
 * Schaffhausen, Switzerland.
 *
 */

#ifndef __COMMON_H__
#define __COMMON_H__

#include <unistd.h>
#include <errno.h>
#include <assert.h>

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <stdarg.h>

#include <sys/types.h>
#include <sys/stat.h>
#include <sys/param.h>

#include <sys/syslog.h>


#ifdef __cplusplus
extern "C" {
#endif

#define UPL_CONF_FILE		"/etc/vz/v2vupload.conf"
#define UPL_HELPERS_DIR		"/usr/libexec/v2vupload"
#define UPL_TMP_DIR		"/var/tmp"

extern int debug_level;
extern int terminated;

void print_log(int level, const char* oformat, ...);
void vprint_log(int level, const char* oformat, va_list pvar);
void open_logger(const char * name);

#define logger(level, fmt, args...) do {	\
	if (debug_level >= (level))		\
		print_log(level, fmt, ##args);	\
} while (0)

#define xdelete(obj) do { delete obj; obj = NULL; } while(0)

extern int putErr(int rc, const char * fm, ...);
extern const char * getError();

#ifdef __cplusplus
}
#endif

// Errors
#define UPL_ERR_USAGE		-1
#define UPL_ERR_SYSTEM		-2
/* bad options, format or disk count mismatch */
#define UPL_ERR_CONFIG		-3
/* missing or too old nbdkit, python, sdk; unsupported allocation */
#define UPL_ERR_ENVIRONMENT	-4
/* precheck or vmcheck helper failed */
#define UPL_ERR_REMOTE		-5
/* completion marker did not appear in time */
#define UPL_ERR_TIMEOUT		-6
/* metadata or createvm helper failed */
#define UPL_ERR_FINALIZE	-7
#define UPL_ERR_BACKEND		-8
#define UPL_ERR_COPY		-9
#define UPL_ERR_NOMODULE	-10

#define UPL_ERR_TERM		-25

#define UPL_ERR_TASK_FAILED	-52
#define UPL_ERR_TASK_SIGNALED	-53
#define UPL_ERR_TASK_EXITED	-54

// Errors message

#define UPL_MSG_TERM		"Upload was terminated"

#define UPL_MSG_CREATE_DIR	"can not create dir '%s' : %m "
#define UPL_MSG_DELETE		"can not delete '%s' : %s"
#define UPL_MSG_WRITE_FILE	"can not write '%s' : %m"
#define UPL_MSG_READ_FILE	"can not read '%s' : %m"

#define UPL_MSG_OO_TWICE	"-o rhv-upload: -oo %s set more than once"
#define UPL_MSG_OO_BOOL		"-o rhv-upload: invalid boolean value '%s' for -oo %s"
#define UPL_MSG_OO_UUID		"-o rhv-upload: invalid UUID for -oo rhv-disk-uuid"
#define UPL_MSG_OO_UNKNOWN	"-o rhv-upload: unknown output option '-oo %s'"
#define UPL_MSG_CAFILE		"-o rhv-upload: -oo rhv-cafile '%s' is not a readable " \
				"PEM certificate bundle"

#define UPL_MSG_PYTHON		"the python interpreter '%s' could not be found"
#define UPL_MSG_SDK		"the Python module 'ovirtsdk4' could not be loaded, " \
				"is it installed?  See previous messages for problems."
#define UPL_MSG_NBDKIT		"nbdkit is not installed or not working.  It is " \
				"required to use '-o rhv-upload'."
#define UPL_MSG_NBDKIT_VERSION	"nbdkit is not new enough, you need to upgrade " \
				"to nbdkit >= %s"
#define UPL_MSG_NBDKIT_PLUGIN	"nbdkit %s plugin is not installed or not working.  " \
				"It is required if you want to use '-o rhv-upload'."
#define UPL_MSG_NBDKIT_SELINUX	"nbdkit was compiled without SELinux support.  " \
				"You will have to recompile nbdkit with libselinux-devel " \
				"installed, or else set SELinux to Permissive mode while " \
				"doing the conversion."
#define UPL_MSG_LIMITATION	"rhv-upload: currently you must use '%s'.  This " \
				"restriction will be loosened in a future version."

#define UPL_MSG_PRECHECK	"failed server prechecks, see earlier errors"
#define UPL_MSG_VMCHECK		"failed vmchecks, see earlier errors"
#define UPL_MSG_CREATEVM	"failed to create virtual machine, see earlier errors"

#define UPL_MSG_ARCH		"the cluster '%s' does not support the architecture %s but %s"
#define UPL_MSG_UUID_COUNT	"the number of '-oo rhv-disk-uuid' parameters passed " \
				"on the command line has to match the number of guest " \
				"disk images (for this guest: %zu)"
#define UPL_MSG_UUID_NONE	"there must be '-oo rhv-disk-uuid' parameters passed " \
				"on the command line to specify the UUIDs of guest disk " \
				"images (for this guest: %zu)"
#define UPL_MSG_UUID_MISMATCH	"disk UUIDs reported by the transfer do not match " \
				"the '-oo rhv-disk-uuid' parameters"
#define UPL_MSG_FORMAT		"rhv-upload: -of %s: Only output format 'raw' or 'qcow2' " \
				"is supported.  If the input is in a different format then " \
				"force one of these output formats by adding either " \
				"'-of raw' or '-of qcow2' on the command line."
#define UPL_MSG_TRANSFER	"transfer of disk %zu/%zu failed, see earlier error messages"

// restore state debug messages
#define UPL_MSG_RST_RM_DIR	"cleaning : 'rm' dir : %s"
#define UPL_MSG_RST_KILL	"cleaning : stop nbdkit (pid %d)"
#define UPL_MSG_RST_DELETE	"cleaning : delete %zu orphan disk(s)"

#define UPL_INFO_STAGE_CHECK_PRECONDITION	"Checking preconditions"

#endif
