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

#include <syslog.h>

#include "common.h"

int debug_level = LOG_INFO;

static int log_opened = 0;
static char prog_name[64] = "";

/* last error message, see putErr() */
static char err_msg[BUFSIZ] = "";

void open_logger(const char * name)
{
	if (log_opened) {
		closelog();
		log_opened = 0;
	}
	if (name == NULL)
		name = prog_name;
	else
		snprintf(prog_name, sizeof(prog_name), "%s", name);
	if (*name == '\0')
		return;
	openlog(name, LOG_PID, LOG_USER);
	log_opened = 1;
}

void vprint_log(int level, const char* oformat, va_list pvar)
{
	char buf[BUFSIZ];
	int err = errno;
	va_list ap;

	/* %m in format should see errno of the caller */
	va_copy(ap, pvar);
	errno = err;
	vsnprintf(buf, sizeof(buf), oformat, ap);
	va_end(ap);

	if (log_opened)
		syslog(level, "%s", buf);

	FILE *fp = (level <= LOG_WARNING) ? stderr : stdout;
	if (level <= LOG_ERR)
		fprintf(fp, "Error: %s\n", buf);
	else if (level == LOG_WARNING)
		fprintf(fp, "Warning: %s\n", buf);
	else
		fprintf(fp, "%s\n", buf);
	fflush(fp);
	errno = err;
}

void print_log(int level, const char* oformat, ...)
{
	va_list pvar;

	va_start(pvar, oformat);
	vprint_log(level, oformat, pvar);
	va_end(pvar);
}

int putErr(int rc, const char * fm, ...)
{
	va_list pvar;
	int err = errno;
	char buf[sizeof(err_msg)];

	/* arguments may refer to err_msg itself */
	va_start(pvar, fm);
	errno = err;
	vsnprintf(buf, sizeof(buf), fm, pvar);
	va_end(pvar);
	memcpy(err_msg, buf, sizeof(err_msg));

	logger(LOG_DEBUG, "error %d : %s", rc, err_msg);
	errno = err;
	return rc;
}

const char * getError()
{
	return err_msg;
}
