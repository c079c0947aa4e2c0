/*
 * Copyright (c) 2006-2017, Parallels International GmbH
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
 * Process and file helpers
 */

#ifndef __UTIL_H__
#define __UTIL_H__

#include <sys/types.h>
#include <sys/stat.h>
#include <unistd.h>
#include <ctype.h>
#include <string.h>

#include <string>
#include <vector>

/* length of the text form of an uuid without the trailing zero */
#define UPL_UUID_LEN	36

#ifdef __cplusplus
extern "C" {
#endif

/*
 * run argv[0] with argv and envp, stdin from <in> and stdout to <out>
 * (-1 keeps them as is), stderr is not redirected. If <retcode> is NULL
 * a non-zero exit is an error, otherwise exit code is returned in <retcode>.
 */
int upl_execve(
		char *const argv[],
		char *const envp[],
		int in,
		int out,
		int *retcode);

/*
 * run argv[0] with argv and envp, stderr and stdout redirect to /dev/null
 * and do not print any error messages
 */
int upl_execve_quiet(
		char *const argv[],
		char *const envp[],
		int in,
		int *retcode);

/*
 * run argv[0] with argv and envp, don't wait for process termination.
 * stdin is /dev/null, stdout and stderr are inherited.
 */
int upl_execve_nowait(
		char *const argv[],
		char *const envp[],
		pid_t *child);

/* create directory with parent directories as needed */
int make_dir(const char *path, mode_t mode);

/* create unique directory <dir>/<prefix>XXXXXX, result in <path> */
int make_tmp_dir(const char *dir, const char *prefix, char *path, size_t sz);

/* check process exit status */
int check_exit_status(const char *task, int status);

void dump_args(const char *title, char * const *args);

/* send SIGTERM, wait <timeout> seconds and send SIGKILL */
void term_clean(pid_t pid, int timeout);

/* generate random uuid in lowercase text form, <buf> is UPL_UUID_LEN+1 */
void gen_uuid(char *buf);

int rmdir_recursively(const char *dirname);

/*
 * wait for <path> appearance up to <timeout> seconds.
 * Return 1 if file exists, 0 on timeout or termination.
 */
int wait_for_file(const char *path, int timeout);

/* 1 if <prog> is an executable path or can be found in PATH */
int find_executable(const char *prog);

#ifdef __cplusplus
}
#endif

int read_whole_file(const char *path, std::string &out);
int write_whole_file(const char *path, const std::string &data, mode_t mode);

std::string remove_trail_spaces(const std::string &str);

#endif
