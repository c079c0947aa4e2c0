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
 */
#include <sys/wait.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <signal.h>
#include <dirent.h>
#include <limits.h>
#include <uuid/uuid.h>

#include <fstream>
#include <sstream>

#include "common.h"
#include "util.h"

static int redirect_fd(int fd, int target)
{
	if (fd == target)
		return 0;
	if (dup2(fd, target) == -1)
		return -1;
	return 0;
}

static int open_devnull(int flags)
{
	return open("/dev/null", flags);
}

static int wait_child(pid_t chpid, int *status)
{
	pid_t pid;

	while ((pid = waitpid(chpid, status, 0)) == -1)
		if (errno != EINTR)
			break;
	if (pid < 0)
		return putErr(UPL_ERR_SYSTEM, "waitpid() : %m");
	return 0;
}

static int do_execve(
		char *const argv[],
		char *const envp[],
		int in,
		int out,
		int quiet,
		int *retcode)
{
	int rc;
	int status;
	pid_t chpid;

	if (debug_level >= LOG_DEBUG)
		dump_args("", argv);

	if ((chpid = fork()) < 0) {
		return putErr(UPL_ERR_SYSTEM, "fork() : %m");
	} else if (chpid == 0) {
		int fd;

		signal(SIGINT, SIG_DFL);
		signal(SIGTERM, SIG_DFL);
		signal(SIGPIPE, SIG_DFL);
		if (in == -1) {
			if ((fd = open_devnull(O_RDONLY)) != -1) {
				redirect_fd(fd, STDIN_FILENO);
				close(fd);
			}
		} else {
			redirect_fd(in, STDIN_FILENO);
		}
		if (quiet) {
			if ((fd = open_devnull(O_WRONLY)) != -1) {
				redirect_fd(fd, STDOUT_FILENO);
				redirect_fd(fd, STDERR_FILENO);
				close(fd);
			}
		} else if (out != -1) {
			redirect_fd(out, STDOUT_FILENO);
		}
		if (envp)
			execve(argv[0], argv, envp);
		else
			execvp(argv[0], argv);
		if (!quiet)
			fprintf(stderr, "can not exec '%s' : %s\n",
				argv[0], strerror(errno));
		_exit(127);
	}

	if ((rc = wait_child(chpid, &status)))
		return rc;

	if (retcode) {
		if (WIFEXITED(status)) {
			*retcode = WEXITSTATUS(status);
			return 0;
		}
		return check_exit_status(argv[0], status);
	}
	if (quiet) {
		if (WIFEXITED(status) && WEXITSTATUS(status) == 0)
			return 0;
		return UPL_ERR_TASK_FAILED;
	}
	return check_exit_status(argv[0], status);
}

int upl_execve(
		char *const argv[],
		char *const envp[],
		int in,
		int out,
		int *retcode)
{
	return do_execve(argv, envp, in, out, 0, retcode);
}

int upl_execve_quiet(
		char *const argv[],
		char *const envp[],
		int in,
		int *retcode)
{
	return do_execve(argv, envp, in, -1, 1, retcode);
}

int upl_execve_nowait(
		char *const argv[],
		char *const envp[],
		pid_t *child)
{
	pid_t chpid;

	if (debug_level >= LOG_DEBUG)
		dump_args("", argv);

	if ((chpid = fork()) < 0) {
		return putErr(UPL_ERR_SYSTEM, "fork() : %m");
	} else if (chpid == 0) {
		int fd;

		signal(SIGINT, SIG_DFL);
		signal(SIGTERM, SIG_DFL);
		signal(SIGPIPE, SIG_DFL);
		if ((fd = open_devnull(O_RDONLY)) != -1) {
			redirect_fd(fd, STDIN_FILENO);
			close(fd);
		}
		if (envp)
			execve(argv[0], argv, envp);
		else
			execvp(argv[0], argv);
		fprintf(stderr, "can not exec '%s' : %s\n",
			argv[0], strerror(errno));
		_exit(127);
	}
	*child = chpid;
	return 0;
}

int check_exit_status(const char *task, int status)
{
	int rc;

	if (WIFEXITED(status)) {
		if ((rc = WEXITSTATUS(status)))
			return putErr(UPL_ERR_TASK_FAILED,
				"%s exited with code %d", task, rc);
	} else if (WIFSIGNALED(status)) {
		return putErr(UPL_ERR_TASK_SIGNALED,
			"%s got signal %d", task, WTERMSIG(status));
	} else {
		return putErr(UPL_ERR_TASK_EXITED,
			"%s exited with status %d", task, status);
	}
	return 0;
}

void dump_args(const char *title, char * const *args)
{
	std::ostringstream s;

	for (int i = 0; args[i]; i++)
		s << " " << args[i];
	logger(LOG_DEBUG, "%srun:%s", title, s.str().c_str());
}

int make_dir(const char *path, mode_t mode)
{
	char buf[PATH_MAX + 1];
	char *p;

	if (strlen(path) >= sizeof(buf))
		return putErr(UPL_ERR_SYSTEM, "make_dir: string overflow");
	strcpy(buf, path);

	for (p = buf + 1; *p; p++) {
		if (*p != '/')
			continue;
		*p = '\0';
		if (mkdir(buf, mode) && errno != EEXIST)
			return putErr(UPL_ERR_SYSTEM, UPL_MSG_CREATE_DIR, buf);
		*p = '/';
	}
	if (mkdir(buf, mode) && errno != EEXIST)
		return putErr(UPL_ERR_SYSTEM, UPL_MSG_CREATE_DIR, buf);
	return 0;
}

int make_tmp_dir(const char *dir, const char *prefix, char *path, size_t sz)
{
	int rc;

	if ((rc = make_dir(dir, 0755)))
		return rc;
	if ((size_t)snprintf(path, sz, "%s/%sXXXXXX", dir, prefix) >= sz)
		return putErr(UPL_ERR_SYSTEM, "make_tmp_dir: string overflow");
	if (mkdtemp(path) == NULL)
		return putErr(UPL_ERR_SYSTEM, "mkdtemp(%s) : %m", path);
	logger(LOG_DEBUG, "temporary directory %s created", path);
	return 0;
}

void term_clean(pid_t pid, int timeout)
{
	int status;
	pid_t ret;

	if (pid <= 0)
		return;

	if (kill(pid, SIGTERM) && errno == ESRCH) {
		/* may be already exited, reap it */
		waitpid(pid, &status, WNOHANG);
		return;
	}

	for (int i = 0; i < timeout * 10; i++) {
		ret = waitpid(pid, &status, WNOHANG);
		if (ret == pid || (ret == -1 && errno == ECHILD))
			return;
		usleep(100000);
	}

	logger(LOG_DEBUG, "process %d is still alive, kill it", pid);
	kill(pid, SIGKILL);
	while (waitpid(pid, &status, 0) == -1)
		if (errno != EINTR)
			break;
}

void gen_uuid(char *buf)
{
	uuid_t u;

	uuid_generate(u);
	uuid_unparse_lower(u, buf);
}

int rmdir_recursively(const char *dirname)
{
	int rc = 0;
	DIR *dir;
	struct dirent *ep;
	struct stat st;
	char path[PATH_MAX + 1];

	if ((dir = opendir(dirname)) == NULL) {
		if (errno == ENOENT)
			return 0;
		return putErr(UPL_ERR_SYSTEM, "opendir(%s) : %m", dirname);
	}

	while ((ep = readdir(dir))) {
		if (!strcmp(ep->d_name, ".") || !strcmp(ep->d_name, ".."))
			continue;

		snprintf(path, sizeof(path), "%s/%s", dirname, ep->d_name);
		if (lstat(path, &st)) {
			rc = putErr(UPL_ERR_SYSTEM, "lstat(%s) : %m", path);
			break;
		}
		if (S_ISDIR(st.st_mode)) {
			if ((rc = rmdir_recursively(path)))
				break;
		} else if (unlink(path) && errno != ENOENT) {
			rc = putErr(UPL_ERR_SYSTEM, UPL_MSG_DELETE, path, strerror(errno));
			break;
		}
	}
	closedir(dir);

	if (rc)
		return rc;
	if (rmdir(dirname) && errno != ENOENT)
		return putErr(UPL_ERR_SYSTEM, UPL_MSG_DELETE, dirname, strerror(errno));
	return 0;
}

int wait_for_file(const char *path, int timeout)
{
	struct stat st;

	for (int i = 0; ; i++) {
		if (stat(path, &st) == 0)
			return 1;
		if (i >= timeout || terminated)
			break;
		sleep(1);
	}
	return 0;
}

int find_executable(const char *prog)
{
	char path[PATH_MAX + 1];
	const char *env;
	const char *p, *e;

	if (strchr(prog, '/'))
		return access(prog, X_OK) == 0;

	if ((env = getenv("PATH")) == NULL)
		env = "/usr/local/bin:/usr/bin:/bin:/usr/local/sbin:/usr/sbin:/sbin";

	for (p = env; *p; p = e) {
		size_t len;

		if ((e = strchr(p, ':')) == NULL)
			e = p + strlen(p);
		len = e - p;
		if (len == 0)
			snprintf(path, sizeof(path), "./%s", prog);
		else
			snprintf(path, sizeof(path), "%.*s/%s", (int)len, p, prog);
		if (access(path, X_OK) == 0)
			return 1;
		if (*e == ':')
			e++;
	}
	return 0;
}

int read_whole_file(const char *path, std::string &out)
{
	std::ifstream in(path, std::ios::in | std::ios::binary);

	if (!in)
		return putErr(UPL_ERR_SYSTEM, UPL_MSG_READ_FILE, path);

	std::ostringstream s;
	s << in.rdbuf();
	if (in.bad())
		return putErr(UPL_ERR_SYSTEM, UPL_MSG_READ_FILE, path);
	out = s.str();
	return 0;
}

int write_whole_file(const char *path, const std::string &data, mode_t mode)
{
	int fd;
	size_t done = 0;
	ssize_t n;

	if ((fd = open(path, O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode)) == -1)
		return putErr(UPL_ERR_SYSTEM, UPL_MSG_WRITE_FILE, path);

	while (done < data.size()) {
		n = write(fd, data.data() + done, data.size() - done);
		if (n < 0) {
			if (errno == EINTR)
				continue;
			close(fd);
			return putErr(UPL_ERR_SYSTEM, UPL_MSG_WRITE_FILE, path);
		}
		done += n;
	}
	if (close(fd))
		return putErr(UPL_ERR_SYSTEM, UPL_MSG_WRITE_FILE, path);
	return 0;
}

std::string remove_trail_spaces(const std::string &str)
{
	std::string::size_type b = 0, e = str.size();

	while (b < e && isspace((unsigned char)str[b]))
		b++;
	while (e > b && isspace((unsigned char)str[e - 1]))
		e--;
	return str.substr(b, e - b);
}
