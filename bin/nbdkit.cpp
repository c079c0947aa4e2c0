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
#include <sys/stat.h>
#include <signal.h>
#include <sstream>

#include "common.h"
#include "util.h"
#include "nbdkit.h"

void nbdkit_cmd::build_args(const string &sock, const string &pidfile,
		vector<string> &argv) const
{
	char buf[32];

	argv.clear();
	argv.push_back(nbdkit);
	argv.push_back("--exit-with-parent");
	argv.push_back("--foreground");
	argv.push_back("--newstyle");
	argv.push_back("--pidfile");
	argv.push_back(pidfile);
	argv.push_back("--unix");
	argv.push_back(sock);
	if (!exportname.empty()) {
		argv.push_back("--exportname");
		argv.push_back(exportname);
	}
	if (threads > 0) {
		snprintf(buf, sizeof(buf), "%d", threads);
		argv.push_back("--threads");
		argv.push_back(buf);
	}
	if (verbose)
		argv.push_back("--verbose");
	if (selinux_label) {
		argv.push_back("--selinux-label");
		argv.push_back(*selinux_label);
	}
	argv.push_back(plugin);
	for (size_t i = 0; i < args.size(); i++)
		argv.push_back(args[i].first + "=" + args[i].second);
}

bool nbdkit_is_installed(const string &nbdkit)
{
	int retcode;
	vector<string> args;

	args.push_back(nbdkit);
	args.push_back("--version");
	ExecveArrayWrapper argv(args);

	if (upl_execve_quiet(argv.getArray(), NULL, -1, &retcode))
		return false;
	return retcode == 0;
}

void nbdkit_parse_config(const string &text, nbdkit_config &config)
{
	std::istringstream in(text);
	string line;

	config.clear();
	while (std::getline(in, line)) {
		string::size_type p = line.find('=');
		if (p == string::npos || p == 0)
			continue;
		config[line.substr(0, p)] = remove_trail_spaces(line.substr(p + 1));
	}
}

int nbdkit_dump_config(const string &nbdkit, nbdkit_config &config)
{
	int rc, retcode;
	FILE *fp;
	vector<string> args;
	string text;
	char buf[BUFSIZ];
	size_t n;

	args.push_back(nbdkit);
	args.push_back("--dump-config");
	ExecveArrayWrapper argv(args);

	if ((fp = tmpfile()) == NULL)
		return putErr(UPL_ERR_SYSTEM, "tmpfile() : %m");

	if ((rc = upl_execve(argv.getArray(), NULL, -1, fileno(fp), &retcode)))
		goto cleanup;
	if (retcode) {
		rc = putErr(UPL_ERR_ENVIRONMENT, "%s --dump-config exited with code %d",
			nbdkit.c_str(), retcode);
		goto cleanup;
	}

	rewind(fp);
	while ((n = fread(buf, 1, sizeof(buf), fp)) > 0)
		text.append(buf, n);
	if (ferror(fp)) {
		rc = putErr(UPL_ERR_SYSTEM, "can not read nbdkit config : %m");
		goto cleanup;
	}
	nbdkit_parse_config(text, config);

cleanup:
	fclose(fp);
	return rc;
}

int nbdkit_parse_version(const string &str, int ver[3])
{
	const char *p = str.c_str();
	char *end;

	for (int i = 0; i < 3; i++) {
		ver[i] = 0;
		if (*p == '\0')
			continue;
		if (!isdigit((unsigned char)*p))
			return putErr(UPL_ERR_ENVIRONMENT,
				"invalid nbdkit version '%s'", str.c_str());
		ver[i] = (int)strtol(p, &end, 10);
		p = end;
		if (*p == '.')
			p++;
		else if (*p != '\0')
			/* 1.23.5-rc1 and so on */
			break;
	}
	return 0;
}

int nbdkit_version_compare(const int a[3], const int b[3])
{
	for (int i = 0; i < 3; i++)
		if (a[i] != b[i])
			return a[i] < b[i] ? -1 : 1;
	return 0;
}

int nbdkit_version(const nbdkit_config &config, int ver[3])
{
	nbdkit_config::const_iterator it = config.find("version");

	if (it == config.end())
		return putErr(UPL_ERR_ENVIRONMENT,
			"nbdkit --dump-config does not report the version");
	return nbdkit_parse_version(it->second, ver);
}

bool nbdkit_plugin_works(const string &nbdkit, const string &plugin,
		const string &script)
{
	int retcode;
	vector<string> args;

	args.push_back(nbdkit);
	args.push_back(plugin);
	args.push_back(script);
	args.push_back("--dump-plugin");
	ExecveArrayWrapper argv(args);

	if (upl_execve_quiet(argv.getArray(), NULL, -1, &retcode))
		return false;
	return retcode == 0;
}

int nbdkit_run_unix(const nbdkit_cmd &cmd, const string &sock,
		const string &pidfile, int timeout, pid_t *pid)
{
	int rc, status;
	pid_t chpid;
	vector<string> args;
	struct stat st;

	cmd.build_args(sock, pidfile, args);
	ExecveArrayWrapper argv(args);

	if ((rc = upl_execve_nowait(argv.getArray(), NULL, &chpid)))
		return rc;

	for (int i = 0; ; i++) {
		if (stat(pidfile.c_str(), &st) == 0)
			break;
		if (waitpid(chpid, &status, WNOHANG) == chpid) {
			check_exit_status(cmd.nbdkit.c_str(), status);
			return putErr(UPL_ERR_BACKEND,
				"nbdkit did not start up, see earlier errors: %s",
				getError());
		}
		if (terminated) {
			term_clean(chpid, 5);
			return putErr(UPL_ERR_TERM, UPL_MSG_TERM);
		}
		if (i >= timeout * 10) {
			term_clean(chpid, 5);
			return putErr(UPL_ERR_BACKEND,
				"nbdkit did not start up.  There may be errors "
				"printed by nbdkit above.");
		}
		usleep(100000);
	}

	/* qemu-img may run as a different user */
	if (geteuid() == 0 && chmod(sock.c_str(), 0777)) {
		rc = putErr(UPL_ERR_BACKEND, "chmod(%s) : %m", sock.c_str());
		term_clean(chpid, 5);
		return rc;
	}

	logger(LOG_DEBUG, "nbdkit started (pid %d), socket %s", chpid, sock.c_str());
	*pid = chpid;
	return 0;
}
