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

#include <signal.h>
#include <sys/wait.h>
#include <algorithm>

#include "util.h"
#include "../bin/util.h"
#include "nbdkit.h"

static void test_build_args()
{
	nbdkit_cmd cmd;
	vector<string> argv;

	cmd.nbdkit = "nbdkit";
	cmd.plugin = "python";
	cmd.exportname = "/";
	cmd.threads = 8;
	cmd.selinux_label = string(NBDKIT_SOCKET_LABEL);
	cmd.add_arg("script", "/usr/libexec/v2vupload/rhv-upload-plugin.py");
	cmd.add_arg("params", "/var/tmp/rhvupload.x/params0.json");
	cmd.build_args("/var/tmp/rhvupload.x/nbdkit0.sock",
		"/var/tmp/rhvupload.x/nbdkit0.pid", argv);

	const char *expected[] = {
		"nbdkit", "--exit-with-parent", "--foreground", "--newstyle",
		"--pidfile", "/var/tmp/rhvupload.x/nbdkit0.pid",
		"--unix", "/var/tmp/rhvupload.x/nbdkit0.sock",
		"--exportname", "/",
		"--threads", "8",
		"--selinux-label", "system_u:object_r:svirt_socket_t:s0",
		"python",
		"script=/usr/libexec/v2vupload/rhv-upload-plugin.py",
		"params=/var/tmp/rhvupload.x/params0.json",
	};
	CHECK_EQ(argv.size(), sizeof(expected) / sizeof(expected[0]));
	for (size_t i = 0; i < argv.size() && i < sizeof(expected) / sizeof(expected[0]); i++)
		CHECK_EQ(argv[i], expected[i]);

	/* verbose, no label */
	cmd.verbose = true;
	cmd.selinux_label = boost::none;
	cmd.build_args("s", "p", argv);
	CHECK(find(argv.begin(), argv.end(), "--verbose") != argv.end());
	CHECK(find(argv.begin(), argv.end(), "--selinux-label") == argv.end());
}

static void test_parse_config()
{
	nbdkit_config config;
	int ver[3];

	nbdkit_parse_config("bindir=/usr/bin\nversion=1.24.2\n"
		"version_major=1\nselinux=yes\nbroken line\n=x\n", config);
	CHECK_EQ(config.size(), 4u);
	CHECK_EQ(config["selinux"], "yes");
	CHECK_RC(nbdkit_version(config, ver), 0);
	CHECK(ver[0] == 1 && ver[1] == 24 && ver[2] == 2);

	config.erase("version");
	CHECK_RC(nbdkit_version(config, ver), UPL_ERR_ENVIRONMENT);
}

static void test_versions()
{
	int a[3], b[3];

	CHECK_RC(nbdkit_parse_version("1.22.0", a), 0);
	CHECK_RC(nbdkit_parse_version("1.22", b), 0);
	CHECK_EQ(nbdkit_version_compare(a, b), 0);

	CHECK_RC(nbdkit_parse_version("1.21.99", b), 0);
	CHECK(nbdkit_version_compare(b, a) < 0);
	CHECK_RC(nbdkit_parse_version("1.100.0", b), 0);
	CHECK(nbdkit_version_compare(b, a) > 0);
	CHECK_RC(nbdkit_parse_version("2", b), 0);
	CHECK(nbdkit_version_compare(b, a) > 0);
	CHECK_RC(nbdkit_parse_version("1.23.5-rc1", b), 0);
	CHECK(b[0] == 1 && b[1] == 23 && b[2] == 5);

	CHECK_RC(nbdkit_parse_version("v1.2", b), UPL_ERR_ENVIRONMENT);
}

static void test_capabilities()
{
	test_env env;
	nbdkit_config config;

	CHECK_RC(test_env_init(env), 0);

	CHECK(nbdkit_is_installed(env.conf.nbdkit));
	CHECK(!nbdkit_is_installed(env.dir + "/bin/missing"));
	setenv("FAKE_NBDKIT_BROKEN", "1", 1);
	CHECK(!nbdkit_is_installed(env.conf.nbdkit));
	unsetenv("FAKE_NBDKIT_BROKEN");

	setenv("FAKE_NBDKIT_VERSION", "1.20.4", 1);
	CHECK_RC(nbdkit_dump_config(env.conf.nbdkit, config), 0);
	CHECK_EQ(config["version"], "1.20.4");
	CHECK_EQ(config["bindir"], "/usr/bin");

	CHECK(nbdkit_plugin_works(env.conf.nbdkit, "python", "plugin.py"));
	setenv("FAKE_PLUGIN_RC", "1", 1);
	CHECK(!nbdkit_plugin_works(env.conf.nbdkit, "python", "plugin.py"));

	test_env_clean(env);
}

static void test_run_unix()
{
	test_env env;
	nbdkit_cmd cmd;
	pid_t pid = -1;
	int status;

	CHECK_RC(test_env_init(env), 0);

	cmd.nbdkit = env.conf.nbdkit;
	cmd.plugin = "python";
	cmd.exportname = "/";
	cmd.add_arg("params", env.dir + "/params0.json");

	string sock = env.dir + "/nbdkit0.sock";
	string pidfile = env.dir + "/nbdkit0.pid";
	CHECK_RC(nbdkit_run_unix(cmd, sock, pidfile, 5, &pid), 0);
	CHECK(pid > 0);
	CHECK(file_exists(sock));
	CHECK(file_exists(pidfile));
	/* still serving */
	CHECK(waitpid(pid, &status, WNOHANG) == 0);
	CHECK_EQ(log_lines(env, "nbdkit ").size(), 1u);

	term_clean(pid, 5);
	CHECK(kill(pid, 0) == -1);

	/* exits before writing the pid file */
	setenv("FAKE_NBDKIT_NOSTART", "1", 1);
	pid = -1;
	CHECK_RC(nbdkit_run_unix(cmd, env.dir + "/nbdkit1.sock",
		env.dir + "/nbdkit1.pid", 5, &pid), UPL_ERR_BACKEND);
	CHECK_EQ(pid, -1);

	test_env_clean(env);
}

int main()
{
	RUN_TEST(test_build_args);
	RUN_TEST(test_parse_config);
	RUN_TEST(test_versions);
	RUN_TEST(test_capabilities);
	RUN_TEST(test_run_unix);
	return TEST_RESULT();
}
