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

#include "common.h"
#include "util.h"
#include "helper.h"
#include "precheck.h"

bool host_have_selinux(const upl_data &conf)
{
	string data;

	if (conf.selinux == UPL_SELINUX_YES)
		return true;
	if (conf.selinux == UPL_SELINUX_NO)
		return false;

	if (access(SELINUX_ENFORCE_FILE, R_OK))
		return false;
	if (read_whole_file(SELINUX_ENFORCE_FILE, data))
		return false;
	return remove_trail_spaces(data) == "1";
}

static int check_ovirtsdk4(const upl_data &conf)
{
	int rc, retcode;
	vector<string> args;

	args.push_back(conf.python);
	args.push_back("-c");
	args.push_back("import ovirtsdk4");
	ExecveArrayWrapper argv(args);

	if ((rc = upl_execve(argv.getArray(), NULL, -1, -1, &retcode)))
		return rc;
	if (retcode)
		return putErr(UPL_ERR_ENVIRONMENT, UPL_MSG_SDK);
	return 0;
}

int check_preconditions(const upl_data &conf, const string &plugin_script,
		const string &output_alloc, upl_environment &env)
{
	int rc;
	int min_version[3];
	nbdkit_config config;
	nbdkit_config::const_iterator it;

	logger(LOG_INFO, UPL_INFO_STAGE_CHECK_PRECONDITION);

	if ((rc = check_python_interpreter(conf)))
		return rc;
	env.python_found = true;

	if ((rc = check_ovirtsdk4(conf)))
		return rc;

	if (!nbdkit_is_installed(conf.nbdkit))
		return putErr(UPL_ERR_ENVIRONMENT, UPL_MSG_NBDKIT);

	if ((rc = nbdkit_dump_config(conf.nbdkit, config)))
		return rc;
	if ((rc = nbdkit_version(config, env.nbdkit_version)))
		return rc;
	nbdkit_parse_version(NBDKIT_MIN_VERSION, min_version);
	if (nbdkit_version_compare(env.nbdkit_version, min_version) < 0)
		return putErr(UPL_ERR_ENVIRONMENT, UPL_MSG_NBDKIT_VERSION,
			NBDKIT_MIN_VERSION);
	logger(LOG_DEBUG, "nbdkit version %d.%d.%d", env.nbdkit_version[0],
		env.nbdkit_version[1], env.nbdkit_version[2]);

	if (!nbdkit_plugin_works(conf.nbdkit, conf.nbdkit_python_plugin,
			plugin_script))
		return putErr(UPL_ERR_ENVIRONMENT, UPL_MSG_NBDKIT_PLUGIN,
			conf.nbdkit_python_plugin.c_str());

	it = config.find("selinux");
	env.nbdkit_selinux = (it != config.end() && it->second != "no");
	env.have_selinux = host_have_selinux(conf);
	if (env.have_selinux && !env.nbdkit_selinux)
		return putErr(UPL_ERR_ENVIRONMENT, UPL_MSG_NBDKIT_SELINUX);

	if (output_alloc != "sparse")
		return putErr(UPL_ERR_ENVIRONMENT, UPL_MSG_LIMITATION, "-oa sparse");

	return 0;
}
