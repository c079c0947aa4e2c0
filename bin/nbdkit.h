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
 * nbdkit command line and process control
 */

#ifndef __NBDKIT_H__
#define __NBDKIT_H__

#include <string>
#include <vector>
#include <map>
#include <utility>
#include <boost/optional.hpp>

#include "bincom.h"

#define NBDKIT_MIN_VERSION	"1.22.0"

#define NBDKIT_SOCKET_LABEL	"system_u:object_r:svirt_socket_t:s0"
#define NBDKIT_FILE_LABEL	"system_u:object_r:svirt_image_t:s0"

typedef map<string, string> nbdkit_config;

/*
 * nbdkit command line, without the socket and pid file which are
 * chosen at start.
 */
struct nbdkit_cmd
{
	string nbdkit;
	string plugin;
	string exportname;
	bool verbose;
	int threads;
	boost::optional<string> selinux_label;
	/* plugin key=value arguments */
	vector<pair<string, string> > args;

	nbdkit_cmd() : verbose(false), threads(0) {}

	void add_arg(const string &key, const string &value)
	{
		args.push_back(make_pair(key, value));
	}

	void build_args(const string &sock, const string &pidfile,
			vector<string> &argv) const;
};

/* `nbdkit --version` works */
bool nbdkit_is_installed(const string &nbdkit);

/* parse `nbdkit --dump-config` key=value lines */
int nbdkit_dump_config(const string &nbdkit, nbdkit_config &config);
void nbdkit_parse_config(const string &text, nbdkit_config &config);

/* "major.minor.patch" into <ver>, missing parts are zero */
int nbdkit_parse_version(const string &str, int ver[3]);
/* <0, 0, >0 like strcmp */
int nbdkit_version_compare(const int a[3], const int b[3]);
/* version from the dump-config output */
int nbdkit_version(const nbdkit_config &config, int ver[3]);

/* `nbdkit <plugin> <script> --dump-plugin` works */
bool nbdkit_plugin_works(const string &nbdkit, const string &plugin,
		const string &script);

/*
 * Start nbdkit serving on Unix socket <sock> and wait up to <timeout>
 * seconds for <pidfile>. If run as root the socket is made world
 * accessible.
 */
int nbdkit_run_unix(const nbdkit_cmd &cmd, const string &sock,
		const string &pidfile, int timeout, pid_t *pid);

#endif
