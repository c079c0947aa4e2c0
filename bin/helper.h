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
 * Python helper scripts and their parameters
 */

#ifndef __HELPER_H__
#define __HELPER_H__

#include <string>
#include <vector>
#include <boost/optional.hpp>
#include <json/json.h>

#include "bincom.h"
#include "upl_config.h"

#define RHV_PRECHECK_SCRIPT	"rhv-upload-precheck.py"
#define RHV_VMCHECK_SCRIPT	"rhv-upload-vmcheck.py"
#define RHV_PLUGIN_SCRIPT	"rhv-upload-plugin.py"
#define RHV_CREATEVM_SCRIPT	"rhv-upload-createvm.py"
#define RHV_DELETEDISKS_SCRIPT	"rhv-upload-deletedisks.py"

/*
 * Parameters document passed to the helper scripts. The invariant part is
 * filled once per session, the optional fields are set per call.
 */
struct rhv_helper_params
{
	bool verbose;
	string output_conn;
	string output_password;
	string output_storage;
	bool output_sparse;
	boost::optional<string> rhv_cafile;
	string rhv_cluster;
	bool rhv_direct;
	bool insecure;

	boost::optional<vector<string> > rhv_disk_uuids;
	boost::optional<string> output_name;
	boost::optional<string> disk_name;
	boost::optional<string> disk_format;
	boost::optional<unsigned long long> disk_size;
	boost::optional<string> diskid_file;
	boost::optional<string> rhv_disk_uuid;
	boost::optional<string> rhv_cluster_uuid;
	boost::optional<vector<string> > disk_uuids;

	rhv_helper_params()
		: verbose(false), output_sparse(true), rhv_direct(false),
		insecure(true)
	{}

	/* absent optional fields are omitted, absent cafile is null */
	Json::Value to_value() const;
	string to_json() const;
};

/* one-line JSON text, non-ASCII escaped */
string json_write(const Json::Value &value);

/*
 * Python helper script from the helpers directory
 */
class HelperScript
{
public:
	HelperScript(const upl_data &conf, const char *name);

	const string &path() const { return m_path; }
	const char *name() const { return m_name; }

	/*
	 * write <params> to <params_file> and run
	 *   <python> <script> <params_file> [files...]
	 * stdout goes to <out> if it is not -1. Exit code of the script is
	 * returned in <retcode>, non-zero rc is for failures to run it at all.
	 */
	int run(const rhv_helper_params &params,
		const string &params_file,
		const vector<string> &files,
		int out,
		int *retcode) const;

private:
	const upl_data &m_conf;
	const char *m_name;
	string m_path;
};

/* 0 if the python interpreter from config can be found */
int check_python_interpreter(const upl_data &conf);

#endif
