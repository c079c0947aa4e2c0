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

#include <json/json.h>

#include "common.h"
#include "util.h"
#include "helper.h"

string json_write(const Json::Value &value)
{
	Json::StreamWriterBuilder builder;

	builder["indentation"] = "";
	return Json::writeString(builder, value);
}

static Json::Value json_list(const vector<string> &list)
{
	Json::Value v(Json::arrayValue);

	for (size_t i = 0; i < list.size(); i++)
		v.append(list[i]);
	return v;
}

Json::Value rhv_helper_params::to_value() const
{
	Json::Value v(Json::objectValue);

	v["verbose"] = verbose;
	v["output_conn"] = output_conn;
	v["output_password"] = output_password;
	v["output_storage"] = output_storage;
	v["output_sparse"] = output_sparse;
	v["rhv_cafile"] = rhv_cafile ? Json::Value(*rhv_cafile) : Json::Value();
	v["rhv_cluster"] = rhv_cluster;
	v["rhv_direct"] = rhv_direct;
	v["insecure"] = insecure;

	if (rhv_disk_uuids)
		v["rhv_disk_uuids"] = json_list(*rhv_disk_uuids);
	if (output_name)
		v["output_name"] = *output_name;
	if (disk_name)
		v["disk_name"] = *disk_name;
	if (disk_format)
		v["disk_format"] = *disk_format;
	if (disk_size)
		v["disk_size"] = Json::Value((Json::UInt64)*disk_size);
	if (diskid_file)
		v["diskid_file"] = *diskid_file;
	if (rhv_disk_uuid)
		v["rhv_disk_uuid"] = *rhv_disk_uuid;
	if (rhv_cluster_uuid)
		v["rhv_cluster_uuid"] = *rhv_cluster_uuid;
	if (disk_uuids)
		v["disk_uuids"] = json_list(*disk_uuids);
	return v;
}

string rhv_helper_params::to_json() const
{
	return json_write(to_value());
}

HelperScript::HelperScript(const upl_data &conf, const char *name)
	: m_conf(conf), m_name(name)
{
	m_path = conf.helpers_dir + "/" + name;
}

int HelperScript::run(const rhv_helper_params &params,
		const string &params_file,
		const vector<string> &files,
		int out,
		int *retcode) const
{
	int rc;
	vector<string> args;

	if ((rc = write_whole_file(params_file.c_str(), params.to_json(), 0600)))
		return rc;

	args.push_back(m_conf.python);
	args.push_back(m_path);
	args.push_back(params_file);
	args.insert(args.end(), files.begin(), files.end());

	ExecveArrayWrapper argv(args);
	logger(LOG_DEBUG, "running %s", m_name);
	if ((rc = upl_execve(argv.getArray(), NULL, -1, out, retcode)))
		return rc;
	if (*retcode)
		logger(LOG_DEBUG, "%s exited with code %d", m_name, *retcode);
	return 0;
}

int check_python_interpreter(const upl_data &conf)
{
	if (!find_executable(conf.python.c_str()))
		return putErr(UPL_ERR_ENVIRONMENT, UPL_MSG_PYTHON,
			conf.python.c_str());
	return 0;
}
