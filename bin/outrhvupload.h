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
 * -o rhv-upload output module
 */

#ifndef __OUTRHVUPLOAD_H__
#define __OUTRHVUPLOAD_H__

#include <string>
#include <vector>
#include <boost/optional.hpp>
#include <boost/shared_ptr.hpp>

#include "bincom.h"
#include "upl_config.h"
#include "output.h"
#include "uploadcom.h"
#include "rhvoptions.h"
#include "helper.h"
#include "nbdkit.h"
#include "precheck.h"
#include "ovf.h"

#define RHV_UPLOAD_MODULE	"rhv-upload"

struct rhv_precheck_result
{
	string rhv_storagedomain_uuid;
	string rhv_cluster_uuid;
	string rhv_cluster_cpu_architecture;
};

/* one disk being uploaded */
struct rhv_disk_target
{
	int id;
	string disk_name;
	string disk_format;
	unsigned long long disk_size;
	boost::optional<string> uuid_override;
	string sock;
	string pidfile;
	string params_file;
	/* written by the plugin when the transfer is finalized */
	string diskid_file;
	/* disk id from diskid_file */
	boost::optional<string> disk_uuid;
	/* nbdkit serving this disk, -1 if stopped */
	pid_t pid;

	rhv_disk_target() : id(0), disk_size(0), pid(-1) {}
};

struct rhv_finalization_result
{
	string vm_uuid;
	vector<string> image_uuids;
	vector<string> vol_uuids;
	string ovf;
};

/*
 * Upload to oVirt/RHV through the imageio transfer API. Each disk is served
 * by its own nbdkit with the python upload plugin, the image-copy tool
 * writes into its socket. Disks uploaded so far are deleted if the session
 * is destroyed before create_metadata() succeeded.
 */
class RhvUpload : public OutputModule, public UploadStateCommon
{
public:
	RhvUpload(const upl_output_args &args, const rhv_options &opts,
			const upl_data &conf);
	virtual ~RhvUpload();

	/* create the working directory */
	int init();

	void set_ovf_builder(const boost::shared_ptr<OvfBuilder> &builder)
	{
		m_ovf = builder;
	}

	virtual int precheck();
	virtual string as_options() const;
	virtual void supported_firmware(vector<int> &firmware) const;
	virtual string transfer_format(const upl_target &target) const;
	virtual int prepare_targets(const upl_source &source,
			vector<upl_target> &targets);
	virtual int disk_copied(const upl_target &target, size_t i,
			size_t nr_disks);
	virtual int create_metadata(const upl_source &source,
			const vector<upl_target> &targets, int firmware,
			string &vm_id);

	const string &tmpdir() const { return m_tmpdir; }
	const rhv_options &options() const { return m_opts; }
	const upl_environment &environment() const { return m_env; }
	const rhv_precheck_result &precheck_result() const { return m_precheck; }
	const vector<rhv_disk_target> &disk_targets() const { return m_targets; }
	const vector<string> &disk_uuids() const { return m_disk_uuids; }
	bool rollback_armed() const { return m_rollback_armed && erase_flag; }
	const boost::optional<rhv_finalization_result> &finalization_result() const
	{
		return m_result;
	}

	/* helper parameters which are the same for all calls */
	const rhv_helper_params &helper_params() const { return m_params; }

private:
	int run_helper(const HelperScript &script, const rhv_helper_params &params,
			const char *params_name, const vector<string> &files,
			int out, int *retcode);
	int read_precheck_result(const string &path);
	int prepare_target(const upl_source &source, upl_target &target,
			const boost::optional<string> &uuid);
	int resolve_image_uuids(size_t nr_targets, vector<string> &uuids) const;
	void arm_rollback();
	void stop_backends();
	int delete_disks();

	static int clean_deleteDisks(const void * arg, const void * dummy);
	static int clean_stopBackends(const void * arg, const void * dummy);

private:
	upl_output_args m_args;
	rhv_options m_opts;
	upl_data m_conf;
	string m_tmpdir;

	HelperScript m_precheck_script;
	HelperScript m_vmcheck_script;
	HelperScript m_plugin_script;
	HelperScript m_createvm_script;
	HelperScript m_deletedisks_script;

	rhv_helper_params m_params;
	nbdkit_cmd m_nbdkit_cmd;
	upl_environment m_env;
	bool m_prechecked;
	rhv_precheck_result m_precheck;

	vector<rhv_disk_target> m_targets;
	vector<string> m_disk_uuids;
	bool m_rollback_armed;

	boost::shared_ptr<OvfBuilder> m_ovf;
	boost::optional<rhv_finalization_result> m_result;
};

int create_rhv_upload(const upl_output_args &args, const upl_data &conf,
		OutputModule **module);

#endif
