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

#include <fcntl.h>
#include <limits.h>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>

#ifdef FIU_ENABLE
#include <fiu.h>
#endif

#include "common.h"
#include "util.h"
#include "outrhvupload.h"

RhvUpload::RhvUpload(const upl_output_args &args, const rhv_options &opts,
		const upl_data &conf)
	: m_args(args)
	, m_opts(opts)
	, m_conf(conf)
	, m_precheck_script(m_conf, RHV_PRECHECK_SCRIPT)
	, m_vmcheck_script(m_conf, RHV_VMCHECK_SCRIPT)
	, m_plugin_script(m_conf, RHV_PLUGIN_SCRIPT)
	, m_createvm_script(m_conf, RHV_CREATEVM_SCRIPT)
	, m_deletedisks_script(m_conf, RHV_DELETEDISKS_SCRIPT)
	, m_prechecked(false)
	, m_rollback_armed(false)
	, m_ovf(new OVirtOvfBuilder())
{
	m_params.verbose = (debug_level >= LOG_DEBUG);
	m_params.output_conn = m_args.output_conn;
	m_params.output_password = m_args.output_password;
	m_params.output_storage = m_args.output_storage;
	m_params.output_sparse = (m_args.output_alloc != "preallocated");
	m_params.rhv_cafile = m_opts.rhv_cafile;
	m_params.rhv_cluster = m_opts.rhv_cluster ?
		*m_opts.rhv_cluster : string(RHV_DEFAULT_CLUSTER);
	m_params.rhv_direct = m_opts.rhv_direct;
	m_params.insecure = !m_opts.rhv_verifypeer;
}

RhvUpload::~RhvUpload()
{
	/* cleaners use this object, so run them before it is destroyed */
	cleanup();
}

int RhvUpload::init()
{
	int rc;
	char path[PATH_MAX + 1];

	if ((rc = make_tmp_dir(m_conf.tmpdir.c_str(), "rhvupload.",
			path, sizeof(path))))
		return rc;
	m_tmpdir = path;

	addCleanerRemove(clean_removeDir, m_tmpdir.c_str(), ANY_CLEANER);
	addCleaner(clean_stopBackends, this, NULL, ANY_CLEANER);
	return 0;
}

int RhvUpload::run_helper(const HelperScript &script,
		const rhv_helper_params &params,
		const char *params_name,
		const vector<string> &files,
		int out,
		int *retcode)
{
	return script.run(params, m_tmpdir + "/" + params_name, files, out, retcode);
}

int RhvUpload::read_precheck_result(const string &path)
{
	boost::property_tree::ptree pt;

	try {
		boost::property_tree::read_json(path, pt);
		m_precheck.rhv_storagedomain_uuid =
			pt.get<string>("rhv_storagedomain_uuid");
		m_precheck.rhv_cluster_uuid = pt.get<string>("rhv_cluster_uuid");
		m_precheck.rhv_cluster_cpu_architecture =
			pt.get<string>("rhv_cluster_cpu_architecture");
	} catch (const boost::property_tree::ptree_error &e) {
		logger(LOG_ERR, "%s: %s", path.c_str(), e.what());
		return putErr(UPL_ERR_REMOTE, UPL_MSG_PRECHECK);
	}

	logger(LOG_DEBUG, "precheck: storage domain %s, cluster %s (%s)",
		m_precheck.rhv_storagedomain_uuid.c_str(),
		m_precheck.rhv_cluster_uuid.c_str(),
		m_precheck.rhv_cluster_cpu_architecture.c_str());
	return 0;
}

int RhvUpload::precheck()
{
	int rc, fd, retcode;
	string result_file = m_tmpdir + "/v2vprecheck.json";
	rhv_helper_params params = m_params;

	START_STAGE();
	if ((rc = check_preconditions(m_conf, m_plugin_script.path(),
			m_args.output_alloc, m_env)))
		return rc;

	if (m_opts.rhv_cafile && (rc = check_cafile(m_opts.rhv_cafile->c_str())))
		return rc;

	/* nbdkit command line which is the same for all disks */
	m_nbdkit_cmd.nbdkit = m_conf.nbdkit;
	m_nbdkit_cmd.plugin = m_conf.nbdkit_python_plugin;
	m_nbdkit_cmd.exportname = "/";
	m_nbdkit_cmd.verbose = m_params.verbose;
	m_nbdkit_cmd.threads = m_conf.nbdkit_threads;
	if (m_env.have_selinux)
		m_nbdkit_cmd.selinux_label = string(NBDKIT_SOCKET_LABEL);
	m_nbdkit_cmd.add_arg("script", m_plugin_script.path());

	if (m_opts.rhv_disk_uuids)
		params.rhv_disk_uuids = m_opts.rhv_disk_uuids;

	fd = open(result_file.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
	if (fd == -1)
		return putErr(UPL_ERR_SYSTEM, UPL_MSG_WRITE_FILE, result_file.c_str());
	rc = run_helper(m_precheck_script, params, "precheck.json",
		vector<string>(), fd, &retcode);
	close(fd);
	if (rc)
		return rc;
	if (retcode)
		return putErr(UPL_ERR_REMOTE, UPL_MSG_PRECHECK);

	if ((rc = read_precheck_result(result_file)))
		return rc;

	m_prechecked = true;
	END_STAGE();
	return 0;
}

string RhvUpload::as_options() const
{
	string s = "-o " RHV_UPLOAD_MODULE;

	if (m_args.output_alloc == "preallocated")
		s += " -oa preallocated";
	s += " -oc " + m_args.output_conn;
	s += " -op " + m_args.output_password;
	s += " -os " + m_args.output_storage;
	return s;
}

void RhvUpload::supported_firmware(vector<int> &firmware) const
{
	firmware.clear();
	firmware.push_back(TARGET_BIOS);
	firmware.push_back(TARGET_UEFI);
}

string RhvUpload::transfer_format(const upl_target &) const
{
	return "raw";
}

void RhvUpload::arm_rollback()
{
	if (m_rollback_armed)
		return;
	addCleaner(clean_deleteDisks, this, NULL, ERROR_CLEANER);
	m_rollback_armed = true;
	logger(LOG_DEBUG, "uploaded disks will be deleted on failure");
}

int RhvUpload::prepare_target(const upl_source &source, upl_target &target,
		const boost::optional<string> &uuid)
{
	int rc;
	char buf[PATH_MAX + 1];
	rhv_disk_target t;
	rhv_helper_params params = m_params;
	nbdkit_cmd cmd = m_nbdkit_cmd;
	Json::Value uri(Json::objectValue);

#ifdef FIU_ENABLE
	if (fiu_fail("upload/prepare_target"))
		return putErr(UPL_ERR_BACKEND, "fault injected at upload/prepare_target");
#endif

	if (target.target_format != "raw" && target.target_format != "qcow2")
		return putErr(UPL_ERR_CONFIG, UPL_MSG_FORMAT,
			target.target_format.c_str());

	t.id = target.disk.id;
	if (snprintf(buf, sizeof(buf), "%s-%03d", source.name.c_str(), t.id)
			>= (int)sizeof(buf))
		return putErr(UPL_ERR_CONFIG, "guest name %.32s... is too long",
			source.name.c_str());
	t.disk_name = buf;
	t.disk_format = target.target_format;
	t.disk_size = target.disk.virtual_size;
	t.uuid_override = uuid;
	snprintf(buf, sizeof(buf), "%s/diskid.%d", m_tmpdir.c_str(), t.id);
	t.diskid_file = buf;
	snprintf(buf, sizeof(buf), "%s/params%d.json", m_tmpdir.c_str(), t.id);
	t.params_file = buf;
	snprintf(buf, sizeof(buf), "%s/nbdkit%d.sock", m_tmpdir.c_str(), t.id);
	t.sock = buf;
	snprintf(buf, sizeof(buf), "%s/nbdkit%d.pid", m_tmpdir.c_str(), t.id);
	t.pidfile = buf;

	params.output_name = source.name;
	params.disk_name = t.disk_name;
	params.disk_format = t.disk_format;
	params.disk_size = t.disk_size;
	params.diskid_file = t.diskid_file;
	params.rhv_disk_uuid = t.uuid_override;
	if ((rc = write_whole_file(t.params_file.c_str(), params.to_json(), 0600)))
		return rc;

	cmd.add_arg("params", t.params_file);
	if ((rc = nbdkit_run_unix(cmd, t.sock, t.pidfile,
			m_conf.pidfile_timeout, &t.pid)))
		return rc;
	m_targets.push_back(t);

	if (m_env.have_selinux) {
		int retcode;
		vector<string> args;

		/* --selinux-label sets the socket label only, not the file one */
		args.push_back(m_conf.chcon);
		args.push_back(NBDKIT_FILE_LABEL);
		args.push_back(t.sock);
		ExecveArrayWrapper argv(args);
		if (upl_execve(argv.getArray(), NULL, -1, -1, &retcode) || retcode)
			logger(LOG_WARNING, "can not set SELinux label of %s",
				t.sock.c_str());
	}

	uri["file.driver"] = "nbd";
	uri["file.path"] = t.sock;
	uri["file.export"] = "/";
	target.target_uri = "json:" + json_write(uri);
	logger(LOG_DEBUG, "disk %d: %s", t.id, target.target_uri.c_str());

	arm_rollback();
	return 0;
}

int RhvUpload::prepare_targets(const upl_source &source,
		vector<upl_target> &targets)
{
	int rc, retcode;
	rhv_helper_params params = m_params;

	START_STAGE();
	if (!m_prechecked)
		return putErr(UPL_ERR_SYSTEM, "-o " RHV_UPLOAD_MODULE
			": targets are prepared before precheck");

	if (m_precheck.rhv_cluster_cpu_architecture != source.arch)
		return putErr(UPL_ERR_CONFIG, UPL_MSG_ARCH,
			m_params.rhv_cluster.c_str(), source.arch.c_str(),
			m_precheck.rhv_cluster_cpu_architecture.c_str());

	if (m_opts.rhv_disk_uuids && m_opts.rhv_disk_uuids->size() != targets.size())
		return putErr(UPL_ERR_CONFIG, UPL_MSG_UUID_COUNT, targets.size());

	/* the VM name is known only here */
	params.output_name = source.name;
	if ((rc = run_helper(m_vmcheck_script, params, "vmcheck.json",
			vector<string>(), -1, &retcode)))
		return rc;
	if (retcode)
		return putErr(UPL_ERR_REMOTE, UPL_MSG_VMCHECK);

	for (size_t i = 0; i < targets.size(); i++) {
		boost::optional<string> uuid;

		if (m_opts.rhv_disk_uuids)
			uuid = (*m_opts.rhv_disk_uuids)[i];
		if ((rc = prepare_target(source, targets[i], uuid)))
			return rc;
		if (terminated)
			return putErr(UPL_ERR_TERM, UPL_MSG_TERM);
	}
	END_STAGE();
	return 0;
}

int RhvUpload::disk_copied(const upl_target &target, size_t i, size_t nr_disks)
{
	string data;
	rhv_disk_target *t = NULL;

	for (size_t j = 0; j < m_targets.size(); j++) {
		if (m_targets[j].id == target.disk.id) {
			t = &m_targets[j];
			break;
		}
	}
	if (t == NULL)
		return putErr(UPL_ERR_SYSTEM, "disk %d was not prepared", target.disk.id);
	if (t->disk_uuid)
		return putErr(UPL_ERR_SYSTEM, "disk %d is already reported as copied",
			target.disk.id);

#ifdef FIU_ENABLE
	if (fiu_fail("upload/disk_copied"))
		return putErr(UPL_ERR_TIMEOUT, UPL_MSG_TRANSFER, i + 1, nr_disks);
#endif

	if (!wait_for_file(t->diskid_file.c_str(), m_conf.finalization_timeout)) {
		if (terminated)
			logger(LOG_ERR, UPL_MSG_TERM);
		return putErr(UPL_ERR_TIMEOUT, UPL_MSG_TRANSFER, i + 1, nr_disks);
	}

	if (read_whole_file(t->diskid_file.c_str(), data))
		return putErr(UPL_ERR_TIMEOUT, UPL_MSG_TRANSFER, i + 1, nr_disks);
	data = remove_trail_spaces(data);
	if (data.empty()) {
		logger(LOG_ERR, "%s is empty", t->diskid_file.c_str());
		return putErr(UPL_ERR_TIMEOUT, UPL_MSG_TRANSFER, i + 1, nr_disks);
	}

	t->disk_uuid = data;
	m_disk_uuids.push_back(data);
	logger(LOG_INFO, "disk %zu/%zu uploaded, id %s", i + 1, nr_disks,
		data.c_str());
	return 0;
}

int RhvUpload::resolve_image_uuids(size_t nr_targets, vector<string> &uuids) const
{
	if (m_opts.rhv_disk_uuids) {
		if (!m_disk_uuids.empty() && m_disk_uuids != *m_opts.rhv_disk_uuids)
			return putErr(UPL_ERR_FINALIZE, UPL_MSG_UUID_MISMATCH);
		uuids = *m_opts.rhv_disk_uuids;
	} else if (!m_disk_uuids.empty()) {
		uuids = m_disk_uuids;
	} else if (nr_targets) {
		return putErr(UPL_ERR_FINALIZE, UPL_MSG_UUID_NONE, nr_targets);
	} else {
		uuids.clear();
	}

	if (uuids.size() != nr_targets)
		return putErr(UPL_ERR_FINALIZE, "%zu disk UUID(s) for %zu disk(s)",
			uuids.size(), nr_targets);
	return 0;
}

int RhvUpload::create_metadata(const upl_source &source,
		const vector<upl_target> &targets, int firmware, string &vm_id)
{
	int rc, retcode;
	char uuid[UPL_UUID_LEN + 1];
	ovf_ids ids;
	rhv_finalization_result result;
	rhv_helper_params params = m_params;
	string ovf_file = m_tmpdir + "/vm.ovf";
	vector<string> files;

	START_STAGE();
	if (!m_prechecked)
		return putErr(UPL_ERR_SYSTEM, "-o " RHV_UPLOAD_MODULE
			": metadata is created before precheck");

	if ((rc = resolve_image_uuids(targets.size(), ids.image_uuids)))
		return rc;

	/* volume and VM ids are made up */
	for (size_t i = 0; i < targets.size(); i++) {
		gen_uuid(uuid);
		ids.vol_uuids.push_back(uuid);
	}
	gen_uuid(uuid);
	ids.vm_uuid = uuid;
	ids.sd_uuid = m_precheck.rhv_storagedomain_uuid;
	ids.sparse = m_params.output_sparse;

	if ((rc = m_ovf->build(source, targets, firmware, ids, result.ovf)))
		return rc;
	if ((rc = write_whole_file(ovf_file.c_str(), result.ovf, 0644)))
		return rc;

	params.rhv_cluster_uuid = m_precheck.rhv_cluster_uuid;
	files.push_back(ovf_file);
	if ((rc = run_helper(m_createvm_script, params, "createvm.json",
			files, -1, &retcode))) {
		logger(LOG_ERR, "%s", getError());
		return putErr(UPL_ERR_FINALIZE, UPL_MSG_CREATEVM);
	}
	if (retcode)
		return putErr(UPL_ERR_FINALIZE, UPL_MSG_CREATEVM);

	/* success, keep the disks */
	erase();

	result.vm_uuid = ids.vm_uuid;
	result.image_uuids = ids.image_uuids;
	result.vol_uuids = ids.vol_uuids;
	m_result = result;
	vm_id = ids.vm_uuid;
	logger(LOG_INFO, "virtual machine %s (%s) created", source.name.c_str(),
		vm_id.c_str());
	END_STAGE();
	return 0;
}

void RhvUpload::stop_backends()
{
	for (size_t i = 0; i < m_targets.size(); i++) {
		if (m_targets[i].pid <= 0)
			continue;
		logger(LOG_DEBUG, UPL_MSG_RST_KILL, m_targets[i].pid);
		term_clean(m_targets[i].pid, 5);
		m_targets[i].pid = -1;
	}
}

int RhvUpload::delete_disks()
{
	int rc, retcode;
	rhv_helper_params params = m_params;

	params.disk_uuids = m_disk_uuids;
	if ((rc = run_helper(m_deletedisks_script, params, "deletedisks.json",
			vector<string>(), -1, &retcode)))
		return rc;
	/* failure path already, nothing else to do */
	if (retcode)
		logger(LOG_WARNING, "%s exited with code %d, orphan disks may remain",
			m_deletedisks_script.name(), retcode);
	return 0;
}

int RhvUpload::clean_deleteDisks(const void * arg, const void *)
{
	RhvUpload *u = (RhvUpload *)arg;

	/* transfers must be closed before the disks can be deleted */
	u->stop_backends();
	if (u->m_disk_uuids.empty())
		return 0;
	logger(LOG_INFO, UPL_MSG_RST_DELETE, u->m_disk_uuids.size());
	return u->delete_disks();
}

int RhvUpload::clean_stopBackends(const void * arg, const void *)
{
	((RhvUpload *)arg)->stop_backends();
	return 0;
}

int create_rhv_upload(const upl_output_args &args, const upl_data &conf,
		OutputModule **module)
{
	int rc;
	rhv_options opts;
	RhvUpload *u;

	if ((rc = parse_output_options(args.options, opts)))
		return rc;

	u = new RhvUpload(args, opts, conf);
	if ((rc = u->init())) {
		delete u;
		return rc;
	}
	*module = u;
	return 0;
}
