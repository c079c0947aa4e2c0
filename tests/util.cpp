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

#include <stdlib.h>
#include <sys/stat.h>
#include <fstream>
#include <sstream>

#include "util.h"
#include "../bin/util.h"

int test_failures = 0;

#define FAKE_PYTHON \
"#!/bin/sh\n" \
"echo \"python $*\" >> \"$FAKE_LOG\"\n" \
"if [ \"$1\" = \"-c\" ]; then\n" \
"	exit ${FAKE_SDK_RC:-0}\n" \
"fi\n" \
"exec /bin/sh \"$@\"\n"

#define FAKE_NBDKIT \
"#!/bin/sh\n" \
"case \"$1\" in\n" \
"--version)\n" \
"	[ -n \"$FAKE_NBDKIT_BROKEN\" ] && exit 1\n" \
"	echo \"nbdkit ${FAKE_NBDKIT_VERSION:-1.24.0}\"\n" \
"	exit 0;;\n" \
"--dump-config)\n" \
"	echo \"bindir=/usr/bin\"\n" \
"	echo \"version=${FAKE_NBDKIT_VERSION:-1.24.0}\"\n" \
"	echo \"selinux=${FAKE_NBDKIT_SELINUX:-yes}\"\n" \
"	exit 0;;\n" \
"esac\n" \
"if [ \"$3\" = \"--dump-plugin\" ]; then\n" \
"	echo \"plugin $*\" >> \"$FAKE_LOG\"\n" \
"	exit ${FAKE_PLUGIN_RC:-0}\n" \
"fi\n" \
"echo \"nbdkit $*\" >> \"$FAKE_LOG\"\n" \
"[ -n \"$FAKE_NBDKIT_NOSTART\" ] && exit 1\n" \
"while [ $# -gt 0 ]; do\n" \
"	case \"$1\" in\n" \
"	--pidfile) pidfile=\"$2\"; shift;;\n" \
"	--unix) sock=\"$2\"; shift;;\n" \
"	esac\n" \
"	shift\n" \
"done\n" \
": > \"$sock\"\n" \
"echo $$ > \"$pidfile\"\n" \
"exec sleep 60\n"

/* writes the disk id file of the plugin, disk <FAKE_COPY_FAIL> fails */
#define FAKE_QEMU_IMG \
"#!/bin/sh\n" \
"echo \"qemu-img $*\" >> \"$FAKE_LOG\"\n" \
"for uri; do :; done\n" \
"sock=$(echo \"$uri\" | sed 's/.*\"file.path\":\"\\([^\"]*\\)\".*/\\1/')\n" \
"id=$(basename \"$sock\" .sock)\n" \
"id=${id#nbdkit}\n" \
"[ \"$id\" = \"$FAKE_COPY_FAIL\" ] && exit 1\n" \
"printf 'dddddddd-0000-4000-8000-%012d\\n' \"$id\" > \"$(dirname \"$sock\")/diskid.$id\"\n" \
"exit 0\n"

#define FAKE_CHCON \
"#!/bin/sh\n" \
"echo \"chcon $*\" >> \"$FAKE_LOG\"\n" \
"exit 0\n"

#define FAKE_PRECHECK \
"echo \"precheck $*\" >> \"$FAKE_LOG\"\n" \
"cp \"$1\" \"$FAKE_DIR/precheck.params\"\n" \
"[ -n \"$FAKE_PRECHECK_FAIL\" ] && exit 1\n" \
"if [ -n \"$FAKE_PRECHECK_PARTIAL\" ]; then\n" \
"	echo '{\"rhv_storagedomain_uuid\": \"11111111-1111-1111-1111-111111111111\"}'\n" \
"	exit 0\n" \
"fi\n" \
"echo '{\"rhv_storagedomain_uuid\": \"11111111-1111-1111-1111-111111111111\", '" \
"'\"rhv_cluster_uuid\": \"22222222-2222-2222-2222-222222222222\", '" \
"\"\\\"rhv_cluster_cpu_architecture\\\": \\\"${FAKE_ARCH:-x86_64}\\\"}\"\n"

#define FAKE_VMCHECK \
"echo \"vmcheck $*\" >> \"$FAKE_LOG\"\n" \
"cp \"$1\" \"$FAKE_DIR/vmcheck.params\"\n" \
"exit ${FAKE_VMCHECK_RC:-0}\n"

#define FAKE_CREATEVM \
"echo \"createvm $*\" >> \"$FAKE_LOG\"\n" \
"cp \"$1\" \"$FAKE_DIR/createvm.params\"\n" \
"cp \"$2\" \"$FAKE_DIR/created.ovf\"\n" \
"exit ${FAKE_CREATEVM_RC:-0}\n"

#define FAKE_DELETEDISKS \
"echo \"deletedisks $*\" >> \"$FAKE_LOG\"\n" \
"cp \"$1\" \"$FAKE_DIR/deletedisks.params\"\n" \
"exit ${FAKE_DELETE_RC:-0}\n"

void write_script(const string &path, const string &body)
{
	std::ofstream out(path.c_str());

	out << body;
	out.close();
	chmod(path.c_str(), 0755);
}

string read_file(const string &path)
{
	string data;

	if (read_whole_file(path.c_str(), data))
		return "";
	return data;
}

bool file_exists(const string &path)
{
	struct stat st;

	return stat(path.c_str(), &st) == 0;
}

vector<string> log_lines(const test_env &env, const string &prefix)
{
	vector<string> lines;
	std::istringstream in(read_file(env.log));
	string line;

	while (std::getline(in, line))
		if (line.compare(0, prefix.size(), prefix) == 0)
			lines.push_back(line);
	return lines;
}

void test_env_reset()
{
	static const char *vars[] = {
		"FAKE_SDK_RC", "FAKE_NBDKIT_BROKEN", "FAKE_NBDKIT_VERSION",
		"FAKE_NBDKIT_SELINUX", "FAKE_PLUGIN_RC", "FAKE_NBDKIT_NOSTART",
		"FAKE_COPY_FAIL", "FAKE_PRECHECK_FAIL", "FAKE_PRECHECK_PARTIAL",
		"FAKE_ARCH", "FAKE_VMCHECK_RC", "FAKE_CREATEVM_RC",
		"FAKE_DELETE_RC", NULL
	};

	for (int i = 0; vars[i]; i++)
		unsetenv(vars[i]);
}

int test_env_init(test_env &env)
{
	int rc;
	char path[PATH_MAX + 1];
	string bin, helpers;

	if ((rc = make_tmp_dir("/tmp", "v2vupload-test.", path, sizeof(path))))
		return rc;
	env.dir = path;
	env.log = env.dir + "/calls.log";
	bin = env.dir + "/bin";
	helpers = env.dir + "/helpers";
	if ((rc = make_dir(bin.c_str(), 0755)) ||
			(rc = make_dir(helpers.c_str(), 0755)) ||
			(rc = make_dir((env.dir + "/tmp").c_str(), 0755)))
		return rc;

	write_script(bin + "/python", FAKE_PYTHON);
	write_script(bin + "/nbdkit", FAKE_NBDKIT);
	write_script(bin + "/qemu-img", FAKE_QEMU_IMG);
	write_script(bin + "/chcon", FAKE_CHCON);
	write_script(helpers + "/rhv-upload-precheck.py", FAKE_PRECHECK);
	write_script(helpers + "/rhv-upload-vmcheck.py", FAKE_VMCHECK);
	write_script(helpers + "/rhv-upload-plugin.py", "# upload plugin\n");
	write_script(helpers + "/rhv-upload-createvm.py", FAKE_CREATEVM);
	write_script(helpers + "/rhv-upload-deletedisks.py", FAKE_DELETEDISKS);

	env.conf = upl_data();
	env.conf.python = bin + "/python";
	env.conf.nbdkit = bin + "/nbdkit";
	env.conf.qemu_img = bin + "/qemu-img";
	env.conf.chcon = bin + "/chcon";
	env.conf.helpers_dir = helpers;
	env.conf.tmpdir = env.dir + "/tmp";
	env.conf.finalization_timeout = 5;
	env.conf.pidfile_timeout = 5;
	env.conf.selinux = UPL_SELINUX_NO;

	test_env_reset();
	setenv("FAKE_LOG", env.log.c_str(), 1);
	setenv("FAKE_DIR", env.dir.c_str(), 1);
	/* keep test output readable */
	debug_level = getenv("TEST_VERBOSE") ? LOG_DEBUG : LOG_ERR;
	return 0;
}

void test_env_clean(test_env &env)
{
	test_env_reset();
	if (!env.dir.empty())
		rmdir_recursively(env.dir.c_str());
	env.dir.clear();
}

upl_source make_guest(const string &name, const string &arch,
		const vector<string> &formats)
{
	upl_source s;

	s.name = name;
	s.arch = arch;
	s.firmware = TARGET_BIOS;
	s.memory = 2048ULL * 1024 * 1024;
	s.vcpus = 2;
	for (size_t i = 0; i < formats.size(); i++) {
		upl_disk d;

		d.id = (int)i;
		d.path = "/var/tmp/" + name + "-sd" + string(1, (char)('a' + i));
		d.format = formats[i];
		d.virtual_size = (i + 1) * 1024ULL * 1024 * 1024;
		d.target_format = formats[i];
		s.disks.push_back(d);
	}
	return s;
}

upl_output_args make_output_args(const string &alloc,
		const OutputOptEntries &options)
{
	upl_output_args args;

	args.output_alloc = alloc;
	args.output_conn = "https://engine.example.com/ovirt-engine/api";
	args.output_password = "/tmp/password";
	args.output_storage = "data";
	args.options = options;
	return args;
}

RhvUpload *make_upload(test_env &env, const upl_output_args &args)
{
	OutputModule *module = NULL;

	if (create_rhv_upload(args, env.conf, &module)) {
		fprintf(stderr, "create_rhv_upload: %s\n", getError());
		return NULL;
	}
	return (RhvUpload *)module;
}

vector<upl_target> make_targets(const upl_source &source)
{
	vector<upl_target> targets;

	for (size_t i = 0; i < source.disks.size(); i++) {
		upl_target t;

		t.disk = source.disks[i];
		t.target_format = source.disks[i].target_format;
		targets.push_back(t);
	}
	return targets;
}
