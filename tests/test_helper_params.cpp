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

#include <sstream>
#include <json/json.h>

#include "util.h"
#include "helper.h"

static Json::Value parse(const string &json)
{
	Json::Value v;
	Json::CharReaderBuilder builder;
	string errs;
	std::istringstream in(json);

	if (!Json::parseFromStream(builder, in, &v, &errs)) {
		fprintf(stderr, "invalid JSON %s: %s\n", json.c_str(), errs.c_str());
		test_failures++;
	}
	return v;
}

static rhv_helper_params base()
{
	rhv_helper_params p;

	p.output_conn = "https://engine.example.com/ovirt-engine/api";
	p.output_password = "/tmp/passwd";
	p.output_storage = "data";
	p.rhv_cluster = "Default";
	return p;
}

static void test_invariant()
{
	rhv_helper_params p = base();
	Json::Value v = parse(p.to_json());

	CHECK(v["verbose"].isBool() && !v["verbose"].asBool());
	CHECK(v["output_sparse"].isBool() && v["output_sparse"].asBool());
	CHECK(v.isMember("rhv_cafile") && v["rhv_cafile"].isNull());
	CHECK(v["rhv_direct"].isBool() && !v["rhv_direct"].asBool());
	CHECK(v["insecure"].isBool() && v["insecure"].asBool());
	CHECK_EQ(v["output_conn"].asString(), p.output_conn);
	CHECK_EQ(v["output_storage"].asString(), "data");
	CHECK_EQ(v["rhv_cluster"].asString(), "Default");

	/* per-call fields are absent */
	CHECK(!v.isMember("output_name"));
	CHECK(!v.isMember("disk_size"));
	CHECK(!v.isMember("rhv_disk_uuids"));
	CHECK(!v.isMember("disk_uuids"));

	/* one line, the scripts read it with json.load() */
	CHECK(p.to_json().find('\n') == string::npos);
}

static void test_per_disk()
{
	rhv_helper_params p = base();

	p.rhv_cafile = string("/etc/pki/ovirt-engine/ca.pem");
	p.output_name = string("guest");
	p.disk_name = string("guest-000");
	p.disk_format = string("qcow2");
	p.disk_size = 10737418240ULL;
	p.diskid_file = string("/var/tmp/rhvupload.x/diskid.0");
	p.rhv_disk_uuid = string("0b0b6a8e-6a1c-4b57-8f3e-1c2a0e1c3a01");

	Json::Value v = parse(p.to_json());

	CHECK(v["disk_size"].isIntegral());
	CHECK_EQ(v["disk_size"].asUInt64(), (Json::UInt64)10737418240ULL);
	CHECK_EQ(v["rhv_cafile"].asString(), "/etc/pki/ovirt-engine/ca.pem");
	CHECK_EQ(v["output_name"].asString(), "guest");
	CHECK_EQ(v["disk_name"].asString(), "guest-000");
	CHECK_EQ(v["disk_format"].asString(), "qcow2");
	CHECK_EQ(v["diskid_file"].asString(), "/var/tmp/rhvupload.x/diskid.0");
	CHECK_EQ(v["rhv_disk_uuid"].asString(),
		"0b0b6a8e-6a1c-4b57-8f3e-1c2a0e1c3a01");
}

static void test_lists()
{
	rhv_helper_params p = base();
	vector<string> ids, got;

	ids.push_back("a");
	ids.push_back("b");
	p.disk_uuids = ids;
	p.rhv_disk_uuids = vector<string>();

	Json::Value v = parse(p.to_json());

	CHECK(v["rhv_disk_uuids"].isArray());
	CHECK_EQ(v["rhv_disk_uuids"].size(), 0u);
	CHECK(v["disk_uuids"].isArray());
	for (Json::ArrayIndex i = 0; i < v["disk_uuids"].size(); i++)
		got.push_back(v["disk_uuids"][i].asString());
	CHECK(got == ids);
}

static void test_flags()
{
	rhv_helper_params p = base();

	p.verbose = true;
	p.output_sparse = false;
	p.rhv_direct = true;
	p.insecure = false;

	Json::Value v = parse(p.to_json());
	CHECK(v["verbose"].isBool() && v["verbose"].asBool());
	CHECK(v["output_sparse"].isBool() && !v["output_sparse"].asBool());
	CHECK(v["rhv_direct"].isBool() && v["rhv_direct"].asBool());
	CHECK(v["insecure"].isBool() && !v["insecure"].asBool());
}

static void test_escaping()
{
	rhv_helper_params p = base();
	string json;

	p.output_storage = "odd \"name\"\\\n\t";
	CHECK_EQ(parse(p.to_json())["output_storage"].asString(),
		"odd \"name\"\\\n\t");

	p.output_storage = string("ctl\x01", 4);
	json = p.to_json();
	CHECK(json.find("\\u0001") != string::npos);
	CHECK_EQ(parse(json)["output_storage"].asString(), string("ctl\x01", 4));

	/* non-ASCII goes out escaped, broken UTF-8 never passes through raw */
	p.output_storage = "d\xc3\xa9j\xc3\xa0";
	json = p.to_json();
	CHECK(json.find("\xc3") == string::npos);
	CHECK_EQ(parse(json)["output_storage"].asString(), "d\xc3\xa9j\xc3\xa0");

	p.output_storage = "bad\xff\xfe";
	json = p.to_json();
	CHECK(json.find('\xff') == string::npos);
	CHECK(json.find('\xfe') == string::npos);
	parse(json);

	Json::Value uri(Json::objectValue);
	uri["file.path"] = "/tmp/x.sock";
	CHECK_EQ(json_write(uri), "{\"file.path\":\"/tmp/x.sock\"}");
}

static void test_run()
{
	test_env env;
	int retcode = -1;
	vector<string> files;
	rhv_helper_params p = base();

	CHECK_RC(test_env_init(env), 0);

	HelperScript createvm(env.conf, RHV_CREATEVM_SCRIPT);
	CHECK_EQ(createvm.path(), env.conf.helpers_dir + "/rhv-upload-createvm.py");

	write_script(env.dir + "/vm.ovf", "<ovf/>\n");
	files.push_back(env.dir + "/vm.ovf");
	p.rhv_cluster_uuid = string("22222222-2222-2222-2222-222222222222");
	CHECK_RC(createvm.run(p, env.dir + "/createvm.json", files, -1, &retcode), 0);
	CHECK_EQ(retcode, 0);
	CHECK_EQ(read_file(env.dir + "/created.ovf"), "<ovf/>\n");
	CHECK_EQ(parse(read_file(env.dir + "/createvm.params"))
		["rhv_cluster_uuid"].asString(), "22222222-2222-2222-2222-222222222222");

	setenv("FAKE_CREATEVM_RC", "3", 1);
	CHECK_RC(createvm.run(p, env.dir + "/createvm.json", files, -1, &retcode), 0);
	CHECK_EQ(retcode, 3);

	CHECK_RC(check_python_interpreter(env.conf), 0);
	env.conf.python = env.dir + "/no-such-python";
	CHECK_RC(check_python_interpreter(env.conf), UPL_ERR_ENVIRONMENT);

	test_env_clean(env);
}

int main()
{
	RUN_TEST(test_invariant);
	RUN_TEST(test_per_disk);
	RUN_TEST(test_lists);
	RUN_TEST(test_flags);
	RUN_TEST(test_escaping);
	RUN_TEST(test_run);
	return TEST_RESULT();
}
