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

#include <string.h>

#include "util.h"
#include "guest.h"

#define GUEST_JSON \
"{\n" \
"  \"name\": \"web01\",\n" \
"  \"arch\": \"x86_64\",\n" \
"  \"firmware\": \"uefi\",\n" \
"  \"memory\": 4294967296,\n" \
"  \"vcpus\": 4,\n" \
"  \"disks\": [\n" \
"    { \"id\": 0, \"path\": \"/var/tmp/web01-sda\", \"format\": \"raw\",\n" \
"      \"virtual_size\": 10737418240 },\n" \
"    { \"id\": 1, \"path\": \"/var/tmp/web01-sdb\", \"format\": \"qcow2\",\n" \
"      \"virtual_size\": 1073741824, \"target_format\": \"raw\" }\n" \
"  ]\n" \
"}\n"

static void test_load()
{
	test_env env;
	upl_source s;
	string path;

	CHECK_RC(test_env_init(env), 0);
	path = env.dir + "/guest.json";
	write_script(path, GUEST_JSON);

	CHECK_RC(load_guest(path.c_str(), "", s), 0);
	CHECK_EQ(s.name, "web01");
	CHECK_EQ(s.arch, "x86_64");
	CHECK_EQ(s.firmware, (int)TARGET_UEFI);
	CHECK_EQ(s.memory, 4294967296ULL);
	CHECK_EQ(s.vcpus, 4);
	CHECK_EQ(s.disks.size(), 2u);
	if (s.disks.size() == 2) {
		CHECK_EQ(s.disks[0].path, "/var/tmp/web01-sda");
		CHECK_EQ(s.disks[0].virtual_size, 10737418240ULL);
		/* target format defaults to the source one */
		CHECK_EQ(s.disks[0].target_format, "raw");
		CHECK_EQ(s.disks[1].id, 1);
		CHECK_EQ(s.disks[1].format, "qcow2");
		CHECK_EQ(s.disks[1].target_format, "raw");
	}

	/* -of wins for every disk */
	CHECK_RC(load_guest(path.c_str(), "qcow2", s), 0);
	for (size_t i = 0; i < s.disks.size(); i++)
		CHECK_EQ(s.disks[i].target_format, "qcow2");

	test_env_clean(env);
}

static void test_invalid()
{
	test_env env;
	upl_source s;
	string path;

	CHECK_RC(test_env_init(env), 0);
	path = env.dir + "/guest.json";

	s.name = "untouched";
	write_script(path, "{ \"arch\": \"x86_64\" }\n");
	CHECK_RC(load_guest(path.c_str(), "", s), UPL_ERR_CONFIG);
	CHECK_EQ(s.name, "untouched");

	write_script(path, "{ \"name\": \"a\", \"arch\": \"x86_64\", "
		"\"firmware\": \"coreboot\" }\n");
	CHECK_RC(load_guest(path.c_str(), "", s), UPL_ERR_CONFIG);

	write_script(path, "{ \"name\": \"a\", \"arch\": \"x86_64\", "
		"\"disks\": [ { \"path\": \"/x\" } ] }\n");
	CHECK_RC(load_guest(path.c_str(), "", s), UPL_ERR_CONFIG);

	write_script(path, "{ \"name\": ");
	CHECK_RC(load_guest(path.c_str(), "", s), UPL_ERR_CONFIG);

	CHECK_RC(load_guest((env.dir + "/missing.json").c_str(), "", s),
		UPL_ERR_CONFIG);

	s.name = "untouched";
	write_script(path, "{ \"name\": \"a\", \"arch\": \"x86_64\", \"disks\": [\n"
		"  { \"id\": 3, \"path\": \"/x\", \"format\": \"raw\", \"virtual_size\": 1 },\n"
		"  { \"id\": 3, \"path\": \"/y\", \"format\": \"raw\", \"virtual_size\": 1 } ] }\n");
	CHECK_RC(load_guest(path.c_str(), "", s), UPL_ERR_CONFIG);
	CHECK(strstr(getError(), "duplicate disk id 3") != NULL);
	CHECK_EQ(s.name, "untouched");

	/* an explicit id may clash with a defaulted one */
	write_script(path, "{ \"name\": \"a\", \"arch\": \"x86_64\", \"disks\": [\n"
		"  { \"path\": \"/x\", \"format\": \"raw\", \"virtual_size\": 1 },\n"
		"  { \"id\": 0, \"path\": \"/y\", \"format\": \"raw\", \"virtual_size\": 1 } ] }\n");
	CHECK_RC(load_guest(path.c_str(), "", s), UPL_ERR_CONFIG);

	write_script(path, "{ \"name\": \"a\", \"arch\": \"x86_64\", \"disks\": [\n"
		"  { \"id\": -1, \"path\": \"/x\", \"format\": \"raw\", \"virtual_size\": 1 } ] }\n");
	CHECK_RC(load_guest(path.c_str(), "", s), UPL_ERR_CONFIG);
	CHECK(strstr(getError(), "invalid disk id -1") != NULL);

	/* ids need not be dense */
	write_script(path, "{ \"name\": \"a\", \"arch\": \"x86_64\", \"disks\": [\n"
		"  { \"id\": 5, \"path\": \"/x\", \"format\": \"raw\", \"virtual_size\": 1 },\n"
		"  { \"id\": 2, \"path\": \"/y\", \"format\": \"raw\", \"virtual_size\": 1 } ] }\n");
	CHECK_RC(load_guest(path.c_str(), "", s), 0);
	CHECK_EQ(s.disks.size(), 2u);

	/* no disks at all is a valid guest */
	write_script(path, "{ \"name\": \"a\", \"arch\": \"x86_64\" }\n");
	CHECK_RC(load_guest(path.c_str(), "", s), 0);
	CHECK(s.disks.empty());
	CHECK_EQ(s.firmware, (int)TARGET_BIOS);

	test_env_clean(env);
}

int main()
{
	RUN_TEST(test_load);
	RUN_TEST(test_invalid);
	return TEST_RESULT();
}
