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
 * Test helpers
 */

#ifndef __TEST_UTIL_H__
#define __TEST_UTIL_H__

#include <string>
#include <vector>

#include "common.h"
#include "upl_config.h"
#include "guest.h"
#include "outrhvupload.h"

extern int test_failures;

#define CHECK(cond) do {						\
	if (!(cond)) {							\
		fprintf(stderr, "%s:%d: CHECK(%s) failed\n",		\
			__FILE__, __LINE__, #cond);			\
		test_failures++;					\
	}								\
} while (0)

#define CHECK_EQ(a, b) do {						\
	if (!((a) == (b))) {						\
		fprintf(stderr, "%s:%d: CHECK_EQ(%s, %s) failed\n",	\
			__FILE__, __LINE__, #a, #b);			\
		test_failures++;					\
	}								\
} while (0)

/* rc must be <code>, print the last error otherwise */
#define CHECK_RC(expr, code) do {					\
	int __rc = (expr);						\
	if (__rc != (code)) {						\
		fprintf(stderr, "%s:%d: %s returned %d, expected %d: %s\n", \
			__FILE__, __LINE__, #expr, __rc, (code), getError()); \
		test_failures++;					\
	}								\
} while (0)

#define RUN_TEST(fn) do {						\
	int __before = test_failures;					\
	fn();								\
	fprintf(stderr, "%s %s\n",					\
		test_failures == __before ? "PASS" : "FAIL", #fn);	\
} while (0)

#define TEST_RESULT() (test_failures ? 1 : 0)

/*
 * Scratch directory with fake python, nbdkit, qemu-img, chcon and helper
 * scripts, and a config pointing to them. The fakes are tuned through
 * FAKE_* environment variables and append their calls to <log>.
 */
struct test_env
{
	string dir;
	string log;
	upl_data conf;
};

int test_env_init(test_env &env);
void test_env_clean(test_env &env);

/* unset all FAKE_* tuning variables */
void test_env_reset();

void write_script(const string &path, const string &body);
string read_file(const string &path);
bool file_exists(const string &path);
/* lines of <env.log> that start with <prefix> */
vector<string> log_lines(const test_env &env, const string &prefix);

/* guest with <formats.size()> disks of the given formats */
upl_source make_guest(const string &name, const string &arch,
		const vector<string> &formats);

/* -o rhv-upload arguments as parse_options() would pass them */
upl_output_args make_output_args(const string &alloc,
		const OutputOptEntries &options = OutputOptEntries());

/* session on <env.conf>, NULL with the error reported on failure */
RhvUpload *make_upload(test_env &env, const upl_output_args &args);

/* targets as the orchestrator builds them from <source> */
vector<upl_target> make_targets(const upl_source &source);

#endif
