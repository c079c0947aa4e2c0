/* $Id$
 *
 * Copyright (c) 2006-2016 Parallels IP Holdings GmbH
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
 * Our contact details: Parallels IP Holdings GmbH, Vordergasse 59, 8200
 * Schaffhausen, Switzerland.
 *
 */
#include <getopt.h>
#include <sys/types.h>

#include "common.h"
#include "util.h"
#include "bincom.h"
#include "output.h"

int terminated = 0;
static void sighandler(int signum)
{
	signal(signum, SIG_IGN);
	// send signal to all processes in group, nbdkit included
	kill(0, signum);
	terminated = 1;
}

int init_sig_handlers(__sighandler_t handler)
{
	struct sigaction sigact;

	sigact.sa_flags = 0;
	sigemptyset(&sigact.sa_mask);

	sigact.sa_handler = handler ?: sighandler;
	sigaction(SIGTERM, &sigact, NULL);
	sigaction(SIGINT, &sigact, NULL);

	sigact.sa_handler = SIG_IGN;
	sigaction(SIGPIPE, &sigact, NULL);
	return 0;
}

CUploadOptions UPLoptions;
CUploadOptions::CUploadOptions()
{
	output_alloc = "sparse";
	list_options = 0;
}

static const char * prog_name = BNAME_UPLOAD;

#define UPLOAD_USAGE									\
"Usage: %s [OPTIONS] -o <module> -oc <url> -op <password file> -os <storage>\n"	\
"          --guest <guest.json>\n"							\
"       %s -o <module> --list-options\n"						\
"Upload the disks of a converted guest to a virtualization manager and\n"	\
"register the guest there.\n\n"							\
"  -h, --help                 Get usage info.\n"					\
"  -o <module>                Output module.\n"					\
"  -oa sparse|preallocated    Allocation policy of the target disks.\n"		\
"  -oc <url>                  Manager API URL.\n"				\
"  -of raw|qcow2              Format of the target disks.\n"			\
"  -oo <key>[=<value>]        Output module specific option, may be repeated.\n"	\
"  -op <file>                 File with the password of the manager user.\n"	\
"  -os <storage>              Target storage domain.\n"				\
"      --guest <file>         JSON description of the guest and its disks.\n"	\
"      --config <file>        Use <file> instead of " UPL_CONF_FILE ".\n"		\
"      --list-options         List -oo options of the output module.\n"	\
"  -v, --verbose              Print verbose information.\n\n"			\
"Output modules:"

static void usage()
{
	vector<string> names;

	fprintf(stderr, UPLOAD_USAGE, prog_name, prog_name);
	output_module_names(names);
	for (size_t i = 0; i < names.size(); i++)
		fprintf(stderr, " %s", names[i].c_str());
	fprintf(stderr, "\n");

	exit(-UPL_ERR_USAGE);
}

#define OUTPUT_OPTS		1
#define OUTPUT_ALLOC_OPTS	2
#define OUTPUT_CONN_OPTS	3
#define OUTPUT_FORMAT_OPTS	4
#define OUTPUT_OO_OPTS		5
#define OUTPUT_PASSWD_OPTS	6
#define OUTPUT_STORAGE_OPTS	7
#define GUEST_OPTS		8
#define CONFIG_OPTS		9
#define LIST_OPTIONS_OPTS	10

/* split -oo key[=value], a missing value is an empty string */
static void add_output_option(const char *arg)
{
	const char *p;
	string key, value;

	if ((p = strchr(arg, '=')) == NULL) {
		key = arg;
	} else {
		key.assign(arg, p - arg);
		value = p + 1;
	}
	if (key.empty()) {
		logger(LOG_ERR, "invalid -oo option '%s'", arg);
		usage();
	}
	UPLoptions.output_options.push_back(make_pair(key, value));
}

void parse_options (int argc, char **argv)
{
	int c;

	static char short_options[] = "hv";

	/* single-dash long options, for getopt_long_only() */
	static struct option long_options[] =
	    {
		    {"o", required_argument, NULL, OUTPUT_OPTS},
		    {"oa", required_argument, NULL, OUTPUT_ALLOC_OPTS},
		    {"oc", required_argument, NULL, OUTPUT_CONN_OPTS},
		    {"of", required_argument, NULL, OUTPUT_FORMAT_OPTS},
		    {"oo", required_argument, NULL, OUTPUT_OO_OPTS},
		    {"op", required_argument, NULL, OUTPUT_PASSWD_OPTS},
		    {"os", required_argument, NULL, OUTPUT_STORAGE_OPTS},
		    {"guest", required_argument, NULL, GUEST_OPTS},
		    {"config", required_argument, NULL, CONFIG_OPTS},
		    {"list-options", no_argument, NULL, LIST_OPTIONS_OPTS},
		    {"help", no_argument, NULL, 'h'},
		    {"verbose", no_argument, NULL, 'v'},
		    {0, 0, 0, 0}
	    };
	prog_name = argv[0];

	while ((c = getopt_long_only(argc, argv, short_options,
	                        long_options, NULL)) != -1)
	{
		switch (c)
		{
		case OUTPUT_OPTS:
			if (!UPLoptions.output.empty()) {
				logger(LOG_ERR, "-o option used more than once");
				usage();
			}
			UPLoptions.output = optarg;
			break;

		case OUTPUT_ALLOC_OPTS:
			if (strcmp(optarg, "sparse") && strcmp(optarg, "preallocated")) {
				logger(LOG_ERR, "-oa option must be 'sparse' or 'preallocated'");
				usage();
			}
			UPLoptions.output_alloc = optarg;
			break;

		case OUTPUT_CONN_OPTS:
			UPLoptions.output_conn = optarg;
			break;

		case OUTPUT_FORMAT_OPTS:
			UPLoptions.output_format = optarg;
			break;

		case OUTPUT_OO_OPTS:
			add_output_option(optarg);
			break;

		case OUTPUT_PASSWD_OPTS:
			UPLoptions.output_password = optarg;
			break;

		case OUTPUT_STORAGE_OPTS:
			UPLoptions.output_storage = optarg;
			break;

		case GUEST_OPTS:
			UPLoptions.guest_file = optarg;
			break;

		case CONFIG_OPTS:
			UPLoptions.config_file = optarg;
			break;

		case LIST_OPTIONS_OPTS:
			UPLoptions.list_options = 1;
			break;

		case 'v':
			debug_level = LOG_DEBUG;
			break;

		case 'h':
		default:
			usage();
		}
	}

	if (optind < argc) {
		logger(LOG_ERR, "unexpected argument '%s'", argv[optind]);
		usage();
	}

	if (UPLoptions.output.empty()) {
		logger(LOG_ERR, "output module is not specified, use -o");
		usage();
	}
	if (find_output_module(UPLoptions.output.c_str()) == NULL) {
		logger(LOG_ERR, "unknown output module '%s'",
			UPLoptions.output.c_str());
		usage();
	}
	if (UPLoptions.list_options)
		return;

	if (UPLoptions.output_conn.empty()) {
		logger(LOG_ERR, "-o %s: output connection was not specified, use '-oc'",
			UPLoptions.output.c_str());
		usage();
	}
	if (UPLoptions.output_password.empty()) {
		logger(LOG_ERR, "-o %s: output password file was not specified, use '-op'",
			UPLoptions.output.c_str());
		usage();
	}
	if (UPLoptions.output_storage.empty()) {
		logger(LOG_ERR, "-o %s: output storage was not specified, use '-os'",
			UPLoptions.output.c_str());
		usage();
	}
	if (UPLoptions.guest_file.empty()) {
		logger(LOG_ERR, "guest description is not specified, use --guest");
		usage();
	}
}

ExecveArrayWrapper::ExecveArrayWrapper(const std::vector<std::string>& array)
{
	m_count = (array.size() + 1);
	m_array = new char* [m_count];

	for (size_t i = 0; i < array.size(); ++i) {
		m_array[i] = new char [array[i].size() + 1];
		strncpy(m_array[i], array[i].c_str(), array[i].size() + 1);
	}
	m_array[array.size()] = NULL;
}

ExecveArrayWrapper::~ExecveArrayWrapper()
{
	for (size_t i = 0; i < m_count; ++i) {
		delete [] m_array[i];
	}
	delete [] m_array;
}
