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
#ifndef _BINCOM_H_
#define _BINCOM_H_

#include <signal.h>
#include <stdarg.h>

#include <string>
#include <vector>
#include <utility>
using namespace std;

#define BNAME_UPLOAD		"v2vupload"

#include "common.h"
#include "util.h"

#define INIT_BIN(debuglevel, logname) do {	\
	debug_level = debuglevel;		\
	open_logger(logname);			\
} while (0)

int init_sig_handlers(__sighandler_t handler = NULL);
void parse_options (int argc, char **argv);

/* -oo key=value as given on the command line */
typedef vector<pair<string, string> > OutputOptEntries;

struct CUploadOptions
{
	/* -o */
	string output;
	/* -oa sparse|preallocated */
	string output_alloc;
	/* -oc */
	string output_conn;
	/* -op */
	string output_password;
	/* -os */
	string output_storage;
	/* -of, empty to keep the format of each disk */
	string output_format;
	OutputOptEntries output_options;
	string guest_file;
	string config_file;
	int list_options;

	CUploadOptions();
};

extern CUploadOptions UPLoptions;


#define BIN_PYTHON	"python3"
#define BIN_NBDKIT	"nbdkit"
#define BIN_QEMU_IMG	"qemu-img"
#define BIN_CHCON	"chcon"

/*
 * Helper class to simplify construction of argv or envp arguments for execve
 * and similar functions.
 */
class ExecveArrayWrapper {
public:
	ExecveArrayWrapper(const std::vector<std::string>& array);
	~ExecveArrayWrapper();
	char *const * getArray() const { return m_array; }
private:
	// Forbidden class methods
	ExecveArrayWrapper(const ExecveArrayWrapper&);
	ExecveArrayWrapper& operator =(const ExecveArrayWrapper&);
private:
	size_t m_count;
	char** m_array;
};

#endif
