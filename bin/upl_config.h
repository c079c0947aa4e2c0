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

#ifndef __UPL_CONFIG_H_
#define __UPL_CONFIG_H_

#include <string>

#include "common.h"
#include "bincom.h"

#define UPL_CONF_NBDKIT			"NBDKIT"
#define UPL_CONF_NBDKIT_PYTHON_PLUGIN	"NBDKIT_PYTHON_PLUGIN"
#define UPL_CONF_PYTHON			"PYTHON"
#define UPL_CONF_HELPERS_DIR		"HELPERS_DIR"
#define UPL_CONF_QEMU_IMG		"QEMU_IMG"
#define UPL_CONF_CHCON			"CHCON"
#define UPL_CONF_TMPDIR			"TMPDIR"
#define UPL_CONF_FINALIZATION_TIMEOUT	"FINALIZATION_TIMEOUT"
#define UPL_CONF_PIDFILE_TIMEOUT	"PIDFILE_TIMEOUT"
#define UPL_CONF_NBDKIT_THREADS		"NBDKIT_THREADS"
#define UPL_CONF_SELINUX		"SELINUX"

/* Wait for the disk id file of an uploaded disk, in seconds */
#define DEF_FINALIZATION_TIMEOUT	300
/* Wait for the nbdkit pid file, in seconds */
#define DEF_PIDFILE_TIMEOUT		30
#define DEF_NBDKIT_THREADS		8

enum {
	UPL_SELINUX_AUTO = 0,
	UPL_SELINUX_YES,
	UPL_SELINUX_NO,
};

/*
 * Global upload config: external programs and timeouts.
 */
struct upl_data {
public:
	upl_data()
		: nbdkit(BIN_NBDKIT)
		, nbdkit_python_plugin("python")
		, python(BIN_PYTHON)
		, helpers_dir(UPL_HELPERS_DIR)
		, qemu_img(BIN_QEMU_IMG)
		, chcon(BIN_CHCON)
		, tmpdir(UPL_TMP_DIR)
		, finalization_timeout(DEF_FINALIZATION_TIMEOUT)
		, pidfile_timeout(DEF_PIDFILE_TIMEOUT)
		, nbdkit_threads(DEF_NBDKIT_THREADS)
		, selinux(UPL_SELINUX_AUTO)
	{
	}

public:
	std::string nbdkit;
	std::string nbdkit_python_plugin;
	std::string python;
	std::string helpers_dir;
	std::string qemu_img;
	std::string chcon;
	std::string tmpdir;
	int finalization_timeout;
	int pidfile_timeout;
	int nbdkit_threads;
	int selinux;
};

/*
 * Read global upload config <path>. Absent keys keep their defaults.
 * If <path> is NULL the default config is read, and it is not an error
 * when the default config does not exist.
 */
int upl_data_load(const char *path, struct upl_data *upl);

#endif
