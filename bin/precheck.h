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
 * Local environment checks before an upload
 */

#ifndef __PRECHECK_H__
#define __PRECHECK_H__

#include <string>

#include "bincom.h"
#include "upl_config.h"
#include "nbdkit.h"

#define SELINUX_ENFORCE_FILE	"/sys/fs/selinux/enforce"

/*
 * Local environment confirmed by check_preconditions()
 */
struct upl_environment
{
	int nbdkit_version[3];
	/* nbdkit supports --selinux-label */
	bool nbdkit_selinux;
	bool python_found;
	/* socket labels must be set */
	bool have_selinux;

	upl_environment()
		: nbdkit_selinux(false), python_found(false), have_selinux(false)
	{
		nbdkit_version[0] = nbdkit_version[1] = nbdkit_version[2] = 0;
	}
};

/* SELINUX=auto from config is resolved through SELINUX_ENFORCE_FILE */
bool host_have_selinux(const upl_data &conf);

/*
 * Check in turn the python interpreter, the ovirtsdk4 module, nbdkit,
 * its version, its python plugin with <plugin_script>, its SELinux support
 * and <output_alloc>. Stops at the first failed check.
 */
int check_preconditions(const upl_data &conf, const string &plugin_script,
		const string &output_alloc, upl_environment &env);

#endif
