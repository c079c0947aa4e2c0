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

#include "common.h"
#include "util.h"
#include "imgcopy.h"

int copy_disk(const upl_data &conf, const upl_target &target,
		const string &transfer_format)
{
	int rc;
	vector<string> args;

	args.push_back(conf.qemu_img);
	args.push_back("convert");
	if (debug_level >= LOG_DEBUG)
		args.push_back("-p");
	/* target exists already, it is the nbdkit export */
	args.push_back("-n");
	args.push_back("-f");
	args.push_back(target.disk.format);
	args.push_back("-O");
	args.push_back(transfer_format);
	args.push_back(target.disk.path);
	args.push_back(target.target_uri);
	ExecveArrayWrapper argv(args);

	logger(LOG_INFO, "Copying disk %d (%s) to %s", target.disk.id,
		target.disk.path.c_str(), target.target_format.c_str());
	if ((rc = upl_execve(argv.getArray(), NULL, -1, -1, NULL))) {
		string err = getError();
		return putErr(UPL_ERR_COPY, "copy of disk %d failed: %s",
			target.disk.id, err.c_str());
	}
	return 0;
}
