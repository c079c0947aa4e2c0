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
 * Converted guest description
 */

#ifndef __GUEST_H__
#define __GUEST_H__

#include <string>
#include <vector>

#include "bincom.h"

enum target_firmware {
	TARGET_BIOS = 0,
	TARGET_UEFI,
};

const char *firmware_name(int firmware);

/* converted disk image, ready to be copied */
struct upl_disk
{
	int id;
	/* local image and its format */
	string path;
	string format;
	unsigned long long virtual_size;
	/* raw or qcow2, format of the disk on the target storage */
	string target_format;

	upl_disk() : id(0), virtual_size(0) {}
};

struct upl_source
{
	string name;
	string arch;
	int firmware;
	unsigned long long memory;
	int vcpus;
	vector<upl_disk> disks;

	upl_source() : firmware(TARGET_BIOS), memory(0), vcpus(1) {}
};

/*
 * Load guest description from JSON file <path>. If <output_format> is not
 * empty it is the target format of all disks, else the target format
 * of a disk defaults to its source format.
 */
int load_guest(const char *path, const string &output_format, upl_source &source);

#endif
