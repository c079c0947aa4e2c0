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
 * -o rhv-upload output options
 */

#ifndef __RHVOPTIONS_H__
#define __RHVOPTIONS_H__

#include <string>
#include <vector>
#include <boost/optional.hpp>

#include "bincom.h"

#define RHV_NIL_UUID		"00000000-0000-0000-0000-000000000000"
#define RHV_DEFAULT_CLUSTER	"Default"

struct rhv_options
{
	boost::optional<string> rhv_cafile;
	boost::optional<string> rhv_cluster;
	bool rhv_direct;
	bool rhv_verifypeer;
	/* in the order given, first one is for disk 0 */
	boost::optional<vector<string> > rhv_disk_uuids;

	rhv_options() : rhv_direct(false), rhv_verifypeer(false) {}
};

void print_output_options();

/* 8-4-4-4-12 hex digits and not the nil uuid */
bool is_nonnil_uuid(const char *uuid);

/* true|false, yes|no, on|off, 1|0, an empty value is true */
int parse_bool_option(const char *key, const string &value, bool *out);

int parse_output_options(const OutputOptEntries &options, rhv_options &opts);

/* check that <path> is a readable PEM bundle with at least one certificate */
int check_cafile(const char *path);

#endif
