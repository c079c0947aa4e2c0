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
 * Guest metadata for the target
 */

#ifndef __OVF_H__
#define __OVF_H__

#include <string>
#include <vector>

#include "bincom.h"
#include "output.h"

/* identifiers of the created objects, one image and volume per target */
struct ovf_ids
{
	string sd_uuid;
	vector<string> image_uuids;
	vector<string> vol_uuids;
	string vm_uuid;
	bool sparse;

	ovf_ids() : sparse(true) {}
};

class OvfBuilder
{
public:
	virtual ~OvfBuilder() {}

	virtual int build(const upl_source &source,
			const vector<upl_target> &targets,
			int firmware,
			const ovf_ids &ids,
			string &ovf) = 0;
};

/*
 * OVF in the flavour oVirt engine imports: References, DiskSection and
 * VirtualSystem content.
 */
class OVirtOvfBuilder : public OvfBuilder
{
public:
	virtual int build(const upl_source &source,
			const vector<upl_target> &targets,
			int firmware,
			const ovf_ids &ids,
			string &ovf);
};

#endif
