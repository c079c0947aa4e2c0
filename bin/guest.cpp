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

#include <set>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/foreach.hpp>

#include "common.h"
#include "guest.h"

const char *firmware_name(int firmware)
{
	return (firmware == TARGET_UEFI) ? "uefi" : "bios";
}

static int parse_firmware(const string &str, int *firmware)
{
	if (str == "bios")
		*firmware = TARGET_BIOS;
	else if (str == "uefi")
		*firmware = TARGET_UEFI;
	else
		return -1;
	return 0;
}

int load_guest(const char *path, const string &output_format, upl_source &source)
{
	boost::property_tree::ptree pt;
	upl_source s;

	try {
		boost::property_tree::read_json(path, pt);

		s.name = pt.get<string>("name");
		s.arch = pt.get<string>("arch");
		if (parse_firmware(pt.get<string>("firmware", "bios"), &s.firmware))
			return putErr(UPL_ERR_CONFIG, "%s: unknown firmware '%s'",
				path, pt.get<string>("firmware").c_str());
		s.memory = pt.get<unsigned long long>("memory", 1024ULL * 1024 * 1024);
		s.vcpus = pt.get<int>("vcpus", 1);

		boost::optional<boost::property_tree::ptree &> disks =
			pt.get_child_optional("disks");
		if (disks) {
			BOOST_FOREACH(boost::property_tree::ptree::value_type &v, *disks) {
				upl_disk d;

				d.id = v.second.get<int>("id", (int)s.disks.size());
				d.path = v.second.get<string>("path");
				d.format = v.second.get<string>("format");
				d.virtual_size = v.second.get<unsigned long long>("virtual_size");
				if (!output_format.empty())
					d.target_format = output_format;
				else
					d.target_format = v.second.get<string>("target_format", d.format);
				s.disks.push_back(d);
			}
		}
	} catch (const boost::property_tree::ptree_error &e) {
		return putErr(UPL_ERR_CONFIG, "can not load guest description %s : %s",
			path, e.what());
	}

	if (s.name.empty())
		return putErr(UPL_ERR_CONFIG, "%s: empty guest name", path);

	/* ids name the per-disk sockets and markers */
	std::set<int> ids;
	for (size_t i = 0; i < s.disks.size(); i++) {
		if (s.disks[i].id < 0)
			return putErr(UPL_ERR_CONFIG, "%s: invalid disk id %d",
				path, s.disks[i].id);
		if (!ids.insert(s.disks[i].id).second)
			return putErr(UPL_ERR_CONFIG, "%s: duplicate disk id %d",
				path, s.disks[i].id);
	}

	source = s;
	logger(LOG_DEBUG, "guest %s (%s, %s): %zu disk(s)", source.name.c_str(),
		source.arch.c_str(), firmware_name(source.firmware), source.disks.size());
	return 0;
}
