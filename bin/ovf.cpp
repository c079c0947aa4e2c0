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

#include <time.h>
#include <sstream>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>

#include "common.h"
#include "ovf.h"

using boost::property_tree::ptree;

#define OVF_NS		"http://schemas.dmtf.org/ovf/envelope/1/"
#define OVF_RASD_NS	"http://schemas.dmtf.org/wbem/wscim/1/cim-schema/2/" \
			"CIM_ResourceAllocationSettingData"
#define OVF_VSSD_NS	"http://schemas.dmtf.org/wbem/wscim/1/cim-schema/2/" \
			"CIM_VirtualSystemSettingData"
#define OVF_XSI_NS	"http://www.w3.org/2001/XMLSchema-instance"
#define OVF_OVIRT_NS	"http://www.ovirt.org/ovf"

#define GiB		(1024ULL * 1024 * 1024)
#define MiB		(1024ULL * 1024)

template <typename T>
static string to_str(T val)
{
	std::ostringstream s;
	s << val;
	return s.str();
}

static string now_str()
{
	char buf[64];
	time_t t = time(NULL);
	struct tm tm;

	gmtime_r(&t, &tm);
	strftime(buf, sizeof(buf), "%Y/%m/%d %H:%M:%S", &tm);
	return buf;
}

static ptree section(const char *type, const char *info)
{
	ptree s;

	s.put("<xmlattr>.xsi:type", type);
	s.put("Info", info);
	return s;
}

static ptree hw_item(const string &caption, const string &instance, int type)
{
	ptree item;

	item.put("rasd:Caption", caption);
	item.put("rasd:InstanceId", instance);
	item.put("rasd:ResourceType", type);
	return item;
}

int OVirtOvfBuilder::build(const upl_source &source,
		const vector<upl_target> &targets,
		int firmware,
		const ovf_ids &ids,
		string &ovf)
{
	ptree doc;
	ptree &env = doc.add_child("ovf:Envelope", ptree());
	ptree refs, disks, content, hw;
	string created = now_str();

	if (ids.image_uuids.size() != targets.size() ||
			ids.vol_uuids.size() != targets.size())
		return putErr(UPL_ERR_FINALIZE,
			"OVF: %zu target(s) but %zu image and %zu volume id(s)",
			targets.size(), ids.image_uuids.size(), ids.vol_uuids.size());

	env.put("<xmlattr>.xmlns:rasd", OVF_RASD_NS);
	env.put("<xmlattr>.xmlns:vssd", OVF_VSSD_NS);
	env.put("<xmlattr>.xmlns:xsi", OVF_XSI_NS);
	env.put("<xmlattr>.xmlns:ovf", OVF_NS);
	env.put("<xmlattr>.xmlns:ovirt", OVF_OVIRT_NS);
	env.put("<xmlattr>.ovf:version", "0.9");

	disks = section("ovf:DiskSection_Type", "List of Virtual Disks");
	for (size_t i = 0; i < targets.size(); i++) {
		const upl_target &t = targets[i];
		string ref = ids.image_uuids[i] + "/" + ids.vol_uuids[i];
		unsigned long long size_gb = (t.disk.virtual_size + GiB - 1) / GiB;

		ptree file;
		file.put("<xmlattr>.ovf:href", ref);
		file.put("<xmlattr>.ovf:id", ids.vol_uuids[i]);
		file.put("<xmlattr>.ovf:size", t.disk.virtual_size);
		file.put("<xmlattr>.ovf:description", source.name);
		refs.add_child("File", file);

		ptree disk;
		disk.put("<xmlattr>.ovf:diskId", ids.vol_uuids[i]);
		disk.put("<xmlattr>.ovf:size", size_gb);
		disk.put("<xmlattr>.ovf:capacity", t.disk.virtual_size);
		disk.put("<xmlattr>.ovf:fileRef", ref);
		disk.put("<xmlattr>.ovf:parentRef", "");
		disk.put("<xmlattr>.ovf:vm_snapshot_id", ids.vm_uuid);
		disk.put("<xmlattr>.ovf:volume-format",
			t.target_format == "qcow2" ? "COW" : "RAW");
		disk.put("<xmlattr>.ovf:volume-type",
			ids.sparse ? "Sparse" : "Preallocated");
		disk.put("<xmlattr>.ovf:format", "http://en.wikipedia.org/wiki/Byte");
		disk.put("<xmlattr>.ovf:disk-interface", "VirtIO");
		disk.put("<xmlattr>.ovf:disk-type", "System");
		disk.put("<xmlattr>.ovf:boot", i == 0 ? "True" : "False");
		disks.add_child("Disk", disk);
	}
	env.add_child("References", refs);
	env.add_child("Section", section("ovf:NetworkSection_Type",
		"List of networks"));
	env.add_child("Section", disks);

	content.put("<xmlattr>.ovf:id", "out");
	content.put("<xmlattr>.xsi:type", "ovf:VirtualSystem_Type");
	content.put("Name", source.name);
	content.put("TemplateId", "00000000-0000-0000-0000-000000000000");
	content.put("TemplateName", "Blank");
	content.put("Description", "generated by " BNAME_UPLOAD);
	content.put("CreationDate", created);
	content.put("ExportDate", created);
	content.put("Origin", 1);
	content.put("VmType", 1);
	/* 1 i440fx with SeaBIOS, 3 q35 with OVMF */
	content.put("BiosType", firmware == TARGET_UEFI ? 3 : 1);

	ptree os = section("ovf:OperatingSystemSection_Type", "Guest Operating System");
	os.put("<xmlattr>.ovf:id", ids.vm_uuid);
	os.put("<xmlattr>.ovf:required", "false");
	os.put("Description", "other");
	content.add_child("Section", os);

	hw = section("ovf:VirtualHardwareSection_Type",
		(to_str(source.vcpus) + " CPU, " +
		 to_str(source.memory / MiB) + " Memory").c_str());
	hw.put("System.vssd:VirtualSystemType", "ENGINE 4.1.0.0");

	ptree cpu = hw_item(to_str(source.vcpus) + " virtual cpu", "1", 3);
	cpu.put("rasd:Description", "Number of virtual CPU");
	cpu.put("rasd:num_of_sockets", source.vcpus);
	cpu.put("rasd:cpu_per_socket", 1);
	cpu.put("rasd:threads_per_cpu", 1);
	hw.add_child("Item", cpu);

	ptree mem = hw_item(to_str(source.memory / MiB) + " MB of memory", "2", 4);
	mem.put("rasd:Description", "Memory Size");
	mem.put("rasd:AllocationUnits", "MegaBytes");
	mem.put("rasd:VirtualQuantity", source.memory / MiB);
	hw.add_child("Item", mem);

	for (size_t i = 0; i < targets.size(); i++) {
		ptree d = hw_item("Drive " + to_str(i + 1), ids.vol_uuids[i], 17);
		d.put("rasd:HostResource", ids.image_uuids[i] + "/" + ids.vol_uuids[i]);
		d.put("rasd:Parent", "00000000-0000-0000-0000-000000000000");
		d.put("rasd:Template", "00000000-0000-0000-0000-000000000000");
		d.put("rasd:ApplicationList", "");
		d.put("rasd:StorageId", ids.sd_uuid);
		d.put("rasd:StoragePoolId", "00000000-0000-0000-0000-000000000000");
		d.put("rasd:CreationDate", created);
		d.put("rasd:LastModified", created);
		d.put("rasd:last_modified_date", created);
		d.put("Type", "disk");
		d.put("Device", "disk");
		d.put("rasd:Address", "");
		d.put("BootOrder", i == 0 ? 1 : 0);
		d.put("IsPlugged", "true");
		d.put("IsReadOnly", "false");
		hw.add_child("Item", d);
	}
	content.add_child("Section", hw);
	env.add_child("Content", content);

	try {
		std::ostringstream s;
		boost::property_tree::write_xml(s, doc,
			boost::property_tree::xml_writer_make_settings<string>(' ', 2));
		ovf = s.str();
	} catch (const boost::property_tree::xml_parser_error &e) {
		return putErr(UPL_ERR_FINALIZE, "can not build OVF : %s", e.what());
	}
	return 0;
}
