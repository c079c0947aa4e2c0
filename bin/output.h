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
 * Output modules interface
 */

#ifndef __OUTPUT_H__
#define __OUTPUT_H__

#include <string>
#include <vector>

#include "bincom.h"
#include "upl_config.h"
#include "guest.h"

/* disk to copy and where to */
struct upl_target
{
	upl_disk disk;
	string target_format;
	/* image-copy target, set by prepare_targets() */
	string target_uri;
};

/* output arguments from the command line */
struct upl_output_args
{
	string output_alloc;
	string output_conn;
	string output_password;
	string output_storage;
	OutputOptEntries options;
};

/*
 * Output module: puts converted disks to a target and registers the guest
 * there. Calls go in order: precheck(), prepare_targets(), disk_copied()
 * for each disk after copying, create_metadata().
 */
class OutputModule
{
public:
	virtual ~OutputModule() {}

	virtual int precheck() = 0;

	/* command line options to repeat this output */
	virtual string as_options() const = 0;

	virtual void supported_firmware(vector<int> &firmware) const = 0;

	/* format the image-copy tool has to write */
	virtual string transfer_format(const upl_target &target) const = 0;

	/* fill target_uri of every target */
	virtual int prepare_targets(const upl_source &source,
			vector<upl_target> &targets) = 0;

	/* disk <i> of <nr_disks> was copied */
	virtual int disk_copied(const upl_target &target, size_t i,
			size_t nr_disks) = 0;

	/* register the guest, the VM identifier is returned in <vm_id> */
	virtual int create_metadata(const upl_source &source,
			const vector<upl_target> &targets, int firmware,
			string &vm_id) = 0;
};

typedef int (*OutputCreateFunc) (const upl_output_args &args,
		const upl_data &conf, OutputModule **module);
typedef void (*OutputListOptionsFunc) ();

struct output_module_entry
{
	const char *name;
	OutputCreateFunc create;
	OutputListOptionsFunc list_options;
};

const struct output_module_entry *find_output_module(const char *name);
void output_module_names(vector<string> &names);

#endif
