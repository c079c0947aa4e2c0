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
#include <libgen.h>
#include <algorithm>
#include <vzctl/libvzctl.h>

#ifdef FIU_ENABLE
#include <fiu.h>
#endif

#include "common.h"
#include "util.h"
#include "bincom.h"
#include "upl_config.h"
#include "guest.h"
#include "output.h"
#include "imgcopy.h"
#include "trace.h"

static int run_upload(OutputModule *module, const upl_data &conf,
		const upl_source &source)
{
	int rc;
	string vm_id;
	vector<int> firmware;
	vector<upl_target> targets;

	logger(LOG_INFO, "Output: %s", module->as_options().c_str());

	if ((rc = module->precheck()))
		return rc;

	module->supported_firmware(firmware);
	if (find(firmware.begin(), firmware.end(), source.firmware) == firmware.end())
		return putErr(UPL_ERR_CONFIG, "-o %s: %s firmware is not supported",
			UPLoptions.output.c_str(), firmware_name(source.firmware));

	for (size_t i = 0; i < source.disks.size(); i++) {
		upl_target t;

		t.disk = source.disks[i];
		t.target_format = source.disks[i].target_format;
		targets.push_back(t);
	}

	if ((rc = module->prepare_targets(source, targets)))
		return rc;

	for (size_t i = 0; i < targets.size(); i++) {
		if (terminated)
			return putErr(UPL_ERR_TERM, UPL_MSG_TERM);
		if ((rc = copy_disk(conf, targets[i],
				module->transfer_format(targets[i]))))
			return rc;
		if ((rc = module->disk_copied(targets[i], i, targets.size())))
			return rc;
	}

	if ((rc = module->create_metadata(source, targets, source.firmware, vm_id)))
		return rc;

	printf("%s\n", vm_id.c_str());
	return 0;
}

static int do_upload(const struct output_module_entry *entry,
		const upl_data &conf, const upl_source &source)
{
	int rc;
	upl_output_args args;
	OutputModule *module = NULL;

	args.output_alloc = UPLoptions.output_alloc;
	args.output_conn = UPLoptions.output_conn;
	args.output_password = UPLoptions.output_password;
	args.output_storage = UPLoptions.output_storage;
	args.options = UPLoptions.output_options;

	if ((rc = entry->create(args, conf, &module))) {
		logger(LOG_ERR, "%s", getError());
		return rc;
	}

	if ((rc = run_upload(module, conf, source)))
		logger(LOG_ERR, "%s", getError());

	/* rollback is done here if the upload failed */
	xdelete(module);
	return rc;
}

int main(int argc, char **argv)
{
	int rc;
	const struct output_module_entry *entry;
	static struct upl_data conf;
	upl_source source;

	argv[0] = basename(argv[0]);

	/*
	 * Create new group because SIGTERM handler will
	 * redirect this signal to all procceses in group.
	 * If we will not do it, handler will terminate parent too
	 */
	setpgrp();

	INIT_BIN(LOG_INFO, BNAME_UPLOAD);

	parse_options(argc, argv);

	if ((entry = find_output_module(UPLoptions.output.c_str())) == NULL) {
		logger(LOG_ERR, "unknown output module '%s'", UPLoptions.output.c_str());
		exit(-UPL_ERR_NOMODULE);
	}
	if (UPLoptions.list_options) {
		entry->list_options();
		return 0;
	}

	/* init vzctl */
	if ((rc = vzctl2_lib_init())) {
		logger(LOG_ERR, "vzctl initialize error %d", rc);
		exit(-UPL_ERR_CONFIG);
	}

	/* read global upload config */
	if ((rc = upl_data_load(UPLoptions.config_file.empty() ?
			NULL : UPLoptions.config_file.c_str(), &conf))) {
		logger(LOG_ERR, "%s", getError());
		exit(-rc);
	}

#ifdef FIU_ENABLE
	fiu_init(0);
#endif

	init_sig_handlers();

	if ((rc = load_guest(UPLoptions.guest_file.c_str(),
			UPLoptions.output_format, source))) {
		logger(LOG_ERR, "%s", getError());
		exit(-rc);
	}

	Trace trace(BNAME_UPLOAD, "upload", source.name.c_str(),
		UPLoptions.output.c_str());
	trace.start();

	rc = do_upload(entry, conf, source);

	trace.finish(rc);
	if (rc == 0 && terminated)
		rc = UPL_ERR_TERM;
	return -rc;
}
