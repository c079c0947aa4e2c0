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

#include <stdlib.h>
#include <string.h>
#include <strings.h>
#include <limits.h>

#include <vzctl/libvzctl.h>

#include "upl_config.h"
#include "common.h"

static int read_str(struct vzctl_env_handle *h, const char *conf,
		const char *key, std::string &out)
{
	const char *data;

	if (vzctl2_env_get_param(h, key, &data) || data == NULL)
		return 0;
	if (*data == '\0')
		return putErr(UPL_ERR_CONFIG, "empty %s in %s", key, conf);
	out = data;
	return 0;
}

static int read_num(struct vzctl_env_handle *h, const char *conf,
		const char *key, int *out)
{
	const char *data;
	char *end;
	long val;

	if (vzctl2_env_get_param(h, key, &data) || data == NULL)
		return 0;

	errno = 0;
	val = strtol(data, &end, 10);
	if (errno || end == data || *end != '\0' || val <= 0 || val > INT_MAX)
		return putErr(UPL_ERR_CONFIG, "invalid %s value '%s' in %s",
			key, data, conf);
	*out = (int)val;
	return 0;
}

int upl_data_load(const char *path, struct upl_data *upl)
{
	int err, rc = 0;
	const char *conf = path ? path : UPL_CONF_FILE;
	const char *data;
	struct vzctl_env_handle *h;

	if (access(conf, F_OK)) {
		if (path == NULL && errno == ENOENT) {
			logger(LOG_DEBUG, "%s not found, default values will be used",
				conf);
			return 0;
		}
		return putErr(UPL_ERR_CONFIG, "can not access %s : %m", conf);
	}

	h = vzctl2_env_open_conf(0, conf, VZCTL_CONF_SKIP_GLOBAL | VZCTL_CONF_SKIP_PARAM_ERRORS, &err);
	if (err)
		return putErr(UPL_ERR_CONFIG, "vzctl2_env_open(%s) error: %s",
			conf, vzctl2_get_last_error());

	if ((rc = read_str(h, conf, UPL_CONF_NBDKIT, upl->nbdkit)))
		goto cleanup;
	if ((rc = read_str(h, conf, UPL_CONF_NBDKIT_PYTHON_PLUGIN,
			upl->nbdkit_python_plugin)))
		goto cleanup;
	if ((rc = read_str(h, conf, UPL_CONF_PYTHON, upl->python)))
		goto cleanup;
	if ((rc = read_str(h, conf, UPL_CONF_HELPERS_DIR, upl->helpers_dir)))
		goto cleanup;
	if ((rc = read_str(h, conf, UPL_CONF_QEMU_IMG, upl->qemu_img)))
		goto cleanup;
	if ((rc = read_str(h, conf, UPL_CONF_CHCON, upl->chcon)))
		goto cleanup;
	if ((rc = read_str(h, conf, UPL_CONF_TMPDIR, upl->tmpdir)))
		goto cleanup;

	if ((rc = read_num(h, conf, UPL_CONF_FINALIZATION_TIMEOUT,
			&upl->finalization_timeout)))
		goto cleanup;
	if ((rc = read_num(h, conf, UPL_CONF_PIDFILE_TIMEOUT,
			&upl->pidfile_timeout)))
		goto cleanup;
	if ((rc = read_num(h, conf, UPL_CONF_NBDKIT_THREADS,
			&upl->nbdkit_threads)))
		goto cleanup;

	/* read SELINUX */
	if (vzctl2_env_get_param(h, UPL_CONF_SELINUX, &data) == 0 && data != NULL) {
		if (strcasecmp(data, "auto") == 0) {
			upl->selinux = UPL_SELINUX_AUTO;
		} else if (strcasecmp(data, "yes") == 0) {
			upl->selinux = UPL_SELINUX_YES;
		} else if (strcasecmp(data, "no") == 0) {
			upl->selinux = UPL_SELINUX_NO;
		} else {
			logger(LOG_WARNING, "invalid " UPL_CONF_SELINUX " value '%s' in %s"
				"; default value (auto) will be used", data, conf);
			upl->selinux = UPL_SELINUX_AUTO;
		}
	}

cleanup:
	vzctl2_env_close(h);

	return rc;
}
