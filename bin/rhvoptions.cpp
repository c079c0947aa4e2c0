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

#include <strings.h>
#include <openssl/pem.h>
#include <openssl/x509.h>
#include <openssl/err.h>

#include "common.h"
#include "rhvoptions.h"

#define RHV_OUTPUT_OPTIONS							\
"Output options (-oo) which can be used with -o rhv-upload:\n\n"		\
"  -oo rhv-cafile=CA.PEM           Set 'ca.pem' certificate bundle filename.\n"	\
"  -oo rhv-cluster=CLUSTERNAME     Set RHV cluster name.\n"			\
"  -oo rhv-direct[=true|false]     Use direct transfer mode (default: false).\n"	\
"  -oo rhv-verifypeer[=true|false] Verify server identity (default: false).\n\n"	\
"You can override the UUIDs of the disks, instead of using autogenerated UUIDs\n"\
"after their uploads (if you do, you must supply one for each disk):\n\n"	\
"  -oo rhv-disk-uuid=UUID          Disk UUID\n"

void print_output_options()
{
	printf(RHV_OUTPUT_OPTIONS);
}

bool is_nonnil_uuid(const char *uuid)
{
	static const int groups[] = { 8, 4, 4, 4, 12 };
	const char *p = uuid;

	if (strcmp(uuid, RHV_NIL_UUID) == 0)
		return false;

	for (size_t i = 0; i < sizeof(groups) / sizeof(groups[0]); i++) {
		if (i && *p++ != '-')
			return false;
		for (int j = 0; j < groups[i]; j++, p++)
			if (!isxdigit((unsigned char)*p))
				return false;
	}
	return *p == '\0';
}

int parse_bool_option(const char *key, const string &value, bool *out)
{
	static const char *yes[] = { "true", "yes", "on", "1" };
	static const char *no[] = { "false", "no", "off", "0" };

	if (value.empty()) {
		*out = true;
		return 0;
	}
	for (size_t i = 0; i < sizeof(yes) / sizeof(yes[0]); i++) {
		if (strcasecmp(value.c_str(), yes[i]) == 0) {
			*out = true;
			return 0;
		}
		if (strcasecmp(value.c_str(), no[i]) == 0) {
			*out = false;
			return 0;
		}
	}
	return putErr(UPL_ERR_CONFIG, UPL_MSG_OO_BOOL, value.c_str(), key);
}

int parse_output_options(const OutputOptEntries &options, rhv_options &opts)
{
	int rc;
	rhv_options o;

	for (OutputOptEntries::const_iterator it = options.begin();
			it != options.end(); ++it)
	{
		const string &key = it->first;
		const string &value = it->second;

		if (key == "rhv-cafile") {
			if (o.rhv_cafile)
				return putErr(UPL_ERR_CONFIG, UPL_MSG_OO_TWICE, key.c_str());
			o.rhv_cafile = value;
		} else if (key == "rhv-cluster") {
			if (o.rhv_cluster)
				return putErr(UPL_ERR_CONFIG, UPL_MSG_OO_TWICE, key.c_str());
			o.rhv_cluster = value;
		} else if (key == "rhv-direct") {
			if ((rc = parse_bool_option(key.c_str(), value, &o.rhv_direct)))
				return rc;
		} else if (key == "rhv-verifypeer") {
			if ((rc = parse_bool_option(key.c_str(), value, &o.rhv_verifypeer)))
				return rc;
		} else if (key == "rhv-disk-uuid") {
			if (!is_nonnil_uuid(value.c_str()))
				return putErr(UPL_ERR_CONFIG, UPL_MSG_OO_UUID);
			if (!o.rhv_disk_uuids)
				o.rhv_disk_uuids = vector<string>();
			o.rhv_disk_uuids->push_back(value);
		} else {
			return putErr(UPL_ERR_CONFIG, UPL_MSG_OO_UNKNOWN, key.c_str());
		}
	}

	opts = o;
	return 0;
}

int check_cafile(const char *path)
{
	FILE *fp;
	X509 *cert;
	int count = 0;

	if ((fp = fopen(path, "r")) == NULL)
		return putErr(UPL_ERR_CONFIG, UPL_MSG_CAFILE, path);

	while ((cert = PEM_read_X509(fp, NULL, NULL, NULL)) != NULL) {
		X509_free(cert);
		count++;
	}
	fclose(fp);
	/* PEM_read_X509() leaves 'no start line' at the end of file */
	ERR_clear_error();

	if (count == 0)
		return putErr(UPL_ERR_CONFIG, UPL_MSG_CAFILE, path);
	logger(LOG_DEBUG, "%s: %d certificate(s) found", path, count);
	return 0;
}
