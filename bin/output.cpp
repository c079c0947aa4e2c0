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
#include "output.h"
#include "outrhvupload.h"
#include "rhvoptions.h"

static const struct output_module_entry output_modules[] = {
	{ "rhv-upload", create_rhv_upload, print_output_options },
	{ NULL, NULL, NULL }
};

const struct output_module_entry *find_output_module(const char *name)
{
	for (const struct output_module_entry *e = output_modules; e->name; e++)
		if (strcmp(e->name, name) == 0)
			return e;
	return NULL;
}

void output_module_names(vector<string> &names)
{
	names.clear();
	for (const struct output_module_entry *e = output_modules; e->name; e++)
		names.push_back(e->name);
}
