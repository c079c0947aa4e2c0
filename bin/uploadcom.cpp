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
#include "util.h"
#include "uploadcom.h"

UploadStateCommon::UploadStateCommon()
{
	erase_flag = 1;
}

UploadStateCommon::~UploadStateCommon()
{
	cleanup();
}

void UploadStateCommon::cleanup()
{
	if (erase_flag)
		doCleaning(ERROR_CLEANER);

	doCleaning(ANY_CLEANER);
}

void UploadStateCommon::addCleaner(UploadCleanFunc _func, const void * _arg1,
                                    const void * _arg2, int type)
{
	CleanActions & cl = GETCLEANER(type);
	UCleanEntry entry;

	entry.func = _func;
	entry.arg1 = _arg1;
	entry.arg2 = _arg2;
	cl.push(entry);
};

int UploadStateCommon::doCleaning(int type)
{
	CleanActions & cl = GETCLEANER(type);
	while (!cl.empty())
	{
		UCleanEntry it = cl.top();
		cl.pop();

		int rc = it.func(it.arg1, it.arg2);
		if (rc)
		{
			/* will ignore errors on cleaning */
			logger(LOG_WARNING, "Can't do correct cleaning: %s",
			       getError());
		}
	}
	return 0;
}

int UploadStateCommon::clean_removeDir(const void * arg, const void *)
{
	const char * path = (const char*) arg;

	logger(LOG_DEBUG, UPL_MSG_RST_RM_DIR, path);
	return rmdir_recursively(path);
};

void UploadStateCommon::addCleanerRemove(UploadCleanFunc _func, const char * name,
		int success)
{
	tmpNames.push_back(name);
	addCleaner(_func, tmpNames.back().c_str(), NULL, success);
	logger(LOG_DEBUG, "add '%s' remove cleaner : %s",
			success == ERROR_CLEANER ? "on failure" : "on any case", name);
}
