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
 * Cleanup stack of an upload
 */

#ifndef __UPLOADCOM_H__
#define __UPLOADCOM_H__

#include <stack>
#include <list>
#include <string>

#include "bincom.h"

#define START_STAGE() logger(LOG_DEBUG, "begin stage : %s", __FUNCTION__)
#define END_STAGE() logger(LOG_DEBUG, "end stage : %s", __FUNCTION__)

class UploadStateCommon
{
public:
	int erase_flag;

	// Cleaning functionality
	typedef int (*UploadCleanFunc) (const void *, const void *);
	struct UCleanEntry
	{
		UploadCleanFunc func;
		const void * arg1;
		const void * arg2;
	};
	typedef stack<UCleanEntry> CleanActions;
	// Actions on case of failure
	CleanActions CleanerErr;
	// Actions on any case
	CleanActions CleanerAny;

	// Temporary file names, cleaners keep pointers to them
	list<string> tmpNames;

public:
	// Clean cleaner
	void erase()
	{
		erase_flag = 0;
	};
#define ERROR_CLEANER	0
#define ANY_CLEANER	2

#define GETCLEANER(type) (((type) == ANY_CLEANER) ? CleanerAny : CleanerErr)

	int doCleaning(int success = ERROR_CLEANER);
	void addCleaner(UploadCleanFunc _func, const void * _arg1 = NULL,
	                const void * _arg2 = NULL, int type = ERROR_CLEANER);

	static int clean_removeDir(const void * arg, const void * dummy = NULL);
	void addCleanerRemove(UploadCleanFunc _func, const char * name,
			int success = ERROR_CLEANER);

	/* error cleaners if not erased, then cleaners for any case */
	void cleanup();

public:
	UploadStateCommon();
	virtual ~UploadStateCommon();
};

#endif
