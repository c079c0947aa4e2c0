/*
* Copyright (c) 2017, Parallels International GmbH
*
* This file is part of Virtuozzo Core. Virtuozzo Core is free
* software; you can redistribute it and/or modify it under the terms
* of the GNU General Public License as published by the Free Software
* Foundation; either version 2 of the License, or (at your option) any
* later version.
* 
* This program is distributed in the hope that it will be useful,
* but WITHOUT ANY WARRANTY; without even the implied warranty of
* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
* GNU General Public License for more details.
* 
* You should have received a copy of the GNU General Public License
* along with this program; if not, write to the Free Software
* Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA
* 02110-1301, USA.
*
* Our contact details: Parallels International GmbH, Vordergasse 59, 8200
* Schaffhausen, Switzerland.
*/

#ifndef __TRACE_H__
#define __TRACE_H__

#include "common.h"

#include <time.h>
#include <syslog.h>
#include <sstream>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>

/*
 * Reports the start and the result of an upload to syslog as one-line JSON
 * under its own identity, then restores the identity of the program log.
 */
class Trace
{
public:
	Trace(const char *name, const char *action, const char *vm,
			const char *output) :
		m_name(name), m_action(action), m_vm(vm), m_output(output),
		m_started(0)
	{
	}

	void start()
	{
		boost::property_tree::ptree t = event("start");

		m_started = time(NULL);
		t.put("output", m_output);
		report(t);
	}

	void finish(int code)
	{
		boost::property_tree::ptree t = event("finish");

		t.put("result", code);
		if (m_started)
			t.put("duration", (long)(time(NULL) - m_started));
		report(t);
	}

private:
	boost::property_tree::ptree event(const char *op) const
	{
		boost::property_tree::ptree t;

		t.put("action", m_action);
		t.put("op", op);
		t.put("vm", m_vm);
		return t;
	}

	void report(const boost::property_tree::ptree &t)
	{
		std::stringstream s;

		boost::property_tree::json_parser::write_json(s, t, false);

		closelog();
		openlog(m_name, LOG_PID, LOG_INFO | LOG_USER);
		syslog(LOG_INFO, "%s", s.str().c_str());
		closelog();
		open_logger(NULL);
	}

	const char *m_name;
	std::string m_action;
	std::string m_vm;
	std::string m_output;
	time_t m_started;
};

#endif // __TRACE_H__
