/*
 * clamftp - scanning FTPS client
 *
 * Copyright (c) 1996-2017 by Alexander V. Lukyanov (lav@yars.free.net)
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */


#include <config.h>
#include "ResMgr.h"

static const char *CommandValidate(xstring_c *value)
{
   const char *v=*value;
   while(*v==' ' || *v=='\t')
      v++;
   if(!*v)
      return "empty command";
   return 0;
}

static ResType clamftp_vars[] = {
   {"ftp:active-port",	    "10806", ResMgr::PortValidate},
   {"ftp:passive-mode",	    "yes",   ResMgr::BoolValidate},
   {"ftp:ssl-allow",	    "yes",   ResMgr::BoolValidate},
   {"ftp:ssl-force",	    "no",    ResMgr::BoolValidate},
   {"ftp:ssl-protect-data", "yes",   ResMgr::BoolValidate},

   {"net:connect-timeout",  "10",    ResMgr::UNumberValidate},
   {"net:timeout",	    "15",    ResMgr::UNumberValidate},

   {"ssl:verify-certificate","no",   ResMgr::BoolValidate},

   {"scan:enabled",	    "yes",   ResMgr::BoolValidate},
   {"scan:host",	    "127.0.0.1",0},
   {"scan:port",	    "15116", ResMgr::PortValidate},
   {"scan:agent-command",   AGENT_PROGRAM " --loop",CommandValidate},
   {"scan:warmup-delay",    "2",     ResMgr::UNumberValidate},
   {"scan:max-attempts",    "3",     ResMgr::UNumberValidate},
   {"scan:base-timeout",    "45",    ResMgr::UNumberValidate},
   {"scan:timeout-per-mb",  "4",     ResMgr::UNumberValidate},
   {"scan:scanner",	    "clamscan --no-summary --infected",CommandValidate},
   {"scan:scratch-dir",	    "scan_temp_dir",0},

   {"agent:loop",	    "no",    ResMgr::BoolValidate},

   {"log:enabled",	    "yes",   ResMgr::BoolValidate},
   {"log:level",	    "4",     ResMgr::UNumberValidate},
   {"log:show-time",	    "no",    ResMgr::BoolValidate},
   {"log:show-pid",	    "no",    ResMgr::BoolValidate},
   {"log:file",		    "",	     0},
   {"log:prefix-recv",	    "<--- ", 0},
   {"log:prefix-send",	    "---> ", 0},
   {"log:prefix-note",	    "---- ", 0},
   {"log:prefix-error",	    "**** ", 0},

   {"cmd:prompt",	    "clamftp> ",0},
   {0}
};

void ResMgr::ClassInit()
{
   Register(clamftp_vars);
}
