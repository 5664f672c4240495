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


#ifndef PROCWAIT_H
#define PROCWAIT_H

#include <sys/types.h>
#include <signal.h>
#include "xstring.h"

/* Handle of a child process. The process is started in its own process
   group, so Kill reaches whatever it has started in turn. */
class ProcWait
{
public:
   enum	State
   {
      TERMINATED,
      RUNNING,
      ERROR
   };

protected:
   const pid_t pid;
   State status;
   int	 term_info;
   int	 saved_errno;

   bool  handle_info(int info); // true if finished

public:
   State Poll();
   State Wait();
   State GetState() { return status; }
   int	 GetInfo() { return term_info; }
   int	 ExitStatus() const;
   int	 Kill(int sig=SIGTERM);
   pid_t GetPid() const { return pid; }

   ProcWait(pid_t p);
   ~ProcWait() {}

   // runs `/bin/sh -c "exec <cmd> <arg>"'; arg is passed unquoted by value
   static ProcWait *Spawn(const char *cmd,const char *arg,xstring& error);
};

#endif /* PROCWAIT_H */
