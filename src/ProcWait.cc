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
#include <sys/wait.h>
#include <errno.h>
#include <unistd.h>
#include <alloca.h>
#include "ProcWait.h"
#include "log.h"

ProcWait::State ProcWait::Poll()
{
   if(status!=RUNNING)
      return status;

   int info;
   int res=waitpid(pid,&info,WNOHANG);
   if(res==-1)
   {
      if(errno==EINTR)
	 return status;
      // waitpid failed, check the process existence
      saved_errno=errno;
      if(kill(pid,0)==-1)
      {
	 status=TERMINATED;
	 term_info=255;
      }
      return status;
   }
   if(res==pid)
      handle_info(info);
   return status;
}

ProcWait::State ProcWait::Wait()
{
   while(status==RUNNING)
   {
      int info;
      int res=waitpid(pid,&info,0);
      if(res==-1)
      {
	 if(errno==EINTR)
	    continue;
	 saved_errno=errno;
	 status=ERROR;
	 term_info=255;
	 break;
      }
      if(res==pid)
	 handle_info(info);
   }
   return status;
}

bool ProcWait::handle_info(int info)
{
   if(WIFSTOPPED(info))
      return false;
   status=TERMINATED;
   term_info=info;
   return true;
}

int ProcWait::ExitStatus() const
{
   if(status!=TERMINATED)
      return -1;
   if(term_info==255)
      return 255;
   if(WIFEXITED(term_info))
      return WEXITSTATUS(term_info);
   return 128+WTERMSIG(term_info);
}

int ProcWait::Kill(int sig)
{
   Poll();
   if(status!=RUNNING)
      return -1;

   int res;
   res=kill(-pid,sig);
   if(res==-1)
      res=kill(pid,sig);
   return res;
}

ProcWait::ProcWait(pid_t p)
   : pid(p)
{
   status=RUNNING;
   term_info=-1;
   saved_errno=0;
}

ProcWait *ProcWait::Spawn(const char *cmd,const char *arg,xstring& error)
{
   xstring& script=xstring::get_tmp("exec ");
   script.append(cmd);
   if(arg)
      script.append(" \"$1\"");
   const char *script_c=alloca_strdup(script);

   pid_t pid=fork();
   if(pid==-1)
   {
      error.setf("fork: %s",strerror(errno));
      return 0;
   }
   if(pid==0)
   {
      /* child */
      setpgid(0,0);
      signal(SIGPIPE,SIG_DFL);
      if(arg)
	 execl("/bin/sh","sh","-c",script_c,"sh",arg,(char*)0);
      else
	 execl("/bin/sh","sh","-c",script_c,(char*)0);
      _exit(127);
   }
   /* parent */
   setpgid(pid,pid);
   debug((9,"started process %d: %s\n",(int)pid,script_c));
   return new ProcWait(pid);
}
