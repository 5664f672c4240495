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

#include <stdio.h>
#include <errno.h>
#include <fcntl.h>
#include <time.h>
#include <sys/types.h>
#include <sys/stat.h>
#include "xstring.h"
#include "log.h"

Ref<Log> Log::global;

Log::Log(const char *name)
   : name(name)
{
   output=-1;
   need_close_output=false;
   enabled=false;
   level=0;
   show_pid=false;
   show_time=false;
   to_output=true;
   listener=0;
   pthread_mutex_init(&mutex,0);
   Reconfig(0);
}

bool Log::WillOutput(int l)
{
   if(!enabled || l>level)
      return false;
   return listener || (to_output && output!=-1);
}

void Log::Write(int l,const char *s,int len)
{
   if(!WillOutput(l))
      return;
   pthread_mutex_lock(&mutex);
   DoWrite(l,s,len);
   pthread_mutex_unlock(&mutex);
}

void Log::DoWrite(int l,const char *s,int len)
{
   if(len==0)
      return;
   if(buf.length()==0)
   {
      if(show_pid)
	 buf.appendf("[%ld] ",(long)getpid());
      if(show_time)
      {
	 time_t t=time(0);
	 struct tm tm;
	 char ts[32];
	 strftime(ts,sizeof(ts),"%Y-%m-%d %H:%M:%S",localtime_r(&t,&tm));
	 buf.append(ts).append(' ');
      }
   }
   buf.append(s,len);
   if(buf.last_char()!='\n')
      return;

   if(listener)
   {
      xstring line;
      line.nset(buf,buf.length()-1);
      listener->LogLine(l,line);
   }
   if(to_output && output!=-1)
   {
      const char *w=buf;
      size_t left=buf.length();
      while(left>0)
      {
	 int res=write(output,w,left);
	 if(res==-1)
	 {
	    if(E_RETRY(errno))
	       continue;
	    break;
	 }
	 w+=res;
	 left-=res;
      }
   }
   buf.truncate(0);
}

void Log::Format(int l,const char *f,...)
{
   if(!WillOutput(l))
      return;

   va_list v;
   va_start(v,f);
   vFormat(l,f,v);
   va_end(v);
}

void Log::vFormat(int l,const char *f,va_list v)
{
   if(!WillOutput(l))
      return;

   xstring& s=xstring::vformat(f,v);
   Write(l,s,s.length());
}

void Log::SetListener(LogListener *l,bool keep_output)
{
   pthread_mutex_lock(&mutex);
   listener=l;
   to_output=keep_output;
   pthread_mutex_unlock(&mutex);
}

void Log::Cleanup()
{
   global=0;
}
Log::~Log()
{
   CloseOutput();
   pthread_mutex_destroy(&mutex);
}

void Log::SetOutput(int o,bool need_close)
{
   CloseOutput();
   output=o;
   need_close_output=need_close;
}

void Log::Reconfig(const char *n)
{
   if(n && strncmp(n,"log:",4))
      return;

   enabled=QueryBool("log:enabled",name);
   level=Query("log:level",name);
   show_time=QueryBool("log:show-time",name);
   show_pid=QueryBool("log:show-pid",name);

   if(!n || !strcmp(n,"log:file"))
   {
      const char *file=Query("log:file",name);
      int fd=2;
      bool need_close_fd=false;
      if(file && *file)
      {
	 fd=open(file,O_WRONLY|O_CREAT|O_APPEND,0600);
	 if(fd==-1)
	 {
	    perror(file);
	    fd=2;
	 }
	 else
	 {
	    need_close_fd=true;
	    fcntl(fd,F_SETFD,FD_CLOEXEC);
	 }
      }
      pthread_mutex_lock(&mutex);
      if(fd!=output)
	 SetOutput(fd,need_close_fd);
      pthread_mutex_unlock(&mutex);
   }
}
