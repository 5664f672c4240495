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
#include <stdlib.h>
#include <stdarg.h>
#include <unistd.h>
#include <readline/readline.h>
#include <readline/history.h>

#include "ShellExec.h"
#include "ResMgr.h"
#include "misc.h"
#include "log.h"

ShellExec::ShellExec()
   : scanner(&supervisor,&events), client(&scanner,&events), queue(&client,this)
{
   exit_code=0;
   done=false;
   background=false;
   progress_line=false;
}

ShellExec::~ShellExec()
{
   queue.Stop();
   supervisor.Stop();
}

int ShellExec::Start()
{
   return queue.Start();
}

void ShellExec::eprintf(const char *fmt,...)
{
   EndProgressLine();
   va_list v;
   va_start(v,fmt);
   vfprintf(stderr,fmt,v);
   va_end(v);
}

void ShellExec::EndProgressLine()
{
   if(!progress_line)
      return;
   putchar('\n');
   progress_line=false;
}

void ShellExec::JobFinished(const TransferJob *job,const Error& err)
{
   const xstring& out=client.Output();
   xstring text(out.get(),out.length());
   if(!err.IsOK())
      text.appendf("%s: %s\n",TransferJob::KindName(job->Kind()),err.Text());
   events.PostJobDone(job->Id(),text,err.IsOK());
}

void ShellExec::JobDiscarded(const TransferJob *job)
{
   events.PostJobDone(job->Id(),xstring::format("%s: discarded\n",job->Describe()),false);
}

void ShellExec::ShowEvent(const Event& e)
{
   switch(e.kind)
   {
   case Event::LOG:
      EndProgressLine();
      fputs(e.text,stderr);
      break;
   case Event::PROGRESS:
   {
      const ProgressState& p=e.progress;
      if(!isatty(1))
	 break;
      if(p.Known())
	 printf("\r%s: %lld/%lld bytes (%d%%)",p.label.get(),p.transferred,p.total,p.Percent());
      else
	 printf("\r%s: %lld bytes",p.label.get(),p.transferred);
      fflush(stdout);
      progress_line=true;
      if(p.Known() && p.transferred>=p.total)
	 EndProgressLine();
      break;
   }
   case Event::JOB_DONE:
      EndProgressLine();
      if(e.ok)
	 fputs(e.text?e.text.get():"",stdout);
      else
      {
	 fputs(e.text?e.text.get():"",stderr);
	 exit_code=1;
      }
      break;
   case Event::CLOSED:
      break;
   }
   fflush(stdout);
}

void ShellExec::DrainEvents()
{
   Event e;
   while(events.Size()>0 && events.Take(&e,0))
   {
      ShowEvent(e);
      if(e.kind==Event::JOB_DONE && e.id>0)
      {
	 EndProgressLine();
	 printf("[%d] Done\n",e.id);
      }
   }
   fflush(stdout);
}

bool ShellExec::WaitJob(int id)
{
   Event e;
   for(;;)
   {
      if(!events.Take(&e))
	 return false;
      if(e.kind==Event::JOB_DONE && e.id==id)
      {
	 ShowEvent(e);
	 return e.ok;
      }
      ShowEvent(e);
      if(e.kind==Event::JOB_DONE)
	 printf("[%d] Done\n",e.id);
   }
}

bool ShellExec::Submit(TransferJob *job)
{
   int id=queue.Enqueue(job);
   if(id==-1)
   {
      DrainEvents();
      exit_code=1;
      return false;
   }
   if(background)
   {
      printf("[%d] %s &\n",id,TransferJob::KindName(job->Kind()));
      return true;
   }
   exit_code=0;
   bool ok=WaitJob(id);
   if(!ok)
      exit_code=1;
   return ok;
}

int ShellExec::find_cmd(const char *name,const cmd_rec **ret)
{
   int part=0;
   const cmd_rec *c;
   *ret=0;
   for(c=static_cmd_table; c->name; c++)
   {
      if(!strcmp(c->name,name))
      {
	 *ret=c;
	 return 1;
      }
      if(!strncmp(c->name,name,strlen(name)))
      {
	 part++;
	 *ret=c;
      }
   }
   if(part!=1)
      *ret=0;
   return part;
}

bool ShellExec::CheckArgs(ArgV *args,int min,int max)
{
   int n=args->count()-1;
   if(n>=min && (max<0 || n<=max))
      return true;
   const cmd_rec *c;
   find_cmd(args->a0(),&c);
   if(c && c->short_desc)
      eprintf("Usage: %s\n",c->short_desc);
   else
      eprintf("%s: wrong number of arguments\n",args->a0());
   exit_code=1;
   return false;
}

void ShellExec::Exec(ArgV *args)
{
   if(args->count()==0)
      return;
   const char *name=args->a0();
   const cmd_rec *c;
   int part=find_cmd(name,&c);
   if(part<=0)
   {
      eprintf("Unknown command `%s'.\n",name);
      exit_code=1;
      return;
   }
   if(part>1)
   {
      eprintf("Ambiguous command `%s'.\n",name);
      exit_code=1;
      return;
   }
   (this->*c->func)(args);
}

void ShellExec::ExecLine(const char *line)
{
   xstring cmd(line);
   int len=cmd.length();
   while(len>0 && (cmd[len-1]==' ' || cmd[len-1]=='\t' || cmd[len-1]=='\n'))
      len--;
   cmd.truncate(len);
   background=false;
   if(len>0 && cmd[len-1]=='&' && (len==1 || cmd[len-2]==' ' || cmd[len-2]=='\t'))
   {
      background=true;
      cmd.truncate(len-1);
   }
   ArgV args;
   const char *error=args.Parse(cmd);
   if(error)
   {
      eprintf("%s\n",error);
      exit_code=1;
      return;
   }
   Exec(&args);
   background=false;
}

void ShellExec::Loop()
{
   while(!done)
   {
      DrainEvents();
      const char *prompt=ResMgr::Query("cmd:prompt",0);
      char *line=readline(prompt?prompt:"");
      if(!line)
      {
	 putchar('\n');
	 break;
      }
      if(*line)
	 add_history(line);
      ExecLine(line);
      free(line);
   }
}

void ShellExec::Open(const char *host,int port,const char *user,const char *pass)
{
   if(!Submit(new TransferJob(TransferJob::CONNECT,host,0,port)) && !background)
      return;
   if(!user)
   {
      user="anonymous";
      pass=PACKAGE "@";
   }
   Submit(new TransferJob(TransferJob::LOGIN,user,pass?pass:""));
}

void ShellExec::AtExit()
{
   background=false;
   Submit(new TransferJob(TransferJob::QUIT));
   queue.Shutdown();
   DrainEvents();
   supervisor.Stop();
}

const char *ShellExec::RcCommand(ArgV *args,void *data)
{
   ShellExec *exec=(ShellExec*)data;
   exec->Exec(args);
   return 0;
}
