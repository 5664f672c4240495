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
#include <string.h>
#include <signal.h>
#include <unistd.h>

#include "ShellExec.h"
#include "GetPass.h"
#include "ResMgr.h"
#include "misc.h"
#include "log.h"

static void usage(const char *prog)
{
   printf("Usage: %s [-f rcfile] [-d] [-u user[,pass]] [host [port]]\n"
	  " -f <file>  execute commands from the file (after ~/.clamftprc)\n"
	  " -d         switch on debugging output\n"
	  " -u <user>[,<pass>]  log in with the given credentials\n"
	  " -h         show this help and exit\n"
	  " -v         show version and exit\n",prog);
}

static void source_if_exist(const char *rc,ShellExec *exec)
{
   if(access(rc,R_OK)==-1)
      return;
   int bad=source_rc_file(rc,ShellExec::RcCommand,exec);
   if(bad>0)
      fprintf(stderr,"%s: %d bad line(s)\n",rc,bad);
}

int main(int argc,char **argv)
{
   const char *prog=argv[0];
   signal(SIGPIPE,SIG_IGN);

   ArgV args(argc,argv);
   const char *rcfile=0;
   bool debug_on=false;
   xstring_c user;
   const char *pass=0;
   int c;
   while((c=args.getopt("+f:du:hv"))!=EOF)
   {
      switch(c)
      {
      case 'f':
	 rcfile=optarg;
	 break;
      case 'd':
	 debug_on=true;
	 break;
      case 'u':
      {
	 user.set(optarg);
	 char *sep=strchr(user.get_non_const(),',');
	 if(sep)
	 {
	    *sep=0;
	    pass=sep+1;
	 }
	 break;
      }
      case 'h':
	 usage(prog);
	 return 0;
      case 'v':
	 printf("%s %s\n",PACKAGE,VERSION);
	 return 0;
      default:
	 fprintf(stderr,"Try `%s -h' for more information.\n",prog);
	 return 1;
      }
   }
   const char *host=args.getcurr();
   const char *port_str=host?args.getarg(args.getindex()+1):0;

   Log::global=new Log("clamftp");
   if(debug_on)
      ResMgr::Set("log:level",0,"9");

   ShellExec *exec=new ShellExec;
   Log::global->SetListener(exec->GetEvents(),false);
   if(exec->Start()!=0)
   {
      fprintf(stderr,"%s: cannot start the transfer worker\n",prog);
      Log::global->SetListener(0);
      delete exec;
      return 1;
   }

   const char *home=getenv("HOME");
   if(home)
   {
      xstring rc(dir_file(home,".clamftprc"));
      source_if_exist(rc,exec);
   }
   if(rcfile)
   {
      if(source_rc_file(rcfile,ShellExec::RcCommand,exec)==-1)
	 perror(rcfile);
   }
   if(debug_on)
      ResMgr::Set("log:level",0,"9");

   if(host)
   {
      int port=0;
      if(port_str)
      {
	 xstring_c p(port_str);
	 const char *error=ResMgr::PortValidate(&p);
	 if(error)
	    fprintf(stderr,"%s: %s\n",port_str,error);
	 else
	    port=atoi(port_str);
      }
      if(user && !pass)
	 pass=GetPass("Password: ");
      exec->Open(host,port,user,pass);
   }

   if(!exec->Done())
      exec->Loop();
   exec->AtExit();
   int exit_code=exec->ExitCode();

   Log::global->SetListener(0);
   delete exec;
   Log::global=0;
   ResMgr::ClassCleanup();
   return exit_code;
}
