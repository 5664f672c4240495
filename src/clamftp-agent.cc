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
#include <signal.h>

#include "ScanAgentServer.h"
#include "ArgV.h"
#include "ResMgr.h"
#include "misc.h"
#include "log.h"

static void usage(const char *prog)
{
   printf("Usage: %s [-f rcfile] [-d] [--loop] [-p port]\n"
	  " -f <file>  read settings from the file\n"
	  " -d         switch on debugging output\n"
	  " --loop     keep serving scan requests instead of exiting after one\n"
	  " -p <port>  listen on this port instead of scan:port\n",prog);
}

int main(int argc,char **argv)
{
   const char *prog=argv[0];
   signal(SIGPIPE,SIG_IGN);

   static const struct option agent_options[]=
   {
      {"loop",no_argument,0,'l'},
      {"help",no_argument,0,'h'},
      {0,0,0,0}
   };

   ArgV args(argc,argv);
   const char *rcfile=0;
   const char *port_str=0;
   bool debug_on=false;
   bool loop=false;
   int c;
   while((c=args.getopt_long("f:dp:h",agent_options))!=EOF)
   {
      switch(c)
      {
      case 'f':
	 rcfile=optarg;
	 break;
      case 'd':
	 debug_on=true;
	 break;
      case 'p':
	 port_str=optarg;
	 break;
      case 'l':
	 loop=true;
	 break;
      case 'h':
	 usage(prog);
	 return 0;
      default:
	 fprintf(stderr,"Try `%s --help' for more information.\n",prog);
	 return 1;
      }
   }

   Log::global=new Log("clamftp-agent");
   if(rcfile && source_rc_file(rcfile)==-1)
   {
      perror(rcfile);
      return 1;
   }
   if(debug_on)
      ResMgr::Set("log:level",0,"9");
   if(port_str)
   {
      const char *error=ResMgr::Set("scan:port",0,port_str);
      if(error)
      {
	 fprintf(stderr,"%s: %s\n",port_str,error);
	 return 1;
      }
   }
   if(ResMgr::QueryBool("agent:loop",0))
      loop=true;

   ScanAgentServer server(ResMgr::Query("scan:scanner",0),
			  ResMgr::Query("scan:scratch-dir",0),
			  ResMgr::Query("scan:base-timeout",0));
   if(server.Listen(ResMgr::Query("scan:host",0),ResMgr::Query("scan:port",0))<0)
   {
      fprintf(stderr,"%s: %s\n",prog,server.GetError().Text());
      return 1;
   }
   int res=server.Run(loop);
   if(res<0)
      fprintf(stderr,"%s: %s\n",prog,server.GetError().Text());
   server.Close();

   Log::global=0;
   ResMgr::ClassCleanup();
   return res<0?1:0;
}
