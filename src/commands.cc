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
#include <errno.h>
#include <glob.h>
#include <unistd.h>
#include <sys/stat.h>

#include "ShellExec.h"
#include "GetPass.h"
#include "ResMgr.h"
#include "misc.h"

#define CMD(name) void ShellExec::cmd_##name(ArgV *args)
#define ALIAS_FOR(cmd) &ShellExec::cmd_##cmd,0,#cmd

const ShellExec::cmd_rec ShellExec::static_cmd_table[]=
{
   {"?",       ALIAS_FOR(help)},
   {"ascii",   &ShellExec::cmd_ascii,	"ascii",
	 "Transfer files in ASCII mode, converting line ends\n"},
   {"binary",  &ShellExec::cmd_binary,	"binary",
	 "Transfer files unchanged (default)\n"},
   {"bye",     ALIAS_FOR(exit)},
   {"cd",      &ShellExec::cmd_cd,	"cd <rdir>",
	 "Change current remote directory\n"},
   {"close",   &ShellExec::cmd_close,	"close",
	 "Send QUIT and close the connection\n"},
   {"exit",    &ShellExec::cmd_exit,	"exit",
	 "Close the connection, stop the scanning agent and exit\n"},
   {"get",     &ShellExec::cmd_get,	"get <rfile> [<lfile>]",
	 "Retrieve remote file <rfile> and store it to local file <lfile>,\n"
	 "by default named after the remote one\n"},
   {"getdir",  &ShellExec::cmd_getdir,	"getdir <rdir> [<ldir>]",
	 "Retrieve remote directory <rdir> recursively\n"},
   {"help",    &ShellExec::cmd_help,	"help [<cmd>]",
	 "Print help for command <cmd>, or list available commands\n"},
   {"lcd",     &ShellExec::cmd_lcd,	"lcd <ldir>",
	 "Change current local directory <ldir>\n"},
   {"ls",      &ShellExec::cmd_ls,	"ls [<rdir>]",
	 "List remote files\n"},
   {"mget",    &ShellExec::cmd_mget,	"mget <pattern>...",
	 "Retrieve remote files matching the shell patterns\n"},
   {"mkdir",   &ShellExec::cmd_mkdir,	"mkdir <rdir>...",
	 "Make remote directories\n"},
   {"mput",    &ShellExec::cmd_mput,	"mput <pattern>...",
	 "Scan and upload local files matching the shell patterns\n"},
   {"open",    &ShellExec::cmd_open,	"open [-u <user>[,<pass>]] <host> [<port>]",
	 "Connect to the server, negotiate TLS and log in\n"
	 "(anonymously unless -u is given)\n"},
   {"passive", &ShellExec::cmd_passive,	"passive [on|off]",
	 "Use passive (default) or active mode for data connections\n"},
   {"put",     &ShellExec::cmd_put,	"put <lfile> [<rfile>]",
	 "Scan local file <lfile> and upload it as <rfile> when it is clean\n"},
   {"putdir",  &ShellExec::cmd_putdir,	"putdir <ldir> [<rdir>]",
	 "Scan and upload local directory <ldir> recursively\n"},
   {"pwd",     &ShellExec::cmd_pwd,	"pwd",
	 "Print current remote directory\n"},
   {"quit",    ALIAS_FOR(exit)},
   {"quote",   &ShellExec::cmd_quote,	"quote <cmd>",
	 "Send the command uninterpreted and print the reply\n"},
   {"rename",  &ShellExec::cmd_rename,	"rename <from> <to>",
	 "Rename remote file <from> to <to>\n"},
   {"rm",      &ShellExec::cmd_rm,	"rm <rfiles>",
	 "Remove remote files\n"},
   {"rmdir",   &ShellExec::cmd_rmdir,	"rmdir <rdirs>",
	 "Remove remote directories\n"},
   {"scan",    &ShellExec::cmd_scan,	"scan <lfile>",
	 "Ask the scanning agent for the verdict on a local file\n"},
   {"set",     &ShellExec::cmd_set,	"set [-a] [<var>[/<closure>] [<val>]]",
	 "Set variable to given value. If the value is omitted, unset the variable.\n"
	 "Without a variable name, list the variables set; -a lists all of them\n"},
   {"status",  &ShellExec::cmd_status,	"status [<path>]",
	 "Show server status (STAT)\n"},
   {"user",    &ShellExec::cmd_user,	"user <user> [<pass>]",
	 "Log in as <user>, asking for the password if not given\n"},
   {0}
};

CMD(ascii)
{
   if(CheckArgs(args,0,0))
      Submit(new TransferJob(TransferJob::SET_MODE,"ascii"));
}

CMD(binary)
{
   if(CheckArgs(args,0,0))
      Submit(new TransferJob(TransferJob::SET_MODE,"binary"));
}

CMD(passive)
{
   if(!CheckArgs(args,0,1))
      return;
   const char *a=args->getarg(1);
   bool on=true;
   if(a)
   {
      xstring_c v(a);
      const char *error=ResMgr::BoolValidate(&v);
      if(error)
      {
	 eprintf("%s: %s\n",a,error);
	 exit_code=1;
	 return;
      }
      on=ResMgr::str2bool(v);
   }
   Submit(new TransferJob(TransferJob::SET_MODE,on?"passive":"active"));
}

CMD(cd)
{
   if(CheckArgs(args,1,1))
      Submit(new TransferJob(TransferJob::COMMAND,"CWD",args->getarg(1)));
}

CMD(pwd)
{
   if(CheckArgs(args,0,0))
      Submit(new TransferJob(TransferJob::COMMAND,"PWD"));
}

CMD(status)
{
   if(CheckArgs(args,0,1))
      Submit(new TransferJob(TransferJob::COMMAND,"STAT",args->getarg(1)));
}

CMD(mkdir)
{
   if(!CheckArgs(args,1,-1))
      return;
   for(int i=1; i<args->count(); i++)
      Submit(new TransferJob(TransferJob::COMMAND,"MKD",args->getarg(i)));
}

CMD(rmdir)
{
   if(!CheckArgs(args,1,-1))
      return;
   for(int i=1; i<args->count(); i++)
      Submit(new TransferJob(TransferJob::COMMAND,"RMD",args->getarg(i)));
}

CMD(rm)
{
   if(!CheckArgs(args,1,-1))
      return;
   for(int i=1; i<args->count(); i++)
      Submit(new TransferJob(TransferJob::COMMAND,"DELE",args->getarg(i)));
}

CMD(quote)
{
   if(!CheckArgs(args,1,-1))
      return;
   xstring cmd;
   args->CombineTo(cmd,1);
   Submit(new TransferJob(TransferJob::COMMAND,cmd));
}

CMD(rename)
{
   if(CheckArgs(args,2,2))
      Submit(new TransferJob(TransferJob::RENAME,args->getarg(1),args->getarg(2)));
}

CMD(ls)
{
   if(CheckArgs(args,0,1))
      Submit(new TransferJob(TransferJob::LIST,args->getarg(1)));
}

CMD(put)
{
   if(!CheckArgs(args,1,2))
      return;
   const char *local=args->getarg(1);
   const char *remote=args->getarg(2);
   if(!remote)
      remote=FtpClient::BaseName(local);
   Submit(new TransferJob(TransferJob::UPLOAD_FILE,local,remote));
}

CMD(get)
{
   if(!CheckArgs(args,1,2))
      return;
   const char *remote=args->getarg(1);
   const char *local=args->getarg(2);
   if(!local)
      local=FtpClient::BaseName(remote);
   Submit(new TransferJob(TransferJob::DOWNLOAD_FILE,remote,local));
}

CMD(putdir)
{
   if(!CheckArgs(args,1,2))
      return;
   const char *local=args->getarg(1);
   const char *remote=args->getarg(2);
   if(!remote)
      remote=FtpClient::BaseName(local);
   Submit(new TransferJob(TransferJob::UPLOAD_FOLDER,local,remote));
}

CMD(getdir)
{
   if(!CheckArgs(args,1,2))
      return;
   const char *remote=args->getarg(1);
   const char *local=args->getarg(2);
   if(!local)
      local=FtpClient::BaseName(remote);
   Submit(new TransferJob(TransferJob::DOWNLOAD_FOLDER,remote,local));
}

CMD(mput)
{
   if(!CheckArgs(args,1,-1))
      return;
   int queued=0;
   for(int i=1; i<args->count(); i++)
   {
      glob_t g;
      int res=glob(args->getarg(i),0,0,&g);
      if(res==GLOB_NOMATCH)
      {
	 eprintf("%s: no files found\n",args->getarg(i));
	 exit_code=1;
	 continue;
      }
      if(res!=0)
      {
	 eprintf("%s: glob failed\n",args->getarg(i));
	 exit_code=1;
	 continue;
      }
      for(size_t j=0; j<g.gl_pathc; j++)
      {
	 const char *path=g.gl_pathv[j];
	 struct stat st;
	 if(stat(path,&st)==-1 || !S_ISREG(st.st_mode))
	    continue;
	 Submit(new TransferJob(TransferJob::UPLOAD_FILE,path,FtpClient::BaseName(path)));
	 queued++;
      }
      globfree(&g);
   }
   if(queued==0)
      exit_code=1;
}

CMD(mget)
{
   if(!CheckArgs(args,1,-1))
      return;
   for(int i=1; i<args->count(); i++)
      Submit(new TransferJob(TransferJob::DOWNLOAD_MATCHING,args->getarg(i)));
}

CMD(scan)
{
   if(!CheckArgs(args,1,-1))
      return;
   for(int i=1; i<args->count(); i++)
      Submit(new TransferJob(TransferJob::SCAN,args->getarg(i)));
}

CMD(open)
{
   const char *user=0;
   const char *pass=0;
   xstring_c user_buf;
   int c;
   while((c=args->getopt("+u:"))!=EOF)
   {
      switch(c)
      {
      case 'u':
      {
	 user_buf.set(optarg);
	 char *sep=strchr(user_buf.get_non_const(),',');
	 if(sep)
	 {
	    *sep=0;
	    pass=sep+1;
	 }
	 user=user_buf;
	 break;
      }
      default:
	 eprintf("Try `help %s' for more information.\n",args->a0());
	 exit_code=1;
	 return;
      }
   }
   const char *host=args->getcurr();
   if(!host)
   {
      CheckArgs(args,1,2);
      return;
   }
   const char *port_str=args->getarg(args->getindex()+1);
   int port=0;
   if(port_str)
   {
      xstring_c p(port_str);
      const char *error=ResMgr::PortValidate(&p);
      if(error)
      {
	 eprintf("%s: %s\n",port_str,error);
	 exit_code=1;
	 return;
      }
      port=atoi(port_str);
   }
   if(user && !pass)
   {
      pass=GetPass("Password: ");
      if(!pass)
	 pass="";
   }
   Open(host,port,user,pass);
}

CMD(user)
{
   if(!CheckArgs(args,1,2))
      return;
   const char *pass=args->getarg(2);
   xstring_c pass_buf;
   if(!pass)
   {
      pass_buf.set(GetPass("Password: "));
      pass=pass_buf?pass_buf.get():"";
   }
   Submit(new TransferJob(TransferJob::LOGIN,args->getarg(1),pass));
}

CMD(close)
{
   if(CheckArgs(args,0,0))
      Submit(new TransferJob(TransferJob::QUIT));
}

CMD(exit)
{
   done=true;
}

CMD(lcd)
{
   if(!CheckArgs(args,1,1))
      return;
   const char *dir=expand_home_relative(args->getarg(1));
   if(chdir(dir)==-1)
   {
      eprintf("lcd: %s: %s\n",dir,strerror(errno));
      exit_code=1;
      return;
   }
   exit_code=0;
}

CMD(set)
{
   xstring out;
   const char *error=set_from_args(args,out);
   if(error)
   {
      eprintf("%s\n",error);
      exit_code=1;
      return;
   }
   fputs(out?out.get():"",stdout);
   exit_code=0;
}

CMD(help)
{
   const char *name=args->getarg(1);
   if(name)
   {
      const cmd_rec *c;
      int part=find_cmd(name,&c);
      if(part!=1)
      {
	 eprintf(part==0?"No such command `%s'.\n":"Ambiguous help topic `%s'.\n",name);
	 exit_code=1;
	 return;
      }
      if(!c->short_desc)
      {
	 // alias: long_desc names the command
	 printf("%s is a built-in alias for %s\n",c->name,c->long_desc);
	 find_cmd(c->long_desc,&c);
      }
      if(c->short_desc)
	 printf("Usage: %s\n",c->short_desc);
      fputs(c->long_desc,stdout);
      exit_code=0;
      return;
   }
   int col=0;
   for(const cmd_rec *c=static_cmd_table; c->name; c++)
   {
      if(!c->short_desc)
	 continue;
      printf("\t%-40s",c->short_desc);
      if(++col==2)
      {
	 putchar('\n');
	 col=0;
      }
   }
   if(col)
      putchar('\n');
   exit_code=0;
}
