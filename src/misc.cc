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
#include <errno.h>
#include "misc.h"
#include "ResMgr.h"
#include "log.h"

const char *dir_file(const char *dir,const char *file)
{
   if(dir==0 || dir[0]==0)
      return file?file:dir;
   if(file==0 || file[0]==0)
      return dir;
   if(file[0]=='/')
      return file;
   if(file[0]=='.' && file[1]=='/')
      file+=2;

   xstring& buf=xstring::get_tmp(dir);
   if(buf.last_char()!='/')
      buf.append('/');
   return buf.append(file);
}

const char *expand_home_relative(const char *path)
{
   if(path[0]!='~' || (path[1]!='/' && path[1]!=0))
      return path;
   const char *home=getenv("HOME");
   if(!home)
      return path;
   return dir_file(home,path[1]?path+2:0);
}

const char *set_from_args(ArgV *args,xstring& out)
{
   bool with_defaults=false;
   int i=1;
   if(!xstrcmp(args->getarg(i),"-a"))
   {
      with_defaults=true;
      i++;
   }
   const char *name=args->getarg(i);
   if(!name)
   {
      ResMgr::Format(out,with_defaults);
      return 0;
   }

   xstring var(name);
   const char *closure=0;
   int slash=var.instr('/');
   if(slash!=-1)
   {
      var.get_non_const()[slash]=0;
      closure=var.get()+slash+1;
   }
   const char *value=0;
   xstring v;
   if(args->getarg(i+1))
      value=args->CombineTo(v,i+1);
   const char *error=ResMgr::Set(var,closure,value);
   if(error)
      return xstring::format("%s: %s",name,error);
   return 0;
}

int source_rc_file(const char *file,const char *(*other_cmd)(ArgV *args,void *data),void *data)
{
   FILE *f=fopen(file,"r");
   if(!f)
      return -1;
   debug((5,"sourcing %s\n",file));
   int bad=0;
   int line_no=0;
   char line[1024];
   while(fgets(line,sizeof(line),f))
   {
      line_no++;
      ArgV args;
      const char *error=args.Parse(line);
      if(!error && args.count()==0)
	 continue;
      if(!error)
      {
	 if(!strcmp(args.a0(),"set"))
	 {
	    xstring listing;
	    error=set_from_args(&args,listing);
	 }
	 else if(other_cmd)
	    error=other_cmd(&args,data);
	 else
	    error=xstring::format("%s: unknown command",args.a0());
      }
      if(error)
      {
	 fprintf(stderr,"%s:%d: %s\n",file,line_no,error);
	 bad++;
      }
   }
   fclose(f);
   return bad;
}
