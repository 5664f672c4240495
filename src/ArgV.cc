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
#include "ArgV.h"

ArgV::ArgV(int new_c,const char * const *new_v)
   : v(0), c(0), ind(0)
{
   for(int i=0; i<new_c; i++)
      Append(new_v[i]);
}

void ArgV::Empty()
{
   for(int i=0; i<c; i++)
      xfree(v[i]);
   xfree(v);
   v=0;
   c=0;
   ind=0;
}

ArgV& ArgV::Append(const char *s)
{
   v=(char**)xrealloc(v,(c+2)*sizeof(*v));
   v[c++]=xstrdup(s);
   v[c]=0;
   return *this;
}

const char *ArgV::Parse(const char *line)
{
   Empty();
   xstring word;
   const char *p=line;
   for(;;)
   {
      while(*p==' ' || *p=='\t' || *p=='\n' || *p=='\r')
	 p++;
      if(!*p || *p=='#')
	 break;
      word.set("");
      char quote=0;
      while(*p && (quote || (*p!=' ' && *p!='\t' && *p!='\n' && *p!='\r')))
      {
	 if(quote && *p==quote)
	    quote=0;
	 else if(!quote && (*p=='\'' || *p=='"'))
	    quote=*p;
	 else if(*p=='\\' && quote!='\'' && p[1])
	    word.append(*++p);
	 else
	    word.append(*p);
	 p++;
      }
      if(quote)
	 return "unterminated quoted string";
      Append(word);
   }
   return 0;
}

xstring& ArgV::CombineTo(xstring& res,int start) const
{
   res.nset("",0);
   for(int i=start; i<c; i++)
   {
      if(i>start)
	 res.append(' ');
      res.append(v[i]);
   }
   return res;
}

const char *ArgV::getnext()
{
   if(ind<c)
      ind++;
   return getcurr();
}

int ArgV::getopt_long(const char *opts,const struct option *lopts,int *lind)
{
   // optind 0 makes glibc reinitialize for a new vector
   optind=(ind<1?0:ind);
   int r=::getopt_long(c,v,opts,lopts,lind);
   ind=optind;
   return r;
}

const char *ArgV::getopt_error_message(int e)
{
   if(optopt>=32 && optopt<127)
   {
      if(e==':')
	 return xstring::format("option requires an argument -- %c",optopt);
      else
	 return xstring::format("invalid option -- %c",optopt);
   }
   if(ind>1)
   {
      if(e==':')
	 return xstring::format("option `%s' requires an argument",getarg(ind-1));
      else
	 return xstring::format("unrecognized option `%s'",getarg(ind-1));
   }
   return "invalid option";
}
