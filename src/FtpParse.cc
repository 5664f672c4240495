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
#include <ctype.h>
#include <stdlib.h>
#include <alloca.h>
#include "FtpParse.h"

bool FtpParse::ParseReplyLine(const char *line,int len,Reply *reply)
{
   while(len>0 && (line[len-1]=='\n' || line[len-1]=='\r'))
      len--;
   if(len<3)
      return false;
   for(int i=0; i<3; i++)
      if(!isdigit((unsigned char)line[i]))
	 return false;
   if(len>3 && line[3]!=' ' && line[3]!='-')
      return false;
   int code=(line[0]-'0')*100+(line[1]-'0')*10+(line[2]-'0');
   if(code<100 || code>599)
      return false;
   *reply=Reply(code,xstring::get_tmp(line,len));
   return true;
}

static bool parse_byte(const char *s,int len,int *value)
{
   if(len<1 || len>3)
      return false;
   int v=0;
   for(int i=0; i<len; i++)
   {
      if(!isdigit((unsigned char)s[i]))
	 return false;
      v=v*10+(s[i]-'0');
   }
   if(v>255)
      return false;
   *value=v;
   return true;
}

Result<sockaddr_u> FtpParse::ParsePASV(const char *reply_text)
{
   xstring line(reply_text);
   line.chomp('\n');
   line.chomp('\r');
   line.rtrim(' ');

   // last whitespace-delimited token
   const char *b=line.get();
   if(!b || !*b)
      return Result<sockaddr_u>(Error::PROTOCOL_ERROR,"empty PASV reply");
   const char *t=b+line.length();
   while(t>b && !isspace((unsigned char)t[-1]))
      t--;
   xstring tok(t);
   tok.chomp('.');
   tok.chomp(')');
   if(tok.begins_with("("))
      tok.set_substr(0,1,"",0);

   int n[6];
   int count=0;
   const char *f=tok.get();
   const char *end=f+tok.length();
   while(f && f<=end)
   {
      const char *comma=(const char*)memchr(f,',',end-f);
      const char *fend=comma?comma:end;
      if(count>=6 || !parse_byte(f,fend-f,&n[count]))
	 return Result<sockaddr_u>(Error::PROTOCOL_ERROR,
	    xstring::format("cannot parse PASV reply `%s'",line.get()));
      count++;
      if(!comma)
	 break;
      f=comma+1;
   }
   if(count!=6)
      return Result<sockaddr_u>(Error::PROTOCOL_ERROR,
	 xstring::format("cannot parse PASV reply `%s'",line.get()));

   sockaddr_u a;
   const char *dotted=xstring::format("%d.%d.%d.%d",n[0],n[1],n[2],n[3]);
   a.set_ipv4(dotted,n[4]*256+n[5]);
   return a;
}

bool FtpParse::FormatPORT(const sockaddr_u *a,xstring& out)
{
   if(a->family()!=AF_INET)
      return false;
   const unsigned char *h=(const unsigned char*)&a->in.sin_addr;
   int port=a->port();
   out.setf("%d,%d,%d,%d,%d,%d",h[0],h[1],h[2],h[3],port/256,port%256);
   return true;
}

/*
drwxr-xr-x   4 lav      root         1024 Feb 22 15:32 lib
-rw-r--r--   1 lav      root         1349 Feb  2 14:10 my file.txt
lrwxrwxrwx   1 lav      root           33 Feb 14 17:45 ltconfig -> /usr/share/libtool/ltconfig
*/
bool FtpParse::ParseListLine(const char *line,int len,FtpListEntry *e)
{
   while(len>0 && (line[len-1]=='\n' || line[len-1]=='\r'))
      len--;
   if(len==0 || !line[0] || !strchr("-dl",line[0]))
      return false;

   const char *field[9];
   int field_len[9];
   int nf=0;
   const char *p=line;
   const char *end=line+len;
   while(nf<9)
   {
      while(p<end && (*p==' ' || *p=='\t'))
	 p++;
      if(p>=end)
	 break;
      field[nf]=p;
      while(p<end && *p!=' ' && *p!='\t')
	 p++;
      field_len[nf]=p-field[nf];
      nf++;
   }
   if(nf<9)
      return false;

   // the name runs from the 9th field to the end of line, blanks included
   const char *name=field[8];
   int name_len=end-name;
   if(line[0]=='l')
   {
      for(const char *a=name; a+4<=end; a++)
      {
	 if(!strncmp(a," -> ",4))
	 {
	    name_len=a-name;
	    break;
	 }
      }
   }
   if((name_len==1 && name[0]=='.')
   || (name_len==2 && name[0]=='.' && name[1]=='.'))
      return false;

   e->name.nset(name,name_len);
   e->is_dir=(line[0]=='d');
   e->is_link=(line[0]=='l');
   e->size=-1;
   if(isdigit((unsigned char)field[4][0]))
      e->size=strtoll(xstring::get_tmp(field[4],field_len[4]),0,10);
   return true;
}

int FtpParse::ParseList(const char *buf,int len,std::vector<FtpListEntry>& out)
{
   int count=0;
   const char *end=buf+len;
   while(buf<end)
   {
      const char *nl=(const char*)memchr(buf,'\n',end-buf);
      const char *line_end=nl?nl:end;
      FtpListEntry e;
      if(ParseListLine(buf,line_end-buf,&e))
      {
	 out.push_back(e);
	 count++;
      }
      buf=nl?nl+1:end;
   }
   return count;
}
