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
#include "ScanProtocol.h"

const char ScanProtocol::SEPARATOR[]="<SEPARATOR>";

const char *ScanProtocol::VerdictName(ScanResult r)
{
   switch(r)
   {
   case SCAN_CLEAN:    return "CLEAN";
   case SCAN_INFECTED: return "INFECTED";
   case SCAN_ERROR:    return "ERROR";
   }
   return "ERROR";
}

ScanResult ScanProtocol::ParseVerdict(const char *buf,int len)
{
   while(len>0 && isspace((unsigned char)buf[len-1]))
      len--;
   while(len>0 && isspace((unsigned char)*buf))
      buf++,len--;
   if(len==5 && !memcmp(buf,"CLEAN",5))
      return SCAN_CLEAN;
   if(len==8 && !memcmp(buf,"INFECTED",8))
      return SCAN_INFECTED;
   return SCAN_ERROR;
}

void ScanProtocol::FormatHeader(xstring& out,const char *path,long long size)
{
   out.setf("%s%s%lld",path,SEPARATOR,size);
}

int ScanProtocol::ParseHeader(const char *buf,int len,xstring& name,xstring& digits)
{
   const int sep_len=sizeof(SEPARATOR)-1;
   const char *sep=0;
   for(const char *p=buf; p+sep_len<=buf+len; p++)
   {
      if(!memcmp(p,SEPARATOR,sep_len))
      {
	 sep=p;
	 break;
      }
   }
   if(!sep)
      return -1;
   const char *d=sep+sep_len;
   const char *end=buf+len;
   if(d>=end || !isdigit((unsigned char)*d))
      return -1;
   digits.truncate(0);
   while(d<end && digits.length()<MAX_SIZE_DIGITS && isdigit((unsigned char)*d))
      digits.append(*d++);
   name.nset(buf,sep-buf);
   return d-buf;
}

long long ScanProtocol::SizeCandidate(const char *digits,int k)
{
   if(k<1 || k>MAX_SIZE_DIGITS || k>(int)strlen(digits))
      return -1;
   long long n=0;
   for(int i=0; i<k; i++)
   {
      if(!isdigit((unsigned char)digits[i]))
	 return -1;
      n=n*10+(digits[i]-'0');
   }
   return n;
}

int ScanProtocol::ResolveSize(const char *digits,long long tail,long long *size)
{
   int len=strlen(digits);
   for(int k=1; k<=len; k++)
   {
      long long n=SizeCandidate(digits,k);
      if(n<0)
	 return -1;
      if(n==(len-k)+tail)
      {
	 *size=n;
	 return k;
      }
   }
   return -1;
}

const char *ScanProtocol::SanitizeName(const char *name)
{
   if(!name)
      return 0;
   xstring& base=xstring::get_tmp(name);
   const char *slash=strrchr(base,'/');
   const char *bslash=strrchr(base,'\\');
   if(bslash && (!slash || bslash>slash))
      slash=bslash;
   const char *b=slash?slash+1:base.get();
   if(!b || !*b || !strcmp(b,".") || !strcmp(b,".."))
      return 0;
   return b;
}

int ScanProtocol::Timeout(long long size,int base,int per_mb)
{
   if(size<0)
      size=0;
   return base+per_mb*(int)(size/(1024*1024));
}
