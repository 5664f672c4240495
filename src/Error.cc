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
#include <stdarg.h>
#include "Error.h"

Error& Error::operator=(const Error& o)
{
   if(this!=&o)
      Set(o.kind,o.text,o.code);
   return *this;
}

void Error::Set(kind_t k,const char *s,int c)
{
   kind=k;
   code=c;
   text.set(s);
}

void Error::SetF(kind_t k,const char *fmt,...)
{
   va_list v;
   va_start(v,fmt);
   xstring& s=xstring::vformat(fmt,v);
   va_end(v);
   Set(k,s);
}

const char *Error::KindName(kind_t k)
{
   switch(k)
   {
   case OK:		  return "ok";
   case CONNECTION_ERROR:  return "connection error";
   case PROTOCOL_ERROR:	  return "protocol error";
   case TRANSFER_ERROR:	  return "transfer error";
   case SCAN_AGENT_ERROR:  return "scan agent error";
   case FILE_SYSTEM_ERROR: return "file system error";
   case SECURITY_REJECTION: return "security rejection";
   }
   return "unknown error";
}
