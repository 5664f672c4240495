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
#include "log.h"
#include "ProtoLog.h"

bool ProtoLog::WillOutput(int level)
{
   return Log::global && Log::global->WillOutput(level);
}

void ProtoLog::Log2(int level,xstring& str)
{
   str.chomp('\n');
   str.chomp('\r');
   str.append('\n');
   Log::global->Write(level,str);
}
void ProtoLog::Log3(int level,const char *prefix_var,const char *str)
{
   if(!WillOutput(level))
      return;
   const char *prefix=ResMgr::Query(prefix_var,0);
   Log2(level,xstring::get_tmp(prefix).append(str));
}
void ProtoLog::LogVF(int level,const char *prefix_var,const char *fmt,va_list v)
{
   if(!WillOutput(level))
      return;
   const char *prefix=ResMgr::Query(prefix_var,0);
   Log2(level,xstring::get_tmp(prefix).vappendf(fmt,v));
}
void ProtoLog::LogError(int level,const char *fmt,...)
{
   va_list v;
   va_start(v,fmt);
   LogVF(level,"log:prefix-error",fmt,v);
   va_end(v);
}
void ProtoLog::LogNote(int level,const char *fmt,...)
{
   va_list v;
   va_start(v,fmt);
   LogVF(level,"log:prefix-note",fmt,v);
   va_end(v);
}
void ProtoLog::LogRecv(int level,const char *line)
{
   Log3(level,"log:prefix-recv",line);
}
void ProtoLog::LogSend(int level,const char *line)
{
   Log3(level,"log:prefix-send",line);
}
