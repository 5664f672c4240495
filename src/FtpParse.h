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


#ifndef FTPPARSE_H
#define FTPPARSE_H

#include <vector>
#include "xstring.h"
#include "network.h"
#include "Error.h"

/* One control channel reply: three digit code and the text of the line. */
class Reply
{
   int code;
   xstring text;

public:
   Reply() : code(0) {}
   Reply(int c,const char *t) : code(c), text(t) {}
   Reply(const Reply& o) : code(o.code), text(o.text.get(),o.text.length()) {}
   Reply& operator=(const Reply& o)
      {
	 code=o.code;
	 text.nset(o.text,o.text.length());
	 return *this;
      }

   int Code() const { return code; }
   const char *Text() const { return text?text.get():""; }
   bool Is1XX() const { return code/100==1; }
   bool Is2XX() const { return code/100==2; }
   bool Is3XX() const { return code/100==3; }
   bool Is4XX() const { return code/100==4; }
   bool Is5XX() const { return code/100==5; }
   bool Is(int c) const { return code==c; }
};

struct FtpListEntry
{
   xstring name;
   bool is_dir;
   bool is_link;
   long long size;

   FtpListEntry() : is_dir(false), is_link(false), size(-1) {}
   FtpListEntry(const FtpListEntry& o)
      : name(o.name.get(),o.name.length()), is_dir(o.is_dir),
	is_link(o.is_link), size(o.size) {}
   FtpListEntry& operator=(const FtpListEntry& o)
      {
	 name.nset(o.name,o.name.length());
	 is_dir=o.is_dir;
	 is_link=o.is_link;
	 size=o.size;
	 return *this;
      }
};

/* Pure parsers for the pieces of FTP that carry structured text.
   None of them touches a socket. */
class FtpParse
{
public:
   // "ddd text" or "ddd-text"; false for anything else
   static bool ParseReplyLine(const char *line,int len,Reply *reply);

   /* 227 reply to PASV. The last blank-separated token is taken, a
      trailing '.' and ')' and a leading '(' are stripped, and exactly six
      comma separated numbers in 0..255 must remain. */
   static Result<sockaddr_u> ParsePASV(const char *reply_text);

   // argument of PORT for an IPv4 endpoint: h1,h2,h3,h4,p1,p2
   static bool FormatPORT(const sockaddr_u *a,xstring& out);

   /* Unix `ls -l' style line with at least 9 fields. Returns false for
      "total N", "." and "..", and lines which don't match. */
   static bool ParseListLine(const char *line,int len,FtpListEntry *e);
   static int ParseList(const char *buf,int len,std::vector<FtpListEntry>& out);
};

#endif//FTPPARSE_H
