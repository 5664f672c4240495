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


#ifndef ERROR_H
#define ERROR_H

#include "xstring.h"

class Error
{
public:
   enum kind_t
   {
      OK=0,
      CONNECTION_ERROR,	   // TCP connect/timeout failures
      PROTOCOL_ERROR,	   // unparsable reply, unexpected reply code
      TRANSFER_ERROR,	   // non-150 reply, I/O failure mid-stream
      SCAN_AGENT_ERROR,	   // cannot talk to the scanning agent
      FILE_SYSTEM_ERROR,   // missing local file, permission denied
      SECURITY_REJECTION   // scan verdict was not clean
   };

private:
   kind_t kind;
   int code;
   xstring text;

public:
   Error() : kind(OK), code(0) {}
   Error(kind_t k,const char *s,int c=0) : kind(k), code(c), text(s) {}
   Error(const Error& o) : kind(o.kind), code(o.code), text(o.text.get(),o.text.length()) {}
   Error& operator=(const Error& o);

   void Set(kind_t k,const char *s,int c=0);
   void SetF(kind_t k,const char *fmt,...) PRINTF_LIKE(3,4);
   void Clear() { Set(OK,0,0); }

   kind_t Kind() const { return kind; }
   int Code() const { return code; }
   const char *Text() const { return text?text.get():""; }
   bool IsOK() const { return kind==OK; }
   bool IsSecurityRejection() const { return kind==SECURITY_REJECTION; }

   static const char *KindName(kind_t k);
   const char *KindName() const { return KindName(kind); }
};

/* Value of an operation, or the Error that prevented it. */
template<typename T> class Result
{
   T value;
   Error error;
public:
   Result(const T& v) : value(v) {}
   Result(const Error& e) : value(), error(e) {}
   Result(Error::kind_t k,const char *s,int c=0) : value(), error(k,s,c) {}

   bool ok() const { return error.IsOK(); }
   const T& Value() const { return value; }
   T& Value() { return value; }
   const Error& GetError() const { return error; }
};

#endif//ERROR_H
