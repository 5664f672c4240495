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


#ifndef SCANPROTOCOL_H
#define SCANPROTOCOL_H

#include "xstring.h"

enum ScanResult
{
   SCAN_CLEAN,
   SCAN_INFECTED,
   SCAN_ERROR
};

/* Wire format between ScanAgentClient and ScanAgentServer:
   client sends "<path><SEPARATOR><size>" followed by exactly size bytes
   and shuts down its sending side, server answers CLEAN, INFECTED or
   ERROR and closes. */
class ScanProtocol
{
public:
   static const char SEPARATOR[];
   enum { BUFFER_SIZE=4096, MAX_SIZE_DIGITS=18 };

   static const char *VerdictName(ScanResult r);
   static ScanResult ParseVerdict(const char *buf,int len);

   static void FormatHeader(xstring& out,const char *path,long long size);

   /* The content follows the size without a delimiter and may itself
      start with digits. ParseHeader stores the whole digit run (at most
      MAX_SIZE_DIGITS) in digits and returns the offset just past it,
      or -1. The real split is found by ResolveSize once the number of
      content bytes after the run is known; the client half-closes its
      side after the content so the agent sees where it ends. */
   static int ParseHeader(const char *buf,int len,xstring& name,xstring& digits);
   // value of the first k digits, -1 if k is out of range
   static long long SizeCandidate(const char *digits,int k);
   // returns the number of size digits and sets size, or -1 on mismatch
   static int ResolveSize(const char *digits,long long tail,long long *size);

   /* Last path component; 0 for empty, "." and "..". The result lives in
      a temporary xstring, copy it before building more temporaries. */
   static const char *SanitizeName(const char *name);

   // seconds: base + per_mb for every whole megabyte
   static int Timeout(long long size,int base,int per_mb);
};

#endif//SCANPROTOCOL_H
