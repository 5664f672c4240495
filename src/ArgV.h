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


#ifndef ARGV_H
#define ARGV_H

#include <getopt.h>
#include "xstring.h"

/* Argument vector with getopt on it. Command lines typed in the shell or
   read from rc files are split into words with Parse. */
class ArgV
{
   char **v;
   int c;
   int ind;

   ArgV(const ArgV&);
   void operator=(const ArgV&);

public:
   ArgV() : v(0), c(0), ind(0) {}
   ArgV(int new_c,const char * const *new_v);
   ~ArgV() { Empty(); }

   void Empty();
   ArgV& Append(const char *s);
   /* splits at blanks; '...' and "..." quote, backslash escapes one
      character, an unquoted # starts a comment. Returns 0 or an error. */
   const char *Parse(const char *line);

   xstring& CombineTo(xstring& res,int start_index=0) const;

   int getopt_long(const char *opts,const struct option *lopts,int *lind=0);
   int getopt(const char *opts) { return getopt_long(opts,0,0); }
   const char *getopt_error_message(int e);

   void seek(int n) { ind=(n>c?c:n); }
   void rewind() { seek(0); }
   const char *getnext();
   const char *getarg(int n) const { return n>=0 && n<c?v[n]:0; }
   const char *getcurr() const { return getarg(ind); }
   int getindex() const { return ind; }
   const char *a0() const { return getarg(0); }
   int count() const { return c; }
};

#endif//ARGV_H
