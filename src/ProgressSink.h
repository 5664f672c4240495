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


#ifndef PROGRESSSINK_H
#define PROGRESSSINK_H

#include "xstring.h"

class ProgressState
{
public:
   xstring label;
   long long total;	   // -1 if unknown
   long long transferred;

   ProgressState() : total(-1), transferred(0) {}
   ProgressState(const ProgressState& o)
      : label(o.label.get(),o.label.length()), total(o.total), transferred(o.transferred) {}
   ProgressState& operator=(const ProgressState& o)
      {
	 label.nset(o.label,o.label.length());
	 total=o.total;
	 transferred=o.transferred;
	 return *this;
      }

   void Start(const char *l,long long t) { label.set(l); total=t; transferred=0; }
   bool Known() const { return total>=0; }
   int Percent() const;
};

/* Receives progress from the code doing the I/O. Called in the
   worker thread. */
class ProgressSink
{
public:
   virtual void Progress(const ProgressState& p)=0;
   virtual ~ProgressSink() {}
};

#endif//PROGRESSSINK_H
