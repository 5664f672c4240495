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


#ifndef EVENTCHANNEL_H
#define EVENTCHANNEL_H

#include <deque>
#include <pthread.h>
#include "ProgressSink.h"
#include "log.h"

class Event
{
public:
   enum kind_t { LOG, PROGRESS, JOB_DONE, CLOSED };

   kind_t kind;
   int id;     // job id of JOB_DONE
   int level;
   xstring text;
   ProgressState progress;
   bool ok;

   Event(kind_t k=CLOSED) : kind(k), id(0), level(0), ok(true) {}
   Event(const Event& o)
      : kind(o.kind), id(o.id), level(o.level), text(o.text.get(),o.text.length()),
	progress(o.progress), ok(o.ok) {}
   Event& operator=(const Event& o);
};

/* Thread-safe hand-off from the worker to whoever displays things.
   The worker only posts; the display thread only takes. */
class EventChannel : public ProgressSink, public LogListener
{
   std::deque<Event> events;
   pthread_mutex_t mutex;
   pthread_cond_t cond;
   bool closed;
   // progress events are coalesced: at most one per label per percent
   int last_percent;
   xstring last_label;

   EventChannel(const EventChannel&);
   void operator=(const EventChannel&);

public:
   EventChannel();
   ~EventChannel();

   void Post(const Event& e);
   void PostJobDone(int id,const char *text,bool ok);
   // timeout in milliseconds, -1 waits forever; false on timeout or close
   bool Take(Event *e,int timeout=-1);
   void Close();
   size_t Size();

   void Progress(const ProgressState& p);
   void LogLine(int level,const char *line);
};

#endif//EVENTCHANNEL_H
