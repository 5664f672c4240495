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
#include <errno.h>
#include <time.h>
#include <sys/time.h>
#include "EventChannel.h"

int ProgressState::Percent() const
{
   if(total<=0)
      return total==0?100:-1;
   return (int)(transferred*100/total);
}

Event& Event::operator=(const Event& o)
{
   kind=o.kind;
   id=o.id;
   level=o.level;
   text.nset(o.text,o.text.length());
   progress=o.progress;
   ok=o.ok;
   return *this;
}

EventChannel::EventChannel()
   : closed(false), last_percent(-2)
{
   pthread_mutex_init(&mutex,0);
   pthread_cond_init(&cond,0);
}
EventChannel::~EventChannel()
{
   pthread_cond_destroy(&cond);
   pthread_mutex_destroy(&mutex);
}

void EventChannel::Post(const Event& e)
{
   pthread_mutex_lock(&mutex);
   if(!closed)
   {
      events.push_back(e);
      pthread_cond_signal(&cond);
   }
   pthread_mutex_unlock(&mutex);
}

void EventChannel::PostJobDone(int id,const char *text,bool ok)
{
   Event e(Event::JOB_DONE);
   e.id=id;
   e.text.set(text);
   e.ok=ok;
   Post(e);
}

bool EventChannel::Take(Event *e,int timeout)
{
   struct timespec deadline;
   if(timeout>=0)
   {
      struct timeval now;
      gettimeofday(&now,0);
      long long ns=(long long)now.tv_usec*1000+(long long)(timeout%1000)*1000000;
      deadline.tv_sec=now.tv_sec+timeout/1000+ns/1000000000;
      deadline.tv_nsec=ns%1000000000;
   }
   pthread_mutex_lock(&mutex);
   while(events.empty() && !closed)
   {
      if(timeout<0)
	 pthread_cond_wait(&cond,&mutex);
      else if(pthread_cond_timedwait(&cond,&mutex,&deadline)==ETIMEDOUT)
	 break;
   }
   bool got=!events.empty();
   if(got)
   {
      *e=events.front();
      events.pop_front();
   }
   pthread_mutex_unlock(&mutex);
   return got;
}

void EventChannel::Close()
{
   pthread_mutex_lock(&mutex);
   closed=true;
   pthread_cond_broadcast(&cond);
   pthread_mutex_unlock(&mutex);
}

size_t EventChannel::Size()
{
   pthread_mutex_lock(&mutex);
   size_t s=events.size();
   pthread_mutex_unlock(&mutex);
   return s;
}

void EventChannel::Progress(const ProgressState& p)
{
   int percent=p.Percent();
   bool done=(p.Known() && p.transferred>=p.total);
   pthread_mutex_lock(&mutex);
   bool skip=(!done && percent==last_percent && last_label.eq(p.label));
   if(!skip)
   {
      last_percent=percent;
      last_label.set(p.label);
   }
   pthread_mutex_unlock(&mutex);
   // unknown totals report every 64k
   if(skip && (p.Known() || (p.transferred&0xffff)!=0))
      return;

   Event e(Event::PROGRESS);
   e.progress=p;
   Post(e);
}

void EventChannel::LogLine(int level,const char *line)
{
   Event e(Event::LOG);
   e.level=level;
   e.text.set(line);
   Post(e);
}
