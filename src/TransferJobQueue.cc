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
#include "TransferJobQueue.h"
#include "log.h"

const char *TransferJob::KindName(kind_t k)
{
   switch(k)
   {
   case UPLOAD_FILE:	   return "put";
   case UPLOAD_FOLDER:	   return "putdir";
   case DOWNLOAD_FILE:	   return "get";
   case DOWNLOAD_FOLDER:   return "getdir";
   case DOWNLOAD_MATCHING: return "mget";
   case LIST:		   return "ls";
   case COMMAND:	   return "quote";
   case RENAME:		   return "rename";
   case SCAN:		   return "scan";
   case CONNECT:	   return "open";
   case LOGIN:		   return "user";
   case SET_MODE:	   return "mode";
   case QUIT:		   return "close";
   case STOP:		   return "stop";
   }
   return "?";
}

const char *TransferJob::Describe() const
{
   xstring& s=xstring::format("[%d] %s",id,KindName(kind));
   if(arg1)
      s.append(' ').append(arg1);
   // never show the password
   if(arg2 && kind!=LOGIN)
      s.append(' ').append(arg2);
   return s;
}

TransferJobQueue::TransferJobQueue(JobRunner *r,JobListener *l)
   : runner(r), listener(l), started(false), accepting(true), busy(false), next_id(1)
{
   pthread_mutex_init(&mutex,0);
   pthread_cond_init(&cond,0);
}

TransferJobQueue::~TransferJobQueue()
{
   Stop();
   while(!jobs.empty())
   {
      delete jobs.front();
      jobs.pop_front();
   }
   pthread_cond_destroy(&cond);
   pthread_mutex_destroy(&mutex);
}

int TransferJobQueue::Start()
{
   pthread_mutex_lock(&mutex);
   int res=0;
   if(!started)
   {
      res=pthread_create(&worker,0,WorkerMain,this);
      if(res==0)
	 started=true;
      else
	 debug((0,"cannot start worker thread: %s\n",strerror(res)));
   }
   pthread_mutex_unlock(&mutex);
   return res==0?0:-1;
}

void *TransferJobQueue::WorkerMain(void *q)
{
   static_cast<TransferJobQueue*>(q)->Work();
   return 0;
}

void TransferJobQueue::Work()
{
   for(;;)
   {
      pthread_mutex_lock(&mutex);
      while(jobs.empty())
	 pthread_cond_wait(&cond,&mutex);
      TransferJob *job=jobs.front();
      jobs.pop_front();
      bool stop=(job->Kind()==TransferJob::STOP);
      busy=!stop;
      pthread_mutex_unlock(&mutex);

      if(stop)
      {
	 debug((9,"worker: stop\n"));
	 delete job;
	 break;
      }

      debug((9,"worker: start %s\n",job->Describe()));
      if(listener)
	 listener->JobStarted(job);
      Error err=runner->RunJob(job);
      if(listener)
	 listener->JobFinished(job,err);
      delete job;

      pthread_mutex_lock(&mutex);
      busy=false;
      pthread_cond_broadcast(&cond);
      pthread_mutex_unlock(&mutex);
   }

   pthread_mutex_lock(&mutex);
   busy=false;
   pthread_cond_broadcast(&cond);
   pthread_mutex_unlock(&mutex);
}

int TransferJobQueue::Enqueue(TransferJob *job)
{
   pthread_mutex_lock(&mutex);
   if(!accepting)
   {
      pthread_mutex_unlock(&mutex);
      debug((1,"queue is stopped, job %s dropped\n",TransferJob::KindName(job->Kind())));
      if(listener)
	 listener->JobDiscarded(job);
      delete job;
      return -1;
   }
   int id=next_id++;
   job->SetId(id);
   jobs.push_back(job);
   pthread_cond_broadcast(&cond);
   pthread_mutex_unlock(&mutex);
   return id;
}

void TransferJobQueue::Join()
{
   pthread_mutex_lock(&mutex);
   bool was_started=started;
   started=false;
   pthread_mutex_unlock(&mutex);
   if(was_started)
      pthread_join(worker,0);
}

void TransferJobQueue::Shutdown()
{
   pthread_mutex_lock(&mutex);
   if(accepting)
   {
      accepting=false;
      jobs.push_back(new TransferJob(TransferJob::STOP));
      pthread_cond_broadcast(&cond);
   }
   pthread_mutex_unlock(&mutex);
   Join();
}

void TransferJobQueue::Stop()
{
   std::deque<TransferJob*> discarded;
   pthread_mutex_lock(&mutex);
   accepting=false;
   while(!jobs.empty())
   {
      if(jobs.front()->Kind()==TransferJob::STOP)
	 delete jobs.front();
      else
	 discarded.push_back(jobs.front());
      jobs.pop_front();
   }
   jobs.push_back(new TransferJob(TransferJob::STOP));
   pthread_cond_broadcast(&cond);
   pthread_mutex_unlock(&mutex);

   while(!discarded.empty())
   {
      TransferJob *job=discarded.front();
      discarded.pop_front();
      debug((1,"job %s discarded\n",job->Describe()));
      if(listener)
	 listener->JobDiscarded(job);
      delete job;
   }
   Join();
}

void TransferJobQueue::WaitIdle()
{
   pthread_mutex_lock(&mutex);
   while(started && (busy || !jobs.empty()))
      pthread_cond_wait(&cond,&mutex);
   pthread_mutex_unlock(&mutex);
}

int TransferJobQueue::Pending()
{
   pthread_mutex_lock(&mutex);
   int n=jobs.size();
   pthread_mutex_unlock(&mutex);
   return n;
}

bool TransferJobQueue::Busy()
{
   pthread_mutex_lock(&mutex);
   bool b=busy;
   pthread_mutex_unlock(&mutex);
   return b;
}
