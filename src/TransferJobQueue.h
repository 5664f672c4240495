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


#ifndef TRANSFERJOBQUEUE_H
#define TRANSFERJOBQUEUE_H

#include <deque>
#include <pthread.h>
#include "Error.h"

class TransferJob
{
public:
   enum kind_t
   {
      UPLOAD_FILE,	// path, name
      UPLOAD_FOLDER,	// path, name
      DOWNLOAD_FILE,	// name, path
      DOWNLOAD_FOLDER,	// name, path
      DOWNLOAD_MATCHING,// pattern
      LIST,		// path
      COMMAND,		// FTP command, argument
      RENAME,		// from, to
      SCAN,		// path
      CONNECT,		// host, port
      LOGIN,		// user, password
      SET_MODE,		// ascii, binary, passive or active
      QUIT,
      STOP		// terminates the worker
   };

private:
   kind_t kind;
   int id;
   xstring_c arg1;
   xstring_c arg2;
   int number;

   TransferJob(const TransferJob&);
   void operator=(const TransferJob&);

public:
   TransferJob(kind_t k,const char *a1=0,const char *a2=0,int n=0)
      : kind(k), id(0), arg1(a1), arg2(a2), number(n) {}

   kind_t Kind() const { return kind; }
   int Id() const { return id; }
   void SetId(int i) { id=i; }
   const char *Arg1() const { return arg1; }
   const char *Arg2() const { return arg2; }
   int Number() const { return number; }

   static const char *KindName(kind_t k);
   const char *Describe() const;
};

/* Executes one job on the worker thread. */
class JobRunner
{
public:
   virtual Error RunJob(const TransferJob *job)=0;
   virtual ~JobRunner() {}
};

/* Told about each job's fate; called on the worker thread, except
   JobDiscarded which is called by whoever stops the queue. */
class JobListener
{
public:
   virtual void JobStarted(const TransferJob *) {}
   virtual void JobFinished(const TransferJob *job,const Error& err)=0;
   virtual void JobDiscarded(const TransferJob *) {}
   virtual ~JobListener() {}
};

/* FIFO of jobs run one at a time by a single worker thread, which is the
   only thread touching the session. Enqueue never blocks. */
class TransferJobQueue
{
   JobRunner *runner;
   JobListener *listener;
   std::deque<TransferJob*> jobs;
   pthread_mutex_t mutex;
   pthread_cond_t cond;
   pthread_t worker;
   bool started;
   bool accepting;
   bool busy;
   int next_id;

   TransferJobQueue(const TransferJobQueue&);
   void operator=(const TransferJobQueue&);

   static void *WorkerMain(void *);
   void Work();
   void Join();

public:
   TransferJobQueue(JobRunner *r,JobListener *l=0);
   ~TransferJobQueue();

   int Start();
   // takes ownership; returns the job id, or -1 once the queue is stopped
   int Enqueue(TransferJob *job);
   // runs the jobs already queued, then stops the worker
   void Shutdown();
   // lets the running job finish and discards the rest
   void Stop();
   void WaitIdle();

   int Pending();
   bool Busy();
};

#endif//TRANSFERJOBQUEUE_H
