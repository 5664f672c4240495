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


#ifndef SCANAGENTCLIENT_H
#define SCANAGENTCLIENT_H

#include <pthread.h>
#include "ScanProtocol.h"
#include "ProcWait.h"
#include "ProgressSink.h"
#include "Error.h"
#include "Ref.h"

/* Decides whether a local file may be uploaded. */
class Scanner
{
public:
   virtual ScanResult Scan(const char *path,Error *err)=0;
   virtual ~Scanner() {}
};

/* Owns the scanning agent process. Start, restart and stop are
   serialized, so two failing scans never restart the agent twice. */
class ScanAgentSupervisor
{
   Ref<ProcWait> proc;
   pthread_mutex_t mutex;
   int start_count;
   int restart_count;

   ScanAgentSupervisor(const ScanAgentSupervisor&);
   void operator=(const ScanAgentSupervisor&);

protected:
   virtual bool IsRunning();
   virtual bool DoStart(Error *err);
   virtual void DoStop();
   void WarmUp();

public:
   ScanAgentSupervisor();
   virtual ~ScanAgentSupervisor();

   bool EnsureRunning(Error *err);
   bool Restart(Error *err);
   void Stop();

   int Starts() const { return start_count; }
   int Restarts() const { return restart_count; }
};

/* Sends files to the agent over loopback and reads its verdict.
   Transport failures are retried up to scan:max-attempts times in total,
   restarting the agent in between; when all attempts fail the result is
   SCAN_ERROR, never clean. */
class ScanAgentClient : public Scanner
{
   ScanAgentSupervisor *supervisor;
   ProgressSink *progress;
   ProgressState progress_state;
   int last_timeout;
   int attempts;

   int Attempt(const char *path,long long size,ScanResult *res,Error *err);

public:
   ScanAgentClient(ScanAgentSupervisor *s,ProgressSink *p=0);

   void SetProgressSink(ProgressSink *p) { progress=p; }
   ScanResult Scan(const char *path,Error *err);

   int LastTimeout() const { return last_timeout; }
   int Attempts() const { return attempts; }

   static int ScanTimeout(long long size);
};

#endif//SCANAGENTCLIENT_H
