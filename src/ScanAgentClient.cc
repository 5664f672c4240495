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
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include "ScanAgentClient.h"
#include "ProtoLog.h"
#include "ResMgr.h"
#include "network.h"
#include "log.h"

class MutexLock
{
   pthread_mutex_t *m;
public:
   MutexLock(pthread_mutex_t *m1) : m(m1) { pthread_mutex_lock(m); }
   ~MutexLock() { pthread_mutex_unlock(m); }
};

ScanAgentSupervisor::ScanAgentSupervisor()
   : start_count(0), restart_count(0)
{
   pthread_mutex_init(&mutex,0);
}
ScanAgentSupervisor::~ScanAgentSupervisor()
{
   if(proc)
   {
      proc->Kill(SIGTERM);
      proc->Wait();
   }
   pthread_mutex_destroy(&mutex);
}

bool ScanAgentSupervisor::IsRunning()
{
   return proc && proc->Poll()==ProcWait::RUNNING;
}

void ScanAgentSupervisor::WarmUp()
{
   int delay=ResMgr::Query("scan:warmup-delay",0);
   if(delay>0)
      sleep(delay);
}

bool ScanAgentSupervisor::DoStart(Error *err)
{
   const char *cmd=ResMgr::Query("scan:agent-command",0);
   xstring spawn_error;
   proc=ProcWait::Spawn(cmd,0,spawn_error);
   if(!proc)
   {
      err->SetF(Error::SCAN_AGENT_ERROR,"cannot start scanning agent `%s': %s",cmd,spawn_error.get());
      ProtoLog::LogError(0,"%s",err->Text());
      return false;
   }
   ProtoLog::LogNote(2,"Started scanning agent `%s' (pid %d)",cmd,(int)proc->GetPid());
   WarmUp();
   if(proc->Poll()!=ProcWait::RUNNING)
   {
      // another agent may already own the port, the connect will tell
      ProtoLog::LogNote(1,"Scanning agent exited with status %d",proc->ExitStatus());
      proc=0;
   }
   return true;
}

void ScanAgentSupervisor::DoStop()
{
   if(!proc)
      return;
   ProtoLog::LogNote(2,"Stopping scanning agent (pid %d)",(int)proc->GetPid());
   proc->Kill(SIGTERM);
   proc->Wait();
   proc=0;
}

bool ScanAgentSupervisor::EnsureRunning(Error *err)
{
   MutexLock lock(&mutex);
   if(IsRunning())
      return true;
   start_count++;
   return DoStart(err);
}

bool ScanAgentSupervisor::Restart(Error *err)
{
   MutexLock lock(&mutex);
   restart_count++;
   DoStop();
   start_count++;
   return DoStart(err);
}

void ScanAgentSupervisor::Stop()
{
   MutexLock lock(&mutex);
   DoStop();
}

ScanAgentClient::ScanAgentClient(ScanAgentSupervisor *s,ProgressSink *p)
   : supervisor(s), progress(p), last_timeout(0), attempts(0)
{
}

int ScanAgentClient::ScanTimeout(long long size)
{
   return ScanProtocol::Timeout(size,
	    ResMgr::Query("scan:base-timeout",0),
	    ResMgr::Query("scan:timeout-per-mb",0));
}

// returns -1 when the agent could not be talked to, so the scan may be retried
int ScanAgentClient::Attempt(const char *path,long long size,ScanResult *res,Error *err)
{
   if(!supervisor->EnsureRunning(err))
      return -1;

   const char *host=ResMgr::Query("scan:host",0);
   int port=ResMgr::Query("scan:port",0);
   sockaddr_u addr;
   const char *resolve_error=Networker::Resolve(host,port,&addr);
   if(resolve_error)
   {
      err->SetF(Error::SCAN_AGENT_ERROR,"%s: %s",host,resolve_error);
      return -1;
   }

   AutoFD sock(Networker::SocketCreateTCP(addr.family()));
   if(!sock.is_open()
   || Networker::SocketConnect(sock,&addr,ResMgr::Query("net:connect-timeout",0))==-1)
   {
      err->SetF(Error::SCAN_AGENT_ERROR,"connect to scanning agent %s: %s",
	 addr.to_string(),strerror(errno));
      return -1;
   }
   last_timeout=ScanTimeout(size);
   Networker::SetTimeout(sock,last_timeout);
   ProtoLog::LogNote(5,"Connected to scanning agent, timeout %ds",last_timeout);

   AutoFD file(open(path,O_RDONLY|O_CLOEXEC));
   if(!file.is_open())
   {
      err->SetF(Error::FILE_SYSTEM_ERROR,"%s: %s",path,strerror(errno));
      *res=SCAN_ERROR;
      return 0;
   }

   xstring header;
   ScanProtocol::FormatHeader(header,path,size);
   if(Networker::WriteAll(sock,header,header.length())<0)
   {
      err->SetF(Error::SCAN_AGENT_ERROR,"send to scanning agent: %s",strerror(errno));
      return -1;
   }

   progress_state.Start(xstring::cat("scan ",path,NULL),size);
   char buf[ScanProtocol::BUFFER_SIZE];
   long long left=size;
   while(left>0)
   {
      int n=Networker::Read(file,buf,left<(long long)sizeof(buf)?(int)left:(int)sizeof(buf));
      if(n<=0)
      {
	 err->SetF(Error::FILE_SYSTEM_ERROR,"%s: %s",path,
	    n==0?"file shrank while scanning":strerror(errno));
	 *res=SCAN_ERROR;
	 return 0;
      }
      if(Networker::WriteAll(sock,buf,n)<0)
      {
	 err->SetF(Error::SCAN_AGENT_ERROR,"send to scanning agent: %s",
	    E_RETRY(errno)?"timed out":strerror(errno));
	 return -1;
      }
      left-=n;
      progress_state.transferred+=n;
      if(progress)
	 progress->Progress(progress_state);
   }

   // end of content; the agent needs it when the content starts with digits
   if(shutdown(sock,SHUT_WR)==-1)
   {
      err->SetF(Error::SCAN_AGENT_ERROR,"send to scanning agent: %s",strerror(errno));
      return -1;
   }

   int n=Networker::Read(sock,buf,sizeof(buf));
   if(n<=0)
   {
      err->SetF(Error::SCAN_AGENT_ERROR,"no verdict from scanning agent: %s",
	 n==0?"connection closed":E_RETRY(errno)?"timed out":strerror(errno));
      return -1;
   }
   *res=ScanProtocol::ParseVerdict(buf,n);
   ProtoLog::LogNote(1,"Scan verdict for %s: %s",path,ScanProtocol::VerdictName(*res));
   return 0;
}

ScanResult ScanAgentClient::Scan(const char *path,Error *err)
{
   err->Clear();
   attempts=0;
   struct stat st;
   if(stat(path,&st)==-1)
   {
      err->SetF(Error::FILE_SYSTEM_ERROR,"%s: %s",path,strerror(errno));
      ProtoLog::LogError(0,"%s",err->Text());
      return SCAN_ERROR;
   }
   if(!S_ISREG(st.st_mode))
   {
      err->SetF(Error::FILE_SYSTEM_ERROR,"%s: Not a regular file",path);
      ProtoLog::LogError(0,"%s",err->Text());
      return SCAN_ERROR;
   }

   int max_attempts=ResMgr::Query("scan:max-attempts",0);
   if(max_attempts<1)
      max_attempts=1;
   for(;;)
   {
      attempts++;
      ScanResult res=SCAN_ERROR;
      Error attempt_err;
      if(Attempt(path,st.st_size,&res,&attempt_err)==0)
      {
	 *err=attempt_err;
	 if(res==SCAN_INFECTED)
	    err->SetF(Error::SECURITY_REJECTION,"%s: rejected: malware detected",path);
	 else if(res==SCAN_ERROR && err->IsOK())
	    err->SetF(Error::SECURITY_REJECTION,"%s: rejected: scanner reported an error",path);
	 return res;
      }
      ProtoLog::LogError(1,"Scan attempt %d of %d failed: %s",attempts,max_attempts,attempt_err.Text());
      if(attempts>=max_attempts)
      {
	 err->SetF(Error::SCAN_AGENT_ERROR,"%s: scanning agent unavailable after %d attempts: %s",
	    path,attempts,attempt_err.Text());
	 ProtoLog::LogError(0,"%s",err->Text());
	 return SCAN_ERROR;
      }
      Error restart_err;
      if(!supervisor->Restart(&restart_err))
	 ProtoLog::LogError(1,"%s",restart_err.Text());
   }
}
