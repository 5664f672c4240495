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
#include <stdio.h>
#include <errno.h>
#include <ctype.h>
#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>
#include "ScanAgentServer.h"
#include "ProcWait.h"
#include "ProtoLog.h"
#include "log.h"

ScanAgentServer::ScanAgentServer(const char *s,const char *d,int t)
   : scanner(s), scratch_dir(d), io_timeout(t)
{
}

int ScanAgentServer::Listen(const char *host,int port)
{
   sockaddr_u addr;
   const char *err=Networker::Resolve(host,port,&addr);
   if(err)
   {
      error.SetF(Error::SCAN_AGENT_ERROR,"%s: %s",host,err);
      return -1;
   }
   if(!addr.is_loopback())
      ProtoLog::LogNote(0,"WARNING: scanning agent is listening on non-loopback address %s",addr.address());
   listen_sock.set(Networker::SocketListen(&addr,BACKLOG));
   if(!listen_sock.is_open())
   {
      error.SetF(Error::SCAN_AGENT_ERROR,"listen on %s: %s",addr.to_string(),strerror(errno));
      return -1;
   }
   if(mkdir(scratch_dir,0700)==-1 && errno!=EEXIST)
   {
      error.SetF(Error::FILE_SYSTEM_ERROR,"%s: %s",scratch_dir.get(),strerror(errno));
      listen_sock.close();
      return -1;
   }
   ProtoLog::LogNote(1,"Scanning agent is listening at %s:%d",host,GetPort());
   return 0;
}

int ScanAgentServer::GetPort() const
{
   sockaddr_u a;
   if(Networker::SocketLocalAddress(listen_sock,&a)==-1)
      return -1;
   return a.port();
}

ScanResult ScanAgentServer::RunScanner(const char *file)
{
   xstring spawn_error;
   ProcWait *p=ProcWait::Spawn(scanner,file,spawn_error);
   if(!p)
   {
      ProtoLog::LogError(0,"%s",spawn_error.get());
      return SCAN_ERROR;
   }
   Ref<ProcWait> proc(p);
   proc->Wait();
   int status=proc->ExitStatus();
   debug((5,"scanner exited with status %d\n",status));
   switch(status)
   {
   case 0:
      return SCAN_CLEAN;
   case 1:
      return SCAN_INFECTED;
   case 127:
      ProtoLog::LogError(0,"Can't find the scanner `%s'",scanner.get());
      return SCAN_ERROR;
   default:
      return SCAN_ERROR;
   }
}

// writes head and then the contents of body_fd into path
static int JoinFile(const char *path,const char *head,int head_len,int body_fd)
{
   AutoFD out(open(path,O_WRONLY|O_CREAT|O_TRUNC|O_CLOEXEC,0600));
   if(!out.is_open())
      return -1;
   if(lseek(body_fd,0,SEEK_SET)==-1)
      return -1;
   if(head_len>0 && Networker::WriteAll(out,head,head_len)<0)
      return -1;
   char buf[ScanProtocol::BUFFER_SIZE];
   for(;;)
   {
      int n=Networker::Read(body_fd,buf,sizeof(buf));
      if(n<0)
	 return -1;
      if(n==0)
	 break;
      if(Networker::WriteAll(out,buf,n)<0)
	 return -1;
   }
   return close(out.borrow());
}

ScanResult ScanAgentServer::Receive(int sock)
{
   char buf[ScanProtocol::BUFFER_SIZE];
   int n=Networker::Read(sock,buf,sizeof(buf));
   if(n<=0)
   {
      ProtoLog::LogError(0,"No request received: %s",n==0?"connection closed":strerror(errno));
      return SCAN_ERROR;
   }
   xstring name;
   xstring digits;
   int header_len=ScanProtocol::ParseHeader(buf,n,name,digits);
   if(header_len<0)
   {
      ProtoLog::LogError(0,"Malformed request header");
      return SCAN_ERROR;
   }
   const char *b=ScanProtocol::SanitizeName(name);
   if(!b)
   {
      ProtoLog::LogError(0,"Rejected file name `%s'",name.get());
      return SCAN_ERROR;
   }
   xstring base(b);
   xstring path;
   path.set(xstring::cat(scratch_dir.get(),"/",base.get(),NULL));
   xstring body_path;
   body_path.set(xstring::cat(path.get(),".part",NULL));

   const char *data=buf+header_len;
   int data_len=n-header_len;
   bool eof=false;
   // the first read may have ended inside the size digits
   while(data_len==0 && digits.length()<ScanProtocol::MAX_SIZE_DIGITS)
   {
      n=Networker::Read(sock,buf,sizeof(buf));
      if(n<0)
      {
	 ProtoLog::LogError(0,"Connection lost while reading the header: %s",strerror(errno));
	 return SCAN_ERROR;
      }
      if(n==0)
      {
	 eof=true;
	 break;
      }
      int d=0;
      while(d<n && digits.length()<ScanProtocol::MAX_SIZE_DIGITS && isdigit((unsigned char)buf[d]))
	 digits.append(buf[d++]);
      data=buf+d;
      data_len=n-d;
   }

   AutoFD body(open(body_path,O_RDWR|O_CREAT|O_TRUNC|O_CLOEXEC,0600));
   if(!body.is_open())
   {
      ProtoLog::LogError(0,"%s: %s",body_path.get(),strerror(errno));
      return SCAN_ERROR;
   }

   // with all digits taken as the size, this is the most content there can be
   long long limit=ScanProtocol::SizeCandidate(digits,digits.length());
   long long received=0;
   bool io_ok=true;
   for(;;)
   {
      if(data_len>limit-received)
	 data_len=limit-received;
      if(data_len>0 && Networker::WriteAll(body,data,data_len)<0)
      {
	 ProtoLog::LogError(0,"%s: %s",body_path.get(),strerror(errno));
	 io_ok=false;
	 break;
      }
      received+=data_len;
      if(received>=limit || eof)
	 break;
      long long want=limit-received;
      data_len=Networker::Read(sock,buf,want<(long long)sizeof(buf)?(int)want:(int)sizeof(buf));
      if(data_len<0)
      {
	 ProtoLog::LogError(0,"Connection lost after %lld bytes",received);
	 io_ok=false;
	 break;
      }
      if(data_len==0)
	 eof=true;
      data=buf;
   }

   ScanResult res=SCAN_ERROR;
   if(io_ok)
   {
      long long size=0;
      int size_digits=ScanProtocol::ResolveSize(digits,received,&size);
      if(size_digits<0)
	 ProtoLog::LogError(0,"Received %lld bytes after `%s', which does not match any declared size",
	    received,digits.get());
      else
      {
	 ProtoLog::LogNote(1,"Received %s (%lld bytes)",base.get(),size);
	 int joined;
	 if(size_digits==(int)digits.length())
	    joined=rename(body_path,path);
	 else
	    joined=JoinFile(path,digits.get()+size_digits,digits.length()-size_digits,body);
	 if(joined==-1)
	    ProtoLog::LogError(0,"%s: %s",path.get(),strerror(errno));
	 else
	    res=RunScanner(path);
      }
   }
   unlink(body_path);
   unlink(path);
   return res;
}

int ScanAgentServer::ServeOne()
{
   sockaddr_u peer;
   AutoFD sock(Networker::SocketAccept(listen_sock,&peer,-1));
   if(!sock.is_open())
   {
      int e=errno;
      error.Set(Error::SCAN_AGENT_ERROR,xstring::format("accept: %s",strerror(e)),e);
      ProtoLog::LogError(0,"%s",error.Text());
      return -1;
   }
   Networker::SetTimeout(sock,io_timeout);
   ProtoLog::LogNote(3,"Connection from %s",peer.to_string());

   ScanResult res=Receive(sock);
   const char *verdict=ScanProtocol::VerdictName(res);
   ProtoLog::LogNote(1,"Scanning result: %s",verdict);
   if(Networker::WriteAll(sock,verdict,strlen(verdict))<0)
      ProtoLog::LogError(0,"Cannot send verdict: %s",strerror(errno));
   return 0;
}

int ScanAgentServer::Run(bool loop)
{
   do
   {
      if(ServeOne()<0 && (!loop || !Networker::TemporaryNetworkError(error.Code())))
	 return -1;
   }
   while(loop);
   return 0;
}
