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
#include <netdb.h>
#include <poll.h>
#include <unistd.h>
#include <netinet/tcp.h>
#include "network.h"

const char *sockaddr_u::address() const
{
   static thread_local char buf[INET6_ADDRSTRLEN];
   if(sa.sa_family==AF_INET)
      return inet_ntop(AF_INET,&in.sin_addr,buf,sizeof(buf));
   if(sa.sa_family==AF_INET6)
      return inet_ntop(AF_INET6,&in6.sin6_addr,buf,sizeof(buf));
   return "?";
}

int sockaddr_u::port() const
{
   if(sa.sa_family==AF_INET)
      return ntohs(in.sin_port);
   if(sa.sa_family==AF_INET6)
      return ntohs(in6.sin6_port);
   return 0;
}

void sockaddr_u::set_port(int port)
{
   if(sa.sa_family==AF_INET)
      in.sin_port=htons(port);
   else if(sa.sa_family==AF_INET6)
      in6.sin6_port=htons(port);
}

bool sockaddr_u::set_ipv4(const char *dotted,int p)
{
   clear();
   in.sin_family=AF_INET;
   if(inet_pton(AF_INET,dotted,&in.sin_addr)!=1)
      return false;
   in.sin_port=htons(p);
   return true;
}

bool sockaddr_u::is_loopback() const
{
   if(sa.sa_family==AF_INET)
      return (ntohl(in.sin_addr.s_addr)>>24)==127;
   if(sa.sa_family==AF_INET6)
      return IN6_IS_ADDR_LOOPBACK(&in6.sin6_addr);
   return false;
}

const xstring& sockaddr_u::to_xstring() const
{
   xstring& s=xstring::get_tmp(address());
   if(sa.sa_family==AF_INET6)
      s.set(xstring::format("[%s]",address()));
   return s.appendf(" port %d",port());
}

void AutoFD::close()
{
   if(fd!=-1)
      ::close(fd);
   fd=-1;
}

void Networker::CloseOnExec(int fd)
{
   fcntl(fd,F_SETFD,FD_CLOEXEC);
}

void Networker::ReuseAddress(int sock)
{
   int on=1;
   setsockopt(sock,SOL_SOCKET,SO_REUSEADDR,(char*)&on,sizeof(on));
}

void Networker::SetTimeout(int sock,int seconds)
{
   struct timeval tv;
   tv.tv_sec=seconds;
   tv.tv_usec=0;
   setsockopt(sock,SOL_SOCKET,SO_RCVTIMEO,(char*)&tv,sizeof(tv));
   setsockopt(sock,SOL_SOCKET,SO_SNDTIMEO,(char*)&tv,sizeof(tv));
}

int Networker::SocketCreateTCP(int af)
{
   int s=socket(af,SOCK_STREAM,IPPROTO_TCP);
   if(s==-1)
      return -1;
   CloseOnExec(s);
   return s;
}

int Networker::SocketConnect(int fd,const sockaddr_u *u,int timeout)
{
   int flags=fcntl(fd,F_GETFL);
   fcntl(fd,F_SETFL,flags|O_NONBLOCK);
   int res=connect(fd,&u->sa,u->addr_len());
   if(res==-1 && errno==EINPROGRESS)
   {
      struct pollfd pfd;
      pfd.fd=fd;
      pfd.events=POLLOUT;
      do
	 res=poll(&pfd,1,timeout*1000);
      while(res==-1 && errno==EINTR);
      if(res==0)
      {
	 errno=ETIMEDOUT;
	 res=-1;
      }
      else if(res>0)
      {
	 int err=0;
	 socklen_t len=sizeof(err);
	 getsockopt(fd,SOL_SOCKET,SO_ERROR,(char*)&err,&len);
	 if(err)
	 {
	    errno=err;
	    res=-1;
	 }
	 else
	    res=0;
      }
   }
   int saved_errno=errno;
   fcntl(fd,F_SETFL,flags);
   errno=saved_errno;
   return res;
}

int Networker::SocketListen(const sockaddr_u *u,int backlog)
{
   int s=SocketCreateTCP(u->family());
   if(s==-1)
      return -1;
   ReuseAddress(s);
   if(bind(s,&u->sa,u->addr_len())==-1 || listen(s,backlog)==-1)
   {
      int saved_errno=errno;
      close(s);
      errno=saved_errno;
      return -1;
   }
   return s;
}

int Networker::SocketAccept(int fd,sockaddr_u *u,int timeout)
{
   struct pollfd pfd;
   pfd.fd=fd;
   pfd.events=POLLIN;
   int res;
   do
      res=poll(&pfd,1,timeout<0?-1:timeout*1000);
   while(res==-1 && errno==EINTR);
   if(res==0)
   {
      errno=ETIMEDOUT;
      return -1;
   }
   if(res==-1)
      return -1;
   sockaddr_u tmp;
   socklen_t len=sizeof(tmp);
   if(!u)
      u=&tmp;
   int a=accept(fd,&u->sa,&len);
   if(a!=-1)
      CloseOnExec(a);
   return a;
}

int Networker::SocketLocalAddress(int fd,sockaddr_u *u)
{
   socklen_t len=sizeof(*u);
   return getsockname(fd,&u->sa,&len);
}

bool Networker::IsNumericAddress(const char *host)
{
   struct in6_addr a6;
   struct in_addr a4;
   return inet_pton(AF_INET,host,&a4)==1 || inet_pton(AF_INET6,host,&a6)==1;
}

const char *Networker::Resolve(const char *host,int port,sockaddr_u *u)
{
   struct addrinfo hints;
   memset(&hints,0,sizeof(hints));
   hints.ai_family=AF_INET;   // PORT can only carry IPv4 addresses
   hints.ai_socktype=SOCK_STREAM;
   struct addrinfo *ai=0;
   int res=getaddrinfo(host,0,&hints,&ai);
   if(res!=0)
      return gai_strerror(res);
   u->clear();
   memcpy(&u->sa,ai->ai_addr,ai->ai_addrlen);
   u->set_port(port);
   freeaddrinfo(ai);
   return 0;
}

int Networker::Read(int fd,char *buf,int size)
{
   int res;
   do
      res=read(fd,buf,size);
   while(res==-1 && errno==EINTR);
   return res;
}

int Networker::WriteAll(int fd,const char *buf,int size)
{
   int done=0;
   while(done<size)
   {
      int res=send(fd,buf+done,size-done,MSG_NOSIGNAL);
      if(res==-1 && errno==ENOTSOCK)   // local files
	 res=write(fd,buf+done,size-done);
      if(res==-1)
      {
	 if(errno==EINTR)
	    continue;
	 return -1;
      }
      done+=res;
   }
   return done;
}

bool Networker::TemporaryNetworkError(int e)
{
   return E_RETRY(e) || e==ENETUNREACH || e==EHOSTUNREACH || e==ECONNRESET
      || e==ETIMEDOUT || e==ECONNREFUSED || e==EPIPE;
}
