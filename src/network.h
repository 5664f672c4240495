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


#ifndef NETWORK_H
#define NETWORK_H

#include <string.h>
#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include "xstring.h"

union sockaddr_u
{
   struct sockaddr	sa;
   struct sockaddr_in	in;
   struct sockaddr_in6	in6;

   socklen_t addr_len() const {
      if(sa.sa_family==AF_INET)
	 return sizeof(in);
      if(sa.sa_family==AF_INET6)
	 return sizeof(in6);
      return sizeof(*this);
   }
   const char *address() const;
   int port() const;
   void set_port(int port);
   int family() const { return sa.sa_family; }
   bool set_ipv4(const char *dotted,int port);
   bool is_loopback() const;
   const xstring& to_xstring() const;
   const char *to_string() const { return to_xstring(); }
   void clear() { memset(this,0,sizeof(*this)); }
   sockaddr_u() { clear(); }
};

/* Owns a file descriptor and closes it when going out of scope. */
class AutoFD
{
   int fd;
   AutoFD(const AutoFD&);
   void operator=(const AutoFD&);
public:
   AutoFD(int f=-1) : fd(f) {}
   ~AutoFD() { close(); }
   int get() const { return fd; }
   operator int() const { return fd; }
   void set(int f) { if(f!=fd) { close(); fd=f; } }
   int borrow() { return replace_value(fd,-1); }
   void close();
   bool is_open() const { return fd!=-1; }
};

class Networker
{
public:
   static void CloseOnExec(int fd);
   static void ReuseAddress(int sock);
   static void SetTimeout(int sock,int seconds);
   static int SocketCreateTCP(int af);
   static int SocketConnect(int fd,const sockaddr_u *u,int timeout);
   static int SocketListen(const sockaddr_u *u,int backlog);
   static int SocketAccept(int fd,sockaddr_u *u,int timeout);
   static int SocketLocalAddress(int fd,sockaddr_u *u);
   static bool IsNumericAddress(const char *host);
   static const char *Resolve(const char *host,int port,sockaddr_u *u);

   static int Read(int fd,char *buf,int size);
   static int WriteAll(int fd,const char *buf,int size);
   static bool TemporaryNetworkError(int e);
};

#endif //NETWORK_H
