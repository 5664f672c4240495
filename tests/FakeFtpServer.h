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


#ifndef FAKEFTPSERVER_H
#define FAKEFTPSERVER_H

#include <map>
#include <set>
#include <string>
#include <vector>
#include <pthread.h>
#include <openssl/ssl.h>
#include "network.h"

/* Plain-text FTP server on 127.0.0.1 for tests. Serves one client at a
   time from an in-memory tree and records every command it receives.
   AUTH TLS is refused, so clients continue in plain text, unless
   EnableTLS was called; then the control connection and, after PROT P,
   the data connections are protected with a throwaway certificate. */
class FakeFtpServer
{
   AutoFD listen_sock;
   int port;
   pthread_t thread;
   bool running;
   bool stop;
   pthread_mutex_t mutex;

   std::map<std::string,std::string> files;
   std::set<std::string> dirs;
   std::vector<std::string> commands;
   SSL_CTX *ssl_ctx;
   int protected_data;
   int resumed_data;

   // per connection
   std::string cwd;
   std::string rename_from;
   AutoFD pasv_sock;
   sockaddr_u port_addr;
   bool have_port;
   bool refuse_active;
   SSL *ctl_ssl;
   bool prot_p;

   static void *Main(void *);
   void Serve();
   void ServeClient(int sock);
   bool Send(int sock,const char *text);
   int OpenData();
   SSL *ProtectData(int fd);
   std::string Path(const std::string& name) const;
   std::string Listing(const std::string& dir);

   FakeFtpServer(const FakeFtpServer&);
   void operator=(const FakeFtpServer&);
public:
   FakeFtpServer();
   ~FakeFtpServer();
   bool Start();
   void Stop();
   int Port() const { return port; }
   // after PORT, never connect back; transfers end with 425
   void RefuseActiveData(bool r) { refuse_active=r; }
   // call before Start
   bool EnableTLS();
   int ProtectedDataConnections();
   int ResumedDataSessions();

   void AddFile(const std::string& path,const std::string& content);
   void AddDir(const std::string& path);
   bool HasFile(const std::string& path);
   bool HasDir(const std::string& path);
   std::string FileContent(const std::string& path);

   std::vector<std::string> Commands();
   int CountCommand(const char *verb);
};

#endif//FAKEFTPSERVER_H
