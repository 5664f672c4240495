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


#ifndef DATACHANNEL_H
#define DATACHANNEL_H

#include "ControlChannel.h"
#include "TLSUpgrader.h"

/* Per-transfer data socket, plus the listening socket in active mode,
   optionally wrapped in TLS. Marks its Session as having a data
   connection open for as long as it lives or until Close. */
class DataConnection
{
   Session *session;
   bool acquired;
   AutoFD sock;
   AutoFD listen_sock;
   Ref<clamftp_ssl> ssl;
   Error error;

   DataConnection(const DataConnection&);
   void operator=(const DataConnection&);

public:
   DataConnection(Session *s);
   ~DataConnection();

   bool Acquire();
   void SetSocket(int fd) { sock.set(fd); }
   void SetListenSocket(int fd) { listen_sock.set(fd); }
   int GetSocket() const { return sock; }
   int GetListenSocket() const { return listen_sock; }
   bool IsConnected() const { return sock.is_open(); }
   bool IsProtected() const { return ssl; }
   Ref<clamftp_ssl>& SSLRef() { return ssl; }

   int Read(char *buf,int size);
   int WriteAll(const char *buf,int size);
   void Close();
   const Error& GetError() const { return error; }
};

/* Opens the data connection for one command, passive or active,
   following the session's current mode. */
class DataChannelNegotiator
{
   Session *session;

public:
   enum { DEFAULT_ACTIVE_PORT=10806 };

   DataChannelNegotiator(Session *s) : session(s) {}

   Result<sockaddr_u> Passive(DataConnection *dc);
   Result<sockaddr_u> Active(DataConnection *dc);

   // PASV and connect, or listen and PORT
   Result<sockaddr_u> Prepare(DataConnection *dc);
   /* Sends cmd and returns the server's reply to it. In active mode the
      server's connection is accepted after a 150 reply. */
   Result<Reply> Trigger(DataConnection *dc,const char *cmd);
   Result<Reply> Negotiate(DataConnection *dc,const char *cmd);

   static bool IsTransferStart(const Reply& r) { return r.Is(150) || r.Is(125); }
   // reads and logs the reply that follows a transfer aborted on our side
   static void DrainFinalReply(ControlChannel *control);
};

#endif//DATACHANNEL_H
