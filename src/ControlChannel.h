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


#ifndef CONTROLCHANNEL_H
#define CONTROLCHANNEL_H

#include "network.h"
#include "FtpParse.h"
#include "Error.h"
#include "Ref.h"
#include "clamftp_ssl.h"

/* FTP command/reply driver over one control connection, plain or TLS.

   RecvReply does one read of at most REPLY_BUFFER bytes and takes the
   reply from what arrived; a reply split over two reads, or a multi-line
   reply whose final line arrives later, is not reassembled. Complete lines
   beyond the first reply are kept and returned by the next RecvReply. */
class ControlChannel
{
   AutoFD sock;
   Ref<clamftp_ssl> ssl;
   xstring_c host;
   int port;
   xstring pending;
   Reply last_reply;
   Error error;

   int RawRead(char *buf,int size);
   int RawWrite(const char *buf,int size);
   bool TakeReply(Reply *reply);

public:
   enum { REPLY_BUFFER=4096 };

   ControlChannel();
   ~ControlChannel();

   Result<Reply> Connect(const char *host,int port,int connect_timeout,int io_timeout);
   int SendCommand(const char *cmd);
   Result<Reply> RecvReply();
   Result<Reply> Command(const char *cmd);
   int StartTLS();
   void Close();

   bool IsConnected() const { return sock.is_open(); }
   bool IsProtected() const { return ssl; }
   const clamftp_ssl *GetSSL() const { return ssl; }
   int GetFD() const { return sock; }
   const char *GetHost() const { return host; }
   int GetPort() const { return port; }
   int LocalAddress(sockaddr_u *u) const;
   const Reply& LastReply() const { return last_reply; }
   const Error& GetError() const { return error; }
};

/* One control connection and the state the data channel negotiation
   depends on. Only the job worker touches a Session. */
class Session
{
public:
   enum mode_t { PASSIVE, ACTIVE };
   enum transfer_mode_t { ASCII, BINARY };

private:
   ControlChannel control;
   mode_t mode;
   transfer_mode_t transfer_mode;
   char type_sent;	// last TYPE argument the server accepted, 0 if none
   bool authenticated;
   bool data_open;
   xstring_c user;

public:
   Session();

   ControlChannel *Control() { return &control; }
   const ControlChannel *Control() const { return &control; }

   mode_t GetMode() const { return mode; }
   void SetMode(mode_t m) { mode=m; }
   transfer_mode_t GetTransferMode() const { return transfer_mode; }
   void SetTransferMode(transfer_mode_t m) { transfer_mode=m; }
   char TypeSent() const { return type_sent; }
   void SetTypeSent(char t) { type_sent=t; }
   bool IsAuthenticated() const { return authenticated; }
   void SetAuthenticated(bool a) { authenticated=a; }
   const char *GetUser() const { return user; }
   void SetUser(const char *u) { user.set(u); }

   // at most one data connection per session
   bool DataOpen() const { return data_open; }
   void SetDataOpen(bool o) { data_open=o; }

   void Reset();
};

#endif//CONTROLCHANNEL_H
