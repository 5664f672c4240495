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


#ifndef TRANSFERENGINE_H
#define TRANSFERENGINE_H

#include "DataChannel.h"
#include "ProgressSink.h"

/* Streams one STOR, RETR or LIST over a fresh data connection.

   Each transfer walks Idle -> DataConnectionOpen -> AwaitingReply ->
   Streaming -> Closed -> ReplyReceived. A reply other than 150 (or 125)
   to the transfer command goes straight to Closed and the transfer
   fails without streaming. */
class TransferEngine
{
public:
   enum state_t
   {
      IDLE,
      DATA_CONNECTION_OPEN,
      AWAITING_REPLY,
      STREAMING,
      CLOSED,
      REPLY_RECEIVED
   };
   enum { CHUNK_SIZE=4096 };

private:
   Session *session;
   TLSUpgrader *upgrader;
   DataChannelNegotiator negotiator;
   ProgressSink *progress;
   ProgressState progress_state;
   state_t state;
   bool cr_pending;   // ASCII download: '\r' held back at a chunk end
   bool last_was_cr;  // ASCII upload: previous chunk ended with '\r'

   void SetState(state_t s);
   Error SetType();
   Result<Reply> Open(DataConnection *dc,const char *cmd);
   Result<Reply> Finish(DataConnection *dc);
   void StartProgress(const char *label,long long total);
   void AddProgress(int bytes);

   int ToNetASCII(const char *in,int len,xstring& out);
   int FromNetASCII(const char *in,int len,xstring& out);

public:
   TransferEngine(Session *s,TLSUpgrader *u,ProgressSink *p=0);

   void SetProgressSink(ProgressSink *p) { progress=p; }
   state_t GetState() const { return state; }
   static const char *StateName(state_t s);

   Result<long long> Size(const char *remote_name);
   Result<long long> Upload(const char *local_path,const char *remote_name);
   Result<long long> Download(const char *remote_name,const char *local_path);
   Error List(const char *path,xstring& out);
};

#endif//TRANSFERENGINE_H
