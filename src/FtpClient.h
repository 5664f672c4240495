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


#ifndef FTPCLIENT_H
#define FTPCLIENT_H

#include "TransferEngine.h"
#include "DirectoryWalker.h"
#include "ScanAgentClient.h"
#include "TransferJobQueue.h"

/* The operations a front end needs, on one session. Uploads go through
   the scanner first and only a clean verdict lets them proceed.
   All methods must be called from one thread at a time; front ends
   enqueue TransferJobs and let the queue's worker call RunJob. */
class FtpClient : public JobRunner, public TreeTransfer
{
   Session session;
   TLSUpgrader upgrader;
   TransferEngine engine;
   Scanner *scanner;
   xstring output;

   Error NotConnected();
   Error ScanForUpload(const char *local_path);

public:
   FtpClient(Scanner *s,ProgressSink *p=0);
   ~FtpClient();

   Session *GetSession() { return &session; }
   // text produced by the last job, e.g. a listing or a PWD reply
   const xstring& Output() const { return output; }

   Result<Reply> Connect(const char *host,int port);
   Result<bool> Login(const char *user,const char *pass);
   Error Quit();

   Error List(const char *path,xstring& out);
   Error Put(const char *local_path,const char *remote_name);
   Error Get(const char *remote_name,const char *local_path);
   Error PutFolder(const char *local_path,const char *remote_name);
   Error GetFolder(const char *remote_name,const char *local_path);
   Error GetMatching(const char *pattern);
   Error Scan(const char *local_path);

   Error Cd(const char *dir) { return SimpleCommand("CWD",dir); }
   Error Mkdir(const char *dir) { return SimpleCommand("MKD",dir); }
   Error Rmdir(const char *dir) { return SimpleCommand("RMD",dir); }
   Error Delete(const char *file) { return SimpleCommand("DELE",file); }
   Error Rename(const char *from,const char *to);
   // cmd may be a whole command line when arg is 0
   Error SimpleCommand(const char *cmd,const char *arg);
   Error Pwd() { return SimpleCommand("PWD",0); }
   Error Stat(const char *path) { return SimpleCommand("STAT",path); }

   void SetTransferMode(Session::transfer_mode_t m) { session.SetTransferMode(m); }
   void SetPassive(bool p) { session.SetMode(p?Session::PASSIVE:Session::ACTIVE); }

   Error RunJob(const TransferJob *job);

   Error PutFile(const char *local_path,const char *remote_name) { return Put(local_path,remote_name); }
   Error GetFile(const char *remote_name,const char *local_path) { return Get(remote_name,local_path); }

   static const char *BaseName(const char *path);
};

#endif//FTPCLIENT_H
