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


#ifndef SHELLEXEC_H
#define SHELLEXEC_H

#include "ArgV.h"
#include "EventChannel.h"
#include "FtpClient.h"
#include "ScanAgentClient.h"
#include "TransferJobQueue.h"

/* The interactive front end. Commands are parsed on the shell thread and
   turned into TransferJobs; the queue's worker runs them against the one
   session and reports back through the EventChannel, which the shell
   drains between prompts and while it waits for a foreground job. */
class ShellExec : public JobListener
{
public:
   typedef void (ShellExec::*cmd_func_t)(ArgV *args);
   struct cmd_rec
   {
      const char  *name;
      cmd_func_t  func;
      const char  *short_desc;
      const char  *long_desc;
   };

private:
   static const cmd_rec static_cmd_table[];

   EventChannel events;
   ScanAgentSupervisor supervisor;
   ScanAgentClient scanner;
   FtpClient client;
   TransferJobQueue queue;

   int exit_code;
   bool done;
   bool background;  // the current command line ended with `&'
   bool progress_line;

   ShellExec(const ShellExec&);
   void operator=(const ShellExec&);

   // enqueues the job; in the foreground waits for it and returns its success
   bool Submit(TransferJob *job);
   bool WaitJob(int id);
   void ShowEvent(const Event& e);
   void EndProgressLine();
   void eprintf(const char *fmt,...) PRINTF_LIKE(2,3);
   bool CheckArgs(ArgV *args,int min,int max);
   static int find_cmd(const char *name,const cmd_rec **ret);

   void cmd_ascii(ArgV *);
   void cmd_binary(ArgV *);
   void cmd_cd(ArgV *);
   void cmd_close(ArgV *);
   void cmd_exit(ArgV *);
   void cmd_get(ArgV *);
   void cmd_getdir(ArgV *);
   void cmd_help(ArgV *);
   void cmd_lcd(ArgV *);
   void cmd_ls(ArgV *);
   void cmd_mget(ArgV *);
   void cmd_mkdir(ArgV *);
   void cmd_mput(ArgV *);
   void cmd_open(ArgV *);
   void cmd_passive(ArgV *);
   void cmd_put(ArgV *);
   void cmd_putdir(ArgV *);
   void cmd_pwd(ArgV *);
   void cmd_quote(ArgV *);
   void cmd_rename(ArgV *);
   void cmd_rm(ArgV *);
   void cmd_rmdir(ArgV *);
   void cmd_scan(ArgV *);
   void cmd_set(ArgV *);
   void cmd_status(ArgV *);
   void cmd_user(ArgV *);

public:
   ShellExec();
   ~ShellExec();

   int Start();
   void Exec(ArgV *args);
   void ExecLine(const char *line);
   void Loop();
   void DrainEvents();
   void AtExit();

   // convenience for the command line: open and log in
   void Open(const char *host,int port,const char *user,const char *pass);

   EventChannel *GetEvents() { return &events; }
   int ExitCode() const { return exit_code; }
   bool Done() const { return done; }

   void JobFinished(const TransferJob *job,const Error& err);
   void JobDiscarded(const TransferJob *job);

   // for `-f' and ~/.clamftprc: runs non-`set' lines as shell commands
   static const char *RcCommand(ArgV *args,void *data);
};

#endif//SHELLEXEC_H
