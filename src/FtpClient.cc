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
#include <fnmatch.h>
#include <sys/stat.h>
#include "FtpClient.h"
#include "ProtoLog.h"
#include "ResMgr.h"

FtpClient::FtpClient(Scanner *s,ProgressSink *p)
   : upgrader(&session), engine(&session,&upgrader,p), scanner(s)
{
}
FtpClient::~FtpClient()
{
   if(session.Control()->IsConnected())
      Quit();
}

const char *FtpClient::BaseName(const char *path)
{
   xstring& s=xstring::get_tmp(path);
   s.rtrim('/');
   const char *slash=strrchr(s,'/');
   return slash?slash+1:s.get();
}

Error FtpClient::NotConnected()
{
   if(!session.Control()->IsConnected())
      return Error(Error::CONNECTION_ERROR,"Not connected");
   if(!session.IsAuthenticated())
      return Error(Error::CONNECTION_ERROR,"Not logged in");
   return Error();
}

Result<Reply> FtpClient::Connect(const char *host,int port)
{
   if(session.Control()->IsConnected())
      Quit();
   session.Reset();
   upgrader.Reset();
   return session.Control()->Connect(host,port,
	    ResMgr::Query("net:connect-timeout",host),
	    ResMgr::Query("net:timeout",host));
}

Result<bool> FtpClient::Login(const char *user,const char *pass)
{
   if(!session.Control()->IsConnected())
      return Error(Error::CONNECTION_ERROR,"Not connected");
   Result<bool> res=upgrader.Upgrade(user,pass);
   if(res.ok() && res.Value())
      ProtoLog::LogNote(1,"Logged in as %s",user);
   return res;
}

Error FtpClient::Quit()
{
   Error err;
   ControlChannel *control=session.Control();
   if(control->IsConnected())
   {
      Result<Reply> r=control->Command("QUIT");
      if(!r.ok())
	 err=r.GetError();
      ProtoLog::LogNote(1,"Connection to %s closed",control->GetHost());
   }
   session.Reset();
   upgrader.Reset();
   return err;
}

Error FtpClient::List(const char *path,xstring& out)
{
   Error err=NotConnected();
   if(!err.IsOK())
      return err;
   return engine.List(path,out);
}

Error FtpClient::ScanForUpload(const char *local_path)
{
   if(!scanner || !ResMgr::QueryBool("scan:enabled",0))
   {
      ProtoLog::LogNote(2,"Scanning disabled, uploading %s unchecked",local_path);
      return Error();
   }
   Error err;
   ScanResult verdict=scanner->Scan(local_path,&err);
   if(verdict==SCAN_CLEAN)
      return Error();
   if(err.IsOK())
      err.SetF(Error::SECURITY_REJECTION,"%s: rejected: scan verdict %s",
	 local_path,ScanProtocol::VerdictName(verdict));
   if(err.IsSecurityRejection())
      ProtoLog::LogError(0,"%s",err.Text());
   else
      ProtoLog::LogError(0,"Upload of %s refused: %s",local_path,err.Text());
   return err;
}

Error FtpClient::Put(const char *local_path,const char *remote_name)
{
   struct stat st;
   if(stat(local_path,&st)==-1)
   {
      Error err;
      err.SetF(Error::FILE_SYSTEM_ERROR,"%s: %s",local_path,strerror(errno));
      ProtoLog::LogError(0,"%s",err.Text());
      return err;
   }
   Error err=NotConnected();
   if(!err.IsOK())
      return err;
   if(!remote_name)
      remote_name=BaseName(local_path);
   xstring name(remote_name);

   err=ScanForUpload(local_path);
   if(!err.IsOK())
      return err;
   Result<long long> res=engine.Upload(local_path,name);
   if(!res.ok())
      return res.GetError();
   return Error();
}

Error FtpClient::Get(const char *remote_name,const char *local_path)
{
   Error err=NotConnected();
   if(!err.IsOK())
      return err;
   if(!local_path)
      local_path=BaseName(remote_name);
   xstring path(local_path);
   Result<long long> res=engine.Download(remote_name,path);
   if(!res.ok())
      return res.GetError();
   return Error();
}

Error FtpClient::PutFolder(const char *local_path,const char *remote_name)
{
   Error err=NotConnected();
   if(!err.IsOK())
      return err;
   if(!remote_name)
      remote_name=BaseName(local_path);
   xstring name(remote_name);
   DirectoryWalker walker(&session,&engine,this);
   return walker.UploadFolder(local_path,name);
}

Error FtpClient::GetFolder(const char *remote_name,const char *local_path)
{
   Error err=NotConnected();
   if(!err.IsOK())
      return err;
   if(!local_path)
      local_path=BaseName(remote_name);
   xstring path(local_path);
   DirectoryWalker walker(&session,&engine,this);
   return walker.DownloadFolder(remote_name,path);
}

Error FtpClient::GetMatching(const char *pattern)
{
   xstring listing;
   Error err=List(0,listing);
   if(!err.IsOK())
      return err;
   std::vector<FtpListEntry> entries;
   FtpParse::ParseList(listing,listing.length(),entries);
   int matched=0;
   int failed=0;
   for(size_t i=0; i<entries.size(); i++)
   {
      const char *name=entries[i].name;
      if(entries[i].is_dir || strchr(name,'/') || fnmatch(pattern,name,0)!=0)
	 continue;
      matched++;
      if(!Get(name,name).IsOK())
	 failed++;
   }
   if(matched==0)
      return Error(Error::FILE_SYSTEM_ERROR,xstring::format("%s: no files found",pattern));
   if(failed>0)
      return Error(Error::TRANSFER_ERROR,xstring::format("%s: %d of %d files failed",pattern,failed,matched));
   return Error();
}

Error FtpClient::Scan(const char *local_path)
{
   if(!scanner)
      return Error(Error::SCAN_AGENT_ERROR,"No scanner configured");
   Error err;
   ScanResult verdict=scanner->Scan(local_path,&err);
   output.setf("%s: %s\n",local_path,ScanProtocol::VerdictName(verdict));
   if(verdict==SCAN_CLEAN)
      return Error();
   return err;
}

Error FtpClient::SimpleCommand(const char *cmd,const char *arg)
{
   Error err=NotConnected();
   if(!err.IsOK())
      return err;
   xstring line(cmd);
   if(arg && *arg)
      line.append(' ').append(arg);
   Result<Reply> r=session.Control()->Command(line);
   if(!r.ok())
      return r.GetError();
   output.setf("%s\n",r.Value().Text());
   if(r.Value().Is4XX() || r.Value().Is5XX())
      return Error(Error::PROTOCOL_ERROR,r.Value().Text(),r.Value().Code());
   return Error();
}

Error FtpClient::Rename(const char *from,const char *to)
{
   Error err=SimpleCommand("RNFR",from);
   if(!err.IsOK())
      return err;
   return SimpleCommand("RNTO",to);
}

Error FtpClient::RunJob(const TransferJob *job)
{
   output.truncate(0);
   const char *a1=job->Arg1();
   const char *a2=job->Arg2();
   switch(job->Kind())
   {
   case TransferJob::UPLOAD_FILE:
      return Put(a1,a2);
   case TransferJob::UPLOAD_FOLDER:
      return PutFolder(a1,a2);
   case TransferJob::DOWNLOAD_FILE:
      return Get(a1,a2);
   case TransferJob::DOWNLOAD_FOLDER:
      return GetFolder(a1,a2);
   case TransferJob::DOWNLOAD_MATCHING:
      return GetMatching(a1);
   case TransferJob::LIST:
      return List(a1,output);
   case TransferJob::COMMAND:
      return SimpleCommand(a1,a2);
   case TransferJob::RENAME:
      return Rename(a1,a2);
   case TransferJob::SCAN:
      return Scan(a1);
   case TransferJob::CONNECT:
   {
      Result<Reply> r=Connect(a1,job->Number()>0?job->Number():21);
      if(!r.ok())
	 return r.GetError();
      output.setf("%s\n",r.Value().Text());
      return Error();
   }
   case TransferJob::LOGIN:
   {
      Result<bool> r=Login(a1,a2);
      if(!r.ok())
	 return r.GetError();
      if(!r.Value())
	 return Error(Error::PROTOCOL_ERROR,"Login incorrect",
		  session.Control()->LastReply().Code());
      return Error();
   }
   case TransferJob::SET_MODE:
      if(!xstrcmp(a1,"ascii"))
	 SetTransferMode(Session::ASCII);
      else if(!xstrcmp(a1,"binary"))
	 SetTransferMode(Session::BINARY);
      else if(!xstrcmp(a1,"passive"))
	 SetPassive(true);
      else if(!xstrcmp(a1,"active"))
	 SetPassive(false);
      else
	 return Error(Error::PROTOCOL_ERROR,xstring::format("unknown mode `%s'",a1?a1:""));
      return Error();
   case TransferJob::QUIT:
      return Quit();
   case TransferJob::STOP:
      break;
   }
   return Error();
}
