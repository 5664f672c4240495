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
#include <stdlib.h>
#include <sys/stat.h>
#include "TransferEngine.h"
#include "ProtoLog.h"
#include "network.h"
#include "log.h"

TransferEngine::TransferEngine(Session *s,TLSUpgrader *u,ProgressSink *p)
   : session(s), upgrader(u), negotiator(s), progress(p), state(IDLE), cr_pending(false), last_was_cr(false)
{
}

const char *TransferEngine::StateName(state_t s)
{
   switch(s)
   {
   case IDLE:		     return "Idle";
   case DATA_CONNECTION_OPEN: return "DataConnectionOpen";
   case AWAITING_REPLY:	     return "AwaitingReply";
   case STREAMING:	     return "Streaming";
   case CLOSED:		     return "Closed";
   case REPLY_RECEIVED:	     return "ReplyReceived";
   }
   return "?";
}

void TransferEngine::SetState(state_t s)
{
   debug((10,"transfer state %s -> %s\n",StateName(state),StateName(s)));
   state=s;
}

Error TransferEngine::SetType()
{
   char type=(session->GetTransferMode()==Session::ASCII?'A':'I');
   if(session->TypeSent()==type)
      return Error();
   char cmd[]="TYPE X";
   cmd[5]=type;
   Result<Reply> r=session->Control()->Command(cmd);
   if(!r.ok())
      return r.GetError();
   if(!r.Value().Is2XX())
      return Error(Error::PROTOCOL_ERROR,r.Value().Text(),r.Value().Code());
   session->SetTypeSent(type);
   return Error();
}

void TransferEngine::StartProgress(const char *label,long long total)
{
   progress_state.Start(label,total);
   if(progress)
      progress->Progress(progress_state);
}
void TransferEngine::AddProgress(int bytes)
{
   progress_state.transferred+=bytes;
   if(progress)
      progress->Progress(progress_state);
}

Result<Reply> TransferEngine::Open(DataConnection *dc,const char *cmd_tmp)
{
   xstring cmd(cmd_tmp);   // callers pass temporaries
   SetState(IDLE);
   Error err=SetType();
   if(!err.IsOK())
      return err;

   Result<sockaddr_u> addr=negotiator.Prepare(dc);
   if(!addr.ok())
      return addr.GetError();
   SetState(DATA_CONNECTION_OPEN);

   SetState(AWAITING_REPLY);
   Result<Reply> r=negotiator.Trigger(dc,cmd);
   if(!r.ok())
   {
      SetState(CLOSED);
      return r;
   }
   if(!DataChannelNegotiator::IsTransferStart(r.Value()))
   {
      SetState(CLOSED);
      ProtoLog::LogError(1,"%s failed: %s",cmd.get(),r.Value().Text());
      return Error(Error::TRANSFER_ERROR,r.Value().Text(),r.Value().Code());
   }

   if(upgrader && upgrader->WrapDataSocket(dc->GetSocket(),dc->SSLRef(),&err)<0)
   {
      dc->Close();
      SetState(CLOSED);
      DataChannelNegotiator::DrainFinalReply(session->Control());
      return err;
   }
   SetState(STREAMING);
   return r;
}

Result<Reply> TransferEngine::Finish(DataConnection *dc)
{
   dc->Close();
   SetState(CLOSED);
   Result<Reply> r=session->Control()->RecvReply();
   if(r.ok())
      SetState(REPLY_RECEIVED);
   return r;
}

int TransferEngine::ToNetASCII(const char *in,int len,xstring& out)
{
   out.truncate(0);
   for(int i=0; i<len; i++)
   {
      if(in[i]=='\n' && !last_was_cr)
	 out.append('\r');
      out.append(in[i]);
      last_was_cr=(in[i]=='\r');
   }
   return out.length();
}
int TransferEngine::FromNetASCII(const char *in,int len,xstring& out)
{
   out.truncate(0);
   if(cr_pending && len>0)
   {
      if(in[0]!='\n')
	 out.append('\r');
      cr_pending=false;
   }
   for(int i=0; i<len; i++)
   {
      if(in[i]=='\r')
      {
	 if(i+1==len)
	 {
	    cr_pending=true;
	    break;
	 }
	 if(in[i+1]=='\n')
	    continue;
      }
      out.append(in[i]);
   }
   return out.length();
}

Result<long long> TransferEngine::Size(const char *remote_name)
{
   Result<Reply> r=session->Control()->Command(xstring::cat("SIZE ",remote_name,NULL));
   if(!r.ok())
      return r.GetError();
   if(!r.Value().Is(213))
      return -1LL;
   const char *t=r.Value().Text();
   if(strlen(t)<5)
      return -1LL;
   char *end=0;
   long long size=strtoll(t+4,&end,10);
   if(end==t+4 || size<0)
      return -1LL;
   return size;
}

Result<long long> TransferEngine::Upload(const char *local_path,const char *remote_name)
{
   AutoFD file(open(local_path,O_RDONLY|O_CLOEXEC));
   struct stat st;
   if(!file.is_open() || fstat(file,&st)==-1)
      return Result<long long>(Error::FILE_SYSTEM_ERROR,
	 xstring::format("%s: %s",local_path,strerror(errno)));
   if(!S_ISREG(st.st_mode))
      return Result<long long>(Error::FILE_SYSTEM_ERROR,
	 xstring::format("%s: Not a regular file",local_path));

   DataConnection dc(session);
   Result<Reply> r=Open(&dc,xstring::cat("STOR ",remote_name,NULL));
   if(!r.ok())
      return r.GetError();

   StartProgress(remote_name,st.st_size);
   bool ascii=(session->GetTransferMode()==Session::ASCII);
   last_was_cr=false;
   xstring converted;
   char buf[CHUNK_SIZE];
   Error err;
   for(;;)
   {
      int res=Networker::Read(file,buf,sizeof(buf));
      if(res==-1)
      {
	 err.SetF(Error::FILE_SYSTEM_ERROR,"%s: %s",local_path,strerror(errno));
	 break;
      }
      if(res==0)
	 break;
      const char *out=buf;
      int out_len=res;
      if(ascii)
      {
	 out_len=ToNetASCII(buf,res,converted);
	 out=converted;
      }
      if(dc.WriteAll(out,out_len)<0)
      {
	 err=dc.GetError();
	 break;
      }
      AddProgress(res);
   }
   r=Finish(&dc);
   if(!err.IsOK())
   {
      ProtoLog::LogError(0,"Upload of %s failed: %s",local_path,err.Text());
      return err;
   }
   if(!r.ok())
      return r.GetError();
   if(r.Value().Is4XX() || r.Value().Is5XX())
      return Result<long long>(Error::TRANSFER_ERROR,r.Value().Text(),r.Value().Code());
   ProtoLog::LogNote(1,"Uploaded %s (%lld bytes)",remote_name,progress_state.transferred);
   return progress_state.transferred;
}

Result<long long> TransferEngine::Download(const char *remote_name,const char *local_path)
{
   Result<long long> size=Size(remote_name);
   if(!size.ok())
      return size;
   long long expected=size.Value();

   DataConnection dc(session);
   Result<Reply> r=Open(&dc,xstring::cat("RETR ",remote_name,NULL));
   if(!r.ok())
      return r.GetError();

   AutoFD file(open(local_path,O_WRONLY|O_CREAT|O_TRUNC|O_CLOEXEC,0644));
   if(!file.is_open())
   {
      Error err;
      err.SetF(Error::FILE_SYSTEM_ERROR,"%s: %s",local_path,strerror(errno));
      Finish(&dc);
      ProtoLog::LogError(0,"%s",err.Text());
      return err;
   }

   StartProgress(remote_name,expected);
   bool ascii=(session->GetTransferMode()==Session::ASCII);
   cr_pending=false;
   xstring converted;
   char buf[CHUNK_SIZE];
   Error err;
   for(;;)
   {
      int res=dc.Read(buf,sizeof(buf));
      if(res<0)
      {
	 err=dc.GetError();
	 break;
      }
      if(res==0)
	 break;
      const char *out=buf;
      int out_len=res;
      if(ascii)
      {
	 out_len=FromNetASCII(buf,res,converted);
	 out=converted;
      }
      if(Networker::WriteAll(file,out,out_len)<0)
      {
	 err.SetF(Error::FILE_SYSTEM_ERROR,"%s: %s",local_path,strerror(errno));
	 break;
      }
      AddProgress(res);
   }
   if(ascii && cr_pending && err.IsOK() && Networker::WriteAll(file,"\r",1)<0)
      err.SetF(Error::FILE_SYSTEM_ERROR,"%s: %s",local_path,strerror(errno));
   r=Finish(&dc);
   if(err.IsOK() && !r.ok())
      err=r.GetError();
   if(err.IsOK() && (r.Value().Is4XX() || r.Value().Is5XX()))
      err.Set(Error::TRANSFER_ERROR,r.Value().Text(),r.Value().Code());
   if(file.get()!=-1 && close(file.borrow())==-1 && err.IsOK())
      err.SetF(Error::FILE_SYSTEM_ERROR,"%s: %s",local_path,strerror(errno));
   if(!err.IsOK())
   {
      ProtoLog::LogError(0,"Download of %s failed: %s",remote_name,err.Text());
      unlink(local_path);
      return err;
   }
   if(expected>=0 && !ascii && progress_state.transferred!=expected)
      ProtoLog::LogNote(1,"%s: got %lld bytes, server announced %lld",
	 remote_name,progress_state.transferred,expected);
   ProtoLog::LogNote(1,"Downloaded %s (%lld bytes)",remote_name,progress_state.transferred);
   return progress_state.transferred;
}

Error TransferEngine::List(const char *path,xstring& out)
{
   out.truncate(0);
   DataConnection dc(session);
   const char *cmd=(path && *path)?xstring::cat("LIST ",path,NULL).get():"LIST";
   Result<Reply> r=Open(&dc,cmd);
   if(!r.ok())
      return r.GetError();

   StartProgress("LIST",-1);
   Error err;
   for(;;)
   {
      char *space=out.add_space(CHUNK_SIZE);
      int res=dc.Read(space,CHUNK_SIZE);
      if(res<0)
      {
	 err=dc.GetError();
	 break;
      }
      if(res==0)
	 break;
      out.add_commit(res);
      AddProgress(res);
   }
   out.set_length(out.length());
   r=Finish(&dc);
   if(!err.IsOK())
      return err;
   if(!r.ok())
      return r.GetError();
   if(r.Value().Is4XX() || r.Value().Is5XX())
      return Error(Error::TRANSFER_ERROR,r.Value().Text(),r.Value().Code());
   return Error();
}
