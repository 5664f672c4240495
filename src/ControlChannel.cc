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
#include "ControlChannel.h"
#include "ProtoLog.h"
#include "ResMgr.h"
#include "log.h"

ControlChannel::ControlChannel()
   : port(0)
{
}
ControlChannel::~ControlChannel()
{
   Close();
}

void ControlChannel::Close()
{
   if(ssl)
      ssl->shutdown();
   ssl=0;
   sock.close();
   pending.truncate(0);
}

Result<Reply> ControlChannel::Connect(const char *h,int p,int connect_timeout,int io_timeout)
{
   Close();
   error.Clear();
   host.set(h);
   port=p;

   sockaddr_u addr;
   const char *err=Networker::Resolve(h,p,&addr);
   if(err)
   {
      error.SetF(Error::CONNECTION_ERROR,"%s: %s",h,err);
      ProtoLog::LogError(0,"%s",error.Text());
      return error;
   }
   ProtoLog::LogNote(1,"Connecting to %s (%s) port %d",h,addr.address(),p);

   sock.set(Networker::SocketCreateTCP(addr.family()));
   if(!sock.is_open())
   {
      error.SetF(Error::CONNECTION_ERROR,"socket: %s",strerror(errno));
      ProtoLog::LogError(0,"%s",error.Text());
      return error;
   }
   if(Networker::SocketConnect(sock,&addr,connect_timeout)==-1)
   {
      error.SetF(Error::CONNECTION_ERROR,"connect(%s): %s",addr.to_string(),strerror(errno));
      ProtoLog::LogError(0,"%s",error.Text());
      sock.close();
      return error;
   }
   Networker::SetTimeout(sock,io_timeout);

   Result<Reply> greeting=RecvReply();
   if(!greeting.ok())
   {
      Close();
      return greeting;
   }
   if(!greeting.Value().Is2XX())
   {
      error.Set(Error::CONNECTION_ERROR,greeting.Value().Text(),greeting.Value().Code());
      Close();
      return error;
   }
   return greeting;
}

int ControlChannel::LocalAddress(sockaddr_u *u) const
{
   return Networker::SocketLocalAddress(sock,u);
}

int ControlChannel::RawRead(char *buf,int size)
{
   if(ssl)
   {
      int res=ssl->read(buf,size);
      if(res<0)
	 error.Set(Error::CONNECTION_ERROR,ssl->error_text());
      return res;
   }
   int res=Networker::Read(sock,buf,size);
   if(res<0)
   {
      if(E_RETRY(errno))
	 error.Set(Error::CONNECTION_ERROR,"Timeout waiting for server reply");
      else
	 error.SetF(Error::CONNECTION_ERROR,"read: %s",strerror(errno));
   }
   return res;
}

int ControlChannel::RawWrite(const char *buf,int size)
{
   if(ssl)
   {
      int res=ssl->write_all(buf,size);
      if(res<0)
	 error.Set(Error::CONNECTION_ERROR,ssl->error_text());
      return res;
   }
   int res=Networker::WriteAll(sock,buf,size);
   if(res<0)
      error.SetF(Error::CONNECTION_ERROR,"write: %s",strerror(errno));
   return res;
}

int ControlChannel::SendCommand(const char *cmd)
{
   if(!sock.is_open())
   {
      error.Set(Error::CONNECTION_ERROR,"Not connected");
      return -1;
   }
   xstring& line=xstring::get_tmp(cmd);
   if(!line.ends_with("\r\n"))
      line.append("\r\n");

   if(!strncasecmp(cmd,"PASS ",5))
      ProtoLog::LogSend(3,"PASS XXXX");
   else
      ProtoLog::LogSend(3,cmd);

   if(RawWrite(line,line.length())<0)
   {
      ProtoLog::LogError(0,"%s",error.Text());
      return -1;
   }
   return 0;
}

// Takes the first reply from the pending lines. Continuation lines
// (ddd-text) are logged and skipped until a final line shows up.
bool ControlChannel::TakeReply(Reply *reply)
{
   bool got=false;
   while(pending.length()>0)
   {
      int nl=pending.instr('\n');
      int line_len=(nl==-1?pending.length():nl+1);
      const char *line=pending.get();
      Reply r;
      bool parsed=FtpParse::ParseReplyLine(line,line_len,&r);
      xstring& logged=xstring::get_tmp(line,line_len);
      logged.chomp('\n');
      logged.chomp('\r');
      ProtoLog::LogRecv(3,logged);
      bool is_final=(parsed && (line_len<4 || line[3]!='-'));
      pending.set_substr(0,line_len,"",0);
      if(parsed)
      {
	 *reply=r;
	 got=true;
      }
      if(is_final)
	 return true;
   }
   return got;
}

Result<Reply> ControlChannel::RecvReply()
{
   Reply reply;
   if(pending.instr('\n')!=-1 && TakeReply(&reply))
   {
      last_reply=reply;
      return reply;
   }
   if(!sock.is_open())
   {
      error.Set(Error::CONNECTION_ERROR,"Not connected");
      return error;
   }

   char *space=pending.add_space(REPLY_BUFFER);
   int res=RawRead(space,REPLY_BUFFER);
   if(res<0)
   {
      ProtoLog::LogError(0,"%s",error.Text());
      return error;
   }
   if(res==0)
   {
      error.Set(Error::CONNECTION_ERROR,"Peer closed connection");
      ProtoLog::LogError(0,"%s",error.Text());
      Close();
      return error;
   }
   pending.add_commit(res);
   pending.set_length(pending.length());

   if(!TakeReply(&reply))
   {
      error.Set(Error::PROTOCOL_ERROR,"Invalid server reply");
      ProtoLog::LogError(0,"%s",error.Text());
      return error;
   }
   last_reply=reply;
   return reply;
}

Result<Reply> ControlChannel::Command(const char *cmd)
{
   if(SendCommand(cmd)<0)
      return error;
   return RecvReply();
}

int ControlChannel::StartTLS()
{
   pending.truncate(0);
   ssl=new clamftp_ssl(sock,host);
   if(ssl->do_handshake()!=clamftp_ssl::DONE)
   {
      error.SetF(Error::CONNECTION_ERROR,"TLS handshake failed: %s",ssl->error_text());
      ProtoLog::LogError(0,"%s",error.Text());
      ssl=0;
      return -1;
   }
   ProtoLog::LogNote(2,"Control connection is protected by TLS");
   return 0;
}

Session::Session()
{
   mode=ResMgr::QueryBool("ftp:passive-mode",0)?PASSIVE:ACTIVE;
   transfer_mode=BINARY;
   type_sent=0;
   authenticated=false;
   data_open=false;
}

void Session::Reset()
{
   control.Close();
   type_sent=0;
   authenticated=false;
   data_open=false;
   user.unset();
}
