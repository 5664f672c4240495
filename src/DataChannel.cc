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
#include "DataChannel.h"
#include "ProtoLog.h"
#include "ResMgr.h"

DataConnection::DataConnection(Session *s)
   : session(s), acquired(false)
{
}
DataConnection::~DataConnection()
{
   Close();
}

bool DataConnection::Acquire()
{
   if(session->DataOpen())
   {
      error.Set(Error::TRANSFER_ERROR,"Another data connection is already open");
      return false;
   }
   session->SetDataOpen(true);
   acquired=true;
   return true;
}

void DataConnection::Close()
{
   if(ssl)
      ssl->shutdown();
   ssl=0;
   sock.close();
   listen_sock.close();
   if(acquired)
      session->SetDataOpen(false);
   acquired=false;
}

int DataConnection::Read(char *buf,int size)
{
   if(ssl)
   {
      int res=ssl->read(buf,size);
      if(res<0)
	 error.Set(Error::TRANSFER_ERROR,ssl->error_text());
      return res;
   }
   int res=Networker::Read(sock,buf,size);
   if(res<0)
   {
      if(E_RETRY(errno))
	 error.Set(Error::TRANSFER_ERROR,"Data connection timed out");
      else
	 error.SetF(Error::TRANSFER_ERROR,"read: %s",strerror(errno));
   }
   return res;
}

int DataConnection::WriteAll(const char *buf,int size)
{
   if(ssl)
   {
      int res=ssl->write_all(buf,size);
      if(res<0)
	 error.Set(Error::TRANSFER_ERROR,ssl->error_text());
      return res;
   }
   int res=Networker::WriteAll(sock,buf,size);
   if(res<0)
   {
      if(E_RETRY(errno))
	 error.Set(Error::TRANSFER_ERROR,"Data connection timed out");
      else
	 error.SetF(Error::TRANSFER_ERROR,"write: %s",strerror(errno));
   }
   return res;
}

Result<sockaddr_u> DataChannelNegotiator::Passive(DataConnection *dc)
{
   ControlChannel *control=session->Control();
   Result<Reply> r=control->Command("PASV");
   if(!r.ok())
      return r.GetError();
   if(!r.Value().Is(227))
      return Result<sockaddr_u>(Error::PROTOCOL_ERROR,r.Value().Text(),r.Value().Code());

   Result<sockaddr_u> addr=FtpParse::ParsePASV(r.Value().Text());
   if(!addr.ok())
   {
      ProtoLog::LogError(0,"%s",addr.GetError().Text());
      return addr;
   }

   const char *host=control->GetHost();
   int fd=Networker::SocketCreateTCP(AF_INET);
   if(fd==-1)
      return Result<sockaddr_u>(Error::CONNECTION_ERROR,
	 xstring::format("socket: %s",strerror(errno)));
   dc->SetSocket(fd);
   ProtoLog::LogNote(5,"Connecting data socket to (%s) port %d",
      addr.Value().address(),addr.Value().port());
   if(Networker::SocketConnect(fd,&addr.Value(),ResMgr::Query("net:connect-timeout",host))==-1)
   {
      Error e;
      e.SetF(Error::CONNECTION_ERROR,"data connect(%s): %s",
	 addr.Value().to_string(),strerror(errno));
      ProtoLog::LogError(0,"%s",e.Text());
      dc->Close();
      return e;
   }
   Networker::SetTimeout(fd,ResMgr::Query("net:timeout",host));
   return addr;
}

Result<sockaddr_u> DataChannelNegotiator::Active(DataConnection *dc)
{
   ControlChannel *control=session->Control();
   const char *host=control->GetHost();

   sockaddr_u local;
   if(control->LocalAddress(&local)==-1 || local.family()!=AF_INET)
      return Result<sockaddr_u>(Error::PROTOCOL_ERROR,
	 "Active mode needs an IPv4 control connection");

   sockaddr_u bind_addr;
   bind_addr.set_ipv4("0.0.0.0",(int)ResMgr::Query("ftp:active-port",host));
   int fd=Networker::SocketListen(&bind_addr,1);
   if(fd==-1)
   {
      Error e;
      e.SetF(Error::CONNECTION_ERROR,"listen on port %d: %s",bind_addr.port(),strerror(errno));
      ProtoLog::LogError(0,"%s",e.Text());
      return e;
   }
   dc->SetListenSocket(fd);
   // the configured port may be 0, use what was really bound
   sockaddr_u bound;
   Networker::SocketLocalAddress(fd,&bound);
   local.set_port(bound.port());

   xstring& port_arg=xstring::get_tmp();
   FtpParse::FormatPORT(&local,port_arg);
   Result<Reply> r=control->Command(xstring::cat("PORT ",port_arg.get(),NULL));
   if(!r.ok())
   {
      dc->Close();
      return r.GetError();
   }
   if(!r.Value().Is(200))
   {
      dc->Close();
      return Result<sockaddr_u>(Error::PROTOCOL_ERROR,
	 xstring::format("Server refused PORT: %s",r.Value().Text()),r.Value().Code());
   }
   ProtoLog::LogNote(5,"Listening for data connection at %s",local.to_string());
   return local;
}

Result<sockaddr_u> DataChannelNegotiator::Prepare(DataConnection *dc)
{
   if(!dc->Acquire())
      return dc->GetError();
   Result<sockaddr_u> addr=(session->GetMode()==Session::PASSIVE?Passive(dc):Active(dc));
   if(!addr.ok())
      dc->Close();
   return addr;
}

// the server answers an aborted transfer with a final reply of its own
void DataChannelNegotiator::DrainFinalReply(ControlChannel *control)
{
   Result<Reply> r=control->RecvReply();
   if(r.ok())
      ProtoLog::LogNote(5,"Aborted transfer: %s",r.Value().Text());
   else
      ProtoLog::LogError(1,"No reply for the aborted transfer: %s",r.GetError().Text());
}

Result<Reply> DataChannelNegotiator::Trigger(DataConnection *dc,const char *cmd)
{
   ControlChannel *control=session->Control();
   Result<Reply> r=control->Command(cmd);
   if(!r.ok() || !IsTransferStart(r.Value()))
   {
      dc->Close();
      return r;
   }

   if(session->GetMode()==Session::ACTIVE)
   {
      ProtoLog::LogNote(5,"Waiting for server to connect");
      int timeout=ResMgr::Query("net:timeout",control->GetHost());
      sockaddr_u peer;
      int fd=Networker::SocketAccept(dc->GetListenSocket(),&peer,timeout);
      if(fd==-1)
      {
	 Error e;
	 e.SetF(Error::CONNECTION_ERROR,"accept: %s",strerror(errno));
	 ProtoLog::LogError(0,"%s",e.Text());
	 dc->Close();
	 DrainFinalReply(control);
	 return e;
      }
      dc->SetSocket(fd);
      dc->SetListenSocket(-1);
      Networker::SetTimeout(fd,timeout);
      ProtoLog::LogNote(5,"Data connection from %s",peer.to_string());
   }
   return r;
}

Result<Reply> DataChannelNegotiator::Negotiate(DataConnection *dc,const char *cmd)
{
   Result<sockaddr_u> addr=Prepare(dc);
   if(!addr.ok())
      return addr.GetError();
   return Trigger(dc,cmd);
}
