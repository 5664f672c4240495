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
#include "TLSUpgrader.h"
#include "ProtoLog.h"
#include "ResMgr.h"

int TLSUpgrader::StartTLS(Error *err)
{
   ControlChannel *control=session->Control();
   const char *host=control->GetHost();
   bool force=ResMgr::QueryBool("ftp:ssl-force",host);
   if(!ResMgr::QueryBool("ftp:ssl-allow",host))
   {
      if(force)
      {
	 err->Set(Error::PROTOCOL_ERROR,"ftp:ssl-force is set but ftp:ssl-allow is not");
	 return -1;
      }
      return 0;
   }

   Result<Reply> r=control->Command("AUTH TLS");
   if(!r.ok())
   {
      *err=r.GetError();
      return -1;
   }
   if(!r.Value().Is(234))
   {
      if(force)
      {
	 err->Set(Error::PROTOCOL_ERROR,"Server refused AUTH TLS and ftp:ssl-force is set",
	    r.Value().Code());
	 ProtoLog::LogError(0,"%s",err->Text());
	 return -1;
      }
      ProtoLog::LogNote(1,"Server does not support AUTH TLS, continuing without encryption");
      return 0;
   }
   if(control->StartTLS()<0)
   {
      *err=control->GetError();
      return -1;
   }
   return 0;
}

Result<bool> TLSUpgrader::Upgrade(const char *user,const char *pass)
{
   ControlChannel *control=session->Control();
   session->SetAuthenticated(false);
   prot_p=false;

   Error err;
   if(!control->IsProtected() && StartTLS(&err)<0)
      return err;

   xstring& cmd=xstring::cat("USER ",user,NULL);
   Result<Reply> r=control->Command(cmd);
   if(!r.ok())
      return r.GetError();
   if(r.Value().Is3XX())
   {
      r=control->Command(xstring::cat("PASS ",pass?pass:"",NULL));
      if(!r.ok())
	 return r.GetError();
   }
   if(!r.Value().Is(230))
   {
      ProtoLog::LogError(0,"Login failed: %s",r.Value().Text());
      return false;
   }
   session->SetAuthenticated(true);
   session->SetUser(user);

   if(control->IsProtected() && ResMgr::QueryBool("ftp:ssl-protect-data",control->GetHost()))
   {
      r=control->Command("PROT P");
      if(!r.ok())
	 return r.GetError();
      prot_p=r.Value().Is2XX();
      if(!prot_p)
	 ProtoLog::LogNote(1,"Server refused PROT P, data connections will not be protected");
   }

   session->SetTransferMode(Session::BINARY);
   r=control->Command("TYPE I");
   if(!r.ok())
      return r.GetError();
   if(r.Value().Is2XX())
      session->SetTypeSent('I');
   return true;
}

int TLSUpgrader::WrapDataSocket(int fd,Ref<clamftp_ssl>& ssl,Error *err)
{
   ControlChannel *control=session->Control();
   if(!prot_p || !control->IsProtected())
      return 0;
   ssl=new clamftp_ssl(fd,control->GetHost());
   ssl->copy_sid(control->GetSSL());
   if(ssl->do_handshake()!=clamftp_ssl::DONE)
   {
      err->SetF(Error::TRANSFER_ERROR,"Data connection TLS handshake failed: %s",ssl->error_text());
      ProtoLog::LogError(0,"%s",err->Text());
      ssl=0;
      return -1;
   }
   ProtoLog::LogNote(9,"Data connection TLS session %s",ssl->session_reused()?"resumed":"not resumed");
   return 0;
}
