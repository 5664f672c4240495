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


#ifndef TLSUPGRADER_H
#define TLSUPGRADER_H

#include "ControlChannel.h"

/* AUTH TLS on the control connection, login, and TLS on data sockets
   resuming the control connection's session. */
class TLSUpgrader
{
   Session *session;
   bool prot_p;	  // server accepted PROT P

public:
   TLSUpgrader(Session *s) : session(s), prot_p(false) {}

   int StartTLS(Error *err);
   Result<bool> Upgrade(const char *user,const char *pass);
   bool DataProtected() const { return prot_p; }

   // returns 0 and leaves *ssl unset when the data channel stays plain
   int WrapDataSocket(int fd,Ref<clamftp_ssl>& ssl,Error *err);

   void Reset() { prot_p=false; }
};

#endif//TLSUPGRADER_H
