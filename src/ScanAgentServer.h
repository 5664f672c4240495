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


#ifndef SCANAGENTSERVER_H
#define SCANAGENTSERVER_H

#include "ScanProtocol.h"
#include "network.h"
#include "Error.h"

/* The scanning agent: takes one file per connection, stores it in the
   scratch directory, runs the external scanner on it and answers with
   the verdict. The scratch copy is always removed. */
class ScanAgentServer
{
   AutoFD listen_sock;
   xstring_c scanner;
   xstring_c scratch_dir;
   int io_timeout;
   Error error;

   ScanResult Receive(int sock);

public:
   enum { BACKLOG=3 };

   ScanAgentServer(const char *scanner,const char *scratch_dir,int io_timeout);

   int Listen(const char *host,int port);
   int GetPort() const;
   int ServeOne();
   int Run(bool loop);
   void Close() { listen_sock.close(); }

   ScanResult RunScanner(const char *file);
   const Error& GetError() const { return error; }
};

#endif//SCANAGENTSERVER_H
