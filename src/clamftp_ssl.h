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


#ifndef CLAMFTP_SSL_H
#define CLAMFTP_SSL_H

#include <openssl/ssl.h>
#include <openssl/err.h>
#include <openssl/x509v3.h>

#include "Ref.h"
#include "xstring.h"

class clamftp_ssl_instance
{
public:
   SSL_CTX *ssl_ctx;
   bool verify;
   clamftp_ssl_instance();
   ~clamftp_ssl_instance();
};

/* Blocking TLS client on an already connected socket. Peer verification
   follows ssl:verify-certificate, which is off unless configured. */
class clamftp_ssl
{
   static Ref<clamftp_ssl_instance> instance;
   SSL *ssl;
   int fd;
   xstring_c hostname;
   bool handshake_done;
   xstring error;
   bool fatal;

   bool check_fatal(int res);
   void set_error(const char *s1,const char *s2);
   static const char *strerror();

public:
   enum code { ERROR=-1, DONE=0 };

   static void global_init();
   static void global_deinit();

   clamftp_ssl(int fd,const char *host=0);
   ~clamftp_ssl();

   int do_handshake();
   int read(char *buf,int size);
   int write(const char *buf,int size);
   int write_all(const char *buf,int size);
   void copy_sid(const clamftp_ssl *);
   bool session_reused() const;
   void shutdown();

   const char *error_text() const { return error?error.get():""; }
   bool is_fatal() const { return fatal; }
   int get_fd() const { return fd; }
};

#endif//CLAMFTP_SSL_H
