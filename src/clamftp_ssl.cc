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
#include <signal.h>
#include <pthread.h>
#include "clamftp_ssl.h"
#include "ResMgr.h"
#include "network.h"
#include "log.h"

Ref<clamftp_ssl_instance> clamftp_ssl::instance;

static pthread_mutex_t instance_mutex=PTHREAD_MUTEX_INITIALIZER;

void clamftp_ssl::global_init()
{
   pthread_mutex_lock(&instance_mutex);
   if(!instance)
   {
      // a peer closing a TLS socket must not kill the process
      signal(SIGPIPE,SIG_IGN);
      instance=new clamftp_ssl_instance();
   }
   pthread_mutex_unlock(&instance_mutex);
}
void clamftp_ssl::global_deinit()
{
   pthread_mutex_lock(&instance_mutex);
   instance=0;
   pthread_mutex_unlock(&instance_mutex);
}

clamftp_ssl_instance::clamftp_ssl_instance()
{
#if OPENSSL_VERSION_NUMBER < 0x10100000L
   SSL_library_init();
   SSL_load_error_strings();
   ssl_ctx=SSL_CTX_new(SSLv23_client_method());
#else
   ssl_ctx=SSL_CTX_new(TLS_client_method());
#endif
   SSL_CTX_set_options(ssl_ctx,SSL_OP_ALL|SSL_OP_NO_SSLv2|SSL_OP_NO_SSLv3);
   SSL_CTX_set_cipher_list(ssl_ctx,"ALL:!aNULL:!eNULL:!SSLv2:!LOW:!EXP:!MD5:@STRENGTH");
   // data channels resume the control channel session
   SSL_CTX_set_session_cache_mode(ssl_ctx,SSL_SESS_CACHE_CLIENT);

   verify=ResMgr::QueryBool("ssl:verify-certificate",0);
   if(verify)
   {
      SSL_CTX_set_default_verify_paths(ssl_ctx);
      SSL_CTX_set_verify(ssl_ctx,SSL_VERIFY_PEER,0);
   }
   else
      SSL_CTX_set_verify(ssl_ctx,SSL_VERIFY_NONE,0);
   debug((9,"ssl: context created, peer verification %s\n",verify?"on":"off"));
}
clamftp_ssl_instance::~clamftp_ssl_instance()
{
   SSL_CTX_free(ssl_ctx);
}

clamftp_ssl::clamftp_ssl(int fd1,const char *h)
   : fd(fd1), hostname(h), handshake_done(false), fatal(false)
{
   if(!instance)
      global_init();

   ssl=SSL_new(instance->ssl_ctx);
   SSL_set_fd(ssl,fd);
   SSL_set_mode(ssl,SSL_MODE_AUTO_RETRY);

   if(h && !Networker::IsNumericAddress(h))
   {
      if(!SSL_set_tlsext_host_name(ssl,h))
	 debug((1,"WARNING: failed to configure server name indication (SNI) TLS extension\n"));
#if OPENSSL_VERSION_NUMBER >= 0x10100000L
      if(instance->verify)
	 SSL_set1_host(ssl,h);
#endif
   }
}
void clamftp_ssl::shutdown()
{
   if(handshake_done)
      SSL_shutdown(ssl);
}
clamftp_ssl::~clamftp_ssl()
{
   SSL_free(ssl);
   ssl=0;
}

void clamftp_ssl::set_error(const char *s1,const char *s2)
{
   if(s2)
      error.setf("%s: %s",s1,s2);
   else
      error.set(s1);
}

bool clamftp_ssl::check_fatal(int res)
{
   return !(SSL_get_error(ssl,res)==SSL_ERROR_SYSCALL
	    && (ERR_peek_error()==0 && Networker::TemporaryNetworkError(errno)));
}

int clamftp_ssl::do_handshake()
{
   if(handshake_done)
      return DONE;
   errno=0;
   int res=SSL_connect(ssl);
   if(res<=0)
   {
      fatal=check_fatal(res);
      if(errno==EAGAIN || errno==EWOULDBLOCK)
	 set_error("SSL_connect","Operation timed out");
      else
	 set_error("SSL_connect",strerror());
      return ERROR;
   }
   handshake_done=true;
   if(instance->verify && SSL_get_verify_result(ssl)!=X509_V_OK)
   {
      fatal=true;
      set_error("Certificate verification",
	 X509_verify_cert_error_string(SSL_get_verify_result(ssl)));
      return ERROR;
   }
   debug((9,"ssl: handshake done, %s, session %s\n",
      SSL_get_version(ssl),SSL_session_reused(ssl)?"resumed":"new"));
   return DONE;
}
int clamftp_ssl::read(char *buf,int size)
{
   if(error)
      return ERROR;
   int res=do_handshake();
   if(res!=DONE)
      return res;
   errno=0;
   res=SSL_read(ssl,buf,size);
   if(res<=0)
   {
      int err=SSL_get_error(ssl,res);
      if(err==SSL_ERROR_ZERO_RETURN)
	 return 0;   // close_notify
      if(err==SSL_ERROR_SYSCALL && ERR_peek_error()==0 && errno==0)
	 return 0;   // EOF without close_notify, many servers do that
      fatal=check_fatal(res);
      if(errno==EAGAIN || errno==EWOULDBLOCK)
	 set_error("SSL_read","Operation timed out");
      else
	 set_error("SSL_read",strerror());
      return ERROR;
   }
   return res;
}
int clamftp_ssl::write(const char *buf,int size)
{
   if(error)
      return ERROR;
   int res=do_handshake();
   if(res!=DONE)
      return res;
   if(size==0)
      return 0;
   errno=0;
   res=SSL_write(ssl,buf,size);
   if(res<=0)
   {
      fatal=check_fatal(res);
      set_error("SSL_write",strerror());
      return ERROR;
   }
   return res;
}
int clamftp_ssl::write_all(const char *buf,int size)
{
   int done=0;
   while(done<size)
   {
      int res=write(buf+done,size-done);
      if(res<0)
	 return res;
      done+=res;
   }
   return done;
}

void clamftp_ssl::copy_sid(const clamftp_ssl *o)
{
   SSL_SESSION *session=SSL_get_session(o->ssl);
   if(session)
      SSL_set_session(ssl,session);
}
bool clamftp_ssl::session_reused() const
{
   return handshake_done && SSL_session_reused(ssl);
}

const char *clamftp_ssl::strerror()
{
   static thread_local char buf[256];
   unsigned long error=ERR_get_error();
   if(error==0)
      return errno?::strerror(errno):"error";
   const char *ssl_error=0;
   if(ERR_GET_LIB(error)==ERR_LIB_SSL)
      ssl_error=ERR_reason_error_string(error);
   if(!ssl_error)
   {
      ERR_error_string_n(error,buf,sizeof(buf));
      ssl_error=buf;
   }
   ERR_clear_error();
   return ssl_error;
}
