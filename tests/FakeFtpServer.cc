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
#include <stdio.h>
#include <errno.h>
#include <unistd.h>
#include <ctype.h>
#include <strings.h>
#include <signal.h>

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>

#include "FakeFtpServer.h"

class ServerLock
{
   pthread_mutex_t *m;
public:
   ServerLock(pthread_mutex_t *m1) : m(m1) { pthread_mutex_lock(m); }
   ~ServerLock() { pthread_mutex_unlock(m); }
};

// reads through TLS when ssl is set; a timeout shows as -1 with EAGAIN
static int ReadFrom(SSL *ssl,int fd,char *buf,int size)
{
   if(!ssl)
      return Networker::Read(fd,buf,size);
   errno=0;
   int res=SSL_read(ssl,buf,size);
   if(res>0)
      return res;
   switch(SSL_get_error(ssl,res))
   {
   case SSL_ERROR_ZERO_RETURN:
      return 0;
   case SSL_ERROR_WANT_READ:
   case SSL_ERROR_WANT_WRITE:
      errno=EAGAIN;
      return -1;
   case SSL_ERROR_SYSCALL:
      if(errno==0)
	 return 0;
      if(E_RETRY(errno))
	 return -1;
      break;
   }
   ERR_clear_error();
   errno=EIO;
   return -1;
}

static int WriteTo(SSL *ssl,int fd,const char *buf,int size)
{
   if(!ssl)
      return Networker::WriteAll(fd,buf,size);
   int done=0;
   while(done<size)
   {
      int res=SSL_write(ssl,buf+done,size-done);
      if(res<=0)
      {
	 ERR_clear_error();
	 return -1;
      }
      done+=res;
   }
   return done;
}

static void CloseTLS(SSL *&ssl)
{
   if(!ssl)
      return;
   SSL_shutdown(ssl);
   SSL_free(ssl);
   ssl=0;
}

static EVP_PKEY *MakeKey()
{
   EVP_PKEY *key=0;
   EVP_PKEY_CTX *c=EVP_PKEY_CTX_new_id(EVP_PKEY_RSA,0);
   if(c && EVP_PKEY_keygen_init(c)>0 && EVP_PKEY_CTX_set_rsa_keygen_bits(c,2048)>0)
   {
      if(EVP_PKEY_keygen(c,&key)<=0)
	 key=0;
   }
   EVP_PKEY_CTX_free(c);
   return key;
}

// self-signed, valid for a day
static X509 *MakeCert(EVP_PKEY *key)
{
   X509 *x=X509_new();
   if(!x)
      return 0;
   X509_NAME *name=X509_get_subject_name(x);
   if(!X509_set_version(x,2)
   || !ASN1_INTEGER_set(X509_get_serialNumber(x),1)
   || !X509_gmtime_adj(X509_getm_notBefore(x),0)
   || !X509_gmtime_adj(X509_getm_notAfter(x),24*3600)
   || !X509_set_pubkey(x,key)
   || !X509_NAME_add_entry_by_txt(name,"CN",MBSTRING_ASC,(const unsigned char*)"127.0.0.1",-1,-1,0)
   || !X509_set_issuer_name(x,name)
   || !X509_sign(x,key,EVP_sha256()))
   {
      X509_free(x);
      return 0;
   }
   return x;
}

bool FakeFtpServer::EnableTLS()
{
   // the client may close first; SSL_shutdown then writes to a dead socket
   signal(SIGPIPE,SIG_IGN);
   EVP_PKEY *key=MakeKey();
   X509 *cert=(key?MakeCert(key):0);
   SSL_CTX_free(ssl_ctx);
   ssl_ctx=SSL_CTX_new(TLS_server_method());
   bool ok=(cert && ssl_ctx
      && SSL_CTX_use_certificate(ssl_ctx,cert)==1
      && SSL_CTX_use_PrivateKey(ssl_ctx,key)==1
      // TLS 1.2 keeps session reuse on data connections deterministic
      && SSL_CTX_set_max_proto_version(ssl_ctx,TLS1_2_VERSION)==1
      && SSL_CTX_set_session_id_context(ssl_ctx,(const unsigned char*)"fakeftp",7)==1);
   X509_free(cert);
   EVP_PKEY_free(key);
   if(!ok)
   {
      ERR_clear_error();
      SSL_CTX_free(ssl_ctx);
      ssl_ctx=0;
   }
   return ok;
}

// TLS on a data connection after PROT P, or 0 for plain data
SSL *FakeFtpServer::ProtectData(int fd)
{
   if(!prot_p || !ctl_ssl)
      return 0;
   SSL *ssl=SSL_new(ssl_ctx);
   if(!ssl)
      return 0;
   SSL_set_fd(ssl,fd);
   if(SSL_accept(ssl)<=0)
   {
      ERR_clear_error();
      SSL_free(ssl);
      return 0;
   }
   ServerLock lock(&mutex);
   protected_data++;
   if(SSL_session_reused(ssl))
      resumed_data++;
   return ssl;
}

int FakeFtpServer::ProtectedDataConnections()
{
   ServerLock lock(&mutex);
   return protected_data;
}

int FakeFtpServer::ResumedDataSessions()
{
   ServerLock lock(&mutex);
   return resumed_data;
}

FakeFtpServer::FakeFtpServer()
   : port(0), running(false), stop(false), ssl_ctx(0), protected_data(0), resumed_data(0),
     have_port(false), refuse_active(false), ctl_ssl(0), prot_p(false)
{
   pthread_mutex_init(&mutex,0);
   dirs.insert("/");
}

FakeFtpServer::~FakeFtpServer()
{
   Stop();
   SSL_CTX_free(ssl_ctx);
   pthread_mutex_destroy(&mutex);
}

bool FakeFtpServer::Start()
{
   sockaddr_u a;
   a.set_ipv4("127.0.0.1",0);
   listen_sock.set(Networker::SocketListen(&a,4));
   if(!listen_sock.is_open() || Networker::SocketLocalAddress(listen_sock,&a)==-1)
      return false;
   port=a.port();
   running=(pthread_create(&thread,0,Main,this)==0);
   return running;
}

void FakeFtpServer::Stop()
{
   if(!running)
      return;
   {
      ServerLock lock(&mutex);
      stop=true;
   }
   pthread_join(thread,0);
   running=false;
   listen_sock.close();
}

void *FakeFtpServer::Main(void *arg)
{
   ((FakeFtpServer*)arg)->Serve();
   return 0;
}

void FakeFtpServer::Serve()
{
   for(;;)
   {
      {
	 ServerLock lock(&mutex);
	 if(stop)
	    return;
      }
      AutoFD sock(Networker::SocketAccept(listen_sock,0,1));
      if(!sock.is_open())
	 continue;
      Networker::SetTimeout(sock,1);
      ServeClient(sock);
      CloseTLS(ctl_ssl);
   }
}

bool FakeFtpServer::Send(int sock,const char *text)
{
   std::string line(text);
   line+="\r\n";
   return WriteTo(ctl_ssl,sock,line.data(),line.size())>=0;
}

std::string FakeFtpServer::Path(const std::string& name) const
{
   if(name.empty())
      return cwd;
   if(name[0]=='/')
      return name;
   if(cwd=="/")
      return "/"+name;
   return cwd+"/"+name;
}

static std::string Parent(const std::string& p)
{
   size_t slash=p.rfind('/');
   if(slash==0 || slash==std::string::npos)
      return "/";
   return p.substr(0,slash);
}

static std::string Base(const std::string& p)
{
   size_t slash=p.rfind('/');
   return slash==std::string::npos?p:p.substr(slash+1);
}

std::string FakeFtpServer::Listing(const std::string& dir)
{
   ServerLock lock(&mutex);
   std::string out;
   char line[512];
   for(std::set<std::string>::iterator i=dirs.begin(); i!=dirs.end(); ++i)
   {
      if(*i=="/" || Parent(*i)!=dir)
	 continue;
      snprintf(line,sizeof(line),"drwxr-xr-x    2 ftp      ftp          4096 Jan 01 00:00 %s\r\n",Base(*i).c_str());
      out+=line;
   }
   for(std::map<std::string,std::string>::iterator i=files.begin(); i!=files.end(); ++i)
   {
      if(Parent(i->first)!=dir)
	 continue;
      snprintf(line,sizeof(line),"-rw-r--r--    1 ftp      ftp    %10lu Jan 01 00:00 %s\r\n",
	 (unsigned long)i->second.size(),Base(i->first).c_str());
      out+=line;
   }
   return out;
}

// the data connection for the current transfer command, or -1
int FakeFtpServer::OpenData()
{
   if(pasv_sock.is_open())
   {
      int s=Networker::SocketAccept(pasv_sock,0,5);
      pasv_sock.close();
      if(s!=-1)
	 Networker::SetTimeout(s,5);
      return s;
   }
   if(!have_port)
      return -1;
   have_port=false;
   if(refuse_active)
      return -1;
   int s=Networker::SocketCreateTCP(AF_INET);
   if(s==-1)
      return -1;
   if(Networker::SocketConnect(s,&port_addr,5)==-1)
   {
      close(s);
      return -1;
   }
   Networker::SetTimeout(s,5);
   return s;
}

void FakeFtpServer::ServeClient(int sock)
{
   cwd="/";
   rename_from.clear();
   pasv_sock.close();
   have_port=false;
   prot_p=false;

   if(!Send(sock,"220 fake FTP server ready"))
      return;

   std::string in;
   char buf[4096];
   for(;;)
   {
      size_t eol=in.find("\r\n");
      if(eol==std::string::npos)
      {
	 int n=ReadFrom(ctl_ssl,sock,buf,sizeof(buf));
	 if(n==-1 && E_RETRY(errno))
	 {
	    ServerLock lock(&mutex);
	    if(stop)
	       return;
	    continue;
	 }
	 if(n<=0)
	    return;
	 in.append(buf,n);
	 continue;
      }
      std::string line=in.substr(0,eol);
      in.erase(0,eol+2);
      {
	 ServerLock lock(&mutex);
	 commands.push_back(line);
      }
      std::string verb=line.substr(0,line.find(' '));
      std::string arg;
      if(line.find(' ')!=std::string::npos)
	 arg=line.substr(line.find(' ')+1);
      for(size_t i=0; i<verb.size(); i++)
	 verb[i]=toupper((unsigned char)verb[i]);

      if(verb=="AUTH")
      {
	 if(!ssl_ctx || ctl_ssl || strcasecmp(arg.c_str(),"TLS"))
	 {
	    Send(sock,"502 AUTH not supported");
	    continue;
	 }
	 Send(sock,"234 Proceed with negotiation");
	 ctl_ssl=SSL_new(ssl_ctx);
	 if(!ctl_ssl)
	    return;
	 SSL_set_fd(ctl_ssl,sock);
	 if(SSL_accept(ctl_ssl)<=0)
	 {
	    ERR_clear_error();
	    SSL_free(ctl_ssl);
	    ctl_ssl=0;
	    return;
	 }
      }
      else if(verb=="PROT")
      {
	 if(!ctl_ssl)
	    Send(sock,"503 PROT needs AUTH TLS");
	 else if(arg=="P" || arg=="C")
	 {
	    prot_p=(arg=="P");
	    Send(sock,"200 Protection level set");
	 }
	 else
	    Send(sock,"536 Protection level not supported");
      }
      else if(verb=="USER")
	 Send(sock,"331 Password required");
      else if(verb=="PASS")
	 Send(sock,arg=="bad"?"530 Login incorrect":"230 Logged in");
      else if(verb=="TYPE")
	 Send(sock,"200 Type set");
      else if(verb=="PWD")
	 Send(sock,("257 \""+cwd+"\" is the current directory").c_str());
      else if(verb=="CWD")
      {
	 std::string p=(arg==".."?Parent(cwd):Path(arg));
	 if(HasDir(p))
	 {
	    cwd=p;
	    Send(sock,"250 Directory changed");
	 }
	 else
	    Send(sock,"550 No such directory");
      }
      else if(verb=="MKD")
      {
	 std::string p=Path(arg);
	 if(HasDir(p))
	    Send(sock,"550 Directory exists");
	 else
	 {
	    AddDir(p);
	    Send(sock,("257 \""+p+"\" created").c_str());
	 }
      }
      else if(verb=="RMD")
      {
	 ServerLock lock(&mutex);
	 Send(sock,dirs.erase(Path(arg))?"250 Removed":"550 No such directory");
      }
      else if(verb=="DELE")
      {
	 ServerLock lock(&mutex);
	 Send(sock,files.erase(Path(arg))?"250 Deleted":"550 No such file");
      }
      else if(verb=="RNFR")
      {
	 rename_from=Path(arg);
	 Send(sock,HasFile(rename_from)?"350 Ready for RNTO":"550 No such file");
      }
      else if(verb=="RNTO")
      {
	 if(!HasFile(rename_from))
	    Send(sock,"503 RNFR first");
	 else
	 {
	    std::string content=FileContent(rename_from);
	    {
	       ServerLock lock(&mutex);
	       files.erase(rename_from);
	    }
	    AddFile(Path(arg),content);
	    Send(sock,"250 Renamed");
	 }
      }
      else if(verb=="SIZE")
      {
	 std::string p=Path(arg);
	 if(!HasFile(p))
	    Send(sock,"550 No such file");
	 else
	 {
	    char r[64];
	    snprintf(r,sizeof(r),"213 %lu",(unsigned long)FileContent(p).size());
	    Send(sock,r);
	 }
      }
      else if(verb=="STAT")
	 Send(sock,"211 fake FTP server status");
      else if(verb=="PASV")
      {
	 sockaddr_u a;
	 a.set_ipv4("127.0.0.1",0);
	 pasv_sock.set(Networker::SocketListen(&a,1));
	 if(!pasv_sock.is_open() || Networker::SocketLocalAddress(pasv_sock,&a)==-1)
	 {
	    Send(sock,"425 Cannot open passive connection");
	    continue;
	 }
	 char r[128];
	 snprintf(r,sizeof(r),"227 Entering Passive Mode (127,0,0,1,%d,%d).",a.port()>>8,a.port()&255);
	 Send(sock,r);
      }
      else if(verb=="PORT")
      {
	 unsigned h1,h2,h3,h4,p1,p2;
	 if(sscanf(arg.c_str(),"%u,%u,%u,%u,%u,%u",&h1,&h2,&h3,&h4,&p1,&p2)!=6)
	 {
	    Send(sock,"501 Bad PORT");
	    continue;
	 }
	 char host[32];
	 snprintf(host,sizeof(host),"%u.%u.%u.%u",h1,h2,h3,h4);
	 have_port=port_addr.set_ipv4(host,p1*256+p2);
	 Send(sock,have_port?"200 PORT command successful":"501 Bad PORT");
      }
      else if(verb=="LIST")
      {
	 std::string dir=Path(arg);
	 if(!HasDir(dir))
	 {
	    Send(sock,"550 No such directory");
	    continue;
	 }
	 std::string text=Listing(dir);
	 Send(sock,"150 Here comes the directory listing");
	 AutoFD data(OpenData());
	 if(!data.is_open())
	 {
	    Send(sock,"425 Cannot open data connection");
	    continue;
	 }
	 SSL *dssl=ProtectData(data);
	 if(prot_p && !dssl)
	 {
	    Send(sock,"522 Data connection TLS negotiation failed");
	    continue;
	 }
	 int res=WriteTo(dssl,data,text.data(),text.size());
	 CloseTLS(dssl);
	 data.close();
	 Send(sock,res<0?"426 Transfer aborted":"226 Directory send OK");
      }
      else if(verb=="RETR")
      {
	 std::string p=Path(arg);
	 if(!HasFile(p))
	 {
	    pasv_sock.close();
	    have_port=false;
	    Send(sock,"550 No such file");
	    continue;
	 }
	 std::string content=FileContent(p);
	 Send(sock,"150 Opening data connection");
	 AutoFD data(OpenData());
	 if(!data.is_open())
	 {
	    Send(sock,"425 Cannot open data connection");
	    continue;
	 }
	 SSL *dssl=ProtectData(data);
	 if(prot_p && !dssl)
	 {
	    Send(sock,"522 Data connection TLS negotiation failed");
	    continue;
	 }
	 int res=WriteTo(dssl,data,content.data(),content.size());
	 CloseTLS(dssl);
	 data.close();
	 Send(sock,res<0?"426 Transfer aborted":"226 Transfer complete");
      }
      else if(verb=="STOR")
      {
	 Send(sock,"150 Ok to send data");
	 AutoFD data(OpenData());
	 if(!data.is_open())
	 {
	    Send(sock,"425 Cannot open data connection");
	    continue;
	 }
	 SSL *dssl=ProtectData(data);
	 if(prot_p && !dssl)
	 {
	    Send(sock,"522 Data connection TLS negotiation failed");
	    continue;
	 }
	 std::string content;
	 int n;
	 while((n=ReadFrom(dssl,data,buf,sizeof(buf)))>0)
	    content.append(buf,n);
	 CloseTLS(dssl);
	 data.close();
	 if(n<0)
	 {
	    Send(sock,"426 Transfer aborted");
	    continue;
	 }
	 AddFile(Path(arg),content);
	 Send(sock,"226 Transfer complete");
      }
      else if(verb=="QUIT")
      {
	 Send(sock,"221 Goodbye");
	 return;
      }
      else
	 Send(sock,"500 Unknown command");
   }
}

void FakeFtpServer::AddFile(const std::string& path,const std::string& content)
{
   ServerLock lock(&mutex);
   files[path]=content;
}

void FakeFtpServer::AddDir(const std::string& path)
{
   ServerLock lock(&mutex);
   dirs.insert(path);
}

bool FakeFtpServer::HasFile(const std::string& path)
{
   ServerLock lock(&mutex);
   return files.count(path)>0;
}

bool FakeFtpServer::HasDir(const std::string& path)
{
   ServerLock lock(&mutex);
   return dirs.count(path)>0;
}

std::string FakeFtpServer::FileContent(const std::string& path)
{
   ServerLock lock(&mutex);
   std::map<std::string,std::string>::iterator i=files.find(path);
   return i==files.end()?std::string():i->second;
}

std::vector<std::string> FakeFtpServer::Commands()
{
   ServerLock lock(&mutex);
   return commands;
}

int FakeFtpServer::CountCommand(const char *verb)
{
   ServerLock lock(&mutex);
   size_t len=strlen(verb);
   int n=0;
   for(size_t i=0; i<commands.size(); i++)
   {
      const std::string& c=commands[i];
      if(!strncasecmp(c.c_str(),verb,len) && (c.size()==len || c[len]==' '))
	 n++;
   }
   return n;
}
