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
#include <dirent.h>
#include <stdlib.h>
#include <sys/stat.h>
#include "DirectoryWalker.h"
#include "ProtoLog.h"

DirectoryWalker::DirectoryWalker(Session *s,TransferEngine *e,TreeTransfer *t)
   : session(s), engine(e), transfer(t), files_done(0), failures(0), dirs_done(0)
{
}

bool DirectoryWalker::Cwd(const char *dir)
{
   Result<Reply> r=session->Control()->Command(xstring::cat("CWD ",dir,NULL));
   if(!r.ok())
      return false;
   if(!r.Value().Is2XX())
   {
      ProtoLog::LogError(1,"Cannot change to %s: %s",dir,r.Value().Text());
      return false;
   }
   return true;
}

void DirectoryWalker::CwdUp()
{
   Result<Reply> r=session->Control()->Command("CWD ..");
   if(r.ok() && !r.Value().Is2XX())
      ProtoLog::LogError(1,"CWD .. failed: %s",r.Value().Text());
}

static int no_dots(const struct dirent *d)
{
   return strcmp(d->d_name,".") && strcmp(d->d_name,"..");
}

void DirectoryWalker::UploadTree(const char *local_path,const char *remote_name)
{
   ControlChannel *control=session->Control();
   Result<Reply> r=control->Command(xstring::cat("MKD ",remote_name,NULL));
   if(!r.ok())
   {
      failures++;
      return;
   }
   if(!r.Value().Is2XX())
      ProtoLog::LogNote(3,"MKD %s: %s",remote_name,r.Value().Text());
   if(!Cwd(remote_name))
   {
      failures++;
      return;
   }
   dirs_done++;

   struct dirent **list=0;
   int n=scandir(local_path,&list,no_dots,alphasort);
   if(n<0)
   {
      ProtoLog::LogError(0,"%s: %s",local_path,strerror(errno));
      failures++;
   }
   for(int i=0; i<n; i++)
   {
      const char *name=list[i]->d_name;
      xstring path;
      path.set(xstring::cat(local_path,"/",name,NULL));
      struct stat st;
      if(stat(path,&st)==-1)
      {
	 ProtoLog::LogError(0,"%s: %s",path.get(),strerror(errno));
	 failures++;
      }
      else if(S_ISDIR(st.st_mode))
	 UploadTree(path,name);
      else if(S_ISREG(st.st_mode))
      {
	 Error err=transfer->PutFile(path,name);
	 if(err.IsOK())
	    files_done++;
	 else
	 {
	    ProtoLog::LogError(0,"Skipping %s: %s",path.get(),err.Text());
	    failures++;
	 }
      }
      else
	 ProtoLog::LogNote(3,"%s: not a regular file, skipped",path.get());
      free(list[i]);
   }
   free(list);

   CwdUp();
}

void DirectoryWalker::DownloadTree(const char *remote_name,const char *local_path)
{
   if(mkdir(local_path,0755)==-1 && errno!=EEXIST)
   {
      ProtoLog::LogError(0,"%s: %s",local_path,strerror(errno));
      failures++;
      return;
   }
   if(!Cwd(remote_name))
   {
      failures++;
      return;
   }
   dirs_done++;

   xstring listing;
   Error err=engine->List(0,listing);
   if(!err.IsOK())
   {
      ProtoLog::LogError(0,"Cannot list %s: %s",remote_name,err.Text());
      failures++;
      CwdUp();
      return;
   }
   std::vector<FtpListEntry> entries;
   FtpParse::ParseList(listing,listing.length(),entries);

   for(size_t i=0; i<entries.size(); i++)
   {
      const char *name=entries[i].name;
      if(strchr(name,'/'))
      {
	 ProtoLog::LogError(1,"Suspicious file name `%s' in listing, skipped",name);
	 continue;
      }
      xstring path;
      path.set(xstring::cat(local_path,"/",name,NULL));
      if(entries[i].is_dir)
	 DownloadTree(name,path);
      else
      {
	 err=transfer->GetFile(name,path);
	 if(err.IsOK())
	    files_done++;
	 else
	 {
	    ProtoLog::LogError(0,"Skipping %s: %s",name,err.Text());
	    failures++;
	 }
      }
   }

   CwdUp();
}

Error DirectoryWalker::Summary(const char *what,const char *name)
{
   ProtoLog::LogNote(1,"%s %s: %d files in %d folders, %d failures",
      what,name,files_done,dirs_done,failures);
   if(!session->Control()->IsConnected())
      return session->Control()->GetError();
   if(dirs_done==0)
      return Error(Error::TRANSFER_ERROR,xstring::format("%s: cannot enter folder",name));
   if(failures>0)
      return Error(Error::TRANSFER_ERROR,xstring::format("%s: %d entries failed",name,failures));
   return Error();
}

Error DirectoryWalker::UploadFolder(const char *local_path,const char *remote_name)
{
   files_done=failures=dirs_done=0;
   struct stat st;
   int res=stat(local_path,&st);
   if(res==-1 || !S_ISDIR(st.st_mode))
   {
      Error err;
      err.SetF(Error::FILE_SYSTEM_ERROR,"%s: %s",local_path,
	 res==-1?strerror(errno):"Not a directory");
      ProtoLog::LogError(0,"%s",err.Text());
      return err;
   }
   UploadTree(local_path,remote_name);
   return Summary("Uploaded",local_path);
}

Error DirectoryWalker::DownloadFolder(const char *remote_name,const char *local_path)
{
   files_done=failures=dirs_done=0;
   DownloadTree(remote_name,local_path);
   return Summary("Downloaded",remote_name);
}
