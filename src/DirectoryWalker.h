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


#ifndef DIRECTORYWALKER_H
#define DIRECTORYWALKER_H

#include "TransferEngine.h"

/* Per-file transfers the walker delegates, so that uploads inside a tree
   are scanned the same way single uploads are. */
class TreeTransfer
{
public:
   virtual Error PutFile(const char *local_path,const char *remote_name)=0;
   virtual Error GetFile(const char *remote_name,const char *local_path)=0;
   virtual ~TreeTransfer() {}
};

/* Recursive folder mirroring using MKD, CWD and per-file transfers.
   Every CWD into a folder is paired with a CWD .. on the way out, also
   after failures inside it; a failing entry is logged and skipped. */
class DirectoryWalker
{
   Session *session;
   TransferEngine *engine;
   TreeTransfer *transfer;
   int files_done;
   int failures;
   int dirs_done;

   bool Cwd(const char *dir);
   void CwdUp();
   void UploadTree(const char *local_path,const char *remote_name);
   void DownloadTree(const char *remote_name,const char *local_path);
   Error Summary(const char *what,const char *name);

public:
   DirectoryWalker(Session *s,TransferEngine *e,TreeTransfer *t);

   Error UploadFolder(const char *local_path,const char *remote_name);
   Error DownloadFolder(const char *remote_name,const char *local_path);

   int FilesDone() const { return files_done; }
   int Failures() const { return failures; }
   int DirsDone() const { return dirs_done; }
};

#endif//DIRECTORYWALKER_H
