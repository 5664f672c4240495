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
#include <stdlib.h>
#include <errno.h>
#include <fcntl.h>
#include <unistd.h>
#include <termios.h>

#include "xstring.h"
#include "GetPass.h"

const char *GetPass(const char *prompt)
{
   static xstring_c oldpass;
   static int tty_fd=-2;

   if(tty_fd==-2)
   {
      if(isatty(0))
	 tty_fd=0;
      else
      {
	 tty_fd=open("/dev/tty",O_RDONLY);
	 if(tty_fd!=-1)
	    fcntl(tty_fd,F_SETFD,FD_CLOEXEC);
      }
   }
   if(tty_fd==-1)
      return 0;

   if(write(tty_fd,prompt,strlen(prompt))==-1)
      return 0;

   struct termios tc;
   bool restore=(tcgetattr(tty_fd,&tc)!=-1);
   tcflag_t old_lflag=tc.c_lflag;
   if(restore)
   {
      tc.c_lflag&=~ECHO;
      tcsetattr(tty_fd,TCSANOW,&tc);
   }

   oldpass.set_allocated(readline_from_file(tty_fd));

   if(restore)
   {
      tc.c_lflag=old_lflag;
      tcsetattr(tty_fd,TCSANOW,&tc);
   }

   if(write(tty_fd,"\r\n",2)==-1)
      perror("write");

   return oldpass;
}

char *readline_from_file(int fd)
{
   xstring line("");
   for(;;)
   {
      char c;
      int res=read(fd,&c,1);
      if(res==-1 && errno==EINTR)
	 continue;
      if(res<=0)
      {
	 if(line.length()==0)
	    return 0;
	 break;
      }
      if(c=='\n')
	 break;
      line.append(c);
   }
   return xstrdup(line);
}
