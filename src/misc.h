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


#ifndef MISC_H
#define MISC_H

#include "ArgV.h"

// joins dir and file with exactly one slash; absolute file wins
const char *dir_file(const char *dir,const char *file);
const char *expand_home_relative(const char *path);

/* `set [-a] [name[/closure] [value...]]'; listing goes to out.
   Returns 0 or an error message. */
const char *set_from_args(ArgV *args,xstring& out);

/* Runs the `set' lines of an rc file; other commands are passed to
   other_cmd when given, else reported. Returns -1 if the file can't be
   read, otherwise the number of bad lines. */
int source_rc_file(const char *file,const char *(*other_cmd)(ArgV *args,void *data)=0,void *data=0);

#endif//MISC_H
