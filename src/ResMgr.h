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


#ifndef RESMGR_H
#define RESMGR_H

#include <stdlib.h>
#include "xstring.h"

typedef const char *ResValValid(xstring_c *value);

struct ResType
{
   const char *name;
   const char *defvalue;
   ResValValid *val_valid;
};

class ResValue
{
   const char *s;
public:
   ResValue(const char *s_new) { s=s_new; }
   bool to_bool() const;
   unsigned long long to_unumber(unsigned long long max) const;
   operator int() const { return (int)to_unumber(0x7fffffff); }
   operator long() const { return (long)to_unumber(0x7fffffffffffffffULL); }
   operator unsigned() const { return (unsigned)to_unumber(0xffffffffU); }
   operator const char*() const { return s; }
   bool is_nil() const { return s==0; }
   bool is_empty() const { return s==0 || *s==0; }
};

/* Settings store. Variables are declared in resource.cc, values are set
   per closure (usually a host name, 0 for the global value). Values stay
   allocated until ClassCleanup, so a returned ResValue may be used after
   another thread has Set the variable again. */
class ResMgr
{
   struct Resource
   {
      const ResType *type;
      xstring_c closure;
      xstring_c value;
      Resource *next;
   };
   static Resource *chain;
   static Resource *retired;
   static bool inited;

   static void Init();
   static void ClassInit();   // registers the variables of resource.cc
   static void Register(const ResType *types);
   static const char *SimpleQuery(const ResType *type,const char *closure);

public:
   static const ResType *FindVar(const char *name,const char **error);
   static const char *Set(const char *name,const char *closure,const char *value);
   static ResValue Query(const char *name,const char *closure);
   static bool QueryBool(const char *name,const char *closure);
   static xstring& Format(xstring& buf,bool with_defaults);
   static void ClassCleanup();

   static const char *BoolValidate(xstring_c *value);
   static const char *UNumberValidate(xstring_c *value);
   static const char *PortValidate(xstring_c *value);
   static bool str2bool(const char *value);
};

class ResClient
{
   static ResClient *list;
   ResClient *next;
protected:
   ResValue Query(const char *name,const char *closure=0) const
      { return ResMgr::Query(name,closure); }
   bool QueryBool(const char *name,const char *closure=0) const
      { return ResMgr::QueryBool(name,closure); }
   ResClient();
   virtual ~ResClient();
public:
   virtual void Reconfig(const char *) {}
   static void ReconfigAll(const char *);
};

#endif //RESMGR_H
