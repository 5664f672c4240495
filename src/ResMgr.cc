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
#include <ctype.h>
#include <fnmatch.h>
#include <pthread.h>
#include "ResMgr.h"

ResMgr::Resource *ResMgr::chain;
ResMgr::Resource *ResMgr::retired;
bool ResMgr::inited;

static pthread_mutex_t res_mutex=PTHREAD_MUTEX_INITIALIZER;
static pthread_mutex_t client_mutex=PTHREAD_MUTEX_INITIALIZER;

enum { MAX_TABLES=8 };
static const ResType *tables[MAX_TABLES];
static int tables_count;

class ResLock
{
   pthread_mutex_t *m;
public:
   ResLock(pthread_mutex_t *m1) : m(m1) { pthread_mutex_lock(m); }
   ~ResLock() { pthread_mutex_unlock(m); }
};

void ResMgr::Register(const ResType *types)
{
   if(tables_count<MAX_TABLES)
      tables[tables_count++]=types;
}

void ResMgr::Init()
{
   ResLock lock(&res_mutex);
   if(!inited)
   {
      inited=true;
      ClassInit();
   }
}

const ResType *ResMgr::FindVar(const char *name,const char **error)
{
   Init();
   const ResType *exact=0;
   const ResType *partial=0;
   int partial_count=0;
   size_t name_len=strlen(name);
   for(int t=0; t<tables_count; t++)
   {
      for(const ResType *r=tables[t]; r->name; r++)
      {
	 if(!strcmp(r->name,name))
	    exact=r;
	 else if(!strncmp(r->name,name,name_len))
	 {
	    partial=r;
	    partial_count++;
	 }
      }
   }
   if(exact)
      return exact;
   if(partial_count==1)
      return partial;
   if(error)
      *error=(partial_count>1?"ambiguous variable name":"no such variable");
   return 0;
}

const char *ResMgr::Set(const char *name,const char *closure,const char *cvalue)
{
   const char *error=0;
   const ResType *type=FindVar(name,&error);
   if(!type)
      return error;

   xstring_c value(cvalue);
   if(value && type->val_valid)
   {
      error=type->val_valid(&value);
      if(error)
	 return error;
   }

   {
      ResLock lock(&res_mutex);
      Resource **scan=&chain;
      while(*scan)
      {
	 Resource *r=*scan;
	 if(r->type==type && !xstrcmp(r->closure,closure))
	    break;
	 scan=&r->next;
      }
      Resource *r=*scan;
      if(r)
      {
	 // unlink, but keep the strings alive for concurrent readers
	 *scan=r->next;
	 r->next=retired;
	 retired=r;
      }
      if(value)
      {
	 r=new Resource;
	 r->type=type;
	 r->closure.set(closure);
	 r->value.set_allocated(value.borrow());
	 r->next=chain;
	 chain=r;
      }
   }
   ResClient::ReconfigAll(type->name);
   return 0;
}

const char *ResMgr::SimpleQuery(const ResType *type,const char *closure)
{
   ResLock lock(&res_mutex);
   const char *global=0;
   for(Resource *r=chain; r; r=r->next)
   {
      if(r->type!=type)
	 continue;
      if(!r->closure)
      {
	 global=r->value;
	 continue;
      }
      if(closure && fnmatch(r->closure,closure,FNM_CASEFOLD)==0)
	 return r->value;
   }
   return global?global:type->defvalue;
}

ResValue ResMgr::Query(const char *name,const char *closure)
{
   const ResType *type=FindVar(name,0);
   if(!type)
      return 0;
   return SimpleQuery(type,closure);
}

bool ResMgr::QueryBool(const char *name,const char *closure)
{
   return Query(name,closure).to_bool();
}

xstring& ResMgr::Format(xstring& buf,bool with_defaults)
{
   Init();
   for(int t=0; t<tables_count; t++)
   {
      for(const ResType *r=tables[t]; r->name; r++)
      {
	 bool have_set=false;
	 {
	    ResLock lock(&res_mutex);
	    for(Resource *s=chain; s; s=s->next)
	    {
	       if(s->type!=r)
		  continue;
	       have_set=true;
	       if(s->closure)
		  buf.appendf("set %s/%s %s\n",r->name,s->closure.get(),s->value.get());
	       else
		  buf.appendf("set %s %s\n",r->name,s->value.get());
	    }
	 }
	 if(!have_set && with_defaults)
	    buf.appendf("set %s %s\n",r->name,r->defvalue);
      }
   }
   return buf;
}

void ResMgr::ClassCleanup()
{
   ResLock lock(&res_mutex);
   while(chain)
      delete replace_value(chain,chain->next);
   while(retired)
      delete replace_value(retired,retired->next);
}

const char *ResMgr::BoolValidate(xstring_c *value)
{
   const char *v=*value;
   const char *newval=0;

   switch(v[0])
   {
   case 't': case 'T': case 'y': case 'Y': case '1': case '+':
      newval="yes";
      break;
   case 'f': case 'F': case 'n': case 'N': case '0': case '-':
      newval="no";
      break;
   case 'o': case 'O':
      newval=(v[1]=='f' || v[1]=='F')?"no":"yes";
      break;
   default:
      return "invalid boolean value";
   }
   if(strcmp(v,newval))
      value->set(newval);
   return 0;
}

const char *ResMgr::UNumberValidate(xstring_c *value)
{
   const char *v=*value;
   char *end=0;
   (void)strtoull(v,&end,10);
   if(!isdigit((unsigned char)v[0]) || *end)
      return "invalid unsigned number";
   return 0;
}

const char *ResMgr::PortValidate(xstring_c *value)
{
   const char *error=UNumberValidate(value);
   if(error)
      return error;
   if(atol(*value)<1 || atol(*value)>65535)
      return "port number out of range";
   return 0;
}

bool ResMgr::str2bool(const char *s)
{
   return s && s[0] && (strchr("TtYy1+",s[0])!=0 || !strcasecmp(s,"on"));
}

bool ResValue::to_bool() const
{
   return ResMgr::str2bool(s);
}

unsigned long long ResValue::to_unumber(unsigned long long max) const
{
   if(is_empty())
      return 0;
   unsigned long long v=strtoull(s,0,10);
   return v>max?max:v;
}

ResClient *ResClient::list;

ResClient::ResClient()
{
   ResLock lock(&client_mutex);
   next=list;
   list=this;
}
ResClient::~ResClient()
{
   ResLock lock(&client_mutex);
   for(ResClient **scan=&list; *scan; scan=&(*scan)->next)
   {
      if(*scan==this)
      {
	 *scan=next;
	 break;
      }
   }
}
void ResClient::ReconfigAll(const char *name)
{
   ResLock lock(&client_mutex);
   for(ResClient *c=list; c; c=c->next)
      c->Reconfig(name);
}
