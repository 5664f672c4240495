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
#include <gtest/gtest.h>
#include "FtpParse.h"

TEST(FtpParse, ReplyLine)
{
   Reply r;
   ASSERT_TRUE(FtpParse::ParseReplyLine("220 Service ready\r\n",19,&r));
   EXPECT_EQ(220,r.Code());
   EXPECT_STREQ("220 Service ready",r.Text());
   EXPECT_TRUE(r.Is2XX());

   ASSERT_TRUE(FtpParse::ParseReplyLine("230-Welcome",11,&r));
   EXPECT_EQ(230,r.Code());

   ASSERT_TRUE(FtpParse::ParseReplyLine("150",3,&r));
   EXPECT_TRUE(r.Is1XX());
}

TEST(FtpParse, ReplyLineRejectsGarbage)
{
   Reply r;
   EXPECT_FALSE(FtpParse::ParseReplyLine("hello",5,&r));
   EXPECT_FALSE(FtpParse::ParseReplyLine("22",2,&r));
   EXPECT_FALSE(FtpParse::ParseReplyLine("220x",4,&r));
   EXPECT_FALSE(FtpParse::ParseReplyLine("020 low",7,&r));
   EXPECT_FALSE(FtpParse::ParseReplyLine("700 high",8,&r));
}

TEST(FtpParse, PassiveReply)
{
   Result<sockaddr_u> a=FtpParse::ParsePASV("227 Entering Passive Mode (192,168,1,10,19,137).");
   ASSERT_TRUE(a.ok()) << a.GetError().Text();
   EXPECT_STREQ("192.168.1.10",a.Value().address());
   EXPECT_EQ(19*256+137,a.Value().port());

   // no parentheses, no trailing dot
   a=FtpParse::ParsePASV("227 =127,0,0,1,4,1");
   EXPECT_FALSE(a.ok());
   a=FtpParse::ParsePASV("227 ok 127,0,0,1,4,1");
   ASSERT_TRUE(a.ok());
   EXPECT_EQ(1025,a.Value().port());
}

TEST(FtpParse, PassiveReplyMalformed)
{
   const char *bad[]={
      "227 Entering Passive Mode (127,0,0,1,4).",
      "227 Entering Passive Mode (127,0,0,1,4,1,7).",
      "227 Entering Passive Mode (256,0,0,1,4,1).",
      "227 Entering Passive Mode (127,0,0,1,4,x).",
      "227 Entering Passive Mode (127,,0,1,4,1).",
      "227",
      "",
   };
   for(size_t i=0; i<sizeof(bad)/sizeof(*bad); i++)
   {
      Result<sockaddr_u> a=FtpParse::ParsePASV(bad[i]);
      EXPECT_FALSE(a.ok()) << bad[i];
      EXPECT_EQ(Error::PROTOCOL_ERROR,a.GetError().Kind()) << bad[i];
   }
}

TEST(FtpParse, PortArgument)
{
   sockaddr_u a;
   ASSERT_TRUE(a.set_ipv4("10.0.0.7",10806));
   xstring out;
   ASSERT_TRUE(FtpParse::FormatPORT(&a,out));
   EXPECT_STREQ("10,0,0,7,42,54",out);

   sockaddr_u a6;
   a6.in6.sin6_family=AF_INET6;
   EXPECT_FALSE(FtpParse::FormatPORT(&a6,out));
}

TEST(FtpParse, ListLine)
{
   FtpListEntry e;
   const char *dir="drwxr-xr-x   4 lav      root         1024 Feb 22 15:32 lib";
   ASSERT_TRUE(FtpParse::ParseListLine(dir,strlen(dir),&e));
   EXPECT_STREQ("lib",e.name);
   EXPECT_TRUE(e.is_dir);

   const char *file="-rw-r--r--   1 lav      root         1349 Feb  2 14:10 my file.txt\r\n";
   ASSERT_TRUE(FtpParse::ParseListLine(file,strlen(file),&e));
   EXPECT_STREQ("my file.txt",e.name);
   EXPECT_FALSE(e.is_dir);
   EXPECT_EQ(1349,e.size);

   const char *link="lrwxrwxrwx   1 lav      root           33 Feb 14 17:45 ltconfig -> /usr/share/libtool/ltconfig";
   ASSERT_TRUE(FtpParse::ParseListLine(link,strlen(link),&e));
   EXPECT_STREQ("ltconfig",e.name);
   EXPECT_TRUE(e.is_link);
}

TEST(FtpParse, ListSkipsNoise)
{
   const char *listing=
      "total 12\r\n"
      "drwxr-xr-x   2 ftp ftp 4096 Jan 01 00:00 .\r\n"
      "drwxr-xr-x   2 ftp ftp 4096 Jan 01 00:00 ..\r\n"
      "-rw-r--r--   1 ftp ftp    5 Jan 01 00:00 a.txt\r\n"
      "drwxr-xr-x   2 ftp ftp 4096 Jan 01 00:00 sub\r\n"
      "-rw-r--r--   1 ftp ftp short\r\n";
   std::vector<FtpListEntry> entries;
   EXPECT_EQ(2,FtpParse::ParseList(listing,strlen(listing),entries));
   ASSERT_EQ(2u,entries.size());
   EXPECT_STREQ("a.txt",entries[0].name);
   EXPECT_EQ(5,entries[0].size);
   EXPECT_STREQ("sub",entries[1].name);
   EXPECT_TRUE(entries[1].is_dir);
}
