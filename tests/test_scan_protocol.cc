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
#include "ScanProtocol.h"

TEST(ScanProtocol, Verdicts)
{
   EXPECT_EQ(SCAN_CLEAN,ScanProtocol::ParseVerdict("CLEAN",5));
   EXPECT_EQ(SCAN_INFECTED,ScanProtocol::ParseVerdict(" INFECTED\n",10));
   EXPECT_EQ(SCAN_ERROR,ScanProtocol::ParseVerdict("ERROR",5));
   EXPECT_EQ(SCAN_ERROR,ScanProtocol::ParseVerdict("clean",5));
   EXPECT_EQ(SCAN_ERROR,ScanProtocol::ParseVerdict("CLEANED",7));
   EXPECT_EQ(SCAN_ERROR,ScanProtocol::ParseVerdict("",0));
}

TEST(ScanProtocol, HeaderFollowedByContent)
{
   xstring wire;
   ScanProtocol::FormatHeader(wire,"/home/u/report.pdf",7);
   EXPECT_STREQ("/home/u/report.pdf<SEPARATOR>7",wire);
   wire.append("%PDF-1.");

   xstring name;
   xstring digits;
   int hlen=ScanProtocol::ParseHeader(wire,wire.length(),name,digits);
   ASSERT_GT(hlen,0);
   EXPECT_STREQ("/home/u/report.pdf",name);
   EXPECT_STREQ("7",digits);
   EXPECT_EQ('%',wire[hlen]);

   long long size=0;
   EXPECT_EQ(1,ScanProtocol::ResolveSize(digits,wire.length()-hlen,&size));
   EXPECT_EQ(7,size);
}

TEST(ScanProtocol, ContentStartingWithDigits)
{
   xstring wire;
   ScanProtocol::FormatHeader(wire,"data.csv",6);
   wire.append("1,2,3\n");

   xstring name;
   xstring digits;
   int hlen=ScanProtocol::ParseHeader(wire,wire.length(),name,digits);
   ASSERT_GT(hlen,0);
   EXPECT_STREQ("61",digits);

   long long size=0;
   EXPECT_EQ(1,ScanProtocol::ResolveSize(digits,wire.length()-hlen,&size));
   EXPECT_EQ(6,size);

   // neither 6 nor 61 fits four bytes after the run
   EXPECT_EQ(-1,ScanProtocol::ResolveSize(digits,4,&size));
}

TEST(ScanProtocol, DigitRunIsCapped)
{
   xstring wire;
   ScanProtocol::FormatHeader(wire,"n.txt",40);
   wire.append("1234567890123456789012345678901234567890");

   xstring name;
   xstring digits;
   int hlen=ScanProtocol::ParseHeader(wire,wire.length(),name,digits);
   ASSERT_GT(hlen,0);
   EXPECT_EQ((size_t)ScanProtocol::MAX_SIZE_DIGITS,digits.length());

   long long size=0;
   EXPECT_EQ(2,ScanProtocol::ResolveSize(digits,wire.length()-hlen,&size));
   EXPECT_EQ(40,size);
   EXPECT_EQ(-1,ScanProtocol::SizeCandidate(digits,ScanProtocol::MAX_SIZE_DIGITS+1));
}

TEST(ScanProtocol, HeaderMalformed)
{
   xstring name;
   xstring digits;
   const char *no_sep="report.pdf 7";
   EXPECT_EQ(-1,ScanProtocol::ParseHeader(no_sep,strlen(no_sep),name,digits));
   const char *no_size="report.pdf<SEPARATOR>";
   EXPECT_EQ(-1,ScanProtocol::ParseHeader(no_size,strlen(no_size),name,digits));
   const char *bad_size="report.pdf<SEPARATOR>-3";
   EXPECT_EQ(-1,ScanProtocol::ParseHeader(bad_size,strlen(bad_size),name,digits));
}

TEST(ScanProtocol, SanitizeName)
{
   EXPECT_STREQ("b.txt",ScanProtocol::SanitizeName("/tmp/a/b.txt"));
   EXPECT_STREQ("evil.exe",ScanProtocol::SanitizeName("..\\..\\evil.exe"));
   EXPECT_STREQ("x",ScanProtocol::SanitizeName("x"));
   EXPECT_EQ((const char*)0,ScanProtocol::SanitizeName(""));
   EXPECT_EQ((const char*)0,ScanProtocol::SanitizeName(".."));
   EXPECT_EQ((const char*)0,ScanProtocol::SanitizeName("a/b/"));
}

TEST(ScanProtocol, Timeout)
{
   EXPECT_EQ(45,ScanProtocol::Timeout(0,45,4));
   EXPECT_EQ(45,ScanProtocol::Timeout(1024*1024-1,45,4));
   EXPECT_EQ(49,ScanProtocol::Timeout(1024*1024,45,4));
   EXPECT_EQ(445,ScanProtocol::Timeout(100LL*1024*1024,45,4));
}
