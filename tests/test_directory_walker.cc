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
#include <unistd.h>
#include <gtest/gtest.h>
#include "FtpClient.h"
#include "ResMgr.h"
#include "FakeFtpServer.h"
#include "TestUtil.h"

// rejects files whose name contains the given text
class PickyScanner : public Scanner
{
public:
   const char *reject;
   PickyScanner() : reject(0) {}
   ScanResult Scan(const char *path,Error *err)
   {
      err->Clear();
      return reject && strstr(path,reject)?SCAN_INFECTED:SCAN_CLEAN;
   }
};

class WalkerTest : public ::testing::Test
{
protected:
   FakeFtpServer server;
   TempDir tmp;
   PickyScanner scanner;
   FtpClient *client;

   void SetUp()
   {
      ResMgr::Set("scan:enabled",0,0);
      ResMgr::Set("ftp:passive-mode",0,0);
      ASSERT_TRUE(server.Start());
      client=new FtpClient(&scanner);
      ASSERT_TRUE(client->Connect("127.0.0.1",server.Port()).ok());
      ASSERT_TRUE(client->Login("tester","secret").Value());
   }
   void TearDown()
   {
      delete client;
      server.Stop();
   }
   void MakeTree(const char *root)
   {
      xstring dir(root);
      ASSERT_TRUE(MakeDir(dir));
      ASSERT_TRUE(WriteFile(xstring::cat(dir.get(),"/a.txt",NULL),"alpha\n"));
      ASSERT_TRUE(MakeDir(xstring::cat(dir.get(),"/sub",NULL)));
      ASSERT_TRUE(WriteFile(xstring::cat(dir.get(),"/sub/b.txt",NULL),"beta\n"));
   }
   // every CWD into a folder must be matched by a CWD ..
   void ExpectBalancedCwd()
   {
      std::vector<std::string> cmds=server.Commands();
      int depth=0;
      for(size_t i=0; i<cmds.size(); i++)
      {
	 if(cmds[i]=="CWD ..")
	 {
	    depth--;
	    EXPECT_GE(depth,0) << "at command " << i;
	 }
	 else if(cmds[i].compare(0,4,"CWD ")==0)
	    depth++;
      }
      EXPECT_EQ(0,depth);
   }
};

TEST_F(WalkerTest, UploadTree)
{
   xstring root(tmp.File("tree"));
   MakeTree(root);
   Error err=client->PutFolder(root,0);
   ASSERT_TRUE(err.IsOK()) << err.Text();

   EXPECT_TRUE(server.HasDir("/tree"));
   EXPECT_TRUE(server.HasDir("/tree/sub"));
   EXPECT_EQ("alpha\n",server.FileContent("/tree/a.txt"));
   EXPECT_EQ("beta\n",server.FileContent("/tree/sub/b.txt"));
   EXPECT_EQ(2,server.CountCommand("CWD .."));
   ExpectBalancedCwd();

   // back where we started
   EXPECT_TRUE(client->Pwd().IsOK());
   EXPECT_NE((const char*)0,strstr(client->Output(),"\"/\""));
}

TEST_F(WalkerTest, UploadIntoExistingFolder)
{
   server.AddDir("/tree");
   xstring root(tmp.File("tree"));
   MakeTree(root);
   Error err=client->PutFolder(root,"tree");
   EXPECT_TRUE(err.IsOK()) << err.Text();
   EXPECT_TRUE(server.HasFile("/tree/sub/b.txt"));
}

TEST_F(WalkerTest, RejectedFileIsSkipped)
{
   scanner.reject="b.txt";
   xstring root(tmp.File("tree"));
   MakeTree(root);
   Error err=client->PutFolder(root,"tree");
   EXPECT_EQ(Error::TRANSFER_ERROR,err.Kind());
   EXPECT_TRUE(server.HasFile("/tree/a.txt"));
   EXPECT_FALSE(server.HasFile("/tree/sub/b.txt"));
   ExpectBalancedCwd();
}

TEST_F(WalkerTest, LocalFolderMissing)
{
   Error err=client->PutFolder(tmp.File("none"),"none");
   EXPECT_EQ(Error::FILE_SYSTEM_ERROR,err.Kind());
   EXPECT_EQ(0,server.CountCommand("MKD"));
}

TEST_F(WalkerTest, DownloadTree)
{
   server.AddDir("/remote");
   server.AddFile("/remote/a.txt","alpha\n");
   server.AddDir("/remote/sub");
   server.AddFile("/remote/sub/b.txt","beta\n");
   server.AddDir("/remote/sub/empty");

   xstring local(tmp.File("mirror"));
   Error err=client->GetFolder("remote",local);
   ASSERT_TRUE(err.IsOK()) << err.Text();

   xstring got;
   ASSERT_TRUE(ReadFile(xstring::cat(local.get(),"/a.txt",NULL),got));
   EXPECT_STREQ("alpha\n",got);
   ASSERT_TRUE(ReadFile(xstring::cat(local.get(),"/sub/b.txt",NULL),got));
   EXPECT_STREQ("beta\n",got);
   EXPECT_EQ(0,access(xstring::cat(local.get(),"/sub/empty",NULL),F_OK));
   EXPECT_EQ(3,server.CountCommand("CWD .."));
   ExpectBalancedCwd();
}

TEST_F(WalkerTest, DownloadMissingFolder)
{
   Error err=client->GetFolder("absent",tmp.File("absent"));
   EXPECT_EQ(Error::TRANSFER_ERROR,err.Kind());
   EXPECT_EQ(0,server.CountCommand("CWD .."));
}
