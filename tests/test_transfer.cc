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

class StubScanner : public Scanner
{
public:
   ScanResult verdict;
   int calls;
   StubScanner() : verdict(SCAN_CLEAN), calls(0) {}
   ScanResult Scan(const char *,Error *err)
   {
      calls++;
      err->Clear();
      return verdict;
   }
};

// never manages to start an agent
class NoAgentSupervisor : public ScanAgentSupervisor
{
protected:
   bool IsRunning() { return false; }
   bool DoStart(Error *err)
   {
      err->Set(Error::SCAN_AGENT_ERROR,"agent not available");
      return false;
   }
   void DoStop() {}
};

class TransferTest : public ::testing::Test
{
protected:
   FakeFtpServer server;
   TempDir tmp;
   StubScanner scanner;
   FtpClient *client;

   void SetUp()
   {
      ResMgr::Set("scan:enabled",0,0);
      ResMgr::Set("ftp:passive-mode",0,0);
      ASSERT_TRUE(server.Start());
      client=new FtpClient(&scanner);
      Result<Reply> greeting=client->Connect("127.0.0.1",server.Port());
      ASSERT_TRUE(greeting.ok()) << greeting.GetError().Text();
      EXPECT_EQ(220,greeting.Value().Code());
      Result<bool> login=client->Login("tester","secret");
      ASSERT_TRUE(login.ok()) << login.GetError().Text();
      ASSERT_TRUE(login.Value());
   }
   void TearDown()
   {
      delete client;
      server.Stop();
   }
   const char *Local(const char *name,const char *content=0)
   {
      const char *path=tmp.File(name);
      if(content)
	 EXPECT_TRUE(WriteFile(path,content));
      return path;
   }
};

class TLSTransferTest : public ::testing::Test
{
protected:
   FakeFtpServer server;
   TempDir tmp;
   StubScanner scanner;
   FtpClient *client;

   void SetUp()
   {
      client=0;
      ResMgr::Set("scan:enabled",0,0);
      ASSERT_TRUE(server.EnableTLS());
      ASSERT_TRUE(server.Start());
      client=new FtpClient(&scanner);
      Result<Reply> greeting=client->Connect("127.0.0.1",server.Port());
      ASSERT_TRUE(greeting.ok()) << greeting.GetError().Text();
      Result<bool> login=client->Login("tester","secret");
      ASSERT_TRUE(login.ok()) << login.GetError().Text();
      ASSERT_TRUE(login.Value());
   }
   void TearDown()
   {
      delete client;
      server.Stop();
   }
};

TEST_F(TLSTransferTest, ProtectedSessionRoundTrip)
{
   EXPECT_TRUE(client->GetSession()->Control()->IsProtected());
   EXPECT_EQ(1,server.CountCommand("AUTH"));
   EXPECT_EQ(1,server.CountCommand("PROT"));
   EXPECT_EQ(1,server.CountCommand("PROT P"));

   server.AddFile("/listed.txt","abc");
   xstring out;
   Error err=client->List(0,out);
   ASSERT_TRUE(err.IsOK()) << err.Text();
   EXPECT_NE((const char*)0,strstr(out,"listed.txt"));

   xstring src(tmp.File("secret.txt"));
   ASSERT_TRUE(WriteFile(src,"sent over TLS\n"));
   err=client->Put(src,"secret.txt");
   ASSERT_TRUE(err.IsOK()) << err.Text();
   EXPECT_EQ("sent over TLS\n",server.FileContent("/secret.txt"));

   xstring dst(tmp.File("back.txt"));
   err=client->Get("secret.txt",dst);
   ASSERT_TRUE(err.IsOK()) << err.Text();
   xstring got;
   ASSERT_TRUE(ReadFile(dst,got));
   EXPECT_STREQ("sent over TLS\n",got);

   // every data connection resumed the control connection's session
   EXPECT_EQ(3,server.ProtectedDataConnections());
   EXPECT_EQ(3,server.ResumedDataSessions());
}

TEST_F(TLSTransferTest, ClearDataWhenProtectionIsOff)
{
   ResMgr::Set("ftp:ssl-protect-data",0,"no");
   ASSERT_TRUE(client->Quit().IsOK());
   ASSERT_TRUE(client->Connect("127.0.0.1",server.Port()).ok());
   Result<bool> login=client->Login("tester","secret");
   ASSERT_TRUE(login.ok() && login.Value());
   EXPECT_TRUE(client->GetSession()->Control()->IsProtected());
   EXPECT_EQ(1,server.CountCommand("PROT"));

   xstring out;
   EXPECT_TRUE(client->List(0,out).IsOK());
   EXPECT_EQ(0,server.ProtectedDataConnections());
   ResMgr::Set("ftp:ssl-protect-data",0,0);
}

TEST_F(TransferTest, LoginContinuesWithoutTLS)
{
   EXPECT_EQ(1,server.CountCommand("AUTH"));
   EXPECT_EQ(0,server.CountCommand("PROT"));
   EXPECT_EQ(1,server.CountCommand("TYPE"));
   EXPECT_TRUE(client->GetSession()->IsAuthenticated());
   EXPECT_FALSE(client->GetSession()->Control()->IsProtected());
}

TEST_F(TransferTest, UploadDownloadRoundTrip)
{
   xstring src(Local("sample.txt","The quick brown fox\n"));
   Error err=client->Put(src,"sample.txt");
   ASSERT_TRUE(err.IsOK()) << err.Text();
   EXPECT_EQ(1,scanner.calls);
   EXPECT_EQ("The quick brown fox\n",server.FileContent("/sample.txt"));

   xstring dst(Local("copy.txt"));
   err=client->Get("sample.txt",dst);
   ASSERT_TRUE(err.IsOK()) << err.Text();
   xstring got;
   ASSERT_TRUE(ReadFile(dst,got));
   EXPECT_STREQ("The quick brown fox\n",got);
   EXPECT_EQ(1,server.CountCommand("SIZE"));
}

TEST_F(TransferTest, LargeUploadSpansChunks)
{
   std::string big;
   for(int i=0; i<3*TransferEngine::CHUNK_SIZE+123; i++)
      big+=(char)('a'+i%26);
   xstring src(Local("big.bin"));
   ASSERT_TRUE(WriteFile(src,big.data(),big.size()));
   Error err=client->Put(src,0);
   ASSERT_TRUE(err.IsOK()) << err.Text();
   EXPECT_EQ(big,server.FileContent("/big.bin"));
}

TEST_F(TransferTest, InfectedFileIsNeverStored)
{
   scanner.verdict=SCAN_INFECTED;
   xstring src(Local("eicar.com","X5O!P%@AP"));
   Error err=client->Put(src,"eicar.com");
   EXPECT_EQ(Error::SECURITY_REJECTION,err.Kind());
   EXPECT_EQ(0,server.CountCommand("STOR"));
   EXPECT_EQ(0,server.CountCommand("PASV"));
   EXPECT_FALSE(server.HasFile("/eicar.com"));
}

TEST_F(TransferTest, ScannerErrorIsNeverStored)
{
   scanner.verdict=SCAN_ERROR;
   xstring src(Local("doc.txt","text"));
   EXPECT_FALSE(client->Put(src,"doc.txt").IsOK());
   EXPECT_EQ(0,server.CountCommand("STOR"));
}

TEST_F(TransferTest, UnreachableAgentFailsClosed)
{
   // the fake server talks to one client at a time
   client->Quit();
   ResMgr::Set("scan:max-attempts",0,"2");
   NoAgentSupervisor sup;
   ScanAgentClient agent(&sup);
   FtpClient scanned(&agent);
   ASSERT_TRUE(scanned.Connect("127.0.0.1",server.Port()).ok());
   ASSERT_TRUE(scanned.Login("tester","secret").Value());

   xstring src(Local("doc.txt","text"));
   Error err=scanned.Put(src,"doc.txt");
   EXPECT_EQ(Error::SCAN_AGENT_ERROR,err.Kind());
   EXPECT_EQ(2,agent.Attempts());
   EXPECT_EQ(0,server.CountCommand("STOR"));
   ResMgr::Set("scan:max-attempts",0,0);
}

TEST_F(TransferTest, ScanningDisabledSkipsScanner)
{
   ResMgr::Set("scan:enabled",0,"no");
   scanner.verdict=SCAN_INFECTED;
   xstring src(Local("a.txt","aaa"));
   EXPECT_TRUE(client->Put(src,"a.txt").IsOK());
   EXPECT_EQ(0,scanner.calls);
   ResMgr::Set("scan:enabled",0,0);
}

TEST_F(TransferTest, MissingLocalFile)
{
   Error err=client->Put(tmp.File("absent"),"absent");
   EXPECT_EQ(Error::FILE_SYSTEM_ERROR,err.Kind());
   EXPECT_EQ(0,scanner.calls);
}

TEST_F(TransferTest, RefusedRetrieveLeavesNoFile)
{
   xstring dst(Local("nothing.txt"));
   Error err=client->Get("nothing.txt",dst);
   EXPECT_EQ(Error::TRANSFER_ERROR,err.Kind());
   EXPECT_NE(0,access(dst,F_OK));
}

TEST_F(TransferTest, ActiveModeListing)
{
   int port=FreePort();
   ASSERT_GT(port,0);
   ResMgr::Set("ftp:active-port",0,xstring::format("%d",port));
   server.AddFile("/a.txt","12345");
   server.AddDir("/sub");
   client->SetPassive(false);

   xstring out;
   Error err=client->List(0,out);
   ASSERT_TRUE(err.IsOK()) << err.Text();
   EXPECT_EQ(1,server.CountCommand("PORT"));
   EXPECT_EQ(0,server.CountCommand("PASV"));

   std::vector<FtpListEntry> entries;
   ASSERT_EQ(2,FtpParse::ParseList(out,out.length(),entries));
   EXPECT_STREQ("sub",entries[0].name);
   EXPECT_STREQ("a.txt",entries[1].name);
   EXPECT_EQ(5,entries[1].size);
   ResMgr::Set("ftp:active-port",0,0);
}

TEST_F(TransferTest, ActiveModeServerNeverConnects)
{
   int port=FreePort();
   ASSERT_GT(port,0);
   ResMgr::Set("ftp:active-port",0,xstring::format("%d",port));
   ResMgr::Set("net:timeout",0,"1");
   server.AddDir("/sub");
   server.RefuseActiveData(true);
   client->SetPassive(false);

   xstring out;
   Error err=client->List(0,out);
   EXPECT_EQ(Error::CONNECTION_ERROR,err.Kind());

   // the 425 for the failed listing does not answer the next command
   err=client->Cd("sub");
   EXPECT_TRUE(err.IsOK()) << err.Text();
   EXPECT_TRUE(client->Pwd().IsOK());
   EXPECT_NE((const char*)0,strstr(client->Output(),"\"/sub\""));

   ResMgr::Set("net:timeout",0,0);
   ResMgr::Set("ftp:active-port",0,0);
}

TEST_F(TransferTest, AsciiModeConvertsLineEnds)
{
   client->SetTransferMode(Session::ASCII);
   xstring src(Local("text.txt","one\ntwo\n"));
   ASSERT_TRUE(client->Put(src,"text.txt").IsOK());
   EXPECT_EQ("one\r\ntwo\r\n",server.FileContent("/text.txt"));
   EXPECT_EQ(1,server.CountCommand("TYPE A"));

   xstring dst(Local("back.txt"));
   ASSERT_TRUE(client->Get("text.txt",dst).IsOK());
   xstring got;
   ASSERT_TRUE(ReadFile(dst,got));
   EXPECT_STREQ("one\ntwo\n",got);
}

TEST_F(TransferTest, AsciiCrLfAcrossChunkBoundary)
{
   client->SetTransferMode(Session::ASCII);
   // the CR ends the first chunk and the LF starts the second
   std::string text(TransferEngine::CHUNK_SIZE-1,'x');
   text.append("\r\nend\r\n");
   xstring src(tmp.File("crlf.txt"));
   ASSERT_TRUE(WriteFile(src,text.data(),text.length()));
   Error err=client->Put(src,"crlf.txt");
   ASSERT_TRUE(err.IsOK()) << err.Text();
   EXPECT_EQ(text,server.FileContent("/crlf.txt"));

   // a CR at the end of one file does not carry over to the next
   xstring cr(Local("cr.txt","a\r"));
   ASSERT_TRUE(client->Put(cr,"cr.txt").IsOK());
   EXPECT_EQ("a\r",server.FileContent("/cr.txt"));
   xstring lf(Local("lf.txt","\nx\n"));
   ASSERT_TRUE(client->Put(lf,"lf.txt").IsOK());
   EXPECT_EQ("\r\nx\r\n",server.FileContent("/lf.txt"));
}

TEST_F(TransferTest, RemoteFileCommands)
{
   server.AddFile("/old.txt","x");
   EXPECT_TRUE(client->Rename("old.txt","new.txt").IsOK());
   EXPECT_TRUE(server.HasFile("/new.txt"));
   EXPECT_TRUE(client->Delete("new.txt").IsOK());
   EXPECT_FALSE(server.HasFile("/new.txt"));
   EXPECT_TRUE(client->Mkdir("dir").IsOK());
   EXPECT_TRUE(client->Cd("dir").IsOK());
   EXPECT_TRUE(client->Pwd().IsOK());
   EXPECT_NE((const char*)0,strstr(client->Output(),"\"/dir\""));
   Error err=client->Cd("nowhere");
   EXPECT_EQ(Error::PROTOCOL_ERROR,err.Kind());
   EXPECT_EQ(550,err.Code());
}

TEST_F(TransferTest, DownloadMatching)
{
   server.AddFile("/r1.log","1");
   server.AddFile("/r2.log","22");
   server.AddFile("/notes.txt","n");
   char cwd[4096];
   ASSERT_TRUE(getcwd(cwd,sizeof(cwd))!=0);
   ASSERT_EQ(0,chdir(tmp.Path()));
   Error err=client->GetMatching("*.log");
   EXPECT_TRUE(err.IsOK()) << err.Text();
   EXPECT_EQ(0,access("r1.log",F_OK));
   EXPECT_EQ(0,access("r2.log",F_OK));
   EXPECT_NE(0,access("notes.txt",F_OK));
   EXPECT_EQ(Error::FILE_SYSTEM_ERROR,client->GetMatching("*.none").Kind());
   ASSERT_EQ(0,chdir(cwd));
}

TEST(FtpClientLogin, WrongPassword)
{
   FakeFtpServer server;
   ASSERT_TRUE(server.Start());
   FtpClient client(0);
   ASSERT_TRUE(client.Connect("127.0.0.1",server.Port()).ok());
   Result<bool> r=client.Login("tester","bad");
   ASSERT_TRUE(r.ok());
   EXPECT_FALSE(r.Value());
   EXPECT_FALSE(client.GetSession()->IsAuthenticated());
   xstring listing;
   EXPECT_EQ(Error::CONNECTION_ERROR,client.List(0,listing).Kind());
}

TEST(FtpClientLogin, TLSRequiredButRefused)
{
   FakeFtpServer server;
   ASSERT_TRUE(server.Start());
   ResMgr::Set("ftp:ssl-force",0,"yes");
   FtpClient client(0);
   ASSERT_TRUE(client.Connect("127.0.0.1",server.Port()).ok());
   Result<bool> r=client.Login("tester","secret");
   EXPECT_FALSE(r.ok());
   EXPECT_EQ(0,server.CountCommand("USER"));
   ResMgr::Set("ftp:ssl-force",0,0);
}

TEST(FtpClientLogin, NotConnected)
{
   FtpClient client(0);
   TempDir tmp;
   xstring path(tmp.File("f"));
   ASSERT_TRUE(WriteFile(path,"x"));
   EXPECT_EQ(Error::CONNECTION_ERROR,client.Put(path,"f").Kind());
}

class JobLog : public JobListener
{
public:
   std::vector<std::string> results;
   void JobFinished(const TransferJob *job,const Error& err)
   {
      results.push_back(std::string(TransferJob::KindName(job->Kind()))+":"+(err.IsOK()?"ok":err.Text()));
   }
};

TEST(FtpClientJobs, SessionDrivenThroughQueue)
{
   FakeFtpServer server;
   ASSERT_TRUE(server.Start());
   server.AddFile("/readme","hi");
   StubScanner scanner;
   FtpClient client(&scanner);
   JobLog log;
   TransferJobQueue queue(&client,&log);
   ASSERT_EQ(0,queue.Start());

   queue.Enqueue(new TransferJob(TransferJob::CONNECT,"127.0.0.1",0,server.Port()));
   queue.Enqueue(new TransferJob(TransferJob::LOGIN,"tester","secret"));
   queue.Enqueue(new TransferJob(TransferJob::SET_MODE,"binary"));
   queue.Enqueue(new TransferJob(TransferJob::COMMAND,"MKD","incoming"));
   queue.Enqueue(new TransferJob(TransferJob::COMMAND,"NOOP"));
   queue.Enqueue(new TransferJob(TransferJob::RENAME,"readme","README"));
   queue.Enqueue(new TransferJob(TransferJob::LIST));
   queue.Enqueue(new TransferJob(TransferJob::SET_MODE,"sideways"));
   queue.Enqueue(new TransferJob(TransferJob::QUIT));
   queue.Shutdown();

   ASSERT_EQ(9u,log.results.size());
   EXPECT_EQ("open:ok",log.results[0]);
   EXPECT_EQ("user:ok",log.results[1]);
   EXPECT_EQ("mode:ok",log.results[2]);
   EXPECT_EQ("quote:ok",log.results[3]);
   EXPECT_EQ("quote:500 Unknown command",log.results[4]);
   EXPECT_EQ("rename:ok",log.results[5]);
   EXPECT_EQ("ls:ok",log.results[6]);
   EXPECT_NE(std::string::npos,log.results[7].find("unknown mode"));
   EXPECT_EQ("close:ok",log.results[8]);
   EXPECT_TRUE(server.HasDir("/incoming"));
   EXPECT_TRUE(server.HasFile("/README"));
   EXPECT_EQ(1,server.CountCommand("QUIT"));
}
