#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "FtpClient.hpp"
#include "Protocol.hpp"
#include "TestSupport.hpp"

using namespace test_support;


class FtpClientTest : public ::testing::Test {
protected:
    FakeConnectionFactory factory;
    MemorySink sink;
    RecordingReporter reporter;
    Logger logger = makeTestLogger();

    SessionParams params(Command command, const std::string& filename = "") {
        SessionParams p;
        p.server_host = "flip2";
        p.server_port = 30020;
        p.command = command;
        if (command == Command::GET) p.filename = filename;
        p.data_port = 30021;
        return p;
    }

    SessionOutcome run(const SessionParams& p) {
        FtpClient client(p, factory, sink, reporter, logger);
        return client.runSession();
    }

    std::vector<Protocol::Packet> controlPacketsFromClient() {
        return readAllPackets(factory.server_control);
    }
};


TEST_F(FtpClientTest, ListingSessionEndToEnd) {
    factory.serverControl(Protocol::Tag::OKAY);
    factory.serverData(Protocol::Tag::FNAME, "ftserver");
    factory.serverData(Protocol::Tag::FNAME, "notes.txt");
    factory.serverData(Protocol::Tag::DONE);
    factory.serverControl(Protocol::Tag::CLOSE);

    SessionOutcome outcome = run(params(Command::LIST));

    EXPECT_TRUE(outcome.result.ok());
    EXPECT_EQ(outcome.exitCode(), 0);
    EXPECT_TRUE(outcome.trailing_errors.empty());
    EXPECT_EQ(reporter.entries, (std::vector<std::string>{"ftserver", "notes.txt"}));

    EXPECT_EQ(factory.connected_host, "flip2");
    EXPECT_EQ(factory.connected_port, 30020);
    EXPECT_EQ(factory.accept_calls, 1);
    EXPECT_EQ(factory.accepted_port, 30021);
    EXPECT_EQ(factory.accepted_backlog, FtpClient::DATA_BACKLOG);

    // DPORT, LIST, ACK and then the control connection was closed
    std::vector<Protocol::Packet> sent = controlPacketsFromClient();
    ASSERT_EQ(sent.size(), 3u);
    EXPECT_EQ(sent[0].tag, "DPORT");
    EXPECT_EQ(sent[1].tag, "LIST");
    EXPECT_EQ(sent[2].tag, "ACK");
}

TEST_F(FtpClientTest, FileSessionEndToEnd) {
    factory.serverControl(Protocol::Tag::OKAY);
    factory.serverData(Protocol::Tag::FILE, "out.txt");
    factory.serverData(Protocol::Tag::FILE, "chunk1");
    factory.serverData(Protocol::Tag::FILE, "chunk2");
    factory.serverData(Protocol::Tag::DONE);
    factory.serverControl(Protocol::Tag::CLOSE);

    SessionOutcome outcome = run(params(Command::GET, "out.txt"));

    EXPECT_TRUE(outcome.result.ok());
    EXPECT_EQ(sink.files["out.txt"], "chunk1chunk2");

    std::vector<Protocol::Packet> sent = controlPacketsFromClient();
    ASSERT_EQ(sent.size(), 3u);
    EXPECT_EQ(sent[1].tag, "GET");
    EXPECT_EQ(sent[1].text(), "out.txt");
    EXPECT_EQ(sent[2].tag, "ACK");
}

TEST_F(FtpClientTest, NegotiationErrorNeverOpensDataConnection) {
    factory.serverControl(Protocol::Tag::ERROR, "reason");

    SessionOutcome outcome = run(params(Command::GET, "missing.txt"));

    EXPECT_EQ(outcome.result.kind, ErrorKind::SERVER_REPORTED);
    EXPECT_EQ(outcome.result.message, "reason");
    EXPECT_EQ(outcome.exitCode(), 1);
    EXPECT_EQ(factory.accept_calls, 0);
    EXPECT_EQ(reporter.errors, (std::vector<std::string>{"reason"}));

    // No ACK, and the control connection is closed
    std::vector<Protocol::Packet> sent = controlPacketsFromClient();
    ASSERT_EQ(sent.size(), 2u);
    EXPECT_EQ(sent[1].tag, "GET");
}

TEST_F(FtpClientTest, TrailingErrorsAreReportedInOrderUntilClose) {
    factory.serverControl(Protocol::Tag::OKAY);
    factory.serverData(Protocol::Tag::FNAME, "a");
    factory.serverData(Protocol::Tag::DONE);
    factory.serverControl(Protocol::Tag::ERROR, "x");
    factory.serverControl(Protocol::Tag::ERROR, "y");
    factory.serverControl(Protocol::Tag::CLOSE);
    factory.serverControl(Protocol::Tag::ERROR, "after close");

    SessionOutcome outcome = run(params(Command::LIST));

    EXPECT_TRUE(outcome.result.ok());
    EXPECT_EQ(outcome.trailing_errors, (std::vector<std::string>{"x", "y"}));
    EXPECT_EQ(reporter.server_errors, (std::vector<std::string>{"x", "y"}));
}

TEST_F(FtpClientTest, MissingFileIsExplainedByTrailingError) {
    // What the server does when GET names a file it does not have
    factory.serverControl(Protocol::Tag::OKAY);
    factory.serverData(Protocol::Tag::DONE);
    factory.serverControl(Protocol::Tag::ERROR, "File not found");
    factory.serverControl(Protocol::Tag::CLOSE);

    SessionOutcome outcome = run(params(Command::GET, "nothere.txt"));

    EXPECT_EQ(outcome.result.kind, ErrorKind::PROTOCOL);
    EXPECT_EQ(outcome.trailing_errors, (std::vector<std::string>{"File not found"}));
    EXPECT_TRUE(sink.files.empty());
}

TEST_F(FtpClientTest, ExistingLocalFileStillAcknowledgesAndDrains) {
    sink.files["out.txt"] = "mine";
    factory.serverControl(Protocol::Tag::OKAY);
    factory.serverData(Protocol::Tag::FILE, "out.txt");
    factory.serverData(Protocol::Tag::FILE, "theirs");
    factory.serverData(Protocol::Tag::DONE);
    factory.serverControl(Protocol::Tag::CLOSE);

    SessionOutcome outcome = run(params(Command::GET, "out.txt"));

    EXPECT_EQ(outcome.result.kind, ErrorKind::LOCAL_PRECONDITION);
    EXPECT_EQ(sink.files["out.txt"], "mine");

    std::vector<Protocol::Packet> sent = controlPacketsFromClient();
    ASSERT_EQ(sent.size(), 3u);
    EXPECT_EQ(sent[2].tag, "ACK");
}

TEST_F(FtpClientTest, ConnectFailureIsTransportError) {
    factory.fail_connect = true;

    SessionOutcome outcome = run(params(Command::LIST));

    EXPECT_EQ(outcome.result.kind, ErrorKind::TRANSPORT);
    EXPECT_EQ(outcome.exitCode(), 1);
    EXPECT_EQ(factory.accept_calls, 0);
    ASSERT_EQ(reporter.errors.size(), 1u);
}

TEST_F(FtpClientTest, DataHangupClosesControlConnection) {
    factory.serverControl(Protocol::Tag::OKAY);
    factory.serverData(Protocol::Tag::FILE, "out.txt");
    factory.serverData(Protocol::Tag::FILE, "partial");
    factory.server_data.close();

    SessionOutcome outcome = run(params(Command::GET, "out.txt"));

    EXPECT_EQ(outcome.result.kind, ErrorKind::TRANSPORT);

    // DPORT and GET only: the transfer never completed, so no ACK
    std::vector<Protocol::Packet> sent = controlPacketsFromClient();
    ASSERT_EQ(sent.size(), 2u);
    EXPECT_EQ(reporter.statuses.back(), "FTP control connection closed");
}

TEST_F(FtpClientTest, ControlHangupDuringDrainIsTransportError) {
    factory.serverControl(Protocol::Tag::OKAY);
    factory.serverData(Protocol::Tag::FNAME, "a");
    factory.serverData(Protocol::Tag::DONE);
    factory.serverControl(Protocol::Tag::ERROR, "disk full");
    // Server stops talking without CLOSE but still accepts our packets
    ::shutdown(factory.server_control.fd(), SHUT_WR);

    SessionOutcome outcome = run(params(Command::LIST));

    EXPECT_EQ(outcome.result.kind, ErrorKind::TRANSPORT);
    EXPECT_EQ(outcome.trailing_errors, (std::vector<std::string>{"disk full"}));
}

TEST_F(FtpClientTest, DrainSkipsPacketsOtherThanErrorAndClose) {
    factory.serverControl(Protocol::Tag::OKAY);
    factory.serverData(Protocol::Tag::FNAME, "a");
    factory.serverData(Protocol::Tag::DONE);
    factory.serverControl(Protocol::Tag::ERROR, "x");
    factory.serverControl(Protocol::Tag::OKAY);
    factory.serverControl(Protocol::Tag::FNAME, "stray");
    factory.serverControl(Protocol::Tag::ERROR, "y");
    factory.serverControl(Protocol::Tag::CLOSE);

    SessionOutcome outcome = run(params(Command::LIST));

    EXPECT_TRUE(outcome.result.ok());
    EXPECT_EQ(outcome.trailing_errors, (std::vector<std::string>{"x", "y"}));
    EXPECT_EQ(reporter.server_errors, (std::vector<std::string>{"x", "y"}));
    EXPECT_EQ(reporter.entries, (std::vector<std::string>{"a"}));
}

TEST_F(FtpClientTest, MalformedNegotiationResponseIsProtocolError) {
    // Length prefix of 5 cannot even cover the 10-byte header
    char response[Protocol::HEADER_SIZE] = {};
    Protocol::write_uint16(response, 5);
    factory.server_control.sendAll(response, sizeof(response));

    SessionOutcome outcome = run(params(Command::LIST));

    EXPECT_EQ(outcome.result.kind, ErrorKind::PROTOCOL);
    EXPECT_EQ(outcome.exitCode(), 1);
    EXPECT_EQ(factory.accept_calls, 0);
    ASSERT_EQ(reporter.errors.size(), 1u);
    EXPECT_EQ(reporter.statuses.back(), "FTP control connection closed");

    // DPORT and LIST, then the control connection was closed
    std::vector<Protocol::Packet> sent = controlPacketsFromClient();
    ASSERT_EQ(sent.size(), 2u);
    EXPECT_EQ(sent[1].tag, "LIST");
}
