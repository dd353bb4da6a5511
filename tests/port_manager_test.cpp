#include "rfc2217/port_manager.hpp"
#include "telnet/parser.hpp"
#include <gtest/gtest.h>
#include <string>

using namespace rfc2217;
using telnet::codes::DO;
using telnet::codes::DONT;
using telnet::codes::IAC;
using telnet::codes::SB;
using telnet::codes::SE;
using telnet::codes::WILL;
using telnet::codes::WONT;

namespace {

std::string Bytes(std::initializer_list<int> v) {
  std::string s;
  for (int b : v) {
    s.push_back(static_cast<char>(b));
  }
  return s;
}

// IAC SB 44 <cmd> <payload> IAC SE, payload taken verbatim
std::string ComPort(int cmd, std::initializer_list<int> payload) {
  std::string s = Bytes({IAC, SB, 44, cmd});
  s += Bytes(payload);
  s += Bytes({IAC, SE});
  return s;
}

class PortManagerTest : public ::testing::Test {
protected:
  // feeds wire bytes, returns the replies; data lands in data_
  std::string Feed(const std::string &wire) {
    std::string replies;
    pm_.Filter(wire, data_, replies);
    return replies;
  }

  PortManager pm_{"rfc2217 test", "mpbridge test"};
  std::string data_;
};

} // namespace

TEST_F(PortManagerTest, GreetingOffersEchoSgaBinaryAndComPort) {
  EXPECT_EQ(pm_.Greeting(),
            Bytes({IAC, WILL, 1, IAC, WILL, 3, IAC, DO, 0, IAC, WILL, 44}));
}

TEST_F(PortManagerTest, AcknowledgementsDoNotProduceReplies) {
  EXPECT_EQ(Feed(Bytes({IAC, DO, 1, IAC, DO, 3, IAC, WILL, 0})), "");
  EXPECT_EQ(pm_.StateOf("ECHO"), OptionState::active);
  EXPECT_EQ(pm_.StateOf("we-SGA"), OptionState::active);
  EXPECT_EQ(pm_.StateOf("they-BINARY"), OptionState::active);
  // repeating an acknowledgement of an active option stays silent too
  EXPECT_EQ(Feed(Bytes({IAC, DO, 1})), "");
}

TEST_F(PortManagerTest, ComPortAcceptanceForcesModemNotification) {
  EXPECT_FALSE(pm_.ClientIsRfc2217());
  const std::string replies = Feed(Bytes({IAC, DO, 44}));
  EXPECT_TRUE(pm_.ClientIsRfc2217());
  // CD|DSR|CTS with their change bits
  EXPECT_EQ(replies, ComPort(107, {0xbb}));
  EXPECT_EQ(pm_.StateOf("we-RFC2217"), OptionState::active);
}

TEST_F(PortManagerTest, ClientOfferingComPortIsAnRfc2217Client) {
  // the client enables COM-PORT from its side only
  const std::string replies = Feed(Bytes({IAC, WILL, 44}));
  EXPECT_TRUE(pm_.ClientIsRfc2217());
  EXPECT_EQ(replies, Bytes({IAC, DO, 44}) + ComPort(107, {0xbb}));
  EXPECT_EQ(pm_.StateOf("they-RFC2217"), OptionState::active);
}

TEST_F(PortManagerTest, UnchangedModemLinesAreNotRepeated) {
  Feed(Bytes({IAC, DO, 44}));
  std::string replies;
  pm_.CheckModemLines(false, replies);
  EXPECT_TRUE(replies.empty());
  pm_.CheckModemLines(true, replies);
  EXPECT_EQ(replies, ComPort(107, {0xb0}));
}

TEST_F(PortManagerTest, UnsolicitedEnableIsAcceptedAndAnswered) {
  // client offers SGA from its side; we had not asked
  EXPECT_EQ(Feed(Bytes({IAC, WILL, 3})), Bytes({IAC, DO, 3}));
  EXPECT_EQ(pm_.StateOf("they-SGA"), OptionState::active);
}

TEST_F(PortManagerTest, RefusalOfActiveOptionIsAnswered) {
  Feed(Bytes({IAC, DO, 1}));
  EXPECT_EQ(Feed(Bytes({IAC, DONT, 1})), Bytes({IAC, WONT, 1}));
  EXPECT_EQ(pm_.StateOf("ECHO"), OptionState::inactive);
}

TEST_F(PortManagerTest, RefusalOfRequestedOptionIsSilent) {
  EXPECT_EQ(Feed(Bytes({IAC, DONT, 1})), "");
  EXPECT_EQ(pm_.StateOf("ECHO"), OptionState::inactive);
}

TEST_F(PortManagerTest, UnknownOptionsAreRefused) {
  EXPECT_EQ(Feed(Bytes({IAC, WILL, 24})), Bytes({IAC, DONT, 24}));
  EXPECT_EQ(Feed(Bytes({IAC, DO, 31})), Bytes({IAC, WONT, 31}));
  // WONT/DONT for unknown options need no answer
  EXPECT_EQ(Feed(Bytes({IAC, WONT, 24})), "");
}

TEST_F(PortManagerTest, SignatureExchange) {
  EXPECT_EQ(Feed(ComPort(0, {})), ComPort(100, {'m', 'p', 'b', 'r', 'i', 'd',
                                               'g', 'e', ' ', 't', 'e', 's',
                                               't'}));
  Feed(ComPort(0, {'p', 'y'}));
  EXPECT_EQ(pm_.ClientSignature(), "py");
}

TEST_F(PortManagerTest, BaudRateSetAndEcho) {
  // 9600 = 0x00002580
  EXPECT_EQ(Feed(ComPort(1, {0, 0, 0x25, 0x80})),
            ComPort(101, {0, 0, 0x25, 0x80}));
  EXPECT_EQ(pm_.Settings().baudrate, 9600u);
}

TEST_F(PortManagerTest, BaudRateQueryKeepsCurrentValue) {
  // 115200 = 0x0001c200
  EXPECT_EQ(Feed(ComPort(1, {0, 0, 0, 0})), ComPort(101, {0, 1, 0xc2, 0}));
  EXPECT_EQ(pm_.Settings().baudrate, 115200u);
}

TEST_F(PortManagerTest, ShortBaudRateIsAViolation) {
  EXPECT_EQ(Feed(ComPort(1, {0x25})), ComPort(101, {0, 1, 0xc2, 0}));
  EXPECT_EQ(pm_.Violations(), 1u);
}

TEST_F(PortManagerTest, DataSizeParityStopBits) {
  EXPECT_EQ(Feed(ComPort(2, {7})), ComPort(102, {7}));
  EXPECT_EQ(Feed(ComPort(2, {0})), ComPort(102, {7}));
  EXPECT_EQ(Feed(ComPort(2, {9})), ComPort(102, {7}));
  EXPECT_EQ(pm_.Settings().bytesize, 7);

  EXPECT_EQ(Feed(ComPort(3, {3})), ComPort(103, {3}));
  EXPECT_EQ(pm_.Settings().parity, 'E');
  EXPECT_EQ(Feed(ComPort(3, {6})), ComPort(103, {3}));

  EXPECT_EQ(Feed(ComPort(4, {2})), ComPort(104, {2}));
  EXPECT_EQ(pm_.Settings().stopbits, StopBits::two);
  EXPECT_EQ(Feed(ComPort(4, {0})), ComPort(104, {2}));
  EXPECT_EQ(pm_.Violations(), 2u);
}

TEST_F(PortManagerTest, SetControlLinesAndQueries) {
  EXPECT_EQ(Feed(ComPort(5, {0})), ComPort(105, {1}));  // no flow control
  EXPECT_EQ(Feed(ComPort(5, {3})), ComPort(105, {3}));  // hardware flow
  EXPECT_TRUE(pm_.Settings().rtscts);
  EXPECT_EQ(Feed(ComPort(5, {0})), ComPort(105, {3}));
  EXPECT_EQ(Feed(ComPort(5, {9})), ComPort(105, {9}));  // DTR off
  EXPECT_FALSE(pm_.Settings().dtr);
  EXPECT_EQ(Feed(ComPort(5, {7})), ComPort(105, {9}));
  EXPECT_EQ(Feed(ComPort(5, {10})), ComPort(105, {11})); // RTS still on
  EXPECT_EQ(Feed(ComPort(5, {5})), ComPort(105, {5}));  // break on
  EXPECT_TRUE(pm_.Settings().break_condition);
  EXPECT_EQ(Feed(ComPort(5, {4})), ComPort(105, {5}));
  EXPECT_EQ(Feed(ComPort(5, {13})), "");                // unsupported
}

TEST_F(PortManagerTest, LineStateAndMasks) {
  EXPECT_EQ(Feed(ComPort(6, {})), ComPort(106, {0}));
  EXPECT_EQ(Feed(ComPort(10, {0x1f})), "");
  EXPECT_EQ(pm_.LinestateMask(), 0x1f);
  EXPECT_EQ(Feed(ComPort(11, {0x30})), "");
  EXPECT_EQ(pm_.ModemstateMask(), 0x30);
  // a forced notification honours the mask
  EXPECT_EQ(Feed(ComPort(7, {})), ComPort(107, {0x30}));
}

TEST_F(PortManagerTest, FlowSuspendResumeAndPurge) {
  EXPECT_EQ(Feed(ComPort(8, {})), "");
  EXPECT_TRUE(pm_.RemoteFlowSuspended());
  EXPECT_EQ(Feed(ComPort(9, {})), "");
  EXPECT_FALSE(pm_.RemoteFlowSuspended());
  EXPECT_EQ(Feed(ComPort(12, {3})), ComPort(112, {3}));
  EXPECT_EQ(Feed(ComPort(12, {4})), "");
}

TEST_F(PortManagerTest, UnknownCommandsAndOptionsAreIgnored) {
  EXPECT_EQ(Feed(ComPort(42, {1})), "");
  EXPECT_EQ(Feed(Bytes({IAC, SB, 24, 1, IAC, SE})), "");
  EXPECT_EQ(pm_.Violations(), 2u);
}

TEST_F(PortManagerTest, DataIsSeparatedFromTelnet) {
  const std::string replies =
      Feed(Bytes({'a', IAC, DO, 1, 'b', IAC, IAC, 'c'}) + ComPort(1, {0, 0, 0, 0}));
  EXPECT_EQ(data_, Bytes({'a', 'b', 0xff, 'c'}));
  EXPECT_EQ(replies, ComPort(101, {0, 1, 0xc2, 0}));
}
