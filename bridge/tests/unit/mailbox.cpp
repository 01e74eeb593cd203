#include <llmbridge/bridge/mailbox.hpp>
#include <llmbridge/common/uuid.hpp>

#include <chrono>
#include <thread>

#include <gtest/gtest.h>

using namespace llmbridge;
using namespace llmbridge::bridge;

class MailboxTest : public ::testing::Test {
protected:
  Message chunk(const uuids::uuid& token, const std::string& json)
  {
    return Message{token, Chunk{engine::Value{"Reply", json}}};
  }

  Message done(const uuids::uuid& token)
  {
    return Message{token, Done{engine::Value{"Reply", "{}"}}};
  }

  common::UUID generator;
  Mailbox mailbox;
};

TEST_F(MailboxTest, SelectiveReceive)
{
  auto first = generator.generate();
  auto second = generator.generate();

  EXPECT_TRUE(mailbox.send(chunk(second, "1")));
  EXPECT_TRUE(mailbox.send(chunk(first, "2")));
  EXPECT_TRUE(mailbox.send(chunk(first, "3")));
  EXPECT_EQ(mailbox.size(), 3);

  auto msg = mailbox.try_receive(first);
  ASSERT_TRUE(msg.has_value());
  EXPECT_EQ(msg->token, first);
  EXPECT_EQ(std::get<Chunk>(msg->body).value.json, "2");

  msg = mailbox.try_receive(first);
  ASSERT_TRUE(msg.has_value());
  EXPECT_EQ(std::get<Chunk>(msg->body).value.json, "3");

  EXPECT_FALSE(mailbox.try_receive(first).has_value());
  EXPECT_EQ(mailbox.size(), 1);

  msg = mailbox.try_receive(second);
  ASSERT_TRUE(msg.has_value());
  EXPECT_EQ(std::get<Chunk>(msg->body).value.json, "1");
}

TEST_F(MailboxTest, ReceiveTimeout)
{
  auto token = generator.generate();

  auto begin = std::chrono::steady_clock::now();
  EXPECT_FALSE(mailbox.receive(token, std::chrono::milliseconds{50}).has_value());
  auto elapsed = std::chrono::steady_clock::now() - begin;
  EXPECT_GE(elapsed, std::chrono::milliseconds{50});
}

TEST_F(MailboxTest, ReceiveFromAnotherThread)
{
  auto token = generator.generate();
  auto other = generator.generate();

  std::thread sender{[&]() {
    std::this_thread::sleep_for(std::chrono::milliseconds{20});
    mailbox.send(chunk(other, "ignored"));
    std::this_thread::sleep_for(std::chrono::milliseconds{20});
    mailbox.send(done(token));
  }};

  auto msg = mailbox.receive(token, std::chrono::milliseconds{5000});
  sender.join();

  ASSERT_TRUE(msg.has_value());
  EXPECT_TRUE(std::holds_alternative<Done>(msg->body));
  EXPECT_EQ(mailbox.size(), 1);
}

TEST_F(MailboxTest, RejectedToken)
{
  auto token = generator.generate();

  mailbox.reject(token);
  EXPECT_TRUE(mailbox.rejected(token));

  EXPECT_FALSE(mailbox.send(chunk(token, "late")));
  EXPECT_EQ(mailbox.size(), 0);

  // Final message clears the rejection.
  EXPECT_FALSE(mailbox.send(done(token)));
  EXPECT_FALSE(mailbox.rejected(token));
  EXPECT_EQ(mailbox.size(), 0);
}

TEST_F(MailboxTest, Drain)
{
  auto token = generator.generate();
  auto other = generator.generate();

  mailbox.send(chunk(token, "1"));
  mailbox.send(chunk(other, "2"));
  mailbox.send(chunk(token, "3"));
  mailbox.send(chunk(token, "4"));

  EXPECT_EQ(mailbox.drain(token, 2), 2);
  EXPECT_EQ(mailbox.size(), 2);

  EXPECT_EQ(mailbox.drain(token, 10), 1);
  EXPECT_EQ(mailbox.size(), 1);
  EXPECT_FALSE(mailbox.try_receive(token).has_value());
  EXPECT_TRUE(mailbox.try_receive(other).has_value());

  mailbox.reject(token);
  mailbox.send(chunk(token, "5"));
  EXPECT_EQ(mailbox.drain(token, 10), 0);
  EXPECT_TRUE(mailbox.rejected(token));
}

TEST_F(MailboxTest, DrainFinalMessage)
{
  auto token = generator.generate();

  mailbox.send(chunk(token, "1"));
  mailbox.send(done(token));
  mailbox.reject(token);

  EXPECT_EQ(mailbox.drain(token, 10), 2);
  EXPECT_FALSE(mailbox.rejected(token));
  EXPECT_EQ(mailbox.size(), 0);
}

TEST(Mailbox, CurrentPerThread)
{
  auto mailbox = Mailbox::current();
  EXPECT_EQ(mailbox, Mailbox::current());

  std::shared_ptr<Mailbox> other;
  std::thread thread{[&]() { other = Mailbox::current(); }};
  thread.join();

  ASSERT_NE(other, nullptr);
  EXPECT_NE(mailbox, other);
}
