#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "../src/commands/CommandHandler.hpp"
#include "../src/db/QueueStore.hpp"
#include "../src/protocol/RESPWriter.hpp"
#include "../src/server/ClientPipeline.hpp"
#include "TestHelpers.hpp"

namespace {

void feedString(ClientPipeline& pipeline, int fd, const std::string& data) {
    pipeline.feed(fd, data.data(), data.size());
}

const std::string kPing = "*1\r\n$4\r\nPING\r\n";

} // namespace

TEST(ClientPipelineTest, CommandSplitAcrossReadsRunsOnceComplete) {
    QueueStore store;
    CommandHandler handler(store, QueueMode::SINGLE);
    ClientPipeline pipeline(handler);
    PipeClient client;

    feedString(pipeline, client.write_fd, "*1\r\n$4\r\nPI");
    EXPECT_EQ("", client.drain());
    EXPECT_EQ(10u, pipeline.pendingBytes(client.write_fd));

    feedString(pipeline, client.write_fd, "NG\r\n");
    EXPECT_EQ("+PONG\r\n", client.drain());
    EXPECT_EQ(0u, pipeline.pendingBytes(client.write_fd));
}

TEST(ClientPipelineTest, PipelinedCommandsReplyInOrder) {
    QueueStore store;
    CommandHandler handler(store, QueueMode::SINGLE);
    ClientPipeline pipeline(handler);
    PipeClient client;

    feedString(pipeline, client.write_fd,
               RESPWriter::array({"ECHO", "hello"}) + kPing);

    EXPECT_EQ("$5\r\nhello\r\n+PONG\r\n", client.drain());
    EXPECT_TRUE(pipeline.takeClosing().empty());
}

TEST(ClientPipelineTest, GarbagePrefixClosesConnection) {
    QueueStore store;
    CommandHandler handler(store, QueueMode::SINGLE);
    ClientPipeline pipeline(handler);
    PipeClient client;

    feedString(pipeline, client.write_fd, "hello\r\n" + kPing);

    EXPECT_EQ("-ERR protocol error\r\n", client.drain());
    EXPECT_EQ(std::vector<int>{client.write_fd}, pipeline.takeClosing());
    EXPECT_EQ(0u, pipeline.pendingBytes(client.write_fd));
}

TEST(ClientPipelineTest, HugeElementCountWaitsForMoreData) {
    QueueStore store;
    CommandHandler handler(store, QueueMode::SINGLE);
    ClientPipeline pipeline(handler);
    PipeClient client;

    EXPECT_NO_THROW(feedString(pipeline, client.write_fd, "*999999999\r\n"));

    EXPECT_EQ("", client.drain());
    EXPECT_TRUE(pipeline.takeClosing().empty());
    EXPECT_EQ(12u, pipeline.pendingBytes(client.write_fd));
}

TEST(ClientPipelineTest, BadBulkTerminatorIsRejectedWithoutWaiting) {
    QueueStore store;
    CommandHandler handler(store, QueueMode::SINGLE);
    ClientPipeline pipeline(handler);
    PipeClient client;

    feedString(pipeline, client.write_fd, "*1\r\n$3\r\nabcXY");

    EXPECT_EQ("-ERR protocol error\r\n", client.drain());
    EXPECT_EQ(std::vector<int>{client.write_fd}, pipeline.takeClosing());
}

TEST(ClientPipelineTest, OversizedPendingCommandClosesConnection) {
    QueueStore store;
    CommandHandler handler(store, QueueMode::SINGLE);
    ClientPipeline pipeline(handler);
    PipeClient client;

    std::string data = "*1\r\n$999999999\r\n";
    data.append(ClientPipeline::kMaxPendingBytes, 'a');
    feedString(pipeline, client.write_fd, data);

    EXPECT_EQ("-ERR protocol error\r\n", client.drain());
    EXPECT_EQ(std::vector<int>{client.write_fd}, pipeline.takeClosing());
    EXPECT_EQ(0u, pipeline.pendingBytes(client.write_fd));
}

TEST(ClientPipelineTest, ParkedClientRepliesStayInCommandOrder) {
    QueueStore store;
    CommandHandler handler(store, QueueMode::SINGLE);
    ClientPipeline pipeline(handler);
    PipeClient holder;
    PipeClient waiter;

    feedString(pipeline, holder.write_fd, RESPWriter::array({"ACQUIRE", "k", "A"}));
    EXPECT_EQ(RESPWriter::array({"k", "A"}), holder.drain());

    // PING is queued behind the parked ACQUIRE and must not answer first.
    feedString(pipeline, waiter.write_fd,
               RESPWriter::array({"ACQUIRE", "k", "B"}) + kPing);
    EXPECT_EQ("", waiter.drain());
    EXPECT_TRUE(pipeline.isBlocked(waiter.write_fd));

    // More input while parked is buffered, not run.
    feedString(pipeline, waiter.write_fd, RESPWriter::array({"ECHO", "later"}));
    EXPECT_EQ("", waiter.drain());

    feedString(pipeline, holder.write_fd, RESPWriter::array({"RELEASE", "k"}));
    EXPECT_EQ(":1\r\n", holder.drain());

    EXPECT_EQ(RESPWriter::array({"k", "B"}) + "+PONG\r\n" + "$5\r\nlater\r\n",
              waiter.drain());
    EXPECT_FALSE(pipeline.isBlocked(waiter.write_fd));
    EXPECT_EQ(0u, pipeline.pendingBytes(waiter.write_fd));
}

TEST(ClientPipelineTest, DroppedClientForgetsBufferedInput) {
    QueueStore store;
    CommandHandler handler(store, QueueMode::SINGLE);
    ClientPipeline pipeline(handler);
    PipeClient holder;
    PipeClient waiter;

    feedString(pipeline, holder.write_fd, RESPWriter::array({"ACQUIRE", "k", "A"}));
    feedString(pipeline, waiter.write_fd,
               RESPWriter::array({"ACQUIRE", "k", "B"}) + kPing);
    ASSERT_TRUE(pipeline.isBlocked(waiter.write_fd));

    pipeline.drop(waiter.write_fd);

    EXPECT_FALSE(pipeline.isBlocked(waiter.write_fd));
    EXPECT_EQ(0u, pipeline.pendingBytes(waiter.write_fd));
    EXPECT_EQ(0u, handler.waitingCount());
}
