#include <gtest/gtest.h>

#include <cstdio>
#include <string>
#include <vector>

#include "../src/commands/CommandHandler.hpp"
#include "../src/db/QueueStore.hpp"
#include "../src/db/Snapshot.hpp"
#include "TestHelpers.hpp"

TEST(CommandHandlerTest, PingRespondsWithPong) {
    QueueStore store;
    CommandHandler handler(store, QueueMode::SINGLE);

    auto args = makeArgs({"PING"});
    auto reply = handler.execute(args.views, /*client_fd=*/1);

    EXPECT_EQ("+PONG\r\n", reply.reply);
}

TEST(CommandHandlerTest, UnknownAndMalformedCommands) {
    QueueStore store;
    CommandHandler handler(store, QueueMode::SINGLE);

    EXPECT_EQ("-ERR unknown command\r\n", handler.execute(makeArgs({"GET", "x"}).views, 1).reply);
    EXPECT_EQ("-ERR wrong number of arguments for 'ACQUIRE'\r\n",
              handler.execute(makeArgs({"ACQUIRE", "k"}).views, 1).reply);
    EXPECT_EQ("-ERR wrong number of arguments for 'RELEASE'\r\n",
              handler.execute(makeArgs({"RELEASE"}).views, 1).reply);
}

TEST(CommandHandlerTest, AcquireOnFreeLockRepliesImmediately) {
    QueueStore store;
    CommandHandler handler(store, QueueMode::SINGLE);

    auto reply = handler.execute(makeArgs({"acquire", "k1", "job-A"}).views, 1);

    EXPECT_FALSE(reply.blocked);
    auto items = parseBulkArray(reply.reply);
    ASSERT_EQ(2u, items.size());
    EXPECT_EQ("k1", items[0]);
    EXPECT_EQ("job-A", items[1]);
}

TEST(CommandHandlerTest, ParkedClientIsWokenByRelease) {
    QueueStore store;
    CommandHandler handler(store, QueueMode::SINGLE);
    PipeClient holder;
    PipeClient waiter;

    handler.execute(makeArgs({"ACQUIRE", "k1", "A"}).views, holder.write_fd);

    auto parked = handler.execute(makeArgs({"ACQUIRE", "k2", "B"}).views, waiter.write_fd);
    EXPECT_TRUE(parked.blocked);
    EXPECT_TRUE(parked.reply.empty());
    EXPECT_EQ(1u, handler.waitingCount());
    EXPECT_EQ("", waiter.drain());

    // Wrong key in single mode: nothing moves.
    auto stale = handler.execute(makeArgs({"RELEASE", "k2"}).views, holder.write_fd);
    EXPECT_EQ(":0\r\n", stale.reply);
    EXPECT_EQ("", waiter.drain());

    auto released = handler.execute(makeArgs({"RELEASE", "k1"}).views, holder.write_fd);
    EXPECT_EQ(":1\r\n", released.reply);
    EXPECT_EQ(0u, handler.waitingCount());

    auto items = parseBulkArray(waiter.drain());
    ASSERT_EQ(2u, items.size());
    EXPECT_EQ("k2", items[0]);
    EXPECT_EQ("B", items[1]);
}

TEST(CommandHandlerTest, MultiModeLocksKeysIndependently) {
    QueueStore store;
    CommandHandler handler(store, QueueMode::MULTI);
    PipeClient c1, c2, c3;

    EXPECT_FALSE(handler.execute(makeArgs({"ACQUIRE", "a", "A1"}).views, c1.write_fd).blocked);
    EXPECT_FALSE(handler.execute(makeArgs({"ACQUIRE", "b", "B1"}).views, c2.write_fd).blocked);
    EXPECT_TRUE(handler.execute(makeArgs({"ACQUIRE", "a", "A2"}).views, c3.write_fd).blocked);

    EXPECT_EQ(":2\r\n", handler.execute(makeArgs({"QLEN", "a"}).views, 1).reply);
    EXPECT_EQ(":1\r\n", handler.execute(makeArgs({"QLEN", "b"}).views, 1).reply);
    EXPECT_EQ(":0\r\n", handler.execute(makeArgs({"QLEN", "c"}).views, 1).reply);

    // Releasing b leaves a's waiter parked.
    EXPECT_EQ(":1\r\n", handler.execute(makeArgs({"RELEASE", "b"}).views, 1).reply);
    EXPECT_EQ("", c3.drain());
    EXPECT_EQ(nullptr, store.getQueue("b"));

    EXPECT_EQ(":1\r\n", handler.execute(makeArgs({"RELEASE", "a"}).views, 1).reply);
    auto items = parseBulkArray(c3.drain());
    ASSERT_EQ(2u, items.size());
    EXPECT_EQ("A2", items[1]);
}

TEST(CommandHandlerTest, ReleaseBatchCountsOnlyEffectiveSignals) {
    QueueStore store;
    CommandHandler handler(store, QueueMode::MULTI);

    handler.execute(makeArgs({"ACQUIRE", "a", "A1"}).views, 1);
    handler.execute(makeArgs({"ACQUIRE", "b", "B1"}).views, 1);

    auto reply = handler.execute(makeArgs({"RELEASE", "a", "a", "zzz", "b"}).views, 1);
    EXPECT_EQ(":2\r\n", reply.reply);
    EXPECT_TRUE(store.queues.empty());
}

TEST(CommandHandlerTest, HolderAndKeysInspection) {
    QueueStore store;
    CommandHandler handler(store, QueueMode::SINGLE);
    PipeClient waiter;

    EXPECT_EQ("$-1\r\n", handler.execute(makeArgs({"HOLDER", "k1"}).views, 1).reply);

    handler.execute(makeArgs({"ACQUIRE", "k1", "A"}).views, 1);
    handler.execute(makeArgs({"ACQUIRE", "k2", "B"}).views, waiter.write_fd);

    auto holder = parseBulkArray(handler.execute(makeArgs({"HOLDER", "k2"}).views, 1).reply);
    ASSERT_EQ(2u, holder.size());
    EXPECT_EQ("k1", holder[0]);
    EXPECT_EQ("A", holder[1]);

    auto keys = parseBulkArray(handler.execute(makeArgs({"QKEYS"}).views, 1).reply);
    EXPECT_EQ((std::vector<std::string>{"k1", "k2"}), keys);
}

TEST(CommandHandlerTest, DisconnectedWaiterKeepsItsPlace) {
    QueueStore store;
    CommandHandler handler(store, QueueMode::SINGLE);
    PipeClient waiter;

    handler.execute(makeArgs({"ACQUIRE", "k", "A"}).views, 1);
    handler.execute(makeArgs({"ACQUIRE", "k", "B"}).views, waiter.write_fd);

    handler.dropClient(waiter.write_fd);
    EXPECT_EQ(0u, handler.waitingCount());

    // B is still admitted (and now holds the lock) even though nobody listens.
    EXPECT_EQ(":1\r\n", handler.execute(makeArgs({"RELEASE", "k"}).views, 1).reply);
    EXPECT_EQ("", waiter.drain());

    auto holder = parseBulkArray(handler.execute(makeArgs({"HOLDER", "k"}).views, 1).reply);
    ASSERT_EQ(2u, holder.size());
    EXPECT_EQ("B", holder[1]);
}

TEST(CommandHandlerTest, SaveWithoutStateFileIsAnError) {
    QueueStore store;
    CommandHandler handler(store, QueueMode::SINGLE);

    EXPECT_EQ("-ERR no state file configured\r\n",
              handler.execute(makeArgs({"SAVE"}).views, 1).reply);
}

TEST(CommandHandlerTest, MutationsAreWrittenThrough) {
    std::string path = ::testing::TempDir() + "turnstile_handler_write_through.resp";
    std::remove(path.c_str());

    QueueStore store;
    CommandHandler handler(store, QueueMode::MULTI, path);

    handler.execute(makeArgs({"ACQUIRE", "a", "A1"}).views, 1);
    handler.execute(makeArgs({"ACQUIRE", "a", "A2"}).views, 2);

    QueueStore loaded;
    std::string err;
    ASSERT_TRUE(Snapshot::load(path, loaded, err)) << err;
    ASSERT_NE(nullptr, loaded.getQueue("a"));
    EXPECT_EQ(2, loaded.getQueue("a")->Len());
    EXPECT_TRUE(loaded.getQueue("a")->IsLocked());

    EXPECT_EQ("+OK\r\n", handler.execute(makeArgs({"SAVE"}).views, 1).reply);

    std::remove(path.c_str());
}

TEST(CommandHandlerTest, ReleaseReportsWokenClientsOnce) {
    QueueStore store;
    CommandHandler handler(store, QueueMode::SINGLE);
    PipeClient holder;
    PipeClient waiter;

    handler.execute(makeArgs({"ACQUIRE", "k", "A"}).views, holder.write_fd);
    handler.execute(makeArgs({"ACQUIRE", "k", "B"}).views, waiter.write_fd);
    EXPECT_TRUE(handler.takeWokenClients().empty());

    handler.execute(makeArgs({"RELEASE", "k"}).views, holder.write_fd);

    EXPECT_EQ(std::vector<int>{waiter.write_fd}, handler.takeWokenClients());
    EXPECT_TRUE(handler.takeWokenClients().empty());
}
