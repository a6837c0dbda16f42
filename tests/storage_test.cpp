// C++ Standard Library
#include <memory>
#include <string>

// GoogleTest
#include <gtest/gtest.h>

// Core
#include <pdb/core/errors.hpp>
#include <pdb/core/storage.hpp>
#include <pdb/core/toml_storage.hpp>

namespace packdb
{
    namespace
    {

        ServerRecord server_named(std::string host)
        {
            ServerRecord rec;
            rec.host = std::move(host);
            rec.port = 6667;
            rec.identity.nick = "nick";
            rec.identity.user = "nick";
            rec.identity.real = "nick";
            return rec;
        }

        TEST(Table, IdsAreSharedAcrossTablesAndIncrease)
        {
            MemoryStorage st;
            const auto s = st.servers().insert(server_named("a"));
            const auto c = st.channels().insert(ChannelRecord{ .server = s, .name = "#c", .password = {} });
            const auto b = st.bots().insert(BotRecord{ .channel = c, .name = "b", .list_enabled = false });

            EXPECT_EQ(s, 1U);
            EXPECT_EQ(c, 2U);
            EXPECT_EQ(b, 3U);
            ASSERT_NE(st.bots().find(b), nullptr);
            EXPECT_EQ(st.bots().find(b)->id, b);
        }

        TEST(Table, DuplicateKeyIsRejected)
        {
            MemoryStorage st;
            (void)st.servers().insert(server_named("a"));
            EXPECT_THROW((void)st.servers().insert(server_named("a")), StorageError);
            EXPECT_EQ(st.servers().size(), 1U);
        }

        TEST(Table, FindByKey)
        {
            MemoryStorage st;
            const auto id = st.servers().insert(server_named("irc.example.org"));
            const auto* rec = st.servers().find_key("irc.example.org");
            ASSERT_NE(rec, nullptr);
            EXPECT_EQ(rec->id, id);
            EXPECT_EQ(st.servers().find_key("other"), nullptr);
        }

        TEST(Table, UpdateRekeysTheIndex)
        {
            MemoryStorage st;
            const auto c1 = st.channels().insert(ChannelRecord{ .server = 1, .name = "#a", .password = {} });
            const auto c2 = st.channels().insert(ChannelRecord{ .server = 1, .name = "#b", .password = {} });
            const auto bot = st.bots().insert(BotRecord{ .channel = c1, .name = "x", .list_enabled = false });

            BotRecord moved = *st.bots().find(bot);
            moved.channel = c2;
            EXPECT_TRUE(st.bots().update(moved));
            EXPECT_EQ(st.bots().find_key(keys::bot(c1, "x")), nullptr);
            ASSERT_NE(st.bots().find_key(keys::bot(c2, "x")), nullptr);

            BotRecord missing = moved;
            missing.id = 999;
            EXPECT_FALSE(st.bots().update(missing));
        }

        TEST(Table, UpdateOntoATakenKeyThrows)
        {
            MemoryStorage st;
            (void)st.servers().insert(server_named("a"));
            const auto b = st.servers().insert(server_named("b"));

            ServerRecord clash = *st.servers().find(b);
            clash.host = "a";
            EXPECT_THROW(st.servers().update(clash), StorageError);
            EXPECT_EQ(st.servers().find(b)->host, "b");
        }

        TEST(Table, EraseDropsRowAndKey)
        {
            MemoryStorage st;
            const auto id = st.servers().insert(server_named("a"));
            EXPECT_TRUE(st.servers().erase(id));
            EXPECT_FALSE(st.servers().erase(id));
            EXPECT_EQ(st.servers().find_key("a"), nullptr);
            EXPECT_NO_THROW((void)st.servers().insert(server_named("a")));
        }

        TEST(Table, SelectKeepsIdOrder)
        {
            MemoryStorage st;
            for (int n : { 3, 1, 2 })
            {
                (void)st.packs().insert(
                    PackRecord{ .bot = 7, .number = n, .file = "f" + std::to_string(n), .size = "1M" });
            }
            const auto rows = st.packs().select([](const PackRecord& p) { return p.number != 1; });
            ASSERT_EQ(rows.size(), 2U);
            EXPECT_EQ(rows[0].number, 3);
            EXPECT_EQ(rows[1].number, 2);
        }

        TEST(Table, RestoreKeepsIdAndMovesCounter)
        {
            MemoryStorage st;
            auto rec = server_named("a");
            rec.id = 41;
            st.servers().restore(rec);
            EXPECT_EQ(st.servers().insert(server_named("b")), 42U);
            EXPECT_THROW(st.servers().restore(rec), StorageError);
        }

        TEST(MemoryBackend, CommitAndCloseLifecycle)
        {
            MemoryStorage st;
            EXPECT_TRUE(st.is_open());
            st.commit();
            st.commit();
            EXPECT_EQ(st.commit_count(), 2U);

            st.close();
            EXPECT_FALSE(st.is_open());
            EXPECT_THROW(st.commit(), ClosedError);
            EXPECT_THROW(st.close(), ClosedError);
        }

        TEST(OpenStorage, PicksTheConfiguredBackend)
        {
            const auto mem = open_storage(StorageConfig{});
            ASSERT_NE(mem, nullptr);
            EXPECT_EQ(mem->describe(), "memory");

            EXPECT_THROW((void)open_storage(StorageConfig{ .backend = StorageBackend::toml, .path = {} }), StorageError);
            EXPECT_EQ(to_string(StorageBackend::toml), "toml");
        }

    } // namespace
} // namespace packdb
