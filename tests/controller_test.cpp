// C++ Standard Library
#include <memory>
#include <string>

// GoogleTest
#include <gtest/gtest.h>

// Core
#include <pdb/core/controller.hpp>
#include <pdb/core/errors.hpp>

// Tests
#include "test_support.hpp"

namespace packdb
{
    namespace
    {

        constexpr std::string_view kHost = "irc.example.org";

        class ControllerTest : public ::testing::Test
        {
        protected:
            ControllerTest()
            {
                auto storage = std::make_unique<test::FlakyStorage>();
                storage_ = storage.get();
                controller_ = std::make_unique<Controller>(std::move(storage));
            }

            void add_plain_server(std::string_view host)
            {
                controller_->add_server(host, 6667, "me", {}, {}, Authentication::none, {}, {});
            }

            // irc.example.org
            //   #files: Offer (1 linux.iso, 2 linux.sig), Other (1 movie.mkv)
            //   #music: Tunes (7 album.flac)
            // other.example.net
            //   #files: Offer (1 linux-other.iso)
            void populate()
            {
                add_plain_server(kHost);
                controller_->add_channel(kHost, "#files", {});
                controller_->add_channel(kHost, "#music", {});
                controller_->add_bot(kHost, "#files", "Offer", true);
                controller_->add_bot(kHost, "#files", "Other", false);
                controller_->add_bot(kHost, "#music", "Tunes", false);
                controller_->update_or_add_pack(kHost, "#files", "Offer", 1, "linux.iso", "4G", false);
                controller_->update_or_add_pack(kHost, "#files", "Offer", 2, "linux.sig", "1K", false);
                controller_->update_or_add_pack(kHost, "#files", "Other", 1, "movie.mkv", "2G", false);
                controller_->update_or_add_pack(kHost, "#music", "Tunes", 7, "album.flac", "300M", false);

                add_plain_server("other.example.net");
                controller_->add_channel("other.example.net", "#files", {});
                controller_->update_or_add_pack("other.example.net", "#files", "Offer", 1, "linux-other.iso", "4G", true);
            }

            test::FlakyStorage* storage_ = nullptr;
            std::unique_ptr<Controller> controller_;
        };

        // ------------------ create / read ------------------

        TEST_F(ControllerTest, ServerDefaultsUserAndRealNameToNick)
        {
            controller_->add_server("Host", 80, "nick", {}, {}, Authentication::none, {}, {});

            const auto server = controller_->get_server("host");
            ASSERT_TRUE(server.has_value());
            EXPECT_EQ(server->host(), "host");
            EXPECT_EQ(server->port(), 80);
            EXPECT_EQ(server->nick_name(), "nick");
            EXPECT_EQ(server->user_name(), "nick");
            EXPECT_EQ(server->real_name(), "nick");
            EXPECT_EQ(server->authentication(), Authentication::none);
            EXPECT_FALSE(server->user_password().has_value());
            EXPECT_FALSE(server->password().has_value());
        }

        TEST_F(ControllerTest, ServerAttributesRoundTrip)
        {
            controller_->add_server(
                "  IRC.Example.ORG ", 6697, "me", "ident", "Real Name", Authentication::nickserv, "secret", "serverpass");

            const auto server = controller_->get_server("irc.EXAMPLE.org");
            ASSERT_TRUE(server.has_value());
            EXPECT_EQ(server->host(), "irc.example.org");
            EXPECT_EQ(server->port(), 6697);
            EXPECT_EQ(server->user_name(), "ident");
            EXPECT_EQ(server->real_name(), "Real Name");
            EXPECT_EQ(server->authentication(), Authentication::nickserv);
            EXPECT_EQ(server->user_password(), "secret");
            EXPECT_EQ(server->password(), "serverpass");
        }

        TEST_F(ControllerTest, DuplicateServerIsRejectedAndOriginalKept)
        {
            add_plain_server(kHost);
            EXPECT_THROW(controller_->add_server("IRC.example.org", 1234, "x", {}, {}, Authentication::none, {}, {}),
                         PreconditionError);

            const auto server = controller_->get_server(kHost);
            ASSERT_TRUE(server.has_value());
            EXPECT_EQ(server->port(), 6667);
            EXPECT_EQ(controller_->server_list().size(), 1U);
        }

        TEST_F(ControllerTest, MalformedInputStoresNothing)
        {
            EXPECT_THROW(add_plain_server("   "), ValidationError);
            EXPECT_THROW(controller_->add_server(kHost, 1, "bad nick", {}, {}, Authentication::none, {}, {}), ValidationError);
            EXPECT_THROW(controller_->add_server(kHost, 1, "me", {}, {}, Authentication::nickserv, {}, {}), ValidationError);
            EXPECT_TRUE(controller_->server_list().empty());
            EXPECT_EQ(storage_->commit_count(), 0U);
        }

        TEST_F(ControllerTest, ChannelNeedsItsServer)
        {
            EXPECT_THROW(controller_->add_channel(kHost, "#files", {}), PreconditionError);

            add_plain_server(kHost);
            controller_->add_channel(kHost, "#files", "key");
            EXPECT_THROW(controller_->add_channel(kHost, "#files", {}), PreconditionError);

            const auto channel = controller_->get_channel(kHost, "#files");
            ASSERT_TRUE(channel.has_value());
            EXPECT_EQ(channel->host(), kHost);
            EXPECT_EQ(channel->password(), "key");
        }

        TEST_F(ControllerTest, ChannelNamesAreCaseSensitive)
        {
            add_plain_server(kHost);
            controller_->add_channel(kHost, "#Files", {});
            controller_->add_channel(kHost, "#files", {});

            EXPECT_EQ(controller_->get_server(kHost)->channels().size(), 2U);
            EXPECT_FALSE(controller_->get_channel(kHost, "#FILES").has_value());
        }

        TEST_F(ControllerTest, BotNeedsItsChannel)
        {
            add_plain_server(kHost);
            EXPECT_THROW(controller_->add_bot(kHost, "#files", "Offer", true), PreconditionError);

            controller_->add_channel(kHost, "#files", {});
            controller_->add_bot(kHost, "#files", "Offer", true);
            EXPECT_THROW(controller_->add_bot(kHost, "#files", "Offer", false), PreconditionError);

            const auto bot = controller_->get_bot(kHost, "#files", "Offer");
            ASSERT_TRUE(bot.has_value());
            EXPECT_TRUE(bot->list_enabled());
            EXPECT_EQ(bot->channel_name(), "#files");
        }

        TEST_F(ControllerTest, PackUpsertReplacesInsteadOfDuplicating)
        {
            populate();
            controller_->update_or_add_pack(kHost, "#files", "Offer", 1, "linux-v2.iso", "5G", false);

            const auto pack = controller_->get_pack(kHost, "#files", "Offer", 1);
            ASSERT_TRUE(pack.has_value());
            EXPECT_EQ(pack->file_name(), "linux-v2.iso");
            EXPECT_EQ(pack->file_size(), "5G");
            EXPECT_EQ(controller_->get_bot(kHost, "#files", "Offer")->packs().size(), 2U);
        }

        TEST_F(ControllerTest, PackForUnknownBotNeedsIntroduction)
        {
            add_plain_server(kHost);
            controller_->add_channel(kHost, "#files", {});

            EXPECT_THROW(controller_->update_or_add_pack(kHost, "#files", "New", 1, "a.bin", "1M", false), PreconditionError);
            EXPECT_FALSE(controller_->get_bot(kHost, "#files", "New").has_value());

            controller_->update_or_add_pack(kHost, "#files", "New", 1, "a.bin", "1M", true);
            const auto bot = controller_->get_bot(kHost, "#files", "New");
            ASSERT_TRUE(bot.has_value());
            EXPECT_FALSE(bot->list_enabled());
            ASSERT_EQ(bot->packs().size(), 1U);
            EXPECT_EQ(bot->packs()[0].file_name(), "a.bin");
        }

        TEST_F(ControllerTest, IntroducingABotStillNeedsTheChannel)
        {
            add_plain_server(kHost);
            EXPECT_THROW(controller_->update_or_add_pack(kHost, "#nowhere", "New", 1, "a.bin", "1M", true),
                         PreconditionError);
        }

        TEST_F(ControllerTest, MissingEntitiesAreEmptyOptionals)
        {
            populate();
            EXPECT_FALSE(controller_->get_server("missing.example").has_value());
            EXPECT_FALSE(controller_->get_channel(kHost, "#missing").has_value());
            EXPECT_FALSE(controller_->get_bot(kHost, "#files", "Missing").has_value());
            EXPECT_FALSE(controller_->get_pack(kHost, "#files", "Offer", 99).has_value());
        }

        TEST_F(ControllerTest, ServerListIsInCreationOrder)
        {
            add_plain_server("c.example");
            add_plain_server("a.example");
            add_plain_server("b.example");

            const auto servers = controller_->server_list();
            ASSERT_EQ(servers.size(), 3U);
            EXPECT_EQ(servers[0].host(), "c.example");
            EXPECT_EQ(servers[1].host(), "a.example");
            EXPECT_EQ(servers[2].host(), "b.example");
        }

        // ------------------ search ------------------

        TEST_F(ControllerTest, FindPackIsCaseSensitiveSubstring)
        {
            populate();
            EXPECT_EQ(controller_->find_pack("linux").size(), 3U);
            EXPECT_EQ(controller_->find_pack(".iso").size(), 2U);
            EXPECT_TRUE(controller_->find_pack("LINUX").empty());
            EXPECT_TRUE(controller_->find_pack("nothing-like-this").empty());
            EXPECT_THROW((void)controller_->find_pack("lin%"), ValidationError);
            EXPECT_THROW((void)controller_->find_pack(" "), ValidationError);
        }

        TEST_F(ControllerTest, SearchIsScoped)
        {
            populate();

            const auto on_server = controller_->find_pack_on_server(kHost, ".");
            EXPECT_EQ(on_server.size(), 4U);
            for (const auto& p : on_server)
                EXPECT_EQ(p.host(), kHost);

            const auto in_channel = controller_->find_pack_in_channel(kHost, "#files", ".");
            ASSERT_EQ(in_channel.size(), 3U);
            for (const auto& p : in_channel)
                EXPECT_EQ(p.channel_name(), "#files");

            const auto by_bot = controller_->find_pack_by_bot(kHost, "#files", "Offer", "linux");
            ASSERT_EQ(by_bot.size(), 2U);
            EXPECT_EQ(by_bot[0].number(), 1);
            EXPECT_EQ(by_bot[1].number(), 2);

            EXPECT_TRUE(controller_->find_pack_on_server("missing.example", "linux").empty());
            EXPECT_TRUE(controller_->find_pack_in_channel(kHost, "#missing", "linux").empty());
            EXPECT_TRUE(controller_->find_pack_by_bot(kHost, "#files", "Missing", "linux").empty());
        }

        // ------------------ update ------------------

        TEST_F(ControllerTest, SetServerIdentity)
        {
            populate();
            EXPECT_FALSE(controller_->set_server_identity("missing.example", "n", {}, {}, Authentication::none, {}));
            EXPECT_THROW(controller_->set_server_identity(kHost, "n", {}, {}, Authentication::nickserv, {}), ValidationError);

            EXPECT_TRUE(controller_->set_server_identity(kHost, "newnick", {}, "Real", Authentication::nickserv, "pw"));
            const auto server = controller_->get_server(kHost);
            EXPECT_EQ(server->nick_name(), "newnick");
            EXPECT_EQ(server->user_name(), "newnick");
            EXPECT_EQ(server->real_name(), "Real");
            EXPECT_EQ(server->authentication(), Authentication::nickserv);
            EXPECT_EQ(server->user_password(), "pw");
        }

        TEST_F(ControllerTest, SetServerPortAndPassword)
        {
            populate();
            EXPECT_FALSE(controller_->set_server_port("missing.example", 1));
            EXPECT_TRUE(controller_->set_server_port("IRC.example.org", 7000));
            EXPECT_EQ(controller_->get_server(kHost)->port(), 7000);

            EXPECT_FALSE(controller_->set_server_password("missing.example", "x"));
            EXPECT_TRUE(controller_->set_server_password(kHost, "x"));
            EXPECT_EQ(controller_->get_server(kHost)->password(), "x");
            EXPECT_TRUE(controller_->set_server_password(kHost, std::nullopt));
            EXPECT_FALSE(controller_->get_server(kHost)->password().has_value());
        }

        TEST_F(ControllerTest, SetChannelPasswordAndBotFlag)
        {
            populate();
            EXPECT_FALSE(controller_->set_channel_password(kHost, "#missing", "k"));
            EXPECT_TRUE(controller_->set_channel_password(kHost, "#files", "k"));
            EXPECT_EQ(controller_->get_channel(kHost, "#files")->password(), "k");

            EXPECT_FALSE(controller_->set_bot_list_enabled(kHost, "#files", "Missing", true));
            EXPECT_TRUE(controller_->set_bot_list_enabled(kHost, "#files", "Offer", false));
            EXPECT_FALSE(controller_->get_bot(kHost, "#files", "Offer")->list_enabled());
        }

        TEST_F(ControllerTest, MoveBotTakesItsPacks)
        {
            populate();
            EXPECT_TRUE(controller_->set_bot_channel(kHost, "#files", "#music", "Offer"));

            EXPECT_FALSE(controller_->get_bot(kHost, "#files", "Offer").has_value());
            const auto moved = controller_->get_bot(kHost, "#music", "Offer");
            ASSERT_TRUE(moved.has_value());
            EXPECT_EQ(moved->packs().size(), 2U);
            EXPECT_EQ(controller_->get_channel(kHost, "#files")->bots().size(), 1U);
            EXPECT_EQ(controller_->get_channel(kHost, "#music")->bots().size(), 2U);
            EXPECT_EQ(controller_->find_pack_in_channel(kHost, "#music", "linux").size(), 2U);
        }

        TEST_F(ControllerTest, MoveBotEdgeCases)
        {
            populate();
            EXPECT_THROW(controller_->set_bot_channel(kHost, "#files", "#files", "Offer"), PreconditionError);
            EXPECT_FALSE(controller_->set_bot_channel(kHost, "#files", "#music", "Missing"));
            EXPECT_FALSE(controller_->set_bot_channel(kHost, "#files", "#missing", "Offer"));

            controller_->add_bot(kHost, "#music", "Offer", false);
            EXPECT_THROW(controller_->set_bot_channel(kHost, "#files", "#music", "Offer"), PreconditionError);
            EXPECT_TRUE(controller_->get_bot(kHost, "#files", "Offer").has_value());
        }

        // ------------------ delete ------------------

        TEST_F(ControllerTest, DeleteServerCascades)
        {
            populate();
            EXPECT_TRUE(controller_->delete_server(kHost));

            EXPECT_FALSE(controller_->get_server(kHost).has_value());
            EXPECT_FALSE(controller_->get_channel(kHost, "#files").has_value());
            EXPECT_FALSE(controller_->get_bot(kHost, "#files", "Offer").has_value());
            EXPECT_FALSE(controller_->get_pack(kHost, "#music", "Tunes", 7).has_value());

            const auto left = controller_->find_pack("linux");
            ASSERT_EQ(left.size(), 1U);
            EXPECT_EQ(left[0].host(), "other.example.net");
            EXPECT_FALSE(controller_->delete_server(kHost));
        }

        TEST_F(ControllerTest, DeleteChannelLeavesSiblings)
        {
            populate();
            EXPECT_TRUE(controller_->delete_channel(kHost, "#files"));
            EXPECT_FALSE(controller_->get_bot(kHost, "#files", "Other").has_value());
            EXPECT_TRUE(controller_->get_channel(kHost, "#music").has_value());
            EXPECT_EQ(controller_->find_pack_on_server(kHost, "a").size(), 1U);
            EXPECT_FALSE(controller_->delete_channel(kHost, "#files"));
        }

        TEST_F(ControllerTest, DeleteBotAndPack)
        {
            populate();
            EXPECT_FALSE(controller_->delete_bot(kHost, "#files", "Missing"));
            EXPECT_TRUE(controller_->delete_bot(kHost, "#files", "Other"));
            EXPECT_TRUE(controller_->find_pack("movie").empty());

            EXPECT_FALSE(controller_->delete_pack(kHost, "#files", "Offer", 99));
            EXPECT_TRUE(controller_->delete_pack(kHost, "#files", "Offer", 2));
            const auto packs = controller_->get_bot(kHost, "#files", "Offer")->packs();
            ASSERT_EQ(packs.size(), 1U);
            EXPECT_EQ(packs[0].number(), 1);
        }

        // ------------------ commit failures ------------------

        TEST_F(ControllerTest, FailedCommitRollsBackInsert)
        {
            storage_->fail_commits = true;
            EXPECT_THROW(add_plain_server(kHost), StorageError);

            storage_->fail_commits = false;
            EXPECT_FALSE(controller_->get_server(kHost).has_value());
            EXPECT_NO_THROW(add_plain_server(kHost));
        }

        TEST_F(ControllerTest, FailedCommitRollsBackCascade)
        {
            populate();
            storage_->fail_commits = true;
            EXPECT_THROW((void)controller_->delete_server(kHost), StorageError);
            EXPECT_THROW((void)controller_->set_bot_channel(kHost, "#files", "#music", "Offer"), StorageError);

            storage_->fail_commits = false;
            EXPECT_EQ(controller_->find_pack_on_server(kHost, ".").size(), 4U);
            EXPECT_TRUE(controller_->get_bot(kHost, "#files", "Offer").has_value());
            EXPECT_EQ(controller_->get_server(kHost)->channels().size(), 2U);
        }

        // ------------------ lifecycle ------------------

        TEST_F(ControllerTest, ClosedControllerRejectsEverything)
        {
            populate();
            EXPECT_FALSE(controller_->is_closed());
            controller_->close();
            EXPECT_TRUE(controller_->is_closed());

            EXPECT_THROW(add_plain_server("new.example"), ClosedError);
            EXPECT_THROW((void)controller_->get_server(kHost), ClosedError);
            EXPECT_THROW((void)controller_->find_pack("linux"), ClosedError);
            EXPECT_THROW((void)controller_->delete_server(kHost), ClosedError);
            EXPECT_THROW(controller_->close(), ClosedError);
        }

        TEST(ControllerConstruction, RejectsClosedStorage)
        {
            auto storage = std::make_unique<MemoryStorage>();
            storage->close();
            EXPECT_THROW(Controller{ std::move(storage) }, ClosedError);
        }

    } // namespace
} // namespace packdb
