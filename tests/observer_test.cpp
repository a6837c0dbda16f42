// C++ Standard Library
#include <memory>
#include <string>
#include <vector>

// GoogleTest
#include <gmock/gmock.h>
#include <gtest/gtest.h>

// Core
#include <pdb/core/controller.hpp>
#include <pdb/core/errors.hpp>

// Tests
#include "test_support.hpp"

using ::testing::ElementsAre;
using ::testing::IsEmpty;

namespace packdb
{
    namespace
    {

        constexpr std::string_view kHost = "irc.example.org";

        class ObserverTest : public ::testing::Test
        {
        protected:
            ObserverTest()
            {
                auto storage = std::make_unique<test::FlakyStorage>();
                storage_ = storage.get();
                controller_ = std::make_unique<Controller>(std::move(storage));
                controller_->add_observer(recorder_);
            }

            void populate()
            {
                controller_->add_server(kHost, 6667, "me", {}, {}, Authentication::none, {}, {});
                controller_->add_channel(kHost, "#a", {});
                controller_->add_channel(kHost, "#b", {});
                controller_->add_bot(kHost, "#a", "A", false);
                controller_->add_bot(kHost, "#a", "B", false);
                controller_->update_or_add_pack(kHost, "#a", "A", 1, "one", "1M", false);
                controller_->update_or_add_pack(kHost, "#a", "A", 2, "two", "2M", false);
                recorder_->clear();
            }

            test::FlakyStorage* storage_ = nullptr;
            std::shared_ptr<test::RecordingObserver> recorder_ = std::make_shared<test::RecordingObserver>();
            std::unique_ptr<Controller> controller_;
        };

        TEST_F(ObserverTest, RegistrationRules)
        {
            EXPECT_THROW(controller_->add_observer(nullptr), ValidationError);
            EXPECT_THROW(controller_->remove_observer(nullptr), ValidationError);
            EXPECT_THROW(controller_->add_observer(recorder_), PreconditionError);
            EXPECT_THROW(controller_->remove_observer(std::make_shared<test::RecordingObserver>()), PreconditionError);

            controller_->remove_observer(recorder_);
            controller_->add_server(kHost, 6667, "me", {}, {}, Authentication::none, {}, {});
            EXPECT_THAT(recorder_->events(), IsEmpty());
        }

        TEST_F(ObserverTest, FlushPrecedesEachEvent)
        {
            controller_->add_server(kHost, 6667, "me", {}, {}, Authentication::none, {}, {});
            controller_->add_channel(kHost, "#a", {});
            controller_->add_bot(kHost, "#a", "A", true);
            controller_->update_or_add_pack(kHost, "#a", "A", 1, "one", "1M", false);
            controller_->update_or_add_pack(kHost, "#a", "A", 1, "uno", "2M", false);

            EXPECT_THAT(recorder_->events(),
                        ElementsAre("flush",
                                    "server_added:irc.example.org",
                                    "flush",
                                    "channel_added:irc.example.org/#a",
                                    "flush",
                                    "bot_added:irc.example.org/#a/A:true",
                                    "flush",
                                    "pack_added:irc.example.org/#a/A/1:one",
                                    "flush",
                                    "pack_updated:irc.example.org/#a/A/1:one->uno:1M->2M"));
        }

        TEST_F(ObserverTest, EventsFireAfterTheCommit)
        {
            struct CommitProbe : Observer
            {
                const Storage* storage = nullptr;
                std::uint64_t seen = 0;

                void on_server_added(std::string_view,
                                     std::uint16_t,
                                     const ServerIdentity&,
                                     const std::optional<std::string>&) override
                {
                    seen = storage->commit_count();
                }
            };

            auto probe = std::make_shared<CommitProbe>();
            probe->storage = storage_;
            controller_->add_observer(probe);
            controller_->add_server(kHost, 6667, "me", {}, {}, Authentication::none, {}, {});
            EXPECT_EQ(probe->seen, 1U);
        }

        TEST_F(ObserverTest, IntroducedBotIsAnnouncedBeforeItsPack)
        {
            controller_->add_server(kHost, 6667, "me", {}, {}, Authentication::none, {}, {});
            controller_->add_channel(kHost, "#a", {});
            recorder_->clear();

            controller_->update_or_add_pack(kHost, "#a", "New", 3, "file", "1M", true);
            EXPECT_THAT(recorder_->events(),
                        ElementsAre("flush",
                                    "bot_added:irc.example.org/#a/New:false",
                                    "flush",
                                    "pack_added:irc.example.org/#a/New/3:file"));
        }

        TEST_F(ObserverTest, ChangesCarryOldAndNewValues)
        {
            populate();
            ASSERT_TRUE(controller_->set_server_identity(kHost, "other", {}, {}, Authentication::none, {}));
            ASSERT_TRUE(controller_->set_server_port(kHost, 7000));
            ASSERT_TRUE(controller_->set_server_password(kHost, "pw"));
            ASSERT_TRUE(controller_->set_channel_password(kHost, "#a", "key"));
            ASSERT_TRUE(controller_->set_bot_list_enabled(kHost, "#a", "A", true));
            ASSERT_TRUE(controller_->set_bot_channel(kHost, "#a", "#b", "B"));

            EXPECT_THAT(recorder_->events(),
                        ElementsAre("flush",
                                    "server_identity:irc.example.org:me->other",
                                    "flush",
                                    "server_port:irc.example.org:6667->7000",
                                    "flush",
                                    "server_password:irc.example.org:-->pw",
                                    "flush",
                                    "channel_password:irc.example.org/#a:-->key",
                                    "flush",
                                    "bot_list:irc.example.org/#a/A:false->true",
                                    "flush",
                                    "bot_moved:irc.example.org/B:#a->#b"));
        }

        TEST_F(ObserverTest, SoftMissesAndFailuresAreSilent)
        {
            populate();
            EXPECT_FALSE(controller_->set_server_port("missing.example", 1));
            EXPECT_FALSE(controller_->delete_bot(kHost, "#a", "Missing"));
            EXPECT_THROW(controller_->add_channel(kHost, "bad", {}), ValidationError);
            EXPECT_THROW(controller_->add_channel(kHost, "#a", {}), PreconditionError);

            storage_->fail_commits = true;
            EXPECT_THROW(controller_->add_channel(kHost, "#c", {}), StorageError);
            storage_->fail_commits = false;

            EXPECT_THAT(recorder_->events(), IsEmpty());
        }

        TEST_F(ObserverTest, CascadeReportsDescendantsBottomUp)
        {
            populate();
            ASSERT_TRUE(controller_->delete_server(kHost));

            EXPECT_THAT(recorder_->events(),
                        ElementsAre("flush",
                                    "pack_deleted:irc.example.org/#a/A/1",
                                    "pack_deleted:irc.example.org/#a/A/2",
                                    "bot_deleted:irc.example.org/#a/A",
                                    "bot_deleted:irc.example.org/#a/B",
                                    "channel_deleted:irc.example.org/#a",
                                    "channel_deleted:irc.example.org/#b",
                                    "server_deleted:irc.example.org"));
        }

        TEST_F(ObserverTest, SingleDeletesReportOnlyTheirSubtree)
        {
            populate();
            ASSERT_TRUE(controller_->delete_pack(kHost, "#a", "A", 2));
            ASSERT_TRUE(controller_->delete_bot(kHost, "#a", "A"));
            ASSERT_TRUE(controller_->delete_channel(kHost, "#b"));

            EXPECT_THAT(recorder_->events(),
                        ElementsAre("flush",
                                    "pack_deleted:irc.example.org/#a/A/2",
                                    "flush",
                                    "pack_deleted:irc.example.org/#a/A/1",
                                    "bot_deleted:irc.example.org/#a/A",
                                    "flush",
                                    "channel_deleted:irc.example.org/#b"));
        }

        TEST_F(ObserverTest, ObserversRunInRegistrationOrder)
        {
            struct Tagger : Observer
            {
                std::vector<std::string>* log = nullptr;
                std::string tag;

                void on_flush() override
                {
                    log->push_back(tag);
                }
            };

            std::vector<std::string> order;
            auto first = std::make_shared<Tagger>();
            first->log = &order;
            first->tag = "first";
            auto second = std::make_shared<Tagger>();
            second->log = &order;
            second->tag = "second";

            controller_->add_observer(first);
            controller_->add_observer(second);
            controller_->add_server(kHost, 6667, "me", {}, {}, Authentication::none, {}, {});
            EXPECT_THAT(order, ElementsAre("first", "second"));
        }

        TEST_F(ObserverTest, CloseAnnouncesOnlyClose)
        {
            populate();
            controller_->close();
            EXPECT_THAT(recorder_->events(), ElementsAre("close"));
        }

    } // namespace
} // namespace packdb
