#ifndef LSNP_TEST_UNIT_TEST_SOCIAL_STATE_HPP
#define LSNP_TEST_UNIT_TEST_SOCIAL_STATE_HPP

#include <gtest/gtest.h>

#include <set>
#include <string>

#include "core/dm_store.hpp"
#include "core/errors.hpp"
#include "core/group_table.hpp"
#include "core/like_index.hpp"
#include "core/post_feed.hpp"
#include "core/social_graph.hpp"
#include "util/recent_message_cache.hpp"

namespace {

using namespace lsnp::core;

TEST(SocialGraphTest, FollowIsIdempotentAndDirected) {
    SocialGraph graph;
    EXPECT_TRUE(graph.Follow("alice", "bob"));
    EXPECT_FALSE(graph.Follow("alice", "bob"));
    EXPECT_FALSE(graph.Follow("alice", "alice"));

    EXPECT_TRUE(graph.IsFollowing("alice", "bob"));
    EXPECT_FALSE(graph.IsFollowing("bob", "alice"));
    EXPECT_EQ(graph.Followers("bob"), std::set<std::string>({"alice"}));

    EXPECT_TRUE(graph.Unfollow("alice", "bob"));
    EXPECT_FALSE(graph.Unfollow("alice", "bob"));
    EXPECT_TRUE(graph.Following("alice").empty());
    EXPECT_TRUE(graph.Followers("bob").empty());
}

TEST(LikeIndexTest, DoubleLikeCountsOnce) {
    LikeIndex likes;
    const std::string key = LikeIndex::PostKey("alice@10.0.0.1", "1700000000");
    EXPECT_EQ(key, "alice@10.0.0.1:1700000000");

    EXPECT_TRUE(likes.Like(key, "bob"));
    EXPECT_FALSE(likes.Like(key, "bob"));
    EXPECT_TRUE(likes.Like(key, "carol"));
    EXPECT_EQ(likes.Count(key), 2u);

    EXPECT_TRUE(likes.Unlike(key, "bob"));
    EXPECT_FALSE(likes.Unlike(key, "bob"));
    EXPECT_EQ(likes.Likers(key), std::set<std::string>({"carol"}));
    EXPECT_FALSE(likes.Unlike("nobody:0", "bob"));
}

TEST(GroupTableTest, CreatorIsAlwaysMember) {
    GroupTable groups;
    Group g = groups.Create("friends", "Friends", "alice", {"bob"});
    EXPECT_TRUE(g.IsMember("alice"));
    EXPECT_TRUE(g.IsMember("bob"));
    EXPECT_THROW(groups.Create("friends", "Again", "alice", {}), std::runtime_error);

    Group updated = groups.UpdateMembers("friends", "alice", {"carol"}, {"alice", "bob"});
    EXPECT_EQ(updated.members, std::set<std::string>({"alice", "carol"}));
}

TEST(GroupTableTest, OnlyCreatorChangesMembership) {
    GroupTable groups;
    groups.Create("friends", "Friends", "alice", {"bob"});
    EXPECT_THROW(groups.UpdateMembers("friends", "bob", {"mallory"}, {}),
                 lsnp::core::PermissionDenied);
    EXPECT_THROW(groups.UpdateMembers("nope", "alice", {}, {}), lsnp::core::GroupNotFound);
    EXPECT_FALSE(groups.Find("friends")->IsMember("mallory"));
}

TEST(GroupTableTest, OnlyMembersMayPost) {
    GroupTable groups;
    groups.Create("friends", "Friends", "alice", {"bob"});

    GroupMessage ok{"bob", 1, "hi all"};
    groups.AppendMessage("friends", ok);
    GroupMessage intruder{"mallory", 2, "spam"};
    EXPECT_THROW(groups.AppendMessage("friends", intruder), lsnp::core::PermissionDenied);

    auto g = groups.Find("friends");
    ASSERT_EQ(g->log.size(), 1u);
    EXPECT_EQ(g->log[0].content, "hi all");
}

TEST(GroupTableTest, RemoteCreateFromSameCreatorReplacesMembers) {
    GroupTable groups;
    EXPECT_TRUE(groups.ApplyRemoteCreate("g", "Group", "alice", {"bob"}));
    groups.AppendMessage("g", GroupMessage{"bob", 1, "first"});

    EXPECT_FALSE(groups.ApplyRemoteCreate("g", "Renamed", "alice", {"bob", "carol"}));
    auto g = groups.Find("g");
    EXPECT_EQ(g->name, "Renamed");
    EXPECT_TRUE(g->IsMember("carol"));
    EXPECT_EQ(g->log.size(), 1u);

    EXPECT_THROW(groups.ApplyRemoteCreate("g", "Hijack", "mallory", {"mallory"}),
                 lsnp::core::PermissionDenied);
    EXPECT_EQ(groups.GroupsOf("carol"), std::vector<std::string>({"g"}));
}

TEST(DmStoreTest, ThreadIsSharedByBothDirections) {
    DmStore dms;
    DmEntry out;
    out.direction = DmDirection::OUTBOUND;
    out.from = "alice";
    out.content = "hi";
    DmEntry in;
    in.direction = DmDirection::INBOUND;
    in.from = "bob";
    in.content = "hello";

    dms.Append("alice", "bob", out);
    dms.Append("bob", "alice", in);

    auto thread = dms.Thread("bob", "alice");
    ASSERT_EQ(thread.size(), 2u);
    EXPECT_EQ(thread[0].content, "hi");
    EXPECT_EQ(thread[1].direction, DmDirection::INBOUND);
    EXPECT_EQ(dms.ThreadCount(), 1u);
    EXPECT_TRUE(dms.Thread("alice", "carol").empty());
}

TEST(PostFeedTest, ExpiredPostsAreHiddenAndPruned) {
    PostFeed feed;
    feed.Add(Post{"alice", "m1", "old", 1000, 60});
    feed.Add(Post{"alice", "m2", "forever", 1010, 0});
    feed.Add(Post{"bob", "m3", "new", 1050, 3600});
    EXPECT_FALSE(feed.Add(Post{"alice", "m1", "old again", 1000, 60}));

    auto timeline = feed.Timeline(1059);
    ASSERT_EQ(timeline.size(), 3u);
    EXPECT_EQ(timeline[0].content, "new");

    EXPECT_EQ(feed.PostsBy("alice", 1060).size(), 1u);
    EXPECT_EQ(feed.Prune(1060), 1u);
    EXPECT_EQ(feed.Prune(1060), 0u);
    EXPECT_EQ(feed.Timeline(999999).size(), 1u);
}

TEST(RecentMessageCacheTest, DuplicatesAreDetectedUntilEvicted) {
    lsnp::util::RecentMessageCache cache(2);
    EXPECT_TRUE(cache.insertIfAbsent("alice/1"));
    EXPECT_FALSE(cache.insertIfAbsent("alice/1"));
    EXPECT_TRUE(cache.insertIfAbsent("alice/2"));
    // least recently seen key goes first
    EXPECT_TRUE(cache.insertIfAbsent("alice/3"));
    EXPECT_EQ(cache.size(), 2u);
    EXPECT_FALSE(cache.contains("alice/1"));
    EXPECT_TRUE(cache.contains("alice/2"));
    EXPECT_TRUE(cache.contains("alice/3"));
}

TEST(RecentMessageCacheTest, ZeroCapacityDisablesFiltering) {
    lsnp::util::RecentMessageCache cache(0);
    EXPECT_TRUE(cache.insertIfAbsent("x"));
    EXPECT_TRUE(cache.insertIfAbsent("x"));
    EXPECT_EQ(cache.size(), 0u);
}

} // namespace

#endif // LSNP_TEST_UNIT_TEST_SOCIAL_STATE_HPP
