#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

#include "TestSupport.hpp"
#include "core/catalog/ChannelBinder.hpp"

using namespace rdg;
using nlohmann::json;
using rdg_test::Gateway;

namespace {

json NewMembersUpdate(int64_t chatId, const std::string& type, int64_t memberId, bool isBot) {
  return {
    {"update_id", 1},
    {"message", {
      {"message_id", 10},
      {"chat", {{"id", chatId}, {"type", type}}},
      {"new_chat_members", json::array({{{"id", memberId}, {"is_bot", isBot}}})}
    }}
  };
}

json ChatMemberUpdate(int64_t chatId, const std::string& type, int64_t userId, const std::string& status) {
  return {
    {"update_id", 2},
    {"chat_member", {
      {"chat", {{"id", chatId}, {"type", type}}},
      {"new_chat_member", {{"status", status}, {"user", {{"id", userId}, {"is_bot", true}}}}}
    }}
  };
}

int TestNewChatMembers() {
  Gateway gw("binder_new_members", 10);
  gw.relay.addIdentity("tok-a", "4242");
  BackendRecord b = gw.pool.registerBackend("alice", "tok-a");
  ChannelBinder binder(gw.store, gw.relay);

  // Someone else joining, or a private chat, binds nothing.
  CHECK(!binder.handle(b.backend_id, NewMembersUpdate(-1001, "channel", 777, true)));
  CHECK(!binder.handle(b.backend_id, NewMembersUpdate(-1001, "private", 4242, true)));
  CHECK(!binder.handle(b.backend_id, NewMembersUpdate(-1001, "group", 4242, true)));
  CHECK(gw.store.findBackend(b.backend_id)->remote_channel_id.empty());

  auto bound = binder.handle(b.backend_id, NewMembersUpdate(-1001234, "supergroup", 4242, true));
  CHECK(bound && *bound == "-1001234");
  CHECK(gw.store.findBackend(b.backend_id)->remote_channel_id == "-1001234");
  CHECK(gw.relay.notices.size() == 1);
  CHECK(gw.relay.notices[0].rfind("-1001234: ", 0) == 0);
  return 0;
}

int TestChatMemberStatus() {
  Gateway gw("binder_chat_member", 10);
  gw.relay.addIdentity("tok-a", "4242");
  BackendRecord b = gw.pool.registerBackend("alice", "tok-a");
  ChannelBinder binder(gw.store, gw.relay);

  CHECK(!binder.handle(b.backend_id, ChatMemberUpdate(-1005, "channel", 4242, "left")));
  CHECK(!binder.handle(b.backend_id, ChatMemberUpdate(-1005, "channel", 1, "administrator")));
  auto bound = binder.handle(b.backend_id, ChatMemberUpdate(-1005, "channel", 4242, "administrator"));
  CHECK(bound && *bound == "-1005");

  // Notice failures do not undo the binding.
  gw.relay.failCredential("tok-a", ErrorKind::TransportUnavailable);
  bound = binder.handle(b.backend_id, ChatMemberUpdate(-1006, "channel", 4242, "member"));
  CHECK(bound && *bound == "-1006");
  CHECK(gw.store.findBackend(b.backend_id)->remote_channel_id == "-1006");
  return 0;
}

int TestUnknownOrInactiveBackend() {
  Gateway gw("binder_inactive", 10);
  gw.relay.addIdentity("tok-a", "4242");
  BackendRecord b = gw.pool.registerBackend("alice", "tok-a");
  ChannelBinder binder(gw.store, gw.relay);

  CHECK(!binder.handle("bk_missing", NewMembersUpdate(-1001, "channel", 4242, true)));
  gw.pool.deactivateBackend("alice", b.backend_id);
  CHECK(!binder.handle(b.backend_id, NewMembersUpdate(-1001, "channel", 4242, true)));
  CHECK(!binder.handle(b.backend_id, json::array()));
  return 0;
}

int TestQueuedEvents() {
  Gateway gw("binder_queue", 10);
  gw.relay.addIdentity("tok-a", "4242");
  BackendRecord b = gw.pool.registerBackend("alice", "tok-a");
  ChannelBinder binder(gw.store, gw.relay);
  binder.start();

  binder.submit(b.backend_id, "not json at all");
  binder.submit(b.backend_id, NewMembersUpdate(-1009, "channel", 4242, true).dump());
  binder.drain();
  CHECK(gw.store.findBackend(b.backend_id)->remote_channel_id == "-1009");
  binder.stop();
  return 0;
}

}  // namespace

int main() {
  if (TestNewChatMembers() != 0) return 1;
  if (TestChatMemberStatus() != 0) return 1;
  if (TestUnknownOrInactiveBackend() != 0) return 1;
  if (TestQueuedEvents() != 0) return 1;
  std::cout << "channel_binder_test passed\n";
  return 0;
}
