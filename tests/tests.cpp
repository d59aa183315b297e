#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <stop_token>
#include <thread>
#include <vector>

#include "chatbridge/config.hpp"
#include "chatbridge/handlers.hpp"
#include "chatbridge/http.hpp"
#include "chatbridge/llm_plugin.hpp"
#include "chatbridge/memory_store.hpp"
#include "chatbridge/openai_plugin.hpp"
#include "chatbridge/service.hpp"
#include "chatbridge/services_runner.hpp"
#include "chatbridge/wiring.hpp"

using namespace chatbridge;

static int fail(const std::string& msg, const char* file, int line) {
  std::cerr << "TEST FAIL: " << msg << " (" << file << ":" << line << ")\n";
  return 1;
}

#define EXPECT_TRUE(x)         \
  do {                         \
    if (!(x)) {                \
      return fail(#x, __FILE__, __LINE__); \
    }                          \
  } while (0)

#define EXPECT_EQ(a, b)                                              \
  do {                                                               \
    const auto _a = (a);                                             \
    const auto _b = (b);                                             \
    if (!(_a == _b)) {                                               \
      std::ostringstream ss;                                         \
      ss << #a << " == " << #b << " (got '" << _a << "' vs '" << _b << "')"; \
      return fail(ss.str(), __FILE__, __LINE__);                     \
    }                                                                \
  } while (0)

namespace {

Message text_message(const std::string& from, const std::string& to, const std::string& text) {
  return Message(Message::Clock::now(), TextPayload{text}, Identifier::from(from), Identifier::from(to),
                 Identifier::from("conv"), Role::kUser);
}

std::string simple_payload(const std::string& from, const std::string& to, const std::string& text) {
  return json{{"sender", from}, {"recipient", to}, {"text", text}, {"conversation", "c-1"}}.dump();
}

class SlowPlugin : public LLMPlugin {
 public:
  explicit SlowPlugin(std::chrono::milliseconds delay) : delay_(delay) {}

  Result<ModelReply, ModelError> respond(const ModelRequest&) override {
    std::this_thread::sleep_for(delay_);
    ModelReply reply;
    reply.text = "late";
    return reply;
  }

 private:
  std::chrono::milliseconds delay_;
};

class SwitchablePlugin : public LLMPlugin {
 public:
  Result<ModelReply, ModelError> respond(const ModelRequest& request) override {
    if (failing.load()) {
      return ModelError{ModelErrorKind::kRejected, "backend said no"};
    }
    return echo_.respond(request);
  }

  std::atomic<bool> failing{true};

 private:
  EchoPlugin echo_;
};

class ThrowingPlugin : public LLMPlugin {
 public:
  Result<ModelReply, ModelError> respond(const ModelRequest&) override { throw std::runtime_error("boom"); }
};

json minimal_config() {
  return json{
      {"port", 0},
      {"plugins", json::array({{{"name", "echo"}, {"type", "echo"}}})},
      {"stores", json::array({{{"name", "mem"}, {"maxConversations", 2}, {"maxMessagesPerConversation", 3}}})},
      {"handlers", json::array({{{"name", "plain"}, {"type", "simple"}}})},
      {"services", json::array({{{"webhookPath", "/chat"}, {"plugin", "echo"}, {"store", "mem"}, {"handler", "plain"}}})},
  };
}

bool rejects(const json& root) {
  try {
    parse_root_config(root);
  } catch (const ConfigurationError&) {
    return true;
  }
  return false;
}

}  // namespace

static int test_identifiers_and_keys() {
  const Identifier a = Identifier::from("alice");
  const Identifier b = Identifier::from(std::string("bob"));
  EXPECT_TRUE(a == Identifier::from("alice"));
  EXPECT_TRUE(!(a == b));
  EXPECT_EQ(Identifier::from(int64_t{42}).value(), "42");
  EXPECT_TRUE(!(Identifier::random() == Identifier::random()));

  const ConversationKey ab = ConversationKey::of(a, b);
  const ConversationKey ba = ConversationKey::of(b, a);
  EXPECT_TRUE(ab == ba);
  EXPECT_EQ(std::hash<ConversationKey>{}(ab), std::hash<ConversationKey>{}(ba));
  EXPECT_EQ(ab.first().value(), "alice");
  EXPECT_EQ(ba.to_string(), "alice|bob");
  EXPECT_TRUE(!(ab == ConversationKey::of(a, Identifier::from("carol"))));
  return 0;
}

static int test_message_reply() {
  const Message in = text_message("user-1", "page-1", "hi");
  const Message out = in.reply(TextPayload{"hello"});
  EXPECT_EQ(out.sender().value(), "page-1");
  EXPECT_EQ(out.recipient().value(), "user-1");
  EXPECT_TRUE(out.conversation_id() == in.conversation_id());
  EXPECT_TRUE(out.conversation_key() == in.conversation_key());
  EXPECT_TRUE(out.timestamp() >= in.timestamp());
  EXPECT_TRUE(out.role() == Role::kAssistant);

  const Payload media = MediaPayload{"https://cdn/x.png", "image", ""};
  EXPECT_EQ(payload_text(media), "[media: image]");
  const Payload captioned = MediaPayload{"https://cdn/x.png", "image", "look"};
  EXPECT_EQ(payload_text(captioned), "look");
  return 0;
}

static int test_store_rejects_zero_capacity() {
  bool threw = false;
  try {
    MemoryStore store(MemoryStoreConfig{0, 1});
  } catch (const ConfigurationError&) {
    threw = true;
  }
  EXPECT_TRUE(threw);

  threw = false;
  try {
    MemoryStore store(MemoryStoreConfig{1, 0});
  } catch (const ConfigurationError&) {
    threw = true;
  }
  EXPECT_TRUE(threw);
  return 0;
}

static int test_store_single_slot_scenario() {
  MemoryStore store(MemoryStoreConfig{1, 1});

  const Message a = text_message("S1", "R1", "A");
  const ThreadState t1 = store.add(a);
  EXPECT_EQ(store.size(), static_cast<std::size_t>(1));
  EXPECT_EQ(t1.size(), static_cast<std::size_t>(1));
  EXPECT_TRUE(t1.tail() == a);

  const Message b = text_message("R1", "S1", "B");
  const ThreadState t2 = store.add(b);
  EXPECT_EQ(store.size(), static_cast<std::size_t>(1));
  EXPECT_EQ(t2.size(), static_cast<std::size_t>(1));
  EXPECT_EQ(t2.messages()[0].text(), "B");

  const Message c = text_message("S2", "R2", "C");
  const ThreadState t3 = store.add(c);
  EXPECT_EQ(store.size(), static_cast<std::size_t>(1));
  EXPECT_EQ(t3.size(), static_cast<std::size_t>(1));
  EXPECT_EQ(t3.messages()[0].text(), "C");
  EXPECT_TRUE(!store.get(a.conversation_key()).has_value());
  EXPECT_TRUE(store.get(c.conversation_key()).has_value());
  return 0;
}

static int test_store_trims_oldest_first() {
  MemoryStore store(MemoryStoreConfig{4, 3});
  for (int i = 1; i <= 5; ++i) {
    store.add(text_message("u", "p", "m" + std::to_string(i)));
  }
  const auto thread = store.get(ConversationKey::of(Identifier::from("p"), Identifier::from("u")));
  EXPECT_TRUE(thread.has_value());
  EXPECT_EQ(thread->size(), static_cast<std::size_t>(3));
  EXPECT_EQ(thread->messages()[0].text(), "m3");
  EXPECT_EQ(thread->messages()[2].text(), "m5");
  EXPECT_EQ(thread->tail().text(), "m5");
  return 0;
}

static int test_store_eviction_order() {
  const std::size_t k = 3;
  MemoryStore store(MemoryStoreConfig{k, 2});
  for (std::size_t i = 1; i <= k; ++i) {
    store.add(text_message("c" + std::to_string(i), "bot", "hi"));
  }
  EXPECT_EQ(store.size(), k);

  store.add(text_message("c4", "bot", "hi"));
  EXPECT_EQ(store.size(), k);
  EXPECT_TRUE(!store.get(ConversationKey::of(Identifier::from("c1"), Identifier::from("bot"))).has_value());
  EXPECT_TRUE(store.get(ConversationKey::of(Identifier::from("c2"), Identifier::from("bot"))).has_value());

  // Activity on c2 makes c3 the least recently active.
  store.add(text_message("bot", "c2", "again"));
  store.add(text_message("c5", "bot", "hi"));
  EXPECT_TRUE(store.get(ConversationKey::of(Identifier::from("c2"), Identifier::from("bot"))).has_value());
  EXPECT_TRUE(!store.get(ConversationKey::of(Identifier::from("c3"), Identifier::from("bot"))).has_value());
  EXPECT_TRUE(store.get(ConversationKey::of(Identifier::from("c4"), Identifier::from("bot"))).has_value());
  EXPECT_TRUE(store.get(ConversationKey::of(Identifier::from("c5"), Identifier::from("bot"))).has_value());
  return 0;
}

static int test_snapshots_do_not_change() {
  MemoryStore store(MemoryStoreConfig{2, 2});
  const ThreadState before = store.add(text_message("u", "p", "one"));
  store.add(text_message("u", "p", "two"));
  store.add(text_message("u", "p", "three"));
  EXPECT_EQ(before.size(), static_cast<std::size_t>(1));
  EXPECT_EQ(before.tail().text(), "one");

  const auto now = store.get(before.key());
  EXPECT_TRUE(now.has_value());
  EXPECT_EQ(now->messages()[0].text(), "two");
  EXPECT_EQ(now->tail().text(), "three");
  return 0;
}

static int test_store_concurrent_adds() {
  const std::size_t max_conversations = 3;
  const std::size_t max_messages = 5;
  MemoryStore store(MemoryStoreConfig{max_conversations, max_messages});
  std::atomic<bool> bounded{true};

  std::vector<std::thread> workers;
  for (int w = 0; w < 8; ++w) {
    workers.emplace_back([&, w]() {
      for (int i = 0; i < 200; ++i) {
        const ThreadState t = store.add(text_message("u" + std::to_string((w + i) % 6), "bot", std::to_string(i)));
        if (t.size() > max_messages || store.size() > max_conversations) {
          bounded.store(false);
        }
      }
    });
  }
  for (auto& t : workers) {
    t.join();
  }
  EXPECT_TRUE(bounded.load());
  EXPECT_TRUE(store.size() <= max_conversations);

  // Producers sharing one conversation keep their own order.
  MemoryStore shared(MemoryStoreConfig{1, 1000});
  std::vector<std::thread> producers;
  for (int w = 0; w < 4; ++w) {
    producers.emplace_back([&shared, w]() {
      for (int i = 0; i < 100; ++i) {
        shared.add(text_message("u", "bot", std::to_string(w) + ":" + std::to_string(i)));
      }
    });
  }
  for (auto& t : producers) {
    t.join();
  }
  const auto thread = shared.get(ConversationKey::of(Identifier::from("u"), Identifier::from("bot")));
  EXPECT_TRUE(thread.has_value());
  EXPECT_EQ(thread->size(), static_cast<std::size_t>(400));
  std::vector<int> last_seen(4, -1);
  for (const auto& m : thread->messages()) {
    const std::string text = m.text();
    const auto colon = text.find(':');
    const int w = std::stoi(text.substr(0, colon));
    const int i = std::stoi(text.substr(colon + 1));
    EXPECT_TRUE(i == last_seen[static_cast<std::size_t>(w)] + 1);
    last_seen[static_cast<std::size_t>(w)] = i;
  }
  return 0;
}

static int test_simple_handler() {
  SimpleHandler handler;
  const auto parsed = handler.parse_inbound(simple_payload("alice", "bot", "hello"));
  EXPECT_TRUE(parsed.ok());
  EXPECT_EQ(parsed.value().sender().value(), "alice");
  EXPECT_EQ(parsed.value().conversation_id().value(), "c-1");
  EXPECT_EQ(parsed.value().text(), "hello");

  EXPECT_TRUE(!handler.parse_inbound("not json").ok());
  EXPECT_TRUE(!handler.parse_inbound("[1,2]").ok());
  EXPECT_TRUE(!handler.parse_inbound(R"({"sender":"a","recipient":"b"})").ok());
  EXPECT_TRUE(!handler.parse_inbound(R"({"sender":"a","recipient":"b","text":"   "})").ok());

  const auto stamped = handler.parse_inbound(R"({"sender":"a","recipient":"b","text":"x","timestamp":1700000000123})");
  EXPECT_TRUE(stamped.ok());
  EXPECT_TRUE(stamped.value().timestamp() == Message::Timestamp(std::chrono::milliseconds(1700000000123LL)));
  // Timestamps the clock cannot represent are rejected rather than wrapped.
  EXPECT_TRUE(!handler.parse_inbound(R"({"sender":"a","recipient":"b","text":"x","timestamp":9000000000000000000})").ok());
  EXPECT_TRUE(!handler.parse_inbound(R"({"sender":"a","recipient":"b","text":"x","timestamp":18446744073709551615})").ok());
  EXPECT_TRUE(!handler.parse_inbound(R"({"sender":"a","recipient":"b","text":"x","timestamp":-5})").ok());

  const auto rendered = handler.render_outbound(parsed.value().reply(TextPayload{"hi alice"}));
  EXPECT_EQ(rendered.size(), static_cast<std::size_t>(1));
  EXPECT_EQ(rendered[0]["recipient"].get<std::string>(), "alice");
  EXPECT_EQ(rendered[0]["text"].get<std::string>(), "hi alice");
  return 0;
}

static int test_messenger_handler() {
  MessengerHandler handler;
  const json payload = {
      {"object", "page"},
      {"entry",
       json::array({{{"id", "page-1"},
                     {"messaging",
                      json::array({
                          {{"sender", {{"id", "page-1"}}},
                           {"recipient", {{"id", "user-9"}}},
                           {"message", {{"mid", "m-0"}, {"text", "echoed"}, {"is_echo", true}}}},
                          {{"sender", {{"id", "user-9"}}},
                           {"recipient", {{"id", "page-1"}}},
                           {"timestamp", 1700000000000LL},
                           {"message", {{"mid", "m-1"}, {"text", "what time is it"}}}},
                      })}}})},
  };
  const auto parsed = handler.parse_inbound(payload.dump());
  EXPECT_TRUE(parsed.ok());
  EXPECT_EQ(parsed.value().sender().value(), "user-9");
  EXPECT_EQ(parsed.value().recipient().value(), "page-1");
  EXPECT_EQ(parsed.value().text(), "what time is it");
  EXPECT_EQ(parsed.value().conversation_id().value(), "m-1");

  const json attachment = {
      {"object", "page"},
      {"entry",
       json::array({{{"messaging",
                      json::array({{{"sender", {{"id", "u"}}},
                                    {"recipient", {{"id", "p"}}},
                                    {"message",
                                     {{"mid", "m-2"},
                                      {"attachments",
                                       json::array({{{"type", "image"},
                                                     {"payload", {{"url", "https://cdn/1.jpg"}}}}})}}}}})}}})},
  };
  const auto media = handler.parse_inbound(attachment.dump());
  EXPECT_TRUE(media.ok());
  EXPECT_TRUE(std::holds_alternative<MediaPayload>(media.value().payload()));
  EXPECT_EQ(std::get<MediaPayload>(media.value().payload()).url, "https://cdn/1.jpg");

  EXPECT_TRUE(!handler.parse_inbound(R"({"object":"user","entry":[]})").ok());
  // A wrongly typed field must surface as a parse error, not an exception.
  const auto odd = handler.parse_inbound(
      R"({"object":"page","entry":[{"messaging":[{"sender":{"id":"u"},"recipient":{"id":"p"},"message":{"text":"x","is_echo":"no"}}]}]})");
  EXPECT_TRUE(!odd.ok());

  const Message reply = parsed.value().reply(TextPayload{std::string(4500, 'x')});
  const auto parts = handler.render_outbound(reply);
  EXPECT_EQ(parts.size(), static_cast<std::size_t>(3));
  EXPECT_EQ(parts[0]["recipient"]["id"].get<std::string>(), "user-9");
  EXPECT_EQ(parts[0]["message"]["text"].get<std::string>().size(), MessengerHandler::kTextLimit);
  EXPECT_EQ(parts[2]["message"]["text"].get<std::string>().size(), static_cast<std::size_t>(500));
  return 0;
}

static int test_whatsapp_handler() {
  WhatsAppHandler handler;
  const json payload = {
      {"object", "whatsapp_business_account"},
      {"entry",
       json::array({{{"changes",
                      json::array({{{"field", "messages"},
                                    {"value",
                                     {{"metadata", {{"phone_number_id", "biz-1"}}},
                                      {"messages",
                                       json::array({{{"from", "15550001"},
                                                     {"id", "wamid.1"},
                                                     {"timestamp", "1700000000"},
                                                     {"type", "text"},
                                                     {"text", {{"body", "hola"}}}}})}}}}})}}})},
  };
  const auto parsed = handler.parse_inbound(payload.dump());
  EXPECT_TRUE(parsed.ok());
  EXPECT_EQ(parsed.value().sender().value(), "15550001");
  EXPECT_EQ(parsed.value().recipient().value(), "biz-1");
  EXPECT_EQ(parsed.value().text(), "hola");
  EXPECT_TRUE(parsed.value().timestamp() == Message::Timestamp(std::chrono::seconds(1700000000)));

  json image = payload;
  image["entry"][0]["changes"][0]["value"]["messages"][0] = {
      {"from", "15550001"}, {"id", "wamid.2"}, {"type", "image"},
      {"image", {{"id", "media-7"}, {"mime_type", "image/jpeg"}}}};
  const auto media = handler.parse_inbound(image.dump());
  EXPECT_TRUE(media.ok());
  EXPECT_EQ(media.value().text(), "[media: image/jpeg]");

  json far_future = payload;
  far_future["entry"][0]["changes"][0]["value"]["messages"][0]["timestamp"] = "9000000000000";
  const auto rejected = handler.parse_inbound(far_future.dump());
  EXPECT_TRUE(!rejected.ok());
  EXPECT_EQ(rejected.error().message, "timestamp out of range");
  far_future["entry"][0]["changes"][0]["value"]["messages"][0]["timestamp"] = "18446744073709551615";
  EXPECT_TRUE(!handler.parse_inbound(far_future.dump()).ok());

  json sticker = payload;
  sticker["entry"][0]["changes"][0]["value"]["messages"][0]["type"] = "sticker";
  EXPECT_TRUE(!handler.parse_inbound(sticker.dump()).ok());

  const auto out = handler.render_outbound(parsed.value().reply(TextPayload{"buenas"}));
  EXPECT_EQ(out.size(), static_cast<std::size_t>(1));
  EXPECT_EQ(out[0]["to"].get<std::string>(), "15550001");
  EXPECT_EQ(out[0]["text"]["body"].get<std::string>(), "buenas");
  return 0;
}

static int test_build_request_window() {
  HandlerOptions options;
  options.system_prompt = "Be brief.";
  options.max_history = 2;
  SimpleHandler handler(options);

  MemoryStore store(MemoryStoreConfig{1, 10});
  const Message first = text_message("u", "p", "one");
  store.add(first);
  store.add(first.reply(TextPayload{"two"}));
  const ThreadState thread = store.add(text_message("u", "p", "three"));

  const ModelRequest request = handler.build_request(thread);
  EXPECT_EQ(request.messages.size(), static_cast<std::size_t>(3));
  EXPECT_EQ(request.messages[0]["role"].get<std::string>(), "system");
  EXPECT_EQ(request.messages[1]["role"].get<std::string>(), "assistant");
  EXPECT_EQ(request.messages[1]["content"].get<std::string>(), "two");
  EXPECT_EQ(request.messages[2]["content"].get<std::string>(), "three");
  EXPECT_TRUE(handler.build_request(thread).messages == request.messages);
  return 0;
}

static int test_openai_completion_parsing() {
  const auto ok = OpenAIPlugin::parse_completion(
      R"({"choices":[{"message":{"role":"assistant","content":"hi"},"finish_reason":null}],"usage":{"total_tokens":3}})");
  EXPECT_TRUE(ok.ok());
  EXPECT_EQ(ok.value().text, "hi");
  EXPECT_EQ(ok.value().finish_reason, "stop");

  const auto empty = OpenAIPlugin::parse_completion(R"({"choices":[]})");
  EXPECT_TRUE(!empty.ok());
  EXPECT_TRUE(empty.error().kind == ModelErrorKind::kMalformedResponse);
  EXPECT_TRUE(!OpenAIPlugin::parse_completion("<html>").ok());

  OpenAIPluginConfig cfg;
  cfg.api_key = "k";
  cfg.api_base = "https://api.example/v1/";
  cfg.model = "m";
  OpenAIPlugin plugin(cfg);
  ModelRequest request;
  request.messages = json::array({{{"role", "user"}, {"content", "q"}}});
  const json body = plugin.build_payload(request);
  EXPECT_EQ(body["model"].get<std::string>(), "m");
  EXPECT_EQ(body["messages"].size(), static_cast<std::size_t>(1));
  return 0;
}

static int test_service_success() {
  auto store = std::make_shared<MemoryStore>(MemoryStoreConfig{10, 10});
  Service service(store, std::make_shared<SimpleHandler>(), std::make_shared<EchoPlugin>(), "/chat");

  const auto outcome = service.handle_inbound(simple_payload("alice", "bot", "ping"));
  EXPECT_TRUE(outcome.ok());
  EXPECT_EQ(outcome.value().size(), static_cast<std::size_t>(1));
  EXPECT_EQ(outcome.value()[0]["text"].get<std::string>(), "ping");
  EXPECT_EQ(outcome.value()[0]["recipient"].get<std::string>(), "alice");

  const auto thread = store->get(ConversationKey::of(Identifier::from("alice"), Identifier::from("bot")));
  EXPECT_TRUE(thread.has_value());
  EXPECT_EQ(thread->size(), static_cast<std::size_t>(2));
  EXPECT_TRUE(thread->messages()[0].role() == Role::kUser);
  EXPECT_TRUE(thread->tail().role() == Role::kAssistant);
  return 0;
}

static int test_service_invalid_payload_leaves_store_alone() {
  auto store = std::make_shared<MemoryStore>(MemoryStoreConfig{10, 10});
  Service service(store, std::make_shared<SimpleHandler>(), std::make_shared<EchoPlugin>(), "/chat");
  const auto outcome = service.handle_inbound("{\"sender\":");
  EXPECT_TRUE(!outcome.ok());
  EXPECT_TRUE(outcome.error().kind == PipelineErrorKind::kInvalidPayload);
  EXPECT_EQ(store->size(), static_cast<std::size_t>(0));
  return 0;
}

static int test_service_model_errors_are_isolated() {
  auto store = std::make_shared<MemoryStore>(MemoryStoreConfig{10, 10});
  auto plugin = std::make_shared<SwitchablePlugin>();
  Service service(store, std::make_shared<SimpleHandler>(), plugin, "/chat");
  const ConversationKey key = ConversationKey::of(Identifier::from("alice"), Identifier::from("bot"));

  const auto first = service.handle_inbound(simple_payload("alice", "bot", "one"));
  EXPECT_TRUE(!first.ok());
  EXPECT_TRUE(first.error().kind == PipelineErrorKind::kModelUnavailable);
  EXPECT_TRUE(first.error().model_error == ModelErrorKind::kRejected);
  EXPECT_EQ(store->get(key)->size(), static_cast<std::size_t>(1));

  plugin->failing.store(false);
  const auto second = service.handle_inbound(simple_payload("alice", "bot", "two"));
  EXPECT_TRUE(second.ok());
  EXPECT_EQ(store->get(key)->size(), static_cast<std::size_t>(3));

  plugin->failing.store(true);
  const auto third = service.handle_inbound(simple_payload("alice", "bot", "three"));
  EXPECT_TRUE(!third.ok());
  const auto thread = store->get(key);
  EXPECT_EQ(thread->size(), static_cast<std::size_t>(4));
  EXPECT_EQ(thread->tail().text(), "three");

  Service throwing(store, std::make_shared<SimpleHandler>(), std::make_shared<ThrowingPlugin>(), "/boom");
  const auto thrown = throwing.handle_inbound(simple_payload("carol", "bot", "hi"));
  EXPECT_TRUE(!thrown.ok());
  EXPECT_TRUE(thrown.error().model_error == ModelErrorKind::kTransport);
  return 0;
}

static int test_service_deadline() {
  auto store = std::make_shared<MemoryStore>(MemoryStoreConfig{10, 10});
  Service service(store, std::make_shared<SimpleHandler>(),
                  std::make_shared<SlowPlugin>(std::chrono::milliseconds(400)), "/slow");

  TurnOptions options;
  options.deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(50);
  const auto started = std::chrono::steady_clock::now();
  const auto outcome = service.handle_inbound(simple_payload("alice", "bot", "hurry"), options);
  const auto waited = std::chrono::steady_clock::now() - started;

  EXPECT_TRUE(!outcome.ok());
  EXPECT_TRUE(outcome.error().kind == PipelineErrorKind::kModelUnavailable);
  EXPECT_TRUE(outcome.error().model_error == ModelErrorKind::kTimeout);
  EXPECT_TRUE(waited < std::chrono::milliseconds(350));
  EXPECT_EQ(store->get(ConversationKey::of(Identifier::from("alice"), Identifier::from("bot")))->size(),
            static_cast<std::size_t>(1));

  Service bounded(store, std::make_shared<SimpleHandler>(),
                  std::make_shared<SlowPlugin>(std::chrono::milliseconds(400)), "/bounded",
                  std::chrono::milliseconds(50));
  const auto timed_out = bounded.handle_inbound(simple_payload("bob", "bot", "hurry"));
  EXPECT_TRUE(!timed_out.ok());
  EXPECT_TRUE(timed_out.error().model_error == ModelErrorKind::kTimeout);
  return 0;
}

static int test_service_cancellation() {
  auto store = std::make_shared<MemoryStore>(MemoryStoreConfig{10, 10});
  Service service(store, std::make_shared<SimpleHandler>(),
                  std::make_shared<SlowPlugin>(std::chrono::milliseconds(400)), "/slow");

  std::stop_source source;
  TurnOptions options;
  options.stop = source.get_token();
  std::thread canceller([&source]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    source.request_stop();
  });
  const auto outcome = service.handle_inbound(simple_payload("alice", "bot", "never mind"), options);
  canceller.join();

  EXPECT_TRUE(!outcome.ok());
  EXPECT_TRUE(outcome.error().kind == PipelineErrorKind::kCancelled);
  const auto thread = store->get(ConversationKey::of(Identifier::from("alice"), Identifier::from("bot")));
  EXPECT_EQ(thread->size(), static_cast<std::size_t>(1));
  EXPECT_TRUE(thread->tail().role() == Role::kUser);
  return 0;
}

static int test_runner_routes() {
  auto store = std::make_shared<MemoryStore>(MemoryStoreConfig{10, 10});
  auto handler = std::make_shared<SimpleHandler>();
  auto plugin = std::make_shared<EchoPlugin>();

  bool threw = false;
  try {
    ServicesRunner runner({std::make_shared<Service>(store, handler, plugin, "/a"),
                           std::make_shared<Service>(store, handler, plugin, "/a")});
  } catch (const ConfigurationError&) {
    threw = true;
  }
  EXPECT_TRUE(threw);

  ServicesRunner runner({std::make_shared<Service>(store, handler, plugin, "/a"),
                         std::make_shared<Service>(store, handler, plugin, "/b")});
  EXPECT_TRUE(runner.has_route("/a"));
  EXPECT_TRUE(!runner.has_route("/c"));

  EXPECT_EQ(runner.dispatch("/c", simple_payload("u", "p", "x")).status, 404u);
  const RoutedResponse ok = runner.dispatch("/b", simple_payload("u", "p", "x"));
  EXPECT_EQ(ok.status, 200u);
  EXPECT_EQ(ok.body["messages"][0]["text"].get<std::string>(), "x");
  const RoutedResponse bad = runner.dispatch("/a", "nope");
  EXPECT_EQ(bad.status, 400u);
  EXPECT_EQ(bad.body["error"].get<std::string>(), "invalid_payload");

  const std::string invalid_utf8 = std::string("{\"sender\":\"a") + '\xff' + "\"}";
  const RoutedResponse garbled = runner.dispatch("/a", invalid_utf8);
  EXPECT_EQ(garbled.status, 400u);
  const json reparsed = json::parse(to_wire(garbled.body));
  EXPECT_EQ(reparsed["error"].get<std::string>(), "invalid_payload");
  return 0;
}

static int test_config_validation() {
  const RootConfig cfg = parse_root_config(minimal_config());
  EXPECT_EQ(cfg.services.size(), static_cast<std::size_t>(1));
  EXPECT_EQ(cfg.stores[0].memory.max_conversations, static_cast<std::size_t>(2));
  EXPECT_EQ(cfg.stores[0].memory.max_messages_per_conversation, static_cast<std::size_t>(3));

  json zero = minimal_config();
  zero["stores"][0]["maxConversations"] = 0;
  EXPECT_TRUE(rejects(zero));

  json dangling = minimal_config();
  dangling["services"][0]["store"] = "missing";
  EXPECT_TRUE(rejects(dangling));

  json dup_names = minimal_config();
  dup_names["plugins"].push_back({{"name", "echo"}, {"type", "echo"}});
  EXPECT_TRUE(rejects(dup_names));

  json dup_paths = minimal_config();
  const json first_service = dup_paths["services"][0];
  dup_paths["services"].push_back(first_service);
  EXPECT_TRUE(rejects(dup_paths));

  json bad_path = minimal_config();
  bad_path["services"][0]["webhookPath"] = "chat";
  EXPECT_TRUE(rejects(bad_path));

  json unknown = minimal_config();
  unknown["handlers"][0]["type"] = "telegram";
  EXPECT_TRUE(rejects(unknown));

  json no_services = minimal_config();
  no_services["services"] = json::array();
  EXPECT_TRUE(rejects(no_services));

  json bad_port = minimal_config();
  bad_port["port"] = 70000;
  EXPECT_TRUE(rejects(bad_port));

  json wrong_type = minimal_config();
  wrong_type["host"] = 5;
  EXPECT_TRUE(rejects(wrong_type));
  return 0;
}

static int test_config_env_refs() {
  json root = minimal_config();
  root["plugins"].push_back({{"name", "gpt"}, {"type", "openai"}, {"apiKey", "${CHATBRIDGE_TEST_KEY}"}});
#ifndef _WIN32
  setenv("CHATBRIDGE_TEST_KEY", "sk-test", 1);
  const RootConfig cfg = parse_root_config(root);
  EXPECT_EQ(cfg.plugins[1].openai.api_key, "sk-test");
  unsetenv("CHATBRIDGE_TEST_KEY");
  EXPECT_TRUE(rejects(root));
#endif
  EXPECT_EQ(resolve_env_ref("plain"), "plain");

  const fs::path tmp = fs::temp_directory_path() / ("chatbridge_test_cfg_" + random_id(10) + ".json");
  EXPECT_TRUE(write_text_file(tmp, minimal_config().dump(2)));
  const RootConfig loaded = load_config(tmp);
  std::error_code ec;
  fs::remove(tmp, ec);
  EXPECT_EQ(loaded.services[0].webhook_path, "/chat");

  bool threw = false;
  try {
    load_config(tmp);
  } catch (const ConfigurationError&) {
    threw = true;
  }
  EXPECT_TRUE(threw);
  return 0;
}

static int test_wiring_shares_named_components() {
  json root = minimal_config();
  root["services"].push_back({{"webhookPath", "/other"}, {"plugin", "echo"}, {"store", "mem"}, {"handler", "plain"}});
  const auto services = make_services(parse_root_config(root));
  EXPECT_EQ(services.size(), static_cast<std::size_t>(2));
  EXPECT_TRUE(&services[0]->store() == &services[1]->store());
  EXPECT_EQ(services[0]->handler().type(), "simple");

  EXPECT_TRUE(services[0]->handle_inbound(simple_payload("alice", "bot", "shared")).ok());
  EXPECT_EQ(services[1]->store().size(), static_cast<std::size_t>(1));
  return 0;
}

static int test_http_round_trip() {
  json root = minimal_config();
  root["host"] = "127.0.0.1";
  root["workers"] = 2;
  auto runner = make_services_runner(parse_root_config(root));
  runner->start();
  EXPECT_TRUE(runner->port() != 0);
  const std::string base = "http://127.0.0.1:" + std::to_string(runner->port());

  HttpClient client;
  const HttpResponse ok =
      client.post(base + "/chat", simple_payload("alice", "bot", "over the wire"), {{"Content-Type", "application/json"}}, 5000);
  EXPECT_EQ(ok.status, 200L);
  EXPECT_EQ(json::parse(ok.body)["messages"][0]["text"].get<std::string>(), "over the wire");

  EXPECT_EQ(client.post(base + "/nowhere", "{}", {}, 5000).status, 404L);
  EXPECT_EQ(client.get(base + "/chat", {}, 5000).status, 405L);
  EXPECT_EQ(client.post(base + "/chat", "garbage", {}, 5000).status, 400L);

  // Request bytes echoed into an error body must not take the listener down.
  const std::string invalid_utf8 = std::string("{\"sender\":\"a") + '\xff' + "\"}";
  EXPECT_EQ(client.post(base + "/chat", invalid_utf8, {}, 5000).status, 400L);
  EXPECT_EQ(client.post(base + "/chat", simple_payload("alice", "bot", "still up"), {}, 5000).status, 200L);

  const HttpResponse counters = client.get(base + "/metrics", {}, 5000);
  EXPECT_EQ(counters.status, 200L);
  EXPECT_TRUE(json::parse(counters.body).contains("http.requests"));

  runner->stop();
  return 0;
}

static int test_stop_with_queued_connections() {
  json root = minimal_config();
  root["host"] = "127.0.0.1";
  root["workers"] = 1;
  auto runner = make_services_runner(parse_root_config(root));
  runner->start();
  const tcp::endpoint endpoint{net::ip::make_address("127.0.0.1"), runner->port()};

  // The first idle client occupies the only worker; the second waits in the pool queue.
  net::io_context io;
  tcp::socket busy(io);
  tcp::socket queued(io);
  beast::error_code ec;
  busy.connect(endpoint, ec);
  EXPECT_TRUE(!ec);
  queued.connect(endpoint, ec);
  EXPECT_TRUE(!ec);
  std::this_thread::sleep_for(std::chrono::milliseconds(100));

  std::atomic<bool> stopped{false};
  std::thread stopper([&]() {
    runner->stop();
    stopped.store(true);
  });
  for (int i = 0; i < 100 && !stopped.load(); ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }
  if (!stopped.load()) {
    stopper.detach();
    // The detached stopper still uses the runner.
    static_cast<void>(runner.release());
    return fail("stop() did not return while clients were idle", __FILE__, __LINE__);
  }
  stopper.join();
  return 0;
}

int main() {
  Logger::set_min_level(Logger::Level::kError);

  int failures = 0;
  failures += test_identifiers_and_keys();
  failures += test_message_reply();
  failures += test_store_rejects_zero_capacity();
  failures += test_store_single_slot_scenario();
  failures += test_store_trims_oldest_first();
  failures += test_store_eviction_order();
  failures += test_snapshots_do_not_change();
  failures += test_store_concurrent_adds();
  failures += test_simple_handler();
  failures += test_messenger_handler();
  failures += test_whatsapp_handler();
  failures += test_build_request_window();
  failures += test_openai_completion_parsing();
  failures += test_service_success();
  failures += test_service_invalid_payload_leaves_store_alone();
  failures += test_service_model_errors_are_isolated();
  failures += test_service_deadline();
  failures += test_service_cancellation();
  failures += test_runner_routes();
  failures += test_config_validation();
  failures += test_config_env_refs();
  failures += test_wiring_shares_named_components();
  failures += test_http_round_trip();
  failures += test_stop_with_queued_connections();

  if (failures != 0) {
    std::cerr << failures << " test(s) failed\n";
    return 1;
  }
  std::cout << "OK\n";
  return 0;
}
