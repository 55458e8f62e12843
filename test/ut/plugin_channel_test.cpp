//=============================================================================
// Plugin Channel Tests
//=============================================================================

#include <boost/ut.hpp>
#include <handoff/plugin-channel.h>
#include "harness/relay_fixture.h"

using namespace boost::ut;
using namespace handoff;
using namespace handoff::test;

suite plugin_channel_client_tests = [] {
    "acquire sends a request and waits for the channel"_test = [] {
        std::vector<MessageKind> sent;
        PluginChannelClient client([&](TransferableEnvelope env) -> Result<void> {
            sent.push_back(env.kind());
            return Ok();
        });

        std::vector<std::string> acquired;
        expect(client.acquire([&](const std::string& channel, std::vector<MessagePort> ports) {
            acquired.push_back(channel + "/" + std::to_string(ports.size()));
        }).has_value());
        expect(client.acquire([&](const std::string& channel, std::vector<MessagePort> ports) {
            acquired.push_back("second:" + channel + "/" + std::to_string(ports.size()));
        }).has_value());

        expect(sent.size() == 2_u);
        expect(sent.size() == 2 && sent[0] == MessageKind::PluginChannelRequest);
        expect(client.pendingCount() == 2_u);

        auto first = MessageChannel::create();
        std::vector<MessagePort> ports;
        ports.push_back(std::move(first.port2));
        expect(client.channelCreated("c1", std::move(ports)).has_value());
        expect(client.channelCreated("c2", {}).has_value());

        std::vector<std::string> expected = {"c1/1", "second:c2/0"};
        expect(acquired == expected);
        expect(client.pendingCount() == 0_u);
    };

    "unsolicited channel is rejected"_test = [] {
        PluginChannelClient client([](TransferableEnvelope) -> Result<void> { return Ok(); });
        auto channel = MessageChannel::create();
        std::vector<MessagePort> ports;
        ports.push_back(std::move(channel.port2));
        expect(!client.channelCreated("c9", std::move(ports)).has_value());

        // The dropped end is closed, so its peer cannot send
        auto res = channel.port1.postMessage(tagged("hello"));
        expect(!res && res.error().code() == ErrorCode::ContextGone);
    };

    "failed send leaves nothing pending"_test = [] {
        PluginChannelClient client([](TransferableEnvelope) -> Result<void> {
            return Err<void>(ErrorCode::ContextGone, "window is gone");
        });
        bool called = false;
        auto res = client.acquire([&](const std::string&, std::vector<MessagePort>) { called = true; });
        expect(!res && res.error().is(ErrorCode::ContextGone));
        expect(client.pendingCount() == 0_u);
        expect(!called);
    };
};

suite plugin_channel_host_tests = [] {
    "host needs a window link"_test = [] {
        auto host = PluginChannelHost::create(MessagePort(), [](const std::string&, MessagePort) {});
        expect(!host && host.error().code() == ErrorCode::Detached);
    };

    "each request gets a fresh channel"_test = [] {
        auto ctx = makeContext("parent");
        expect(ctx != nullptr);
        if (!ctx) return;

        auto link = MessageChannel::create();
        auto windowEnd = std::make_shared<MessagePort>(std::move(link.port2));
        auto hostLink = std::make_shared<MessagePort>(std::move(link.port1));
        auto windowSeen = std::make_shared<Recorder>();
        auto opened = std::make_shared<Recorder>();
        auto other = std::make_shared<Recorder>();
        auto hostHolder = std::make_shared<PluginChannelHost::Ptr>();
        auto kept = std::make_shared<std::vector<MessagePort>>();

        auto res = runOn(ctx, [=]() -> Result<void> {
            if (auto r = windowEnd->start([windowSeen](TransferableEnvelope env) { windowSeen->add(describe(env)); }); !r) {
                return r;
            }
            auto host = PluginChannelHost::create(std::move(*hostLink),
                [opened, kept](const std::string& channel, MessagePort port) {
                    opened->add(channel);
                    kept->push_back(std::move(port));
                });
            if (!host) return Err<void>("host", host);
            *hostHolder = *host;
            (*host)->onMessage([other](TransferableEnvelope env) { other->add(describe(env)); });
            return (*host)->start();
        });
        expect(res.has_value()) << error_msg(res);

        expect(windowEnd->postMessage(TransferableEnvelope::pluginChannelRequest()).has_value());
        expect(windowEnd->postMessage(tagged("app")).has_value());
        expect(windowEnd->postMessage(TransferableEnvelope::pluginChannelRequest()).has_value());

        expect(waitUntil([&] { return windowSeen->size() == 2 && other->size() == 1; }));
        std::vector<std::string> replies = {"PLUGIN_CHANNEL_CREATED:c1/1", "PLUGIN_CHANNEL_CREATED:c2/1"};
        expect(windowSeen->entries() == replies);
        std::vector<std::string> names = {"c1", "c2"};
        expect(opened->entries() == names);
        std::vector<std::string> apps = {"app/0"};
        expect(other->entries() == apps);

        auto channelCount = std::make_shared<uint64_t>(0);
        expect(runOn(ctx, [=] {
            if (*hostHolder) {
                *channelCount = (*hostHolder)->channelCount();
                if (auto r = (*hostHolder)->shutdown(); !r) yerror("{}", error_msg(r));
            }
            hostHolder->reset();
            kept->clear();
            windowEnd->close();
        }).has_value());
        expect(*channelCount == 2_u);
    };
};
