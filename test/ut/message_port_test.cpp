//=============================================================================
// MessagePort Tests
//
// Entangled port pairs between execution contexts: ordering, buffering,
// transfer and teardown.
//=============================================================================

#include <boost/ut.hpp>
#include <handoff/envelope.h>
#include <handoff/message-port.h>
#include "harness/context_harness.h"

using namespace boost::ut;
using namespace handoff;
using namespace handoff::test;

namespace {

TransferableEnvelope tagged(const std::string& tag) {
    msgpack::sbuffer buffer;
    msgpack::packer<msgpack::sbuffer> pk(buffer);
    pk.pack_map(1);
    pk.pack(std::string("type"));
    pk.pack(tag);
    return TransferableEnvelope(MessageKind::Other, std::string(buffer.data(), buffer.size()));
}

MessageHandler recordInto(std::shared_ptr<Recorder> recorder) {
    return [recorder](TransferableEnvelope env) {
        auto type = env.stringField("type");
        recorder->add(type ? *type : std::string("?"));
    };
}

} // namespace

suite message_port_tests = [] {
    "messages posted before start arrive in order"_test = [] {
        auto ctx = makeContext("receiver");
        expect(ctx != nullptr);
        if (!ctx) return;

        auto channel = MessageChannel::create();
        for (const char* tag : {"m1", "m2", "m3"}) {
            expect(channel.port1.postMessage(tagged(tag)).has_value());
        }

        auto recorder = std::make_shared<Recorder>();
        auto receiver = std::make_shared<MessagePort>(std::move(channel.port2));
        auto res = runOn(ctx, [receiver, recorder] { return receiver->start(recordInto(recorder)); });
        expect(res.has_value()) << error_msg(res);

        expect(waitUntil([&] { return recorder->size() == 3; }));
        std::vector<std::string> expected = {"m1", "m2", "m3"};
        expect(recorder->entries() == expected);

        expect(runOn(ctx, [receiver] { receiver->close(); }).has_value());
    };

    "start outside a context fails"_test = [] {
        auto channel = MessageChannel::create();
        auto res = channel.port1.start([](TransferableEnvelope) {});
        expect(!res.has_value());
    };

    "stopped port buffers until restarted"_test = [] {
        auto ctx = makeContext("receiver");
        if (!ctx) return;
        auto channel = MessageChannel::create();
        auto recorder = std::make_shared<Recorder>();
        auto receiver = std::make_shared<MessagePort>(std::move(channel.port2));

        expect(runOn(ctx, [receiver, recorder] { return receiver->start(recordInto(recorder)); }).has_value());
        expect(channel.port1.postMessage(tagged("a")).has_value());
        expect(waitUntil([&] { return recorder->size() == 1; }));

        expect(runOn(ctx, [receiver] { return receiver->stop(); }).has_value());
        expect(channel.port1.postMessage(tagged("b")).has_value());
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        expect(recorder->size() == 1_u);

        expect(runOn(ctx, [receiver, recorder] { return receiver->start(recordInto(recorder)); }).has_value());
        expect(waitUntil([&] { return recorder->size() == 2; }));
        std::vector<std::string> expected = {"a", "b"};
        expect(recorder->entries() == expected);

        expect(runOn(ctx, [receiver] { receiver->close(); }).has_value());
    };

    "moved-from port is detached"_test = [] {
        auto channel = MessageChannel::create();
        MessagePort moved = std::move(channel.port1);
        expect(channel.port1.isDetached());
        expect(!moved.isDetached());

        auto res = channel.port1.postMessage(tagged("x"));
        expect(!res && res.error().code() == ErrorCode::Detached);
    };

    "posting to a closed peer fails"_test = [] {
        auto channel = MessageChannel::create();
        channel.port2.close();
        auto res = channel.port1.postMessage(tagged("x"));
        expect(!res.has_value());
        expect(!res && res.error().is(ErrorCode::ContextGone));
    };

    "a port cannot travel through its own channel"_test = [] {
        auto channel = MessageChannel::create();
        std::vector<MessagePort> ports;
        ports.push_back(std::move(channel.port2));
        auto res = channel.port1.postMessage(TransferableEnvelope::pluginChannelCreated("c1", std::move(ports)));
        expect(!res && res.error().code() == ErrorCode::MalformedTransferList);
    };

    "two channels cannot end up buffered inside each other"_test = [] {
        auto a = MessageChannel::create();
        auto b = MessageChannel::create();

        // b2 is never started, so a2 stays in its pending queue
        std::vector<MessagePort> first;
        first.push_back(std::move(a.port2));
        expect(b.port1.postMessage(TransferableEnvelope::pluginChannelCreated("c1", std::move(first))).has_value());

        std::vector<MessagePort> second;
        second.push_back(std::move(b.port2));
        auto res = a.port1.postMessage(TransferableEnvelope::pluginChannelCreated("c2", std::move(second)));
        expect(!res && res.error().code() == ErrorCode::MalformedTransferList);

        // The rejected envelope took b2 down, and a2 with it
        auto afterA = a.port1.postMessage(tagged("x"));
        expect(!afterA && afterA.error().is(ErrorCode::ContextGone));
        auto afterB = b.port1.postMessage(tagged("y"));
        expect(!afterB && afterB.error().is(ErrorCode::ContextGone));
    };

    "transferred port keeps working on the other side"_test = [] {
        auto ctx = makeContext("receiver");
        if (!ctx) return;

        auto link = MessageChannel::create();
        auto inner = MessageChannel::create();
        auto received = std::make_shared<MessagePort>();
        auto linkEnd = std::make_shared<MessagePort>(std::move(link.port2));

        expect(runOn(ctx, [linkEnd, received] {
            return linkEnd->start([received](TransferableEnvelope env) {
                auto ports = env.takePorts();
                if (!ports.empty()) *received = std::move(ports.front());
            });
        }).has_value());

        std::vector<MessagePort> ports;
        ports.push_back(std::move(inner.port2));
        expect(link.port1.postMessage(TransferableEnvelope::pluginChannelCreated("c1", std::move(ports))).has_value());

        expect(waitUntil([&] {
            auto r = runOn(ctx, [received]() -> Result<void> {
                if (received->isDetached()) return Err<void>("not yet");
                return Ok();
            });
            return r.has_value();
        }));

        // Message from the kept end reaches the transferred end
        auto recorder = std::make_shared<Recorder>();
        expect(runOn(ctx, [received, recorder] { return received->start(recordInto(recorder)); }).has_value());
        expect(inner.port1.postMessage(tagged("through")).has_value());
        expect(waitUntil([&] { return recorder->size() == 1; }));

        expect(runOn(ctx, [received, linkEnd] {
            received->close();
            linkEnd->close();
        }).has_value());
    };
};
