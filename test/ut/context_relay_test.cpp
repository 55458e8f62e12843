//=============================================================================
// ContextRelay Tests
//
// Parent <-> window <-> worker forwarding: per-source order, transfer
// exclusivity, isolated failures and the plugin channel round trip.
//=============================================================================

#include <boost/ut.hpp>
#include <handoff/context-relay.h>
#include <handoff/plugin-channel.h>
#include "harness/relay_fixture.h"

using namespace boost::ut;
using namespace handoff;
using namespace handoff::test;

suite context_relay_order_tests = [] {
    "parent messages reach the worker in order regardless of transfer lists"_test = [] {
        RelayFixture fx;
        auto started = fx.start();
        expect(started.has_value()) << error_msg(started);
        if (!started) return;

        expect(fx.sendFromParent([] {
            auto channel = MessageChannel::create();
            std::vector<Transferable> ts;
            ts.emplace_back(std::move(channel.port2));
            return tagged("m1", std::move(ts));
        }).has_value());
        expect(fx.sendFromParent([] { return tagged("m2"); }).has_value());
        expect(fx.sendFromParent([] {
            std::vector<Transferable> ts;
            ts.emplace_back(fakeSurface());
            return tagged("m3", std::move(ts));
        }).has_value());

        expect(waitUntil([&] { return fx.side->recorder->size() == 4; }));
        std::vector<std::string> expected = {"m1/1", "m2/0", "m3/1", "surface-usable"};
        expect(fx.side->recorder->entries() == expected);
        expect(fx.relay->forwardedCount(RelaySource::Parent) == 3_u);
        expect(fx.relay->failedCount() == 0_u);
    };

    "worker messages reach the parent"_test = [] {
        RelayFixture fx;
        expect(fx.start().has_value());
        if (!fx.relay) return;

        expect(fx.sendFromParent([] { return tagged("echo"); }).has_value());
        expect(waitUntil([&] { return fx.parentRecorder->size() == 1; }));
        std::vector<std::string> expected = {"echoed/0"};
        expect(fx.parentRecorder->entries() == expected);
        expect(fx.relay->forwardedCount(RelaySource::Worker) == 1_u);
    };

    "start and stop are idempotent"_test = [] {
        RelayFixture fx;
        expect(fx.start().has_value());
        if (!fx.relay) return;
        auto relay = fx.relay;

        auto res = runOn(fx.window, [relay]() -> Result<void> {
            if (auto r = relay->start(); !r) return r;
            if (auto r = relay->stop(); !r) return r;
            if (auto r = relay->stop(); !r) return r;
            return relay->isRunning() ? Err<void>("still running") : Ok();
        });
        expect(res.has_value()) << error_msg(res);

        // Stopped: parent traffic waits on the link
        expect(fx.sendFromParent([] { return tagged("held"); }).has_value());
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        expect(fx.side->recorder->size() == 0_u);

        expect(runOn(fx.window, [relay] { return relay->start(); }).has_value());
        expect(waitUntil([&] { return fx.side->recorder->size() == 1; }));
    };
};

suite context_relay_transfer_tests = [] {
    "forwarded surface is no longer usable by the sender"_test = [] {
        RelayFixture fx;
        expect(fx.start().has_value());
        if (!fx.relay) return;

        auto kept = std::make_shared<OffscreenSurface>(fakeSurface());
        auto end = fx.parentEnd;
        auto res = runOn(fx.parent, [end, kept]() -> Result<void> {
            std::vector<Transferable> ts;
            ts.emplace_back(std::move(*kept));
            return end->postMessage(tagged("surface", std::move(ts)));
        });
        expect(res.has_value()) << error_msg(res);

        expect(waitUntil([&] { return fx.side->recorder->size() == 2; }));
        std::vector<std::string> expected = {"surface/1", "surface-usable"};
        expect(fx.side->recorder->entries() == expected);

        expect(kept->isDetached());
        auto handle = kept->nativeHandle();
        expect(!handle && handle.error().code() == ErrorCode::Detached);
        expect(!kept->claimForRendering().has_value());
    };

    "a message cannot be resent once forwarded"_test = [] {
        RelayFixture fx;
        expect(fx.start().has_value());
        if (!fx.relay) return;

        auto channel = std::make_shared<MessageChannel>(MessageChannel::create());
        auto end = fx.parentEnd;
        auto res = runOn(fx.parent, [end, channel]() -> Result<void> {
            std::vector<Transferable> ts;
            ts.emplace_back(std::move(channel->port2));
            if (auto r = end->postMessage(tagged("port", std::move(ts))); !r) return r;

            // The sender's binding is gone; reusing it is refused
            std::vector<Transferable> again;
            again.emplace_back(std::move(channel->port2));
            auto second = end->postMessage(tagged("port-again", std::move(again)));
            if (second || second.error().code() != ErrorCode::MalformedTransferList) {
                return Err<void>("reused port was accepted");
            }
            return Ok();
        });
        expect(res.has_value()) << error_msg(res);
        expect(waitUntil([&] { return fx.side->recorder->size() == 1; }));
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        expect(fx.side->recorder->size() == 1_u);
    };
};

suite context_relay_failure_tests = [] {
    "a failed forward does not affect later ones"_test = [] {
        RelayFixture fx;
        expect(fx.start().has_value());
        if (!fx.relay) return;
        auto relay = fx.relay;

        auto res = runOn(fx.window, [relay]() -> Result<void> {
            // Surface declared but never referenced from the payload
            std::vector<Transferable> ts;
            ts.emplace_back(fakeSurface());
            TransferableEnvelope broken(MessageKind::Other, encodePayload(std::string("x")), std::move(ts));
            auto r = relay->forward(std::move(broken), RelaySource::Parent);
            if (r || r.error().code() != ErrorCode::ForwardFailed) {
                return Err<void>("malformed envelope was forwarded");
            }
            if (!r.error().is(ErrorCode::MalformedTransferList)) {
                return Err<void>("cause lost: " + r.error().to_string());
            }
            return Ok();
        });
        expect(res.has_value()) << error_msg(res);
        expect(relay->failedCount() == 1_u);

        expect(fx.sendFromParent([] { return tagged("after"); }).has_value());
        expect(waitUntil([&] { return fx.side->recorder->size() == 1; }));
        std::vector<std::string> expected = {"after/0"};
        expect(fx.side->recorder->entries() == expected);
        expect(relay->forwardedCount(RelaySource::Parent) == 1_u);
    };

    "top-level window cannot forward worker messages"_test = [] {
        RelayFixture fx;
        expect(fx.start(false).has_value());
        if (!fx.relay) return;
        expect(!fx.relay->hasParent());

        auto relay = fx.relay;
        auto worker = fx.worker;
        expect(runOn(fx.window, [worker] { return worker->postMessage(tagged("echo")); }).has_value());
        expect(waitUntil([&] { return relay->failedCount() == 1; }));
        expect(relay->forwardedCount(RelaySource::Worker) == 0_u);
    };

    "forward to a terminated worker fails"_test = [] {
        RelayFixture fx;
        expect(fx.start().has_value());
        if (!fx.relay) return;
        auto relay = fx.relay;
        auto worker = fx.worker;

        auto res = runOn(fx.window, [relay, worker]() -> Result<void> {
            worker->terminate();
            auto r = relay->forward(tagged("late"), RelaySource::Parent);
            if (r || r.error().code() != ErrorCode::ForwardFailed) {
                return Err<void>("forward to a terminated worker succeeded");
            }
            return Ok();
        });
        expect(res.has_value()) << error_msg(res);
        expect(relay->failedCount() == 1_u);
    };
};

suite context_relay_plugin_channel_tests = [] {
    "plugin channel request round trip"_test = [] {
        RelayFixture fx;
        expect(fx.start(true, false).has_value());
        if (!fx.relay) return;

        // Parent hosts plugin channels on its end of the link
        auto pluginRecorder = std::make_shared<Recorder>();
        auto pluginPorts = std::make_shared<std::vector<MessagePort>>();
        auto host = std::make_shared<PluginChannelHost::Ptr>();
        auto end = fx.parentEnd;
        auto res = runOn(fx.parent, [end, host, pluginRecorder, pluginPorts]() -> Result<void> {
            auto hostRes = PluginChannelHost::create(std::move(*end),
                [pluginRecorder, pluginPorts](const std::string& channel, MessagePort port) {
                    pluginRecorder->add("open:" + channel);
                    auto res = port.start([pluginRecorder](TransferableEnvelope env) {
                        pluginRecorder->add(describe(env));
                    });
                    if (!res) pluginRecorder->add("start failed");
                    pluginPorts->push_back(std::move(port));
                });
            if (!hostRes) return Err<void>("host", hostRes);
            *host = *hostRes;
            return (*host)->start();
        });
        expect(res.has_value()) << error_msg(res);

        // Window -> worker control message makes the worker ask for a channel
        auto worker = fx.worker;
        expect(runOn(fx.window, [worker] { return worker->postMessage(tagged("request-channel")); }).has_value());

        expect(waitUntil([&] { return pluginRecorder->size() == 2; }));
        std::vector<std::string> parentSide = {"open:c1", "via-plugin/0"};
        expect(pluginRecorder->entries() == parentSide);

        auto workerSide = fx.side->recorder->entries();
        expect(workerSide.size() == 2_u);
        expect(workerSide.size() == 2 && workerSide[1] == "PLUGIN_CHANNEL_CREATED:c1/1");

        expect(fx.relay->forwardedCount(RelaySource::Worker) == 1_u);
        expect(fx.relay->forwardedCount(RelaySource::Parent) == 1_u);

        expect(runOn(fx.parent, [host, pluginPorts] {
            pluginPorts->clear();
            if (*host) {
                if (auto r = (*host)->shutdown(); !r) yerror("{}", error_msg(r));
            }
            host->reset();
        }).has_value());
    };
};
